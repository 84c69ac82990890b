#pragma once

// ============================================================================
// DocumentLocks - Exclusive edit tokens per document
// ============================================================================
// A mutation holds the token of every document it will bump from validation
// through commit. Acquisition is all-or-none: if any document of a request
// is already held, nothing is taken and the request fails.
// ============================================================================

#include <QSet>
#include <QString>
#include <QStringList>

class DocumentLocks {
public:
    DocumentLocks() = default;
    DocumentLocks(const DocumentLocks&) = delete;
    DocumentLocks& operator=(const DocumentLocks&) = delete;

    /**
     * @brief Take the tokens of all listed documents.
     * @return false, with nothing acquired, if any token is held.
     */
    bool tryAcquire(const QStringList& documentIds);

    void release(const QStringList& documentIds);

    bool isHeld(const QString& documentId) const { return m_held.contains(documentId); }

private:
    QSet<QString> m_held;
};

/**
 * @brief Holds document tokens for the lifetime of the guard.
 *
 * Ids are de-duplicated and taken in sorted order.
 */
class DocumentLockGuard {
public:
    DocumentLockGuard(DocumentLocks* locks, QStringList documentIds);
    ~DocumentLockGuard();

    DocumentLockGuard(const DocumentLockGuard&) = delete;
    DocumentLockGuard& operator=(const DocumentLockGuard&) = delete;

    /**
     * @brief True if the tokens were acquired (always true without a lock table).
     */
    bool isLocked() const { return m_locked; }

private:
    DocumentLocks* m_locks;
    QStringList m_ids;
    bool m_locked = false;
};
