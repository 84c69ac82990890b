#pragma once

// ============================================================================
// PageStorage - Abstract interface for payload and side-data storage
// ============================================================================
// Paths are relative to the storage root. Implementations create parent
// locations on write and replace files atomically: a reader never sees a
// partially written payload.
// ============================================================================

#include "PagePath.h"

#include <QByteArray>
#include <QString>

#include <memory>

class PageStorage {
public:
    virtual ~PageStorage() = default;

    /**
     * @brief Read a whole file.
     * @param ok Set to false when the file is missing or unreadable.
     */
    virtual QByteArray read(const QString& path, bool* ok = nullptr) const = 0;

    /**
     * @brief Write a whole file, creating parent locations as needed.
     * @return true on success.
     */
    virtual bool write(const QString& path, const QByteArray& data) = 0;

    virtual bool exists(const QString& path) const = 0;

    /**
     * @brief Copy every artifact of one page slot to another.
     *
     * The destination slot is created if needed. A source slot without
     * artifacts is not an error: there is simply nothing to copy.
     */
    virtual bool copyPage(const PagePath& src, const PagePath& dst) = 0;

    /**
     * @brief Remove a file or a directory tree. Missing paths succeed.
     */
    virtual bool removeTree(const QString& path) = 0;

    /**
     * @brief Last error message, empty if the last operation succeeded.
     */
    virtual QString errorMessage() const = 0;

    /**
     * @brief Create the file-system storage rooted at a directory.
     */
    static std::unique_ptr<PageStorage> createFileStorage(const QString& rootDir);
};
