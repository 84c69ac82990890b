#include "DocumentLocks.h"

#include <QDebug>

bool DocumentLocks::tryAcquire(const QStringList& documentIds)
{
    for (const QString& id : documentIds) {
        if (m_held.contains(id)) {
            qWarning() << "[DocumentLocks] Document" << id << "is being edited";
            return false;
        }
    }
    for (const QString& id : documentIds) {
        m_held.insert(id);
    }
    return true;
}

void DocumentLocks::release(const QStringList& documentIds)
{
    for (const QString& id : documentIds) {
        m_held.remove(id);
    }
}

DocumentLockGuard::DocumentLockGuard(DocumentLocks* locks, QStringList documentIds)
    : m_locks(locks)
    , m_ids(std::move(documentIds))
{
    m_ids.removeDuplicates();
    m_ids.sort();

    if (!m_locks) {
        m_locked = true;
        return;
    }
    m_locked = m_locks->tryAcquire(m_ids);
}

DocumentLockGuard::~DocumentLockGuard()
{
    if (m_locks && m_locked) {
        m_locks->release(m_ids);
    }
}
