#pragma once

// ============================================================================
// FileStorage - PageStorage on the local file system
// ============================================================================

#include "PageStorage.h"

#include <QString>

class FileStorage : public PageStorage {
public:
    explicit FileStorage(const QString& rootDir);
    ~FileStorage() override = default;

    QByteArray read(const QString& path, bool* ok = nullptr) const override;
    bool write(const QString& path, const QByteArray& data) override;
    bool exists(const QString& path) const override;
    bool copyPage(const PagePath& src, const PagePath& dst) override;
    bool removeTree(const QString& path) override;
    QString errorMessage() const override { return m_lastError; }

    /**
     * @brief Absolute file-system path of a storage path.
     */
    QString absolutePath(const QString& path) const;

private:
    QString m_rootDir;
    mutable QString m_lastError;
};
