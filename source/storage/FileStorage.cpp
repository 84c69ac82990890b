// ============================================================================
// FileStorage - Implementation
// ============================================================================

#include "FileStorage.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QDebug>

FileStorage::FileStorage(const QString& rootDir)
    : m_rootDir(QDir::cleanPath(rootDir))
{
}

std::unique_ptr<PageStorage> PageStorage::createFileStorage(const QString& rootDir)
{
    return std::make_unique<FileStorage>(rootDir);
}

QString FileStorage::absolutePath(const QString& path) const
{
    return QDir(m_rootDir).filePath(path);
}

QByteArray FileStorage::read(const QString& path, bool* ok) const
{
    m_lastError.clear();
    QFile file(absolutePath(path));
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QStringLiteral("Cannot read %1: %2").arg(path, file.errorString());
        if (ok) *ok = false;
        return QByteArray();
    }
    if (ok) *ok = true;
    return file.readAll();
}

bool FileStorage::write(const QString& path, const QByteArray& data)
{
    m_lastError.clear();
    const QString target = absolutePath(path);

    if (!QDir().mkpath(QFileInfo(target).absolutePath())) {
        m_lastError = QStringLiteral("Cannot create directory for %1").arg(path);
        return false;
    }

    // QSaveFile writes to a temporary file and renames it on commit()
    QSaveFile file(target);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(data) != data.size()) {
        m_lastError = QStringLiteral("Short write to %1: %2").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        m_lastError = QStringLiteral("Cannot commit %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

bool FileStorage::exists(const QString& path) const
{
    return QFileInfo::exists(absolutePath(path));
}

bool FileStorage::copyPage(const PagePath& src, const PagePath& dst)
{
    m_lastError.clear();
    QDir srcDir(absolutePath(src.directory()));
    if (!srcDir.exists()) {
        return true;    // Artifacts are produced lazily; nothing to copy yet
    }

    const QString dstPath = absolutePath(dst.directory());
    if (!QDir().mkpath(dstPath)) {
        m_lastError = QStringLiteral("Cannot create %1").arg(dst.directory());
        return false;
    }
    QDir dstDir(dstPath);

    const QStringList entries = srcDir.entryList(QDir::Files | QDir::NoDotAndDotDot);
    for (const QString& name : entries) {
        const QString target = dstDir.filePath(name);
        if (QFile::exists(target)) {
            QFile::remove(target);
        }
        if (!QFile::copy(srcDir.filePath(name), target)) {
            m_lastError = QStringLiteral("Cannot copy %1 to %2")
                              .arg(src.directory() + "/" + name, dst.directory());
            qWarning() << "[FileStorage]" << m_lastError;
            return false;
        }
    }
    return true;
}

bool FileStorage::removeTree(const QString& path)
{
    m_lastError.clear();
    const QString target = absolutePath(path);
    QFileInfo info(target);
    if (!info.exists()) {
        return true;
    }

    bool removed = info.isDir() ? QDir(target).removeRecursively() : QFile::remove(target);
    if (!removed) {
        m_lastError = QStringLiteral("Cannot remove %1").arg(path);
    }
    return removed;
}
