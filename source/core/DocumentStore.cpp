// ============================================================================
// DocumentStore - Implementation
// ============================================================================

#include "DocumentStore.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

// ===== Folders =====

Folder* DocumentStore::createFolder(const QString& title, const QString& parentId)
{
    m_folders.push_back(Folder::createNew(title, parentId));
    return m_folders.back().get();
}

Folder* DocumentStore::folder(const QString& folderId)
{
    for (auto& f : m_folders) {
        if (f->id == folderId) {
            return f.get();
        }
    }
    return nullptr;
}

std::vector<const Folder*> DocumentStore::folders() const
{
    std::vector<const Folder*> result;
    for (const auto& f : m_folders) {
        result.push_back(f.get());
    }
    return result;
}

// ===== Documents =====

Document* DocumentStore::createDocument(const QString& title, const QString& language,
                                        const QString& folderId)
{
    if (!folder(folderId)) {
        qWarning() << "[DocumentStore] Unknown folder" << folderId;
        return nullptr;
    }
    m_documents.push_back(Document::createNew(title, language, folderId));
    return m_documents.back().get();
}

Document* DocumentStore::document(const QString& documentId)
{
    for (auto& d : m_documents) {
        if (d->id == documentId) {
            return d.get();
        }
    }
    return nullptr;
}

std::vector<Document*> DocumentStore::documents()
{
    std::vector<Document*> result;
    for (auto& d : m_documents) {
        result.push_back(d.get());
    }
    return result;
}

std::vector<Document*> DocumentStore::documentsInFolder(const QString& folderId)
{
    std::vector<Document*> result;
    for (auto& d : m_documents) {
        if (d->folderId == folderId) {
            result.push_back(d.get());
        }
    }
    return result;
}

PageLocation DocumentStore::findPage(const QString& pageId)
{
    PageLocation location;
    for (auto& d : m_documents) {
        for (const DocumentVersion* v : d->versions()) {
            DocumentVersion* version = d->versionById(v->id);
            Page* page = version->pageById(pageId);
            if (page) {
                location.document = d.get();
                location.version = version;
                location.page = page;
                return location;
            }
        }
    }
    return location;
}

// ===== Persistence =====

QJsonObject DocumentStore::toJson() const
{
    QJsonObject root;
    root["version"] = SNAPSHOT_VERSION;

    QJsonArray foldersArray;
    for (const auto& f : m_folders) {
        foldersArray.append(f->toJson());
    }
    root["folders"] = foldersArray;

    QJsonArray documentsArray;
    for (const auto& d : m_documents) {
        documentsArray.append(d->toJson());
    }
    root["documents"] = documentsArray;

    return root;
}

bool DocumentStore::loadFromJson(const QJsonObject& root, QString* errorMessage)
{
    int version = root["version"].toInt(1);
    if (version > SNAPSHOT_VERSION) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Snapshot version %1 is newer than supported version %2")
                                .arg(version).arg(SNAPSHOT_VERSION);
        }
        return false;
    }

    std::vector<std::unique_ptr<Document>> documents;
    const QJsonArray documentsArray = root["documents"].toArray();
    for (const auto& value : documentsArray) {
        auto doc = Document::fromJson(value.toObject());
        if (!doc) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Document %1 has a version with invalid page numbering")
                                    .arg(value.toObject()["id"].toString());
            }
            qWarning() << "[DocumentStore] Rejecting snapshot:" << value.toObject()["id"].toString();
            return false;
        }
        documents.push_back(std::move(doc));
    }

    clear();

    const QJsonArray foldersArray = root["folders"].toArray();
    for (const auto& value : foldersArray) {
        m_folders.push_back(Folder::fromJson(value.toObject()));
    }
    m_documents = std::move(documents);

    return true;
}

bool DocumentStore::save(const QString& filePath, QString* errorMessage) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        }
        qWarning() << "[DocumentStore] Failed to save to" << filePath;
        return false;
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString());
        }
        qWarning() << "[DocumentStore] Failed to commit" << filePath;
        return false;
    }
    return true;
}

bool DocumentStore::load(const QString& filePath, QString* errorMessage)
{
    clear();

    QFile file(filePath);
    if (!file.exists()) {
        return true;    // No snapshot yet, start fresh
    }

    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("JSON parse error in %1: %2")
                                .arg(filePath, parseError.errorString());
        }
        qWarning() << "[DocumentStore] JSON parse error:" << parseError.errorString();
        return false;
    }

    return loadFromJson(doc.object(), errorMessage);
}

void DocumentStore::clear()
{
    m_documents.clear();
    m_folders.clear();
}
