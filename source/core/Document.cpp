// ============================================================================
// Document - Implementation
// ============================================================================

#include "Document.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QUuid>
#include <QDebug>

#include <algorithm>

Document::Document()
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    created = QDateTime::currentDateTimeUtc();
}

std::unique_ptr<Document> Document::createNew(const QString& docTitle,
                                              const QString& lang,
                                              const QString& parentFolderId)
{
    auto doc = std::make_unique<Document>();
    doc->title = docTitle;
    doc->language = lang;
    doc->folderId = parentFolderId;
    return doc;
}

// ===== Versions =====

std::vector<const DocumentVersion*> Document::versions() const
{
    std::vector<const DocumentVersion*> result;
    result.reserve(m_versions.size());
    for (const auto& v : m_versions) {
        result.push_back(v.get());
    }
    return result;
}

DocumentVersion* Document::versionByNumber(int number)
{
    for (auto& v : m_versions) {
        if (v->versionNumber == number) {
            return v.get();
        }
    }
    return nullptr;
}

DocumentVersion* Document::versionById(const QString& versionId)
{
    for (auto& v : m_versions) {
        if (v->id == versionId) {
            return v.get();
        }
    }
    return nullptr;
}

DocumentVersion* Document::currentVersion()
{
    for (auto& v : m_versions) {
        if (v->isCurrent()) {
            return v.get();
        }
    }
    return nullptr;
}

const DocumentVersion* Document::currentVersion() const
{
    for (const auto& v : m_versions) {
        if (v->isCurrent()) {
            return v.get();
        }
    }
    return nullptr;
}

int Document::nextVersionNumber() const
{
    int highest = 0;
    for (const auto& v : m_versions) {
        highest = std::max(highest, v->versionNumber);
    }
    return highest + 1;
}

DocumentVersion* Document::appendVersion(std::unique_ptr<DocumentVersion> version)
{
    if (!version) {
        return nullptr;
    }
    version->documentId = id;
    m_versions.push_back(std::move(version));
    return m_versions.back().get();
}

bool Document::setCurrent(DocumentVersion* version)
{
    if (!version || !version->isStaged()) {
        return false;
    }

    auto it = std::find_if(m_versions.begin(), m_versions.end(),
                           [version](const std::unique_ptr<DocumentVersion>& v) {
                               return v.get() == version;
                           });
    if (it == m_versions.end()) {
        return false;
    }

    // Archive and promote in one step so there is never zero or two current versions
    for (auto& v : m_versions) {
        if (v->isCurrent()) {
            v->state = DocumentVersion::State::Archived;
        }
    }
    version->state = DocumentVersion::State::Current;
    return true;
}

bool Document::removeStagedVersion(const QString& versionId)
{
    auto it = std::find_if(m_versions.begin(), m_versions.end(),
                           [&versionId](const std::unique_ptr<DocumentVersion>& v) {
                               return v->id == versionId;
                           });
    if (it == m_versions.end() || !(*it)->isStaged()) {
        return false;
    }
    m_versions.erase(it);
    return true;
}

QString Document::fileName() const
{
    QString name = title;
    name.replace(QLatin1Char('\\'), QLatin1Char('/'));
    name = QFileInfo(name).fileName().trimmed();

    if (name.isEmpty() || name == QLatin1String(".") || name == QLatin1String("..")) {
        return QStringLiteral("document.pdf");
    }
    if (name.endsWith(QLatin1String(".pdf"), Qt::CaseInsensitive)) {
        return name;
    }
    return name + QStringLiteral(".pdf");
}

// ===== Serialization =====

QJsonObject Document::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["lang"] = language;
    obj["folder_id"] = folderId;
    obj["created"] = created.toString(Qt::ISODate);

    QJsonArray versionsArray;
    for (const auto& v : m_versions) {
        versionsArray.append(v->toJson());
    }
    obj["versions"] = versionsArray;

    return obj;
}

std::unique_ptr<Document> Document::fromJson(const QJsonObject& obj)
{
    auto doc = std::make_unique<Document>();
    doc->id = obj["id"].toString(doc->id);
    doc->title = obj["title"].toString();
    doc->language = obj["lang"].toString();
    doc->folderId = obj["folder_id"].toString();
    doc->created = QDateTime::fromString(obj["created"].toString(), Qt::ISODate);

    int currentCount = 0;
    const QJsonArray versionsArray = obj["versions"].toArray();
    for (const auto& value : versionsArray) {
        auto version = DocumentVersion::fromJson(value.toObject());
        if (!version) {
            qWarning() << "[Document] Rejecting document" << doc->id << "with a malformed version";
            return nullptr;
        }
        if (version->isCurrent()) {
            ++currentCount;
        }
        doc->appendVersion(std::move(version));
    }

    if (currentCount > 1) {
        qWarning() << "[Document]" << doc->id << "has" << currentCount << "current versions";
    }

    std::sort(doc->m_versions.begin(), doc->m_versions.end(),
              [](const std::unique_ptr<DocumentVersion>& a,
                 const std::unique_ptr<DocumentVersion>& b) {
                  return a->versionNumber < b->versionNumber;
              });

    return doc;
}
