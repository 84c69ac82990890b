// ============================================================================
// DocumentVersion - Implementation
// ============================================================================

#include "DocumentVersion.h"

#include <QJsonArray>
#include <QUuid>
#include <QDebug>

DocumentVersion::DocumentVersion()
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    created = QDateTime::currentDateTimeUtc();
}

// ===== Page Access =====

Page* DocumentVersion::page(int number)
{
    if (number < 1 || number > pageCount()) {
        return nullptr;
    }
    return m_pages[static_cast<size_t>(number - 1)].get();
}

const Page* DocumentVersion::page(int number) const
{
    if (number < 1 || number > pageCount()) {
        return nullptr;
    }
    return m_pages[static_cast<size_t>(number - 1)].get();
}

Page* DocumentVersion::pageById(const QString& pageId)
{
    for (auto& p : m_pages) {
        if (p->id == pageId) {
            return p.get();
        }
    }
    return nullptr;
}

const Page* DocumentVersion::pageById(const QString& pageId) const
{
    for (const auto& p : m_pages) {
        if (p->id == pageId) {
            return p.get();
        }
    }
    return nullptr;
}

Page* DocumentVersion::addPage(std::unique_ptr<Page> page)
{
    if (!page) {
        return nullptr;
    }
    m_pages.push_back(std::move(page));
    Page* added = m_pages.back().get();
    added->number = pageCount();
    return added;
}

std::vector<const Page*> DocumentVersion::pages() const
{
    std::vector<const Page*> result;
    result.reserve(m_pages.size());
    for (const auto& p : m_pages) {
        result.push_back(p.get());
    }
    return result;
}

bool DocumentVersion::hasContiguousNumbers() const
{
    for (size_t i = 0; i < m_pages.size(); ++i) {
        if (m_pages[i]->number != static_cast<int>(i) + 1) {
            return false;
        }
    }
    return true;
}

// ===== Text =====

bool DocumentVersion::updateText(const QStringList& texts, QString* errorMessage)
{
    if (isArchived()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Version %1 is archived").arg(versionNumber);
        }
        return false;
    }
    if (texts.size() != pageCount()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Expected %1 page texts, got %2")
                                .arg(pageCount()).arg(texts.size());
        }
        return false;
    }

    for (int i = 0; i < texts.size(); ++i) {
        m_pages[static_cast<size_t>(i)]->text = texts.at(i);
    }
    rebuildText();
    return true;
}

void DocumentVersion::rebuildText()
{
    QStringList parts;
    for (const auto& p : m_pages) {
        if (p->hasText()) {
            parts.append(*p->text);
        }
    }
    text = parts.join(QLatin1Char(' '));
}

// ===== Serialization =====

QJsonObject DocumentVersion::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["document_id"] = documentId;
    obj["number"] = versionNumber;
    obj["payload"] = payloadPath;
    obj["text"] = text;
    obj["state"] = stateToString(state);
    obj["created"] = created.toString(Qt::ISODate);

    QJsonArray pagesArray;
    for (const auto& p : m_pages) {
        pagesArray.append(p->toJson());
    }
    obj["pages"] = pagesArray;

    return obj;
}

std::unique_ptr<DocumentVersion> DocumentVersion::fromJson(const QJsonObject& obj)
{
    auto version = std::make_unique<DocumentVersion>();
    version->id = obj["id"].toString(version->id);
    version->documentId = obj["document_id"].toString();
    version->versionNumber = obj["number"].toInt(1);
    version->payloadPath = obj["payload"].toString();
    version->text = obj["text"].toString();
    version->state = stringToState(obj["state"].toString());
    version->created = QDateTime::fromString(obj["created"].toString(), Qt::ISODate);

    const QJsonArray pagesArray = obj["pages"].toArray();
    for (const auto& value : pagesArray) {
        auto page = Page::fromJson(value.toObject());
        if (!page) {
            qWarning() << "[DocumentVersion] Skipping malformed page in version" << version->id;
            continue;
        }
        version->m_pages.push_back(std::move(page));
    }

    if (!version->hasContiguousNumbers()) {
        qWarning() << "[DocumentVersion] Page numbers of version" << version->id
                   << "are not contiguous";
        return nullptr;
    }

    return version;
}

QString DocumentVersion::stateToString(State s)
{
    switch (s) {
        case State::Staged:   return QStringLiteral("staged");
        case State::Current:  return QStringLiteral("current");
        case State::Archived: return QStringLiteral("archived");
    }
    return QStringLiteral("staged");
}

DocumentVersion::State DocumentVersion::stringToState(const QString& str)
{
    if (str == QLatin1String("current")) return State::Current;
    if (str == QLatin1String("archived")) return State::Archived;
    return State::Staged;
}
