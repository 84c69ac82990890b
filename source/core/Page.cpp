// ============================================================================
// Page - Implementation
// ============================================================================

#include "Page.h"

#include <QUuid>
#include <QDebug>

Page::Page()
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
}

Page::Page(int pageNumber)
    : Page()
{
    number = pageNumber;
}

// ===== Serialization =====

QJsonObject Page::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["number"] = number;

    if (text) {
        obj["text"] = *text;
    }
    if (language) {
        obj["lang"] = *language;
    }
    if (artifactPath) {
        obj["artifact"] = *artifactPath;
    }

    return obj;
}

std::unique_ptr<Page> Page::fromJson(const QJsonObject& obj)
{
    if (!obj.contains("id") || !obj.contains("number")) {
        qWarning() << "[Page] Missing id or number in page record";
        return nullptr;
    }

    auto page = std::make_unique<Page>();
    page->id = obj["id"].toString();
    page->number = obj["number"].toInt();

    if (obj.contains("text")) {
        page->text = obj["text"].toString();
    }
    if (obj.contains("lang")) {
        page->language = obj["lang"].toString();
    }
    if (obj.contains("artifact")) {
        page->artifactPath = obj["artifact"].toString();
    }

    return page;
}
