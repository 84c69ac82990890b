#include "Folder.h"

#include <QUuid>

Folder::Folder()
{
    id = QUuid::createUuid().toString(QUuid::WithoutBraces);
}

std::unique_ptr<Folder> Folder::createNew(const QString& folderTitle, const QString& parentFolderId)
{
    auto folder = std::make_unique<Folder>();
    folder->title = folderTitle;
    folder->parentId = parentFolderId;
    return folder;
}

QJsonObject Folder::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["title"] = title;
    obj["parent_id"] = parentId;
    return obj;
}

std::unique_ptr<Folder> Folder::fromJson(const QJsonObject& obj)
{
    auto folder = std::make_unique<Folder>();
    folder->id = obj["id"].toString(folder->id);
    folder->title = obj["title"].toString();
    folder->parentId = obj["parent_id"].toString();
    return folder;
}
