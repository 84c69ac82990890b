#pragma once

#include <QString>
#include <QJsonObject>

#include <memory>

/**
 * @brief A folder that documents live in.
 *
 * Folders are the destination of move-to-folder extraction.
 */
class Folder {
public:
    QString id;         ///< UUID
    QString title;
    QString parentId;   ///< Empty for a root folder

    Folder();

    static std::unique_ptr<Folder> createNew(const QString& folderTitle,
                                             const QString& parentFolderId = QString());

    QJsonObject toJson() const;
    static std::unique_ptr<Folder> fromJson(const QJsonObject& obj);
};
