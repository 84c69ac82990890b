#pragma once

// ============================================================================
// PagePath - Storage locations of version payloads and page side data
// ============================================================================
// Layout below the storage root:
//
//   docs/<document id>/v<version number>/<file name>      PDF payload
//   <sidecars>/<document id>/v<version number>/            version side data
//   <sidecars>/<document id>/v<version number>/pages/000001 per-page artifacts
//
// Every path is relative to the storage root and uses '/' separators.
// ============================================================================

#include <QString>

/**
 * @brief Addresses one page of one version in storage.
 */
struct PagePath {
    QString documentId;
    int versionNumber = 0;
    int pageNumber = 0;                             ///< 1-based
    QString sidecarDirName = QStringLiteral("sidecars");

    PagePath() = default;
    PagePath(const QString& docId, int version, int page,
             const QString& sidecars = QStringLiteral("sidecars"))
        : documentId(docId), versionNumber(version), pageNumber(page), sidecarDirName(sidecars) {}

    /**
     * @brief Directory holding this page's rendering artifacts.
     */
    QString directory() const
    {
        return versionSidecarDir(documentId, versionNumber, sidecarDirName)
               + QStringLiteral("/pages/")
               + QStringLiteral("%1").arg(pageNumber, 6, 10, QLatin1Char('0'));
    }

    /**
     * @brief Payload path of a version.
     */
    static QString documentPathFor(const QString& docId, int version, const QString& fileName)
    {
        return QStringLiteral("docs/%1/v%2/%3").arg(docId).arg(version).arg(fileName);
    }

    /**
     * @brief Directory holding all payload files of a version.
     */
    static QString versionPayloadDir(const QString& docId, int version)
    {
        return QStringLiteral("docs/%1/v%2").arg(docId).arg(version);
    }

    /**
     * @brief Directory holding the side data of every page of a version.
     */
    static QString versionSidecarDir(const QString& docId, int version,
                                     const QString& sidecars = QStringLiteral("sidecars"))
    {
        return QStringLiteral("%1/%2/v%3").arg(sidecars, docId).arg(version);
    }
};
