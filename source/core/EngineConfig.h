#pragma once

// ============================================================================
// EngineConfig - Settings of the page mutation engine
// ============================================================================
// Values are read from QSettings. A library directory may carry its own
// folio.ini; without one, the native "Folio"/"Engine" settings are used.
// ============================================================================

#include <QString>

class QSettings;

/**
 * @brief Configuration consumed by PageMutator, storage and the PDF editor.
 */
struct EngineConfig {
    QString storageRoot;                            ///< Root directory of FileStorage
    QString defaultLanguage = QStringLiteral("eng");///< Language for documents created without one
    QString extractedTitle = QStringLiteral("noname.pdf"); ///< Title of documents created by move-to-folder
    QString sidecarDirName = QStringLiteral("sidecars");    ///< Top-level storage directory of page artifacts
    bool pdfGarbageCollect = true;                  ///< Drop unreferenced objects when writing PDFs
    bool pdfCompress = true;                        ///< Deflate streams when writing PDFs

    /**
     * @brief Read values from an open settings object.
     * Missing keys keep their defaults.
     */
    static EngineConfig fromSettings(QSettings& settings);

    /**
     * @brief Load configuration for a library directory.
     *
     * Reads <libraryDir>/folio.ini when it exists, otherwise the native
     * settings. An empty storageRoot defaults to <libraryDir>/storage.
     */
    static EngineConfig load(const QString& libraryDir);

    /**
     * @brief Write all values to a settings object.
     */
    void save(QSettings& settings) const;
};
