#include "EngineConfig.h"

#include <QSettings>
#include <QFileInfo>
#include <QDir>

EngineConfig EngineConfig::fromSettings(QSettings& settings)
{
    EngineConfig config;
    settings.beginGroup("engine");
    config.storageRoot = settings.value("storageRoot", config.storageRoot).toString();
    config.defaultLanguage = settings.value("defaultLanguage", config.defaultLanguage).toString();
    config.extractedTitle = settings.value("extractedTitle", config.extractedTitle).toString();
    config.sidecarDirName = settings.value("sidecarDirName", config.sidecarDirName).toString();
    settings.endGroup();

    settings.beginGroup("pdf");
    config.pdfGarbageCollect = settings.value("garbageCollect", config.pdfGarbageCollect).toBool();
    config.pdfCompress = settings.value("compress", config.pdfCompress).toBool();
    settings.endGroup();

    // Ensure valid values
    if (config.defaultLanguage.isEmpty()) {
        config.defaultLanguage = QStringLiteral("eng");
    }
    if (config.extractedTitle.isEmpty()) {
        config.extractedTitle = QStringLiteral("noname.pdf");
    }
    if (config.sidecarDirName.isEmpty()) {
        config.sidecarDirName = QStringLiteral("sidecars");
    }
    return config;
}

EngineConfig EngineConfig::load(const QString& libraryDir)
{
    EngineConfig config;
    const QString iniPath = QDir(libraryDir).filePath("folio.ini");

    if (QFileInfo::exists(iniPath)) {
        QSettings settings(iniPath, QSettings::IniFormat);
        config = fromSettings(settings);
    } else {
        QSettings settings("Folio", "Engine");
        config = fromSettings(settings);
    }

    if (config.storageRoot.isEmpty()) {
        config.storageRoot = QDir(libraryDir).filePath("storage");
    } else if (QDir::isRelativePath(config.storageRoot)) {
        config.storageRoot = QDir(libraryDir).filePath(config.storageRoot);
    }
    return config;
}

void EngineConfig::save(QSettings& settings) const
{
    settings.beginGroup("engine");
    settings.setValue("storageRoot", storageRoot);
    settings.setValue("defaultLanguage", defaultLanguage);
    settings.setValue("extractedTitle", extractedTitle);
    settings.setValue("sidecarDirName", sidecarDirName);
    settings.endGroup();

    settings.beginGroup("pdf");
    settings.setValue("garbageCollect", pdfGarbageCollect);
    settings.setValue("compress", pdfCompress);
    settings.endGroup();
}
