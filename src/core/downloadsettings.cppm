/*!
 * @file        downloadsettings.cppm
 * @brief       Read-only download settings consumed by the batch core.
 * @details     Settings describe what the user wants produced: the output
 *              container or audio format, the quality selector handed to the
 *              engine, subtitle and per-field metadata embedding flags and the
 *              year-subfolder partitioning switch.
 *
 *              The core never mutates settings. They are loaded from the
 *              application's JSON settings document and may then be overridden
 *              by the command line before a batch starts.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>

#ifndef Q_MOC_RUN
export module reel.core.downloadsettings;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief User preferences that shape a download.
 */
REEL_MODULE_EXPORT struct DownloadSettings {
    QString outputFormat = QStringLiteral("mp4");   //!< mp4, mkv or mp3.
    QString quality = QStringLiteral("best");       //!< Engine format selector.
    bool downloadSubtitles = false;                 //!< Fetch subtitles and automatic captions.
    bool embedTitle = true;                         //!< Write the title into the container.
    bool embedUploader = true;                      //!< Write the uploader into the container.
    bool embedDescription = true;                   //!< Write the description into the container.
    bool embedTags = true;                          //!< Write tags into the container.
    bool embedLicense = true;                       //!< Write the license into the container.
    bool useYearSubfolders = false;                 //!< Partition output by upload year.
    QString cookiesFile;                            //!< Optional cookie jar for the engine.
    QString ledgerFile = QStringLiteral("downloaded_files.json"); //!< Idempotency ledger location.
    QString loggingLevel = QStringLiteral("DEBUG"); //!< Minimum log level.

    //!< @brief Return true when only the audio stream is kept.
    bool audioOnly() const { return normalizedFormat() == QStringLiteral("mp3"); }

    /**
     * @brief Container extension produced for this format.
     *
     * Unknown formats fall back to an mp4 merge.
     */
    QString normalizedFormat() const;

    /**
     * @brief Build settings from a JSON settings document.
     *
     * Unknown keys are ignored; missing keys keep their defaults.
     *
     * @param object Parsed settings document.
     * @return Settings.
     */
    static DownloadSettings fromJson(const QJsonObject& object);

    /**
     * @brief Serialize settings with the same keys fromJson() reads.
     * @return JSON document.
     */
    QJsonObject toJson() const;
};

/**
 * @brief Load settings from a JSON file.
 *
 * A missing file is not an error and yields defaults. A file that cannot be
 * read or parsed yields defaults and an error description.
 *
 * @param path Settings file path.
 * @param error Optional output for a human-readable error.
 * @return Loaded settings.
 */
REEL_MODULE_EXPORT DownloadSettings loadSettingsFile(const QString& path, QString* error = nullptr);
