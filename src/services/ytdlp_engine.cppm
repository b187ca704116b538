/*!
 * @file        ytdlp_engine.cppm
 * @brief       ExtractionEngine backed by the yt-dlp executable.
 * @details     Metadata is requested with "yt-dlp -J" and parsed into
 *              MediaInfo. Downloads run yt-dlp with a line-oriented progress
 *              template and an "after_move" print marker so progress reports
 *              and the finalized file path can be read from stdout while the
 *              process runs.
 *
 *              All calls block the calling thread and are meant to run on the
 *              batch worker.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <optional>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.services.ytdlp_engine;
import reel.core.extractionengine;
import reel.core.downloadsettings;
import reel.core.mediainfo;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief yt-dlp process wrapper.
 */
REEL_MODULE_EXPORT class YtDlpEngine : public ExtractionEngine {
public:
    /**
     * @brief Construct an engine.
     * @param executable yt-dlp path or name; empty searches PATH.
     * @param ffmpegLocation Optional muxer location forwarded to yt-dlp.
     */
    explicit YtDlpEngine(const QString& executable = QString(),
                         const QString& ffmpegLocation = QString());

    //!< @brief Return true if the yt-dlp executable can be found.
    bool isAvailable() const;

    //!< @brief Resolved executable path, empty when not found.
    QString executablePath() const { return m_executable; }

    void setCookiesFile(const QString& path) override { m_cookiesFile = path; }

    ExtractionResult extractInfo(const QString& url, ExtractionMode mode) override;

    EngineResult download(const DownloadRequest& request,
                          const ProgressHook& onProgress,
                          const FinalizedHook& onFinalized,
                          const CancelPredicate& isCancelled) override;

    /**
     * @brief Build the argument list for a metadata request.
     * @return Arguments, URL last.
     */
    static QStringList buildExtractArguments(const QString& url,
                                             ExtractionMode mode,
                                             const QString& cookiesFile = QString());

    /**
     * @brief Build the argument list for a download.
     * @param request Download request.
     * @param ffmpegLocation Optional muxer location.
     * @return Arguments, URL last.
     */
    static QStringList buildDownloadArguments(const DownloadRequest& request,
                                              const QString& ffmpegLocation = QString());

    /**
     * @brief Parse one progress line printed through the progress template.
     * @param line stdout line.
     * @return Progress report, or nothing if the line is not a progress line.
     */
    static std::optional<EngineProgress> parseProgressLine(const QString& line);

    /**
     * @brief Parse the finalized-file marker line.
     * @param line stdout line.
     * @return Path of the finalized file, or nothing.
     */
    static std::optional<QString> parseFinalizedLine(const QString& line);

    /**
     * @brief Pick the most relevant error text from yt-dlp stderr.
     *
     * Prefers the last "ERROR:" line without its prefix; otherwise the last
     * non-empty line.
     */
    static QString errorFromOutput(const QString& stderrText);

private:
    QString m_executable;       //!< yt-dlp path.
    QString m_ffmpegLocation;   //!< Forwarded with --ffmpeg-location.
    QString m_cookiesFile;      //!< Cookie jar for metadata requests.
};
