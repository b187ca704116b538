/*!
 * @file        extractionengine.cppm
 * @brief       Boundary between the batch core and the extraction/download engine.
 * @details     The engine is treated as a black box that can describe a URL
 *              (shallow "flat" listing or full metadata) and transfer media to
 *              disk. The core talks to it only through this interface, which
 *              keeps the resolver, executor and orchestrator testable with a
 *              scripted engine.
 *
 *              Cancellation crosses this boundary as a value: the progress hook
 *              returns HookDecision::Cancel and the engine reports
 *              EngineResult::Status::Cancelled instead of unwinding with an
 *              exception.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <functional>
#include <optional>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.core.extractionengine;
import reel.core.mediainfo;
import reel.core.downloadsettings;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Depth of metadata retrieval.
 */
REEL_MODULE_EXPORT enum class ExtractionMode {
    Flat,   //!< List playlist entries without resolving each entry.
    Full    //!< Complete metadata of a single item.
};

/**
 * @brief Result of a metadata request.
 */
REEL_MODULE_EXPORT struct ExtractionResult {
    std::optional<MediaInfo> info;  //!< Metadata, if the engine returned any.
    QString error;                  //!< Engine error text when info is empty.

    //!< @brief Return true if metadata is available.
    bool ok() const { return info.has_value(); }
};

/**
 * @brief One progress report from the engine.
 */
REEL_MODULE_EXPORT struct EngineProgress {
    QString status;                 //!< downloading, finished, error, ...
    qint64 downloadedBytes = 0;     //!< Bytes transferred so far.
    qint64 totalBytes = 0;          //!< Exact total, 0 if unknown.
    qint64 totalBytesEstimate = 0;  //!< Estimated total, 0 if unknown.
};

/**
 * @brief Answer of a progress hook.
 */
REEL_MODULE_EXPORT enum class HookDecision {
    Continue,   //!< Keep transferring.
    Cancel      //!< Abort the transfer as soon as possible.
};

/**
 * @brief Everything the engine needs to download one item.
 */
REEL_MODULE_EXPORT struct DownloadRequest {
    QString url;                //!< Item URL.
    QString outputTemplate;     //!< Output template, e.g. "/dir/Title.%(ext)s".
    DownloadSettings settings;  //!< Format, quality and subtitle options.
    QString cookiesFile;        //!< Optional cookie jar.
};

/**
 * @brief Result of a download request.
 */
REEL_MODULE_EXPORT struct EngineResult {
    /**
     * @brief Terminal state of the transfer.
     */
    enum class Status {
        Finished,   //!< Media file finalized.
        Cancelled,  //!< Aborted on request.
        Failed      //!< Engine error; see errorText.
    };

    Status status = Status::Failed;    //!< Terminal state.
    QString filePath;                  //!< Final media path when known.
    QString errorText;                 //!< Engine error text for Failed.
};

REEL_MODULE_EXPORT using ProgressHook = std::function<HookDecision(const EngineProgress&)>;
REEL_MODULE_EXPORT using FinalizedHook = std::function<void(const QString& filePath)>;
REEL_MODULE_EXPORT using CancelPredicate = std::function<bool()>;

/**
 * @brief Abstract extraction/download engine.
 *
 * Calls block the calling thread. Implementations must be usable from the
 * single background worker that drives a batch.
 */
REEL_MODULE_EXPORT class ExtractionEngine {
public:
    virtual ~ExtractionEngine() = default;

    /**
     * @brief Cookie jar used for metadata requests of the next batch.
     *
     * Downloads use the cookie file carried by the request. An empty path
     * disables cookies.
     */
    virtual void setCookiesFile(const QString& path) = 0;

    /**
     * @brief Retrieve metadata for a URL.
     * @param url URL to describe.
     * @param mode Flat listing or full metadata.
     * @return Metadata or the engine's error text.
     */
    virtual ExtractionResult extractInfo(const QString& url, ExtractionMode mode) = 0;

    /**
     * @brief Download one item.
     *
     * @param request What to download and where.
     * @param onProgress Called for every progress report; returning
     *        HookDecision::Cancel aborts the transfer.
     * @param onFinalized Called once with the final path after the container
     *        has been finalized.
     * @param isCancelled Polled while the engine waits for output.
     * @return Terminal state of the transfer.
     */
    virtual EngineResult download(const DownloadRequest& request,
                                  const ProgressHook& onProgress,
                                  const FinalizedHook& onFinalized,
                                  const CancelPredicate& isCancelled) = 0;
};
