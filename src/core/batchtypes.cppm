/*!
 * @file        batchtypes.cppm
 * @brief       Value types shared by the resolver, executor and orchestrator.
 * @details     Defines the unit of work handed from resolution to download,
 *              the failure taxonomy reported at batch completion, and the
 *              outcome of a single download attempt.
 *
 *              Cancellation is an outcome of its own rather than a failure, so
 *              the orchestrator can stop the loop and report "stopped by user"
 *              instead of counting the interruption as an ordinary error.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <optional>
#include <QList>
#include <QString>

#ifndef Q_MOC_RUN
export module reel.core.batchtypes;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Why a URL or item could not be processed.
 */
REEL_MODULE_EXPORT enum class FailureReason {
    NoMetadata,             //!< The engine returned nothing for a raw URL.
    PrivateOrInaccessible,  //!< Private, deleted or otherwise unavailable item.
    UnhandledType,          //!< The engine returned a result type the core cannot use.
    DownloadError,          //!< The engine failed; detail carries its message.
    Cancelled               //!< The in-flight item was interrupted by the user.
};

/**
 * @brief One failed URL and the reason it failed.
 *
 * Records are immutable once created and collected in discovery order.
 */
REEL_MODULE_EXPORT struct FailureRecord {
    QString url;                                        //!< URL that failed (or the best-known parent URL).
    FailureReason reason = FailureReason::DownloadError; //!< Failure class.
    QString detail;                                     //!< Raw engine text or type name, if any.

    //!< @brief Human-readable reason, e.g. "no-metadata" or the engine error text.
    QString reasonText() const;

    //!< @brief Single-line summary "url - reason".
    QString toString() const;

    bool operator==(const FailureRecord& other) const = default;
};

REEL_MODULE_EXPORT using FailureList = QList<FailureRecord>;

/**
 * @brief Stable identifier of a failure reason.
 * @param reason Reason value.
 * @return Identifier such as "private-or-inaccessible".
 */
REEL_MODULE_EXPORT QString failureReasonName(FailureReason reason);

/**
 * @brief One concrete, downloadable unit.
 *
 * Created during resolution with only the source URL, then enriched by the
 * executor's metadata fetch before the download starts.
 */
REEL_MODULE_EXPORT struct WorkItem {
    QString sourceUrl;                      //!< Page/video URL.
    QString title;                          //!< Title, empty until metadata is fetched.
    std::optional<qint64> uploadTimestamp;  //!< Upload time as unix seconds.
    QString thumbnailUrl;                   //!< Thumbnail URL.
    QString description;                    //!< Description text.
    QString destinationDir;                 //!< Folder the media file is written to.
};

/**
 * @brief Result of executing one work item.
 */
REEL_MODULE_EXPORT struct DownloadOutcome {
    /**
     * @brief Outcome kind.
     */
    enum class Kind {
        Downloaded,     //!< Media file written and post-processed.
        Skipped,        //!< Already downloaded; nothing was done.
        Cancelled,      //!< Interrupted by cancellation.
        Failed          //!< Failed; see failure.
    };

    Kind kind = Kind::Failed;   //!< Outcome kind.
    QString filePath;           //!< Final media path for Downloaded/Skipped.
    FailureRecord failure;      //!< Populated for Failed and Cancelled.

    //!< @brief Return true for Downloaded and Skipped.
    bool succeeded() const { return kind == Kind::Downloaded || kind == Kind::Skipped; }

    static DownloadOutcome downloaded(const QString& path) { return { Kind::Downloaded, path, {} }; }
    static DownloadOutcome skipped(const QString& path) { return { Kind::Skipped, path, {} }; }
    static DownloadOutcome cancelled(const QString& url) { return { Kind::Cancelled, QString(), { url, FailureReason::Cancelled, QString() } }; }
    static DownloadOutcome failed(const FailureRecord& record) { return { Kind::Failed, QString(), record }; }
};
