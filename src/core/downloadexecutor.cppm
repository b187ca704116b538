/*!
 * @file        downloadexecutor.cppm
 * @brief       Downloads one resolved item end to end.
 * @details     For a single video URL the executor fetches full metadata,
 *              announces the item, derives the destination folder and file
 *              name, skips work already done, drives the engine with a
 *              progress hook that honours cancellation and finally hands the
 *              finalized file to post-processing and records it in the ledger.
 *
 *              Failures are returned as values. Cancellation is reported as its
 *              own outcome so the caller can stop the batch loop.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QObject>
#include <QString>

#ifndef Q_MOC_RUN
export module reel.core.downloadexecutor;
import reel.core.batchtypes;
import reel.core.downloadledger;
import reel.core.downloadsettings;
import reel.core.extractionengine;
import reel.core.mediainfo;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Executes one work item on the batch worker.
 *
 * Signals are emitted from the calling thread; receivers living elsewhere get
 * them through queued connections.
 */
REEL_MODULE_EXPORT class DownloadExecutor : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct an executor.
     * @param engine Extraction engine; must outlive the executor.
     * @param ledger Idempotency ledger; must outlive the executor.
     * @param settings Download settings.
     * @param muxerPath Muxer used by post-processing.
     * @param parent Optional parent QObject.
     */
    DownloadExecutor(ExtractionEngine& engine,
                     DownloadLedger& ledger,
                     const DownloadSettings& settings,
                     const QString& muxerPath,
                     QObject* parent = nullptr);

    /**
     * @brief Download one video.
     * @param videoUrl Resolved video URL.
     * @param destinationBase Base output folder.
     * @param isCancelled Cancellation predicate polled by the progress hook.
     * @return Outcome of the attempt.
     */
    DownloadOutcome execute(const QString& videoUrl,
                            const QString& destinationBase,
                            const CancelPredicate& isCancelled);

    //!< @brief Enable or disable the best-effort thumbnail preview fetch.
    void setThumbnailFetchEnabled(bool enabled) { m_fetchThumbnails = enabled; }

    //!< @brief Timeout of the thumbnail preview fetch in milliseconds.
    void setThumbnailTimeout(int ms) { m_thumbnailTimeoutMs = ms; }

    //!< @brief Work item of the most recent execute() call.
    WorkItem currentItem() const { return m_item; }

    /**
     * @brief Convert an engine progress report to a 0..100 value.
     *
     * Uses the exact total when known, then the estimate; an unknown size
     * reports 0. A finished report is always 100.
     */
    static int progressPercent(const EngineProgress& progress);

    /**
     * @brief Folder an item is written to.
     * @param base Base output folder.
     * @param uploadDate Upload date as YYYYMMDD.
     * @param useYearSubfolders Append the upload year when well-formed.
     */
    static QString destinationFolder(const QString& base, const QString& uploadDate, bool useYearSubfolders);

    /**
     * @brief File stem derived from the item title.
     *
     * Falls back to the id when the title is empty. The stem is short enough
     * that every sidecar and temporary suffix still fits a file name.
     */
    static QString fileStem(const MediaInfo& info);

signals:
    //!< @brief Title of the item being processed.
    void currentItemChanged(const QString& title);

    //!< @brief Description of the item being processed.
    void descriptionChanged(const QString& description);

    //!< @brief Raw thumbnail bytes of the item being processed.
    void thumbnailFetched(const QByteArray& data);

    //!< @brief Per-item progress, 0..100.
    void itemProgress(int percent);

    //!< @brief Human-readable status line.
    void statusMessage(const QString& text);

private:
    QByteArray fetchThumbnail(const QString& url) const;
    DownloadOutcome classifyFailure(const QString& url, const QString& errorText) const;

    ExtractionEngine& m_engine;         //!< Metadata and transfer.
    DownloadLedger& m_ledger;           //!< Finished downloads.
    DownloadSettings m_settings;        //!< Output preferences.
    QString m_muxerPath;                //!< Post-processing muxer.
    WorkItem m_item;                    //!< Item in flight.
    bool m_fetchThumbnails = true;      //!< Preview fetch switch.
    int m_thumbnailTimeoutMs = 10000;   //!< Preview fetch timeout.
};

#include "downloadexecutor.moc"
