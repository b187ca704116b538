/*!
 * @file        batchorchestrator.cppm
 * @brief       Drives one batch from raw URLs to a final failure report.
 * @details     The orchestrator owns the per-run BatchState, resolves the raw
 *              URLs, downloads the resolved items one after another on a single
 *              background worker, aggregates per-item and overall progress,
 *              inserts a randomized cool-off every few items and collects
 *              failures into one list reported at completion.
 *
 *              Phases:
 *              - Idle -> Resolving when a batch starts with valid preconditions
 *              - Resolving -> Downloading once resolution finished
 *              - Downloading -> Cancelling as soon as cancellation is observed
 *              - any -> Completed when the queue is exhausted or cancelled
 *
 *              Everything the presentation layer learns arrives through
 *              signals. Nothing outside the worker mutates the batch state; the
 *              only inbound call during a run is cancel(), which flips a
 *              monotonic flag.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <atomic>
#include <QByteArray>
#include <QFutureWatcher>
#include <QMutex>
#include <QObject>
#include <QSharedPointer>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.core.batchorchestrator;
import reel.core.batchtypes;
import reel.core.downloadledger;
import reel.core.downloadsettings;
import reel.core.extractionengine;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Lifecycle phase of a batch.
 */
REEL_MODULE_EXPORT enum class BatchPhase {
    Idle,           //!< Nothing running.
    Resolving,      //!< Flattening raw URLs.
    Downloading,    //!< Working through the resolved queue.
    Cancelling,     //!< Cancellation observed; unwinding the in-flight item.
    Completed       //!< Terminal.
};

//!< @brief Lower-case name of a phase, for logs.
REEL_MODULE_EXPORT QString batchPhaseName(BatchPhase phase);

/**
 * @brief Input of one batch.
 */
REEL_MODULE_EXPORT struct BatchRequest {
    QStringList urls;           //!< Raw user-supplied URLs.
    QString destinationDir;     //!< Base output folder.
    DownloadSettings settings;  //!< Output preferences.
    QString cookiesFile;        //!< Overrides settings.cookiesFile when set.
};

/**
 * @brief Mutable state of one run.
 *
 * Created when a batch starts and replaced by the next batch. Only the
 * worker running the batch writes it; cancelRequested is the single field
 * other threads may set.
 */
REEL_MODULE_EXPORT struct BatchState {
    QStringList queue;                          //!< Resolved video URLs in discovery order.
    int completedCount = 0;                     //!< Items finished, skipped or failed.
    int totalCount = 0;                         //!< Resolved queue length.
    FailureList failures;                       //!< Append-only during a run.
    std::atomic_bool cancelRequested { false }; //!< Monotonic cancellation flag.
    int downloadCounter = 0;                    //!< Drives the periodic cool-off.
};

/**
 * @brief Result of a finished batch.
 */
REEL_MODULE_EXPORT struct BatchSummary {
    int totalCount = 0;         //!< Resolved items.
    int completedCount = 0;     //!< Items processed to an outcome.
    int downloaded = 0;         //!< Items downloaded in this run.
    int skipped = 0;            //!< Items already present.
    FailureList failures;       //!< Every failure in discovery order.
    bool cancelled = false;     //!< Stopped by the user.
    bool fatal = false;         //!< Stopped by a failed precondition.
    QString finalStatus;        //!< Last status message.
};

/**
 * @brief Batch state machine.
 */
REEL_MODULE_EXPORT class BatchOrchestrator : public QObject {

    Q_OBJECT

    //!< @brief Whether a batch is in progress.
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)

public:
    /**
     * @brief Construct an orchestrator.
     * @param engine Extraction engine; must outlive the orchestrator.
     * @param muxerPath ffmpeg path or name; empty searches PATH.
     * @param ledgerPath Ledger file, loaded here.
     * @param parent Optional parent QObject.
     */
    BatchOrchestrator(ExtractionEngine& engine,
                      const QString& muxerPath,
                      const QString& ledgerPath,
                      QObject* parent = nullptr);

    ~BatchOrchestrator() override;

    /**
     * @brief Start a batch on a background worker.
     * @return false if a batch is already running.
     */
    bool start(const BatchRequest& request);

    /**
     * @brief Run a batch on the calling thread.
     *
     * Emits the same signals as start(). Returns a fatal summary if a batch
     * is already running.
     */
    BatchSummary run(const BatchRequest& request);

    //!< @brief Request cancellation of the running batch.
    Q_INVOKABLE void cancel();

    //!< @brief Block until a batch started with start() finished.
    void waitForFinished();

    //!< @brief Return true while a batch runs.
    bool isRunning() const { return m_running.load(); }

    //!< @brief Current phase.
    BatchPhase phase() const { return m_phase.load(); }

    //!< @brief Summary of the last finished batch.
    BatchSummary lastSummary() const;

    //!< @brief Resolved muxer path, empty when not found.
    QString muxerPath() const { return m_muxerPath; }

    //!< @brief Ledger shared by all batches of this orchestrator.
    const DownloadLedger& ledger() const { return m_ledger; }

    /**
     * @brief Configure the cool-off between items.
     * @param everyItems Pause after every N processed items (0 disables).
     * @param maxDelayMs Upper bound of the random pause.
     */
    void setCoolOff(int everyItems, int maxDelayMs);

    //!< @brief Enable or disable thumbnail preview fetches.
    void setThumbnailFetchEnabled(bool enabled) { m_fetchThumbnails = enabled; }

    //!< @brief Overall progress for completed of total, 0 when total is 0.
    static int overallPercent(int completed, int total);

signals:
    void runningChanged();
    void phaseChanged(BatchPhase phase);
    void statusChanged(const QString& text);
    void itemProgress(int percent);
    void overallProgress(int percent);
    void currentItemChanged(const QString& title);
    void thumbnailReady(const QByteArray& data);
    void descriptionChanged(const QString& description);

    //!< @brief Total number of resolved items.
    void batchResolved(int total);

    //!< @brief Every failure of the batch, emitted once even when empty.
    void failuresReported(const FailureList& failures);

    //!< @brief Emitted exactly once per batch, last.
    void completed();

private:
    QSharedPointer<BatchState> beginBatch();
    BatchSummary execute(const BatchRequest& request, const QSharedPointer<BatchState>& state);
    QString checkPreconditions(const BatchRequest& request) const;
    void coolOff(const CancelPredicate& isCancelled);
    void setPhase(BatchPhase phase);
    void finish(const BatchSummary& summary);

    ExtractionEngine& m_engine;                 //!< Metadata and transfer.
    QString m_muxerPath;                        //!< Resolved muxer.
    DownloadLedger m_ledger;                    //!< Finished downloads.

    mutable QMutex m_mutex;                     //!< Guards m_state and m_lastSummary.
    QSharedPointer<BatchState> m_state;         //!< Current run.
    BatchSummary m_lastSummary;                 //!< Last finished run.

    std::atomic_bool m_running { false };       //!< Batch in progress.
    std::atomic<BatchPhase> m_phase { BatchPhase::Idle }; //!< Current phase.

    QFutureWatcher<BatchSummary> m_watcher;     //!< Background run.
    int m_coolOffEvery = 10;                    //!< Items between pauses.
    int m_coolOffMaxMs = 2000;                  //!< Pause upper bound.
    bool m_fetchThumbnails = true;              //!< Preview fetch switch.
};

#include "batchorchestrator.moc"
