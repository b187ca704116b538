module;
#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QRandomGenerator>
#include <QThread>
#include <QtConcurrent>

module reel.core.batchorchestrator;

import reel.core.downloadexecutor;
import reel.core.urlresolver;
import reel.utils.download_utils;

namespace utils = reel::utils;

namespace {

constexpr int kCoolOffSliceMs = 50;

const QString kStoppedStatus = QStringLiteral("Download stopped by user.");
const QString kCompleteStatus = QStringLiteral("Download complete");

} // namespace

QString batchPhaseName(BatchPhase phase)
{
    switch (phase) {
    case BatchPhase::Idle: return QStringLiteral("idle");
    case BatchPhase::Resolving: return QStringLiteral("resolving");
    case BatchPhase::Downloading: return QStringLiteral("downloading");
    case BatchPhase::Cancelling: return QStringLiteral("cancelling");
    case BatchPhase::Completed: return QStringLiteral("completed");
    }
    return QString();
}

BatchOrchestrator::BatchOrchestrator(ExtractionEngine& engine,
                                     const QString& muxerPath,
                                     const QString& ledgerPath,
                                     QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_muxerPath(utils::findExecutable(muxerPath, QStringLiteral("ffmpeg")))
    , m_ledger(ledgerPath)
{
}

BatchOrchestrator::~BatchOrchestrator()
{
    cancel();
    m_watcher.waitForFinished();
}

bool BatchOrchestrator::start(const BatchRequest& request)
{
    if (m_running.exchange(true)) {
        qWarning() << "A batch is already running";
        return false;
    }
    const auto state = beginBatch();
    m_watcher.setFuture(QtConcurrent::run([this, request, state]() {
        return execute(request, state);
    }));
    return true;
}

BatchSummary BatchOrchestrator::run(const BatchRequest& request)
{
    if (m_running.exchange(true)) {
        qWarning() << "A batch is already running";
        BatchSummary rejected;
        rejected.fatal = true;
        rejected.finalStatus = QStringLiteral("A batch is already running.");
        return rejected;
    }
    return execute(request, beginBatch());
}

void BatchOrchestrator::cancel()
{
    QMutexLocker locker(&m_mutex);
    if (!m_state || !m_running.load()) return;
    if (!m_state->cancelRequested.exchange(true)) {
        qInfo() << "Cancellation requested";
    }
}

void BatchOrchestrator::waitForFinished()
{
    m_watcher.waitForFinished();
}

BatchSummary BatchOrchestrator::lastSummary() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastSummary;
}

void BatchOrchestrator::setCoolOff(int everyItems, int maxDelayMs)
{
    m_coolOffEvery = qMax(0, everyItems);
    m_coolOffMaxMs = qMax(0, maxDelayMs);
}

int BatchOrchestrator::overallPercent(int completed, int total)
{
    if (total <= 0) return 0;
    return static_cast<int>(static_cast<qint64>(completed) * 100 / total);
}

QSharedPointer<BatchState> BatchOrchestrator::beginBatch()
{
    const auto state = QSharedPointer<BatchState>::create();
    QMutexLocker locker(&m_mutex);
    m_state = state;
    return state;
}

BatchSummary BatchOrchestrator::execute(const BatchRequest& request, const QSharedPointer<BatchState>& state)
{
    emit runningChanged();
    setPhase(BatchPhase::Idle);

    BatchSummary summary;
    const CancelPredicate isCancelled = [state]() { return state->cancelRequested.load(); };

    const QString fatal = checkPreconditions(request);
    if (!fatal.isEmpty()) {
        qCritical().noquote() << fatal;
        summary.fatal = true;
        summary.finalStatus = fatal;
        emit statusChanged(fatal);
        finish(summary);
        return summary;
    }

    DownloadSettings settings = request.settings;
    if (!request.cookiesFile.isEmpty()) settings.cookiesFile = request.cookiesFile;
    m_engine.setCookiesFile(settings.cookiesFile);

    setPhase(BatchPhase::Resolving);
    emit statusChanged(QStringLiteral("Resolving %1 URL(s)...").arg(request.urls.size()));

    UrlResolver resolver(m_engine);
    const ResolveResult resolved = resolver.resolve(request.urls, isCancelled);
    state->queue = resolved.urls;
    state->totalCount = static_cast<int>(resolved.urls.size());
    state->failures.append(resolved.failures);
    emit batchResolved(state->totalCount);
    qInfo() << "Resolved" << state->totalCount << "item(s)," << resolved.failures.size() << "resolution failure(s)";

    if (isCancelled()) {
        setPhase(BatchPhase::Cancelling);
    } else {
        setPhase(BatchPhase::Downloading);

        DownloadExecutor executor(m_engine, m_ledger, settings, m_muxerPath);
        executor.setThumbnailFetchEnabled(m_fetchThumbnails);
        connect(&executor, &DownloadExecutor::currentItemChanged, this, &BatchOrchestrator::currentItemChanged, Qt::DirectConnection);
        connect(&executor, &DownloadExecutor::descriptionChanged, this, &BatchOrchestrator::descriptionChanged, Qt::DirectConnection);
        connect(&executor, &DownloadExecutor::thumbnailFetched, this, &BatchOrchestrator::thumbnailReady, Qt::DirectConnection);
        connect(&executor, &DownloadExecutor::itemProgress, this, &BatchOrchestrator::itemProgress, Qt::DirectConnection);
        connect(&executor, &DownloadExecutor::statusMessage, this, &BatchOrchestrator::statusChanged, Qt::DirectConnection);

        for (int i = 0; i < state->totalCount; ++i) {
            if (isCancelled()) {
                setPhase(BatchPhase::Cancelling);
                break;
            }

            const QString& url = state->queue.at(i);
            emit statusChanged(QStringLiteral("Processing %1 of %2").arg(i + 1).arg(state->totalCount));
            emit itemProgress(0);

            const DownloadOutcome outcome = executor.execute(url, request.destinationDir, isCancelled);
            if (outcome.kind == DownloadOutcome::Kind::Cancelled) {
                setPhase(BatchPhase::Cancelling);
                state->failures.append(outcome.failure);
                break;
            }

            switch (outcome.kind) {
            case DownloadOutcome::Kind::Downloaded: ++summary.downloaded; break;
            case DownloadOutcome::Kind::Skipped: ++summary.skipped; break;
            case DownloadOutcome::Kind::Failed: state->failures.append(outcome.failure); break;
            case DownloadOutcome::Kind::Cancelled: break;
            }

            state->completedCount = qMin(state->completedCount + 1, state->totalCount);
            emit overallProgress(overallPercent(state->completedCount, state->totalCount));

            ++state->downloadCounter;
            if (m_coolOffEvery > 0 && state->downloadCounter % m_coolOffEvery == 0 && i + 1 < state->totalCount) {
                coolOff(isCancelled);
            }
        }
    }

    summary.totalCount = state->totalCount;
    summary.completedCount = state->completedCount;
    summary.failures = state->failures;
    summary.cancelled = isCancelled();
    summary.finalStatus = summary.cancelled ? kStoppedStatus : kCompleteStatus;

    qInfo().noquote() << summary.finalStatus << QStringLiteral("(%1/%2 processed, %3 failure(s))")
                                                     .arg(summary.completedCount)
                                                     .arg(summary.totalCount)
                                                     .arg(summary.failures.size());
    emit statusChanged(summary.finalStatus);
    finish(summary);
    return summary;
}

QString BatchOrchestrator::checkPreconditions(const BatchRequest& request) const
{
    bool anyUrl = false;
    for (const QString& url : request.urls) {
        if (!url.trimmed().isEmpty()) {
            anyUrl = true;
            break;
        }
    }
    if (!anyUrl) return QStringLiteral("No URLs to download.");

    if (m_muxerPath.isEmpty()) {
        return QStringLiteral("ffmpeg not found. Install it or pass its location.");
    }

    if (request.destinationDir.trimmed().isEmpty()) {
        return QStringLiteral("No destination folder selected.");
    }
    const QString destination = utils::normalizeFilePath(request.destinationDir);
    if (!QDir().mkpath(destination)) {
        return QStringLiteral("Cannot create destination folder: %1").arg(destination);
    }
    return QString();
}

void BatchOrchestrator::coolOff(const CancelPredicate& isCancelled)
{
    if (m_coolOffMaxMs <= 0) return;
    const int delay = static_cast<int>(QRandomGenerator::global()->bounded(m_coolOffMaxMs + 1));
    qDebug() << "Cooling off for" << delay << "ms";
    emit statusChanged(QStringLiteral("Pausing %1 ms to avoid rate limits").arg(delay));

    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < delay) {
        if (isCancelled()) return;
        const qint64 remaining = delay - timer.elapsed();
        QThread::msleep(static_cast<unsigned long>(qBound<qint64>(1, remaining, kCoolOffSliceMs)));
    }
}

void BatchOrchestrator::setPhase(BatchPhase phase)
{
    if (m_phase.exchange(phase) == phase) return;
    qDebug() << "Batch phase:" << batchPhaseName(phase);
    emit phaseChanged(phase);
}

// Every batch, fatal ones included, reports its failure list (possibly empty)
// before completed(). The batch is no longer running by then, so a completed()
// handler may start the next one.
void BatchOrchestrator::finish(const BatchSummary& summary)
{
    {
        QMutexLocker locker(&m_mutex);
        m_lastSummary = summary;
    }
    emit failuresReported(summary.failures);
    m_running = false;
    emit runningChanged();
    setPhase(BatchPhase::Completed);
    emit completed();
}
