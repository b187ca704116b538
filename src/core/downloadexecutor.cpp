module;
#include <memory>
#include <QDebug>
#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

module reel.core.downloadexecutor;

import reel.core.postprocessor;
import reel.utils.download_utils;
import reel.utils.filename_utils;

namespace utils = reel::utils;

DownloadExecutor::DownloadExecutor(ExtractionEngine& engine,
                                   DownloadLedger& ledger,
                                   const DownloadSettings& settings,
                                   const QString& muxerPath,
                                   QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_ledger(ledger)
    , m_settings(settings)
    , m_muxerPath(muxerPath)
{
}

DownloadOutcome DownloadExecutor::execute(const QString& videoUrl,
                                          const QString& destinationBase,
                                          const CancelPredicate& isCancelled)
{
    m_item = WorkItem();
    m_item.sourceUrl = videoUrl;

    // The ledger is authoritative and saves a metadata round trip.
    if (m_ledger.contains(videoUrl)) {
        const QString path = m_ledger.pathFor(videoUrl);
        qDebug() << "Already downloaded:" << videoUrl << "->" << path;
        emit statusMessage(QStringLiteral("Already downloaded: %1").arg(videoUrl));
        return DownloadOutcome::skipped(path);
    }

    const ExtractionResult extracted = m_engine.extractInfo(videoUrl, ExtractionMode::Full);
    if (!extracted.ok()) {
        qWarning() << "No metadata for" << videoUrl << extracted.error;
        return DownloadOutcome::failed(FailureRecord{ videoUrl, FailureReason::PrivateOrInaccessible, extracted.error });
    }
    const MediaInfo& info = *extracted.info;

    m_item.title = info.title;
    m_item.uploadTimestamp = info.timestamp;
    m_item.thumbnailUrl = info.thumbnail;
    m_item.description = info.description;

    emit currentItemChanged(m_item.title);
    emit descriptionChanged(m_item.description);
    if (m_fetchThumbnails && !m_item.thumbnailUrl.isEmpty()) {
        const QByteArray thumbnail = fetchThumbnail(m_item.thumbnailUrl);
        if (!thumbnail.isEmpty()) emit thumbnailFetched(thumbnail);
    }

    m_item.destinationDir = destinationFolder(destinationBase, info.uploadDate, m_settings.useYearSubfolders);
    if (!QDir().mkpath(m_item.destinationDir)) {
        const QString error = QStringLiteral("Cannot create folder %1").arg(m_item.destinationDir);
        qWarning() << error;
        return DownloadOutcome::failed(FailureRecord{ videoUrl, FailureReason::DownloadError, error });
    }

    const QString stem = QDir(m_item.destinationDir).filePath(fileStem(info));
    const QString expectedPath = stem + QLatin1Char('.') + m_settings.normalizedFormat();
    if (utils::fileExistsPath(expectedPath)) {
        qDebug() << "Output already exists, skipping:" << expectedPath;
        emit statusMessage(QStringLiteral("Already downloaded: %1").arg(m_item.title));
        if (!m_ledger.record(videoUrl, expectedPath)) {
            qWarning() << "Existing output could not be recorded:" << videoUrl;
        }
        return DownloadOutcome::skipped(expectedPath);
    }

    emit statusMessage(QStringLiteral("Downloading: %1").arg(m_item.title));

    DownloadRequest request;
    request.url = videoUrl;
    request.outputTemplate = stem + QStringLiteral(".%(ext)s");
    request.settings = m_settings;
    request.cookiesFile = m_settings.cookiesFile;

    int lastPercent = -1;
    const ProgressHook onProgress = [&](const EngineProgress& progress) {
        if (isCancelled && isCancelled()) return HookDecision::Cancel;
        const int percent = progressPercent(progress);
        if (percent != lastPercent) {
            lastPercent = percent;
            emit itemProgress(percent);
        }
        return HookDecision::Continue;
    };

    QString finalizedPath;
    const FinalizedHook onFinalized = [&finalizedPath](const QString& path) {
        finalizedPath = path;
    };

    const EngineResult result = m_engine.download(request, onProgress, onFinalized, isCancelled);
    switch (result.status) {
    case EngineResult::Status::Cancelled:
        qDebug() << "Download cancelled:" << videoUrl;
        return DownloadOutcome::cancelled(videoUrl);
    case EngineResult::Status::Failed:
        return classifyFailure(videoUrl, result.errorText);
    case EngineResult::Status::Finished:
        break;
    }

    QString mediaPath = finalizedPath.isEmpty() ? result.filePath : finalizedPath;
    if (mediaPath.isEmpty() || !QFileInfo::exists(mediaPath)) mediaPath = expectedPath;
    if (lastPercent != 100) emit itemProgress(100);

    PostProcessor postProcessor(m_muxerPath, m_settings);
    postProcessor.process(mediaPath, info, videoUrl);

    if (!m_ledger.record(videoUrl, mediaPath)) {
        qWarning() << "Download finished but could not be recorded:" << videoUrl;
    }
    qDebug() << "Download completed:" << mediaPath;
    return DownloadOutcome::downloaded(mediaPath);
}

int DownloadExecutor::progressPercent(const EngineProgress& progress)
{
    if (progress.status == QStringLiteral("finished")) return 100;
    const qint64 total = progress.totalBytes > 0 ? progress.totalBytes : progress.totalBytesEstimate;
    if (total <= 0) return 0;
    const qint64 percent = progress.downloadedBytes * 100 / total;
    return static_cast<int>(qBound<qint64>(0, percent, 100));
}

QString DownloadExecutor::destinationFolder(const QString& base, const QString& uploadDate, bool useYearSubfolders)
{
    const QString root = utils::normalizeFilePath(base);
    if (!useYearSubfolders) return root;
    const QString year = utils::uploadYear(uploadDate);
    if (year.isEmpty()) return root;
    return QDir(root).filePath(year);
}

QString DownloadExecutor::fileStem(const MediaInfo& info)
{
    return utils::sanitizeFileStem(info.title.trimmed().isEmpty() ? info.id : info.title);
}

QByteArray DownloadExecutor::fetchThumbnail(const QString& url) const
{
    QNetworkAccessManager manager;
    QNetworkRequest request{ QUrl(url) };
    request.setTransferTimeout(m_thumbnailTimeoutMs);

    std::unique_ptr<QNetworkReply> reply(manager.get(request));
    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) loop.exec();

    if (reply->error() != QNetworkReply::NoError) {
        qWarning() << "Thumbnail fetch failed for" << url << reply->errorString();
        return QByteArray();
    }
    return reply->readAll();
}

DownloadOutcome DownloadExecutor::classifyFailure(const QString& url, const QString& errorText) const
{
    qWarning() << "Download failed:" << url << errorText;
    if (utils::isPrivateVideoMessage(errorText)) {
        return DownloadOutcome::failed(FailureRecord{ url, FailureReason::PrivateOrInaccessible, errorText });
    }
    return DownloadOutcome::failed(FailureRecord{ url, FailureReason::DownloadError, errorText });
}
