module;
#include <cstdio>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QJsonDocument>
#include <QProcess>
#include <QSaveFile>
#include <QString>
#include <QStringList>

module reel.core.postprocessor;

import reel.utils.download_utils;
import reel.utils.file_times;
import reel.utils.metadata_formatter;

namespace utils = reel::utils;

namespace {

constexpr int kMuxerStartTimeoutMs = 5000;

bool writeTextFile(const QString& path, const QByteArray& data)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot write" << path << file.errorString();
        return false;
    }
    file.write(data);
    return file.commit();
}

QString readTextFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to read description file" << path << file.errorString();
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

// Replaces target in one step so a reader never sees a partial file. Where
// rename cannot overwrite (Windows), the target is removed first.
bool replaceFile(const QString& source, const QString& target)
{
    if (std::rename(QFile::encodeName(source).constData(), QFile::encodeName(target).constData()) == 0) {
        return true;
    }
    if (QFile::exists(target) && !QFile::remove(target)) {
        qWarning() << "Failed to remove" << target << "before replacing it";
        QFile::remove(source);
        return false;
    }
    if (!QFile::rename(source, target)) {
        qWarning() << "Failed to replace" << target << "with" << source;
        QFile::remove(source);
        return false;
    }
    return true;
}

} // namespace

PostProcessor::PostProcessor(const QString& muxerPath, const DownloadSettings& settings)
    : m_muxerPath(muxerPath)
    , m_settings(settings)
{
}

PostProcessReport PostProcessor::process(const QString& mediaPath, const MediaInfo& info, const QString& originalUrl)
{
    PostProcessReport report;
    const QString base = utils::pathWithoutSuffix(mediaPath);

    report.pngThumbnail = ensurePngThumbnail(mediaPath);

    const QString descriptionPath = base + QStringLiteral(".description");
    if (QFileInfo::exists(descriptionPath)) {
        QString description = readTextFile(descriptionPath);
        if (description.trimmed().isEmpty()) description = info.description;
        report.metadataEmbedded = embedMetadata(mediaPath, info, description);
    }

    if (report.pngThumbnail.isEmpty()) {
        qDebug() << "No thumbnail to embed for" << mediaPath;
    } else {
        report.coverEmbedded = embedCover(mediaPath, report.pngThumbnail);
    }

    const QString textPath = base + QStringLiteral(".txt");
    if (writeTextFile(textPath, utils::formatMetadata(info, originalUrl).toUtf8())) {
        report.metadataSidecar = textPath;
    }

    const QString infoPath = base + QStringLiteral(".info.json");
    if (QFileInfo::exists(infoPath)) {
        report.infoSidecar = infoPath;
    } else if (!info.raw.isEmpty()
               && writeTextFile(infoPath, QJsonDocument(info.raw).toJson(QJsonDocument::Indented))) {
        report.infoSidecar = infoPath;
    }

    if (info.timestamp) {
        report.timesSynced = utils::syncFileTimes({ mediaPath,
                                                    base + QStringLiteral(".png"),
                                                    textPath,
                                                    infoPath,
                                                    descriptionPath },
                                                  *info.timestamp);
    } else {
        qDebug() << "No upload timestamp for" << mediaPath << "- file times left unchanged";
    }
    return report;
}

QString PostProcessor::ensurePngThumbnail(const QString& mediaPath) const
{
    const QString base = utils::pathWithoutSuffix(mediaPath);
    const QString pngPath = base + QStringLiteral(".png");
    if (QFileInfo::exists(pngPath)) return pngPath;

    for (const QString& ext : thumbnailExtensions()) {
        const QString candidate = base + QLatin1Char('.') + ext;
        if (!QFileInfo::exists(candidate)) continue;

        QImage image(candidate);
        if (image.isNull()) {
            qWarning() << "Failed to load thumbnail" << candidate;
            return QString();
        }
        if (!image.save(pngPath, "PNG")) {
            qWarning() << "Failed to convert thumbnail to PNG:" << candidate;
            return QString();
        }
        qDebug() << "Thumbnail converted to PNG:" << pngPath;
        return pngPath;
    }
    return QString();
}

bool PostProcessor::embedMetadata(const QString& mediaPath, const MediaInfo& info, const QString& description) const
{
    const QStringList metadata = metadataArguments(info, description, m_settings);
    if (metadata.isEmpty()) {
        qDebug() << "Metadata embedding disabled for" << mediaPath;
        return false;
    }
    if (!muxerAvailable()) return false;

    const QString tempPath = temporaryPathFor(mediaPath);
    QStringList args;
    args << QStringLiteral("-y") << QStringLiteral("-loglevel") << QStringLiteral("error")
         << QStringLiteral("-i") << mediaPath
         << QStringLiteral("-map") << QStringLiteral("0")
         << QStringLiteral("-c") << QStringLiteral("copy")
         << metadata
         << tempPath;
    if (!runMuxer(args, mediaPath, tempPath)) return false;
    qDebug() << "Description metadata added to:" << mediaPath;
    return true;
}

bool PostProcessor::embedCover(const QString& mediaPath, const QString& pngPath) const
{
    if (pngPath.isEmpty() || !QFileInfo::exists(pngPath)) return false;

    const QString tempPath = temporaryPathFor(mediaPath);
    const QStringList cover = coverArguments(mediaPath, pngPath, tempPath);
    if (cover.isEmpty()) {
        qDebug() << "Cover art not supported for" << mediaPath;
        return false;
    }
    if (!muxerAvailable()) return false;

    QStringList args;
    args << QStringLiteral("-y") << QStringLiteral("-loglevel") << QStringLiteral("error") << cover;
    if (!runMuxer(args, mediaPath, tempPath)) return false;
    qDebug() << "Thumbnail embedded successfully into:" << mediaPath;
    return true;
}

QStringList PostProcessor::metadataArguments(const MediaInfo& info,
                                             const QString& description,
                                             const DownloadSettings& settings)
{
    QStringList args;
    auto add = [&args](const QString& key, const QString& value) {
        if (value.trimmed().isEmpty()) return;
        args << QStringLiteral("-metadata") << key + QLatin1Char('=') + value;
    };

    if (settings.embedTitle) add(QStringLiteral("title"), info.title);
    if (settings.embedUploader) add(QStringLiteral("author"), info.uploader);
    if (settings.embedDescription) {
        add(QStringLiteral("comment"), description);
        add(QStringLiteral("description"), description);
    }
    if (settings.embedTags) add(QStringLiteral("keywords"), info.tags.join(QStringLiteral(", ")));
    if (settings.embedLicense) add(QStringLiteral("copyright"), info.license);
    return args;
}

QStringList PostProcessor::coverArguments(const QString& mediaPath,
                                          const QString& pngPath,
                                          const QString& outputPath)
{
    const QString ext = QFileInfo(mediaPath).suffix().toLower();
    QStringList args;
    if (ext == QStringLiteral("mp4") || ext == QStringLiteral("m4a") || ext == QStringLiteral("mov")) {
        // audio-only m4a has no video stream, so the cover is video stream 0
        const QString coverStream = ext == QStringLiteral("m4a") ? QStringLiteral("-disposition:v:0")
                                                                 : QStringLiteral("-disposition:v:1");
        args << QStringLiteral("-i") << mediaPath
             << QStringLiteral("-i") << pngPath
             << QStringLiteral("-map") << QStringLiteral("0")
             << QStringLiteral("-map") << QStringLiteral("1")
             << QStringLiteral("-c") << QStringLiteral("copy")
             << coverStream << QStringLiteral("attached_pic")
             << outputPath;
    } else if (ext == QStringLiteral("mkv")) {
        args << QStringLiteral("-i") << mediaPath
             << QStringLiteral("-map") << QStringLiteral("0")
             << QStringLiteral("-c") << QStringLiteral("copy")
             << QStringLiteral("-attach") << pngPath
             << QStringLiteral("-metadata:s:t") << QStringLiteral("mimetype=image/png")
             << QStringLiteral("-metadata:s:t") << QStringLiteral("filename=cover.png")
             << outputPath;
    } else if (ext == QStringLiteral("mp3")) {
        args << QStringLiteral("-i") << mediaPath
             << QStringLiteral("-i") << pngPath
             << QStringLiteral("-map") << QStringLiteral("0:a")
             << QStringLiteral("-map") << QStringLiteral("1")
             << QStringLiteral("-c") << QStringLiteral("copy")
             << QStringLiteral("-id3v2_version") << QStringLiteral("3")
             << QStringLiteral("-metadata:s:v") << QStringLiteral("title=Album cover")
             << QStringLiteral("-metadata:s:v") << QStringLiteral("comment=Cover (front)")
             << QStringLiteral("-disposition:v") << QStringLiteral("attached_pic")
             << outputPath;
    }
    return args;
}

QStringList PostProcessor::thumbnailExtensions()
{
    return { QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("webp"),
             QStringLiteral("bmp"), QStringLiteral("gif"), QStringLiteral("tiff") };
}

QString PostProcessor::temporaryPathFor(const QString& mediaPath)
{
    const QFileInfo info(mediaPath);
    const QString suffix = info.suffix();
    const QString base = utils::pathWithoutSuffix(mediaPath);
    // The muxer picks the output format from the extension, so it stays last.
    return suffix.isEmpty() ? base + QStringLiteral(".reel-tmp")
                            : base + QStringLiteral(".reel-tmp.") + suffix;
}

bool PostProcessor::muxerAvailable() const
{
    if (m_muxerPath.isEmpty()) {
        qWarning() << "No muxer configured, skipping container rewrite";
        return false;
    }
    return true;
}

bool PostProcessor::runMuxer(const QStringList& args, const QString& mediaPath, const QString& tempPath) const
{
    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(m_muxerPath, args);
    if (!proc.waitForStarted(kMuxerStartTimeoutMs)) {
        qWarning() << "Failed to start muxer" << m_muxerPath << proc.errorString();
        QFile::remove(tempPath);
        return false;
    }
    proc.waitForFinished(-1);

    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        qWarning().noquote() << "Muxer failed for" << mediaPath << ":"
                             << QString::fromUtf8(proc.readAll()).trimmed();
        QFile::remove(tempPath);
        return false;
    }
    if (!QFileInfo::exists(tempPath)) {
        qWarning() << "Muxer produced no output for" << mediaPath;
        return false;
    }
    return replaceFile(tempPath, mediaPath);
}
