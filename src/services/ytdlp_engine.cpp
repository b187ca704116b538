module;
#include <optional>
#include <QDebug>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QProcess>
#include <QString>
#include <QStringList>

module reel.services.ytdlp_engine;

import reel.utils.download_utils;

namespace utils = reel::utils;

namespace {

const QString kProgressPrefix = QStringLiteral("reel-progress ");
const QString kFinalizedPrefix = QStringLiteral("reel-file ");

constexpr int kStartTimeoutMs = 5000;
constexpr int kPollIntervalMs = 200;
constexpr int kTerminateGraceMs = 3000;

qint64 parseByteCount(const QString& token)
{
    bool ok = false;
    const double value = token.toDouble(&ok);
    if (!ok || value < 0) return 0;
    return static_cast<qint64>(value);
}

void stopProcess(QProcess& process)
{
    if (process.state() == QProcess::NotRunning) return;
    process.terminate();
    if (!process.waitForFinished(kTerminateGraceMs)) {
        qWarning() << "yt-dlp did not exit after terminate, killing it";
        process.kill();
        process.waitForFinished(kTerminateGraceMs);
    }
}

// Splits complete lines off the front of buffer.
QStringList takeLines(QString& buffer)
{
    QStringList lines;
    qsizetype nl = buffer.indexOf(QLatin1Char('\n'));
    while (nl >= 0) {
        const QString line = buffer.left(nl).trimmed();
        if (!line.isEmpty()) lines.append(line);
        buffer.remove(0, nl + 1);
        nl = buffer.indexOf(QLatin1Char('\n'));
    }
    return lines;
}

} // namespace

YtDlpEngine::YtDlpEngine(const QString& executable, const QString& ffmpegLocation)
    : m_executable(utils::findExecutable(executable, QStringLiteral("yt-dlp")))
    , m_ffmpegLocation(ffmpegLocation)
{
    if (m_executable.isEmpty()) {
        qWarning() << "yt-dlp executable not found:" << (executable.isEmpty() ? QStringLiteral("yt-dlp") : executable);
    }
}

bool YtDlpEngine::isAvailable() const
{
    if (m_executable.isEmpty()) return false;
    const QFileInfo info(m_executable);
    return info.exists() && info.isExecutable();
}

ExtractionResult YtDlpEngine::extractInfo(const QString& url, ExtractionMode mode)
{
    ExtractionResult result;
    if (!isAvailable()) {
        result.error = QStringLiteral("yt-dlp executable not found");
        return result;
    }

    const QStringList args = buildExtractArguments(url, mode, m_cookiesFile);

    QProcess proc;
    proc.start(m_executable, args);
    if (!proc.waitForStarted(kStartTimeoutMs)) {
        result.error = QStringLiteral("Failed to start yt-dlp: %1").arg(proc.errorString());
        return result;
    }
    proc.waitForFinished(-1);

    const QByteArray out = proc.readAllStandardOutput().trimmed();
    const QString err = QString::fromUtf8(proc.readAllStandardError());

    // With --ignore-errors a playlist is still printed when some entries fail.
    if (!out.isEmpty()) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(out, &parseError);
        if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
            result.info = MediaInfo::fromJson(doc.object());
            return result;
        }
        qWarning() << "Unparsable yt-dlp output for" << url << parseError.errorString();
    }

    result.error = errorFromOutput(err);
    if (result.error.isEmpty()) {
        result.error = QStringLiteral("yt-dlp exited with code %1").arg(proc.exitCode());
    }
    qDebug() << "Extraction failed for" << url << ":" << result.error;
    return result;
}

EngineResult YtDlpEngine::download(const DownloadRequest& request,
                                   const ProgressHook& onProgress,
                                   const FinalizedHook& onFinalized,
                                   const CancelPredicate& isCancelled)
{
    EngineResult result;
    if (!isAvailable()) {
        result.errorText = QStringLiteral("yt-dlp executable not found");
        return result;
    }

    QProcess proc;
    proc.start(m_executable, buildDownloadArguments(request, m_ffmpegLocation));
    if (!proc.waitForStarted(kStartTimeoutMs)) {
        result.errorText = QStringLiteral("Failed to start yt-dlp: %1").arg(proc.errorString());
        return result;
    }

    bool cancelled = false;
    QString outBuffer;
    QString errBuffer;
    QStringList errLines;

    // Progress goes to stderr when --print makes yt-dlp quiet, so both
    // channels are scanned for markers.
    auto handleLine = [&](const QString& line) {
        if (const auto progress = parseProgressLine(line)) {
            if (onProgress && onProgress(*progress) == HookDecision::Cancel) cancelled = true;
            return true;
        }
        if (const auto path = parseFinalizedLine(line)) {
            result.filePath = *path;
            if (onFinalized) onFinalized(*path);
            return true;
        }
        return false;
    };

    auto drain = [&]() {
        outBuffer += QString::fromUtf8(proc.readAllStandardOutput());
        errBuffer += QString::fromUtf8(proc.readAllStandardError());
        for (const QString& line : takeLines(outBuffer)) {
            if (!handleLine(line)) qDebug().noquote() << "[yt-dlp]" << line;
        }
        for (const QString& line : takeLines(errBuffer)) {
            if (!handleLine(line)) {
                qDebug().noquote() << "[yt-dlp]" << line;
                errLines.append(line);
            }
        }
    };

    while (proc.state() != QProcess::NotRunning) {
        if (!cancelled && isCancelled && isCancelled()) cancelled = true;
        if (cancelled) {
            stopProcess(proc);
            break;
        }
        proc.waitForReadyRead(kPollIntervalMs);
        drain();
    }
    drain();
    outBuffer.append(QLatin1Char('\n'));
    errBuffer.append(QLatin1Char('\n'));
    drain();

    if (cancelled) {
        result.status = EngineResult::Status::Cancelled;
        return result;
    }
    if (proc.exitStatus() == QProcess::NormalExit && proc.exitCode() == 0) {
        result.status = EngineResult::Status::Finished;
        return result;
    }

    result.status = EngineResult::Status::Failed;
    result.errorText = errorFromOutput(errLines.join(QLatin1Char('\n')));
    if (result.errorText.isEmpty()) {
        result.errorText = proc.exitStatus() == QProcess::CrashExit
                               ? QStringLiteral("yt-dlp crashed")
                               : QStringLiteral("yt-dlp exited with code %1").arg(proc.exitCode());
    }
    return result;
}

QStringList YtDlpEngine::buildExtractArguments(const QString& url, ExtractionMode mode, const QString& cookiesFile)
{
    QStringList args;
    args << QStringLiteral("-J") << QStringLiteral("--no-warnings") << QStringLiteral("--ignore-errors");
    args << (mode == ExtractionMode::Flat ? QStringLiteral("--flat-playlist") : QStringLiteral("--no-playlist"));
    if (!cookiesFile.isEmpty()) {
        args << QStringLiteral("--cookies") << cookiesFile;
    }
    args << QStringLiteral("--") << url;
    return args;
}

QStringList YtDlpEngine::buildDownloadArguments(const DownloadRequest& request, const QString& ffmpegLocation)
{
    const DownloadSettings& settings = request.settings;
    const QString quality = settings.quality.trimmed().isEmpty() ? QStringLiteral("best") : settings.quality.trimmed();

    QStringList args;
    args << QStringLiteral("--newline")
         << QStringLiteral("--progress")
         << QStringLiteral("--no-simulate")
         << QStringLiteral("--no-playlist")
         << QStringLiteral("--continue")
         << QStringLiteral("--progress-template")
         << QStringLiteral("download:") + kProgressPrefix
                + QStringLiteral("%(progress.status)s %(progress.downloaded_bytes)s "
                                 "%(progress.total_bytes)s %(progress.total_bytes_estimate)s")
         << QStringLiteral("--print")
         << QStringLiteral("after_move:") + kFinalizedPrefix + QStringLiteral("%(filepath)s")
         << QStringLiteral("-o") << request.outputTemplate
         << QStringLiteral("--write-thumbnail")
         << QStringLiteral("--write-description")
         << QStringLiteral("--write-info-json");

    if (settings.downloadSubtitles) {
        args << QStringLiteral("--write-subs") << QStringLiteral("--write-auto-subs");
    }

    if (settings.audioOnly()) {
        args << QStringLiteral("-f") << quality + QStringLiteral("/bestaudio/best")
             << QStringLiteral("-x")
             << QStringLiteral("--audio-format") << QStringLiteral("mp3")
             << QStringLiteral("--audio-quality") << QStringLiteral("192K");
    } else {
        args << QStringLiteral("-f") << quality + QStringLiteral("+bestaudio/best")
             << QStringLiteral("--merge-output-format") << settings.normalizedFormat();
    }

    args << QStringLiteral("--retries") << QStringLiteral("3")
         << QStringLiteral("--fragment-retries") << QStringLiteral("3")
         << QStringLiteral("--concurrent-fragments") << QStringLiteral("5");

    const QString cookies = request.cookiesFile.isEmpty() ? settings.cookiesFile : request.cookiesFile;
    if (!cookies.isEmpty()) {
        args << QStringLiteral("--cookies") << cookies;
    }
    if (!ffmpegLocation.isEmpty()) {
        args << QStringLiteral("--ffmpeg-location") << ffmpegLocation;
    }

    args << QStringLiteral("--") << request.url;
    return args;
}

std::optional<EngineProgress> YtDlpEngine::parseProgressLine(const QString& line)
{
    const QString trimmed = line.trimmed();
    if (!trimmed.startsWith(kProgressPrefix)) return std::nullopt;

    const QStringList parts = trimmed.mid(kProgressPrefix.size()).split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.isEmpty()) return std::nullopt;

    EngineProgress progress;
    progress.status = parts.at(0);
    if (parts.size() > 1) progress.downloadedBytes = parseByteCount(parts.at(1));
    if (parts.size() > 2) progress.totalBytes = parseByteCount(parts.at(2));
    if (parts.size() > 3) progress.totalBytesEstimate = parseByteCount(parts.at(3));
    return progress;
}

std::optional<QString> YtDlpEngine::parseFinalizedLine(const QString& line)
{
    QString trimmed = line;
    while (trimmed.endsWith(QLatin1Char('\r')) || trimmed.endsWith(QLatin1Char('\n'))) trimmed.chop(1);
    if (!trimmed.startsWith(kFinalizedPrefix)) return std::nullopt;
    const QString path = trimmed.mid(kFinalizedPrefix.size());
    if (path.isEmpty()) return std::nullopt;
    return path;
}

QString YtDlpEngine::errorFromOutput(const QString& stderrText)
{
    const QStringList lines = stderrText.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    QString lastLine;
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        const QString line = it->trimmed();
        if (line.isEmpty()) continue;
        if (line.startsWith(QStringLiteral("ERROR:"))) {
            return line.mid(6).trimmed();
        }
        if (lastLine.isEmpty()) lastLine = line;
    }
    return lastLine;
}
