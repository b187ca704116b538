#include <atomic>
#include <csignal>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QScopeGuard>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

import reel.core.batchorchestrator;
import reel.core.batchtypes;
import reel.core.downloadsettings;
import reel.services.logging;
import reel.services.ytdlp_engine;
import reel.utils.download_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFailures = 1,
    ExitFatal = 2
};

std::atomic_bool g_interrupted { false };

void handleSignal(int)
{
    g_interrupted = true;
}

// One URL per line; blank lines and '#' comments are ignored.
bool readUrlFile(const QString& path, QStringList& urls)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCritical() << "Cannot read URL file" << path << file.errorString();
        return false;
    }
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) continue;
        urls.append(line);
    }
    return true;
}

bool writeFailures(const QString& path, const FailureList& failures)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Cannot write failures to" << path << file.errorString();
        return false;
    }
    QTextStream out(&file);
    for (const FailureRecord& failure : failures) {
        out << failure.url << '\n';
    }
    out.flush();
    return file.commit();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Reel"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Batch downloader for videos, playlists and lists of playlists."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("urls"), QStringLiteral("Video or playlist URLs."), QStringLiteral("[urls...]"));

    const QCommandLineOption inputOption({ QStringLiteral("i"), QStringLiteral("input-file") },
                                         QStringLiteral("Read URLs from <file>, one per line."), QStringLiteral("file"));
    const QCommandLineOption outputOption({ QStringLiteral("o"), QStringLiteral("output") },
                                          QStringLiteral("Destination folder (default: current folder)."), QStringLiteral("dir"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Settings file (default: settings.json)."), QStringLiteral("file"),
                                            QStringLiteral("settings.json"));
    const QCommandLineOption cookiesOption(QStringLiteral("cookies"), QStringLiteral("Cookie file for the engine."), QStringLiteral("file"));
    const QCommandLineOption formatOption({ QStringLiteral("f"), QStringLiteral("format") },
                                          QStringLiteral("Output format: mp4, mkv or mp3."), QStringLiteral("format"));
    const QCommandLineOption qualityOption({ QStringLiteral("q"), QStringLiteral("quality") },
                                           QStringLiteral("Engine quality selector, e.g. best or bestvideo[height<=1080]."), QStringLiteral("selector"));
    const QCommandLineOption subtitlesOption(QStringLiteral("subtitles"), QStringLiteral("Download subtitles."));
    const QCommandLineOption yearFoldersOption(QStringLiteral("year-folders"), QStringLiteral("Sort downloads into upload-year folders."));
    const QCommandLineOption ledgerOption(QStringLiteral("ledger"), QStringLiteral("Ledger of finished downloads."), QStringLiteral("file"));
    const QCommandLineOption logLevelOption(QStringLiteral("log-level"), QStringLiteral("debug, info, warning or error."), QStringLiteral("level"));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"), QStringLiteral("Append log messages to <file>."), QStringLiteral("file"));
    const QCommandLineOption ytdlpOption(QStringLiteral("yt-dlp"), QStringLiteral("yt-dlp executable."), QStringLiteral("path"));
    const QCommandLineOption ffmpegOption(QStringLiteral("ffmpeg"), QStringLiteral("ffmpeg executable."), QStringLiteral("path"));
    const QCommandLineOption failuresOption(QStringLiteral("failures-out"),
                                            QStringLiteral("Write failed URLs to <file> for a later --input-file run."), QStringLiteral("file"));

    parser.addOptions({ inputOption, outputOption, settingsOption, cookiesOption, formatOption, qualityOption,
                        subtitlesOption, yearFoldersOption, ledgerOption, logLevelOption, logFileOption,
                        ytdlpOption, ffmpegOption, failuresOption });

    if (!parser.parse(QCoreApplication::arguments())) {
        QTextStream(stderr) << parser.errorText() << '\n' << parser.helpText();
        return ExitFatal;
    }
    if (parser.isSet(helpOption)) parser.showHelp(ExitOk);
    if (parser.isSet(versionOption)) parser.showVersion();

    QString settingsError;
    DownloadSettings settings = loadSettingsFile(parser.value(settingsOption), &settingsError);
    if (parser.isSet(formatOption)) settings.outputFormat = parser.value(formatOption).trimmed().toLower();
    if (parser.isSet(qualityOption)) settings.quality = parser.value(qualityOption);
    if (parser.isSet(subtitlesOption)) settings.downloadSubtitles = true;
    if (parser.isSet(yearFoldersOption)) settings.useYearSubfolders = true;
    if (parser.isSet(cookiesOption)) settings.cookiesFile = parser.value(cookiesOption);
    if (parser.isSet(ledgerOption)) settings.ledgerFile = parser.value(ledgerOption);
    if (parser.isSet(logLevelOption)) settings.loggingLevel = parser.value(logLevelOption);

    const auto loggingGuard = qScopeGuard([] { reel::logging::shutdown(); });
    if (!reel::logging::configure(settings.loggingLevel, parser.value(logFileOption))) {
        qWarning() << "Cannot open log file" << parser.value(logFileOption);
    }
    if (!settingsError.isEmpty()) {
        qWarning().noquote() << settingsError << "- using defaults";
    }

    QStringList urls = parser.positionalArguments();
    if (parser.isSet(inputOption) && !readUrlFile(parser.value(inputOption), urls)) {
        return ExitFatal;
    }

    const QString ffmpeg = reel::utils::findExecutable(parser.value(ffmpegOption), QStringLiteral("ffmpeg"));
    YtDlpEngine engine(parser.value(ytdlpOption), ffmpeg);
    if (!engine.isAvailable()) {
        qCritical() << "yt-dlp not found. Install it or pass --yt-dlp.";
        return ExitFatal;
    }

    BatchOrchestrator orchestrator(engine, parser.value(ffmpegOption), settings.ledgerFile);

    QObject::connect(&orchestrator, &BatchOrchestrator::statusChanged, &app, [](const QString& text) {
        qInfo().noquote() << text;
    });
    QObject::connect(&orchestrator, &BatchOrchestrator::currentItemChanged, &app, [](const QString& title) {
        qInfo().noquote() << "Current item:" << title;
    });
    QObject::connect(&orchestrator, &BatchOrchestrator::overallProgress, &app, [](int percent) {
        qInfo().noquote() << QStringLiteral("Overall progress: %1%").arg(percent);
    });
    QObject::connect(&orchestrator, &BatchOrchestrator::itemProgress, &app, [](int percent) {
        if (percent % 10 == 0) qDebug().noquote() << QStringLiteral("Item progress: %1%").arg(percent);
    });
    QObject::connect(&orchestrator, &BatchOrchestrator::completed, &app, &QCoreApplication::quit, Qt::QueuedConnection);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QTimer interruptTimer;
    QObject::connect(&interruptTimer, &QTimer::timeout, &app, [&orchestrator, &interruptTimer]() {
        if (!g_interrupted.load()) return;
        interruptTimer.stop();
        qInfo() << "Interrupted, stopping after the current item is cancelled";
        orchestrator.cancel();
    });
    interruptTimer.start(200);

    BatchRequest request;
    request.urls = urls;
    request.destinationDir = parser.isSet(outputOption) ? parser.value(outputOption) : QDir::currentPath();
    request.settings = settings;

    if (!orchestrator.start(request)) return ExitFatal;
    app.exec();
    orchestrator.waitForFinished();

    const BatchSummary summary = orchestrator.lastSummary();
    if (summary.fatal) return ExitFatal;

    if (!summary.failures.isEmpty()) {
        qWarning().noquote() << QStringLiteral("%1 URL(s) failed:").arg(summary.failures.size());
        for (const FailureRecord& failure : summary.failures) {
            qWarning().noquote() << "  " << failure.toString();
        }
        if (parser.isSet(failuresOption) && !writeFailures(parser.value(failuresOption), summary.failures)) {
            qWarning() << "Failed URLs were not saved to" << parser.value(failuresOption);
        }
    }
    qInfo().noquote() << QStringLiteral("Downloaded %1, skipped %2, failed %3 of %4")
                             .arg(summary.downloaded)
                             .arg(summary.skipped)
                             .arg(summary.failures.size())
                             .arg(summary.totalCount);

    if (summary.cancelled || !summary.failures.isEmpty()) return ExitFailures;
    return ExitOk;
}
