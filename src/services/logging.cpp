module;
#include <memory>
#include <QFile>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QTextStream>

module reel.services.logging;

namespace reel::logging {

namespace {

QMutex g_fileMutex;
std::unique_ptr<QFile> g_logFile;
QtMessageHandler g_previousHandler = nullptr;
bool g_handlerInstalled = false;

void teeMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    {
        QMutexLocker locker(&g_fileMutex);
        if (g_logFile && g_logFile->isOpen()) {
            QTextStream out(g_logFile.get());
            out << qFormatLogMessage(type, context, message) << '\n';
            out.flush();
        }
    }
    if (g_previousHandler) g_previousHandler(type, context, message);
}

} // namespace

QtMsgType levelFromString(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "info") return QtInfoMsg;
    if (n == "warning" || n == "warn") return QtWarningMsg;
    if (n == "error" || n == "critical") return QtCriticalMsg;
    return QtDebugMsg;
}

bool configure(const QString& level, const QString& logFilePath)
{
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{message}"));

    QStringList rules;
    switch (levelFromString(level)) {
    case QtCriticalMsg:
    case QtFatalMsg:
        rules << QStringLiteral("*.warning=false");
        Q_FALLTHROUGH();
    case QtWarningMsg:
        rules << QStringLiteral("*.info=false");
        Q_FALLTHROUGH();
    case QtInfoMsg:
        rules << QStringLiteral("*.debug=false");
        break;
    case QtDebugMsg:
        rules << QStringLiteral("*.debug=true");
        break;
    }
    QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));

    if (logFilePath.isEmpty()) return true;

    QMutexLocker locker(&g_fileMutex);
    if (!g_logFile) {
        g_logFile = std::make_unique<QFile>(logFilePath);
    } else if (g_logFile->fileName() != logFilePath) {
        g_logFile->close();
        g_logFile->setFileName(logFilePath);
    }
    if (!g_logFile->isOpen() && !g_logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    if (!g_handlerInstalled) {
        g_previousHandler = qInstallMessageHandler(teeMessageHandler);
        g_handlerInstalled = true;
    }
    return true;
}

void shutdown()
{
    if (g_handlerInstalled) {
        qInstallMessageHandler(g_previousHandler);
        g_previousHandler = nullptr;
        g_handlerInstalled = false;
    }
    QMutexLocker locker(&g_fileMutex);
    g_logFile.reset();
}

} // namespace reel::logging
