module;
#include <QFileInfo>
#include <QUrl>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QStringList>
#include <QtGlobal>

module reel.utils.download_utils;

namespace reel::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

bool fileExistsPath(const QString& path)
{
    const QString normalized = normalizeFilePath(path);
    if (normalized.isEmpty()) return false;
    QFileInfo info(normalized);
    return info.exists() && info.isFile();
}

QString pathWithoutSuffix(const QString& filePath)
{
    const int dot = filePath.lastIndexOf('.');
    const int slash = qMax(filePath.lastIndexOf('/'), filePath.lastIndexOf('\\'));
    if (dot <= slash + 1) return filePath;
    return filePath.left(dot);
}

QString uploadYear(const QString& uploadDate)
{
    static const QRegularExpression re(QStringLiteral("^(\\d{4})\\d{4}$"));
    const auto match = re.match(uploadDate.trimmed());
    if (!match.hasMatch()) return QString();
    return match.captured(1);
}

bool isAbsoluteUrl(const QString& value)
{
    const QUrl url(value.trimmed(), QUrl::StrictMode);
    return url.isValid() && !url.isRelative() && !url.host().isEmpty();
}

QString qualifyEntryUrl(const QString& entryUrl, const QString& parentUrl)
{
    const QString trimmed = entryUrl.trimmed();
    if (trimmed.isEmpty()) return QString();
    if (isAbsoluteUrl(trimmed)) return trimmed;

    const QUrl parent(parentUrl);
    if (trimmed.startsWith('/') && parent.isValid() && !parent.host().isEmpty()) {
        return parent.resolved(QUrl(trimmed)).toString();
    }

    // Flat playlist entries only carry the video id for most sites.
    static const QRegularExpression idRe(QStringLiteral("^[A-Za-z0-9_-]+$"));
    if (!idRe.match(trimmed).hasMatch()) return QString();

    const QString host = parent.host().toLower();
    if (host.isEmpty() || host.contains("youtube.com") || host.contains("youtu.be")) {
        return QStringLiteral("https://www.youtube.com/watch?v=%1").arg(trimmed);
    }
    QUrl base;
    base.setScheme(parent.scheme().isEmpty() ? QStringLiteral("https") : parent.scheme());
    base.setHost(parent.host());
    return base.resolved(QUrl(trimmed)).toString();
}

bool isPrivateVideoMessage(const QString& message)
{
    static const QStringList markers = {
        QStringLiteral("private video"),
        QStringLiteral("video is private"),
        QStringLiteral("video unavailable"),
        QStringLiteral("members-only"),
        QStringLiteral("sign in to confirm your age")
    };
    const QString lower = message.toLower();
    for (const QString& marker : markers) {
        if (lower.contains(marker)) return true;
    }
    return false;
}

QString findExecutable(const QString& nameOrPath, const QString& fallbackName)
{
    const QString name = nameOrPath.trimmed().isEmpty() ? fallbackName : nameOrPath.trimmed();
    if (name.contains('/') || name.contains('\\')) {
        const QFileInfo info(normalizeFilePath(name));
        return (info.exists() && info.isExecutable()) ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(name);
}

} // namespace reel::utils
