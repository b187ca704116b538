module;
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

module reel.utils.file_times;

namespace reel::utils {

int syncFileTimes(const QStringList& paths, qint64 timestamp)
{
    const QDateTime when = QDateTime::fromSecsSinceEpoch(timestamp);
    int updated = 0;
    for (const QString& path : paths) {
        if (path.isEmpty()) continue;
        const QFileInfo info(path);
        if (!info.exists() || !info.isFile()) {
            qDebug() << "File not found for time update:" << path;
            continue;
        }

        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            qWarning() << "Cannot open file for time update:" << path << file.errorString();
            continue;
        }
        const bool ok = file.setFileTime(when, QFileDevice::FileModificationTime)
                        && file.setFileTime(when, QFileDevice::FileAccessTime);
        file.close();
        if (!ok) {
            qWarning() << "Failed to set file time on" << path << file.errorString();
            continue;
        }
        ++updated;
    }
    return updated;
}

} // namespace reel::utils
