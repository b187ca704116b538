module;
#include <optional>
#include <utility>
#include <QList>
#include <QString>
#include <QStringList>

module reel.utils.metadata_formatter;

namespace reel::utils {

namespace {

using Field = std::pair<QString, QString>;

template <typename T>
QString optionalNumber(const std::optional<T>& value)
{
    return value ? QString::number(*value) : QString();
}

QString optionalNumber(const std::optional<double>& value)
{
    return value ? QString::number(*value, 'g', 12) : QString();
}

QString section(const QString& heading, const QList<Field>& fields)
{
    QStringList lines;
    lines.reserve(fields.size() + 1);
    lines.append(heading + QLatin1Char(':'));
    for (const Field& f : fields) {
        lines.append(QStringLiteral("%1: %2").arg(f.first, f.second));
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace

QString formatMetadata(const MediaInfo& info, const QString& originalUrl)
{
    const QList<Field> basic = {
        { QStringLiteral("Title"), info.title },
        { QStringLiteral("Uploader"), info.uploader },
        { QStringLiteral("Upload date"), info.uploadDate },
        { QStringLiteral("Duration"), optionalNumber(info.duration) },
        { QStringLiteral("View count"), optionalNumber(info.viewCount) },
        { QStringLiteral("Like count"), optionalNumber(info.likeCount) },
        { QStringLiteral("Description"), info.description },
        { QStringLiteral("Tags"), info.tags.join(QStringLiteral(", ")) }
    };

    const QList<Field> technical = {
        { QStringLiteral("Format"), info.format },
        { QStringLiteral("Format ID"), info.formatId },
        { QStringLiteral("Resolution"), info.resolution },
        { QStringLiteral("FPS"), optionalNumber(info.fps) },
        { QStringLiteral("Video Codec"), info.videoCodec },
        { QStringLiteral("Audio Codec"), info.audioCodec }
    };

    const QList<Field> other = {
        { QStringLiteral("Categories"), info.categories.join(QStringLiteral(", ")) },
        { QStringLiteral("License"), info.license },
        { QStringLiteral("Age Limit"), optionalNumber(info.ageLimit) },
        { QStringLiteral("Webpage URL"), info.webpageUrl },
        { QStringLiteral("Original URL"), originalUrl }
    };

    return QStringList{
        section(QStringLiteral("Basic Info"), basic),
        section(QStringLiteral("Technical Info"), technical),
        section(QStringLiteral("Other Info"), other)
    }.join(QStringLiteral("\n\n"));
}

} // namespace reel::utils
