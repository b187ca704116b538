module;
#include <optional>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QUrlQuery>
#include <QUrl>

module reel.core.mediainfo;

namespace {

QStringList stringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& v : array) {
        const QString s = v.toString();
        if (!s.isEmpty()) out.append(s);
    }
    return out;
}

std::optional<qint64> optionalInteger(const QJsonObject& object, const QString& key)
{
    const QJsonValue v = object.value(key);
    if (!v.isDouble()) return std::nullopt;
    return static_cast<qint64>(v.toDouble());
}

std::optional<double> optionalReal(const QJsonObject& object, const QString& key)
{
    const QJsonValue v = object.value(key);
    if (!v.isDouble()) return std::nullopt;
    return v.toDouble();
}

} // namespace

MediaType mediaTypeFromString(const QString& value)
{
    const QString v = value.trimmed().toLower();
    if (v.isEmpty() || v == "video") return MediaType::Video;
    if (v == "playlist" || v == "multi_video") return MediaType::Playlist;
    if (v == "url" || v == "url_transparent") return MediaType::Url;
    return MediaType::Unknown;
}

QString MediaInfo::bestUrl() const
{
    if (!webpageUrl.isEmpty()) return webpageUrl;
    if (!url.isEmpty()) return url;
    return originalUrl;
}

bool MediaInfo::isUnavailablePlaceholder() const
{
    static const QStringList placeholders = {
        QStringLiteral("[private video]"),
        QStringLiteral("[deleted video]"),
        QStringLiteral("[unavailable video]")
    };
    return placeholders.contains(title.trimmed().toLower());
}

bool MediaInfo::refersToPlaylist() const
{
    if (type == MediaType::Playlist) return true;
    if (type != MediaType::Url) return false;

    if (extractorKey.endsWith("Tab") || extractorKey.endsWith("Playlist")) return true;

    const QUrl target(bestUrl());
    const QUrlQuery query(target);
    return query.hasQueryItem(QStringLiteral("list")) && !query.hasQueryItem(QStringLiteral("v"));
}

MediaInfo MediaInfo::fromJson(const QJsonObject& object)
{
    MediaInfo info;
    info.raw = object;
    info.type = mediaTypeFromString(object.value("_type").toString());
    info.id = object.value("id").toString();
    info.extractorKey = object.value("ie_key").toString(object.value("extractor_key").toString());
    info.title = object.value("title").toString();
    info.uploader = object.value("uploader").toString();
    info.channel = object.value("channel").toString();
    info.uploadDate = object.value("upload_date").toString();
    info.timestamp = optionalInteger(object, "timestamp");
    info.duration = optionalReal(object, "duration");
    info.viewCount = optionalInteger(object, "view_count");
    info.likeCount = optionalInteger(object, "like_count");
    info.description = object.value("description").toString();
    info.tags = stringList(object.value("tags"));
    info.categories = stringList(object.value("categories"));
    info.license = object.value("license").toString();
    if (const auto age = optionalInteger(object, "age_limit")) {
        info.ageLimit = static_cast<int>(*age);
    }
    info.webpageUrl = object.value("webpage_url").toString();
    info.url = object.value("url").toString();
    info.originalUrl = object.value("original_url").toString();
    info.thumbnail = object.value("thumbnail").toString();
    info.format = object.value("format").toString();
    info.formatId = object.value("format_id").toString();
    info.resolution = object.value("resolution").toString();
    info.fps = optionalReal(object, "fps");
    info.videoCodec = object.value("vcodec").toString();
    info.audioCodec = object.value("acodec").toString();
    info.extension = object.value("ext").toString();

    const QJsonArray entries = object.value("entries").toArray();
    for (const QJsonValue& v : entries) {
        if (!v.isObject()) {
            info.entries.append(QSharedPointer<MediaInfo>());
            continue;
        }
        info.entries.append(QSharedPointer<MediaInfo>::create(MediaInfo::fromJson(v.toObject())));
    }
    // an explicit entry list means playlist even when the type is missing
    if (info.type == MediaType::Video && object.contains("entries")) {
        info.type = MediaType::Playlist;
    }
    return info;
}
