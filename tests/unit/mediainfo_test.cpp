#undef NDEBUG
#include <cassert>
#include <iostream>
#include <optional>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QSharedPointer>
#include <QString>
#include <QStringList>

import reel.core.mediainfo;

namespace {

void TestParsesVideoFields()
{
    QJsonObject json;
    json.insert("_type", "video");
    json.insert("id", "abc");
    json.insert("title", "A title");
    json.insert("uploader", "Someone");
    json.insert("upload_date", "20210704");
    json.insert("timestamp", 1625400000);
    json.insert("duration", 61.5);
    json.insert("view_count", 1200);
    json.insert("tags", QJsonArray{ "one", "", "two" });
    json.insert("age_limit", 18);
    json.insert("webpage_url", "https://www.youtube.com/watch?v=abc");
    json.insert("vcodec", "vp9");
    json.insert("ext", "webm");

    const MediaInfo info = MediaInfo::fromJson(json);
    assert(info.type == MediaType::Video);
    assert(info.id == QStringLiteral("abc"));
    assert(info.title == QStringLiteral("A title"));
    assert(info.timestamp && *info.timestamp == 1625400000);
    assert(info.duration && *info.duration == 61.5);
    assert(info.viewCount && *info.viewCount == 1200);
    assert(!info.likeCount);
    assert(info.tags == QStringList({ QStringLiteral("one"), QStringLiteral("two") }));
    assert(info.ageLimit && *info.ageLimit == 18);
    assert(info.videoCodec == QStringLiteral("vp9"));
    assert(info.extension == QStringLiteral("webm"));
    assert(info.raw == json);
    assert(!info.isPlaylist());
}

void TestPlaylistKeepsNullEntries()
{
    QJsonObject entry;
    entry.insert("_type", "url");
    entry.insert("id", "v1");
    entry.insert("url", "https://www.youtube.com/watch?v=v1");

    QJsonObject json;
    json.insert("_type", "playlist");
    json.insert("entries", QJsonArray{ entry, QJsonValue(), entry });

    const MediaInfo info = MediaInfo::fromJson(json);
    assert(info.isPlaylist());
    assert(info.entries.size() == 3);
    assert(!info.entries.at(0).isNull());
    assert(info.entries.at(1).isNull());
    assert(info.entries.at(2)->type == MediaType::Url);
}

void TestEntriesWithoutTypeMeanPlaylist()
{
    QJsonObject json;
    json.insert("id", "pl");
    json.insert("entries", QJsonArray());
    assert(MediaInfo::fromJson(json).type == MediaType::Playlist);
}

void TestTypeNames()
{
    assert(mediaTypeFromString(QString()) == MediaType::Video);
    assert(mediaTypeFromString(QStringLiteral("video")) == MediaType::Video);
    assert(mediaTypeFromString(QStringLiteral("multi_video")) == MediaType::Playlist);
    assert(mediaTypeFromString(QStringLiteral("url_transparent")) == MediaType::Url);
    assert(mediaTypeFromString(QStringLiteral("channel")) == MediaType::Unknown);
}

void TestRefersToPlaylist()
{
    MediaInfo tab;
    tab.type = MediaType::Url;
    tab.extractorKey = QStringLiteral("YoutubeTab");
    tab.url = QStringLiteral("https://www.youtube.com/@someone/videos");
    assert(tab.refersToPlaylist());

    MediaInfo byQuery;
    byQuery.type = MediaType::Url;
    byQuery.url = QStringLiteral("https://www.youtube.com/playlist?list=PL123");
    assert(byQuery.refersToPlaylist());

    MediaInfo videoInList;
    videoInList.type = MediaType::Url;
    videoInList.extractorKey = QStringLiteral("Youtube");
    videoInList.url = QStringLiteral("https://www.youtube.com/watch?v=x&list=PL123");
    assert(!videoInList.refersToPlaylist());

    MediaInfo video;
    video.type = MediaType::Video;
    assert(!video.refersToPlaylist());
}

void TestPlaceholdersAndBestUrl()
{
    MediaInfo info;
    info.title = QStringLiteral("[Private video]");
    assert(info.isUnavailablePlaceholder());
    info.title = QStringLiteral("[Deleted video]");
    assert(info.isUnavailablePlaceholder());
    info.title = QStringLiteral("Private video review");
    assert(!info.isUnavailablePlaceholder());

    info.originalUrl = QStringLiteral("o");
    assert(info.bestUrl() == QStringLiteral("o"));
    info.url = QStringLiteral("u");
    assert(info.bestUrl() == QStringLiteral("u"));
    info.webpageUrl = QStringLiteral("w");
    assert(info.bestUrl() == QStringLiteral("w"));
}

} // namespace

int main()
{
    TestParsesVideoFields();
    TestPlaylistKeepsNullEntries();
    TestEntriesWithoutTypeMeanPlaylist();
    TestTypeNames();
    TestRefersToPlaylist();
    TestPlaceholdersAndBestUrl();

    std::cout << "reel_unit_mediainfo: pass\n";
    return 0;
}
