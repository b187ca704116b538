#undef NDEBUG
#include <cassert>
#include <functional>
#include <iostream>
#include <optional>
#include <QFile>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QSet>
#include <QSharedPointer>
#include <QString>
#include <QStringList>

import reel.core.batchtypes;
import reel.core.downloadsettings;
import reel.core.extractionengine;
import reel.core.mediainfo;
import reel.core.urlresolver;

#include "fake_extraction_engine.hpp"

using test::FakeExtractionEngine;
using test::flatEntry;
using test::playlistJson;
using test::playlistReference;
using test::playlistUrl;
using test::watchUrl;

namespace {

void TestSingleVideo()
{
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("v1"), QStringLiteral("One"));

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ QStringLiteral("  ") + watchUrl("v1") + QStringLiteral(" ") });
    assert(result.urls == QStringList({ watchUrl("v1") }));
    assert(result.failures.isEmpty());
    assert(engine.extractCalls == QStringList({ QStringLiteral("flat:") + watchUrl("v1") }));
}

void TestPlaylistWithUnavailableEntry()
{
    FakeExtractionEngine engine;
    engine.flat.insert(playlistUrl("PL1"),
                       playlistJson("PL1", QJsonArray{ flatEntry("a"), flatEntry("b"), QJsonValue(),
                                                       flatEntry("c"), flatEntry("d") }));

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ playlistUrl("PL1") });
    assert(result.urls == QStringList({ watchUrl("a"), watchUrl("b"), watchUrl("c"), watchUrl("d") }));
    assert(result.failures.size() == 1);
    assert(result.failures.first().url == playlistUrl("PL1"));
    assert(result.failures.first().reason == FailureReason::PrivateOrInaccessible);
}

void TestMissingMetadataDoesNotStopSiblings()
{
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("ok"), QStringLiteral("Fine"));

    UrlResolver resolver(engine);
    const QString broken = QStringLiteral("https://example.invalid/nothing");
    const ResolveResult result = resolver.resolve({ broken, watchUrl("ok") });
    assert(result.urls == QStringList({ watchUrl("ok") }));
    assert(result.failures.size() == 1);
    assert(result.failures.first().url == broken);
    assert(result.failures.first().reason == FailureReason::NoMetadata);
    assert(result.failures.first().detail.contains(QStringLiteral("Unsupported URL")));
}

void TestPlaylistOfPlaylistsKeepsOrder()
{
    FakeExtractionEngine engine;
    engine.flat.insert(playlistUrl("ALL"),
                       playlistJson("ALL", QJsonArray{ playlistReference("A"), flatEntry("solo"), playlistReference("B") }));
    engine.flat.insert(playlistUrl("A"), playlistJson("A", QJsonArray{ flatEntry("a1"), flatEntry("a2") }));
    engine.flat.insert(playlistUrl("B"), playlistJson("B", QJsonArray{ flatEntry("b1") }));
    engine.addVideo(QStringLiteral("first"), QStringLiteral("First"));

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ watchUrl("first"), playlistUrl("ALL") });
    assert(result.urls == QStringList({ watchUrl("first"), watchUrl("a1"), watchUrl("a2"),
                                        watchUrl("solo"), watchUrl("b1") }));
    assert(result.failures.isEmpty());
}

void TestInlineNestedPlaylist()
{
    FakeExtractionEngine engine;
    const QJsonObject inner = playlistJson("IN", QJsonArray{ flatEntry("i1"), flatEntry("i2") });
    engine.flat.insert(playlistUrl("OUT"), playlistJson("OUT", QJsonArray{ flatEntry("o1"), inner, flatEntry("o2") }));

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ playlistUrl("OUT") });
    assert(result.urls == QStringList({ watchUrl("o1"), watchUrl("i1"), watchUrl("i2"), watchUrl("o2") }));
    assert(engine.extractCalls.size() == 1);
}

void TestPlaceholderEntries()
{
    FakeExtractionEngine engine;
    engine.flat.insert(playlistUrl("P"),
                       playlistJson("P", QJsonArray{ flatEntry("x", QStringLiteral("[Private video]")), flatEntry("y") }));

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ playlistUrl("P") });
    assert(result.urls == QStringList({ watchUrl("y") }));
    assert(result.failures.size() == 1);
    assert(result.failures.first() == (FailureRecord{ watchUrl("x"), FailureReason::PrivateOrInaccessible,
                                                      QStringLiteral("[Private video]") }));
}

void TestUnknownResultType()
{
    FakeExtractionEngine engine;
    QJsonObject odd;
    odd.insert("_type", "channel");
    odd.insert("id", "c1");
    const QString url = QStringLiteral("https://example.com/channel/c1");
    engine.flat.insert(url, odd);

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ url });
    assert(result.urls.isEmpty());
    assert(result.failures.size() == 1);
    assert(result.failures.first().reason == FailureReason::UnhandledType);
    assert(result.failures.first().detail == QStringLiteral("channel"));
}

void TestTopLevelReferenceIsFollowed()
{
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("target"), QStringLiteral("Target"));
    QJsonObject ref;
    ref.insert("_type", "url");
    ref.insert("url", watchUrl("target"));
    const QString shortUrl = QStringLiteral("https://youtu.be/target");
    engine.flat.insert(shortUrl, ref);

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ shortUrl });
    assert(result.urls == QStringList({ watchUrl("target") }));
    assert(result.failures.isEmpty());
}

void TestBareIdsAreQualified()
{
    FakeExtractionEngine engine;
    QJsonObject bare;
    bare.insert("_type", "url");
    bare.insert("id", "xyz");
    engine.flat.insert(playlistUrl("IDS"), playlistJson("IDS", QJsonArray{ bare }));

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ playlistUrl("IDS") });
    assert(result.urls == QStringList({ watchUrl("xyz") }));
}

void TestResolutionIsRepeatable()
{
    FakeExtractionEngine engine;
    engine.flat.insert(playlistUrl("R"), playlistJson("R", QJsonArray{ flatEntry("r1"), QJsonValue(), flatEntry("r2") }));

    UrlResolver resolver(engine);
    const ResolveResult first = resolver.resolve({ playlistUrl("R") });
    const ResolveResult second = resolver.resolve({ playlistUrl("R") });
    assert(first.urls == second.urls);
    assert(first.failures == second.failures);
}

void TestCancellationStopsFurtherUrls()
{
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("v1"), QStringLiteral("One"));
    engine.addVideo(QStringLiteral("v2"), QStringLiteral("Two"));

    UrlResolver resolver(engine);
    const ResolveResult result = resolver.resolve({ watchUrl("v1"), watchUrl("v2") },
                                                  [&engine]() { return !engine.extractCalls.isEmpty(); });
    assert(result.urls == QStringList({ watchUrl("v1") }));
    assert(engine.extractCalls.size() == 1);

    engine.extractCalls.clear();
    engine.flat.insert(playlistUrl("ALL"), playlistJson("ALL", QJsonArray{ playlistReference("A"), playlistReference("B") }));
    engine.flat.insert(playlistUrl("A"), playlistJson("A", QJsonArray{ flatEntry("a1") }));
    engine.flat.insert(playlistUrl("B"), playlistJson("B", QJsonArray{ flatEntry("b1") }));
    const ResolveResult nested = resolver.resolve({ playlistUrl("ALL") },
                                                  [&engine]() { return engine.extractCalls.size() >= 2; });
    assert(nested.urls == QStringList({ watchUrl("a1") }));
    assert(!engine.extractCalls.contains(QStringLiteral("flat:") + playlistUrl("B")));
}

void TestCyclesAndDepthLimit()
{
    FakeExtractionEngine engine;
    engine.flat.insert(playlistUrl("A"), playlistJson("A", QJsonArray{ flatEntry("a1"), playlistReference("B") }));
    engine.flat.insert(playlistUrl("B"), playlistJson("B", QJsonArray{ flatEntry("b1"), playlistReference("A") }));

    UrlResolver resolver(engine);
    const ResolveResult cyclic = resolver.resolve({ playlistUrl("A") });
    assert(cyclic.urls == QStringList({ watchUrl("a1"), watchUrl("b1") }));
    assert(cyclic.failures.isEmpty());

    engine.flat.insert(playlistUrl("C"), playlistJson("C", QJsonArray{ flatEntry("c1") }));
    engine.flat.insert(playlistUrl("TOP"), playlistJson("TOP", QJsonArray{ playlistReference("MID") }));
    engine.flat.insert(playlistUrl("MID"), playlistJson("MID", QJsonArray{ flatEntry("m1"), playlistReference("C") }));

    UrlResolver shallow(engine, 1);
    const ResolveResult limited = shallow.resolve({ playlistUrl("TOP") });
    assert(limited.urls == QStringList({ watchUrl("m1") }));
    assert(limited.failures.size() == 1);
    assert(limited.failures.first() == (FailureRecord{ playlistUrl("C"), FailureReason::UnhandledType,
                                                       QStringLiteral("playlist") }));
}

void TestEntryUrlPreference()
{
    MediaInfo entry;
    entry.id = QStringLiteral("id1");
    assert(UrlResolver::entryUrl(entry, playlistUrl("P")) == watchUrl("id1"));
    entry.url = QStringLiteral("https://example.com/v/2");
    assert(UrlResolver::entryUrl(entry, playlistUrl("P")) == QStringLiteral("https://example.com/v/2"));
    entry.webpageUrl = QStringLiteral("https://example.com/watch/3");
    assert(UrlResolver::entryUrl(entry, playlistUrl("P")) == QStringLiteral("https://example.com/watch/3"));
    assert(UrlResolver::entryUrl(MediaInfo(), playlistUrl("P")).isEmpty());
}

} // namespace

int main()
{
    TestSingleVideo();
    TestPlaylistWithUnavailableEntry();
    TestMissingMetadataDoesNotStopSiblings();
    TestPlaylistOfPlaylistsKeepsOrder();
    TestInlineNestedPlaylist();
    TestPlaceholderEntries();
    TestUnknownResultType();
    TestTopLevelReferenceIsFollowed();
    TestBareIdsAreQualified();
    TestResolutionIsRepeatable();
    TestCancellationStopsFurtherUrls();
    TestCyclesAndDepthLimit();
    TestEntryUrlPreference();

    std::cout << "reel_unit_url_resolver: pass\n";
    return 0;
}
