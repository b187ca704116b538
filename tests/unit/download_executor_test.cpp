#undef NDEBUG
#include <cassert>
#include <functional>
#include <iostream>
#include <optional>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>

import reel.core.batchtypes;
import reel.core.downloadexecutor;
import reel.core.downloadledger;
import reel.core.downloadsettings;
import reel.core.extractionengine;
import reel.core.mediainfo;

#include "fake_extraction_engine.hpp"

using test::FakeExtractionEngine;
using test::watchUrl;

namespace {

struct Recorder {
    QStringList titles;
    QStringList descriptions;
    QList<int> progress;
    QStringList statuses;

    void attach(DownloadExecutor& executor)
    {
        QObject::connect(&executor, &DownloadExecutor::currentItemChanged, [this](const QString& t) { titles.append(t); });
        QObject::connect(&executor, &DownloadExecutor::descriptionChanged, [this](const QString& d) { descriptions.append(d); });
        QObject::connect(&executor, &DownloadExecutor::itemProgress, [this](int p) { progress.append(p); });
        QObject::connect(&executor, &DownloadExecutor::statusMessage, [this](const QString& s) { statuses.append(s); });
    }
};

void TestDownloadsAndPostProcesses()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("v1"), QStringLiteral("My: Video"));
    DownloadLedger ledger;

    DownloadExecutor executor(engine, ledger, DownloadSettings(), QString());
    executor.setThumbnailFetchEnabled(false);
    Recorder recorder;
    recorder.attach(executor);

    const DownloadOutcome outcome = executor.execute(watchUrl("v1"), tmp.path(), {});
    const QString expected = QDir(tmp.path()).filePath(QStringLiteral("My_ Video.mp4"));
    assert(outcome.kind == DownloadOutcome::Kind::Downloaded);
    assert(outcome.succeeded());
    assert(outcome.filePath == expected);
    assert(QFileInfo::exists(expected));
    assert(QFileInfo::exists(QDir(tmp.path()).filePath(QStringLiteral("My_ Video.txt"))));
    assert(QFileInfo(expected).lastModified().toSecsSinceEpoch() == 1673740800);

    assert(recorder.titles == QStringList({ QStringLiteral("My: Video") }));
    assert(recorder.descriptions == QStringList({ QStringLiteral("Description of My: Video") }));
    assert(recorder.progress == QList<int>({ 50, 100 }));
    assert(ledger.pathFor(watchUrl("v1")) == expected);

    const WorkItem item = executor.currentItem();
    assert(item.sourceUrl == watchUrl("v1"));
    assert(item.title == QStringLiteral("My: Video"));
    assert(item.uploadTimestamp && *item.uploadTimestamp == 1673740800);
    assert(item.destinationDir == tmp.path());

    // second attempt is answered by the ledger
    const DownloadOutcome again = executor.execute(watchUrl("v1"), tmp.path(), {});
    assert(again.kind == DownloadOutcome::Kind::Skipped);
    assert(again.filePath == expected);
    assert(engine.downloadCalls.size() == 1);
    assert(engine.extractCalls.size() == 1);
}

void TestYearSubfolder()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("y"), QStringLiteral("Yearly"));
    DownloadLedger ledger;
    DownloadSettings settings;
    settings.useYearSubfolders = true;

    DownloadExecutor executor(engine, ledger, settings, QString());
    const DownloadOutcome outcome = executor.execute(watchUrl("y"), tmp.path(), {});
    assert(outcome.kind == DownloadOutcome::Kind::Downloaded);
    assert(outcome.filePath == QDir(tmp.path()).filePath(QStringLiteral("2023/Yearly.mp4")));
}

void TestMissingMetadata()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    FakeExtractionEngine engine;
    DownloadLedger ledger;
    DownloadExecutor executor(engine, ledger, DownloadSettings(), QString());

    const DownloadOutcome outcome = executor.execute(watchUrl("gone"), tmp.path(), {});
    assert(outcome.kind == DownloadOutcome::Kind::Failed);
    assert(outcome.failure.url == watchUrl("gone"));
    assert(outcome.failure.reason == FailureReason::PrivateOrInaccessible);
    assert(engine.downloadCalls.isEmpty());
}

void TestEngineErrorsAreClassified()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("p"), QStringLiteral("Private"));
    engine.addVideo(QStringLiteral("e"), QStringLiteral("Broken"));
    engine.downloadErrors.insert(watchUrl("p"), QStringLiteral("[youtube] p: Private video. Sign in if you've been granted access"));
    engine.downloadErrors.insert(watchUrl("e"), QStringLiteral("HTTP Error 500: Internal Server Error"));
    DownloadLedger ledger;
    DownloadExecutor executor(engine, ledger, DownloadSettings(), QString());

    const DownloadOutcome privateOutcome = executor.execute(watchUrl("p"), tmp.path(), {});
    assert(privateOutcome.kind == DownloadOutcome::Kind::Failed);
    assert(privateOutcome.failure.reason == FailureReason::PrivateOrInaccessible);

    const DownloadOutcome errorOutcome = executor.execute(watchUrl("e"), tmp.path(), {});
    assert(errorOutcome.kind == DownloadOutcome::Kind::Failed);
    assert(errorOutcome.failure.reason == FailureReason::DownloadError);
    assert(errorOutcome.failure.detail == QStringLiteral("HTTP Error 500: Internal Server Error"));
    assert(ledger.size() == 0);
}

void TestCancellationInsideTransfer()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("c"), QStringLiteral("Cancelled"));
    DownloadLedger ledger;
    DownloadExecutor executor(engine, ledger, DownloadSettings(), QString());

    bool cancelRequested = false;
    QObject::connect(&executor, &DownloadExecutor::itemProgress, [&cancelRequested](int) { cancelRequested = true; });

    const DownloadOutcome outcome = executor.execute(watchUrl("c"), tmp.path(),
                                                     [&cancelRequested]() { return cancelRequested; });
    assert(outcome.kind == DownloadOutcome::Kind::Cancelled);
    assert(!outcome.succeeded());
    assert(outcome.failure.reason == FailureReason::Cancelled);
    assert(engine.progressReports == 1);
    assert(!ledger.contains(watchUrl("c")));
    assert(!QFileInfo::exists(QDir(tmp.path()).filePath(QStringLiteral("Cancelled.mp4"))));
}

void TestExistingOutputIsSkipped()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString existing = QDir(tmp.path()).filePath(QStringLiteral("Existing.mp4"));
    {
        QFile file(existing);
        assert(file.open(QIODevice::WriteOnly));
        file.write("old");
    }
    FakeExtractionEngine engine;
    engine.addVideo(QStringLiteral("x"), QStringLiteral("Existing"));
    DownloadLedger ledger;
    DownloadExecutor executor(engine, ledger, DownloadSettings(), QString());

    const DownloadOutcome outcome = executor.execute(watchUrl("x"), tmp.path(), {});
    assert(outcome.kind == DownloadOutcome::Kind::Skipped);
    assert(outcome.filePath == existing);
    assert(engine.downloadCalls.isEmpty());
    assert(ledger.pathFor(watchUrl("x")) == existing);
}

void TestProgressPercent()
{
    assert(DownloadExecutor::progressPercent({ QStringLiteral("downloading"), 25, 100, 0 }) == 25);
    assert(DownloadExecutor::progressPercent({ QStringLiteral("downloading"), 30, 0, 120 }) == 25);
    assert(DownloadExecutor::progressPercent({ QStringLiteral("downloading"), 999, 0, 0 }) == 0);
    assert(DownloadExecutor::progressPercent({ QStringLiteral("downloading"), 150, 100, 0 }) == 100);
    assert(DownloadExecutor::progressPercent({ QStringLiteral("finished"), 0, 0, 0 }) == 100);
}

void TestDestinationAndStem()
{
    assert(DownloadExecutor::destinationFolder(QStringLiteral("/base"), QStringLiteral("20230115"), true) == QStringLiteral("/base/2023"));
    assert(DownloadExecutor::destinationFolder(QStringLiteral("/base"), QStringLiteral("20230115"), false) == QStringLiteral("/base"));
    assert(DownloadExecutor::destinationFolder(QStringLiteral("/base"), QStringLiteral("2023"), true) == QStringLiteral("/base"));
    assert(DownloadExecutor::destinationFolder(QStringLiteral("file:///base"), QString(), false) == QStringLiteral("/base"));

    MediaInfo info;
    info.id = QStringLiteral("abc123");
    assert(DownloadExecutor::fileStem(info) == QStringLiteral("abc123"));
    info.title = QStringLiteral("A/B");
    assert(DownloadExecutor::fileStem(info) == QStringLiteral("A_B"));

    info.title = QString(300, QLatin1Char('t'));
    const QString longStem = DownloadExecutor::fileStem(info);
    assert(longStem.size() + QStringLiteral(".reel-tmp.mp4").size() <= 255);
    assert(longStem.size() + QStringLiteral(".info.json").size() <= 255);
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    TestDownloadsAndPostProcesses();
    TestYearSubfolder();
    TestMissingMetadata();
    TestEngineErrorsAreClassified();
    TestCancellationInsideTransfer();
    TestExistingOutputIsSkipped();
    TestProgressPercent();
    TestDestinationAndStem();

    std::cout << "reel_unit_download_executor: pass\n";
    return 0;
}
