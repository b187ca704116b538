#undef NDEBUG
#include <cassert>
#include <iostream>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <QTemporaryDir>

import reel.core.downloadledger;

namespace {

void TestRecordsArePersisted()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString path = tmp.filePath(QStringLiteral("state/downloaded_files.json"));

    {
        DownloadLedger ledger(path);
        assert(ledger.size() == 0);
        assert(!ledger.contains(QStringLiteral("u1")));
        assert(ledger.record(QStringLiteral("u1"), QStringLiteral("/media/a.mp4")));
        assert(ledger.record(QStringLiteral("u2"), QStringLiteral("/media/b.mp4")));
        assert(ledger.record(QStringLiteral("u1"), QStringLiteral("/media/a2.mp4")));
        assert(ledger.size() == 2);
    }

    QFile file(path);
    assert(file.open(QIODevice::ReadOnly));
    const QJsonObject json = QJsonDocument::fromJson(file.readAll()).object();
    assert(json.value(QStringLiteral("u1")).toString() == QStringLiteral("/media/a2.mp4"));

    DownloadLedger reopened(path);
    assert(reopened.size() == 2);
    assert(reopened.contains(QStringLiteral("u2")));
    assert(reopened.pathFor(QStringLiteral("u2")) == QStringLiteral("/media/b.mp4"));
    assert(reopened.pathFor(QStringLiteral("u3")).isEmpty());
}

void TestReloadPicksUpExternalChanges()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString path = tmp.filePath(QStringLiteral("ledger.json"));

    DownloadLedger first(path);
    DownloadLedger second(path);
    assert(first.record(QStringLiteral("u"), QStringLiteral("p")));
    assert(!second.contains(QStringLiteral("u")));
    second.reload();
    assert(second.contains(QStringLiteral("u")));
}

void TestMalformedFileStartsEmpty()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QString path = tmp.filePath(QStringLiteral("ledger.json"));
    {
        QFile file(path);
        assert(file.open(QIODevice::WriteOnly));
        file.write("not json at all");
    }

    DownloadLedger ledger(path);
    assert(ledger.size() == 0);
    assert(ledger.record(QStringLiteral("u"), QStringLiteral("p")));
    DownloadLedger reopened(path);
    assert(reopened.contains(QStringLiteral("u")));
}

void TestInMemoryLedger()
{
    DownloadLedger ledger;
    assert(ledger.filePath().isEmpty());
    assert(ledger.record(QStringLiteral("u"), QStringLiteral("p")));
    assert(ledger.contains(QStringLiteral("u")));
    assert(!ledger.record(QString(), QStringLiteral("p")));
    assert(ledger.size() == 1);
}

} // namespace

int main()
{
    TestRecordsArePersisted();
    TestReloadPicksUpExternalChanges();
    TestMalformedFileStartsEmpty();
    TestInMemoryLedger();

    std::cout << "reel_unit_download_ledger: pass\n";
    return 0;
}
