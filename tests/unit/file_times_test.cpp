#undef NDEBUG
#include <cassert>
#include <iostream>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QTemporaryDir>

import reel.utils.file_times;

namespace utils = reel::utils;

namespace {

constexpr qint64 kTimestamp = 1600000000;

QString touch(const QDir& dir, const QString& name)
{
    const QString path = dir.filePath(name);
    QFile file(path);
    assert(file.open(QIODevice::WriteOnly));
    file.write("x");
    file.close();
    return path;
}

void TestSetsModificationTime()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QDir dir(tmp.path());
    const QString a = touch(dir, QStringLiteral("a.mp4"));
    const QString b = touch(dir, QStringLiteral("a.txt"));

    assert(utils::syncFileTimes({ a, b }, kTimestamp) == 2);
    assert(QFileInfo(a).lastModified().toSecsSinceEpoch() == kTimestamp);
    assert(QFileInfo(b).lastModified().toSecsSinceEpoch() == kTimestamp);
}

void TestSkipsMissingPathsWithoutCreatingThem()
{
    QTemporaryDir tmp;
    assert(tmp.isValid());
    const QDir dir(tmp.path());
    const QString present = touch(dir, QStringLiteral("video.mkv"));
    const QString missing = dir.filePath(QStringLiteral("video.png"));

    assert(utils::syncFileTimes({ missing, present, QString() }, kTimestamp) == 1);
    assert(!QFileInfo::exists(missing));
    assert(QFileInfo(present).lastModified().toSecsSinceEpoch() == kTimestamp);
}

void TestEmptyListIsNoop()
{
    assert(utils::syncFileTimes({}, kTimestamp) == 0);
}

} // namespace

int main()
{
    TestSetsModificationTime();
    TestSkipsMissingPathsWithoutCreatingThem();
    TestEmptyListIsNoop();

    std::cout << "reel_unit_file_times: pass\n";
    return 0;
}
