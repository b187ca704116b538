module;
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

module reel.core.downloadledger;

DownloadLedger::DownloadLedger(const QString& filePath)
    : m_filePath(filePath)
{
    reload();
}

void DownloadLedger::reload()
{
    m_entries = QJsonObject();
    if (m_filePath.isEmpty()) return;
    QFile file(m_filePath);
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot read download ledger" << m_filePath << file.errorString();
        return;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Ignoring malformed download ledger" << m_filePath << error.errorString();
        return;
    }
    m_entries = doc.object();
    qDebug() << "Loaded download ledger with" << m_entries.size() << "entries";
}

bool DownloadLedger::contains(const QString& url) const
{
    return m_entries.contains(url);
}

QString DownloadLedger::pathFor(const QString& url) const
{
    return m_entries.value(url).toString();
}

bool DownloadLedger::record(const QString& url, const QString& filePath)
{
    if (url.isEmpty()) return false;
    m_entries.insert(url, filePath);
    return save();
}

bool DownloadLedger::save() const
{
    if (m_filePath.isEmpty()) return true;

    const QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        qWarning() << "Cannot create ledger folder" << info.absolutePath();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Cannot write download ledger" << m_filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(m_entries).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "Failed to commit download ledger" << m_filePath << file.errorString();
        return false;
    }
    return true;
}
