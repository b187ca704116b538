module;
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>
#include <QStringList>

module reel.core.downloadsettings;

QString DownloadSettings::normalizedFormat() const
{
    const QString f = outputFormat.trimmed().toLower();
    if (f == "mp3" || f == "mkv") return f;
    return QStringLiteral("mp4");
}

DownloadSettings DownloadSettings::fromJson(const QJsonObject& object)
{
    DownloadSettings s;
    s.outputFormat = object.value("output_format").toString(s.outputFormat);
    s.quality = object.value("download_quality").toString(s.quality);
    if (s.quality.trimmed().isEmpty()) s.quality = QStringLiteral("best");
    s.downloadSubtitles = object.value("download_subtitles").toBool(s.downloadSubtitles);
    s.embedTitle = object.value("embed_title").toBool(s.embedTitle);
    s.embedUploader = object.value("embed_uploader").toBool(s.embedUploader);
    s.embedDescription = object.value("embed_description").toBool(s.embedDescription);
    s.embedTags = object.value("embed_tags").toBool(s.embedTags);
    s.embedLicense = object.value("embed_license").toBool(s.embedLicense);
    s.useYearSubfolders = object.value("use_year_subfolders").toBool(s.useYearSubfolders);
    s.cookiesFile = object.value("cookies_file").toString(s.cookiesFile);
    s.ledgerFile = object.value("metadata_file").toString(s.ledgerFile);
    s.loggingLevel = object.value("logging_level").toString(s.loggingLevel);
    return s;
}

QJsonObject DownloadSettings::toJson() const
{
    QJsonObject root;
    root.insert("output_format", outputFormat);
    root.insert("download_quality", quality);
    root.insert("download_subtitles", downloadSubtitles);
    root.insert("embed_title", embedTitle);
    root.insert("embed_uploader", embedUploader);
    root.insert("embed_description", embedDescription);
    root.insert("embed_tags", embedTags);
    root.insert("embed_license", embedLicense);
    root.insert("use_year_subfolders", useYearSubfolders);
    root.insert("cookies_file", cookiesFile);
    root.insert("metadata_file", ledgerFile);
    root.insert("logging_level", loggingLevel);
    return root;
}

DownloadSettings loadSettingsFile(const QString& path, QString* error)
{
    if (path.isEmpty() || !QFile::exists(path)) return DownloadSettings();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QStringLiteral("Cannot open settings file %1: %2").arg(path, file.errorString());
        return DownloadSettings();
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("Invalid settings file %1: %2")
                         .arg(path, parseError.error != QJsonParseError::NoError
                                        ? parseError.errorString()
                                        : QStringLiteral("expected a JSON object"));
        }
        return DownloadSettings();
    }
    return DownloadSettings::fromJson(doc.object());
}
