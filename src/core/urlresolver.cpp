module;
#include <QDebug>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

module reel.core.urlresolver;

import reel.utils.download_utils;

namespace utils = reel::utils;

UrlResolver::UrlResolver(ExtractionEngine& engine, int maxDepth)
    : m_engine(engine)
    , m_maxDepth(qMax(0, maxDepth))
{
}

ResolveResult UrlResolver::resolve(const QStringList& rawUrls, const CancelPredicate& isCancelled)
{
    Pass pass;
    pass.isCancelled = isCancelled;

    for (const QString& raw : rawUrls) {
        const QString url = raw.trimmed();
        if (url.isEmpty()) continue;
        if (pass.cancelled()) {
            qDebug() << "Resolution cancelled before" << url;
            break;
        }
        pass.visited.clear();
        resolveUrl(url, 0, pass);
    }

    qDebug() << "Resolved" << pass.result.urls.size() << "video URLs with"
             << pass.result.failures.size() << "failures";
    return pass.result;
}

QString UrlResolver::entryUrl(const MediaInfo& entry, const QString& parentUrl)
{
    QString candidate = entry.webpageUrl;
    if (candidate.isEmpty()) candidate = entry.url;
    if (candidate.isEmpty()) candidate = entry.id;
    if (candidate.isEmpty()) return QString();
    return utils::qualifyEntryUrl(candidate, parentUrl);
}

void UrlResolver::resolveUrl(const QString& url, int depth, Pass& pass)
{
    pass.visited.insert(url);

    const ExtractionResult extracted = m_engine.extractInfo(url, ExtractionMode::Flat);
    if (!extracted.ok()) {
        qWarning() << "No metadata for" << url << extracted.error;
        pass.result.failures.append(FailureRecord{ url, FailureReason::NoMetadata, extracted.error });
        return;
    }
    handleInfo(*extracted.info, url, depth, pass);
}

void UrlResolver::handleInfo(const MediaInfo& info, const QString& requestedUrl, int depth, Pass& pass)
{
    switch (info.type) {
    case MediaType::Video: {
        if (info.isUnavailablePlaceholder()) {
            pass.result.failures.append(FailureRecord{ requestedUrl, FailureReason::PrivateOrInaccessible, info.title });
            return;
        }
        QString url = entryUrl(info, requestedUrl);
        if (url.isEmpty()) url = requestedUrl;
        pass.result.urls.append(url);
        return;
    }
    case MediaType::Playlist:
        expandPlaylist(info, requestedUrl, depth, pass);
        return;
    case MediaType::Url: {
        // A bare reference: follow it once more in flat mode.
        const QString target = entryUrl(info, requestedUrl);
        if (target.isEmpty() || pass.visited.contains(target) || depth >= m_maxDepth) {
            pass.result.failures.append(FailureRecord{ requestedUrl, FailureReason::UnhandledType, QStringLiteral("url") });
            return;
        }
        resolveUrl(target, depth + 1, pass);
        return;
    }
    case MediaType::Unknown:
        break;
    }

    const QString typeName = info.raw.value(QStringLiteral("_type")).toString();
    qWarning() << "Unhandled result type" << typeName << "for" << requestedUrl;
    pass.result.failures.append(FailureRecord{ requestedUrl, FailureReason::UnhandledType,
                                  typeName.isEmpty() ? QStringLiteral("unknown") : typeName });
}

void UrlResolver::expandPlaylist(const MediaInfo& playlist, const QString& parentUrl, int depth, Pass& pass)
{
    const QString playlistUrl = parentUrl.isEmpty() ? playlist.bestUrl() : parentUrl;
    qDebug() << "Expanding playlist" << playlist.title << "with" << playlist.entries.size() << "entries";

    for (const auto& entry : playlist.entries) {
        if (!entry) {
            pass.result.failures.append(FailureRecord{ playlistUrl, FailureReason::PrivateOrInaccessible, QString() });
            continue;
        }

        const QString url = entryUrl(*entry, playlistUrl);
        if (entry->isUnavailablePlaceholder()) {
            pass.result.failures.append(FailureRecord{ url.isEmpty() ? playlistUrl : url,
                                          FailureReason::PrivateOrInaccessible, entry->title });
            continue;
        }

        if (entry->type == MediaType::Playlist) {
            if (depth >= m_maxDepth) {
                qWarning() << "Playlist nesting too deep at" << playlistUrl;
                pass.result.failures.append(FailureRecord{ url.isEmpty() ? playlistUrl : url,
                                              FailureReason::UnhandledType, QStringLiteral("playlist") });
                continue;
            }
            expandPlaylist(*entry, url.isEmpty() ? playlistUrl : url, depth + 1, pass);
            continue;
        }

        if (url.isEmpty()) {
            pass.result.failures.append(FailureRecord{ playlistUrl, FailureReason::PrivateOrInaccessible, QString() });
            continue;
        }

        if (entry->refersToPlaylist()) {
            if (pass.cancelled()) return;
            if (pass.visited.contains(url)) {
                qDebug() << "Skipping already expanded playlist" << url;
                continue;
            }
            if (depth >= m_maxDepth) {
                qWarning() << "Playlist nesting too deep at" << url;
                pass.result.failures.append(FailureRecord{ url, FailureReason::UnhandledType, QStringLiteral("playlist") });
                continue;
            }
            resolveUrl(url, depth + 1, pass);
            continue;
        }

        pass.result.urls.append(url);
    }
}
