/*!
 * @file        urlresolver.cppm
 * @brief       Flattens raw input URLs into an ordered list of video URLs.
 * @details     Every raw URL is described by the engine in flat mode. Single
 *              videos contribute their canonical page URL, playlists contribute
 *              their entries in order, and playlists of playlists are expanded
 *              recursively so each child playlist keeps its own entry order.
 *
 *              Unresolvable URLs and unavailable entries become failure records;
 *              resolution of their siblings continues.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QSet>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.core.urlresolver;
import reel.core.batchtypes;
import reel.core.extractionengine;
import reel.core.mediainfo;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Output of a resolution pass.
 */
REEL_MODULE_EXPORT struct ResolveResult {
    QStringList urls;       //!< Concrete video URLs in discovery order.
    FailureList failures;   //!< Failures in discovery order.
};

/**
 * @brief Resolution stage of a batch.
 */
REEL_MODULE_EXPORT class UrlResolver {
public:
    //!< @brief Default limit for playlist nesting.
    static constexpr int kDefaultMaxDepth = 5;

    /**
     * @brief Construct a resolver.
     * @param engine Engine used for flat extraction; must outlive the resolver.
     * @param maxDepth Maximum playlist nesting followed below a raw URL.
     */
    explicit UrlResolver(ExtractionEngine& engine, int maxDepth = kDefaultMaxDepth);

    /**
     * @brief Resolve raw URLs in input order.
     *
     * Stops before the next raw URL (or nested playlist) once isCancelled()
     * returns true; URLs resolved so far are kept.
     *
     * @param rawUrls User-supplied URLs.
     * @param isCancelled Optional cancellation predicate.
     * @return Resolved URLs and failures.
     */
    ResolveResult resolve(const QStringList& rawUrls, const CancelPredicate& isCancelled = {});

    /**
     * @brief URL of a playlist entry, qualified against its parent.
     *
     * Prefers the canonical page URL, then the raw URL, then the id.
     *
     * @return Absolute URL, or empty if the entry carries none.
     */
    static QString entryUrl(const MediaInfo& entry, const QString& parentUrl);

private:
    struct Pass {
        ResolveResult result;
        CancelPredicate isCancelled;
        QSet<QString> visited;

        bool cancelled() const { return isCancelled && isCancelled(); }
    };

    void resolveUrl(const QString& url, int depth, Pass& pass);
    void handleInfo(const MediaInfo& info, const QString& requestedUrl, int depth, Pass& pass);
    void expandPlaylist(const MediaInfo& playlist, const QString& parentUrl, int depth, Pass& pass);

    ExtractionEngine& m_engine; //!< Metadata source.
    int m_maxDepth;             //!< Nesting limit.
};
