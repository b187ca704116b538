/*!
 * @file        mediainfo.cppm
 * @brief       Typed metadata record for items reported by the extraction engine.
 * @details     The extraction engine reports loosely structured key/value
 *              payloads. MediaInfo turns them into a typed record with explicit
 *              optional fields, so defaults for missing values are resolved once
 *              at the engine boundary instead of being scattered across the
 *              resolver, executor and post-processing stages.
 *
 *              Playlists keep their entries in order. An entry the engine could
 *              not describe (private, deleted or otherwise unavailable) is kept
 *              as a null pointer so that its position and its failure can still
 *              be reported.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <optional>
#include <QJsonObject>
#include <QList>
#include <QSharedPointer>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.core.mediainfo;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief Kind of result returned by the engine for a URL.
 */
REEL_MODULE_EXPORT enum class MediaType {
    Video,      //!< A single downloadable item.
    Playlist,   //!< An ordered list of entries (may contain nested playlists).
    Url,        //!< A reference to another page, typical for flat playlist entries.
    Unknown     //!< Anything the core does not handle.
};

/**
 * @brief Typed view of the metadata the engine reports for one URL.
 *
 * Fields the engine did not report are empty strings or disengaged
 * optionals. The raw payload is retained for writing a machine-readable
 * sidecar when the engine did not leave one behind.
 */
REEL_MODULE_EXPORT struct MediaInfo {
    MediaType type = MediaType::Unknown;    //!< Result type.
    QString id;                             //!< Site-specific identifier.
    QString extractorKey;                   //!< Extractor that produced the result.
    QString title;                          //!< Title.
    QString uploader;                       //!< Uploader display name.
    QString channel;                        //!< Channel name, if distinct from uploader.
    QString uploadDate;                     //!< Upload date as YYYYMMDD.
    std::optional<qint64> timestamp;        //!< Upload time as unix seconds.
    std::optional<double> duration;         //!< Duration in seconds.
    std::optional<qint64> viewCount;        //!< View count.
    std::optional<qint64> likeCount;        //!< Like count.
    QString description;                    //!< Description text.
    QStringList tags;                       //!< Tags.
    QStringList categories;                 //!< Categories.
    QString license;                        //!< License text.
    std::optional<int> ageLimit;            //!< Age limit.
    QString webpageUrl;                     //!< Canonical page URL.
    QString url;                            //!< Raw URL (flat entries use this).
    QString originalUrl;                    //!< URL as passed to the engine.
    QString thumbnail;                      //!< Thumbnail URL.
    QString format;                         //!< Human-readable format description.
    QString formatId;                       //!< Format identifier.
    QString resolution;                     //!< Resolution, e.g. 1920x1080.
    std::optional<double> fps;              //!< Frames per second.
    QString videoCodec;                     //!< Video codec.
    QString audioCodec;                     //!< Audio codec.
    QString extension;                      //!< Container extension.
    QList<QSharedPointer<MediaInfo>> entries;  //!< Playlist entries; null marks an unavailable entry.
    QJsonObject raw;                        //!< Original payload.

    //!< @brief Return true for playlists.
    bool isPlaylist() const { return type == MediaType::Playlist; }

    /**
     * @brief Best URL to use when referring to this item.
     *
     * Prefers the canonical webpage URL, then the raw URL, then the URL
     * originally requested.
     */
    QString bestUrl() const;

    /**
     * @brief Whether the item is a placeholder for unavailable content.
     *
     * Flat playlist listings keep private and deleted videos as entries
     * with placeholder titles instead of dropping them.
     */
    bool isUnavailablePlaceholder() const;

    /**
     * @brief Whether this entry refers to a playlist rather than a video.
     *
     * True for expanded playlists and for flat references that point to a
     * playlist page.
     */
    bool refersToPlaylist() const;

    /**
     * @brief Build a record from an engine JSON payload.
     * @param object Engine payload.
     * @return Typed record.
     */
    static MediaInfo fromJson(const QJsonObject& object);
};

/**
 * @brief Parse the engine's type string.
 * @param value Raw "_type" value; empty means video.
 * @return Parsed type.
 */
REEL_MODULE_EXPORT MediaType mediaTypeFromString(const QString& value);
