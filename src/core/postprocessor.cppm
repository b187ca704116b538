/*!
 * @file        postprocessor.cppm
 * @brief       Steps applied to a media file after the engine finalized it.
 * @details     Converts the thumbnail sidecar to PNG, injects title, uploader,
 *              description, tags and license into the container through the
 *              muxer, embeds the PNG as cover art, writes the text and JSON
 *              metadata sidecars and aligns file times with the upload time.
 *
 *              Every step is best-effort. A failing step is logged and the
 *              pipeline moves on; the downloaded media file is never removed.
 *              Container rewrites go to a temporary file in the same folder
 *              which then replaces the original in one rename.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module reel.core.postprocessor;
import reel.core.mediainfo;
import reel.core.downloadsettings;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief What the pipeline managed to do for one file.
 */
REEL_MODULE_EXPORT struct PostProcessReport {
    QString pngThumbnail;           //!< PNG thumbnail path, empty if none.
    QString metadataSidecar;        //!< Text sidecar path, empty if not written.
    QString infoSidecar;            //!< JSON sidecar path, empty if absent.
    bool metadataEmbedded = false;  //!< Container metadata was rewritten.
    bool coverEmbedded = false;     //!< Cover art was embedded.
    int timesSynced = 0;            //!< Files whose times were updated.
};

/**
 * @brief Best-effort post-processing pipeline.
 */
REEL_MODULE_EXPORT class PostProcessor {
public:
    /**
     * @brief Construct a pipeline.
     * @param muxerPath Path of the ffmpeg executable; empty disables muxing steps.
     * @param settings Embed flags and output format.
     */
    PostProcessor(const QString& muxerPath, const DownloadSettings& settings);

    /**
     * @brief Run every step for a finalized media file.
     * @param mediaPath Finalized media path.
     * @param info Full metadata of the item.
     * @param originalUrl URL the item was requested with.
     * @return Summary of the steps that succeeded.
     */
    PostProcessReport process(const QString& mediaPath, const MediaInfo& info, const QString& originalUrl);

    /**
     * @brief Make sure a PNG thumbnail sits next to the media file.
     *
     * An existing PNG sidecar is used as is. Otherwise the first sidecar with
     * a known image extension is converted; the source image is kept.
     *
     * @return PNG path, or empty if there is no usable thumbnail.
     */
    QString ensurePngThumbnail(const QString& mediaPath) const;

    /**
     * @brief Rewrite container metadata according to the embed flags.
     * @param mediaPath Media file.
     * @param info Item metadata.
     * @param description Description text to embed.
     * @return true if the file was rewritten.
     */
    bool embedMetadata(const QString& mediaPath, const MediaInfo& info, const QString& description) const;

    /**
     * @brief Embed a PNG as cover art.
     * @return true if the file was rewritten; false for a missing PNG, an
     *         unsupported container or a muxer failure.
     */
    bool embedCover(const QString& mediaPath, const QString& pngPath) const;

    /**
     * @brief "-metadata key=value" arguments allowed by the embed flags.
     */
    static QStringList metadataArguments(const MediaInfo& info,
                                         const QString& description,
                                         const DownloadSettings& settings);

    /**
     * @brief Muxer arguments for embedding a cover, by container.
     * @return Arguments, empty for containers without cover support.
     */
    static QStringList coverArguments(const QString& mediaPath,
                                      const QString& pngPath,
                                      const QString& outputPath);

    //!< @brief Image sidecar extensions that are converted to PNG.
    static QStringList thumbnailExtensions();

    //!< @brief Temporary output path used while rewriting a container.
    static QString temporaryPathFor(const QString& mediaPath);

private:
    bool muxerAvailable() const;
    bool runMuxer(const QStringList& args, const QString& mediaPath, const QString& tempPath) const;

    QString m_muxerPath;        //!< ffmpeg path.
    DownloadSettings m_settings; //!< Embed flags.
};
