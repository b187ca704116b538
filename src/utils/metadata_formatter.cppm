/*!
 * @file        metadata_formatter.cppm
 * @brief       Human-readable metadata sidecar text.
 * @details     Renders the metadata of a downloaded item as three sections
 *              (basic, technical and other information), each a block of
 *              "Key: value" lines. Sections are separated by a blank line.
 *
 *              Every key is always present; missing values render as empty
 *              strings so the sidecar can be searched by key.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module reel.utils.metadata_formatter;
import reel.core.mediainfo;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

/**
 * @brief Formats item metadata as sidecar text.
 *
 * @param info Full metadata of the item.
 * @param originalUrl URL the user asked for.
 * @return Deterministic text with Basic Info, Technical Info and Other Info sections.
 */
QString formatMetadata(const MediaInfo& info, const QString& originalUrl);

} // namespace reel::utils
