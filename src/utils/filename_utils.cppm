/*!
 * @file        filename_utils.cppm
 * @brief       Filesystem-safe naming for downloaded media.
 * @details     Turns arbitrary titles reported by the extraction engine into
 *              names that can be created on every common filesystem. Invalid
 *              characters are replaced, surrounding whitespace and trailing dots
 *              are removed, the length is bounded while keeping the extension,
 *              and reserved device names are escaped.
 *
 *              The sanitizer is pure and deterministic: identical input always
 *              yields identical output and no filesystem access takes place.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module reel.utils.filename_utils;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

//!< @brief Maximum length of a sanitized name, in UTF-16 code units.
inline constexpr int kMaxFileNameLength = 255;

//!< @brief Room kept after a stem for suffixes such as ".reel-tmp.mp4" or ".description".
inline constexpr int kMaxSuffixLength = 16;

//!< @brief Name returned when nothing usable is left of the input.
inline constexpr const char* kFallbackFileName = "unknown_file";

/**
 * @brief Checks whether a character may not appear in a file name.
 *
 * Control characters and any of `<>:"/\|?*` are rejected.
 *
 * @param ch Character to inspect.
 * @return true if the character must be replaced.
 */
bool isForbiddenFileNameChar(QChar ch);

/**
 * @brief Checks whether a name is a reserved device name.
 *
 * Matches CON, PRN, AUX, NUL, COM1-COM9 and LPT1-LPT9 case-insensitively.
 * Only the part before the first dot is compared, since "nul.txt" is as
 * unusable as "nul".
 *
 * @param name Candidate file name.
 * @return true if the name would resolve to a device.
 */
bool isReservedDeviceName(const QString& name);

/**
 * @brief Produces a filesystem-safe file name from an arbitrary title.
 *
 * - Forbidden characters become '_'.
 * - Leading/trailing whitespace and trailing dots are removed.
 * - The result is at most kMaxFileNameLength code units; when a suffix is
 *   present the stem is shortened instead of the suffix.
 * - Reserved device names receive a '_' prefix.
 * - Empty or all-invalid input yields kFallbackFileName.
 *
 * @param rawName Unfiltered title or file name.
 * @return Safe file name.
 */
QString sanitizeFileName(const QString& rawName);

/**
 * @brief Sanitizes a title for use as a stem that suffixes are appended to.
 *
 * Same rules as sanitizeFileName(), but the result leaves @p reservedSuffixLength
 * units free so that stem plus suffix stays within kMaxFileNameLength.
 */
QString sanitizeFileStem(const QString& rawName, int reservedSuffixLength = kMaxSuffixLength);

} // namespace reel::utils
