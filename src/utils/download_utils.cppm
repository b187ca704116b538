/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for download paths, URLs and engine messages.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across the batch core. These utilities handle common tasks such
 *              as path normalization, sidecar path derivation, upload-date
 *              parsing, playlist entry URL qualification and classification of
 *              engine error text.
 *
 *              All helpers are designed to be side-effect free and safe for use
 *              from the background worker as well as from the command line front end.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QUrl>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Checks whether a normalized path exists and refers to a regular file.
 *
 * @param path Normalized filesystem path.
 * @return true if the path exists and is a file, false otherwise.
 */
bool fileExistsPath(const QString& path);

/**
 * @brief Strips the last extension from a file path.
 *
 * Only the final suffix is removed, so "a.b.mp4" becomes "a.b". Dots inside
 * directory names are never treated as a suffix separator.
 *
 * @param filePath Media file path.
 * @return Path without its last suffix, used as the base for sidecar files.
 */
QString pathWithoutSuffix(const QString& filePath);

/**
 * @brief Extracts the 4-digit year from an engine upload date.
 *
 * The engine reports upload dates as YYYYMMDD. Anything else is considered
 * malformed.
 *
 * @param uploadDate Raw upload date string.
 * @return The year, or an empty string if the date is missing or malformed.
 */
QString uploadYear(const QString& uploadDate);

/**
 * @brief Checks whether a string is an absolute URL with a scheme and host.
 * @param value Candidate URL.
 * @return true for absolute http(s)-like URLs.
 */
bool isAbsoluteUrl(const QString& value);

/**
 * @brief Qualifies a playlist entry URL.
 *
 * Absolute URLs are returned unchanged. Host-relative paths are resolved
 * against the parent page. Bare identifiers are expanded to the site's
 * canonical watch URL.
 *
 * @param entryUrl URL or identifier reported for the entry.
 * @param parentUrl Canonical URL of the playlist the entry belongs to.
 * @return Absolute URL, or an empty string if nothing usable was given.
 */
QString qualifyEntryUrl(const QString& entryUrl, const QString& parentUrl);

/**
 * @brief Detects engine messages that indicate a private or removed video.
 * @param message Raw engine error text.
 * @return true if the message carries a private-video indicator.
 */
bool isPrivateVideoMessage(const QString& message);

/**
 * @brief Locates an external executable.
 *
 * A value containing a path separator is taken as a path and must exist;
 * a bare name is searched on PATH. An empty value searches for fallbackName.
 *
 * @return Absolute path, or empty if not found.
 */
QString findExecutable(const QString& nameOrPath, const QString& fallbackName);

} // namespace reel::utils
