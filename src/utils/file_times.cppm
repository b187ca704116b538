/*!
 * @file        file_times.cppm
 * @brief       File timestamp synchronization.
 * @details     Sets the modification and access times of downloaded media and
 *              its sidecars to the original publish time of the source, so
 *              that files sort by upload date in file managers.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.utils.file_times;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::utils {

/**
 * @brief Set modification and access time of existing files.
 *
 * Paths that do not exist are skipped and logged. Files are never created.
 *
 * @param paths Files to update.
 * @param timestamp Unix time in seconds.
 * @return Number of files that were updated.
 */
int syncFileTimes(const QStringList& paths, qint64 timestamp);

} // namespace reel::utils
