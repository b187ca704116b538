/*!
 * @file        logging.cppm
 * @brief       Process-wide log configuration on top of Qt's message system.
 * @details     The core logs with qDebug(), qInfo(), qWarning() and qCritical().
 *              This module applies the configured minimum level through
 *              QLoggingCategory filter rules, installs a uniform message
 *              pattern and can mirror every message into an append-only log
 *              file next to the console output.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module reel.services.logging;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

REEL_MODULE_EXPORT namespace reel::logging {

/**
 * @brief Parse a level name.
 *
 * Accepts debug, info, warning/warn, error/critical, case-insensitive.
 * Unknown names map to QtDebugMsg.
 *
 * @param name Level name.
 * @return Minimum message type to emit.
 */
QtMsgType levelFromString(const QString& name);

/**
 * @brief Configure logging for the process.
 *
 * @param level Minimum level name, see levelFromString().
 * @param logFilePath Optional file that receives a copy of every message.
 * @return false if the log file could not be opened; console logging is
 *         configured regardless.
 */
bool configure(const QString& level, const QString& logFilePath = QString());

//!< @brief Restore the previous message handler and close the log file.
void shutdown();

} // namespace reel::logging
