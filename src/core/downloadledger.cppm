/*!
 * @file        downloadledger.cppm
 * @brief       Persistent record of finished downloads.
 * @details     Maps a source URL to the last output path produced for it. The
 *              ledger is read before and written after every item by the single
 *              batch worker and is saved atomically after each record, so an
 *              interrupted batch never loses entries for items that finished.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QJsonObject>
#include <QString>

#ifndef Q_MOC_RUN
export module reel.core.downloadledger;
#endif

#ifdef Q_MOC_RUN
#define REEL_MODULE_EXPORT
#else
#define REEL_MODULE_EXPORT export
#endif

/**
 * @brief URL to output-path ledger stored as a JSON object.
 *
 * Not thread-safe. Parallel downloads would need to guard it.
 */
REEL_MODULE_EXPORT class DownloadLedger {
public:
    /**
     * @brief Open a ledger.
     * @param filePath JSON document path; empty keeps the ledger in memory.
     */
    explicit DownloadLedger(const QString& filePath = QString());

    //!< @brief Return true if the URL was recorded as downloaded.
    bool contains(const QString& url) const;

    //!< @brief Output path recorded for the URL, empty if none.
    QString pathFor(const QString& url) const;

    /**
     * @brief Record a finished download and persist the ledger.
     * @param url Source URL.
     * @param filePath Output path.
     * @return false if the ledger file could not be written.
     */
    bool record(const QString& url, const QString& filePath);

    //!< @brief Number of recorded URLs.
    int size() const { return static_cast<int>(m_entries.size()); }

    //!< @brief Ledger file path.
    QString filePath() const { return m_filePath; }

    //!< @brief Reload entries from disk, replacing the in-memory state.
    void reload();

private:
    bool save() const;

    QString m_filePath;         //!< Backing file.
    QJsonObject m_entries;      //!< url -> path.
};
