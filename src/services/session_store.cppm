/*!
 * @file        session_store.cppm
 * @brief       JSON-backed durable storage for download sessions.
 * @details     Persists DownloadSession records and the files recorded against
 *              them. Every mutation rewrites the document atomically through
 *              QSaveFile; an empty path keeps the store in memory.
 *
 *              The store only keeps records. Deciding when a session starts,
 *              is reused or ends belongs to the SessionManager.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <QByteArray>
#include <optional>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QString>

#ifndef Q_MOC_RUN
export module sazman.services.session_store;
import sazman.core.models;
import sazman.services.providers;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief SessionStore persisted as a JSON document.
 */
SAZMAN_MODULE_EXPORT class JsonSessionStore : public SessionStore {
public:
    /**
     * @param path JSON file path, empty for an in-memory store.
     */
    explicit JsonSessionStore(const QString& path = QString());

    int createSession(const DownloadSession& session) override;
    std::optional<DownloadSession> activeSession() override;
    std::optional<DownloadSession> sessionById(int sessionId) override;
    bool updateSession(const DownloadSession& session) override;
    bool endSession(int sessionId, const QDateTime& now) override;
    void addFileToSession(int sessionId, const SessionFile& file) override;
    QList<SessionFile> sessionFiles(int sessionId) override;
    QList<DownloadSession> sessions(std::optional<bool> activeOnly, int limit) override;
    QList<DownloadSession> endTimedOutSessions(const QDateTime& now) override;
    int deleteSessionsBefore(const QDateTime& cutoff) override;

    /**
     * @brief Number of stored sessions (active and ended).
     */
    int sessionCount() const;

private:
    void load();
    QByteArray serializeLocked() const;
    void persist(QMutexLocker<QMutex>& locker);

    mutable QMutex m_mutex;                        //!< Guards every member below
    QString m_path;                                //!< Backing document
    QList<DownloadSession> m_sessions;             //!< Sessions in creation order
    QHash<int, QList<SessionFile>> m_files;        //!< Files per session id
    int m_nextId = 1;                              //!< Next identifier to assign
    quint64 m_generation = 0;                      //!< Snapshot counter

    QMutex m_writeMutex;                           //!< Serializes file writes
    quint64 m_writtenGeneration = 0;               //!< Newest snapshot on disk
};
