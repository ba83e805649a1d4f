/*!
 * @file        sessionmanager.cppm
 * @brief       Lifecycle management for download sessions.
 * @details     A download session groups files that arrive close together
 *              under one classification. At most one session is active at a
 *              time: a file for the same group extends it, a file for a
 *              different group ends it and opens a new one, and a session that
 *              sees no files for its timeout is ended by the periodic sweep.
 *
 *              Records live in an injected SessionStore; the manager owns the
 *              rules and serializes every mutation so two files arriving
 *              concurrently can never open two sessions.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <optional>
#include <QDateTime>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QTimer>

#ifndef Q_MOC_RUN
export module sazman.core.sessionmanager;
import sazman.core.models;
import sazman.services.providers;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief Group with the most sessions in the history.
 */
SAZMAN_MODULE_EXPORT struct GroupActivity {
    QString groupName;      //!< Group name
    int sessionCount = 0;   //!< Sessions recorded for the group
};

/**
 * @brief Creates, reuses, times out and ends download sessions.
 *
 * Mutating calls propagate store exceptions to the caller. Read-only queries
 * log store failures and return an empty answer.
 */
SAZMAN_MODULE_EXPORT class SessionManager : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs a manager over a session store.
     * @param store Session persistence, not owned; must outlive the manager.
     * @param parent Optional QObject parent.
     * @throws std::invalid_argument if store is null.
     */
    explicit SessionManager(SessionStore* store, QObject* parent = nullptr);

    /**
     * @brief The active session, if any.
     */
    std::optional<DownloadSession> active();

    /**
     * @brief Starts a session or reuses the active one for the same group.
     *
     * An active session for a different group is ended first.
     *
     * @param groupName Group the session belongs to.
     * @param windowTitle Window title observed at creation.
     * @param processName Process name observed at creation.
     * @param confidence Confidence in the group name.
     * @param now Reference time.
     * @return The reused or newly created session.
     */
    DownloadSession start(const QString& groupName,
                          const QString& windowTitle = QString(),
                          const QString& processName = QString(),
                          double confidence = 1.0,
                          const QDateTime& now = QDateTime::currentDateTime());

    /**
     * @brief Adds a file to the active session for its group.
     *
     * When no session is active, or the active one belongs to another group,
     * a session for fallbackGroupName is started first. A file name already
     * in the session only refreshes its activity.
     *
     * @return The session the file was added to.
     */
    DownloadSession addFile(const QString& fileName,
                            const QString& fallbackGroupName,
                            const QString& filePath = QString(),
                            qint64 fileSize = 0,
                            const QDateTime& now = QDateTime::currentDateTime());

    /**
     * @brief Ends a session by id; ended or unknown sessions are ignored.
     */
    void end(int sessionId, const QDateTime& now = QDateTime::currentDateTime());

    //!< @brief End the active session, if any.
    void endCurrent(const QDateTime& now = QDateTime::currentDateTime());

    /**
     * @brief Ends every active session idle past its timeout.
     * @return Number of sessions ended.
     */
    int sweepTimedOut(const QDateTime& now = QDateTime::currentDateTime());

    bool isActive();

    /**
     * @brief Group name of the active session.
     */
    std::optional<QString> currentGroupName();

    /**
     * @brief Seconds until the active session times out (>= 0).
     */
    std::optional<double> timeoutRemaining(const QDateTime& now = QDateTime::currentDateTime());

    /**
     * @brief Most recent sessions, newest first.
     * @param limit Maximum number of sessions.
     * @param includeActive Include the active session.
     */
    QList<DownloadSession> recentSessions(int limit = 10, bool includeActive = true);

    std::optional<DownloadSession> sessionById(int sessionId);

    /**
     * @brief Files recorded against a session, oldest first.
     */
    QList<SessionFile> sessionFiles(int sessionId);

    int totalSessionCount();

    /**
     * @brief Mean file count over the last 1000 sessions.
     */
    double averageFilesPerSession();

    /**
     * @brief Group with the most sessions among the last 1000.
     *
     * Ties go to the group with the most recent session.
     */
    std::optional<GroupActivity> mostActiveGroup();

    /**
     * @brief Removes ended sessions older than the retention period.
     * @param retentionDays Days to keep (>= 1).
     * @return Number of sessions removed.
     */
    int deleteOldSessions(int retentionDays, const QDateTime& now = QDateTime::currentDateTime());

    int defaultTimeout() const;

    /**
     * @brief Sets the timeout for new sessions (5 - 300 seconds).
     */
    void setDefaultTimeout(int timeoutSeconds);

    /**
     * @brief Runs sweepTimedOut() periodically.
     * @param intervalMs Sweep period in milliseconds.
     */
    void startSweeping(int intervalMs = 5000);

    void stopSweeping();

    bool isSweeping() const;

signals:
    //!< @brief A new session was created.
    void sessionStarted(const DownloadSession& session);

    //!< @brief A session ended (explicitly, by a group change or by timeout).
    void sessionEnded(const DownloadSession& session);

    //!< @brief A session ended because of inactivity; followed by sessionEnded.
    void sessionTimedOut(const DownloadSession& session);

    //!< @brief A new file joined a session.
    void fileAdded(const DownloadSession& session, const QString& fileName);

private slots:
    //!< @brief Periodic sweep tick.
    void onSweepTimer();

private:
    /**
     * @brief Deferred notification, delivered after the lock is released.
     */
    struct Notice {
        enum Kind { Started, Ended, TimedOut, FileAdded } kind;
        DownloadSession session;
        QString fileName;
    };

    DownloadSession startLocked(const QString& groupName, const QString& windowTitle,
                                const QString& processName, double confidence,
                                const QDateTime& now, QList<Notice>& pending);
    void endLocked(int sessionId, const QDateTime& now, QList<Notice>& pending);
    void deliver(const QList<Notice>& pending);

    SessionStore* m_store;                 //!< Session persistence (not owned)
    mutable QMutex m_mutex;                //!< Serializes session transitions
    int m_defaultTimeoutSeconds = 30;      //!< Timeout for new sessions
    QTimer m_sweepTimer;                   //!< Periodic timeout sweep
};

#include "sessionmanager.moc"
