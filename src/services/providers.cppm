/*!
 * @file        providers.cppm
 * @brief       Narrow interfaces to the engine's external collaborators.
 * @details     The detection core never talks to the desktop or to storage
 *              directly. It reads the focused window, enumerates candidate
 *              windows, looks up learned patterns and persists sessions
 *              through the abstract providers declared here.
 *
 *              Implementations may throw std::exception subclasses on
 *              failure; callers in the core treat a throwing provider as an
 *              absent signal.
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
#include <QString>

#ifndef Q_MOC_RUN
export module sazman.services.providers;
import sazman.core.models;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief Reports the currently focused top-level window.
 */
SAZMAN_MODULE_EXPORT class ForegroundProvider {
public:
    virtual ~ForegroundProvider() = default;

    /**
     * @brief Title of the focused window, empty if unknown.
     */
    virtual QString activeTitle() = 0;

    /**
     * @brief Process name owning the focused window, empty if unknown.
     */
    virtual QString activeProcessName() = 0;
};

/**
 * @brief One visible top-level window as reported by a WindowEnumerator.
 */
SAZMAN_MODULE_EXPORT struct WindowObservation {
    QString id;                 //!< Platform window id
    QString title;              //!< Window title
    QString processName;        //!< Owning process name
    bool isActiveFocus = false; //!< Window holds input focus
};

/**
 * @brief Lists visible windows of the source application.
 */
SAZMAN_MODULE_EXPORT class WindowEnumerator {
public:
    virtual ~WindowEnumerator() = default;

    /**
     * @brief Enumerates visible top-level windows of the source application.
     * @param applicationName Bare application name (e.g. "Telegram").
     */
    virtual QList<WindowObservation> enumerate(const QString& applicationName) = 0;
};

/**
 * @brief Historical pattern lookup and learning.
 */
SAZMAN_MODULE_EXPORT class PatternStore {
public:
    virtual ~PatternStore() = default;

    /**
     * @brief Best matching pattern for a file, by confidence then observations.
     * @param fileName File name.
     * @param extension Extension including the dot.
     * @param time Observation time.
     */
    virtual std::optional<FilePattern> bestPattern(const QString& fileName,
                                                   const QString& extension,
                                                   const QDateTime& time) = 0;

    /**
     * @brief Inserts a new pattern (id 0) or replaces the stored one with the same id.
     * @return Identifier of the stored pattern.
     */
    virtual int savePattern(const FilePattern& pattern) = 0;
};

/**
 * @brief Durable storage for download sessions.
 */
SAZMAN_MODULE_EXPORT class SessionStore {
public:
    virtual ~SessionStore() = default;

    /**
     * @brief Persists a new session and returns its identifier.
     */
    virtual int createSession(const DownloadSession& session) = 0;

    /**
     * @brief Most recently started active session, if any.
     */
    virtual std::optional<DownloadSession> activeSession() = 0;

    virtual std::optional<DownloadSession> sessionById(int sessionId) = 0;

    /**
     * @brief Replaces the stored record with the same id.
     * @return false if no such session exists.
     */
    virtual bool updateSession(const DownloadSession& session) = 0;

    /**
     * @brief Marks a session inactive.
     * @return false if the session does not exist or already ended.
     */
    virtual bool endSession(int sessionId, const QDateTime& now) = 0;

    /**
     * @brief Records a file against a session.
     */
    virtual void addFileToSession(int sessionId, const SessionFile& file) = 0;

    /**
     * @brief Files recorded against a session, oldest first.
     */
    virtual QList<SessionFile> sessionFiles(int sessionId) = 0;

    /**
     * @brief Sessions ordered newest first.
     * @param activeOnly true = only active, false = only ended, empty = all.
     * @param limit Maximum number of rows, 0 for no limit.
     */
    virtual QList<DownloadSession> sessions(std::optional<bool> activeOnly, int limit) = 0;

    /**
     * @brief Ends every active session idle past its timeout.
     * @return The sessions that were ended, in their ended state.
     */
    virtual QList<DownloadSession> endTimedOutSessions(const QDateTime& now) = 0;

    /**
     * @brief Removes ended sessions that started before the cutoff.
     * @return Number of sessions removed.
     */
    virtual int deleteSessionsBefore(const QDateTime& cutoff) = 0;
};
