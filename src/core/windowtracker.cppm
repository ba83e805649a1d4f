/*!
 * @file        windowtracker.cppm
 * @brief       Time-decayed cache of recently seen source-application windows.
 * @details     The focused window is only a snapshot: by the time a download
 *              lands, the user may already be elsewhere. WindowTracker keeps
 *              a bounded cache of the source application's windows, refreshed
 *              by periodic scans, so the engine can still ask "which chat was
 *              open a moment ago?".
 *
 *              The cache never holds more than maxTrackedWindows entries; on
 *              overflow the entry with the oldest lastSeen is evicted.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <optional>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QTimer>

#ifndef Q_MOC_RUN
export module sazman.core.windowtracker;
import sazman.core.models;
import sazman.services.providers;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief Best group name recently seen in the cache.
 */
SAZMAN_MODULE_EXPORT struct RecentGroup {
    QString groupName;          //!< Extracted group name
    double confidence = 0.0;    //!< Cached (undecayed) confidence
    QDateTime lastSeen;         //!< When the window was last seen
};

/**
 * @brief Background window cache fed by a WindowEnumerator.
 *
 * Scans run either on demand through scan() or periodically once start()
 * has been called. Queries return copies of the cached entries.
 */
SAZMAN_MODULE_EXPORT class WindowTracker : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs a tracker over an enumerator.
     * @param enumerator Window source, not owned; must outlive the tracker.
     * @param parent Optional QObject parent.
     * @throws std::invalid_argument if enumerator is null.
     */
    explicit WindowTracker(WindowEnumerator* enumerator, QObject* parent = nullptr);

    /**
     * @brief Enumerates windows and merges them into the cache.
     *
     * A failing enumerator is logged and leaves the cache untouched.
     *
     * @param now Scan time.
     */
    void scan(const QDateTime& now);

    /**
     * @brief All cached windows, most recently seen first.
     */
    QList<WindowCandidate> all() const;

    std::optional<WindowCandidate> mostRecent() const;

    /**
     * @brief Windows seen within the given number of seconds, most recent first.
     */
    QList<WindowCandidate> recent(int withinSeconds, const QDateTime& now) const;

    std::optional<WindowCandidate> byId(const QString& id) const;

    /**
     * @brief Best group name among windows seen recently.
     *
     * Prefers the highest-confidence window with an extracted name (ties go
     * to the most recent); otherwise extracts and caches a name from the
     * most recent window.
     *
     * @param now Reference time.
     * @param withinSeconds Recency window.
     */
    std::optional<RecentGroup> bestRecentGroupName(const QDateTime& now, int withinSeconds = 60);

    /**
     * @brief Removes windows not seen for timeoutSeconds.
     * @return Number of removed windows.
     */
    int evictExpired(const QDateTime& now, int timeoutSeconds = 300);

    int trackedCount() const;

    //!< @brief Drop every cached window without notifications.
    void clear();

    //!< @brief Start periodic scanning.
    void start();

    //!< @brief Stop periodic scanning.
    void stop();

    bool isRunning() const;

    int scanIntervalMs() const;

    /**
     * @brief Sets the scan period (250 - 60000 ms).
     */
    void setScanIntervalMs(int intervalMs);

    int maxTrackedWindows() const;

    /**
     * @brief Sets the cache bound (1 - 500); shrinking evicts immediately.
     */
    void setMaxTrackedWindows(int count);

    QString sourceApplication() const;
    void setSourceApplication(const QString& applicationName);

signals:
    //!< @brief A window entered the cache.
    void windowDetected(const WindowCandidate& window);

    //!< @brief A cached window gained focus.
    void windowActivated(const WindowCandidate& window);

    //!< @brief A window left the cache (overflow or expiry).
    void windowRemoved(const WindowCandidate& window);

private slots:
    //!< @brief Periodic scan tick.
    void onScanTimer();

private:
    QList<WindowCandidate> sortedLocked() const;
    void enforceLimitLocked(QList<WindowCandidate>& removed);

    WindowEnumerator* m_enumerator;                    //!< Window source (not owned)
    mutable QMutex m_mutex;                            //!< Guards the cache and settings
    QHash<QString, WindowCandidate> m_windows;         //!< Cache keyed by window id
    int m_maxTrackedWindows = 20;                      //!< Cache bound
    QString m_sourceApplication;                       //!< Application being tracked
    QTimer m_scanTimer;                                //!< Periodic scan timer
};

#include "windowtracker.moc"
