/*!
 * @file        burstdetector.cppm
 * @brief       Rolling-window detector for rapid successive downloads.
 * @details     Users often forward or save a batch of files from one chat in
 *              quick succession. Each file lands a few seconds after the
 *              previous one, long after the user may have switched windows.
 *              BurstDetector recognizes such batches so the caller can keep
 *              the whole batch under one classification.
 *
 *              Events older than the burst threshold (relative to the newest
 *              observation) are evicted. A burst starts when the window holds
 *              at least the minimum number of files, and is force-ended once
 *              it runs longer than the maximum duration.
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

#ifndef Q_MOC_RUN
export module sazman.core.burstdetector;
import sazman.core.models;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief Detects bursts of downloads within a rolling time window.
 *
 * All methods are thread-safe. Notifications are emitted after the internal
 * lock has been released, so handlers may call back into the detector.
 */
SAZMAN_MODULE_EXPORT class BurstDetector : public QObject {
    Q_OBJECT

public:
    explicit BurstDetector(QObject* parent = nullptr);

    /**
     * @brief Records a download and updates the burst state.
     * @param fileName Downloaded file name.
     * @param time Observation time.
     */
    void record(const QString& fileName, const QDateTime& time);

    /**
     * @brief Predicts whether a download at the given time would be part of a burst.
     *
     * Does not modify the detector.
     *
     * @param fileName File name (diagnostics only).
     * @param time Observation time.
     * @return true if the latest event is within the threshold and enough
     *         prior events would still be retained.
     */
    bool isBurst(const QString& fileName, const QDateTime& time) const;

    /**
     * @brief Snapshot of the current window.
     */
    BurstStatus status() const;

    /**
     * @brief Clears all events; ends an active burst first.
     */
    void reset();

    /**
     * @brief Seconds left until the active burst expires.
     * @param now Reference time.
     * @return Remaining seconds (>= 0), or empty when no burst is active.
     */
    std::optional<double> remaining(const QDateTime& now) const;

    /**
     * @brief Applies eviction at the given time without recording an event.
     *
     * Ends the burst when too few events remain or the maximum duration
     * has passed.
     */
    void sweep(const QDateTime& now);

    /**
     * @brief Number of files in the active burst, 0 when none is active.
     */
    int currentCount() const;

    int burstThresholdSeconds() const;
    void setBurstThresholdSeconds(int seconds);

    int minimumFilesForBurst() const;
    void setMinimumFilesForBurst(int count);

    int maxBurstDurationSeconds() const;
    void setMaxBurstDurationSeconds(int seconds);

    int saturationCount() const;
    void setSaturationCount(int count);

signals:
    //!< @brief Emitted when the window first reaches the minimum file count.
    void burstStarted(const BurstStatus& status);

    //!< @brief Emitted for each further file of an active burst.
    void burstContinued(const BurstStatus& status);

    //!< @brief Emitted when a burst ends (too few files, overrun or reset).
    void burstEnded(const BurstStatus& status);

private:
    /**
     * @brief A recorded download.
     */
    struct Event {
        QString fileName;
        QDateTime time;
    };

    enum class Notice { Started, Continued, Ended };

    struct PendingNotice {
        Notice notice;
        BurstStatus status;
    };

    BurstStatus statusLocked() const;
    void evictLocked(const QDateTime& reference, QList<PendingNotice>& pending);
    void endLocked(QList<PendingNotice>& pending);
    void deliver(const QList<PendingNotice>& pending);

    mutable QMutex m_mutex;                        //!< Guards every member below
    QList<Event> m_events;                         //!< Retained events, oldest first
    bool m_active = false;                         //!< Burst in progress
    std::optional<QDateTime> m_burstStart;         //!< Start of the active burst
    int m_thresholdSeconds = 5;                    //!< Max gap to the newest event
    int m_minimumFiles = 2;                        //!< Files needed to start a burst
    int m_maxDurationSeconds = 60;                 //!< Hard cap on a burst's span
    int m_saturationCount = 10;                    //!< Files for full confidence
};

#include "burstdetector.moc"
