/*!
 * @file        models.cppm
 * @brief       Shared value types for sessions, windows, patterns and bursts.
 * @details     Defines the plain data records exchanged between the burst
 *              detector, the window tracker, the session manager, the
 *              external stores and the fusion engine.
 *
 *              All records are copyable values. Components hand out copies
 *              (snapshots) of their internal state, never references into
 *              it, so readers never observe a half-applied update.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <optional>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module sazman.core.models;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief A time-bounded group of files believed to share one classification.
 *
 * At most one session is active at any time. A session ends explicitly or
 * once no file has been added for longer than timeoutSeconds.
 */
SAZMAN_MODULE_EXPORT struct DownloadSession {

    //!< @brief Store-assigned identifier (0 until persisted).
    int id = 0;

    //!< @brief Detected group/channel name.
    QString groupName;

    //!< @brief When the session started.
    QDateTime startTime;

    //!< @brief When the session ended, if it did.
    std::optional<QDateTime> endTime;

    //!< @brief Last time a file was added or the session was reused.
    QDateTime lastActivity;

    //!< @brief Inactivity timeout in seconds.
    int timeoutSeconds = 30;

    //!< @brief Confidence in the group name (1.0 = source window was focused).
    double confidenceScore = 1.0;

    //!< @brief Number of distinct files in the session.
    int fileCount = 0;

    //!< @brief Whether the session still accepts files.
    bool isActive = true;

    //!< @brief Distinct file names added to the session.
    QStringList fileNames;

    //!< @brief Window title observed when the session was created.
    QString windowTitle;

    //!< @brief Process name observed when the session was created.
    QString processName;

    /**
     * @brief Checks whether the session exceeded its inactivity timeout.
     * @param now Reference time.
     * @return true if active and idle for more than timeoutSeconds.
     */
    bool hasTimedOut(const QDateTime& now) const;

    /**
     * @brief Seconds since the last activity (never negative).
     * @param now Reference time.
     */
    double idleSeconds(const QDateTime& now) const;

    //!< @brief Refresh lastActivity.
    void touch(const QDateTime& now);

    /**
     * @brief Adds a file name; repeated names are not counted twice.
     * @param fileName File name.
     * @param now Reference time.
     * @return true if the file was new to the session.
     */
    bool addFile(const QString& fileName, const QDateTime& now);

    //!< @brief Mark the session inactive and stamp the end time.
    void end(const QDateTime& now);
};

/**
 * @brief One file recorded against a session.
 */
SAZMAN_MODULE_EXPORT struct SessionFile {
    QString fileName;       //!< File name.
    QString filePath;       //!< Full path, if known.
    qint64 fileSize = 0;    //!< Size in bytes, 0 if unknown.
    QDateTime addedAt;      //!< When the file joined the session.
};

/**
 * @brief A cached window of the source application.
 *
 * Entries are keyed by the platform window id. Confidence reflects the focus
 * state at the last scan and is decayed by age when turned into a signal.
 */
SAZMAN_MODULE_EXPORT struct WindowCandidate {

    //!< @brief Platform window handle or id.
    QString id;

    //!< @brief Last observed title.
    QString title;

    //!< @brief Owning process name.
    QString processName;

    //!< @brief Whether the window had input focus at the last scan.
    bool isActive = false;

    //!< @brief When the window was first seen.
    QDateTime firstSeen;

    //!< @brief When the window was last seen.
    QDateTime lastSeen;

    //!< @brief 1.0 when focused at the last scan, 0.7 when only visible.
    double confidenceScore = 1.0;

    //!< @brief Group name extracted from the title, empty until extracted.
    QString extractedGroupName;

    //!< @brief Number of scans that reported this window.
    int seenCount = 1;

    /**
     * @brief Seconds since the window was last seen (never negative).
     * @param now Reference time.
     */
    double ageSeconds(const QDateTime& now) const;

    /**
     * @brief Checks whether the window was not seen for timeoutSeconds.
     */
    bool isExpired(int timeoutSeconds, const QDateTime& now) const;

    //!< @brief Diagnostic rendering for logs.
    QString toString(const QDateTime& now) const;
};

/**
 * @brief A learned association between file traits and a group.
 *
 * Every criterion that is present must hold for the pattern to match.
 * Confidence is the observed accuracy timesCorrect / timesSeen.
 */
SAZMAN_MODULE_EXPORT struct FilePattern {

    //!< @brief Store-assigned identifier (0 until persisted).
    int id = 0;

    //!< @brief File extension including the dot (".pdf").
    std::optional<QString> extension;

    //!< @brief Case-insensitive substring of the file name.
    std::optional<QString> namePattern;

    //!< @brief Hour of day (0-23).
    std::optional<int> hourOfDay;

    //!< @brief Day of week (0 = Sunday, 6 = Saturday).
    std::optional<int> dayOfWeek;

    //!< @brief Predicted group name.
    QString groupName;

    //!< @brief Observed accuracy (0.0 - 1.0).
    double confidenceScore = 0.0;

    //!< @brief Number of observations.
    int timesSeen = 0;

    //!< @brief Number of correct predictions.
    int timesCorrect = 0;

    //!< @brief When the pattern was first learned.
    QDateTime firstSeen;

    //!< @brief When the pattern was last observed.
    QDateTime lastSeen;

    /**
     * @brief Checks whether the pattern applies to a file.
     * @param fileName File name.
     * @param fileExtension Extension including the dot.
     * @param time Observation time.
     */
    bool matches(const QString& fileName, const QString& fileExtension, const QDateTime& time) const;

    /**
     * @brief Records one more observation and recomputes the accuracy.
     * @param wasCorrect Whether the prediction was correct.
     * @param now Reference time.
     */
    void recordOutcome(bool wasCorrect, const QDateTime& now);

    //!< @brief Human readable description of the criteria.
    QString description() const;
};

/**
 * @brief Snapshot of the burst detector's rolling window.
 */
SAZMAN_MODULE_EXPORT struct BurstStatus {

    //!< @brief Whether a burst is in progress.
    bool isActive = false;

    //!< @brief Number of events retained in the window.
    int fileCount = 0;

    //!< @brief Start of the burst, or of the earliest retained event.
    std::optional<QDateTime> burstStartTime;

    //!< @brief Time of the most recent retained event.
    std::optional<QDateTime> lastFileTime;

    //!< @brief File names of the retained events, oldest first.
    QStringList fileNames;

    //!< @brief File count at which confidence saturates.
    int saturationCount = 10;

    //!< @brief Seconds between burst start and the last file.
    double durationSeconds() const;

    //!< @brief Average seconds between consecutive files.
    double averageIntervalSeconds() const;

    /**
     * @brief Confidence that this is a genuine batch (0.0 - 1.0).
     *
     * Mean of a file-count score saturating at saturationCount and an
     * interval score favouring short gaps between files.
     */
    double confidence() const;

    //!< @brief Diagnostic rendering for logs.
    QString toString() const;
};
