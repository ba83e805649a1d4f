/*!
 * @file        contextsignal.cppm
 * @brief       Context signals and multi-source detection results.
 * @details     A ContextSignal is one source's vote for a group name. The
 *              fusion engine collects at most one signal per source, weighs
 *              them and reports the outcome as a DetectionResult together with
 *              the per-source breakdown used for diagnostics.
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
#include <QMap>
#include <QString>

#ifndef Q_MOC_RUN
export module sazman.core.contextsignal;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief Origin of a context signal.
 */
SAZMAN_MODULE_EXPORT enum class SignalSource {
    Foreground,   //!< Currently focused source-application window
    Background,   //!< Recently seen window from the background cache
    Session,      //!< Active download session
    Pattern       //!< Learned historical pattern
};

/**
 * @brief Returns a stable display name for a signal source.
 */
SAZMAN_MODULE_EXPORT QString signalSourceName(SignalSource source);

/**
 * @brief One source's vote for a context.
 */
SAZMAN_MODULE_EXPORT struct ContextSignal {

    //!< @brief Where the vote came from.
    SignalSource source = SignalSource::Foreground;

    //!< @brief Detected group name.
    QString detectedContext;

    //!< @brief Effective weight (possibly adjusted by the boost policy).
    double weight = 0.0;

    //!< @brief Configured weight before any adjustment.
    double originalWeight = 0.0;

    //!< @brief Confidence of the source in its vote (0.0 - 1.0).
    double confidence = 0.0;

    //!< @brief When the signal was collected.
    QDateTime timestamp;

    //!< @brief Whether the boost policy increased the weight.
    bool wasBoosted = false;

    //!< @brief Free-form diagnostic text.
    QString metadata;

    /**
     * @brief Weight multiplied by confidence.
     */
    double votingPower() const;

    /**
     * @brief A signal votes only with a real context and positive weight
     *        and confidence.
     */
    bool isValid() const;

    QString toString() const;
};

/**
 * @brief Outcome of one multi-source detection.
 */
SAZMAN_MODULE_EXPORT struct DetectionResult {

    //!< @brief Winning context, or the "Unsorted" sentinel.
    QString detectedContext;

    //!< @brief Confidence in the winner (0.0 - 1.0).
    double overallConfidence = 0.0;

    //!< @brief Every collected signal, in collection order.
    QList<ContextSignal> contextSignals;

    //!< @brief Voting power per source.
    QMap<SignalSource, double> signalBreakdown;

    //!< @brief Total voting power of the winner.
    double winningScore = 0.0;

    //!< @brief Wall time spent detecting.
    qint64 detectionDurationMs = 0;

    //!< @brief Whether the session priority boost was applied.
    bool boostApplied = false;

    //!< @brief Why the boost was applied.
    std::optional<QString> boostReason;

    /**
     * @brief True when more than one collected signal agrees on the winner.
     */
    bool hasConsensus() const;

    /**
     * @brief Number of collected signals that are valid.
     */
    int validSignalCount() const;

    QString toString() const;
};
