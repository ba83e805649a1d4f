/*!
 * @file        contextfusion.cppm
 * @brief       Multi-source weighted voting for download classification.
 * @details     ContextFusionEngine decides which chat or channel a freshly
 *              downloaded file came from. It pulls one signal from each of
 *              four independent sources:
 *
 *              - Foreground: the focused source-application window
 *              - Background: recently seen windows from the WindowTracker
 *              - Session: the active download session
 *              - Pattern: learned associations from the PatternStore
 *
 *              Each signal votes with weight x confidence; the context with
 *              the largest total wins. When the foreground is missing or weak
 *              while a session is running, the Session Priority Boost lets
 *              the session carry the batch instead of whichever window the
 *              user happens to be looking at.
 *
 *              Pattern and session lookups may block on storage, so they run
 *              on the engine's own thread pool with a bounded wait. A lookup
 *              that fails or overruns simply contributes no vote.
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
#include <QMutex>
#include <QObject>
#include <QString>
#include <QThreadPool>

#ifndef Q_MOC_RUN
export module sazman.core.contextfusion;
import sazman.core.contextsignal;
import sazman.core.models;
import sazman.core.sessionmanager;
import sazman.core.windowtracker;
import sazman.services.providers;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief Orchestrates signal collection, boosting and weighted voting.
 *
 * detect() and detectWithDetails() may be called concurrently from several
 * threads. Configuration is snapshotted at the start of every detection.
 */
SAZMAN_MODULE_EXPORT class ContextFusionEngine : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Constructs the engine over its collaborators (none owned).
     * @param foreground Focused window provider.
     * @param tracker Background window cache.
     * @param patterns Learned pattern store.
     * @param sessions Session manager.
     * @param parent Optional QObject parent.
     * @throws std::invalid_argument if any collaborator is null.
     */
    ContextFusionEngine(ForegroundProvider* foreground,
                        WindowTracker* tracker,
                        PatternStore* patterns,
                        SessionManager* sessions,
                        QObject* parent = nullptr);

    ~ContextFusionEngine() override;

    /**
     * @brief Classifies a file.
     * @param fileName Downloaded file name.
     * @param time Observation time; reference for every age computation.
     * @return Winning context, or "Unsorted".
     */
    QString detect(const QString& fileName, const QDateTime& time = QDateTime::currentDateTime());

    /**
     * @brief Classifies a file and reports every step of the decision.
     *
     * Never throws; any internal failure yields an "Unsorted" result.
     */
    DetectionResult detectWithDetails(const QString& fileName,
                                      const QDateTime& time = QDateTime::currentDateTime());

    /**
     * @brief Collects the signals that would take part in a vote.
     *
     * Only valid signals at or above the minimum confidence are returned,
     * in source order (foreground, background, session, pattern). No boost
     * is applied.
     */
    QList<ContextSignal> collectAllSignals(const QString& fileName,
                                           const QDateTime& time = QDateTime::currentDateTime());

    /**
     * @brief Teaches the pattern store from a user-confirmed classification.
     *
     * Store failures are logged and never propagated.
     *
     * @param fileName File the decision was about.
     * @param detectedContext What the engine detected.
     * @param actualContext Correct context when the detection was wrong.
     * @param wasCorrect Whether the detection was right.
     * @param now Reference time.
     */
    void recordFeedback(const QString& fileName,
                        const QString& detectedContext,
                        const std::optional<QString>& actualContext,
                        bool wasCorrect,
                        const QDateTime& now = QDateTime::currentDateTime());

    // Statistics

    int totalDetections() const;
    int consensusDetections() const;
    double averageDetectionTimeMs() const;
    int sessionBoostCount() const;
    void resetStatistics();

    std::optional<DetectionResult> lastResult() const;
    double lastConfidenceScore() const;
    QMap<SignalSource, double> lastSignalBreakdown() const;
    QList<ContextSignal> lastSignals() const;

    // Configuration; invalid values are rejected with a warning.

    double foregroundWeight() const;
    void setForegroundWeight(double weight);

    double backgroundWeight() const;
    void setBackgroundWeight(double weight);

    double sessionWeight() const;
    void setSessionWeight(double weight);

    double patternWeight() const;
    void setPatternWeight(double weight);

    double minimumConfidenceThreshold() const;
    void setMinimumConfidenceThreshold(double threshold);

    int maxSignalAgeSeconds() const;
    void setMaxSignalAgeSeconds(int seconds);

    bool useSessionPriorityBoost() const;
    void setUseSessionPriorityBoost(bool enabled);

    double foregroundWeakThreshold() const;
    void setForegroundWeakThreshold(double threshold);

    double sessionBoostMultiplier() const;
    void setSessionBoostMultiplier(double multiplier);

    double otherSignalsDampening() const;
    void setOtherSignalsDampening(double dampening);

    /**
     * @brief Upper bound for each store lookup; 0 runs lookups synchronously.
     */
    int storeTimeoutMs() const;
    void setStoreTimeoutMs(int timeoutMs);

    QString sourceApplication() const;
    void setSourceApplication(const QString& applicationName);

signals:
    //!< @brief Emitted after every detection.
    void contextDetected(const DetectionResult& result);

private:
    /**
     * @brief Tunables, copied once per detection.
     */
    struct Config {
        double foregroundWeight = 0.5;
        double backgroundWeight = 0.3;
        double sessionWeight = 0.4;
        double patternWeight = 0.2;
        double minimumConfidenceThreshold = 0.3;
        int maxSignalAgeSeconds = 30;
        bool useSessionPriorityBoost = true;
        double foregroundWeakThreshold = 0.3;
        double sessionBoostMultiplier = 2.0;
        double otherSignalsDampening = 0.5;
        int storeTimeoutMs = 80;
        QString sourceApplication = QStringLiteral("Telegram");
    };

    Config config() const;
    QList<ContextSignal> collect(const QString& fileName, const QDateTime& time, const Config& cfg);
    std::optional<ContextSignal> foregroundSignal(const QDateTime& time, const Config& cfg);
    std::optional<ContextSignal> backgroundSignal(const QDateTime& time, const Config& cfg);
    std::optional<ContextSignal> sessionSignal(const QDateTime& time, const Config& cfg);
    std::optional<ContextSignal> patternSignal(const QString& fileName, const QDateTime& time, const Config& cfg);
    std::optional<QString> applySessionBoost(QList<ContextSignal>& signalList, const Config& cfg) const;
    DetectionResult vote(const QList<ContextSignal>& signalList) const;
    void record(const DetectionResult& result);
    void setUnit(double& field, double value, const char* name);

    ForegroundProvider* m_foreground;          //!< Focused window source
    WindowTracker* m_tracker;                  //!< Background window cache
    PatternStore* m_patterns;                  //!< Learned patterns
    SessionManager* m_sessions;                //!< Session lifecycle

    mutable QMutex m_mutex;                    //!< Guards config, statistics and last result
    Config m_config;                           //!< Current tunables
    int m_totalDetections = 0;                 //!< Detections performed
    int m_consensusDetections = 0;             //!< Detections with agreeing signals
    double m_totalDetectionMs = 0.0;           //!< Cumulative detection time
    int m_sessionBoostCount = 0;               //!< Detections that applied the boost
    std::optional<DetectionResult> m_lastResult;   //!< Most recent result

    QThreadPool m_lookupPool;                  //!< Runs bounded store lookups; destroyed first
};

#include "contextfusion.moc"
