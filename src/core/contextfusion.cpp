module;
#include <algorithm>
#include <cmath>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <QDateTime>
#include <QDebug>
#include <QElapsedTimer>
#include <QFuture>
#include <QList>
#include <QMap>
#include <QMutexLocker>
#include <QSemaphore>
#include <QString>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

module sazman.core.contextfusion;

import sazman.utils.title_utils;

namespace {

constexpr double kForegroundConfidence = 0.95;
constexpr int kBackgroundWindowSeconds = 60;
constexpr double kScoreEpsilon = 1e-9;

/**
 * @brief Shared state between a caller and a lookup running on the pool.
 *
 * The caller may give up waiting; the worker keeps the slot alive until it
 * finishes.
 */
template <typename T>
struct LookupSlot {
    QSemaphore done;
    std::optional<T> value;
    std::optional<std::string> error;
};

/**
 * @brief Runs a store lookup with an upper bound on the wait.
 * @param pool Pool to run on.
 * @param timeoutMs Wait bound; 0 runs the lookup on the calling thread.
 * @param what Lookup name for diagnostics.
 * @param lookup Callable returning std::optional<T>.
 * @return The lookup's answer, or empty on failure or timeout.
 */
template <typename T, typename Lookup>
std::optional<T> boundedLookup(QThreadPool& pool, int timeoutMs, const char* what, Lookup lookup)
{
    if (timeoutMs <= 0) {
        try {
            return lookup();
        } catch (const std::exception& e) {
            qDebug() << "Fusion:" << what << "lookup failed:" << e.what();
            return std::nullopt;
        }
    }

    auto slot = std::make_shared<LookupSlot<T>>();
    QFuture<void> task = QtConcurrent::run(&pool, [slot, lookup]() {
        try {
            slot->value = lookup();
        } catch (const std::exception& e) {
            slot->error = e.what();
        }
        slot->done.release();
    });
    Q_UNUSED(task)

    if (!slot->done.tryAcquire(1, timeoutMs)) {
        qDebug() << "Fusion:" << what << "lookup exceeded" << timeoutMs << "ms";
        return std::nullopt;
    }
    if (slot->error) {
        qDebug() << "Fusion:" << what << "lookup failed:" << slot->error->c_str();
        return std::nullopt;
    }
    return slot->value;
}

bool isUnitInterval(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

ContextFusionEngine::ContextFusionEngine(ForegroundProvider* foreground,
                                         WindowTracker* tracker,
                                         PatternStore* patterns,
                                         SessionManager* sessions,
                                         QObject* parent)
    : QObject(parent)
    , m_foreground(foreground)
    , m_tracker(tracker)
    , m_patterns(patterns)
    , m_sessions(sessions)
{
    if (!m_foreground) throw std::invalid_argument("ContextFusionEngine requires a foreground provider");
    if (!m_tracker) throw std::invalid_argument("ContextFusionEngine requires a window tracker");
    if (!m_patterns) throw std::invalid_argument("ContextFusionEngine requires a pattern store");
    if (!m_sessions) throw std::invalid_argument("ContextFusionEngine requires a session manager");

    m_lookupPool.setMaxThreadCount(4);
}

ContextFusionEngine::~ContextFusionEngine()
{
    m_lookupPool.waitForDone();
}

ContextFusionEngine::Config ContextFusionEngine::config() const
{
    QMutexLocker locker(&m_mutex);
    return m_config;
}

QString ContextFusionEngine::detect(const QString& fileName, const QDateTime& time)
{
    return detectWithDetails(fileName, time).detectedContext;
}

DetectionResult ContextFusionEngine::detectWithDetails(const QString& fileName, const QDateTime& time)
{
    QElapsedTimer timer;
    timer.start();

    DetectionResult result;
    result.detectedContext = sazman::utils::unsortedContext();

    try {
        const Config cfg = config();
        QList<ContextSignal> signalList = collect(fileName, time, cfg);

        if (signalList.isEmpty()) {
            qDebug() << "Fusion: no usable signals for" << fileName;
        } else {
            const std::optional<QString> reason = applySessionBoost(signalList, cfg);
            result = vote(signalList);
            if (reason) {
                result.boostApplied = true;
                result.boostReason = reason;
            }
        }
    } catch (const std::exception& e) {
        qWarning() << "Fusion: detection failed for" << fileName << ":" << e.what();
        result = DetectionResult();
        result.detectedContext = sazman::utils::unsortedContext();
    }

    result.detectionDurationMs = timer.elapsed();
    qDebug().noquote() << "Fusion:" << fileName << "->" << result.detectedContext
                       << QStringLiteral("(%1)").arg(result.overallConfidence, 0, 'f', 2);

    record(result);
    emit contextDetected(result);
    return result;
}

QList<ContextSignal> ContextFusionEngine::collectAllSignals(const QString& fileName, const QDateTime& time)
{
    return collect(fileName, time, config());
}

QList<ContextSignal> ContextFusionEngine::collect(const QString& fileName, const QDateTime& time, const Config& cfg)
{
    QList<ContextSignal> collected;
    const auto keep = [&](std::optional<ContextSignal> signal) {
        if (!signal) return;
        if (!signal->isValid()) return;
        if (signal->confidence < cfg.minimumConfidenceThreshold) {
            qDebug() << "Fusion:" << signalSourceName(signal->source) << "signal below threshold"
                     << signal->confidence;
            return;
        }
        collected.append(*signal);
    };

    keep(foregroundSignal(time, cfg));
    keep(backgroundSignal(time, cfg));
    keep(sessionSignal(time, cfg));
    keep(patternSignal(fileName, time, cfg));
    return collected;
}

std::optional<ContextSignal> ContextFusionEngine::foregroundSignal(const QDateTime& time, const Config& cfg)
{
    QString title;
    QString process;
    try {
        title = m_foreground->activeTitle();
        process = m_foreground->activeProcessName();
    } catch (const std::exception& e) {
        qDebug() << "Fusion: foreground provider failed:" << e.what();
        return std::nullopt;
    }

    if (!sazman::utils::isSourceWindow(title, process, cfg.sourceApplication)) {
        qDebug() << "Fusion: foreground is not" << cfg.sourceApplication << "(" << process << ")";
        return std::nullopt;
    }

    const QString group = sazman::utils::extractGroupName(title, cfg.sourceApplication);
    if (group == sazman::utils::unsortedContext()) return std::nullopt;

    ContextSignal signal;
    signal.source = SignalSource::Foreground;
    signal.detectedContext = group;
    signal.weight = cfg.foregroundWeight;
    signal.originalWeight = cfg.foregroundWeight;
    signal.confidence = kForegroundConfidence;
    signal.timestamp = time;
    signal.metadata = QStringLiteral("title: %1").arg(title);
    return signal;
}

std::optional<ContextSignal> ContextFusionEngine::backgroundSignal(const QDateTime& time, const Config& cfg)
{
    std::optional<RecentGroup> recent;
    try {
        recent = m_tracker->bestRecentGroupName(time, kBackgroundWindowSeconds);
    } catch (const std::exception& e) {
        qDebug() << "Fusion: background lookup failed:" << e.what();
        return std::nullopt;
    }
    if (!recent) return std::nullopt;

    const double age = std::max(0.0, static_cast<double>(recent->lastSeen.msecsTo(time)) / 1000.0);
    const double decay = std::max(0.0, 1.0 - age / cfg.maxSignalAgeSeconds);

    ContextSignal signal;
    signal.source = SignalSource::Background;
    signal.detectedContext = recent->groupName;
    signal.weight = cfg.backgroundWeight;
    signal.originalWeight = cfg.backgroundWeight;
    signal.confidence = recent->confidence * decay;
    signal.timestamp = time;
    signal.metadata = QStringLiteral("age: %1s").arg(age, 0, 'f', 1);
    return signal;
}

std::optional<ContextSignal> ContextFusionEngine::sessionSignal(const QDateTime& time, const Config& cfg)
{
    SessionManager* sessions = m_sessions;
    const std::optional<DownloadSession> session = boundedLookup<DownloadSession>(
        m_lookupPool, cfg.storeTimeoutMs, "session", [sessions]() { return sessions->active(); });
    if (!session || !session->isActive) return std::nullopt;

    const double idle = session->idleSeconds(time);
    const double span = 2.0 * std::max(1, session->timeoutSeconds);
    const double penalty = std::max(0.0, 1.0 - idle / span);

    ContextSignal signal;
    signal.source = SignalSource::Session;
    signal.detectedContext = session->groupName;
    signal.weight = cfg.sessionWeight;
    signal.originalWeight = cfg.sessionWeight;
    signal.confidence = std::clamp(session->confidenceScore * penalty, 0.0, 1.0);
    signal.timestamp = time;
    signal.metadata = QStringLiteral("session #%1, %2 files, idle %3s")
                          .arg(session->id)
                          .arg(session->fileCount)
                          .arg(idle, 0, 'f', 1);
    return signal;
}

std::optional<ContextSignal> ContextFusionEngine::patternSignal(const QString& fileName, const QDateTime& time, const Config& cfg)
{
    PatternStore* patterns = m_patterns;
    const QString extension = sazman::utils::fileExtension(fileName);
    const std::optional<FilePattern> pattern = boundedLookup<FilePattern>(
        m_lookupPool, cfg.storeTimeoutMs, "pattern",
        [patterns, fileName, extension, time]() { return patterns->bestPattern(fileName, extension, time); });
    if (!pattern) return std::nullopt;

    const double bonus = std::min(0.1, pattern->timesSeen / 100.0);

    ContextSignal signal;
    signal.source = SignalSource::Pattern;
    signal.detectedContext = pattern->groupName;
    signal.weight = cfg.patternWeight;
    signal.originalWeight = cfg.patternWeight;
    signal.confidence = std::min(1.0, pattern->confidenceScore + bonus);
    signal.timestamp = time;
    signal.metadata = QStringLiteral("%1, seen %2x").arg(pattern->description()).arg(pattern->timesSeen);
    return signal;
}

std::optional<QString> ContextFusionEngine::applySessionBoost(QList<ContextSignal>& signalList, const Config& cfg) const
{
    if (!cfg.useSessionPriorityBoost) return std::nullopt;

    const auto sessionIt = std::find_if(signalList.cbegin(), signalList.cend(), [](const ContextSignal& s) {
        return s.source == SignalSource::Session && s.isValid();
    });
    if (sessionIt == signalList.cend()) return std::nullopt;
    const QString sessionContext = sessionIt->detectedContext;

    const auto foregroundIt = std::find_if(signalList.cbegin(), signalList.cend(), [](const ContextSignal& s) {
        return s.source == SignalSource::Foreground && s.isValid();
    });

    QString reason;
    if (foregroundIt == signalList.cend()) {
        reason = QStringLiteral("Foreground signal missing; session '%1' takes priority").arg(sessionContext);
    } else if (foregroundIt->votingPower() < cfg.foregroundWeakThreshold) {
        reason = QStringLiteral("Foreground signal weak (%1 < %2); session '%3' takes priority")
                     .arg(foregroundIt->votingPower(), 0, 'f', 3)
                     .arg(cfg.foregroundWeakThreshold, 0, 'f', 2)
                     .arg(sessionContext);
    } else {
        if (foregroundIt->detectedContext.compare(sessionContext, Qt::CaseInsensitive) != 0) {
            qDebug() << "Fusion: foreground" << foregroundIt->detectedContext
                     << "differs from session" << sessionContext << "; treating as a new batch";
        }
        return std::nullopt;
    }

    for (ContextSignal& signal : signalList) {
        if (signal.source == SignalSource::Session) {
            signal.weight = signal.originalWeight * cfg.sessionBoostMultiplier;
            signal.wasBoosted = true;
        } else {
            signal.weight *= cfg.otherSignalsDampening;
        }
    }

    qInfo().noquote() << "Session priority boost:" << reason;
    return reason;
}

DetectionResult ContextFusionEngine::vote(const QList<ContextSignal>& signalList) const
{
    DetectionResult result;
    result.detectedContext = sazman::utils::unsortedContext();
    result.contextSignals = signalList;

    QMap<QString, double> totals;
    QMap<QString, double> strongest;
    for (const ContextSignal& signal : signalList) {
        result.signalBreakdown[signal.source] += signal.votingPower();
        if (!signal.isValid()) continue;
        totals[signal.detectedContext] += signal.votingPower();
        strongest[signal.detectedContext] = std::max(strongest.value(signal.detectedContext), signal.confidence);
    }
    if (totals.isEmpty()) return result;

    // QMap iterates in key order, so the first of several exact ties is the
    // lexicographically smallest name.
    QString winner;
    double best = -1.0;
    for (auto it = totals.cbegin(); it != totals.cend(); ++it) {
        const double total = it.value();
        if (winner.isEmpty() || total > best + kScoreEpsilon) {
            winner = it.key();
            best = total;
        } else if (std::abs(total - best) <= kScoreEpsilon
                   && strongest.value(it.key()) > strongest.value(winner)) {
            winner = it.key();
            best = total;
        }
    }

    double confidenceSum = 0.0;
    int agreeing = 0;
    int disagreeing = 0;
    for (const ContextSignal& signal : signalList) {
        if (!signal.isValid()) continue;
        if (signal.detectedContext == winner) {
            confidenceSum += signal.confidence;
            ++agreeing;
        } else {
            ++disagreeing;
        }
    }

    double confidence = agreeing > 0 ? confidenceSum / agreeing : 0.0;
    if (agreeing > 1) confidence += 0.1;
    confidence -= 0.05 * disagreeing;

    result.detectedContext = winner;
    result.winningScore = best;
    result.overallConfidence = std::clamp(confidence, 0.0, 1.0);
    return result;
}

void ContextFusionEngine::record(const DetectionResult& result)
{
    QMutexLocker locker(&m_mutex);
    ++m_totalDetections;
    if (result.hasConsensus()) ++m_consensusDetections;
    if (result.boostApplied) ++m_sessionBoostCount;
    m_totalDetectionMs += static_cast<double>(result.detectionDurationMs);
    m_lastResult = result;
}

void ContextFusionEngine::recordFeedback(const QString& fileName,
                                         const QString& detectedContext,
                                         const std::optional<QString>& actualContext,
                                         bool wasCorrect,
                                         const QDateTime& now)
{
    const QString extension = sazman::utils::fileExtension(fileName);
    if (extension.isEmpty()) {
        qDebug() << "Fusion: no extension on" << fileName << "; feedback not learned";
        return;
    }

    QString group = detectedContext;
    if (!wasCorrect && actualContext && !actualContext->trimmed().isEmpty()) group = actualContext->trimmed();
    if (group.trimmed().isEmpty() || group == sazman::utils::unsortedContext()) return;

    FilePattern pattern;
    pattern.extension = extension;
    pattern.groupName = group;
    pattern.confidenceScore = wasCorrect ? 0.6 : 0.4;
    pattern.timesSeen = 1;
    pattern.timesCorrect = wasCorrect ? 1 : 0;
    pattern.firstSeen = now;
    pattern.lastSeen = now;

    try {
        const int id = m_patterns->savePattern(pattern);
        qDebug() << "Fusion: learned pattern" << id << extension << "->" << group;
    } catch (const std::exception& e) {
        qWarning() << "Fusion: failed to save feedback pattern:" << e.what();
    }
}

int ContextFusionEngine::totalDetections() const
{
    QMutexLocker locker(&m_mutex);
    return m_totalDetections;
}

int ContextFusionEngine::consensusDetections() const
{
    QMutexLocker locker(&m_mutex);
    return m_consensusDetections;
}

double ContextFusionEngine::averageDetectionTimeMs() const
{
    QMutexLocker locker(&m_mutex);
    return m_totalDetections > 0 ? m_totalDetectionMs / m_totalDetections : 0.0;
}

int ContextFusionEngine::sessionBoostCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_sessionBoostCount;
}

void ContextFusionEngine::resetStatistics()
{
    QMutexLocker locker(&m_mutex);
    m_totalDetections = 0;
    m_consensusDetections = 0;
    m_totalDetectionMs = 0.0;
    m_sessionBoostCount = 0;
}

std::optional<DetectionResult> ContextFusionEngine::lastResult() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastResult;
}

double ContextFusionEngine::lastConfidenceScore() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastResult ? m_lastResult->overallConfidence : 0.0;
}

QMap<SignalSource, double> ContextFusionEngine::lastSignalBreakdown() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastResult ? m_lastResult->signalBreakdown : QMap<SignalSource, double>();
}

QList<ContextSignal> ContextFusionEngine::lastSignals() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastResult ? m_lastResult->contextSignals : QList<ContextSignal>();
}

void ContextFusionEngine::setUnit(double& field, double value, const char* name)
{
    if (!isUnitInterval(value)) {
        qWarning() << "Fusion: rejected" << name << value << "keeping" << field;
        return;
    }
    field = value;
}

double ContextFusionEngine::foregroundWeight() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.foregroundWeight;
}

void ContextFusionEngine::setForegroundWeight(double weight)
{
    QMutexLocker locker(&m_mutex);
    setUnit(m_config.foregroundWeight, weight, "foreground weight");
}

double ContextFusionEngine::backgroundWeight() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.backgroundWeight;
}

void ContextFusionEngine::setBackgroundWeight(double weight)
{
    QMutexLocker locker(&m_mutex);
    setUnit(m_config.backgroundWeight, weight, "background weight");
}

double ContextFusionEngine::sessionWeight() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.sessionWeight;
}

void ContextFusionEngine::setSessionWeight(double weight)
{
    QMutexLocker locker(&m_mutex);
    setUnit(m_config.sessionWeight, weight, "session weight");
}

double ContextFusionEngine::patternWeight() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.patternWeight;
}

void ContextFusionEngine::setPatternWeight(double weight)
{
    QMutexLocker locker(&m_mutex);
    setUnit(m_config.patternWeight, weight, "pattern weight");
}

double ContextFusionEngine::minimumConfidenceThreshold() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.minimumConfidenceThreshold;
}

void ContextFusionEngine::setMinimumConfidenceThreshold(double threshold)
{
    QMutexLocker locker(&m_mutex);
    setUnit(m_config.minimumConfidenceThreshold, threshold, "minimum confidence");
}

int ContextFusionEngine::maxSignalAgeSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.maxSignalAgeSeconds;
}

void ContextFusionEngine::setMaxSignalAgeSeconds(int seconds)
{
    QMutexLocker locker(&m_mutex);
    if (seconds < 1 || seconds > 3600) {
        qWarning() << "Fusion: rejected max signal age" << seconds << "keeping" << m_config.maxSignalAgeSeconds;
        return;
    }
    m_config.maxSignalAgeSeconds = seconds;
}

bool ContextFusionEngine::useSessionPriorityBoost() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.useSessionPriorityBoost;
}

void ContextFusionEngine::setUseSessionPriorityBoost(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_config.useSessionPriorityBoost = enabled;
}

double ContextFusionEngine::foregroundWeakThreshold() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.foregroundWeakThreshold;
}

void ContextFusionEngine::setForegroundWeakThreshold(double threshold)
{
    QMutexLocker locker(&m_mutex);
    setUnit(m_config.foregroundWeakThreshold, threshold, "foreground weak threshold");
}

double ContextFusionEngine::sessionBoostMultiplier() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.sessionBoostMultiplier;
}

void ContextFusionEngine::setSessionBoostMultiplier(double multiplier)
{
    QMutexLocker locker(&m_mutex);
    if (!std::isfinite(multiplier) || multiplier < 1.0 || multiplier > 10.0) {
        qWarning() << "Fusion: rejected boost multiplier" << multiplier << "keeping" << m_config.sessionBoostMultiplier;
        return;
    }
    m_config.sessionBoostMultiplier = multiplier;
}

double ContextFusionEngine::otherSignalsDampening() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.otherSignalsDampening;
}

void ContextFusionEngine::setOtherSignalsDampening(double dampening)
{
    QMutexLocker locker(&m_mutex);
    setUnit(m_config.otherSignalsDampening, dampening, "dampening");
}

int ContextFusionEngine::storeTimeoutMs() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.storeTimeoutMs;
}

void ContextFusionEngine::setStoreTimeoutMs(int timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    if (timeoutMs < 0 || timeoutMs > 10000) {
        qWarning() << "Fusion: rejected store timeout" << timeoutMs << "keeping" << m_config.storeTimeoutMs;
        return;
    }
    m_config.storeTimeoutMs = timeoutMs;
}

QString ContextFusionEngine::sourceApplication() const
{
    QMutexLocker locker(&m_mutex);
    return m_config.sourceApplication;
}

void ContextFusionEngine::setSourceApplication(const QString& applicationName)
{
    const QString name = applicationName.trimmed();
    QMutexLocker locker(&m_mutex);
    if (name.isEmpty()) {
        qWarning() << "Fusion: rejected empty source application";
        return;
    }
    m_config.sourceApplication = name;
}
