module;
#include <QSettings>
#include <QString>

module sazman.core.settings;

static QString settingsGroup()
{
    return QStringLiteral("detection");
}

DetectionSettings loadDetectionSettings(QSettings& settings)
{
    DetectionSettings v;
    settings.beginGroup(settingsGroup());
    v.sourceApplication = settings.value(QStringLiteral("sourceApplication"), v.sourceApplication).toString().trimmed();
    if (v.sourceApplication.isEmpty()) v.sourceApplication = DetectionSettings().sourceApplication;

    v.foregroundWeight = settings.value(QStringLiteral("foregroundWeight"), v.foregroundWeight).toDouble();
    v.backgroundWeight = settings.value(QStringLiteral("backgroundWeight"), v.backgroundWeight).toDouble();
    v.sessionWeight = settings.value(QStringLiteral("sessionWeight"), v.sessionWeight).toDouble();
    v.patternWeight = settings.value(QStringLiteral("patternWeight"), v.patternWeight).toDouble();
    v.minimumConfidenceThreshold = settings.value(QStringLiteral("minimumConfidenceThreshold"), v.minimumConfidenceThreshold).toDouble();
    v.maxSignalAgeSeconds = settings.value(QStringLiteral("maxSignalAgeSeconds"), v.maxSignalAgeSeconds).toInt();
    v.useSessionPriorityBoost = settings.value(QStringLiteral("useSessionPriorityBoost"), v.useSessionPriorityBoost).toBool();
    v.foregroundWeakThreshold = settings.value(QStringLiteral("foregroundWeakThreshold"), v.foregroundWeakThreshold).toDouble();
    v.sessionBoostMultiplier = settings.value(QStringLiteral("sessionBoostMultiplier"), v.sessionBoostMultiplier).toDouble();
    v.otherSignalsDampening = settings.value(QStringLiteral("otherSignalsDampening"), v.otherSignalsDampening).toDouble();
    v.storeTimeoutMs = settings.value(QStringLiteral("storeTimeoutMs"), v.storeTimeoutMs).toInt();

    v.burstThresholdSeconds = settings.value(QStringLiteral("burstThresholdSeconds"), v.burstThresholdSeconds).toInt();
    v.minimumFilesForBurst = settings.value(QStringLiteral("minimumFilesForBurst"), v.minimumFilesForBurst).toInt();
    v.maxBurstDurationSeconds = settings.value(QStringLiteral("maxBurstDurationSeconds"), v.maxBurstDurationSeconds).toInt();
    v.burstSaturationCount = settings.value(QStringLiteral("burstSaturationCount"), v.burstSaturationCount).toInt();

    v.scanIntervalMs = settings.value(QStringLiteral("scanIntervalMs"), v.scanIntervalMs).toInt();
    v.maxTrackedWindows = settings.value(QStringLiteral("maxTrackedWindows"), v.maxTrackedWindows).toInt();

    v.sessionTimeoutSeconds = settings.value(QStringLiteral("sessionTimeoutSeconds"), v.sessionTimeoutSeconds).toInt();
    v.sessionSweepIntervalMs = settings.value(QStringLiteral("sessionSweepIntervalMs"), v.sessionSweepIntervalMs).toInt();
    v.sessionRetentionDays = settings.value(QStringLiteral("sessionRetentionDays"), v.sessionRetentionDays).toInt();
    settings.endGroup();
    return v;
}

void saveDetectionSettings(QSettings& settings, const DetectionSettings& v)
{
    settings.beginGroup(settingsGroup());
    settings.setValue(QStringLiteral("sourceApplication"), v.sourceApplication);

    settings.setValue(QStringLiteral("foregroundWeight"), v.foregroundWeight);
    settings.setValue(QStringLiteral("backgroundWeight"), v.backgroundWeight);
    settings.setValue(QStringLiteral("sessionWeight"), v.sessionWeight);
    settings.setValue(QStringLiteral("patternWeight"), v.patternWeight);
    settings.setValue(QStringLiteral("minimumConfidenceThreshold"), v.minimumConfidenceThreshold);
    settings.setValue(QStringLiteral("maxSignalAgeSeconds"), v.maxSignalAgeSeconds);
    settings.setValue(QStringLiteral("useSessionPriorityBoost"), v.useSessionPriorityBoost);
    settings.setValue(QStringLiteral("foregroundWeakThreshold"), v.foregroundWeakThreshold);
    settings.setValue(QStringLiteral("sessionBoostMultiplier"), v.sessionBoostMultiplier);
    settings.setValue(QStringLiteral("otherSignalsDampening"), v.otherSignalsDampening);
    settings.setValue(QStringLiteral("storeTimeoutMs"), v.storeTimeoutMs);

    settings.setValue(QStringLiteral("burstThresholdSeconds"), v.burstThresholdSeconds);
    settings.setValue(QStringLiteral("minimumFilesForBurst"), v.minimumFilesForBurst);
    settings.setValue(QStringLiteral("maxBurstDurationSeconds"), v.maxBurstDurationSeconds);
    settings.setValue(QStringLiteral("burstSaturationCount"), v.burstSaturationCount);

    settings.setValue(QStringLiteral("scanIntervalMs"), v.scanIntervalMs);
    settings.setValue(QStringLiteral("maxTrackedWindows"), v.maxTrackedWindows);

    settings.setValue(QStringLiteral("sessionTimeoutSeconds"), v.sessionTimeoutSeconds);
    settings.setValue(QStringLiteral("sessionSweepIntervalMs"), v.sessionSweepIntervalMs);
    settings.setValue(QStringLiteral("sessionRetentionDays"), v.sessionRetentionDays);
    settings.endGroup();
}

void applyDetectionSettings(const DetectionSettings& v,
                            BurstDetector& burst,
                            WindowTracker& tracker,
                            SessionManager& sessions,
                            ContextFusionEngine& engine)
{
    engine.setSourceApplication(v.sourceApplication);
    engine.setForegroundWeight(v.foregroundWeight);
    engine.setBackgroundWeight(v.backgroundWeight);
    engine.setSessionWeight(v.sessionWeight);
    engine.setPatternWeight(v.patternWeight);
    engine.setMinimumConfidenceThreshold(v.minimumConfidenceThreshold);
    engine.setMaxSignalAgeSeconds(v.maxSignalAgeSeconds);
    engine.setUseSessionPriorityBoost(v.useSessionPriorityBoost);
    engine.setForegroundWeakThreshold(v.foregroundWeakThreshold);
    engine.setSessionBoostMultiplier(v.sessionBoostMultiplier);
    engine.setOtherSignalsDampening(v.otherSignalsDampening);
    engine.setStoreTimeoutMs(v.storeTimeoutMs);

    // Each bound is validated against the other, so the max duration is applied on both sides.
    burst.setMaxBurstDurationSeconds(v.maxBurstDurationSeconds);
    burst.setBurstThresholdSeconds(v.burstThresholdSeconds);
    burst.setMaxBurstDurationSeconds(v.maxBurstDurationSeconds);
    burst.setMinimumFilesForBurst(v.minimumFilesForBurst);
    burst.setSaturationCount(v.burstSaturationCount);

    tracker.setSourceApplication(v.sourceApplication);
    tracker.setScanIntervalMs(v.scanIntervalMs);
    tracker.setMaxTrackedWindows(v.maxTrackedWindows);

    sessions.setDefaultTimeout(v.sessionTimeoutSeconds);
}
