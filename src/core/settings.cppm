/*!
 * @file        settings.cppm
 * @brief       Persistent detection settings.
 * @details     Loads and saves every tunable of the detection pipeline from
 *              QSettings (group "detection") and applies them through the
 *              components' validating setters, so an out-of-range value in a
 *              hand-edited config file is rejected exactly like one set at
 *              runtime.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <QSettings>
#include <QString>

#ifndef Q_MOC_RUN
export module sazman.core.settings;
import sazman.core.burstdetector;
import sazman.core.contextfusion;
import sazman.core.sessionmanager;
import sazman.core.windowtracker;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief All tunables of the detection pipeline, with their defaults.
 */
SAZMAN_MODULE_EXPORT struct DetectionSettings {

    //!< @brief Application whose windows identify the source.
    QString sourceApplication = QStringLiteral("Telegram");

    // Fusion engine
    double foregroundWeight = 0.5;              //!< Foreground vote weight
    double backgroundWeight = 0.3;              //!< Background vote weight
    double sessionWeight = 0.4;                 //!< Session vote weight
    double patternWeight = 0.2;                 //!< Pattern vote weight
    double minimumConfidenceThreshold = 0.3;    //!< Floor for a signal to vote
    int maxSignalAgeSeconds = 30;               //!< Background decay horizon
    bool useSessionPriorityBoost = true;        //!< Enable the boost policy
    double foregroundWeakThreshold = 0.3;       //!< Foreground power considered weak
    double sessionBoostMultiplier = 2.0;        //!< Session weight factor when boosted
    double otherSignalsDampening = 0.5;         //!< Other weights factor when boosted
    int storeTimeoutMs = 80;                    //!< Bound on store lookups

    // Burst detector
    int burstThresholdSeconds = 5;              //!< Max gap inside a burst
    int minimumFilesForBurst = 2;               //!< Files needed for a burst
    int maxBurstDurationSeconds = 60;           //!< Hard cap on a burst
    int burstSaturationCount = 10;              //!< Files for full burst confidence

    // Window tracker
    int scanIntervalMs = 2000;                  //!< Background scan period
    int maxTrackedWindows = 20;                 //!< Cache bound

    // Session manager
    int sessionTimeoutSeconds = 30;             //!< Timeout for new sessions
    int sessionSweepIntervalMs = 5000;          //!< Timeout sweep period
    int sessionRetentionDays = 30;              //!< History kept on disk
};

/**
 * @brief Reads the "detection" group; missing keys keep their defaults.
 */
SAZMAN_MODULE_EXPORT DetectionSettings loadDetectionSettings(QSettings& settings);

/**
 * @brief Writes every value to the "detection" group.
 */
SAZMAN_MODULE_EXPORT void saveDetectionSettings(QSettings& settings, const DetectionSettings& values);

/**
 * @brief Pushes settings into the components through their validating setters.
 */
SAZMAN_MODULE_EXPORT void applyDetectionSettings(const DetectionSettings& values,
                                                 BurstDetector& burst,
                                                 WindowTracker& tracker,
                                                 SessionManager& sessions,
                                                 ContextFusionEngine& engine);
