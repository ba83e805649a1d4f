#include <exception>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QSet>
#include <QSettings>
#include <QStandardPaths>
#include <QTimer>

import sazman.core.burstdetector;
import sazman.core.contextfusion;
import sazman.core.contextsignal;
import sazman.core.models;
import sazman.core.sessionmanager;
import sazman.core.settings;
import sazman.core.windowtracker;
import sazman.services.desktop_windows;
import sazman.services.pattern_store;
import sazman.services.session_store;
import sazman.utils.title_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

static bool isIncompleteDownload(const QFileInfo& info)
{
    static const QStringList partialSuffixes = {
        QStringLiteral("part"), QStringLiteral("crdownload"), QStringLiteral("tmp"), QStringLiteral("download")
    };
    return info.fileName().startsWith(QLatin1Char('.'))
           || partialSuffixes.contains(info.suffix(), Qt::CaseInsensitive);
}

static QSet<QString> listFiles(const QDir& dir)
{
    QSet<QString> names;
    const QStringList entries = dir.entryList(QDir::Files | QDir::NoDotAndDotDot);
    for (const QString& name : entries) names.insert(name);
    return names;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Sazman"));
    QCoreApplication::setApplicationName(QStringLiteral("Sazman"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Classifies new downloads by the chat they came from."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption watchOption({ QStringLiteral("w"), QStringLiteral("watch") },
                                         QStringLiteral("Directory to watch for new downloads."),
                                         QStringLiteral("dir"),
                                         QStandardPaths::writableLocation(QStandardPaths::DownloadLocation));
    const QCommandLineOption dataOption({ QStringLiteral("d"), QStringLiteral("data") },
                                        QStringLiteral("Directory for the pattern and session stores."),
                                        QStringLiteral("dir"),
                                        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    const QCommandLineOption appOption({ QStringLiteral("a"), QStringLiteral("app") },
                                       QStringLiteral("Source application name (overrides settings)."),
                                       QStringLiteral("name"));
    const QCommandLineOption memoryOption(QStringLiteral("in-memory"),
                                          QStringLiteral("Keep patterns and sessions in memory only."));
    parser.addOption(watchOption);
    parser.addOption(dataOption);
    parser.addOption(appOption);
    parser.addOption(memoryOption);
    parser.process(app);

    const QDir watchDir(parser.value(watchOption));
    if (!watchDir.exists()) {
        qCritical() << "Watch directory does not exist:" << watchDir.absolutePath();
        return 1;
    }

    const bool inMemory = parser.isSet(memoryOption);
    const QDir dataDir(parser.value(dataOption));
    JsonPatternStore patternStore(inMemory ? QString() : dataDir.filePath(QStringLiteral("patterns.json")));
    JsonSessionStore sessionStore(inMemory ? QString() : dataDir.filePath(QStringLiteral("sessions.json")));

    DesktopWindowProvider desktop;
    if (!desktop.isSupported()) {
        qWarning() << "Window tools not available; running on session and pattern signals only";
    }

    BurstDetector burst;
    WindowTracker tracker(&desktop);
    SessionManager sessions(&sessionStore);
    ContextFusionEngine engine(&desktop, &tracker, &patternStore, &sessions);

    QSettings settings;
    DetectionSettings values = loadDetectionSettings(settings);
    if (parser.isSet(appOption)) values.sourceApplication = parser.value(appOption);
    applyDetectionSettings(values, burst, tracker, sessions, engine);
    saveDetectionSettings(settings, values);

    const int removed = sessions.deleteOldSessions(values.sessionRetentionDays);
    if (removed > 0) qInfo() << "Pruned" << removed << "sessions older than" << values.sessionRetentionDays << "days";

    QObject::connect(&burst, &BurstDetector::burstEnded, [](const BurstStatus& status) {
        qInfo().noquote() << "Batch finished:" << status.toString();
    });
    QObject::connect(&sessions, &SessionManager::sessionTimedOut, [](const DownloadSession& session) {
        qInfo().noquote() << "Session for" << session.groupName << "closed after" << session.fileCount << "files";
    });

    QSet<QString> knownFiles = listFiles(watchDir);

    const auto handleNewFile = [&](const QFileInfo& info) {
        const QDateTime now = QDateTime::currentDateTime();
        const QString name = info.fileName();

        const bool partOfBurst = burst.isBurst(name, now);
        burst.record(name, now);

        const DetectionResult result = engine.detectWithDetails(name, now);
        qInfo().noquote() << name << "->" << result.detectedContext
                          << QStringLiteral("(confidence %1%2)")
                                 .arg(result.overallConfidence, 0, 'f', 2)
                                 .arg(partOfBurst ? QStringLiteral(", batch") : QString());
        qDebug().noquote() << result.toString();

        if (result.detectedContext == sazman::utils::unsortedContext()) return;
        try {
            sessions.addFile(name, result.detectedContext, info.absoluteFilePath(), info.size(), now);
        } catch (const std::exception& e) {
            qWarning() << "Could not record" << name << "in the session store:" << e.what();
        }
    };

    QFileSystemWatcher watcher;
    watcher.addPath(watchDir.absolutePath());
    QObject::connect(&watcher, &QFileSystemWatcher::directoryChanged, [&](const QString&) {
        const QSet<QString> current = listFiles(watchDir);
        for (const QString& name : current) {
            if (knownFiles.contains(name)) continue;
            const QFileInfo info(watchDir.filePath(name));
            if (isIncompleteDownload(info)) continue;
            knownFiles.insert(name);
            handleNewFile(info);
        }
        knownFiles.intersect(current);
    });

    QTimer burstSweep;
    burstSweep.setInterval(1000);
    QObject::connect(&burstSweep, &QTimer::timeout, [&burst]() { burst.sweep(QDateTime::currentDateTime()); });
    burstSweep.start();

    tracker.start();
    sessions.startSweeping(values.sessionSweepIntervalMs);

    qInfo() << "Watching" << watchDir.absolutePath() << "for" << values.sourceApplication << "downloads";
    return app.exec();
}
