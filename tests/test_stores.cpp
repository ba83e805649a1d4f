#include <QtTest/QtTest>

#include <QDateTime>
#include <QFile>
#include <QFuture>
#include <QList>
#include <QString>
#include <QTemporaryDir>

#include <optional>

#include <QtConcurrent/QtConcurrentRun>

#ifndef Q_MOC_RUN
import sazman.core.models;
import sazman.services.pattern_store;
import sazman.services.session_store;
#endif

namespace {

QDateTime baseTime()
{
    return QDateTime(QDate(2026, 3, 14), QTime(10, 0, 0));
}

QDateTime at(int seconds)
{
    return baseTime().addSecs(seconds);
}

FilePattern pattern(const QString& group, double confidence, int timesSeen)
{
    FilePattern p;
    p.extension = QStringLiteral(".pdf");
    p.groupName = group;
    p.confidenceScore = confidence;
    p.timesSeen = timesSeen;
    p.timesCorrect = timesSeen;
    p.firstSeen = baseTime();
    p.lastSeen = baseTime();
    return p;
}

DownloadSession session(const QString& group, const QDateTime& start, int timeoutSeconds = 30)
{
    DownloadSession s;
    s.groupName = group;
    s.startTime = start;
    s.lastActivity = start;
    s.timeoutSeconds = timeoutSeconds;
    return s;
}

} // namespace

class TestStores : public QObject {
    Q_OBJECT

private slots:
    void testPatternIdsAndReplace();
    void testBestPatternOrdering();
    void testPatternCriteria();
    void testUpdatePatternAccuracy();
    void testDeleteLowConfidencePatterns();
    void testPatternsForGroup();
    void testPatternPersistence();
    void testMalformedPatternDocumentIgnored();
    void testSessionLifecycle();
    void testSessionQueries();
    void testEndTimedOutSessions();
    void testDeleteSessionsBefore();
    void testSessionPersistence();
    void testConcurrentWritesKeepNewestDocument();
};

void TestStores::testPatternIdsAndReplace()
{
    JsonPatternStore store;
    QCOMPARE(store.savePattern(pattern(QStringLiteral("Alpha"), 0.6, 1)), 1);
    QCOMPARE(store.savePattern(pattern(QStringLiteral("Beta"), 0.6, 1)), 2);

    FilePattern replacement = pattern(QStringLiteral("Gamma"), 0.9, 4);
    replacement.id = 1;
    QCOMPARE(store.savePattern(replacement), 1);
    QCOMPARE(store.patternCount(), 2);
    QCOMPARE(store.allPatterns().first().groupName, QStringLiteral("Gamma"));

    FilePattern unknown = pattern(QStringLiteral("Delta"), 0.5, 1);
    unknown.id = 99;
    QCOMPARE(store.savePattern(unknown), 3);
    QCOMPARE(store.patternCount(), 3);
}

void TestStores::testBestPatternOrdering()
{
    JsonPatternStore store;
    QVERIFY(!store.bestPattern(QStringLiteral("a.pdf"), QStringLiteral(".pdf"), baseTime()).has_value());

    store.savePattern(pattern(QStringLiteral("Few"), 0.8, 2));
    store.savePattern(pattern(QStringLiteral("Many"), 0.8, 5));
    QCOMPARE(store.bestPattern(QStringLiteral("a.pdf"), QStringLiteral(".pdf"), baseTime())->groupName,
             QStringLiteral("Many"));

    store.savePattern(pattern(QStringLiteral("Sure"), 0.9, 1));
    const QList<FilePattern> matches = store.matchingPatterns(QStringLiteral("a.pdf"), QStringLiteral(".pdf"), baseTime());
    QCOMPARE(matches.size(), 3);
    QCOMPARE(matches.at(0).groupName, QStringLiteral("Sure"));
    QCOMPARE(matches.at(1).groupName, QStringLiteral("Many"));
    QCOMPARE(matches.at(2).groupName, QStringLiteral("Few"));
}

void TestStores::testPatternCriteria()
{
    JsonPatternStore store;

    FilePattern byName = pattern(QStringLiteral("Billing"), 0.7, 3);
    byName.namePattern = QStringLiteral("invoice");
    store.savePattern(byName);

    FilePattern byHour = pattern(QStringLiteral("Morning"), 0.6, 3);
    byHour.hourOfDay = 10;
    store.savePattern(byHour);

    FilePattern bySunday = pattern(QStringLiteral("Weekly"), 0.95, 3);
    bySunday.dayOfWeek = 0;
    store.savePattern(bySunday);

    FilePattern bySaturday = pattern(QStringLiteral("Weekend"), 0.5, 3);
    bySaturday.dayOfWeek = 6;
    store.savePattern(bySaturday);

    const auto names = [&](const QString& fileName, const QString& ext, const QDateTime& time) {
        QStringList groups;
        for (const FilePattern& p : store.matchingPatterns(fileName, ext, time)) groups << p.groupName;
        return groups;
    };

    QCOMPARE(names(QStringLiteral("March_INVOICE.PDF"), QStringLiteral(".PDF"), baseTime()),
             QStringList({ QStringLiteral("Billing"), QStringLiteral("Morning"), QStringLiteral("Weekend") }));
    QCOMPARE(names(QStringLiteral("notes.pdf"), QStringLiteral(".pdf"), baseTime().addSecs(3600)),
             QStringList({ QStringLiteral("Weekend") }));
    QCOMPARE(names(QStringLiteral("notes.pdf"), QStringLiteral(".pdf"), baseTime().addDays(1).addSecs(3600)),
             QStringList({ QStringLiteral("Weekly") }));
    QVERIFY(names(QStringLiteral("notes.docx"), QStringLiteral(".docx"), baseTime()).isEmpty());

    QCOMPARE(bySaturday.description(), QStringLiteral("Extension: .pdf, Day: Saturday"));
    QCOMPARE(FilePattern().description(), QStringLiteral("Any file"));
}

void TestStores::testUpdatePatternAccuracy()
{
    JsonPatternStore store;
    FilePattern learned = pattern(QStringLiteral("Alpha"), 0.6, 1);
    const int id = store.savePattern(learned);

    QVERIFY(store.updatePatternAccuracy(id, false, at(60)));
    const FilePattern updated = store.allPatterns().first();
    QCOMPARE(updated.timesSeen, 2);
    QCOMPARE(updated.timesCorrect, 1);
    QCOMPARE(updated.confidenceScore, 0.5);
    QCOMPARE(updated.lastSeen, at(60));

    QVERIFY(!store.updatePatternAccuracy(42, true, at(60)));
}

void TestStores::testDeleteLowConfidencePatterns()
{
    JsonPatternStore store;
    store.savePattern(pattern(QStringLiteral("Unreliable"), 0.2, 5));
    store.savePattern(pattern(QStringLiteral("Young"), 0.2, 1));
    store.savePattern(pattern(QStringLiteral("Solid"), 0.9, 5));

    QCOMPARE(store.deleteLowConfidencePatterns(0.3, 3), 1);
    QCOMPARE(store.patternCount(), 2);
    QVERIFY(store.patternsForGroup(QStringLiteral("Unreliable")).isEmpty());
    QCOMPARE(store.deleteLowConfidencePatterns(0.3, 3), 0);
}

void TestStores::testPatternsForGroup()
{
    JsonPatternStore store;
    store.savePattern(pattern(QStringLiteral("Alpha"), 0.4, 1));
    store.savePattern(pattern(QStringLiteral("alpha"), 0.8, 1));
    store.savePattern(pattern(QStringLiteral("Beta"), 0.8, 1));

    const QList<FilePattern> alpha = store.patternsForGroup(QStringLiteral("ALPHA"));
    QCOMPARE(alpha.size(), 2);
    QCOMPARE(alpha.first().confidenceScore, 0.8);
}

void TestStores::testPatternPersistence()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("data/patterns.json"));

    {
        JsonPatternStore store(path);
        FilePattern first = pattern(QStringLiteral("Alpha"), 0.6, 1);
        first.namePattern = QStringLiteral("lecture");
        first.hourOfDay = 9;
        store.savePattern(first);
        store.savePattern(pattern(QStringLiteral("Beta"), 0.4, 1));
    }
    QVERIFY(QFile::exists(path));

    JsonPatternStore reloaded(path);
    QCOMPARE(reloaded.path(), path);
    QCOMPARE(reloaded.patternCount(), 2);

    const FilePattern first = reloaded.allPatterns().first();
    QCOMPARE(first.id, 1);
    QCOMPARE(first.groupName, QStringLiteral("Alpha"));
    QCOMPARE(first.namePattern.value(), QStringLiteral("lecture"));
    QCOMPARE(first.hourOfDay.value(), 9);
    QVERIFY(!first.dayOfWeek.has_value());
    QCOMPARE(first.firstSeen, baseTime());

    QCOMPARE(reloaded.savePattern(pattern(QStringLiteral("Gamma"), 0.6, 1)), 3);
}

void TestStores::testMalformedPatternDocumentIgnored()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("patterns.json"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not json at all");
    file.close();

    JsonPatternStore store(path);
    QCOMPARE(store.patternCount(), 0);
    QCOMPARE(store.savePattern(pattern(QStringLiteral("Alpha"), 0.6, 1)), 1);
}

void TestStores::testSessionLifecycle()
{
    JsonSessionStore store;
    QVERIFY(!store.activeSession().has_value());

    const int first = store.createSession(session(QStringLiteral("Alpha"), at(0)));
    const int second = store.createSession(session(QStringLiteral("Beta"), at(10)));
    QCOMPARE(first, 1);
    QCOMPARE(second, 2);
    QCOMPARE(store.activeSession()->id, second);

    QVERIFY(store.endSession(second, at(20)));
    QVERIFY(!store.endSession(second, at(21)));
    QVERIFY(!store.endSession(99, at(21)));
    QCOMPARE(store.activeSession()->id, first);
    QCOMPARE(store.sessionById(second)->endTime.value(), at(20));

    DownloadSession changed = store.sessionById(first).value();
    changed.addFile(QStringLiteral("a.pdf"), at(30));
    QVERIFY(store.updateSession(changed));
    QCOMPARE(store.sessionById(first)->fileCount, 1);

    DownloadSession missing = changed;
    missing.id = 77;
    QVERIFY(!store.updateSession(missing));
}

void TestStores::testSessionQueries()
{
    JsonSessionStore store;
    store.createSession(session(QStringLiteral("Alpha"), at(0)));
    store.createSession(session(QStringLiteral("Beta"), at(10)));
    store.createSession(session(QStringLiteral("Gamma"), at(20)));
    store.endSession(1, at(5));

    const QList<DownloadSession> all = store.sessions(std::nullopt, 0);
    QCOMPARE(all.size(), 3);
    QCOMPARE(all.at(0).groupName, QStringLiteral("Gamma"));
    QCOMPARE(all.at(2).groupName, QStringLiteral("Alpha"));

    QCOMPARE(store.sessions(true, 0).size(), 2);
    QCOMPARE(store.sessions(false, 0).size(), 1);
    QCOMPARE(store.sessions(std::nullopt, 2).size(), 2);

    store.addFileToSession(2, SessionFile{ QStringLiteral("b.pdf"), QStringLiteral("/tmp/b.pdf"), 10, at(11) });
    QCOMPARE(store.sessionFiles(2).size(), 1);
    QVERIFY(store.sessionFiles(3).isEmpty());
}

void TestStores::testEndTimedOutSessions()
{
    JsonSessionStore store;
    store.createSession(session(QStringLiteral("Short"), at(0), 10));
    store.createSession(session(QStringLiteral("Long"), at(0), 60));

    QVERIFY(store.endTimedOutSessions(at(10)).isEmpty());

    const QList<DownloadSession> ended = store.endTimedOutSessions(at(11));
    QCOMPARE(ended.size(), 1);
    QCOMPARE(ended.first().groupName, QStringLiteral("Short"));
    QVERIFY(!ended.first().isActive);
    QCOMPARE(ended.first().endTime.value(), at(11));
    QCOMPARE(store.activeSession()->groupName, QStringLiteral("Long"));
}

void TestStores::testDeleteSessionsBefore()
{
    JsonSessionStore store;
    store.createSession(session(QStringLiteral("Old"), at(0)));
    store.createSession(session(QStringLiteral("OldActive"), at(1)));
    store.createSession(session(QStringLiteral("New"), baseTime().addDays(10)));
    store.endSession(1, at(5));
    store.endSession(3, baseTime().addDays(10));
    store.addFileToSession(1, SessionFile{ QStringLiteral("a.pdf"), QString(), 0, at(2) });

    QCOMPARE(store.deleteSessionsBefore(baseTime().addDays(5)), 1);
    QCOMPARE(store.sessionCount(), 2);
    QVERIFY(!store.sessionById(1).has_value());
    QVERIFY(store.sessionFiles(1).isEmpty());
    QVERIFY(store.sessionById(2).has_value());
}

void TestStores::testSessionPersistence()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("sessions.json"));

    {
        JsonSessionStore store(path);
        DownloadSession created = session(QStringLiteral("Alpha"), at(0));
        created.windowTitle = QStringLiteral("Alpha - Telegram");
        created.confidenceScore = 0.75;
        const int id = store.createSession(created);

        DownloadSession stored = store.sessionById(id).value();
        stored.addFile(QStringLiteral("a.pdf"), at(3));
        store.updateSession(stored);
        store.addFileToSession(id, SessionFile{ QStringLiteral("a.pdf"), QStringLiteral("/tmp/a.pdf"), 512, at(3) });

        store.createSession(session(QStringLiteral("Beta"), at(10)));
        store.endSession(2, at(20));
    }

    JsonSessionStore reloaded(path);
    QCOMPARE(reloaded.sessionCount(), 2);

    const DownloadSession alpha = reloaded.sessionById(1).value();
    QCOMPARE(alpha.groupName, QStringLiteral("Alpha"));
    QCOMPARE(alpha.windowTitle, QStringLiteral("Alpha - Telegram"));
    QCOMPARE(alpha.confidenceScore, 0.75);
    QCOMPARE(alpha.fileNames, QStringList({ QStringLiteral("a.pdf") }));
    QCOMPARE(alpha.fileCount, 1);
    QCOMPARE(alpha.lastActivity, at(3));
    QVERIFY(alpha.isActive);

    const QList<SessionFile> files = reloaded.sessionFiles(1);
    QCOMPARE(files.size(), 1);
    QCOMPARE(files.first().filePath, QStringLiteral("/tmp/a.pdf"));
    QCOMPARE(files.first().fileSize, qint64(512));

    const DownloadSession beta = reloaded.sessionById(2).value();
    QVERIFY(!beta.isActive);
    QCOMPARE(beta.endTime.value(), at(20));

    QCOMPARE(reloaded.createSession(session(QStringLiteral("Gamma"), at(30))), 3);
}

void TestStores::testConcurrentWritesKeepNewestDocument()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString sessionPath = dir.filePath(QStringLiteral("sessions.json"));
    const QString patternPath = dir.filePath(QStringLiteral("patterns.json"));

    constexpr int writers = 8;
    {
        JsonSessionStore sessions(sessionPath);
        JsonPatternStore patterns(patternPath);
        QList<QFuture<void>> running;
        for (int i = 0; i < writers; ++i) {
            running.append(QtConcurrent::run([&sessions, &patterns, i]() {
                const int id = sessions.createSession(session(QStringLiteral("Group %1").arg(i), at(i)));
                sessions.addFileToSession(id, SessionFile{ QStringLiteral("f%1.pdf").arg(i), QString(), 1, at(i) });
                patterns.savePattern(pattern(QStringLiteral("Group %1").arg(i), 0.6, 1));
            }));
        }
        for (QFuture<void>& future : running) future.waitForFinished();
        QCOMPARE(sessions.sessionCount(), writers);
        QVERIFY(sessions.activeSession().has_value());
    }

    JsonSessionStore sessions(sessionPath);
    JsonPatternStore patterns(patternPath);
    QCOMPARE(sessions.sessionCount(), writers);
    QCOMPARE(patterns.patternCount(), writers);
    for (int id = 1; id <= writers; ++id) QCOMPARE(sessions.sessionFiles(id).size(), 1);
}

QTEST_MAIN(TestStores)
#include "test_stores.moc"
