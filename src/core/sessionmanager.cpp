module;
#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <QDateTime>
#include <QDebug>
#include <QHash>
#include <QList>
#include <QMutexLocker>
#include <QString>
#include <QTimer>

module sazman.core.sessionmanager;

SessionManager::SessionManager(SessionStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    if (!m_store) throw std::invalid_argument("SessionManager requires a session store");
    connect(&m_sweepTimer, &QTimer::timeout, this, &SessionManager::onSweepTimer);
}

std::optional<DownloadSession> SessionManager::active()
{
    try {
        return m_store->activeSession();
    } catch (const std::exception& e) {
        qWarning() << "Session manager: active session lookup failed:" << e.what();
        return std::nullopt;
    }
}

DownloadSession SessionManager::start(const QString& groupName,
                                      const QString& windowTitle,
                                      const QString& processName,
                                      double confidence,
                                      const QDateTime& now)
{
    QList<Notice> pending;
    DownloadSession session;
    {
        QMutexLocker locker(&m_mutex);
        session = startLocked(groupName, windowTitle, processName, confidence, now, pending);
    }
    deliver(pending);
    return session;
}

DownloadSession SessionManager::startLocked(const QString& groupName, const QString& windowTitle,
                                            const QString& processName, double confidence,
                                            const QDateTime& now, QList<Notice>& pending)
{
    std::optional<DownloadSession> current = m_store->activeSession();

    if (current && current->groupName == groupName) {
        current->touch(now);
        m_store->updateSession(*current);
        qDebug() << "Session manager: reusing session" << current->id << "for" << groupName;
        return *current;
    }

    if (current) endLocked(current->id, now, pending);

    DownloadSession session;
    session.groupName = groupName;
    session.startTime = now;
    session.lastActivity = now;
    session.timeoutSeconds = m_defaultTimeoutSeconds;
    session.confidenceScore = std::clamp(confidence, 0.0, 1.0);
    session.isActive = true;
    session.windowTitle = windowTitle;
    session.processName = processName;
    session.id = m_store->createSession(session);

    qInfo().noquote() << QStringLiteral("Session started: #%1 '%2' (confidence %3, timeout %4s)")
                             .arg(session.id)
                             .arg(groupName)
                             .arg(session.confidenceScore, 0, 'f', 2)
                             .arg(session.timeoutSeconds);
    pending.append(Notice{ Notice::Started, session, QString() });
    return session;
}

DownloadSession SessionManager::addFile(const QString& fileName,
                                        const QString& fallbackGroupName,
                                        const QString& filePath,
                                        qint64 fileSize,
                                        const QDateTime& now)
{
    QList<Notice> pending;
    DownloadSession session;
    {
        QMutexLocker locker(&m_mutex);
        std::optional<DownloadSession> current = m_store->activeSession();
        if (current && current->groupName == fallbackGroupName) {
            session = *current;
        } else {
            session = startLocked(fallbackGroupName, QString(), QString(), 1.0, now, pending);
        }

        if (session.addFile(fileName, now)) {
            m_store->addFileToSession(session.id, SessionFile{ fileName, filePath, fileSize, now });
            m_store->updateSession(session);
            qDebug() << "Session manager: added" << fileName << "to session" << session.id
                     << "files" << session.fileCount;
            pending.append(Notice{ Notice::FileAdded, session, fileName });
        } else {
            session.touch(now);
            m_store->updateSession(session);
        }
    }
    deliver(pending);
    return session;
}

void SessionManager::end(int sessionId, const QDateTime& now)
{
    QList<Notice> pending;
    {
        QMutexLocker locker(&m_mutex);
        endLocked(sessionId, now, pending);
    }
    deliver(pending);
}

void SessionManager::endLocked(int sessionId, const QDateTime& now, QList<Notice>& pending)
{
    std::optional<DownloadSession> session = m_store->sessionById(sessionId);
    if (!session || !session->isActive) return;
    if (!m_store->endSession(sessionId, now)) return;

    session->end(now);
    qInfo().noquote() << QStringLiteral("Session ended: #%1 '%2' (files %3, duration %4s)")
                             .arg(session->id)
                             .arg(session->groupName)
                             .arg(session->fileCount)
                             .arg(session->startTime.secsTo(now));
    pending.append(Notice{ Notice::Ended, *session, QString() });
}

void SessionManager::endCurrent(const QDateTime& now)
{
    QList<Notice> pending;
    {
        QMutexLocker locker(&m_mutex);
        const std::optional<DownloadSession> current = m_store->activeSession();
        if (current) endLocked(current->id, now, pending);
    }
    deliver(pending);
}

int SessionManager::sweepTimedOut(const QDateTime& now)
{
    QList<Notice> pending;
    {
        QMutexLocker locker(&m_mutex);
        const QList<DownloadSession> ended = m_store->endTimedOutSessions(now);
        for (const DownloadSession& session : ended) {
            qInfo().noquote() << QStringLiteral("Session timed out: #%1 '%2' (files %3)")
                                     .arg(session.id)
                                     .arg(session.groupName)
                                     .arg(session.fileCount);
            pending.append(Notice{ Notice::TimedOut, session, QString() });
            pending.append(Notice{ Notice::Ended, session, QString() });
        }
    }
    deliver(pending);

    int count = 0;
    for (const Notice& notice : pending) {
        if (notice.kind == Notice::TimedOut) ++count;
    }
    return count;
}

bool SessionManager::isActive()
{
    return active().has_value();
}

std::optional<QString> SessionManager::currentGroupName()
{
    const std::optional<DownloadSession> session = active();
    if (!session) return std::nullopt;
    return session->groupName;
}

std::optional<double> SessionManager::timeoutRemaining(const QDateTime& now)
{
    const std::optional<DownloadSession> session = active();
    if (!session) return std::nullopt;
    return std::max(0.0, session->timeoutSeconds - session->idleSeconds(now));
}

QList<DownloadSession> SessionManager::recentSessions(int limit, bool includeActive)
{
    try {
        return m_store->sessions(includeActive ? std::nullopt : std::optional<bool>(false), limit);
    } catch (const std::exception& e) {
        qWarning() << "Session manager: history lookup failed:" << e.what();
        return {};
    }
}

std::optional<DownloadSession> SessionManager::sessionById(int sessionId)
{
    try {
        return m_store->sessionById(sessionId);
    } catch (const std::exception& e) {
        qWarning() << "Session manager: lookup of session" << sessionId << "failed:" << e.what();
        return std::nullopt;
    }
}

QList<SessionFile> SessionManager::sessionFiles(int sessionId)
{
    try {
        return m_store->sessionFiles(sessionId);
    } catch (const std::exception& e) {
        qWarning() << "Session manager: file lookup of session" << sessionId << "failed:" << e.what();
        return {};
    }
}

int SessionManager::totalSessionCount()
{
    return static_cast<int>(recentSessions(0, true).size());
}

double SessionManager::averageFilesPerSession()
{
    const QList<DownloadSession> sessions = recentSessions(1000, true);
    if (sessions.isEmpty()) return 0.0;

    double total = 0.0;
    for (const DownloadSession& session : sessions) total += session.fileCount;
    return total / sessions.size();
}

std::optional<GroupActivity> SessionManager::mostActiveGroup()
{
    const QList<DownloadSession> sessions = recentSessions(1000, true);
    if (sessions.isEmpty()) return std::nullopt;

    QHash<QString, int> counts;
    QList<QString> order;
    for (const DownloadSession& session : sessions) {
        if (!counts.contains(session.groupName)) order.append(session.groupName);
        ++counts[session.groupName];
    }

    GroupActivity best;
    for (const QString& group : order) {
        if (counts.value(group) > best.sessionCount) best = GroupActivity{ group, counts.value(group) };
    }
    return best;
}

int SessionManager::deleteOldSessions(int retentionDays, const QDateTime& now)
{
    if (retentionDays < 1) {
        qWarning() << "Session manager: rejected retention of" << retentionDays << "days";
        return 0;
    }
    QMutexLocker locker(&m_mutex);
    const int removed = m_store->deleteSessionsBefore(now.addDays(-retentionDays));
    if (removed > 0) qInfo() << "Session manager: removed" << removed << "old sessions";
    return removed;
}

int SessionManager::defaultTimeout() const
{
    QMutexLocker locker(&m_mutex);
    return m_defaultTimeoutSeconds;
}

void SessionManager::setDefaultTimeout(int timeoutSeconds)
{
    QMutexLocker locker(&m_mutex);
    if (timeoutSeconds < 5 || timeoutSeconds > 300) {
        qWarning() << "Session manager: rejected timeout" << timeoutSeconds << "keeping" << m_defaultTimeoutSeconds;
        return;
    }
    m_defaultTimeoutSeconds = timeoutSeconds;
}

void SessionManager::startSweeping(int intervalMs)
{
    if (intervalMs < 100) {
        qWarning() << "Session manager: rejected sweep interval" << intervalMs;
        return;
    }
    m_sweepTimer.start(intervalMs);
}

void SessionManager::stopSweeping()
{
    m_sweepTimer.stop();
}

bool SessionManager::isSweeping() const
{
    return m_sweepTimer.isActive();
}

void SessionManager::onSweepTimer()
{
    try {
        sweepTimedOut(QDateTime::currentDateTime());
    } catch (const std::exception& e) {
        qWarning() << "Session manager: timeout sweep failed:" << e.what();
    }
}

void SessionManager::deliver(const QList<Notice>& pending)
{
    for (const Notice& notice : pending) {
        switch (notice.kind) {
        case Notice::Started: emit sessionStarted(notice.session); break;
        case Notice::Ended: emit sessionEnded(notice.session); break;
        case Notice::TimedOut: emit sessionTimedOut(notice.session); break;
        case Notice::FileAdded: emit fileAdded(notice.session, notice.fileName); break;
        }
    }
}
