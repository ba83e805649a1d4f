module;
#include <QByteArray>
#include <algorithm>
#include <optional>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QMutexLocker>
#include <QSaveFile>
#include <QString>
#include <QStringList>

module sazman.services.session_store;

namespace {

QString timeToString(const QDateTime& time)
{
    return time.toString(Qt::ISODateWithMs);
}

QDateTime timeFromString(const QString& text)
{
    return QDateTime::fromString(text, Qt::ISODateWithMs);
}

QJsonObject sessionToJson(const DownloadSession& session)
{
    QJsonObject obj;
    obj.insert("id", session.id);
    obj.insert("groupName", session.groupName);
    obj.insert("startTime", timeToString(session.startTime));
    if (session.endTime) obj.insert("endTime", timeToString(*session.endTime));
    obj.insert("lastActivity", timeToString(session.lastActivity));
    obj.insert("timeoutSeconds", session.timeoutSeconds);
    obj.insert("confidenceScore", session.confidenceScore);
    obj.insert("isActive", session.isActive);
    obj.insert("windowTitle", session.windowTitle);
    obj.insert("processName", session.processName);
    obj.insert("fileNames", QJsonArray::fromStringList(session.fileNames));
    return obj;
}

DownloadSession sessionFromJson(const QJsonObject& obj)
{
    DownloadSession session;
    session.id = obj.value("id").toInt(0);
    session.groupName = obj.value("groupName").toString();
    session.startTime = timeFromString(obj.value("startTime").toString());
    if (obj.contains("endTime")) session.endTime = timeFromString(obj.value("endTime").toString());
    session.lastActivity = timeFromString(obj.value("lastActivity").toString());
    session.timeoutSeconds = obj.value("timeoutSeconds").toInt(30);
    session.confidenceScore = obj.value("confidenceScore").toDouble(1.0);
    session.isActive = obj.value("isActive").toBool(false);
    session.windowTitle = obj.value("windowTitle").toString();
    session.processName = obj.value("processName").toString();
    for (const QJsonValue& v : obj.value("fileNames").toArray()) session.fileNames.append(v.toString());
    session.fileCount = static_cast<int>(session.fileNames.size());
    return session;
}

QJsonObject fileToJson(const SessionFile& file)
{
    QJsonObject obj;
    obj.insert("fileName", file.fileName);
    obj.insert("filePath", file.filePath);
    obj.insert("fileSize", static_cast<double>(file.fileSize));
    obj.insert("addedAt", timeToString(file.addedAt));
    return obj;
}

SessionFile fileFromJson(const QJsonObject& obj)
{
    SessionFile file;
    file.fileName = obj.value("fileName").toString();
    file.filePath = obj.value("filePath").toString();
    file.fileSize = static_cast<qint64>(obj.value("fileSize").toDouble(0));
    file.addedAt = timeFromString(obj.value("addedAt").toString());
    return file;
}

} // namespace

JsonSessionStore::JsonSessionStore(const QString& path)
    : m_path(path)
{
    load();
}

int JsonSessionStore::createSession(const DownloadSession& session)
{
    QMutexLocker locker(&m_mutex);
    DownloadSession stored = session;
    stored.id = m_nextId++;
    m_sessions.append(stored);
    persist(locker);
    return stored.id;
}

std::optional<DownloadSession> JsonSessionStore::activeSession()
{
    QMutexLocker locker(&m_mutex);
    std::optional<DownloadSession> best;
    for (const DownloadSession& session : m_sessions) {
        if (!session.isActive) continue;
        if (!best || session.startTime >= best->startTime) best = session;
    }
    return best;
}

std::optional<DownloadSession> JsonSessionStore::sessionById(int sessionId)
{
    QMutexLocker locker(&m_mutex);
    for (const DownloadSession& session : m_sessions) {
        if (session.id == sessionId) return session;
    }
    return std::nullopt;
}

bool JsonSessionStore::updateSession(const DownloadSession& session)
{
    QMutexLocker locker(&m_mutex);
    for (DownloadSession& stored : m_sessions) {
        if (stored.id != session.id) continue;
        stored = session;
        persist(locker);
        return true;
    }
    return false;
}

bool JsonSessionStore::endSession(int sessionId, const QDateTime& now)
{
    QMutexLocker locker(&m_mutex);
    for (DownloadSession& stored : m_sessions) {
        if (stored.id != sessionId) continue;
        if (!stored.isActive) return false;
        stored.end(now);
        persist(locker);
        return true;
    }
    return false;
}

void JsonSessionStore::addFileToSession(int sessionId, const SessionFile& file)
{
    QMutexLocker locker(&m_mutex);
    m_files[sessionId].append(file);
    persist(locker);
}

QList<SessionFile> JsonSessionStore::sessionFiles(int sessionId)
{
    QMutexLocker locker(&m_mutex);
    return m_files.value(sessionId);
}

QList<DownloadSession> JsonSessionStore::sessions(std::optional<bool> activeOnly, int limit)
{
    QMutexLocker locker(&m_mutex);
    QList<DownloadSession> result;
    for (const DownloadSession& session : m_sessions) {
        if (activeOnly && session.isActive != *activeOnly) continue;
        result.append(session);
    }
    std::stable_sort(result.begin(), result.end(), [](const DownloadSession& a, const DownloadSession& b) {
        if (a.startTime != b.startTime) return a.startTime > b.startTime;
        return a.id > b.id;
    });
    if (limit > 0 && result.size() > limit) result.resize(limit);
    return result;
}

QList<DownloadSession> JsonSessionStore::endTimedOutSessions(const QDateTime& now)
{
    QMutexLocker locker(&m_mutex);
    QList<DownloadSession> ended;
    for (DownloadSession& stored : m_sessions) {
        if (!stored.hasTimedOut(now)) continue;
        stored.end(now);
        ended.append(stored);
    }
    if (!ended.isEmpty()) persist(locker);
    return ended;
}

int JsonSessionStore::deleteSessionsBefore(const QDateTime& cutoff)
{
    QMutexLocker locker(&m_mutex);
    QList<int> removedIds;
    m_sessions.removeIf([&](const DownloadSession& session) {
        if (session.isActive || session.startTime >= cutoff) return false;
        removedIds.append(session.id);
        return true;
    });
    for (int id : removedIds) m_files.remove(id);
    if (!removedIds.isEmpty()) persist(locker);
    return static_cast<int>(removedIds.size());
}

int JsonSessionStore::sessionCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_sessions.size());
}

void JsonSessionStore::load()
{
    if (m_path.isEmpty()) return;
    QFile file(m_path);
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Session store: cannot open" << m_path << file.errorString();
        return;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        qWarning() << "Session store: ignoring malformed document" << m_path;
        return;
    }
    const QJsonObject root = doc.object();

    for (const QJsonValue& v : root.value("sessions").toArray()) {
        if (!v.isObject()) continue;
        const DownloadSession session = sessionFromJson(v.toObject());
        if (session.id <= 0 || session.groupName.isEmpty()) continue;
        m_nextId = std::max(m_nextId, session.id + 1);
        m_sessions.append(session);
    }

    const QJsonObject files = root.value("files").toObject();
    for (auto it = files.begin(); it != files.end(); ++it) {
        bool ok = false;
        const int sessionId = it.key().toInt(&ok);
        if (!ok) continue;
        QList<SessionFile> list;
        for (const QJsonValue& v : it.value().toArray()) {
            if (v.isObject()) list.append(fileFromJson(v.toObject()));
        }
        m_files.insert(sessionId, list);
    }
}

QByteArray JsonSessionStore::serializeLocked() const
{
    QJsonObject root;
    root.insert("version", 1);

    QJsonArray sessions;
    for (const DownloadSession& session : m_sessions) sessions.append(sessionToJson(session));
    root.insert("sessions", sessions);

    QJsonObject files;
    for (auto it = m_files.begin(); it != m_files.end(); ++it) {
        QJsonArray list;
        for (const SessionFile& file : it.value()) list.append(fileToJson(file));
        files.insert(QString::number(it.key()), list);
    }
    root.insert("files", files);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

void JsonSessionStore::persist(QMutexLocker<QMutex>& locker)
{
    if (m_path.isEmpty()) return;

    const QByteArray document = serializeLocked();
    const quint64 generation = ++m_generation;
    locker.unlock();

    // The write runs outside m_mutex; a snapshot older than the one on disk is dropped.
    QMutexLocker writeLocker(&m_writeMutex);
    if (generation <= m_writtenGeneration) return;

    QDir().mkpath(QFileInfo(m_path).absolutePath());

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Session store: cannot write" << m_path << file.errorString();
        return;
    }
    file.write(document);
    if (!file.commit()) {
        qWarning() << "Session store: commit failed for" << m_path << file.errorString();
        return;
    }
    m_writtenGeneration = generation;
}
