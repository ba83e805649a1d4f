module;
#include <QByteArray>
#include <algorithm>
#include <optional>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QMutexLocker>
#include <QSaveFile>
#include <QString>

module sazman.services.pattern_store;

namespace {

QJsonObject patternToJson(const FilePattern& pattern)
{
    QJsonObject obj;
    obj.insert("id", pattern.id);
    if (pattern.extension) obj.insert("extension", *pattern.extension);
    if (pattern.namePattern) obj.insert("namePattern", *pattern.namePattern);
    if (pattern.hourOfDay) obj.insert("hourOfDay", *pattern.hourOfDay);
    if (pattern.dayOfWeek) obj.insert("dayOfWeek", *pattern.dayOfWeek);
    obj.insert("groupName", pattern.groupName);
    obj.insert("confidenceScore", pattern.confidenceScore);
    obj.insert("timesSeen", pattern.timesSeen);
    obj.insert("timesCorrect", pattern.timesCorrect);
    obj.insert("firstSeen", pattern.firstSeen.toString(Qt::ISODateWithMs));
    obj.insert("lastSeen", pattern.lastSeen.toString(Qt::ISODateWithMs));
    return obj;
}

FilePattern patternFromJson(const QJsonObject& obj)
{
    FilePattern pattern;
    pattern.id = obj.value("id").toInt(0);
    if (obj.contains("extension")) pattern.extension = obj.value("extension").toString();
    if (obj.contains("namePattern")) pattern.namePattern = obj.value("namePattern").toString();
    if (obj.contains("hourOfDay")) pattern.hourOfDay = obj.value("hourOfDay").toInt();
    if (obj.contains("dayOfWeek")) pattern.dayOfWeek = obj.value("dayOfWeek").toInt();
    pattern.groupName = obj.value("groupName").toString();
    pattern.confidenceScore = std::clamp(obj.value("confidenceScore").toDouble(0.0), 0.0, 1.0);
    pattern.timesSeen = obj.value("timesSeen").toInt(0);
    pattern.timesCorrect = obj.value("timesCorrect").toInt(0);
    pattern.firstSeen = QDateTime::fromString(obj.value("firstSeen").toString(), Qt::ISODateWithMs);
    pattern.lastSeen = QDateTime::fromString(obj.value("lastSeen").toString(), Qt::ISODateWithMs);
    return pattern;
}

} // namespace

JsonPatternStore::JsonPatternStore(const QString& path)
    : m_path(path)
{
    load();
}

QString JsonPatternStore::path() const
{
    return m_path;
}

void JsonPatternStore::sortBest(QList<FilePattern>& patterns)
{
    std::stable_sort(patterns.begin(), patterns.end(), [](const FilePattern& a, const FilePattern& b) {
        if (a.confidenceScore != b.confidenceScore) return a.confidenceScore > b.confidenceScore;
        return a.timesSeen > b.timesSeen;
    });
}

QList<FilePattern> JsonPatternStore::matchingPatterns(const QString& fileName,
                                                      const QString& extension,
                                                      const QDateTime& time) const
{
    QMutexLocker locker(&m_mutex);
    QList<FilePattern> matches;
    for (const FilePattern& pattern : m_patterns) {
        if (pattern.matches(fileName, extension, time)) matches.append(pattern);
    }
    sortBest(matches);
    return matches;
}

std::optional<FilePattern> JsonPatternStore::bestPattern(const QString& fileName,
                                                         const QString& extension,
                                                         const QDateTime& time)
{
    const QList<FilePattern> matches = matchingPatterns(fileName, extension, time);
    if (matches.isEmpty()) return std::nullopt;
    return matches.first();
}

int JsonPatternStore::savePattern(const FilePattern& pattern)
{
    QMutexLocker locker(&m_mutex);
    FilePattern stored = pattern;

    auto it = std::find_if(m_patterns.begin(), m_patterns.end(), [&](const FilePattern& p) {
        return stored.id > 0 && p.id == stored.id;
    });
    if (it != m_patterns.end()) {
        *it = stored;
    } else {
        stored.id = m_nextId++;
        if (!stored.firstSeen.isValid()) stored.firstSeen = QDateTime::currentDateTime();
        if (!stored.lastSeen.isValid()) stored.lastSeen = stored.firstSeen;
        m_patterns.append(stored);
    }

    persist(locker);
    return stored.id;
}

bool JsonPatternStore::updatePatternAccuracy(int patternId, bool wasCorrect, const QDateTime& now)
{
    QMutexLocker locker(&m_mutex);
    for (FilePattern& pattern : m_patterns) {
        if (pattern.id != patternId) continue;
        pattern.recordOutcome(wasCorrect, now);
        persist(locker);
        return true;
    }
    return false;
}

QList<FilePattern> JsonPatternStore::patternsForGroup(const QString& groupName) const
{
    QMutexLocker locker(&m_mutex);
    QList<FilePattern> result;
    for (const FilePattern& pattern : m_patterns) {
        if (pattern.groupName.compare(groupName, Qt::CaseInsensitive) == 0) result.append(pattern);
    }
    sortBest(result);
    return result;
}

int JsonPatternStore::deleteLowConfidencePatterns(double threshold, int minTimesSeen)
{
    QMutexLocker locker(&m_mutex);
    const auto removed = m_patterns.removeIf([&](const FilePattern& p) {
        return p.confidenceScore < threshold && p.timesSeen >= minTimesSeen;
    });
    if (removed > 0) {
        qInfo() << "Pattern store: removed" << removed << "low-confidence patterns";
        persist(locker);
    }
    return static_cast<int>(removed);
}

QList<FilePattern> JsonPatternStore::allPatterns() const
{
    QMutexLocker locker(&m_mutex);
    return m_patterns;
}

int JsonPatternStore::patternCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_patterns.size());
}

void JsonPatternStore::load()
{
    if (m_path.isEmpty()) return;
    QFile file(m_path);
    if (!file.exists()) return;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Pattern store: cannot open" << m_path << file.errorString();
        return;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        qWarning() << "Pattern store: ignoring malformed document" << m_path;
        return;
    }

    const QJsonArray items = doc.object().value("patterns").toArray();
    for (const QJsonValue& v : items) {
        if (!v.isObject()) continue;
        FilePattern pattern = patternFromJson(v.toObject());
        if (pattern.id <= 0 || pattern.groupName.isEmpty()) continue;
        m_nextId = std::max(m_nextId, pattern.id + 1);
        m_patterns.append(pattern);
    }
}

QByteArray JsonPatternStore::serializeLocked() const
{
    QJsonObject root;
    root.insert("version", 1);
    QJsonArray items;
    for (const FilePattern& pattern : m_patterns) items.append(patternToJson(pattern));
    root.insert("patterns", items);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

void JsonPatternStore::persist(QMutexLocker<QMutex>& locker)
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
        qWarning() << "Pattern store: cannot write" << m_path << file.errorString();
        return;
    }
    file.write(document);
    if (!file.commit()) {
        qWarning() << "Pattern store: commit failed for" << m_path << file.errorString();
        return;
    }
    m_writtenGeneration = generation;
}
