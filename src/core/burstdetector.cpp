module;
#include <algorithm>
#include <optional>
#include <QDateTime>
#include <QDebug>
#include <QList>
#include <QMutexLocker>
#include <QString>

module sazman.core.burstdetector;

namespace {

double secondsSince(const QDateTime& from, const QDateTime& to)
{
    return static_cast<double>(from.msecsTo(to)) / 1000.0;
}

} // namespace

BurstDetector::BurstDetector(QObject* parent)
    : QObject(parent)
{
}

void BurstDetector::record(const QString& fileName, const QDateTime& time)
{
    QList<PendingNotice> pending;
    {
        QMutexLocker locker(&m_mutex);
        evictLocked(time, pending);

        m_events.append(Event{ fileName, time });
        qDebug() << "Burst: recorded" << fileName << "window size" << m_events.size();

        if (m_events.size() >= m_minimumFiles) {
            if (!m_active) {
                m_active = true;
                m_burstStart = m_events.first().time;
                const BurstStatus status = statusLocked();
                qInfo().noquote() << "Burst started:" << status.toString();
                pending.append(PendingNotice{ Notice::Started, status });
            } else {
                pending.append(PendingNotice{ Notice::Continued, statusLocked() });
            }
        } else if (m_active) {
            endLocked(pending);
        }
    }
    deliver(pending);
}

bool BurstDetector::isBurst(const QString& fileName, const QDateTime& time) const
{
    QMutexLocker locker(&m_mutex);
    if (m_events.isEmpty()) return false;

    const double sinceLast = secondsSince(m_events.last().time, time);
    if (sinceLast > m_thresholdSeconds) return false;

    // record() would force-end this burst and drop its events.
    if (m_active && m_burstStart && secondsSince(*m_burstStart, time) > m_maxDurationSeconds) {
        qDebug() << "Burst: check" << fileName << "falls past the max duration";
        return false;
    }

    const auto retained = std::count_if(m_events.cbegin(), m_events.cend(), [&](const Event& e) {
        return secondsSince(e.time, time) <= m_thresholdSeconds;
    });
    const bool burst = retained >= m_minimumFiles - 1;
    qDebug() << "Burst: check" << fileName << "retained" << retained << "burst" << burst;
    return burst;
}

BurstStatus BurstDetector::status() const
{
    QMutexLocker locker(&m_mutex);
    return statusLocked();
}

void BurstDetector::reset()
{
    QList<PendingNotice> pending;
    {
        QMutexLocker locker(&m_mutex);
        if (m_active) endLocked(pending);
        m_events.clear();
        m_burstStart.reset();
    }
    deliver(pending);
}

std::optional<double> BurstDetector::remaining(const QDateTime& now) const
{
    QMutexLocker locker(&m_mutex);
    if (!m_active || m_events.isEmpty()) return std::nullopt;
    const double left = m_thresholdSeconds - secondsSince(m_events.last().time, now);
    return std::max(0.0, left);
}

void BurstDetector::sweep(const QDateTime& now)
{
    QList<PendingNotice> pending;
    {
        QMutexLocker locker(&m_mutex);
        evictLocked(now, pending);
        if (m_active && m_events.size() < m_minimumFiles) endLocked(pending);
    }
    deliver(pending);
}

int BurstDetector::currentCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_active ? static_cast<int>(m_events.size()) : 0;
}

int BurstDetector::burstThresholdSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_thresholdSeconds;
}

void BurstDetector::setBurstThresholdSeconds(int seconds)
{
    QMutexLocker locker(&m_mutex);
    if (seconds < 1 || seconds > 300 || seconds > m_maxDurationSeconds) {
        qWarning() << "Burst: rejected threshold" << seconds << "keeping" << m_thresholdSeconds;
        return;
    }
    m_thresholdSeconds = seconds;
}

int BurstDetector::minimumFilesForBurst() const
{
    QMutexLocker locker(&m_mutex);
    return m_minimumFiles;
}

void BurstDetector::setMinimumFilesForBurst(int count)
{
    QMutexLocker locker(&m_mutex);
    if (count < 2 || count > 100) {
        qWarning() << "Burst: rejected minimum file count" << count << "keeping" << m_minimumFiles;
        return;
    }
    m_minimumFiles = count;
}

int BurstDetector::maxBurstDurationSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxDurationSeconds;
}

void BurstDetector::setMaxBurstDurationSeconds(int seconds)
{
    QMutexLocker locker(&m_mutex);
    if (seconds < m_thresholdSeconds || seconds > 3600) {
        qWarning() << "Burst: rejected max duration" << seconds << "keeping" << m_maxDurationSeconds;
        return;
    }
    m_maxDurationSeconds = seconds;
}

int BurstDetector::saturationCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_saturationCount;
}

void BurstDetector::setSaturationCount(int count)
{
    QMutexLocker locker(&m_mutex);
    if (count < 2 || count > 1000) {
        qWarning() << "Burst: rejected saturation count" << count << "keeping" << m_saturationCount;
        return;
    }
    m_saturationCount = count;
}

BurstStatus BurstDetector::statusLocked() const
{
    BurstStatus status;
    status.isActive = m_active;
    status.fileCount = static_cast<int>(m_events.size());
    status.saturationCount = m_saturationCount;
    if (m_burstStart) {
        status.burstStartTime = m_burstStart;
    } else if (!m_events.isEmpty()) {
        status.burstStartTime = m_events.first().time;
    }
    if (!m_events.isEmpty()) status.lastFileTime = m_events.last().time;
    for (const Event& e : m_events) status.fileNames.append(e.fileName);
    return status;
}

void BurstDetector::evictLocked(const QDateTime& reference, QList<PendingNotice>& pending)
{
    m_events.removeIf([&](const Event& e) {
        return secondsSince(e.time, reference) > m_thresholdSeconds;
    });

    if (m_active && m_burstStart && secondsSince(*m_burstStart, reference) > m_maxDurationSeconds) {
        qInfo() << "Burst: max duration" << m_maxDurationSeconds << "s exceeded, ending burst";
        endLocked(pending);
        m_events.clear();
    }
}

void BurstDetector::endLocked(QList<PendingNotice>& pending)
{
    if (!m_active) return;
    m_active = false;
    BurstStatus status = statusLocked();
    m_burstStart.reset();
    qInfo().noquote() << "Burst ended:" << status.toString();
    pending.append(PendingNotice{ Notice::Ended, status });
}

void BurstDetector::deliver(const QList<PendingNotice>& pending)
{
    for (const PendingNotice& item : pending) {
        switch (item.notice) {
        case Notice::Started: emit burstStarted(item.status); break;
        case Notice::Continued: emit burstContinued(item.status); break;
        case Notice::Ended: emit burstEnded(item.status); break;
        }
    }
}
