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

module sazman.core.windowtracker;

import sazman.utils.title_utils;

namespace {

constexpr double kActiveConfidence = 1.0;
constexpr double kVisibleConfidence = 0.7;

} // namespace

WindowTracker::WindowTracker(WindowEnumerator* enumerator, QObject* parent)
    : QObject(parent)
    , m_enumerator(enumerator)
    , m_sourceApplication(sazman::utils::defaultSourceApplication())
{
    if (!m_enumerator) throw std::invalid_argument("WindowTracker requires a window enumerator");

    m_scanTimer.setInterval(2000);
    connect(&m_scanTimer, &QTimer::timeout, this, &WindowTracker::onScanTimer);
}

void WindowTracker::scan(const QDateTime& now)
{
    const QString application = sourceApplication();

    QList<WindowObservation> observed;
    try {
        observed = m_enumerator->enumerate(application);
    } catch (const std::exception& e) {
        qWarning() << "Window tracker: enumeration failed:" << e.what();
        return;
    }

    QList<WindowCandidate> detected;
    QList<WindowCandidate> activated;
    QList<WindowCandidate> removed;
    {
        QMutexLocker locker(&m_mutex);
        for (const WindowObservation& obs : observed) {
            if (obs.id.isEmpty()) continue;

            auto it = m_windows.find(obs.id);
            if (it != m_windows.end()) {
                WindowCandidate& window = it.value();
                const bool becameActive = obs.isActiveFocus && !window.isActive;
                if (window.title != obs.title) {
                    window.title = obs.title;
                    window.extractedGroupName.clear();
                }
                window.processName = obs.processName;
                window.isActive = obs.isActiveFocus;
                window.lastSeen = now;
                window.confidenceScore = obs.isActiveFocus ? kActiveConfidence : kVisibleConfidence;
                ++window.seenCount;
                if (becameActive) activated.append(window);
                continue;
            }

            WindowCandidate window;
            window.id = obs.id;
            window.title = obs.title;
            window.processName = obs.processName;
            window.isActive = obs.isActiveFocus;
            window.firstSeen = now;
            window.lastSeen = now;
            window.confidenceScore = obs.isActiveFocus ? kActiveConfidence : kVisibleConfidence;
            m_windows.insert(window.id, window);
            detected.append(window);
        }
        enforceLimitLocked(removed);
    }

    for (const WindowCandidate& window : detected) {
        qDebug() << "Window tracker: detected" << window.title;
        emit windowDetected(window);
    }
    for (const WindowCandidate& window : activated) emit windowActivated(window);
    for (const WindowCandidate& window : removed) emit windowRemoved(window);
}

QList<WindowCandidate> WindowTracker::sortedLocked() const
{
    QList<WindowCandidate> windows = m_windows.values();
    std::sort(windows.begin(), windows.end(), [](const WindowCandidate& a, const WindowCandidate& b) {
        if (a.lastSeen != b.lastSeen) return a.lastSeen > b.lastSeen;
        return a.id < b.id;
    });
    return windows;
}

void WindowTracker::enforceLimitLocked(QList<WindowCandidate>& removed)
{
    while (m_windows.size() > m_maxTrackedWindows) {
        auto oldest = m_windows.begin();
        for (auto it = m_windows.begin(); it != m_windows.end(); ++it) {
            if (it->lastSeen < oldest->lastSeen
                || (it->lastSeen == oldest->lastSeen && it->id < oldest->id)) {
                oldest = it;
            }
        }
        qDebug() << "Window tracker: evicted" << oldest->title;
        removed.append(oldest.value());
        m_windows.erase(oldest);
    }
}

QList<WindowCandidate> WindowTracker::all() const
{
    QMutexLocker locker(&m_mutex);
    return sortedLocked();
}

std::optional<WindowCandidate> WindowTracker::mostRecent() const
{
    QMutexLocker locker(&m_mutex);
    const QList<WindowCandidate> windows = sortedLocked();
    if (windows.isEmpty()) return std::nullopt;
    return windows.first();
}

QList<WindowCandidate> WindowTracker::recent(int withinSeconds, const QDateTime& now) const
{
    QMutexLocker locker(&m_mutex);
    QList<WindowCandidate> windows = sortedLocked();
    windows.removeIf([&](const WindowCandidate& w) { return w.ageSeconds(now) > withinSeconds; });
    return windows;
}

std::optional<WindowCandidate> WindowTracker::byId(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_windows.constFind(id);
    if (it == m_windows.constEnd()) return std::nullopt;
    return it.value();
}

std::optional<RecentGroup> WindowTracker::bestRecentGroupName(const QDateTime& now, int withinSeconds)
{
    QMutexLocker locker(&m_mutex);

    const QString unsorted = sazman::utils::unsortedContext();
    const QList<WindowCandidate> windows = sortedLocked();

    const WindowCandidate* best = nullptr;
    for (const WindowCandidate& window : windows) {
        if (window.ageSeconds(now) > withinSeconds) continue;
        if (window.extractedGroupName.isEmpty() || window.extractedGroupName == unsorted) continue;
        // Sorted most recent first, so a strict comparison keeps the most recent on ties.
        if (!best || window.confidenceScore > best->confidenceScore) best = &window;
    }
    if (best) {
        qDebug() << "Window tracker: best recent group" << best->extractedGroupName << best->confidenceScore;
        return RecentGroup{ best->extractedGroupName, best->confidenceScore, best->lastSeen };
    }

    if (windows.isEmpty()) return std::nullopt;
    const WindowCandidate& latest = windows.first();
    if (latest.ageSeconds(now) > withinSeconds) return std::nullopt;

    const QString extracted = sazman::utils::extractGroupName(latest.title, m_sourceApplication);
    if (extracted == unsorted) return std::nullopt;

    m_windows[latest.id].extractedGroupName = extracted;
    qDebug() << "Window tracker: extracted" << extracted << "from most recent window";
    return RecentGroup{ extracted, latest.confidenceScore, latest.lastSeen };
}

int WindowTracker::evictExpired(const QDateTime& now, int timeoutSeconds)
{
    QList<WindowCandidate> removed;
    {
        QMutexLocker locker(&m_mutex);
        for (auto it = m_windows.begin(); it != m_windows.end();) {
            if (it->isExpired(timeoutSeconds, now)) {
                removed.append(it.value());
                it = m_windows.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (!removed.isEmpty()) qDebug() << "Window tracker: expired" << removed.size() << "windows";
    for (const WindowCandidate& window : removed) emit windowRemoved(window);
    return static_cast<int>(removed.size());
}

int WindowTracker::trackedCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_windows.size());
}

void WindowTracker::clear()
{
    QMutexLocker locker(&m_mutex);
    m_windows.clear();
}

void WindowTracker::start()
{
    if (m_scanTimer.isActive()) return;
    qInfo() << "Window tracker: scanning every" << m_scanTimer.interval() << "ms";
    m_scanTimer.start();
    onScanTimer();
}

void WindowTracker::stop()
{
    m_scanTimer.stop();
}

bool WindowTracker::isRunning() const
{
    return m_scanTimer.isActive();
}

int WindowTracker::scanIntervalMs() const
{
    return m_scanTimer.interval();
}

void WindowTracker::setScanIntervalMs(int intervalMs)
{
    if (intervalMs < 250 || intervalMs > 60000) {
        qWarning() << "Window tracker: rejected scan interval" << intervalMs << "keeping" << m_scanTimer.interval();
        return;
    }
    m_scanTimer.setInterval(intervalMs);
}

int WindowTracker::maxTrackedWindows() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxTrackedWindows;
}

void WindowTracker::setMaxTrackedWindows(int count)
{
    QList<WindowCandidate> removed;
    {
        QMutexLocker locker(&m_mutex);
        if (count < 1 || count > 500) {
            qWarning() << "Window tracker: rejected window limit" << count << "keeping" << m_maxTrackedWindows;
            return;
        }
        m_maxTrackedWindows = count;
        enforceLimitLocked(removed);
    }
    for (const WindowCandidate& window : removed) emit windowRemoved(window);
}

QString WindowTracker::sourceApplication() const
{
    QMutexLocker locker(&m_mutex);
    return m_sourceApplication;
}

void WindowTracker::setSourceApplication(const QString& applicationName)
{
    const QString name = applicationName.trimmed();
    if (name.isEmpty()) {
        qWarning() << "Window tracker: rejected empty source application";
        return;
    }
    QMutexLocker locker(&m_mutex);
    if (m_sourceApplication == name) return;
    m_sourceApplication = name;
    m_windows.clear();
}

void WindowTracker::onScanTimer()
{
    const QDateTime now = QDateTime::currentDateTime();
    scan(now);
    evictExpired(now);
}
