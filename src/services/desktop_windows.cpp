module;
#include <QDebug>
#include <QFile>
#include <QList>
#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QtGlobal>

module sazman.services.desktop_windows;

import sazman.utils.title_utils;

DesktopWindowProvider::DesktopWindowProvider(int commandTimeoutMs)
    : m_commandTimeoutMs(qMax(100, commandTimeoutMs))
{
}

bool DesktopWindowProvider::isSupported() const
{
#if defined(Q_OS_LINUX)
    return !QStandardPaths::findExecutable(QStringLiteral("xdotool")).isEmpty();
#else
    return false;
#endif
}

QString DesktopWindowProvider::runTool(const QString& program, const QStringList& arguments) const
{
    QProcess proc;
    proc.start(program, arguments);
    if (!proc.waitForStarted(m_commandTimeoutMs)) return {};
    if (!proc.waitForFinished(m_commandTimeoutMs)) {
        proc.kill();
        proc.waitForFinished(100);
        return {};
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) return {};
    return QString::fromUtf8(proc.readAllStandardOutput()).trimmed();
}

QString DesktopWindowProvider::processNameForPid(qint64 pid) const
{
#if defined(Q_OS_LINUX)
    if (pid <= 0) return {};
    QFile file(QStringLiteral("/proc/%1/comm").arg(pid));
    if (!file.open(QIODevice::ReadOnly)) return {};
    return QString::fromUtf8(file.readAll()).trimmed();
#else
    Q_UNUSED(pid)
    return {};
#endif
}

QString DesktopWindowProvider::activeTitle()
{
#if defined(Q_OS_LINUX)
    return runTool(QStringLiteral("xdotool"), { QStringLiteral("getactivewindow"), QStringLiteral("getwindowname") });
#else
    return {};
#endif
}

QString DesktopWindowProvider::activeProcessName()
{
#if defined(Q_OS_LINUX)
    const QString pid = runTool(QStringLiteral("xdotool"), { QStringLiteral("getactivewindow"), QStringLiteral("getwindowpid") });
    bool ok = false;
    const qint64 value = pid.toLongLong(&ok);
    return ok ? processNameForPid(value) : QString();
#else
    return {};
#endif
}

QList<WindowObservation> DesktopWindowProvider::enumerate(const QString& applicationName)
{
    QList<WindowObservation> windows;
#if defined(Q_OS_LINUX)
    // wmctrl -lp: "<hex id> <desktop> <pid> <host> <title...>"
    const QString listing = runTool(QStringLiteral("wmctrl"), { QStringLiteral("-lp") });
    if (listing.isEmpty()) return windows;

    bool ok = false;
    const qulonglong activeId = runTool(QStringLiteral("xdotool"), { QStringLiteral("getactivewindow") }).toULongLong(&ok);
    const bool haveActive = ok;

    const QStringList lines = listing.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        const QStringList parts = line.simplified().split(QLatin1Char(' '));
        if (parts.size() < 4) continue;

        WindowObservation window;
        window.id = parts.at(0);
        window.processName = processNameForPid(parts.at(2).toLongLong());
        window.title = parts.size() > 4 ? parts.mid(4).join(QLatin1Char(' ')) : QString();
        if (window.title.isEmpty()) continue;
        if (!sazman::utils::isSourceWindow(window.title, window.processName, applicationName)) continue;

        bool idOk = false;
        const qulonglong id = window.id.toULongLong(&idOk, 0);
        window.isActiveFocus = haveActive && idOk && id == activeId;
        windows.append(window);
    }
#else
    Q_UNUSED(applicationName)
#endif
    return windows;
}
