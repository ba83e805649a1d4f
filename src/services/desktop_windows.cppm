/*!
 * @file        desktop_windows.cppm
 * @brief       Desktop-backed foreground and window enumeration providers.
 * @details     Implements ForegroundProvider and WindowEnumerator on top of the
 *              desktop's own tooling. On X11 desktops the focused window is
 *              read with `xdotool` and the window list with `wmctrl -lp`;
 *              process names come from /proc/<pid>/comm.
 *
 *              When the tooling is missing or the platform is not supported,
 *              both providers report nothing (empty title, empty list) and the
 *              engine simply runs without those signals.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <QList>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module sazman.services.desktop_windows;
import sazman.services.providers;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief Reads window state from the running desktop session.
 *
 * Stateless apart from the command timeout; safe to share between the
 * fusion engine (foreground) and the window tracker (enumeration).
 */
SAZMAN_MODULE_EXPORT class DesktopWindowProvider : public ForegroundProvider, public WindowEnumerator {
public:
    /**
     * @param commandTimeoutMs Upper bound for each helper process.
     */
    explicit DesktopWindowProvider(int commandTimeoutMs = 1000);

    QString activeTitle() override;
    QString activeProcessName() override;
    QList<WindowObservation> enumerate(const QString& applicationName) override;

    /**
     * @brief Whether the helper tools are available on this system.
     */
    bool isSupported() const;

private:
    /**
     * @brief Runs a helper and returns its trimmed stdout, empty on failure.
     */
    QString runTool(const QString& program, const QStringList& arguments) const;

    /**
     * @brief Resolves a process id to its short process name.
     */
    QString processNameForPid(qint64 pid) const;

    int m_commandTimeoutMs;   //!< Per-command timeout in milliseconds
};
