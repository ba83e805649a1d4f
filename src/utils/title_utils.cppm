/*!
 * @file        title_utils.cppm
 * @brief       Window title parsing helpers for source-group extraction.
 * @details     Provides the pure text functions shared by the foreground
 *              signal and the background window tracker: recognizing a
 *              window that belongs to the source application and turning its
 *              title into a candidate group name.
 *
 *              Both signal sources must produce identical names for the same
 *              title, otherwise their votes would split across two spellings
 *              of one group.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module sazman.utils.title_utils;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

SAZMAN_MODULE_EXPORT namespace sazman::utils {

/**
 * @brief Returns the "no classification" sentinel.
 *
 * The sentinel is a real value distinct from an empty or absent context and
 * never counts as a valid vote.
 */
QString unsortedContext();

/**
 * @brief Returns the default source application name ("Telegram").
 */
QString defaultSourceApplication();

/**
 * @brief Extracts the group/channel name from a source-application window title.
 *
 * Applied in order: strip a leading unread marker "(N)", strip trailing
 * message count markers "– (N)" and "(N)", strip a trailing "– <app>" suffix,
 * drop decoration outside the permitted scripts, collapse whitespace.
 *
 * @param windowTitle Raw window title.
 * @param applicationName Bare application name used for suffix stripping.
 * @return Candidate group name, or the "Unsorted" sentinel.
 */
QString extractGroupName(const QString& windowTitle,
                         const QString& applicationName = QStringLiteral("Telegram"));

/**
 * @brief Checks whether a window belongs to the source application.
 *
 * The process name is checked first. The title check only accepts the
 * " - <app>" suffix form or the bare application name, so titles that merely
 * mention the application (an editor with a project of the same name) do not
 * match.
 *
 * @param windowTitle Window title.
 * @param processName Owning process name, with or without ".exe".
 * @param applicationName Bare application name.
 * @return true for a genuine source-application window.
 */
bool isSourceWindow(const QString& windowTitle,
                    const QString& processName,
                    const QString& applicationName = QStringLiteral("Telegram"));

/**
 * @brief Returns the lower-case extension of a file name including the dot.
 *
 * @param fileName File name or path.
 * @return Extension such as ".pdf", or an empty string.
 */
QString fileExtension(const QString& fileName);

} // namespace sazman::utils
