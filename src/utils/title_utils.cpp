module;
#include <QFileInfo>
#include <QRegularExpression>
#include <QString>

module sazman.utils.title_utils;

namespace sazman::utils {

QString unsortedContext()
{
    return QStringLiteral("Unsorted");
}

QString defaultSourceApplication()
{
    return QStringLiteral("Telegram");
}

QString extractGroupName(const QString& windowTitle, const QString& applicationName)
{
    QString title = windowTitle.trimmed();
    if (title.isEmpty()) return unsortedContext();

    // \d and \s must also match Arabic-Indic digits and non-ASCII spaces.
    constexpr auto unicode = QRegularExpression::UseUnicodePropertiesOption;
    static const QRegularExpression unreadPrefix(QStringLiteral("^\\(\\d+\\)\\s*"), unicode);
    static const QRegularExpression dashedCount(QStringLiteral("\\s*[\\x{2013}\\x{2014}-]\\s*\\(\\d+\\)$"), unicode);
    static const QRegularExpression trailingCount(QStringLiteral("\\s*\\(\\d+\\)$"), unicode);
    static const QRegularExpression decoration(QStringLiteral(
        "[^\\x{0600}-\\x{06FF}\\x{0750}-\\x{077F}\\x{FB50}-\\x{FDFF}\\x{FE70}-\\x{FEFF}a-zA-Z0-9\\s\\-_\\.]+"),
        unicode);
    static const QRegularExpression whitespace(QStringLiteral("\\s+"), unicode);

    title.remove(unreadPrefix);
    title.remove(dashedCount);
    title.remove(trailingCount);

    const QString app = applicationName.trimmed();
    if (!app.isEmpty()) {
        const QRegularExpression appSuffix(
            QStringLiteral("\\s*[\\x{2013}\\x{2014}-]\\s*%1$").arg(QRegularExpression::escape(app)),
            QRegularExpression::CaseInsensitiveOption | unicode);
        title.remove(appSuffix);
    }

    title.remove(decoration);
    title.replace(whitespace, QStringLiteral(" "));

    // Trim the separator characters left behind by the removals.
    qsizetype begin = 0;
    qsizetype end = title.size();
    const auto isTrimChar = [](QChar c) {
        return c == u' ' || c == u'-' || c == u'_' || c == u'.';
    };
    while (begin < end && isTrimChar(title.at(begin))) ++begin;
    while (end > begin && isTrimChar(title.at(end - 1))) --end;
    title = title.mid(begin, end - begin);

    if (title.isEmpty()) return unsortedContext();
    if (!app.isEmpty() && title.compare(app, Qt::CaseInsensitive) == 0) return unsortedContext();
    return title;
}

bool isSourceWindow(const QString& windowTitle, const QString& processName, const QString& applicationName)
{
    const QString title = windowTitle.trimmed();
    const QString app = applicationName.trimmed();
    if (title.isEmpty() || app.isEmpty()) return false;

    const QString process = processName.trimmed();
    if (process.compare(app, Qt::CaseInsensitive) == 0) return true;
    if (process.compare(app + QStringLiteral(".exe"), Qt::CaseInsensitive) == 0) return true;

    if (title.endsWith(QStringLiteral(" - ") + app, Qt::CaseInsensitive)) return true;
    if (title.endsWith(QStringLiteral(" \u2013 ") + app, Qt::CaseInsensitive)) return true;

    return title.compare(app, Qt::CaseInsensitive) == 0;
}

QString fileExtension(const QString& fileName)
{
    const QString suffix = QFileInfo(fileName).suffix();
    if (suffix.isEmpty()) return QString();
    return QStringLiteral(".") + suffix.toLower();
}

} // namespace sazman::utils
