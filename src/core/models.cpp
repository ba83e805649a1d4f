module;
#include <algorithm>
#include <QDateTime>
#include <QString>
#include <QStringList>

module sazman.core.models;

static double secondsBetween(const QDateTime& from, const QDateTime& to)
{
    if (!from.isValid() || !to.isValid()) return 0.0;
    return static_cast<double>(from.msecsTo(to)) / 1000.0;
}

bool DownloadSession::hasTimedOut(const QDateTime& now) const
{
    return isActive && secondsBetween(lastActivity, now) > timeoutSeconds;
}

double DownloadSession::idleSeconds(const QDateTime& now) const
{
    return std::max(0.0, secondsBetween(lastActivity, now));
}

void DownloadSession::touch(const QDateTime& now)
{
    lastActivity = now;
}

bool DownloadSession::addFile(const QString& fileName, const QDateTime& now)
{
    if (fileNames.contains(fileName)) return false;
    fileNames.append(fileName);
    fileCount = static_cast<int>(fileNames.size());
    touch(now);
    return true;
}

void DownloadSession::end(const QDateTime& now)
{
    isActive = false;
    endTime = now;
}

double WindowCandidate::ageSeconds(const QDateTime& now) const
{
    return std::max(0.0, secondsBetween(lastSeen, now));
}

bool WindowCandidate::isExpired(int timeoutSeconds, const QDateTime& now) const
{
    return ageSeconds(now) > timeoutSeconds;
}

QString WindowCandidate::toString(const QDateTime& now) const
{
    return QStringLiteral("%1 [%2] (seen %3x, confidence %4, age %5s)")
        .arg(title)
        .arg(isActive ? QStringLiteral("ACTIVE") : QStringLiteral("VISIBLE"))
        .arg(seenCount)
        .arg(confidenceScore, 0, 'f', 2)
        .arg(ageSeconds(now), 0, 'f', 0);
}

bool FilePattern::matches(const QString& fileName, const QString& fileExtension, const QDateTime& time) const
{
    if (extension && !extension->isEmpty()
        && fileExtension.compare(*extension, Qt::CaseInsensitive) != 0) {
        return false;
    }
    if (namePattern && !namePattern->isEmpty()
        && !fileName.contains(*namePattern, Qt::CaseInsensitive)) {
        return false;
    }
    if (hourOfDay && time.time().hour() != *hourOfDay) return false;
    // Qt numbers Monday..Sunday as 1..7.
    if (dayOfWeek && time.date().dayOfWeek() % 7 != *dayOfWeek) return false;
    return true;
}

void FilePattern::recordOutcome(bool wasCorrect, const QDateTime& now)
{
    ++timesSeen;
    if (wasCorrect) ++timesCorrect;
    confidenceScore = timesSeen > 0 ? static_cast<double>(timesCorrect) / timesSeen : 0.0;
    lastSeen = now;
}

QString FilePattern::description() const
{
    static const QStringList dayNames = {
        QStringLiteral("Sunday"), QStringLiteral("Monday"), QStringLiteral("Tuesday"),
        QStringLiteral("Wednesday"), QStringLiteral("Thursday"), QStringLiteral("Friday"),
        QStringLiteral("Saturday")
    };

    QStringList parts;
    if (extension && !extension->isEmpty()) parts << QStringLiteral("Extension: %1").arg(*extension);
    if (namePattern && !namePattern->isEmpty()) parts << QStringLiteral("Name: *%1*").arg(*namePattern);
    if (hourOfDay) parts << QStringLiteral("Hour: %1:00").arg(*hourOfDay);
    if (dayOfWeek && *dayOfWeek >= 0 && *dayOfWeek < dayNames.size()) {
        parts << QStringLiteral("Day: %1").arg(dayNames.at(*dayOfWeek));
    }
    return parts.isEmpty() ? QStringLiteral("Any file") : parts.join(QStringLiteral(", "));
}

double BurstStatus::durationSeconds() const
{
    if (!burstStartTime || !lastFileTime) return 0.0;
    return secondsBetween(*burstStartTime, *lastFileTime);
}

double BurstStatus::averageIntervalSeconds() const
{
    if (fileCount <= 1) return 0.0;
    return durationSeconds() / (fileCount - 1);
}

double BurstStatus::confidence() const
{
    if (fileCount < 2) return 0.0;
    const int saturation = std::max(2, saturationCount);
    if (fileCount >= saturation) return 1.0;

    const double countScore = std::min(static_cast<double>(fileCount) / saturation, 1.0);
    const double interval = averageIntervalSeconds();
    const double intervalScore = interval < 2.0 ? 1.0 : std::max(0.0, 1.0 - interval / 10.0);
    return (countScore + intervalScore) / 2.0;
}

QString BurstStatus::toString() const
{
    if (!isActive && fileCount == 0) return QStringLiteral("No burst detected");
    return QStringLiteral("Burst: %1 files in %2s (avg %3s/file, confidence %4)")
        .arg(fileCount)
        .arg(durationSeconds(), 0, 'f', 1)
        .arg(averageIntervalSeconds(), 0, 'f', 1)
        .arg(confidence(), 0, 'f', 2);
}
