module;
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

module sazman.core.contextsignal;

import sazman.utils.title_utils;

QString signalSourceName(SignalSource source)
{
    switch (source) {
    case SignalSource::Foreground: return QStringLiteral("Foreground");
    case SignalSource::Background: return QStringLiteral("Background");
    case SignalSource::Session: return QStringLiteral("Session");
    case SignalSource::Pattern: return QStringLiteral("Pattern");
    }
    return QStringLiteral("Unknown");
}

double ContextSignal::votingPower() const
{
    return weight * confidence;
}

bool ContextSignal::isValid() const
{
    const QString context = detectedContext.trimmed();
    return !context.isEmpty()
           && context != sazman::utils::unsortedContext()
           && weight > 0.0
           && confidence > 0.0;
}

QString ContextSignal::toString() const
{
    QString text = QStringLiteral("%1: %2 (weight %3, confidence %4, power %5)")
                       .arg(signalSourceName(source), detectedContext)
                       .arg(weight, 0, 'f', 2)
                       .arg(confidence, 0, 'f', 2)
                       .arg(votingPower(), 0, 'f', 3);
    if (wasBoosted) text += QStringLiteral(" [boosted from %1]").arg(originalWeight, 0, 'f', 2);
    if (!metadata.isEmpty()) text += QStringLiteral(" {%1}").arg(metadata);
    return text;
}

bool DetectionResult::hasConsensus() const
{
    int agreeing = 0;
    for (const auto& signal : contextSignals) {
        if (signal.detectedContext == detectedContext) ++agreeing;
    }
    return agreeing > 1;
}

int DetectionResult::validSignalCount() const
{
    int count = 0;
    for (const auto& signal : contextSignals) {
        if (signal.isValid()) ++count;
    }
    return count;
}

QString DetectionResult::toString() const
{
    QStringList lines;
    lines << QStringLiteral("Detected: %1 (confidence %2, score %3, %4 ms)")
                 .arg(detectedContext)
                 .arg(overallConfidence, 0, 'f', 2)
                 .arg(winningScore, 0, 'f', 3)
                 .arg(detectionDurationMs);
    if (boostApplied) lines << QStringLiteral("Boost: %1").arg(boostReason.value_or(QString()));
    for (const auto& signal : contextSignals) lines << QStringLiteral("  ") + signal.toString();
    return lines.join(QLatin1Char('\n'));
}
