/*!
 * @file        pattern_store.cppm
 * @brief       JSON-backed store of learned file patterns.
 * @details     Keeps FilePattern records in memory and mirrors them to a JSON
 *              document on every change. The document is written atomically
 *              through QSaveFile, so a crash never leaves a truncated file.
 *
 *              An empty path keeps the store purely in memory, which is what
 *              the tests and the dry-run mode of the daemon use.
 *
 * @author      Sazman developers
 * @since       14 Mar 2026
 * @copyright   Copyright (c) 2026 The Sazman Project. All rights reserved.
 * @license     MIT, see LICENSE.md in the project root.
 */

module;
#include <QByteArray>
#include <optional>
#include <QDateTime>
#include <QList>
#include <QMutex>
#include <QString>

#ifndef Q_MOC_RUN
export module sazman.services.pattern_store;
import sazman.core.models;
import sazman.services.providers;
#endif

#ifdef Q_MOC_RUN
#define SAZMAN_MODULE_EXPORT
#else
#define SAZMAN_MODULE_EXPORT export
#endif

/**
 * @brief PatternStore persisted as a JSON document.
 *
 * All methods are thread-safe; the fusion engine calls bestPattern() from
 * its worker pool while feedback is recorded from the caller's thread.
 */
SAZMAN_MODULE_EXPORT class JsonPatternStore : public PatternStore {
public:
    /**
     * @brief Opens the store and loads any existing document.
     * @param path JSON file path, empty for an in-memory store.
     */
    explicit JsonPatternStore(const QString& path = QString());

    std::optional<FilePattern> bestPattern(const QString& fileName,
                                           const QString& extension,
                                           const QDateTime& time) override;
    int savePattern(const FilePattern& pattern) override;

    /**
     * @brief All patterns matching a file, best first.
     */
    QList<FilePattern> matchingPatterns(const QString& fileName,
                                        const QString& extension,
                                        const QDateTime& time) const;

    /**
     * @brief Records a prediction outcome for a stored pattern.
     * @return false if the pattern does not exist.
     */
    bool updatePatternAccuracy(int patternId, bool wasCorrect, const QDateTime& now);

    /**
     * @brief Patterns predicting a group, best first.
     */
    QList<FilePattern> patternsForGroup(const QString& groupName) const;

    /**
     * @brief Removes patterns that proved unreliable.
     *
     * A pattern is removed when its confidence is below the threshold and it
     * has been observed at least minTimesSeen times.
     *
     * @return Number of removed patterns.
     */
    int deleteLowConfidencePatterns(double threshold, int minTimesSeen);

    QList<FilePattern> allPatterns() const;
    int patternCount() const;

    /**
     * @brief Path of the backing document, empty when in memory.
     */
    QString path() const;

private:
    void load();
    QByteArray serializeLocked() const;
    void persist(QMutexLocker<QMutex>& locker);
    static void sortBest(QList<FilePattern>& patterns);

    mutable QMutex m_mutex;            //!< Guards every member below
    QString m_path;                    //!< Backing document
    QList<FilePattern> m_patterns;     //!< Stored patterns
    int m_nextId = 1;                  //!< Next identifier to assign
    quint64 m_generation = 0;          //!< Snapshot counter

    QMutex m_writeMutex;               //!< Serializes file writes
    quint64 m_writtenGeneration = 0;   //!< Newest snapshot on disk
};
