#ifndef TRANSFERMARKER_H
#define TRANSFERMARKER_H

#include "pipelinetypes.h"

#include <QList>
#include <QPair>
#include <QString>

/**
 * @brief Resume record stored beside a temp download as `<temp>.origin`.
 *
 * Remembers which remote file the temp belongs to and the exact ranges that
 * were fully written. A range only counts on resume if a chunk of the new
 * plan has the same offset and length.
 */
struct TransferMarker
{
    QString remotePath;
    qint64 sizeBytes = 0;
    QDateTime modifiedTime;
    QList<QPair<qint64, qint64>> completedRanges;

    static QString pathFor(const QString &tempPath);

    static bool load(const QString &markerPath, TransferMarker *out, QString *errorOut = nullptr);
    bool save(const QString &markerPath, QString *errorOut = nullptr) const;

    bool describes(const RemoteEntry &entry) const;
    bool hasCompleted(const ChunkRange &range) const;
};

#endif // TRANSFERMARKER_H
