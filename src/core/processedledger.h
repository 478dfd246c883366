#ifndef PROCESSEDLEDGER_H
#define PROCESSEDLEDGER_H

#include "pipelinetypes.h"

#include <QString>

/**
 * @brief Remembers remote files that already went through the pipeline.
 *
 * One small JSON file per item under `<local_temp>/.processed/`, named by a
 * hash of the remote path. A record only matches an entry with the same
 * size (and modification time, when both sides know it), so a re-uploaded
 * file is processed again.
 */
class ProcessedLedger
{
public:
    explicit ProcessedLedger(const QString &tempDir);

    bool contains(const RemoteEntry &entry) const;
    bool record(const RemoteEntry &entry, const QString &finalPath, QString *errorOut = nullptr);

    QString directory() const { return m_directory; }
    QString markerPathFor(const QString &remotePath) const;

private:
    QString m_directory;
};

#endif // PROCESSEDLEDGER_H
