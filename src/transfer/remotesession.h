#ifndef REMOTESESSION_H
#define REMOTESESSION_H

#include "pipelinetypes.h"

#include <QIODevice>
#include <QList>
#include <QString>
#include <memory>

/**
 * @brief Connected, authenticated access to a remote file store.
 *
 * openRead() must be callable from several threads at once: the transfer
 * engine opens one stream per chunk on its worker pool.
 */
class RemoteSession
{
public:
    virtual ~RemoteSession() = default;

    virtual bool list(const QString &directory, QList<RemoteEntry> *entries, QString *errorOut) = 0;

    // Returns a readable stream positioned at `offset` that yields at most
    // `length` bytes, or nullptr with errorOut filled.
    virtual std::unique_ptr<QIODevice> openRead(const QString &remotePath, qint64 offset, qint64 length,
                                                QString *errorOut) = 0;

    virtual bool remove(const QString &remotePath, QString *errorOut) = 0;
};

#endif // REMOTESESSION_H
