#ifndef LOCALREMOTESESSION_H
#define LOCALREMOTESESSION_H

#include "remotesession.h"

#include <QFile>

/**
 * @brief RemoteSession over a local directory.
 *
 * Used for move-local mode, where the temp folder itself is the store, and
 * by the tests as a stand-in for a network store. Remote paths are relative
 * to the root passed to the constructor.
 */
class LocalRemoteSession : public RemoteSession
{
public:
    explicit LocalRemoteSession(const QString &rootPath);

    bool list(const QString &directory, QList<RemoteEntry> *entries, QString *errorOut) override;
    std::unique_ptr<QIODevice> openRead(const QString &remotePath, qint64 offset, qint64 length,
                                        QString *errorOut) override;
    bool remove(const QString &remotePath, QString *errorOut) override;

    QString localPath(const QString &remotePath) const;

private:
    QString m_rootPath;
};

/**
 * @brief Read-only window of `length` bytes into a local file.
 */
class FileRangeReader : public QIODevice
{
    Q_OBJECT
public:
    FileRangeReader(const QString &path, qint64 offset, qint64 length);

    bool start(QString *errorOut);
    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override;

protected:
    qint64 readData(char *data, qint64 maxSize) override;
    qint64 writeData(const char *data, qint64 maxSize) override;

private:
    QFile m_file;
    qint64 m_offset;
    qint64 m_remaining;
};

#endif // LOCALREMOTESESSION_H
