#ifndef SFTPSESSION_H
#define SFTPSESSION_H

#include "remotesession.h"

#include <QUrl>
#include <libssh/libssh.h>
#include <libssh/sftp.h>

/**
 * @brief One SSH connection with its SFTP channel.
 *
 * libssh sessions must not be shared between threads, so every stream and
 * every listing opens its own connection.
 */
class SftpConnection
{
public:
    SftpConnection() = default;
    ~SftpConnection();

    bool open(const QUrl &url, const QString &user, const QString &password, long timeoutSeconds,
              QString *errorOut);

    sftp_session sftp() const { return m_sftp; }
    QString sshError() const;
    QString sftpError(const QString &what) const;

private:
    Q_DISABLE_COPY(SftpConnection)

    ssh_session m_ssh = nullptr;
    sftp_session m_sftp = nullptr;
};

/**
 * @brief RemoteSession over SFTP (libssh), selected by an `sftp://` remote URL.
 *
 * Each chunk stream opens the file on a connection of its own, seeks to the
 * chunk offset and reads at most the chunk length.
 */
class SftpSession : public RemoteSession
{
public:
    SftpSession(const QUrl &url, const QString &user, const QString &password, long timeoutSeconds = 30);

    bool list(const QString &directory, QList<RemoteEntry> *entries, QString *errorOut) override;
    std::unique_ptr<QIODevice> openRead(const QString &remotePath, qint64 offset, qint64 length,
                                        QString *errorOut) override;
    bool remove(const QString &remotePath, QString *errorOut) override;

    static bool isSftpUrl(const QUrl &url);

private:
    std::unique_ptr<SftpConnection> connect(QString *errorOut) const;

    QUrl m_url;
    QString m_user;
    QString m_password;
    long m_timeoutSeconds;
};

/**
 * @brief Read-only stream over one open remote file, bounded to `length` bytes.
 */
class SftpRangeReader : public QIODevice
{
    Q_OBJECT
public:
    SftpRangeReader(std::unique_ptr<SftpConnection> connection, sftp_file file, qint64 length);
    ~SftpRangeReader() override;

    bool isSequential() const override { return true; }

protected:
    qint64 readData(char *data, qint64 maxSize) override;
    qint64 writeData(const char *data, qint64 maxSize) override;

private:
    std::unique_ptr<SftpConnection> m_connection;
    sftp_file m_file;
    qint64 m_remaining;
};

#endif // SFTPSESSION_H
