#include "sftpsession.h"

#include <QBuffer>
#include <fcntl.h>

static QString joinRemotePath(const QString& directory, const QString& name)
{
    if (directory.isEmpty() || directory == "/")
        return "/" + name;
    return directory.endsWith('/') ? directory + name : directory + "/" + name;
}

SftpConnection::~SftpConnection()
{
    if (m_sftp)
        sftp_free(m_sftp);
    if (m_ssh)
    {
        if (ssh_is_connected(m_ssh))
            ssh_disconnect(m_ssh);
        ssh_free(m_ssh);
    }
}

QString SftpConnection::sshError() const
{
    return m_ssh ? QString::fromUtf8(ssh_get_error(m_ssh)) : QString("no SSH session");
}

QString SftpConnection::sftpError(const QString& what) const
{
    const int code = m_sftp ? sftp_get_error(m_sftp) : -1;
    return QString("%1 (SFTP error %2: %3)").arg(what).arg(code).arg(sshError());
}

bool SftpConnection::open(const QUrl& url, const QString& user, const QString& password, long timeoutSeconds,
                          QString* errorOut)
{
    m_ssh = ssh_new();
    if (!m_ssh)
    {
        if (errorOut)
            *errorOut = "Cannot allocate an SSH session";
        return false;
    }

    const QByteArray host = url.host().toUtf8();
    const QByteArray login = (url.userName().isEmpty() ? user : url.userName()).toUtf8();
    const int port = url.port(22);
    ssh_options_set(m_ssh, SSH_OPTIONS_HOST, host.constData());
    ssh_options_set(m_ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(m_ssh, SSH_OPTIONS_TIMEOUT, &timeoutSeconds);
    if (!login.isEmpty())
        ssh_options_set(m_ssh, SSH_OPTIONS_USER, login.constData());

    if (ssh_connect(m_ssh) != SSH_OK)
    {
        if (errorOut)
            *errorOut = QString("Cannot connect to %1:%2: %3").arg(url.host()).arg(port).arg(sshError());
        return false;
    }

    // Unknown hosts are accepted for this session only; a changed key is refused.
    const ssh_known_hosts_e known = ssh_session_is_known_server(m_ssh);
    if (known == SSH_KNOWN_HOSTS_CHANGED || known == SSH_KNOWN_HOSTS_OTHER || known == SSH_KNOWN_HOSTS_ERROR)
    {
        if (errorOut)
            *errorOut = QString("Host key of %1 does not match known_hosts").arg(url.host());
        return false;
    }

    const QByteArray secret = (url.password().isEmpty() ? password : url.password()).toUtf8();
    if (ssh_userauth_password(m_ssh, nullptr, secret.constData()) != SSH_AUTH_SUCCESS)
    {
        if (errorOut)
            *errorOut = QString("Authentication as %1 failed: %2").arg(QString::fromUtf8(login), sshError());
        return false;
    }

    m_sftp = sftp_new(m_ssh);
    if (!m_sftp || sftp_init(m_sftp) != SSH_OK)
    {
        if (errorOut)
            *errorOut = sftpError("Cannot start the SFTP subsystem");
        return false;
    }
    return true;
}

SftpSession::SftpSession(const QUrl& url, const QString& user, const QString& password, long timeoutSeconds)
    : m_url(url),
    m_user(user),
    m_password(password),
    m_timeoutSeconds(timeoutSeconds)
{
}

bool SftpSession::isSftpUrl(const QUrl& url)
{
    return url.scheme().compare("sftp", Qt::CaseInsensitive) == 0 && !url.host().isEmpty();
}

std::unique_ptr<SftpConnection> SftpSession::connect(QString* errorOut) const
{
    auto connection = std::make_unique<SftpConnection>();
    if (!connection->open(m_url, m_user, m_password, m_timeoutSeconds, errorOut))
        return nullptr;
    return connection;
}

bool SftpSession::list(const QString& directory, QList<RemoteEntry>* entries, QString* errorOut)
{
    std::unique_ptr<SftpConnection> connection = connect(errorOut);
    if (!connection)
        return false;

    sftp_dir dir = sftp_opendir(connection->sftp(), directory.toUtf8().constData());
    if (!dir)
    {
        if (errorOut)
            *errorOut = connection->sftpError("Cannot open remote directory " + directory);
        return false;
    }

    entries->clear();
    while (sftp_attributes attributes = sftp_readdir(connection->sftp(), dir))
    {
        if (attributes->type == SSH_FILEXFER_TYPE_REGULAR && attributes->name)
        {
            RemoteEntry entry;
            entry.remotePath = joinRemotePath(directory, QString::fromUtf8(attributes->name));
            entry.sizeBytes = static_cast<qint64>(attributes->size);
            entry.modifiedTime = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(attributes->mtime), Qt::UTC);
            entries->append(entry);
        }
        sftp_attributes_free(attributes);
    }

    const bool complete = sftp_dir_eof(dir) == 1;
    sftp_closedir(dir);
    if (!complete)
    {
        if (errorOut)
            *errorOut = connection->sftpError("Listing of " + directory + " ended early");
        return false;
    }
    return true;
}

std::unique_ptr<QIODevice> SftpSession::openRead(const QString& remotePath, qint64 offset, qint64 length,
                                                 QString* errorOut)
{
    if (length <= 0)
    {
        auto empty = std::make_unique<QBuffer>();
        empty->open(QIODevice::ReadOnly);
        return empty;
    }

    std::unique_ptr<SftpConnection> connection = connect(errorOut);
    if (!connection)
        return nullptr;

    sftp_file file = sftp_open(connection->sftp(), remotePath.toUtf8().constData(), O_RDONLY, 0);
    if (!file)
    {
        if (errorOut)
            *errorOut = connection->sftpError("Cannot open " + remotePath);
        return nullptr;
    }
    if (sftp_seek64(file, static_cast<uint64_t>(offset)) < 0)
    {
        if (errorOut)
            *errorOut = connection->sftpError(QString("Cannot seek %1 to offset %2").arg(remotePath).arg(offset));
        sftp_close(file);
        return nullptr;
    }

    auto reader = std::make_unique<SftpRangeReader>(std::move(connection), file, length);
    if (!reader->open(QIODevice::ReadOnly | QIODevice::Unbuffered))
    {
        if (errorOut)
            *errorOut = "Cannot open stream for " + remotePath;
        return nullptr;
    }
    return reader;
}

bool SftpSession::remove(const QString& remotePath, QString* errorOut)
{
    std::unique_ptr<SftpConnection> connection = connect(errorOut);
    if (!connection)
        return false;

    if (sftp_unlink(connection->sftp(), remotePath.toUtf8().constData()) < 0)
    {
        if (errorOut)
            *errorOut = connection->sftpError("Cannot remove " + remotePath);
        return false;
    }
    return true;
}

SftpRangeReader::SftpRangeReader(std::unique_ptr<SftpConnection> connection, sftp_file file, qint64 length)
    : m_connection(std::move(connection)),
    m_file(file),
    m_remaining(length)
{
}

SftpRangeReader::~SftpRangeReader()
{
    // The file handle belongs to the channel, close it before the connection goes
    if (m_file)
        sftp_close(m_file);
}

qint64 SftpRangeReader::readData(char* data, qint64 maxSize)
{
    if (m_remaining == 0)
        return -1;
    const ssize_t got = sftp_read(m_file, data, static_cast<size_t>(qMin(maxSize, m_remaining)));
    if (got < 0)
    {
        setErrorString(m_connection->sftpError("Read failed"));
        return -1;
    }
    if (got == 0)
        return -1;
    m_remaining -= got;
    return got;
}

qint64 SftpRangeReader::writeData(const char* data, qint64 maxSize)
{
    Q_UNUSED(data);
    Q_UNUSED(maxSize);
    return -1;
}
