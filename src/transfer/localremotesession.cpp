#include "localremotesession.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

static QString joinRemotePath(const QString& directory, const QString& name)
{
    if (directory.isEmpty() || directory == "/")
        return "/" + name;
    return directory.endsWith('/') ? directory + name : directory + "/" + name;
}

LocalRemoteSession::LocalRemoteSession(const QString& rootPath) : m_rootPath(rootPath)
{
}

QString LocalRemoteSession::localPath(const QString& remotePath) const
{
    QString relative = remotePath;
    while (relative.startsWith('/'))
        relative.remove(0, 1);
    return relative.isEmpty() ? m_rootPath : QDir(m_rootPath).filePath(relative);
}

bool LocalRemoteSession::list(const QString& directory, QList<RemoteEntry>* entries, QString* errorOut)
{
    QDir dir(localPath(directory));
    if (!dir.exists())
    {
        if (errorOut)
            *errorOut = QString("Directory not found: %1").arg(dir.absolutePath());
        return false;
    }

    entries->clear();
    // Hidden files are skipped: that covers marker files and in-flight placements.
    const QFileInfoList infos = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& info : infos)
    {
        const QString suffix = info.suffix();
        if (suffix == "part" || suffix == "origin")
            continue;

        RemoteEntry entry;
        entry.remotePath = joinRemotePath(directory, info.fileName());
        entry.sizeBytes = info.size();
        entry.modifiedTime = info.lastModified();
        entries->append(entry);
    }
    return true;
}

std::unique_ptr<QIODevice> LocalRemoteSession::openRead(const QString& remotePath, qint64 offset, qint64 length,
                                                        QString* errorOut)
{
    auto reader = std::make_unique<FileRangeReader>(localPath(remotePath), offset, length);
    if (!reader->start(errorOut))
    {
        return nullptr;
    }
    return reader;
}

bool LocalRemoteSession::remove(const QString& remotePath, QString* errorOut)
{
    QFile file(localPath(remotePath));
    if (!file.remove())
    {
        if (errorOut)
            *errorOut = QString("Cannot remove %1: %2").arg(remotePath, file.errorString());
        return false;
    }
    return true;
}

FileRangeReader::FileRangeReader(const QString& path, qint64 offset, qint64 length)
    : m_file(path),
    m_offset(offset),
    m_remaining(qMax<qint64>(0, length))
{
}

bool FileRangeReader::start(QString* errorOut)
{
    if (!m_file.open(QIODevice::ReadOnly))
    {
        if (errorOut)
            *errorOut = QString("Cannot open %1: %2").arg(m_file.fileName(), m_file.errorString());
        return false;
    }
    if (!m_file.seek(m_offset))
    {
        if (errorOut)
            *errorOut = QString("Cannot seek %1 to offset %2").arg(m_file.fileName()).arg(m_offset);
        return false;
    }
    return open(QIODevice::ReadOnly | QIODevice::Unbuffered);
}

qint64 FileRangeReader::bytesAvailable() const
{
    return qMin(m_remaining, m_file.bytesAvailable()) + QIODevice::bytesAvailable();
}

qint64 FileRangeReader::readData(char* data, qint64 maxSize)
{
    if (m_remaining == 0)
        return -1;
    const qint64 read = m_file.read(data, qMin(maxSize, m_remaining));
    if (read < 0)
    {
        setErrorString(m_file.errorString());
        return -1;
    }
    if (read == 0)
        return -1;
    m_remaining -= read;
    return read;
}

qint64 FileRangeReader::writeData(const char* data, qint64 maxSize)
{
    Q_UNUSED(data);
    Q_UNUSED(maxSize);
    return -1;
}
