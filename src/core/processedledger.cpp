#include "processedledger.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

ProcessedLedger::ProcessedLedger(const QString& tempDir)
    : m_directory(QDir(tempDir).filePath(".processed"))
{
}

QString ProcessedLedger::markerPathFor(const QString& remotePath) const
{
    const QByteArray hash = QCryptographicHash::hash(remotePath.toUtf8(), QCryptographicHash::Sha1).toHex();
    return QDir(m_directory).filePath(QString::fromLatin1(hash) + ".json");
}

bool ProcessedLedger::contains(const RemoteEntry& entry) const
{
    QFile file(markerPathFor(entry.remotePath));
    if (!file.open(QIODevice::ReadOnly))
        return false;

    const QJsonObject root = QJsonDocument::fromJson(file.readAll()).object();
    if (root["remotePath"].toString() != entry.remotePath)
        return false;
    if (root["size"].toVariant().toLongLong() != entry.sizeBytes)
        return false;

    const QDateTime recorded = QDateTime::fromString(root["modified"].toString(), Qt::ISODateWithMs);
    if (recorded.isValid() && entry.modifiedTime.isValid())
        return recorded == entry.modifiedTime;
    return true;
}

bool ProcessedLedger::record(const RemoteEntry& entry, const QString& finalPath, QString* errorOut)
{
    if (!QDir().mkpath(m_directory))
    {
        if (errorOut)
            *errorOut = QString("Cannot create %1").arg(m_directory);
        return false;
    }

    QJsonObject root;
    root["remotePath"] = entry.remotePath;
    root["size"] = static_cast<double>(entry.sizeBytes);
    root["modified"] = entry.modifiedTime.toString(Qt::ISODateWithMs);
    root["finalPath"] = finalPath;
    root["processedAt"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);

    QSaveFile file(markerPathFor(entry.remotePath));
    if (!file.open(QIODevice::WriteOnly))
    {
        if (errorOut)
            *errorOut = QString("Cannot write %1: %2").arg(file.fileName(), file.errorString());
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit())
    {
        if (errorOut)
            *errorOut = QString("Cannot commit %1: %2").arg(file.fileName(), file.errorString());
        return false;
    }
    return true;
}
