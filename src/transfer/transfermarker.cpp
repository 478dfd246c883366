#include "transfermarker.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

QString TransferMarker::pathFor(const QString& tempPath)
{
    return tempPath + ".origin";
}

bool TransferMarker::load(const QString& markerPath, TransferMarker* out, QString* errorOut)
{
    QFile file(markerPath);
    if (!file.open(QIODevice::ReadOnly))
    {
        if (errorOut)
            *errorOut = QString("Cannot open resume marker %1").arg(markerPath);
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        if (errorOut)
            *errorOut = QString("Resume marker %1 is corrupt: %2").arg(markerPath, parseError.errorString());
        return false;
    }

    const QJsonObject root = doc.object();
    TransferMarker marker;
    marker.remotePath = root["remotePath"].toString();
    marker.sizeBytes = root["size"].toVariant().toLongLong();
    marker.modifiedTime = QDateTime::fromString(root["modified"].toString(), Qt::ISODateWithMs);
    for (const QJsonValue& value : root["completed"].toArray())
    {
        const QJsonArray pair = value.toArray();
        if (pair.size() != 2)
            continue;
        marker.completedRanges.append(qMakePair(pair[0].toVariant().toLongLong(), pair[1].toVariant().toLongLong()));
    }
    *out = marker;
    return true;
}

bool TransferMarker::save(const QString& markerPath, QString* errorOut) const
{
    QJsonObject root;
    root["remotePath"] = remotePath;
    // JSON numbers are doubles, exact up to 2^53
    root["size"] = static_cast<double>(sizeBytes);
    root["modified"] = modifiedTime.toString(Qt::ISODateWithMs);
    QJsonArray completed;
    for (const auto& range : completedRanges)
    {
        completed.append(QJsonArray{static_cast<double>(range.first), static_cast<double>(range.second)});
    }
    root["completed"] = completed;

    QSaveFile file(markerPath);
    if (!file.open(QIODevice::WriteOnly))
    {
        if (errorOut)
            *errorOut = QString("Cannot write resume marker %1: %2").arg(markerPath, file.errorString());
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit())
    {
        if (errorOut)
            *errorOut = QString("Cannot commit resume marker %1: %2").arg(markerPath, file.errorString());
        return false;
    }
    return true;
}

bool TransferMarker::describes(const RemoteEntry& entry) const
{
    if (remotePath != entry.remotePath || sizeBytes != entry.sizeBytes)
    {
        return false;
    }
    // A store that reports no timestamps cannot be held against us
    if (modifiedTime.isValid() && entry.modifiedTime.isValid())
    {
        return modifiedTime == entry.modifiedTime;
    }
    return true;
}

bool TransferMarker::hasCompleted(const ChunkRange& range) const
{
    return completedRanges.contains(qMakePair(range.offset, range.length));
}
