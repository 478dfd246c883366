#include "mkvtoolnixmuxtool.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

static const int kIdentifyTimeoutMs = 60000;
static const int kMuxTimeoutMs = 30 * 60 * 1000;

MkvToolNixMuxTool::MkvToolNixMuxTool(const QString& mkvmergePath, const QString& mkvextractPath, QObject* parent)
    : QObject(parent),
    m_processManager(new ProcessManager(this)),
    m_mkvmergePath(mkvmergePath),
    m_mkvextractPath(mkvextractPath)
{
    connect(m_processManager, &ProcessManager::logMessage, this, &MkvToolNixMuxTool::logMessage,
            Qt::DirectConnection);
}

QString MkvToolNixMuxTool::extensionForCodec(const QString& codecId)
{
    if (codecId == "S_TEXT/ASS")
        return "ass";
    if (codecId == "S_TEXT/SSA")
        return "ssa";
    if (codecId == "S_TEXT/UTF8")
        return "srt";
    return QString();
}

bool MkvToolNixMuxTool::parseIdentification(const QByteArray& json, int preferredId, SubtitleTrackInfo* track,
                                            QString* errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        if (errorOut)
            *errorOut = QString("Unreadable mkvmerge identification: %1").arg(parseError.errorString());
        return false;
    }

    const QJsonArray tracks = doc.object()["tracks"].toArray();
    for (const QJsonValue& val : tracks)
    {
        const QJsonObject trackObject = val.toObject();
        if (trackObject["type"].toString() != "subtitles")
            continue;
        const int id = trackObject["id"].toInt(-1);
        if (preferredId >= 0 && id != preferredId)
            continue;

        const QJsonObject props = trackObject["properties"].toObject();
        const QString codecId = props["codec_id"].toString();
        const QString extension = extensionForCodec(codecId);
        if (extension.isEmpty())
        {
            if (preferredId >= 0)
            {
                if (errorOut)
                    *errorOut = QString("Subtitle track %1 is not text based (%2)").arg(id).arg(codecId);
                return false;
            }
            continue;
        }

        track->id = id;
        track->codecId = codecId;
        track->extension = extension;
        track->language = props["language"].toString();
        track->name = props["track_name"].toString();
        return true;
    }

    if (errorOut)
    {
        *errorOut = preferredId >= 0 ? QString("Subtitle track %1 not found").arg(preferredId)
                                     : QString("No text subtitle track found");
    }
    return false;
}

bool MkvToolNixMuxTool::mkvmergeSucceeded(const ProcessResult& result)
{
    // mkvmerge: 0 = success, 1 = success with warnings, 2 = error
    return result.finishedNormally() && (result.exitCode == 0 || result.exitCode == 1);
}

bool MkvToolNixMuxTool::findSubtitleTrack(const QString& mediaPath, int preferredId, SubtitleTrackInfo* track,
                                          QString* errorOut)
{
    QByteArray jsonData;
    if (!m_processManager->executeAndWait(m_mkvmergePath, {"-J", mediaPath}, jsonData, kIdentifyTimeoutMs))
    {
        if (errorOut)
            *errorOut = QString("mkvmerge -J failed for %1").arg(QFileInfo(mediaPath).fileName());
        return false;
    }
    return parseIdentification(jsonData, preferredId, track, errorOut);
}

bool MkvToolNixMuxTool::extractSubtitle(const QString& mediaPath, const SubtitleTrackInfo& track,
                                        const QString& outputPath, QString* errorOut)
{
    const QStringList args = {mediaPath, "tracks", QString("%1:%2").arg(track.id).arg(outputPath)};
    const ProcessResult result = m_processManager->run(m_mkvextractPath, args, kMuxTimeoutMs);
    // mkvextract uses the same exit code convention as mkvmerge
    if (!mkvmergeSucceeded(result) || !QFileInfo::exists(outputPath))
    {
        if (errorOut)
            *errorOut = QString("mkvextract failed for %1 (exit code %2)")
                            .arg(QFileInfo(mediaPath).fileName())
                            .arg(result.exitCode);
        return false;
    }
    return true;
}

QStringList MkvToolNixMuxTool::remuxArguments(const QString& mediaPath, const QString& subtitlePath,
                                              const RemuxOptions& options, const QString& outputPath)
{
    QStringList args;
    args << "-o" << outputPath;
    if (options.replacedTrackId >= 0)
        args << "--subtitle-tracks" << QString("!%1").arg(options.replacedTrackId);
    args << mediaPath;
    args << "--language" << QString("0:%1").arg(options.language);
    if (!options.trackName.isEmpty())
        args << "--track-name" << QString("0:%1").arg(options.trackName);
    args << "--default-track" << "0:yes";
    args << subtitlePath;
    return args;
}

bool MkvToolNixMuxTool::remuxSubtitle(const QString& mediaPath, const QString& subtitlePath,
                                      const RemuxOptions& options, const QString& outputPath, QString* errorOut)
{
    const ProcessResult result =
        m_processManager->run(m_mkvmergePath, remuxArguments(mediaPath, subtitlePath, options, outputPath),
                              kMuxTimeoutMs);
    if (!mkvmergeSucceeded(result))
    {
        if (errorOut)
            *errorOut = QString("mkvmerge failed for %1 (exit code %2)")
                            .arg(QFileInfo(mediaPath).fileName())
                            .arg(result.exitCode);
        return false;
    }
    if (result.exitCode == 1)
    {
        emit logMessage(QString("mkvmerge finished with warnings for %1").arg(QFileInfo(mediaPath).fileName()),
                        LogCategory::MKVTOOLNIX);
    }
    return true;
}
