#include "subtitleprocessor.h"
#include "fileplacer.h"
#include "subtitlerewriter.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace
{
// Removes the wrapped file when the scope ends.
class TempFileGuard
{
public:
    explicit TempFileGuard(const QString &path) : m_path(path) {}
    ~TempFileGuard() { QFile::remove(m_path); }

private:
    QString m_path;
};
}

SubtitleProcessor::SubtitleProcessor(MuxTool& muxTool, const Options& options, QObject* parent)
    : QObject(parent),
    m_muxTool(muxTool),
    m_options(options)
{
}

SubtitleResult SubtitleProcessor::fail(const QString& reason)
{
    emit logMessage("Subtitle processing skipped: " + reason, LogCategory::MKVTOOLNIX);
    SubtitleResult result;
    result.outcome = SubtitleOutcome::Failed;
    result.reason = reason;
    return result;
}

SubtitleResult SubtitleProcessor::process(const QString& mediaPath, const ReplacementRuleList& rules)
{
    SubtitleResult result;
    if (rules.isEmpty())
    {
        result.reason = "no replacement rules";
        return result;
    }

    const QFileInfo media(mediaPath);
    if (!media.isFile())
        return fail(QString("media file missing: %1").arg(mediaPath));

    QString error;
    SubtitleTrackInfo track;
    if (!m_muxTool.findSubtitleTrack(mediaPath, m_options.trackId, &track, &error))
        return fail(error);

    const QDir dir = media.absoluteDir();
    const QString subtitlePath = dir.filePath(QString(".%1.track%2.%3").arg(media.completeBaseName()).arg(track.id).arg(track.extension));
    const QString remuxPath = dir.filePath(QString(".%1.remux.%2").arg(media.completeBaseName(), media.suffix()));
    TempFileGuard subtitleGuard(subtitlePath);
    TempFileGuard remuxGuard(remuxPath);

    if (!m_muxTool.extractSubtitle(mediaPath, track, subtitlePath, &error))
        return fail(error);

    int changed = 0;
    if (!SubtitleRewriter::rewriteFile(subtitlePath, rules, &changed, &error))
        return fail(error);

    if (changed == 0)
    {
        emit logMessage(QString("No substitutions needed in %1").arg(media.fileName()), LogCategory::MKVTOOLNIX);
        result.outcome = SubtitleOutcome::Applied;
        result.reason = "no substitutions needed";
        return result;
    }

    RemuxOptions remux;
    remux.replacedTrackId = track.id;
    remux.language = m_options.language;
    remux.trackName = m_options.trackName;
    if (!m_muxTool.remuxSubtitle(mediaPath, subtitlePath, remux, remuxPath, &error))
        return fail(error);

    const QFileInfo output(remuxPath);
    if (!output.isFile() || output.size() == 0)
        return fail(QString("remux produced no output for %1").arg(media.fileName()));

    if (!FilePlacer::replaceFile(remuxPath, mediaPath, &error))
        return fail(error);

    emit logMessage(QString("Subtitles rewritten in %1 (%2 lines changed)").arg(media.fileName()).arg(changed),
                    LogCategory::MKVTOOLNIX);
    result.outcome = SubtitleOutcome::Applied;
    result.changedLines = changed;
    return result;
}
