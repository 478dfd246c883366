#ifndef MUXTOOL_H
#define MUXTOOL_H

#include <QString>

struct SubtitleTrackInfo
{
    int id = -1;
    QString codecId;
    QString extension; // "ass", "ssa" or "srt"
    QString language;
    QString name;

    bool isValid() const { return id >= 0; }
};

struct RemuxOptions
{
    int replacedTrackId = -1;
    QString language = "eng";
    QString trackName;
};

/**
 * @brief Container tool used by the subtitle stage.
 *
 * Implementations run synchronously and may be called from several item
 * threads at once.
 */
class MuxTool
{
public:
    virtual ~MuxTool() = default;

    // preferredId < 0 picks the first text subtitle track.
    virtual bool findSubtitleTrack(const QString &mediaPath, int preferredId, SubtitleTrackInfo *track,
                                   QString *errorOut) = 0;
    virtual bool extractSubtitle(const QString &mediaPath, const SubtitleTrackInfo &track,
                                 const QString &outputPath, QString *errorOut) = 0;
    virtual bool remuxSubtitle(const QString &mediaPath, const QString &subtitlePath, const RemuxOptions &options,
                               const QString &outputPath, QString *errorOut) = 0;
};

#endif // MUXTOOL_H
