#ifndef MKVTOOLNIXMUXTOOL_H
#define MKVTOOLNIXMUXTOOL_H

#include "muxtool.h"
#include "processmanager.h"

#include <QByteArray>
#include <QObject>

/**
 * @brief MuxTool backed by mkvmerge and mkvextract.
 */
class MkvToolNixMuxTool : public QObject, public MuxTool
{
    Q_OBJECT
public:
    MkvToolNixMuxTool(const QString &mkvmergePath, const QString &mkvextractPath, QObject *parent = nullptr);

    bool findSubtitleTrack(const QString &mediaPath, int preferredId, SubtitleTrackInfo *track,
                           QString *errorOut) override;
    bool extractSubtitle(const QString &mediaPath, const SubtitleTrackInfo &track, const QString &outputPath,
                         QString *errorOut) override;
    bool remuxSubtitle(const QString &mediaPath, const QString &subtitlePath, const RemuxOptions &options,
                       const QString &outputPath, QString *errorOut) override;

    // Picks a text subtitle track from `mkvmerge -J` output.
    static bool parseIdentification(const QByteArray &json, int preferredId, SubtitleTrackInfo *track,
                                    QString *errorOut);
    static QString extensionForCodec(const QString &codecId);

    static QStringList remuxArguments(const QString &mediaPath, const QString &subtitlePath,
                                      const RemuxOptions &options, const QString &outputPath);

signals:
    void logMessage(const QString &message, LogCategory category);

private:
    static bool mkvmergeSucceeded(const ProcessResult &result);

    ProcessManager *m_processManager;
    QString m_mkvmergePath;
    QString m_mkvextractPath;
};

#endif // MKVTOOLNIXMUXTOOL_H
