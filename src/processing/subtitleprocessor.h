#ifndef SUBTITLEPROCESSOR_H
#define SUBTITLEPROCESSOR_H

#include "appsettings.h"
#include "muxtool.h"
#include "pipelinetypes.h"

#include <QObject>
#include <QString>

struct SubtitleResult
{
    SubtitleOutcome outcome = SubtitleOutcome::NotApplicable;
    QString reason;
    int changedLines = 0;
};

/**
 * @brief Rewrites the primary subtitle track of a placed media file.
 *
 * extract -> rewrite -> remux into a hidden sibling -> atomic replace. Any
 * failure leaves the media file exactly as it was and is reported as a
 * Failed outcome, never as an item failure.
 */
class SubtitleProcessor : public QObject
{
    Q_OBJECT
public:
    struct Options
    {
        int trackId = -1;
        QString language = "eng";
        QString trackName;
    };

    SubtitleProcessor(MuxTool &muxTool, const Options &options, QObject *parent = nullptr);

    SubtitleResult process(const QString &mediaPath, const ReplacementRuleList &rules);

signals:
    void logMessage(const QString &message, LogCategory category);

private:
    SubtitleResult fail(const QString &reason);

    MuxTool &m_muxTool;
    Options m_options;
};

#endif // SUBTITLEPROCESSOR_H
