#ifndef SUBTITLEREWRITER_H
#define SUBTITLEREWRITER_H

#include "pipelinetypes.h"

#include <QString>

/**
 * @brief Applies replacement rules to the text payload of a subtitle file.
 *
 * Only what a viewer reads is touched. In ASS/SSA files that is the Text
 * field of `Dialogue:` lines, outside `{...}` override blocks. In SRT files
 * it is every line that is neither a cue counter nor a timing line.
 */
class SubtitleRewriter
{
public:
    enum class Format
    {
        Ass,
        Srt
    };

    // Literal, global, in list order: rule N+1 sees the output of rule N.
    static QString applyRules(const QString &text, const ReplacementRuleList &rules);

    // Same, but leaves {...} override blocks untouched.
    static QString applyRulesOutsideOverrides(const QString &text, const ReplacementRuleList &rules);

    static QString rewriteAss(const QString &content, const ReplacementRuleList &rules, int *changedLines = nullptr);
    static QString rewriteSrt(const QString &content, const ReplacementRuleList &rules, int *changedLines = nullptr);

    static Format formatForFile(const QString &path);

    // Rewrites the file in place, keeping a UTF-8 byte order mark if it had one.
    static bool rewriteFile(const QString &path, const ReplacementRuleList &rules, int *changedLines,
                            QString *errorOut);
};

#endif // SUBTITLEREWRITER_H
