#ifndef REPLACEMENTRULES_H
#define REPLACEMENTRULES_H

#include "pipelinetypes.h"

#include <QString>

/**
 * @brief Loading and validation of subtitle replacement rulesets.
 *
 * A ruleset is a UTF-8 text with one `old|new` pair per line. Blank lines and
 * lines starting with `#` are ignored. A ruleset is valid only when it holds
 * at least one rule and every other line is a well formed pair with a
 * non-empty `old` part.
 */
class ReplacementRules
{
public:
    static bool parse(const QString &text, ReplacementRuleList *rules, QString *errorOut = nullptr);

    static bool loadFromFile(const QString &path, ReplacementRuleList *rules, QString *errorOut = nullptr);

    // Blocking HTTP(S) GET on a private event loop.
    static bool fetchFromUrl(const QString &url, ReplacementRuleList *rules, QString *errorOut = nullptr,
                             int timeoutMs = 30000);

    // Dispatches on the source: http/https URLs are fetched, anything else is a file path.
    static bool loadFromSource(const QString &source, ReplacementRuleList *rules, QString *errorOut = nullptr);

    static bool isUrl(const QString &source);

    // Stutter and line-break normalisation, applied before the series rules.
    static ReplacementRuleList standardRules();
};

#endif // REPLACEMENTRULES_H
