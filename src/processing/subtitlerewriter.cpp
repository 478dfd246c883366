#include "subtitlerewriter.h"

#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSaveFile>
#include <QStringList>

static const int kDefaultAssTextField = 9;

QString SubtitleRewriter::applyRules(const QString& text, const ReplacementRuleList& rules)
{
    QString result = text;
    for (const ReplacementRule& rule : rules)
    {
        if (!rule.oldText.isEmpty())
            result.replace(rule.oldText, rule.newText);
    }
    return result;
}

QString SubtitleRewriter::applyRulesOutsideOverrides(const QString& text, const ReplacementRuleList& rules)
{
    QString result;
    result.reserve(text.size());
    int pos = 0;
    while (pos < text.size())
    {
        const int open = text.indexOf('{', pos);
        if (open < 0)
        {
            result += applyRules(text.mid(pos), rules);
            break;
        }
        const int close = text.indexOf('}', open);
        if (close < 0)
        {
            // Unterminated block: the rest is markup as far as the renderer is concerned
            result += applyRules(text.mid(pos, open - pos), rules);
            result += text.mid(open);
            break;
        }
        result += applyRules(text.mid(pos, open - pos), rules);
        result += text.mid(open, close - open + 1);
        pos = close + 1;
    }
    return result;
}

QString SubtitleRewriter::rewriteAss(const QString& content, const ReplacementRuleList& rules, int* changedLines)
{
    QStringList lines = content.split('\n');
    int textField = kDefaultAssTextField;
    bool inEvents = false;
    int changed = 0;

    for (QString& line : lines)
    {
        const bool hasCr = line.endsWith('\r');
        QString body = hasCr ? line.left(line.size() - 1) : line;
        const QString trimmed = body.trimmed();

        if (trimmed.startsWith('['))
        {
            inEvents = trimmed.compare("[Events]", Qt::CaseInsensitive) == 0;
            continue;
        }
        if (inEvents && trimmed.startsWith("Format:"))
        {
            const QStringList fields = trimmed.mid(7).split(',');
            for (int i = 0; i < fields.size(); ++i)
            {
                if (fields[i].trimmed().compare("Text", Qt::CaseInsensitive) == 0)
                    textField = i;
            }
            continue;
        }
        if (!body.startsWith("Dialogue:"))
            continue;

        // The Text field is last and may itself contain commas
        int cut = 0;
        for (int i = 0; i < textField && cut >= 0; ++i)
        {
            cut = body.indexOf(',', cut);
            if (cut >= 0)
                ++cut;
        }
        if (cut < 0)
            continue;

        const QString textPart = body.mid(cut);
        const QString newText = applyRulesOutsideOverrides(textPart, rules);
        if (newText != textPart)
        {
            ++changed;
            line = body.left(cut) + newText + (hasCr ? "\r" : "");
        }
    }

    if (changedLines)
        *changedLines = changed;
    return lines.join('\n');
}

QString SubtitleRewriter::rewriteSrt(const QString& content, const ReplacementRuleList& rules, int* changedLines)
{
    static const QRegularExpression kCounter("^\\s*\\d+\\s*$");
    QStringList lines = content.split('\n');
    int changed = 0;
    bool atBlockStart = true;

    for (QString& line : lines)
    {
        const bool hasCr = line.endsWith('\r');
        const QString body = hasCr ? line.left(line.size() - 1) : line;

        if (body.trimmed().isEmpty())
        {
            atBlockStart = true;
            continue;
        }
        if (atBlockStart && kCounter.match(body).hasMatch())
        {
            atBlockStart = false;
            continue;
        }
        atBlockStart = false;
        if (body.contains("-->"))
            continue;

        const QString newText = applyRules(body, rules);
        if (newText != body)
        {
            ++changed;
            line = newText + (hasCr ? "\r" : "");
        }
    }

    if (changedLines)
        *changedLines = changed;
    return lines.join('\n');
}

SubtitleRewriter::Format SubtitleRewriter::formatForFile(const QString& path)
{
    return QFileInfo(path).suffix().compare("srt", Qt::CaseInsensitive) == 0 ? Format::Srt : Format::Ass;
}

bool SubtitleRewriter::rewriteFile(const QString& path, const ReplacementRuleList& rules, int* changedLines,
                                   QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        if (errorOut)
            *errorOut = QString("Cannot open subtitle %1: %2").arg(path, file.errorString());
        return false;
    }
    QByteArray raw = file.readAll();
    file.close();

    static const QByteArray kBom("\xEF\xBB\xBF");
    const bool hasBom = raw.startsWith(kBom);
    if (hasBom)
        raw.remove(0, kBom.size());

    const QString content = QString::fromUtf8(raw);
    int changed = 0;
    const QString rewritten = formatForFile(path) == Format::Srt ? rewriteSrt(content, rules, &changed)
                                                                  : rewriteAss(content, rules, &changed);
    if (changedLines)
        *changedLines = changed;
    if (changed == 0)
        return true;

    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly))
    {
        if (errorOut)
            *errorOut = QString("Cannot write subtitle %1: %2").arg(path, out.errorString());
        return false;
    }
    if (hasBom)
        out.write(kBom);
    out.write(rewritten.toUtf8());
    if (!out.commit())
    {
        if (errorOut)
            *errorOut = QString("Cannot write subtitle %1: %2").arg(path, out.errorString());
        return false;
    }
    return true;
}
