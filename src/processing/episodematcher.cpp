#include "episodematcher.h"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>


static QString fileExtension(const QString& fileName)
{
    const int dot = fileName.lastIndexOf('.');
    if (dot <= 0)
        return QString();
    const QString ext = fileName.mid(dot);
    // "Show - 05.5" has no real extension
    static const QRegularExpression kExtension("^\\.[A-Za-z0-9]{1,5}$");
    return kExtension.match(ext).hasMatch() && !ext.mid(1).toInt() ? ext : QString();
}

static bool isYearLike(const QString& digits)
{
    if (digits.size() != 4)
        return false;
    const int value = digits.toInt();
    return value >= 1900 && value <= 2099;
}

EpisodeMatcher::EpisodeMatcher(const Catalog& catalog, const Options& options)
    : m_catalog(catalog),
    m_options(options)
{
}

QString EpisodeMatcher::sanitizeForPath(const QString& name)
{
    QString result = name;
    result.replace(':', ' ');
    result.replace('"', ' ');
    result.replace('<', ' ');
    result.replace('>', ' ');
    result.replace('|', ' ');
    result.replace('?', ' ');
    result.replace('*', ' ');
    result.replace('/', ' ');
    result.replace('\\', ' ');
    result = result.simplified();
    // A leading dot would hide the file and collide with in-flight placements
    while (result.startsWith('.'))
        result.remove(0, 1);
    return result;
}

QString EpisodeMatcher::seasonFolderName(int season)
{
    return QString("Season %1").arg(season, 2, 10, QChar('0'));
}

QString EpisodeMatcher::canonicalFileName(const CatalogRule& rule, int episode, const QString& extension)
{
    return QString("%1 S%2E%3%4")
        .arg(sanitizeForPath(rule.displayName))
        .arg(rule.seasonNumber, 2, 10, QChar('0'))
        .arg(episode, 2, 10, QChar('0'))
        .arg(extension);
}

int EpisodeMatcher::detectEpisode(const QString& fileName, const QString& titleToIgnore)
{
    QString stem = fileName;
    const QString ext = fileExtension(fileName);
    if (!ext.isEmpty())
        stem.chop(ext.size());
    if (!titleToIgnore.isEmpty())
        stem.replace(titleToIgnore, " ");

    static const QRegularExpression kSeasonEpisode("(?<![A-Za-z0-9])[Ss](\\d{1,2})[ ._-]?[Ee](\\d{1,4})(?:v\\d+)?(?![0-9])");
    const QRegularExpressionMatch explicitMatch = kSeasonEpisode.match(stem);
    if (explicitMatch.hasMatch())
    {
        return explicitMatch.captured(2).toInt();
    }

    static const QRegularExpression kSeparators("[^\\p{L}\\p{N}]+");
    static const QRegularExpression kBareNumber("^(\\d{1,4})(?:v\\d+)?$");
    static const QRegularExpression kEpisodeToken("^(?:[Ee][Pp]?)(\\d{1,4})(?:v\\d+)?$");
    static const QRegularExpression kOrdinal("^\\d+(?:st|nd|rd|th)$", QRegularExpression::CaseInsensitiveOption);

    const QStringList tokens = stem.split(kSeparators, Qt::SkipEmptyParts);
    for (int i = 0; i < tokens.size(); ++i)
    {
        const QRegularExpressionMatch episodeToken = kEpisodeToken.match(tokens[i]);
        if (episodeToken.hasMatch())
        {
            return episodeToken.captured(1).toInt();
        }

        const QRegularExpressionMatch bare = kBareNumber.match(tokens[i]);
        if (!bare.hasMatch())
            continue;

        const QString digits = bare.captured(1);
        if (isYearLike(digits))
            continue;

        const QString previous = i > 0 ? tokens[i - 1].toLower() : QString();
        const QString next = i + 1 < tokens.size() ? tokens[i + 1].toLower() : QString();
        // "2nd Season 05": the season is already spelled as an ordinal
        const bool seasonAlreadyGiven = i > 1 && kOrdinal.match(tokens[i - 2]).hasMatch();
        if ((previous == "season" && !seasonAlreadyGiven) || previous == "s" || next == "season")
            continue;

        return digits.toInt();
    }
    return -1;
}

MatchResult EpisodeMatcher::match(const QString& sourcePath, const QString& remoteFileName) const
{
    MatchResult result;
    const CatalogRule* rule = m_catalog.match(remoteFileName);
    if (!rule)
    {
        result.error = PipelineError::NoCatalogMatch;
        return result;
    }

    PlacementDecision& decision = result.decision;
    decision.rule = *rule;
    decision.sourcePath = sourcePath;
    decision.action = m_options.moveLocal ? PlacementAction::Move : PlacementAction::Copy;

    QString finalName = sanitizeForPath(remoteFileName);
    if (m_options.rename)
    {
        result.episode = detectEpisode(remoteFileName, rule->matchKey);
        if (result.episode >= 0)
        {
            finalName = canonicalFileName(*rule, result.episode, fileExtension(remoteFileName));
            decision.renamed = true;
        }
        else
        {
            result.error = PipelineError::NamingAmbiguous;
        }
    }

    const QString seasonDir = QDir(m_options.localRoot)
                                  .filePath(sanitizeForPath(rule->displayName) + "/" + seasonFolderName(rule->seasonNumber));
    decision.finalPath = QDir::cleanPath(QDir(seasonDir).filePath(finalName));
    return result;
}
