#ifndef EPISODEMATCHER_H
#define EPISODEMATCHER_H

#include "catalog.h"
#include "pipelinetypes.h"

#include <QString>

struct MatchResult
{
    PipelineError error = PipelineError::None; // NoCatalogMatch or NamingAmbiguous
    PlacementDecision decision;
    int episode = -1;
};

/**
 * @brief Maps a remote file name to its place in the local library.
 *
 * Pure function of (file name, catalog, options): calling match() twice with
 * the same input gives the same decision, and nothing touches the disk.
 */
class EpisodeMatcher
{
public:
    struct Options
    {
        QString localRoot;
        bool rename = true;
        bool moveLocal = false;
    };

    EpisodeMatcher(const Catalog &catalog, const Options &options);

    MatchResult match(const QString &sourcePath, const QString &remoteFileName) const;

    /**
     * @brief Finds the episode number in a release name.
     *
     * An explicit SxxEyy marker wins. Otherwise the first standalone integer
     * token (optionally with a vN revision suffix) is used, ignoring year-like
     * four digit numbers, the season number and anything inside `titleToIgnore`.
     * Returns -1 when nothing qualifies.
     */
    static int detectEpisode(const QString &fileName, const QString &titleToIgnore = QString());

    /**
     * @brief Replaces characters that are forbidden in file/directory names.
     *
     * Forbidden characters: : " < > | ? * / and backslash. Runs of
     * whitespace collapse into one space.
     */
    static QString sanitizeForPath(const QString &name);

    static QString seasonFolderName(int season);
    static QString canonicalFileName(const CatalogRule &rule, int episode, const QString &extension);

private:
    const Catalog &m_catalog;
    Options m_options;
};

#endif // EPISODEMATCHER_H
