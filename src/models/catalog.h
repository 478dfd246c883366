#ifndef CATALOG_H
#define CATALOG_H

#include "pipelinetypes.h"

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief Ordered table of series rules.
 *
 * Lines look like `match_key|display_name|season[|replacement_source]`.
 * Lookups are first-match-wins in declaration order, so more specific keys
 * must be declared before the generic ones they contain.
 */
class Catalog
{
public:
    Catalog() = default;
    explicit Catalog(const QList<CatalogRule> &rules);

    bool loadFromFile(const QString &path, QString *errorOut = nullptr);
    bool parse(const QString &text, QString *errorOut = nullptr);

    const CatalogRule *match(const QString &remoteFileName) const;

    const QList<CatalogRule> &rules() const { return m_rules; }
    bool isEmpty() const { return m_rules.isEmpty(); }

    // Reads a small config-style text file, trying UTF-8 (with or without BOM),
    // UTF-16 with BOM and finally Latin-1.
    static bool readTextFile(const QString &path, QString *textOut, QString *errorOut = nullptr);

private:
    QList<CatalogRule> m_rules;
};

/**
 * @brief Release-group allow list.
 *
 * An empty list accepts everything. Otherwise a remote file name must carry
 * one of the groups as `[Group]` or `【Group】`.
 */
class ReleaseGroupFilter
{
public:
    ReleaseGroupFilter() = default;
    explicit ReleaseGroupFilter(const QStringList &groups);

    bool loadFromFile(const QString &path, QString *errorOut = nullptr);
    bool accepts(const QString &fileName) const;
    bool isEmpty() const { return m_groups.isEmpty(); }

private:
    QStringList m_groups;
};

#endif // CATALOG_H
