#include "catalog.h"

#include <QFile>
#include <QStringDecoder>


Catalog::Catalog(const QList<CatalogRule>& rules) : m_rules(rules)
{
}

bool Catalog::readTextFile(const QString& path, QString* textOut, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        if (errorOut)
            *errorOut = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    const QByteArray data = file.readAll();
    file.close();

    if (data.startsWith("\xFF\xFE") || data.startsWith("\xFE\xFF"))
    {
        QStringDecoder utf16(QStringDecoder::Utf16);
        QString text = utf16.decode(data);
        if (!utf16.hasError())
        {
            *textOut = text;
            return true;
        }
    }

    QStringDecoder utf8(QStringDecoder::Utf8);
    QString text = utf8.decode(data);
    if (!utf8.hasError())
    {
        *textOut = text;
        return true;
    }

    // Japanese titles are often saved as Shift_JIS. The codec is only there when Qt has ICU.
    QStringDecoder shiftJis("Shift_JIS");
    if (shiftJis.isValid())
    {
        QString text = shiftJis.decode(data);
        if (!shiftJis.hasError())
        {
            *textOut = text;
            return true;
        }
    }

    *textOut = QString::fromLatin1(data);
    return true;
}

bool Catalog::loadFromFile(const QString& path, QString* errorOut)
{
    QString text;
    if (!readTextFile(path, &text, errorOut))
    {
        return false;
    }
    return parse(text, errorOut);
}

bool Catalog::parse(const QString& text, QString* errorOut)
{
    QList<CatalogRule> rules;
    const QStringList lines = text.split('\n');
    for (int i = 0; i < lines.size(); ++i)
    {
        const QString line = lines[i].trimmed();
        if (line.isEmpty() || line.startsWith('#'))
        {
            continue;
        }

        const QStringList parts = line.split('|');
        if (parts.size() < 3 || parts.size() > 4)
        {
            if (errorOut)
                *errorOut = QString("Catalog line %1: expected 'key|folder|season[|source]', got '%2'")
                                .arg(i + 1)
                                .arg(line);
            return false;
        }

        CatalogRule rule;
        rule.matchKey = parts[0].trimmed();
        rule.displayName = parts[1].trimmed();
        bool ok = false;
        rule.seasonNumber = parts[2].trimmed().toInt(&ok);
        if (parts.size() == 4)
        {
            rule.replacementSource = parts[3].trimmed();
        }

        if (rule.matchKey.isEmpty() || rule.displayName.isEmpty())
        {
            if (errorOut)
                *errorOut = QString("Catalog line %1: match key and folder name must not be empty").arg(i + 1);
            return false;
        }
        if (!ok || rule.seasonNumber <= 0)
        {
            if (errorOut)
                *errorOut = QString("Catalog line %1: season must be a positive integer, got '%2'")
                                .arg(i + 1)
                                .arg(parts[2].trimmed());
            return false;
        }
        rules.append(rule);
    }

    m_rules = rules;
    return true;
}

const CatalogRule* Catalog::match(const QString& remoteFileName) const
{
    for (const CatalogRule& rule : m_rules)
    {
        if (remoteFileName.contains(rule.matchKey))
        {
            return &rule;
        }
    }
    return nullptr;
}

ReleaseGroupFilter::ReleaseGroupFilter(const QStringList& groups)
{
    for (const QString& group : groups)
    {
        if (!group.trimmed().isEmpty())
            m_groups.append(group.trimmed());
    }
}

bool ReleaseGroupFilter::loadFromFile(const QString& path, QString* errorOut)
{
    QString text;
    if (!Catalog::readTextFile(path, &text, errorOut))
    {
        return false;
    }
    m_groups.clear();
    for (const QString& line : text.split('\n'))
    {
        const QString group = line.trimmed();
        if (!group.isEmpty() && !group.startsWith('#'))
            m_groups.append(group);
    }
    return true;
}

bool ReleaseGroupFilter::accepts(const QString& fileName) const
{
    if (m_groups.isEmpty())
    {
        return true;
    }
    for (const QString& group : m_groups)
    {
        if (fileName.contains('[' + group + ']') || fileName.contains(QString::fromUtf8("【") + group + QString::fromUtf8("】")))
        {
            return true;
        }
    }
    return false;
}
