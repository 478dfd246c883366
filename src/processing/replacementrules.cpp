#include "replacementrules.h"
#include "catalog.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QStringList>
#include <QTimer>
#include <QUrl>

bool ReplacementRules::parse(const QString& text, ReplacementRuleList* rules, QString* errorOut)
{
    ReplacementRuleList parsed;
    const QStringList lines = text.split('\n');
    for (int i = 0; i < lines.size(); ++i)
    {
        QString line = lines[i];
        if (line.endsWith('\r'))
            line.chop(1);
        if (line.trimmed().isEmpty() || line.trimmed().startsWith('#'))
            continue;

        const int separator = line.indexOf('|');
        if (separator < 0)
        {
            if (errorOut)
                *errorOut = QString("Line %1: expected old|new").arg(i + 1);
            return false;
        }
        ReplacementRule rule;
        rule.oldText = line.left(separator);
        rule.newText = line.mid(separator + 1);
        if (rule.oldText.isEmpty())
        {
            if (errorOut)
                *errorOut = QString("Line %1: empty search text").arg(i + 1);
            return false;
        }
        parsed.append(rule);
    }

    if (parsed.isEmpty())
    {
        if (errorOut)
            *errorOut = "Ruleset is empty";
        return false;
    }
    *rules = parsed;
    return true;
}

bool ReplacementRules::loadFromFile(const QString& path, ReplacementRuleList* rules, QString* errorOut)
{
    QString text;
    if (!Catalog::readTextFile(path, &text, errorOut))
        return false;
    QString parseError;
    if (!parse(text, rules, &parseError))
    {
        if (errorOut)
            *errorOut = QString("%1: %2").arg(path, parseError);
        return false;
    }
    return true;
}

bool ReplacementRules::fetchFromUrl(const QString& url, ReplacementRuleList* rules, QString* errorOut, int timeoutMs)
{
    QNetworkAccessManager manager;
    QNetworkRequest request{QUrl(url)};
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    QNetworkReply* reply = manager.get(request);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(timeoutMs);
    if (!reply->isFinished())
        loop.exec();

    if (!reply->isFinished())
    {
        reply->abort();
        reply->deleteLater();
        if (errorOut)
            *errorOut = QString("Fetching %1 timed out").arg(url);
        return false;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError || status != 200)
    {
        if (errorOut)
            *errorOut = QString("Fetching %1 failed (HTTP %2): %3").arg(url).arg(status).arg(reply->errorString());
        reply->deleteLater();
        return false;
    }

    const QString text = QString::fromUtf8(reply->readAll());
    reply->deleteLater();

    QString parseError;
    if (!parse(text, rules, &parseError))
    {
        if (errorOut)
            *errorOut = QString("%1: %2").arg(url, parseError);
        return false;
    }
    return true;
}

bool ReplacementRules::isUrl(const QString& source)
{
    return source.startsWith("http://", Qt::CaseInsensitive) || source.startsWith("https://", Qt::CaseInsensitive);
}

bool ReplacementRules::loadFromSource(const QString& source, ReplacementRuleList* rules, QString* errorOut)
{
    if (isUrl(source))
        return fetchFromUrl(source, rules, errorOut);
    return loadFromFile(source, rules, errorOut);
}

ReplacementRuleList ReplacementRules::standardRules()
{
    ReplacementRuleList rules = {
        {"Wh-wh", "W-Wh"},
        {"Wh-Wh", "W-Wh"},
        {"Th-th", "T-Th"},
        {"Th-Th", "T-Th"},
    };
    // A-a ... Z-z, V and X have never been part of the list
    for (char c = 'A'; c <= 'Z'; ++c)
    {
        if (c == 'V' || c == 'X')
            continue;
        const QString upper(QChar::fromLatin1(c));
        const QString lower = upper.toLower();
        rules.append(ReplacementRule{upper + '-' + lower, upper + '-' + upper});
    }
    rules.append(ReplacementRule{"\\N", "\\N "});
    rules.append(ReplacementRule{"\\h", "\\h "});
    return rules;
}
