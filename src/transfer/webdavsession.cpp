#include "webdavsession.h"

#include <QBuffer>
#include <QEventLoop>
#include <QLocale>
#include <QNetworkAccessManager>
#include <QTimeZone>
#include <QTimer>
#include <QXmlStreamReader>

static const qint64 kReplyBufferSize = 4 * 1024 * 1024;

static const char* kPropfindBody = "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
                                   "<d:propfind xmlns:d=\"DAV:\"><d:prop>"
                                   "<d:getcontentlength/><d:getlastmodified/><d:resourcetype/>"
                                   "</d:prop></d:propfind>";

// getlastmodified is an RFC 1123 date, usually with a "GMT" zone name
static QDateTime parseHttpDate(const QString& text)
{
    const QString trimmed = text.trimmed();
    QDateTime parsed = QDateTime::fromString(trimmed, Qt::RFC2822Date);
    if (parsed.isValid())
        return parsed;
    parsed = QLocale::c().toDateTime(trimmed, "ddd, dd MMM yyyy hh:mm:ss 'GMT'");
    if (parsed.isValid())
        parsed.setTimeZone(QTimeZone::utc());
    return parsed;
}

// Runs one request to completion on a private event loop. Returns false on timeout.
static bool waitForReply(QNetworkReply* reply, int timeoutMs)
{
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
        return false;
    }
    return true;
}

WebDavSession::WebDavSession(const QUrl& baseUrl, const QString& user, const QString& password, int timeoutMs)
    : m_baseUrl(baseUrl),
    m_timeoutMs(timeoutMs)
{
    if (!user.isEmpty())
    {
        m_authorization = "Basic " + QString("%1:%2").arg(user, password).toUtf8().toBase64();
    }
}

QUrl WebDavSession::urlFor(const QString& remotePath) const
{
    QUrl url = m_baseUrl;
    QString basePath = url.path();
    if (basePath.endsWith('/'))
        basePath.chop(1);
    QString relative = remotePath;
    if (!relative.startsWith('/'))
        relative.prepend('/');
    url.setPath(basePath + relative);
    return url;
}

QNetworkRequest WebDavSession::makeRequest(const QUrl& url) const
{
    QNetworkRequest request(url);
    if (!m_authorization.isEmpty())
    {
        request.setRawHeader("Authorization", m_authorization);
    }
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    return request;
}

bool WebDavSession::list(const QString& directory, QList<RemoteEntry>* entries, QString* errorOut)
{
    QNetworkAccessManager manager;
    QUrl url = urlFor(directory);
    if (!url.path().endsWith('/'))
        url.setPath(url.path() + '/');

    QNetworkRequest request = makeRequest(url);
    request.setRawHeader("Depth", "1");
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");

    QNetworkReply* reply = manager.sendCustomRequest(request, "PROPFIND", QByteArray(kPropfindBody));
    const bool finished = waitForReply(reply, m_timeoutMs);
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    if (!finished)
    {
        if (errorOut)
            *errorOut = QString("Listing %1 timed out").arg(url.toDisplayString());
        reply->deleteLater();
        return false;
    }
    if (reply->error() != QNetworkReply::NoError || status != 207)
    {
        if (errorOut)
            *errorOut = QString("Listing %1 failed (HTTP %2): %3")
                            .arg(url.toDisplayString())
                            .arg(status)
                            .arg(reply->errorString());
        reply->deleteLater();
        return false;
    }

    const QByteArray body = reply->readAll();
    reply->deleteLater();

    QString basePath = m_baseUrl.path();
    if (basePath.endsWith('/'))
        basePath.chop(1);
    return parseMultiStatus(body, basePath, directory, entries, errorOut);
}

bool WebDavSession::parseMultiStatus(const QByteArray& xml, const QString& basePath, const QString& directory,
                                     QList<RemoteEntry>* entries, QString* errorOut)
{
    entries->clear();
    QXmlStreamReader reader(xml);

    QString href;
    QString length;
    QString modified;
    bool isCollection = false;
    bool inResponse = false;

    QString normalizedDir = directory;
    if (!normalizedDir.startsWith('/'))
        normalizedDir.prepend('/');
    if (normalizedDir.endsWith('/') && normalizedDir.size() > 1)
        normalizedDir.chop(1);

    while (!reader.atEnd())
    {
        reader.readNext();
        if (reader.isStartElement())
        {
            const QStringView name = reader.name();
            if (name == QLatin1String("response"))
            {
                inResponse = true;
                href.clear();
                length.clear();
                modified.clear();
                isCollection = false;
            }
            else if (inResponse && name == QLatin1String("href"))
            {
                href = reader.readElementText();
            }
            else if (inResponse && name == QLatin1String("getcontentlength"))
            {
                length = reader.readElementText();
            }
            else if (inResponse && name == QLatin1String("getlastmodified"))
            {
                modified = reader.readElementText();
            }
            else if (inResponse && name == QLatin1String("collection"))
            {
                isCollection = true;
            }
        }
        else if (reader.isEndElement() && reader.name() == QLatin1String("response"))
        {
            inResponse = false;
            if (isCollection || href.isEmpty())
                continue;

            // href may be absolute or a path, and is percent-encoded
            QString path = QUrl(href).path(QUrl::FullyDecoded);
            if (!basePath.isEmpty() && path.startsWith(basePath))
                path = path.mid(basePath.size());
            if (!path.startsWith('/'))
                path.prepend('/');
            if (path == normalizedDir || path == normalizedDir + '/')
                continue;

            RemoteEntry entry;
            entry.remotePath = path;
            entry.sizeBytes = length.toLongLong();
            entry.modifiedTime = parseHttpDate(modified);
            entries->append(entry);
        }
    }

    if (reader.hasError())
    {
        if (errorOut)
            *errorOut = QString("Malformed PROPFIND response: %1").arg(reader.errorString());
        return false;
    }
    return true;
}

std::unique_ptr<QIODevice> WebDavSession::openRead(const QString& remotePath, qint64 offset, qint64 length,
                                                   QString* errorOut)
{
    if (length <= 0)
    {
        auto empty = std::make_unique<QBuffer>();
        empty->open(QIODevice::ReadOnly);
        return empty;
    }

    auto reader = std::make_unique<HttpRangeReader>(makeRequest(urlFor(remotePath)), offset, length, m_timeoutMs);
    if (!reader->start(errorOut))
    {
        return nullptr;
    }
    return reader;
}

bool WebDavSession::remove(const QString& remotePath, QString* errorOut)
{
    QNetworkAccessManager manager;
    QNetworkReply* reply = manager.deleteResource(makeRequest(urlFor(remotePath)));
    const bool finished = waitForReply(reply, m_timeoutMs);
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const bool ok = finished && reply->error() == QNetworkReply::NoError && status >= 200 && status < 300;
    if (!ok && errorOut)
    {
        *errorOut = finished ? QString("DELETE %1 failed (HTTP %2): %3").arg(remotePath).arg(status).arg(reply->errorString())
                             : QString("DELETE %1 timed out").arg(remotePath);
    }
    reply->deleteLater();
    return ok;
}

HttpRangeReader::HttpRangeReader(const QNetworkRequest& request, qint64 offset, qint64 length, int timeoutMs)
    : m_manager(new QNetworkAccessManager(this)),
    m_request(request),
    m_offset(offset),
    m_length(length),
    m_timeoutMs(timeoutMs)
{
}

HttpRangeReader::~HttpRangeReader()
{
    if (m_reply && !m_reply->isFinished())
    {
        m_reply->abort();
    }
}

bool HttpRangeReader::start(QString* errorOut)
{
    QNetworkRequest request = m_request;
    request.setRawHeader("Range", QString("bytes=%1-%2").arg(m_offset).arg(m_offset + m_length - 1).toLatin1());

    m_reply = m_manager->get(request);
    m_reply->setParent(this);
    m_reply->setReadBufferSize(kReplyBufferSize);

    // Wait for headers so a server that ignores Range is caught before any byte is written.
    while (!m_reply->isFinished() && !m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid())
    {
        if (!waitForActivity())
        {
            if (errorOut)
                *errorOut = QString("No response for %1 within %2 ms").arg(m_request.url().toDisplayString()).arg(m_timeoutMs);
            m_reply->abort();
            return false;
        }
    }

    const int status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (m_reply->error() != QNetworkReply::NoError && m_reply->bytesAvailable() == 0)
    {
        if (errorOut)
            *errorOut = QString("GET %1 failed (HTTP %2): %3").arg(m_request.url().toDisplayString()).arg(status).arg(m_reply->errorString());
        return false;
    }
    // 200 means the whole body: only usable when the range starts at zero
    if (status != 206 && !(status == 200 && m_offset == 0))
    {
        if (errorOut)
            *errorOut = QString("Server ignored range request for %1 (HTTP %2)").arg(m_request.url().toDisplayString()).arg(status);
        m_reply->abort();
        return false;
    }

    return open(QIODevice::ReadOnly | QIODevice::Unbuffered);
}

qint64 HttpRangeReader::bytesAvailable() const
{
    return (m_reply ? m_reply->bytesAvailable() : 0) + QIODevice::bytesAvailable();
}

bool HttpRangeReader::waitForActivity()
{
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(m_reply, &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
    connect(m_reply, &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
    connect(m_reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(m_timeoutMs);
    loop.exec();
    return timer.isActive();
}

qint64 HttpRangeReader::readData(char* data, qint64 maxSize)
{
    while (m_reply->bytesAvailable() == 0)
    {
        if (m_reply->isFinished())
        {
            if (m_reply->error() != QNetworkReply::NoError)
            {
                setErrorString(m_reply->errorString());
            }
            return -1;
        }
        if (!waitForActivity())
        {
            setErrorString(QString("Read stalled for %1 ms").arg(m_timeoutMs));
            m_reply->abort();
            return -1;
        }
    }
    return m_reply->read(data, maxSize);
}

qint64 HttpRangeReader::writeData(const char* data, qint64 maxSize)
{
    Q_UNUSED(data);
    Q_UNUSED(maxSize);
    return -1;
}
