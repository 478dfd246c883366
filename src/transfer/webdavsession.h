#ifndef WEBDAVSESSION_H
#define WEBDAVSESSION_H

#include "remotesession.h"

#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

class QNetworkAccessManager;

/**
 * @brief RemoteSession over WebDAV / plain HTTP.
 *
 * Listing uses PROPFIND with Depth 1, reads are ranged GET requests.
 * Each call builds its own QNetworkAccessManager in the calling thread and
 * spins a local event loop, so the session can be shared by worker threads.
 */
class WebDavSession : public RemoteSession
{
public:
    WebDavSession(const QUrl &baseUrl, const QString &user, const QString &password, int timeoutMs = 30000);

    bool list(const QString &directory, QList<RemoteEntry> *entries, QString *errorOut) override;
    std::unique_ptr<QIODevice> openRead(const QString &remotePath, qint64 offset, qint64 length,
                                        QString *errorOut) override;
    bool remove(const QString &remotePath, QString *errorOut) override;

    // Parses a PROPFIND multistatus body. Public for tests.
    static bool parseMultiStatus(const QByteArray &xml, const QString &basePath, const QString &directory,
                                 QList<RemoteEntry> *entries, QString *errorOut);

private:
    QUrl urlFor(const QString &remotePath) const;
    QNetworkRequest makeRequest(const QUrl &url) const;

    QUrl m_baseUrl;
    QByteArray m_authorization;
    int m_timeoutMs;
};

/**
 * @brief Blocking QIODevice over one ranged GET reply.
 *
 * readData() waits on a private event loop until data arrives, the reply
 * finishes or the inactivity timeout expires.
 */
class HttpRangeReader : public QIODevice
{
    Q_OBJECT
public:
    HttpRangeReader(const QNetworkRequest &request, qint64 offset, qint64 length, int timeoutMs);
    ~HttpRangeReader() override;

    bool start(QString *errorOut);
    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override;

protected:
    qint64 readData(char *data, qint64 maxSize) override;
    qint64 writeData(const char *data, qint64 maxSize) override;

private:
    bool waitForActivity();

    QNetworkAccessManager *m_manager;
    QNetworkReply *m_reply = nullptr;
    QNetworkRequest m_request;
    qint64 m_offset;
    qint64 m_length;
    int m_timeoutMs;
};

#endif // WEBDAVSESSION_H
