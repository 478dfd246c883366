/**
 * @file transferengine_test.cpp
 * @brief Unit tests for TransferEngine
 *
 * The remote store is an in-memory session so that reads can be counted,
 * delayed and broken on purpose.
 */

#include <QtTest/QtTest>
#include <QBuffer>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTemporaryDir>
#include <QThread>
#include <atomic>
#include <limits>

#include "localremotesession.h"
#include "transferengine.h"
#include "transfermarker.h"

namespace
{
class MemorySession : public RemoteSession
{
public:
    explicit MemorySession(const QByteArray& data) : m_data(data) {}

    bool list(const QString&, QList<RemoteEntry>* entries, QString*) override
    {
        entries->clear();
        return true;
    }

    std::unique_ptr<QIODevice> openRead(const QString&, qint64 offset, qint64 length, QString* errorOut) override
    {
        bool truncate = false;
        {
            QMutexLocker locker(&m_mutex);
            m_openedOffsets.append(offset);
            if (offset >= m_brokenFrom)
            {
                if (errorOut)
                    *errorOut = "connection refused";
                return nullptr;
            }
            if (offset == m_truncateOffset && m_truncationsLeft > 0)
            {
                --m_truncationsLeft;
                truncate = true;
            }
        }

        // Later offsets answer first, so chunks complete out of order
        if (m_reverseDelays)
            QThread::msleep(static_cast<unsigned long>(qMax<qint64>(0, 40 - offset / 25)));

        QByteArray slice = m_data.mid(offset, length);
        if (truncate)
            slice.truncate(slice.size() / 2);
        auto buffer = std::make_unique<QBuffer>();
        buffer->setData(slice);
        buffer->open(QIODevice::ReadOnly);
        return buffer;
    }

    bool remove(const QString&, QString*) override { return true; }

    QList<qint64> openedOffsets() const
    {
        QMutexLocker locker(&m_mutex);
        return m_openedOffsets;
    }

    void truncateOnce(qint64 offset, int times)
    {
        m_truncateOffset = offset;
        m_truncationsLeft = times;
    }
    void breakFrom(qint64 offset) { m_brokenFrom = offset; }
    void setReverseDelays(bool enabled) { m_reverseDelays = enabled; }

private:
    QByteArray m_data;
    mutable QMutex m_mutex;
    QList<qint64> m_openedOffsets;
    qint64 m_truncateOffset = -1;
    int m_truncationsLeft = 0;
    qint64 m_brokenFrom = std::numeric_limits<qint64>::max();
    bool m_reverseDelays = false;
};

QByteArray makePayload(int size)
{
    QByteArray data;
    data.reserve(size);
    for (int i = 0; i < size; ++i)
        data.append(static_cast<char>((i * 31 + i / 7) & 0xFF));
    return data;
}

QByteArray readAll(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QByteArray();
    return file.readAll();
}
}

class TransferEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void init();

    void testTransfer_chunkedCopyIsByteIdentical();
    void testTransfer_outOfOrderCompletion();
    void testTransfer_singleStreamMode();
    void testTransfer_emptyFile();
    void testTransfer_retriesFromCurrentOffset();
    void testTransfer_exhaustedRetriesFailAndCleanUp();
    void testTransfer_stopKeepsPartialFile();
    void testTransfer_resumeSkipsCompletedChunks();
    void testTransfer_foreignMarkerDownloadsEverything();
    void testTransfer_changedLayoutDownloadsEverything();
    void testTransfer_localSession();
    void testTransfer_markerListsEveryCompletedChunk();
    void testLocalSession_readIsBoundedByLength();

private:
    TransferOptions options(int chunks) const;
    RemoteEntry entry(qint64 size) const;

    QTemporaryDir m_dir;
    QString m_tempPath;
    const QByteArray m_payload = makePayload(1000);
};

void TransferEngineTest::init()
{
    QVERIFY(m_dir.isValid());
    m_tempPath = m_dir.filePath("episode.mkv.part");
    TransferEngine::discardTemp(m_tempPath);
}

TransferOptions TransferEngineTest::options(int chunks) const
{
    TransferOptions opts;
    opts.chunkedMode = true;
    opts.chunkCount = chunks;
    opts.bufferSize = 64;
    opts.maxRetries = 2;
    opts.saveOriginalName = true;
    return opts;
}

RemoteEntry TransferEngineTest::entry(qint64 size) const
{
    RemoteEntry e;
    e.remotePath = "/incoming/episode.mkv";
    e.sizeBytes = size;
    e.modifiedTime = QDateTime(QDate(2024, 5, 1), QTime(12, 0), Qt::UTC);
    return e;
}

/** @brief Test: four concurrent chunks reassemble into an exact copy. */
void TransferEngineTest::testTransfer_chunkedCopyIsByteIdentical()
{
    MemorySession session(m_payload);
    TransferEngine engine(options(4));
    std::atomic_int progressEvents{0};
    connect(
        &engine, &TransferEngine::bytesTransferred, this,
        [&progressEvents](const QString&, qint64, qint64) { ++progressEvents; }, Qt::DirectConnection);
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(result.chunks.size(), size_t(4));
    for (const ChunkRange& chunk : result.chunks)
    {
        QCOMPARE(chunk.state, ChunkState::Done);
        QCOMPARE(chunk.bytesWritten, chunk.length);
    }
    QCOMPARE(readAll(m_tempPath), m_payload);
    QVERIFY(progressEvents.load() > 0);
    // Marker stays until the file has been placed
    QVERIFY(QFile::exists(TransferMarker::pathFor(m_tempPath)));
}

/** @brief Test: completion order does not change the result. */
void TransferEngineTest::testTransfer_outOfOrderCompletion()
{
    MemorySession session(m_payload);
    session.setReverseDelays(true);
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(readAll(m_tempPath), m_payload);
}

void TransferEngineTest::testTransfer_singleStreamMode()
{
    MemorySession session(m_payload);
    TransferOptions opts = options(4);
    opts.chunkedMode = false;
    TransferEngine engine(opts);
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(result.chunks.size(), size_t(1));
    QCOMPARE(session.openedOffsets(), QList<qint64>{0});
    QCOMPARE(readAll(m_tempPath), m_payload);
}

void TransferEngineTest::testTransfer_emptyFile()
{
    MemorySession session(QByteArray{});
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(0), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QVERIFY(QFile::exists(m_tempPath));
    QCOMPARE(QFileInfo(m_tempPath).size(), qint64(0));
}

/** @brief Test: a stream that dies mid-chunk is reopened at the first unwritten byte. */
void TransferEngineTest::testTransfer_retriesFromCurrentOffset()
{
    MemorySession session(m_payload);
    session.truncateOnce(250, 1);
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(readAll(m_tempPath), m_payload);
    const QList<qint64> offsets = session.openedOffsets();
    QCOMPARE(offsets.count(250), 1);
    QCOMPARE(offsets.count(250 + 125), 1);
}

void TransferEngineTest::testTransfer_exhaustedRetriesFailAndCleanUp()
{
    MemorySession session(m_payload);
    session.breakFrom(500);
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Failed);
    QVERIFY(!result.error.isEmpty());
    QVERIFY(!QFile::exists(m_tempPath));
    QVERIFY(!QFile::exists(TransferMarker::pathFor(m_tempPath)));
}

/** @brief Test: a stop request ends Cancelled and leaves temp and marker for resume. */
void TransferEngineTest::testTransfer_stopKeepsPartialFile()
{
    MemorySession session(m_payload);
    TransferEngine engine(options(4));
    std::atomic_bool stop{true};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Cancelled);
    QVERIFY(QFile::exists(m_tempPath));
    QVERIFY(QFile::exists(TransferMarker::pathFor(m_tempPath)));
}

/** @brief Test: chunks recorded as complete are not fetched again and the result is identical. */
void TransferEngineTest::testTransfer_resumeSkipsCompletedChunks()
{
    // Chunks 0 and 1 on disk, the rest still zero
    QByteArray partial = m_payload.left(500);
    partial.append(QByteArray(500, '\0'));
    QFile temp(m_tempPath);
    QVERIFY(temp.open(QIODevice::WriteOnly));
    temp.write(partial);
    temp.close();

    TransferMarker marker;
    marker.remotePath = entry(1000).remotePath;
    marker.sizeBytes = 1000;
    marker.modifiedTime = entry(1000).modifiedTime;
    marker.completedRanges = {qMakePair(qint64(0), qint64(250)), qMakePair(qint64(250), qint64(250))};
    QVERIFY(marker.save(TransferMarker::pathFor(m_tempPath)));

    MemorySession session(m_payload);
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(result.chunksResumed, 2);
    for (qint64 offset : session.openedOffsets())
    {
        QVERIFY2(offset >= 500, qPrintable(QString("re-fetched offset %1").arg(offset)));
    }
    QCOMPARE(readAll(m_tempPath), m_payload);
}

void TransferEngineTest::testTransfer_foreignMarkerDownloadsEverything()
{
    QFile temp(m_tempPath);
    QVERIFY(temp.open(QIODevice::WriteOnly));
    temp.write(QByteArray(1000, 'x'));
    temp.close();

    TransferMarker marker;
    marker.remotePath = "/incoming/other.mkv";
    marker.sizeBytes = 1000;
    marker.completedRanges = {qMakePair(qint64(0), qint64(250))};
    QVERIFY(marker.save(TransferMarker::pathFor(m_tempPath)));

    MemorySession session(m_payload);
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(result.chunksResumed, 0);
    QVERIFY(session.openedOffsets().contains(0));
    QCOMPARE(readAll(m_tempPath), m_payload);
}

/** @brief Test: ranges from a different chunk layout are not trusted. */
void TransferEngineTest::testTransfer_changedLayoutDownloadsEverything()
{
    QFile temp(m_tempPath);
    QVERIFY(temp.open(QIODevice::WriteOnly));
    temp.write(QByteArray(1000, 'x'));
    temp.close();

    TransferMarker marker;
    marker.remotePath = entry(1000).remotePath;
    marker.sizeBytes = 1000;
    marker.modifiedTime = entry(1000).modifiedTime;
    // Written by a three chunk plan
    marker.completedRanges = {qMakePair(qint64(0), qint64(333)), qMakePair(qint64(333), qint64(333))};
    QVERIFY(marker.save(TransferMarker::pathFor(m_tempPath)));

    MemorySession session(m_payload);
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(result.chunksResumed, 0);
    QCOMPARE(session.openedOffsets().size(), 4);
    QCOMPARE(readAll(m_tempPath), m_payload);
}

void TransferEngineTest::testTransfer_localSession()
{
    QTemporaryDir storeDir;
    QVERIFY(storeDir.isValid());
    QFile source(storeDir.filePath("episode.mkv"));
    QVERIFY(source.open(QIODevice::WriteOnly));
    source.write(m_payload);
    source.close();

    LocalRemoteSession session(storeDir.path());
    QList<RemoteEntry> entries;
    QString error;
    QVERIFY2(session.list("/", &entries, &error), qPrintable(error));
    QCOMPARE(entries.size(), 1);
    QCOMPARE(entries[0].remotePath, QString("/episode.mkv"));
    QCOMPARE(entries[0].sizeBytes, qint64(1000));

    TransferEngine engine(options(3));
    std::atomic_bool stop{false};
    const TransferResult result = engine.transfer(session, entries[0], m_tempPath, stop);

    QCOMPARE(result.status, TransferStatus::Verified);
    QCOMPARE(readAll(m_tempPath), m_payload);
}

/** @brief Test: the marker on disk ends with every chunk, whatever order they finished in. */
void TransferEngineTest::testTransfer_markerListsEveryCompletedChunk()
{
    MemorySession session(m_payload);
    session.setReverseDelays(true);
    TransferEngine engine(options(4));
    std::atomic_bool stop{false};

    const TransferResult result = engine.transfer(session, entry(m_payload.size()), m_tempPath, stop);
    QCOMPARE(result.status, TransferStatus::Verified);

    TransferMarker marker;
    QString error;
    QVERIFY2(TransferMarker::load(TransferMarker::pathFor(m_tempPath), &marker, &error), qPrintable(error));
    QVERIFY(marker.describes(entry(m_payload.size())));
    QCOMPARE(marker.completedRanges.size(), 4);
    for (const ChunkRange& chunk : result.chunks)
    {
        QVERIFY2(marker.hasCompleted(chunk), qPrintable(QString("chunk %1 missing").arg(chunk.index)));
    }
}

void TransferEngineTest::testLocalSession_readIsBoundedByLength()
{
    QTemporaryDir storeDir;
    QVERIFY(storeDir.isValid());
    QFile source(storeDir.filePath("episode.mkv"));
    QVERIFY(source.open(QIODevice::WriteOnly));
    source.write(m_payload);
    source.close();

    LocalRemoteSession session(storeDir.path());
    QString error;
    std::unique_ptr<QIODevice> stream = session.openRead("/episode.mkv", 100, 50, &error);
    QVERIFY2(stream, qPrintable(error));
    QCOMPARE(stream->readAll(), m_payload.mid(100, 50));

    // A window past the end yields what is left
    stream = session.openRead("/episode.mkv", 990, 50, &error);
    QVERIFY2(stream, qPrintable(error));
    QCOMPARE(stream->readAll(), m_payload.mid(990));

    QVERIFY(!session.openRead("/missing.mkv", 0, 10, &error));
    QVERIFY(!error.isEmpty());
}

QTEST_MAIN(TransferEngineTest)
#include "transferengine_test.moc"
