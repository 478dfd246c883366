#ifndef TRANSFERENGINE_H
#define TRANSFERENGINE_H

#include "appsettings.h"
#include "pipelinetypes.h"
#include "remotesession.h"
#include "transfermarker.h"

#include <QMutex>
#include <QObject>
#include <atomic>

struct TransferOptions
{
    bool chunkedMode = true;
    int chunkCount = 3;
    qint64 bufferSize = 1024 * 1024;
    int maxRetries = 3;
    bool saveOriginalName = true;

    static TransferOptions fromSettings(const AppSettings &settings);
};

struct TransferResult
{
    TransferStatus status = TransferStatus::Pending;
    QString error;
    ChunkPlan chunks;
    int chunksResumed = 0;
};

/**
 * @brief Downloads one remote file into a temp file, chunk by chunk.
 *
 * The temp file is pre-sized, and every chunk worker writes through its own
 * file handle into its own byte window, so workers share nothing but the
 * resume marker. The result is either Verified (byte-exact copy on disk),
 * Failed (temp and marker deleted) or Cancelled (temp and marker kept for a
 * later resume).
 */
class TransferEngine : public QObject
{
    Q_OBJECT
public:
    explicit TransferEngine(const TransferOptions &options, QObject *parent = nullptr);

    TransferResult transfer(RemoteSession &session, const RemoteEntry &entry, const QString &tempPath,
                            const std::atomic_bool &stopRequested);

    const TransferOptions &options() const { return m_options; }

    static void discardTemp(const QString &tempPath);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::TRANSFER);
    void bytesTransferred(const QString &remotePath, qint64 done, qint64 total);

private:
    enum class ChunkOutcome
    {
        Done,
        Failed,
        Cancelled,
        Aborted
    };

    struct ChunkResult
    {
        ChunkOutcome outcome = ChunkOutcome::Failed;
        QString error;
    };

    struct JobContext
    {
        RemoteSession *session = nullptr;
        TransferJob *job = nullptr;
        TransferMarker marker;
        QString markerPath;
        QMutex mutex;
        QMutex markerWriteMutex;
        int markerGeneration = 0; // guarded by mutex
        int savedGeneration = 0;  // guarded by markerWriteMutex
        const std::atomic_bool *stopRequested = nullptr;
        std::atomic_bool abortJob{false};
        std::atomic<qint64> transferred{0};
    };

    int restoreFromMarker(TransferJob &job, TransferMarker *marker);
    bool prepareTempFile(const TransferJob &job, bool keepExisting, QString *errorOut);
    ChunkResult fetchChunk(JobContext &ctx, int index);
    void setChunkState(JobContext &ctx, int index, ChunkState state);
    void markChunkDone(JobContext &ctx, int index);
    bool verify(const TransferJob &job, QString *errorOut) const;

    TransferOptions m_options;
};

#endif // TRANSFERENGINE_H
