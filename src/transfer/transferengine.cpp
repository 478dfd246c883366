#include "transferengine.h"
#include "chunkplanner.h"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFuture>
#include <QMutexLocker>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>

TransferOptions TransferOptions::fromSettings(const AppSettings& settings)
{
    TransferOptions options;
    options.chunkedMode = settings.useChunks();
    options.chunkCount = settings.chunkCount();
    options.bufferSize = settings.bufferSize();
    options.maxRetries = settings.maxRetries();
    options.saveOriginalName = settings.saveOriginalName();
    return options;
}

TransferEngine::TransferEngine(const TransferOptions& options, QObject* parent) : QObject{parent}, m_options(options)
{
}

void TransferEngine::discardTemp(const QString& tempPath)
{
    QFile::remove(tempPath);
    QFile::remove(TransferMarker::pathFor(tempPath));
}

TransferResult TransferEngine::transfer(RemoteSession& session, const RemoteEntry& entry, const QString& tempPath,
                                        const std::atomic_bool& stopRequested)
{
    TransferJob job;
    job.entry = entry;
    job.tempPath = tempPath;
    job.chunks = ChunkPlanner::plan(entry.sizeBytes, m_options.chunkCount, m_options.chunkedMode, m_options.bufferSize);

    TransferResult result;

    JobContext ctx;
    ctx.session = &session;
    ctx.job = &job;
    ctx.markerPath = TransferMarker::pathFor(tempPath);
    ctx.stopRequested = &stopRequested;

    result.chunksResumed = m_options.saveOriginalName ? restoreFromMarker(job, &ctx.marker) : 0;
    if (result.chunksResumed > 0)
    {
        emit logMessage(QString("Resuming %1: %2 of %3 chunks already on disk.")
                            .arg(entry.fileName())
                            .arg(result.chunksResumed)
                            .arg(job.chunks.size()),
                        LogCategory::TRANSFER);
    }

    QString error;
    if (!prepareTempFile(job, result.chunksResumed > 0, &error))
    {
        emit logMessage("Transfer failed: " + error, LogCategory::TRANSFER);
        discardTemp(tempPath);
        job.status = TransferStatus::Failed;
        result.status = job.status;
        result.error = error;
        result.chunks = job.chunks;
        return result;
    }

    if (m_options.saveOriginalName)
    {
        ctx.marker.remotePath = entry.remotePath;
        ctx.marker.sizeBytes = entry.sizeBytes;
        ctx.marker.modifiedTime = entry.modifiedTime;
        if (!ctx.marker.save(ctx.markerPath, &error))
        {
            emit logMessage("Warning: " + error + ". This transfer cannot be resumed.", LogCategory::TRANSFER);
        }
    }

    job.status = TransferStatus::InProgress;
    emit logMessage(QString("Downloading %1 (%2 bytes, %3 chunk(s)).")
                        .arg(entry.fileName())
                        .arg(entry.sizeBytes)
                        .arg(job.chunks.size()),
                    LogCategory::TRANSFER);

    qint64 alreadyDone = 0;
    for (const ChunkRange& chunk : job.chunks)
    {
        if (chunk.state == ChunkState::Done)
            alreadyDone += chunk.length;
    }
    ctx.transferred = alreadyDone;

    QThreadPool pool;
    pool.setMaxThreadCount(qMax(1, m_options.chunkCount));

    QList<QFuture<ChunkResult>> futures;
    for (const ChunkRange& chunk : job.chunks)
    {
        if (chunk.state == ChunkState::Done)
            continue;
        const int index = chunk.index;
        futures.append(QtConcurrent::run(&pool, [this, &ctx, index]() { return fetchChunk(ctx, index); }));
    }

    bool cancelled = false;
    QStringList errors;
    for (QFuture<ChunkResult>& future : futures)
    {
        future.waitForFinished();
        const ChunkResult chunkResult = future.result();
        if (chunkResult.outcome == ChunkOutcome::Failed)
            errors << chunkResult.error;
        else if (chunkResult.outcome == ChunkOutcome::Cancelled)
            cancelled = true;
    }
    result.chunks = job.chunks;

    if (!errors.isEmpty())
    {
        job.status = TransferStatus::Failed;
        result.error = errors.join("; ");
        emit logMessage(QString("Transfer of %1 failed: %2").arg(entry.fileName(), result.error), LogCategory::TRANSFER);
        discardTemp(tempPath);
    }
    else if (cancelled)
    {
        job.status = TransferStatus::Cancelled;
        result.error = "stopped by user";
        emit logMessage(QString("Transfer of %1 stopped, partial file kept for resume.").arg(entry.fileName()),
                        LogCategory::TRANSFER);
    }
    else if (!verify(job, &error))
    {
        job.status = TransferStatus::Failed;
        result.error = error;
        emit logMessage(QString("Verification of %1 failed: %2").arg(entry.fileName(), error), LogCategory::TRANSFER);
        discardTemp(tempPath);
    }
    else
    {
        job.status = TransferStatus::Verified;
        emit logMessage(QString("Downloaded and verified: %1").arg(entry.fileName()), LogCategory::TRANSFER);
    }

    result.status = job.status;
    return result;
}

int TransferEngine::restoreFromMarker(TransferJob& job, TransferMarker* marker)
{
    const QString markerPath = TransferMarker::pathFor(job.tempPath);
    const QFileInfo tempInfo(job.tempPath);
    if (!tempInfo.exists() || !QFileInfo::exists(markerPath))
    {
        return 0;
    }

    TransferMarker previous;
    QString error;
    if (!TransferMarker::load(markerPath, &previous, &error))
    {
        emit logMessage(error + ", downloading from scratch.", LogCategory::TRANSFER);
        return 0;
    }
    if (!previous.describes(job.entry) || tempInfo.size() != job.entry.sizeBytes)
    {
        emit logMessage(QString("Temp file %1 belongs to another version of the remote file, downloading from scratch.")
                            .arg(tempInfo.fileName()),
                        LogCategory::TRANSFER);
        return 0;
    }

    int restored = 0;
    for (ChunkRange& chunk : job.chunks)
    {
        if (previous.hasCompleted(chunk))
        {
            chunk.state = ChunkState::Done;
            chunk.bytesWritten = chunk.length;
            marker->completedRanges.append(qMakePair(chunk.offset, chunk.length));
            ++restored;
        }
    }
    return restored;
}

bool TransferEngine::prepareTempFile(const TransferJob& job, bool keepExisting, QString* errorOut)
{
    const QFileInfo info(job.tempPath);
    if (!QDir().mkpath(info.absolutePath()))
    {
        if (errorOut)
            *errorOut = QString("Cannot create temp directory %1").arg(info.absolutePath());
        return false;
    }

    if (!keepExisting)
    {
        discardTemp(job.tempPath);
    }

    QFile file(job.tempPath);
    QIODevice::OpenMode mode = QIODevice::ReadWrite;
    if (!keepExisting)
        mode |= QIODevice::Truncate;
    if (!file.open(mode))
    {
        if (errorOut)
            *errorOut = QString("Cannot open temp file %1: %2").arg(job.tempPath, file.errorString());
        return false;
    }
    if (!file.resize(job.entry.sizeBytes))
    {
        if (errorOut)
            *errorOut = QString("Cannot pre-allocate %1 bytes for %2: %3")
                            .arg(job.entry.sizeBytes)
                            .arg(job.tempPath, file.errorString());
        return false;
    }
    file.close();
    return true;
}

void TransferEngine::setChunkState(JobContext& ctx, int index, ChunkState state)
{
    QMutexLocker locker(&ctx.mutex);
    ctx.job->chunks[static_cast<size_t>(index)].state = state;
}

void TransferEngine::markChunkDone(JobContext& ctx, int index)
{
    TransferMarker snapshot;
    int generation = 0;
    {
        QMutexLocker locker(&ctx.mutex);
        ChunkRange& chunk = ctx.job->chunks[static_cast<size_t>(index)];
        chunk.state = ChunkState::Done;
        if (!m_options.saveOriginalName)
            return;
        ctx.marker.completedRanges.append(qMakePair(chunk.offset, chunk.length));
        snapshot = ctx.marker;
        generation = ++ctx.markerGeneration;
    }

    // The rename in save() runs outside the state lock. Writers are ordered
    // so that an older snapshot never replaces a newer one.
    QMutexLocker writeLocker(&ctx.markerWriteMutex);
    if (generation <= ctx.savedGeneration)
        return;
    QString error;
    if (!snapshot.save(ctx.markerPath, &error))
    {
        emit logMessage("Warning: " + error, LogCategory::TRANSFER);
        return;
    }
    ctx.savedGeneration = generation;
}

TransferEngine::ChunkResult TransferEngine::fetchChunk(JobContext& ctx, int index)
{
    ChunkResult result;
    TransferJob& job = *ctx.job;
    const RemoteEntry& entry = job.entry;

    // Only this worker touches this element; the mutex guards the marker and the state reads.
    ChunkRange& chunk = job.chunks[static_cast<size_t>(index)];
    chunk.bytesWritten = 0;

    QFile out(job.tempPath);
    if (!out.open(QIODevice::ReadWrite))
    {
        result.error = QString("chunk %1: cannot open %2: %3").arg(index).arg(job.tempPath, out.errorString());
        ctx.abortJob = true;
        return result;
    }

    QByteArray buffer;
    buffer.resize(static_cast<qsizetype>(qMin(m_options.bufferSize, qMax<qint64>(1, chunk.length))));

    int attempts = 0;
    setChunkState(ctx, index, ChunkState::Downloading);

    while (chunk.bytesWritten < chunk.length)
    {
        if (ctx.stopRequested->load())
        {
            result.outcome = ChunkOutcome::Cancelled;
            setChunkState(ctx, index, ChunkState::NotStarted);
            return result;
        }
        if (ctx.abortJob.load())
        {
            result.outcome = ChunkOutcome::Aborted;
            setChunkState(ctx, index, ChunkState::NotStarted);
            return result;
        }

        const qint64 position = chunk.offset + chunk.bytesWritten;
        const qint64 remaining = chunk.length - chunk.bytesWritten;

        QString readError;
        std::unique_ptr<QIODevice> stream = ctx.session->openRead(entry.remotePath, position, remaining, &readError);
        if (stream && !out.seek(position))
        {
            result.error = QString("chunk %1: cannot seek temp file to %2").arg(index).arg(position);
            ctx.abortJob = true;
            return result;
        }

        while (stream && chunk.bytesWritten < chunk.length)
        {
            if (ctx.stopRequested->load() || ctx.abortJob.load())
                break;

            const qint64 want = qMin<qint64>(buffer.size(), chunk.length - chunk.bytesWritten);
            const qint64 got = stream->read(buffer.data(), want);
            if (got <= 0)
            {
                readError = QString("stream ended %1 bytes early").arg(chunk.length - chunk.bytesWritten);
                if (got < 0 && !stream->errorString().isEmpty())
                    readError += " (" + stream->errorString() + ")";
                break;
            }

            if (out.write(buffer.constData(), got) != got)
            {
                result.error = QString("chunk %1: write to %2 failed: %3").arg(index).arg(job.tempPath, out.errorString());
                ctx.abortJob = true;
                return result;
            }
            chunk.bytesWritten += got;
            const qint64 done = ctx.transferred.fetch_add(got) + got;
            emit bytesTransferred(entry.remotePath, done, entry.sizeBytes);
        }

        if (chunk.bytesWritten >= chunk.length || ctx.stopRequested->load() || ctx.abortJob.load())
            continue;

        // Read failure: retry the unread tail of this chunk from where it stopped.
        ++attempts;
        if (attempts > m_options.maxRetries)
        {
            result.error = QString("chunk %1 (offset %2): %3, giving up after %4 retries")
                               .arg(index)
                               .arg(position)
                               .arg(readError)
                               .arg(m_options.maxRetries);
            setChunkState(ctx, index, ChunkState::NotStarted);
            ctx.abortJob = true;
            return result;
        }
        emit logMessage(QString("%1: chunk %2 read error (%3), retrying from offset %4 (%5/%6).")
                            .arg(entry.fileName())
                            .arg(index)
                            .arg(readError)
                            .arg(chunk.offset + chunk.bytesWritten)
                            .arg(attempts)
                            .arg(m_options.maxRetries),
                        LogCategory::TRANSFER);
        setChunkState(ctx, index, ChunkState::NotStarted);
        setChunkState(ctx, index, ChunkState::Downloading);
    }

    if (!out.flush())
    {
        result.error = QString("chunk %1: flush of %2 failed: %3").arg(index).arg(job.tempPath, out.errorString());
        ctx.abortJob = true;
        return result;
    }
    out.close();

    markChunkDone(ctx, index);
    result.outcome = ChunkOutcome::Done;
    return result;
}

bool TransferEngine::verify(const TransferJob& job, QString* errorOut) const
{
    for (const ChunkRange& chunk : job.chunks)
    {
        if (chunk.state != ChunkState::Done || chunk.bytesWritten != chunk.length)
        {
            if (errorOut)
                *errorOut = QString("chunk %1 incomplete (%2 of %3 bytes)")
                                .arg(chunk.index)
                                .arg(chunk.bytesWritten)
                                .arg(chunk.length);
            return false;
        }
    }

    const qint64 actual = QFileInfo(job.tempPath).size();
    if (actual != job.entry.sizeBytes)
    {
        if (errorOut)
            *errorOut = QString("size mismatch, expected %1 bytes, got %2").arg(job.entry.sizeBytes).arg(actual);
        return false;
    }
    return true;
}
