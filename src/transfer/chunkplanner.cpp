#include "chunkplanner.h"

#include <QtGlobal>

ChunkPlan ChunkPlanner::plan(qint64 fileSize, int chunkCount, bool chunkedMode, qint64 bufferSize)
{
    ChunkPlan plan;
    const qint64 size = qMax<qint64>(0, fileSize);

    qint64 count = 1;
    if (chunkedMode && chunkCount > 1 && size > bufferSize)
    {
        count = qMin<qint64>(chunkCount, size);
    }

    const qint64 width = size / count;
    plan.reserve(static_cast<size_t>(count));
    for (qint64 i = 0; i < count; ++i)
    {
        ChunkRange range;
        range.index = static_cast<int>(i);
        range.offset = i * width;
        range.length = (i == count - 1) ? size - range.offset : width;
        plan.push_back(range);
    }
    return plan;
}

bool ChunkPlanner::coversExactly(const ChunkPlan& plan, qint64 fileSize)
{
    if (plan.empty())
    {
        return fileSize == 0;
    }
    qint64 expectedOffset = 0;
    for (size_t i = 0; i < plan.size(); ++i)
    {
        const ChunkRange& range = plan[i];
        if (range.index != static_cast<int>(i) || range.offset != expectedOffset || range.length < 0)
        {
            return false;
        }
        if (range.length == 0 && fileSize != 0)
        {
            return false;
        }
        expectedOffset += range.length;
    }
    return expectedOffset == fileSize;
}
