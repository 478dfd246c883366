#ifndef CHUNKPLANNER_H
#define CHUNKPLANNER_H

#include "pipelinetypes.h"

class ChunkPlanner
{
public:
    /**
     * @brief Partitions [0, fileSize) into contiguous ranges.
     *
     * Chunked mode splits files larger than one buffer into chunkCount
     * equal-width ranges, the last one taking the remainder. Everything else
     * gets a single range. The result never contains gaps, overlaps or, for
     * a non-empty file, empty ranges.
     */
    static ChunkPlan plan(qint64 fileSize, int chunkCount, bool chunkedMode, qint64 bufferSize);

    static bool coversExactly(const ChunkPlan &plan, qint64 fileSize);
};

#endif // CHUNKPLANNER_H
