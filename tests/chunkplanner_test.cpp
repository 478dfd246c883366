/**
 * @file chunkplanner_test.cpp
 * @brief Unit tests for ChunkPlanner
 */

#include <QtTest/QtTest>

#include "chunkplanner.h"

class ChunkPlannerTest : public QObject
{
    Q_OBJECT

private slots:
    void testPlan_coversWholeFile_data();
    void testPlan_coversWholeFile();
    void testPlan_fiveHundredMegabytesInFourChunks();
    void testPlan_lastChunkTakesRemainder();
    void testPlan_singleRangeWhenChunkingDisabled();
    void testPlan_singleRangeForSmallFile();
    void testPlan_emptyFile();
    void testPlan_countClampedToSize();
    void testCoversExactly_detectsGapAndOverlap();
};

void ChunkPlannerTest::testPlan_coversWholeFile_data()
{
    QTest::addColumn<qint64>("size");
    QTest::addColumn<int>("chunks");

    const QList<qint64> sizes = {0, 1, 2, 3, 7, 4096, 4097, 1048576, 1048577, 123456789, 500000000};
    const QList<int> counts = {1, 2, 3, 4, 7, 16};
    for (qint64 size : sizes)
    {
        for (int count : counts)
        {
            QTest::addRow("size%lld_n%d", size, count) << size << count;
        }
    }
}

/** @brief Test: every plan partitions [0, S) without gaps, overlaps or empty ranges. */
void ChunkPlannerTest::testPlan_coversWholeFile()
{
    QFETCH(qint64, size);
    QFETCH(int, chunks);

    // Small buffer so that chunking kicks in for most sizes
    const ChunkPlan plan = ChunkPlanner::plan(size, chunks, true, 1);
    QVERIFY2(ChunkPlanner::coversExactly(plan, size), "plan does not cover the file exactly");

    qint64 total = 0;
    for (const ChunkRange& range : plan)
    {
        QCOMPARE(range.state, ChunkState::NotStarted);
        total += range.length;
    }
    QCOMPARE(total, size);
    QVERIFY(static_cast<qint64>(plan.size()) <= qMax<qint64>(1, qMin<qint64>(chunks, size)));
}

/** @brief Test: 500,000,000 bytes in 4 chunks gives four 125,000,000 byte ranges. */
void ChunkPlannerTest::testPlan_fiveHundredMegabytesInFourChunks()
{
    const ChunkPlan plan = ChunkPlanner::plan(500000000, 4, true, 1048576);
    QCOMPARE(plan.size(), size_t(4));
    for (int i = 0; i < 4; ++i)
    {
        QCOMPARE(plan[i].index, i);
        QCOMPARE(plan[i].offset, qint64(i) * 125000000);
        QCOMPARE(plan[i].length, qint64(125000000));
    }
}

void ChunkPlannerTest::testPlan_lastChunkTakesRemainder()
{
    const ChunkPlan plan = ChunkPlanner::plan(10, 3, true, 1);
    QCOMPARE(plan.size(), size_t(3));
    QCOMPARE(plan[0].length, qint64(3));
    QCOMPARE(plan[1].length, qint64(3));
    QCOMPARE(plan[2].offset, qint64(6));
    QCOMPARE(plan[2].length, qint64(4));
}

void ChunkPlannerTest::testPlan_singleRangeWhenChunkingDisabled()
{
    const ChunkPlan plan = ChunkPlanner::plan(50000000, 4, false, 1048576);
    QCOMPARE(plan.size(), size_t(1));
    QCOMPARE(plan[0].offset, qint64(0));
    QCOMPARE(plan[0].length, qint64(50000000));
}

/** @brief Test: a file no larger than one buffer is never split. */
void ChunkPlannerTest::testPlan_singleRangeForSmallFile()
{
    QCOMPARE(ChunkPlanner::plan(1048576, 4, true, 1048576).size(), size_t(1));
    QCOMPARE(ChunkPlanner::plan(1048577, 4, true, 1048576).size(), size_t(4));
}

void ChunkPlannerTest::testPlan_emptyFile()
{
    const ChunkPlan plan = ChunkPlanner::plan(0, 4, true, 1);
    QCOMPARE(plan.size(), size_t(1));
    QCOMPARE(plan[0].offset, qint64(0));
    QCOMPARE(plan[0].length, qint64(0));
    QVERIFY(ChunkPlanner::coversExactly(plan, 0));
}

void ChunkPlannerTest::testPlan_countClampedToSize()
{
    const ChunkPlan plan = ChunkPlanner::plan(3, 8, true, 1);
    QCOMPARE(plan.size(), size_t(3));
    for (const ChunkRange& range : plan)
    {
        QCOMPARE(range.length, qint64(1));
    }
}

void ChunkPlannerTest::testCoversExactly_detectsGapAndOverlap()
{
    ChunkPlan plan = ChunkPlanner::plan(100, 4, true, 1);
    QVERIFY(ChunkPlanner::coversExactly(plan, 100));

    ChunkPlan gap = plan;
    gap[2].offset += 1;
    QVERIFY(!ChunkPlanner::coversExactly(gap, 100));

    ChunkPlan overlap = plan;
    overlap[1].length += 1;
    QVERIFY(!ChunkPlanner::coversExactly(overlap, 100));

    QVERIFY(!ChunkPlanner::coversExactly(plan, 101));
}

QTEST_MAIN(ChunkPlannerTest)
#include "chunkplanner_test.moc"
