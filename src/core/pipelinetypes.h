#ifndef PIPELINETYPES_H
#define PIPELINETYPES_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <vector>


struct RemoteEntry
{
    QString remotePath;
    qint64 sizeBytes = 0;
    QDateTime modifiedTime;

    QString fileName() const
    {
        const int slash = remotePath.lastIndexOf('/');
        return slash < 0 ? remotePath : remotePath.mid(slash + 1);
    }
};

enum class ChunkState
{
    NotStarted,
    Downloading,
    Done
};

struct ChunkRange
{
    int index = 0;
    qint64 offset = 0;
    qint64 length = 0;
    ChunkState state = ChunkState::NotStarted;
    qint64 bytesWritten = 0;

    qint64 end() const { return offset + length; }
};

using ChunkPlan = std::vector<ChunkRange>;

enum class TransferStatus
{
    Pending,
    InProgress,
    Verified,
    Failed,
    Cancelled
};

struct TransferJob
{
    RemoteEntry entry;
    QString tempPath;
    ChunkPlan chunks;
    TransferStatus status = TransferStatus::Pending;
};

struct ReplacementRule
{
    QString oldText;
    QString newText;
};

using ReplacementRuleList = QList<ReplacementRule>;

struct CatalogRule
{
    QString matchKey;
    QString displayName;
    int seasonNumber = 1;
    QString replacementSource; // URL or local path, may be empty
};

enum class PlacementAction
{
    Copy,
    Move
};

struct PlacementDecision
{
    QString sourcePath;
    QString finalPath;
    PlacementAction action = PlacementAction::Copy;
    bool renamed = false;
    CatalogRule rule;

    bool operator==(const PlacementDecision &other) const
    {
        return sourcePath == other.sourcePath && finalPath == other.finalPath && action == other.action &&
               renamed == other.renamed;
    }
};

enum class ItemState
{
    Listed,
    Transferring,
    Verified,
    Matching,
    Placed,
    SubtitleProcessing,
    Done,
    Skipped,
    Failed
};

enum class PipelineError
{
    None,
    TransferError,
    NoCatalogMatch,
    NamingAmbiguous,
    SubtitleToolError,
    PlacementError,
    Cancelled,
    AlreadyProcessed,
    Filtered
};

enum class SubtitleOutcome
{
    NotApplicable,
    Applied,
    Failed
};

struct ItemReport
{
    RemoteEntry entry;
    ItemState state = ItemState::Listed;
    PipelineError error = PipelineError::None;
    QString reason;
    QString finalPath;
    bool unrenamed = false;
    SubtitleOutcome subtitleOutcome = SubtitleOutcome::NotApplicable;
    QString subtitleReason;
};

struct RunSummary
{
    QList<ItemReport> items;
    bool listed = false; // false when the store could not be listed at all
    int done = 0;
    int skipped = 0;
    int failed = 0;
};

QString itemStateName(ItemState state);
QString pipelineErrorName(PipelineError error);
QString subtitleOutcomeName(SubtitleOutcome outcome);
bool isTerminalState(ItemState state);
bool isValidTransition(ItemState from, ItemState to);

#endif // PIPELINETYPES_H
