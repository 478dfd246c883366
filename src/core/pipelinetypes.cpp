#include "pipelinetypes.h"


QString itemStateName(ItemState state)
{
    switch (state)
    {
    case ItemState::Listed:
        return "Listed";
    case ItemState::Transferring:
        return "Transferring";
    case ItemState::Verified:
        return "Verified";
    case ItemState::Matching:
        return "Matching";
    case ItemState::Placed:
        return "Placed";
    case ItemState::SubtitleProcessing:
        return "SubtitleProcessing";
    case ItemState::Done:
        return "Done";
    case ItemState::Skipped:
        return "Skipped";
    case ItemState::Failed:
        return "Failed";
    }
    return "Unknown";
}

QString pipelineErrorName(PipelineError error)
{
    switch (error)
    {
    case PipelineError::None:
        return "None";
    case PipelineError::TransferError:
        return "TransferError";
    case PipelineError::NoCatalogMatch:
        return "NoCatalogMatch";
    case PipelineError::NamingAmbiguous:
        return "NamingAmbiguous";
    case PipelineError::SubtitleToolError:
        return "SubtitleToolError";
    case PipelineError::PlacementError:
        return "PlacementError";
    case PipelineError::Cancelled:
        return "Cancelled";
    case PipelineError::AlreadyProcessed:
        return "AlreadyProcessed";
    case PipelineError::Filtered:
        return "Filtered";
    }
    return "Unknown";
}

QString subtitleOutcomeName(SubtitleOutcome outcome)
{
    switch (outcome)
    {
    case SubtitleOutcome::NotApplicable:
        return "not applicable";
    case SubtitleOutcome::Applied:
        return "applied";
    case SubtitleOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

bool isTerminalState(ItemState state)
{
    return state == ItemState::Done || state == ItemState::Skipped || state == ItemState::Failed;
}

bool isValidTransition(ItemState from, ItemState to)
{
    switch (from)
    {
    case ItemState::Listed:
        // Skipped here covers already processed and filtered entries,
        // Failed covers a stop request before the item started.
        return to == ItemState::Transferring || to == ItemState::Skipped || to == ItemState::Failed;
    case ItemState::Transferring:
        return to == ItemState::Verified || to == ItemState::Failed;
    case ItemState::Verified:
        return to == ItemState::Matching;
    case ItemState::Matching:
        return to == ItemState::Placed || to == ItemState::Skipped || to == ItemState::Failed;
    case ItemState::Placed:
        return to == ItemState::SubtitleProcessing || to == ItemState::Failed;
    case ItemState::SubtitleProcessing:
        return to == ItemState::Done;
    case ItemState::Done:
    case ItemState::Skipped:
    case ItemState::Failed:
        return false;
    }
    return false;
}
