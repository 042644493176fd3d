#include "conflictresolver.h"

ConflictResolver::Step ConflictResolver::onConflict() const
{
    switch (mode_) {
    case Mode::Overwrite:
        return Step::RetryWithOverwrite;
    case Mode::Skip:
        return Step::Skip;
    case Mode::None:
        break;
    }
    return Step::AskUser;
}

ConflictResolver::Step ConflictResolver::resolve(OverwriteResponse response)
{
    switch (response) {
    case OverwriteResponse::OverwriteAll:
        mode_ = Mode::Overwrite;
        return Step::RetryWithOverwrite;
    case OverwriteResponse::Overwrite:
        return Step::RetryWithOverwrite;
    case OverwriteResponse::SkipAll:
        mode_ = Mode::Skip;
        return Step::Skip;
    case OverwriteResponse::Skip:
        return Step::Skip;
    case OverwriteResponse::Cancel:
        break;
    }
    return Step::CancelBatch;
}

const char *ConflictResolver::modeToString(Mode mode)
{
    switch (mode) {
    case Mode::None: return "None";
    case Mode::Overwrite: return "Overwrite";
    case Mode::Skip: return "Skip";
    }
    return "Unknown";
}
