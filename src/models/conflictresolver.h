/**
 * @file conflictresolver.h
 * @brief Sticky overwrite/skip policy for one batch.
 */

#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

/**
 * @brief User decision for a name conflict.
 */
enum class OverwriteResponse { Overwrite, OverwriteAll, Skip, SkipAll, Cancel };

/**
 * @brief Decides what happens when a copy reports a name conflict.
 *
 * The resolver carries the "for all remaining" mode of the running batch.
 * Once the user picks Overwrite All or Skip All, later conflicts in the same
 * batch are handled without asking. reset() is called at the start of every
 * batch.
 */
class ConflictResolver
{
public:
    enum class Mode { None, Overwrite, Skip };

    /// @brief What the queue does next with the conflicting file.
    enum class Step {
        RetryWithOverwrite,  ///< Copy the same file again with overwrite forced
        Skip,                ///< Mark the item skipped and continue
        AskUser,             ///< Suspend the batch until a decision arrives
        CancelBatch          ///< Stop the batch; remaining paths are never enqueued
    };

    [[nodiscard]] Mode mode() const { return mode_; }
    void reset() { mode_ = Mode::None; }

    /// @brief True when new copies should be started with overwrite set.
    [[nodiscard]] bool forcesOverwrite() const { return mode_ == Mode::Overwrite; }

    /// @brief Step for a conflict reported by the copy primitive.
    [[nodiscard]] Step onConflict() const;

    /**
     * @brief Applies a user decision.
     *
     * The "All" variants switch the mode for the rest of the batch.
     * @return RetryWithOverwrite, Skip or CancelBatch.
     */
    Step resolve(OverwriteResponse response);

    [[nodiscard]] static const char *modeToString(Mode mode);

private:
    Mode mode_ = Mode::None;
};

#endif // CONFLICTRESOLVER_H
