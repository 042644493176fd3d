#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QAbstractListModel>
#include <QDateTime>
#include <QHash>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "conflictresolver.h"
#include "services/copyresult.h"  // For CopyResult definition (needed by Qt MOC)
#include "services/ifileoperations.h"  // Full include needed for QPointer

/**
 * @brief State machine states for TransferQueue.
 */
enum class QueueState {
    Idle,                    ///< No batch running - ready for new work
    Copying,                 ///< A batch is running (one copy in flight or about to start)
    AwaitingConfirmation     ///< Suspended on a name conflict until a decision arrives
};

/// @brief Convert QueueState to string for debugging
[[nodiscard]] inline const char* queueStateToString(QueueState state) {
    switch (state) {
        case QueueState::Idle: return "Idle";
        case QueueState::Copying: return "Copying";
        case QueueState::AwaitingConfirmation: return "AwaitingConfirmation";
    }
    return "Unknown";
}

struct TransferItem {
    enum class Status { Pending, Copying, Completed, Failed, Cancelled };

    QString id;
    QString fileName;
    qint64 fileSize = 0;
    bool sizeKnown = false;
    qint64 bytesTransferred = 0;
    Status status = Status::Pending;
    QString errorMessage;
    QDateTime startTime;
    QString sourcePath;
    QString destinationDir;
    int serial = 0;      // Position in enqueue order, shown as "#"
    int batchId = -1;    // Links item to its batch

    [[nodiscard]] bool isTerminal() const {
        return status == Status::Completed || status == Status::Failed
            || status == Status::Cancelled;
    }
};

/**
 * @brief How a batch treats a name conflict.
 */
enum class ConflictHandling {
    Prompt,          ///< Consult the sticky mode, ask the user when it is unset
    FailOnConflict   ///< Record the conflict as a failed item and continue
};

/**
 * @brief One user action's worth of copies into a single directory.
 */
struct BatchRequest {
    QStringList sourcePaths;
    QString destinationDir;
    QHash<QString, qint64> fileSizes;  ///< Known sizes keyed by source path
    bool forceOverwrite = false;
    ConflictHandling conflictHandling = ConflictHandling::Prompt;
};

/**
 * @brief Continuation of a batch suspended on a name conflict.
 *
 * Captured when the conflict is reported and handed back to
 * TransferQueue::resolveConflict() together with the decision. Resuming
 * needs nothing beyond this value and the resolver's sticky mode.
 */
struct PendingBatch {
    int batchId = -1;
    QStringList sourcePaths;
    int currentIndex = 0;
    QHash<QString, qint64> fileSizes;
    QString destinationDir;
    QString itemId;      ///< Item waiting for the decision
    QString fileName;    ///< Name shown in the overwrite prompt

    [[nodiscard]] bool isValid() const { return batchId >= 0; }
};

/**
 * @brief Sequential copy queue with conflict suspension.
 *
 * Batches run one at a time, one copy in flight at a time. Each source path
 * gets a TransferItem when its copy starts, so a path that is never reached
 * (after Cancel Import) never appears in the list. Batches submitted while
 * another is running or suspended wait in FIFO order.
 *
 * Cancellation only changes the status of an item. A copy that is already
 * running is allowed to finish; its result does not replace the Cancelled
 * status.
 *
 * Work triggered from signal handlers is deferred through an internal event
 * queue; tests call flushEventQueue() to run it synchronously.
 */
class TransferQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        FileNameRole,
        FileSizeRole,
        BytesTransferredRole,
        ProgressRole,
        StatusRole,
        ErrorMessageRole,
        StartTimeRole,
        SourcePathRole,
        DestinationDirRole,
        SerialRole
    };

    static const QString SkippedMessage;
    static const QString ImportCancelledMessage;
    static const QString CancelledMessage;

    explicit TransferQueue(QObject *parent = nullptr);
    ~TransferQueue() override;

    void setFileOperations(IFileOperations *fileOps);

    /**
     * @brief Submits a batch.
     * @return The batch id, or -1 for an empty request.
     *
     * The sticky conflict mode is reset when the batch starts.
     */
    int enqueueBatch(const BatchRequest &request);

    /// @name Conflict decisions
    /// @{

    /**
     * @brief Resumes (or stops) a suspended batch.
     * @param batch The continuation from overwriteConfirmationNeeded().
     * @param response The user's decision.
     *
     * A continuation that is not the one currently suspended is ignored.
     */
    void resolveConflict(const PendingBatch &batch, OverwriteResponse response);

    /// @brief resolveConflict() for the currently suspended batch, if any.
    void respondToOverwrite(OverwriteResponse response);

    [[nodiscard]] std::optional<PendingBatch> pendingBatch() const { return pending_; }
    [[nodiscard]] bool isAwaitingConfirmation() const { return state_ == QueueState::AwaitingConfirmation; }
    [[nodiscard]] ConflictResolver::Mode overwriteAllMode() const { return resolver_.mode(); }
    /// @}

    /// @name Cancellation and cleanup
    /// @{
    void cancelTransfer(const QString &itemId);
    void cancelAll();
    void clear();
    void removeFinished();
    /// @}

    /// @name Queries
    /// @{
    [[nodiscard]] QueueState state() const { return state_; }
    [[nodiscard]] bool isProcessing() const { return state_ != QueueState::Idle; }
    [[nodiscard]] int queuedBatchCount() const { return queuedBatches_.size(); }
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] int finishedCount() const;
    [[nodiscard]] bool hasFailures() const;
    [[nodiscard]] bool allSucceeded() const;
    [[nodiscard]] const QList<TransferItem> &items() const { return items_; }
    [[nodiscard]] std::optional<TransferItem> findItem(const QString &itemId) const;
    /// @}

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

    // For testing: immediately process all pending events
    void flushEventQueue();

signals:
    void batchStarted(int batchId);
    void batchFinished(int batchId, bool cancelled);
    void operationStarted(const QString &itemId, const QString &fileName);
    void operationCompleted(const QString &itemId, const QString &fileName);
    void operationFailed(const QString &fileName, const QString &error);
    void overwriteConfirmationNeeded(const QString &fileName, const QString &itemId);
    void destinationRefreshNeeded(const QString &destinationDir);
    void allOperationsCompleted(bool allSucceeded);
    void operationsCancelled();
    void queueChanged();

    // Status messages (for user feedback)
    void statusMessage(const QString &message, int timeout);

private slots:
    void onCopyProgress(const QString &sourcePath, qint64 bytesCopied, qint64 totalBytes);
    void onCopyFinished(const QString &sourcePath, const CopyResult &result);

private:
    struct QueuedBatch {
        int batchId = -1;
        BatchRequest request;
    };

    struct ActiveBatch {
        int batchId = -1;
        BatchRequest request;
        int index = 0;              // Index into request.sourcePaths
        QString currentItemId;
        bool inFlight = false;      // A copyFile() call has not reported back yet
        bool retrying = false;      // The in-flight copy is the forced-overwrite retry
        bool cancelled = false;     // cancelAll() hit while the copy was in flight
    };

    void processNext();
    void scheduleProcessNext();  // Defers processNext() to prevent re-entrancy
    void scheduleAdvance();      // Defers moving to the next path of the active batch
    void scheduleEvent(std::function<void()> event);
    void processEventQueue();    // Processes pending events

    void startCurrentItem();
    void startCopy(const QString &sourcePath, bool overwrite);
    void advance();
    void finishBatch(bool cancelled);
    void handleConflict(int row, const CopyResult &result);

    void setItemStatus(int row, TransferItem::Status status, const QString &error = QString());
    [[nodiscard]] int findItemIndex(const QString &itemId) const;
    [[nodiscard]] QString makeItemId(const QString &fileName);

    void transitionTo(QueueState newState);

    QPointer<IFileOperations> fileOps_;
    QList<TransferItem> items_;

    QQueue<QueuedBatch> queuedBatches_;
    std::optional<ActiveBatch> active_;
    std::optional<PendingBatch> pending_;
    ConflictResolver resolver_;

    int nextBatchId_ = 1;
    int nextSerial_ = 1;
    quint64 idCounter_ = 0;

    // Event queue for deferred processing (prevents re-entrancy)
    QQueue<std::function<void()>> eventQueue_;
    bool processingEvents_ = false;  // Re-entrancy guard
    bool eventProcessingScheduled_ = false;  // Prevents multiple timer posts

    QueueState state_ = QueueState::Idle;
};

#endif // TRANSFERQUEUE_H
