/**
 * @file transferservice.h
 * @brief Service turning user actions into transfer batches and file mutations.
 *
 * This service encapsulates the ingestion workflow, providing high-level
 * operations for UI widgets instead of direct TransferQueue coupling.
 */

#ifndef TRANSFERSERVICE_H
#define TRANSFERSERVICE_H

#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "models/selectionengine.h"
#include "models/transferqueue.h"

class QMimeData;
class PaneModel;

/**
 * @brief Service for coordinating copies into the pool and pane mutations.
 *
 * Every way of bringing files in (toolbar copy, keyboard, in-app drag, drop
 * from the desktop, file dialog, folder import) ends in a single call to
 * TransferQueue::enqueueBatch(). Copy back to the source directory uses the
 * same entry point with conflicts recorded as failures.
 *
 * Rename, delete and create folder go straight to IFileOperations. The
 * affected pane is refreshed afterwards whether the mutation succeeded or
 * not; failures are reported through mutationFailed().
 *
 * @par Example usage:
 * @code
 * TransferService *service = new TransferService(source, destination, queue, this);
 * service->setFileOperations(fileOps);
 *
 * connect(service, &TransferService::mutationFailed,
 *         errorHandler, &ErrorHandler::handleMutationError);
 *
 * service->copySelectedToPool();
 * @endcode
 */
class TransferService : public QObject
{
    Q_OBJECT

public:
    /// MIME type of the in-app drag payload (JSON array of absolute paths)
    static const QString DragMimeType;

    /**
     * @brief Constructs a transfer service.
     * @param source The source pane (not owned).
     * @param destination The destination pane (not owned).
     * @param queue The transfer queue to delegate copies to (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferService(PaneModel *source,
                             PaneModel *destination,
                             TransferQueue *queue,
                             QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~TransferService() override;

    void setFileOperations(IFileOperations *fileOps);

    /// @name Ingestion
    /// All of these return the batch id, or -1 when nothing was queued.
    /// @{

    /**
     * @brief Copies the source pane selection into the destination directory.
     *
     * Paths are taken in listing order with their known sizes. The source
     * selection is cleared and the transfer panel requested.
     */
    int copySelectedToPool();

    /**
     * @brief Queues paths dropped from the source pane.
     *
     * Only paths still present in the source listing are copied.
     */
    int handleInternalDrop(const QMimeData *mimeData);

    /**
     * @brief Queues files dropped from outside the application.
     *
     * Non-local URLs are ignored. Dropped files go through the same conflict
     * handling as every other import.
     */
    int handleExternalDrop(const QList<QUrl> &urls);

    /// @brief Queues files picked in a file dialog.
    int importFiles(const QStringList &paths);

    /// @brief Queues a whole folder (copied recursively as one item).
    int importFolder(const QString &path);

    /**
     * @brief Copies destination entries into the source pane's directory.
     * @param contextPath Entry the context menu was opened on, if any.
     *
     * With a context path that is not part of the selection, only that entry
     * is copied. Requires the source pane to be open. Existing files are not
     * replaced; they are recorded as failed items.
     */
    int copyBackToSource(const QString &contextPath = QString());
    /// @}

    /// @name Drag and drop helpers
    /// @{
    [[nodiscard]] static QMimeData *createDragMimeData(const QStringList &paths);
    [[nodiscard]] static QStringList decodeDragPaths(const QMimeData *mimeData);
    [[nodiscard]] static bool canDecode(const QMimeData *mimeData);

    /// @brief Drop-zone highlight; independent of the queue state.
    void setDropHover(bool hovering);
    [[nodiscard]] bool isDropHighlighted() const { return dropHighlighted_; }
    /// @}

    /// @name Mutations
    /// @{

    /**
     * @brief Renames an entry shown in @p side.
     * @return False if the trimmed name is empty or unchanged.
     */
    bool renameEntry(PaneSide side, const QString &path, const QString &newName);

    /**
     * @brief Deletes entries shown in @p side and clears that pane's selection.
     * @return False if @p paths is empty.
     */
    bool deleteEntries(PaneSide side, const QStringList &paths);

    /**
     * @brief Creates a folder in the current directory of @p side.
     * @return False if the trimmed name is empty or the pane has no directory.
     */
    bool createFolder(PaneSide side, const QString &name);
    /// @}

    /// @name Queue Management
    /// @{
    /// @brief The suspended batch, captured before the user is asked.
    [[nodiscard]] std::optional<PendingBatch> pendingBatch() const;
    /// @brief Resumes @p batch; ignored if it is no longer the suspended batch.
    void resolveConflict(const PendingBatch &batch, OverwriteResponse response);
    void cancelAll();
    void removeFinished();
    void clear();
    [[nodiscard]] bool isProcessing() const;
    /// @}

    [[nodiscard]] TransferQueue *queue() { return queue_; }

signals:
    /// @brief The transfer panel should be shown.
    void transferPanelRequested();

    void dropZoneHighlightChanged(bool highlighted);

    /**
     * @brief Emitted when a rename, delete or create folder fails.
     * @param operation User-facing operation name ("Rename", "Delete", "Create Folder").
     * @param error The raw error text.
     */
    void mutationFailed(const QString &operation, const QString &error);

    /// @brief Emitted when a mutation finished and its pane was refreshed.
    void mutationFinished(PaneSide side);

    /**
     * @brief Emitted when a status message should be displayed.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout = 0);

private slots:
    void onDestinationRefreshNeeded(const QString &directory);
    void onOperationFinished(IFileOperations::Mutation mutation, const QString &path,
                             const QString &error);

private:
    int enqueue(const QStringList &paths, const QString &destinationDir,
                const QList<FileEntry> &knownEntries,
                ConflictHandling handling = ConflictHandling::Prompt);
    [[nodiscard]] PaneModel *pane(PaneSide side) const;
    [[nodiscard]] static QString mutationName(IFileOperations::Mutation mutation);

    QPointer<PaneModel> source_;
    QPointer<PaneModel> destination_;
    QPointer<TransferQueue> queue_;
    QPointer<IFileOperations> fileOps_;

    // Pane of each mutation in flight, in request order
    QQueue<PaneSide> pendingMutations_;

    bool dropHighlighted_ = false;
};

#endif // TRANSFERSERVICE_H
