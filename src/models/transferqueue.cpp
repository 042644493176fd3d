#include "transferqueue.h"
#include "utils/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QTimer>
#include <QDebug>

const QString TransferQueue::SkippedMessage = QStringLiteral("Skipped (file exists)");
const QString TransferQueue::ImportCancelledMessage = QStringLiteral("Import cancelled");
const QString TransferQueue::CancelledMessage = QStringLiteral("Cancelled");

TransferQueue::TransferQueue(QObject *parent)
    : QAbstractListModel(parent)
{
}

TransferQueue::~TransferQueue()
{
    // Disconnect from the file operations BEFORE this object is destroyed to
    // prevent signals from being delivered to slots that access invalid memory.
    // Qt's automatic disconnection happens in QObject::~QObject() which
    // runs AFTER this destructor body, by which time our member variables
    // (like items_) may already be destroyed.
    if (fileOps_) {
        disconnect(fileOps_, nullptr, this, nullptr);
    }
}

void TransferQueue::scheduleProcessNext()
{
    scheduleEvent([this]() { processNext(); });
}

void TransferQueue::scheduleAdvance()
{
    if (!active_) {
        return;
    }

    // Bind to the batch position so a stale event cannot move a later batch
    int batchId = active_->batchId;
    int index = active_->index;
    scheduleEvent([this, batchId, index]() {
        if (active_ && active_->batchId == batchId && active_->index == index) {
            advance();
        }
    });
}

void TransferQueue::scheduleEvent(std::function<void()> event)
{
    eventQueue_.enqueue(std::move(event));

    // Schedule event processing if not already scheduled
    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
    }
}

void TransferQueue::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        // Reschedule for later if there are still events
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;

    // Process all queued events
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }

    processingEvents_ = false;
}

void TransferQueue::flushEventQueue()
{
    // Re-entrancy guard: don't flush if we're already processing
    if (processingEvents_) {
        return;
    }

    // Cancel any pending timer and process immediately
    eventProcessingScheduled_ = false;
    processingEvents_ = true;

    // Process all events synchronously
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }

    processingEvents_ = false;
}

void TransferQueue::transitionTo(QueueState newState)
{
    if (state_ == newState) {
        return;  // No change
    }

    LOG_VERBOSE() << "TransferQueue: State transition"
                  << queueStateToString(state_) << "->" << queueStateToString(newState);

    state_ = newState;
}

void TransferQueue::setFileOperations(IFileOperations *fileOps)
{
    if (fileOps_) {
        disconnect(fileOps_, nullptr, this, nullptr);
    }

    fileOps_ = fileOps;

    if (fileOps_) {
        connect(fileOps_, &IFileOperations::copyProgress,
                this, &TransferQueue::onCopyProgress);
        connect(fileOps_, &IFileOperations::copyFinished,
                this, &TransferQueue::onCopyFinished);
    }
}

int TransferQueue::enqueueBatch(const BatchRequest &request)
{
    if (request.sourcePaths.isEmpty()) {
        return -1;
    }

    QueuedBatch queued;
    queued.batchId = nextBatchId_++;
    queued.request = request;
    queuedBatches_.enqueue(queued);

    qDebug() << "TransferQueue: Batch" << queued.batchId << "queued with"
             << request.sourcePaths.size() << "paths for" << request.destinationDir;

    emit queueChanged();

    if (!active_) {
        scheduleProcessNext();
    }
    return queued.batchId;
}

void TransferQueue::processNext()
{
    if (active_ || state_ != QueueState::Idle) {
        LOG_VERBOSE() << "TransferQueue: processNext - batch already running";
        return;
    }

    if (queuedBatches_.isEmpty()) {
        return;
    }

    QueuedBatch next = queuedBatches_.dequeue();

    ActiveBatch batch;
    batch.batchId = next.batchId;
    batch.request = next.request;
    active_ = batch;

    // The sticky mode never carries over from a previous batch
    resolver_.reset();

    transitionTo(QueueState::Copying);
    emit batchStarted(batch.batchId);

    startCurrentItem();
}

void TransferQueue::startCurrentItem()
{
    if (!active_) {
        return;
    }

    const BatchRequest &request = active_->request;
    if (active_->index >= request.sourcePaths.size()) {
        finishBatch(false);
        return;
    }

    QString sourcePath = request.sourcePaths.at(active_->index);
    QString fileName = QFileInfo(sourcePath).fileName();
    if (fileName.isEmpty()) {
        fileName = QDir(sourcePath).dirName();
    }

    TransferItem item;
    item.id = makeItemId(fileName);
    item.fileName = fileName;
    item.sizeKnown = request.fileSizes.contains(sourcePath);
    item.fileSize = request.fileSizes.value(sourcePath, 0);
    item.status = TransferItem::Status::Copying;
    item.startTime = QDateTime::currentDateTime();
    item.sourcePath = sourcePath;
    item.destinationDir = request.destinationDir;
    item.serial = nextSerial_++;
    item.batchId = active_->batchId;

    int row = items_.size();
    beginInsertRows(QModelIndex(), row, row);
    items_.append(item);
    endInsertRows();

    active_->currentItemId = item.id;
    active_->retrying = false;

    emit operationStarted(item.id, item.fileName);
    emit queueChanged();

    startCopy(sourcePath, request.forceOverwrite || resolver_.forcesOverwrite());
}

void TransferQueue::startCopy(const QString &sourcePath, bool overwrite)
{
    if (!fileOps_) {
        qWarning() << "TransferQueue: No file operations set, cannot copy" << sourcePath;
        int row = findItemIndex(active_->currentItemId);
        setItemStatus(row, TransferItem::Status::Failed, tr("No file operations available"));
        scheduleAdvance();
        return;
    }

    LOG_VERBOSE() << "TransferQueue: Copying" << sourcePath << "->"
                  << active_->request.destinationDir << "overwrite:" << overwrite;

    active_->inFlight = true;
    fileOps_->copyFile(sourcePath, active_->request.destinationDir, overwrite);
}

void TransferQueue::advance()
{
    if (!active_ || active_->inFlight) {
        return;
    }
    active_->index++;
    startCurrentItem();
}

void TransferQueue::finishBatch(bool cancelled)
{
    if (!active_) {
        return;
    }

    int batchId = active_->batchId;
    QString destinationDir = active_->request.destinationDir;

    active_.reset();
    pending_.reset();
    transitionTo(QueueState::Idle);

    qDebug() << "TransferQueue: Batch" << batchId << (cancelled ? "cancelled" : "finished");

    emit destinationRefreshNeeded(destinationDir);
    emit batchFinished(batchId, cancelled);
    emit queueChanged();

    if (!queuedBatches_.isEmpty()) {
        scheduleProcessNext();
    } else {
        emit allOperationsCompleted(allSucceeded());
    }
}

void TransferQueue::onCopyProgress(const QString &sourcePath, qint64 bytesCopied, qint64 totalBytes)
{
    if (!active_ || !active_->inFlight
        || active_->request.sourcePaths.value(active_->index) != sourcePath) {
        return;
    }

    int row = findItemIndex(active_->currentItemId);
    if (row < 0 || items_[row].status != TransferItem::Status::Copying) {
        return;
    }

    TransferItem &item = items_[row];
    if (!item.sizeKnown && totalBytes > 0) {
        item.fileSize = totalBytes;
        item.sizeKnown = true;
    }
    item.bytesTransferred = item.sizeKnown ? qMin(bytesCopied, item.fileSize) : bytesCopied;

    emit dataChanged(index(row), index(row),
                     {BytesTransferredRole, ProgressRole, FileSizeRole});
}

void TransferQueue::onCopyFinished(const QString &sourcePath, const CopyResult &result)
{
    if (!active_ || !active_->inFlight
        || active_->request.sourcePaths.value(active_->index) != sourcePath) {
        LOG_VERBOSE() << "TransferQueue: Ignoring copy result for" << sourcePath;
        return;
    }

    active_->inFlight = false;

    if (active_->cancelled) {
        // The item was already marked cancelled; the copy ran to completion anyway
        finishBatch(true);
        return;
    }

    int row = findItemIndex(active_->currentItemId);
    bool cancelledByUser = row >= 0
        && items_[row].status == TransferItem::Status::Cancelled;

    if (result.isOk()) {
        if (row >= 0 && !cancelledByUser) {
            TransferItem &item = items_[row];
            item.bytesTransferred = item.fileSize > 0 ? item.fileSize : 1;
            setItemStatus(row, TransferItem::Status::Completed);
            emit operationCompleted(item.id, item.fileName);
        }
        scheduleAdvance();
        return;
    }

    if (result.isConflict() && !active_->retrying && !cancelledByUser) {
        handleConflict(row, result);
        return;
    }

    if (row >= 0 && !cancelledByUser) {
        setItemStatus(row, TransferItem::Status::Failed, result.message);
        emit operationFailed(items_[row].fileName, result.message);
    }
    scheduleAdvance();
}

void TransferQueue::handleConflict(int row, const CopyResult &result)
{
    const BatchRequest &request = active_->request;
    QString sourcePath = request.sourcePaths.at(active_->index);

    if (request.conflictHandling == ConflictHandling::FailOnConflict) {
        if (row >= 0) {
            setItemStatus(row, TransferItem::Status::Failed, result.message);
            emit operationFailed(items_[row].fileName, result.message);
        }
        scheduleAdvance();
        return;
    }

    switch (resolver_.onConflict()) {
    case ConflictResolver::Step::RetryWithOverwrite:
        LOG_VERBOSE() << "TransferQueue: Overwrite all active, retrying" << sourcePath;
        active_->retrying = true;
        startCopy(sourcePath, true);
        break;

    case ConflictResolver::Step::Skip:
        setItemStatus(row, TransferItem::Status::Cancelled, SkippedMessage);
        scheduleAdvance();
        break;

    case ConflictResolver::Step::AskUser:
    case ConflictResolver::Step::CancelBatch: {
        PendingBatch pending;
        pending.batchId = active_->batchId;
        pending.sourcePaths = request.sourcePaths;
        pending.currentIndex = active_->index;
        pending.fileSizes = request.fileSizes;
        pending.destinationDir = request.destinationDir;
        pending.itemId = active_->currentItemId;
        pending.fileName = row >= 0 ? items_[row].fileName : QFileInfo(sourcePath).fileName();
        pending_ = pending;

        qDebug() << "TransferQueue: File exists, asking for confirmation:" << pending.fileName;
        transitionTo(QueueState::AwaitingConfirmation);
        emit overwriteConfirmationNeeded(pending.fileName, pending.itemId);
        break;
    }
    }
}

void TransferQueue::resolveConflict(const PendingBatch &batch, OverwriteResponse response)
{
    if (!pending_ || batch.batchId != pending_->batchId || batch.itemId != pending_->itemId
        || batch.currentIndex != pending_->currentIndex) {
        qWarning() << "TransferQueue: Ignoring decision for batch" << batch.batchId
                   << "item" << batch.itemId << "- not the suspended batch";
        return;
    }

    if (!active_ || active_->batchId != batch.batchId) {
        qWarning() << "TransferQueue: Suspended batch" << batch.batchId << "is no longer active";
        pending_.reset();
        return;
    }

    pending_.reset();

    // Resume from the continuation value
    active_->request.sourcePaths = batch.sourcePaths;
    active_->request.fileSizes = batch.fileSizes;
    active_->request.destinationDir = batch.destinationDir;
    active_->index = batch.currentIndex;
    active_->currentItemId = batch.itemId;

    transitionTo(QueueState::Copying);

    int row = findItemIndex(batch.itemId);
    ConflictResolver::Step step = resolver_.resolve(response);

    qDebug() << "TransferQueue: Conflict on" << batch.fileName << "resolved, mode now"
             << ConflictResolver::modeToString(resolver_.mode());

    switch (step) {
    case ConflictResolver::Step::RetryWithOverwrite:
        active_->retrying = true;
        startCopy(batch.sourcePaths.at(batch.currentIndex), true);
        break;

    case ConflictResolver::Step::Skip:
        setItemStatus(row, TransferItem::Status::Cancelled, SkippedMessage);
        scheduleAdvance();
        break;

    case ConflictResolver::Step::CancelBatch:
    case ConflictResolver::Step::AskUser:
        setItemStatus(row, TransferItem::Status::Cancelled, ImportCancelledMessage);
        emit statusMessage(tr("Import cancelled"), 3000);
        finishBatch(true);
        break;
    }
}

void TransferQueue::respondToOverwrite(OverwriteResponse response)
{
    if (!pending_) {
        return;
    }
    PendingBatch batch = *pending_;
    resolveConflict(batch, response);
}

void TransferQueue::cancelTransfer(const QString &itemId)
{
    int row = findItemIndex(itemId);
    if (row < 0 || items_[row].isTerminal()) {
        return;
    }

    setItemStatus(row, TransferItem::Status::Cancelled, CancelledMessage);

    // A suspended item cannot be resolved any more; move past it
    if (pending_ && pending_->itemId == itemId) {
        PendingBatch batch = *pending_;
        resolveConflict(batch, OverwriteResponse::Skip);
    }
    emit queueChanged();
}

void TransferQueue::cancelAll()
{
    queuedBatches_.clear();

    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].status == TransferItem::Status::Pending) {
            setItemStatus(i, TransferItem::Status::Cancelled, CancelledMessage);
        }
    }

    if (active_) {
        int row = findItemIndex(active_->currentItemId);
        setItemStatus(row, TransferItem::Status::Cancelled, ImportCancelledMessage);

        if (active_->inFlight) {
            // Advisory: the running copy finishes, then the batch ends
            active_->cancelled = true;
        } else {
            finishBatch(true);
        }
    }

    emit queueChanged();
    emit operationsCancelled();
}

void TransferQueue::clear()
{
    beginResetModel();
    items_.clear();
    endResetModel();

    emit queueChanged();
}

void TransferQueue::removeFinished()
{
    for (int i = items_.size() - 1; i >= 0; --i) {
        if (items_[i].isTerminal()) {
            beginRemoveRows(QModelIndex(), i, i);
            items_.removeAt(i);
            endRemoveRows();
        }
    }
    emit queueChanged();
}

int TransferQueue::activeCount() const
{
    int count = 0;
    for (const auto &item : items_) {
        if (item.status == TransferItem::Status::Pending ||
            item.status == TransferItem::Status::Copying) {
            count++;
        }
    }
    return count;
}

int TransferQueue::finishedCount() const
{
    int count = 0;
    for (const auto &item : items_) {
        if (item.isTerminal()) {
            count++;
        }
    }
    return count;
}

bool TransferQueue::hasFailures() const
{
    for (const auto &item : items_) {
        if (item.status == TransferItem::Status::Failed) {
            return true;
        }
    }
    return false;
}

bool TransferQueue::allSucceeded() const
{
    if (items_.isEmpty()) {
        return false;
    }
    for (const auto &item : items_) {
        if (item.status != TransferItem::Status::Completed) {
            return false;
        }
    }
    return true;
}

std::optional<TransferItem> TransferQueue::findItem(const QString &itemId) const
{
    int row = findItemIndex(itemId);
    if (row < 0) {
        return std::nullopt;
    }
    return items_.at(row);
}

int TransferQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return items_.size();
}

QVariant TransferQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= items_.size()) {
        return QVariant();
    }

    const TransferItem &item = items_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return item.fileName;
    case Qt::ToolTipRole:
        return item.errorMessage.isEmpty() ? QVariant() : QVariant(item.errorMessage);
    case IdRole:
        return item.id;
    case FileSizeRole:
        return item.fileSize;
    case BytesTransferredRole:
        return item.bytesTransferred;
    case ProgressRole:
        if (item.status == TransferItem::Status::Completed) {
            return 100;
        }
        if (item.fileSize > 0) {
            return static_cast<int>((item.bytesTransferred * 100) / item.fileSize);
        }
        return 0;
    case StatusRole:
        return static_cast<int>(item.status);
    case ErrorMessageRole:
        return item.errorMessage;
    case StartTimeRole:
        return item.startTime;
    case SourcePathRole:
        return item.sourcePath;
    case DestinationDirRole:
        return item.destinationDir;
    case SerialRole:
        return item.serial;
    }

    return QVariant();
}

QHash<int, QByteArray> TransferQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[IdRole] = "id";
    roles[FileNameRole] = "fileName";
    roles[FileSizeRole] = "fileSize";
    roles[BytesTransferredRole] = "bytesTransferred";
    roles[ProgressRole] = "progress";
    roles[StatusRole] = "status";
    roles[ErrorMessageRole] = "errorMessage";
    roles[StartTimeRole] = "startTime";
    roles[SourcePathRole] = "sourcePath";
    roles[DestinationDirRole] = "destinationDir";
    roles[SerialRole] = "serial";
    return roles;
}

void TransferQueue::setItemStatus(int row, TransferItem::Status status, const QString &error)
{
    if (row < 0 || row >= items_.size()) {
        return;
    }

    TransferItem &item = items_[row];

    // Terminal statuses are final
    if (item.isTerminal()) {
        return;
    }

    item.status = status;
    if (!error.isEmpty()) {
        item.errorMessage = error;
    }
    emit dataChanged(index(row), index(row));
}

int TransferQueue::findItemIndex(const QString &itemId) const
{
    if (itemId.isEmpty()) {
        return -1;
    }
    for (int i = items_.size() - 1; i >= 0; --i) {
        if (items_[i].id == itemId) {
            return i;
        }
    }
    return -1;
}

QString TransferQueue::makeItemId(const QString &fileName)
{
    return QStringLiteral("%1-%2-%3")
        .arg(++idCounter_)
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(fileName);
}
