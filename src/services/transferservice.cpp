#include "transferservice.h"
#include "models/panemodel.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMimeData>

const QString TransferService::DragMimeType = QStringLiteral("application/x-poolxfer-paths");

TransferService::TransferService(PaneModel *source,
                                 PaneModel *destination,
                                 TransferQueue *queue,
                                 QObject *parent)
    : QObject(parent)
    , source_(source)
    , destination_(destination)
    , queue_(queue)
{
    connect(queue_, &TransferQueue::destinationRefreshNeeded,
            this, &TransferService::onDestinationRefreshNeeded);
    connect(queue_, &TransferQueue::statusMessage,
            this, &TransferService::statusMessage);
}

TransferService::~TransferService()
{
    if (fileOps_) {
        disconnect(fileOps_, nullptr, this, nullptr);
    }
}

void TransferService::setFileOperations(IFileOperations *fileOps)
{
    if (fileOps_) {
        disconnect(fileOps_, nullptr, this, nullptr);
    }

    fileOps_ = fileOps;
    pendingMutations_.clear();

    if (fileOps_) {
        connect(fileOps_, &IFileOperations::operationFinished,
                this, &TransferService::onOperationFinished);
    }
}

int TransferService::enqueue(const QStringList &paths, const QString &destinationDir,
                             const QList<FileEntry> &knownEntries, ConflictHandling handling)
{
    if (paths.isEmpty() || destinationDir.isEmpty()) {
        return -1;
    }

    BatchRequest request;
    request.sourcePaths = paths;
    request.destinationDir = destinationDir;
    request.conflictHandling = handling;

    for (const QString &path : paths) {
        bool found = false;
        for (const FileEntry &entry : knownEntries) {
            if (entry.path == path) {
                if (!entry.isDirectory) {
                    request.fileSizes.insert(path, entry.size);
                }
                found = true;
                break;
            }
        }
        if (!found) {
            QFileInfo info(path);
            if (info.isFile()) {
                request.fileSizes.insert(path, info.size());
            }
        }
    }

    int batchId = queue_->enqueueBatch(request);
    if (batchId >= 0) {
        LOG_VERBOSE() << "TransferService: Queued" << paths.size() << "paths into" << destinationDir;
        emit transferPanelRequested();
        if (paths.size() == 1) {
            emit statusMessage(tr("Copying %1").arg(QFileInfo(paths.first()).fileName()), 3000);
        } else {
            emit statusMessage(tr("Copying %1 items").arg(paths.size()), 3000);
        }
    }
    return batchId;
}

int TransferService::copySelectedToPool()
{
    if (!source_ || !destination_) {
        return -1;
    }

    QStringList paths = source_->selectedPaths();
    if (paths.isEmpty()) {
        return -1;
    }

    int batchId = enqueue(paths, destination_->currentPath(), source_->listing());
    if (batchId >= 0) {
        source_->clearSelection();
    }
    return batchId;
}

int TransferService::handleInternalDrop(const QMimeData *mimeData)
{
    setDropHover(false);

    if (!source_ || !destination_) {
        return -1;
    }

    QStringList paths;
    const QStringList decoded = decodeDragPaths(mimeData);
    for (const QString &path : decoded) {
        if (source_->indexOfPath(path) >= 0) {
            paths.append(path);
        }
    }

    if (paths.isEmpty()) {
        LOG_VERBOSE() << "TransferService: Internal drop carried no paths from the source listing";
        return -1;
    }

    int batchId = enqueue(paths, destination_->currentPath(), source_->listing());
    if (batchId >= 0) {
        source_->clearSelection();
    }
    return batchId;
}

int TransferService::handleExternalDrop(const QList<QUrl> &urls)
{
    setDropHover(false);

    QStringList paths;
    for (const QUrl &url : urls) {
        if (url.isLocalFile()) {
            paths.append(QFileInfo(url.toLocalFile()).absoluteFilePath());
        } else {
            qDebug() << "TransferService: Ignoring non-local drop" << url.toString();
        }
    }

    if (paths.isEmpty() || !destination_) {
        return -1;
    }
    return enqueue(paths, destination_->currentPath(), {});
}

int TransferService::importFiles(const QStringList &paths)
{
    if (!destination_) {
        return -1;
    }
    return enqueue(paths, destination_->currentPath(), {});
}

int TransferService::importFolder(const QString &path)
{
    if (path.isEmpty() || !destination_) {
        return -1;
    }
    return enqueue({QFileInfo(path).absoluteFilePath()}, destination_->currentPath(), {});
}

int TransferService::copyBackToSource(const QString &contextPath)
{
    if (!source_ || !destination_ || source_->currentPath().isEmpty()) {
        return -1;
    }

    QStringList paths;
    if (!contextPath.isEmpty() && !destination_->isSelected(contextPath)) {
        paths.append(contextPath);
    } else {
        paths = destination_->selectedPaths();
    }

    if (paths.isEmpty()) {
        return -1;
    }

    destination_->clearSelection();
    return enqueue(paths, source_->currentPath(), destination_->listing(),
                   ConflictHandling::FailOnConflict);
}

QMimeData *TransferService::createDragMimeData(const QStringList &paths)
{
    auto *mimeData = new QMimeData();
    QJsonArray array;
    for (const QString &path : paths) {
        array.append(path);
    }
    mimeData->setData(DragMimeType, QJsonDocument(array).toJson(QJsonDocument::Compact));
    return mimeData;
}

QStringList TransferService::decodeDragPaths(const QMimeData *mimeData)
{
    if (!canDecode(mimeData)) {
        return {};
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(mimeData->data(DragMimeType), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "TransferService: Invalid drag payload:" << parseError.errorString();
        return {};
    }

    QStringList paths;
    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        if (value.isString() && !value.toString().isEmpty()) {
            paths.append(value.toString());
        }
    }
    return paths;
}

bool TransferService::canDecode(const QMimeData *mimeData)
{
    return mimeData && mimeData->hasFormat(DragMimeType);
}

void TransferService::setDropHover(bool hovering)
{
    if (dropHighlighted_ == hovering) {
        return;
    }
    dropHighlighted_ = hovering;
    emit dropZoneHighlightChanged(hovering);
}

bool TransferService::renameEntry(PaneSide side, const QString &path, const QString &newName)
{
    QString name = newName.trimmed();
    if (!fileOps_ || path.isEmpty() || name.isEmpty() || name == QFileInfo(path).fileName()) {
        return false;
    }

    pendingMutations_.enqueue(side);
    fileOps_->renameEntry(path, name);
    return true;
}

bool TransferService::deleteEntries(PaneSide side, const QStringList &paths)
{
    if (!fileOps_ || paths.isEmpty()) {
        return false;
    }

    if (PaneModel *model = pane(side)) {
        model->clearSelection();
    }

    pendingMutations_.enqueue(side);
    fileOps_->deleteEntries(paths);
    return true;
}

bool TransferService::createFolder(PaneSide side, const QString &name)
{
    QString trimmed = name.trimmed();
    PaneModel *model = pane(side);
    if (!fileOps_ || trimmed.isEmpty() || !model || model->currentPath().isEmpty()) {
        return false;
    }

    pendingMutations_.enqueue(side);
    fileOps_->createDirectory(model->currentPath(), trimmed);
    return true;
}

void TransferService::onOperationFinished(IFileOperations::Mutation mutation, const QString &path,
                                          const QString &error)
{
    if (pendingMutations_.isEmpty()) {
        LOG_VERBOSE() << "TransferService: Unrequested mutation result for" << path;
        return;
    }

    PaneSide side = pendingMutations_.dequeue();

    if (!error.isEmpty()) {
        qWarning() << "TransferService:" << mutationName(mutation) << "failed:" << error;
        emit mutationFailed(mutationName(mutation), error);
    } else {
        qDebug() << "TransferService:" << mutationName(mutation) << "finished:" << path;
    }

    if (PaneModel *model = pane(side)) {
        model->refresh();
    }
    emit mutationFinished(side);
}

void TransferService::onDestinationRefreshNeeded(const QString &directory)
{
    QString cleaned = QDir::cleanPath(directory);
    if (destination_ && QDir::cleanPath(destination_->currentPath()) == cleaned) {
        destination_->refresh();
    }
    if (source_ && !source_->currentPath().isEmpty()
        && QDir::cleanPath(source_->currentPath()) == cleaned) {
        source_->refresh();
    }
}

std::optional<PendingBatch> TransferService::pendingBatch() const
{
    return queue_->pendingBatch();
}

void TransferService::resolveConflict(const PendingBatch &batch, OverwriteResponse response)
{
    queue_->resolveConflict(batch, response);
}

void TransferService::cancelAll()
{
    queue_->cancelAll();
}

void TransferService::removeFinished()
{
    queue_->removeFinished();
}

void TransferService::clear()
{
    queue_->clear();
}

bool TransferService::isProcessing() const
{
    return queue_ && queue_->isProcessing();
}

PaneModel *TransferService::pane(PaneSide side) const
{
    return side == PaneSide::Source ? source_.data() : destination_.data();
}

QString TransferService::mutationName(IFileOperations::Mutation mutation)
{
    switch (mutation) {
    case IFileOperations::Mutation::Rename: return tr("Rename");
    case IFileOperations::Mutation::Delete: return tr("Delete");
    case IFileOperations::Mutation::CreateDirectory: return tr("Create Folder");
    }
    return QString();
}
