#include "mockfileoperations.h"

#include <QDir>
#include <QFileInfo>

MockFileOperations::MockFileOperations(QObject *parent)
    : IFileOperations(parent)
{
}

void MockFileOperations::listDirectory(const QString &path)
{
    listRequests_.append(path);

    PendingOp op;
    op.type = PendingOp::List;
    op.path = path;
    pendingOps_.enqueue(op);
}

void MockFileOperations::createDirectory(const QString &basePath, const QString &name)
{
    createRequests_.append(basePath + "/" + name);

    PendingOp op;
    op.type = PendingOp::Create;
    op.path = basePath;
    op.argument = name;
    pendingOps_.enqueue(op);
}

void MockFileOperations::copyFile(const QString &sourcePath, const QString &destinationDir,
                                  bool overwrite)
{
    copyRequests_.append({sourcePath, destinationDir, overwrite});

    PendingOp op;
    op.type = PendingOp::Copy;
    op.path = sourcePath;
    op.argument = destinationDir;
    op.overwrite = overwrite;
    pendingOps_.enqueue(op);
}

void MockFileOperations::renameEntry(const QString &oldPath, const QString &newName)
{
    renameRequests_.append(oldPath);

    PendingOp op;
    op.type = PendingOp::Rename;
    op.path = oldPath;
    op.argument = newName;
    pendingOps_.enqueue(op);
}

void MockFileOperations::deleteEntries(const QStringList &paths)
{
    deleteRequests_.append(paths);

    PendingOp op;
    op.type = PendingOp::Delete;
    op.paths = paths;
    op.path = paths.isEmpty() ? QString() : paths.first();
    pendingOps_.enqueue(op);
}

QString MockFileOperations::parentDirectory(const QString &path) const
{
    QString cleaned = QDir::cleanPath(path);
    if (cleaned.isEmpty() || cleaned == "/") {
        return QString();
    }
    return QFileInfo(cleaned).path();
}

// === Mock control methods ===

void MockFileOperations::mockSetDirectoryListing(const QString &path, const QList<FileEntry> &entries)
{
    mockListings_[path] = entries;
    listingErrors_.remove(path);
}

void MockFileOperations::mockSetListingFails(const QString &path, const QString &errorMessage)
{
    listingErrors_[path] = errorMessage;
}

void MockFileOperations::mockAddExistingPath(const QString &path)
{
    existingPaths_.insert(path);
}

void MockFileOperations::mockSetCopyError(const QString &sourcePath, const QString &errorMessage)
{
    copyErrors_[sourcePath] = errorMessage;
}

void MockFileOperations::mockSetNextMutationFails(const QString &errorMessage)
{
    nextMutationFails_ = true;
    nextMutationError_ = errorMessage;
}

void MockFileOperations::mockSetOverwriteCopyError(const QString &sourcePath,
                                                   const QString &errorMessage)
{
    overwriteCopyErrors_[sourcePath] = errorMessage;
}

void MockFileOperations::mockSetFileSize(const QString &sourcePath, qint64 size)
{
    fileSizes_[sourcePath] = size;
}

void MockFileOperations::mockProcessNextOperation()
{
    if (pendingOps_.isEmpty()) {
        return;
    }

    PendingOp op = pendingOps_.dequeue();

    // Mutation failures are one-shot and only apply to rename/delete/create
    QString mutationError;
    if (nextMutationFails_ && (op.type == PendingOp::Rename || op.type == PendingOp::Delete
                               || op.type == PendingOp::Create)) {
        nextMutationFails_ = false;
        mutationError = nextMutationError_;
    }

    switch (op.type) {
    case PendingOp::List: {
        if (listingErrors_.contains(op.path)) {
            emit listingFailed(op.path, listingErrors_.value(op.path));
        } else {
            emit directoryListed(op.path, mockListings_.value(op.path));
        }
        break;
    }
    case PendingOp::Copy: {
        QString target = op.argument + "/" + QFileInfo(op.path).fileName();
        if (copyErrors_.contains(op.path)) {
            emit copyFinished(op.path, CopyResult::io(copyErrors_.value(op.path)));
        } else if (existingPaths_.contains(target) && !op.overwrite) {
            emit copyFinished(op.path, CopyResult::conflict(target));
        } else if (op.overwrite && overwriteCopyErrors_.contains(op.path)) {
            emit copyFinished(op.path, CopyResult::io(overwriteCopyErrors_.value(op.path)));
        } else {
            qint64 size = fileSizes_.value(op.path, 0);
            if (size > 0) {
                emit copyProgress(op.path, size, size);
            }
            existingPaths_.insert(target);
            emit copyFinished(op.path, CopyResult::ok(target));
        }
        break;
    }
    case PendingOp::Rename: {
        QString newPath = QFileInfo(op.path).path() + "/" + op.argument;
        if (mutationError.isEmpty()) {
            existingPaths_.remove(op.path);
            existingPaths_.insert(newPath);
        }
        emit operationFinished(Mutation::Rename,
                               mutationError.isEmpty() ? newPath : op.path, mutationError);
        break;
    }
    case PendingOp::Delete: {
        if (mutationError.isEmpty()) {
            for (const QString &path : op.paths) {
                existingPaths_.remove(path);
            }
        }
        emit operationFinished(Mutation::Delete, op.path, mutationError);
        break;
    }
    case PendingOp::Create: {
        QString newPath = op.path + "/" + op.argument;
        if (mutationError.isEmpty()) {
            existingPaths_.insert(newPath);
        }
        emit operationFinished(Mutation::CreateDirectory,
                               mutationError.isEmpty() ? newPath : op.path, mutationError);
        break;
    }
    }
}

void MockFileOperations::mockProcessAllOperations()
{
    while (!pendingOps_.isEmpty()) {
        mockProcessNextOperation();
    }
}

void MockFileOperations::mockReset()
{
    pendingOps_.clear();
    mockListings_.clear();
    listingErrors_.clear();
    copyErrors_.clear();
    overwriteCopyErrors_.clear();
    fileSizes_.clear();
    existingPaths_.clear();
    listRequests_.clear();
    copyRequests_.clear();
    renameRequests_.clear();
    deleteRequests_.clear();
    createRequests_.clear();
    nextMutationFails_ = false;
    nextMutationError_.clear();
}
