#include "panemodel.h"
#include "services/audiometadatareader.h"
#include "utils/logging.h"

#include <QDir>
#include <QDebug>

namespace {

FileEntrySort::Column sortColumnFor(int column)
{
    switch (column) {
    case PaneModel::SizeColumn: return FileEntrySort::Column::Size;
    case PaneModel::FormatColumn: return FileEntrySort::Column::Format;
    case PaneModel::ChannelsColumn: return FileEntrySort::Column::Channels;
    case PaneModel::BitDepthColumn: return FileEntrySort::Column::BitDepth;
    case PaneModel::SampleRateColumn: return FileEntrySort::Column::SampleRate;
    default: return FileEntrySort::Column::Name;
    }
}

QVariant optionalValue(const std::optional<int> &value)
{
    return value ? QVariant(*value) : QVariant();
}

} // namespace

PaneModel::PaneModel(PaneSide side, QObject *parent)
    : QAbstractTableModel(parent)
    , side_(side)
{
}

PaneModel::~PaneModel()
{
    // Disconnect before members are destroyed; a listing can still be queued
    if (fileOps_) {
        disconnect(fileOps_, nullptr, this, nullptr);
    }
}

void PaneModel::setFileOperations(IFileOperations *fileOps)
{
    if (fileOps_) {
        disconnect(fileOps_, nullptr, this, nullptr);
    }

    fileOps_ = fileOps;

    if (fileOps_) {
        connect(fileOps_, &IFileOperations::directoryListed,
                this, &PaneModel::onDirectoryListed);
        connect(fileOps_, &IFileOperations::listingFailed,
                this, &PaneModel::onListingFailed);
    }
}

void PaneModel::setRootBound(const QString &root)
{
    rootBound_ = root.isEmpty() ? QString() : QDir::cleanPath(root);
}

bool PaneModel::setPath(const QString &path)
{
    if (path.isEmpty()) {
        return false;
    }

    QString cleaned = QDir::cleanPath(path);

    if (!isWithinRoot(cleaned)) {
        qWarning() << "PaneModel: Refusing to leave root" << rootBound_ << "for" << cleaned;
        return false;
    }

    if (cleaned == currentPath_) {
        if (loading_) {
            LOG_VERBOSE() << "PaneModel: Already loading" << cleaned;
            return false;
        }
        requestListing();
        return true;
    }

    bool hadSelection = !selection_.isEmpty();

    beginResetModel();
    currentPath_ = cleaned;
    listing_.clear();
    selection_.clear();
    cursorIndex_ = 0;
    lastClickedIndex_ = -1;
    endResetModel();

    emit pathChanged(currentPath_);
    if (hadSelection) {
        emit selectionChanged();
    }
    emit cursorChanged(cursorIndex_);

    requestListing();
    return true;
}

bool PaneModel::navigateToParent()
{
    if (currentPath_.isEmpty() || !fileOps_) {
        return false;
    }

    if (!rootBound_.isEmpty() && currentPath_ == rootBound_) {
        return false;
    }

    QString parent = fileOps_->parentDirectory(currentPath_);
    if (parent.isEmpty()) {
        return false;
    }

    if (!rootBound_.isEmpty() && QDir::cleanPath(parent).length() < rootBound_.length()) {
        return false;
    }

    return setPath(parent);
}

void PaneModel::refresh()
{
    if (currentPath_.isEmpty()) {
        return;
    }
    if (loading_) {
        LOG_VERBOSE() << "PaneModel: Refresh suppressed while loading" << currentPath_;
        return;
    }
    requestListing();
}

void PaneModel::clear()
{
    bool hadSelection = !selection_.isEmpty();

    beginResetModel();
    currentPath_.clear();
    listing_.clear();
    selection_.clear();
    cursorIndex_ = 0;
    lastClickedIndex_ = -1;
    endResetModel();

    setLoading(false);
    emit pathChanged(currentPath_);
    emit listingChanged();
    if (hadSelection) {
        emit selectionChanged();
    }
    emit cursorChanged(cursorIndex_);
}

FileEntry PaneModel::entryAt(int row) const
{
    if (row < 0 || row >= listing_.size()) {
        return FileEntry();
    }
    return listing_.at(row);
}

int PaneModel::indexOfPath(const QString &path) const
{
    for (int i = 0; i < listing_.size(); ++i) {
        if (listing_.at(i).path == path) {
            return i;
        }
    }
    return -1;
}

QString PaneModel::fileManagerPath(const QString &contextPath) const
{
    int row = contextPath.isEmpty() ? -1 : indexOfPath(contextPath);
    if (row >= 0 && listing_.at(row).isDirectory) {
        return contextPath;
    }
    return currentPath_;
}

QStringList PaneModel::selectedPaths() const
{
    return SelectionEngine::orderedSelection(selection_, listing_);
}

QList<FileEntry> PaneModel::selectedEntries() const
{
    QList<FileEntry> entries;
    for (const FileEntry &entry : listing_) {
        if (selection_.contains(entry.path)) {
            entries.append(entry);
        }
    }
    return entries;
}

void PaneModel::setSelection(const QSet<QString> &selection)
{
    QSet<QString> pruned = SelectionEngine::pruneSelection(selection, listing_);
    if (pruned == selection_) {
        return;
    }
    selection_ = pruned;
    if (!listing_.isEmpty()) {
        emit dataChanged(index(0, 0), index(listing_.size() - 1, ColumnCount - 1),
                         {SelectedRole});
    }
    emit selectionChanged();
}

void PaneModel::clearSelection()
{
    setSelection(QSet<QString>());
}

void PaneModel::setCursorIndex(int index)
{
    int clamped = SelectionEngine::clampCursor(index, listing_.size());
    if (clamped == cursorIndex_) {
        return;
    }

    int previous = cursorIndex_;
    cursorIndex_ = clamped;

    if (previous < listing_.size()) {
        emit dataChanged(this->index(previous, 0), this->index(previous, ColumnCount - 1),
                         {CursorRole});
    }
    if (!listing_.isEmpty()) {
        emit dataChanged(this->index(cursorIndex_, 0), this->index(cursorIndex_, ColumnCount - 1),
                         {CursorRole});
    }
    emit cursorChanged(cursorIndex_);
}

SelectionEngine::PaneSnapshot PaneModel::snapshot(bool sourcePaneOpen) const
{
    SelectionEngine::PaneSnapshot snap;
    snap.side = side_;
    snap.listing = listing_;
    snap.selection = selection_;
    snap.cursorIndex = cursorIndex_;
    snap.lastClickedIndex = lastClickedIndex_;
    snap.sourcePaneOpen = sourcePaneOpen;
    return snap;
}

void PaneModel::applyUpdate(const SelectionEngine::SelectionUpdate &update)
{
    lastClickedIndex_ = update.lastClickedIndex < listing_.size() ? update.lastClickedIndex : -1;
    setSelection(update.selection);
    setCursorIndex(update.cursorIndex);
}

void PaneModel::setSort(FileEntrySort::Column column, Qt::SortOrder order)
{
    if (column == sortColumn_ && order == sortOrder_) {
        return;
    }
    sortColumn_ = column;
    sortOrder_ = order;
    applySortOrder();
    emit sortChanged(sortColumn_, sortOrder_);
}

int PaneModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return listing_.size();
}

int PaneModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return ColumnCount;
}

QVariant PaneModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= listing_.size()) {
        return QVariant();
    }

    const FileEntry &entry = listing_.at(index.row());

    switch (role) {
    case Qt::DisplayRole:
        switch (index.column()) {
        case NameColumn: return entry.name;
        case SizeColumn: return entry.isDirectory ? QVariant() : formatSize(entry.size);
        case FormatColumn:
            return entry.isDirectory ? tr("Folder")
                                     : AudioMetadataReader::formatForFileName(entry.name);
        case ChannelsColumn: return optionalValue(entry.channels);
        case BitDepthColumn:
            return entry.bitDepth ? QVariant(tr("%1-bit").arg(*entry.bitDepth)) : QVariant();
        case SampleRateColumn:
            return entry.sampleRate ? QVariant(tr("%1 Hz").arg(*entry.sampleRate)) : QVariant();
        }
        break;

    case Qt::TextAlignmentRole:
        if (index.column() != NameColumn && index.column() != FormatColumn) {
            return int(Qt::AlignRight | Qt::AlignVCenter);
        }
        break;

    case Qt::ToolTipRole:
        return entry.path;

    case FilePathRole:
        return entry.path;

    case IsDirectoryRole:
        return entry.isDirectory;

    case FileSizeRole:
        return entry.size;

    case FormatRole:
        return AudioMetadataReader::formatForFileName(entry.name);

    case ChannelsRole:
        return optionalValue(entry.channels);

    case BitDepthRole:
        return optionalValue(entry.bitDepth);

    case SampleRateRole:
        return optionalValue(entry.sampleRate);

    case SelectedRole:
        return selection_.contains(entry.path);

    case CursorRole:
        return index.row() == cursorIndex_;
    }

    return QVariant();
}

QVariant PaneModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole) {
        return QVariant();
    }

    switch (section) {
    case NameColumn: return tr("Name");
    case SizeColumn: return tr("Size");
    case FormatColumn: return tr("Format");
    case ChannelsColumn: return tr("Ch");
    case BitDepthColumn: return tr("Bit depth");
    case SampleRateColumn: return tr("Sample rate");
    }

    return QVariant();
}

Qt::ItemFlags PaneModel::flags(const QModelIndex &index) const
{
    if (!index.isValid()) {
        return Qt::ItemIsDropEnabled;
    }
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable | Qt::ItemIsDragEnabled;
}

void PaneModel::sort(int column, Qt::SortOrder order)
{
    setSort(sortColumnFor(column), order);
}

QString PaneModel::formatSize(qint64 bytes)
{
    if (bytes < 1024) {
        return tr("%1 B").arg(bytes);
    } else if (bytes < 1024 * 1024) {
        return tr("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    } else if (bytes < 1024LL * 1024 * 1024) {
        return tr("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
    }
    return tr("%1 GB").arg(bytes / (1024.0 * 1024.0 * 1024.0), 0, 'f', 2);
}

void PaneModel::onDirectoryListed(const QString &path, const QList<FileEntry> &entries)
{
    if (!loading_ || QDir::cleanPath(path) != currentPath_) {
        return;
    }

    QSet<QString> previousSelection = selection_;

    beginResetModel();
    listing_ = entries;
    FileEntrySort::sortEntries(listing_, sortColumn_, sortOrder_);
    selection_ = SelectionEngine::pruneSelection(selection_, listing_);
    cursorIndex_ = SelectionEngine::clampCursor(cursorIndex_, listing_.size());
    if (lastClickedIndex_ >= listing_.size()) {
        lastClickedIndex_ = -1;
    }
    endResetModel();

    LOG_VERBOSE() << "PaneModel: Listed" << listing_.size() << "entries in" << currentPath_;

    setLoading(false);
    emit listingChanged();
    if (selection_ != previousSelection) {
        emit selectionChanged();
    }
    emit cursorChanged(cursorIndex_);
}

void PaneModel::onListingFailed(const QString &path, const QString &message)
{
    if (!loading_ || QDir::cleanPath(path) != currentPath_) {
        return;
    }

    qWarning() << "PaneModel: Listing failed for" << path << "-" << message;

    bool hadSelection = !selection_.isEmpty();

    beginResetModel();
    listing_.clear();
    selection_.clear();
    cursorIndex_ = 0;
    lastClickedIndex_ = -1;
    endResetModel();

    setLoading(false);
    emit listingChanged();
    if (hadSelection) {
        emit selectionChanged();
    }
    emit cursorChanged(cursorIndex_);
    emit listingFailed(path, message);
}

bool PaneModel::isWithinRoot(const QString &path) const
{
    if (rootBound_.isEmpty()) {
        return true;
    }
    if (path == rootBound_) {
        return true;
    }
    QString prefix = rootBound_.endsWith('/') ? rootBound_ : rootBound_ + '/';
    return path.startsWith(prefix);
}

void PaneModel::requestListing()
{
    if (!fileOps_) {
        qWarning() << "PaneModel: No file operations set, cannot list" << currentPath_;
        return;
    }

    setLoading(true);
    fileOps_->listDirectory(currentPath_);
}

void PaneModel::setLoading(bool loading)
{
    if (loading_ == loading) {
        return;
    }
    loading_ = loading;
    emit loadingChanged(loading_);
}

void PaneModel::applySortOrder()
{
    if (listing_.isEmpty()) {
        return;
    }

    // Keep the cursor on the same entry; the anchor is positional and is dropped
    QString cursorPath = listing_.value(cursorIndex_).path;

    emit layoutAboutToBeChanged();
    FileEntrySort::sortEntries(listing_, sortColumn_, sortOrder_);
    emit layoutChanged();

    lastClickedIndex_ = -1;
    int newCursor = indexOfPath(cursorPath);
    if (newCursor >= 0 && newCursor != cursorIndex_) {
        cursorIndex_ = newCursor;
        emit cursorChanged(cursorIndex_);
    }
}
