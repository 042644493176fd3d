/**
 * @file panemodel.h
 * @brief Table model holding the listing, cursor and selection of one pane.
 */

#ifndef PANEMODEL_H
#define PANEMODEL_H

#include <QAbstractTableModel>
#include <QPointer>
#include <QSet>
#include <QString>

#include "fileentrysort.h"
#include "selectionengine.h"
#include "services/ifileoperations.h"

/**
 * @brief State of one file pane (source or destination).
 *
 * The model owns the unfiltered listing of the current directory together
 * with the cursor, the selection (a set of absolute paths) and the anchor
 * used for shift-click ranges. The listing is kept in the active sort order
 * (directories first), so row numbers, the cursor and shift-click ranges all
 * follow the order the user sees. Filtering happens in PaneProxyModel and
 * never touches this state.
 *
 * Listings are requested asynchronously through IFileOperations. While a
 * listing is in flight, refresh() and setPath() for the same directory are
 * ignored. A listing that arrives for a directory the pane has since left
 * is discarded.
 *
 * A pane with a root bound (the destination pane) refuses to move to any
 * directory outside that root.
 */
class PaneModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    enum Column {
        NameColumn = 0,
        SizeColumn,
        FormatColumn,
        ChannelsColumn,
        BitDepthColumn,
        SampleRateColumn,
        ColumnCount
    };

    enum Roles {
        FilePathRole = Qt::UserRole + 1,
        IsDirectoryRole,
        FileSizeRole,
        FormatRole,
        ChannelsRole,
        BitDepthRole,
        SampleRateRole,
        SelectedRole,
        CursorRole
    };

    explicit PaneModel(PaneSide side, QObject *parent = nullptr);
    ~PaneModel() override;

    void setFileOperations(IFileOperations *fileOps);

    [[nodiscard]] PaneSide side() const { return side_; }

    /// @name Navigation
    /// @{

    /**
     * @brief Restricts navigation to @p root and its descendants.
     *
     * An empty root removes the bound.
     */
    void setRootBound(const QString &root);
    [[nodiscard]] QString rootBound() const { return rootBound_; }

    /**
     * @brief Moves the pane to @p path and requests a listing.
     * @return False if the path is outside the root bound or already loading.
     *
     * Moving to a different directory resets the cursor to 0 and clears the
     * selection and the shift-click anchor.
     */
    bool setPath(const QString &path);
    [[nodiscard]] QString currentPath() const { return currentPath_; }

    /**
     * @brief Moves the pane to the parent directory.
     * @return False at the filesystem root or at the root bound.
     */
    bool navigateToParent();

    /// @brief Re-lists the current directory unless a listing is already in flight.
    void refresh();

    /// @brief Forgets path, listing and selection (used when the source pane closes).
    void clear();

    [[nodiscard]] bool isLoading() const { return loading_; }
    /// @}

    /// @name Listing
    /// @{
    [[nodiscard]] const QList<FileEntry> &listing() const { return listing_; }
    [[nodiscard]] int entryCount() const { return listing_.size(); }
    [[nodiscard]] FileEntry entryAt(int row) const;
    [[nodiscard]] int indexOfPath(const QString &path) const;

    /// @brief Folder to show in the system file manager: @p contextPath if it
    /// is a listed folder, otherwise the current directory.
    [[nodiscard]] QString fileManagerPath(const QString &contextPath) const;
    /// @}

    /// @name Selection and cursor
    /// @{
    [[nodiscard]] const QSet<QString> &selection() const { return selection_; }
    [[nodiscard]] QStringList selectedPaths() const;
    [[nodiscard]] QList<FileEntry> selectedEntries() const;
    [[nodiscard]] bool isSelected(const QString &path) const { return selection_.contains(path); }
    [[nodiscard]] int cursorIndex() const { return cursorIndex_; }
    [[nodiscard]] int lastClickedIndex() const { return lastClickedIndex_; }

    /// @brief Replaces the selection; paths not in the listing are dropped.
    void setSelection(const QSet<QString> &selection);
    void clearSelection();

    /// @brief Moves the cursor, clamped to the listing.
    void setCursorIndex(int index);

    /**
     * @brief Builds the input for SelectionEngine from the current state.
     * @param sourcePaneOpen Whether the source pane is currently shown.
     */
    [[nodiscard]] SelectionEngine::PaneSnapshot snapshot(bool sourcePaneOpen) const;

    /// @brief Applies selection, cursor and anchor from a SelectionEngine result.
    void applyUpdate(const SelectionEngine::SelectionUpdate &update);
    /// @}

    /// @name Sorting
    /// @{
    [[nodiscard]] FileEntrySort::Column sortColumn() const { return sortColumn_; }
    [[nodiscard]] Qt::SortOrder sortOrder() const { return sortOrder_; }
    void setSort(FileEntrySort::Column column, Qt::SortOrder order);
    /// @}

    // QAbstractItemModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QVariant headerData(int section, Qt::Orientation orientation,
                                      int role = Qt::DisplayRole) const override;
    [[nodiscard]] Qt::ItemFlags flags(const QModelIndex &index) const override;
    void sort(int column, Qt::SortOrder order = Qt::AscendingOrder) override;

    /// @brief Human readable size ("12.3 KB").
    [[nodiscard]] static QString formatSize(qint64 bytes);

signals:
    void pathChanged(const QString &path);
    void loadingChanged(bool loading);
    void listingChanged();
    void listingFailed(const QString &path, const QString &message);
    void selectionChanged();
    void cursorChanged(int index);
    void sortChanged(FileEntrySort::Column column, Qt::SortOrder order);

private slots:
    void onDirectoryListed(const QString &path, const QList<FileEntry> &entries);
    void onListingFailed(const QString &path, const QString &message);

private:
    [[nodiscard]] bool isWithinRoot(const QString &path) const;
    void requestListing();
    void setLoading(bool loading);
    void applySortOrder();

    PaneSide side_;
    QPointer<IFileOperations> fileOps_;

    QString rootBound_;
    QString currentPath_;
    QList<FileEntry> listing_;
    int cursorIndex_ = 0;
    QSet<QString> selection_;
    int lastClickedIndex_ = -1;
    bool loading_ = false;

    FileEntrySort::Column sortColumn_ = FileEntrySort::Column::Name;
    Qt::SortOrder sortOrder_ = Qt::AscendingOrder;
};

#endif // PANEMODEL_H
