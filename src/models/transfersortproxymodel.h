#ifndef TRANSFERSORTPROXYMODEL_H
#define TRANSFERSORTPROXYMODEL_H

#include <QSortFilterProxyModel>

/**
 * Sorting view over a TransferQueue:
 * - # (enqueue order), Progress, File, Size or Status
 * - Status order is Copying, Pending, Completed, Failed, Cancelled
 * - Ties fall back to enqueue order
 */
class TransferSortProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    enum class SortKey {
        Serial,
        Progress,
        FileName,
        Size,
        Status
    };

    explicit TransferSortProxyModel(QObject *parent = nullptr);

    void setSortKey(SortKey key, Qt::SortOrder order = Qt::AscendingOrder);
    [[nodiscard]] SortKey sortKey() const { return sortKey_; }

    [[nodiscard]] static QString sortKeyLabel(SortKey key);

    /// @brief Rank of a TransferItem::Status value in the status sort order.
    [[nodiscard]] static int statusRank(int status);

protected:
    bool lessThan(const QModelIndex &left, const QModelIndex &right) const override;

private:
    SortKey sortKey_ = SortKey::Serial;
};

#endif // TRANSFERSORTPROXYMODEL_H
