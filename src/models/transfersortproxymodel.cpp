#include "transfersortproxymodel.h"
#include "transferqueue.h"

#include <QCollator>

TransferSortProxyModel::TransferSortProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
{
    setDynamicSortFilter(true);
}

void TransferSortProxyModel::setSortKey(SortKey key, Qt::SortOrder order)
{
    sortKey_ = key;
    invalidate();
    sort(0, order);
}

QString TransferSortProxyModel::sortKeyLabel(SortKey key)
{
    switch (key) {
    case SortKey::Serial: return tr("#");
    case SortKey::Progress: return tr("Progress");
    case SortKey::FileName: return tr("File");
    case SortKey::Size: return tr("Size");
    case SortKey::Status: return tr("Status");
    }
    return QString();
}

int TransferSortProxyModel::statusRank(int status)
{
    switch (static_cast<TransferItem::Status>(status)) {
    case TransferItem::Status::Copying: return 0;
    case TransferItem::Status::Pending: return 1;
    case TransferItem::Status::Completed: return 2;
    case TransferItem::Status::Failed: return 3;
    case TransferItem::Status::Cancelled: return 4;
    }
    return 5;
}

bool TransferSortProxyModel::lessThan(const QModelIndex &left, const QModelIndex &right) const
{
    int leftSerial = left.data(TransferQueue::SerialRole).toInt();
    int rightSerial = right.data(TransferQueue::SerialRole).toInt();

    switch (sortKey_) {
    case SortKey::Serial:
        break;

    case SortKey::Progress: {
        int l = left.data(TransferQueue::ProgressRole).toInt();
        int r = right.data(TransferQueue::ProgressRole).toInt();
        if (l != r) {
            return l < r;
        }
        break;
    }

    case SortKey::FileName: {
        static const QCollator collator = [] {
            QCollator c;
            c.setCaseSensitivity(Qt::CaseInsensitive);
            c.setNumericMode(true);
            return c;
        }();
        int cmp = collator.compare(left.data(TransferQueue::FileNameRole).toString(),
                                   right.data(TransferQueue::FileNameRole).toString());
        if (cmp != 0) {
            return cmp < 0;
        }
        break;
    }

    case SortKey::Size: {
        qint64 l = left.data(TransferQueue::FileSizeRole).toLongLong();
        qint64 r = right.data(TransferQueue::FileSizeRole).toLongLong();
        if (l != r) {
            return l < r;
        }
        break;
    }

    case SortKey::Status: {
        int l = statusRank(left.data(TransferQueue::StatusRole).toInt());
        int r = statusRank(right.data(TransferQueue::StatusRole).toInt());
        if (l != r) {
            return l < r;
        }
        break;
    }
    }

    return leftSerial < rightSerial;
}
