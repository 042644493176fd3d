#include <QtTest>
#include <QStandardItemModel>

#include "models/transferqueue.h"
#include "models/transfersortproxymodel.h"

class TestTransferSortProxyModel : public QObject
{
    Q_OBJECT

private:
    QStandardItemModel *source;
    TransferSortProxyModel *proxy;

    void addRow(int serial, const QString &fileName, qint64 size, int progress,
                TransferItem::Status status)
    {
        auto *item = new QStandardItem(fileName);
        item->setData(serial, TransferQueue::SerialRole);
        item->setData(fileName, TransferQueue::FileNameRole);
        item->setData(size, TransferQueue::FileSizeRole);
        item->setData(progress, TransferQueue::ProgressRole);
        item->setData(static_cast<int>(status), TransferQueue::StatusRole);
        source->appendRow(item);
    }

    QList<int> serials() const
    {
        QList<int> result;
        for (int row = 0; row < proxy->rowCount(); ++row) {
            result << proxy->index(row, 0).data(TransferQueue::SerialRole).toInt();
        }
        return result;
    }

private slots:
    void init()
    {
        source = new QStandardItemModel(this);
        proxy = new TransferSortProxyModel(this);
        proxy->setSourceModel(source);

        addRow(1, "kick10.wav", 300, 100, TransferItem::Status::Completed);
        addRow(2, "Kick2.wav", 100, 40, TransferItem::Status::Copying);
        addRow(3, "bass.wav", 300, 0, TransferItem::Status::Pending);
        addRow(4, "clap.wav", 50, 0, TransferItem::Status::Failed);
        addRow(5, "hat.wav", 200, 0, TransferItem::Status::Cancelled);
    }

    void cleanup()
    {
        delete proxy;
        delete source;
        proxy = nullptr;
        source = nullptr;
    }

    void testSerialOrder()
    {
        proxy->setSortKey(TransferSortProxyModel::SortKey::Serial);
        QCOMPARE(serials(), (QList<int>{1, 2, 3, 4, 5}));

        proxy->setSortKey(TransferSortProxyModel::SortKey::Serial, Qt::DescendingOrder);
        QCOMPARE(serials(), (QList<int>{5, 4, 3, 2, 1}));
    }

    void testFileNameUsesNaturalCaseInsensitiveOrder()
    {
        proxy->setSortKey(TransferSortProxyModel::SortKey::FileName);
        QCOMPARE(serials(), (QList<int>{3, 4, 5, 2, 1}));
    }

    void testSizeTiesFallBackToSerial()
    {
        proxy->setSortKey(TransferSortProxyModel::SortKey::Size);
        QCOMPARE(serials(), (QList<int>{4, 2, 5, 1, 3}));
    }

    void testProgressOrder()
    {
        proxy->setSortKey(TransferSortProxyModel::SortKey::Progress, Qt::DescendingOrder);
        QCOMPARE(serials().mid(0, 2), (QList<int>{1, 2}));
    }

    void testStatusOrder()
    {
        proxy->setSortKey(TransferSortProxyModel::SortKey::Status);
        QCOMPARE(proxy->sortKey(), TransferSortProxyModel::SortKey::Status);
        QCOMPARE(serials(), (QList<int>{2, 3, 1, 4, 5}));
    }

    void testLabels()
    {
        QCOMPARE(TransferSortProxyModel::sortKeyLabel(TransferSortProxyModel::SortKey::Serial),
                 QString("#"));
        QCOMPARE(TransferSortProxyModel::sortKeyLabel(TransferSortProxyModel::SortKey::Status),
                 QString("Status"));
    }
};

QTEST_MAIN(TestTransferSortProxyModel)
#include "test_transfersortproxymodel.moc"
