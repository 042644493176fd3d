#include "transferqueuewidget.h"
#include "models/panemodel.h"
#include "models/transferqueue.h"
#include "models/transfersortproxymodel.h"
#include "services/transferservice.h"

#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QStyledItemDelegate>
#include <QPainter>
#include <QApplication>
#include <QStyleOptionProgressBar>

class TransferItemDelegate : public QStyledItemDelegate
{
public:
    using QStyledItemDelegate::QStyledItemDelegate;

    void paint(QPainter *painter, const QStyleOptionViewItem &option,
               const QModelIndex &index) const override
    {
        QStyleOptionViewItem opt = option;
        initStyleOption(&opt, index);

        painter->save();

        if (opt.state & QStyle::State_Selected) {
            painter->fillRect(opt.rect, opt.palette.highlight());
        }

        QRect rect = opt.rect.adjusted(4, 4, -4, -4);

        QString fileName = index.data(TransferQueue::FileNameRole).toString();
        int serial = index.data(TransferQueue::SerialRole).toInt();
        qint64 size = index.data(TransferQueue::FileSizeRole).toLongLong();
        QString error = index.data(TransferQueue::ErrorMessageRole).toString();

        int status = index.data(TransferQueue::StatusRole).toInt();
        QString statusText;
        QColor statusColor;
        switch (static_cast<TransferItem::Status>(status)) {
        case TransferItem::Status::Pending:
            statusText = QApplication::tr("Pending");
            statusColor = Qt::gray;
            break;
        case TransferItem::Status::Copying:
            statusText = QApplication::tr("Copying");
            statusColor = Qt::blue;
            break;
        case TransferItem::Status::Completed:
            statusText = QApplication::tr("Done");
            statusColor = Qt::darkGreen;
            break;
        case TransferItem::Status::Failed:
            statusText = QApplication::tr("Failed");
            statusColor = Qt::red;
            break;
        case TransferItem::Status::Cancelled:
            statusText = error == TransferQueue::SkippedMessage
                ? QApplication::tr("Skipped") : QApplication::tr("Cancelled");
            statusColor = Qt::darkYellow;
            break;
        }

        painter->setFont(opt.font);

        QRect textRect = rect;
        textRect.setHeight(rect.height() / 2);

        QString sizeText = size > 0 ? PaneModel::formatSize(size) : QString();
        painter->setPen(opt.palette.color(QPalette::Text));
        painter->drawText(textRect, Qt::AlignLeft | Qt::AlignVCenter,
                          QString("#%1  %2").arg(serial).arg(fileName));

        painter->setPen(statusColor);
        painter->drawText(textRect, Qt::AlignRight | Qt::AlignVCenter,
                          sizeText.isEmpty() ? statusText
                                             : QString("%1  %2").arg(sizeText, statusText));

        QRect lowerRect = rect;
        lowerRect.setTop(rect.top() + rect.height() / 2 + 2);
        lowerRect.setHeight(rect.height() / 2 - 4);

        if (status == static_cast<int>(TransferItem::Status::Copying)) {
            int progress = index.data(TransferQueue::ProgressRole).toInt();

            QStyleOptionProgressBar progressBarOption;
            progressBarOption.rect = lowerRect;
            progressBarOption.minimum = 0;
            progressBarOption.maximum = 100;
            progressBarOption.progress = progress;
            progressBarOption.text = QString("%1%").arg(progress);
            progressBarOption.textVisible = true;

            QApplication::style()->drawControl(QStyle::CE_ProgressBar,
                                                &progressBarOption, painter);
        } else if (status == static_cast<int>(TransferItem::Status::Failed) && !error.isEmpty()) {
            // Full text is in the tooltip
            painter->setPen(statusColor);
            QString elided = opt.fontMetrics.elidedText(error, Qt::ElideRight, lowerRect.width());
            painter->drawText(lowerRect, Qt::AlignLeft | Qt::AlignVCenter, elided);
        }

        painter->restore();
    }

    QSize sizeHint(const QStyleOptionViewItem &option,
                   const QModelIndex &index) const override
    {
        Q_UNUSED(index)
        return QSize(option.rect.width(), 50);
    }
};

TransferQueueWidget::TransferQueueWidget(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
}

void TransferQueueWidget::setTransferService(TransferService *service)
{
    if (service_) {
        disconnect(service_->queue(), nullptr, this, nullptr);
    }

    service_ = service;

    if (service_) {
        TransferQueue *queue = service_->queue();
        sortModel_->setSourceModel(queue);
        connect(queue, &TransferQueue::queueChanged,
                this, &TransferQueueWidget::onQueueChanged);
        connect(queue, &TransferQueue::dataChanged,
                this, [this]() { listView_->viewport()->update(); });
    } else {
        sortModel_->setSourceModel(nullptr);
    }

    onQueueChanged();
}

void TransferQueueWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    // Header with status
    auto *headerLayout = new QHBoxLayout();

    sortModel_ = new TransferSortProxyModel(this);

    statusLabel_ = new QLabel(tr("Transfers"));
    statusLabel_->setObjectName("heading");
    headerLayout->addWidget(statusLabel_);

    headerLayout->addStretch();

    headerLayout->addWidget(new QLabel(tr("Sort:")));
    sortCombo_ = new QComboBox();
    for (auto key : {TransferSortProxyModel::SortKey::Serial,
                     TransferSortProxyModel::SortKey::Progress,
                     TransferSortProxyModel::SortKey::FileName,
                     TransferSortProxyModel::SortKey::Size,
                     TransferSortProxyModel::SortKey::Status}) {
        sortCombo_->addItem(TransferSortProxyModel::sortKeyLabel(key), static_cast<int>(key));
    }
    headerLayout->addWidget(sortCombo_);

    orderButton_ = new QToolButton();
    orderButton_->setCheckable(true);
    orderButton_->setText(QStringLiteral("\u2191"));
    orderButton_->setToolTip(tr("Toggle sort direction"));
    connect(orderButton_, &QToolButton::toggled, this, [this](bool descending) {
        orderButton_->setText(descending ? QStringLiteral("\u2193") : QStringLiteral("\u2191"));
        onSortChanged();
    });
    headerLayout->addWidget(orderButton_);

    // Connected only once the order button exists; adding items fires currentIndexChanged
    connect(sortCombo_, &QComboBox::currentIndexChanged,
            this, &TransferQueueWidget::onSortChanged);

    clearFinishedButton_ = new QPushButton(tr("Clear Finished"));
    clearFinishedButton_->setEnabled(false);
    connect(clearFinishedButton_, &QPushButton::clicked,
            this, &TransferQueueWidget::onClearFinished);
    headerLayout->addWidget(clearFinishedButton_);

    clearAllButton_ = new QPushButton(tr("Clear All"));
    clearAllButton_->setEnabled(false);
    connect(clearAllButton_, &QPushButton::clicked,
            this, &TransferQueueWidget::onClearAll);
    headerLayout->addWidget(clearAllButton_);

    cancelButton_ = new QPushButton(tr("Cancel All"));
    cancelButton_->setEnabled(false);
    connect(cancelButton_, &QPushButton::clicked,
            this, &TransferQueueWidget::onCancelAll);
    headerLayout->addWidget(cancelButton_);

    closeButton_ = new QToolButton();
    closeButton_->setText(QStringLiteral("\u00D7"));
    closeButton_->setToolTip(tr("Hide transfers"));
    connect(closeButton_, &QToolButton::clicked, this, &TransferQueueWidget::closeRequested);
    headerLayout->addWidget(closeButton_);

    layout->addLayout(headerLayout);

    // List view
    listView_ = new QListView();
    listView_->setModel(sortModel_);
    listView_->setItemDelegate(new TransferItemDelegate(listView_));
    listView_->setSelectionMode(QAbstractItemView::NoSelection);
    listView_->setAlternatingRowColors(true);
    listView_->setFocusPolicy(Qt::NoFocus);
    layout->addWidget(listView_);
}

void TransferQueueWidget::onQueueChanged()
{
    updateButtons();

    if (!service_) {
        return;
    }

    TransferQueue *queue = service_->queue();
    int total = queue->rowCount();
    int finished = queue->finishedCount();

    if (total == 0) {
        statusLabel_->setText(tr("Transfers"));
    } else if (queue->isAwaitingConfirmation()) {
        statusLabel_->setText(tr("Waiting for decision (%1 of %2 done)").arg(finished).arg(total));
    } else if (queue->isProcessing()) {
        statusLabel_->setText(tr("Copying (%1 of %2 done)").arg(finished).arg(total));
    } else {
        statusLabel_->setText(tr("Transfers (%1 items)").arg(total));
    }
}

void TransferQueueWidget::onClearFinished()
{
    if (service_) {
        service_->removeFinished();
    }
}

void TransferQueueWidget::onClearAll()
{
    if (service_) {
        service_->clear();
    }
}

void TransferQueueWidget::onCancelAll()
{
    if (service_) {
        service_->cancelAll();
    }
}

void TransferQueueWidget::onSortChanged()
{
    auto key = static_cast<TransferSortProxyModel::SortKey>(sortCombo_->currentData().toInt());
    Qt::SortOrder order = orderButton_->isChecked() ? Qt::DescendingOrder : Qt::AscendingOrder;
    sortModel_->setSortKey(key, order);
}

void TransferQueueWidget::updateButtons()
{
    if (!service_) {
        clearFinishedButton_->setEnabled(false);
        clearAllButton_->setEnabled(false);
        cancelButton_->setEnabled(false);
        return;
    }

    TransferQueue *queue = service_->queue();
    bool hasItems = queue->rowCount() > 0;

    clearFinishedButton_->setEnabled(queue->finishedCount() > 0);
    clearAllButton_->setEnabled(hasItems && !service_->isProcessing());
    cancelButton_->setEnabled(service_->isProcessing());
}
