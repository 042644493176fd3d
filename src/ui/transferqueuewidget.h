#ifndef TRANSFERQUEUEWIDGET_H
#define TRANSFERQUEUEWIDGET_H

#include <QWidget>
#include <QListView>
#include <QPushButton>
#include <QLabel>
#include <QComboBox>
#include <QToolButton>

class TransferService;
class TransferSortProxyModel;

/**
 * @brief Transfer list with per-item status, progress and error tooltips.
 *
 * Items can be sorted by #, progress, file name, size or status.
 * Clear All, Clear Finished and Cancel All act on the whole queue.
 */
class TransferQueueWidget : public QWidget
{
    Q_OBJECT

public:
    explicit TransferQueueWidget(QWidget *parent = nullptr);

    void setTransferService(TransferService *service);

signals:
    void closeRequested();

private slots:
    void onQueueChanged();
    void onClearFinished();
    void onClearAll();
    void onCancelAll();
    void onSortChanged();

private:
    void setupUi();
    void updateButtons();

    TransferService *service_ = nullptr;
    TransferSortProxyModel *sortModel_ = nullptr;
    QListView *listView_ = nullptr;
    QLabel *statusLabel_ = nullptr;
    QComboBox *sortCombo_ = nullptr;
    QToolButton *orderButton_ = nullptr;
    QPushButton *clearFinishedButton_ = nullptr;
    QPushButton *clearAllButton_ = nullptr;
    QPushButton *cancelButton_ = nullptr;
    QToolButton *closeButton_ = nullptr;
};

#endif // TRANSFERQUEUEWIDGET_H
