#ifndef FILEPANEWIDGET_H
#define FILEPANEWIDGET_H

#include <QWidget>
#include <QTreeView>
#include <QLineEdit>
#include <QCheckBox>
#include <QComboBox>
#include <QLabel>
#include <QMenu>
#include <QPointer>
#include <QToolButton>

#include "models/selectionengine.h"

class DualPaneController;
class PaneModel;
class PaneProxyModel;
class PanePreferences;
class PathNavigationWidget;
class TransferService;
class PaneItemDelegate;

/**
 * @brief View of one pane: path bar, filter bar and listing.
 *
 * Selection, cursor and navigation live in the PaneModel; the tree view
 * only displays them. Clicks and key presses are routed to the
 * DualPaneController. The source pane starts in-app drags; the destination
 * pane accepts them together with OS-level file drops.
 */
class FilePaneWidget : public QWidget
{
    Q_OBJECT

public:
    explicit FilePaneWidget(PaneSide side,
                            DualPaneController *controller,
                            TransferService *service,
                            QWidget *parent = nullptr);

    [[nodiscard]] PaneSide side() const { return side_; }
    [[nodiscard]] PaneProxyModel *proxyModel() const { return proxyModel_; }

    void setPreferences(PanePreferences *preferences);

    /// @brief Marks this pane as the one receiving keyboard input.
    void setActive(bool active);

    /// @brief Entries the mutation actions apply to (selection, else the cursor entry).
    [[nodiscard]] QStringList actionPaths() const;

public slots:
    void onCopy();
    void onNewFolder();
    void onRename();
    void onDelete();
    void onRefresh();
    /// @brief Shows the cursor folder, or the current directory, in the system file manager.
    void onOpenInFileManager();

signals:
    void statusMessage(const QString &message, int timeout = 0);

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private slots:
    void onPathChanged(const QString &path);
    void onListingChanged();
    void onCursorChanged(int index);
    void onClicked(const QModelIndex &proxyIndex);
    void onContextMenu(const QPoint &pos);
    void onFilterControlsChanged();
    void onFiltersChanged();
    void onDropHighlightChanged(bool highlighted);

private:
    void setupUi();
    void setupFilterBar(QWidget *container);
    void setupConnections();
    void refreshFilterChoices();
    void startDrag();
    bool handleDragEvent(QEvent *event);
    void openInFileManager(const QString &contextPath);

    static void fillIntCombo(QComboBox *combo, const QString &anyText,
                             const QList<int> &values, const QString &format);

    PaneSide side_;
    QPointer<DualPaneController> controller_;
    QPointer<TransferService> service_;
    QPointer<PanePreferences> preferences_;
    PaneModel *model_ = nullptr;
    PaneProxyModel *proxyModel_ = nullptr;

    // UI widgets
    QLabel *titleLabel_ = nullptr;
    PathNavigationWidget *navWidget_ = nullptr;
    QLineEdit *nameFilterEdit_ = nullptr;
    QCheckBox *hideDirsCheck_ = nullptr;
    QComboBox *formatCombo_ = nullptr;
    QComboBox *channelsCombo_ = nullptr;
    QComboBox *bitDepthCombo_ = nullptr;
    QComboBox *sampleRateCombo_ = nullptr;
    QToolButton *clearFiltersButton_ = nullptr;
    QLabel *summaryLabel_ = nullptr;
    QTreeView *treeView_ = nullptr;
    PaneItemDelegate *delegate_ = nullptr;

    // Drag state
    QPoint dragStartPos_;
    int dragRow_ = -1;
    bool updatingFilters_ = false;
};

#endif // FILEPANEWIDGET_H
