#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QSplitter>
#include <QToolBar>
#include <QTimer>
#include <QAction>

#include "models/selectionengine.h"

class DualPaneController;
class ErrorHandler;
class FilePaneWidget;
class LocalFileOperations;
class PanePreferences;
class TransferQueue;
class TransferQueueWidget;
class TransferService;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    /// Delay before the transfer list hides after a fully successful run
    static constexpr int kAutoCloseDelayMs = 1500;

    explicit MainWindow(PanePreferences *preferences, QWidget *parent = nullptr);
    ~MainWindow() override;

    /// @brief Opens the panes at the pool root and the last source directory.
    void start();

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onCopy();
    void onCopyBack();
    void onToggleSourcePane();
    void onImportFiles();
    void onImportFolder();
    void onChoosePool();
    void onNewFolder();
    void onRename();
    void onDelete();
    void onRefresh();
    void onOpenInFileManager();
    void onShowTransfers();

    void onActivePaneChanged(PaneSide side);
    void onSourcePaneToggled(bool open);
    void onPoolRootChanged(const QString &path);
    void onOverwriteConfirmationNeeded(const QString &fileName, const QString &itemId);
    void onAllOperationsCompleted(bool allSucceeded);
    void onStatusMessage(const QString &message, int timeout);

private:
    void setupUi();
    void setupMenuBar();
    void setupToolBar();
    void setupConnections();
    void updateActions();
    void updateWindowTitle();
    void loadSettings();
    void saveSettings();

    [[nodiscard]] FilePaneWidget *paneWidget(PaneSide side) const;
    [[nodiscard]] FilePaneWidget *activePaneWidget() const;

    // Services (owned through QObject parenting)
    PanePreferences *preferences_ = nullptr;
    LocalFileOperations *fileOps_ = nullptr;
    TransferQueue *transferQueue_ = nullptr;
    DualPaneController *controller_ = nullptr;
    TransferService *transferService_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;

    // UI widgets
    QSplitter *verticalSplitter_ = nullptr;
    QSplitter *paneSplitter_ = nullptr;
    FilePaneWidget *sourceWidget_ = nullptr;
    FilePaneWidget *destinationWidget_ = nullptr;
    TransferQueueWidget *transferWidget_ = nullptr;
    QToolBar *toolBar_ = nullptr;
    QTimer *autoCloseTimer_ = nullptr;

    // Actions
    QAction *copyAction_ = nullptr;
    QAction *copyBackAction_ = nullptr;
    QAction *toggleSourceAction_ = nullptr;
    QAction *importFilesAction_ = nullptr;
    QAction *importFolderAction_ = nullptr;
    QAction *choosePoolAction_ = nullptr;
    QAction *newFolderAction_ = nullptr;
    QAction *renameAction_ = nullptr;
    QAction *deleteAction_ = nullptr;
    QAction *refreshAction_ = nullptr;
    QAction *openInFileManagerAction_ = nullptr;
    QAction *showTransfersAction_ = nullptr;
};

#endif // MAINWINDOW_H
