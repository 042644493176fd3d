#include "mainwindow.h"
#include "ui/filepanewidget.h"
#include "ui/overwritedialog.h"
#include "ui/transferqueuewidget.h"
#include "services/dualpanecontroller.h"
#include "services/errorhandler.h"
#include "services/localfileoperations.h"
#include "services/panepreferences.h"
#include "services/transferservice.h"
#include "models/panemodel.h"
#include "models/transferqueue.h"
#include "utils/logging.h"
#include "version.h"

#include <QCloseEvent>
#include <QDir>
#include <QFileDialog>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QVBoxLayout>

MainWindow::MainWindow(PanePreferences *preferences, QWidget *parent)
    : QMainWindow(parent)
    , preferences_(preferences)
    , fileOps_(new LocalFileOperations(this))
    , transferQueue_(new TransferQueue(this))
    , controller_(new DualPaneController(this))
{
    Q_ASSERT(preferences_ && "PanePreferences is required");

    transferQueue_->setFileOperations(fileOps_);

    // Create the transfer service over both panes
    transferService_ = new TransferService(controller_->sourcePane(),
                                           controller_->destinationPane(),
                                           transferQueue_, this);
    transferService_->setFileOperations(fileOps_);

    // Create the error handler
    errorHandler_ = new ErrorHandler(this, this);

    controller_->setFileOperations(fileOps_);
    controller_->setTransferService(transferService_);
    controller_->setErrorHandler(errorHandler_);
    controller_->setPreferences(preferences_);

    autoCloseTimer_ = new QTimer(this);
    autoCloseTimer_->setSingleShot(true);
    autoCloseTimer_->setInterval(kAutoCloseDelayMs);

    setupUi();
    setupMenuBar();
    setupToolBar();
    setupConnections();

    updateWindowTitle();
    updateActions();

    resize(1100, 720);
    setMinimumSize(700, 450);
    loadSettings();
}

MainWindow::~MainWindow()
{
    // Panes may still be waiting for listings from fileOps_
    disconnect(fileOps_, nullptr, nullptr, nullptr);
}

void MainWindow::start()
{
    controller_->setPoolRoot(preferences_->poolRoot());
    controller_->start();

    onSourcePaneToggled(controller_->isSourcePaneOpen());
    onActivePaneChanged(controller_->activePane());

    QString pool = preferences_->poolRoot();
    if (pool.isEmpty()) {
        statusBar()->showMessage(tr("Choose a pool folder to copy into (File > Choose Pool...)"));
    } else if (!QDir(pool).exists()) {
        errorHandler_->handleConfigurationError(tr("Pool folder not found: %1")
                                                    .arg(QDir::toNativeSeparators(pool)));
    } else {
        statusBar()->showMessage(tr("Ready"), 2000);
    }
}

void MainWindow::setupUi()
{
    auto *centralContainer = new QWidget(this);
    auto *layout = new QVBoxLayout(centralContainer);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(0);

    sourceWidget_ = new FilePaneWidget(PaneSide::Source, controller_, transferService_);
    destinationWidget_ = new FilePaneWidget(PaneSide::Destination, controller_, transferService_);
    sourceWidget_->setPreferences(preferences_);
    destinationWidget_->setPreferences(preferences_);

    paneSplitter_ = new QSplitter(Qt::Horizontal);
    paneSplitter_->addWidget(sourceWidget_);
    paneSplitter_->addWidget(destinationWidget_);
    paneSplitter_->setSizes({500, 500});

    transferWidget_ = new TransferQueueWidget();
    transferWidget_->setTransferService(transferService_);
    transferWidget_->setVisible(false);

    verticalSplitter_ = new QSplitter(Qt::Vertical);
    verticalSplitter_->addWidget(paneSplitter_);
    verticalSplitter_->addWidget(transferWidget_);
    verticalSplitter_->setStretchFactor(0, 3);
    verticalSplitter_->setStretchFactor(1, 1);

    layout->addWidget(verticalSplitter_);
    setCentralWidget(centralContainer);
}

void MainWindow::setupMenuBar()
{
    // File menu
    auto *fileMenu = menuBar()->addMenu(tr("&File"));

    choosePoolAction_ = fileMenu->addAction(tr("Choose &Pool..."));
    connect(choosePoolAction_, &QAction::triggered, this, &MainWindow::onChoosePool);

    fileMenu->addSeparator();

    importFilesAction_ = fileMenu->addAction(tr("&Import Files..."));
    importFilesAction_->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_I));
    connect(importFilesAction_, &QAction::triggered, this, &MainWindow::onImportFiles);

    importFolderAction_ = fileMenu->addAction(tr("Import &Folder..."));
    importFolderAction_->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_I));
    connect(importFolderAction_, &QAction::triggered, this, &MainWindow::onImportFolder);

    fileMenu->addSeparator();

    auto *quitAction = fileMenu->addAction(tr("&Quit"));
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QMainWindow::close);

    // Edit menu
    auto *editMenu = menuBar()->addMenu(tr("&Edit"));

    copyAction_ = editMenu->addAction(tr("&Copy to Pool"));
    copyAction_->setShortcut(QKeySequence(Qt::Key_F5));
    connect(copyAction_, &QAction::triggered, this, &MainWindow::onCopy);

    copyBackAction_ = editMenu->addAction(tr("Copy &Back to Source"));
    copyBackAction_->setShortcut(QKeySequence(Qt::SHIFT | Qt::Key_F5));
    connect(copyBackAction_, &QAction::triggered, this, &MainWindow::onCopyBack);

    editMenu->addSeparator();

    newFolderAction_ = editMenu->addAction(tr("&New Folder..."));
    newFolderAction_->setShortcut(QKeySequence(Qt::Key_F7));
    connect(newFolderAction_, &QAction::triggered, this, &MainWindow::onNewFolder);

    renameAction_ = editMenu->addAction(tr("&Rename..."));
    renameAction_->setShortcut(QKeySequence(Qt::Key_F2));
    connect(renameAction_, &QAction::triggered, this, &MainWindow::onRename);

    deleteAction_ = editMenu->addAction(tr("&Delete"));
    deleteAction_->setShortcut(QKeySequence::Delete);
    connect(deleteAction_, &QAction::triggered, this, &MainWindow::onDelete);

    // View menu
    auto *viewMenu = menuBar()->addMenu(tr("&View"));

    toggleSourceAction_ = viewMenu->addAction(tr("&Source Pane"));
    toggleSourceAction_->setCheckable(true);
    toggleSourceAction_->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_B));
    connect(toggleSourceAction_, &QAction::triggered, this, &MainWindow::onToggleSourcePane);

    showTransfersAction_ = viewMenu->addAction(tr("&Transfers"));
    showTransfersAction_->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_T));
    connect(showTransfersAction_, &QAction::triggered, this, &MainWindow::onShowTransfers);

    refreshAction_ = viewMenu->addAction(tr("&Refresh"));
    refreshAction_->setShortcut(QKeySequence::Refresh);
    connect(refreshAction_, &QAction::triggered, this, &MainWindow::onRefresh);

    openInFileManagerAction_ = viewMenu->addAction(tr("&Open in File Manager"));
    openInFileManagerAction_->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_O));
    connect(openInFileManagerAction_, &QAction::triggered,
            this, &MainWindow::onOpenInFileManager);

    // Help menu
    auto *helpMenu = menuBar()->addMenu(tr("&Help"));
    auto *aboutAction = helpMenu->addAction(tr("&About"));
    connect(aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, tr("About poolxfer"),
            tr("poolxfer %1\n\nCopies audio files into a sampler pool folder.")
                .arg(POOLXFER_VERSION));
    });
}

void MainWindow::setupToolBar()
{
    toolBar_ = addToolBar(tr("Main"));
    toolBar_->setObjectName("mainToolBar");
    toolBar_->setMovable(false);
    toolBar_->setToolButtonStyle(Qt::ToolButtonTextOnly);
    toolBar_->setFocusPolicy(Qt::NoFocus);

    toolBar_->addAction(copyAction_);
    toolBar_->addAction(copyBackAction_);
    toolBar_->addSeparator();
    toolBar_->addAction(toggleSourceAction_);
    toolBar_->addAction(importFilesAction_);
    toolBar_->addAction(importFolderAction_);
    toolBar_->addSeparator();
    toolBar_->addAction(newFolderAction_);
    toolBar_->addAction(renameAction_);
    toolBar_->addAction(deleteAction_);
    toolBar_->addSeparator();
    toolBar_->addAction(showTransfersAction_);
}

void MainWindow::setupConnections()
{
    connect(controller_, &DualPaneController::activePaneChanged,
            this, &MainWindow::onActivePaneChanged);
    connect(controller_, &DualPaneController::sourcePaneToggled,
            this, &MainWindow::onSourcePaneToggled);
    connect(preferences_, &PanePreferences::poolRootChanged,
            this, &MainWindow::onPoolRootChanged);

    // Keep actions in step with pane state
    for (PaneSide side : {PaneSide::Source, PaneSide::Destination}) {
        PaneModel *pane = controller_->pane(side);
        connect(pane, &PaneModel::selectionChanged, this, &MainWindow::updateActions);
        connect(pane, &PaneModel::listingChanged, this, &MainWindow::updateActions);
        connect(pane, &PaneModel::pathChanged, this, &MainWindow::updateActions);
    }

    // Status messages
    connect(sourceWidget_, &FilePaneWidget::statusMessage, this, &MainWindow::onStatusMessage);
    connect(destinationWidget_, &FilePaneWidget::statusMessage, this, &MainWindow::onStatusMessage);
    connect(transferService_, &TransferService::statusMessage, this, &MainWindow::onStatusMessage);
    connect(errorHandler_, &ErrorHandler::statusMessage, this, &MainWindow::onStatusMessage);

    // Errors
    connect(transferService_, &TransferService::mutationFailed,
            errorHandler_, &ErrorHandler::handleMutationError);
    connect(transferQueue_, &TransferQueue::operationFailed,
            errorHandler_, &ErrorHandler::handleTransferFailed);

    // Transfer panel
    connect(transferService_, &TransferService::transferPanelRequested,
            this, &MainWindow::onShowTransfers);
    connect(transferQueue_, &TransferQueue::batchStarted, autoCloseTimer_, &QTimer::stop);
    connect(transferQueue_, &TransferQueue::allOperationsCompleted,
            this, &MainWindow::onAllOperationsCompleted);
    connect(autoCloseTimer_, &QTimer::timeout, this, [this]() {
        transferWidget_->setVisible(false);
    });
    connect(transferWidget_, &TransferQueueWidget::closeRequested, this, [this]() {
        autoCloseTimer_->stop();
        transferWidget_->setVisible(false);
    });

    // Queued so the prompt opens outside the queue's own processing step
    connect(transferQueue_, &TransferQueue::overwriteConfirmationNeeded,
            this, &MainWindow::onOverwriteConfirmationNeeded, Qt::QueuedConnection);
}

void MainWindow::updateActions()
{
    bool sourceOpen = controller_->isSourcePaneOpen();
    PaneModel *source = controller_->sourcePane();
    PaneModel *destination = controller_->destinationPane();
    bool hasPool = !destination->currentPath().isEmpty();

    copyAction_->setEnabled(sourceOpen && hasPool && !source->selection().isEmpty());
    copyBackAction_->setEnabled(sourceOpen && !destination->selection().isEmpty());
    importFilesAction_->setEnabled(hasPool);
    importFolderAction_->setEnabled(hasPool);
    toggleSourceAction_->setChecked(sourceOpen);

    FilePaneWidget *active = activePaneWidget();
    bool hasPath = !controller_->pane(controller_->activePane())->currentPath().isEmpty();
    QStringList targets = active ? active->actionPaths() : QStringList();
    newFolderAction_->setEnabled(hasPath);
    renameAction_->setEnabled(targets.size() == 1);
    deleteAction_->setEnabled(!targets.isEmpty());
    refreshAction_->setEnabled(hasPath);
    openInFileManagerAction_->setEnabled(hasPath);
}

void MainWindow::updateWindowTitle()
{
    QString pool = preferences_->poolRoot();
    if (pool.isEmpty()) {
        setWindowTitle(tr("poolxfer"));
    } else {
        setWindowTitle(tr("poolxfer - %1").arg(QDir::toNativeSeparators(pool)));
    }
}

void MainWindow::loadSettings()
{
    QByteArray geometry = preferences_->windowGeometry();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    }
}

void MainWindow::saveSettings()
{
    preferences_->setWindowGeometry(saveGeometry());
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (transferService_->isProcessing()) {
        int result = QMessageBox::question(this, tr("Copy in Progress"),
            tr("Files are still being copied. Quit anyway?"),
            QMessageBox::Yes | QMessageBox::No);
        if (result != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        transferService_->cancelAll();
    }

    saveSettings();
    event->accept();
}

FilePaneWidget *MainWindow::paneWidget(PaneSide side) const
{
    return side == PaneSide::Source ? sourceWidget_ : destinationWidget_;
}

FilePaneWidget *MainWindow::activePaneWidget() const
{
    return paneWidget(controller_->activePane());
}

// Slots

void MainWindow::onCopy()
{
    if (transferService_->copySelectedToPool() < 0) {
        statusBar()->showMessage(tr("Select files in the source pane to copy"), 3000);
    }
}

void MainWindow::onCopyBack()
{
    if (transferService_->copyBackToSource() < 0) {
        statusBar()->showMessage(tr("Select files in the pool and open the source pane to copy back"),
                                 3000);
    }
}

void MainWindow::onToggleSourcePane()
{
    controller_->toggleSourcePane();
}

void MainWindow::onImportFiles()
{
    controller_->setDialogOpen(true);
    QStringList files = QFileDialog::getOpenFileNames(this, tr("Import Files"),
        preferences_->lastSourcePath().isEmpty() ? QDir::homePath() : preferences_->lastSourcePath(),
        tr("Audio files (*.wav *.aif *.aiff *.mp3 *.flac *.ogg *.m4a);;All files (*)"));
    controller_->setDialogOpen(false);

    if (!files.isEmpty()) {
        transferService_->importFiles(files);
    }
}

void MainWindow::onImportFolder()
{
    controller_->setDialogOpen(true);
    QString folder = QFileDialog::getExistingDirectory(this, tr("Import Folder"),
        preferences_->lastSourcePath().isEmpty() ? QDir::homePath() : preferences_->lastSourcePath());
    controller_->setDialogOpen(false);

    if (!folder.isEmpty()) {
        transferService_->importFolder(folder);
    }
}

void MainWindow::onChoosePool()
{
    controller_->setDialogOpen(true);
    QString folder = QFileDialog::getExistingDirectory(this, tr("Choose Pool Folder"),
        preferences_->poolRoot().isEmpty() ? QDir::homePath() : preferences_->poolRoot());
    controller_->setDialogOpen(false);

    if (!folder.isEmpty()) {
        preferences_->setPoolRoot(folder);
    }
}

void MainWindow::onNewFolder()
{
    if (FilePaneWidget *pane = activePaneWidget()) {
        pane->onNewFolder();
    }
}

void MainWindow::onRename()
{
    if (FilePaneWidget *pane = activePaneWidget()) {
        pane->onRename();
    }
}

void MainWindow::onDelete()
{
    if (FilePaneWidget *pane = activePaneWidget()) {
        pane->onDelete();
    }
}

void MainWindow::onRefresh()
{
    if (FilePaneWidget *pane = activePaneWidget()) {
        pane->onRefresh();
    }
}

void MainWindow::onOpenInFileManager()
{
    if (FilePaneWidget *pane = activePaneWidget()) {
        pane->onOpenInFileManager();
    }
}

void MainWindow::onShowTransfers()
{
    autoCloseTimer_->stop();
    transferWidget_->setVisible(true);
}

void MainWindow::onActivePaneChanged(PaneSide side)
{
    sourceWidget_->setActive(side == PaneSide::Source);
    destinationWidget_->setActive(side == PaneSide::Destination);
    updateActions();
}

void MainWindow::onSourcePaneToggled(bool open)
{
    sourceWidget_->setVisible(open);
    updateActions();
}

void MainWindow::onPoolRootChanged(const QString &path)
{
    LOG_VERBOSE() << "MainWindow: Pool root changed to" << path;
    controller_->setPoolRoot(path);
    updateWindowTitle();
    updateActions();
    statusBar()->showMessage(tr("Pool: %1").arg(QDir::toNativeSeparators(path)), 3000);
}

void MainWindow::onOverwriteConfirmationNeeded(const QString &fileName, const QString &itemId)
{
    // The batch may have been cancelled while the signal was queued
    std::optional<PendingBatch> pending = transferService_->pendingBatch();
    if (!pending || pending->itemId != itemId) {
        return;
    }

    controller_->setDialogOpen(true);
    OverwriteResponse response = OverwriteDialog::ask(this, fileName);
    controller_->setDialogOpen(false);

    // Stale if the batch was cancelled while the dialog was open
    transferService_->resolveConflict(*pending, response);
}

void MainWindow::onAllOperationsCompleted(bool allSucceeded)
{
    updateActions();
    if (allSucceeded && transferWidget_->isVisible()) {
        autoCloseTimer_->start();
    }
}

void MainWindow::onStatusMessage(const QString &message, int timeout)
{
    statusBar()->showMessage(message, timeout);
}
