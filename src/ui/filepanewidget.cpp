#include "filepanewidget.h"
#include "pathnavigationwidget.h"
#include "models/panemodel.h"
#include "models/paneproxymodel.h"
#include "services/dualpanecontroller.h"
#include "services/panepreferences.h"
#include "services/transferservice.h"

#include <QApplication>
#include <QDebug>
#include <QDesktopServices>
#include <QDir>
#include <QDrag>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QInputDialog>
#include <QKeyEvent>
#include <QMessageBox>
#include <QMimeData>
#include <QMouseEvent>
#include <QPainter>
#include <QStyledItemDelegate>
#include <QUrl>
#include <QVBoxLayout>

// Paints the pane's own selection and cursor instead of the view's
class PaneItemDelegate : public QStyledItemDelegate
{
public:
    using QStyledItemDelegate::QStyledItemDelegate;

    void setActive(bool active) { active_ = active; }

    void paint(QPainter *painter, const QStyleOptionViewItem &option,
               const QModelIndex &index) const override
    {
        QStyleOptionViewItem opt = option;
        opt.state &= ~(QStyle::State_Selected | QStyle::State_HasFocus);
        if (index.data(PaneModel::SelectedRole).toBool()) {
            opt.state |= QStyle::State_Selected;
        }
        if (!active_) {
            opt.state &= ~QStyle::State_Active;
        }

        QStyledItemDelegate::paint(painter, opt, index);

        if (active_ && index.data(PaneModel::CursorRole).toBool()) {
            painter->save();
            QPen pen(opt.palette.color(QPalette::Highlight));
            pen.setWidth(1);
            pen.setStyle(Qt::DotLine);
            painter->setPen(pen);
            QRect rect = opt.rect.adjusted(0, 0, -1, -1);
            painter->drawLine(rect.topLeft(), rect.topRight());
            painter->drawLine(rect.bottomLeft(), rect.bottomRight());
            painter->restore();
        }
    }

private:
    bool active_ = false;
};

FilePaneWidget::FilePaneWidget(PaneSide side,
                               DualPaneController *controller,
                               TransferService *service,
                               QWidget *parent)
    : QWidget(parent)
    , side_(side)
    , controller_(controller)
    , service_(service)
{
    Q_ASSERT(controller_ && "DualPaneController is required");
    Q_ASSERT(service_ && "TransferService is required");

    model_ = controller_->pane(side_);
    proxyModel_ = new PaneProxyModel(this);
    proxyModel_->setSourceModel(model_);

    setupUi();
    setupConnections();

    onPathChanged(model_->currentPath());
    onListingChanged();
}

void FilePaneWidget::setupUi()
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);

    bool isSource = side_ == PaneSide::Source;

    titleLabel_ = new QLabel(isSource ? tr("Source") : tr("Pool"));
    titleLabel_->setStyleSheet("font-weight: bold;");
    layout->addWidget(titleLabel_);

    navWidget_ = new PathNavigationWidget(isSource ? tr("Browse:") : tr("Copy to:"));
    if (isSource) {
        navWidget_->setStyleBlue();
    } else {
        navWidget_->setStyleGreen();
    }
    connect(navWidget_, &PathNavigationWidget::upClicked, this, [this]() {
        model_->navigateToParent();
    });
    connect(navWidget_, &PathNavigationWidget::pathRequested, this, [this](const QString &path) {
        model_->setPath(path);
    });
    layout->addWidget(navWidget_);

    auto *filterContainer = new QWidget();
    setupFilterBar(filterContainer);
    layout->addWidget(filterContainer);

    treeView_ = new QTreeView();
    treeView_->setRootIsDecorated(false);
    treeView_->setItemsExpandable(false);
    treeView_->setUniformRowHeights(true);
    treeView_->setAlternatingRowColors(true);
    treeView_->setSelectionMode(QAbstractItemView::NoSelection);
    treeView_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    treeView_->setContextMenuPolicy(Qt::CustomContextMenu);
    treeView_->setDragEnabled(false);
    treeView_->setModel(proxyModel_);

    delegate_ = new PaneItemDelegate(treeView_);
    treeView_->setItemDelegate(delegate_);

    QHeaderView *header = treeView_->header();
    header->setSectionResizeMode(PaneModel::NameColumn, QHeaderView::Stretch);
    header->setStretchLastSection(false);
    header->setSortIndicator(static_cast<int>(model_->sortColumn()), model_->sortOrder());
    treeView_->setSortingEnabled(true);

    if (!isSource) {
        treeView_->setAcceptDrops(true);
        treeView_->viewport()->setAcceptDrops(true);
    }

    treeView_->installEventFilter(this);
    treeView_->viewport()->installEventFilter(this);

    layout->addWidget(treeView_, 1);
}

void FilePaneWidget::setupFilterBar(QWidget *container)
{
    auto *outer = new QVBoxLayout(container);
    outer->setContentsMargins(0, 0, 0, 0);
    outer->setSpacing(2);

    auto *topRow = new QHBoxLayout();
    nameFilterEdit_ = new QLineEdit();
    nameFilterEdit_->setPlaceholderText(tr("Filter by name"));
    nameFilterEdit_->setClearButtonEnabled(true);
    topRow->addWidget(nameFilterEdit_, 1);

    hideDirsCheck_ = new QCheckBox(tr("Hide folders"));
    topRow->addWidget(hideDirsCheck_);

    clearFiltersButton_ = new QToolButton();
    clearFiltersButton_->setText(tr("Clear"));
    clearFiltersButton_->setToolTip(tr("Clear all filters"));
    clearFiltersButton_->setEnabled(false);
    topRow->addWidget(clearFiltersButton_);
    outer->addLayout(topRow);

    auto *bottomRow = new QHBoxLayout();
    formatCombo_ = new QComboBox();
    channelsCombo_ = new QComboBox();
    bitDepthCombo_ = new QComboBox();
    sampleRateCombo_ = new QComboBox();
    for (QComboBox *combo : {formatCombo_, channelsCombo_, bitDepthCombo_, sampleRateCombo_}) {
        combo->setSizeAdjustPolicy(QComboBox::AdjustToContents);
        combo->setFocusPolicy(Qt::ClickFocus);
        bottomRow->addWidget(combo);
    }
    bottomRow->addStretch();

    summaryLabel_ = new QLabel();
    bottomRow->addWidget(summaryLabel_);
    outer->addLayout(bottomRow);

    connect(nameFilterEdit_, &QLineEdit::textChanged,
            this, &FilePaneWidget::onFilterControlsChanged);
    connect(hideDirsCheck_, &QCheckBox::toggled, this, [this](bool hide) {
        if (preferences_) {
            preferences_->setHideDirectories(side_, hide);
        }
        onFilterControlsChanged();
    });
    for (QComboBox *combo : {formatCombo_, channelsCombo_, bitDepthCombo_, sampleRateCombo_}) {
        connect(combo, &QComboBox::currentIndexChanged,
                this, &FilePaneWidget::onFilterControlsChanged);
    }
    connect(clearFiltersButton_, &QToolButton::clicked, proxyModel_, &PaneProxyModel::clearFilters);
}

void FilePaneWidget::setupConnections()
{
    connect(model_, &PaneModel::pathChanged, this, &FilePaneWidget::onPathChanged);
    connect(model_, &PaneModel::listingChanged, this, &FilePaneWidget::onListingChanged);
    connect(model_, &PaneModel::loadingChanged, navWidget_, &PathNavigationWidget::setLoading);
    connect(model_, &PaneModel::cursorChanged, this, &FilePaneWidget::onCursorChanged);
    connect(model_, &PaneModel::selectionChanged, this, [this]() {
        treeView_->viewport()->update();
    });
    connect(model_, &PaneModel::sortChanged, this,
            [this](FileEntrySort::Column column, Qt::SortOrder order) {
        treeView_->header()->setSortIndicator(static_cast<int>(column), order);
    });

    connect(proxyModel_, &PaneProxyModel::filtersChanged, this, &FilePaneWidget::onFiltersChanged);

    connect(treeView_, &QTreeView::clicked, this, &FilePaneWidget::onClicked);
    connect(treeView_, &QTreeView::customContextMenuRequested,
            this, &FilePaneWidget::onContextMenu);

    if (side_ == PaneSide::Destination) {
        connect(service_, &TransferService::dropZoneHighlightChanged,
                this, &FilePaneWidget::onDropHighlightChanged);
    }
}

void FilePaneWidget::setPreferences(PanePreferences *preferences)
{
    preferences_ = preferences;
    if (preferences_) {
        hideDirsCheck_->setChecked(preferences_->hideDirectories(side_));
    }
}

void FilePaneWidget::setActive(bool active)
{
    delegate_->setActive(active);
    titleLabel_->setStyleSheet(active ? "font-weight: bold; color: palette(highlight);"
                                      : "font-weight: bold;");
    if (active && !treeView_->hasFocus()) {
        treeView_->setFocus(Qt::OtherFocusReason);
    }
    treeView_->viewport()->update();
}

QStringList FilePaneWidget::actionPaths() const
{
    QStringList paths = model_->selectedPaths();
    if (paths.isEmpty() && model_->entryCount() > 0) {
        FileEntry entry = model_->entryAt(model_->cursorIndex());
        if (!entry.path.isEmpty()) {
            paths.append(entry.path);
        }
    }
    return paths;
}

void FilePaneWidget::onCopy()
{
    if (side_ == PaneSide::Source) {
        if (service_->copySelectedToPool() < 0) {
            emit statusMessage(tr("Nothing selected to copy"), 3000);
        }
    } else if (service_->copyBackToSource() < 0) {
        emit statusMessage(tr("Select files in the pool and open the source pane to copy back"), 3000);
    }
}

void FilePaneWidget::onOpenInFileManager()
{
    QString cursorPath;
    if (model_->entryCount() > 0) {
        cursorPath = model_->entryAt(model_->cursorIndex()).path;
    }
    openInFileManager(cursorPath);
}

void FilePaneWidget::openInFileManager(const QString &contextPath)
{
    QString path = model_->fileManagerPath(contextPath);
    if (path.isEmpty()) {
        return;
    }

    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(path))) {
        qWarning() << "FilePaneWidget: Could not open file manager for" << path;
        emit statusMessage(tr("Could not open %1 in the file manager")
                               .arg(QDir::toNativeSeparators(path)), 5000);
    }
}

void FilePaneWidget::onNewFolder()
{
    if (model_->currentPath().isEmpty()) {
        return;
    }

    controller_->setDialogOpen(true);
    bool ok;
    QString folderName = QInputDialog::getText(this, tr("New Folder"),
        tr("Folder name:"), QLineEdit::Normal, "", &ok);
    controller_->setDialogOpen(false);

    if (!ok || folderName.trimmed().isEmpty()) {
        return;
    }

    if (folderName.contains('/') || folderName.contains('\\')) {
        QMessageBox::warning(this, tr("Invalid Name"),
            tr("The name cannot contain '/' or '\\' characters."));
        return;
    }

    service_->createFolder(side_, folderName);
}

void FilePaneWidget::onRename()
{
    QStringList paths = actionPaths();
    if (paths.size() != 1) {
        emit statusMessage(tr("Select a single file or folder to rename"), 3000);
        return;
    }

    QFileInfo fileInfo(paths.first());
    QString oldName = fileInfo.fileName();
    QString itemType = model_->entryAt(model_->indexOfPath(paths.first())).isDirectory
        ? tr("folder") : tr("file");

    controller_->setDialogOpen(true);
    bool ok;
    QString newName = QInputDialog::getText(this, tr("Rename %1").arg(itemType),
        tr("New name:"), QLineEdit::Normal, oldName, &ok);
    controller_->setDialogOpen(false);

    if (!ok) {
        return;
    }

    if (newName.contains('/') || newName.contains('\\')) {
        QMessageBox::warning(this, tr("Invalid Name"),
            tr("The name cannot contain '/' or '\\' characters."));
        return;
    }

    service_->renameEntry(side_, paths.first(), newName);
}

void FilePaneWidget::onDelete()
{
    QStringList paths = actionPaths();
    if (paths.isEmpty()) {
        return;
    }

    QString question = paths.size() == 1
        ? tr("Are you sure you want to delete '%1'?").arg(QFileInfo(paths.first()).fileName())
        : tr("Are you sure you want to delete %1 items?").arg(paths.size());

    controller_->setDialogOpen(true);
    int result = QMessageBox::question(this, tr("Delete"),
        question + "\n\n" + tr("Folders are deleted with their contents."),
        QMessageBox::Yes | QMessageBox::No);
    controller_->setDialogOpen(false);

    if (result != QMessageBox::Yes) {
        return;
    }

    service_->deleteEntries(side_, paths);
}

void FilePaneWidget::onRefresh()
{
    model_->refresh();
}

bool FilePaneWidget::eventFilter(QObject *watched, QEvent *event)
{
    if (watched == treeView_) {
        if (event->type() == QEvent::KeyPress) {
            auto *keyEvent = static_cast<QKeyEvent*>(event);
            if (controller_ && controller_->handleKey(keyEvent->key(), keyEvent->modifiers())) {
                return true;
            }
        } else if (event->type() == QEvent::FocusIn) {
            if (controller_ && controller_->activePane() != side_) {
                controller_->setActivePane(side_);
            }
        }
        return QWidget::eventFilter(watched, event);
    }

    if (watched == treeView_->viewport()) {
        switch (event->type()) {
        case QEvent::MouseButtonPress: {
            auto *mouseEvent = static_cast<QMouseEvent*>(event);
            if (mouseEvent->button() == Qt::LeftButton) {
                dragStartPos_ = mouseEvent->position().toPoint();
                QModelIndex proxyIndex = treeView_->indexAt(dragStartPos_);
                dragRow_ = proxyIndex.isValid() ? proxyModel_->listingIndex(proxyIndex.row()) : -1;
            }
            break;
        }
        case QEvent::MouseMove: {
            auto *mouseEvent = static_cast<QMouseEvent*>(event);
            if (side_ == PaneSide::Source && dragRow_ >= 0
                && (mouseEvent->buttons() & Qt::LeftButton)
                && (mouseEvent->position().toPoint() - dragStartPos_).manhattanLength()
                       >= QApplication::startDragDistance()) {
                startDrag();
                return true;
            }
            break;
        }
        case QEvent::DragEnter:
        case QEvent::DragMove:
        case QEvent::DragLeave:
        case QEvent::Drop:
            if (handleDragEvent(event)) {
                return true;
            }
            break;
        default:
            break;
        }
    }

    return QWidget::eventFilter(watched, event);
}

void FilePaneWidget::startDrag()
{
    FileEntry pressed = model_->entryAt(dragRow_);
    dragRow_ = -1;
    if (pressed.path.isEmpty()) {
        return;
    }

    // Dragging a selected entry drags the whole selection
    QStringList paths = model_->isSelected(pressed.path)
        ? model_->selectedPaths() : QStringList{pressed.path};

    auto *drag = new QDrag(this);
    drag->setMimeData(TransferService::createDragMimeData(paths));
    drag->exec(Qt::CopyAction);

    service_->setDropHover(false);
}

bool FilePaneWidget::handleDragEvent(QEvent *event)
{
    if (side_ != PaneSide::Destination) {
        return false;
    }

    switch (event->type()) {
    case QEvent::DragEnter: {
        auto *dragEvent = static_cast<QDragEnterEvent*>(event);
        const QMimeData *mime = dragEvent->mimeData();
        if (TransferService::canDecode(mime) || mime->hasUrls()) {
            dragEvent->acceptProposedAction();
            service_->setDropHover(true);
        } else {
            dragEvent->ignore();
        }
        return true;
    }
    case QEvent::DragMove: {
        auto *moveEvent = static_cast<QDragMoveEvent*>(event);
        moveEvent->acceptProposedAction();
        return true;
    }
    case QEvent::DragLeave:
        service_->setDropHover(false);
        return true;
    case QEvent::Drop: {
        auto *dropEvent = static_cast<QDropEvent*>(event);
        const QMimeData *mime = dropEvent->mimeData();
        int batchId = TransferService::canDecode(mime)
            ? service_->handleInternalDrop(mime)
            : service_->handleExternalDrop(mime->urls());
        if (batchId < 0) {
            emit statusMessage(tr("Nothing to copy from drop"), 3000);
        }
        dropEvent->acceptProposedAction();
        return true;
    }
    default:
        return false;
    }
}

void FilePaneWidget::onPathChanged(const QString &path)
{
    if (side_ == PaneSide::Destination) {
        navWidget_->setRoot(model_->rootBound(), tr("Pool"));
    }
    navWidget_->setPath(path);

    bool canGoUp = !path.isEmpty();
    if (canGoUp && side_ == PaneSide::Destination) {
        canGoUp = path != model_->rootBound();
    } else if (canGoUp) {
        canGoUp = !QDir(path).isRoot();
    }
    navWidget_->setUpEnabled(canGoUp);
}

void FilePaneWidget::onListingChanged()
{
    refreshFilterChoices();
    onFiltersChanged();
    onCursorChanged(model_->cursorIndex());
}

void FilePaneWidget::onCursorChanged(int index)
{
    int row = proxyModel_->proxyRow(index);
    if (row >= 0) {
        treeView_->scrollTo(proxyModel_->index(row, 0));
    }
    treeView_->viewport()->update();
}

void FilePaneWidget::onClicked(const QModelIndex &proxyIndex)
{
    if (!proxyIndex.isValid() || !controller_) {
        return;
    }
    int row = proxyModel_->listingIndex(proxyIndex.row());
    controller_->handleClick(side_, row, QApplication::keyboardModifiers());
}

void FilePaneWidget::onContextMenu(const QPoint &pos)
{
    QModelIndex proxyIndex = treeView_->indexAt(pos);
    QString contextPath;
    if (proxyIndex.isValid()) {
        contextPath = model_->entryAt(proxyModel_->listingIndex(proxyIndex.row())).path;
    }

    // Right-clicking outside the selection acts on the clicked entry alone
    if (!contextPath.isEmpty() && !model_->isSelected(contextPath)) {
        model_->setSelection({contextPath});
    }

    QMenu menu(this);
    if (side_ == PaneSide::Source) {
        QAction *copyAction = menu.addAction(tr("Copy to Pool"), this, &FilePaneWidget::onCopy);
        copyAction->setEnabled(!model_->selection().isEmpty());
    } else {
        QAction *copyBackAction = menu.addAction(tr("Copy to Source"), this, [this, contextPath]() {
            if (service_->copyBackToSource(contextPath) < 0) {
                emit statusMessage(tr("Open the source pane to copy back"), 3000);
            }
        });
        copyBackAction->setEnabled(!contextPath.isEmpty() && controller_->isSourcePaneOpen());
    }
    menu.addSeparator();
    menu.addAction(tr("New Folder"), this, &FilePaneWidget::onNewFolder);
    QAction *renameAction = menu.addAction(tr("Rename"), this, &FilePaneWidget::onRename);
    renameAction->setEnabled(actionPaths().size() == 1);
    QAction *deleteAction = menu.addAction(tr("Delete"), this, &FilePaneWidget::onDelete);
    deleteAction->setEnabled(!contextPath.isEmpty());
    menu.addSeparator();
    QAction *openAction = menu.addAction(tr("Open in File Manager"), this, [this, contextPath]() {
        openInFileManager(contextPath);
    });
    openAction->setEnabled(!model_->currentPath().isEmpty());
    menu.addAction(tr("Refresh"), this, &FilePaneWidget::onRefresh);

    controller_->setDialogOpen(true);
    menu.exec(treeView_->viewport()->mapToGlobal(pos));
    controller_->setDialogOpen(false);
}

void FilePaneWidget::onFilterControlsChanged()
{
    if (updatingFilters_) {
        return;
    }

    auto optionalInt = [](QComboBox *combo) -> std::optional<int> {
        QVariant value = combo->currentData();
        return value.isValid() ? std::optional<int>(value.toInt()) : std::nullopt;
    };

    updatingFilters_ = true;
    proxyModel_->setNameFilter(nameFilterEdit_->text());
    proxyModel_->setHideDirectories(hideDirsCheck_->isChecked());
    proxyModel_->setFormatFilter(formatCombo_->currentData().toString());
    proxyModel_->setChannelsFilter(optionalInt(channelsCombo_));
    proxyModel_->setBitDepthFilter(optionalInt(bitDepthCombo_));
    proxyModel_->setSampleRateFilter(optionalInt(sampleRateCombo_));
    updatingFilters_ = false;

    onFiltersChanged();
}

void FilePaneWidget::onFiltersChanged()
{
    // Reflect clearFilters() back into the controls
    if (!updatingFilters_ && !proxyModel_->hasActiveFilters()) {
        updatingFilters_ = true;
        nameFilterEdit_->clear();
        hideDirsCheck_->setChecked(false);
        for (QComboBox *combo : {formatCombo_, channelsCombo_, bitDepthCombo_, sampleRateCombo_}) {
            combo->setCurrentIndex(0);
        }
        updatingFilters_ = false;
    }

    summaryLabel_->setText(proxyModel_->summaryText());
    clearFiltersButton_->setEnabled(proxyModel_->hasActiveFilters());
    treeView_->viewport()->update();
}

void FilePaneWidget::refreshFilterChoices()
{
    updatingFilters_ = true;

    QString currentFormat = proxyModel_->formatFilter();
    formatCombo_->clear();
    formatCombo_->addItem(tr("Any format"), QString());
    QStringList formats = proxyModel_->availableFormats();
    if (!currentFormat.isEmpty() && !formats.contains(currentFormat)) {
        formats.append(currentFormat);
    }
    for (const QString &format : formats) {
        formatCombo_->addItem(format, format);
    }
    formatCombo_->setCurrentIndex(qMax(0, formatCombo_->findData(currentFormat)));

    auto withCurrent = [](QList<int> values, std::optional<int> current) {
        if (current && !values.contains(*current)) {
            values.append(*current);
        }
        return values;
    };

    fillIntCombo(channelsCombo_, tr("Any channels"),
                 withCurrent(proxyModel_->availableChannels(), proxyModel_->channelsFilter()),
                 tr("%1 ch"));
    fillIntCombo(bitDepthCombo_, tr("Any bit depth"),
                 withCurrent(proxyModel_->availableBitDepths(), proxyModel_->bitDepthFilter()),
                 tr("%1-bit"));
    fillIntCombo(sampleRateCombo_, tr("Any sample rate"),
                 withCurrent(proxyModel_->availableSampleRates(), proxyModel_->sampleRateFilter()),
                 tr("%1 Hz"));

    auto select = [](QComboBox *combo, std::optional<int> value) {
        combo->setCurrentIndex(value ? qMax(0, combo->findData(*value)) : 0);
    };
    select(channelsCombo_, proxyModel_->channelsFilter());
    select(bitDepthCombo_, proxyModel_->bitDepthFilter());
    select(sampleRateCombo_, proxyModel_->sampleRateFilter());

    updatingFilters_ = false;
}

void FilePaneWidget::fillIntCombo(QComboBox *combo, const QString &anyText,
                                  const QList<int> &values, const QString &format)
{
    combo->clear();
    combo->addItem(anyText, QVariant());
    for (int value : values) {
        combo->addItem(format.arg(value), value);
    }
}

void FilePaneWidget::onDropHighlightChanged(bool highlighted)
{
    treeView_->setStyleSheet(highlighted
        ? "QTreeView { border: 2px dashed palette(highlight); }"
        : QString());
}
