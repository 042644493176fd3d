#include "dualpanecontroller.h"
#include "errorhandler.h"
#include "ifileoperations.h"
#include "panepreferences.h"
#include "transferservice.h"
#include "models/panemodel.h"
#include "utils/logging.h"

#include <QDebug>

DualPaneController::DualPaneController(QObject *parent)
    : QObject(parent)
    , source_(new PaneModel(PaneSide::Source, this))
    , destination_(new PaneModel(PaneSide::Destination, this))
{
    connect(source_, &PaneModel::pathChanged,
            this, &DualPaneController::onSourcePathChanged);
}

DualPaneController::~DualPaneController() = default;

void DualPaneController::setFileOperations(IFileOperations *fileOps)
{
    fileOps_ = fileOps;
    source_->setFileOperations(fileOps);
    destination_->setFileOperations(fileOps);
}

void DualPaneController::setTransferService(TransferService *service)
{
    transferService_ = service;
}

void DualPaneController::setErrorHandler(ErrorHandler *handler)
{
    if (!handler) {
        return;
    }
    connect(source_, &PaneModel::listingFailed,
            handler, &ErrorHandler::handleListingError);
    connect(destination_, &PaneModel::listingFailed,
            handler, &ErrorHandler::handleListingError);
}

void DualPaneController::setPreferences(PanePreferences *preferences)
{
    if (preferences_) {
        disconnect(source_, &PaneModel::sortChanged, preferences_.data(), nullptr);
        disconnect(destination_, &PaneModel::sortChanged, preferences_.data(), nullptr);
    }

    preferences_ = preferences;
    if (!preferences_) {
        return;
    }

    for (PaneModel *model : {source_, destination_}) {
        PanePreferences::SortPreference sort = preferences_->sortPreference(model->side());
        model->setSort(sort.column, sort.order);

        PaneSide side = model->side();
        connect(model, &PaneModel::sortChanged, preferences_.data(),
                [prefs = preferences_, side](FileEntrySort::Column column, Qt::SortOrder order) {
                    if (prefs) {
                        prefs->setSortPreference(side, column, order);
                    }
                });
    }

    sourcePaneOpen_ = preferences_->isSourcePaneOpen();
    if (!preferences_->lastSourcePath().isEmpty()) {
        lastSourcePath_ = preferences_->lastSourcePath();
    }
}

PaneModel *DualPaneController::pane(PaneSide side) const
{
    return side == PaneSide::Source ? source_ : destination_;
}

void DualPaneController::setPoolRoot(const QString &root)
{
    destination_->setRootBound(root);
    if (!root.isEmpty()) {
        destination_->setPath(root);
    } else {
        destination_->clear();
    }
}

QString DualPaneController::poolRoot() const
{
    return destination_->rootBound();
}

void DualPaneController::start()
{
    if (!sourcePaneOpen_) {
        qDebug() << "DualPaneController: Source pane closed, not loading";
        return;
    }
    openSourcePane();
}

void DualPaneController::openSourcePane()
{
    QString path = lastSourcePath_;
    if (path.isEmpty() && fileOps_) {
        path = fileOps_->homeDirectory();
    }
    if (path.isEmpty()) {
        qWarning() << "DualPaneController: No directory to show in the source pane";
        return;
    }
    source_->setPath(path);
}

void DualPaneController::setActivePane(PaneSide side)
{
    if (side == PaneSide::Source && !sourcePaneOpen_) {
        return;
    }
    if (side == activePane_) {
        return;
    }
    activePane_ = side;
    LOG_VERBOSE() << "DualPaneController: Active pane"
                  << (side == PaneSide::Source ? "source" : "destination");
    emit activePaneChanged(activePane_);
}

void DualPaneController::toggleSourcePane()
{
    sourcePaneOpen_ = !sourcePaneOpen_;

    if (sourcePaneOpen_) {
        openSourcePane();
    } else {
        source_->clear();
        setActivePane(PaneSide::Destination);
    }

    if (preferences_) {
        preferences_->setSourcePaneOpen(sourcePaneOpen_);
    }
    emit sourcePaneToggled(sourcePaneOpen_);
}

bool DualPaneController::handleKey(int key, Qt::KeyboardModifiers modifiers)
{
    if (dialogOpen_) {
        LOG_VERBOSE() << "DualPaneController: Ignoring key while dialog is open";
        return false;
    }
    if (!SelectionEngine::handlesKey(key, modifiers)) {
        return false;
    }

    PaneModel *model = pane(activePane_);
    SelectionEngine::SelectionUpdate update =
        SelectionEngine::keyPress(model->snapshot(sourcePaneOpen_), key, modifiers);
    apply(model, update);
    return true;
}

void DualPaneController::handleClick(PaneSide side, int row, Qt::KeyboardModifiers modifiers)
{
    if (side == PaneSide::Source && !sourcePaneOpen_) {
        return;
    }

    setActivePane(side);

    PaneModel *model = pane(side);
    SelectionEngine::SelectionUpdate update =
        SelectionEngine::click(model->snapshot(sourcePaneOpen_), row, modifiers);
    apply(model, update);
}

void DualPaneController::apply(PaneModel *model, const SelectionEngine::SelectionUpdate &update)
{
    using SelectionEngine::Action;

    if (update.action != Action::Navigate) {
        model->applyUpdate(update);
    }

    switch (update.action) {
    case Action::None:
        break;

    case Action::Navigate:
        model->setPath(update.navigatePath);
        break;

    case Action::NavigateParent:
        model->navigateToParent();
        break;

    case Action::ActivateSource:
        setActivePane(PaneSide::Source);
        break;

    case Action::ActivateDestination:
        setActivePane(PaneSide::Destination);
        break;

    case Action::CopySelection:
        if (transferService_) {
            transferService_->copySelectedToPool();
        } else {
            qWarning() << "DualPaneController: No transfer service, cannot copy";
        }
        break;

    case Action::CopyBack:
        if (transferService_) {
            transferService_->copyBackToSource();
        } else {
            qWarning() << "DualPaneController: No transfer service, cannot copy back";
        }
        break;
    }
}

void DualPaneController::onSourcePathChanged(const QString &path)
{
    if (path.isEmpty()) {
        return;
    }
    lastSourcePath_ = path;
    if (preferences_) {
        preferences_->setLastSourcePath(path);
    }
}
