/**
 * @file dualpanecontroller.h
 * @brief Coordinates the source and destination panes.
 */

#ifndef DUALPANECONTROLLER_H
#define DUALPANECONTROLLER_H

#include <QObject>
#include <QPointer>
#include <QString>

#include "models/selectionengine.h"

class ErrorHandler;
class IFileOperations;
class PaneModel;
class PanePreferences;
class TransferService;

/**
 * @brief Owns both panes and routes clicks and keys to them.
 *
 * The destination pane is bound to the pool root; the source pane roams
 * freely and can be closed. Keyboard input always goes to the active pane,
 * which starts out as the destination. While the overwrite dialog is open
 * keyboard input is ignored.
 *
 * Click and key rules live in SelectionEngine; this class applies the
 * resulting selection and carries out the follow-up action.
 */
class DualPaneController : public QObject
{
    Q_OBJECT

public:
    explicit DualPaneController(QObject *parent = nullptr);
    ~DualPaneController() override;

    void setFileOperations(IFileOperations *fileOps);
    void setTransferService(TransferService *service);
    void setErrorHandler(ErrorHandler *handler);

    /**
     * @brief Applies stored sort order and source pane state.
     *
     * Call before start(). Later path and sort changes are written back.
     */
    void setPreferences(PanePreferences *preferences);

    [[nodiscard]] PaneModel *sourcePane() const { return source_; }
    [[nodiscard]] PaneModel *destinationPane() const { return destination_; }
    [[nodiscard]] PaneModel *pane(PaneSide side) const;

    /**
     * @brief Binds the destination pane to @p root and lists it.
     */
    void setPoolRoot(const QString &root);
    [[nodiscard]] QString poolRoot() const;

    /**
     * @brief Loads the source pane.
     *
     * Uses the stored source path when there is one, otherwise the home
     * directory. Does nothing while the source pane is closed.
     */
    void start();

    /// @name Active pane
    /// @{
    [[nodiscard]] PaneSide activePane() const { return activePane_; }

    /// @brief Activating the source pane is refused while it is closed.
    void setActivePane(PaneSide side);
    /// @}

    /// @name Source pane
    /// @{
    [[nodiscard]] bool isSourcePaneOpen() const { return sourcePaneOpen_; }

    /**
     * @brief Closes or reopens the source pane.
     *
     * Closing forgets the pane's listing and selection and makes the
     * destination active. Reopening lists the last source directory.
     */
    void toggleSourcePane();
    /// @}

    /// @name Input
    /// @{

    /**
     * @brief Routes a key press to the active pane.
     * @return True if the key was consumed.
     */
    bool handleKey(int key, Qt::KeyboardModifiers modifiers);

    /**
     * @brief Applies a click on @p row of @p side and makes that pane active.
     * @param row Index into the unfiltered listing.
     */
    void handleClick(PaneSide side, int row, Qt::KeyboardModifiers modifiers);

    /// @brief Suppresses keyboard handling while a modal dialog is shown.
    void setDialogOpen(bool open) { dialogOpen_ = open; }
    [[nodiscard]] bool isDialogOpen() const { return dialogOpen_; }
    /// @}

signals:
    void activePaneChanged(PaneSide side);
    void sourcePaneToggled(bool open);

private slots:
    void onSourcePathChanged(const QString &path);

private:
    void apply(PaneModel *model, const SelectionEngine::SelectionUpdate &update);
    void openSourcePane();

    PaneModel *source_ = nullptr;
    PaneModel *destination_ = nullptr;

    QPointer<IFileOperations> fileOps_;
    QPointer<TransferService> transferService_;
    QPointer<PanePreferences> preferences_;

    PaneSide activePane_ = PaneSide::Destination;
    bool sourcePaneOpen_ = true;
    bool dialogOpen_ = false;
    QString lastSourcePath_;
};

#endif // DUALPANECONTROLLER_H
