/**
 * @file selectionengine.h
 * @brief Pure click and keyboard selection rules for a file pane.
 *
 * Every function takes a snapshot of a pane and an input event and returns
 * the new selection, cursor and last-clicked index together with the
 * action the caller should carry out (navigate, switch pane, copy). Nothing
 * here touches a model, so the rules can be tested without an event loop.
 */

#ifndef SELECTIONENGINE_H
#define SELECTIONENGINE_H

#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <Qt>

#include "services/fileentry.h"

/**
 * @brief Identifies one of the two panes.
 */
enum class PaneSide {
    Source,       ///< Free-roaming pane the user copies from
    Destination   ///< Pane bound to the pool root
};

namespace SelectionEngine {

/**
 * @brief Read-only view of the pane state the rules depend on.
 *
 * Indices refer to the unfiltered listing.
 */
struct PaneSnapshot {
    PaneSide side = PaneSide::Destination;
    QList<FileEntry> listing;
    QSet<QString> selection;
    int cursorIndex = 0;
    int lastClickedIndex = -1;
    bool sourcePaneOpen = true;
};

/**
 * @brief Follow-up the caller performs after applying an update.
 */
enum class Action {
    None,
    Navigate,             ///< Enter SelectionUpdate::navigatePath
    NavigateParent,       ///< Go up one level (subject to the pane's root bound)
    ActivateSource,
    ActivateDestination,
    CopySelection,        ///< Copy the source selection into the destination
    CopyBack              ///< Copy the destination selection into the source directory
};

/**
 * @brief New pane state plus the follow-up action.
 */
struct SelectionUpdate {
    QSet<QString> selection;
    int cursorIndex = 0;
    int lastClickedIndex = -1;
    Action action = Action::None;
    QString navigatePath;  ///< Only set for Action::Navigate
};

/**
 * @brief Applies a mouse click on row @p index.
 *
 * A plain click on a directory navigates into it and leaves the selection
 * alone. In the destination pane any click on a directory navigates. Shift
 * adds the range from the last clicked row (files only in the destination
 * pane) without moving the anchor; Ctrl toggles; a plain click on a file
 * selects only that file.
 */
[[nodiscard]] SelectionUpdate click(const PaneSnapshot &pane, int index,
                                    Qt::KeyboardModifiers modifiers);

/**
 * @brief Applies a key press to the active pane.
 *
 * Unhandled keys return the pane state unchanged with Action::None.
 */
[[nodiscard]] SelectionUpdate keyPress(const PaneSnapshot &pane, int key,
                                       Qt::KeyboardModifiers modifiers);

/// @brief True if @p key is one the pane handles.
[[nodiscard]] bool handlesKey(int key, Qt::KeyboardModifiers modifiers);

/// @brief Clamps a cursor to [0, count - 1], or 0 for an empty listing.
[[nodiscard]] int clampCursor(int cursor, int count);

/// @brief Drops selected paths that are no longer in @p listing.
[[nodiscard]] QSet<QString> pruneSelection(const QSet<QString> &selection,
                                           const QList<FileEntry> &listing);

/// @brief Selected paths in listing order.
[[nodiscard]] QStringList orderedSelection(const QSet<QString> &selection,
                                           const QList<FileEntry> &listing);

} // namespace SelectionEngine

#endif // SELECTIONENGINE_H
