#include "selectionengine.h"

#include <QStringList>
#include <algorithm>

namespace SelectionEngine {

namespace {

SelectionUpdate unchanged(const PaneSnapshot &pane)
{
    SelectionUpdate update;
    update.selection = pane.selection;
    update.cursorIndex = pane.cursorIndex;
    update.lastClickedIndex = pane.lastClickedIndex;
    return update;
}

bool hasCtrl(Qt::KeyboardModifiers modifiers)
{
    // Qt maps Cmd to ControlModifier on macOS
    return modifiers.testFlag(Qt::ControlModifier);
}

bool hasShift(Qt::KeyboardModifiers modifiers)
{
    return modifiers.testFlag(Qt::ShiftModifier);
}

SelectionUpdate moveCursor(const PaneSnapshot &pane, int delta, bool extend)
{
    SelectionUpdate update = unchanged(pane);
    int count = pane.listing.size();
    if (count == 0) {
        update.cursorIndex = 0;
        return update;
    }

    update.cursorIndex = clampCursor(pane.cursorIndex + delta, count);
    const QString &path = pane.listing.at(update.cursorIndex).path;
    if (!extend) {
        update.selection.clear();
    }
    update.selection.insert(path);
    return update;
}

// Enter/Space/Ctrl+Right on a directory under the cursor
bool enterDirectoryAtCursor(const PaneSnapshot &pane, SelectionUpdate &update)
{
    if (pane.cursorIndex < 0 || pane.cursorIndex >= pane.listing.size()) {
        return false;
    }
    const FileEntry &entry = pane.listing.at(pane.cursorIndex);
    if (!entry.isDirectory) {
        return false;
    }
    update.action = Action::Navigate;
    update.navigatePath = entry.path;
    update.cursorIndex = 0;
    return true;
}

} // namespace

SelectionUpdate click(const PaneSnapshot &pane, int index, Qt::KeyboardModifiers modifiers)
{
    SelectionUpdate update = unchanged(pane);
    if (index < 0 || index >= pane.listing.size()) {
        return update;
    }

    const FileEntry &entry = pane.listing.at(index);
    bool ctrl = hasCtrl(modifiers);
    bool shift = hasShift(modifiers);

    if (entry.isDirectory && (pane.side == PaneSide::Destination || (!ctrl && !shift))) {
        update.action = Action::Navigate;
        update.navigatePath = entry.path;
        return update;
    }

    if (shift && pane.lastClickedIndex >= 0 && pane.lastClickedIndex < pane.listing.size()) {
        int first = std::min(pane.lastClickedIndex, index);
        int last = std::max(pane.lastClickedIndex, index);
        for (int i = first; i <= last; ++i) {
            const FileEntry &ranged = pane.listing.at(i);
            if (pane.side == PaneSide::Destination && ranged.isDirectory) {
                continue;
            }
            update.selection.insert(ranged.path);
        }
        update.cursorIndex = index;
    } else if (ctrl) {
        if (update.selection.contains(entry.path)) {
            update.selection.remove(entry.path);
        } else {
            update.selection.insert(entry.path);
        }
        update.lastClickedIndex = index;
        update.cursorIndex = index;
    } else {
        update.selection = {entry.path};
        update.lastClickedIndex = index;
        update.cursorIndex = index;
    }
    return update;
}

SelectionUpdate keyPress(const PaneSnapshot &pane, int key, Qt::KeyboardModifiers modifiers)
{
    SelectionUpdate update = unchanged(pane);
    bool ctrl = hasCtrl(modifiers);
    bool shift = hasShift(modifiers);

    switch (key) {
    case Qt::Key_Up:
        return moveCursor(pane, -1, shift);

    case Qt::Key_Down:
        return moveCursor(pane, 1, shift);

    case Qt::Key_Left:
        if (ctrl) {
            update.action = Action::NavigateParent;
        } else if (pane.sourcePaneOpen) {
            update.action = Action::ActivateSource;
        }
        return update;

    case Qt::Key_Right:
        if (ctrl) {
            enterDirectoryAtCursor(pane, update);
        } else {
            update.action = Action::ActivateDestination;
        }
        return update;

    case Qt::Key_Return:
    case Qt::Key_Enter:
        if (ctrl && !pane.selection.isEmpty()) {
            if (pane.side == PaneSide::Source) {
                update.action = Action::CopySelection;
                return update;
            }
            if (pane.sourcePaneOpen) {
                update.action = Action::CopyBack;
                return update;
            }
        }
        if (!enterDirectoryAtCursor(pane, update)
            && pane.side == PaneSide::Source && !pane.selection.isEmpty()) {
            update.action = Action::CopySelection;
        }
        return update;

    case Qt::Key_Space:
        enterDirectoryAtCursor(pane, update);
        return update;

    case Qt::Key_A:
        if (ctrl) {
            update.selection.clear();
            for (const FileEntry &entry : pane.listing) {
                update.selection.insert(entry.path);
            }
        }
        return update;

    case Qt::Key_Escape:
        update.selection.clear();
        return update;

    case Qt::Key_Backspace:
        update.action = Action::NavigateParent;
        return update;

    default:
        return update;
    }
}

bool handlesKey(int key, Qt::KeyboardModifiers modifiers)
{
    switch (key) {
    case Qt::Key_Up:
    case Qt::Key_Down:
    case Qt::Key_Left:
    case Qt::Key_Right:
    case Qt::Key_Return:
    case Qt::Key_Enter:
    case Qt::Key_Space:
    case Qt::Key_Escape:
    case Qt::Key_Backspace:
        return true;
    case Qt::Key_A:
        return hasCtrl(modifiers);
    default:
        return false;
    }
}

int clampCursor(int cursor, int count)
{
    if (count <= 0) {
        return 0;
    }
    return std::clamp(cursor, 0, count - 1);
}

QSet<QString> pruneSelection(const QSet<QString> &selection, const QList<FileEntry> &listing)
{
    if (selection.isEmpty()) {
        return selection;
    }

    QSet<QString> present;
    for (const FileEntry &entry : listing) {
        if (selection.contains(entry.path)) {
            present.insert(entry.path);
        }
    }
    return present;
}

QStringList orderedSelection(const QSet<QString> &selection, const QList<FileEntry> &listing)
{
    QStringList paths;
    for (const FileEntry &entry : listing) {
        if (selection.contains(entry.path)) {
            paths.append(entry.path);
        }
    }
    return paths;
}

} // namespace SelectionEngine
