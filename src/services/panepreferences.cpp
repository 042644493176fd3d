#include "panepreferences.h"

#include <QDir>
#include <QSettings>

PanePreferences::PanePreferences(QObject *parent)
    : QObject(parent)
{
}

void PanePreferences::loadSettings()
{
    QSettings settings;
    poolRoot_ = settings.value("pool/root").toString();
    lastSourcePath_ = settings.value("directories/source").toString();
    sourcePaneOpen_ = settings.value("panes/sourceOpen", true).toBool();
    windowGeometry_ = settings.value("window/geometry").toByteArray();

    for (PaneSide side : {PaneSide::Source, PaneSide::Destination}) {
        QString group = paneGroup(side);
        SortPreference sort;
        sort.column = FileEntrySort::columnFromKey(
            settings.value(group + "/sortColumn", "name").toString());
        sort.order = settings.value(group + "/sortOrder", "asc").toString() == "desc"
            ? Qt::DescendingOrder : Qt::AscendingOrder;
        bool hide = settings.value(group + "/hideDirectories", false).toBool();

        if (side == PaneSide::Source) {
            sourceSort_ = sort;
            sourceHideDirectories_ = hide;
        } else {
            destinationSort_ = sort;
            destinationHideDirectories_ = hide;
        }
    }
}

void PanePreferences::setPoolRoot(const QString &path)
{
    QString cleaned = path.isEmpty() ? QString() : QDir::cleanPath(path);
    if (cleaned == poolRoot_) {
        return;
    }
    poolRoot_ = cleaned;

    QSettings settings;
    settings.setValue("pool/root", poolRoot_);
    emit poolRootChanged(poolRoot_);
}

void PanePreferences::setLastSourcePath(const QString &path)
{
    if (path.isEmpty() || path == lastSourcePath_) {
        return;
    }
    lastSourcePath_ = path;

    QSettings settings;
    settings.setValue("directories/source", lastSourcePath_);
}

void PanePreferences::setSourcePaneOpen(bool open)
{
    sourcePaneOpen_ = open;

    QSettings settings;
    settings.setValue("panes/sourceOpen", open);
}

PanePreferences::SortPreference PanePreferences::sortPreference(PaneSide side) const
{
    return side == PaneSide::Source ? sourceSort_ : destinationSort_;
}

void PanePreferences::setSortPreference(PaneSide side, FileEntrySort::Column column,
                                        Qt::SortOrder order)
{
    SortPreference &sort = side == PaneSide::Source ? sourceSort_ : destinationSort_;
    sort.column = column;
    sort.order = order;

    QSettings settings;
    settings.setValue(paneGroup(side) + "/sortColumn", FileEntrySort::columnKey(column));
    settings.setValue(paneGroup(side) + "/sortOrder",
                      order == Qt::DescendingOrder ? "desc" : "asc");
}

bool PanePreferences::hideDirectories(PaneSide side) const
{
    return side == PaneSide::Source ? sourceHideDirectories_ : destinationHideDirectories_;
}

void PanePreferences::setHideDirectories(PaneSide side, bool hide)
{
    if (side == PaneSide::Source) {
        sourceHideDirectories_ = hide;
    } else {
        destinationHideDirectories_ = hide;
    }

    QSettings settings;
    settings.setValue(paneGroup(side) + "/hideDirectories", hide);
}

void PanePreferences::setWindowGeometry(const QByteArray &geometry)
{
    windowGeometry_ = geometry;

    QSettings settings;
    settings.setValue("window/geometry", geometry);
}

QString PanePreferences::paneGroup(PaneSide side)
{
    return side == PaneSide::Source ? QStringLiteral("panes/source")
                                    : QStringLiteral("panes/destination");
}
