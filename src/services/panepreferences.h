/**
 * @file panepreferences.h
 * @brief Persisted settings of the two panes and the main window.
 */

#ifndef PANEPREFERENCES_H
#define PANEPREFERENCES_H

#include <QByteArray>
#include <QObject>
#include <QString>

#include "models/fileentrysort.h"
#include "models/selectionengine.h"

/**
 * @brief Pane and window preferences stored with QSettings.
 *
 * Values are read once by loadSettings() and written back immediately by
 * every setter, so a crash never loses more than the last change.
 */
class PanePreferences : public QObject
{
    Q_OBJECT

public:
    struct SortPreference {
        FileEntrySort::Column column = FileEntrySort::Column::Name;
        Qt::SortOrder order = Qt::AscendingOrder;
    };

    explicit PanePreferences(QObject *parent = nullptr);
    ~PanePreferences() override = default;

    void loadSettings();

    [[nodiscard]] QString poolRoot() const { return poolRoot_; }
    void setPoolRoot(const QString &path);

    /// @brief Last directory shown in the source pane (empty if never saved).
    [[nodiscard]] QString lastSourcePath() const { return lastSourcePath_; }
    void setLastSourcePath(const QString &path);

    [[nodiscard]] bool isSourcePaneOpen() const { return sourcePaneOpen_; }
    void setSourcePaneOpen(bool open);

    [[nodiscard]] SortPreference sortPreference(PaneSide side) const;
    void setSortPreference(PaneSide side, FileEntrySort::Column column, Qt::SortOrder order);

    [[nodiscard]] bool hideDirectories(PaneSide side) const;
    void setHideDirectories(PaneSide side, bool hide);

    [[nodiscard]] QByteArray windowGeometry() const { return windowGeometry_; }
    void setWindowGeometry(const QByteArray &geometry);

signals:
    void poolRootChanged(const QString &path);

private:
    [[nodiscard]] static QString paneGroup(PaneSide side);

    QString poolRoot_;
    QString lastSourcePath_;
    bool sourcePaneOpen_ = true;
    SortPreference sourceSort_;
    SortPreference destinationSort_;
    bool sourceHideDirectories_ = false;
    bool destinationHideDirectories_ = false;
    QByteArray windowGeometry_;
};

#endif // PANEPREFERENCES_H
