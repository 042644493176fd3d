#ifndef PATHNAVIGATIONWIDGET_H
#define PATHNAVIGATIONWIDGET_H

#include <QWidget>
#include <QPushButton>
#include <QLabel>
#include <QList>

class QHBoxLayout;

/**
 * @brief Up button plus a clickable breadcrumb of the pane's directory.
 *
 * When a root is set (the pool folder) the breadcrumb starts at the root
 * under a short label, so the user never sees or clicks above it.
 */
class PathNavigationWidget : public QWidget
{
    Q_OBJECT

public:
    struct Crumb {
        QString label;
        QString path;
    };

    explicit PathNavigationWidget(const QString &prefix, QWidget *parent = nullptr);

    void setPath(const QString &path);
    [[nodiscard]] QString path() const { return currentPath_; }

    void setRoot(const QString &root, const QString &rootLabel);
    void setUpEnabled(bool enabled);
    void setLoading(bool loading);

    void setStyleBlue();
    void setStyleGreen();

    /// @brief Splits @p path into crumbs starting at @p root, the home folder or "/".
    [[nodiscard]] static QList<Crumb> crumbsFor(const QString &path,
                                                const QString &root,
                                                const QString &rootLabel);

signals:
    void upClicked();
    void pathRequested(const QString &path);

private:
    void rebuildCrumbs();
    void applyCrumbColors(const QString &text, const QString &background);

    QString prefix_;
    QString currentPath_;
    QString root_;
    QString rootLabel_;

    QPushButton *upButton_ = nullptr;
    QLabel *prefixLabel_ = nullptr;
    QWidget *crumbContainer_ = nullptr;
    QHBoxLayout *crumbLayout_ = nullptr;
    QLabel *loadingLabel_ = nullptr;
};

#endif // PATHNAVIGATIONWIDGET_H
