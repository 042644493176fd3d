#include "pathnavigationwidget.h"

#include <QDir>
#include <QHBoxLayout>
#include <QToolButton>

PathNavigationWidget::PathNavigationWidget(const QString &prefix, QWidget *parent)
    : QWidget(parent)
    , prefix_(prefix)
{
    auto *layout = new QHBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(6);

    upButton_ = new QPushButton(tr("\u2191 Up"));
    upButton_->setToolTip(tr("Go to parent folder (Backspace)"));
    upButton_->setFocusPolicy(Qt::NoFocus);
    connect(upButton_, &QPushButton::clicked, this, &PathNavigationWidget::upClicked);
    layout->addWidget(upButton_);

    prefixLabel_ = new QLabel(prefix_);
    layout->addWidget(prefixLabel_);

    crumbContainer_ = new QWidget();
    crumbLayout_ = new QHBoxLayout(crumbContainer_);
    crumbLayout_->setContentsMargins(4, 1, 4, 1);
    crumbLayout_->setSpacing(0);
    layout->addWidget(crumbContainer_, 1);

    loadingLabel_ = new QLabel(tr("Loading..."));
    loadingLabel_->setVisible(false);
    layout->addWidget(loadingLabel_);

    setStyleBlue();
    setPath(QString());
}

void PathNavigationWidget::setPath(const QString &path)
{
    currentPath_ = path;
    crumbContainer_->setToolTip(QDir::toNativeSeparators(path));
    rebuildCrumbs();
}

void PathNavigationWidget::setRoot(const QString &root, const QString &rootLabel)
{
    QString cleaned = root.isEmpty() ? QString() : QDir::cleanPath(root);
    if (cleaned == root_ && rootLabel == rootLabel_) {
        return;
    }
    root_ = cleaned;
    rootLabel_ = rootLabel;
    rebuildCrumbs();
}

void PathNavigationWidget::setUpEnabled(bool enabled)
{
    upButton_->setEnabled(enabled);
}

void PathNavigationWidget::setLoading(bool loading)
{
    loadingLabel_->setVisible(loading);
}

void PathNavigationWidget::setStyleBlue()
{
    applyCrumbColors("#0066cc", "#f0f8ff");
}

void PathNavigationWidget::setStyleGreen()
{
    applyCrumbColors("#006600", "#f0fff0");
}

void PathNavigationWidget::applyCrumbColors(const QString &text, const QString &background)
{
    crumbContainer_->setStyleSheet(
        QString("QWidget { color: %1; background-color: %2; border-radius: 3px; }"
                "QToolButton { border: none; padding: 1px 3px; }")
            .arg(text, background));
}

void PathNavigationWidget::rebuildCrumbs()
{
    // Crumbs are rebuilt from inside a crumb's own clicked() signal
    while (QLayoutItem *item = crumbLayout_->takeAt(0)) {
        if (QWidget *widget = item->widget()) {
            widget->hide();
            widget->deleteLater();
        }
        delete item;
    }

    const QList<Crumb> crumbs = crumbsFor(currentPath_, root_, rootLabel_);
    if (crumbs.isEmpty()) {
        crumbLayout_->addWidget(new QLabel(tr("(none)")));
        crumbLayout_->addStretch();
        return;
    }

    for (int i = 0; i < crumbs.size(); ++i) {
        if (i > 0 && crumbs.at(i - 1).label != "/") {
            crumbLayout_->addWidget(new QLabel("/"));
        }

        auto *button = new QToolButton();
        button->setText(crumbs.at(i).label);
        button->setAutoRaise(true);
        button->setFocusPolicy(Qt::NoFocus);

        bool isCurrent = i == crumbs.size() - 1;
        if (isCurrent) {
            QFont font = button->font();
            font.setBold(true);
            button->setFont(font);
            button->setEnabled(false);
        } else {
            QString target = crumbs.at(i).path;
            connect(button, &QToolButton::clicked, this, [this, target]() {
                emit pathRequested(target);
            });
        }
        crumbLayout_->addWidget(button);
    }
    crumbLayout_->addStretch();
}

QList<PathNavigationWidget::Crumb> PathNavigationWidget::crumbsFor(const QString &path,
                                                                   const QString &root,
                                                                   const QString &rootLabel)
{
    QList<Crumb> crumbs;
    if (path.isEmpty()) {
        return crumbs;
    }

    QString cleaned = QDir::cleanPath(path);
    QString home = QDir::homePath();
    QString base;

    if (!root.isEmpty() && (cleaned == root || cleaned.startsWith(root + '/'))) {
        base = root;
        crumbs.append({rootLabel, root});
    } else if (cleaned == home || cleaned.startsWith(home + '/')) {
        base = home;
        crumbs.append({QStringLiteral("~"), home});
    } else if (cleaned.startsWith('/')) {
        base = QStringLiteral("/");
        crumbs.append({base, base});
    } else {
        // Drive letter root such as "C:/"
        base = cleaned.section('/', 0, 0) + '/';
        crumbs.append({base.chopped(1), base});
    }

    QString current = base;
    const QStringList parts = cleaned.mid(base.length()).split('/', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        current = current.endsWith('/') ? current + part : current + '/' + part;
        crumbs.append({part, current});
    }
    return crumbs;
}
