#include "overwritedialog.h"

#include <QMessageBox>
#include <QPushButton>

OverwriteResponse OverwriteDialog::ask(QWidget *parent, const QString &fileName)
{
    QMessageBox msgBox(parent);
    msgBox.setWindowTitle(QMessageBox::tr("File Already Exists"));
    msgBox.setText(QMessageBox::tr("The file '%1' already exists in the destination.\n\n"
                                   "Do you want to overwrite it?").arg(fileName));
    msgBox.setIcon(QMessageBox::Question);

    QPushButton *overwriteButton = msgBox.addButton(QMessageBox::tr("Overwrite"), QMessageBox::AcceptRole);
    QPushButton *overwriteAllButton = msgBox.addButton(QMessageBox::tr("Overwrite All"), QMessageBox::AcceptRole);
    QPushButton *skipButton = msgBox.addButton(QMessageBox::tr("Skip"), QMessageBox::RejectRole);
    QPushButton *skipAllButton = msgBox.addButton(QMessageBox::tr("Skip All"), QMessageBox::RejectRole);
    QPushButton *cancelButton = msgBox.addButton(QMessageBox::tr("Cancel Import"), QMessageBox::RejectRole);

    msgBox.setDefaultButton(skipButton);
    msgBox.setEscapeButton(cancelButton);
    msgBox.exec();

    QAbstractButton *clicked = msgBox.clickedButton();

    if (clicked == overwriteButton) {
        return OverwriteResponse::Overwrite;
    }
    if (clicked == overwriteAllButton) {
        return OverwriteResponse::OverwriteAll;
    }
    if (clicked == skipButton) {
        return OverwriteResponse::Skip;
    }
    if (clicked == skipAllButton) {
        return OverwriteResponse::SkipAll;
    }
    // Cancel Import clicked OR dialog dismissed
    return OverwriteResponse::Cancel;
}
