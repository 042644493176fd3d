#ifndef OVERWRITEDIALOG_H
#define OVERWRITEDIALOG_H

#include <QString>

#include "models/conflictresolver.h"

class QWidget;

/**
 * @brief Modal prompt shown when a copy would replace an existing file.
 *
 * Offers Overwrite, Overwrite All, Skip, Skip All and Cancel Import.
 * Dismissing the dialog (Escape or the close button) counts as Cancel Import.
 */
class OverwriteDialog
{
public:
    [[nodiscard]] static OverwriteResponse ask(QWidget *parent, const QString &fileName);
};

#endif // OVERWRITEDIALOG_H
