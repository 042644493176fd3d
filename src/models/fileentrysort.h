/**
 * @file fileentrysort.h
 * @brief Ordering rules shared by directory listings and the pane views.
 */

#ifndef FILEENTRYSORT_H
#define FILEENTRYSORT_H

#include <QList>
#include <QString>
#include <Qt>

#include "services/fileentry.h"

namespace FileEntrySort {

/**
 * @brief Columns a pane can be sorted by.
 */
enum class Column {
    Name,
    Size,
    Format,
    Channels,
    BitDepth,
    SampleRate
};

/**
 * @brief Compares two names case-insensitively using the current locale.
 * @return Negative, zero or positive like QString::compare().
 */
[[nodiscard]] int compareNames(const QString &left, const QString &right);

/**
 * @brief Strict weak ordering for listing entries.
 *
 * Directories always precede files, whatever the column or direction.
 * Within the same kind, entries are ordered by @p column in @p order;
 * missing audio metadata sorts as -1.
 */
[[nodiscard]] bool lessThan(const FileEntry &left, const FileEntry &right,
                            Column column, Qt::SortOrder order);

/**
 * @brief Sorts entries in place (stable).
 */
void sortEntries(QList<FileEntry> &entries, Column column = Column::Name,
                 Qt::SortOrder order = Qt::AscendingOrder);

/// @brief Column name used when persisting sort preferences.
[[nodiscard]] QString columnKey(Column column);

/// @brief Inverse of columnKey(); unknown keys map to Column::Name.
[[nodiscard]] Column columnFromKey(const QString &key);

} // namespace FileEntrySort

#endif // FILEENTRYSORT_H
