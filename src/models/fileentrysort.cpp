#include "fileentrysort.h"
#include "services/audiometadatareader.h"

#include <QCollator>
#include <QLocale>
#include <algorithm>

namespace FileEntrySort {

namespace {

QCollator makeCollator()
{
    QCollator collator{QLocale()};
    collator.setCaseSensitivity(Qt::CaseInsensitive);
    collator.setNumericMode(false);
    return collator;
}

// Returns <0, 0, >0 for the column value only; direction is applied by the caller
int compareColumn(const FileEntry &left, const FileEntry &right, Column column)
{
    switch (column) {
    case Column::Name:
        return compareNames(left.name, right.name);
    case Column::Size:
        return left.size < right.size ? -1 : (left.size > right.size ? 1 : 0);
    case Column::Format:
        return QString::compare(AudioMetadataReader::formatForFileName(left.name),
                                AudioMetadataReader::formatForFileName(right.name));
    case Column::Channels: {
        int a = left.channels.value_or(-1);
        int b = right.channels.value_or(-1);
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    case Column::BitDepth: {
        int a = left.bitDepth.value_or(-1);
        int b = right.bitDepth.value_or(-1);
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    case Column::SampleRate: {
        int a = left.sampleRate.value_or(-1);
        int b = right.sampleRate.value_or(-1);
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    }
    return 0;
}

} // namespace

int compareNames(const QString &left, const QString &right)
{
    static const QCollator collator = makeCollator();
    return collator.compare(left, right);
}

bool lessThan(const FileEntry &left, const FileEntry &right,
              Column column, Qt::SortOrder order)
{
    if (left.isDirectory != right.isDirectory) {
        return left.isDirectory;
    }

    int cmp = compareColumn(left, right, column);
    return order == Qt::AscendingOrder ? cmp < 0 : cmp > 0;
}

void sortEntries(QList<FileEntry> &entries, Column column, Qt::SortOrder order)
{
    std::stable_sort(entries.begin(), entries.end(),
                     [column, order](const FileEntry &a, const FileEntry &b) {
        return lessThan(a, b, column, order);
    });
}

QString columnKey(Column column)
{
    switch (column) {
    case Column::Name: return QStringLiteral("name");
    case Column::Size: return QStringLiteral("size");
    case Column::Format: return QStringLiteral("format");
    case Column::Channels: return QStringLiteral("channels");
    case Column::BitDepth: return QStringLiteral("bitdepth");
    case Column::SampleRate: return QStringLiteral("samplerate");
    }
    return QStringLiteral("name");
}

Column columnFromKey(const QString &key)
{
    if (key == QLatin1String("size")) {
        return Column::Size;
    }
    if (key == QLatin1String("format")) {
        return Column::Format;
    }
    if (key == QLatin1String("channels")) {
        return Column::Channels;
    }
    if (key == QLatin1String("bitdepth")) {
        return Column::BitDepth;
    }
    if (key == QLatin1String("samplerate")) {
        return Column::SampleRate;
    }
    return Column::Name;
}

} // namespace FileEntrySort
