#include "paneproxymodel.h"
#include "panemodel.h"
#include "services/audiometadatareader.h"

#include <QSet>
#include <algorithm>

namespace {

QList<int> sortedValues(const QSet<int> &values)
{
    QList<int> list(values.begin(), values.end());
    std::sort(list.begin(), list.end());
    return list;
}

} // namespace

PaneProxyModel::PaneProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
{
    setDynamicSortFilter(true);
}

void PaneProxyModel::sort(int column, Qt::SortOrder order)
{
    // Keep proxy rows in source order; the pane model does the ordering
    if (PaneModel *pane = paneModel()) {
        pane->sort(column, order);
    }
}

void PaneProxyModel::setNameFilter(const QString &text)
{
    if (nameFilter_ == text) {
        return;
    }
    nameFilter_ = text;
    filtersUpdated();
}

void PaneProxyModel::setHideDirectories(bool hide)
{
    if (hideDirectories_ == hide) {
        return;
    }
    hideDirectories_ = hide;
    filtersUpdated();
}

void PaneProxyModel::setFormatFilter(const QString &format)
{
    if (formatFilter_ == format) {
        return;
    }
    formatFilter_ = format;
    filtersUpdated();
}

void PaneProxyModel::setChannelsFilter(std::optional<int> channels)
{
    if (channelsFilter_ == channels) {
        return;
    }
    channelsFilter_ = channels;
    filtersUpdated();
}

void PaneProxyModel::setBitDepthFilter(std::optional<int> bitDepth)
{
    if (bitDepthFilter_ == bitDepth) {
        return;
    }
    bitDepthFilter_ = bitDepth;
    filtersUpdated();
}

void PaneProxyModel::setSampleRateFilter(std::optional<int> sampleRate)
{
    if (sampleRateFilter_ == sampleRate) {
        return;
    }
    sampleRateFilter_ = sampleRate;
    filtersUpdated();
}

void PaneProxyModel::clearFilters()
{
    if (!hasActiveFilters()) {
        return;
    }
    nameFilter_.clear();
    hideDirectories_ = false;
    formatFilter_.clear();
    channelsFilter_.reset();
    bitDepthFilter_.reset();
    sampleRateFilter_.reset();
    filtersUpdated();
}

bool PaneProxyModel::hasActiveFilters() const
{
    return !nameFilter_.isEmpty() || hideDirectories_ || !formatFilter_.isEmpty()
        || channelsFilter_ || bitDepthFilter_ || sampleRateFilter_;
}

QStringList PaneProxyModel::availableFormats() const
{
    QSet<QString> formats;
    if (PaneModel *pane = paneModel()) {
        for (const FileEntry &entry : pane->listing()) {
            if (entry.isDirectory) {
                continue;
            }
            QString format = AudioMetadataReader::formatForFileName(entry.name);
            if (!format.isEmpty()) {
                formats.insert(format);
            }
        }
    }
    QStringList list(formats.begin(), formats.end());
    list.sort();
    return list;
}

QList<int> PaneProxyModel::availableChannels() const
{
    QSet<int> values;
    if (PaneModel *pane = paneModel()) {
        for (const FileEntry &entry : pane->listing()) {
            if (entry.channels) {
                values.insert(*entry.channels);
            }
        }
    }
    return sortedValues(values);
}

QList<int> PaneProxyModel::availableBitDepths() const
{
    QSet<int> values;
    if (PaneModel *pane = paneModel()) {
        for (const FileEntry &entry : pane->listing()) {
            if (entry.bitDepth) {
                values.insert(*entry.bitDepth);
            }
        }
    }
    return sortedValues(values);
}

QList<int> PaneProxyModel::availableSampleRates() const
{
    QSet<int> values;
    if (PaneModel *pane = paneModel()) {
        for (const FileEntry &entry : pane->listing()) {
            if (entry.sampleRate) {
                values.insert(*entry.sampleRate);
            }
        }
    }
    return sortedValues(values);
}

QString PaneProxyModel::summaryText() const
{
    if (!hasActiveFilters() || !sourceModel()) {
        return QString();
    }
    return tr("Showing %1 of %2").arg(rowCount()).arg(sourceModel()->rowCount());
}

int PaneProxyModel::listingIndex(int proxyRow) const
{
    if (proxyRow < 0 || proxyRow >= rowCount()) {
        return -1;
    }
    return mapToSource(index(proxyRow, 0)).row();
}

int PaneProxyModel::proxyRow(int listingIndex) const
{
    if (!sourceModel() || listingIndex < 0 || listingIndex >= sourceModel()->rowCount()) {
        return -1;
    }
    QModelIndex proxyIdx = mapFromSource(sourceModel()->index(listingIndex, 0));
    return proxyIdx.isValid() ? proxyIdx.row() : -1;
}

bool PaneProxyModel::filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const
{
    Q_UNUSED(sourceParent)

    PaneModel *pane = paneModel();
    if (!pane) {
        return true;
    }

    FileEntry entry = pane->entryAt(sourceRow);

    if (hideDirectories_ && entry.isDirectory) {
        return false;
    }
    if (!nameFilter_.isEmpty() && !entry.name.contains(nameFilter_, Qt::CaseInsensitive)) {
        return false;
    }
    if (!formatFilter_.isEmpty()
        && (entry.isDirectory
            || AudioMetadataReader::formatForFileName(entry.name) != formatFilter_)) {
        return false;
    }
    if (channelsFilter_ && entry.channels != channelsFilter_) {
        return false;
    }
    if (bitDepthFilter_ && entry.bitDepth != bitDepthFilter_) {
        return false;
    }
    if (sampleRateFilter_ && entry.sampleRate != sampleRateFilter_) {
        return false;
    }
    return true;
}

PaneModel *PaneProxyModel::paneModel() const
{
    return qobject_cast<PaneModel*>(sourceModel());
}

void PaneProxyModel::filtersUpdated()
{
    invalidateFilter();
    emit filtersChanged();
}
