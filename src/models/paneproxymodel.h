#ifndef PANEPROXYMODEL_H
#define PANEPROXYMODEL_H

#include <QSortFilterProxyModel>
#include <QStringList>
#include <optional>

class PaneModel;

/**
 * Filtering view over a PaneModel:
 * - Name substring filter (case-insensitive)
 * - Optional hiding of directories
 * - Exact-match filters on format, channel count, bit depth and sample rate
 *
 * All active filters must match (AND). An entry without the metadata a
 * filter asks for (a directory, an unreadable header) never matches it.
 *
 * The proxy never reorders rows itself. sort() is forwarded to the
 * PaneModel so that the listing, the cursor and shift-click ranges share
 * the order the view shows.
 */
class PaneProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit PaneProxyModel(QObject *parent = nullptr);

    void sort(int column, Qt::SortOrder order = Qt::AscendingOrder) override;

    void setNameFilter(const QString &text);
    [[nodiscard]] QString nameFilter() const { return nameFilter_; }

    void setHideDirectories(bool hide);
    [[nodiscard]] bool hideDirectories() const { return hideDirectories_; }

    void setFormatFilter(const QString &format);
    [[nodiscard]] QString formatFilter() const { return formatFilter_; }

    void setChannelsFilter(std::optional<int> channels);
    [[nodiscard]] std::optional<int> channelsFilter() const { return channelsFilter_; }

    void setBitDepthFilter(std::optional<int> bitDepth);
    [[nodiscard]] std::optional<int> bitDepthFilter() const { return bitDepthFilter_; }

    void setSampleRateFilter(std::optional<int> sampleRate);
    [[nodiscard]] std::optional<int> sampleRateFilter() const { return sampleRateFilter_; }

    /// @brief Removes every filter (hide-directories included).
    void clearFilters();
    [[nodiscard]] bool hasActiveFilters() const;

    /// @name Distinct values in the unfiltered listing, for filter choices
    /// @{
    [[nodiscard]] QStringList availableFormats() const;
    [[nodiscard]] QList<int> availableChannels() const;
    [[nodiscard]] QList<int> availableBitDepths() const;
    [[nodiscard]] QList<int> availableSampleRates() const;
    /// @}

    /// @brief "Showing X of Y", or an empty string without active filters.
    [[nodiscard]] QString summaryText() const;

    /// @brief Source row (listing index) for a proxy row, or -1.
    [[nodiscard]] int listingIndex(int proxyRow) const;

    /// @brief Proxy row for a listing index, or -1 if filtered out.
    [[nodiscard]] int proxyRow(int listingIndex) const;

signals:
    void filtersChanged();

protected:
    bool filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const override;

private:
    [[nodiscard]] PaneModel *paneModel() const;
    void filtersUpdated();

    QString nameFilter_;
    bool hideDirectories_ = false;
    QString formatFilter_;
    std::optional<int> channelsFilter_;
    std::optional<int> bitDepthFilter_;
    std::optional<int> sampleRateFilter_;
};

#endif // PANEPROXYMODEL_H
