/**
 * @file mockfileoperations.h
 * @brief Mock file operations for testing.
 *
 * This mock implements IFileOperations and can be injected at runtime for
 * testing components that list directories or copy files.
 */

#ifndef MOCKFILEOPERATIONS_H
#define MOCKFILEOPERATIONS_H

#include <QQueue>
#include <QMap>
#include <QSet>

#include "services/ifileoperations.h"

/**
 * @brief Mock file operations implementing IFileOperations for testing.
 *
 * @par Features:
 * - Queue-based operation processing driven by the test
 * - Configurable directory listings and listing failures
 * - Simulated destination contents, so copies can report conflicts
 * - Per-source copy errors and one-shot mutation errors
 * - Request tracking for test assertions
 *
 * @par Example usage:
 * @code
 * MockFileOperations *mock = new MockFileOperations(this);
 * mock->mockAddExistingPath("/pool/kick.wav");
 *
 * queue->setFileOperations(mock);
 * queue->enqueueBatch(request);
 * queue->flushEventQueue();
 *
 * // Copy of kick.wav reports a conflict
 * mock->mockProcessNextOperation();
 * @endcode
 */
class MockFileOperations : public IFileOperations
{
    Q_OBJECT

public:
    struct CopyRequest {
        QString sourcePath;
        QString destinationDir;
        bool overwrite = false;
    };

    explicit MockFileOperations(QObject *parent = nullptr);
    ~MockFileOperations() override = default;

    /// @name IFileOperations Implementation
    /// @{
    void listDirectory(const QString &path) override;
    void createDirectory(const QString &basePath, const QString &name) override;
    void copyFile(const QString &sourcePath, const QString &destinationDir,
                  bool overwrite) override;
    void renameEntry(const QString &oldPath, const QString &newName) override;
    void deleteEntries(const QStringList &paths) override;
    [[nodiscard]] QString homeDirectory() const override { return homeDirectory_; }
    [[nodiscard]] QString parentDirectory(const QString &path) const override;
    /// @}

    /// @name Mock Control Methods
    /// @{
    void mockSetHomeDirectory(const QString &path) { homeDirectory_ = path; }
    void mockSetDirectoryListing(const QString &path, const QList<FileEntry> &entries);
    void mockSetListingFails(const QString &path, const QString &errorMessage);

    /// @brief Marks a destination path as existing (copies onto it conflict).
    void mockAddExistingPath(const QString &path);

    /// @brief Makes every copy of @p sourcePath fail with an I/O error.
    void mockSetCopyError(const QString &sourcePath, const QString &errorMessage);

    /// @brief Makes overwriting copies of @p sourcePath fail; plain copies still conflict.
    void mockSetOverwriteCopyError(const QString &sourcePath, const QString &errorMessage);

    /// @brief Makes the next rename/delete/create fail with @p errorMessage.
    void mockSetNextMutationFails(const QString &errorMessage);

    /// @brief Size reported through copyProgress() for @p sourcePath.
    void mockSetFileSize(const QString &sourcePath, qint64 size);

    /**
     * @brief Processes one pending operation and emits its signal(s).
     */
    void mockProcessNextOperation();

    /**
     * @brief Processes all pending operations.
     */
    void mockProcessAllOperations();
    /// @}

    /// @name Test Inspection Methods
    /// @{
    [[nodiscard]] int mockPendingOperationCount() const { return pendingOps_.size(); }
    [[nodiscard]] QStringList mockGetListRequests() const { return listRequests_; }
    [[nodiscard]] QList<CopyRequest> mockGetCopyRequests() const { return copyRequests_; }
    [[nodiscard]] QStringList mockGetRenameRequests() const { return renameRequests_; }
    [[nodiscard]] QStringList mockGetDeleteRequests() const { return deleteRequests_; }
    [[nodiscard]] QStringList mockGetCreateRequests() const { return createRequests_; }
    [[nodiscard]] bool mockPathExists(const QString &path) const { return existingPaths_.contains(path); }

    void mockReset();
    /// @}

private:
    struct PendingOp {
        enum Type { List, Copy, Rename, Delete, Create };
        Type type;
        QString path;
        QString argument;     // Destination dir, new name or folder name
        QStringList paths;    // For delete operations
        bool overwrite = false;
    };

    QString homeDirectory_ = QStringLiteral("/home/user");

    QQueue<PendingOp> pendingOps_;
    QMap<QString, QList<FileEntry>> mockListings_;
    QMap<QString, QString> listingErrors_;
    QMap<QString, QString> copyErrors_;
    QMap<QString, QString> overwriteCopyErrors_;
    QMap<QString, qint64> fileSizes_;
    QSet<QString> existingPaths_;

    // Track requests for assertions
    QStringList listRequests_;
    QList<CopyRequest> copyRequests_;
    QStringList renameRequests_;
    QStringList deleteRequests_;
    QStringList createRequests_;

    // Error simulation
    bool nextMutationFails_ = false;
    QString nextMutationError_;
};

#endif // MOCKFILEOPERATIONS_H
