/**
 * @file localfileoperations.h
 * @brief IFileOperations implementation backed by the local filesystem.
 */

#ifndef LOCALFILEOPERATIONS_H
#define LOCALFILEOPERATIONS_H

#include "ifileoperations.h"

/**
 * @brief Local filesystem implementation of IFileOperations.
 *
 * Every asynchronous operation is deferred to the next turn of the event
 * loop and then runs to completion on the calling thread, so results are
 * never delivered before the request returns. Large copies report progress
 * per chunk. An overwrite copies into a hidden ".name.part" sibling first,
 * so a failed copy leaves the existing entry untouched. Linked folders
 * inside a copied folder are skipped.
 */
class LocalFileOperations : public IFileOperations
{
    Q_OBJECT

public:
    static constexpr qint64 CopyChunkSize = 1024 * 1024;
    static constexpr const char *StagingSuffix = ".part";  ///< Hidden sibling used while overwriting

    explicit LocalFileOperations(QObject *parent = nullptr);
    ~LocalFileOperations() override = default;

    void listDirectory(const QString &path) override;
    void createDirectory(const QString &basePath, const QString &name) override;
    void copyFile(const QString &sourcePath, const QString &destinationDir,
                  bool overwrite) override;
    void renameEntry(const QString &oldPath, const QString &newName) override;
    void deleteEntries(const QStringList &paths) override;

    [[nodiscard]] QString homeDirectory() const override;
    [[nodiscard]] QString parentDirectory(const QString &path) const override;

    /// @name Synchronous primitives (used by the deferred operations and tests)
    /// @{
    [[nodiscard]] static QList<FileEntry> readDirectory(const QString &path, QString *error);
    [[nodiscard]] CopyResult copyNow(const QString &sourcePath, const QString &destinationDir,
                                     bool overwrite);
    [[nodiscard]] static QString renameNow(const QString &oldPath, const QString &newName,
                                           QString *newPath);
    [[nodiscard]] static QString deleteNow(const QStringList &paths);
    [[nodiscard]] static QString createDirectoryNow(const QString &basePath, const QString &name,
                                                    QString *newPath);
    /// @}

private:
    bool copySingleFile(const QString &sourcePath, const QString &targetPath,
                        const QString &progressKey, qint64 &copied, qint64 total,
                        QString *error);
    bool copyDirectoryRecursive(const QString &sourceDir, const QString &targetDir,
                                const QString &progressKey, qint64 &copied, qint64 total,
                                QString *error);
    static qint64 totalSize(const QString &path);
    static QString stagingPathFor(const QString &targetPath);
    static bool removePath(const QString &path);
};

#endif // LOCALFILEOPERATIONS_H
