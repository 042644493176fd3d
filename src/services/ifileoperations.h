/**
 * @file ifileoperations.h
 * @brief Interface for the file operations the transfer core depends on.
 *
 * This interface allows dependency injection of the filesystem layer,
 * enabling runtime swapping between the local implementation and a mock
 * for testing.
 */

#ifndef IFILEOPERATIONS_H
#define IFILEOPERATIONS_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>

#include "fileentry.h"
#include "copyresult.h"

/**
 * @brief Abstract interface for directory listing and file mutation.
 *
 * All operations except homeDirectory() and parentDirectory() are
 * asynchronous: the call returns immediately and the outcome is delivered
 * by a signal on a later turn of the event loop. Callers must never assume
 * a result arrives before the call returns.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IFileOperations *fileOps = new LocalFileOperations(this);
 *
 * // Test code
 * IFileOperations *fileOps = new MockFileOperations(this);
 *
 * connect(fileOps, &IFileOperations::copyFinished, this, &Foo::onCopyFinished);
 * fileOps->copyFile("/home/me/kick.wav", "/pool/AUDIO", false);
 * @endcode
 */
class IFileOperations : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Kind of mutation reported by operationFinished().
     */
    enum class Mutation {
        Rename,
        Delete,
        CreateDirectory
    };
    Q_ENUM(Mutation)

    /**
     * @brief Constructs a file operations interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IFileOperations(QObject *parent = nullptr) : QObject(parent) {}

    ~IFileOperations() override = default;

    /// @name Directory Operations
    /// @{

    /**
     * @brief Lists the contents of a directory.
     * @param path Absolute directory path.
     *
     * Emits directoryListed() or listingFailed().
     */
    virtual void listDirectory(const QString &path) = 0;

    /**
     * @brief Creates a new directory.
     * @param basePath Directory to create the new folder in.
     * @param name Name of the new folder.
     *
     * Emits operationFinished() with Mutation::CreateDirectory.
     */
    virtual void createDirectory(const QString &basePath, const QString &name) = 0;
    /// @}

    /// @name File Operations
    /// @{

    /**
     * @brief Copies a file or directory into a destination directory.
     * @param sourcePath Absolute path of the file or directory to copy.
     * @param destinationDir Directory to copy into.
     * @param overwrite Replace an existing target of the same name.
     *
     * Emits zero or more copyProgress() signals, then exactly one
     * copyFinished(). A name collision without @p overwrite is reported
     * as CopyResult::Kind::Conflict.
     */
    virtual void copyFile(const QString &sourcePath, const QString &destinationDir,
                          bool overwrite) = 0;

    /**
     * @brief Renames a file or directory in place.
     * @param oldPath Current absolute path.
     * @param newName New name (not a path).
     */
    virtual void renameEntry(const QString &oldPath, const QString &newName) = 0;

    /**
     * @brief Deletes files and directories (directories recursively).
     * @param paths Absolute paths to delete.
     */
    virtual void deleteEntries(const QStringList &paths) = 0;
    /// @}

    /// @name Path Helpers
    /// @{

    /**
     * @brief Returns the user's home directory.
     */
    [[nodiscard]] virtual QString homeDirectory() const = 0;

    /**
     * @brief Returns the parent of a directory.
     * @param path Absolute directory path.
     * @return The parent path, or an empty string at the filesystem root.
     */
    [[nodiscard]] virtual QString parentDirectory(const QString &path) const = 0;
    /// @}

signals:
    /**
     * @brief Emitted when a directory listing completes.
     * @param path The listed directory path.
     * @param entries Entries sorted directories first, then by name.
     */
    void directoryListed(const QString &path, const QList<FileEntry> &entries);

    /**
     * @brief Emitted when a directory could not be listed.
     * @param path The requested directory path.
     * @param message Human-readable error description.
     */
    void listingFailed(const QString &path, const QString &message);

    /**
     * @brief Emitted while a copy is running.
     * @param sourcePath The source being copied.
     * @param bytesCopied Bytes written so far.
     * @param totalBytes Total bytes to write (0 if unknown).
     */
    void copyProgress(const QString &sourcePath, qint64 bytesCopied, qint64 totalBytes);

    /**
     * @brief Emitted once per copyFile() call.
     * @param sourcePath The source that was copied.
     * @param result Tagged outcome of the copy.
     */
    void copyFinished(const QString &sourcePath, const CopyResult &result);

    /**
     * @brief Emitted once per rename, delete or create-directory call.
     * @param mutation Which operation finished.
     * @param path The affected path (new path on success where applicable).
     * @param error Empty on success, otherwise the raw error text.
     */
    void operationFinished(IFileOperations::Mutation mutation, const QString &path,
                           const QString &error);
};

#endif // IFILEOPERATIONS_H
