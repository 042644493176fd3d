#include "localfileoperations.h"
#include "audiometadatareader.h"
#include "models/fileentrysort.h"
#include "utils/logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTimer>

LocalFileOperations::LocalFileOperations(QObject *parent)
    : IFileOperations(parent)
{
}

void LocalFileOperations::listDirectory(const QString &path)
{
    QTimer::singleShot(0, this, [this, path]() {
        QString error;
        QList<FileEntry> entries = readDirectory(path, &error);
        if (!error.isEmpty()) {
            emit listingFailed(path, error);
            return;
        }
        emit directoryListed(path, entries);
    });
}

void LocalFileOperations::createDirectory(const QString &basePath, const QString &name)
{
    QTimer::singleShot(0, this, [this, basePath, name]() {
        QString newPath;
        QString error = createDirectoryNow(basePath, name, &newPath);
        emit operationFinished(Mutation::CreateDirectory,
                               error.isEmpty() ? newPath : basePath, error);
    });
}

void LocalFileOperations::copyFile(const QString &sourcePath, const QString &destinationDir,
                                   bool overwrite)
{
    QTimer::singleShot(0, this, [this, sourcePath, destinationDir, overwrite]() {
        CopyResult result = copyNow(sourcePath, destinationDir, overwrite);
        emit copyFinished(sourcePath, result);
    });
}

void LocalFileOperations::renameEntry(const QString &oldPath, const QString &newName)
{
    QTimer::singleShot(0, this, [this, oldPath, newName]() {
        QString newPath;
        QString error = renameNow(oldPath, newName, &newPath);
        emit operationFinished(Mutation::Rename, error.isEmpty() ? newPath : oldPath, error);
    });
}

void LocalFileOperations::deleteEntries(const QStringList &paths)
{
    QTimer::singleShot(0, this, [this, paths]() {
        QString error = deleteNow(paths);
        QString first = paths.isEmpty() ? QString() : paths.first();
        emit operationFinished(Mutation::Delete, first, error);
    });
}

QString LocalFileOperations::homeDirectory() const
{
    return QDir::homePath();
}

QString LocalFileOperations::parentDirectory(const QString &path) const
{
    QString cleaned = QDir::cleanPath(path);
    if (cleaned.isEmpty() || QDir(cleaned).isRoot()) {
        return QString();
    }
    return QFileInfo(cleaned).path();
}

QList<FileEntry> LocalFileOperations::readDirectory(const QString &path, QString *error)
{
    QList<FileEntry> entries;
    QDir dir(path);

    if (!dir.exists()) {
        if (error) {
            *error = tr("Directory does not exist: %1").arg(path);
        }
        return entries;
    }

    if (!QFileInfo(path).isReadable()) {
        if (error) {
            *error = tr("Failed to read directory: %1").arg(path);
        }
        return entries;
    }

    const QFileInfoList infos = dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot);

    for (const QFileInfo &info : infos) {
        if (info.fileName().startsWith('.')) {
            continue;
        }

        FileEntry entry;
        entry.name = info.fileName();
        entry.path = info.absoluteFilePath();
        entry.isDirectory = info.isDir();
        entry.size = entry.isDirectory ? 0 : info.size();

        if (!entry.isDirectory && AudioMetadataReader::isAudioFile(entry.name)) {
            AudioMetadataReader::AudioInfo audio = AudioMetadataReader::readFile(entry.path);
            if (audio.valid) {
                entry.channels = audio.channels;
                entry.bitDepth = audio.bitDepth;
                entry.sampleRate = audio.sampleRate;
            }
        }
        entries.append(entry);
    }

    FileEntrySort::sortEntries(entries);
    LOG_VERBOSE() << "LocalFileOperations: Listed" << entries.size() << "entries in" << path;
    return entries;
}

CopyResult LocalFileOperations::copyNow(const QString &sourcePath, const QString &destinationDir,
                                        bool overwrite)
{
    QFileInfo source(sourcePath);
    if (!source.exists()) {
        return CopyResult::io(tr("Source file does not exist: %1").arg(sourcePath));
    }

    QFileInfo destination(destinationDir);
    if (!destination.exists() || !destination.isDir()) {
        return CopyResult::io(tr("Destination directory does not exist: %1").arg(destinationDir));
    }

    QString sourceAbs = QDir::cleanPath(source.absoluteFilePath());
    QString targetPath = QDir(destination.absoluteFilePath()).filePath(source.fileName());

    if (QDir::cleanPath(targetPath) == sourceAbs) {
        return CopyResult::io(tr("Source and destination are the same file: %1").arg(sourcePath));
    }

    if (source.isDir()) {
        QString destAbs = QDir::cleanPath(destination.absoluteFilePath());
        if (destAbs == sourceAbs || destAbs.startsWith(sourceAbs + '/')) {
            return CopyResult::io(tr("Cannot copy a folder into itself: %1").arg(sourcePath));
        }
    }

    QFileInfo target(targetPath);
    bool replacing = target.exists() || target.isSymLink();
    if (replacing && !overwrite) {
        return CopyResult::conflict(targetPath);
    }

    // Replacements are written beside the target and swapped in afterwards
    QString writePath = replacing ? stagingPathFor(targetPath) : targetPath;
    if (replacing && !removePath(writePath)) {
        return CopyResult::io(tr("Failed to replace existing file: %1").arg(targetPath));
    }

    qint64 total = totalSize(sourceAbs);
    qint64 copied = 0;
    QString error;
    bool ok = source.isDir()
        ? copyDirectoryRecursive(sourceAbs, writePath, sourcePath, copied, total, &error)
        : copySingleFile(sourceAbs, writePath, sourcePath, copied, total, &error);

    if (!ok) {
        qWarning() << "LocalFileOperations: Copy failed:" << error;
        if (!removePath(writePath)) {
            qWarning() << "LocalFileOperations: Could not remove partial copy" << writePath;
        }
        return CopyResult::io(error);
    }

    if (replacing) {
        if (!removePath(targetPath)) {
            if (!removePath(writePath)) {
                qWarning() << "LocalFileOperations: Could not remove partial copy" << writePath;
            }
            return CopyResult::io(tr("Failed to replace existing file: %1").arg(targetPath));
        }
        if (!QDir().rename(writePath, targetPath)) {
            qWarning() << "LocalFileOperations: Rename failed:" << writePath << "->" << targetPath;
            return CopyResult::io(tr("Failed to replace existing file: %1").arg(targetPath));
        }
    }

    LOG_VERBOSE() << "LocalFileOperations: Copied" << sourcePath << "->" << targetPath;
    return CopyResult::ok(targetPath);
}

QString LocalFileOperations::renameNow(const QString &oldPath, const QString &newName,
                                       QString *newPath)
{
    QFileInfo info(oldPath);
    if (!info.exists()) {
        return tr("File does not exist: %1").arg(oldPath);
    }

    QString target = info.dir().filePath(newName);
    if (QFileInfo::exists(target)) {
        return tr("A file or folder with the name '%1' already exists").arg(newName);
    }

    if (!QDir().rename(oldPath, target)) {
        return tr("Failed to rename: %1").arg(oldPath);
    }

    if (newPath) {
        *newPath = target;
    }
    return QString();
}

QString LocalFileOperations::deleteNow(const QStringList &paths)
{
    QStringList failures;

    for (const QString &path : paths) {
        QFileInfo info(path);
        if (!info.exists() && !info.isSymLink()) {
            failures.append(tr("File does not exist: %1").arg(path));
            continue;
        }

        bool removed = info.isDir() && !info.isSymLink()
            ? QDir(path).removeRecursively()
            : QFile::remove(path);
        if (!removed) {
            failures.append(tr("Failed to delete: %1").arg(path));
        }
    }

    return failures.join('\n');
}

QString LocalFileOperations::createDirectoryNow(const QString &basePath, const QString &name,
                                                QString *newPath)
{
    QString target = QDir(basePath).filePath(name);
    if (QFileInfo::exists(target)) {
        return tr("Directory already exists: %1").arg(target);
    }

    if (!QDir().mkpath(target)) {
        return tr("Failed to create directory: %1").arg(target);
    }

    if (newPath) {
        *newPath = target;
    }
    return QString();
}

bool LocalFileOperations::copySingleFile(const QString &sourcePath, const QString &targetPath,
                                         const QString &progressKey, qint64 &copied, qint64 total,
                                         QString *error)
{
    QFile in(sourcePath);
    if (!in.open(QIODevice::ReadOnly)) {
        *error = tr("Failed to open %1: %2").arg(sourcePath, in.errorString());
        return false;
    }

    QFile out(targetPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        *error = tr("Failed to create %1: %2").arg(targetPath, out.errorString());
        return false;
    }

    while (!in.atEnd()) {
        QByteArray chunk = in.read(CopyChunkSize);
        if (chunk.isEmpty() && in.error() != QFileDevice::NoError) {
            *error = tr("Failed to read %1: %2").arg(sourcePath, in.errorString());
            out.close();
            out.remove();
            return false;
        }
        if (out.write(chunk) != chunk.size()) {
            *error = tr("Failed to write %1: %2").arg(targetPath, out.errorString());
            out.close();
            out.remove();
            return false;
        }
        copied += chunk.size();
        emit copyProgress(progressKey, copied, total);
    }

    out.close();
    out.setPermissions(in.permissions());
    return true;
}

bool LocalFileOperations::copyDirectoryRecursive(const QString &sourceDir, const QString &targetDir,
                                                 const QString &progressKey, qint64 &copied,
                                                 qint64 total, QString *error)
{
    if (!QDir().mkpath(targetDir)) {
        *error = tr("Failed to create directory: %1").arg(targetDir);
        return false;
    }

    QDir dir(sourceDir);
    const QFileInfoList infos = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System);

    for (const QFileInfo &info : infos) {
        // Linked folders may point back up the tree
        if (info.isSymLink() && info.isDir()) {
            LOG_VERBOSE() << "LocalFileOperations: Skipping linked folder"
                          << info.absoluteFilePath();
            continue;
        }

        QString childTarget = QDir(targetDir).filePath(info.fileName());
        bool ok = info.isDir()
            ? copyDirectoryRecursive(info.absoluteFilePath(), childTarget, progressKey,
                                     copied, total, error)
            : copySingleFile(info.absoluteFilePath(), childTarget, progressKey,
                             copied, total, error);
        if (!ok) {
            return false;
        }
    }
    return true;
}

QString LocalFileOperations::stagingPathFor(const QString &targetPath)
{
    QFileInfo info(targetPath);
    return info.dir().filePath(QStringLiteral(".") + info.fileName() + StagingSuffix);
}

bool LocalFileOperations::removePath(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        return true;
    }
    return info.isDir() && !info.isSymLink()
        ? QDir(path).removeRecursively()
        : QFile::remove(path);
}

qint64 LocalFileOperations::totalSize(const QString &path)
{
    QFileInfo info(path);
    if (!info.isDir()) {
        return info.size();
    }

    qint64 total = 0;
    QDirIterator it(path, QDir::Files | QDir::Hidden | QDir::System,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        total += it.fileInfo().size();
    }
    return total;
}
