#ifndef FILEENTRY_H
#define FILEENTRY_H

#include <QList>
#include <QMetaType>
#include <QString>
#include <optional>

/**
 * @brief Represents a single entry in a local directory listing.
 *
 * Audio metadata is only present for files whose header could be read
 * (WAV and AIFF); it is empty for directories and other files.
 */
struct FileEntry {
    QString name;                      ///< File or directory name
    QString path;                      ///< Absolute path, unique within a listing
    bool isDirectory = false;          ///< True if this entry is a directory
    qint64 size = 0;                   ///< Size in bytes (0 for directories)
    std::optional<int> channels;       ///< Channel count
    std::optional<int> bitDepth;       ///< Bits per sample
    std::optional<int> sampleRate;     ///< Sample rate in Hz
};

Q_DECLARE_METATYPE(FileEntry)

#endif // FILEENTRY_H
