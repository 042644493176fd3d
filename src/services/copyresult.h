/**
 * @file copyresult.h
 * @brief Tagged outcome of a single copy operation.
 */

#ifndef COPYRESULT_H
#define COPYRESULT_H

#include <QMetaType>
#include <QString>

/**
 * @brief Result of IFileOperations::copyFile().
 *
 * A name collision at the destination is reported as a distinct kind so
 * callers never need to inspect the error wording.
 */
struct CopyResult {
    enum class Kind {
        Ok,        ///< Copy finished
        Conflict,  ///< Target already exists and overwrite was not requested
        Io         ///< Any other failure; see message
    };

    Kind kind = Kind::Ok;
    QString path;     ///< Resulting path (Ok) or conflicting target (Conflict)
    QString message;  ///< Human readable error text (Conflict and Io)

    [[nodiscard]] bool isOk() const { return kind == Kind::Ok; }
    [[nodiscard]] bool isConflict() const { return kind == Kind::Conflict; }

    static CopyResult ok(const QString &targetPath)
    {
        return CopyResult{Kind::Ok, targetPath, QString()};
    }

    static CopyResult conflict(const QString &targetPath)
    {
        return CopyResult{Kind::Conflict, targetPath,
                          QStringLiteral("File already exists: %1").arg(targetPath)};
    }

    static CopyResult io(const QString &errorMessage)
    {
        return CopyResult{Kind::Io, QString(), errorMessage};
    }
};

Q_DECLARE_METATYPE(CopyResult)

#endif // COPYRESULT_H
