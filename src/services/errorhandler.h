/**
 * @file errorhandler.h
 * @brief Routes listing, copy, mutation and configuration errors to the UI.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QMetaType>
#include <QObject>
#include <QString>

#include <functional>

class QWidget;

enum class ErrorCategory {
    Listing,        ///< Directory could not be read
    Transfer,       ///< A queued copy failed
    FileOperation,  ///< Rename, delete, create folder errors
    Configuration   ///< Pool folder or saved settings are unusable
};

enum class ErrorSeverity {
    Info,      ///< Status bar only, short timeout
    Warning,   ///< Status bar, longer timeout
    Critical   ///< Status bar and a blocking dialog
};

/**
 * @brief One reported error, as logged and as shown to the user.
 */
struct ErrorReport {
    ErrorCategory category = ErrorCategory::Listing;
    ErrorSeverity severity = ErrorSeverity::Warning;
    QString title;
    QString details;

    /// "title: details", or just the title when there are no extra details
    [[nodiscard]] QString displayText() const;

    /// "[Category/SEV] title: details"
    [[nodiscard]] QString logLine() const;
};

Q_DECLARE_METATYPE(ErrorReport)

/**
 * @brief Presents errors in the status bar, the log and (for critical
 * errors) a modal dialog.
 *
 * Listing and copy failures only reach the status bar. Failed mutations
 * (rename, delete, create folder) are critical and block on a dialog that
 * shows the raw error text.
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /// Shows a blocking dialog for a critical error
    using DialogPresenter = std::function<void(const QString &title, const QString &message)>;

    static constexpr int InfoTimeoutMs = 3000;
    static constexpr int WarningTimeoutMs = 5000;

    /**
     * @param parentWidget Parent for the critical error dialog (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QWidget *parentWidget, QObject *parent = nullptr);

    /// Replaces the QMessageBox used for critical errors (tests pass a recorder)
    void setDialogPresenter(DialogPresenter presenter);

    void report(const ErrorReport &error);

    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /// @name Error sources
    /// @{
    void handleListingError(const QString &path, const QString &message);
    void handleTransferFailed(const QString &fileName, const QString &error);

    /**
     * @brief Reports a failed rename, delete or create folder.
     * @param operation "Rename", "Delete" or "Create folder".
     * @param error Shown verbatim in the dialog.
     */
    void handleMutationError(const QString &operation, const QString &error);

    void handleConfigurationError(const QString &message);
    /// @}

    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /// @param timeout Milliseconds; 0 keeps the message until replaced
    void statusMessage(const QString &message, int timeout);

    void errorLogged(const ErrorReport &error);

private:
    void showErrorDialog(const QString &title, const QString &message);

    QWidget *parentWidget_ = nullptr;
    DialogPresenter dialogPresenter_;
};

#endif // ERRORHANDLER_H
