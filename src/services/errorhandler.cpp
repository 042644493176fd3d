#include "errorhandler.h"

#include <QDebug>
#include <QMessageBox>

QString ErrorReport::displayText() const
{
    if (details.isEmpty() || details == title) {
        return title;
    }
    return QStringLiteral("%1: %2").arg(title, details);
}

QString ErrorReport::logLine() const
{
    return QStringLiteral("[%1/%2] %3")
        .arg(ErrorHandler::categoryToString(category),
             ErrorHandler::severityToString(severity),
             displayText());
}

ErrorHandler::ErrorHandler(QWidget *parentWidget, QObject *parent)
    : QObject(parent)
    , parentWidget_(parentWidget)
{
}

void ErrorHandler::setDialogPresenter(DialogPresenter presenter)
{
    dialogPresenter_ = std::move(presenter);
}

void ErrorHandler::report(const ErrorReport &error)
{
    switch (error.severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << error.logLine();
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << error.logLine();
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << error.logLine();
        break;
    }
    emit errorLogged(error);

    emit statusMessage(error.displayText(), timeoutForSeverity(error.severity));

    if (error.severity == ErrorSeverity::Critical) {
        showErrorDialog(error.title, error.details.isEmpty() ? error.title : error.details);
    }
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    report(ErrorReport{category, severity, title, details});
}

void ErrorHandler::handleListingError(const QString &path, const QString &message)
{
    handleError(ErrorCategory::Listing, ErrorSeverity::Warning,
                tr("Could not list %1").arg(path), message);
}

void ErrorHandler::handleTransferFailed(const QString &fileName, const QString &error)
{
    handleError(ErrorCategory::Transfer, ErrorSeverity::Warning,
                tr("Copy failed: %1").arg(fileName), error);
}

void ErrorHandler::handleMutationError(const QString &operation, const QString &error)
{
    handleError(ErrorCategory::FileOperation, ErrorSeverity::Critical,
                tr("%1 failed").arg(operation), error);
}

void ErrorHandler::handleConfigurationError(const QString &message)
{
    handleError(ErrorCategory::Configuration, ErrorSeverity::Warning,
                tr("Configuration"), message);
}

void ErrorHandler::showErrorDialog(const QString &title, const QString &message)
{
    if (dialogPresenter_) {
        dialogPresenter_(title, message);
        return;
    }
    QMessageBox::critical(parentWidget_, title, message);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return InfoTimeoutMs;
    case ErrorSeverity::Warning:
        return WarningTimeoutMs;
    case ErrorSeverity::Critical:
        return 0;
    }
    return WarningTimeoutMs;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Listing:
        return QStringLiteral("Listing");
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::FileOperation:
        return QStringLiteral("FileOp");
    case ErrorCategory::Configuration:
        return QStringLiteral("Config");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
