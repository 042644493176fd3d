#include <QtTest>
#include <QSignalSpy>
#include <QWidget>

#include "services/errorhandler.h"

class TestErrorHandler : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testReportFormatsStatusMessage();
    void testTitleOnlyReport();
    void testSeverityTimeouts_data();
    void testSeverityTimeouts();
    void testLogLinePrefix();

    void testListingErrorIsWarning();
    void testTransferFailedCarriesFileName();
    void testMutationErrorShowsDialog();
    void testMutationErrorWithoutDetails();
    void testConfigurationError();
    void testNonCriticalNeverShowsDialog();

private:
    struct DialogCall {
        QString title;
        QString message;
    };

    QWidget *parentWidget_ = nullptr;
    ErrorHandler *handler_ = nullptr;
    QList<DialogCall> dialogs_;
};

void TestErrorHandler::init()
{
    parentWidget_ = new QWidget();
    handler_ = new ErrorHandler(parentWidget_, this);
    dialogs_.clear();
    handler_->setDialogPresenter([this](const QString &title, const QString &message) {
        dialogs_.append({title, message});
    });
}

void TestErrorHandler::cleanup()
{
    delete handler_;
    handler_ = nullptr;
    delete parentWidget_;
    parentWidget_ = nullptr;
}

void TestErrorHandler::testReportFormatsStatusMessage()
{
    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);

    handler_->handleError(ErrorCategory::Transfer, ErrorSeverity::Info,
                          "Copy failed: kick.wav", "Disk full");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("Copy failed: kick.wav: Disk full"));
}

void TestErrorHandler::testTitleOnlyReport()
{
    ErrorReport report{ErrorCategory::Listing, ErrorSeverity::Info, "Nothing here", QString()};
    QCOMPARE(report.displayText(), QString("Nothing here"));

    report.details = "Nothing here";
    QCOMPARE(report.displayText(), QString("Nothing here"));
}

void TestErrorHandler::testSeverityTimeouts_data()
{
    QTest::addColumn<ErrorSeverity>("severity");
    QTest::addColumn<int>("timeout");

    QTest::newRow("info") << ErrorSeverity::Info << 3000;
    QTest::newRow("warning") << ErrorSeverity::Warning << 5000;
    QTest::newRow("critical") << ErrorSeverity::Critical << 0;
}

void TestErrorHandler::testSeverityTimeouts()
{
    QFETCH(ErrorSeverity, severity);
    QFETCH(int, timeout);

    QSignalSpy spy(handler_, &ErrorHandler::statusMessage);
    handler_->handleError(ErrorCategory::FileOperation, severity, "Message");

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(1).toInt(), timeout);
}

void TestErrorHandler::testLogLinePrefix()
{
    ErrorReport report{ErrorCategory::FileOperation, ErrorSeverity::Warning,
                       "Rename failed", "Permission denied"};
    QCOMPARE(report.logLine(), QString("[FileOp/WARN] Rename failed: Permission denied"));

    report.category = ErrorCategory::Configuration;
    report.severity = ErrorSeverity::Critical;
    QCOMPARE(report.logLine(), QString("[Config/CRIT] Rename failed: Permission denied"));
}

void TestErrorHandler::testListingErrorIsWarning()
{
    QSignalSpy statusSpy(handler_, &ErrorHandler::statusMessage);
    QSignalSpy loggedSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleListingError("/pool/missing", "Directory does not exist: /pool/missing");

    QCOMPARE(statusSpy.count(), 1);
    QVERIFY(statusSpy.at(0).at(0).toString().startsWith("Could not list /pool/missing"));
    QCOMPARE(statusSpy.at(0).at(1).toInt(), ErrorHandler::WarningTimeoutMs);

    QCOMPARE(loggedSpy.count(), 1);
    auto report = loggedSpy.at(0).at(0).value<ErrorReport>();
    QCOMPARE(report.category, ErrorCategory::Listing);
    QCOMPARE(report.severity, ErrorSeverity::Warning);
    QVERIFY(dialogs_.isEmpty());
}

void TestErrorHandler::testTransferFailedCarriesFileName()
{
    QSignalSpy loggedSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleTransferFailed("kick.wav", "Disk full");

    QCOMPARE(loggedSpy.count(), 1);
    auto report = loggedSpy.at(0).at(0).value<ErrorReport>();
    QCOMPARE(report.category, ErrorCategory::Transfer);
    QVERIFY(report.title.contains("kick.wav"));
    QCOMPARE(report.details, QString("Disk full"));
}

void TestErrorHandler::testMutationErrorShowsDialog()
{
    QSignalSpy statusSpy(handler_, &ErrorHandler::statusMessage);

    handler_->handleMutationError("Rename",
        "A file or folder with the name 'snare.wav' already exists");

    QCOMPARE(dialogs_.size(), 1);
    QCOMPARE(dialogs_.at(0).title, QString("Rename failed"));
    QCOMPARE(dialogs_.at(0).message,
             QString("A file or folder with the name 'snare.wav' already exists"));

    QCOMPARE(statusSpy.count(), 1);
    QCOMPARE(statusSpy.at(0).at(1).toInt(), 0);
}

void TestErrorHandler::testMutationErrorWithoutDetails()
{
    handler_->handleMutationError("Delete", QString());

    QCOMPARE(dialogs_.size(), 1);
    QCOMPARE(dialogs_.at(0).message, QString("Delete failed"));
}

void TestErrorHandler::testConfigurationError()
{
    QSignalSpy loggedSpy(handler_, &ErrorHandler::errorLogged);

    handler_->handleConfigurationError("Pool folder not found: /media/card/AUDIO");

    QCOMPARE(loggedSpy.count(), 1);
    auto report = loggedSpy.at(0).at(0).value<ErrorReport>();
    QCOMPARE(report.category, ErrorCategory::Configuration);
    QCOMPARE(report.severity, ErrorSeverity::Warning);
    QVERIFY(dialogs_.isEmpty());
}

void TestErrorHandler::testNonCriticalNeverShowsDialog()
{
    handler_->handleError(ErrorCategory::Transfer, ErrorSeverity::Info, "a");
    handler_->handleError(ErrorCategory::Listing, ErrorSeverity::Warning, "b", "c");
    handler_->handleTransferFailed("hat.wav", "Read error");

    QVERIFY(dialogs_.isEmpty());
}

QTEST_MAIN(TestErrorHandler)
#include "test_errorhandler.moc"
