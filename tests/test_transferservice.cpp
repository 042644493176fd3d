/**
 * @file test_transferservice.cpp
 * @brief Unit tests for TransferService.
 *
 * Tests verify:
 * - Every ingestion path queues one batch with the right paths and sizes
 * - Drag payload encoding and filtering against the source listing
 * - Copy back to the source directory never prompts
 * - Mutations refresh their pane and report failures
 */

#include <QtTest/QtTest>
#include <QMimeData>
#include <QSignalSpy>
#include <memory>

#include "mocks/mockfileoperations.h"
#include "models/panemodel.h"
#include "models/transferqueue.h"
#include "services/transferservice.h"

class TestTransferService : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Ingestion
    void testCopySelectedQueuesListingOrder();
    void testCopySelectedAttachesFileSizesOnly();
    void testCopySelectedWithoutSelectionDoesNothing();
    void testInternalDropFiltersToSourceListing();
    void testInternalDropWithForeignPayload();
    void testExternalDropIgnoresRemoteUrls();
    void testExternalDropUsesConflictHandling();
    void testImportFilesAndFolder();

    // Drag helpers
    void testDragPayloadRoundTrip();
    void testInvalidDragPayload();
    void testDropHoverEmitsOnChange();

    // Copy back
    void testCopyBackRecordsConflictAsFailure();
    void testCopyBackRequiresOpenSourcePane();
    void testCopyBackContextEntryOutsideSelection();

    // Refresh after batches
    void testDestinationRefreshedAfterBatch();

    // Conflict decisions
    void testCapturedPendingBatchResumesImport();
    void testPendingBatchResolvedAfterCancelIsIgnored();

    // Mutations
    void testRenameRefreshesPane();
    void testRenameRejectsEmptyName();
    void testDeleteClearsSelectionAndRefreshes();
    void testCreateFolderFailureIsReported();

private:
    FileEntry makeEntry(const QString &dir, const QString &name, bool isDir, qint64 size) const;
    void loadPanes();
    void flushAndProcess();
    int listRequestCount(const QString &path) const;

    MockFileOperations *mockOps_ = nullptr;
    PaneModel *source_ = nullptr;
    PaneModel *destination_ = nullptr;
    TransferQueue *queue_ = nullptr;
    TransferService *service_ = nullptr;

    const QString sourceDir_ = QStringLiteral("/home/user/samples");
    const QString poolDir_ = QStringLiteral("/pool");
};

FileEntry TestTransferService::makeEntry(const QString &dir, const QString &name,
                                         bool isDir, qint64 size) const
{
    FileEntry entry;
    entry.name = name;
    entry.path = dir + "/" + name;
    entry.isDirectory = isDir;
    entry.size = size;
    return entry;
}

void TestTransferService::loadPanes()
{
    source_->setPath(sourceDir_);
    destination_->setPath(poolDir_);
    mockOps_->mockProcessAllOperations();
    QCOMPARE(source_->entryCount(), 3);
    QCOMPARE(destination_->entryCount(), 1);
}

void TestTransferService::flushAndProcess()
{
    int iterations = 0;
    while (iterations++ < 100) {
        queue_->flushEventQueue();
        if (mockOps_->mockPendingOperationCount() == 0) {
            break;
        }
        mockOps_->mockProcessAllOperations();
    }
    queue_->flushEventQueue();
}

int TestTransferService::listRequestCount(const QString &path) const
{
    return mockOps_->mockGetListRequests().count(path);
}

void TestTransferService::init()
{
    mockOps_ = new MockFileOperations(this);

    mockOps_->mockSetDirectoryListing(sourceDir_, {
        makeEntry(sourceDir_, "snare.wav", false, 200),
        makeEntry(sourceDir_, "loops", true, 0),
        makeEntry(sourceDir_, "kick.wav", false, 100)
    });
    mockOps_->mockSetDirectoryListing(poolDir_, {
        makeEntry(poolDir_, "existing.wav", false, 300)
    });

    source_ = new PaneModel(PaneSide::Source, this);
    source_->setFileOperations(mockOps_);

    destination_ = new PaneModel(PaneSide::Destination, this);
    destination_->setRootBound(poolDir_);
    destination_->setFileOperations(mockOps_);

    queue_ = new TransferQueue(this);
    queue_->setFileOperations(mockOps_);

    service_ = new TransferService(source_, destination_, queue_, this);
    service_->setFileOperations(mockOps_);

    loadPanes();
}

void TestTransferService::cleanup()
{
    delete service_;
    delete queue_;
    delete destination_;
    delete source_;
    delete mockOps_;
    service_ = nullptr;
    queue_ = nullptr;
    destination_ = nullptr;
    source_ = nullptr;
    mockOps_ = nullptr;
}

void TestTransferService::testCopySelectedQueuesListingOrder()
{
    QSignalSpy panelSpy(service_, &TransferService::transferPanelRequested);

    source_->setSelection({sourceDir_ + "/snare.wav", sourceDir_ + "/kick.wav",
                           sourceDir_ + "/loops"});

    int batchId = service_->copySelectedToPool();
    QVERIFY(batchId > 0);
    QCOMPARE(panelSpy.count(), 1);
    QVERIFY(source_->selection().isEmpty());

    flushAndProcess();

    const auto requests = mockOps_->mockGetCopyRequests();
    QCOMPARE(requests.size(), 3);
    QCOMPARE(requests.at(0).sourcePath, sourceDir_ + "/loops");
    QCOMPARE(requests.at(1).sourcePath, sourceDir_ + "/kick.wav");
    QCOMPARE(requests.at(2).sourcePath, sourceDir_ + "/snare.wav");
    for (const auto &request : requests) {
        QCOMPARE(request.destinationDir, poolDir_);
        QCOMPARE(request.overwrite, false);
    }
}

void TestTransferService::testCopySelectedAttachesFileSizesOnly()
{
    source_->setSelection({sourceDir_ + "/kick.wav", sourceDir_ + "/loops"});
    service_->copySelectedToPool();
    flushAndProcess();

    const auto &items = queue_->items();
    QCOMPARE(items.size(), 2);
    QCOMPARE(items.at(0).fileName, QString("loops"));
    QVERIFY(!items.at(0).sizeKnown);
    QCOMPARE(items.at(1).fileName, QString("kick.wav"));
    QVERIFY(items.at(1).sizeKnown);
    QCOMPARE(items.at(1).fileSize, qint64(100));
}

void TestTransferService::testCopySelectedWithoutSelectionDoesNothing()
{
    QSignalSpy panelSpy(service_, &TransferService::transferPanelRequested);

    QCOMPARE(service_->copySelectedToPool(), -1);
    QCOMPARE(panelSpy.count(), 0);
    queue_->flushEventQueue();
    QCOMPARE(queue_->rowCount(), 0);
}

void TestTransferService::testInternalDropFiltersToSourceListing()
{
    std::unique_ptr<QMimeData> mime(TransferService::createDragMimeData({
        sourceDir_ + "/kick.wav",
        "/somewhere/else/ghost.wav"
    }));

    int batchId = service_->handleInternalDrop(mime.get());
    QVERIFY(batchId > 0);

    flushAndProcess();

    const auto requests = mockOps_->mockGetCopyRequests();
    QCOMPARE(requests.size(), 1);
    QCOMPARE(requests.first().sourcePath, sourceDir_ + "/kick.wav");
}

void TestTransferService::testInternalDropWithForeignPayload()
{
    QMimeData mime;
    mime.setText("just text");

    QCOMPARE(service_->handleInternalDrop(&mime), -1);
    QCOMPARE(service_->handleInternalDrop(nullptr), -1);
}

void TestTransferService::testExternalDropIgnoresRemoteUrls()
{
    QList<QUrl> urls = {
        QUrl::fromLocalFile("/tmp/dropped/hat.wav"),
        QUrl("https://example.com/remote.wav")
    };

    QVERIFY(service_->handleExternalDrop(urls) > 0);
    flushAndProcess();

    const auto requests = mockOps_->mockGetCopyRequests();
    QCOMPARE(requests.size(), 1);
    QCOMPARE(requests.first().sourcePath, QString("/tmp/dropped/hat.wav"));
    QCOMPARE(requests.first().destinationDir, poolDir_);

    QCOMPARE(service_->handleExternalDrop({QUrl("https://example.com/a.wav")}), -1);
}

void TestTransferService::testExternalDropUsesConflictHandling()
{
    QSignalSpy overwriteSpy(queue_, &TransferQueue::overwriteConfirmationNeeded);

    mockOps_->mockAddExistingPath(poolDir_ + "/existing.wav");
    service_->handleExternalDrop({QUrl::fromLocalFile("/tmp/dropped/existing.wav")});
    flushAndProcess();

    QCOMPARE(overwriteSpy.count(), 1);
    QVERIFY(queue_->isAwaitingConfirmation());
}

void TestTransferService::testImportFilesAndFolder()
{
    QVERIFY(service_->importFiles({"/tmp/a.wav", "/tmp/b.wav"}) > 0);
    QVERIFY(service_->importFolder("/tmp/kit") > 0);
    QCOMPARE(service_->importFiles({}), -1);
    QCOMPARE(service_->importFolder(QString()), -1);

    flushAndProcess();

    const auto requests = mockOps_->mockGetCopyRequests();
    QCOMPARE(requests.size(), 3);
    QCOMPARE(requests.at(2).sourcePath, QString("/tmp/kit"));
}

void TestTransferService::testCapturedPendingBatchResumesImport()
{
    mockOps_->mockAddExistingPath(poolDir_ + "/a.wav");

    QVERIFY(service_->importFiles({"/tmp/a.wav", "/tmp/b.wav"}) > 0);
    flushAndProcess();

    std::optional<PendingBatch> pending = service_->pendingBatch();
    QVERIFY(pending.has_value());
    QCOMPARE(pending->fileName, QString("a.wav"));

    service_->resolveConflict(*pending, OverwriteResponse::Overwrite);
    flushAndProcess();

    QVERIFY(!service_->pendingBatch().has_value());
    const auto requests = mockOps_->mockGetCopyRequests();
    QCOMPARE(requests.size(), 3);
    QCOMPARE(requests.at(1).sourcePath, QString("/tmp/a.wav"));
    QCOMPARE(requests.at(1).overwrite, true);
    QCOMPARE(requests.at(2).sourcePath, QString("/tmp/b.wav"));
}

void TestTransferService::testPendingBatchResolvedAfterCancelIsIgnored()
{
    mockOps_->mockAddExistingPath(poolDir_ + "/a.wav");

    QVERIFY(service_->importFiles({"/tmp/a.wav", "/tmp/b.wav"}) > 0);
    flushAndProcess();

    std::optional<PendingBatch> pending = service_->pendingBatch();
    QVERIFY(pending.has_value());

    // Cancelled while the prompt was still open
    service_->cancelAll();
    flushAndProcess();
    QVERIFY(!service_->pendingBatch().has_value());

    service_->resolveConflict(*pending, OverwriteResponse::Overwrite);
    flushAndProcess();

    QCOMPARE(mockOps_->mockGetCopyRequests().size(), 1);
    QVERIFY(!service_->isProcessing());
}

void TestTransferService::testDragPayloadRoundTrip()
{
    QStringList paths = {"/a/one.wav", "/b/two words.aif"};
    std::unique_ptr<QMimeData> mime(TransferService::createDragMimeData(paths));

    QVERIFY(TransferService::canDecode(mime.get()));
    QVERIFY(mime->hasFormat("application/x-poolxfer-paths"));
    QCOMPARE(TransferService::decodeDragPaths(mime.get()), paths);
}

void TestTransferService::testInvalidDragPayload()
{
    QMimeData mime;
    mime.setData(TransferService::DragMimeType, "{not json");
    QVERIFY(TransferService::decodeDragPaths(&mime).isEmpty());

    mime.setData(TransferService::DragMimeType, "{\"path\": \"/a.wav\"}");
    QVERIFY(TransferService::decodeDragPaths(&mime).isEmpty());
}

void TestTransferService::testDropHoverEmitsOnChange()
{
    QSignalSpy spy(service_, &TransferService::dropZoneHighlightChanged);

    service_->setDropHover(true);
    service_->setDropHover(true);
    QCOMPARE(spy.count(), 1);
    QVERIFY(service_->isDropHighlighted());

    service_->setDropHover(false);
    QCOMPARE(spy.count(), 2);
    QCOMPARE(spy.last().at(0).toBool(), false);

    // Dropping ends the hover state
    service_->setDropHover(true);
    service_->handleExternalDrop({});
    QVERIFY(!service_->isDropHighlighted());
}

void TestTransferService::testCopyBackRecordsConflictAsFailure()
{
    QSignalSpy overwriteSpy(queue_, &TransferQueue::overwriteConfirmationNeeded);

    mockOps_->mockAddExistingPath(sourceDir_ + "/existing.wav");
    destination_->setSelection({poolDir_ + "/existing.wav"});

    QVERIFY(service_->copyBackToSource() > 0);
    QVERIFY(destination_->selection().isEmpty());

    flushAndProcess();

    QCOMPARE(overwriteSpy.count(), 0);
    QCOMPARE(queue_->rowCount(), 1);
    QCOMPARE(queue_->items().first().status, TransferItem::Status::Failed);
    QCOMPARE(queue_->items().first().destinationDir, sourceDir_);
}

void TestTransferService::testCopyBackRequiresOpenSourcePane()
{
    destination_->setSelection({poolDir_ + "/existing.wav"});
    source_->clear();

    QCOMPARE(service_->copyBackToSource(), -1);
    QCOMPARE(destination_->selection().size(), 1);
}

void TestTransferService::testCopyBackContextEntryOutsideSelection()
{
    mockOps_->mockSetDirectoryListing(poolDir_, {
        makeEntry(poolDir_, "a.wav", false, 1),
        makeEntry(poolDir_, "b.wav", false, 2)
    });
    destination_->refresh();
    mockOps_->mockProcessAllOperations();

    destination_->setSelection({poolDir_ + "/a.wav"});
    service_->copyBackToSource(poolDir_ + "/b.wav");
    flushAndProcess();

    const auto requests = mockOps_->mockGetCopyRequests();
    QCOMPARE(requests.size(), 1);
    QCOMPARE(requests.first().sourcePath, poolDir_ + "/b.wav");
    QCOMPARE(requests.first().destinationDir, sourceDir_);
}

void TestTransferService::testDestinationRefreshedAfterBatch()
{
    int before = listRequestCount(poolDir_);

    service_->importFiles({"/tmp/a.wav", "/tmp/b.wav"});
    flushAndProcess();

    QCOMPARE(listRequestCount(poolDir_), before + 1);
}

void TestTransferService::testRenameRefreshesPane()
{
    QSignalSpy finishedSpy(service_, &TransferService::mutationFinished);
    QSignalSpy failedSpy(service_, &TransferService::mutationFailed);
    int before = listRequestCount(poolDir_);

    QVERIFY(service_->renameEntry(PaneSide::Destination, poolDir_ + "/existing.wav", "  renamed.wav "));
    QCOMPARE(mockOps_->mockGetRenameRequests(), QStringList{poolDir_ + "/existing.wav"});

    mockOps_->mockProcessNextOperation();

    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 0);
    QCOMPARE(listRequestCount(poolDir_), before + 1);
    QVERIFY(mockOps_->mockPathExists(poolDir_ + "/renamed.wav"));
}

void TestTransferService::testRenameRejectsEmptyName()
{
    QVERIFY(!service_->renameEntry(PaneSide::Destination, poolDir_ + "/existing.wav", "   "));
    QVERIFY(!service_->renameEntry(PaneSide::Destination, poolDir_ + "/existing.wav", "existing.wav"));
    QCOMPARE(mockOps_->mockPendingOperationCount(), 0);
}

void TestTransferService::testDeleteClearsSelectionAndRefreshes()
{
    int before = listRequestCount(sourceDir_);
    source_->setSelection({sourceDir_ + "/kick.wav"});

    QVERIFY(service_->deleteEntries(PaneSide::Source, {sourceDir_ + "/kick.wav"}));
    QVERIFY(source_->selection().isEmpty());

    mockOps_->mockProcessNextOperation();

    QCOMPARE(mockOps_->mockGetDeleteRequests(), QStringList{sourceDir_ + "/kick.wav"});
    QCOMPARE(listRequestCount(sourceDir_), before + 1);
    QVERIFY(!service_->deleteEntries(PaneSide::Source, {}));
}

void TestTransferService::testCreateFolderFailureIsReported()
{
    QSignalSpy failedSpy(service_, &TransferService::mutationFailed);
    int before = listRequestCount(poolDir_);

    mockOps_->mockSetNextMutationFails("Directory already exists: /pool/Kits");
    QVERIFY(service_->createFolder(PaneSide::Destination, "Kits"));
    QCOMPARE(mockOps_->mockGetCreateRequests(), QStringList{poolDir_ + "/Kits"});

    mockOps_->mockProcessNextOperation();

    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.first().at(0).toString(), QString("Create Folder"));
    QCOMPARE(failedSpy.first().at(1).toString(), QString("Directory already exists: /pool/Kits"));
    // Refreshed regardless of the failure
    QCOMPARE(listRequestCount(poolDir_), before + 1);

    QVERIFY(!service_->createFolder(PaneSide::Destination, ""));
}

QTEST_MAIN(TestTransferService)
#include "test_transferservice.moc"
