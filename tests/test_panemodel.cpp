#include <QtTest>
#include <QSignalSpy>

#include "mocks/mockfileoperations.h"
#include "models/panemodel.h"

class TestPaneModel : public QObject
{
    Q_OBJECT

private:
    MockFileOperations *mockOps;
    PaneModel *model;

    const QString poolDir = QStringLiteral("/pool");

    static FileEntry entry(const QString &dir, const QString &name, bool isDir = false,
                           qint64 size = 1000)
    {
        FileEntry e;
        e.name = name;
        e.path = dir + "/" + name;
        e.isDirectory = isDir;
        e.size = isDir ? 0 : size;
        return e;
    }

    void openPool()
    {
        model->setRootBound(poolDir);
        QVERIFY(model->setPath(poolDir));
        mockOps->mockProcessAllOperations();
    }

private slots:
    void init()
    {
        mockOps = new MockFileOperations(this);
        mockOps->mockSetDirectoryListing(poolDir, {
            entry(poolDir, "snare.wav", false, 300),
            entry(poolDir, "Kits", true),
            entry(poolDir, "Bass.wav", false, 100),
            entry(poolDir, "hat.aif", false, 200)
        });
        mockOps->mockSetDirectoryListing(poolDir + "/Kits", {
            entry(poolDir + "/Kits", "909.wav")
        });

        model = new PaneModel(PaneSide::Destination, this);
        model->setFileOperations(mockOps);
    }

    void cleanup()
    {
        delete model;
        delete mockOps;
        model = nullptr;
        mockOps = nullptr;
    }

    // === Navigation ===

    void testSetPathListsSorted()
    {
        QSignalSpy pathSpy(model, &PaneModel::pathChanged);
        QSignalSpy listingSpy(model, &PaneModel::listingChanged);

        openPool();

        QCOMPARE(pathSpy.count(), 1);
        QCOMPARE(listingSpy.count(), 1);
        QCOMPARE(model->rowCount(), 4);
        QCOMPARE(model->entryAt(0).name, QString("Kits"));
        QCOMPARE(model->entryAt(1).name, QString("Bass.wav"));
        QCOMPARE(model->entryAt(2).name, QString("hat.aif"));
        QCOMPARE(model->entryAt(3).name, QString("snare.wav"));
        QVERIFY(!model->isLoading());
    }

    void testSetPathResetsSelectionAndCursor()
    {
        openPool();
        model->setSelection({poolDir + "/Bass.wav"});
        model->setCursorIndex(2);

        QVERIFY(model->setPath(poolDir + "/Kits"));

        QVERIFY(model->selection().isEmpty());
        QCOMPARE(model->cursorIndex(), 0);
        QCOMPARE(model->lastClickedIndex(), -1);
        QCOMPARE(model->rowCount(), 0);
        QVERIFY(model->isLoading());

        mockOps->mockProcessAllOperations();
        QCOMPARE(model->rowCount(), 1);
    }

    void testRootBoundRefusesOutsidePaths()
    {
        openPool();

        QVERIFY(!model->setPath("/home/user"));
        QVERIFY(!model->setPath("/poolside"));
        QCOMPARE(model->currentPath(), poolDir);
        QVERIFY(!model->navigateToParent());
    }

    void testNavigateToParentWithinRoot()
    {
        openPool();
        QVERIFY(model->setPath(poolDir + "/Kits"));
        mockOps->mockProcessAllOperations();

        QVERIFY(model->navigateToParent());
        QCOMPARE(model->currentPath(), poolDir);
    }

    void testUnboundPaneStopsAtFilesystemRoot()
    {
        PaneModel source(PaneSide::Source);
        source.setFileOperations(mockOps);

        QVERIFY(source.setPath("/"));
        mockOps->mockProcessAllOperations();
        QVERIFY(!source.navigateToParent());
    }

    void testStaleListingIsDiscarded()
    {
        model->setRootBound(poolDir);
        model->setPath(poolDir);
        model->setPath(poolDir + "/Kits");

        // The pool listing arrives first but the pane has moved on
        mockOps->mockProcessNextOperation();
        QCOMPARE(model->rowCount(), 0);
        QVERIFY(model->isLoading());

        mockOps->mockProcessNextOperation();
        QCOMPARE(model->rowCount(), 1);
        QCOMPARE(model->entryAt(0).name, QString("909.wav"));
    }

    void testRefreshSuppressedWhileLoading()
    {
        model->setPath(poolDir);
        model->refresh();
        QVERIFY(!model->setPath(poolDir));

        QCOMPARE(mockOps->mockGetListRequests().size(), 1);
        mockOps->mockProcessAllOperations();

        model->refresh();
        QCOMPARE(mockOps->mockGetListRequests().size(), 2);
    }

    void testRefreshPrunesSelectionAndClampsCursor()
    {
        openPool();
        model->setSelection({poolDir + "/snare.wav", poolDir + "/Bass.wav"});
        model->setCursorIndex(3);

        mockOps->mockSetDirectoryListing(poolDir, {
            entry(poolDir, "Kits", true),
            entry(poolDir, "Bass.wav", false, 100)
        });

        QSignalSpy selectionSpy(model, &PaneModel::selectionChanged);
        model->refresh();
        mockOps->mockProcessAllOperations();

        QCOMPARE(model->selection(), QSet<QString>{poolDir + "/Bass.wav"});
        QCOMPARE(model->cursorIndex(), 1);
        QCOMPARE(selectionSpy.count(), 1);
    }

    void testListingFailureEmptiesPane()
    {
        openPool();
        model->setSelection({poolDir + "/Bass.wav"});
        mockOps->mockSetListingFails(poolDir, "Permission denied");

        QSignalSpy failedSpy(model, &PaneModel::listingFailed);
        model->refresh();
        mockOps->mockProcessAllOperations();

        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.at(0).at(1).toString(), QString("Permission denied"));
        QCOMPARE(model->rowCount(), 0);
        QVERIFY(model->selection().isEmpty());
        QVERIFY(!model->isLoading());
        QCOMPARE(model->currentPath(), poolDir);
    }

    void testClearForgetsEverything()
    {
        openPool();
        model->setSelection({poolDir + "/Bass.wav"});

        model->clear();

        QVERIFY(model->currentPath().isEmpty());
        QCOMPARE(model->rowCount(), 0);
        QVERIFY(model->selection().isEmpty());
    }

    // === Selection and cursor ===

    void testFileManagerPathPrefersFolderRow()
    {
        QVERIFY(model->fileManagerPath(QString()).isEmpty());

        openPool();

        QCOMPARE(model->fileManagerPath(poolDir + "/Kits"), poolDir + "/Kits");
        QCOMPARE(model->fileManagerPath(poolDir + "/Bass.wav"), poolDir);
        QCOMPARE(model->fileManagerPath(QString()), poolDir);
        QCOMPARE(model->fileManagerPath("/elsewhere/Folder"), poolDir);
    }

    void testSetSelectionDropsUnknownPaths()
    {
        openPool();
        QSignalSpy selectionSpy(model, &PaneModel::selectionChanged);

        model->setSelection({poolDir + "/hat.aif", "/elsewhere/x.wav"});

        QCOMPARE(model->selection(), QSet<QString>{poolDir + "/hat.aif"});
        QCOMPARE(selectionSpy.count(), 1);
        QVERIFY(model->isSelected(poolDir + "/hat.aif"));

        // Same selection again is not a change
        model->setSelection({poolDir + "/hat.aif"});
        QCOMPARE(selectionSpy.count(), 1);
    }

    void testSelectedPathsFollowListingOrder()
    {
        openPool();
        model->setSelection({poolDir + "/snare.wav", poolDir + "/Kits", poolDir + "/Bass.wav"});

        QCOMPARE(model->selectedPaths(),
                 (QStringList{poolDir + "/Kits", poolDir + "/Bass.wav", poolDir + "/snare.wav"}));
        QCOMPARE(model->selectedEntries().size(), 3);
    }

    void testCursorIsClamped()
    {
        openPool();
        QSignalSpy cursorSpy(model, &PaneModel::cursorChanged);

        model->setCursorIndex(10);
        QCOMPARE(model->cursorIndex(), 3);
        model->setCursorIndex(-4);
        QCOMPARE(model->cursorIndex(), 0);
        QCOMPARE(cursorSpy.count(), 2);
    }

    void testSnapshotAndApplyUpdate()
    {
        openPool();

        SelectionEngine::PaneSnapshot snap = model->snapshot(false);
        QCOMPARE(snap.side, PaneSide::Destination);
        QCOMPARE(snap.listing.size(), 4);
        QVERIFY(!snap.sourcePaneOpen);

        SelectionEngine::SelectionUpdate update;
        update.selection = {poolDir + "/hat.aif"};
        update.cursorIndex = 2;
        update.lastClickedIndex = 2;
        model->applyUpdate(update);

        QCOMPARE(model->cursorIndex(), 2);
        QCOMPARE(model->lastClickedIndex(), 2);
        QVERIFY(model->data(model->index(2, 0), PaneModel::SelectedRole).toBool());
        QVERIFY(model->data(model->index(2, 0), PaneModel::CursorRole).toBool());
    }

    // === Sorting ===

    void testSortKeepsCursorOnSameEntry()
    {
        openPool();
        model->setCursorIndex(1);  // Bass.wav
        QSignalSpy sortSpy(model, &PaneModel::sortChanged);

        model->sort(PaneModel::SizeColumn, Qt::DescendingOrder);

        QCOMPARE(sortSpy.count(), 1);
        QCOMPARE(model->sortColumn(), FileEntrySort::Column::Size);
        QCOMPARE(model->entryAt(0).name, QString("Kits"));
        QCOMPARE(model->entryAt(1).name, QString("snare.wav"));
        QCOMPARE(model->entryAt(3).name, QString("Bass.wav"));
        QCOMPARE(model->cursorIndex(), 3);
        QCOMPARE(model->lastClickedIndex(), -1);
    }

    void testSortAppliesToLaterListings()
    {
        model->setSort(FileEntrySort::Column::Name, Qt::DescendingOrder);
        openPool();

        QCOMPARE(model->entryAt(0).name, QString("Kits"));
        QCOMPARE(model->entryAt(1).name, QString("snare.wav"));
    }

    // === Data ===

    void testDisplayData()
    {
        openPool();

        QCOMPARE(model->columnCount(), int(PaneModel::ColumnCount));
        QCOMPARE(model->data(model->index(0, PaneModel::FormatColumn)).toString(), QString("Folder"));
        QVERIFY(!model->data(model->index(0, PaneModel::SizeColumn)).isValid());
        QCOMPARE(model->data(model->index(1, PaneModel::SizeColumn)).toString(), QString("100 B"));
        QCOMPARE(model->data(model->index(2, PaneModel::FormatColumn)).toString(), QString("AIF"));
        QCOMPARE(model->data(model->index(1, 0), PaneModel::FilePathRole).toString(),
                 poolDir + "/Bass.wav");
        QVERIFY(model->data(model->index(0, 0), PaneModel::IsDirectoryRole).toBool());
        QVERIFY(!model->data(model->index(1, 0), PaneModel::SampleRateRole).isValid());
    }

    void testFormatSize()
    {
        QCOMPARE(PaneModel::formatSize(512), QString("512 B"));
        QCOMPARE(PaneModel::formatSize(1536), QString("1.5 KB"));
        QCOMPARE(PaneModel::formatSize(5 * 1024 * 1024), QString("5.0 MB"));
        QCOMPARE(PaneModel::formatSize(2LL * 1024 * 1024 * 1024), QString("2.00 GB"));
    }
};

QTEST_MAIN(TestPaneModel)
#include "test_panemodel.moc"
