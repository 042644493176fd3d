#include <QtTest>

#include "models/fileentrysort.h"

using FileEntrySort::Column;

class TestFileEntrySort : public QObject
{
    Q_OBJECT

private:
    static FileEntry entry(const QString &name, bool isDir = false, qint64 size = 0,
                           std::optional<int> sampleRate = std::nullopt)
    {
        FileEntry e;
        e.name = name;
        e.path = "/x/" + name;
        e.isDirectory = isDir;
        e.size = size;
        e.sampleRate = sampleRate;
        return e;
    }

    static QStringList names(const QList<FileEntry> &entries)
    {
        QStringList list;
        for (const FileEntry &e : entries) {
            list << e.name;
        }
        return list;
    }

private slots:
    void testDirectoriesFirstInEveryOrder_data()
    {
        QTest::addColumn<int>("column");
        QTest::addColumn<int>("order");

        for (int column = 0; column <= static_cast<int>(Column::SampleRate); ++column) {
            QTest::newRow(qPrintable(FileEntrySort::columnKey(Column(column)) + "-asc"))
                << column << int(Qt::AscendingOrder);
            QTest::newRow(qPrintable(FileEntrySort::columnKey(Column(column)) + "-desc"))
                << column << int(Qt::DescendingOrder);
        }
    }

    void testDirectoriesFirstInEveryOrder()
    {
        QFETCH(int, column);
        QFETCH(int, order);

        QList<FileEntry> entries = {
            entry("zeta.wav", false, 900, 48000),
            entry("Alpha", true),
            entry("beta.aif", false, 10, 44100),
            entry("omega", true)
        };
        FileEntrySort::sortEntries(entries, Column(column), Qt::SortOrder(order));

        QVERIFY(entries.at(0).isDirectory);
        QVERIFY(entries.at(1).isDirectory);
        QVERIFY(!entries.at(2).isDirectory);
        QVERIFY(!entries.at(3).isDirectory);
    }

    void testNamesCaseInsensitive()
    {
        QList<FileEntry> entries = {entry("b.wav"), entry("A.wav"), entry("c.wav")};
        FileEntrySort::sortEntries(entries);
        QCOMPARE(names(entries), (QStringList{"A.wav", "b.wav", "c.wav"}));

        FileEntrySort::sortEntries(entries, Column::Name, Qt::DescendingOrder);
        QCOMPARE(names(entries), (QStringList{"c.wav", "b.wav", "A.wav"}));
    }

    void testSizeOrder()
    {
        QList<FileEntry> entries = {entry("a", false, 30), entry("b", false, 10), entry("c", false, 20)};
        FileEntrySort::sortEntries(entries, Column::Size, Qt::AscendingOrder);
        QCOMPARE(names(entries), (QStringList{"b", "c", "a"}));
    }

    void testMissingMetadataSortsFirstAscending()
    {
        QList<FileEntry> entries = {
            entry("a.wav", false, 1, 48000),
            entry("b.mp3", false, 1),
            entry("c.wav", false, 1, 44100)
        };
        FileEntrySort::sortEntries(entries, Column::SampleRate, Qt::AscendingOrder);
        QCOMPARE(names(entries), (QStringList{"b.mp3", "c.wav", "a.wav"}));
    }

    void testColumnKeys()
    {
        QCOMPARE(FileEntrySort::columnKey(Column::BitDepth), QString("bitdepth"));
        QCOMPARE(FileEntrySort::columnFromKey("samplerate"), Column::SampleRate);
        QCOMPARE(FileEntrySort::columnFromKey("bogus"), Column::Name);
    }
};

QTEST_MAIN(TestFileEntrySort)
#include "test_fileentrysort.moc"
