/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalHistoryTest.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTest>

#include "../session/ScrollbackBuffer.h"
#include "../session/TerminalHistory.h"

using namespace Trellis;

void TerminalHistoryTest::testScrollbackLineLimit()
{
    ScrollbackBuffer buffer(3, 1024);
    buffer.append("one\ntwo\nthree\n");
    QCOMPARE(buffer.lineCount(), 3);

    buffer.append("four\nfive");
    QCOMPARE(buffer.lineCount(), 3);
    QCOMPARE(buffer.data(), QByteArray("two\nthree\nfour\nfive"));
}

void TerminalHistoryTest::testScrollbackByteLimitKeepsUtf8()
{
    ScrollbackBuffer buffer(100, 4);
    // "xé€": 1 + 2 + 3 bytes
    buffer.append("x\xc3\xa9\xe2\x82\xac");

    // A 4-byte tail would start inside é; the cut moves forward to €
    QCOMPARE(buffer.data(), QByteArray("\xe2\x82\xac"));
    QVERIFY(buffer.data().size() <= buffer.maxBytes());
}

void TerminalHistoryTest::testScrollbackClear()
{
    ScrollbackBuffer buffer;
    buffer.append("line\n");
    buffer.append(QByteArray());
    QCOMPARE(buffer.lineCount(), 1);

    buffer.clear();
    QVERIFY(buffer.data().isEmpty());
    QCOMPARE(buffer.lineCount(), 0);
}

void TerminalHistoryTest::testDirectoryLayout()
{
    const QString directory = TerminalHistory::directory(QStringLiteral("/state/terminal-history"), QStringLiteral("ws"), QStringLiteral("t1"));
    QCOMPARE(directory, QStringLiteral("/state/terminal-history/ws/t1"));
    QCOMPARE(TerminalHistory::historyFilePath(directory), QStringLiteral("/state/terminal-history/ws/t1/history.ndjson"));
    QCOMPARE(TerminalHistory::metadataFilePath(directory), QStringLiteral("/state/terminal-history/ws/t1/meta.json"));
}

void TerminalHistoryTest::testWriteAndReadBack()
{
    QTemporaryDir root;
    QVERIFY(root.isValid());
    const QString directory = TerminalHistory::directory(root.path(), QStringLiteral("ws"), QStringLiteral("t1"));

    {
        HistoryWriter writer(directory, QStringLiteral("/home"), 100, 30);
        QVERIFY(writer.init());
        QVERIFY(writer.isOpen());
        writer.writeData("hello ");
        writer.writeData(QByteArray("\x00\xff binary", 9));
    }

    const HistoryRecord record = HistoryReader(directory).readLatest();
    QVERIFY(record.exists);
    QCOMPARE(record.scrollback, QByteArray("hello ") + QByteArray("\x00\xff binary", 9));
    QVERIFY(record.metadata.has_value());
    QCOMPARE(record.metadata->cwd, QStringLiteral("/home"));
    QCOMPARE(record.metadata->cols, 100);
    QCOMPARE(record.metadata->rows, 30);
}

void TerminalHistoryTest::testUnfinishedRecordingIsRestorable()
{
    QTemporaryDir root;
    const QString directory = TerminalHistory::directory(root.path(), QStringLiteral("ws"), QStringLiteral("t1"));

    {
        HistoryWriter writer(directory, QStringLiteral("/tmp"), 80, 24);
        QVERIFY(writer.init());
        writer.writeData("output");
        TerminalModes modes;
        modes.bracketedPaste = true;
        writer.updateMetadata(QStringLiteral("/srv"), 120, 40, modes);
    }

    const auto metadata = HistoryReader(directory).readMetadata();
    QVERIFY(metadata.has_value());
    QVERIFY(!metadata->endedCleanly());
    QCOMPARE(metadata->cwd, QStringLiteral("/srv"));
    QCOMPARE(metadata->cols, 120);
    QVERIFY(metadata->modes.bracketedPaste);
}

void TerminalHistoryTest::testFinalizeRecordsExit()
{
    QTemporaryDir root;
    const QString directory = TerminalHistory::directory(root.path(), QStringLiteral("ws"), QStringLiteral("t1"));

    HistoryWriter writer(directory, QStringLiteral("/tmp"), 80, 24);
    QVERIFY(writer.init());
    writer.writeData("bye\n");
    writer.writeExit(3, 0);
    QVERIFY(!writer.isOpen());

    // Writes after the exit are dropped
    writer.writeData("late");

    const HistoryRecord record = HistoryReader(directory).readLatest();
    QCOMPARE(record.scrollback, QByteArray("bye\n"));
    QVERIFY(record.metadata->endedCleanly());
    QCOMPARE(record.metadata->exitCode.value_or(-1), 3);
}

void TerminalHistoryTest::testReadLatestKeepsTail()
{
    QTemporaryDir root;
    const QString directory = TerminalHistory::directory(root.path(), QStringLiteral("ws"), QStringLiteral("t1"));

    {
        HistoryWriter writer(directory, QStringLiteral("/tmp"), 80, 24);
        QVERIFY(writer.init());
        for (int i = 0; i < 100; ++i) {
            writer.writeData(QByteArray::number(i).rightJustified(3, '0') + '\n');
        }
    }

    const HistoryRecord record = HistoryReader(directory).readLatest(HistoryReader::DefaultMaxBytesToRead, 8);
    QCOMPARE(record.scrollback, QByteArray("098\n099\n"));

    // Reading only the end of the file drops the partial first line
    const HistoryRecord partial = HistoryReader(directory).readLatest(200, 1000);
    QVERIFY(partial.scrollback.endsWith("099\n"));
    QVERIFY(partial.scrollback.size() < 100 * 4);
}

void TerminalHistoryTest::testReadLatestSkipsMalformedLines()
{
    QTemporaryDir root;
    const QString directory = TerminalHistory::directory(root.path(), QStringLiteral("ws"), QStringLiteral("t1"));
    QVERIFY(QDir().mkpath(directory));

    QFile file(TerminalHistory::historyFilePath(directory));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"t":1,"type":"data","data":"YWJj"})"
               "\n"
               "{truncated\n"
               R"({"t":2,"type":"resize","cols":10,"rows":5})"
               "\n"
               R"({"t":3,"type":"data","data":"ZGVm"})"
               "\n");
    file.close();

    const HistoryRecord record = HistoryReader(directory).readLatest();
    QVERIFY(record.exists);
    QCOMPARE(record.scrollback, QByteArray("abcdef"));
    QVERIFY(!record.metadata.has_value());
}

void TerminalHistoryTest::testMarkEnded()
{
    QTemporaryDir root;
    const QString directory = TerminalHistory::directory(root.path(), QStringLiteral("ws"), QStringLiteral("t1"));

    {
        HistoryWriter writer(directory, QStringLiteral("/tmp"), 80, 24);
        QVERIFY(writer.init());
        writer.writeData("x");
    }

    const HistoryReader reader(directory);
    QVERIFY(!reader.readMetadata()->endedCleanly());
    QVERIFY(reader.markEnded());
    QVERIFY(reader.readMetadata()->endedCleanly());
}

void TerminalHistoryTest::testCleanup()
{
    QTemporaryDir root;
    const QString directory = TerminalHistory::directory(root.path(), QStringLiteral("ws"), QStringLiteral("t1"));

    {
        HistoryWriter writer(directory, QStringLiteral("/tmp"), 80, 24);
        QVERIFY(writer.init());
    }
    QVERIFY(QFileInfo(directory).isDir());

    QVERIFY(HistoryReader(directory).cleanup());
    QVERIFY(!QFileInfo(directory).exists());
    // Nothing left to remove
    QVERIFY(HistoryReader(directory).cleanup());
}

void TerminalHistoryTest::testMissingRecording()
{
    QTemporaryDir root;
    const HistoryRecord record = HistoryReader(root.filePath(QStringLiteral("none"))).readLatest();
    QVERIFY(!record.exists);
    QVERIFY(record.scrollback.isEmpty());
}

QTEST_GUILESS_MAIN(TerminalHistoryTest)
