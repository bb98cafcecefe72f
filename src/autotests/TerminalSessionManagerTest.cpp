/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalSessionManagerTest.h"

#include <QDir>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTest>

#include <csignal>
#include <utility>

#include "../session/TerminalHistory.h"
#include "../session/TerminalSessionManager.h"

using namespace Trellis;

namespace
{

const int Timeout = 10000;

CreateOrAttachRequest request(const QString &id, const QString &cwd, int cols = 0, int rows = 0)
{
    CreateOrAttachRequest request;
    request.id = id;
    request.workspaceId = QStringLiteral("ws");
    request.cwd = cwd;
    request.cols = cols;
    request.rows = rows;
    return request;
}

bool historyContains(const TerminalSessionManager &manager, const QString &id, const QByteArray &text)
{
    const auto history = manager.getHistory(id);
    return history.has_value() && history->contains(text);
}

}

SessionManagerSettings TerminalSessionManagerTest::settings() const
{
    SessionManagerSettings settings;
    settings.historyRoot = _dir->filePath(QStringLiteral("terminal-history"));
    settings.shell = QStringLiteral("/bin/sh");
    settings.initialCommandDelay = 50;
    return settings;
}

void TerminalSessionManagerTest::init()
{
    _dir = std::make_unique<QTemporaryDir>();
    QVERIFY(_dir->isValid());
}

void TerminalSessionManagerTest::cleanup()
{
    _dir.reset();
}

void TerminalSessionManagerTest::testEmptyIdRejected()
{
    TerminalSessionManager manager(settings());
    const CreateOrAttachResult result = manager.createOrAttach(request(QString(), _dir->path()));
    QVERIFY(!result.success);
    QVERIFY(!result.error.isEmpty());
    QVERIFY(manager.sessionIds().isEmpty());
}

void TerminalSessionManagerTest::testPathLikeIdsRejected_data()
{
    QTest::addColumn<QString>("terminalId");
    QTest::addColumn<QString>("workspaceId");

    QTest::newRow("dot") << QStringLiteral(".") << QStringLiteral("ws");
    QTest::newRow("dot dot") << QStringLiteral("..") << QStringLiteral("ws");
    QTest::newRow("slash") << QStringLiteral("../../escape") << QStringLiteral("ws");
    QTest::newRow("workspace dot dot") << QStringLiteral("t1") << QStringLiteral("..");
    QTest::newRow("workspace slash") << QStringLiteral("t1") << QStringLiteral("a/b");
}

void TerminalSessionManagerTest::testPathLikeIdsRejected()
{
    QFETCH(QString, terminalId);
    QFETCH(QString, workspaceId);

    TerminalSessionManager manager(settings());
    CreateOrAttachRequest bad = request(terminalId, _dir->path());
    bad.workspaceId = workspaceId;
    const CreateOrAttachResult result = manager.createOrAttach(bad);
    QVERIFY(!result.success);
    QVERIFY(manager.sessionIds().isEmpty());
    QVERIFY(!QFileInfo::exists(_dir->filePath(QStringLiteral("escape"))));
}

void TerminalSessionManagerTest::testKillWithPathLikeIdKeepsHistory()
{
    TerminalSessionManager manager(settings());
    const QString id = QStringLiteral("t1");
    QVERIFY(manager.createOrAttach(request(id, _dir->path())).success);

    const QString directory = TerminalHistory::directory(settings().historyRoot, QStringLiteral("ws"), id);
    QVERIFY(QFileInfo(directory).isDir());
    QVERIFY(TerminalHistory::directory(settings().historyRoot, QStringLiteral("ws"), QStringLiteral("..")).isEmpty());

    manager.kill(QStringLiteral(".."), true);
    manager.kill(QStringLiteral("."), true);
    manager.kill(QStringLiteral("ws/t1"), true);

    QVERIFY(QFileInfo(settings().historyRoot).isDir());
    QVERIFY(QFileInfo(directory).isDir());
    QVERIFY(manager.hasSession(id));
}

void TerminalSessionManagerTest::testOversizedDimensionsClamped()
{
    TerminalSessionManager manager(settings());
    const QString id = QStringLiteral("t1");
    const CreateOrAttachResult result = manager.createOrAttach(request(id, _dir->path(), 70000, 24));
    QVERIFY(result.success);
    QCOMPARE(result.cols, 65535);
    QCOMPARE(result.rows, 24);

    manager.resize(id, 100, 90000);
    QCOMPARE(manager.sessionInfo(id)->cols, 100);
    QCOMPARE(manager.sessionInfo(id)->rows, 65535);
}

void TerminalSessionManagerTest::testCreateNewSession()
{
    TerminalSessionManager manager(settings());
    const CreateOrAttachResult result = manager.createOrAttach(request(QStringLiteral("t1"), _dir->path(), 100, 30));

    QVERIFY(result.success);
    QVERIFY(result.isNew);
    QVERIFY(!result.wasRecovered);
    QVERIFY(!result.isColdRestore);
    QVERIFY(!result.isExited);
    QCOMPARE(result.cols, 100);
    QCOMPARE(result.rows, 30);

    QVERIFY(manager.hasSession(QStringLiteral("t1")));
    const auto info = manager.sessionInfo(QStringLiteral("t1"));
    QVERIFY(info.has_value());
    QVERIFY(info->isAlive);
    QVERIFY(info->pid > 0);
}

void TerminalSessionManagerTest::testReattachReturnsSameScrollback()
{
    TerminalSessionManager manager(settings());
    const QString id = QStringLiteral("t1");
    QVERIFY(manager.createOrAttach(request(id, _dir->path())).isNew);

    manager.write(id, "echo reattach-$((40+2))\n");
    QTRY_VERIFY_WITH_TIMEOUT(historyContains(manager, id, "reattach-42"), Timeout);

    const QByteArray before = *manager.getHistory(id);
    const CreateOrAttachResult second = manager.createOrAttach(request(id, _dir->path()));
    QVERIFY(second.success);
    QVERIFY(!second.isNew);
    QVERIFY(second.wasRecovered);
    QCOMPARE(second.scrollback, before);

    // Still one session, still the same process
    QCOMPARE(manager.sessionIds(), QStringList{id});
}

void TerminalSessionManagerTest::testReattachAppliesSize()
{
    TerminalSessionManager manager(settings());
    const QString id = QStringLiteral("t1");
    manager.createOrAttach(request(id, _dir->path(), 80, 24));

    const CreateOrAttachResult second = manager.createOrAttach(request(id, _dir->path(), 132, 50));
    QCOMPARE(second.cols, 132);
    QCOMPARE(second.rows, 50);
    QCOMPARE(manager.sessionInfo(id)->cols, 132);
}

void TerminalSessionManagerTest::testOutputSignal()
{
    TerminalSessionManager manager(settings());
    QSignalSpy outputSpy(&manager, &TerminalSessionManager::terminalOutput);

    const QString id = QStringLiteral("t1");
    manager.createOrAttach(request(id, _dir->path()));
    manager.write(id, "echo out-$((2*3))\n");

    QTRY_VERIFY_WITH_TIMEOUT(historyContains(manager, id, "out-6"), Timeout);
    QVERIFY(!outputSpy.isEmpty());
    QCOMPARE(outputSpy.first().at(0).toString(), id);

    QByteArray streamed;
    quint64 expectedSequence = 0;
    for (const auto &arguments : std::as_const(outputSpy)) {
        streamed.append(arguments.at(1).toByteArray());
        QCOMPARE(arguments.at(2).value<quint64>(), ++expectedSequence);
    }
    QVERIFY(streamed.contains("out-6"));

    // A reattach reports which chunks its scrollback already holds
    const CreateOrAttachResult reattached = manager.createOrAttach(request(id, _dir->path()));
    QCOMPARE(reattached.outputSequence, expectedSequence);
    QCOMPARE(reattached.scrollback, streamed);
}

void TerminalSessionManagerTest::testInitialCommandsRun()
{
    TerminalSessionManager manager(settings());
    CreateOrAttachRequest create = request(QStringLiteral("t1"), _dir->path());
    create.initialCommands = {QStringLiteral("echo init-$((5+5))")};
    QVERIFY(manager.createOrAttach(create).isNew);

    QTRY_VERIFY_WITH_TIMEOUT(historyContains(manager, QStringLiteral("t1"), "init-10"), Timeout);
}

void TerminalSessionManagerTest::testExitedSessionStaysAddressable()
{
    TerminalSessionManager manager(settings());
    QSignalSpy exitSpy(&manager, &TerminalSessionManager::terminalExited);

    const QString id = QStringLiteral("t1");
    manager.createOrAttach(request(id, _dir->path()));
    manager.write(id, "exit 7\n");

    QTRY_COMPARE_WITH_TIMEOUT(exitSpy.count(), 1, Timeout);
    QCOMPARE(exitSpy.first().at(0).toString(), id);
    QCOMPARE(exitSpy.first().at(1).toInt(), 7);
    QCOMPARE(exitSpy.first().at(2).toInt(), 0);

    QVERIFY(manager.hasSession(id));
    const CreateOrAttachResult result = manager.createOrAttach(request(id, _dir->path()));
    QVERIFY(result.success);
    QVERIFY(result.isExited);
    QCOMPARE(result.exitCode.value_or(-1), 7);
    QVERIFY(!manager.sessionInfo(id)->isAlive);
}

void TerminalSessionManagerTest::testSignalTerminates()
{
    TerminalSessionManager manager(settings());
    QSignalSpy exitSpy(&manager, &TerminalSessionManager::terminalExited);

    const QString id = QStringLiteral("t1");
    manager.createOrAttach(request(id, _dir->path()));
    manager.signal(id, QStringLiteral("KILL"));

    QTRY_COMPARE_WITH_TIMEOUT(exitSpy.count(), 1, Timeout);
    QCOMPARE(exitSpy.first().at(2).toInt(), int(SIGKILL));
    QCOMPARE(exitSpy.first().at(1).toInt(), 128 + SIGKILL);
}

void TerminalSessionManagerTest::testKillForgetsSessionSilently()
{
    TerminalSessionManager manager(settings());
    QSignalSpy exitSpy(&manager, &TerminalSessionManager::terminalExited);

    const QString id = QStringLiteral("t1");
    manager.createOrAttach(request(id, _dir->path()));
    manager.kill(id, false);

    QVERIFY(!manager.hasSession(id));
    QVERIFY(!manager.getHistory(id).has_value());
    QTest::qWait(300);
    QCOMPARE(exitSpy.count(), 0);

    // Unknown ids are ignored
    manager.kill(QStringLiteral("missing"), true);
    manager.write(QStringLiteral("missing"), "x");
}

void TerminalSessionManagerTest::testKillDeletesHistory()
{
    TerminalSessionManager manager(settings());
    const QString id = QStringLiteral("t1");
    manager.createOrAttach(request(id, _dir->path()));

    const QString directory = TerminalHistory::directory(settings().historyRoot, QStringLiteral("ws"), id);
    QVERIFY(QFileInfo(directory).isDir());

    manager.kill(id, true);
    QVERIFY(!QFileInfo(directory).exists());
}

void TerminalSessionManagerTest::testCleanRestartIsRecovered()
{
    const QString id = QStringLiteral("t1");
    {
        TerminalSessionManager manager(settings());
        manager.createOrAttach(request(id, _dir->path()));
        manager.write(id, "echo first-$((1+2))\n");
        QTRY_VERIFY_WITH_TIMEOUT(historyContains(manager, id, "first-3"), Timeout);
        manager.shutdown();
    }

    // A cleanly closed recording seeds a fresh shell instead of a cold restore
    TerminalSessionManager manager(settings());
    const CreateOrAttachResult result = manager.createOrAttach(request(id, _dir->path()));
    QVERIFY(result.success);
    QVERIFY(result.isNew);
    QVERIFY(result.wasRecovered);
    QVERIFY(!result.isColdRestore);
    QVERIFY(result.scrollback.contains("first-3"));
}

void TerminalSessionManagerTest::testColdRestore()
{
    const QString id = QStringLiteral("t-cold");
    const QString directory = TerminalHistory::directory(settings().historyRoot, QStringLiteral("ws"), id);
    {
        // A recording that was never finalized: the host died
        HistoryWriter writer(directory, _dir->path(), 80, 24);
        QVERIFY(writer.init());
        writer.writeData("restored screen\r\n\033[?2004h$ ");
        writer.updateMetadata(_dir->path(), 120, 40, TerminalModes());
    }

    TerminalSessionManager manager(settings());
    const CreateOrAttachResult result = manager.createOrAttach(request(id, QString()));
    QVERIFY(result.success);
    QVERIFY(result.isColdRestore);
    QVERIFY(!result.isNew);
    QVERIFY(result.snapshot.has_value());
    QVERIFY(result.snapshot->screenAnsi.startsWith("restored screen"));
    QVERIFY(result.snapshot->modes.bracketedPaste);
    QCOMPARE(result.snapshot->cols, 120);
    QCOMPARE(result.snapshot->rows, 40);
    QCOMPARE(result.previousCwd, _dir->path());
    QVERIFY(!manager.hasSession(id));

    // Stays a cold restore until acknowledged
    QVERIFY(manager.createOrAttach(request(id, QString())).isColdRestore);
    QVERIFY(historyContains(manager, id, "restored screen"));

    manager.ackColdRestore(id);
    QVERIFY(!QFileInfo(directory).exists());

    const CreateOrAttachResult fresh = manager.createOrAttach(request(id, result.previousCwd));
    QVERIFY(fresh.success);
    QVERIFY(fresh.isNew);
    QVERIFY(!fresh.isColdRestore);
    QVERIFY(!fresh.wasRecovered);
    QVERIFY(manager.hasSession(id));
}

void TerminalSessionManagerTest::testSignalFromName_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<int>("signal");

    QTest::newRow("full name") << QStringLiteral("SIGTERM") << int(SIGTERM);
    QTest::newRow("short name") << QStringLiteral("INT") << int(SIGINT);
    QTest::newRow("lower case") << QStringLiteral("sighup") << int(SIGHUP);
    QTest::newRow("number") << QStringLiteral("9") << 9;
    QTest::newRow("unknown") << QStringLiteral("SIGBOGUS") << 0;
}

void TerminalSessionManagerTest::testSignalFromName()
{
    QFETCH(QString, name);
    QFETCH(int, signal);
    QCOMPARE(TerminalSessionManager::signalFromName(name), signal);
}

QTEST_GUILESS_MAIN(TerminalSessionManagerTest)
