/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostConfigTest.h"

#include <QFile>
#include <QTemporaryDir>
#include <QTest>

#include "../host/HostConfig.h"

using namespace Trellis;

void HostConfigTest::testMissingFileGivesDefaults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const HostConfig config = HostConfig::load(dir.filePath(QStringLiteral("absent.conf")));
    const HostConfig defaults = HostConfig::defaults();
    QCOMPARE(config.socketName, QStringLiteral("trellis-host"));
    QCOMPARE(config.stateDirectory, defaults.stateDirectory);
    QCOMPARE(config.defaultCols, 80);
    QCOMPARE(config.defaultRows, 24);
    QCOMPARE(config.scrollbackLines, 10000);
    QCOMPARE(config.initialCommandDelay, 500);
    QVERIFY(config.shell.isEmpty());
}

void HostConfigTest::testSaveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("host.conf"));

    HostConfig config;
    config.socketName = QStringLiteral("custom-socket");
    config.stateDirectory = dir.filePath(QStringLiteral("state"));
    config.shell = QStringLiteral("/bin/sh");
    config.defaultCols = 132;
    config.defaultRows = 43;
    config.scrollbackLines = 500;
    config.replayBytesToRead = 4096;
    config.initialCommandDelay = 0;
    QVERIFY(config.save(path));

    const HostConfig loaded = HostConfig::load(path);
    QCOMPARE(loaded.socketName, config.socketName);
    QCOMPARE(loaded.stateDirectory, config.stateDirectory);
    QCOMPARE(loaded.shell, config.shell);
    QCOMPARE(loaded.defaultCols, 132);
    QCOMPARE(loaded.defaultRows, 43);
    QCOMPARE(loaded.scrollbackLines, 500);
    QCOMPARE(loaded.replayBytesToRead, qint64(4096));
    QCOMPARE(loaded.initialCommandDelay, 0);
}

void HostConfigTest::testOutOfRangeValuesClamped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("host.conf"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("[terminal]\ndefaultCols=0\ndefaultRows=-5\ninitialCommandDelay=-1\n");
    file.close();

    const HostConfig config = HostConfig::load(path);
    QCOMPARE(config.defaultCols, 1);
    QCOMPARE(config.defaultRows, 1);
    QCOMPARE(config.initialCommandDelay, 0);
}

void HostConfigTest::testSessionManagerSettings()
{
    HostConfig config;
    config.stateDirectory = QStringLiteral("/var/lib/trellis");
    config.shell = QStringLiteral("/bin/zsh");
    config.scrollbackBytes = 2048;

    QCOMPARE(config.historyRoot(), QStringLiteral("/var/lib/trellis/terminal-history"));
    QCOMPARE(config.workspaceStatePath(), QStringLiteral("/var/lib/trellis/workspaces.json"));

    const SessionManagerSettings settings = config.sessionManagerSettings();
    QCOMPARE(settings.historyRoot, config.historyRoot());
    QCOMPARE(settings.shell, QStringLiteral("/bin/zsh"));
    QCOMPARE(settings.scrollbackBytes, 2048);
    QCOMPARE(settings.defaultCols, 80);
}

QTEST_GUILESS_MAIN(HostConfigTest)
