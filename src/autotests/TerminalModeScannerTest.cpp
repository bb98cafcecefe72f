/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalModeScannerTest.h"

#include <QTest>

#include "../session/TerminalModeScanner.h"
#include "../session/TerminalSnapshot.h"

using namespace Trellis;

void TerminalModeScannerTest::testDefaults()
{
    TerminalModeScanner scanner;
    const TerminalModes &modes = scanner.modes();
    QVERIFY(!modes.alternateScreen);
    QVERIFY(modes.cursorVisible);
    QVERIFY(modes.autoWrap);
    QVERIFY(!modes.bracketedPaste);
    QVERIFY(modes == TerminalModes());

    QVERIFY(!scanner.feed("plain text\r\n").has_value());
    QVERIFY(scanner.modes() == TerminalModes());
}

void TerminalModeScannerTest::testPrivateModes_data()
{
    QTest::addColumn<QByteArray>("input");
    QTest::addColumn<QString>("mode");
    QTest::addColumn<bool>("expected");

    QTest::newRow("alternate screen 1049") << QByteArray("\033[?1049h") << QStringLiteral("alternateScreen") << true;
    QTest::newRow("alternate screen 47") << QByteArray("\033[?47h") << QStringLiteral("alternateScreen") << true;
    QTest::newRow("hide cursor") << QByteArray("\033[?25l") << QStringLiteral("cursorVisible") << false;
    QTest::newRow("app cursor keys") << QByteArray("\033[?1h") << QStringLiteral("appCursorKeys") << true;
    QTest::newRow("no autowrap") << QByteArray("\033[?7l") << QStringLiteral("autoWrap") << false;
    QTest::newRow("bracketed paste") << QByteArray("\033[?2004h") << QStringLiteral("bracketedPaste") << true;
    QTest::newRow("focus") << QByteArray("\033[?1004h") << QStringLiteral("focusReporting") << true;
    QTest::newRow("mouse") << QByteArray("\033[?1000h") << QStringLiteral("mouseStandard") << true;
    QTest::newRow("mouse button") << QByteArray("\033[?1002h") << QStringLiteral("mouseButton") << true;
    QTest::newRow("mouse any") << QByteArray("\033[?1003h") << QStringLiteral("mouseAny") << true;
    QTest::newRow("mouse sgr") << QByteArray("\033[?1006h") << QStringLiteral("mouseSGR") << true;
    QTest::newRow("set then reset") << QByteArray("\033[?2004h\033[?2004l") << QStringLiteral("bracketedPaste") << false;
}

void TerminalModeScannerTest::testPrivateModes()
{
    QFETCH(QByteArray, input);
    QFETCH(QString, mode);
    QFETCH(bool, expected);

    TerminalModeScanner scanner;
    scanner.feed(input);
    const QJsonObject modes = scanner.modes().toJson();
    QVERIFY(modes.contains(mode));
    QCOMPARE(modes.value(mode).toBool(), expected);
}

void TerminalModeScannerTest::testMultipleParameters()
{
    TerminalModeScanner scanner;
    scanner.feed("\033[?1000;1006;25l");

    QVERIFY(!scanner.modes().mouseStandard);
    QVERIFY(!scanner.modes().mouseSGR);
    QVERIFY(!scanner.modes().cursorVisible);

    scanner.feed("\033[?1000;1006h");
    QVERIFY(scanner.modes().mouseStandard);
    QVERIFY(scanner.modes().mouseSGR);
}

void TerminalModeScannerTest::testInsertMode()
{
    TerminalModeScanner scanner;
    scanner.feed("\033[4h");
    QVERIFY(scanner.modes().insertMode);
    // Private 4 is not insert mode
    scanner.feed("\033[?4l");
    QVERIFY(scanner.modes().insertMode);
    scanner.feed("\033[4l");
    QVERIFY(!scanner.modes().insertMode);
}

void TerminalModeScannerTest::testKeypadMode()
{
    TerminalModeScanner scanner;
    scanner.feed("\033=");
    QVERIFY(scanner.modes().appKeypad);
    scanner.feed("\033>");
    QVERIFY(!scanner.modes().appKeypad);
}

void TerminalModeScannerTest::testSequenceSplitAcrossFeeds()
{
    TerminalModeScanner scanner;
    scanner.feed("abc\033");
    scanner.feed("[?10");
    QVERIFY(!scanner.modes().alternateScreen);
    scanner.feed("49h tail");
    QVERIFY(scanner.modes().alternateScreen);
}

void TerminalModeScannerTest::testResetSequence()
{
    TerminalModeScanner scanner;
    scanner.feed("\033[?1049h\033[?25l\033[?2004h");
    QVERIFY(scanner.modes() != TerminalModes());

    scanner.feed("\033c");
    QVERIFY(scanner.modes() == TerminalModes());
}

void TerminalModeScannerTest::testOsc7_data()
{
    QTest::addColumn<QByteArray>("input");
    QTest::addColumn<QString>("cwd");

    QTest::newRow("bel terminated") << QByteArray("\033]7;file://host/home/user\a") << QStringLiteral("/home/user");
    QTest::newRow("st terminated") << QByteArray("\033]7;file://host/tmp\033\\") << QStringLiteral("/tmp");
    QTest::newRow("no host") << QByteArray("\033]7;file:///var/log\a") << QStringLiteral("/var/log");
    QTest::newRow("percent encoded") << QByteArray("\033]7;file://host/tmp/with%20space\a") << QStringLiteral("/tmp/with space");
    QTest::newRow("bare path") << QByteArray("\033]7;/srv/data\a") << QStringLiteral("/srv/data");
    QTest::newRow("last wins") << QByteArray("\033]7;file:///a\a\033]7;file:///b\a") << QStringLiteral("/b");
}

void TerminalModeScannerTest::testOsc7()
{
    QFETCH(QByteArray, input);
    QFETCH(QString, cwd);

    TerminalModeScanner scanner;
    const auto reported = scanner.feed(QByteArray("prompt ") + input + " $ ");
    QVERIFY(reported.has_value());
    QCOMPARE(*reported, cwd);
}

void TerminalModeScannerTest::testOsc7SplitAcrossFeeds()
{
    TerminalModeScanner scanner;
    QVERIFY(!scanner.feed("\033]7;file://ho").has_value());
    const auto reported = scanner.feed("st/opt\a");
    QVERIFY(reported.has_value());
    QCOMPARE(*reported, QStringLiteral("/opt"));
}

void TerminalModeScannerTest::testOtherOscIgnored()
{
    TerminalModeScanner scanner;
    QVERIFY(!scanner.feed("\033]0;window title\a").has_value());
    QVERIFY(!scanner.feed("\033]7;http://host/path\a").has_value());
    QVERIFY(!TerminalModeScanner::parseOsc7("8;;https://example.org").has_value());
}

void TerminalModeScannerTest::testDcsPayloadIgnored()
{
    TerminalModeScanner scanner;
    // Mode-like bytes inside a DCS string are not sequences
    scanner.feed("\033P[?1049h\033\\");
    QVERIFY(!scanner.modes().alternateScreen);
    scanner.feed("\033[?1049h");
    QVERIFY(scanner.modes().alternateScreen);
}

void TerminalModeScannerTest::testSnapshotRehydrate()
{
    TerminalModeScanner scanner;
    scanner.feed("\033[?1049h\033[?25l\033[?2004h\033[?1h");

    TerminalSnapshot snapshot;
    snapshot.modes = scanner.modes();
    const QByteArray sequences = snapshot.rehydrateSequences();

    QVERIFY(sequences.contains("\033[?25l"));
    QVERIFY(sequences.contains("\033[?2004h"));
    QVERIFY(sequences.contains("\033[?1h"));
    QVERIFY(!sequences.contains("\033[?1049h"));

    // Default modes need nothing
    QVERIFY(TerminalSnapshot().rehydrateSequences().isEmpty());
}

QTEST_GUILESS_MAIN(TerminalModeScannerTest)
