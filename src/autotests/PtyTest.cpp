/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PtyTest.h"

#include <QDir>
#include <QProcessEnvironment>
#include <QSignalSpy>
#include <QTest>
#include <QTimer>

#include "../session/Pty.h"

using namespace Trellis;

namespace
{

const int Timeout = 10000;

bool startShell(Pty &pty, const QString &command)
{
    return pty.start(QStringLiteral("/bin/sh"),
                     {QStringLiteral("-c"), command},
                     QDir::tempPath(),
                     QProcessEnvironment::systemEnvironment().toStringList(),
                     80,
                     24);
}

}

void PtyTest::testMissingShell()
{
    Pty pty;
    QVERIFY(!pty.start(QStringLiteral("/nonexistent/shell"), {}, QDir::tempPath(), {}, 80, 24));
    QVERIFY(pty.errorString().contains(QStringLiteral("/nonexistent/shell")));
    QVERIFY(!pty.isRunning());
}

void PtyTest::testReadsAreCapped()
{
    Pty pty;
    qsizetype total = 0;
    qsizetype largest = 0;
    connect(&pty, &Pty::receivedData, this, [&total, &largest](const QByteArray &data) {
        total += data.size();
        largest = qMax(largest, data.size());
    });
    QSignalSpy finishedSpy(&pty, &Pty::finished);

    // NUL bytes pass the line discipline unchanged
    QVERIFY2(startShell(pty, QStringLiteral("head -c 1000000 /dev/zero")), qPrintable(pty.errorString()));
    QVERIFY(finishedSpy.wait(Timeout));

    QCOMPARE(finishedSpy.first().at(0).toInt(), 0);
    QCOMPARE(total, qsizetype(1000000));
    QVERIFY(largest <= Pty::MaxReadPerActivation);
}

void PtyTest::testEventLoopServedDuringFlood()
{
    Pty pty;
    qsizetype total = 0;
    connect(&pty, &Pty::receivedData, this, [&total](const QByteArray &data) {
        total += data.size();
    });

    int ticks = 0;
    QTimer timer;
    timer.setInterval(10);
    connect(&timer, &QTimer::timeout, this, [&ticks]() {
        ++ticks;
    });

    QVERIFY2(startShell(pty, QStringLiteral("exec yes")), qPrintable(pty.errorString()));
    QTRY_VERIFY_WITH_TIMEOUT(total > 0, Timeout);

    timer.start();
    QTRY_VERIFY_WITH_TIMEOUT(ticks >= 5, Timeout);
    QVERIFY(pty.isRunning());

    QSignalSpy finishedSpy(&pty, &Pty::finished);
    pty.terminate();
    QVERIFY(finishedSpy.wait(Timeout));
}

QTEST_GUILESS_MAIN(PtyTest)
