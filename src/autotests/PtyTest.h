/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PTYTEST_H
#define PTYTEST_H

#include <QObject>

namespace Trellis
{
class PtyTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testMissingShell();
    void testReadsAreCapped();
    void testEventLoopServedDuringFlood();
};

}

#endif // PTYTEST_H
