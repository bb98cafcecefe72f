/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALRESIZECOORDINATORTEST_H
#define TERMINALRESIZECOORDINATORTEST_H

#include <QObject>

namespace Trellis
{
class TerminalResizeCoordinatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testWritePassesThroughWhenIdle();
    void testOutputQueuedDuringResize();
    void testResizeBurstDebounced();
    void testUnchangedSizeNotSent();
    void testInvalidProposalIgnored();
    void testInitialSetupSuppressesResize();
    void testInitialSetupReleaseSendsChangedSize();
    void testStopDropsQueue();
};

}

#endif // TERMINALRESIZECOORDINATORTEST_H
