/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALHISTORYTEST_H
#define TERMINALHISTORYTEST_H

#include <QObject>

namespace Trellis
{
class TerminalHistoryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testScrollbackLineLimit();
    void testScrollbackByteLimitKeepsUtf8();
    void testScrollbackClear();
    void testDirectoryLayout();
    void testWriteAndReadBack();
    void testUnfinishedRecordingIsRestorable();
    void testFinalizeRecordsExit();
    void testReadLatestKeepsTail();
    void testReadLatestSkipsMalformedLines();
    void testMarkEnded();
    void testCleanup();
    void testMissingRecording();
};

}

#endif // TERMINALHISTORYTEST_H
