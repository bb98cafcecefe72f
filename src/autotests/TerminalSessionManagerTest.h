/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALSESSIONMANAGERTEST_H
#define TERMINALSESSIONMANAGERTEST_H

#include <QObject>
#include <QTemporaryDir>

#include <memory>

namespace Trellis
{
struct SessionManagerSettings;

class TerminalSessionManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testEmptyIdRejected();
    void testPathLikeIdsRejected_data();
    void testPathLikeIdsRejected();
    void testKillWithPathLikeIdKeepsHistory();
    void testOversizedDimensionsClamped();
    void testCreateNewSession();
    void testReattachReturnsSameScrollback();
    void testReattachAppliesSize();
    void testOutputSignal();
    void testInitialCommandsRun();
    void testExitedSessionStaysAddressable();
    void testSignalTerminates();
    void testKillForgetsSessionSilently();
    void testKillDeletesHistory();
    void testCleanRestartIsRecovered();
    void testColdRestore();
    void testSignalFromName_data();
    void testSignalFromName();

private:
    SessionManagerSettings settings() const;

    std::unique_ptr<QTemporaryDir> _dir;
};

}

#endif // TERMINALSESSIONMANAGERTEST_H
