/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TABCONTROLLERTEST_H
#define TABCONTROLLERTEST_H

#include <QObject>
#include <QStringList>
#include <QTemporaryDir>

#include <memory>

namespace Trellis
{
class LocalHostBackend;
class TabController;
class TerminalSessionManager;
class WorkspaceStore;

class TabControllerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testLoad();
    void testLoadUnknownWorkspace();
    void testCreateTerminalTabSelectsIt();
    void testSplitTopLevelTabCreatesGroup();
    void testSplitInsideGroup();
    void testSplitGroupRejected();
    void testMoveOutDissolvesGroup();
    void testRejectedMoveLeavesMirror();
    void testRejectedLayoutStepStopsMove();
    void testGroupTabs();
    void testCloseTabReselectsNeighbour();
    void testCloseLastTabClearsSelection();
    void testApplyLayoutEditClosesDroppedPanes();
    void testApplyLayoutEditRejectsForeignPane();
    void testTerminalExitClosesTab();

private:
    bool loadController(TabController &controller) const;
    QString addTab(TabController &controller, const QString &name) const;
    QString splitFirstTab(TabController &controller) const;
    QStringList topLevelIds(const TabController &controller) const;
    bool inSync(const TabController &controller) const;

    std::unique_ptr<QTemporaryDir> _dir;
    std::unique_ptr<WorkspaceStore> _store;
    std::unique_ptr<TerminalSessionManager> _manager;
    std::unique_ptr<LocalHostBackend> _backend;
    QString _workspaceId;
    QString _worktreeId;
};

}

#endif // TABCONTROLLERTEST_H
