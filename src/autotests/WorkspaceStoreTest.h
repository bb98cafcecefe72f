/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESTORETEST_H
#define WORKSPACESTORETEST_H

#include <QObject>
#include <QTemporaryDir>

#include <memory>

namespace Trellis
{
class WorkspaceStore;

class WorkspaceStoreTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testLoadMissingFileIsEmpty();
    void testLoadCorruptFileFails();
    void testCreateWorkspaceAndWorktree();
    void testCreateTabDefaults();
    void testCreateTabCopiesCwd();
    void testCreateTabRejectsNestedGroup();
    void testCreateTabUnknownParent();
    void testMoveTabIntoGroup();
    void testMoveTabOutOfGroupDropsEmptyGroup();
    void testMoveGroupIntoGroupRejected();
    void testMoveTabIntoItselfRejected();
    void testReorderTabs();
    void testReorderTabsCountMismatch();
    void testDeleteGroupCascades();
    void testDeleteChildUpdatesLayout();
    void testDeleteSelectedTabClearsSelection();
    void testUpdateLayoutTreeRejectsDuplicates();
    void testSelectionValidation();
    void testRenameTab();
    void testUpdateTerminalCwd();
    void testPersistenceRoundTrip();
    void testUnreadableLayoutMarkedInvalid();

private:
    QString statePath() const;
    void createFixture();

    std::unique_ptr<QTemporaryDir> _dir;
    std::unique_ptr<WorkspaceStore> _store;
    QString _workspaceId;
    QString _worktreeId;
};

}

#endif // WORKSPACESTORETEST_H
