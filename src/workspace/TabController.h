/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TABCONTROLLER_H
#define TABCONTROLLER_H

#include <QObject>
#include <QStringList>

#include <functional>

#include "WorkspaceModel.h"
#include "trellisprivate_export.h"

namespace Trellis
{

class HostBackend;

/**
 * Client-side mirror of one workspace and the structural operations a
 * user performs on it.
 *
 * Every edit is requested from the host first; the mirror changes only
 * after the host acknowledged it, and a rejected step stops the
 * remaining steps of that operation. A terminal that exits on its own
 * is closed exactly like a user close.
 */
class TRELLISPRIVATE_EXPORT TabController : public QObject
{
    Q_OBJECT
public:
    explicit TabController(HostBackend *backend, QObject *parent = nullptr);

    void load(const QString &workspaceId);

    const Workspace &workspace() const
    {
        return _workspace;
    }

    bool isLoaded() const
    {
        return !_workspace.id.isEmpty();
    }

    std::optional<ActiveSelection> selection() const
    {
        return _workspace.activeSelection;
    }

    void select(const QString &worktreeId, const QString &tabId);

    void createTerminalTab(const QString &worktreeId, const QString &name = QString(), const QString &parentTabId = QString());

    /** Splits @p tabId, grouping it first when it is not in a group yet. */
    void splitTab(const QString &worktreeId, const QString &tabId, SplitDirection direction = SplitDirection::Row);

    /** Drops @p draggedTabId onto @p targetTabId (a group, or a tab to group with). */
    void groupTabs(const QString &worktreeId, const QString &targetTabId, const QString &draggedTabId);

    /** Ownership move, then target tree insert, then source tree remove. */
    void moveTab(const QString &worktreeId, const QString &tabId, const QString &targetParentTabId, int targetIndex);

    void closeTab(const QString &worktreeId, const QString &tabId);

    /** Persists a user-edited layout. Panes dropped from the tree close their tabs. */
    void applyLayoutEdit(const QString &worktreeId, const QString &groupTabId, const PaneLayoutTree::Tree &tree);

Q_SIGNALS:
    void workspaceLoaded();
    void workspaceChanged();
    void selectionChanged(const QString &worktreeId, const QString &tabId);
    void tabClosed(const QString &tabId);
    void operationFailed(const QString &error);

private:
    Worktree *worktree(const QString &worktreeId);
    Tab *findTab(const QString &worktreeId, const QString &tabId);
    QString parentIdOf(const QString &worktreeId, const QString &tabId);

    void fail(const QString &operation, const QString &error);
    void onTerminalExited(const QString &terminalId);

    void moveTabInternal(const QString &worktreeId, const QString &tabId, const QString &targetParentTabId, int targetIndex, std::function<void()> done);
    void updateLayout(const QString &worktreeId, const QString &groupTabId, const PaneLayoutTree::Tree &tree, std::function<void()> done);
    void removeFromSourceGroup(const QString &worktreeId, const QString &sourceGroupId, const QString &tabId, std::function<void()> done);
    void dissolveGroup(const QString &worktreeId, const QString &groupTabId, std::function<void()> done);
    void moveIntoGroup(const QString &worktreeId, QStringList tabIds, const QString &groupTabId, std::function<void()> done);
    void groupIntoNewGroup(const QString &worktreeId, const QStringList &tabIds, std::function<void(const QString &groupId)> done);
    void createInGroup(const QString &worktreeId, const QString &groupTabId, const QString &copyFromTabId, SplitDirection direction);
    void reselectAfterClose(const QString &worktreeId, const QString &closedTabId, const QString &parentTabId, int closedIndex, int parentIndex);
    void applyOrReload(const OperationResult &result);

    HostBackend *_backend;
    Workspace _workspace;
};

} // namespace Trellis

#endif // TABCONTROLLER_H
