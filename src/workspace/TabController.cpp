/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TabController.h"

#include "host/HostBackend.h"

#include <QLoggingCategory>
#include <QPointer>

#include <utility>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisWorkspace)

namespace Trellis
{

namespace
{
// Host callbacks may outlive the controller.
template<typename Fn>
auto guarded(QObject *owner, Fn fn)
{
    return [owner = QPointer<QObject>(owner), fn](auto &&...args) {
        if (owner) {
            fn(std::forward<decltype(args)>(args)...);
        }
    };
}

int indexIn(const QList<Tab> &tabs, const QString &tabId)
{
    for (int i = 0; i < tabs.size(); ++i) {
        if (tabs.at(i).id == tabId) {
            return i;
        }
    }
    return -1;
}
}

TabController::TabController(HostBackend *backend, QObject *parent)
    : QObject(parent)
    , _backend(backend)
{
    connect(_backend, &HostBackend::terminalExited, this, [this](const QString &terminalId) {
        onTerminalExited(terminalId);
    });
    connect(_backend, &HostBackend::terminalCwdChanged, this, [this](const QString &terminalId, const QString &cwd) {
        for (auto &worktree : _workspace.worktrees) {
            if (Tab *tab = WorkspaceModel::findTab(worktree.tabs, terminalId)) {
                tab->cwd = cwd;
                return;
            }
        }
    });
}

void TabController::load(const QString &workspaceId)
{
    _backend->getWorkspace(workspaceId, guarded(this, [this](const WorkspaceResult &result) {
                               if (!result.success) {
                                   fail(QStringLiteral("workspace.get"), result.error);
                                   return;
                               }
                               _workspace = result.workspace;
                               _workspace.activeSelection = WorkspaceModel::resolveSelection(_workspace);
                               qCDebug(lcTrellisWorkspace) << "Loaded workspace" << _workspace.id << "with" << _workspace.worktrees.size() << "worktree(s)";
                               Q_EMIT workspaceLoaded();
                           }));
}

void TabController::select(const QString &worktreeId, const QString &tabId)
{
    if (worktreeId.isEmpty()) {
        _workspace.activeSelection.reset();
    } else {
        if (!worktree(worktreeId) || (!tabId.isEmpty() && !findTab(worktreeId, tabId))) {
            qCWarning(lcTrellisWorkspace) << "Cannot select unknown tab" << tabId << "in" << worktreeId;
            return;
        }
        _workspace.activeSelection = ActiveSelection{worktreeId, tabId};
    }
    Q_EMIT selectionChanged(worktreeId, tabId);

    _backend->setActiveSelection(_workspace.id, worktreeId, tabId, [](const OperationResult &result) {
        if (!result.success) {
            qCWarning(lcTrellisWorkspace) << "Persisting the selection failed:" << result.error;
        }
    });
}

void TabController::createTerminalTab(const QString &worktreeId, const QString &name, const QString &parentTabId)
{
    CreateTabRequest request;
    request.workspaceId = _workspace.id;
    request.worktreeId = worktreeId;
    request.name = name;
    request.type = TabType::Terminal;
    request.parentTabId = parentTabId;

    _backend->createTab(request, guarded(this, [this, worktreeId, parentTabId](const TabResult &result) {
                            if (!result.success) {
                                fail(QStringLiteral("tab.create"), result.error);
                                return;
                            }
                            Worktree *wt = worktree(worktreeId);
                            if (!wt) {
                                return;
                            }
                            applyOrReload(WorkspaceModel::addTab(*wt, result.tab, parentTabId));
                            Q_EMIT workspaceChanged();

                            const QString tabId = result.tab.id;
                            if (parentTabId.isEmpty()) {
                                select(worktreeId, tabId);
                                return;
                            }
                            const Tab *group = findTab(worktreeId, parentTabId);
                            updateLayout(worktreeId, parentTabId, PaneLayoutTree::insert(group ? group->layoutTree : std::nullopt, tabId), [this, worktreeId, tabId]() {
                                select(worktreeId, tabId);
                            });
                        }));
}

void TabController::splitTab(const QString &worktreeId, const QString &tabId, SplitDirection direction)
{
    const Tab *tab = findTab(worktreeId, tabId);
    if (!tab) {
        fail(QStringLiteral("split"), QStringLiteral("Tab not found"));
        return;
    }
    if (tab->isGroup()) {
        fail(QStringLiteral("split"), QStringLiteral("Cannot split a group tab"));
        return;
    }

    const QString parentId = parentIdOf(worktreeId, tabId);
    if (!parentId.isEmpty()) {
        createInGroup(worktreeId, parentId, tabId, direction);
        return;
    }

    groupIntoNewGroup(worktreeId, {tabId}, [this, worktreeId, tabId, direction](const QString &groupId) {
        createInGroup(worktreeId, groupId, tabId, direction);
    });
}

void TabController::groupTabs(const QString &worktreeId, const QString &targetTabId, const QString &draggedTabId)
{
    if (targetTabId == draggedTabId) {
        return;
    }
    const Tab *target = findTab(worktreeId, targetTabId);
    const Tab *dragged = findTab(worktreeId, draggedTabId);
    if (!target || !dragged) {
        fail(QStringLiteral("group"), QStringLiteral("Tab not found"));
        return;
    }
    if (dragged->isGroup()) {
        fail(QStringLiteral("group"), QStringLiteral("Cannot move a group tab into another group tab"));
        return;
    }

    QString groupId = target->isGroup() ? targetTabId : parentIdOf(worktreeId, targetTabId);
    if (!groupId.isEmpty()) {
        if (groupId == parentIdOf(worktreeId, draggedTabId)) {
            return;
        }
        const Tab *group = findTab(worktreeId, groupId);
        moveTabInternal(worktreeId, draggedTabId, groupId, int(group->tabs.size()), [this, worktreeId, draggedTabId]() {
            select(worktreeId, draggedTabId);
        });
        return;
    }

    groupIntoNewGroup(worktreeId, {targetTabId, draggedTabId}, [this, worktreeId](const QString &newGroupId) {
        select(worktreeId, newGroupId);
    });
}

void TabController::moveTab(const QString &worktreeId, const QString &tabId, const QString &targetParentTabId, int targetIndex)
{
    moveTabInternal(worktreeId, tabId, targetParentTabId, targetIndex, nullptr);
}

void TabController::moveTabInternal(const QString &worktreeId, const QString &tabId, const QString &targetParentTabId, int targetIndex, std::function<void()> done)
{
    const Tab *tab = findTab(worktreeId, tabId);
    if (!tab) {
        fail(QStringLiteral("tab.move"), QStringLiteral("Tab not found"));
        return;
    }
    if (!targetParentTabId.isEmpty()) {
        const Tab *target = findTab(worktreeId, targetParentTabId);
        if (!WorkspaceModel::isValidParent(target)) {
            fail(QStringLiteral("tab.move"), QStringLiteral("Target parent tab not found"));
            return;
        }
        if (tab->isGroup()) {
            fail(QStringLiteral("tab.move"), QStringLiteral("Cannot move a group tab into another group tab"));
            return;
        }
    }

    MoveTabRequest request;
    request.workspaceId = _workspace.id;
    request.worktreeId = worktreeId;
    request.tabId = tabId;
    request.sourceParentTabId = parentIdOf(worktreeId, tabId);
    request.targetParentTabId = targetParentTabId;
    request.targetIndex = targetIndex;

    // 1. ownership
    _backend->moveTab(request, guarded(this, [this, request, done](const OperationResult &result) {
                          if (!result.success) {
                              fail(QStringLiteral("tab.move"), result.error);
                              return;
                          }
                          Worktree *wt = worktree(request.worktreeId);
                          if (!wt) {
                              return;
                          }
                          applyOrReload(WorkspaceModel::moveTab(*wt, request.tabId, request.sourceParentTabId, request.targetParentTabId, request.targetIndex));
                          Q_EMIT workspaceChanged();

                          const bool crossesGroups = request.sourceParentTabId != request.targetParentTabId;
                          auto removeFromSource = [this, request, crossesGroups, done]() {
                              // 3. source tree
                              if (crossesGroups && !request.sourceParentTabId.isEmpty()) {
                                  removeFromSourceGroup(request.worktreeId, request.sourceParentTabId, request.tabId, done);
                              } else if (done) {
                                  done();
                              }
                          };

                          // 2. target tree
                          const Tab *target = request.targetParentTabId.isEmpty() ? nullptr : findTab(request.worktreeId, request.targetParentTabId);
                          if (crossesGroups && target) {
                              updateLayout(request.worktreeId, request.targetParentTabId, PaneLayoutTree::insert(target->layoutTree, request.tabId), removeFromSource);
                          } else {
                              removeFromSource();
                          }
                      }));
}

void TabController::removeFromSourceGroup(const QString &worktreeId, const QString &sourceGroupId, const QString &tabId, std::function<void()> done)
{
    const Tab *group = findTab(worktreeId, sourceGroupId);
    if (!group) {
        // Emptied by the move and removed together with it.
        if (done) {
            done();
        }
        return;
    }

    const int remaining = int(group->tabs.size());
    updateLayout(worktreeId, sourceGroupId, PaneLayoutTree::remove(group->layoutTree, tabId), [this, worktreeId, sourceGroupId, remaining, done]() {
        if (remaining <= 1) {
            dissolveGroup(worktreeId, sourceGroupId, done);
        } else if (done) {
            done();
        }
    });
}

void TabController::dissolveGroup(const QString &worktreeId, const QString &groupTabId, std::function<void()> done)
{
    Worktree *wt = worktree(worktreeId);
    const Tab *group = findTab(worktreeId, groupTabId);
    if (!wt || !group || group->tabs.isEmpty()) {
        if (done) {
            done();
        }
        return;
    }

    MoveTabRequest request;
    request.workspaceId = _workspace.id;
    request.worktreeId = worktreeId;
    request.tabId = group->tabs.first().id;
    request.sourceParentTabId = groupTabId;
    request.targetIndex = qMax(0, indexIn(wt->tabs, groupTabId));

    qCDebug(lcTrellisWorkspace) << "Dissolving group" << groupTabId << "into" << request.tabId;

    _backend->moveTab(request, guarded(this, [this, request, done](const OperationResult &result) {
                          if (!result.success) {
                              fail(QStringLiteral("tab.move"), result.error);
                              return;
                          }
                          Worktree *wt = worktree(request.worktreeId);
                          if (!wt) {
                              return;
                          }
                          applyOrReload(WorkspaceModel::moveTab(*wt, request.tabId, request.sourceParentTabId, QString(), request.targetIndex));
                          Q_EMIT workspaceChanged();

                          const auto selection = _workspace.activeSelection;
                          if (selection && selection->tabId == request.sourceParentTabId) {
                              select(request.worktreeId, request.tabId);
                          }
                          if (done) {
                              done();
                          }
                      }));
}

void TabController::groupIntoNewGroup(const QString &worktreeId, const QStringList &tabIds, std::function<void(const QString &groupId)> done)
{
    Worktree *wt = worktree(worktreeId);
    if (!wt || tabIds.isEmpty()) {
        return;
    }
    const int position = qMax(0, indexIn(wt->tabs, tabIds.first()));

    CreateTabRequest request;
    request.workspaceId = _workspace.id;
    request.worktreeId = worktreeId;
    request.type = TabType::Group;

    _backend->createTab(request, guarded(this, [this, worktreeId, tabIds, position, done](const TabResult &result) {
                            if (!result.success) {
                                fail(QStringLiteral("tab.create"), result.error);
                                return;
                            }
                            Worktree *wt = worktree(worktreeId);
                            if (!wt) {
                                return;
                            }
                            applyOrReload(WorkspaceModel::addTab(*wt, result.tab, QString()));
                            Q_EMIT workspaceChanged();

                            const QString groupId = result.tab.id;
                            moveIntoGroup(worktreeId, tabIds, groupId, [this, worktreeId, groupId, position, done]() {
                                // The group was appended; put it where the first tab was.
                                moveTabInternal(worktreeId, groupId, QString(), position, [groupId, done]() {
                                    if (done) {
                                        done(groupId);
                                    }
                                });
                            });
                        }));
}

void TabController::moveIntoGroup(const QString &worktreeId, QStringList tabIds, const QString &groupTabId, std::function<void()> done)
{
    if (tabIds.isEmpty()) {
        if (done) {
            done();
        }
        return;
    }
    const Tab *group = findTab(worktreeId, groupTabId);
    if (!group) {
        fail(QStringLiteral("group"), QStringLiteral("Group tab not found"));
        return;
    }

    const QString tabId = tabIds.takeFirst();
    moveTabInternal(worktreeId, tabId, groupTabId, int(group->tabs.size()), [this, worktreeId, tabIds, groupTabId, done]() {
        moveIntoGroup(worktreeId, tabIds, groupTabId, done);
    });
}

void TabController::createInGroup(const QString &worktreeId, const QString &groupTabId, const QString &copyFromTabId, SplitDirection direction)
{
    CreateTabRequest request;
    request.workspaceId = _workspace.id;
    request.worktreeId = worktreeId;
    request.type = TabType::Terminal;
    request.parentTabId = groupTabId;
    request.copyFromTabId = copyFromTabId;

    _backend->createTab(request, guarded(this, [this, worktreeId, groupTabId, copyFromTabId, direction](const TabResult &result) {
                            if (!result.success) {
                                fail(QStringLiteral("tab.create"), result.error);
                                return;
                            }
                            Worktree *wt = worktree(worktreeId);
                            if (!wt) {
                                return;
                            }
                            applyOrReload(WorkspaceModel::addTab(*wt, result.tab, groupTabId));
                            Q_EMIT workspaceChanged();

                            const Tab *group = findTab(worktreeId, groupTabId);
                            if (!group) {
                                return;
                            }
                            const QString newId = result.tab.id;
                            updateLayout(worktreeId,
                                         groupTabId,
                                         PaneLayoutTree::splitPane(group->layoutTree, copyFromTabId, newId, direction),
                                         [this, worktreeId, newId]() {
                                             select(worktreeId, newId);
                                         });
                        }));
}

void TabController::updateLayout(const QString &worktreeId, const QString &groupTabId, const PaneLayoutTree::Tree &tree, std::function<void()> done)
{
    _backend->updateLayoutTree(_workspace.id, worktreeId, groupTabId, tree, guarded(this, [this, worktreeId, groupTabId, tree, done](const OperationResult &result) {
                                   if (!result.success) {
                                       fail(QStringLiteral("tab.updateLayoutTree"), result.error);
                                       return;
                                   }
                                   Worktree *wt = worktree(worktreeId);
                                   if (!wt) {
                                       return;
                                   }
                                   applyOrReload(WorkspaceModel::setLayoutTree(*wt, groupTabId, tree));
                                   Q_EMIT workspaceChanged();
                                   if (done) {
                                       done();
                                   }
                               }));
}

void TabController::closeTab(const QString &worktreeId, const QString &tabId)
{
    Worktree *wt = worktree(worktreeId);
    if (!wt || !findTab(worktreeId, tabId)) {
        fail(QStringLiteral("tab.delete"), QStringLiteral("Tab not found"));
        return;
    }

    const QString parentId = parentIdOf(worktreeId, tabId);
    int closedIndex = 0;
    WorkspaceModel::siblingsOf(*wt, tabId, &closedIndex);
    const int parentIndex = parentId.isEmpty() ? closedIndex : indexIn(wt->tabs, parentId);

    // The host kills the session before it drops the pane from the layout.
    _backend->deleteTab(_workspace.id, worktreeId, tabId, guarded(this, [this, worktreeId, tabId, parentId, closedIndex, parentIndex](const OperationResult &result) {
                            if (!result.success) {
                                fail(QStringLiteral("tab.delete"), result.error);
                                return;
                            }
                            Worktree *wt = worktree(worktreeId);
                            if (!wt) {
                                return;
                            }
                            applyOrReload(WorkspaceModel::deleteTab(*wt, tabId));
                            Q_EMIT tabClosed(tabId);
                            Q_EMIT workspaceChanged();
                            reselectAfterClose(worktreeId, tabId, parentId, closedIndex, parentIndex);
                        }));
}

void TabController::reselectAfterClose(const QString &worktreeId, const QString &closedTabId, const QString &parentTabId, int closedIndex, int parentIndex)
{
    const auto selection = _workspace.activeSelection;
    if (!selection || selection->worktreeId != worktreeId) {
        return;
    }
    if (selection->tabId != closedTabId && (selection->tabId.isEmpty() || findTab(worktreeId, selection->tabId))) {
        return;
    }

    const Worktree *wt = worktree(worktreeId);
    const Tab *parent = parentTabId.isEmpty() ? nullptr : findTab(worktreeId, parentTabId);
    const QList<Tab> &siblings = parent ? parent->tabs : wt->tabs;
    // A group emptied by the close is gone; fall back to its slot.
    const int index = (parent || parentTabId.isEmpty()) ? closedIndex : parentIndex;

    if (siblings.isEmpty()) {
        select(QString(), QString());
        return;
    }
    select(worktreeId, siblings.at(qBound(0, index, int(siblings.size()) - 1)).id);
}

void TabController::applyLayoutEdit(const QString &worktreeId, const QString &groupTabId, const PaneLayoutTree::Tree &tree)
{
    const Tab *group = findTab(worktreeId, groupTabId);
    if (!group || !group->isGroup()) {
        fail(QStringLiteral("layout"), QStringLiteral("Tab is not a group"));
        return;
    }
    if (!PaneLayoutTree::isWellFormed(tree)) {
        fail(QStringLiteral("layout"), QStringLiteral("Layout tree is malformed"));
        return;
    }

    const QStringList panes = PaneLayoutTree::paneIds(tree);
    QStringList dropped;
    for (const auto &child : group->tabs) {
        if (!panes.contains(child.id)) {
            dropped.append(child.id);
        }
    }
    for (const QString &pane : panes) {
        if (indexIn(group->tabs, pane) < 0) {
            fail(QStringLiteral("layout"), QStringLiteral("Layout references a tab outside the group"));
            return;
        }
    }

    updateLayout(worktreeId, groupTabId, tree, [this, worktreeId, dropped]() {
        for (const QString &tabId : dropped) {
            closeTab(worktreeId, tabId);
        }
    });
}

void TabController::onTerminalExited(const QString &terminalId)
{
    const QString worktreeId = WorkspaceModel::worktreeIdForTab(_workspace, terminalId);
    if (worktreeId.isEmpty()) {
        return;
    }
    qCInfo(lcTrellisWorkspace) << "Terminal" << terminalId << "exited, closing its tab";
    closeTab(worktreeId, terminalId);
}

void TabController::applyOrReload(const OperationResult &result)
{
    if (result.success) {
        return;
    }
    // The host accepted what the mirror rejects: the two diverged.
    qCWarning(lcTrellisWorkspace) << "Local mirror out of sync (" << result.error << "), reloading";
    load(_workspace.id);
}

void TabController::fail(const QString &operation, const QString &error)
{
    qCWarning(lcTrellisWorkspace) << operation << "failed:" << error;
    Q_EMIT operationFailed(error);
}

Worktree *TabController::worktree(const QString &worktreeId)
{
    return WorkspaceModel::findWorktree(_workspace, worktreeId);
}

Tab *TabController::findTab(const QString &worktreeId, const QString &tabId)
{
    Worktree *wt = worktree(worktreeId);
    return wt ? WorkspaceModel::findTab(wt->tabs, tabId) : nullptr;
}

QString TabController::parentIdOf(const QString &worktreeId, const QString &tabId)
{
    Worktree *wt = worktree(worktreeId);
    if (!wt) {
        return QString();
    }
    const Tab *parent = WorkspaceModel::findParentTab(wt->tabs, tabId);
    return parent ? parent->id : QString();
}

} // namespace Trellis

#include "moc_TabController.cpp"
