/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceModel.h"

#include <QSet>

namespace Trellis
{

bool Tab::operator==(const Tab &other) const
{
    return id == other.id && type == other.type && name == other.name && cwd == other.cwd && command == other.command && createdAt == other.createdAt
        && tabs == other.tabs && layoutTree == other.layoutTree && layoutInvalid == other.layoutInvalid;
}

bool Worktree::operator==(const Worktree &other) const
{
    return id == other.id && name == other.name && path == other.path && branch == other.branch && tabs == other.tabs;
}

bool Workspace::operator==(const Workspace &other) const
{
    return id == other.id && name == other.name && repoPath == other.repoPath && worktrees == other.worktrees && activeSelection == other.activeSelection
        && updatedAt == other.updatedAt;
}

Worktree *WorkspaceModel::findWorktree(Workspace &workspace, const QString &worktreeId)
{
    for (auto &worktree : workspace.worktrees) {
        if (worktree.id == worktreeId) {
            return &worktree;
        }
    }
    return nullptr;
}

const Worktree *WorkspaceModel::findWorktree(const Workspace &workspace, const QString &worktreeId)
{
    for (const auto &worktree : workspace.worktrees) {
        if (worktree.id == worktreeId) {
            return &worktree;
        }
    }
    return nullptr;
}

Tab *WorkspaceModel::findTab(QList<Tab> &tabs, const QString &tabId)
{
    for (auto &tab : tabs) {
        if (tab.id == tabId) {
            return &tab;
        }
        if (tab.isGroup()) {
            if (Tab *found = findTab(tab.tabs, tabId)) {
                return found;
            }
        }
    }
    return nullptr;
}

const Tab *WorkspaceModel::findTab(const QList<Tab> &tabs, const QString &tabId)
{
    for (const auto &tab : tabs) {
        if (tab.id == tabId) {
            return &tab;
        }
        if (tab.isGroup()) {
            if (const Tab *found = findTab(tab.tabs, tabId)) {
                return found;
            }
        }
    }
    return nullptr;
}

Tab *WorkspaceModel::findParentTab(QList<Tab> &tabs, const QString &tabId)
{
    for (auto &tab : tabs) {
        if (!tab.isGroup()) {
            continue;
        }
        for (const auto &child : std::as_const(tab.tabs)) {
            if (child.id == tabId) {
                return &tab;
            }
        }
        if (Tab *found = findParentTab(tab.tabs, tabId)) {
            return found;
        }
    }
    return nullptr;
}

const Tab *WorkspaceModel::findParentTab(const QList<Tab> &tabs, const QString &tabId)
{
    for (const auto &tab : tabs) {
        if (!tab.isGroup()) {
            continue;
        }
        for (const auto &child : tab.tabs) {
            if (child.id == tabId) {
                return &tab;
            }
        }
        if (const Tab *found = findParentTab(tab.tabs, tabId)) {
            return found;
        }
    }
    return nullptr;
}

QList<Tab> *WorkspaceModel::siblingsOf(Worktree &worktree, const QString &tabId, int *index)
{
    Tab *parent = findParentTab(worktree.tabs, tabId);
    QList<Tab> *siblings = parent ? &parent->tabs : &worktree.tabs;
    for (int i = 0; i < siblings->size(); ++i) {
        if (siblings->at(i).id == tabId) {
            if (index) {
                *index = i;
            }
            return siblings;
        }
    }
    return nullptr;
}

QString WorkspaceModel::worktreeIdForTab(const Workspace &workspace, const QString &tabId)
{
    for (const auto &worktree : workspace.worktrees) {
        if (findTab(worktree.tabs, tabId)) {
            return worktree.id;
        }
    }
    return QString();
}

QStringList WorkspaceModel::terminalIdsIn(const Tab &tab)
{
    QStringList ids;
    if (tab.type == TabType::Terminal) {
        ids.append(tab.id);
    }
    for (const auto &child : tab.tabs) {
        ids.append(terminalIdsIn(child));
    }
    return ids;
}

bool WorkspaceModel::isValidParent(const Tab *tab)
{
    return tab && tab->isGroup();
}

OperationResult WorkspaceModel::addTab(Worktree &worktree, const Tab &tab, const QString &parentTabId)
{
    if (findTab(worktree.tabs, tab.id)) {
        return OperationResult::failure(QStringLiteral("Tab id already in use"));
    }

    if (parentTabId.isEmpty()) {
        worktree.tabs.append(tab);
        return OperationResult::ok();
    }

    Tab *parent = findTab(worktree.tabs, parentTabId);
    if (!isValidParent(parent)) {
        return OperationResult::failure(QStringLiteral("Parent tab not found or not a group"));
    }
    if (tab.isGroup()) {
        return OperationResult::failure(QStringLiteral("Cannot create group tab inside another group tab"));
    }
    parent->tabs.append(tab);
    return OperationResult::ok();
}

OperationResult WorkspaceModel::moveTab(Worktree &worktree, const QString &tabId, const QString &sourceParentTabId, const QString &targetParentTabId, int targetIndex)
{
    QList<Tab> *sourceTabs = &worktree.tabs;
    if (!sourceParentTabId.isEmpty()) {
        Tab *sourceParent = findTab(worktree.tabs, sourceParentTabId);
        if (!isValidParent(sourceParent)) {
            return OperationResult::failure(QStringLiteral("Source parent tab not found"));
        }
        sourceTabs = &sourceParent->tabs;
    }

    int sourceIndex = -1;
    for (int i = 0; i < sourceTabs->size(); ++i) {
        if (sourceTabs->at(i).id == tabId) {
            sourceIndex = i;
            break;
        }
    }
    if (sourceIndex < 0) {
        return OperationResult::failure(QStringLiteral("Tab not found in source"));
    }

    if (!targetParentTabId.isEmpty()) {
        if (targetParentTabId == tabId) {
            return OperationResult::failure(QStringLiteral("Cannot move a tab into itself"));
        }
        const Tab *targetParent = findTab(worktree.tabs, targetParentTabId);
        if (!isValidParent(targetParent)) {
            return OperationResult::failure(QStringLiteral("Target parent tab not found"));
        }
        if (sourceTabs->at(sourceIndex).isGroup()) {
            return OperationResult::failure(QStringLiteral("Cannot move a group tab into another group tab"));
        }
    }

    Tab moved = sourceTabs->takeAt(sourceIndex);

    // Resolve the target only after the take: the source list may be the
    // worktree list, which shifts every group pointer behind sourceIndex.
    QList<Tab> *targetTabs = &worktree.tabs;
    if (!targetParentTabId.isEmpty()) {
        targetTabs = &findTab(worktree.tabs, targetParentTabId)->tabs;
    }
    targetTabs->insert(qBound(0, targetIndex, int(targetTabs->size())), moved);

    removeEmptyGroups(worktree.tabs);
    return OperationResult::ok();
}

OperationResult WorkspaceModel::setLayoutTree(Worktree &worktree, const QString &tabId, const PaneLayoutTree::Tree &tree)
{
    Tab *tab = findTab(worktree.tabs, tabId);
    if (!tab) {
        return OperationResult::failure(QStringLiteral("Tab not found"));
    }
    if (!tab->isGroup()) {
        return OperationResult::failure(QStringLiteral("Tab is not a group"));
    }
    if (!PaneLayoutTree::isWellFormed(tree)) {
        return OperationResult::failure(QStringLiteral("Layout tree is malformed"));
    }

    tab->layoutTree = tree;
    tab->layoutInvalid = false;
    return OperationResult::ok();
}

OperationResult WorkspaceModel::reorderTabs(Worktree &worktree, const QString &parentTabId, const QStringList &tabIds)
{
    QList<Tab> *tabs = &worktree.tabs;
    if (!parentTabId.isEmpty()) {
        Tab *parent = findTab(worktree.tabs, parentTabId);
        if (!isValidParent(parent)) {
            return OperationResult::failure(QStringLiteral("Parent tab not found or not a group"));
        }
        tabs = &parent->tabs;
    }

    QList<Tab> reordered;
    reordered.reserve(tabs->size());
    for (const QString &id : tabIds) {
        for (const auto &tab : std::as_const(*tabs)) {
            if (tab.id == id) {
                reordered.append(tab);
                break;
            }
        }
    }

    if (reordered.size() != tabs->size() || QSet<QString>(tabIds.begin(), tabIds.end()).size() != tabIds.size()) {
        return OperationResult::failure(QStringLiteral("Tab count mismatch during reorder"));
    }

    *tabs = reordered;
    return OperationResult::ok();
}

OperationResult WorkspaceModel::deleteTab(Worktree &worktree, const QString &tabId)
{
    Tab *parent = findParentTab(worktree.tabs, tabId);
    if (parent && parent->layoutTree.has_value()) {
        parent->layoutTree = PaneLayoutTree::remove(parent->layoutTree, tabId);
    }

    if (!removeTabRecursive(worktree.tabs, tabId)) {
        return OperationResult::failure(QStringLiteral("Tab not found"));
    }

    removeEmptyGroups(worktree.tabs);
    return OperationResult::ok();
}

OperationResult WorkspaceModel::renameTab(Worktree &worktree, const QString &tabId, const QString &name)
{
    Tab *tab = findTab(worktree.tabs, tabId);
    if (!tab) {
        return OperationResult::failure(QStringLiteral("Tab not found"));
    }
    tab->name = name;
    return OperationResult::ok();
}

bool WorkspaceModel::removeTabRecursive(QList<Tab> &tabs, const QString &tabId)
{
    for (int i = 0; i < tabs.size(); ++i) {
        if (tabs.at(i).id == tabId) {
            tabs.removeAt(i);
            return true;
        }
        if (tabs.at(i).isGroup() && removeTabRecursive(tabs[i].tabs, tabId)) {
            return true;
        }
    }
    return false;
}

int WorkspaceModel::removeEmptyGroups(QList<Tab> &tabs)
{
    int removed = 0;
    for (int i = tabs.size() - 1; i >= 0; --i) {
        if (!tabs.at(i).isGroup()) {
            continue;
        }
        removed += removeEmptyGroups(tabs[i].tabs);
        if (tabs.at(i).tabs.isEmpty()) {
            tabs.removeAt(i);
            ++removed;
        }
    }
    return removed;
}

std::optional<ActiveSelection> WorkspaceModel::resolveSelection(const Workspace &workspace)
{
    if (!workspace.activeSelection.has_value()) {
        return std::nullopt;
    }

    const ActiveSelection &selection = *workspace.activeSelection;
    const Worktree *worktree = findWorktree(workspace, selection.worktreeId);
    if (!worktree) {
        return std::nullopt;
    }
    if (!selection.tabId.isEmpty() && !findTab(worktree->tabs, selection.tabId)) {
        return std::nullopt;
    }
    return selection;
}

QString WorkspaceModel::typeName(TabType type)
{
    switch (type) {
    case TabType::Terminal:
        return QStringLiteral("terminal");
    case TabType::Group:
        return QStringLiteral("group");
    case TabType::Other:
        break;
    }
    return QStringLiteral("other");
}

TabType WorkspaceModel::typeFromName(const QString &name)
{
    if (name == QLatin1String("terminal")) {
        return TabType::Terminal;
    }
    if (name == QLatin1String("group")) {
        return TabType::Group;
    }
    return TabType::Other;
}

} // namespace Trellis
