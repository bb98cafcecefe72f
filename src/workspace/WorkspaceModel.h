/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACEMODEL_H
#define WORKSPACEMODEL_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "layout/PaneLayoutTree.h"
#include "trellisprivate_export.h"

namespace Trellis
{

enum class TabType { Terminal, Group, Other };

struct TRELLISPRIVATE_EXPORT Tab {
    QString id;
    TabType type = TabType::Terminal;
    QString name;
    QString cwd;
    QString command;
    QDateTime createdAt;

    // group only
    QList<Tab> tabs;
    PaneLayoutTree::Tree layoutTree;
    bool layoutInvalid = false;

    bool isGroup() const
    {
        return type == TabType::Group;
    }

    bool operator==(const Tab &other) const;
};

struct TRELLISPRIVATE_EXPORT Worktree {
    QString id;
    QString name;
    QString path;
    QString branch;
    QList<Tab> tabs;

    bool operator==(const Worktree &other) const;
};

struct ActiveSelection {
    QString worktreeId;
    QString tabId;

    bool operator==(const ActiveSelection &other) const
    {
        return worktreeId == other.worktreeId && tabId == other.tabId;
    }
};

struct TRELLISPRIVATE_EXPORT Workspace {
    QString id;
    QString name;
    QString repoPath;
    QList<Worktree> worktrees;
    std::optional<ActiveSelection> activeSelection;
    QDateTime updatedAt;

    bool operator==(const Workspace &other) const;
};

struct OperationResult {
    bool success = true;
    QString error;

    static OperationResult ok()
    {
        return {};
    }

    static OperationResult failure(const QString &error)
    {
        return {false, error};
    }
};

/**
 * Structural edits on the workspace → worktree → tab hierarchy.
 *
 * Both the host's persisted store and the client-side mirror apply
 * edits through these functions so the two stay identical once the
 * host has acknowledged a request.
 */
class TRELLISPRIVATE_EXPORT WorkspaceModel
{
public:
    static Worktree *findWorktree(Workspace &workspace, const QString &worktreeId);
    static const Worktree *findWorktree(const Workspace &workspace, const QString &worktreeId);

    static Tab *findTab(QList<Tab> &tabs, const QString &tabId);
    static const Tab *findTab(const QList<Tab> &tabs, const QString &tabId);

    /** The group holding @p tabId, or nullptr for a top-level (or unknown) tab. */
    static Tab *findParentTab(QList<Tab> &tabs, const QString &tabId);
    static const Tab *findParentTab(const QList<Tab> &tabs, const QString &tabId);

    /** Sibling list containing @p tabId and its index there. */
    static QList<Tab> *siblingsOf(Worktree &worktree, const QString &tabId, int *index = nullptr);

    /** Worktree id owning @p tabId, searched across the workspace. */
    static QString worktreeIdForTab(const Workspace &workspace, const QString &tabId);

    /** The tab and every terminal tab nested under it. */
    static QStringList terminalIdsIn(const Tab &tab);

    static bool isValidParent(const Tab *tab);

    static OperationResult addTab(Worktree &worktree, const Tab &tab, const QString &parentTabId);
    static OperationResult moveTab(Worktree &worktree, const QString &tabId, const QString &sourceParentTabId, const QString &targetParentTabId, int targetIndex);
    static OperationResult setLayoutTree(Worktree &worktree, const QString &tabId, const PaneLayoutTree::Tree &tree);
    static OperationResult reorderTabs(Worktree &worktree, const QString &parentTabId, const QStringList &tabIds);
    static OperationResult deleteTab(Worktree &worktree, const QString &tabId);
    static OperationResult renameTab(Worktree &worktree, const QString &tabId, const QString &name);

    /** Drops group tabs without children. Returns the number removed. */
    static int removeEmptyGroups(QList<Tab> &tabs);

    /** Selection if it still points at an existing tab, otherwise nullopt. */
    static std::optional<ActiveSelection> resolveSelection(const Workspace &workspace);

    static QString typeName(TabType type);
    static TabType typeFromName(const QString &name);

private:
    static bool removeTabRecursive(QList<Tab> &tabs, const QString &tabId);
};

} // namespace Trellis

#endif // WORKSPACEMODEL_H
