/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESTORE_H
#define WORKSPACESTORE_H

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "WorkspaceModel.h"
#include "trellisprivate_export.h"

namespace Trellis
{

struct CreateTabRequest {
    QString workspaceId;
    QString worktreeId;
    QString name;
    TabType type = TabType::Terminal;
    QString parentTabId;
    QString copyFromTabId;
    QString command;
    QString cwd;
};

struct MoveTabRequest {
    QString workspaceId;
    QString worktreeId;
    QString tabId;
    QString sourceParentTabId;
    QString targetParentTabId;
    int targetIndex = 0;
};

struct TabResult {
    bool success = false;
    QString error;
    Tab tab;
};

struct WorkspaceResult {
    bool success = false;
    QString error;
    Workspace workspace;
};

struct WorktreeResult {
    bool success = false;
    QString error;
    Worktree worktree;
};

/**
 * Host-side owner of the persisted workspace hierarchy.
 *
 * Every successful mutation is written through to a single JSON file
 * with QSaveFile. Concurrent edits from several clients are applied in
 * arrival order; the last write wins.
 */
class TRELLISPRIVATE_EXPORT WorkspaceStore
{
public:
    explicit WorkspaceStore(const QString &filePath);

    bool load();
    bool save() const;

    QString filePath() const
    {
        return _filePath;
    }

    const QList<Workspace> &workspaces() const
    {
        return _workspaces;
    }

    std::optional<Workspace> workspace(const QString &workspaceId) const;
    QString workspaceIdForTab(const QString &tabId) const;
    std::optional<Tab> findTab(const QString &tabId) const;

    WorkspaceResult createWorkspace(const QString &name, const QString &repoPath);
    WorktreeResult createWorktree(const QString &workspaceId, const QString &name, const QString &path, const QString &branch);

    TabResult createTab(const CreateTabRequest &request);
    OperationResult moveTab(const MoveTabRequest &request);
    OperationResult updateLayoutTree(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const PaneLayoutTree::Tree &tree);
    OperationResult reorderTabs(const QString &workspaceId, const QString &worktreeId, const QString &parentTabId, const QStringList &tabIds);
    OperationResult deleteTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId);
    OperationResult renameTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const QString &name);
    OperationResult setActiveSelection(const QString &workspaceId, const QString &worktreeId, const QString &tabId);

    /** Records a terminal's new working directory. Returns false for unknown tabs. */
    bool updateTerminalCwd(const QString &tabId, const QString &cwd);

    static QString createId();

private:
    Workspace *findWorkspace(const QString &workspaceId);
    Worktree *findWorktree(const QString &workspaceId, const QString &worktreeId, QString *error);
    void commit(Workspace &workspace);

    QString _filePath;
    QList<Workspace> _workspaces;
};

} // namespace Trellis

#endif // WORKSPACESTORE_H
