/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceStore.h"

#include "WorkspaceJson.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QUuid>

Q_LOGGING_CATEGORY(lcTrellisWorkspace, "trellis.workspace")

namespace Trellis
{

static const int StateFormatVersion = 1;

WorkspaceStore::WorkspaceStore(const QString &filePath)
    : _filePath(filePath)
{
}

QString WorkspaceStore::createId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

bool WorkspaceStore::load()
{
    _workspaces.clear();

    QFile file(_filePath);
    if (!file.exists()) {
        qCDebug(lcTrellisWorkspace) << "No workspace state at" << _filePath;
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCCritical(lcTrellisWorkspace) << "Cannot read workspace state" << _filePath << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qCCritical(lcTrellisWorkspace) << "Workspace state is corrupt:" << parseError.errorString();
        return false;
    }

    const QJsonObject root = document.object();
    const int version = root.value(QStringLiteral("version")).toInt(StateFormatVersion);
    if (version > StateFormatVersion) {
        qCWarning(lcTrellisWorkspace) << "Workspace state version" << version << "is newer than supported";
    }

    _workspaces = WorkspaceJson::workspacesFromJson(root.value(QStringLiteral("workspaces")).toArray());
    for (auto &workspace : _workspaces) {
        workspace.activeSelection = WorkspaceModel::resolveSelection(workspace);
    }
    qCDebug(lcTrellisWorkspace) << "Loaded" << _workspaces.size() << "workspaces from" << _filePath;
    return true;
}

bool WorkspaceStore::save() const
{
    const QFileInfo info(_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        qCCritical(lcTrellisWorkspace) << "Cannot create state directory" << info.absolutePath();
        return false;
    }

    QJsonObject root;
    root.insert(QStringLiteral("version"), StateFormatVersion);
    root.insert(QStringLiteral("workspaces"), WorkspaceJson::toJson(_workspaces));

    QSaveFile file(_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCCritical(lcTrellisWorkspace) << "Cannot write workspace state" << _filePath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCCritical(lcTrellisWorkspace) << "Failed to commit workspace state" << _filePath << file.errorString();
        return false;
    }
    return true;
}

std::optional<Workspace> WorkspaceStore::workspace(const QString &workspaceId) const
{
    for (const auto &workspace : _workspaces) {
        if (workspace.id == workspaceId) {
            return workspace;
        }
    }
    return std::nullopt;
}

QString WorkspaceStore::workspaceIdForTab(const QString &tabId) const
{
    for (const auto &workspace : _workspaces) {
        if (!WorkspaceModel::worktreeIdForTab(workspace, tabId).isEmpty()) {
            return workspace.id;
        }
    }
    return QString();
}

std::optional<Tab> WorkspaceStore::findTab(const QString &tabId) const
{
    for (const auto &workspace : _workspaces) {
        for (const auto &worktree : workspace.worktrees) {
            if (const Tab *tab = WorkspaceModel::findTab(worktree.tabs, tabId)) {
                return *tab;
            }
        }
    }
    return std::nullopt;
}

Workspace *WorkspaceStore::findWorkspace(const QString &workspaceId)
{
    for (auto &workspace : _workspaces) {
        if (workspace.id == workspaceId) {
            return &workspace;
        }
    }
    return nullptr;
}

Worktree *WorkspaceStore::findWorktree(const QString &workspaceId, const QString &worktreeId, QString *error)
{
    Workspace *workspace = findWorkspace(workspaceId);
    if (!workspace) {
        *error = QStringLiteral("Workspace not found");
        return nullptr;
    }
    Worktree *worktree = WorkspaceModel::findWorktree(*workspace, worktreeId);
    if (!worktree) {
        *error = QStringLiteral("Worktree not found");
        return nullptr;
    }
    return worktree;
}

void WorkspaceStore::commit(Workspace &workspace)
{
    workspace.updatedAt = QDateTime::currentDateTimeUtc();
    // The in-memory state stays authoritative if the write fails; the
    // next successful mutation persists it.
    save();
}

WorkspaceResult WorkspaceStore::createWorkspace(const QString &name, const QString &repoPath)
{
    WorkspaceResult result;
    Workspace workspace;
    workspace.id = createId();
    workspace.name = name.isEmpty() ? QFileInfo(repoPath).fileName() : name;
    workspace.repoPath = repoPath;
    _workspaces.append(workspace);
    commit(_workspaces.last());

    result.success = true;
    result.workspace = _workspaces.last();
    return result;
}

WorktreeResult WorkspaceStore::createWorktree(const QString &workspaceId, const QString &name, const QString &path, const QString &branch)
{
    WorktreeResult result;
    Workspace *workspace = findWorkspace(workspaceId);
    if (!workspace) {
        result.error = QStringLiteral("Workspace not found");
        return result;
    }

    Worktree worktree;
    worktree.id = createId();
    worktree.name = name.isEmpty() ? branch : name;
    worktree.path = path.isEmpty() ? workspace->repoPath : path;
    worktree.branch = branch;
    workspace->worktrees.append(worktree);
    commit(*workspace);

    result.success = true;
    result.worktree = worktree;
    return result;
}

TabResult WorkspaceStore::createTab(const CreateTabRequest &request)
{
    TabResult result;
    Workspace *workspace = findWorkspace(request.workspaceId);
    Worktree *worktree = findWorktree(request.workspaceId, request.worktreeId, &result.error);
    if (!worktree) {
        return result;
    }

    Tab tab;
    tab.id = createId();
    tab.type = request.type;
    tab.cwd = request.cwd;
    tab.command = request.command;
    tab.createdAt = QDateTime::currentDateTimeUtc();

    if (!request.copyFromTabId.isEmpty()) {
        const Tab *source = WorkspaceModel::findTab(worktree->tabs, request.copyFromTabId);
        if (!source) {
            result.error = QStringLiteral("Tab to copy from not found");
            return result;
        }
        if (tab.cwd.isEmpty()) {
            tab.cwd = source->cwd;
        }
        if (tab.command.isEmpty()) {
            tab.command = source->command;
        }
    }

    if (tab.type == TabType::Terminal && tab.cwd.isEmpty()) {
        tab.cwd = worktree->path;
    }

    if (!request.name.isEmpty()) {
        tab.name = request.name;
    } else {
        tab.name = tab.isGroup() ? QStringLiteral("Group") : QStringLiteral("Terminal");
    }

    const OperationResult added = WorkspaceModel::addTab(*worktree, tab, request.parentTabId);
    if (!added.success) {
        qCWarning(lcTrellisWorkspace) << "Rejected tab.create:" << added.error;
        result.error = added.error;
        return result;
    }
    commit(*workspace);

    qCDebug(lcTrellisWorkspace) << "Created" << WorkspaceModel::typeName(tab.type) << "tab" << tab.id << "in worktree" << worktree->id;
    result.success = true;
    result.tab = tab;
    return result;
}

OperationResult WorkspaceStore::moveTab(const MoveTabRequest &request)
{
    QString error;
    Worktree *worktree = findWorktree(request.workspaceId, request.worktreeId, &error);
    if (!worktree) {
        return OperationResult::failure(error);
    }

    const OperationResult moved =
        WorkspaceModel::moveTab(*worktree, request.tabId, request.sourceParentTabId, request.targetParentTabId, request.targetIndex);
    if (!moved.success) {
        qCWarning(lcTrellisWorkspace) << "Rejected tab.move of" << request.tabId << ":" << moved.error;
        return moved;
    }
    commit(*findWorkspace(request.workspaceId));
    return moved;
}

OperationResult WorkspaceStore::updateLayoutTree(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const PaneLayoutTree::Tree &tree)
{
    QString error;
    Worktree *worktree = findWorktree(workspaceId, worktreeId, &error);
    if (!worktree) {
        return OperationResult::failure(error);
    }

    const OperationResult updated = WorkspaceModel::setLayoutTree(*worktree, tabId, tree);
    if (!updated.success) {
        qCWarning(lcTrellisWorkspace) << "Rejected tab.updateLayoutTree of" << tabId << ":" << updated.error;
        return updated;
    }
    commit(*findWorkspace(workspaceId));
    return updated;
}

OperationResult WorkspaceStore::reorderTabs(const QString &workspaceId, const QString &worktreeId, const QString &parentTabId, const QStringList &tabIds)
{
    QString error;
    Worktree *worktree = findWorktree(workspaceId, worktreeId, &error);
    if (!worktree) {
        return OperationResult::failure(error);
    }

    const OperationResult reordered = WorkspaceModel::reorderTabs(*worktree, parentTabId, tabIds);
    if (!reordered.success) {
        qCWarning(lcTrellisWorkspace) << "Rejected tab.reorder:" << reordered.error;
        return reordered;
    }
    commit(*findWorkspace(workspaceId));
    return reordered;
}

OperationResult WorkspaceStore::deleteTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId)
{
    QString error;
    Worktree *worktree = findWorktree(workspaceId, worktreeId, &error);
    if (!worktree) {
        return OperationResult::failure(error);
    }

    const OperationResult deleted = WorkspaceModel::deleteTab(*worktree, tabId);
    if (!deleted.success) {
        return deleted;
    }

    Workspace *workspace = findWorkspace(workspaceId);
    workspace->activeSelection = WorkspaceModel::resolveSelection(*workspace);
    commit(*workspace);

    qCDebug(lcTrellisWorkspace) << "Deleted tab" << tabId;
    return deleted;
}

OperationResult WorkspaceStore::renameTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const QString &name)
{
    QString error;
    Worktree *worktree = findWorktree(workspaceId, worktreeId, &error);
    if (!worktree) {
        return OperationResult::failure(error);
    }

    const OperationResult renamed = WorkspaceModel::renameTab(*worktree, tabId, name);
    if (renamed.success) {
        commit(*findWorkspace(workspaceId));
    }
    return renamed;
}

OperationResult WorkspaceStore::setActiveSelection(const QString &workspaceId, const QString &worktreeId, const QString &tabId)
{
    Workspace *workspace = findWorkspace(workspaceId);
    if (!workspace) {
        return OperationResult::failure(QStringLiteral("Workspace not found"));
    }

    if (worktreeId.isEmpty()) {
        workspace->activeSelection.reset();
    } else {
        const Worktree *worktree = WorkspaceModel::findWorktree(*workspace, worktreeId);
        if (!worktree) {
            return OperationResult::failure(QStringLiteral("Worktree not found"));
        }
        if (!tabId.isEmpty() && !WorkspaceModel::findTab(worktree->tabs, tabId)) {
            return OperationResult::failure(QStringLiteral("Tab not found"));
        }
        workspace->activeSelection = ActiveSelection{worktreeId, tabId};
    }
    commit(*workspace);
    return OperationResult::ok();
}

bool WorkspaceStore::updateTerminalCwd(const QString &tabId, const QString &cwd)
{
    for (auto &workspace : _workspaces) {
        for (auto &worktree : workspace.worktrees) {
            Tab *tab = WorkspaceModel::findTab(worktree.tabs, tabId);
            if (!tab) {
                continue;
            }
            if (tab->cwd != cwd) {
                tab->cwd = cwd;
                commit(workspace);
            }
            return true;
        }
    }
    return false;
}

} // namespace Trellis
