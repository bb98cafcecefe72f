/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LocalHostBackend.h"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisHost)

namespace Trellis
{

LocalHostBackend::LocalHostBackend(TerminalSessionManager *sessionManager, WorkspaceStore *store, QObject *parent)
    : HostBackend(parent)
    , _sessionManager(sessionManager)
    , _store(store)
{
    connect(_sessionManager, &TerminalSessionManager::terminalOutput, this, &HostBackend::terminalOutput);
    connect(_sessionManager, &TerminalSessionManager::terminalExited, this, &HostBackend::terminalExited);
    connect(_sessionManager, &TerminalSessionManager::terminalCwdChanged, this, [this](const QString &terminalId, const QString &cwd) {
        _store->updateTerminalCwd(terminalId, cwd);
        Q_EMIT terminalCwdChanged(terminalId, cwd);
    });
}

void LocalHostBackend::createOrAttach(const CreateOrAttachRequest &request, CreateOrAttachCallback callback)
{
    CreateOrAttachRequest resolved = request;
    if (resolved.workspaceId.isEmpty()) {
        resolved.workspaceId = _store->workspaceIdForTab(request.id);
    }
    if (resolved.cwd.isEmpty()) {
        if (auto tab = _store->findTab(request.id)) {
            resolved.cwd = tab->cwd;
        }
    }
    deliver(callback, _sessionManager->createOrAttach(resolved));
}

void LocalHostBackend::write(const QString &terminalId, const QByteArray &data)
{
    _sessionManager->write(terminalId, data);
}

void LocalHostBackend::resize(const QString &terminalId, int cols, int rows)
{
    _sessionManager->resize(terminalId, cols, rows);
}

void LocalHostBackend::signal(const QString &terminalId, const QString &signalName)
{
    _sessionManager->signal(terminalId, signalName);
}

void LocalHostBackend::detach(const QString &terminalId)
{
    _sessionManager->detach(terminalId);
}

void LocalHostBackend::kill(const QString &terminalId, bool deleteHistory, ResultCallback callback)
{
    _sessionManager->kill(terminalId, deleteHistory);
    deliver(callback, OperationResult::ok());
}

void LocalHostBackend::getHistory(const QString &terminalId, HistoryCallback callback)
{
    HistoryResult result;
    if (auto scrollback = _sessionManager->getHistory(terminalId)) {
        result.success = true;
        result.scrollback = *scrollback;
    } else {
        result.error = QStringLiteral("Terminal not found");
    }
    deliver(callback, result);
}

void LocalHostBackend::ackColdRestore(const QString &terminalId)
{
    _sessionManager->ackColdRestore(terminalId);
}

void LocalHostBackend::getWorkspace(const QString &workspaceId, WorkspaceCallback callback)
{
    WorkspaceResult result;
    if (auto workspace = _store->workspace(workspaceId)) {
        result.success = true;
        result.workspace = *workspace;
    } else {
        result.error = QStringLiteral("Workspace not found");
    }
    deliver(callback, result);
}

void LocalHostBackend::createWorkspace(const QString &name, const QString &repoPath, WorkspaceCallback callback)
{
    deliver(callback, _store->createWorkspace(name, repoPath));
}

void LocalHostBackend::createWorktree(const QString &workspaceId, const QString &name, const QString &path, const QString &branch, WorktreeCallback callback)
{
    deliver(callback, _store->createWorktree(workspaceId, name, path, branch));
}

void LocalHostBackend::setActiveSelection(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback)
{
    deliver(callback, _store->setActiveSelection(workspaceId, worktreeId, tabId));
}

void LocalHostBackend::createTab(const CreateTabRequest &request, TabCallback callback)
{
    deliver(callback, _store->createTab(request));
}

void LocalHostBackend::moveTab(const MoveTabRequest &request, ResultCallback callback)
{
    deliver(callback, _store->moveTab(request));
}

void LocalHostBackend::updateLayoutTree(const QString &workspaceId,
                                        const QString &worktreeId,
                                        const QString &tabId,
                                        const PaneLayoutTree::Tree &tree,
                                        ResultCallback callback)
{
    deliver(callback, _store->updateLayoutTree(workspaceId, worktreeId, tabId, tree));
}

void LocalHostBackend::reorderTabs(const QString &workspaceId, const QString &worktreeId, const QString &parentTabId, const QStringList &tabIds, ResultCallback callback)
{
    deliver(callback, _store->reorderTabs(workspaceId, worktreeId, parentTabId, tabIds));
}

void LocalHostBackend::deleteTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback)
{
    const auto workspace = _store->workspace(workspaceId);
    const Worktree *worktree = workspace ? WorkspaceModel::findWorktree(*workspace, worktreeId) : nullptr;
    const Tab *tab = worktree ? WorkspaceModel::findTab(worktree->tabs, tabId) : nullptr;
    if (!tab) {
        deliver(callback, OperationResult::failure(QStringLiteral("Tab not found")));
        return;
    }

    // Sessions go first, then the tab leaves its group's layout.
    const QStringList terminalIds = WorkspaceModel::terminalIdsIn(*tab);
    for (const QString &terminalId : terminalIds) {
        _sessionManager->kill(terminalId, true);
    }

    const OperationResult deleted = _store->deleteTab(workspaceId, worktreeId, tabId);
    if (!deleted.success) {
        qCWarning(lcTrellisHost) << "tab.delete of" << tabId << "failed:" << deleted.error;
        deliver(callback, OperationResult::failure(deleted.error));
        return;
    }
    deliver(callback, OperationResult::ok());
}

void LocalHostBackend::renameTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const QString &name, ResultCallback callback)
{
    deliver(callback, _store->renameTab(workspaceId, worktreeId, tabId, name));
}

} // namespace Trellis

#include "moc_LocalHostBackend.cpp"
