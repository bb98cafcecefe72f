/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LOCALHOSTBACKEND_H
#define LOCALHOSTBACKEND_H

#include <QTimer>

#include "HostBackend.h"

namespace Trellis
{

/**
 * HostBackend served directly from a session manager and workspace
 * store living in this process. The daemon dispatches decoded socket
 * requests through it; tests use it without a socket.
 */
class TRELLISPRIVATE_EXPORT LocalHostBackend : public HostBackend
{
    Q_OBJECT
public:
    LocalHostBackend(TerminalSessionManager *sessionManager, WorkspaceStore *store, QObject *parent = nullptr);

    void createOrAttach(const CreateOrAttachRequest &request, CreateOrAttachCallback callback) override;
    void write(const QString &terminalId, const QByteArray &data) override;
    void resize(const QString &terminalId, int cols, int rows) override;
    void signal(const QString &terminalId, const QString &signalName) override;
    void detach(const QString &terminalId) override;
    void kill(const QString &terminalId, bool deleteHistory, ResultCallback callback) override;
    void getHistory(const QString &terminalId, HistoryCallback callback) override;
    void ackColdRestore(const QString &terminalId) override;

    void getWorkspace(const QString &workspaceId, WorkspaceCallback callback) override;
    void createWorkspace(const QString &name, const QString &repoPath, WorkspaceCallback callback) override;
    void createWorktree(const QString &workspaceId, const QString &name, const QString &path, const QString &branch, WorktreeCallback callback) override;
    void setActiveSelection(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback) override;

    void createTab(const CreateTabRequest &request, TabCallback callback) override;
    void moveTab(const MoveTabRequest &request, ResultCallback callback) override;
    void updateLayoutTree(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const PaneLayoutTree::Tree &tree, ResultCallback callback) override;
    void reorderTabs(const QString &workspaceId, const QString &worktreeId, const QString &parentTabId, const QStringList &tabIds, ResultCallback callback) override;
    void deleteTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback) override;
    void renameTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const QString &name, ResultCallback callback) override;

    TerminalSessionManager *sessionManager() const
    {
        return _sessionManager;
    }

    WorkspaceStore *store() const
    {
        return _store;
    }

private:
    template<typename Callback, typename Result>
    void deliver(const Callback &callback, const Result &result)
    {
        if (!callback) {
            return;
        }
        QTimer::singleShot(0, this, [callback, result]() {
            callback(result);
        });
    }

    TerminalSessionManager *_sessionManager;
    WorkspaceStore *_store;
};

} // namespace Trellis

#endif // LOCALHOSTBACKEND_H
