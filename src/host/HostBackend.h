/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTBACKEND_H
#define HOSTBACKEND_H

#include <QByteArray>
#include <QObject>
#include <QStringList>

#include <functional>

#include "session/TerminalSessionManager.h"
#include "workspace/WorkspaceStore.h"
#include "trellisprivate_export.h"

namespace Trellis
{

struct HistoryResult {
    bool success = false;
    QString error;
    QByteArray scrollback;
};

/**
 * Everything a client can ask of the host.
 *
 * Request/response operations complete through a callback that is never
 * invoked synchronously from inside the call. write, resize, signal,
 * detach and ackColdRestore are fire-and-forget.
 */
class TRELLISPRIVATE_EXPORT HostBackend : public QObject
{
    Q_OBJECT
public:
    using CreateOrAttachCallback = std::function<void(const CreateOrAttachResult &result)>;
    using HistoryCallback = std::function<void(const HistoryResult &result)>;
    using ResultCallback = std::function<void(const OperationResult &result)>;
    using TabCallback = std::function<void(const TabResult &result)>;
    using WorkspaceCallback = std::function<void(const WorkspaceResult &result)>;
    using WorktreeCallback = std::function<void(const WorktreeResult &result)>;

    explicit HostBackend(QObject *parent = nullptr);
    ~HostBackend() override;

    // terminal.*
    virtual void createOrAttach(const CreateOrAttachRequest &request, CreateOrAttachCallback callback) = 0;
    virtual void write(const QString &terminalId, const QByteArray &data) = 0;
    virtual void resize(const QString &terminalId, int cols, int rows) = 0;
    virtual void signal(const QString &terminalId, const QString &signalName) = 0;
    virtual void detach(const QString &terminalId) = 0;
    virtual void kill(const QString &terminalId, bool deleteHistory, ResultCallback callback) = 0;
    virtual void getHistory(const QString &terminalId, HistoryCallback callback) = 0;
    virtual void ackColdRestore(const QString &terminalId) = 0;

    // workspace.* / worktree.*
    virtual void getWorkspace(const QString &workspaceId, WorkspaceCallback callback) = 0;
    virtual void createWorkspace(const QString &name, const QString &repoPath, WorkspaceCallback callback) = 0;
    virtual void createWorktree(const QString &workspaceId, const QString &name, const QString &path, const QString &branch, WorktreeCallback callback) = 0;
    virtual void setActiveSelection(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback) = 0;

    // tab.*
    virtual void createTab(const CreateTabRequest &request, TabCallback callback) = 0;
    virtual void moveTab(const MoveTabRequest &request, ResultCallback callback) = 0;
    virtual void updateLayoutTree(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const PaneLayoutTree::Tree &tree, ResultCallback callback) = 0;
    virtual void reorderTabs(const QString &workspaceId, const QString &worktreeId, const QString &parentTabId, const QStringList &tabIds, ResultCallback callback) = 0;
    virtual void deleteTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback) = 0;
    virtual void renameTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const QString &name, ResultCallback callback) = 0;

Q_SIGNALS:
    // sequence orders the chunk against CreateOrAttachResult::outputSequence
    void terminalOutput(const QString &terminalId, const QByteArray &data, quint64 sequence);
    void terminalExited(const QString &terminalId, int exitCode, int signal);
    void terminalCwdChanged(const QString &terminalId, const QString &cwd);
    void disconnected();
};

} // namespace Trellis

#endif // HOSTBACKEND_H
