/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTGATEWAY_H
#define HOSTGATEWAY_H

#include <QByteArray>

#include <functional>
#include <map>

#include "HostBackend.h"
#include "HostProtocol.h"

class QLocalSocket;

namespace Trellis
{

/**
 * Client side of the host connection.
 *
 * Requests are numbered and their replies matched back to the pending
 * callback by id. When the socket goes away every pending callback
 * fails and disconnected() is emitted; terminals should then be treated
 * as detached, not closed.
 */
class TRELLISPRIVATE_EXPORT HostGateway : public HostBackend
{
    Q_OBJECT
public:
    explicit HostGateway(QObject *parent = nullptr);
    ~HostGateway() override;

    void connectToHost(const QString &socketName);
    void disconnectFromHost();
    bool isConnected() const;

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

    int pendingRequestCount() const
    {
        return static_cast<int>(_pending.size());
    }

Q_SIGNALS:
    void connected();
    void connectionFailed(const QString &error);

private:
    using ReplyHandler = std::function<void(const HostReply &reply)>;

    void sendRequest(const HostCommand &command, ReplyHandler handler);
    void sendCommand(const HostCommand &command);
    void onReadyRead();
    void onSocketDisconnected();
    void handleMessage(const HostMessage &message);
    void failPending(const QString &error);

    QLocalSocket *_socket;
    QByteArray _buffer;
    quint64 _nextRequestId = 1;
    std::map<quint64, ReplyHandler> _pending;
    bool _wasConnected = false;
};

} // namespace Trellis

#endif // HOSTGATEWAY_H
