/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostGateway.h"

#include "workspace/WorkspaceJson.h"

#include <QJsonArray>
#include <QLocalSocket>
#include <QLoggingCategory>
#include <QTimer>

#include <type_traits>
#include <utility>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisHost)

namespace Trellis
{

namespace
{
OperationResult toOperationResult(const HostReply &reply)
{
    return reply.ok ? OperationResult::ok() : OperationResult::failure(reply.error);
}

template<typename Result>
Result failedResult(const QString &error)
{
    Result result;
    result.success = false;
    result.error = error;
    return result;
}
}

HostGateway::HostGateway(QObject *parent)
    : HostBackend(parent)
    , _socket(new QLocalSocket(this))
{
    connect(_socket, &QLocalSocket::connected, this, [this]() {
        _wasConnected = true;
        qCDebug(lcTrellisHost) << "Connected to host" << _socket->fullServerName();
        Q_EMIT connected();
    });
    connect(_socket, &QLocalSocket::readyRead, this, &HostGateway::onReadyRead);
    connect(_socket, &QLocalSocket::disconnected, this, &HostGateway::onSocketDisconnected);
    connect(_socket, &QLocalSocket::errorOccurred, this, [this](QLocalSocket::LocalSocketError) {
        if (!_wasConnected) {
            qCWarning(lcTrellisHost) << "Cannot connect to host:" << _socket->errorString();
            Q_EMIT connectionFailed(_socket->errorString());
        }
    });
}

HostGateway::~HostGateway()
{
    _socket->disconnect(this);
    _socket->abort();
}

void HostGateway::connectToHost(const QString &socketName)
{
    _wasConnected = false;
    _buffer.clear();
    _socket->connectToServer(socketName);
}

void HostGateway::disconnectFromHost()
{
    _socket->disconnectFromServer();
}

bool HostGateway::isConnected() const
{
    return _socket->state() == QLocalSocket::ConnectedState;
}

void HostGateway::sendRequest(const HostCommand &command, ReplyHandler handler)
{
    const HostRequest request = command.build(_nextRequestId++);
    if (!isConnected()) {
        qCWarning(lcTrellisHost) << "Not connected, failing" << request.command;
        QTimer::singleShot(0, this, [handler, request]() {
            handler(HostReply{request.id, false, QStringLiteral("Not connected to host"), QJsonValue()});
        });
        return;
    }
    _pending.emplace(request.id, std::move(handler));
    _socket->write(HostProtocol::encode(request));
}

void HostGateway::sendCommand(const HostCommand &command)
{
    const HostRequest request = command.build();
    if (!isConnected()) {
        qCDebug(lcTrellisHost) << "Not connected, dropping" << request.command;
        return;
    }
    _socket->write(HostProtocol::encode(request));
}

void HostGateway::onReadyRead()
{
    _buffer.append(_socket->readAll());

    QList<QByteArray> lines;
    int newline;
    while ((newline = _buffer.indexOf('\n')) >= 0) {
        lines.append(_buffer.left(newline));
        _buffer.remove(0, newline + 1);
    }

    for (const QByteArray &line : std::as_const(lines)) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        const auto message = HostProtocol::decode(line);
        if (!message.has_value()) {
            qCWarning(lcTrellisHost) << "Ignoring malformed message from host:" << line.left(200);
            continue;
        }
        handleMessage(*message);
    }
}

void HostGateway::handleMessage(const HostMessage &message)
{
    std::visit(
        [this](auto &&m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, HostReply>) {
                auto it = _pending.find(m.requestId);
                if (it == _pending.end()) {
                    qCWarning(lcTrellisHost) << "Reply for unknown request" << m.requestId;
                    return;
                }
                ReplyHandler handler = std::move(it->second);
                _pending.erase(it);
                if (handler) {
                    handler(m);
                }
            } else if constexpr (std::is_same_v<T, TerminalOutputEvent>) {
                Q_EMIT terminalOutput(m.terminalId, m.data, m.sequence);
            } else if constexpr (std::is_same_v<T, TerminalExitedEvent>) {
                Q_EMIT terminalExited(m.terminalId, m.exitCode, m.signal);
            } else if constexpr (std::is_same_v<T, TerminalCwdChangedEvent>) {
                Q_EMIT terminalCwdChanged(m.terminalId, m.cwd);
            } else if constexpr (std::is_same_v<T, HostRequest>) {
                qCWarning(lcTrellisHost) << "Host sent a request:" << m.command;
            }
        },
        message);
}

void HostGateway::onSocketDisconnected()
{
    _buffer.clear();
    if (!_wasConnected) {
        return;
    }
    _wasConnected = false;
    qCWarning(lcTrellisHost) << "Lost connection to host," << _pending.size() << "request(s) pending";
    failPending(QStringLiteral("Disconnected from host"));
    Q_EMIT disconnected();
}

void HostGateway::failPending(const QString &error)
{
    std::map<quint64, ReplyHandler> pending;
    pending.swap(_pending);
    for (auto &[id, handler] : pending) {
        if (handler) {
            handler(HostReply{id, false, error, QJsonValue()});
        }
    }
}

void HostGateway::createOrAttach(const CreateOrAttachRequest &request, CreateOrAttachCallback callback)
{
    HostCommand command(QStringLiteral("terminal.createOrAttach"));
    command.args(HostProtocol::toJson(request));
    sendRequest(command, [callback](const HostReply &reply) {
        if (!callback) {
            return;
        }
        if (!reply.ok) {
            callback(failedResult<CreateOrAttachResult>(reply.error));
            return;
        }
        callback(HostProtocol::createOrAttachResultFromJson(reply.result.toObject()));
    });
}

void HostGateway::write(const QString &terminalId, const QByteArray &data)
{
    sendCommand(HostCommand(QStringLiteral("terminal.write")).terminal(terminalId).bytes(QStringLiteral("data"), data));
}

void HostGateway::resize(const QString &terminalId, int cols, int rows)
{
    sendCommand(HostCommand(QStringLiteral("terminal.resize")).terminal(terminalId).arg(QStringLiteral("cols"), cols).arg(QStringLiteral("rows"), rows));
}

void HostGateway::signal(const QString &terminalId, const QString &signalName)
{
    sendCommand(HostCommand(QStringLiteral("terminal.signal")).terminal(terminalId).arg(QStringLiteral("signal"), signalName));
}

void HostGateway::detach(const QString &terminalId)
{
    sendCommand(HostCommand(QStringLiteral("terminal.detach")).terminal(terminalId));
}

void HostGateway::kill(const QString &terminalId, bool deleteHistory, ResultCallback callback)
{
    sendRequest(HostCommand(QStringLiteral("terminal.kill")).terminal(terminalId).arg(QStringLiteral("deleteHistory"), deleteHistory), [callback](const HostReply &reply) {
        if (callback) {
            callback(toOperationResult(reply));
        }
    });
}

void HostGateway::getHistory(const QString &terminalId, HistoryCallback callback)
{
    sendRequest(HostCommand(QStringLiteral("terminal.getHistory")).terminal(terminalId), [callback](const HostReply &reply) {
        if (!callback) {
            return;
        }
        HistoryResult result;
        result.success = reply.ok;
        result.error = reply.error;
        if (reply.ok) {
            result.scrollback = HostProtocol::bytesFromJson(reply.result.toObject().value(QStringLiteral("scrollback")));
        }
        callback(result);
    });
}

void HostGateway::ackColdRestore(const QString &terminalId)
{
    sendCommand(HostCommand(QStringLiteral("terminal.ackColdRestore")).terminal(terminalId));
}

void HostGateway::getWorkspace(const QString &workspaceId, WorkspaceCallback callback)
{
    sendRequest(HostCommand(QStringLiteral("workspace.get")).workspace(workspaceId), [callback](const HostReply &reply) {
        if (!callback) {
            return;
        }
        if (!reply.ok) {
            callback(failedResult<WorkspaceResult>(reply.error));
            return;
        }
        const auto workspace = WorkspaceJson::workspaceFromJson(reply.result.toObject());
        if (!workspace.has_value()) {
            callback(failedResult<WorkspaceResult>(QStringLiteral("Malformed workspace in reply")));
            return;
        }
        callback(WorkspaceResult{true, QString(), *workspace});
    });
}

void HostGateway::createWorkspace(const QString &name, const QString &repoPath, WorkspaceCallback callback)
{
    HostCommand command(QStringLiteral("workspace.create"));
    command.arg(QStringLiteral("name"), name).arg(QStringLiteral("repoPath"), repoPath);
    sendRequest(command, [callback](const HostReply &reply) {
        if (!callback) {
            return;
        }
        const auto workspace = reply.ok ? WorkspaceJson::workspaceFromJson(reply.result.toObject()) : std::nullopt;
        if (!workspace.has_value()) {
            callback(failedResult<WorkspaceResult>(reply.ok ? QStringLiteral("Malformed workspace in reply") : reply.error));
            return;
        }
        callback(WorkspaceResult{true, QString(), *workspace});
    });
}

void HostGateway::createWorktree(const QString &workspaceId, const QString &name, const QString &path, const QString &branch, WorktreeCallback callback)
{
    HostCommand command(QStringLiteral("worktree.create"));
    command.workspace(workspaceId).arg(QStringLiteral("name"), name).arg(QStringLiteral("path"), path).arg(QStringLiteral("branch"), branch);
    sendRequest(command, [callback](const HostReply &reply) {
        if (!callback) {
            return;
        }
        const auto worktree = reply.ok ? WorkspaceJson::worktreeFromJson(reply.result.toObject()) : std::nullopt;
        if (!worktree.has_value()) {
            callback(failedResult<WorktreeResult>(reply.ok ? QStringLiteral("Malformed worktree in reply") : reply.error));
            return;
        }
        callback(WorktreeResult{true, QString(), *worktree});
    });
}

void HostGateway::setActiveSelection(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback)
{
    HostCommand command(QStringLiteral("workspace.setActiveSelection"));
    command.workspace(workspaceId)
        .arg(QStringLiteral("worktreeId"), worktreeId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(worktreeId))
        .arg(QStringLiteral("tabId"), tabId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(tabId));
    sendRequest(command, [callback](const HostReply &reply) {
        if (callback) {
            callback(toOperationResult(reply));
        }
    });
}

void HostGateway::createTab(const CreateTabRequest &request, TabCallback callback)
{
    HostCommand command(QStringLiteral("tab.create"));
    command.args(HostProtocol::toJson(request));
    sendRequest(command, [callback](const HostReply &reply) {
        if (!callback) {
            return;
        }
        const auto tab = reply.ok ? WorkspaceJson::tabFromJson(reply.result.toObject()) : std::nullopt;
        if (!tab.has_value()) {
            callback(failedResult<TabResult>(reply.ok ? QStringLiteral("Malformed tab in reply") : reply.error));
            return;
        }
        callback(TabResult{true, QString(), *tab});
    });
}

void HostGateway::moveTab(const MoveTabRequest &request, ResultCallback callback)
{
    HostCommand command(QStringLiteral("tab.move"));
    command.args(HostProtocol::toJson(request));
    sendRequest(command, [callback](const HostReply &reply) {
        if (callback) {
            callback(toOperationResult(reply));
        }
    });
}

void HostGateway::updateLayoutTree(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const PaneLayoutTree::Tree &tree, ResultCallback callback)
{
    HostCommand command(QStringLiteral("tab.updateLayoutTree"));
    command.workspace(workspaceId).worktree(worktreeId).tab(tabId).arg(QStringLiteral("layoutTree"), PaneLayoutTree::toJson(tree));
    sendRequest(command, [callback](const HostReply &reply) {
        if (callback) {
            callback(toOperationResult(reply));
        }
    });
}

void HostGateway::reorderTabs(const QString &workspaceId, const QString &worktreeId, const QString &parentTabId, const QStringList &tabIds, ResultCallback callback)
{
    HostCommand command(QStringLiteral("tab.reorder"));
    command.workspace(workspaceId)
        .worktree(worktreeId)
        .arg(QStringLiteral("parentTabId"), parentTabId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(parentTabId))
        .arg(QStringLiteral("tabIds"), QJsonArray::fromStringList(tabIds));
    sendRequest(command, [callback](const HostReply &reply) {
        if (callback) {
            callback(toOperationResult(reply));
        }
    });
}

void HostGateway::deleteTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, ResultCallback callback)
{
    HostCommand command(QStringLiteral("tab.delete"));
    command.workspace(workspaceId).worktree(worktreeId).tab(tabId);
    sendRequest(command, [callback](const HostReply &reply) {
        if (callback) {
            callback(toOperationResult(reply));
        }
    });
}

void HostGateway::renameTab(const QString &workspaceId, const QString &worktreeId, const QString &tabId, const QString &name, ResultCallback callback)
{
    HostCommand command(QStringLiteral("tab.rename"));
    command.workspace(workspaceId).worktree(worktreeId).tab(tabId).arg(QStringLiteral("name"), name);
    sendRequest(command, [callback](const HostReply &reply) {
        if (callback) {
            callback(toOperationResult(reply));
        }
    });
}

} // namespace Trellis

#include "moc_HostGateway.cpp"
