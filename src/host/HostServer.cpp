/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostServer.h"

#include "LocalHostBackend.h"
#include "workspace/WorkspaceJson.h"

#include <QJsonArray>
#include <QLocalServer>
#include <QLocalSocket>
#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcTrellisHost, "trellis.host", QtInfoMsg)

namespace Trellis
{

namespace
{
QString optionalId(const QJsonObject &params, const QString &key)
{
    const QJsonValue value = params.value(key);
    return value.isString() ? value.toString() : QString();
}
}

HostServer::HostServer(LocalHostBackend *backend, QObject *parent)
    : QObject(parent)
    , _backend(backend)
    , _server(new QLocalServer(this))
{
    connect(_server, &QLocalServer::newConnection, this, &HostServer::onNewConnection);

    connect(_backend, &HostBackend::terminalOutput, this, [this](const QString &terminalId, const QByteArray &data, quint64 sequence) {
        const HostMessage event = TerminalOutputEvent{terminalId, data, sequence};
        for (auto it = _connections.constBegin(); it != _connections.constEnd(); ++it) {
            if (it.value().subscriptions.contains(terminalId)) {
                send(it.key(), event);
            }
        }
    });
    connect(_backend, &HostBackend::terminalExited, this, [this](const QString &terminalId, int exitCode, int signal) {
        broadcast(TerminalExitedEvent{terminalId, exitCode, signal});
    });
    connect(_backend, &HostBackend::terminalCwdChanged, this, [this](const QString &terminalId, const QString &cwd) {
        broadcast(TerminalCwdChangedEvent{terminalId, cwd});
    });
}

HostServer::~HostServer()
{
    close();
}

bool HostServer::listen(const QString &socketName, QString *error)
{
    // A socket file left behind by a crashed host would make listen() fail.
    QLocalServer::removeServer(socketName);
    _server->setSocketOptions(QLocalServer::UserAccessOption);
    if (!_server->listen(socketName)) {
        if (error) {
            *error = _server->errorString();
        }
        qCCritical(lcTrellisHost) << "Cannot listen on" << socketName << ":" << _server->errorString();
        return false;
    }
    qCInfo(lcTrellisHost) << "Listening on" << _server->fullServerName();
    return true;
}

void HostServer::close()
{
    const auto sockets = _connections.keys();
    _connections.clear();
    for (QLocalSocket *socket : sockets) {
        socket->disconnect(this);
        socket->disconnectFromServer();
        socket->deleteLater();
    }
    _server->close();
}

QString HostServer::fullServerName() const
{
    return _server->fullServerName();
}

int HostServer::connectionCount() const
{
    return _connections.size();
}

void HostServer::onNewConnection()
{
    while (QLocalSocket *socket = _server->nextPendingConnection()) {
        _connections.insert(socket, Connection());
        connect(socket, &QLocalSocket::readyRead, this, [this, socket]() {
            onReadyRead(socket);
        });
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() {
            onDisconnected(socket);
        });
        qCDebug(lcTrellisHost) << "Client connected," << _connections.size() << "connection(s)";
    }
}

void HostServer::onReadyRead(QLocalSocket *socket)
{
    auto it = _connections.find(socket);
    if (it == _connections.end()) {
        return;
    }
    it->buffer.append(socket->readAll());

    QList<QByteArray> lines;
    int newline;
    while ((newline = it->buffer.indexOf('\n')) >= 0) {
        lines.append(it->buffer.left(newline));
        it->buffer.remove(0, newline + 1);
    }

    for (const QByteArray &line : std::as_const(lines)) {
        if (!line.trimmed().isEmpty()) {
            processLine(socket, line);
        }
    }
}

void HostServer::onDisconnected(QLocalSocket *socket)
{
    if (_connections.remove(socket) > 0) {
        qCDebug(lcTrellisHost) << "Client disconnected," << _connections.size() << "connection(s) left";
    }
    socket->deleteLater();
}

void HostServer::processLine(QLocalSocket *socket, const QByteArray &line)
{
    const auto message = HostProtocol::decode(line);
    if (!message.has_value() || !std::holds_alternative<HostRequest>(*message)) {
        qCWarning(lcTrellisHost) << "Ignoring malformed message:" << line.left(200);
        return;
    }
    dispatch(socket, std::get<HostRequest>(*message));
}

void HostServer::dispatch(QLocalSocket *socket, const HostRequest &request)
{
    const QString &cmd = request.command;
    const QJsonObject &params = request.params;
    const QString terminalId = params.value(QStringLiteral("terminalId")).toString();
    const QString workspaceId = params.value(QStringLiteral("workspaceId")).toString();
    const QString worktreeId = params.value(QStringLiteral("worktreeId")).toString();
    const QString tabId = params.value(QStringLiteral("tabId")).toString();
    const QPointer<QLocalSocket> peer(socket);
    const quint64 id = request.id;

    auto replyResult = [this, peer, id](const OperationResult &result) {
        reply(peer, id, result.success, result.error);
    };

    qCDebug(lcTrellisHost) << "Request" << id << cmd << terminalId;

    if (cmd == QLatin1String("terminal.write")) {
        _backend->write(terminalId, HostProtocol::bytesFromJson(params.value(QStringLiteral("data"))));
    } else if (cmd == QLatin1String("terminal.resize")) {
        _backend->resize(terminalId, params.value(QStringLiteral("cols")).toInt(), params.value(QStringLiteral("rows")).toInt());
    } else if (cmd == QLatin1String("terminal.signal")) {
        _backend->signal(terminalId, params.value(QStringLiteral("signal")).toString(QStringLiteral("SIGTERM")));
    } else if (cmd == QLatin1String("terminal.detach")) {
        unsubscribe(socket, terminalId);
        _backend->detach(terminalId);
    } else if (cmd == QLatin1String("terminal.ackColdRestore")) {
        _backend->ackColdRestore(terminalId);
    } else if (cmd == QLatin1String("terminal.createOrAttach")) {
        // Subscribe before the scrollback is taken so no output falls
        // between the reply and the first event.
        subscribe(socket, terminalId);
        _backend->createOrAttach(HostProtocol::createOrAttachRequestFromJson(params), [this, peer, id, terminalId](const CreateOrAttachResult &result) {
            if (!result.success) {
                if (peer) {
                    unsubscribe(peer, terminalId);
                }
                reply(peer, id, false, result.error);
                return;
            }
            reply(peer, id, true, QString(), HostProtocol::toJson(result));
        });
    } else if (cmd == QLatin1String("terminal.kill")) {
        unsubscribeAll(terminalId);
        _backend->kill(terminalId, params.value(QStringLiteral("deleteHistory")).toBool(), replyResult);
    } else if (cmd == QLatin1String("terminal.getHistory")) {
        _backend->getHistory(terminalId, [this, peer, id](const HistoryResult &result) {
            QJsonObject object;
            object.insert(QStringLiteral("scrollback"), QString::fromLatin1(result.scrollback.toBase64()));
            reply(peer, id, result.success, result.error, object);
        });
    } else if (cmd == QLatin1String("workspace.get")) {
        _backend->getWorkspace(workspaceId, [this, peer, id](const WorkspaceResult &result) {
            reply(peer, id, result.success, result.error, result.success ? QJsonValue(WorkspaceJson::toJson(result.workspace)) : QJsonValue());
        });
    } else if (cmd == QLatin1String("workspace.create")) {
        _backend->createWorkspace(params.value(QStringLiteral("name")).toString(),
                                  params.value(QStringLiteral("repoPath")).toString(),
                                  [this, peer, id](const WorkspaceResult &result) {
                                      reply(peer, id, result.success, result.error, result.success ? QJsonValue(WorkspaceJson::toJson(result.workspace)) : QJsonValue());
                                  });
    } else if (cmd == QLatin1String("worktree.create")) {
        _backend->createWorktree(workspaceId,
                                 params.value(QStringLiteral("name")).toString(),
                                 params.value(QStringLiteral("path")).toString(),
                                 params.value(QStringLiteral("branch")).toString(),
                                 [this, peer, id](const WorktreeResult &result) {
                                     reply(peer, id, result.success, result.error, result.success ? QJsonValue(WorkspaceJson::toJson(result.worktree)) : QJsonValue());
                                 });
    } else if (cmd == QLatin1String("workspace.setActiveSelection")) {
        _backend->setActiveSelection(workspaceId, optionalId(params, QStringLiteral("worktreeId")), optionalId(params, QStringLiteral("tabId")), replyResult);
    } else if (cmd == QLatin1String("tab.create")) {
        _backend->createTab(HostProtocol::createTabRequestFromJson(params), [this, peer, id](const TabResult &result) {
            reply(peer, id, result.success, result.error, result.success ? QJsonValue(WorkspaceJson::toJson(result.tab)) : QJsonValue());
        });
    } else if (cmd == QLatin1String("tab.move")) {
        _backend->moveTab(HostProtocol::moveTabRequestFromJson(params), replyResult);
    } else if (cmd == QLatin1String("tab.updateLayoutTree")) {
        const auto tree = PaneLayoutTree::fromJson(params.value(QStringLiteral("layoutTree")));
        if (!tree.has_value()) {
            reply(peer, id, false, QStringLiteral("Layout tree is malformed"));
            return;
        }
        _backend->updateLayoutTree(workspaceId, worktreeId, tabId, *tree, replyResult);
    } else if (cmd == QLatin1String("tab.reorder")) {
        _backend->reorderTabs(workspaceId,
                              worktreeId,
                              optionalId(params, QStringLiteral("parentTabId")),
                              HostProtocol::stringListFromJson(params.value(QStringLiteral("tabIds"))),
                              replyResult);
    } else if (cmd == QLatin1String("tab.delete")) {
        _backend->deleteTab(workspaceId, worktreeId, tabId, replyResult);
    } else if (cmd == QLatin1String("tab.rename")) {
        _backend->renameTab(workspaceId, worktreeId, tabId, params.value(QStringLiteral("name")).toString(), replyResult);
    } else {
        qCWarning(lcTrellisHost) << "Unknown command" << cmd;
        reply(peer, id, false, QStringLiteral("Unknown command: %1").arg(cmd));
    }
}

void HostServer::reply(const QPointer<QLocalSocket> &socket, quint64 requestId, bool ok, const QString &error, const QJsonValue &result)
{
    if (requestId == 0) {
        return;
    }
    if (!socket || !_connections.contains(socket.data())) {
        qCDebug(lcTrellisHost) << "Dropping reply" << requestId << "for a closed connection";
        return;
    }
    if (!ok) {
        qCWarning(lcTrellisHost) << "Request" << requestId << "failed:" << error;
    }
    send(socket.data(), HostReply{requestId, ok, error, result});
}

void HostServer::send(QLocalSocket *socket, const HostMessage &message)
{
    if (socket->state() != QLocalSocket::ConnectedState) {
        return;
    }
    const QByteArray line = HostProtocol::encode(message);
    if (socket->write(line) != line.size()) {
        qCWarning(lcTrellisHost) << "Short write to client:" << socket->errorString();
    }
}

void HostServer::broadcast(const HostMessage &message)
{
    for (auto it = _connections.constBegin(); it != _connections.constEnd(); ++it) {
        send(it.key(), message);
    }
}

void HostServer::subscribe(QLocalSocket *socket, const QString &terminalId)
{
    auto it = _connections.find(socket);
    if (it != _connections.end()) {
        ++it->subscriptions[terminalId];
    }
}

void HostServer::unsubscribe(QLocalSocket *socket, const QString &terminalId)
{
    auto it = _connections.find(socket);
    if (it == _connections.end()) {
        return;
    }
    auto sub = it->subscriptions.find(terminalId);
    if (sub != it->subscriptions.end() && --sub.value() <= 0) {
        it->subscriptions.erase(sub);
    }
}

void HostServer::unsubscribeAll(const QString &terminalId)
{
    for (auto it = _connections.begin(); it != _connections.end(); ++it) {
        it->subscriptions.remove(terminalId);
    }
}

} // namespace Trellis

#include "moc_HostServer.cpp"
