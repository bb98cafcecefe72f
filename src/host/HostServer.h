/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTSERVER_H
#define HOSTSERVER_H

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QPointer>

#include "HostProtocol.h"
#include "trellisprivate_export.h"

class QLocalServer;
class QLocalSocket;

namespace Trellis
{

class LocalHostBackend;

/**
 * Serves a LocalHostBackend over a QLocalServer.
 *
 * A connection receives terminal.output for the terminals it attached
 * with terminal.createOrAttach until it detaches or kills them. Exit and
 * cwd events go to every connection.
 */
class TRELLISPRIVATE_EXPORT HostServer : public QObject
{
    Q_OBJECT
public:
    explicit HostServer(LocalHostBackend *backend, QObject *parent = nullptr);
    ~HostServer() override;

    bool listen(const QString &socketName, QString *error = nullptr);
    void close();

    QString fullServerName() const;
    int connectionCount() const;

private:
    struct Connection {
        QByteArray buffer;
        // terminal id -> number of createOrAttach not yet detached
        QHash<QString, int> subscriptions;
    };

    void onNewConnection();
    void onReadyRead(QLocalSocket *socket);
    void onDisconnected(QLocalSocket *socket);
    void processLine(QLocalSocket *socket, const QByteArray &line);
    void dispatch(QLocalSocket *socket, const HostRequest &request);

    void reply(const QPointer<QLocalSocket> &socket, quint64 requestId, bool ok, const QString &error, const QJsonValue &result = QJsonValue());
    void send(QLocalSocket *socket, const HostMessage &message);
    void broadcast(const HostMessage &message);

    void subscribe(QLocalSocket *socket, const QString &terminalId);
    void unsubscribe(QLocalSocket *socket, const QString &terminalId);
    void unsubscribeAll(const QString &terminalId);

    LocalHostBackend *_backend;
    QLocalServer *_server;
    QHash<QLocalSocket *, Connection> _connections;
};

} // namespace Trellis

#endif // HOSTSERVER_H
