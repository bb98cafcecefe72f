/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTPROTOCOL_H
#define HOSTPROTOCOL_H

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>
#include <variant>

#include "session/TerminalSessionManager.h"
#include "workspace/WorkspaceStore.h"
#include "trellisprivate_export.h"

namespace Trellis
{

// Wire format: one JSON object per line.
//   request  {"id":7,"cmd":"tab.move","workspaceId":...}
//   reply    {"reply":7,"ok":true,"result":...} / {"reply":7,"ok":false,"error":"..."}
//   event    {"event":"terminal.output","id":"<terminal>","data":"<base64>","seq":12}
// Fire-and-forget requests carry id 0 and get no reply.

struct HostRequest {
    quint64 id = 0;
    QString command;
    QJsonObject params;
};

struct HostReply {
    quint64 requestId = 0;
    bool ok = false;
    QString error;
    QJsonValue result;
};

struct TerminalOutputEvent {
    QString terminalId;
    QByteArray data;
    // Per terminal, increasing by one for every chunk
    quint64 sequence = 0;
};

struct TerminalExitedEvent {
    QString terminalId;
    int exitCode = 0;
    int signal = 0;
};

struct TerminalCwdChangedEvent {
    QString terminalId;
    QString cwd;
};

using HostMessage = std::variant<HostRequest, HostReply, TerminalOutputEvent, TerminalExitedEvent, TerminalCwdChangedEvent>;

class HostCommand
{
public:
    explicit HostCommand(const QString &command)
        : _command(command)
    {
    }

    HostCommand &terminal(const QString &terminalId)
    {
        return arg(QStringLiteral("terminalId"), terminalId);
    }

    HostCommand &workspace(const QString &workspaceId)
    {
        return arg(QStringLiteral("workspaceId"), workspaceId);
    }

    HostCommand &worktree(const QString &worktreeId)
    {
        return arg(QStringLiteral("worktreeId"), worktreeId);
    }

    HostCommand &tab(const QString &tabId)
    {
        return arg(QStringLiteral("tabId"), tabId);
    }

    HostCommand &bytes(const QString &key, const QByteArray &value)
    {
        return arg(key, QString::fromLatin1(value.toBase64()));
    }

    HostCommand &arg(const QString &key, const QJsonValue &value)
    {
        _params.insert(key, value);
        return *this;
    }

    HostCommand &args(const QJsonObject &values)
    {
        for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
            _params.insert(it.key(), it.value());
        }
        return *this;
    }

    HostRequest build(quint64 id = 0) const
    {
        return HostRequest{id, _command, _params};
    }

private:
    QString _command;
    QJsonObject _params;
};

class TRELLISPRIVATE_EXPORT HostProtocol
{
public:
    static QByteArray encode(const HostMessage &message);
    static std::optional<HostMessage> decode(const QByteArray &line);

    static bool isFireAndForget(const QString &command);

    static QJsonObject toJson(const CreateOrAttachRequest &request);
    static CreateOrAttachRequest createOrAttachRequestFromJson(const QJsonObject &object);

    static QJsonObject toJson(const CreateOrAttachResult &result);
    static CreateOrAttachResult createOrAttachResultFromJson(const QJsonObject &object);

    static QJsonObject toJson(const CreateTabRequest &request);
    static CreateTabRequest createTabRequestFromJson(const QJsonObject &object);

    static QJsonObject toJson(const MoveTabRequest &request);
    static MoveTabRequest moveTabRequestFromJson(const QJsonObject &object);

    static QByteArray bytesFromJson(const QJsonValue &value);
    static QStringList stringListFromJson(const QJsonValue &value);

private:
    static QJsonObject encodeObject(const HostMessage &message);
};

} // namespace Trellis

#endif // HOSTPROTOCOL_H
