/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostProtocol.h"

#include <QJsonArray>
#include <QJsonDocument>

#include <type_traits>

namespace Trellis
{

QByteArray HostProtocol::encode(const HostMessage &message)
{
    QByteArray line = QJsonDocument(encodeObject(message)).toJson(QJsonDocument::Compact);
    line.append('\n');
    return line;
}

QJsonObject HostProtocol::encodeObject(const HostMessage &message)
{
    QJsonObject object;
    std::visit(
        [&object](auto &&m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, HostRequest>) {
                object = m.params;
                object.insert(QStringLiteral("id"), static_cast<qint64>(m.id));
                object.insert(QStringLiteral("cmd"), m.command);
            } else if constexpr (std::is_same_v<T, HostReply>) {
                object.insert(QStringLiteral("reply"), static_cast<qint64>(m.requestId));
                object.insert(QStringLiteral("ok"), m.ok);
                if (!m.ok) {
                    object.insert(QStringLiteral("error"), m.error);
                }
                if (!m.result.isUndefined()) {
                    object.insert(QStringLiteral("result"), m.result);
                }
            } else if constexpr (std::is_same_v<T, TerminalOutputEvent>) {
                object.insert(QStringLiteral("event"), QStringLiteral("terminal.output"));
                object.insert(QStringLiteral("id"), m.terminalId);
                object.insert(QStringLiteral("data"), QString::fromLatin1(m.data.toBase64()));
                object.insert(QStringLiteral("seq"), static_cast<qint64>(m.sequence));
            } else if constexpr (std::is_same_v<T, TerminalExitedEvent>) {
                object.insert(QStringLiteral("event"), QStringLiteral("terminal.exited"));
                object.insert(QStringLiteral("id"), m.terminalId);
                object.insert(QStringLiteral("exitCode"), m.exitCode);
                if (m.signal != 0) {
                    object.insert(QStringLiteral("signal"), m.signal);
                }
            } else if constexpr (std::is_same_v<T, TerminalCwdChangedEvent>) {
                object.insert(QStringLiteral("event"), QStringLiteral("terminal.cwdChanged"));
                object.insert(QStringLiteral("id"), m.terminalId);
                object.insert(QStringLiteral("cwd"), m.cwd);
            }
        },
        message);
    return object;
}

std::optional<HostMessage> HostProtocol::decode(const QByteArray &line)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(line, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }
    QJsonObject object = document.object();

    if (object.contains(QStringLiteral("cmd"))) {
        HostRequest request;
        request.command = object.take(QStringLiteral("cmd")).toString();
        request.id = static_cast<quint64>(object.take(QStringLiteral("id")).toDouble());
        request.params = object;
        if (request.command.isEmpty()) {
            return std::nullopt;
        }
        return request;
    }

    if (object.contains(QStringLiteral("reply"))) {
        HostReply reply;
        reply.requestId = static_cast<quint64>(object.value(QStringLiteral("reply")).toDouble());
        reply.ok = object.value(QStringLiteral("ok")).toBool();
        reply.error = object.value(QStringLiteral("error")).toString();
        reply.result = object.value(QStringLiteral("result"));
        return reply;
    }

    const QString event = object.value(QStringLiteral("event")).toString();
    const QString terminalId = object.value(QStringLiteral("id")).toString();
    if (terminalId.isEmpty()) {
        return std::nullopt;
    }
    if (event == QLatin1String("terminal.output")) {
        return TerminalOutputEvent{terminalId,
                                   bytesFromJson(object.value(QStringLiteral("data"))),
                                   static_cast<quint64>(object.value(QStringLiteral("seq")).toDouble())};
    }
    if (event == QLatin1String("terminal.exited")) {
        return TerminalExitedEvent{terminalId, object.value(QStringLiteral("exitCode")).toInt(), object.value(QStringLiteral("signal")).toInt()};
    }
    if (event == QLatin1String("terminal.cwdChanged")) {
        return TerminalCwdChangedEvent{terminalId, object.value(QStringLiteral("cwd")).toString()};
    }
    return std::nullopt;
}

bool HostProtocol::isFireAndForget(const QString &command)
{
    return command == QLatin1String("terminal.write") || command == QLatin1String("terminal.resize") || command == QLatin1String("terminal.signal")
        || command == QLatin1String("terminal.detach") || command == QLatin1String("terminal.ackColdRestore");
}

QByteArray HostProtocol::bytesFromJson(const QJsonValue &value)
{
    return QByteArray::fromBase64(value.toString().toLatin1());
}

QStringList HostProtocol::stringListFromJson(const QJsonValue &value)
{
    QStringList list;
    const QJsonArray array = value.toArray();
    for (const auto &entry : array) {
        list.append(entry.toString());
    }
    return list;
}

QJsonObject HostProtocol::toJson(const CreateOrAttachRequest &request)
{
    QJsonObject object;
    object.insert(QStringLiteral("terminalId"), request.id);
    if (!request.workspaceId.isEmpty()) {
        object.insert(QStringLiteral("workspaceId"), request.workspaceId);
    }
    if (!request.cwd.isEmpty()) {
        object.insert(QStringLiteral("cwd"), request.cwd);
    }
    if (request.cols > 0 && request.rows > 0) {
        object.insert(QStringLiteral("cols"), request.cols);
        object.insert(QStringLiteral("rows"), request.rows);
    }
    if (!request.initialCommands.isEmpty()) {
        object.insert(QStringLiteral("initialCommands"), QJsonArray::fromStringList(request.initialCommands));
    }
    return object;
}

CreateOrAttachRequest HostProtocol::createOrAttachRequestFromJson(const QJsonObject &object)
{
    CreateOrAttachRequest request;
    request.id = object.value(QStringLiteral("terminalId")).toString();
    request.workspaceId = object.value(QStringLiteral("workspaceId")).toString();
    request.cwd = object.value(QStringLiteral("cwd")).toString();
    request.cols = object.value(QStringLiteral("cols")).toInt();
    request.rows = object.value(QStringLiteral("rows")).toInt();
    request.initialCommands = stringListFromJson(object.value(QStringLiteral("initialCommands")));
    return request;
}

QJsonObject HostProtocol::toJson(const CreateOrAttachResult &result)
{
    QJsonObject object;
    object.insert(QStringLiteral("isNew"), result.isNew);
    object.insert(QStringLiteral("wasRecovered"), result.wasRecovered);
    object.insert(QStringLiteral("scrollback"), QString::fromLatin1(result.scrollback.toBase64()));
    object.insert(QStringLiteral("outputSequence"), static_cast<qint64>(result.outputSequence));
    object.insert(QStringLiteral("cols"), result.cols);
    object.insert(QStringLiteral("rows"), result.rows);
    if (result.isColdRestore) {
        object.insert(QStringLiteral("isColdRestore"), true);
        object.insert(QStringLiteral("previousCwd"), result.previousCwd);
    }
    if (result.snapshot.has_value()) {
        object.insert(QStringLiteral("snapshot"), result.snapshot->toJson());
    }
    if (result.isExited) {
        object.insert(QStringLiteral("isExited"), true);
    }
    if (result.exitCode.has_value()) {
        object.insert(QStringLiteral("exitCode"), *result.exitCode);
    }
    return object;
}

CreateOrAttachResult HostProtocol::createOrAttachResultFromJson(const QJsonObject &object)
{
    CreateOrAttachResult result;
    result.success = true;
    result.isNew = object.value(QStringLiteral("isNew")).toBool();
    result.wasRecovered = object.value(QStringLiteral("wasRecovered")).toBool();
    result.scrollback = bytesFromJson(object.value(QStringLiteral("scrollback")));
    result.outputSequence = static_cast<quint64>(object.value(QStringLiteral("outputSequence")).toDouble());
    result.cols = object.value(QStringLiteral("cols")).toInt();
    result.rows = object.value(QStringLiteral("rows")).toInt();
    result.isColdRestore = object.value(QStringLiteral("isColdRestore")).toBool();
    result.previousCwd = object.value(QStringLiteral("previousCwd")).toString();
    if (object.value(QStringLiteral("snapshot")).isObject()) {
        result.snapshot = TerminalSnapshot::fromJson(object.value(QStringLiteral("snapshot")).toObject());
    }
    result.isExited = object.value(QStringLiteral("isExited")).toBool();
    if (object.value(QStringLiteral("exitCode")).isDouble()) {
        result.exitCode = object.value(QStringLiteral("exitCode")).toInt();
    }
    return result;
}

QJsonObject HostProtocol::toJson(const CreateTabRequest &request)
{
    QJsonObject object;
    object.insert(QStringLiteral("workspaceId"), request.workspaceId);
    object.insert(QStringLiteral("worktreeId"), request.worktreeId);
    object.insert(QStringLiteral("name"), request.name);
    object.insert(QStringLiteral("type"), WorkspaceModel::typeName(request.type));
    if (!request.parentTabId.isEmpty()) {
        object.insert(QStringLiteral("parentTabId"), request.parentTabId);
    }
    if (!request.copyFromTabId.isEmpty()) {
        object.insert(QStringLiteral("copyFromTabId"), request.copyFromTabId);
    }
    if (!request.command.isEmpty()) {
        object.insert(QStringLiteral("command"), request.command);
    }
    if (!request.cwd.isEmpty()) {
        object.insert(QStringLiteral("cwd"), request.cwd);
    }
    return object;
}

CreateTabRequest HostProtocol::createTabRequestFromJson(const QJsonObject &object)
{
    CreateTabRequest request;
    request.workspaceId = object.value(QStringLiteral("workspaceId")).toString();
    request.worktreeId = object.value(QStringLiteral("worktreeId")).toString();
    request.name = object.value(QStringLiteral("name")).toString();
    request.type = WorkspaceModel::typeFromName(object.value(QStringLiteral("type")).toString(QStringLiteral("terminal")));
    request.parentTabId = object.value(QStringLiteral("parentTabId")).toString();
    request.copyFromTabId = object.value(QStringLiteral("copyFromTabId")).toString();
    request.command = object.value(QStringLiteral("command")).toString();
    request.cwd = object.value(QStringLiteral("cwd")).toString();
    return request;
}

QJsonObject HostProtocol::toJson(const MoveTabRequest &request)
{
    QJsonObject object;
    object.insert(QStringLiteral("workspaceId"), request.workspaceId);
    object.insert(QStringLiteral("worktreeId"), request.worktreeId);
    object.insert(QStringLiteral("tabId"), request.tabId);
    object.insert(QStringLiteral("sourceParentTabId"), request.sourceParentTabId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(request.sourceParentTabId));
    object.insert(QStringLiteral("targetParentTabId"), request.targetParentTabId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(request.targetParentTabId));
    object.insert(QStringLiteral("targetIndex"), request.targetIndex);
    return object;
}

MoveTabRequest HostProtocol::moveTabRequestFromJson(const QJsonObject &object)
{
    MoveTabRequest request;
    request.workspaceId = object.value(QStringLiteral("workspaceId")).toString();
    request.worktreeId = object.value(QStringLiteral("worktreeId")).toString();
    request.tabId = object.value(QStringLiteral("tabId")).toString();
    request.sourceParentTabId = object.value(QStringLiteral("sourceParentTabId")).toString();
    request.targetParentTabId = object.value(QStringLiteral("targetParentTabId")).toString();
    request.targetIndex = object.value(QStringLiteral("targetIndex")).toInt();
    return request;
}

} // namespace Trellis
