/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACEJSON_H
#define WORKSPACEJSON_H

#include <QJsonArray>
#include <QJsonObject>
#include <QList>

#include <optional>

#include "WorkspaceModel.h"
#include "trellisprivate_export.h"

namespace Trellis
{

/**
 * Durable JSON form of the workspace hierarchy. Group tabs embed their
 * layout tree in the format of PaneLayoutTree::toJson().
 */
class TRELLISPRIVATE_EXPORT WorkspaceJson
{
public:
    static QJsonObject toJson(const Workspace &workspace);
    static std::optional<Workspace> workspaceFromJson(const QJsonObject &object);

    static QJsonObject toJson(const Worktree &worktree);
    static std::optional<Worktree> worktreeFromJson(const QJsonObject &object);

    static QJsonObject toJson(const Tab &tab);
    static std::optional<Tab> tabFromJson(const QJsonObject &object);

    static QJsonArray toJson(const QList<Workspace> &workspaces);
    static QList<Workspace> workspacesFromJson(const QJsonArray &array);

private:
    static QString dateToString(const QDateTime &dateTime);
    static QDateTime dateFromString(const QString &text);
};

} // namespace Trellis

#endif // WORKSPACEJSON_H
