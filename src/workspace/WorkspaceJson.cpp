/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorkspaceJson.h"

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTrellisWorkspace)

namespace Trellis
{

QString WorkspaceJson::dateToString(const QDateTime &dateTime)
{
    return dateTime.isValid() ? dateTime.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime WorkspaceJson::dateFromString(const QString &text)
{
    if (text.isEmpty()) {
        return QDateTime();
    }
    return QDateTime::fromString(text, Qt::ISODateWithMs);
}

QJsonObject WorkspaceJson::toJson(const Tab &tab)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), tab.id);
    object.insert(QStringLiteral("type"), WorkspaceModel::typeName(tab.type));
    object.insert(QStringLiteral("name"), tab.name);
    if (!tab.cwd.isEmpty()) {
        object.insert(QStringLiteral("cwd"), tab.cwd);
    }
    if (!tab.command.isEmpty()) {
        object.insert(QStringLiteral("command"), tab.command);
    }
    if (tab.createdAt.isValid()) {
        object.insert(QStringLiteral("createdAt"), dateToString(tab.createdAt));
    }

    if (tab.isGroup()) {
        QJsonArray children;
        for (const auto &child : tab.tabs) {
            children.append(toJson(child));
        }
        object.insert(QStringLiteral("tabs"), children);
        object.insert(QStringLiteral("layoutTree"), PaneLayoutTree::toJson(tab.layoutTree));
        if (tab.layoutInvalid) {
            object.insert(QStringLiteral("layoutInvalid"), true);
        }
    }
    return object;
}

std::optional<Tab> WorkspaceJson::tabFromJson(const QJsonObject &object)
{
    Tab tab;
    tab.id = object.value(QStringLiteral("id")).toString();
    if (tab.id.isEmpty()) {
        return std::nullopt;
    }
    tab.type = WorkspaceModel::typeFromName(object.value(QStringLiteral("type")).toString());
    tab.name = object.value(QStringLiteral("name")).toString();
    tab.cwd = object.value(QStringLiteral("cwd")).toString();
    tab.command = object.value(QStringLiteral("command")).toString();
    tab.createdAt = dateFromString(object.value(QStringLiteral("createdAt")).toString());

    if (!tab.isGroup()) {
        return tab;
    }

    const QJsonArray children = object.value(QStringLiteral("tabs")).toArray();
    for (const auto &childValue : children) {
        auto child = tabFromJson(childValue.toObject());
        if (!child.has_value()) {
            qCWarning(lcTrellisWorkspace) << "Skipping malformed child of group" << tab.id;
            continue;
        }
        if (child->isGroup()) {
            qCWarning(lcTrellisWorkspace) << "Skipping nested group" << child->id << "in" << tab.id;
            continue;
        }
        tab.tabs.append(*child);
    }

    tab.layoutInvalid = object.value(QStringLiteral("layoutInvalid")).toBool();
    auto tree = PaneLayoutTree::fromJson(object.value(QStringLiteral("layoutTree")));
    if (tree.has_value()) {
        tab.layoutTree = *tree;
    } else {
        qCWarning(lcTrellisWorkspace) << "Group" << tab.id << "has an unreadable layout tree";
        tab.layoutInvalid = true;
    }
    return tab;
}

QJsonObject WorkspaceJson::toJson(const Worktree &worktree)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), worktree.id);
    object.insert(QStringLiteral("name"), worktree.name);
    object.insert(QStringLiteral("path"), worktree.path);
    if (!worktree.branch.isEmpty()) {
        object.insert(QStringLiteral("branch"), worktree.branch);
    }
    QJsonArray tabs;
    for (const auto &tab : worktree.tabs) {
        tabs.append(toJson(tab));
    }
    object.insert(QStringLiteral("tabs"), tabs);
    return object;
}

std::optional<Worktree> WorkspaceJson::worktreeFromJson(const QJsonObject &object)
{
    Worktree worktree;
    worktree.id = object.value(QStringLiteral("id")).toString();
    if (worktree.id.isEmpty()) {
        return std::nullopt;
    }
    worktree.name = object.value(QStringLiteral("name")).toString();
    worktree.path = object.value(QStringLiteral("path")).toString();
    worktree.branch = object.value(QStringLiteral("branch")).toString();

    const QJsonArray tabs = object.value(QStringLiteral("tabs")).toArray();
    for (const auto &tabValue : tabs) {
        auto tab = tabFromJson(tabValue.toObject());
        if (tab.has_value()) {
            worktree.tabs.append(*tab);
        }
    }
    return worktree;
}

QJsonObject WorkspaceJson::toJson(const Workspace &workspace)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), workspace.id);
    object.insert(QStringLiteral("name"), workspace.name);
    object.insert(QStringLiteral("repoPath"), workspace.repoPath);

    QJsonArray worktrees;
    for (const auto &worktree : workspace.worktrees) {
        worktrees.append(toJson(worktree));
    }
    object.insert(QStringLiteral("worktrees"), worktrees);

    if (workspace.activeSelection.has_value()) {
        QJsonObject selection;
        selection.insert(QStringLiteral("worktreeId"), workspace.activeSelection->worktreeId);
        selection.insert(QStringLiteral("tabId"), workspace.activeSelection->tabId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(workspace.activeSelection->tabId));
        object.insert(QStringLiteral("activeSelection"), selection);
    } else {
        object.insert(QStringLiteral("activeSelection"), QJsonValue(QJsonValue::Null));
    }

    if (workspace.updatedAt.isValid()) {
        object.insert(QStringLiteral("updatedAt"), dateToString(workspace.updatedAt));
    }
    return object;
}

std::optional<Workspace> WorkspaceJson::workspaceFromJson(const QJsonObject &object)
{
    Workspace workspace;
    workspace.id = object.value(QStringLiteral("id")).toString();
    if (workspace.id.isEmpty()) {
        return std::nullopt;
    }
    workspace.name = object.value(QStringLiteral("name")).toString();
    workspace.repoPath = object.value(QStringLiteral("repoPath")).toString();
    workspace.updatedAt = dateFromString(object.value(QStringLiteral("updatedAt")).toString());

    const QJsonArray worktrees = object.value(QStringLiteral("worktrees")).toArray();
    for (const auto &worktreeValue : worktrees) {
        auto worktree = worktreeFromJson(worktreeValue.toObject());
        if (worktree.has_value()) {
            workspace.worktrees.append(*worktree);
        }
    }

    const QJsonValue selectionValue = object.value(QStringLiteral("activeSelection"));
    if (selectionValue.isObject()) {
        const QJsonObject selection = selectionValue.toObject();
        ActiveSelection active;
        active.worktreeId = selection.value(QStringLiteral("worktreeId")).toString();
        active.tabId = selection.value(QStringLiteral("tabId")).toString();
        if (!active.worktreeId.isEmpty()) {
            workspace.activeSelection = active;
        }
    }
    return workspace;
}

QJsonArray WorkspaceJson::toJson(const QList<Workspace> &workspaces)
{
    QJsonArray array;
    for (const auto &workspace : workspaces) {
        array.append(toJson(workspace));
    }
    return array;
}

QList<Workspace> WorkspaceJson::workspacesFromJson(const QJsonArray &array)
{
    QList<Workspace> workspaces;
    for (const auto &value : array) {
        auto workspace = workspaceFromJson(value.toObject());
        if (workspace.has_value()) {
            workspaces.append(*workspace);
        } else {
            qCWarning(lcTrellisWorkspace) << "Skipping workspace record without id";
        }
    }
    return workspaces;
}

} // namespace Trellis
