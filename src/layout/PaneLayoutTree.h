/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANELAYOUTTREE_H
#define PANELAYOUTTREE_H

#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

#include "trellisprivate_export.h"

namespace Trellis
{

enum class PaneLayoutNodeType { Leaf, Split };

// Row places first/second side by side, Column stacks them.
enum class SplitDirection { Row, Column };

struct TRELLISPRIVATE_EXPORT PaneLayoutNode {
    PaneLayoutNodeType type = PaneLayoutNodeType::Leaf;
    QString paneId; // leaf only
    SplitDirection direction = SplitDirection::Row; // split only
    std::optional<double> splitPercentage; // split only
    QList<PaneLayoutNode> children; // split only: [first, second]

    static PaneLayoutNode leaf(const QString &paneId);
    static PaneLayoutNode split(SplitDirection direction, const PaneLayoutNode &first, const PaneLayoutNode &second, std::optional<double> splitPercentage = 50.0);

    bool isLeaf() const
    {
        return type == PaneLayoutNodeType::Leaf;
    }

    const PaneLayoutNode &first() const
    {
        return children.at(0);
    }

    const PaneLayoutNode &second() const
    {
        return children.at(1);
    }

    bool operator==(const PaneLayoutNode &other) const;
    bool operator!=(const PaneLayoutNode &other) const
    {
        return !(*this == other);
    }
};

/**
 * Binary split tree over the pane ids of a group tab.
 *
 * A null tree (std::nullopt) is an empty group. All operations return
 * new trees; inputs are never modified.
 */
class TRELLISPRIVATE_EXPORT PaneLayoutTree
{
public:
    using Tree = std::optional<PaneLayoutNode>;

    static Tree buildDefault(const QStringList &paneIds);

    /** Appends @p paneId on the second branch. No-op if already present. */
    static Tree insert(const Tree &tree, const QString &paneId);

    /** Removes @p paneId, collapsing any split left with a single child. */
    static Tree remove(const Tree &tree, const QString &paneId);

    /** Replaces the leaf @p targetId by a split of (target, newId). */
    static Tree splitPane(const Tree &tree, const QString &targetId, const QString &newId, SplitDirection direction);

    static bool contains(const Tree &tree, const QString &paneId);

    /** Pane ids in visual order: first before second at every split. */
    static QStringList paneIds(const Tree &tree);

    /** True if every split has two children and no pane id repeats. */
    static bool isWellFormed(const Tree &tree);

    static QJsonValue toJson(const Tree &tree);
    static std::optional<Tree> fromJson(const QJsonValue &value);

    static QString directionName(SplitDirection direction);

private:
    static PaneLayoutNode insertNode(const PaneLayoutNode &node, const QString &paneId);
    static Tree removeNode(const PaneLayoutNode &node, const QString &paneId);
    static bool containsNode(const PaneLayoutNode &node, const QString &paneId);
    static void collectPaneIds(const PaneLayoutNode &node, QStringList &output);
    static std::optional<PaneLayoutNode> parseNode(const QJsonValue &value);
    static QJsonValue serializeNode(const PaneLayoutNode &node);
};

} // namespace Trellis

#endif // PANELAYOUTTREE_H
