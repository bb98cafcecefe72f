/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PaneLayoutTree.h"

#include <QJsonObject>
#include <QLoggingCategory>
#include <QSet>

#include <functional>

Q_LOGGING_CATEGORY(lcTrellisLayout, "trellis.layout")

namespace Trellis
{

PaneLayoutNode PaneLayoutNode::leaf(const QString &paneId)
{
    PaneLayoutNode node;
    node.type = PaneLayoutNodeType::Leaf;
    node.paneId = paneId;
    return node;
}

PaneLayoutNode PaneLayoutNode::split(SplitDirection direction, const PaneLayoutNode &first, const PaneLayoutNode &second, std::optional<double> splitPercentage)
{
    PaneLayoutNode node;
    node.type = PaneLayoutNodeType::Split;
    node.direction = direction;
    node.splitPercentage = splitPercentage;
    node.children = {first, second};
    return node;
}

bool PaneLayoutNode::operator==(const PaneLayoutNode &other) const
{
    if (type != other.type) {
        return false;
    }
    if (type == PaneLayoutNodeType::Leaf) {
        return paneId == other.paneId;
    }
    return direction == other.direction && splitPercentage == other.splitPercentage && children == other.children;
}

PaneLayoutTree::Tree PaneLayoutTree::buildDefault(const QStringList &paneIds)
{
    if (paneIds.isEmpty()) {
        return std::nullopt;
    }
    if (paneIds.size() == 1) {
        return PaneLayoutNode::leaf(paneIds.first());
    }
    if (paneIds.size() == 2) {
        return PaneLayoutNode::split(SplitDirection::Row, PaneLayoutNode::leaf(paneIds[0]), PaneLayoutNode::leaf(paneIds[1]));
    }

    // Remaining panes stack in nested column splits: b / (c / (d / ...))
    PaneLayoutNode rest = PaneLayoutNode::leaf(paneIds.last());
    for (int i = paneIds.size() - 2; i >= 1; --i) {
        rest = PaneLayoutNode::split(SplitDirection::Column, PaneLayoutNode::leaf(paneIds[i]), rest);
    }
    return PaneLayoutNode::split(SplitDirection::Row, PaneLayoutNode::leaf(paneIds.first()), rest);
}

PaneLayoutTree::Tree PaneLayoutTree::insert(const Tree &tree, const QString &paneId)
{
    if (!tree.has_value()) {
        return PaneLayoutNode::leaf(paneId);
    }
    if (containsNode(*tree, paneId)) {
        return tree;
    }
    return insertNode(*tree, paneId);
}

PaneLayoutNode PaneLayoutTree::insertNode(const PaneLayoutNode &node, const QString &paneId)
{
    if (node.isLeaf()) {
        return PaneLayoutNode::split(SplitDirection::Row, node, PaneLayoutNode::leaf(paneId));
    }

    PaneLayoutNode result = node;
    result.children[1] = insertNode(node.second(), paneId);
    return result;
}

PaneLayoutTree::Tree PaneLayoutTree::remove(const Tree &tree, const QString &paneId)
{
    if (!tree.has_value()) {
        return std::nullopt;
    }
    return removeNode(*tree, paneId);
}

PaneLayoutTree::Tree PaneLayoutTree::removeNode(const PaneLayoutNode &node, const QString &paneId)
{
    if (node.isLeaf()) {
        if (node.paneId == paneId) {
            return std::nullopt;
        }
        return node;
    }

    Tree first = removeNode(node.first(), paneId);
    Tree second = removeNode(node.second(), paneId);

    if (!first.has_value() && !second.has_value()) {
        return std::nullopt;
    }
    if (!first.has_value()) {
        return second;
    }
    if (!second.has_value()) {
        return first;
    }

    PaneLayoutNode result = node;
    result.children = {*first, *second};
    return result;
}

PaneLayoutTree::Tree PaneLayoutTree::splitPane(const Tree &tree, const QString &targetId, const QString &newId, SplitDirection direction)
{
    if (!tree.has_value()) {
        return PaneLayoutNode::leaf(newId);
    }
    if (containsNode(*tree, newId)) {
        return tree;
    }
    if (!containsNode(*tree, targetId)) {
        return insertNode(*tree, newId);
    }

    std::function<PaneLayoutNode(const PaneLayoutNode &)> replace = [&](const PaneLayoutNode &node) -> PaneLayoutNode {
        if (node.isLeaf()) {
            if (node.paneId == targetId) {
                return PaneLayoutNode::split(direction, node, PaneLayoutNode::leaf(newId));
            }
            return node;
        }
        PaneLayoutNode result = node;
        result.children = {replace(node.first()), replace(node.second())};
        return result;
    };
    return replace(*tree);
}

bool PaneLayoutTree::contains(const Tree &tree, const QString &paneId)
{
    return tree.has_value() && containsNode(*tree, paneId);
}

bool PaneLayoutTree::containsNode(const PaneLayoutNode &node, const QString &paneId)
{
    if (node.isLeaf()) {
        return node.paneId == paneId;
    }
    for (const auto &child : node.children) {
        if (containsNode(child, paneId)) {
            return true;
        }
    }
    return false;
}

QStringList PaneLayoutTree::paneIds(const Tree &tree)
{
    QStringList output;
    if (tree.has_value()) {
        collectPaneIds(*tree, output);
    }
    return output;
}

void PaneLayoutTree::collectPaneIds(const PaneLayoutNode &node, QStringList &output)
{
    if (node.isLeaf()) {
        output.append(node.paneId);
        return;
    }
    for (const auto &child : node.children) {
        collectPaneIds(child, output);
    }
}

bool PaneLayoutTree::isWellFormed(const Tree &tree)
{
    if (!tree.has_value()) {
        return true;
    }

    std::function<bool(const PaneLayoutNode &)> checkSplits = [&](const PaneLayoutNode &node) {
        if (node.isLeaf()) {
            return !node.paneId.isEmpty() && node.children.isEmpty();
        }
        if (node.children.size() != 2) {
            return false;
        }
        return checkSplits(node.first()) && checkSplits(node.second());
    };
    if (!checkSplits(*tree)) {
        return false;
    }

    const QStringList ids = paneIds(tree);
    return QSet<QString>(ids.begin(), ids.end()).size() == ids.size();
}

QString PaneLayoutTree::directionName(SplitDirection direction)
{
    return direction == SplitDirection::Row ? QStringLiteral("row") : QStringLiteral("column");
}

QJsonValue PaneLayoutTree::toJson(const Tree &tree)
{
    if (!tree.has_value()) {
        return QJsonValue(QJsonValue::Null);
    }
    return serializeNode(*tree);
}

QJsonValue PaneLayoutTree::serializeNode(const PaneLayoutNode &node)
{
    if (node.isLeaf()) {
        return node.paneId;
    }

    QJsonObject object;
    object.insert(QStringLiteral("direction"), directionName(node.direction));
    object.insert(QStringLiteral("first"), serializeNode(node.first()));
    object.insert(QStringLiteral("second"), serializeNode(node.second()));
    if (node.splitPercentage.has_value()) {
        object.insert(QStringLiteral("splitPercentage"), *node.splitPercentage);
    }
    return object;
}

std::optional<PaneLayoutTree::Tree> PaneLayoutTree::fromJson(const QJsonValue &value)
{
    if (value.isNull() || value.isUndefined()) {
        return Tree(std::nullopt);
    }

    auto node = parseNode(value);
    if (!node.has_value()) {
        return std::nullopt;
    }

    Tree tree = *node;
    if (!isWellFormed(tree)) {
        qCWarning(lcTrellisLayout) << "Rejecting layout tree with duplicate or empty panes";
        return std::nullopt;
    }
    return tree;
}

std::optional<PaneLayoutNode> PaneLayoutTree::parseNode(const QJsonValue &value)
{
    if (value.isString()) {
        const QString paneId = value.toString();
        if (paneId.isEmpty()) {
            return std::nullopt;
        }
        return PaneLayoutNode::leaf(paneId);
    }

    if (!value.isObject()) {
        return std::nullopt;
    }

    const QJsonObject object = value.toObject();
    const QString direction = object.value(QStringLiteral("direction")).toString();
    SplitDirection splitDirection;
    if (direction == QLatin1String("row")) {
        splitDirection = SplitDirection::Row;
    } else if (direction == QLatin1String("column")) {
        splitDirection = SplitDirection::Column;
    } else {
        return std::nullopt;
    }

    auto first = parseNode(object.value(QStringLiteral("first")));
    auto second = parseNode(object.value(QStringLiteral("second")));
    if (!first.has_value() || !second.has_value()) {
        return std::nullopt;
    }

    std::optional<double> percentage;
    const QJsonValue percentageValue = object.value(QStringLiteral("splitPercentage"));
    if (percentageValue.isDouble()) {
        percentage = percentageValue.toDouble();
    } else if (!percentageValue.isUndefined() && !percentageValue.isNull()) {
        return std::nullopt;
    }

    return PaneLayoutNode::split(splitDirection, *first, *second, percentage);
}

} // namespace Trellis
