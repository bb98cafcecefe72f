/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LayoutDiagram.h"

#include <QStringList>

#include <climits>

using namespace Trellis;

namespace
{

const QChar TopLeft(0x250C); // ┌
const QChar BottomRight(0x2518); // ┘
const QChar Horizontal(0x2500); // ─
const QChar Vertical(0x2502); // │
const QChar TeeDown(0x252C); // ┬
const QChar TeeUp(0x2534); // ┴
const QChar TeeRight(0x251C); // ├
const QChar TeeLeft(0x2524); // ┤
const QChar Cross(0x253C); // ┼

QStringList dedentLines(const QString &text)
{
    const QStringList lines = text.split(QLatin1Char('\n'));

    int minIndent = INT_MAX;
    for (const QString &line : lines) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        int indent = 0;
        while (indent < line.size() && line[indent] == QLatin1Char(' ')) {
            ++indent;
        }
        minIndent = qMin(minIndent, indent);
    }
    if (minIndent == INT_MAX) {
        minIndent = 0;
    }

    QStringList result;
    for (const QString &line : lines) {
        result.append(line.trimmed().isEmpty() ? QString() : line.mid(minIndent));
    }
    while (!result.isEmpty() && result.first().isEmpty()) {
        result.removeFirst();
    }
    while (!result.isEmpty() && result.last().isEmpty()) {
        result.removeLast();
    }
    return result;
}

QChar charAt(const QStringList &lines, int row, int col)
{
    if (row < 0 || row >= lines.size() || col < 0 || col >= lines[row].size()) {
        return QChar();
    }
    return lines[row][col];
}

QString paneName(const QStringList &lines, int top, int left, int bottom, int right)
{
    for (int row = top + 1; row < bottom; ++row) {
        const QString interior = lines[row].mid(left + 1, right - left - 1).trimmed();
        if (interior.isEmpty()) {
            continue;
        }
        if (interior.startsWith(QLatin1String("id:"))) {
            return interior.mid(3).trimmed();
        }
        return interior;
    }
    return QString();
}

// Folds siblings right: [a, b, c] -> split(a, split(b, c))
PaneLayoutNode nest(SplitDirection direction, const QList<PaneLayoutNode> &children)
{
    PaneLayoutNode node = children.last();
    for (int i = children.size() - 2; i >= 0; --i) {
        node = PaneLayoutNode::split(direction, children[i], node);
    }
    return node;
}

PaneLayoutNode parseRegion(const QStringList &lines, int top, int left, int bottom, int right)
{
    // Vertical dividers: ┬ on the top edge meeting ┴ on the bottom edge
    QList<int> dividerCols;
    for (int col = left + 1; col < right; ++col) {
        const QChar topChar = charAt(lines, top, col);
        const QChar bottomChar = charAt(lines, bottom, col);
        if ((topChar != TeeDown && topChar != Cross) || (bottomChar != TeeUp && bottomChar != Cross)) {
            continue;
        }
        bool fullHeight = true;
        for (int row = top + 1; row < bottom; ++row) {
            const QChar ch = charAt(lines, row, col);
            if (ch != Vertical && ch != Cross && ch != TeeRight && ch != TeeLeft) {
                fullHeight = false;
                break;
            }
        }
        if (fullHeight) {
            dividerCols.append(col);
        }
    }

    if (!dividerCols.isEmpty()) {
        QList<PaneLayoutNode> children;
        int previous = left;
        for (int col : dividerCols) {
            children.append(parseRegion(lines, top, previous, bottom, col));
            previous = col;
        }
        children.append(parseRegion(lines, top, previous, bottom, right));
        return nest(SplitDirection::Row, children);
    }

    // Horizontal dividers: ├ on the left edge meeting ┤ on the right edge
    QList<int> dividerRows;
    for (int row = top + 1; row < bottom; ++row) {
        const QChar leftChar = charAt(lines, row, left);
        const QChar rightChar = charAt(lines, row, right);
        if ((leftChar != TeeRight && leftChar != Cross) || (rightChar != TeeLeft && rightChar != Cross)) {
            continue;
        }
        bool fullWidth = true;
        for (int col = left + 1; col < right; ++col) {
            const QChar ch = charAt(lines, row, col);
            if (ch != Horizontal && ch != Cross && ch != TeeDown && ch != TeeUp) {
                fullWidth = false;
                break;
            }
        }
        if (fullWidth) {
            dividerRows.append(row);
        }
    }

    if (!dividerRows.isEmpty()) {
        QList<PaneLayoutNode> children;
        int previous = top;
        for (int row : dividerRows) {
            children.append(parseRegion(lines, previous, left, row, right));
            previous = row;
        }
        children.append(parseRegion(lines, previous, left, bottom, right));
        return nest(SplitDirection::Column, children);
    }

    return PaneLayoutNode::leaf(paneName(lines, top, left, bottom, right));
}

int countLeaves(const PaneLayoutNode &node)
{
    if (node.isLeaf()) {
        return 1;
    }
    return countLeaves(node.first()) + countLeaves(node.second());
}

} // namespace

namespace Trellis
{
namespace LayoutDiagram
{

PaneLayoutTree::Tree parse(const QString &diagram)
{
    const QStringList lines = dedentLines(diagram);

    int top = -1;
    int left = -1;
    int bottom = -1;
    int right = -1;
    for (int row = 0; row < lines.size(); ++row) {
        for (int col = 0; col < lines[row].size(); ++col) {
            if (lines[row][col] == TopLeft && top == -1) {
                top = row;
                left = col;
            }
            if (lines[row][col] == BottomRight) {
                bottom = row;
                right = col;
            }
        }
    }

    if (top < 0 || bottom < 0) {
        return std::nullopt;
    }
    return parseRegion(lines, top, left, bottom, right);
}

int countPanes(const PaneLayoutTree::Tree &tree)
{
    return tree.has_value() ? countLeaves(*tree) : 0;
}

} // namespace LayoutDiagram
} // namespace Trellis
