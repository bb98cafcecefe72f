/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LAYOUTDIAGRAM_H
#define LAYOUTDIAGRAM_H

#include <QString>

#include "layout/PaneLayoutTree.h"

namespace Trellis
{
namespace LayoutDiagram
{

/**
 * Builds a layout tree from a box drawing:
 *
 *   ┌───┬───┐
 *   │ a │ b │
 *   │   ├───┤
 *   │   │ c │
 *   └───┴───┘
 *
 * Vertical dividers give row splits, horizontal dividers column splits.
 * Three or more siblings nest on the second branch. A pane is named by
 * its first non-empty line, either bare or as "id: <name>". Every split
 * is 50%. A diagram without a box is the empty tree.
 */
PaneLayoutTree::Tree parse(const QString &diagram);

int countPanes(const PaneLayoutTree::Tree &tree);

} // namespace LayoutDiagram
} // namespace Trellis

#endif // LAYOUTDIAGRAM_H
