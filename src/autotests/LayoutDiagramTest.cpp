/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LayoutDiagramTest.h"
#include "LayoutDiagram.h"

#include <QTest>

using namespace Trellis;

void LayoutDiagramTest::testParseSinglePane()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌────────┐
        │ shell  │
        └────────┘
    )"));

    QVERIFY(tree.has_value());
    QVERIFY(tree->isLeaf());
    QCOMPARE(tree->paneId, QStringLiteral("shell"));
}

void LayoutDiagramTest::testParseSideBySide()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌──────┬──────┐
        │ L    │ R    │
        └──────┴──────┘
    )"));

    QVERIFY(tree.has_value());
    QVERIFY(!tree->isLeaf());
    QVERIFY(tree->direction == SplitDirection::Row);
    QCOMPARE(tree->first().paneId, QStringLiteral("L"));
    QCOMPARE(tree->second().paneId, QStringLiteral("R"));
    QCOMPARE(*tree->splitPercentage, 50.0);
}

void LayoutDiagramTest::testParseStacked()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌──────┐
        │ T    │
        ├──────┤
        │ B    │
        └──────┘
    )"));

    QVERIFY(tree.has_value());
    QVERIFY(tree->direction == SplitDirection::Column);
    QCOMPARE(tree->first().paneId, QStringLiteral("T"));
    QCOMPARE(tree->second().paneId, QStringLiteral("B"));
}

void LayoutDiagramTest::testParseIdAnnotation()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌──────────┐
        │          │
        │ id: t-1  │
        │ ignored  │
        └──────────┘
    )"));

    QVERIFY(tree.has_value());
    QCOMPARE(tree->paneId, QStringLiteral("t-1"));
}

void LayoutDiagramTest::testParseThreeColumnsNest()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┬───┐
        │ a │ b │ c │
        └───┴───┴───┘
    )"));

    QCOMPARE(LayoutDiagram::countPanes(tree), 3);
    QCOMPARE(tree->first().paneId, QStringLiteral("a"));
    QVERIFY(!tree->second().isLeaf());
    QVERIFY(tree->second().direction == SplitDirection::Row);
    QCOMPARE(tree->second().first().paneId, QStringLiteral("b"));
    QCOMPARE(tree->second().second().paneId, QStringLiteral("c"));
}

void LayoutDiagramTest::testParseGrid()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┐
        │ a │ b │
        ├───┼───┤
        │ c │ d │
        └───┴───┘
    )"));

    // Vertical dividers are taken first
    QCOMPARE(LayoutDiagram::countPanes(tree), 4);
    QVERIFY(tree->direction == SplitDirection::Row);
    QVERIFY(tree->first().direction == SplitDirection::Column);
    QCOMPARE(tree->first().first().paneId, QStringLiteral("a"));
    QCOMPARE(tree->first().second().paneId, QStringLiteral("c"));
    QCOMPARE(tree->second().first().paneId, QStringLiteral("b"));
    QCOMPARE(tree->second().second().paneId, QStringLiteral("d"));
}

void LayoutDiagramTest::testParseNoBox()
{
    QVERIFY(!LayoutDiagram::parse(QStringLiteral("no panes here")).has_value());
    QCOMPARE(LayoutDiagram::countPanes(std::nullopt), 0);
}

QTEST_GUILESS_MAIN(LayoutDiagramTest)
