/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PaneLayoutTreeTest.h"
#include "LayoutDiagram.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTest>

#include "../layout/PaneLayoutTree.h"

using namespace Trellis;

namespace
{

QStringList ids(const char *list)
{
    return QString::fromLatin1(list).split(QLatin1Char(','), Qt::SkipEmptyParts);
}

QJsonValue parseJson(const char *text)
{
    // Wrapped so bare strings and null parse too
    const QByteArray wrapped = QByteArray("[") + text + "]";
    return QJsonDocument::fromJson(wrapped).array().first();
}

}

void PaneLayoutTreeTest::testBuildDefaultEmpty()
{
    QVERIFY(!PaneLayoutTree::buildDefault({}).has_value());
}

void PaneLayoutTreeTest::testBuildDefaultSingle()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a"));
    QVERIFY(tree.has_value());
    QVERIFY(tree->isLeaf());
    QCOMPARE(tree->paneId, QStringLiteral("a"));
}

void PaneLayoutTreeTest::testBuildDefaultTwo()
{
    const auto expected = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┐
        │ a │ b │
        └───┴───┘
    )"));
    QVERIFY(PaneLayoutTree::buildDefault(ids("a,b")) == expected);
}

void PaneLayoutTreeTest::testBuildDefaultThree()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b,c"));

    const auto expected = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┐
        │ a │ b │
        │   ├───┤
        │   │ c │
        └───┴───┘
    )"));
    QVERIFY(tree == expected);

    const QJsonObject json = PaneLayoutTree::toJson(tree).toObject();
    QCOMPARE(json.value(QStringLiteral("direction")).toString(), QStringLiteral("row"));
    QCOMPARE(json.value(QStringLiteral("first")).toString(), QStringLiteral("a"));
    const QJsonObject second = json.value(QStringLiteral("second")).toObject();
    QCOMPARE(second.value(QStringLiteral("direction")).toString(), QStringLiteral("column"));
    QCOMPARE(second.value(QStringLiteral("first")).toString(), QStringLiteral("b"));
    QCOMPARE(second.value(QStringLiteral("second")).toString(), QStringLiteral("c"));
}

void PaneLayoutTreeTest::testBuildDefaultFour()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b,c,d"));

    const auto expected = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┐
        │ a │ b │
        │   ├───┤
        │   │ c │
        │   ├───┤
        │   │ d │
        └───┴───┘
    )"));
    QVERIFY(tree == expected);
    QVERIFY(PaneLayoutTree::isWellFormed(tree));
    QCOMPARE(PaneLayoutTree::paneIds(tree), ids("a,b,c,d"));
}

void PaneLayoutTreeTest::testInsertIntoEmpty()
{
    const auto tree = PaneLayoutTree::insert(std::nullopt, QStringLiteral("a"));
    QVERIFY(tree.has_value());
    QVERIFY(tree->isLeaf());
    QCOMPARE(tree->paneId, QStringLiteral("a"));
}

void PaneLayoutTreeTest::testInsertAppendsOnSecondBranch()
{
    auto tree = PaneLayoutTree::insert(PaneLayoutTree::buildDefault(ids("a,b")), QStringLiteral("c"));

    const auto expected = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┬───┐
        │ a │ b │ c │
        └───┴───┴───┘
    )"));
    QVERIFY(tree == expected);
}

void PaneLayoutTreeTest::testInsertExistingIsNoop()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b,c"));
    QVERIFY(PaneLayoutTree::insert(tree, QStringLiteral("b")) == tree);
}

void PaneLayoutTreeTest::testRemoveCollapsesToLeaf()
{
    const PaneLayoutTree::Tree tree = PaneLayoutNode::split(SplitDirection::Row, PaneLayoutNode::leaf(QStringLiteral("a")), PaneLayoutNode::leaf(QStringLiteral("b")));

    const auto result = PaneLayoutTree::remove(tree, QStringLiteral("a"));
    QVERIFY(result.has_value());
    QVERIFY(result->isLeaf());
    QCOMPARE(result->paneId, QStringLiteral("b"));
    QCOMPARE(PaneLayoutTree::toJson(result).toString(), QStringLiteral("b"));
}

void PaneLayoutTreeTest::testRemoveLastPane()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a"));
    QVERIFY(!PaneLayoutTree::remove(tree, QStringLiteral("a")).has_value());
    QVERIFY(!PaneLayoutTree::remove(std::nullopt, QStringLiteral("a")).has_value());
}

void PaneLayoutTreeTest::testRemoveNested()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┐
        │ a │ b │
        ├───┼───┤
        │ c │ d │
        └───┴───┘
    )"));
    QCOMPARE(LayoutDiagram::countPanes(tree), 4);

    const auto result = PaneLayoutTree::remove(tree, QStringLiteral("c"));

    // The left column collapses into its remaining pane
    const auto expected = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┐
        │ a │ b │
        │   ├───┤
        │   │ d │
        └───┴───┘
    )"));
    QVERIFY(result == expected);
    QVERIFY(PaneLayoutTree::isWellFormed(result));
}

void PaneLayoutTreeTest::testInsertThenRemoveRestoresTree_data()
{
    QTest::addColumn<QStringList>("panes");

    QTest::newRow("empty") << QStringList();
    QTest::newRow("single") << ids("a");
    QTest::newRow("pair") << ids("a,b");
    QTest::newRow("five") << ids("a,b,c,d,e");
}

void PaneLayoutTreeTest::testInsertThenRemoveRestoresTree()
{
    QFETCH(QStringList, panes);
    const auto tree = PaneLayoutTree::buildDefault(panes);

    const auto inserted = PaneLayoutTree::insert(tree, QStringLiteral("z"));
    QVERIFY(PaneLayoutTree::contains(inserted, QStringLiteral("z")));
    QVERIFY(PaneLayoutTree::remove(inserted, QStringLiteral("z")) == tree);
}

void PaneLayoutTreeTest::testRemoveUnknownKeepsTree()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b,c"));
    QVERIFY(PaneLayoutTree::remove(tree, QStringLiteral("zz")) == tree);
}

void PaneLayoutTreeTest::testSplitPane()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b"));
    const auto result = PaneLayoutTree::splitPane(tree, QStringLiteral("a"), QStringLiteral("c"), SplitDirection::Column);

    const auto expected = LayoutDiagram::parse(QStringLiteral(R"(
        ┌───┬───┐
        │ a │ b │
        ├───┤   │
        │ c │   │
        └───┴───┘
    )"));
    QVERIFY(result == expected);
}

void PaneLayoutTreeTest::testSplitPaneUnknownTargetAppends()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b"));
    const auto result = PaneLayoutTree::splitPane(tree, QStringLiteral("zz"), QStringLiteral("c"), SplitDirection::Column);
    QCOMPARE(PaneLayoutTree::paneIds(result), ids("a,b,c"));
    QVERIFY(result == PaneLayoutTree::insert(tree, QStringLiteral("c")));
}

void PaneLayoutTreeTest::testSplitPaneDuplicateIsNoop()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b"));
    QVERIFY(PaneLayoutTree::splitPane(tree, QStringLiteral("a"), QStringLiteral("b"), SplitDirection::Row) == tree);
    QVERIFY(PaneLayoutTree::isWellFormed(tree));
}

void PaneLayoutTreeTest::testEditsDoNotModifyInput()
{
    const auto tree = PaneLayoutTree::buildDefault(ids("a,b,c"));
    const auto copy = tree;

    PaneLayoutTree::insert(tree, QStringLiteral("d"));
    PaneLayoutTree::remove(tree, QStringLiteral("b"));
    PaneLayoutTree::splitPane(tree, QStringLiteral("c"), QStringLiteral("e"), SplitDirection::Row);

    QVERIFY(tree == copy);
}

void PaneLayoutTreeTest::testPaneIdsVisualOrder()
{
    const auto tree = LayoutDiagram::parse(QStringLiteral(R"(
        ┌────┬────┐
        │ x  │ y  │
        ├────┤    │
        │ w  │    │
        └────┴────┘
    )"));
    QCOMPARE(PaneLayoutTree::paneIds(tree), ids("x,w,y"));
    QVERIFY(PaneLayoutTree::contains(tree, QStringLiteral("w")));
    QVERIFY(!PaneLayoutTree::contains(tree, QStringLiteral("z")));
    QVERIFY(!PaneLayoutTree::contains(std::nullopt, QStringLiteral("x")));
}

void PaneLayoutTreeTest::testJsonRoundTrip()
{
    auto tree = PaneLayoutTree::buildDefault(ids("a,b,c"));
    tree->splitPercentage = 30.0;

    const QJsonValue json = PaneLayoutTree::toJson(tree);
    QCOMPARE(json.toObject().value(QStringLiteral("splitPercentage")).toDouble(), 30.0);

    const auto parsed = PaneLayoutTree::fromJson(json);
    QVERIFY(parsed.has_value());
    QVERIFY(*parsed == tree);
}

void PaneLayoutTreeTest::testJsonNullIsEmpty()
{
    const auto parsed = PaneLayoutTree::fromJson(QJsonValue(QJsonValue::Null));
    QVERIFY(parsed.has_value());
    QVERIFY(!parsed->has_value());
    QVERIFY(PaneLayoutTree::toJson(std::nullopt).isNull());
}

void PaneLayoutTreeTest::testJsonRejectsMalformed_data()
{
    QTest::addColumn<QByteArray>("json");

    QTest::newRow("duplicate pane") << QByteArray(R"({"direction":"row","first":"a","second":"a"})");
    QTest::newRow("empty pane id") << QByteArray(R"("")");
    QTest::newRow("missing second") << QByteArray(R"({"direction":"row","first":"a"})");
    QTest::newRow("unknown direction") << QByteArray(R"({"direction":"diagonal","first":"a","second":"b"})");
    QTest::newRow("bad percentage") << QByteArray(R"({"direction":"row","first":"a","second":"b","splitPercentage":"half"})");
    QTest::newRow("number") << QByteArray("42");
    QTest::newRow("nested duplicate") << QByteArray(R"({"direction":"row","first":"a","second":{"direction":"column","first":"b","second":"a"}})");
}

void PaneLayoutTreeTest::testJsonRejectsMalformed()
{
    QFETCH(QByteArray, json);
    QVERIFY(!PaneLayoutTree::fromJson(parseJson(json.constData())).has_value());
}

void PaneLayoutTreeTest::testJsonKeepsMissingPercentage()
{
    const auto parsed = PaneLayoutTree::fromJson(parseJson(R"({"direction":"column","first":"a","second":"b"})"));
    QVERIFY(parsed.has_value());
    QVERIFY(parsed->has_value());
    QVERIFY((*parsed)->direction == SplitDirection::Column);
    QVERIFY(!(*parsed)->splitPercentage.has_value());
    QVERIFY(!PaneLayoutTree::toJson(*parsed).toObject().contains(QStringLiteral("splitPercentage")));
}

QTEST_GUILESS_MAIN(PaneLayoutTreeTest)
