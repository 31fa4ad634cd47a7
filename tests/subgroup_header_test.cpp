/*
 * University timetable from XLS to JSON converter
 *
 * Copyright (c) 2018 Vitaliy Novichkov <admin@wohlnet.ru>
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the "Software"),
 * to deal in the Software without restriction, including without limitation the
 * rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
 * sell copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
 * OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
 * IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
 * DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE,
 * ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 * DEALINGS IN THE SOFTWARE.
 */

#include <gtest/gtest.h>
#include "subgroup_header.h"
#include "test_helpers.h"

using namespace TestSheets;

static SubgroupCluster with(std::initializer_list<int> numbers)
{
    return SubgroupCluster(std::vector<int>(numbers));
}

static SubgroupCluster without()
{
    return SubgroupCluster();
}

//! Строка заголовка: три служебные ячейки, затем ячейки номеров через одну
static Row headerRow(const std::vector<Cell> &cells)
{
    Row row(3);
    for(const Cell &c : cells)
    {
        row.push_back(c);
        row.push_back(empty());
    }
    return row;
}

TEST(SubgroupHeaderScannerTest, AscendingNumbersAccumulate)
{
    SubgroupHeaderScanner s;
    s.onNumber(1);
    EXPECT_EQ(s.state(), SubgroupHeaderScanner::Accumulating);
    s.onNumber(2);
    s.onNumber(3);
    EXPECT_TRUE(s.clusters().empty());
    s.finish();
    SubgroupClusters expected = {with({1, 2, 3})};
    EXPECT_EQ(s.clusters(), expected);
}

TEST(SubgroupHeaderScannerTest, DecreasingNumberOpensNewCluster)
{
    SubgroupHeaderScanner s;
    s.onNumber(1);
    s.onNumber(2);
    s.onNumber(1);
    EXPECT_EQ(s.state(), SubgroupHeaderScanner::Accumulating);
    ASSERT_EQ(s.clusters().size(), 1u);
    EXPECT_EQ(s.clusters()[0], with({1, 2}));
    s.finish();
    SubgroupClusters expected = {with({1, 2}), with({1})};
    EXPECT_EQ(s.takeClusters(), expected);
}

TEST(SubgroupHeaderScannerTest, RepeatedNumberOpensNewCluster)
{
    SubgroupHeaderScanner s;
    s.onNumber(2);
    s.onNumber(2);
    s.finish();
    SubgroupClusters expected = {with({2}), with({2})};
    EXPECT_EQ(s.clusters(), expected);
}

TEST(SubgroupHeaderScannerTest, EmptyCellClosesCluster)
{
    SubgroupHeaderScanner s;
    s.onNumber(1);
    s.onNumber(2);
    s.onEmpty();
    EXPECT_EQ(s.state(), SubgroupHeaderScanner::Idle);
    s.onNumber(1);
    s.finish();
    // Пустая ячейка - это столбец группы без подгрупп
    SubgroupClusters expected = {with({1, 2}), without(), with({1})};
    EXPECT_EQ(s.clusters(), expected);
}

TEST(SubgroupHeaderScannerTest, LeadingEmptyCellIsGroupWithoutSubgroups)
{
    SubgroupHeaderScanner s;
    s.onEmpty();
    s.onNumber(1);
    s.onNumber(2);
    s.finish();
    SubgroupClusters expected = {without(), with({1, 2})};
    EXPECT_EQ(s.clusters(), expected);
}

TEST(SubgroupHeaderScannerTest, EmptyCellsAreSeparateGroups)
{
    SubgroupHeaderScanner s;
    s.onEmpty();
    s.onEmpty();
    s.onEmpty();
    s.finish();
    SubgroupClusters expected = {without(), without(), without()};
    EXPECT_EQ(s.clusters(), expected);
}

TEST(SubgroupHeaderScannerTest, NothingScannedGivesOneGroup)
{
    SubgroupHeaderScanner s;
    s.finish();
    SubgroupClusters expected = {without()};
    EXPECT_EQ(s.clusters(), expected);
}

TEST(SubgroupHeaderTest, AdjacentNumberedGroups)
{
    SubgroupClusters clusters;
    ScheduleError error;
    ASSERT_TRUE(parseSubgroupHeader(headerRow({str("1"), str("2"), str("1")}), 1, clusters, error));
    SubgroupClusters expected = {with({1, 2}), with({1})};
    EXPECT_EQ(clusters, expected);
    EXPECT_EQ(countSubgroupColumns(clusters), 3u);
}

TEST(SubgroupHeaderTest, RowWithoutNumbersIsSingleGroup)
{
    SubgroupClusters clusters;
    ScheduleError error;
    ASSERT_TRUE(parseSubgroupHeader(headerRow({empty()}), 1, clusters, error));
    SubgroupClusters expected = {without()};
    EXPECT_EQ(clusters, expected);
    EXPECT_EQ(countSubgroupColumns(clusters), 1u);
}

TEST(SubgroupHeaderTest, ShortRowIsSingleGroup)
{
    SubgroupClusters clusters;
    ScheduleError error;
    ASSERT_TRUE(parseSubgroupHeader(Row(3), 1, clusters, error));
    EXPECT_EQ(clusters.size(), 1u);
    EXPECT_FALSE(clusters[0].has_subgroups);
}

TEST(SubgroupHeaderTest, RoomColumnsAreSkipped)
{
    Row row(3);
    row.push_back(str("1"));
    row.push_back(str("ignored"));
    row.push_back(str("2"));
    row.push_back(num(7.0));

    SubgroupClusters clusters;
    ScheduleError error;
    ASSERT_TRUE(parseSubgroupHeader(row, 1, clusters, error));
    SubgroupClusters expected = {with({1, 2})};
    EXPECT_EQ(clusters, expected);
}

TEST(SubgroupHeaderTest, MixedGroups)
{
    SubgroupClusters clusters;
    ScheduleError error;
    ASSERT_TRUE(parseSubgroupHeader(headerRow({empty(), str("1"), str("2"), empty(), str("1"), str("2"), str("3")}),
                                    1, clusters, error));
    SubgroupClusters expected = {without(), with({1, 2}), without(), with({1, 2, 3})};
    EXPECT_EQ(clusters, expected);
    EXPECT_EQ(countSubgroupColumns(clusters), 7u);
}

TEST(SubgroupHeaderTest, NumericCellIsTypeMismatch)
{
    SubgroupClusters clusters;
    ScheduleError error;
    EXPECT_FALSE(parseSubgroupHeader(headerRow({str("1"), num(2.0)}), 1, clusters, error));
    EXPECT_EQ(error.code, ScheduleError::CellTypeMismatch);
    EXPECT_EQ(error.row, 1);
    EXPECT_EQ(error.column, 5);
}

TEST(SubgroupHeaderTest, TextCellIsUnparsable)
{
    SubgroupClusters clusters;
    ScheduleError error;
    EXPECT_FALSE(parseSubgroupHeader(headerRow({str("first")}), 1, clusters, error));
    EXPECT_EQ(error.code, ScheduleError::UnparsableSubgroupNumber);
    EXPECT_EQ(error.column, 3);
}

TEST(SubgroupHeaderTest, SubgroupNumberRange)
{
    int n = 0;
    EXPECT_TRUE(parseSubgroupNumber("1", n));
    EXPECT_EQ(n, 1);
    EXPECT_TRUE(parseSubgroupNumber(" 12 ", n));
    EXPECT_EQ(n, 12);
    EXPECT_TRUE(parseSubgroupNumber("255", n));
    EXPECT_EQ(n, 255);
    EXPECT_FALSE(parseSubgroupNumber("0", n));
    EXPECT_FALSE(parseSubgroupNumber("256", n));
    EXPECT_FALSE(parseSubgroupNumber("-1", n));
    EXPECT_FALSE(parseSubgroupNumber("1a", n));
    EXPECT_FALSE(parseSubgroupNumber("   ", n));
    EXPECT_FALSE(parseSubgroupNumber("99999999999999999999", n));
}
