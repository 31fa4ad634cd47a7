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
#include "class_cell.h"
#include "test_helpers.h"

using namespace TestSheets;

TEST(ClassCellTest, ParsesNameTypeLectorAndRoom)
{
    Class c;
    ASSERT_TRUE(parseClassCell(str("Math (Практические)\nTeacher"), str("Class"), c));
    EXPECT_EQ(c, makeClass("Math", ClassType::Practice, "Teacher", "Class"));
    EXPECT_TRUE(c.hasLector());
}

TEST(ClassCellTest, LectorIsOptional)
{
    Class c;
    ASSERT_TRUE(parseClassCell(str("CS (Лабораторные)"), str("Class2"), c));
    EXPECT_EQ(c.disciplyne_name, "CS");
    EXPECT_EQ(c.class_type, ClassType(ClassType::Lab));
    EXPECT_FALSE(c.hasLector());
    EXPECT_EQ(c.room_name, "Class2");
}

TEST(ClassCellTest, BlankLectorLineIsDropped)
{
    Class c;
    ASSERT_TRUE(parseClassCell(str("Physics (Лекционные)\n   "), str("101"), c));
    EXPECT_EQ(c.class_type, ClassType(ClassType::Lecture));
    EXPECT_FALSE(c.hasLector());

    ASSERT_TRUE(parseClassCell(str("Physics (Лекционные)\n"), str("101"), c));
    EXPECT_FALSE(c.hasLector());
}

TEST(ClassCellTest, UnknownTypeKeepsRawLabel)
{
    Class c;
    ASSERT_TRUE(parseClassCell(str("History (Семинар)\nIvanov"), str("A-1"), c));
    EXPECT_EQ(c.class_type.kind, ClassType::Unknown);
    EXPECT_EQ(c.class_type.label, "Семинар");
}

TEST(ClassCellTest, TypeLabelIsCaseSensitive)
{
    Class c;
    ASSERT_TRUE(parseClassCell(str("Math (лекционные)"), str("1"), c));
    EXPECT_EQ(c.class_type.kind, ClassType::Unknown);
    EXPECT_EQ(c.class_type.label, "лекционные");
}

TEST(ClassCellTest, SplitsOnFirstParenthesis)
{
    Class c;
    ASSERT_TRUE(parseClassCell(str("Algebra (part 2) (Практические)"), str("5"), c));
    EXPECT_EQ(c.disciplyne_name, "Algebra");
    EXPECT_EQ(c.class_type.kind, ClassType::Unknown);
    EXPECT_EQ(c.class_type.label, "part 2) (Практические");
}

TEST(ClassCellTest, NonStringDescriptionIsNoClass)
{
    Class c;
    EXPECT_FALSE(parseClassCell(num(42.0), str("Class"), c));
    EXPECT_FALSE(parseClassCell(empty(), str("Class"), c));
    EXPECT_FALSE(parseLessonSlot(num(1.0), str("Room")).is_set);
}

TEST(ClassCellTest, NonStringRoomIsNoClass)
{
    Class c;
    EXPECT_FALSE(parseClassCell(str("Math (Практические)"), num(305.0), c));
    EXPECT_FALSE(parseClassCell(str("Math (Практические)"), empty(), c));
}

TEST(ClassCellTest, GrammarViolationsAreNoClass)
{
    Class c;
    EXPECT_FALSE(parseClassCell(str("Math"), str("1"), c));
    EXPECT_FALSE(parseClassCell(str("Math(Практические)"), str("1"), c));
    EXPECT_FALSE(parseClassCell(str("Math (Практические"), str("1"), c));
    EXPECT_FALSE(parseClassCell(str("Math (Практические\nTeacher)"), str("1"), c));
}

TEST(ClassCellTest, LessonSlotCarriesParsedClass)
{
    LessonSlot slot = parseLessonSlot(str("Math (Практические)\nTeacher"), str("Class"));
    ASSERT_TRUE(slot.is_set);
    EXPECT_EQ(slot.entry, makeClass("Math", ClassType::Practice, "Teacher", "Class"));
}
