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
#include <cstdio>
#include <string>
#include "schedule_json.h"
#include "test_helpers.h"

using namespace TestSheets;
using nlohmann::json;

static CourseSet sampleCourses()
{
    CourseSet courses;

    Subgroup one;
    one.number = 1;
    one.days[0].upper_classes[0] = LessonSlot(makeClass("Math", ClassType::Practice, "Teacher", "Class"));
    one.days[3].lower_classes[2] = LessonSlot(makeClass("Physics", ClassType::Lecture, "", "A-1"));

    Subgroup two;
    two.number = 2;
    Class unknown = makeClass("History", ClassType::Unknown, "Ivanov", "B-7");
    unknown.class_type = ClassType(ClassType::Unknown, "Семинар");
    two.days[6].lower_classes[6] = LessonSlot(unknown);

    GroupInfo withSubgroups;
    withSubgroups.name = "БИВТ-21-15";
    withSubgroups.subgroups = WeekInfo::makeWithSubgroups(std::vector<Subgroup>{one, two});

    Week week;
    week[4].upper_classes[5] = LessonSlot(makeClass("CS", ClassType::Lab, "Teacher2", "Class2"));
    GroupInfo plain;
    plain.name = "БИВТ-21-16";
    plain.subgroups = WeekInfo::makeWithoutSubgroup(week);

    courses[0] = Course("Первый курс", std::vector<GroupInfo>{withSubgroups, plain});
    courses[1] = Course("Второй курс", std::vector<GroupInfo>{plain});
    courses[2] = Course("Третий курс", std::vector<GroupInfo>());
    courses[3] = Course("Четвёртый курс", std::vector<GroupInfo>{withSubgroups});
    return courses;
}

TEST(ScheduleJsonTest, CourseSetRoundTrip)
{
    CourseSet courses = sampleCourses();
    CourseSet restored;
    ScheduleError error;
    std::string text;
    ASSERT_TRUE(coursesToString(courses, text, error)) << error.toString();
    ASSERT_TRUE(coursesFromString(text, restored, error)) << error.toString();
    EXPECT_EQ(restored, courses);
}

TEST(ScheduleJsonTest, NestedValuesRoundTrip)
{
    CourseSet courses = sampleCourses();
    const GroupInfo &group = courses[0].groups[0];

    EXPECT_EQ(json(group).get<GroupInfo>(), group);
    EXPECT_EQ(json(group.subgroups).get<WeekInfo>(), group.subgroups);
    EXPECT_EQ(json(group.subgroups.subgroups[1]).get<Subgroup>(), group.subgroups.subgroups[1]);

    const Day &day = group.subgroups.subgroups[0].days[0];
    EXPECT_EQ(json(day).get<Day>(), day);
    EXPECT_EQ(json(day.upper_classes[0].entry).get<Class>(), day.upper_classes[0].entry);
}

TEST(ScheduleJsonTest, ClassEncoding)
{
    json withLector = json(makeClass("Math", ClassType::Practice, "Teacher", "Class"));
    EXPECT_EQ(withLector["name"], "Math");
    EXPECT_EQ(withLector["class_type"]["kind"], "Practice");
    EXPECT_EQ(withLector["teacher"], "Teacher");
    EXPECT_EQ(withLector["room"], "Class");

    json noLector = json(makeClass("CS", ClassType::Lab, "", "Class2"));
    EXPECT_EQ(noLector.count("teacher"), 0u);

    json unknown = json(ClassType(ClassType::Unknown, "Семинар"));
    EXPECT_EQ(unknown["kind"], "Unknown");
    EXPECT_EQ(unknown["label"], "Семинар");

    EXPECT_TRUE(json(LessonSlot()).is_null());
}

TEST(ScheduleJsonTest, WeekInfoIsTagged)
{
    CourseSet courses = sampleCourses();
    json with = json(courses[0].groups[0].subgroups);
    EXPECT_EQ(with["kind"], "WithSubgroups");
    EXPECT_EQ(with["subgroups"].size(), 2u);

    json without = json(courses[0].groups[1].subgroups);
    EXPECT_EQ(without["kind"], "WithoutSubgroup");
    EXPECT_EQ(without["week"].size(), 7u);
    EXPECT_EQ(without["week"][0]["upper_classes"].size(), 7u);
}

TEST(ScheduleJsonTest, NullTeacherIsAccepted)
{
    json j = {{"name", "CS"}, {"class_type", {{"kind", "Lab"}}}, {"teacher", nullptr}, {"room", "1"}};
    Class c = j.get<Class>();
    EXPECT_FALSE(c.hasLector());
}

TEST(ScheduleJsonTest, MalformedDocumentsAreRejected)
{
    CourseSet restored;
    ScheduleError error;

    EXPECT_FALSE(coursesFromString("{not json", restored, error));
    EXPECT_EQ(error.code, ScheduleError::DocumentFormat);

    EXPECT_FALSE(coursesFromString("[]", restored, error));
    EXPECT_EQ(error.code, ScheduleError::DocumentFormat);

    json doc = coursesToJson(sampleCourses());
    doc[0]["groups"][1]["subgroups"]["week"].erase(0);
    EXPECT_FALSE(coursesFromJson(doc, restored, error));
    EXPECT_EQ(error.code, ScheduleError::DocumentFormat);

    doc = coursesToJson(sampleCourses());
    doc[1]["groups"][0]["subgroups"]["kind"] = "Sometimes";
    EXPECT_FALSE(coursesFromJson(doc, restored, error));

    doc = coursesToJson(sampleCourses());
    doc[0]["groups"][0]["subgroups"]["subgroups"] = json::array();
    EXPECT_FALSE(coursesFromJson(doc, restored, error));

    doc = coursesToJson(sampleCourses());
    doc[0]["groups"][0]["subgroups"]["subgroups"][0]["days"][0]["upper_classes"][0]["class_type"]["kind"] = 5;
    EXPECT_FALSE(coursesFromJson(doc, restored, error));

    EXPECT_EQ(restored, CourseSet());
}

TEST(ScheduleJsonTest, SubgroupNumberRangeIsChecked)
{
    json doc = coursesToJson(sampleCourses());
    json &number = doc[0]["groups"][0]["subgroups"]["subgroups"][0]["number"];
    CourseSet restored;
    ScheduleError error;

    number = 0;
    EXPECT_FALSE(coursesFromJson(doc, restored, error));
    EXPECT_EQ(error.code, ScheduleError::DocumentFormat);

    number = -3;
    EXPECT_FALSE(coursesFromJson(doc, restored, error));

    number = 256;
    EXPECT_FALSE(coursesFromJson(doc, restored, error));

    number = 2.7;
    EXPECT_FALSE(coursesFromJson(doc, restored, error));

    number = "1";
    EXPECT_FALSE(coursesFromJson(doc, restored, error));

    number = 255;
    ASSERT_TRUE(coursesFromJson(doc, restored, error)) << error.toString();
    EXPECT_EQ(restored[0].groups[0].subgroups.subgroups[0].number, 255);
}

TEST(ScheduleJsonTest, InvalidUtf8IsReportedNotThrown)
{
    CourseSet courses = sampleCourses();
    courses[2].groups.push_back(GroupInfo());
    courses[2].groups[0].name = "БИВТ\xff";
    courses[2].groups[0].subgroups = WeekInfo::makeWithoutSubgroup(Week());

    std::string text;
    ScheduleError error;
    EXPECT_FALSE(coursesToString(courses, text, error));
    EXPECT_EQ(error.code, ScheduleError::DocumentFormat);

    std::string path = testing::TempDir() + "timetable_json_bad_utf8.json";
    error = ScheduleError();
    EXPECT_FALSE(saveCoursesToFile(path, courses, error));
    EXPECT_EQ(error.code, ScheduleError::DocumentFormat);
    std::remove(path.c_str());
}

TEST(ScheduleJsonTest, FileRoundTrip)
{
    std::string path = testing::TempDir() + "timetable_json_roundtrip.json";
    CourseSet courses = sampleCourses();
    ScheduleError error;
    ASSERT_TRUE(saveCoursesToFile(path, courses, error)) << error.toString();

    CourseSet restored;
    ASSERT_TRUE(loadCoursesFromFile(path, restored, error)) << error.toString();
    EXPECT_EQ(restored, courses);
    std::remove(path.c_str());

    EXPECT_FALSE(loadCoursesFromFile(path, restored, error));
    EXPECT_EQ(error.code, ScheduleError::FileLoadFailed);
}
