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

#include "schedule_json.h"
#include "sheet_layout.h"
#include <cstdio>
#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace
{

/**
 * @brief Документ корректен как JSON, но не соответствует модели
 */
class DocumentError : public std::runtime_error
{
public:
    explicit DocumentError(const std::string &what) :
        std::runtime_error(what)
    {}
};

void expectArray(const json &j, std::size_t size, const char *what)
{
    if(!j.is_array())
        throw DocumentError(std::string(what) + ": ожидался массив");
    if(j.size() != size)
        throw DocumentError(std::string(what) + ": ожидалось " + std::to_string(size) +
                            " элементов, получено " + std::to_string(j.size()));
}

void lessonsFromJson(const json &j, DayLessons &lessons, const char *what)
{
    expectArray(j, lessons.size(), what);
    for(std::size_t i = 0; i < lessons.size(); i++)
        lessons[i] = j[i].get<LessonSlot>();
}

const char *classKindName(ClassType::Kind k)
{
    switch(k)
    {
    case ClassType::Lecture:
        return "Lecture";
    case ClassType::Practice:
        return "Practice";
    case ClassType::Lab:
        return "Lab";
    case ClassType::Unknown:
        break;
    }
    return "Unknown";
}

} // namespace

void to_json(json &j, const ClassType &t)
{
    j = json::object();
    j["kind"] = classKindName(t.kind);
    if(t.kind == ClassType::Unknown)
        j["label"] = t.label;
}

void from_json(const json &j, ClassType &t)
{
    std::string kind = j.at("kind").get<std::string>();
    if(kind == "Lecture")
        t = ClassType(ClassType::Lecture);
    else if(kind == "Practice")
        t = ClassType(ClassType::Practice);
    else if(kind == "Lab")
        t = ClassType(ClassType::Lab);
    else if(kind == "Unknown")
        t = ClassType(ClassType::Unknown, j.at("label").get<std::string>());
    else
        throw DocumentError("неизвестный тип занятия [" + kind + "]");
}

void to_json(json &j, const Class &c)
{
    j = json::object();
    j["name"] = c.disciplyne_name;
    j["class_type"] = c.class_type;
    if(c.hasLector())
        j["teacher"] = c.lector_name;
    j["room"] = c.room_name;
}

void from_json(const json &j, Class &c)
{
    c.disciplyne_name = j.at("name").get<std::string>();
    c.class_type = j.at("class_type").get<ClassType>();
    c.lector_name.clear();
    json::const_iterator teacher = j.find("teacher");
    if(teacher != j.end() && !teacher->is_null())
        c.lector_name = teacher->get<std::string>();
    c.room_name = j.at("room").get<std::string>();
}

void to_json(json &j, const LessonSlot &s)
{
    if(s.is_set)
        j = json(s.entry);
    else
        j = nullptr;
}

void from_json(const json &j, LessonSlot &s)
{
    if(j.is_null())
    {
        s.clean();
        return;
    }
    s.entry = j.get<Class>();
    s.is_set = true;
}

void to_json(json &j, const Day &d)
{
    json upper = json::array();
    json lower = json::array();
    for(const LessonSlot &s : d.upper_classes)
        upper.push_back(json(s));
    for(const LessonSlot &s : d.lower_classes)
        lower.push_back(json(s));
    j = json::object();
    j["upper_classes"] = upper;
    j["lower_classes"] = lower;
}

void from_json(const json &j, Day &d)
{
    lessonsFromJson(j.at("upper_classes"), d.upper_classes, "upper_classes");
    lessonsFromJson(j.at("lower_classes"), d.lower_classes, "lower_classes");
}

json weekToJson(const Week &week)
{
    json out = json::array();
    for(const Day &d : week)
        out.push_back(json(d));
    return out;
}

void weekFromJson(const json &j, Week &week)
{
    expectArray(j, week.size(), "week");
    for(std::size_t i = 0; i < week.size(); i++)
        week[i] = j[i].get<Day>();
}

void to_json(json &j, const Subgroup &s)
{
    j = json::object();
    j["number"] = s.number;
    j["days"] = weekToJson(s.days);
}

void from_json(const json &j, Subgroup &s)
{
    const json &number = j.at("number");
    if(!number.is_number_integer())
        throw DocumentError("номер подгруппы должен быть целым числом");
    long long value = number.get<long long>();
    if(value < 1 || value > SheetLayout::maxSubgroupNumber)
        throw DocumentError("номер подгруппы вне диапазона 1.." +
                            std::to_string(SheetLayout::maxSubgroupNumber) + ": " + std::to_string(value));
    s.number = static_cast<int>(value);
    weekFromJson(j.at("days"), s.days);
}

void to_json(json &j, const WeekInfo &w)
{
    j = json::object();
    if(w.kind == WeekInfo::WithSubgroups)
    {
        json list = json::array();
        for(const Subgroup &s : w.subgroups)
            list.push_back(json(s));
        j["kind"] = "WithSubgroups";
        j["subgroups"] = list;
    }
    else
    {
        j["kind"] = "WithoutSubgroup";
        j["week"] = weekToJson(w.week);
    }
}

void from_json(const json &j, WeekInfo &w)
{
    std::string kind = j.at("kind").get<std::string>();
    if(kind == "WithSubgroups")
    {
        const json &list = j.at("subgroups");
        if(!list.is_array() || list.empty())
            throw DocumentError("список подгрупп должен быть непустым массивом");
        std::vector<Subgroup> subgroups;
        for(const json &s : list)
            subgroups.push_back(s.get<Subgroup>());
        w = WeekInfo::makeWithSubgroups(std::move(subgroups));
    }
    else if(kind == "WithoutSubgroup")
    {
        Week week;
        weekFromJson(j.at("week"), week);
        w = WeekInfo::makeWithoutSubgroup(std::move(week));
    }
    else
        throw DocumentError("неизвестный вид недели [" + kind + "]");
}

void to_json(json &j, const GroupInfo &g)
{
    j = json::object();
    j["name"] = g.name;
    j["subgroups"] = g.subgroups;
}

void from_json(const json &j, GroupInfo &g)
{
    g.name = j.at("name").get<std::string>();
    g.subgroups = j.at("subgroups").get<WeekInfo>();
}

void to_json(json &j, const Course &c)
{
    json groups = json::array();
    for(const GroupInfo &g : c.groups)
        groups.push_back(json(g));
    j = json::object();
    j["name"] = c.name;
    j["groups"] = groups;
}

void from_json(const json &j, Course &c)
{
    c.name = j.at("name").get<std::string>();
    c.groups.clear();
    const json &groups = j.at("groups");
    if(!groups.is_array())
        throw DocumentError("groups: ожидался массив");
    for(const json &g : groups)
        c.groups.push_back(g.get<GroupInfo>());
}

json coursesToJson(const CourseSet &courses)
{
    json out = json::array();
    for(const Course &c : courses)
        out.push_back(json(c));
    return out;
}

bool coursesFromJson(const json &j, CourseSet &courses, ScheduleError &error)
{
    try
    {
        expectArray(j, courses.size(), "courses");
        CourseSet tmp;
        for(std::size_t i = 0; i < tmp.size(); i++)
            tmp[i] = j[i].get<Course>();
        courses = std::move(tmp);
    }
    catch(const json::exception &e)
    {
        error = ScheduleError(ScheduleError::DocumentFormat, e.what());
        return false;
    }
    catch(const DocumentError &e)
    {
        error = ScheduleError(ScheduleError::DocumentFormat, e.what());
        return false;
    }

    return true;
}

bool coursesToString(const CourseSet &courses, std::string &out, ScheduleError &error, int indent)
{
    try
    {
        out = coursesToJson(courses).dump(indent);
    }
    catch(const json::exception &e)
    {
        error = ScheduleError(ScheduleError::DocumentFormat, e.what());
        return false;
    }

    return true;
}

bool coursesFromString(const std::string &text, CourseSet &courses, ScheduleError &error)
{
    json j;
    try
    {
        j = json::parse(text);
    }
    catch(const json::parse_error &e)
    {
        error = ScheduleError(ScheduleError::DocumentFormat, e.what());
        return false;
    }

    return coursesFromJson(j, courses, error);
}

bool saveCoursesToFile(const std::string &path, const CourseSet &courses, ScheduleError &error)
{
    std::string text;
    if(!coursesToString(courses, text, error))
        return false;

    FILE *f = std::fopen(path.c_str(), "wb");
    if(!f)
    {
        error = ScheduleError(ScheduleError::FileLoadFailed,
                              "невозможно открыть файл " + path + " для записи");
        return false;
    }

    size_t written = std::fwrite(text.data(), 1, text.size(), f);
    bool closed = std::fclose(f) == 0;

    if(written != text.size() || !closed)
    {
        error = ScheduleError(ScheduleError::FileLoadFailed,
                              "ошибка записи в файл " + path);
        return false;
    }

    return true;
}

bool loadCoursesFromFile(const std::string &path, CourseSet &courses, ScheduleError &error)
{
    FILE *f = std::fopen(path.c_str(), "rb");
    if(!f)
    {
        error = ScheduleError(ScheduleError::FileLoadFailed,
                              "невозможно открыть файл " + path);
        return false;
    }

    std::string text;
    char buffer[4096];
    size_t got;
    while((got = std::fread(buffer, 1, sizeof(buffer), f)) > 0)
        text.append(buffer, got);

    bool failed = std::ferror(f) != 0;
    std::fclose(f);

    if(failed)
    {
        error = ScheduleError(ScheduleError::FileLoadFailed,
                              "ошибка чтения файла " + path);
        return false;
    }

    return coursesFromString(text, courses, error);
}
