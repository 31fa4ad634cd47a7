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

#include "schedule_model.h"
#include <utility>

ClassType ClassType::fromLabel(const std::string &label)
{
    if(label == "Лекционные")
        return ClassType(Lecture);
    if(label == "Практические")
        return ClassType(Practice);
    if(label == "Лабораторные")
        return ClassType(Lab);
    return ClassType(Unknown, label);
}

bool Class::operator==(const Class &o) const
{
    return disciplyne_name == o.disciplyne_name &&
           class_type == o.class_type &&
           lector_name == o.lector_name &&
           room_name == o.room_name;
}

WeekInfo WeekInfo::makeWithSubgroups(std::vector<Subgroup> list)
{
    WeekInfo w;
    w.kind = WithSubgroups;
    w.subgroups = std::move(list);
    return w;
}

WeekInfo WeekInfo::makeWithoutSubgroup(Week week)
{
    WeekInfo w;
    w.kind = WithoutSubgroup;
    w.week = std::move(week);
    return w;
}

std::size_t WeekInfo::weeksCount() const
{
    return kind == WithSubgroups ? subgroups.size() : 1;
}

bool WeekInfo::operator==(const WeekInfo &o) const
{
    if(kind != o.kind)
        return false;
    if(kind == WithSubgroups)
        return subgroups == o.subgroups;
    return week == o.week;
}

const Subgroup *GroupInfo::getSubgroup(int number) const
{
    if(subgroups.kind != WeekInfo::WithSubgroups)
        return nullptr;

    for(const Subgroup &s : subgroups.subgroups)
    {
        if(s.number == number)
            return &s;
    }

    return nullptr;
}

const GroupInfo *Course::findGroup(const std::string &groupName) const
{
    for(const GroupInfo &g : groups)
    {
        if(g.name == groupName)
            return &g;
    }
    return nullptr;
}
