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

#ifndef SCHEDULE_MODEL_H
#define SCHEDULE_MODEL_H

#include <array>
#include <string>
#include <utility>
#include <vector>

//! Дней в неделе (понедельник = 0 ... воскресенье = 6)
const std::size_t SCHEDULE_DAYS_IN_WEEK = 7;
//! Пар в одном дне
const std::size_t SCHEDULE_LESSONS_IN_DAY = 7;

/**
 * @brief Тип занятия (Лекция, практика, лабораторная, либо что-то иное)
 */
struct ClassType
{
    enum Kind
    {
        Lecture = 0,
        Practice,
        Lab,
        Unknown
    };

    Kind        kind = Unknown;
    //! Исходная подпись типа (хранится только для Unknown)
    std::string label;

    ClassType() = default;
    explicit ClassType(Kind k, const std::string &l = std::string()) :
        kind(k), label(k == Unknown ? l : std::string())
    {}

    /**
     * @brief Распознать тип занятия по подписи из таблицы
     * @param label Подпись без скобок, например "Лекционные"
     * @return Тип занятия, Unknown с исходной подписью если не распознано
     */
    static ClassType fromLabel(const std::string &label);

    bool operator==(const ClassType &o) const
    {
        return kind == o.kind && label == o.label;
    }
    bool operator!=(const ClassType &o) const
    {
        return !operator==(o);
    }
};

/**
 * @brief Одно занятие
 */
struct Class
{
    //! Название предмета
    std::string disciplyne_name;
    //! Тип занятия
    ClassType   class_type;
    //! Преподаватель (пустая строка - не указан)
    std::string lector_name;
    //! Имя комнаты проведения занятия
    std::string room_name;

    bool hasLector() const
    {
        return !lector_name.empty();
    }

    bool operator==(const Class &o) const;
    bool operator!=(const Class &o) const
    {
        return !operator==(o);
    }
};

/**
 * @brief Ячейка пары: занятие может отсутствовать
 */
struct LessonSlot
{
    bool  is_set = false;
    Class entry;

    LessonSlot() = default;
    LessonSlot(const Class &c) : is_set(true), entry(c) {}

    void clean()
    {
        is_set = false;
        entry = Class();
    }

    bool operator==(const LessonSlot &o) const
    {
        return is_set == o.is_set && (!is_set || entry == o.entry);
    }
    bool operator!=(const LessonSlot &o) const
    {
        return !operator==(o);
    }
};

typedef std::array<LessonSlot, SCHEDULE_LESSONS_IN_DAY> DayLessons;

/**
 * @brief Расписание одного дня для одного столбца недели
 */
struct Day
{
    //! Занятия верхней строки (индекс - номер пары от 0 до 6)
    DayLessons upper_classes;
    //! Занятия нижней строки
    DayLessons lower_classes;

    bool operator==(const Day &o) const
    {
        return upper_classes == o.upper_classes && lower_classes == o.lower_classes;
    }
    bool operator!=(const Day &o) const
    {
        return !operator==(o);
    }
};

typedef std::array<Day, SCHEDULE_DAYS_IN_WEEK> Week;

/**
 * @brief Неделя одной пронумерованной подгруппы
 */
struct Subgroup
{
    int  number = 0;
    Week days;

    bool operator==(const Subgroup &o) const
    {
        return number == o.number && days == o.days;
    }
    bool operator!=(const Subgroup &o) const
    {
        return !operator==(o);
    }
};

/**
 * @brief Форма расписания группы: с подгруппами или одна неделя
 */
struct WeekInfo
{
    enum Kind
    {
        WithSubgroups = 0,
        WithoutSubgroup
    };

    Kind                  kind = WithoutSubgroup;
    //! Подгруппы (только для WithSubgroups, не пуст)
    std::vector<Subgroup> subgroups;
    //! Неделя (только для WithoutSubgroup)
    Week                  week;

    static WeekInfo makeWithSubgroups(std::vector<Subgroup> list);
    static WeekInfo makeWithoutSubgroup(Week w);

    //! Сколько столбцов недели занимает группа
    std::size_t weeksCount() const;

    bool operator==(const WeekInfo &o) const;
    bool operator!=(const WeekInfo &o) const
    {
        return !operator==(o);
    }
};

/**
 * @brief Студенческая группа
 */
struct GroupInfo
{
    std::string name;
    WeekInfo    subgroups;

    /**
     * @brief Найти подгруппу по номеру
     * @return Указатель на подгруппу, nullptr если не найдена или у группы нет подгрупп
     */
    const Subgroup *getSubgroup(int number) const;

    bool operator==(const GroupInfo &o) const
    {
        return name == o.name && subgroups == o.subgroups;
    }
    bool operator!=(const GroupInfo &o) const
    {
        return !operator==(o);
    }
};

/**
 * @brief Курс: расписание одного листа
 */
struct Course
{
    //! Название (имя листа)
    std::string            name;
    std::vector<GroupInfo> groups;

    Course() = default;
    Course(const std::string &n, std::vector<GroupInfo> g) :
        name(n), groups(std::move(g))
    {}

    const GroupInfo *findGroup(const std::string &groupName) const;

    bool operator==(const Course &o) const
    {
        return name == o.name && groups == o.groups;
    }
    bool operator!=(const Course &o) const
    {
        return !operator==(o);
    }
};

#endif // SCHEDULE_MODEL_H
