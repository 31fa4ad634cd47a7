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

#ifndef SCHEDULE_JSON_H
#define SCHEDULE_JSON_H

#include <string>
#include <nlohmann/json.hpp>
#include "schedule_model.h"
#include "schedule_error.h"
#include "schedule_file.h"

/*
 * Преобразования модели расписания в JSON и обратно.
 * Функции from_json бросают исключения nlohmann::json при неверном
 * документе, coursesFromJson() и load*() переводят их в ScheduleError.
 */

void to_json(nlohmann::json &j, const ClassType &t);
void from_json(const nlohmann::json &j, ClassType &t);

void to_json(nlohmann::json &j, const Class &c);
void from_json(const nlohmann::json &j, Class &c);

void to_json(nlohmann::json &j, const LessonSlot &s);
void from_json(const nlohmann::json &j, LessonSlot &s);

void to_json(nlohmann::json &j, const Day &d);
void from_json(const nlohmann::json &j, Day &d);

void to_json(nlohmann::json &j, const Subgroup &s);
void from_json(const nlohmann::json &j, Subgroup &s);

void to_json(nlohmann::json &j, const WeekInfo &w);
void from_json(const nlohmann::json &j, WeekInfo &w);

void to_json(nlohmann::json &j, const GroupInfo &g);
void from_json(const nlohmann::json &j, GroupInfo &g);

void to_json(nlohmann::json &j, const Course &c);
void from_json(const nlohmann::json &j, Course &c);

nlohmann::json weekToJson(const Week &week);
void weekFromJson(const nlohmann::json &j, Week &week);

nlohmann::json coursesToJson(const CourseSet &courses);
bool coursesFromJson(const nlohmann::json &j, CourseSet &courses, ScheduleError &error);

/**
 * @brief Записать курсы в текст JSON
 *
 * Текст ячеек, не являющийся корректным UTF-8, даёт ошибку DocumentFormat.
 */
bool coursesToString(const CourseSet &courses, std::string &out, ScheduleError &error, int indent = 4);
bool coursesFromString(const std::string &text, CourseSet &courses, ScheduleError &error);

/**
 * @brief Записать курсы в JSON-файл
 * @param path Путь к файлу
 * @param courses Курсы
 * @param error Описание ошибки
 * @return true если файл записан
 */
bool saveCoursesToFile(const std::string &path, const CourseSet &courses, ScheduleError &error);

/**
 * @brief Прочитать курсы из JSON-файла
 */
bool loadCoursesFromFile(const std::string &path, CourseSet &courses, ScheduleError &error);

#endif // SCHEDULE_JSON_H
