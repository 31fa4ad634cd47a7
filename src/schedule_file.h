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

#ifndef SCHEDULE_FILE_H
#define SCHEDULE_FILE_H

#include <array>
#include <string>
#include <vector>
#include "schedule_grid.h"
#include "schedule_model.h"
#include "schedule_error.h"
#include "sheet_layout.h"

extern bool g_fullDebugInfo;

//! Курсы всех листов книги, в порядке листов
typedef std::array<Course, SheetLayout::sheetsCount> CourseSet;

/**
 * @brief Итог разбора одного листа
 */
struct SheetResult
{
    bool          is_valid = false;
    Course        course;
    ScheduleError error;
};

/**
 * @brief Разобрать все листы книги независимо друг от друга
 *
 * Каждый лист разбирается в своём потоке, ошибка одного листа
 * не мешает разбору остальных.
 *
 * @param book Книга
 * @param out Итоги по листам, в порядке листов
 * @param error Заполняется, если в книге не ровно 4 листа
 * @return false если число листов неверное (ни один лист не разбирается)
 */
bool parseSheets(const Workbook &book, std::vector<SheetResult> &out, ScheduleError &error);

/**
 * @brief Разобрать книгу в набор из 4 курсов
 * @param book Книга
 * @param out Курсы, заполняются только если все листы разобраны
 * @param errors Ошибки всех листов
 * @return true если все 4 листа разобраны без ошибок
 */
bool buildCourses(const Workbook &book, CourseSet &out, std::vector<ScheduleError> &errors);

class ScheduleFile
{
public:
    ScheduleFile();
    virtual ~ScheduleFile();

    /**
     * @brief Прочитать XLS/XLSX файл и разобрать расписание
     * @param path Путь к файлу
     * @return true если файл прочитан и все листы разобраны
     */
    bool loadFromExcel(const std::string &path);

    /**
     * @brief Разобрать уже прочитанную книгу
     * @param book Книга
     * @param origin Имя источника для сообщений
     * @return true если все листы разобраны
     */
    bool loadFromWorkbook(const Workbook &book, const std::string &origin = std::string());

    /**
     * @brief Прочитать книгу из файла в сетки ячеек
     * @param path Путь к файлу
     * @param out Книга
     * @param error Описание ошибки
     * @return true если файл прочитан
     */
    static bool readWorkbook(const std::string &path, Workbook &out, ScheduleError &error);

    bool isValid() const;
    std::string filePath() const;
    std::string fileName() const;
    const std::vector<ScheduleError> &errorsList() const;
    const CourseSet &courses() const;

private:
    //! Путь к исходному файлу
    std::string                 m_orig_file;
    //! Разобранные курсы
    CourseSet                   m_courses;
    //! Была ли обнаружена ошибка при считвании или проверки данных
    bool                        m_isInvalid = false;
    //! Список ошибок
    std::vector<ScheduleError>  m_errorsList;
    void addError(const ScheduleError &err);
};

#endif // SCHEDULE_FILE_H
