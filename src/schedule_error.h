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

#ifndef SCHEDULE_ERROR_H
#define SCHEDULE_ERROR_H

#include <string>
#include <cstddef>

/**
 * @brief Описание ошибки формата расписания
 *
 * Индексы строк и столбцов абсолютные (от нуля) в пределах листа,
 * -1 если к ошибке не относятся.
 */
struct ScheduleError
{
    enum Code
    {
        NoError = 0,
        //! В книге не ровно 4 листа
        WrongSheetCount,
        //! Ячейка, которая должна быть строкой, ею не является
        CellTypeMismatch,
        //! Номер подгруппы не является небольшим положительным числом
        UnparsableSubgroupNumber,
        //! Число столбцов строки занятий не совпадает с числом подгрупп
        RowColumnCountMismatch,
        //! Больше 49 пар строк занятий на листе
        TooManyRows,
        //! Число названий групп не совпадает с числом кластеров подгрупп
        GroupSubgroupCountMismatch,
        //! На листе нет двух строк заголовка
        MissingHeaderRows,
        //! Файл или каталог не удалось открыть, прочитать или создать
        FileLoadFailed,
        //! JSON-документ не соответствует модели расписания
        DocumentFormat
    };

    Code        code = NoError;
    std::string sheet;
    int         row = -1;
    int         column = -1;
    std::size_t expected = 0;
    std::size_t actual = 0;
    std::string details;

    ScheduleError() = default;
    ScheduleError(Code c, const std::string &d) :
        code(c), details(d)
    {}

    static const char *codeName(Code c);

    bool isError() const
    {
        return code != NoError;
    }

    std::string toString() const;
};

#endif // SCHEDULE_ERROR_H
