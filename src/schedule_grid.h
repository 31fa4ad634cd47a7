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

#ifndef SCHEDULE_GRID_H
#define SCHEDULE_GRID_H

#include <string>
#include <vector>

/**
 * @brief Ячейка таблицы, уже прочитанная из XLS/XLSX файла
 */
struct Cell
{
    enum Type
    {
        Empty = 0,
        String,
        Number
    };

    Type        type = Empty;
    //! Текст ячейки (только для String)
    std::string str;
    //! Числовое значение (только для Number)
    double      num = 0.0;

    Cell() = default;

    static Cell makeString(const std::string &s)
    {
        Cell c;
        if(!s.empty())
        {
            c.type = String;
            c.str = s;
        }
        return c;
    }

    static Cell makeNumber(double d)
    {
        Cell c;
        c.type = Number;
        c.num = d;
        return c;
    }

    bool isEmpty() const
    {
        return type == Empty;
    }

    bool isString() const
    {
        return type == String;
    }
};

typedef std::vector<Cell> Row;

/**
 * @brief Один лист книги: имя и прямоугольная сетка ячеек
 */
struct Sheet
{
    std::string      name;
    std::vector<Row> rows;
};

typedef std::vector<Sheet> Workbook;

#endif // SCHEDULE_GRID_H
