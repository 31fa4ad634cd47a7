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

#include "grid_scanner.h"
#include "sheet_layout.h"
#include "class_cell.h"

static bool checkRowWidth(const Row &row, std::size_t rowIndex,
                          std::size_t weekColumns, ScheduleError &error)
{
    std::size_t actual = row.size() > SheetLayout::leadInColumns ?
                         row.size() - SheetLayout::leadInColumns : 0;
    std::size_t expected = weekColumns * SheetLayout::columnStride;

    if(actual != expected)
    {
        error = ScheduleError(ScheduleError::RowColumnCountMismatch,
                              "число ячеек строки занятий не совпадает с числом подгрупп");
        error.row = (int)rowIndex;
        error.expected = expected;
        error.actual = actual;
        return false;
    }

    return true;
}

bool scanScheduleBody(const std::vector<Row> &rows,
                      std::size_t weekColumns,
                      std::vector<Week> &out,
                      ScheduleError &error)
{
    out.clear();
    out.resize(weekColumns);

    for(std::size_t pair = 0; SheetLayout::rowOfLessonPair(pair) + 1 < rows.size(); pair++)
    {
        std::size_t upperIndex = SheetLayout::rowOfLessonPair(pair);
        std::size_t lowerIndex = upperIndex + 1;
        std::size_t day = SheetLayout::dayOfLessonPair(pair);
        std::size_t lesson = SheetLayout::lessonOfLessonPair(pair);

        if(day >= SCHEDULE_DAYS_IN_WEEK)
        {
            error = ScheduleError(ScheduleError::TooManyRows,
                                  "на листе больше 49 пар строк занятий");
            error.row = (int)upperIndex;
            return false;
        }

        const Row &upper = rows[upperIndex];
        const Row &lower = rows[lowerIndex];

        if(!checkRowWidth(upper, upperIndex, weekColumns, error))
            return false;
        if(!checkRowWidth(lower, lowerIndex, weekColumns, error))
            return false;

        for(std::size_t col = 0; col < weekColumns; col++)
        {
            std::size_t descCol = SheetLayout::columnOfCell(col);
            std::size_t roomCol = SheetLayout::roomColumnOfCell(col);
            Day &d = out[col][day];
            d.upper_classes[lesson] = parseLessonSlot(upper[descCol], upper[roomCol]);
            d.lower_classes[lesson] = parseLessonSlot(lower[descCol], lower[roomCol]);
        }
    }

    return true;
}
