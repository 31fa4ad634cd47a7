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

#include "schedule_error.h"
#include <sstream>

const char *ScheduleError::codeName(ScheduleError::Code c)
{
    switch(c)
    {
    case NoError:
        return "NoError";
    case WrongSheetCount:
        return "WrongSheetCount";
    case CellTypeMismatch:
        return "CellTypeMismatch";
    case UnparsableSubgroupNumber:
        return "UnparsableSubgroupNumber";
    case RowColumnCountMismatch:
        return "RowColumnCountMismatch";
    case TooManyRows:
        return "TooManyRows";
    case GroupSubgroupCountMismatch:
        return "GroupSubgroupCountMismatch";
    case MissingHeaderRows:
        return "MissingHeaderRows";
    case FileLoadFailed:
        return "FileLoadFailed";
    case DocumentFormat:
        return "DocumentFormat";
    }
    return "Unknown";
}

std::string ScheduleError::toString() const
{
    std::ostringstream out;
    out << codeName(code);

    if(!sheet.empty())
        out << " [лист '" << sheet << "']";
    if(row >= 0)
        out << " строка " << row;
    if(column >= 0)
        out << " столбец " << column;

    if(code == WrongSheetCount ||
       code == RowColumnCountMismatch ||
       code == GroupSubgroupCountMismatch)
        out << " (ожидалось " << expected << ", получено " << actual << ")";

    if(!details.empty())
        out << ": " << details;

    return out.str();
}
