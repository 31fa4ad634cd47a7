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

#ifndef SHEET_LAYOUT_H
#define SHEET_LAYOUT_H

#include <cstddef>
#include "schedule_model.h"

/**
 * @brief Позиционная разметка листа расписания
 *
 * Строка 0 - названия групп, строка 1 - номера подгрупп, далее
 * пары строк (верхняя и нижняя) на каждую пару занятий. Первые три
 * столбца служебные (день, номер пары, время), далее на каждый
 * столбец недели приходится два столбца: описание и аудитория.
 */
namespace SheetLayout
{
    //! Количество листов в книге
    const std::size_t sheetsCount = 4;
    //! Строк заголовка (названия групп и номера подгрупп)
    const std::size_t headerRows = 2;
    //! Индекс строки с названиями групп
    const std::size_t groupNamesRow = 0;
    //! Индекс строки с номерами подгрупп
    const std::size_t subgroupsRow = 1;
    //! Служебных столбцов в начале каждой строки
    const std::size_t leadInColumns = 3;
    //! Столбцов таблицы на один столбец недели
    const std::size_t columnStride = 2;
    //! Строк таблицы на одну пару
    const std::size_t rowsPerLesson = 2;
    //! Наибольшее число пар строк занятий на листе
    const std::size_t maxLessonPairs = SCHEDULE_DAYS_IN_WEEK * SCHEDULE_LESSONS_IN_DAY;
    //! Наибольший номер подгруппы
    const int maxSubgroupNumber = 255;

    //! Столбец таблицы для i-го столбца недели (ячейка описания)
    inline std::size_t columnOfCell(std::size_t index)
    {
        return leadInColumns + index * columnStride;
    }

    //! Столбец ячейки аудитории i-го столбца недели
    inline std::size_t roomColumnOfCell(std::size_t index)
    {
        return columnOfCell(index) + 1;
    }

    //! Строка таблицы, с которой начинается k-я пара строк занятий
    inline std::size_t rowOfLessonPair(std::size_t pair)
    {
        return headerRows + pair * rowsPerLesson;
    }

    //! День недели k-й пары строк
    inline std::size_t dayOfLessonPair(std::size_t pair)
    {
        return pair / SCHEDULE_LESSONS_IN_DAY;
    }

    //! Номер пары в дне для k-й пары строк
    inline std::size_t lessonOfLessonPair(std::size_t pair)
    {
        return pair % SCHEDULE_LESSONS_IN_DAY;
    }

    //! Ожидаемая ширина строки занятий при заданном числе столбцов недели
    inline std::size_t bodyRowWidth(std::size_t weekColumns)
    {
        return leadInColumns + weekColumns * columnStride;
    }
}

#endif // SHEET_LAYOUT_H
