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

#ifndef CLASS_CELL_H
#define CLASS_CELL_H

#include "schedule_grid.h"
#include "schedule_model.h"

/**
 * @brief Разобрать ячейку описания занятия и ячейку аудитории
 *
 * Описание записано в виде:
 *     Название (Тип)
 *     Преподаватель
 * Вторая строка не обязательна.
 *
 * @param description Ячейка описания занятия
 * @param room Ячейка с аудиторией
 * @param out Занятие, заполняется только при успехе
 * @return true если в ячейках есть занятие, false если пара пустая
 */
bool parseClassCell(const Cell &description, const Cell &room, Class &out);

/**
 * @brief То же самое, но результат в виде ячейки пары
 */
LessonSlot parseLessonSlot(const Cell &description, const Cell &room);

#endif // CLASS_CELL_H
