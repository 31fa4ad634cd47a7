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

#ifndef GRID_SCANNER_H
#define GRID_SCANNER_H

#include <vector>
#include "schedule_grid.h"
#include "schedule_model.h"
#include "schedule_error.h"

/**
 * @brief Разобрать тело листа: пары строк занятий
 *
 * Строки после заголовка берутся парами (верхняя, нижняя), k-я пара
 * соответствует дню k / 7 и паре k % 7. Непарная последняя строка
 * игнорируется.
 *
 * @param rows Все строки листа (вместе с заголовком)
 * @param weekColumns Число столбцов недели (сумма по кластерам подгрупп)
 * @param out Недели, по одной на столбец, слева направо
 * @param error Описание ошибки
 * @return true если не было ошибок
 */
bool scanScheduleBody(const std::vector<Row> &rows,
                      std::size_t weekColumns,
                      std::vector<Week> &out,
                      ScheduleError &error);

#endif // GRID_SCANNER_H
