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

#ifndef SHEET_ASSEMBLER_H
#define SHEET_ASSEMBLER_H

#include <string>
#include <vector>
#include "schedule_grid.h"
#include "schedule_model.h"
#include "schedule_error.h"
#include "subgroup_header.h"

/**
 * @brief Прочитать названия групп из первой строки листа
 *
 * Берутся только строковые ячейки после служебных столбцов:
 * объединённые ячейки дают ровно одно название на кластер.
 */
std::vector<std::string> readGroupNames(const Row &row);

/**
 * @brief Собрать группы из названий, кластеров подгрупп и недель
 * @param names Названия групп слева направо
 * @param clusters Кластеры подгрупп слева направо
 * @param weeks Недели по столбцам, забираются по порядку
 * @param out Список групп
 * @param error Описание ошибки
 * @return true если не было ошибок
 */
bool assembleGroups(const std::vector<std::string> &names,
                    const SubgroupClusters &clusters,
                    std::vector<Week> &weeks,
                    std::vector<GroupInfo> &out,
                    ScheduleError &error);

/**
 * @brief Разобрать один лист целиком в курс
 * @param sheet Лист книги
 * @param out Курс с именем листа
 * @param error Описание ошибки (с именем листа)
 * @return true если не было ошибок
 */
bool parseScheduleSheet(const Sheet &sheet, Course &out, ScheduleError &error);

#endif // SHEET_ASSEMBLER_H
