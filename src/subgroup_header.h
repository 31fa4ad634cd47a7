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

#ifndef SUBGROUP_HEADER_H
#define SUBGROUP_HEADER_H

#include <vector>
#include "schedule_grid.h"
#include "schedule_error.h"

/**
 * @brief Кластер столбцов одной группы в строке номеров подгрупп
 *
 * Без подгрупп - ровно один столбец недели, с подгруппами - по столбцу
 * на каждый номер из списка.
 */
struct SubgroupCluster
{
    bool             has_subgroups = false;
    std::vector<int> numbers;

    SubgroupCluster() = default;
    explicit SubgroupCluster(const std::vector<int> &n) :
        has_subgroups(true), numbers(n)
    {}

    std::size_t columnsCount() const
    {
        return has_subgroups ? numbers.size() : 1;
    }

    bool operator==(const SubgroupCluster &o) const
    {
        return has_subgroups == o.has_subgroups && numbers == o.numbers;
    }
    bool operator!=(const SubgroupCluster &o) const
    {
        return !operator==(o);
    }
};

typedef std::vector<SubgroupCluster> SubgroupClusters;

/**
 * @brief Автомат разбора строки номеров подгрупп
 *
 * Состояния: Idle (подгрупп не копится) и Accumulating (список номеров
 * и последний номер). Ячейки подаются слева направо по одной.
 */
class SubgroupHeaderScanner
{
public:
    enum State
    {
        Idle = 0,
        Accumulating
    };

    SubgroupHeaderScanner() = default;

    //! Пустая ячейка: граница кластера
    void onEmpty();
    //! Ячейка с номером подгруппы
    void onNumber(int number);
    //! Завершить проход и сбросить остаток
    void finish();

    State state() const
    {
        return m_state;
    }

    const SubgroupClusters &clusters() const
    {
        return m_clusters;
    }

    SubgroupClusters takeClusters();

private:
    void flush();

    State            m_state = Idle;
    //! Копящийся список номеров
    std::vector<int> m_current;
    //! Обработана ли уже хоть одна ячейка
    bool             m_started = false;
    SubgroupClusters m_clusters;
};

/**
 * @brief Разобрать номер подгруппы
 * @param text Текст ячейки
 * @param out Номер от 1 до 255
 * @return true при успехе
 */
bool parseSubgroupNumber(const std::string &text, int &out);

/**
 * @brief Разобрать строку номеров подгрупп (вторая строка листа)
 *
 * Пропускаются первые три ячейки, далее берётся каждая вторая
 * (ячейки аудиторий объединены и всегда пусты).
 *
 * @param header Строка заголовка
 * @param rowIndex Номер строки на листе, для сообщений об ошибках
 * @param out Список кластеров
 * @param error Описание ошибки
 * @return true если не было ошибок
 */
bool parseSubgroupHeader(const Row &header, int rowIndex,
                         SubgroupClusters &out, ScheduleError &error);

//! Общее число столбцов недели по всем кластерам
std::size_t countSubgroupColumns(const SubgroupClusters &clusters);

#endif // SUBGROUP_HEADER_H
