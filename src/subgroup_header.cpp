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

#include "subgroup_header.h"
#include "sheet_layout.h"
#include "Utils/strings.h"

void SubgroupHeaderScanner::flush()
{
    if(m_state == Accumulating)
        m_clusters.push_back(SubgroupCluster(m_current));
    else
        m_clusters.push_back(SubgroupCluster());
    m_current.clear();
    m_state = Idle;
}

void SubgroupHeaderScanner::onEmpty()
{
    if(m_started)
        flush();
    m_current.clear();
    m_state = Idle;
    m_started = true;
}

void SubgroupHeaderScanner::onNumber(int number)
{
    if(m_state == Idle)
    {
        // Начало новой группы: предыдущая была без подгрупп
        if(m_started)
            m_clusters.push_back(SubgroupCluster());
        m_current.clear();
        m_state = Accumulating;
    }
    else if(!m_current.empty() && number <= m_current.back())
    {
        // Нумерация сбросилась - соседняя группа без пустого разделителя
        m_clusters.push_back(SubgroupCluster(m_current));
        m_current.clear();
    }

    m_current.push_back(number);
    m_started = true;
}

void SubgroupHeaderScanner::finish()
{
    flush();
    m_started = false;
}

SubgroupClusters SubgroupHeaderScanner::takeClusters()
{
    SubgroupClusters out;
    out.swap(m_clusters);
    m_current.clear();
    m_state = Idle;
    m_started = false;
    return out;
}

bool parseSubgroupNumber(const std::string &text, int &out)
{
    std::string number = Strings::trim(text);
    if(number.empty())
        return false;

    int value = 0;
    for(char c : number)
    {
        if(c < '0' || c > '9')
            return false;
        value = value * 10 + (c - '0');
        if(value > SheetLayout::maxSubgroupNumber)
            return false;
    }

    if(value < 1)
        return false;

    out = value;
    return true;
}

bool parseSubgroupHeader(const Row &header, int rowIndex,
                         SubgroupClusters &out, ScheduleError &error)
{
    SubgroupHeaderScanner scanner;

    for(size_t i = 0; SheetLayout::columnOfCell(i) < header.size(); i++)
    {
        size_t col = SheetLayout::columnOfCell(i);
        const Cell &cell = header[col];

        if(cell.isEmpty())
        {
            scanner.onEmpty();
            continue;
        }

        if(!cell.isString())
        {
            error = ScheduleError(ScheduleError::CellTypeMismatch,
                                  "номер подгруппы должен быть строкой");
            error.row = rowIndex;
            error.column = (int)col;
            return false;
        }

        int number = 0;
        if(!parseSubgroupNumber(cell.str, number))
        {
            error = ScheduleError(ScheduleError::UnparsableSubgroupNumber,
                                  "неверный номер подгруппы [" + cell.str + "]");
            error.row = rowIndex;
            error.column = (int)col;
            return false;
        }

        scanner.onNumber(number);
    }

    scanner.finish();
    out = scanner.takeClusters();
    return true;
}

std::size_t countSubgroupColumns(const SubgroupClusters &clusters)
{
    std::size_t sum = 0;
    for(const SubgroupCluster &c : clusters)
        sum += c.columnsCount();
    return sum;
}
