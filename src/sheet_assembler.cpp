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

#include "sheet_assembler.h"
#include "sheet_layout.h"
#include "grid_scanner.h"
#include <utility>

std::vector<std::string> readGroupNames(const Row &row)
{
    std::vector<std::string> names;
    for(std::size_t col = SheetLayout::leadInColumns; col < row.size(); col++)
    {
        if(row[col].isString())
            names.push_back(row[col].str);
    }
    return names;
}

bool assembleGroups(const std::vector<std::string> &names,
                    const SubgroupClusters &clusters,
                    std::vector<Week> &weeks,
                    std::vector<GroupInfo> &out,
                    ScheduleError &error)
{
    out.clear();

    if(names.size() != clusters.size())
    {
        error = ScheduleError(ScheduleError::GroupSubgroupCountMismatch,
                              "число названий групп не совпадает с числом групп в строке подгрупп");
        error.row = (int)SheetLayout::groupNamesRow;
        error.expected = clusters.size();
        error.actual = names.size();
        return false;
    }

    std::size_t columns = countSubgroupColumns(clusters);
    if(weeks.size() != columns)
    {
        error = ScheduleError(ScheduleError::RowColumnCountMismatch,
                              "число столбцов недели не совпадает с числом подгрупп");
        error.expected = columns;
        error.actual = weeks.size();
        return false;
    }

    std::vector<Week>::iterator cursor = weeks.begin();
    out.reserve(names.size());

    for(std::size_t i = 0; i < names.size(); i++)
    {
        const SubgroupCluster &cluster = clusters[i];
        GroupInfo group;
        group.name = names[i];

        if(cluster.has_subgroups)
        {
            std::vector<Subgroup> subgroups;
            subgroups.reserve(cluster.numbers.size());
            for(int number : cluster.numbers)
            {
                Subgroup s;
                s.number = number;
                s.days = std::move(*cursor++);
                subgroups.push_back(std::move(s));
            }
            group.subgroups = WeekInfo::makeWithSubgroups(std::move(subgroups));
        }
        else
        {
            group.subgroups = WeekInfo::makeWithoutSubgroup(std::move(*cursor++));
        }

        out.push_back(std::move(group));
    }

    return true;
}

bool parseScheduleSheet(const Sheet &sheet, Course &out, ScheduleError &error)
{
    if(sheet.rows.size() < SheetLayout::headerRows)
    {
        error = ScheduleError(ScheduleError::MissingHeaderRows,
                              "на листе нет строк заголовка");
        error.sheet = sheet.name;
        return false;
    }

    SubgroupClusters clusters;
    if(!parseSubgroupHeader(sheet.rows[SheetLayout::subgroupsRow],
                            (int)SheetLayout::subgroupsRow, clusters, error))
    {
        error.sheet = sheet.name;
        return false;
    }

    std::vector<Week> weeks;
    if(!scanScheduleBody(sheet.rows, countSubgroupColumns(clusters), weeks, error))
    {
        error.sheet = sheet.name;
        return false;
    }

    std::vector<std::string> names = readGroupNames(sheet.rows[SheetLayout::groupNamesRow]);
    std::vector<GroupInfo> groups;
    if(!assembleGroups(names, clusters, weeks, groups, error))
    {
        error.sheet = sheet.name;
        return false;
    }

    out = Course(sheet.name, std::move(groups));
    return true;
}
