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

#include "schedule_file.h"
#include "sheet_assembler.h"
#include <cstdio>
#include <functional>
#include <future>
#include <utility>
#include "Utils/files.h"

#include "xl/xl_base.h"
#include "xl/xl_xls.h"
#include "xl/xl_xlsx.h"

bool g_fullDebugInfo = false;

static SheetResult parseOneSheet(const Sheet &sheet)
{
    SheetResult result;
    result.is_valid = parseScheduleSheet(sheet, result.course, result.error);
    return result;
}

bool parseSheets(const Workbook &book, std::vector<SheetResult> &out, ScheduleError &error)
{
    out.clear();

    if(book.size() != SheetLayout::sheetsCount)
    {
        error = ScheduleError(ScheduleError::WrongSheetCount,
                              "в книге должно быть ровно 4 листа");
        error.expected = SheetLayout::sheetsCount;
        error.actual = book.size();
        return false;
    }

    std::vector<std::future<SheetResult> > tasks;
    tasks.reserve(book.size());
    for(const Sheet &sheet : book)
        tasks.push_back(std::async(std::launch::async, parseOneSheet, std::cref(sheet)));

    out.reserve(tasks.size());
    for(std::future<SheetResult> &task : tasks)
        out.push_back(task.get());

    return true;
}

bool buildCourses(const Workbook &book, CourseSet &out, std::vector<ScheduleError> &errors)
{
    std::vector<SheetResult> results;
    ScheduleError error;

    if(!parseSheets(book, results, error))
    {
        errors.push_back(error);
        return false;
    }

    bool allValid = true;
    for(const SheetResult &r : results)
    {
        if(!r.is_valid)
        {
            errors.push_back(r.error);
            allValid = false;
        }
    }

    if(!allValid)
        return false;

    for(size_t i = 0; i < results.size(); i++)
        out[i] = std::move(results[i].course);

    return true;
}


ScheduleFile::ScheduleFile() = default;

ScheduleFile::~ScheduleFile() = default;

static bool readOpenedBook(XlBase *xl, Workbook &out, ScheduleError &error)
{
    int sheets = xl->sheetsCount();
    if(sheets != (int)SheetLayout::sheetsCount)
    {
        error = ScheduleError(ScheduleError::WrongSheetCount,
                              "в книге должно быть ровно 4 листа");
        error.expected = SheetLayout::sheetsCount;
        error.actual = (size_t)(sheets < 0 ? 0 : sheets);
        return false;
    }

    out.clear();
    out.resize((size_t)sheets);

    for(int sheet_id = 0; sheet_id < sheets; sheet_id++)
    {
        Sheet &sheet = out[(size_t)sheet_id];
        sheet.name = xl->sheetName(sheet_id);

        if(!xl->chooseSheet(sheet_id))
        {
            error = ScheduleError(ScheduleError::FileLoadFailed, "не удалось открыть лист");
            error.sheet = sheet.name;
            return false;
        }

        int lastRow = xl->lastRow();
        int lastCol = xl->lastCol();

        for(int row_l = 0; row_l <= lastRow; row_l++)
        {
            Row row;
            row.reserve((size_t)(lastCol + 1));
            for(int col_l = 0; col_l <= lastCol; col_l++)
            {
                switch(xl->getCellType(row_l, col_l))
                {
                case XlBase::CELL_STRING:
                    row.push_back(Cell::makeString(xl->getStrCell(row_l, col_l)));
                    break;
                case XlBase::CELL_NUMBER:
                    row.push_back(Cell::makeNumber(xl->getDoubleCell(row_l, col_l)));
                    break;
                case XlBase::CELL_EMPTY:
                    row.push_back(Cell());
                    break;
                }
            }
            sheet.rows.push_back(std::move(row));
        }

        if(g_fullDebugInfo)
        {
            std::fprintf(stdout, "INFO: Лист '%s': %d строк, %d столбцов\n",
                         sheet.name.c_str(), lastRow + 1, lastCol + 1);
            std::fflush(stdout);
        }

        xl->closeSheet();
    }

    return true;
}

bool ScheduleFile::readWorkbook(const std::string &path, Workbook &out, ScheduleError &error)
{
    XlBase  *xl = nullptr;
    ReadXls  xls_r;
    ReadXlsX xls_x;
    if(ReadXls::isExcel97(path) && xls_r.load(path))
    {
        std::fprintf(stdout, "INFO: File %s loaded as XLS (97-2003)!\n", path.c_str());
        std::fflush(stdout);
        xl = &xls_r;
    }
    if(!xl && ReadXlsX::isExcelX(path) && xls_x.load(path))
    {
        std::fprintf(stdout, "INFO: File %s loaded as XLSX (2007+)!\n", path.c_str());
        std::fflush(stdout);
        xl = &xls_x;
    }

    if(!xl)
    {
        error = ScheduleError(ScheduleError::FileLoadFailed,
                              "невозможно открыть файл " + path);
        return false;
    }

    bool ret = readOpenedBook(xl, out, error);
    xl->close();
    return ret;
}

bool ScheduleFile::loadFromExcel(const std::string &path)
{
    m_orig_file = path;
    m_isInvalid = false;
    m_errorsList.clear();

    Workbook book;
    ScheduleError error;
    if(!readWorkbook(path, book, error))
    {
        addError(error);
        m_isInvalid = true;
        return false;
    }

    return loadFromWorkbook(book, path);
}

bool ScheduleFile::loadFromWorkbook(const Workbook &book, const std::string &origin)
{
    if(!origin.empty())
        m_orig_file = origin;
    m_isInvalid = false;
    m_errorsList.clear();
    m_courses = CourseSet();

    std::vector<SheetResult> results;
    ScheduleError error;
    if(!parseSheets(book, results, error))
    {
        addError(error);
        m_isInvalid = true;
        return false;
    }

    for(size_t i = 0; i < results.size(); i++)
    {
        SheetResult &r = results[i];
        if(!r.is_valid)
        {
            addError(r.error);
            m_isInvalid = true;
            continue;
        }

        if(g_fullDebugInfo)
        {
            std::fprintf(stdout, "INFO: Лист %lu '%s' разобран, групп: %lu\n",
                         (unsigned long)i, r.course.name.c_str(),
                         (unsigned long)r.course.groups.size());
            std::fflush(stdout);
        }
    }

    if(m_isInvalid)
        return false;

    for(size_t i = 0; i < results.size(); i++)
        m_courses[i] = std::move(results[i].course);

    return true;
}

bool ScheduleFile::isValid() const
{
    return !m_isInvalid;
}

std::string ScheduleFile::filePath() const
{
    return m_orig_file;
}

std::string ScheduleFile::fileName() const
{
    return Files::basename(m_orig_file);
}

const std::vector<ScheduleError> &ScheduleFile::errorsList() const
{
    return m_errorsList;
}

const CourseSet &ScheduleFile::courses() const
{
    return m_courses;
}

void ScheduleFile::addError(const ScheduleError &err)
{
    m_errorsList.push_back(err);
    std::fprintf(stderr, "WARNING: %s\n", err.toString().c_str());
    std::fflush(stderr);
}
