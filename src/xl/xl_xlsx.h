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

#ifndef TIMETABLE_XLS2JSON_XL_XLSX_H
#define TIMETABLE_XLS2JSON_XL_XLSX_H

#include "xl_base.h"

#include <xlnt/xlnt.hpp>    //For Excel 2007+
#include <cstdio>
#include <cstring>

/**
 * @brief Обёртка над парсером файлов XLSX (2007+)
 */
class ReadXlsX final:
        public XlBase
{
    xlnt::workbook          wb;
    xlnt::worksheet         ws;
    bool                    hasSheet = false;

    bool hasCell(int row, int col)
    {
        if(!hasSheet)
            return false;
        xlnt::cell_reference ref(xlnt::column_t((xlnt::column_t::index_t)col + 1),
                                 (xlnt::row_t)row + 1);
        return ws.has_cell(ref);
    }

    xlnt::cell cellAt(int row, int col)
    {
        return ws.cell(xlnt::column_t((xlnt::column_t::index_t)col + 1), (xlnt::row_t)row + 1);
    }
public:
    ReadXlsX() : XlBase() {}
    ~ReadXlsX() override;

    static bool isExcelX(const std::string &path)
    {
        static const char *xlsx_magic[3] =
                {
                        "\x50\x4B\x03\x04",
                        "\x50\x4B\x05\x06",
                        "\x50\x4B\x07\x08"
                };
        char buff[8];

        FILE *f = std::fopen(path.c_str(), "rb");
        if(!f)
            return false;

        if(std::fread(buff, 1, 4, f) != 4)
        {
            std::fclose(f);
            return false;
        }
        std::fclose(f);

        for(auto &i : xlsx_magic)
        {
            if(std::memcmp(buff, i, 4) == 0)
                return true;
        }

        return false;
    }

    bool load(const std::string &path) override
    {
        try {
            wb.load(path);
        } catch (const xlnt::exception &e) {
            std::fprintf(stderr, "Can't load file %s because of exception %s!\n", path.c_str(), e.what());
            std::fflush(stderr);
            return false;
        }
        catch (const std::exception &e) {
            std::fprintf(stderr, "Can't load file %s because of unknown exception %s!\n", path.c_str(), e.what());
            std::fflush(stderr);
            return false;
        }
        return true;
    }

    void close() override
    {
        closeSheet();
        wb.clear();
    }

    int  sheetsCount() override
    {
        return (int)wb.sheet_count();
    }

    std::string sheetName(int sheet) override
    {
        return wb.sheet_by_index(static_cast<std::size_t>(sheet)).title();
    }

    bool chooseSheet(int sheet) override
    {
        if(sheet < 0 || sheet >= sheetsCount())
            return false;
        ws = wb.sheet_by_index(static_cast<std::size_t>(sheet));
        hasSheet = true;
        return true;
    }

    void closeSheet() override
    {
        hasSheet = false;
    }

    int  lastRow() override
    {
        if(!hasSheet)
            return -1;
        return (int)ws.highest_row() - 1;
    }

    int  lastCol() override
    {
        if(!hasSheet)
            return -1;
        return (int)ws.highest_column().index - 1;
    }

    CellType getCellType(int row, int col) override
    {
        if(!hasCell(row, col))
            return CELL_EMPTY;

        xlnt::cell cell = cellAt(row, col);
        switch(cell.data_type())
        {
        case xlnt::cell_type::inline_string:
        case xlnt::cell_type::shared_string:
        case xlnt::cell_type::formula_string:
            return cell.to_string().empty() ? CELL_EMPTY : CELL_STRING;
        case xlnt::cell_type::number:
        case xlnt::cell_type::date:
        case xlnt::cell_type::boolean:
            return cell.has_value() ? CELL_NUMBER : CELL_EMPTY;
        default:
            return CELL_EMPTY;
        }
    }

    std::string getStrCell(int row, int col) override
    {
        if(!hasCell(row, col))
            return std::string();
        return cellAt(row, col).to_string();
    }

    double getDoubleCell(int row, int col) override
    {
        if(!hasCell(row, col))
            return 0.0;
        return cellAt(row, col).value<double>();
    }
};

inline ReadXlsX::~ReadXlsX()
{
    close();
}

#endif //TIMETABLE_XLS2JSON_XL_XLSX_H
