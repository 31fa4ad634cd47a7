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

#ifndef TIMETABLE_XLS2JSON_XL_XLS_H
#define TIMETABLE_XLS2JSON_XL_XLS_H

#include "xl_base.h"

#include <xls.h>            //For Excel 97-2003
#include <cstdio>
#include <cstring>

/**
 * @brief Обёртка над парсером файлов XLS (97-2003)
 */
class ReadXls final : public XlBase
{
    xls::xlsWorkBook*  pWB = nullptr;
    xls::xlsWorkSheet* pWS = nullptr;

    static bool isCellEmpty(xls::st_cell::st_cell_data &cell)
    {
        return (cell.str == nullptr) || cell.str[0] == '\0';
    }

    xls::st_cell::st_cell_data *cellAt(int row, int col)
    {
        if(!pWS || row < 0 || col < 0)
            return nullptr;
        if(row > (int)pWS->rows.lastrow || col > (int)pWS->rows.lastcol)
            return nullptr;
        xls::st_row::st_row_data* p_row = &pWS->rows.row[row];
        return &p_row->cells.cell[col];
    }
public:
    ReadXls() : XlBase() {}
    ~ReadXls() override;

    static bool isExcel97(const std::string &path)
    {
        static const char *xls_magic = "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1";
        char buff[8];
        FILE *f = std::fopen(path.c_str(), "rb");
        if(!f)
            return false;

        if(std::fread(buff, 1, 8, f) != 8)
        {
            std::fclose(f);
            return false;
        }
        std::fclose(f);

        return (std::memcmp(buff, xls_magic, 8) == 0);
    }

    bool load(const std::string &path) override
    {
        if(pWB)
            close();
        pWB = xls::xls_open(path.c_str(), "UTF-8");
        return (pWB != nullptr);
    }

    void close() override
    {
        closeSheet();
        if(pWB)
            xls::xls_close_WB(pWB);
        pWB = nullptr;
    }

    int sheetsCount() override
    {
        if(!pWB)
            return 0;
        return (int)pWB->sheets.count;
    }

    std::string sheetName(int sheet) override
    {
        if(!pWB || sheet < 0 || sheet >= sheetsCount())
            return std::string();
        const char *name = (const char*)pWB->sheets.sheet[sheet].name;
        return name ? std::string(name) : std::string();
    }

    bool chooseSheet(int sheet) override
    {
        if(!pWB || sheet < 0 || sheet >= sheetsCount())
            return false;
        closeSheet();
        pWS = xls::xls_getWorkSheet(pWB, sheet);
        if(!pWS)
            return false;
        if(xls::xls_parseWorkSheet(pWS) != xls::LIBXLS_OK)
        {
            closeSheet();
            return false;
        }
        return true;
    }

    void closeSheet() override
    {
        if(pWS)
            xls::xls_close_WS(pWS);
        pWS = nullptr;
    }

    int  lastRow() override
    {
        if(!pWS)
            return -1;
        return (int)pWS->rows.lastrow;
    }

    int  lastCol() override
    {
        if(!pWS)
            return -1;
        return (int)pWS->rows.lastcol;
    }

    CellType getCellType(int row, int col) override
    {
        xls::st_cell::st_cell_data *p_cell = cellAt(row, col);
        if(!p_cell)
            return CELL_EMPTY;

        switch(p_cell->id)
        {
        case XLS_RECORD_LABELSST:
        case XLS_RECORD_LABEL:
        case XLS_RECORD_RSTRING:
            return isCellEmpty(*p_cell) ? CELL_EMPTY : CELL_STRING;
        case XLS_RECORD_NUMBER:
        case XLS_RECORD_RK:
        case XLS_RECORD_MULRK:
            return CELL_NUMBER;
        case XLS_RECORD_FORMULA:
            // Результат формулы: l != 0 - строка, иначе число
            if(p_cell->l == 0)
                return CELL_NUMBER;
            return isCellEmpty(*p_cell) ? CELL_EMPTY : CELL_STRING;
        default:
            return CELL_EMPTY;
        }
    }

    std::string getStrCell(int row, int col) override
    {
        xls::st_cell::st_cell_data *p_cell = cellAt(row, col);
        if(!p_cell || isCellEmpty(*p_cell))
            return std::string("");
        return std::string((char*)p_cell->str);
    }

    double getDoubleCell(int row, int col) override
    {
        xls::st_cell::st_cell_data *p_cell = cellAt(row, col);
        if(!p_cell)
            return 0.0;
        return p_cell->d;
    }
};

inline ReadXls::~ReadXls()
{
    close();
}

#endif //TIMETABLE_XLS2JSON_XL_XLS_H
