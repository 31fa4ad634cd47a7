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

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "schedule_file.h"
#include "schedule_json.h"
#include "output_files.h"

#ifndef DIR_SCHEDULES_PARSED
#define DIR_SCHEDULES_PARSED "schedules/parsed"
#endif

static void printUsage(const char *self)
{
    std::fprintf(stderr, "Использование: %s [-v] [-o <каталог>] <файл.xls|файл.xlsx>...\n", self);
    std::fprintf(stderr, "  -v          подробный вывод\n");
    std::fprintf(stderr, "  -o <dir>    каталог для JSON (по умолчанию %s)\n", DIR_SCHEDULES_PARSED);
    std::fflush(stderr);
}

int main(int argc, char **argv)
{
    std::string outDir = DIR_SCHEDULES_PARSED;
    std::vector<std::string> fileList;

    for(int i = 1; i < argc; i++)
    {
        if(std::strcmp(argv[i], "-v") == 0)
            g_fullDebugInfo = true;
        else if(std::strcmp(argv[i], "-o") == 0)
        {
            if(i + 1 >= argc)
            {
                printUsage(argv[0]);
                return 2;
            }
            outDir = argv[++i];
        }
        else if(std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0)
        {
            printUsage(argv[0]);
            return 0;
        }
        else if(argv[i][0] == '-')
        {
            std::fprintf(stderr, "Неизвестный ключ %s\n", argv[i]);
            printUsage(argv[0]);
            return 2;
        }
        else
            fileList.push_back(argv[i]);
    }

    if(fileList.empty())
    {
        printUsage(argv[0]);
        return 2;
    }

    ScheduleError dirError;
    if(!prepareOutputDir(outDir, dirError))
    {
        std::fprintf(stderr, "WARNING: %s\n", dirError.toString().c_str());
        std::fflush(stderr);
        return 1;
    }

    std::fprintf(stdout, "===============================================================================\n");
    std::fprintf(stdout, "Будет произведено считывание файлов с общим количеством: %lu\n", (unsigned long)fileList.size());
    std::fprintf(stdout, "===============================================================================\n\n");

    size_t files_counter = 1;
    size_t failed = 0;

    for(const std::string &file : fileList)
    {
        std::fprintf(stdout, "\n\n===============================================================================\n");
        std::fprintf(stdout, "Обработка файла %lu из %lu\n", (unsigned long)files_counter, (unsigned long)fileList.size());
        std::fprintf(stdout, "===============================================================================\n");
        std::fflush(stdout);
        files_counter++;

        ScheduleFile schedule;
        if(!schedule.loadFromExcel(file))
        {
            std::fprintf(stderr, "\n");
            std::fprintf(stderr, "===============================================================================\n");
            std::fprintf(stderr, "ФАЙЛ ОТКЛОНЁН: %s (ошибок: %lu)\n",
                                 schedule.fileName().c_str(),
                                 (unsigned long)schedule.errorsList().size());
            std::fprintf(stderr, "===============================================================================\n");
            std::fflush(stderr);
            failed++;
            continue;
        }

        std::string outPath = outDir + "/" + jsonFileNameFor(file);
        ScheduleError error;
        if(!saveCoursesToFile(outPath, schedule.courses(), error))
        {
            std::fprintf(stderr, "WARNING: %s\n", error.toString().c_str());
            std::fflush(stderr);
            failed++;
            continue;
        }

        std::fprintf(stdout, "\n");
        std::fprintf(stdout, "===============================================================================\n");
        for(const Course &c : schedule.courses())
            std::fprintf(stdout, "Курс '%s': групп %lu\n", c.name.c_str(), (unsigned long)c.groups.size());
        std::fprintf(stdout, "Файл помещён в %s\n", outPath.c_str());
        std::fprintf(stdout, "===============================================================================\n");
        std::fflush(stdout);
    }

    std::fprintf(stdout, "===============================================================================\n");
    if(failed == 0)
        std::fprintf(stdout, "Все файлы успешно преобразованы\n");
    else
        std::fprintf(stdout, "Не удалось преобразовать файлов: %lu\n", (unsigned long)failed);
    std::fflush(stdout);

    return failed == 0 ? 0 : 1;
}
