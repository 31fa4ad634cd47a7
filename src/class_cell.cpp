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

#include "class_cell.h"
#include "Utils/strings.h"

bool parseClassCell(const Cell &description, const Cell &room, Class &out)
{
    if(!description.isString() || !room.isString())
        return false;

    const std::string &text = description.str;

    size_t typeBegin = text.find(" (");
    if(typeBegin == std::string::npos)
        return false;

    std::string name = text.substr(0, typeBegin);
    std::string rest = text.substr(typeBegin + 2);
    std::string lector;

    size_t newLine = rest.find('\n');
    if(newLine != std::string::npos)
    {
        lector = rest.substr(newLine + 1);
        rest.resize(newLine);
        if(Strings::trim(lector).empty())
            lector.clear();
    }

    if(rest.empty() || rest[rest.size() - 1] != ')')
        return false;
    rest.resize(rest.size() - 1);

    out.disciplyne_name = name;
    out.class_type = ClassType::fromLabel(rest);
    out.lector_name = lector;
    out.room_name = room.str;
    return true;
}

LessonSlot parseLessonSlot(const Cell &description, const Cell &room)
{
    LessonSlot slot;
    slot.is_set = parseClassCell(description, room, slot.entry);
    return slot;
}
