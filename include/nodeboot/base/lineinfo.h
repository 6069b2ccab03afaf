#pragma once

#include <nodeboot/base/fmt.h>

#include <string>

namespace nodeboot
{
    struct LineInfo
    {
        int line_number;
        const char* file_name;
        const char* function_name;

        std::string to_string() const;
    };
}

#define NODEBOOT_LINE_INFO                                                                                             \
    nodeboot::LineInfo { __LINE__, __FILE__, __func__ }

NODEBOOT_FORMAT_WITH_TO_STRING(nodeboot::LineInfo);
