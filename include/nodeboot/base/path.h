#pragma once

#include <nodeboot/base/fmt.h>
#include <nodeboot/base/stringview.h>

#include <string>

namespace nodeboot
{
    struct Path
    {
        Path() = default;
        Path(const StringView sv);
        Path(const std::string& s);
        Path(std::string&& s);
        Path(const char* s);
        Path(const char* first, size_t size);

        const std::string& native() const& noexcept;
        operator StringView() const noexcept;

        const char* c_str() const noexcept;

        bool empty() const noexcept;

        Path operator/(StringView sv) const&;
        Path operator/(StringView sv) &&;

        Path& operator/=(StringView sv);
        Path& operator+=(StringView sv);

        StringView parent_path() const;
        StringView filename() const;

        bool is_absolute() const;

    private:
        std::string m_str;
    };
}

NODEBOOT_FORMAT_AS(nodeboot::Path, nodeboot::StringView);
