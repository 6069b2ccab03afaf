#pragma once

#include <nodeboot/base/fmt.h>
#include <nodeboot/base/optional.h>
#include <nodeboot/base/stringview.h>

#include <iterator>
#include <string>
#include <type_traits>
#include <vector>

namespace nodeboot::Strings::details
{
    void append_internal(std::string& into, char c);
    void append_internal(std::string& into, const char* v);
    void append_internal(std::string& into, const std::string& s);
    void append_internal(std::string& into, StringView s);
    template<class T, class = decltype(std::declval<const T&>().to_string(std::declval<std::string&>()))>
    void append_internal(std::string& into, const T& t)
    {
        t.to_string(into);
    }
    template<class T,
             class = void,
             class = void,
             std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, char>::value, int> = 0>
    void append_internal(std::string& into, const T& t)
    {
        fmt::format_to(std::back_inserter(into), "{}", t);
    }

    static constexpr struct IdentityTransformer
    {
        template<class T>
        T&& operator()(T&& t) const noexcept
        {
            return static_cast<T&&>(t);
        }
    } identity_transformer;
}

namespace nodeboot::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string into;
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

#if defined(_WIN32)
    std::wstring to_utf16(StringView s);

    std::string to_utf8(const wchar_t* w);
    std::string to_utf8(const wchar_t* w, size_t size_in_characters);
    std::string to_utf8(const std::wstring& ws);
#endif

    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept;

    [[nodiscard]] std::string ascii_to_lowercase(StringView s);

    template<class InputIterator, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter,
                                   InputIterator first,
                                   InputIterator last,
                                   Transformer transformer)
    {
        std::string output;
        if (first == last)
        {
            return output;
        }

        for (;;)
        {
            Strings::append(output, transformer(*first));
            if (++first == last)
            {
                return output;
            }

            output.append(delimiter.data(), delimiter.size());
        }
    }

    template<class Container>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& v)
    {
        return join(delimiter, std::begin(v), std::end(v), details::identity_transformer);
    }

    [[nodiscard]] StringView trim(StringView sv);

    [[nodiscard]] std::vector<std::string> split(StringView s, const char delimiter);

    // Splits a PATH-like list on the platform's list separator, dropping empty entries.
    [[nodiscard]] std::vector<std::string> split_paths(StringView s);

    // Equivalent to one of the `::strto[T]` functions. Returns `nullopt` if there is an error.
    template<class T>
    Optional<T> strto(StringView sv);

    template<>
    Optional<long> strto<long>(StringView);
    template<>
    Optional<int> strto<int>(StringView);
}
