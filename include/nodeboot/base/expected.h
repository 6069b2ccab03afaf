#pragma once

#include <nodeboot/base/checks.h>
#include <nodeboot/base/lineinfo.h>
#include <nodeboot/base/messages.h>

#include <new>
#include <type_traits>
#include <utility>

namespace nodeboot
{
    struct Unit
    {
        // A meaningless type intended to be used with Expected when there is no meaningful value.
    };

    template<class T, class Error>
    struct ExpectedT
    {
        // Constructors are intentionally implicit

        // Each single argument ctor exists if we can convert to T or Error, and it isn't exactly the other type.
        template<class ConvToT,
                 std::enable_if_t<std::is_convertible_v<ConvToT, T> &&
                                      !std::is_same_v<std::remove_cv_t<std::remove_reference_t<ConvToT>>, Error>,
                                  int> = 0>
        ExpectedT(ConvToT&& t) noexcept(std::is_nothrow_constructible_v<T, ConvToT>)
            : m_t(std::forward<ConvToT>(t)), value_is_error(false)
        {
        }

        template<class ConvToError,
                 std::enable_if_t<std::is_convertible_v<ConvToError, Error> &&
                                      !std::is_same_v<std::remove_cv_t<std::remove_reference_t<ConvToError>>, T>,
                                  int> = 0,
                 int = 1>
        ExpectedT(ConvToError&& e) noexcept(std::is_nothrow_constructible_v<Error, ConvToError>)
            : m_error(std::forward<ConvToError>(e)), value_is_error(true)
        {
        }

        ExpectedT(const ExpectedT& other) : value_is_error(other.value_is_error)
        {
            if (value_is_error)
            {
                ::new (&m_error) Error(other.m_error);
            }
            else
            {
                ::new (&m_t) T(other.m_t);
            }
        }

        ExpectedT(ExpectedT&& other) noexcept : value_is_error(other.value_is_error)
        {
            if (value_is_error)
            {
                ::new (&m_error) Error(std::move(other.m_error));
            }
            else
            {
                ::new (&m_t) T(std::move(other.m_t));
            }
        }

        ExpectedT& operator=(const ExpectedT&) = delete;

        ~ExpectedT()
        {
            if (value_is_error)
            {
                m_error.~Error();
            }
            else
            {
                m_t.~T();
            }
        }

        explicit constexpr operator bool() const noexcept { return !value_is_error; }
        constexpr bool has_value() const noexcept { return !value_is_error; }

        const Error& error() const& noexcept
        {
            if (!value_is_error)
            {
                Checks::unreachable(NODEBOOT_LINE_INFO);
            }

            return m_error;
        }

        const T* get() const noexcept { return value_is_error ? nullptr : &m_t; }
        T* get() noexcept { return value_is_error ? nullptr : &m_t; }

    private:
        union
        {
            Error m_error;
            T m_t;
        };

        bool value_is_error;
    };

    template<class T>
    using ExpectedL = ExpectedT<T, LocalizedString>;
}
