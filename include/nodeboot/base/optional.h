#pragma once

#include <nodeboot/base/checks.h>
#include <nodeboot/base/lineinfo.h>

#include <new>
#include <type_traits>
#include <utility>

namespace nodeboot
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) { }
    };

    const static constexpr NullOpt nullopt{0};

    // An optional value, in the style of std::optional but with access through get() returning a pointer so that
    // "if (auto p = maybe.get())" is the idiomatic test-and-use.
    template<class T>
    struct Optional
    {
        static_assert(!std::is_reference<T>::value, "Optional<T&> is not supported");

        constexpr Optional() noexcept : m_is_present(false), m_inactive() { }
        constexpr Optional(NullOpt) noexcept : m_is_present(false), m_inactive() { }

        Optional(const T& t) : m_is_present(true), m_t(t) { }
        Optional(T&& t) noexcept(std::is_nothrow_move_constructible<T>::value) : m_is_present(true), m_t(std::move(t))
        {
        }

        template<class U,
                 std::enable_if_t<!std::is_same<std::decay_t<U>, T>::value &&
                                      !std::is_same<std::decay_t<U>, Optional>::value &&
                                      !std::is_same<std::decay_t<U>, NullOpt>::value &&
                                      std::is_constructible<T, U&&>::value,
                                  int> = 0>
        Optional(U&& u) : m_is_present(true), m_t(std::forward<U>(u))
        {
        }

        Optional(const Optional& o) : m_is_present(false), m_inactive()
        {
            if (o.m_is_present)
            {
                new (&m_t) T(o.m_t);
                m_is_present = true;
            }
        }

        Optional(Optional&& o) noexcept(std::is_nothrow_move_constructible<T>::value)
            : m_is_present(false), m_inactive()
        {
            if (o.m_is_present)
            {
                new (&m_t) T(std::move(o.m_t));
                m_is_present = true;
            }
        }

        Optional& operator=(const Optional& o)
        {
            if (this != &o)
            {
                clear();
                if (o.m_is_present)
                {
                    new (&m_t) T(o.m_t);
                    m_is_present = true;
                }
            }

            return *this;
        }

        Optional& operator=(Optional&& o) noexcept(std::is_nothrow_move_constructible<T>::value)
        {
            if (this != &o)
            {
                clear();
                if (o.m_is_present)
                {
                    new (&m_t) T(std::move(o.m_t));
                    m_is_present = true;
                }
            }

            return *this;
        }

        ~Optional() { clear(); }

        void clear() noexcept
        {
            if (m_is_present)
            {
                m_t.~T();
                m_is_present = false;
            }
        }

        constexpr bool has_value() const noexcept { return m_is_present; }
        constexpr explicit operator bool() const noexcept { return m_is_present; }

        const T* get() const& noexcept { return m_is_present ? &m_t : nullptr; }
        T* get() & noexcept { return m_is_present ? &m_t : nullptr; }
        const T* get() const&& = delete;
        T* get() && = delete;

        T&& value_or_exit(const LineInfo& line_info) && noexcept
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return std::move(m_t);
        }

        template<class U>
        T value_or(U&& default_value) const&
        {
            return m_is_present ? m_t : static_cast<T>(std::forward<U>(default_value));
        }

        template<class U>
        T value_or(U&& default_value) &&
        {
            return m_is_present ? std::move(m_t) : static_cast<T>(std::forward<U>(default_value));
        }

        template<class F>
        using map_t = decltype(std::declval<F&>()(std::declval<const T&>()));

        template<class F>
        Optional<map_t<F>> map(F f) const&
        {
            if (m_is_present)
            {
                return f(m_t);
            }

            return nullopt;
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs)
        {
            if (lhs.m_is_present && rhs.m_is_present)
            {
                return lhs.m_t == rhs.m_t;
            }

            return lhs.m_is_present == rhs.m_is_present;
        }

        friend bool operator!=(const Optional& lhs, const Optional& rhs) { return !(lhs == rhs); }

    private:
        bool m_is_present;
        union
        {
            char m_inactive;
            T m_t;
        };
    };
}
