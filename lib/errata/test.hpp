/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_TEST_HPP
#define ERRATA_TEST_HPP

#include <cstdlib>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include <errata/config.hpp>
#include <errata/format.hpp>

namespace errata {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T, typename Y>
    bool test_same(const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<T>(y);
        expect(res, loc) << fmt::format("{} != {}", x, static_cast<T>(y));
        return res;
    }

    inline bool test_contains(const std::string_view text, const std::string_view needle, const std::source_location &loc=std::source_location::current())
    {
        const auto res = text.find(needle) != text.npos;
        expect(res, loc) << fmt::format("'{}' does not contain '{}'", text, needle);
        return res;
    }

    // Sets or unsets an environment variable for the lifetime of the guard and restores the previous value
    struct scoped_env {
        scoped_env(const std::string_view name, const std::optional<std::string_view> val): _name { name }, _prev { getenv_opt(name) }
        {
            _apply(val);
        }

        scoped_env(const scoped_env &) =delete;
        scoped_env &operator=(const scoped_env &) =delete;

        ~scoped_env()
        {
            _apply(_prev);
        }
    private:
        std::string _name;
        std::optional<std::string> _prev;

        void _apply(const std::optional<std::string_view> val)
        {
            if (val)
                ::setenv(_name.c_str(), std::string { *val }.c_str(), 1);
            else
                ::unsetenv(_name.c_str());
        }
    };
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<errata::test_printer>> {};

#endif // !ERRATA_TEST_HPP
