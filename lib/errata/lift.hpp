/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_LIFT_HPP
#define ERRATA_LIFT_HPP

#include <concepts>
#include <filesystem>
#include <source_location>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <errata/error.hpp>

namespace errata {
    template<typename E>
    concept foreign_exception = std::derived_from<std::decay_t<E>, std::exception>
        && !std::derived_from<std::decay_t<E>, error>
        && !std::derived_from<std::decay_t<E>, std::system_error>;

    inline error lift(error &&err)
    {
        return std::move(err);
    }

    inline error lift(const error &err)
    {
        return err;
    }

    // plain text becomes an internal error
    extern error lift(std::string_view msg, const std::source_location &loc=std::source_location::current());
    extern error lift(const std::error_code &ec, const std::source_location &loc=std::source_location::current());
    extern error lift(const std::system_error &ex, const std::source_location &loc=std::source_location::current());
    extern error lift(const std::filesystem::filesystem_error &ex, const std::source_location &loc=std::source_location::current());

    // keeps a typed copy of the exception available through error::downcast unless E is a base of its dynamic type
    template<foreign_exception E>
    error lift(E &&ex, const std::source_location &loc=std::source_location::current())
    {
        return error { kind::foreign::lift(std::forward<E>(ex)), loc };
    }

    // Converts the exception being handled. Must be called from within a catch block;
    // without an active exception the result is an internal error.
    extern error lift_current(const std::source_location &loc=std::source_location::current());
    extern error lift_io(int err, std::string_view msg, const std::source_location &loc=std::source_location::current());

    // the value of an environment variable or a config error naming it
    extern std::string getenv_required(std::string_view name, const std::source_location &loc=std::source_location::current());

    // runs f and rethrows any failure as an errata::error with an extra context
    template<typename F>
    auto with_context(const std::string_view msg, F &&f, const std::source_location &loc=std::source_location::current()) -> decltype(f())
    {
        try {
            return f();
        } catch (...) {
            throw lift_current(loc).context(msg, loc);
        }
    }
}

#endif // !ERRATA_LIFT_HPP
