/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/config.hpp>
#include <errata/lift.hpp>

namespace errata {
    error lift(const std::string_view msg, const std::source_location &loc)
    {
        return error { kind::internal { msg }, loc };
    }

    error lift(const std::error_code &ec, const std::source_location &loc)
    {
        return error { kind::io::from_error_code(ec), loc }.with_metadata("error_code", fmt::format("{}:{}", ec.category().name(), ec.value()));
    }

    error lift(const std::system_error &ex, const std::source_location &loc)
    {
        return error { kind::io { kind::io::from_error_code(ex.code()).code, ex.what() }, loc };
    }

    error lift(const std::filesystem::filesystem_error &ex, const std::source_location &loc)
    {
        auto err = error { kind::io { kind::io::from_error_code(ex.code()).code, ex.what() }, loc };
        if (!ex.path1().empty())
            err = std::move(err).with_metadata("path", ex.path1().string());
        return err;
    }

    error lift_current(const std::source_location &loc)
    {
        const auto ptr = std::current_exception();
        if (!ptr)
            return error { kind::internal { "no exception is being handled", "errata" }, loc };
        try {
            std::rethrow_exception(ptr);
        } catch (const error &err) {
            // the exception object stays in flight for rethrows and stored exception_ptrs
            return error { err, error::same_instance_t {} };
        } catch (const std::filesystem::filesystem_error &ex) {
            return lift(ex, loc);
        } catch (const std::system_error &ex) {
            return lift(ex, loc);
        } catch (const std::exception &ex) {
            return error { kind::foreign::from_exception(ex), loc };
        } catch (...) {
            return error { kind::internal { "unknown exception" }, loc };
        }
    }

    error lift_io(const int err, const std::string_view msg, const std::source_location &loc)
    {
        return error { kind::io::from_errno(err, msg), loc };
    }

    std::string getenv_required(const std::string_view name, const std::source_location &loc)
    {
        if (auto val = getenv_opt(name); val)
            return std::move(*val);
        throw error { kind::config { "environment variable not present", "environment_variables" }, loc }.with_metadata("name", name);
    }
}
