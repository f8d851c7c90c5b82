/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_KIND_HPP
#define ERRATA_KIND_HPP

#include <chrono>
#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <system_error>
#include <typeinfo>
#include <variant>
#include <vector>
#include <boost/core/demangle.hpp>
#include <errata/intern.hpp>
#include <errata/sanitize.hpp>

namespace errata {
    struct error;
    using error_ptr = std::shared_ptr<const error>;
}

namespace errata::kind {
    enum class io_code: uint8_t {
        not_found, permission_denied, connection_refused, timed_out, generic, other
    };

    extern std::string_view io_code_name(io_code code);
    extern uint8_t io_code_severity(io_code code);
    extern bool io_code_transient(io_code code);

    struct io {
        io_code code = io_code::other;
        std::optional<istring> message {};

        explicit io(io_code c, std::optional<std::string_view> msg={});

        // classifies by well-known phrases, e.g. "no such file" or "connection refused"
        static io from_message(std::string_view msg);
        static io from_errno(int err, std::string_view msg);
        static io from_error_code(const std::error_code &ec);
    };

    struct network {
        istring message;
        error_ptr source {};
        std::optional<uint32_t> error_code {};

        explicit network(std::string_view msg, std::optional<uint32_t> code={}, error_ptr src={});
    };

    struct config {
        istring message;
        error_ptr source {};
        std::optional<istring> config_path {};

        explicit config(std::string_view msg, std::optional<std::string_view> path={}, error_ptr src={});
    };

    struct validation {
        istring field;
        istring message;
        std::optional<istring> expected {};
        std::optional<istring> actual {};

        explicit validation(std::string_view fld, std::string_view msg,
            std::optional<std::string_view> exp={}, std::optional<std::string_view> act={});
    };

    struct internal {
        istring message;
        error_ptr source {};
        std::optional<istring> component {};

        explicit internal(std::string_view msg, std::optional<std::string_view> comp={}, error_ptr src={});
    };

    struct not_found {
        istring resource_type;
        istring identifier;
        std::optional<std::vector<istring>> search_locations {};

        explicit not_found(std::string_view type, std::string_view id, const std::vector<std::string_view> &locations={});
    };

    struct timeout {
        istring operation;
        std::chrono::milliseconds duration;
        std::optional<std::chrono::milliseconds> expected_max {};

        explicit timeout(std::string_view op, std::chrono::milliseconds dur, std::optional<std::chrono::milliseconds> max={});
    };

    struct resource_exhausted {
        istring resource;
        istring limit;
        istring current;
        std::optional<double> usage_percentage {};

        explicit resource_exhausted(std::string_view res, std::string_view lim, std::string_view cur, std::optional<double> usage={});
    };

    // A failure of a foreign type; the message is sanitized at the time of lifting
    struct foreign {
        istring type_name;
        istring message;
        std::optional<istring> context {};
        std::shared_ptr<const std::exception> object {};

        template<typename E>
            requires std::derived_from<std::decay_t<E>, std::exception>
        static foreign lift(E &&ex, const std::string_view ctx={})
        {
            using value_type = std::decay_t<E>;
            foreign res { boost::core::demangle(typeid(ex).name()), ex.what(), ctx };
            // a copy through a base reference would slice the object
            if (typeid(ex) == typeid(value_type))
                res.object = std::make_shared<const value_type>(std::forward<E>(ex));
            return res;
        }

        // keeps only the dynamic type name and the message
        static foreign from_exception(const std::exception &ex, std::string_view ctx={});

        foreign(std::string_view type, std::string_view msg, std::string_view ctx={});
    };

    struct multiple {
        std::vector<error_ptr> errors {};
        std::optional<size_t> primary_index {};

        explicit multiple(std::vector<error_ptr> errs, std::optional<size_t> primary={});
    };
}

namespace errata {
    using kind_type = std::variant<kind::io, kind::network, kind::config, kind::validation, kind::internal,
        kind::not_found, kind::timeout, kind::resource_exhausted, kind::foreign, kind::multiple>;

    // 0..100, a fixed value per kind
    extern uint8_t severity(const kind_type &k);
    extern bool is_transient(const kind_type &k);
    extern std::string_view kind_name(const kind_type &k);
    // the causal predecessor if the kind carries one; for multiple the primary or the first error
    extern const error *source(const kind_type &k);
    // io and foreign include their cause in their own text
    extern bool inlines_source(const kind_type &k);
    extern std::string describe(const kind_type &k);
}

namespace fmt {
    template<>
    struct formatter<errata::kind::io_code>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const errata::kind::io_code &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(errata::kind::io_code_name(v), ctx);
        }
    };

    template<>
    struct formatter<errata::kind_type>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const errata::kind_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(errata::describe(v), ctx);
        }
    };
}

#endif // !ERRATA_KIND_HPP
