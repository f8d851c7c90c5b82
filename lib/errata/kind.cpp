/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <errata/error.hpp>
#include <errata/kind.hpp>

namespace errata::kind {
    std::string_view io_code_name(const io_code code)
    {
        switch (code) {
            case io_code::not_found: return "not found";
            case io_code::permission_denied: return "permission denied";
            case io_code::connection_refused: return "connection refused";
            case io_code::timed_out: return "timed out";
            case io_code::generic: return "I/O error";
            case io_code::other: return "other error";
        }
        return "other error";
    }

    uint8_t io_code_severity(const io_code code)
    {
        switch (code) {
            case io_code::not_found: return 30;
            case io_code::permission_denied: return 50;
            case io_code::timed_out: return 35;
            case io_code::generic: return 45;
            case io_code::connection_refused:
            case io_code::other:
                return 40;
        }
        return 40;
    }

    bool io_code_transient(const io_code code)
    {
        return code == io_code::connection_refused || code == io_code::timed_out || code == io_code::generic;
    }

    io::io(const io_code c, const std::optional<std::string_view> msg): code { c }
    {
        if (msg)
            message.emplace(intern(sanitize(*msg)));
    }

    io io::from_message(const std::string_view msg)
    {
        struct pattern {
            io_code code;
            std::array<std::string_view, 6> phrases;
        };
        static const std::array<pattern, 5> patterns {{
            { io_code::not_found, { "not found", "no such file", "enoent", "file does not exist" } },
            { io_code::permission_denied, { "permission denied", "access denied", "access is denied", "eacces", "unauthorized", "forbidden" } },
            { io_code::connection_refused, { "connection refused", "econnrefused", "no route to host", "network unreachable" } },
            { io_code::timed_out, { "timed out", "timeout", "etimedout" } },
            { io_code::generic, { "i/o error", "io error", "input/output error" } }
        }};
        std::string lower { msg };
        std::transform(lower.begin(), lower.end(), lower.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        for (const auto &[code, phrases]: patterns) {
            for (const auto phrase: phrases) {
                if (!phrase.empty() && lower.find(phrase) != lower.npos) {
                    if (code == io_code::generic)
                        return io { code, msg };
                    return io { code };
                }
            }
        }
        return io { io_code::other, msg };
    }

    io io::from_errno(const int err, const std::string_view msg)
    {
        switch (err < 0 ? -static_cast<int64_t>(err) : static_cast<int64_t>(err)) {
            case ENOENT: return io { io_code::not_found };
            case EACCES: return io { io_code::permission_denied };
            case ECONNREFUSED: return io { io_code::connection_refused };
            case ETIMEDOUT: return io { io_code::timed_out };
            case EIO: return io { io_code::generic, msg };
            default: return io { io_code::other, msg };
        }
    }

    io io::from_error_code(const std::error_code &ec)
    {
        if (ec == std::errc::no_such_file_or_directory)
            return io { io_code::not_found };
        if (ec == std::errc::permission_denied)
            return io { io_code::permission_denied };
        if (ec == std::errc::connection_refused)
            return io { io_code::connection_refused };
        if (ec == std::errc::timed_out)
            return io { io_code::timed_out };
        return io { io_code::generic, ec.message() };
    }

    network::network(const std::string_view msg, const std::optional<uint32_t> code, error_ptr src):
        message { intern(msg) }, source { std::move(src) }, error_code { code }
    {
    }

    config::config(const std::string_view msg, const std::optional<std::string_view> path, error_ptr src):
        message { intern(msg) }, source { std::move(src) }
    {
        if (path)
            config_path.emplace(intern(*path));
    }

    validation::validation(const std::string_view fld, const std::string_view msg,
            const std::optional<std::string_view> exp, const std::optional<std::string_view> act):
        field { intern(fld) }, message { intern(msg) }
    {
        if (exp)
            expected.emplace(intern(*exp));
        if (act)
            actual.emplace(intern(*act));
    }

    internal::internal(const std::string_view msg, const std::optional<std::string_view> comp, error_ptr src):
        message { intern(msg) }, source { std::move(src) }
    {
        if (comp)
            component.emplace(intern(*comp));
    }

    not_found::not_found(const std::string_view type, const std::string_view id, const std::vector<std::string_view> &locations):
        resource_type { intern(type) }, identifier { intern(id) }
    {
        if (!locations.empty()) {
            auto &locs = search_locations.emplace();
            locs.reserve(locations.size());
            for (const auto l: locations)
                locs.emplace_back(intern(l));
        }
    }

    timeout::timeout(const std::string_view op, const std::chrono::milliseconds dur, const std::optional<std::chrono::milliseconds> max):
        operation { intern(op) }, duration { dur }, expected_max { max }
    {
    }

    resource_exhausted::resource_exhausted(const std::string_view res, const std::string_view lim, const std::string_view cur, const std::optional<double> usage):
        resource { intern(res) }, limit { intern(lim) }, current { intern(cur) }, usage_percentage { usage }
    {
    }

    foreign::foreign(const std::string_view type, const std::string_view msg, const std::string_view ctx):
        type_name { intern(type) }, message { intern(sanitize(msg)) }
    {
        if (!ctx.empty())
            context.emplace(intern(ctx));
    }

    foreign foreign::from_exception(const std::exception &ex, const std::string_view ctx)
    {
        return foreign { boost::core::demangle(typeid(ex).name()), ex.what(), ctx };
    }

    multiple::multiple(std::vector<error_ptr> errs, const std::optional<size_t> primary):
        errors { std::move(errs) }, primary_index { primary }
    {
    }
}

namespace errata {
    struct kind_traits {
        std::string_view name;
        uint8_t severity;
        bool transient;
        bool inlines_source;
    };

    // indexed by the alternative index of kind_type
    static constexpr std::array<kind_traits, 10> kind_table {{
        { "Io", 40, true, true },
        { "Network", 50, true, false },
        { "Config", 30, false, false },
        { "Validation", 20, false, false },
        { "Internal", 80, false, false },
        { "NotFound", 25, false, false },
        { "Timeout", 45, true, false },
        { "ResourceExhausted", 70, true, false },
        { "Foreign", 60, false, true },
        { "Multiple", 65, false, false }
    }};
    static_assert(kind_table.size() == std::variant_size_v<kind_type>);

    uint8_t severity(const kind_type &k)
    {
        return kind_table[k.index()].severity;
    }

    bool is_transient(const kind_type &k)
    {
        return kind_table[k.index()].transient;
    }

    std::string_view kind_name(const kind_type &k)
    {
        return kind_table[k.index()].name;
    }

    bool inlines_source(const kind_type &k)
    {
        return kind_table[k.index()].inlines_source;
    }

    const error *source(const kind_type &k)
    {
        return std::visit([](const auto &v) -> const error * {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, kind::network> || std::is_same_v<T, kind::config> || std::is_same_v<T, kind::internal>) {
                return v.source.get();
            } else if constexpr (std::is_same_v<T, kind::multiple>) {
                if (v.errors.empty())
                    return nullptr;
                if (v.primary_index && *v.primary_index < v.errors.size())
                    return v.errors[*v.primary_index].get();
                return v.errors.front().get();
            } else {
                return nullptr;
            }
        }, k);
    }

    std::string describe(const kind_type &k)
    {
        return std::visit([](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, kind::io>) {
                if (v.message)
                    return fmt::format("I/O error: {}", *v.message);
                return fmt::format("I/O error: {}", v.code);
            } else if constexpr (std::is_same_v<T, kind::network>) {
                if (v.error_code)
                    return fmt::format("Network error (code {}): {}", *v.error_code, v.message);
                return fmt::format("Network error: {}", v.message);
            } else if constexpr (std::is_same_v<T, kind::config>) {
                if (v.config_path)
                    return fmt::format("Configuration error in '{}': {}", *v.config_path, v.message);
                return fmt::format("Configuration error: {}", v.message);
            } else if constexpr (std::is_same_v<T, kind::validation>) {
                auto res = fmt::format("Validation error for '{}': {}", v.field, v.message);
                if (v.expected && v.actual)
                    res += fmt::format(" (expected: {}, actual: {})", *v.expected, *v.actual);
                return res;
            } else if constexpr (std::is_same_v<T, kind::internal>) {
                if (v.component)
                    return fmt::format("Internal error in {}: {}", *v.component, v.message);
                return fmt::format("Internal error: {}", v.message);
            } else if constexpr (std::is_same_v<T, kind::not_found>) {
                return fmt::format("{} not found: {}", v.resource_type, v.identifier);
            } else if constexpr (std::is_same_v<T, kind::timeout>) {
                auto res = fmt::format("Operation '{}' timed out after {}", v.operation, v.duration);
                if (v.expected_max)
                    res += fmt::format(" (max expected: {})", *v.expected_max);
                return res;
            } else if constexpr (std::is_same_v<T, kind::resource_exhausted>) {
                auto res = fmt::format("Resource '{}' exhausted: {} (limit: {})", v.resource, v.current, v.limit);
                if (v.usage_percentage)
                    res += fmt::format(" [{:.1f}% usage]", *v.usage_percentage);
                return res;
            } else if constexpr (std::is_same_v<T, kind::foreign>) {
                if (v.context)
                    return fmt::format("{}: {}: {}", v.type_name, *v.context, v.message);
                return fmt::format("{}: {}", v.type_name, v.message);
            } else if constexpr (std::is_same_v<T, kind::multiple>) {
                return fmt::format("Multiple errors ({} total)", v.errors.size());
            } else {
                static_assert(sizeof(T) == 0, "unsupported error kind");
            }
        }, k);
    }
}
