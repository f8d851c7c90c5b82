/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_ERROR_HPP
#define ERRATA_ERROR_HPP

#include <chrono>
#include <exception>
#include <optional>
#include <source_location>
#include <vector>
#include <errata/backtrace.hpp>
#include <errata/context.hpp>
#include <errata/kind.hpp>

namespace errata {
    struct context_analysis {
        size_t total_contexts = 0;
        size_t metadata_entries = 0;
        size_t payload_count = 0;
        bool has_suggestions = false;
        bool has_locations = false;
        uint8_t primary_priority = 0;
    };

    // A structured failure: a kind, a stack of contexts attached while it propagates,
    // a process-unique instance id, and an optional backtrace.
    // The builder methods consume the error and return the updated value.
    // Copies are clones: they receive a fresh instance id and no backtrace.
    struct error: std::exception {
        using clock = std::chrono::system_clock;

        explicit error(kind_type k, const std::source_location &loc=std::source_location::current());
        error(const error &o);
        error(error &&o) noexcept =default;
        ~error() override =default;
        error &operator=(const error &o);
        error &operator=(error &&o) noexcept =default;

        // the full rendering
        const char *what() const noexcept override;

        // appends a new context with the message and the call-site location
        error context(std::string_view msg, const std::source_location &loc=std::source_location::current()) &&;
        error push(errata::context ctx) &&;

        // the following operate on the most recently appended context, creating one first if there are none
        error with_metadata(std::string_view key, std::string_view val) &&;
        error with_suggestion(std::string_view text) &&;
        error with_priority(uint8_t priority) &&;
        error with_location(const errata::location &loc) &&;
        error with_component(std::string_view name) &&;

        template<typename T>
        error with_payload(T &&val) &&
        {
            auto &ctx = _last_context();
            ctx = std::move(ctx).with_payload(std::forward<T>(val));
            return std::move(*this);
        }

        [[nodiscard]] const kind_type &kind() const noexcept
        {
            return _kind;
        }

        [[nodiscard]] kind_type &kind() noexcept
        {
            return _kind;
        }

        [[nodiscard]] const std::vector<errata::context> &contexts() const noexcept
        {
            return _contexts;
        }

        [[nodiscard]] uint64_t instance_id() const noexcept
        {
            return _instance_id;
        }

        [[nodiscard]] clock::time_point created_at() const noexcept
        {
            return _created_at;
        }

        [[nodiscard]] const std::optional<errata::backtrace> &backtrace() const noexcept
        {
            return _backtrace;
        }

        // the context with the highest priority, the earliest appended one on ties
        [[nodiscard]] const errata::context *primary_context() const noexcept;
        [[nodiscard]] const istring *message() const noexcept;
        [[nodiscard]] const istring *suggestion() const noexcept;

        // checks the primary context first, then all contexts in append order
        template<typename T>
        [[nodiscard]] const T *payload() const noexcept
        {
            if (const auto *primary = primary_context(); primary) {
                if (const auto *v = primary->template payload<T>(); v)
                    return v;
            }
            for (const auto &ctx: _contexts) {
                if (const auto *v = ctx.template payload<T>(); v)
                    return v;
            }
            return nullptr;
        }

        // the originally lifted foreign exception object if it has type E
        template<typename E>
        [[nodiscard]] const E *downcast() const noexcept
        {
            if (const auto *f = std::get_if<errata::kind::foreign>(&_kind); f && f->object)
                return dynamic_cast<const E *>(f->object.get());
            return nullptr;
        }

        [[nodiscard]] const error *source() const noexcept
        {
            return errata::source(_kind);
        }

        [[nodiscard]] uint8_t severity() const noexcept
        {
            return errata::severity(_kind);
        }

        [[nodiscard]] bool is_transient() const noexcept
        {
            return errata::is_transient(_kind);
        }

        // 0..100, an advisory estimate of how likely a retry is to succeed
        [[nodiscard]] uint8_t recovery_score() const noexcept;
        [[nodiscard]] context_analysis analyze_contexts() const noexcept;
    private:
        friend error lift_current(const std::source_location &loc);

        struct same_instance_t {};

        // a copy that stays the same error instance: keeps the id and the captured backtrace
        error(const error &o, same_instance_t);

        kind_type _kind;
        std::vector<errata::context> _contexts {};
        uint64_t _instance_id;
        clock::time_point _created_at;
        std::optional<errata::backtrace> _backtrace {};

        errata::context &_last_context();
    };

    // turns an error into a shareable causal source keeping its instance id
    inline error_ptr share(error &&e)
    {
        return std::make_shared<const error>(std::move(e));
    }
}

namespace fmt {
    template<>
    struct formatter<errata::error>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const errata::error &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(v.what(), ctx);
        }
    };
}

#endif // !ERRATA_ERROR_HPP
