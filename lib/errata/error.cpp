/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <algorithm>
#include <array>
#include <errata/counter.hpp>
#include <errata/error.hpp>
#include <errata/logger.hpp>
#include <errata/render.hpp>

namespace errata {
    error::error(kind_type k, const std::source_location &loc):
        _kind { std::move(k) }, _instance_id { counter::next_id() }, _created_at { clock::now() },
        _backtrace { errata::backtrace::capture(loc) }
    {
        if (logger::tracing_enabled())
            logger::trace("error #{} of kind {} created at {}", _instance_id, kind_name(_kind), location::from(loc));
    }

    error::error(const error &o):
        std::exception { o }, _kind { o._kind }, _contexts { o._contexts }, _instance_id { counter::next_id() },
        _created_at { o._created_at }
    {
    }

    error::error(const error &o, same_instance_t):
        std::exception { o }, _kind { o._kind }, _contexts { o._contexts }, _instance_id { o._instance_id },
        _created_at { o._created_at }, _backtrace { o._backtrace }
    {
    }

    error &error::operator=(const error &o)
    {
        if (this != &o) {
            error tmp { o };
            *this = std::move(tmp);
        }
        return *this;
    }

    const char *error::what() const noexcept
    {
        thread_local std::string buf {};
        try {
            buf = render(*this);
        } catch (const std::bad_alloc &) {
            return "errata::error: out of memory while rendering";
        }
        return buf.c_str();
    }

    errata::context &error::_last_context()
    {
        if (_contexts.empty())
            _contexts.emplace_back();
        return _contexts.back();
    }

    error error::context(const std::string_view msg, const std::source_location &loc) &&
    {
        const auto l = location::from(loc);
        _contexts.emplace_back(errata::context { msg }.with_location(l));
        if (_backtrace && _backtrace->status() == errata::backtrace::status_type::unsupported)
            _backtrace->add_location(l);
        return std::move(*this);
    }

    error error::push(errata::context ctx) &&
    {
        _contexts.emplace_back(std::move(ctx));
        return std::move(*this);
    }

    error error::with_metadata(const std::string_view key, const std::string_view val) &&
    {
        auto &ctx = _last_context();
        ctx = std::move(ctx).with_metadata(key, val);
        return std::move(*this);
    }

    error error::with_suggestion(const std::string_view text) &&
    {
        auto &ctx = _last_context();
        ctx = std::move(ctx).with_suggestion(text);
        return std::move(*this);
    }

    error error::with_priority(const uint8_t priority) &&
    {
        auto &ctx = _last_context();
        ctx = std::move(ctx).with_priority(priority);
        return std::move(*this);
    }

    error error::with_location(const errata::location &loc) &&
    {
        auto &ctx = _last_context();
        ctx = std::move(ctx).with_location(loc);
        return std::move(*this);
    }

    error error::with_component(const std::string_view name) &&
    {
        return std::move(*this).with_metadata("component", name);
    }

    const errata::context *error::primary_context() const noexcept
    {
        const errata::context *best = nullptr;
        for (const auto &ctx: _contexts) {
            if (!best || ctx.priority() > best->priority())
                best = &ctx;
        }
        return best;
    }

    const istring *error::message() const noexcept
    {
        if (const auto *ctx = primary_context(); ctx && ctx->message())
            return &*ctx->message();
        return nullptr;
    }

    const istring *error::suggestion() const noexcept
    {
        if (const auto *ctx = primary_context(); ctx && ctx->suggestion())
            return &*ctx->suggestion();
        return nullptr;
    }

    uint8_t error::recovery_score() const noexcept
    {
        // indexed by the alternative index of kind_type
        static constexpr std::array<uint8_t, 10> base_scores { 60, 70, 20, 10, 15, 20, 75, 55, 30, 25 };
        static_assert(base_scores.size() == std::variant_size_v<kind_type>);
        uint32_t score = base_scores[_kind.index()];
        if (is_transient())
            score = std::min<uint32_t>(score + 20, 100);
        const bool retried = std::any_of(_contexts.begin(), _contexts.end(), [](const auto &ctx) {
            return ctx.metadata("retry_count") != nullptr;
        });
        if (retried)
            score /= 2;
        return static_cast<uint8_t>(score);
    }

    context_analysis error::analyze_contexts() const noexcept
    {
        context_analysis res {};
        res.total_contexts = _contexts.size();
        for (const auto &ctx: _contexts) {
            res.metadata_entries += ctx.metadata().size();
            res.payload_count += ctx.payloads().size();
            res.has_suggestions |= ctx.suggestion().has_value();
            res.has_locations |= ctx.location().has_value();
        }
        if (const auto *primary = primary_context(); primary)
            res.primary_priority = primary->priority();
        return res;
    }
}
