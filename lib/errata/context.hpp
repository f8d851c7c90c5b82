/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_CONTEXT_HPP
#define ERRATA_CONTEXT_HPP

#include <chrono>
#include <map>
#include <optional>
#include <vector>
#include <errata/config.hpp>
#include <errata/intern.hpp>
#include <errata/location.hpp>
#include <errata/payload.hpp>

namespace errata {
    // One layer of diagnostic information attached to an error while it propagates.
    // The builder methods consume the context and return the updated value.
    // All text is interned.
    struct context {
        using clock = std::chrono::system_clock;
        using metadata_map = std::map<istring, istring>;

        context();
        explicit context(std::string_view msg);

        context with_metadata(std::string_view key, std::string_view val) &&;
        context with_suggestion(std::string_view text) &&;
        context with_priority(uint8_t priority) &&;
        context with_location(const errata::location &loc) &&;

        // Payloads beyond config::max_payloads are dropped
        template<typename T>
        context with_payload(T &&val) &&
        {
            if (_payloads.size() < config::max_payloads)
                _payloads.emplace_back(errata::payload::make(std::forward<T>(val)));
            return std::move(*this);
        }

        // The first payload of type T in insertion order
        template<typename T>
        [[nodiscard]] const T *payload() const noexcept
        {
            for (const auto &p: _payloads) {
                if (const auto *v = p.template get<T>(); v)
                    return v;
            }
            return nullptr;
        }

        [[nodiscard]] const std::optional<istring> &message() const noexcept
        {
            return _message;
        }

        [[nodiscard]] const metadata_map &metadata() const noexcept
        {
            return _metadata;
        }

        [[nodiscard]] const istring *metadata(std::string_view key) const;

        [[nodiscard]] const std::optional<istring> &suggestion() const noexcept
        {
            return _suggestion;
        }

        [[nodiscard]] const std::optional<errata::location> &location() const noexcept
        {
            return _location;
        }

        [[nodiscard]] const std::vector<errata::payload> &payloads() const noexcept
        {
            return _payloads;
        }

        [[nodiscard]] clock::time_point created_at() const noexcept
        {
            return _created_at;
        }

        [[nodiscard]] uint8_t priority() const noexcept
        {
            return _priority;
        }

        // true when there is nothing to render
        [[nodiscard]] bool empty() const noexcept
        {
            return !_message && !_suggestion && _metadata.empty() && _payloads.empty();
        }
    private:
        std::optional<istring> _message {};
        metadata_map _metadata {};
        std::optional<istring> _suggestion {};
        std::optional<errata::location> _location {};
        std::vector<errata::payload> _payloads {};
        clock::time_point _created_at;
        uint8_t _priority = config::default_priority;
    };
}

#endif // !ERRATA_CONTEXT_HPP
