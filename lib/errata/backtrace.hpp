/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_BACKTRACE_HPP
#define ERRATA_BACKTRACE_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <source_location>
#include <string>
#include <thread>
#include <vector>
#include <errata/location.hpp>

namespace errata {
    struct backtrace {
        using clock = std::chrono::system_clock;
        static constexpr size_t stacktrace_depth = 0x40;

        enum class status_type {
            captured, disabled, unsupported
        };

        // Captures only when ERRATA_LIB_BACKTRACE or ERRATA_BACKTRACE is "1" or "full"
        static std::optional<backtrace> capture(const std::source_location &loc=std::source_location::current());
        static backtrace capture_now(const std::source_location &loc=std::source_location::current());

        // A location-only trace for environments without stack introspection
        explicit backtrace(const location &loc);

        void add_location(const location &loc);

        [[nodiscard]] status_type status() const noexcept;
        [[nodiscard]] size_t num_frames() const noexcept
        {
            return _num_frames;
        }

        [[nodiscard]] uint32_t call_depth() const noexcept
        {
            return _call_depth;
        }

        [[nodiscard]] const std::vector<location> &locations() const noexcept
        {
            return _locations;
        }

        [[nodiscard]] clock::time_point captured_at() const noexcept
        {
            return _captured_at;
        }

        [[nodiscard]] std::thread::id thread_id() const noexcept
        {
            return _thread_id;
        }

        [[nodiscard]] const std::optional<std::string> &thread_name() const noexcept
        {
            return _thread_name;
        }

        [[nodiscard]] std::optional<uint64_t> capture_cost_ns() const noexcept
        {
            return _capture_cost_ns;
        }

        // the complete text of the trace
        [[nodiscard]] std::string to_string() const;
        // the text limited to config::max_backtrace_size, or a redaction line in production mode
        [[nodiscard]] std::string render() const;
    private:
        std::array<std::byte, sizeof(void *) * stacktrace_depth> _trace {};
        size_t _num_frames = 0;
        std::vector<location> _locations {};
        uint32_t _call_depth = 0;
        clock::time_point _captured_at;
        std::thread::id _thread_id;
        std::optional<std::string> _thread_name {};
        std::optional<uint64_t> _capture_cost_ns {};
    };
}

#endif // !ERRATA_BACKTRACE_HPP
