/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_CONFIG_HPP
#define ERRATA_CONFIG_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace errata {
    struct config {
        static constexpr size_t max_payloads = 16;
        static constexpr uint8_t default_priority = 128;
        static constexpr size_t max_render_depth = 32;
        static constexpr size_t max_message_size = 256;
        static constexpr size_t max_backtrace_size = 0x2000;
        static constexpr std::string_view redaction_marker { "[REDACTED]" };
        static constexpr std::string_view truncation_marker { "...[truncated]" };
        static constexpr std::string_view backtrace_redaction { "[backtrace redacted in production mode]" };
        static constexpr std::array<std::string_view, 3> sensitive_words { "password", "token", "key" };

        static constexpr std::string_view backtrace_env { "ERRATA_LIB_BACKTRACE" };
        static constexpr std::string_view backtrace_env_alias { "ERRATA_BACKTRACE" };
        static constexpr std::string_view production_env { "ERRATA_PRODUCTION" };

        // Environment lookups are not cached so that tests can toggle them
        static bool backtrace_enabled();
        static bool production_mode();
    };

    extern std::optional<std::string> getenv_opt(std::string_view name);
}

#endif // !ERRATA_CONFIG_HPP
