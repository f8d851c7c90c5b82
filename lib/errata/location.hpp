/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_LOCATION_HPP
#define ERRATA_LOCATION_HPP

#include <cstdint>
#include <source_location>
#include <string_view>
#include <errata/format.hpp>

namespace errata {
    struct location {
        const char *file = "";
        uint32_t line = 0;
        uint32_t column = 0;

        static constexpr location current(const std::source_location &loc=std::source_location::current()) noexcept
        {
            return { loc.file_name(), static_cast<uint32_t>(loc.line()), static_cast<uint32_t>(loc.column()) };
        }

        static constexpr location from(const std::source_location &loc) noexcept
        {
            return { loc.file_name(), static_cast<uint32_t>(loc.line()), static_cast<uint32_t>(loc.column()) };
        }

        [[nodiscard]] std::string_view filename() const noexcept
        {
            const std::string_view path { file };
            if (const auto pos = path.find_last_of("/\\"); pos != path.npos)
                return path.substr(pos + 1);
            return path;
        }

        bool operator==(const location &o) const noexcept
        {
            return line == o.line && column == o.column && std::string_view { file } == std::string_view { o.file };
        }
    };
}

namespace fmt {
    template<>
    struct formatter<errata::location>: formatter<int> {
        template<typename FormatContext>
        auto format(const errata::location &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}:{}:{}", v.filename(), v.line, v.column);
        }
    };
}

#endif // !ERRATA_LOCATION_HPP
