/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_FORMAT_HPP
#define ERRATA_FORMAT_HPP

#include <sstream>
#include <string>
#include <thread>
#ifndef _MSC_VER
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpragmas"
#ifndef __clang__
#   pragma GCC diagnostic ignored "-Wdangling-reference"
#endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#ifndef _MSC_VER
#pragma GCC diagnostic pop
#endif

namespace errata {
    using fmt::format;
}

namespace fmt {
    template<>
    struct formatter<std::thread::id>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::stringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !ERRATA_FORMAT_HPP
