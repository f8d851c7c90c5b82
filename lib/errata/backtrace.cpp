/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#ifndef _WIN32
#   include <pthread.h>
#endif
#include <boost/stacktrace.hpp>
#include <errata/backtrace.hpp>
#include <errata/config.hpp>
#include <errata/logger.hpp>

namespace errata {
    static std::optional<std::string> current_thread_name()
    {
#if defined(__linux__) || defined(__APPLE__)
        std::array<char, 64> buf {};
        if (pthread_getname_np(pthread_self(), buf.data(), buf.size()) == 0 && buf[0] != 0)
            return std::string { buf.data() };
#endif
        return {};
    }

    backtrace::backtrace(const location &loc):
        _locations { loc }, _call_depth { 1 }, _captured_at { clock::now() },
        _thread_id { std::this_thread::get_id() }, _thread_name { current_thread_name() }
    {
    }

    std::optional<backtrace> backtrace::capture(const std::source_location &loc)
    {
        if (!config::backtrace_enabled())
            return {};
        return capture_now(loc);
    }

    backtrace backtrace::capture_now(const std::source_location &loc)
    {
        const auto start = std::chrono::steady_clock::now();
        backtrace bt { location::from(loc) };
        // skips top 2 frames: safe_dump_to and capture_now
        bt._num_frames = boost::stacktrace::safe_dump_to(2, bt._trace.data(), bt._trace.size());
        const auto cost = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
        bt._capture_cost_ns = static_cast<uint64_t>(cost.count());
        if (logger::tracing_enabled())
            logger::trace("captured a backtrace of {} frames in {} ns", bt._num_frames, cost.count());
        return bt;
    }

    void backtrace::add_location(const location &loc)
    {
        _locations.emplace_back(loc);
        ++_call_depth;
    }

    backtrace::status_type backtrace::status() const noexcept
    {
        if (_num_frames > 0)
            return status_type::captured;
        if (!_locations.empty())
            return status_type::unsupported;
        return status_type::disabled;
    }

    std::string backtrace::to_string() const
    {
        std::string thread_descr = fmt::format("{}", _thread_id);
        if (_thread_name)
            thread_descr += fmt::format(" ({})", *_thread_name);
        if (_num_frames > 0) {
            const auto st = boost::stacktrace::stacktrace::from_dump(_trace.data(), _num_frames * sizeof(void *));
            return fmt::format("Backtrace captured at {:%Y-%m-%d %H:%M:%S} on thread {} in {} ns\n{}",
                std::chrono::time_point_cast<std::chrono::seconds>(_captured_at), thread_descr,
                _capture_cost_ns.value_or(0), boost::stacktrace::to_string(st));
        }
        std::string res = fmt::format("Minimal backtrace captured at {:%Y-%m-%d %H:%M:%S}\nThread: {} | Call depth: {}\nLocations:\n",
            std::chrono::time_point_cast<std::chrono::seconds>(_captured_at), thread_descr, _call_depth);
        for (size_t i = 0; i < _locations.size(); ++i)
            res += fmt::format("  {}: {}\n", i, _locations[i]);
        return res;
    }

    std::string backtrace::render() const
    {
        if (config::production_mode())
            return std::string { config::backtrace_redaction };
        auto res = to_string();
        if (res.size() > config::max_backtrace_size) {
            res.resize(config::max_backtrace_size);
            res += '\n';
            res += config::truncation_marker;
        }
        return res;
    }
}
