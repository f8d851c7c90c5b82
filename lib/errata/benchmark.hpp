/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_BENCHMARK_HPP
#define ERRATA_BENCHMARK_HPP

#include <chrono>
#include <cmath>
#include <iostream>
#include <source_location>
#include <string_view>
#include <vector>
#include <errata/test.hpp>

namespace errata {
    template<typename T>
    concept countable = requires(T a) {
        { a() + 1 };
    };

    inline std::string humanize_rate(const double rate)
    {
        struct scale {
            double norm;
            const char *suffix;
        };
        static const std::vector<scale> scales { { 1e9, "G" }, { 1e6, "M" }, { 1e3, "K" } };
        const auto abs_rate = std::fabs(rate);
        for (const auto &[norm, suff]: scales) {
            if (abs_rate >= norm)
                return fmt::format("{:.3f}{}", rate / norm, suff);
        }
        return fmt::format("{:.3f}", rate);
    }

    template<countable T>
    double benchmark_rate(const std::string_view name, const size_t num_iter, const T &action)
    {
        const auto start = std::chrono::steady_clock::now();
        uint64_t total_iters = 0;
        for (size_t i = 0; i < num_iter; ++i)
            total_iters += action();
        const std::chrono::duration<double> sec = std::chrono::steady_clock::now() - start;
        const double rate = static_cast<double>(total_iters) / sec.count();
        std::clog << fmt::format("[{}] {}iters/sec, total iters: {}\n", name, humanize_rate(rate), total_iters);
        return rate;
    }

    template<typename T>
    double benchmark_rate(const std::string_view name, const size_t num_iter, const T &action)
    {
        return benchmark_rate(name, num_iter, [&] {
            action();
            return 1;
        });
    }

    template<typename T>
    void benchmark_r(const std::string_view name, const double min_rate, const size_t num_iter, const T &action, const std::source_location &src_loc=std::source_location::current())
    {
        boost::ut::test(name) = [=] {
            const double rate = benchmark_rate(name, num_iter, action);
            boost::ut::expect(rate >= min_rate, src_loc) << rate << " < " << min_rate;
        };
    }
}

#endif // !ERRATA_BENCHMARK_HPP
