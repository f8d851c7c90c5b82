/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/benchmark.hpp>
#include <errata/intern.hpp>

using namespace errata;

suite intern_bench_suite = [] {
    "intern"_test = [] {
        benchmark_r("intern hit", 1'000'000.0, 1'000'000,
            [] {
                return intern("intern-bench-hit").empty() ? 0 : 1;
            }
        );
        std::vector<std::string> words {};
        for (size_t i = 0; i < 100'000; ++i)
            words.emplace_back(fmt::format("intern-bench-miss-{}", i));
        size_t next = 0;
        benchmark_r("intern miss", 100'000.0, words.size(),
            [&words, &next] {
                return intern(words[next++ % words.size()]).empty() ? 0 : 1;
            }
        );
    };
};
