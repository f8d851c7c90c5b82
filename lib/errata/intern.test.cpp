/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <thread>
#include <vector>
#include <errata/intern.hpp>
#include <errata/test.hpp>

using namespace errata;

suite intern_suite = [] {
    "intern"_test = [] {
        "idempotent"_test = [] {
            const auto a = intern("intern-test-idempotent");
            const auto b = intern("intern-test-idempotent");
            expect(a == b);
            expect(a.same_storage(b));
            expect(a == std::string_view { "intern-test-idempotent" });
        };
        "concurrent"_test = [] {
            static constexpr size_t num_threads = 16;
            std::vector<istring> results(num_threads);
            {
                std::vector<std::thread> threads {};
                for (size_t i = 0; i < num_threads; ++i)
                    threads.emplace_back([&results, i] { results[i] = intern("intern-test-concurrent"); });
                for (auto &t: threads)
                    t.join();
            }
            for (const auto &r: results) {
                expect(r == results.front());
                expect(r.same_storage(results.front()));
            }
        };
        "empty text"_test = [] {
            const auto before = interner::get().stats();
            const auto s = intern("");
            expect(s.empty());
            const auto after = interner::get().stats();
            expect(before.hits == after.hits);
            expect(before.misses == after.misses);
        };
        "stats"_test = [] {
            const auto before = interner::get().stats();
            const auto a = intern("intern-test-stats");
            const auto b = intern("intern-test-stats");
            const auto after = interner::get().stats();
            test_same(before.misses + 1, after.misses);
            test_same(before.hits + 1, after.hits);
            test_same(before.size + 1, after.size);
        };
        "clear"_test = [] {
            const auto a = intern("intern-test-clear");
            interner::get().clear();
            test_same(size_t { 0 }, interner::get().stats().size);
            expect(a == std::string_view { "intern-test-clear" });
            const auto b = intern("intern-test-clear");
            expect(a == b);
            expect(!a.same_storage(b));
        };
        "ordering"_test = [] {
            expect(intern("a") < intern("b"));
            test_same(std::string { "abc" }, fmt::format("{}", intern("abc")));
        };
    };
};
