/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include <errata/lazy.hpp>
#include <errata/test.hpp>

using namespace errata;

suite lazy_suite = [] {
    "lazy"_test = [] {
        "uninitialized"_test = [] {
            once<int> val {};
            expect(val.get() == nullptr);
            expect(val.get_or_init([] { return 7; }) == 7);
            expect(val.get() != nullptr);
        };
        "single initialization"_test = [] {
            static constexpr size_t num_threads = 8;
            once<std::string> val {};
            std::atomic_size_t num_calls { 0 };
            std::vector<const std::string *> ptrs(num_threads);
            {
                std::vector<std::thread> threads {};
                for (size_t i = 0; i < num_threads; ++i) {
                    threads.emplace_back([&, i] {
                        ptrs[i] = &val.get_or_init([&] {
                            ++num_calls;
                            std::this_thread::sleep_for(std::chrono::milliseconds { 20 });
                            return std::string { "ready" };
                        });
                    });
                }
                for (auto &t: threads)
                    t.join();
            }
            test_same(size_t { 1 }, num_calls.load());
            for (const auto *p: ptrs)
                expect(p == val.get());
            test_same(std::string { "ready" }, *val.get());
        };
        "failed factory"_test = [] {
            once<std::string> val {};
            expect(throws<std::runtime_error>([&] {
                val.get_or_init([]() -> std::string { throw std::runtime_error { "factory failure" }; });
            }));
            expect(val.get() == nullptr);
            test_same(std::string { "second" }, val.get_or_init([] { return std::string { "second" }; }));
        };
    };
};
