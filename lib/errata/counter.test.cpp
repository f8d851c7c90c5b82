/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <set>
#include <thread>
#include <vector>
#include <errata/counter.hpp>
#include <errata/mutex.hpp>
#include <errata/test.hpp>

using namespace errata;

suite counter_suite = [] {
    "counter"_test = [] {
        "monotonic"_test = [] {
            const auto a = counter::next_id();
            const auto b = counter::next_id();
            expect(a > 0);
            expect(b > a);
            expect(counter::current_count() >= b);
        };
        "unique across threads"_test = [] {
            static constexpr size_t num_threads = 4;
            static constexpr size_t num_ids = 1000;
            std::set<uint64_t> ids {};
            mutex::unique_lock::mutex_type ids_mutex {};
            {
                std::vector<std::thread> threads {};
                for (size_t i = 0; i < num_threads; ++i) {
                    threads.emplace_back([&] {
                        std::vector<uint64_t> local {};
                        for (size_t j = 0; j < num_ids; ++j)
                            local.emplace_back(counter::next_id());
                        mutex::scoped_lock lk { ids_mutex };
                        ids.insert(local.begin(), local.end());
                    });
                }
                for (auto &t: threads)
                    t.join();
            }
            test_same(num_threads * num_ids, ids.size());
        };
    };
};
