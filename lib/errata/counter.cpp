/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <atomic>
#include <errata/counter.hpp>
#include <errata/mutex.hpp>

namespace errata::counter {
    alignas(mutex::padding) static std::atomic<uint64_t> instances { 0 };

    uint64_t next_id()
    {
        return instances.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    uint64_t current_count()
    {
        return instances.load(std::memory_order_relaxed);
    }
}
