/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_MUTEX_HPP
#define ERRATA_MUTEX_HPP

#include <cstddef>
#include <mutex>
#include <new>
#include <shared_mutex>

namespace errata::mutex {
    // keeps frequently written process-wide state such as the id counter and the interner lock on separate cache lines
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Winterference-size"
#   endif
#endif
#   ifdef __cpp_lib_hardware_interference_size
        static constexpr size_t padding = std::hardware_destructive_interference_size;
#   else
        static constexpr size_t padding = 64;
#   endif
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

    // exclusive access for rarely contended state such as the last logged error
    using scoped_lock = std::scoped_lock<std::mutex>;
    using unique_lock = std::unique_lock<std::mutex>;

    // the interner pool is read far more often than it is written
    using shared_mutex = std::shared_mutex;
    using read_lock = std::shared_lock<shared_mutex>;
    using write_lock = std::unique_lock<shared_mutex>;
}

#endif // !ERRATA_MUTEX_HPP
