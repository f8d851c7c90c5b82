/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_COUNTER_HPP
#define ERRATA_COUNTER_HPP

#include <cstdint>

namespace errata::counter {
    // ids start at 1, are unique and increase monotonically but are not gap-free across threads
    extern uint64_t next_id();
    extern uint64_t current_count();
}

#endif // !ERRATA_COUNTER_HPP
