/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <errata/intern.hpp>
#include <errata/lazy.hpp>
#include <errata/logger.hpp>

namespace errata {
    static once<interner> interner_instance {};

    interner &interner::get()
    {
        return interner_instance.get_or_init([] { return interner {}; });
    }

    istring interner::intern(const std::string_view s)
    {
        if (s.empty())
            return {};
        {
            mutex::read_lock lk { _mutex };
            if (const auto it = _pool.find(s); it != _pool.end()) {
                _hits.fetch_add(1, std::memory_order_relaxed);
                return istring { it->second };
            }
        }
        mutex::write_lock lk { _mutex };
        // another writer may have inserted the same text between the two locks
        if (const auto it = _pool.find(s); it != _pool.end()) {
            _hits.fetch_add(1, std::memory_order_relaxed);
            return istring { it->second };
        }
        auto ptr = std::make_shared<const std::string>(s);
        _pool.emplace(std::string_view { *ptr }, ptr);
        _misses.fetch_add(1, std::memory_order_relaxed);
        return istring { std::move(ptr) };
    }

    interner::stats_type interner::stats() const
    {
        mutex::read_lock lk { _mutex };
        return { _hits.load(std::memory_order_relaxed), _misses.load(std::memory_order_relaxed), _pool.size() };
    }

    void interner::clear()
    {
        mutex::write_lock lk { _mutex };
        logger::trace("interner clear: {} entries, {} hits, {} misses", _pool.size(),
            _hits.load(std::memory_order_relaxed), _misses.load(std::memory_order_relaxed));
        _pool.clear();
    }
}
