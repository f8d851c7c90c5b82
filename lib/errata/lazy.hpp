/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_LAZY_HPP
#define ERRATA_LAZY_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <thread>

namespace errata {
    // One-time initialization of process-wide state.
    // Exactly one factory invocation succeeds; concurrent first callers spin until the winner finishes.
    // A factory that throws leaves the value uninitialized so that a later call can retry.
    template<typename T>
    struct once {
        constexpr once() noexcept
        {
        }

        once(const once &) =delete;
        once &operator=(const once &) =delete;

        ~once()
        {
            if (_state.load(std::memory_order_acquire) == state::ready)
                _ptr()->~T();
        }

        template<typename F>
        T &get_or_init(const F &factory)
        {
            if (_state.load(std::memory_order_acquire) == state::ready) [[likely]]
                return *_ptr();
            for (;;) {
                auto expected = state::empty;
                if (_state.compare_exchange_strong(expected, state::running, std::memory_order_acq_rel)) {
                    try {
                        ::new (static_cast<void *>(_storage)) T(factory());
                    } catch (...) {
                        _state.store(state::empty, std::memory_order_release);
                        throw;
                    }
                    _state.store(state::ready, std::memory_order_release);
                    return *_ptr();
                }
                if (expected == state::ready)
                    return *_ptr();
                std::this_thread::yield();
            }
        }

        T *get() noexcept
        {
            if (_state.load(std::memory_order_acquire) == state::ready)
                return _ptr();
            return nullptr;
        }

        const T *get() const noexcept
        {
            if (_state.load(std::memory_order_acquire) == state::ready)
                return _ptr();
            return nullptr;
        }
    private:
        enum class state: uint8_t {
            empty, running, ready
        };

        std::atomic<state> _state { state::empty };
        alignas(T) std::byte _storage[sizeof(T)];

        T *_ptr() noexcept
        {
            return std::launder(reinterpret_cast<T *>(_storage));
        }

        const T *_ptr() const noexcept
        {
            return std::launder(reinterpret_cast<const T *>(_storage));
        }
    };
}

#endif // !ERRATA_LAZY_HPP
