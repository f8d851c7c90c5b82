/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_INTERN_HPP
#define ERRATA_INTERN_HPP

#include <atomic>
#include <compare>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <errata/format.hpp>
#include <errata/mutex.hpp>

namespace errata {
    // Immutable text shared by all of its holders
    struct istring {
        istring() =default;

        explicit istring(std::shared_ptr<const std::string> ptr): _ptr { std::move(ptr) }
        {
        }

        [[nodiscard]] std::string_view view() const noexcept
        {
            if (_ptr)
                return *_ptr;
            return {};
        }

        operator std::string_view() const noexcept
        {
            return view();
        }

        [[nodiscard]] std::string str() const
        {
            return std::string { view() };
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return view().empty();
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return view().size();
        }

        // true when both values point to the same canonical allocation
        [[nodiscard]] bool same_storage(const istring &o) const noexcept
        {
            return _ptr == o._ptr;
        }

        [[nodiscard]] long use_count() const noexcept
        {
            return _ptr.use_count();
        }

        bool operator==(const istring &o) const noexcept
        {
            return view() == o.view();
        }

        bool operator==(const std::string_view o) const noexcept
        {
            return view() == o;
        }

        std::strong_ordering operator<=>(const istring &o) const noexcept
        {
            return view() <=> o.view();
        }
    private:
        std::shared_ptr<const std::string> _ptr {};
    };

    struct interner {
        struct stats_type {
            size_t hits = 0;
            size_t misses = 0;
            size_t size = 0;
        };

        static interner &get();

        istring intern(std::string_view s);
        stats_type stats() const;
        // Forgets all canonical values. Already issued istrings stay valid.
        void clear();
    private:
        alignas(mutex::padding) mutable mutex::shared_mutex _mutex {};
        std::unordered_map<std::string_view, std::shared_ptr<const std::string>> _pool {};
        std::atomic<size_t> _hits { 0 };
        std::atomic<size_t> _misses { 0 };
    };

    inline istring intern(const std::string_view s)
    {
        return interner::get().intern(s);
    }
}

namespace fmt {
    template<>
    struct formatter<errata::istring>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const errata::istring &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(v.view(), ctx);
        }
    };
}

#endif // !ERRATA_INTERN_HPP
