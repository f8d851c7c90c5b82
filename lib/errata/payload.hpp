/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_PAYLOAD_HPP
#define ERRATA_PAYLOAD_HPP

#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace errata {
    // A shared immutable value of an arbitrary type tagged with its runtime type id
    struct payload {
        template<typename T>
        static payload make(T &&val)
        {
            using value_type = std::decay_t<T>;
            return payload { std::make_shared<const value_type>(std::forward<T>(val)), typeid(value_type) };
        }

        template<typename T>
        [[nodiscard]] const T *get() const noexcept
        {
            if (_type != typeid(T))
                return nullptr;
            return static_cast<const T *>(_ptr.get());
        }

        [[nodiscard]] std::type_index type() const noexcept
        {
            return _type;
        }

        [[nodiscard]] const char *type_name() const noexcept
        {
            return _type.name();
        }

        [[nodiscard]] long use_count() const noexcept
        {
            return _ptr.use_count();
        }
    private:
        std::shared_ptr<const void> _ptr;
        std::type_index _type;

        payload(std::shared_ptr<const void> ptr, const std::type_info &type): _ptr { std::move(ptr) }, _type { type }
        {
        }
    };
}

#endif // !ERRATA_PAYLOAD_HPP
