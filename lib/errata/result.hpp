/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef ERRATA_RESULT_HPP
#define ERRATA_RESULT_HPP

#include <source_location>
#include <type_traits>
#include <variant>
#include <errata/lift.hpp>

namespace errata {
    // Either a value or a failure of type E. The context adapters lift a failure into errata::error
    // and pass a value through unchanged.
    template<typename T, typename E=errata::error>
    struct result {
        static_assert(!std::is_same_v<T, errata::error>, "an error can't be a result value");
        using value_type = T;
        using error_type = E;

        static result from_value(T val)
        {
            return result { std::in_place_index<0>, std::move(val) };
        }

        static result from_error(E err)
        {
            return result { std::in_place_index<1>, std::move(err) };
        }

        result(T val) requires (!std::is_same_v<T, E>): _val { std::in_place_index<0>, std::move(val) }
        {
        }

        result(E err) requires (!std::is_same_v<T, E>): _val { std::in_place_index<1>, std::move(err) }
        {
        }

        [[nodiscard]] bool ok() const noexcept
        {
            return _val.index() == 0;
        }

        explicit operator bool() const noexcept
        {
            return ok();
        }

        // throws the lifted failure when there is no value
        const T &value() const &
        {
            if (!ok())
                throw lift(std::get<1>(_val));
            return std::get<0>(_val);
        }

        T &value() &
        {
            if (!ok())
                throw lift(std::get<1>(_val));
            return std::get<0>(_val);
        }

        T value() &&
        {
            if (!ok())
                throw lift(std::move(std::get<1>(_val)));
            return std::move(std::get<0>(_val));
        }

        const E &error() const
        {
            if (ok())
                throw errata::error { kind::internal { "the result holds a value, not an error", "errata" } };
            return std::get<1>(_val);
        }

        result<T, errata::error> context(const std::string_view msg, const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(*this)._map([&](errata::error &&err) {
                return std::move(err).context(msg, loc);
            }, loc);
        }

        result<T, errata::error> with_suggestion(const std::string_view text, const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(*this)._map([&](errata::error &&err) {
                return std::move(err).with_suggestion(text);
            }, loc);
        }

        template<typename P>
        result<T, errata::error> with_payload(P &&payload, const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(*this)._map([&](errata::error &&err) {
                return std::move(err).with_payload(std::forward<P>(payload));
            }, loc);
        }

        result<T, errata::error> with_priority(const uint8_t priority, const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(*this)._map([&](errata::error &&err) {
                return std::move(err).with_priority(priority);
            }, loc);
        }

        result<T, errata::error> meta(const std::string_view key, const std::string_view val, const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(*this)._map([&](errata::error &&err) {
                return std::move(err).with_metadata(key, val);
            }, loc);
        }
    private:
        template<typename, typename>
        friend struct result;

        std::variant<T, E> _val;

        template<size_t I, typename V>
        result(std::in_place_index_t<I> idx, V &&v): _val { idx, std::forward<V>(v) }
        {
        }

        // a failure is lifted with the call-site location and the mutation is applied to it
        template<typename F>
        result<T, errata::error> _map(const F &f, const std::source_location &loc) &&
        {
            if (ok())
                return result<T, errata::error>::from_value(std::move(std::get<0>(_val)));
            if constexpr (std::is_same_v<E, errata::error>) {
                return result<T, errata::error>::from_error(f(std::move(std::get<1>(_val))));
            } else if constexpr (std::is_convertible_v<E, std::string_view>) {
                return result<T, errata::error>::from_error(f(lift(std::string_view { std::get<1>(_val) }, loc)));
            } else {
                return result<T, errata::error>::from_error(f(lift(std::move(std::get<1>(_val)), loc)));
            }
        }
    };

    // runs f and captures any failure as an errata::error
    template<typename F>
    auto attempt(F &&f, const std::source_location &loc=std::source_location::current())
    {
        using value_type = std::invoke_result_t<F>;
        if constexpr (std::is_void_v<value_type>) {
            using res_type = result<std::monostate>;
            try {
                f();
                return res_type::from_value(std::monostate {});
            } catch (...) {
                return res_type::from_error(lift_current(loc));
            }
        } else {
            using res_type = result<value_type>;
            try {
                return res_type::from_value(f());
            } catch (...) {
                return res_type::from_error(lift_current(loc));
            }
        }
    }
}

#endif // !ERRATA_RESULT_HPP
