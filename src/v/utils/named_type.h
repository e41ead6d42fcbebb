/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#pragma once
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <type_traits>
#include <utility>

namespace detail {

template<typename T, typename Tag, typename IsArithmetic>
class base_named_type;

/// Strongly typed number. Two named types with different tags never convert
/// into each other implicitly.
template<typename T, typename Tag>
class base_named_type<T, Tag, std::true_type> {
public:
    using type = T;
    constexpr base_named_type() = default;
    constexpr explicit base_named_type(const type& v)
      : _value(v) {}

    friend constexpr bool
    operator==(const base_named_type&, const base_named_type&) noexcept
      = default;
    friend constexpr auto
    operator<=>(const base_named_type&, const base_named_type&) noexcept
      = default;

    friend constexpr bool
    operator==(const base_named_type& lhs, const type& rhs) noexcept {
        return lhs._value == rhs;
    }
    friend constexpr auto
    operator<=>(const base_named_type& lhs, const type& rhs) noexcept {
        return lhs._value <=> rhs;
    }

    constexpr base_named_type& operator++() {
        ++_value;
        return *this;
    }
    constexpr base_named_type operator++(int) {
        auto copy = *this;
        ++_value;
        return copy;
    }
    constexpr base_named_type operator+(const type& val) const {
        return base_named_type(_value + val);
    }
    constexpr base_named_type operator-(const type& val) const {
        return base_named_type(_value - val);
    }

    // explicit getter
    constexpr type operator()() const { return _value; }
    // implicit conversion operator
    constexpr operator type() const { return _value; }

    static constexpr base_named_type min() {
        return base_named_type(std::numeric_limits<type>::min());
    }
    static constexpr base_named_type max() {
        return base_named_type(std::numeric_limits<type>::max());
    }

    friend std::ostream& operator<<(std::ostream& o, const base_named_type& t) {
        fmt::print(o, "{}", t._value);
        return o;
    };

    template<typename H>
    friend H AbslHashValue(H h, const base_named_type& t) {
        return H::combine(std::move(h), t._value);
    }

protected:
    type _value = std::numeric_limits<T>::min();
};

/// Strongly typed wrapper over a non-arithmetic value such as a string.
template<typename T, typename Tag>
class base_named_type<T, Tag, std::false_type> {
public:
    using type = T;

    base_named_type() = default;

    template<typename... Args>
    requires std::constructible_from<T, Args...>
    explicit constexpr base_named_type(Args&&... args)
      : _value(std::forward<Args>(args)...) {}

    friend bool
    operator==(const base_named_type& lhs, const base_named_type& rhs) noexcept
      = default;
    friend auto
    operator<=>(const base_named_type& lhs, const base_named_type& rhs) noexcept {
        if (lhs._value == rhs._value) {
            return std::strong_ordering::equal;
        }
        return lhs._value < rhs._value ? std::strong_ordering::less
                                       : std::strong_ordering::greater;
    }

    // explicit getter
    constexpr const type& operator()() const& { return _value; }
    constexpr type operator()() && { return std::move(_value); }

    friend std::ostream& operator<<(std::ostream& o, const base_named_type& t) {
        fmt::print(o, "{}", t._value);
        return o;
    };

    template<typename H>
    friend H AbslHashValue(H h, const base_named_type& t) {
        return H::combine(std::move(h), std::string_view(t._value));
    }

protected:
    type _value;
};

} // namespace detail

template<typename T, typename Tag>
using named_type = detail::base_named_type<
  T,
  Tag,
  std::conditional_t<std::is_arithmetic_v<T>, std::true_type, std::false_type>>;

namespace std {
template<typename T, typename Tag>
struct hash<named_type<T, Tag>> {
    using type = ::named_type<T, Tag>;
    size_t operator()(const type& x) const { return std::hash<T>()(x()); }
};
} // namespace std

template<typename T, typename Tag, typename IsArithmetic>
struct fmt::formatter<detail::base_named_type<T, Tag, IsArithmetic>>
  : fmt::formatter<T> {
    template<typename FormatContext>
    auto format(
      const ::detail::base_named_type<T, Tag, IsArithmetic>& v,
      FormatContext& ctx) const {
        return fmt::formatter<T>::format(v(), ctx);
    }
};
