#ifndef EQTYPE_INSTANCES_HPP
#define EQTYPE_INSTANCES_HPP

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <eqtype/derive.hpp>
#include <eqtype/eq.hpp>

namespace eqtype {

// --- Unit ---

constexpr bool unit_eq(std::monostate, std::monostate) { return true; }

template <> struct eq_instance<std::monostate> {
    static constexpr auto mixin = make_eq_mixin<std::monostate>(&unit_eq);
};

// --- Bool ---

constexpr bool addb(bool x, bool y) { return x != y; }
constexpr bool eqb(bool x, bool y) { return !addb(x, y); }

template <> struct eq_instance<bool> {
    static constexpr auto mixin = make_eq_mixin<bool>(&eqb);
};

// --- Integers, characters and enumerations ---
//
// Built-in == is structural on these. Floating point is left out on purpose:
// NaN is not equal to itself.

template <typename T>
    requires((std::integral<T> && !std::same_as<T, bool>) || std::is_enum_v<T>)
struct eq_instance<T> {
    static constexpr auto mixin = comparable_mixin<T>();
};

// --- Strings ---

template <typename C, typename Tr, typename A>
struct eq_instance<std::basic_string<C, Tr, A>> {
    static constexpr auto mixin =
        comparable_mixin<std::basic_string<C, Tr, A>>();
};

template <typename C, typename Tr>
struct eq_instance<std::basic_string_view<C, Tr>> {
    static constexpr auto mixin =
        comparable_mixin<std::basic_string_view<C, Tr>>();
};

} // namespace eqtype

#endif // EQTYPE_INSTANCES_HPP
