#ifndef EQTYPE_COMPOSITE_HPP
#define EQTYPE_COMPOSITE_HPP

// Structural equality for products, sums and options, synthesised from the
// canonical equality of their components.

#include <cstddef>
#include <optional>
#include <tuple>
#include <utility>
#include <variant>

#include <eqtype/eq.hpp>
#include <eqtype/instances.hpp>

namespace eqtype {

// --- Product ---

template <typename T1, typename T2>
constexpr bool pair_eq(const std::pair<T1, T2>& u,
                       const std::pair<T1, T2>& v) {
    return eq_op(u.first, v.first) && eq_op(u.second, v.second);
}

// Component-wise consequences of u == v
template <typename T1, typename T2>
constexpr bool pair_eq1(const std::pair<T1, T2>& u,
                        const std::pair<T1, T2>& v) {
    return eq_op(u.first, v.first);
}

template <typename T1, typename T2>
constexpr bool pair_eq2(const std::pair<T1, T2>& u,
                        const std::pair<T1, T2>& v) {
    return eq_op(u.second, v.second);
}

template <EqType T1, EqType T2> struct eq_instance<std::pair<T1, T2>> {
    static constexpr auto mixin =
        make_eq_mixin<std::pair<T1, T2>>(&pair_eq<T1, T2>);
};

// n-ary product; the empty tuple is another unit type
template <typename... Ts>
constexpr bool tuple_eq(const std::tuple<Ts...>& u,
                        const std::tuple<Ts...>& v) {
    return [&]<std::size_t... Is>(std::index_sequence<Is...>) {
        return (eq_op(std::get<Is>(u), std::get<Is>(v)) && ...);
    }(std::index_sequence_for<Ts...>{});
}

template <EqType... Ts> struct eq_instance<std::tuple<Ts...>> {
    static constexpr auto mixin =
        make_eq_mixin<std::tuple<Ts...>>(&tuple_eq<Ts...>);
};

// --- Sum ---
//
// Alternatives are told apart by position, not by type, so a sum of two
// identical payload types keeps its sides distinct.

template <typename A, typename B> using sum = std::variant<A, B>;

template <typename A, typename B> constexpr sum<A, B> inl(A a) {
    return sum<A, B>(std::in_place_index<0>, std::move(a));
}

template <typename A, typename B> constexpr sum<A, B> inr(B b) {
    return sum<A, B>(std::in_place_index<1>, std::move(b));
}

template <typename... Ts>
constexpr bool sum_eq(const std::variant<Ts...>& u,
                      const std::variant<Ts...>& v) {
    if (u.index() != v.index())
        return false;
    if (u.valueless_by_exception())
        return true;
    return [&]<std::size_t... Is>(std::index_sequence<Is...>) {
        bool result = false;
        ((u.index() == Is
          && (result = eq_op(std::get<Is>(u), std::get<Is>(v)), true))
         || ...);
        return result;
    }(std::index_sequence_for<Ts...>{});
}

template <EqType... Ts> struct eq_instance<std::variant<Ts...>> {
    static constexpr auto mixin =
        make_eq_mixin<std::variant<Ts...>>(&sum_eq<Ts...>);
};

// --- Option ---

template <typename T>
constexpr bool opt_eq(const std::optional<T>& u, const std::optional<T>& v) {
    if (u.has_value() != v.has_value())
        return false;
    return !u.has_value() || eq_op(*u, *v);
}

template <EqType T> struct eq_instance<std::optional<T>> {
    static constexpr auto mixin = make_eq_mixin<std::optional<T>>(&opt_eq<T>);
};

} // namespace eqtype

#endif // EQTYPE_COMPOSITE_HPP
