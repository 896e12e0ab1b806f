#ifndef EQTYPE_DERIVE_HPP
#define EQTYPE_DERIVE_HPP

// Derived equality: build an EqMixin for a new type from data that already
// lives in the framework, without restating a decision procedure.
//
// None of these is registered anywhere. A type opts in explicitly:
//
//   template <> struct eqtype::eq_instance<Celsius> {
//       static constexpr auto mixin =
//           eqtype::can_eq_mixin<Celsius>(to_kelvin, from_kelvin);
//   };

#include <functional>
#include <optional>
#include <type_traits>

#include <eqtype/eq.hpp>

namespace eqtype {

// --- From generic decidability ---
//
// `decide` is a total decision procedure for equality on T. The default uses
// the built-in operator==, which is only correct when == is structural.
template <typename T, typename Decide = std::equal_to<>>
constexpr auto comparable_mixin(Decide decide = {}) {
    static_assert(std::is_invocable_r_v<bool, Decide&, const T&, const T&>,
                  "comparable_mixin: decide must be (T, T) -> bool");
    return make_eq_mixin<T>(decide);
}

// --- From an injective map ---
//
// f : T -> U with U an EqType. Precondition: f is injective.
template <typename T, typename F> constexpr auto inj_eq_mixin(F f) {
    using U = std::remove_cvref_t<std::invoke_result_t<F&, const T&>>;
    static_assert(EqType<U>,
                  "inj_eq_mixin: the codomain has no canonical equality");
    return make_eq_mixin<T>(comparing<T>(f));
}

// --- From a partial left inverse ---
//
// f : T -> U, g : U -> optional<T> with g(f(x)) == x for every x. This makes
// f injective; g itself is never evaluated.
template <typename T, typename F, typename G>
constexpr auto pcan_eq_mixin(F f, [[maybe_unused]] G g) {
    using U = std::remove_cvref_t<std::invoke_result_t<F&, const T&>>;
    static_assert(
        std::is_same_v<std::remove_cvref_t<std::invoke_result_t<G&, const U&>>,
                       std::optional<T>>,
        "pcan_eq_mixin: g must be U -> std::optional<T>");
    return inj_eq_mixin<T>(f);
}

// --- From a total left inverse ---
//
// f : T -> U, g : U -> T with g(f(x)) == x for every x.
template <typename T, typename F, typename G>
constexpr auto can_eq_mixin(F f, [[maybe_unused]] G g) {
    using U = std::remove_cvref_t<std::invoke_result_t<F&, const T&>>;
    static_assert(
        std::is_same_v<std::remove_cvref_t<std::invoke_result_t<G&, const U&>>,
                       T>,
        "can_eq_mixin: g must be U -> T");
    return inj_eq_mixin<T>(f);
}

} // namespace eqtype

#endif // EQTYPE_DERIVE_HPP
