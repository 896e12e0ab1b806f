#ifndef SUBTYPE_SUBTYPE_HPP
#define SUBTYPE_SUBTYPE_HPP

// Subtypes: a type S isomorphic to {x : B | pred(x)}.
//
// A subtype joins the framework by specialising sub_type_instance:
//
//   template <> struct subtype::sub_type_instance<EvenNat> {
//       using base_type = unsigned;
//       static constexpr bool pred(const unsigned& x) { return x % 2 == 0; }
//       static constexpr const unsigned& val(const EvenNat& u);
//       static constexpr EvenNat build(unsigned x);   // assumes pred(x)
//   };
//
// build() is the raw isomorphism and does not check pred. Client code goes
// through sub() / insub() / insubd() / innew() instead, so every value of S
// is the image of a base value satisfying pred, and val() is injective.

#include <concepts>
#include <optional>
#include <utility>

namespace subtype {

template <typename S> struct sub_type_instance;

template <typename S>
concept SubType = requires(
    const S& u, const typename sub_type_instance<S>::base_type& x) {
    { sub_type_instance<S>::pred(x) } -> std::convertible_to<bool>;
    { sub_type_instance<S>::val(u) }
        -> std::convertible_to<typename sub_type_instance<S>::base_type>;
    { sub_type_instance<S>::build(x) } -> std::same_as<S>;
};

// Subtypes whose predicate is trivially true (pure wrappers)
template <typename S>
concept NewTypeLike = SubType<S> && requires {
    requires sub_type_instance<S>::is_new_type;
};

template <SubType S> using base_t = typename sub_type_instance<S>::base_type;

// --- Projection ---

template <SubType S> constexpr decltype(auto) val(const S& u) {
    return sub_type_instance<S>::val(u);
}

template <SubType S> constexpr bool sub_pred(const base_t<S>& x) {
    return static_cast<bool>(sub_type_instance<S>::pred(x));
}

// --- Construction ---

// x must satisfy the predicate. Violating this is a programming error: it
// throws, which is a hard compile error under constant evaluation.
template <SubType S> constexpr S sub(base_t<S> x) {
    if (!sub_pred<S>(x))
        throw "sub: value does not satisfy the subtype predicate";
    return sub_type_instance<S>::build(std::move(x));
}

// The value of S wrapping x, or nullopt when x fails the predicate.
template <SubType S> constexpr std::optional<S> insub(base_t<S> x) {
    if (!sub_pred<S>(x))
        return std::nullopt;
    return sub_type_instance<S>::build(std::move(x));
}

// insub() with no detour through a general decision procedure. Predicates
// here are already boolean functions, so the two coincide.
template <SubType S> constexpr std::optional<S> insub_eq(base_t<S> x) {
    return insub<S>(std::move(x));
}

// insub() falling back to `def`
template <SubType S> constexpr S insubd(const S& def, base_t<S> x) {
    if (auto u = insub<S>(std::move(x)))
        return *std::move(u);
    return def;
}

template <NewTypeLike S> constexpr S innew(base_t<S> x) {
    return sub_type_instance<S>::build(std::move(x));
}

} // namespace subtype

#endif // SUBTYPE_SUBTYPE_HPP
