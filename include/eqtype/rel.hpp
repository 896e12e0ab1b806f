#ifndef EQTYPE_REL_HPP
#define EQTYPE_REL_HPP

#include <eqtype/eq.hpp>

namespace eqtype {

// Relation of an endofunction's graph: frel(f)(x, y) <=> f(x) == y
template <typename F> constexpr auto frel(F f) {
    return [f](const auto& x, const auto& y) -> bool { return eq_op(f(x), y); };
}

// Points whose k-projection is unchanged by f: k(f(x)) == k(x)
//
// Post-composing k with any h can only grow this set; with h injective the
// set is unchanged.
template <typename F, typename K> constexpr auto invariant(F f, K k) {
    return [f, k](const auto& x) -> bool { return eq_op(k(f(x)), k(x)); };
}

// h . k
template <typename H, typename K> constexpr auto compose(H h, K k) {
    return [h, k](const auto& x) { return h(k(x)); };
}

// --- Pointwise equality on a finite domain ---

template <typename F, typename G, typename R>
constexpr bool eqfun_on(F f, G g, const R& xs) {
    for (const auto& x : xs)
        if (!eq_op(f(x), g(x)))
            return false;
    return true;
}

template <typename Rel1, typename Rel2, typename R>
constexpr bool eqrel_on(Rel1 r, Rel2 s, const R& xs) {
    for (const auto& x : xs)
        for (const auto& y : xs)
            if (static_cast<bool>(r(x, y)) != static_cast<bool>(s(x, y)))
                return false;
    return true;
}

} // namespace eqtype

#endif // EQTYPE_REL_HPP
