#ifndef EQTYPE_LAWS_HPP
#define EQTYPE_LAWS_HPP

// Law checkers over finite samples.
//
// The correctness of an equality (it decides x = y) and the preconditions of
// the derived constructors (injectivity, cancellation) cannot be proven by
// the compiler. These checkers state them as properties of a sample range so
// they can be verified with static_assert or at run time.

#include <functional>
#include <optional>

#include <eqtype/composite.hpp>
#include <eqtype/eq.hpp>

namespace eqtype {

// --- Equivalence ---

template <typename Op, typename R>
constexpr bool reflexive_on(Op op, const R& xs) {
    for (const auto& x : xs)
        if (!op(x, x))
            return false;
    return true;
}

template <typename Op, typename R>
constexpr bool symmetric_on(Op op, const R& xs) {
    for (const auto& x : xs)
        for (const auto& y : xs)
            if (static_cast<bool>(op(x, y)) != static_cast<bool>(op(y, x)))
                return false;
    return true;
}

template <typename Op, typename R>
constexpr bool transitive_on(Op op, const R& xs) {
    for (const auto& x : xs)
        for (const auto& y : xs)
            for (const auto& z : xs)
                if (op(x, y) && op(y, z) && !op(x, z))
                    return false;
    return true;
}

// op agrees with `same`, the notion of identity of the samples (built-in ==
// by default).
template <typename Op, typename R, typename Same = std::equal_to<>>
constexpr bool decides_equality_on(Op op, const R& xs, Same same = {}) {
    for (const auto& x : xs)
        for (const auto& y : xs)
            if (static_cast<bool>(op(x, y)) != static_cast<bool>(same(x, y)))
                return false;
    return true;
}

// All of the above for the canonical equality, plus neq_op being its
// negation.
template <typename R> constexpr bool eq_laws_on(const R& xs) {
    auto op = [](const auto& x, const auto& y) { return eq_op(x, y); };
    for (const auto& x : xs)
        for (const auto& y : xs)
            if (neq_op(x, y) == eq_op(x, y))
                return false;
    return reflexive_on(op, xs) && symmetric_on(op, xs)
        && transitive_on(op, xs);
}

// --- Preconditions of the derived constructors ---

template <typename F, typename R> constexpr bool injective_on(F f, const R& xs) {
    for (const auto& x : xs)
        for (const auto& y : xs)
            if (eq_op(f(x), f(y)) && !eq_op(x, y))
                return false;
    return true;
}

// g(f(x)) == x
template <typename F, typename G, typename R>
constexpr bool cancel_on(F f, G g, const R& xs) {
    for (const auto& x : xs)
        if (!eq_op(g(f(x)), x))
            return false;
    return true;
}

// g(f(x)) == Some(x)
template <typename F, typename G, typename R>
constexpr bool pcancel_on(F f, G g, const R& xs) {
    for (const auto& x : xs) {
        auto back = g(f(x));
        if (!eq_op(back, decltype(back)(x)))
            return false;
    }
    return true;
}

} // namespace eqtype

#endif // EQTYPE_LAWS_HPP
