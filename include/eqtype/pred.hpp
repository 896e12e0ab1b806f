#ifndef EQTYPE_PRED_HPP
#define EQTYPE_PRED_HPP

// Boolean predicates built from the canonical equality.
//
// Each builder returns a constexpr callable T -> bool, read as a finite set:
//   pred1(a)        {a}
//   pred2(a1, a2)   {a1, a2}             (pred3, pred4 likewise)
//   predU1(a, p)    {a} U p
//   predC1(a)       complement of {a}
//   predD1(p, a)    p \ {a}

#include <utility>

#include <eqtype/eq.hpp>

namespace eqtype {

// --- Generic set operations on predicates ---

template <typename P> constexpr auto predC(P p) {
    return [p](const auto& x) -> bool { return !p(x); };
}

template <typename P, typename Q> constexpr auto predU(P p, Q q) {
    return [p, q](const auto& x) -> bool { return p(x) || q(x); };
}

template <typename P, typename Q> constexpr auto predI(P p, Q q) {
    return [p, q](const auto& x) -> bool { return p(x) && q(x); };
}

// Product predicate on pairs: (x1, x2) in p1 X p2
template <typename P1, typename P2> constexpr auto predX(P1 p1, P2 p2) {
    return [p1, p2](const auto& u) -> bool {
        return p1(u.first) && p2(u.second);
    };
}

// --- Finite sets ---

template <EqType T> constexpr auto pred1(T a) {
    return [a = std::move(a)](const T& x) { return eq_op(x, a); };
}

template <EqType T> constexpr auto pred2(T a1, T a2) {
    return [a1 = std::move(a1), a2 = std::move(a2)](const T& x) {
        return eq_op(x, a1) || eq_op(x, a2);
    };
}

template <EqType T> constexpr auto pred3(T a1, T a2, T a3) {
    return [a1 = std::move(a1), a2 = std::move(a2),
            a3 = std::move(a3)](const T& x) {
        return eq_op(x, a1) || eq_op(x, a2) || eq_op(x, a3);
    };
}

template <EqType T> constexpr auto pred4(T a1, T a2, T a3, T a4) {
    return [a1 = std::move(a1), a2 = std::move(a2), a3 = std::move(a3),
            a4 = std::move(a4)](const T& x) {
        return eq_op(x, a1) || eq_op(x, a2) || eq_op(x, a3) || eq_op(x, a4);
    };
}

// --- Adding and removing one point ---

template <EqType T, typename P> constexpr auto predU1(T a, P p) {
    return [a = std::move(a), p](const T& x) -> bool {
        return eq_op(x, a) || p(x);
    };
}

template <EqType T> constexpr auto predC1(T a) {
    return [a = std::move(a)](const T& x) { return neq_op(x, a); };
}

template <typename P, EqType T> constexpr auto predD1(P p, T a) {
    return [p, a = std::move(a)](const T& x) -> bool {
        return neq_op(x, a) && p(x);
    };
}

} // namespace eqtype

#endif // EQTYPE_PRED_HPP
