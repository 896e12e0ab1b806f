#ifndef SUBTYPE_SUB_LAWS_HPP
#define SUBTYPE_SUB_LAWS_HPP

// Subtype laws over finite samples.
//
// `same` is the notion of identity on S used as ground truth; it defaults to
// the built-in operator==, which Sig and NewType define structurally.

#include <functional>
#include <type_traits>

#include <eqtype/eq.hpp>
#include <eqtype/instances.hpp>
#include <subtype/subtype.hpp>

namespace subtype {

// val(u) == val(v) implies u == v
template <typename R, typename Same = std::equal_to<>>
constexpr bool val_inj_on(const R& us, Same same = {}) {
    for (const auto& u : us)
        for (const auto& v : us)
            if (eqtype::eq_op(val(u), val(v)) && !same(u, v))
                return false;
    return true;
}

// insub(val(u)) == Some(u)
template <typename R, typename Same = std::equal_to<>>
constexpr bool valK_on(const R& us, Same same = {}) {
    for (const auto& u : us) {
        using S = std::remove_cvref_t<decltype(u)>;
        auto back = insub<S>(val(u));
        if (!back || !same(*back, u))
            return false;
    }
    return true;
}

// sub(val(u)) == u
template <typename R, typename Same = std::equal_to<>>
constexpr bool subK_on(const R& us, Same same = {}) {
    for (const auto& u : us) {
        using S = std::remove_cvref_t<decltype(u)>;
        if (!same(sub<S>(val(u)), u))
            return false;
    }
    return true;
}

// insub(x) holds a value exactly when pred(x), and that value projects back
// to x.
template <SubType S, typename R> constexpr bool insub_correct_on(const R& xs) {
    for (const auto& x : xs) {
        auto u = insub<S>(x);
        if (u.has_value() != sub_pred<S>(x))
            return false;
        if (u && !eqtype::eq_op(base_t<S>(val(*u)), base_t<S>(x)))
            return false;
    }
    return true;
}

// val(insubd(def, x)) is x when pred(x) and val(def) otherwise.
template <SubType S, typename R>
constexpr bool val_insubd_on(const S& def, const R& xs) {
    for (const auto& x : xs) {
        const base_t<S> expected = sub_pred<S>(x) ? base_t<S>(x)
                                                  : base_t<S>(val(def));
        if (!eqtype::eq_op(base_t<S>(val(insubd(def, x))), expected))
            return false;
    }
    return true;
}

} // namespace subtype

#endif // SUBTYPE_SUB_LAWS_HPP
