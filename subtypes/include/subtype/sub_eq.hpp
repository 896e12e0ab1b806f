#ifndef SUBTYPE_SUB_EQ_HPP
#define SUBTYPE_SUB_EQ_HPP

// A subtype inherits the equality of its base type through val(), which is
// injective.
//
// Sig and NewType are registered here. Other subtypes opt in with
//
//   template <>
//   struct eqtype::eq_instance<EvenNat> : subtype::sub_eq_instance<EvenNat> {};

#include <eqtype/derive.hpp>
#include <eqtype/eq.hpp>
#include <eqtype/instances.hpp>
#include <subtype/sig.hpp>
#include <subtype/subtype.hpp>

namespace subtype {

template <SubType S> constexpr auto sub_eq_mixin() {
    static_assert(eqtype::EqType<base_t<S>>,
                  "sub_eq_mixin: the base type has no canonical equality");
    return eqtype::inj_eq_mixin<S>(
        [](const S& u) -> decltype(auto) { return subtype::val(u); });
}

template <SubType S> struct sub_eq_instance {
    static constexpr auto mixin = sub_eq_mixin<S>();
};

} // namespace subtype

namespace eqtype {

template <EqType B, auto P>
struct eq_instance<subtype::Sig<B, P>>
    : subtype::sub_eq_instance<subtype::Sig<B, P>> {};

template <EqType B, typename Tag>
struct eq_instance<subtype::NewType<B, Tag>>
    : subtype::sub_eq_instance<subtype::NewType<B, Tag>> {};

} // namespace eqtype

#endif // SUBTYPE_SUB_EQ_HPP
