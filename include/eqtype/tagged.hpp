#ifndef EQTYPE_TAGGED_HPP
#define EQTYPE_TAGGED_HPP

// Dependent pairs {i : I & F<i>} over a closed set of indices.
//
// Usage:
//   template <auto I>
//   using shape_payload = std::conditional_t<I == 0, int, std::string>;
//   using Shape = Tagged<shape_payload, 0, 1>;
//
//   constexpr auto s = Shape::make<0>(3);   // tag 0, payload int
//   tag(s) == 0; tagged<0>(s) == 3
//
// The payload is stored positionally, so a value's tag and payload type can
// never disagree.

#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>

#include <eqtype/composite.hpp>
#include <eqtype/eq.hpp>

namespace eqtype {

template <template <auto> class F, auto... Is> class Tagged {
    static_assert(sizeof...(Is) > 0, "Tagged: empty index set");

  public:
    using index_type = std::common_type_t<decltype(Is)...>;
    using storage_type = std::variant<F<Is>...>;

    static_assert(EqType<index_type>,
                  "Tagged: the index type has no canonical equality");

    static constexpr index_type indices[sizeof...(Is)] = {
        static_cast<index_type>(Is)...};

    // Position of index i in the declared set; fails to compile in constant
    // evaluation when i is not declared.
    static constexpr std::size_t position_of(const index_type& i) {
        for (std::size_t k = 0; k < sizeof...(Is); ++k)
            if (eq_op(indices[k], i))
                return k;
        throw "Tagged: index outside the declared index set";
    }

    template <index_type I> using payload_type = F<I>;

    template <index_type I> static constexpr Tagged make(F<I> x) {
        static_assert(indices_distinct(), "Tagged: duplicate index");
        constexpr std::size_t pos = position_of(I);
        return Tagged(storage_type(std::in_place_index<pos>, std::move(x)));
    }

    constexpr index_type tag() const { return indices[payload_.index()]; }

    template <index_type I> constexpr const F<I>& tagged() const {
        constexpr std::size_t pos = position_of(I);
        if (payload_.index() != pos)
            throw "Tagged: payload requested at another index";
        return std::get<pos>(payload_);
    }

    constexpr const storage_type& payload() const { return payload_; }

  private:
    constexpr explicit Tagged(storage_type p) : payload_(std::move(p)) {}

    static consteval bool indices_distinct() {
        for (std::size_t a = 0; a < sizeof...(Is); ++a)
            for (std::size_t b = a + 1; b < sizeof...(Is); ++b)
                if (eq_op(indices[a], indices[b]))
                    return false;
        return true;
    }

    storage_type payload_;
};

template <template <auto> class F, auto... Is>
constexpr auto tag(const Tagged<F, Is...>& u) {
    return u.tag();
}

template <auto I, template <auto> class F, auto... Is>
constexpr decltype(auto) tagged(const Tagged<F, Is...>& u) {
    return u.template tagged<I>();
}

// v's payload moved to u's index. When the tags differ there is nothing to
// transport and u is returned unchanged.
template <template <auto> class F, auto... Is>
constexpr Tagged<F, Is...> tagged_as(const Tagged<F, Is...>& u,
                                     const Tagged<F, Is...>& v) {
    if (eq_op(u.tag(), v.tag()))
        return v;
    return u;
}

// Equal tags first, then payloads at the common index.
template <template <auto> class F, auto... Is>
constexpr bool tag_eq(const Tagged<F, Is...>& u, const Tagged<F, Is...>& v) {
    if (!eq_op(u.tag(), v.tag()))
        return false;
    return sum_eq(u.payload(), tagged_as(u, v).payload());
}

template <template <auto> class F, auto... Is>
    requires(EqType<F<Is>> && ...)
struct eq_instance<Tagged<F, Is...>> {
    static constexpr auto mixin =
        make_eq_mixin<Tagged<F, Is...>>(&tag_eq<F, Is...>);
};

} // namespace eqtype

#endif // EQTYPE_TAGGED_HPP
