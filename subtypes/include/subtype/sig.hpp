#ifndef SUBTYPE_SIG_HPP
#define SUBTYPE_SIG_HPP

// Ready-made subtypes.
//
//   Sig<B, P>        {x : B | P(x)}; P is a stateless callable or a function
//                    pointer passed as a template argument
//   NewType<B, Tag>  B rewrapped under a new name; the predicate is true
//
//   constexpr bool is_even(unsigned x) { return x % 2 == 0; }
//   using Even = Sig<unsigned, &is_even>;
//   constexpr auto four = insub<Even>(4u);   // holds 4
//   constexpr auto five = insub<Even>(5u);   // nullopt

#include <utility>

#include <subtype/subtype.hpp>

namespace subtype {

template <typename B, auto P> class Sig {
  public:
    using base_type = B;

    constexpr const B& val() const { return value_; }

    friend constexpr bool operator==(const Sig&, const Sig&) = default;

  private:
    friend struct sub_type_instance<Sig>;
    constexpr explicit Sig(B x) : value_(std::move(x)) {}

    B value_;
};

template <typename B, auto P> struct sub_type_instance<Sig<B, P>> {
    using base_type = B;

    static constexpr bool pred(const B& x) { return static_cast<bool>(P(x)); }
    static constexpr const B& val(const Sig<B, P>& u) { return u.value_; }
    static constexpr Sig<B, P> build(B x) { return Sig<B, P>(std::move(x)); }
};

template <typename B, typename Tag> class NewType {
  public:
    using base_type = B;

    constexpr const B& val() const { return value_; }

    friend constexpr bool operator==(const NewType&, const NewType&) = default;

  private:
    friend struct sub_type_instance<NewType>;
    constexpr explicit NewType(B x) : value_(std::move(x)) {}

    B value_;
};

template <typename B, typename Tag> struct sub_type_instance<NewType<B, Tag>> {
    using base_type = B;
    static constexpr bool is_new_type = true;

    static constexpr bool pred(const B&) { return true; }
    static constexpr const B& val(const NewType<B, Tag>& u) {
        return u.value_;
    }
    static constexpr NewType<B, Tag> build(B x) {
        return NewType<B, Tag>(std::move(x));
    }
};

} // namespace subtype

#endif // SUBTYPE_SIG_HPP
