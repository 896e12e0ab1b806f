// 02_custom_subtype.cpp — Registering a hand-written subtype and a newtype
//
// Shows: specialising sub_type_instance for a class with its own storage,
//        opting into the inherited equality with sub_eq_instance, and
//        NewType / innew() for a wrapper with no refinement.

#include <iostream>
#include <string>

#include <eqtype/eqtype.hpp>
#include <subtype/subtypes.hpp>

// Percentages stored as basis points; only 0..100 are valid.
class Percent {
  public:
    constexpr int whole() const { return basis_points_ / 100; }

  private:
    friend struct subtype::sub_type_instance<Percent>;
    constexpr explicit Percent(int basis_points)
        : basis_points_(basis_points) {}

    int basis_points_;
};

template <> struct subtype::sub_type_instance<Percent> {
    using base_type = int;
    static constexpr bool pred(const int& x) { return x >= 0 && x <= 100; }
    static constexpr int val(const Percent& p) { return p.whole(); }
    static constexpr Percent build(int x) { return Percent(x * 100); }
};

template <>
struct eqtype::eq_instance<Percent> : subtype::sub_eq_instance<Percent> {};

using Email = subtype::NewType<std::string, struct EmailTag>;

int main() {
    using subtype::insub;
    using subtype::val;

    static_assert(eqtype::eq_op(subtype::sub<Percent>(40),
                                subtype::sub<Percent>(40)));

    for (int x : {-5, 0, 55, 100, 101}) {
        auto p = insub<Percent>(x);
        std::cout << x << ": " << (p ? "valid" : "rejected") << "\n";
    }

    const auto mail = subtype::innew<Email>(std::string("ada@example.org"));
    std::cout << "email: " << val(mail) << "\n";
    std::cout << "same email: "
              << eqtype::eq_op(mail, subtype::innew<Email>(
                                         std::string("ada@example.org")))
              << "\n";
}
