#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <string>
#include <type_traits>

#include <subtype/subtypes.hpp>

using subtype::base_t;
using subtype::insub;
using subtype::insub_correct_on;
using subtype::insub_eq;
using subtype::insubd;
using subtype::Sig;
using subtype::sub;
using subtype::sub_pred;
using subtype::SubType;
using subtype::val;
using subtype::val_insubd_on;
using subtype::valK_on;
using subtype::subK_on;

constexpr bool is_even(unsigned x) { return x % 2 == 0; }
using Even = Sig<unsigned, &is_even>;

constexpr auto is_digit = [](int x) { return x >= 0 && x < 10; };
using Digit = Sig<int, is_digit>;

using NonEmpty = Sig<std::string, [](const std::string& s) { return !s.empty(); }>;

// A hand-written subtype: the base value is stored halved.
class EvenNat {
  public:
    constexpr unsigned value() const { return half_ * 2; }
    constexpr bool operator==(const EvenNat&) const = default;

  private:
    friend struct subtype::sub_type_instance<EvenNat>;
    constexpr explicit EvenNat(unsigned half) : half_(half) {}

    unsigned half_;
};

namespace subtype {

template <> struct sub_type_instance<EvenNat> {
    using base_type = unsigned;
    static constexpr bool pred(const unsigned& x) { return x % 2 == 0; }
    static constexpr unsigned val(const EvenNat& u) { return u.value(); }
    static constexpr EvenNat build(unsigned x) { return EvenNat(x / 2); }
};

} // namespace subtype

// --- Concept ---

TEST(SubType, Concept) {
    static_assert(SubType<Even>);
    static_assert(SubType<Digit>);
    static_assert(SubType<NonEmpty>);
    static_assert(SubType<EvenNat>);
    static_assert(!SubType<unsigned>);
    static_assert(std::is_same_v<base_t<Even>, unsigned>);
    static_assert(std::is_same_v<base_t<EvenNat>, unsigned>);
}

// --- Even naturals ---

TEST(Insub, EvenNaturals) {
    constexpr auto four = insub<Even>(4u);
    static_assert(four.has_value());
    static_assert(val(*four) == 4u);
    static_assert(!insub<Even>(5u).has_value());
}

TEST(Insub, PartialityMatchesPredicate) {
    for (unsigned x = 0; x < 50; ++x) {
        auto u = insub<Even>(x);
        EXPECT_EQ(u.has_value(), is_even(x));
        if (u)
            EXPECT_EQ(val(*u), x);
    }
}

TEST(Insub, InsubEqAgrees) {
    for (unsigned x = 0; x < 20; ++x)
        EXPECT_EQ(insub_eq<Even>(x), insub<Even>(x));
}

TEST(Insub, StringBase) {
    EXPECT_FALSE(insub<NonEmpty>(std::string()).has_value());
    auto u = insub<NonEmpty>(std::string("x"));
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(val(*u), "x");
}

// --- sub ---

TEST(Sub, ProjectsBack) {
    constexpr auto d = sub<Digit>(7);
    static_assert(val(d) == 7);
    static_assert(d.val() == 7);
}

TEST(Sub, RejectsValueOutsidePredicate) {
    EXPECT_ANY_THROW((void)sub<Digit>(10));
    EXPECT_ANY_THROW((void)sub<Even>(3u));
    EXPECT_ANY_THROW((void)sub<EvenNat>(3u));
}

TEST(Sub, PredicateAccessor) {
    static_assert(sub_pred<Digit>(0));
    static_assert(!sub_pred<Digit>(-1));
    static_assert(sub_pred<EvenNat>(8u));
}

// --- insubd ---

TEST(Insubd, FallsBackToDefault) {
    constexpr auto zero = sub<Digit>(0);
    static_assert(val(insubd(zero, 4)) == 4);
    static_assert(val(insubd(zero, 42)) == 0);
    static_assert(val(insubd(zero, -3)) == 0);
}

TEST(Insubd, Laws) {
    constexpr std::array<int, 6> xs{-5, 0, 3, 9, 10, 99};
    static_assert(val_insubd_on(sub<Digit>(5), xs));
}

// --- Laws ---

TEST(SubLaws, PcancelValInsub) {
    constexpr std::array<Even, 4> us{sub<Even>(0u), sub<Even>(2u),
                                     sub<Even>(10u), sub<Even>(2u)};
    static_assert(valK_on(us));
    static_assert(subK_on(us));
}

TEST(SubLaws, InsubCorrect) {
    constexpr std::array<unsigned, 8> xs{0, 1, 2, 3, 4, 5, 1000, 1001};
    static_assert(insub_correct_on<Even>(xs));
    static_assert(insub_correct_on<EvenNat>(xs));
}

TEST(SubLaws, HandWrittenSubtype) {
    constexpr auto u = insub<EvenNat>(12u);
    static_assert(u.has_value());
    static_assert(val(*u) == 12u);
    static_assert(!insub<EvenNat>(13u).has_value());

    constexpr std::array<EvenNat, 3> us{sub<EvenNat>(0u), sub<EvenNat>(6u),
                                        sub<EvenNat>(6u)};
    static_assert(valK_on(us));
    static_assert(subK_on(us));
}
