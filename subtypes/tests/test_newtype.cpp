#include <gtest/gtest.h>

#include <string>
#include <type_traits>

#include <subtype/subtypes.hpp>

using subtype::innew;
using subtype::insub;
using subtype::NewType;
using subtype::NewTypeLike;
using subtype::Sig;
using subtype::sub;
using subtype::val;

struct UserIdTag {};
struct OrderIdTag {};

using UserId = NewType<int, UserIdTag>;
using OrderId = NewType<int, OrderIdTag>;
using Name = NewType<std::string, struct NameTag>;

constexpr bool positive(int x) { return x > 0; }
using Positive = Sig<int, &positive>;

TEST(NewType, Concept) {
    static_assert(NewTypeLike<UserId>);
    static_assert(NewTypeLike<Name>);
    static_assert(!NewTypeLike<Positive>);
    static_assert(!std::is_same_v<UserId, OrderId>);
}

TEST(NewType, InnewWraps) {
    constexpr auto u = innew<UserId>(42);
    static_assert(val(u) == 42);
    static_assert(u.val() == 42);
}

TEST(NewType, EveryBaseValueIsAccepted) {
    for (int x = -5; x <= 5; ++x) {
        auto u = insub<UserId>(x);
        ASSERT_TRUE(u.has_value());
        EXPECT_EQ(val(*u), x);
        EXPECT_EQ(*u, innew<UserId>(x));
        EXPECT_EQ(sub<UserId>(x), innew<UserId>(x));
    }
}

TEST(NewType, StringPayload) {
    const auto n = innew<Name>(std::string("ada"));
    EXPECT_EQ(val(n), "ada");
}
