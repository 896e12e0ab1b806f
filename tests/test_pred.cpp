#include <gtest/gtest.h>

#include <string>
#include <utility>

#include <eqtype/composite.hpp>
#include <eqtype/pred.hpp>

using eqtype::eq_op;
using eqtype::pred1;
using eqtype::pred2;
using eqtype::pred3;
using eqtype::pred4;
using eqtype::predC;
using eqtype::predC1;
using eqtype::predD1;
using eqtype::predI;
using eqtype::predU;
using eqtype::predU1;
using eqtype::predX;

constexpr auto is_neg = [](int x) { return x < 0; };

// --- Singletons and small sets ---

TEST(Pred1, Singleton) {
    constexpr auto p = pred1(4);
    static_assert(p(4));
    static_assert(!p(5));
}

TEST(Pred1, ReflectsEquality) {
    auto p = pred1(std::string("x"));
    for (const char* s : {"x", "y", ""})
        EXPECT_EQ(p(s), eq_op(std::string(s), std::string("x")));
}

TEST(Pred2, Pair) {
    constexpr auto p = pred2(1, 2);
    static_assert(p(1) && p(2));
    static_assert(!p(3));
}

TEST(Pred3, Triple) {
    constexpr auto p = pred3('a', 'b', 'c');
    static_assert(p('a') && p('b') && p('c'));
    static_assert(!p('d'));
}

TEST(Pred4, Quad) {
    constexpr auto p = pred4(10, 20, 30, 40);
    static_assert(p(10) && p(20) && p(30) && p(40));
    static_assert(!p(0) && !p(50));
}

// pred2..pred4 are the disjunction of the pointwise equalities
TEST(PredN, ReflectsDisjunction) {
    const auto p2 = pred2(1, 5);
    const auto p3 = pred3(1, 5, 9);
    const auto p4 = pred4(1, 5, 9, 13);
    for (int x = -2; x <= 15; ++x) {
        EXPECT_EQ(p2(x), eq_op(x, 1) || eq_op(x, 5));
        EXPECT_EQ(p3(x), eq_op(x, 1) || eq_op(x, 5) || eq_op(x, 9));
        EXPECT_EQ(p4(x),
                  eq_op(x, 1) || eq_op(x, 5) || eq_op(x, 9) || eq_op(x, 13));
    }
}

TEST(PredN, DuplicatePointsCollapse) {
    constexpr auto p = pred2(7, 7);
    static_assert(p(7));
    static_assert(!p(8));
}

// --- One point added or removed ---

TEST(PredU1, AddsOnePoint) {
    constexpr auto p = predU1(0, is_neg);
    static_assert(p(0));
    static_assert(p(-3));
    static_assert(!p(1));
}

TEST(PredU1, ReflectsDisjunction) {
    const auto p = predU1(3, is_neg);
    for (int x = -4; x <= 4; ++x)
        EXPECT_EQ(p(x), eq_op(x, 3) || is_neg(x));
}

TEST(PredC1, Complement) {
    constexpr auto p = predC1(2);
    static_assert(!p(2));
    static_assert(p(3));
}

TEST(PredC1, IsComplementOfPred1) {
    const auto c1 = predC1(6);
    const auto c = predC(pred1(6));
    for (int x = 0; x <= 10; ++x)
        EXPECT_EQ(c1(x), c(x));
}

TEST(PredD1, RemovesOnePoint) {
    constexpr auto p = predD1(is_neg, -1);
    static_assert(!p(-1));
    static_assert(p(-2));
    static_assert(!p(5));
}

TEST(PredD1, ReflectsConjunction) {
    const auto p = predD1(is_neg, -2);
    const auto same = predI(predC1(-2), is_neg);
    for (int x = -5; x <= 5; ++x) {
        EXPECT_EQ(p(x), !eq_op(x, -2) && is_neg(x));
        EXPECT_EQ(p(x), same(x));
    }
}

TEST(PredD1, UndoesPredU1) {
    // p \ {a} after adding a gives back p when a was not in p
    const auto p = predD1(predU1(8, is_neg), 8);
    for (int x = -3; x <= 10; ++x)
        EXPECT_EQ(p(x), is_neg(x));
}

// --- Generic combinators ---

TEST(PredCombinators, UnionIntersection) {
    constexpr auto small = [](int x) { return x < 3; };
    constexpr auto u = predU(pred1(10), small);
    constexpr auto i = predI(predC1(1), small);
    static_assert(u(10) && u(0) && !u(5));
    static_assert(i(0) && !i(1) && !i(4));
}

TEST(PredX, ProductOfPredicates) {
    constexpr auto p = predX(pred1(1), predC1('a'));
    static_assert(p(std::pair{1, 'b'}));
    static_assert(!p(std::pair{1, 'a'}));
    static_assert(!p(std::pair{2, 'b'}));
}
