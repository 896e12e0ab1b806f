// 01_canonical_equality.cpp — Comparing values through their canonical equality
//
// Shows: eq_op(), neq_op(), eqP(), eqVneq(), the EqType concept, and the
//        built-in instances for bool, integers and strings.

#include <iostream>
#include <string>

#include <eqtype/eqtype.hpp>

using namespace eqtype;

template <EqType T> void report(const T& x, const T& y, const char* what) {
    std::cout << what << ": " << (eq_op(x, y) ? "equal" : "different")
              << "\n";
}

int main() {
    // --- Decided at compile time ---
    static_assert(eq_op(2, 2));
    static_assert(neq_op('a', 'b'));
    static_assert(eqb(true, true) && !eqb(true, false));

    // double has no canonical equality: NaN != NaN
    static_assert(!EqType<double>);

    report(std::string("abc"), std::string("abc"), "strings");
    report(10u, 11u, "naturals");

    // --- eqP: a boolean view usable in a condition ---
    if (eqP(std::string("x"), std::string("x")))
        std::cout << "eqP holds\n";

    // --- eqVneq: branch with the compared values in hand ---
    auto split = eqVneq(7, 9);
    std::cout << split.visit(
                     [](int x) { return "same value " + std::to_string(x); },
                     [](int x, int y) {
                         return std::to_string(x) + " vs " + std::to_string(y);
                     })
              << "\n";
}
