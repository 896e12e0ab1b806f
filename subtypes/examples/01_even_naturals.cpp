// 01_even_naturals.cpp — A refinement subtype {x : unsigned | x even}
//
// Shows: Sig, insub() as the safe way in, sub() when the predicate is known,
//        insubd() with a default, and the equality every Sig inherits.

#include <iostream>

#include <subtype/subtypes.hpp>

using namespace subtype;

constexpr bool is_even(unsigned x) { return x % 2 == 0; }
using Even = Sig<unsigned, &is_even>;

// Checked at compile time: sub() throws on odd input, which would stop the
// build here.
constexpr Even two = sub<Even>(2u);

int main() {
    static_assert(val(two) == 2u);
    static_assert(insub<Even>(4u).has_value());
    static_assert(!insub<Even>(5u).has_value());

    for (unsigned x : {0u, 3u, 8u, 11u}) {
        if (auto u = insub<Even>(x))
            std::cout << x << " is even, val = " << val(*u) << "\n";
        else
            std::cout << x << " is not even\n";
    }

    std::cout << "insubd(2, 7) = " << val(insubd(two, 7u)) << "\n";
    std::cout << "insubd(2, 6) = " << val(insubd(two, 6u)) << "\n";

    // Equality comes from unsigned through val()
    std::cout << "sub(6) == insubd(2, 6): "
              << eqtype::eq_op(sub<Even>(6u), insubd(two, 6u)) << "\n";
}
