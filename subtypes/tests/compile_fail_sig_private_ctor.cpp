// Compile-fail test: a Sig value cannot be built around the predicate check.
// This file should FAIL to compile — the Sig constructor is private.
#include <subtype/subtypes.hpp>

constexpr bool is_even(unsigned x) { return x % 2 == 0; }
using Even = subtype::Sig<unsigned, &is_even>;

constexpr Even three{3u};

int main() { (void)three; }
