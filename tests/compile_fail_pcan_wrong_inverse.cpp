// Compile-fail test: pcan_eq_mixin needs g : U -> std::optional<T>.
// This file should FAIL to compile — g here is total.
#include <eqtype/derive.hpp>
#include <eqtype/instances.hpp>

struct Box {
    int v;
};

constexpr int unbox(const Box& b) { return b.v; }
constexpr Box rebox(const int& v) { return Box{v}; }

constexpr auto mixin = eqtype::pcan_eq_mixin<Box>(&unbox, &rebox);

int main() { (void)mixin; }
