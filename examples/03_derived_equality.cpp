// 03_derived_equality.cpp — Giving a new type an equality without writing one
//
// Shows: inj_eq_mixin(), can_eq_mixin(), pcan_eq_mixin(), explicit
//        registration through eq_instance, and the law checkers.

#include <array>
#include <iostream>
#include <optional>

#include <eqtype/eqtype.hpp>

struct Rgb {
    unsigned char r, g, b;
};

constexpr unsigned pack(const Rgb& c) {
    return (unsigned{c.r} << 16) | (unsigned{c.g} << 8) | unsigned{c.b};
}

constexpr std::optional<Rgb> unpack(const unsigned& v) {
    if (v > 0xFFFFFFu)
        return std::nullopt;
    return Rgb{static_cast<unsigned char>(v >> 16),
               static_cast<unsigned char>(v >> 8),
               static_cast<unsigned char>(v)};
}

// Rgb opts into the partial-inverse derivation.
template <> struct eqtype::eq_instance<Rgb> {
    static constexpr auto mixin = eqtype::pcan_eq_mixin<Rgb>(&pack, &unpack);
};

constexpr std::array<Rgb, 4> palette{Rgb{0, 0, 0}, Rgb{255, 0, 0},
                                     Rgb{0, 255, 0}, Rgb{255, 0, 0}};

static_assert(eqtype::pcancel_on(&pack, &unpack, palette));
static_assert(eqtype::eq_laws_on(palette));

int main() {
    std::cout << "red == red: " << eqtype::eq_op(palette[1], palette[3])
              << "\n";
    std::cout << "red == green: " << eqtype::eq_op(palette[1], palette[2])
              << "\n";

    // Not every derivation is registered: this one is used directly.
    constexpr auto by_red = eqtype::inj_eq_mixin<Rgb>(
        [](const Rgb& c) { return c.r; });
    std::cout << "same red channel as black: "
              << by_red(palette[0], palette[2]) << "\n";
}
