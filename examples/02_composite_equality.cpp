// 02_composite_equality.cpp — Equality of products, sums, options and tags
//
// Shows: pair/tuple/variant/optional instances, inl()/inr() for sums with
//        identical sides, Tagged dependent pairs and tagged_as().

#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <eqtype/eqtype.hpp>

using namespace eqtype;

enum class Field { id, name };

template <auto F>
using field_payload = std::conditional_t<F == Field::id, int, std::string>;

using Cell = Tagged<field_payload, Field::id, Field::name>;

int main() {
    // --- Product ---
    using Row = std::pair<int, std::string>;
    std::cout << "(1, a) == (1, a): " << eq_op(Row{1, "a"}, Row{1, "a"})
              << "\n";
    std::cout << "(1, a) == (1, b): " << eq_op(Row{1, "a"}, Row{1, "b"})
              << "\n";

    // --- Sum: the side matters, not just the payload ---
    static_assert(!eq_op(inl<int, int>(5), inr<int, int>(5)));
    static_assert(eq_op(inl<int, int>(5), inl<int, int>(5)));

    // --- Option ---
    using O = std::optional<int>;
    static_assert(eq_op(O{3}, O{3}) && !eq_op(O{3}, O{}) && eq_op(O{}, O{}));

    // --- Tagged: compare indices first, then transported payloads ---
    const auto a = Cell::make<Field::id>(7);
    const auto b = Cell::make<Field::id>(7);
    const auto c = Cell::make<Field::name>(std::string("seven"));
    std::cout << "id 7 == id 7: " << eq_op(a, b) << "\n";
    std::cout << "id 7 == name seven: " << eq_op(a, c) << "\n";
    std::cout << "tagged_as(a, c) keeps tag id: "
              << eq_op(tag(tagged_as(a, c)), Field::id) << "\n";
}
