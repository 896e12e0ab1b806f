#ifndef EQTYPE_EQ_HPP
#define EQTYPE_EQ_HPP

#include <concepts>
#include <type_traits>
#include <utility>

namespace eqtype {

// --- EqMixin: a comparison operator packaged for one type ---
//
// `op` must decide structural equality: op(x, y) is true exactly when x and
// y denote the same value. The compiler cannot check this; laws.hpp turns it
// into a property that tests check over sample values.

template <typename T, typename Op> struct EqMixin {
    using value_type = T;
    Op op{};

    constexpr bool operator()(const T& x, const T& y) const {
        return static_cast<bool>(op(x, y));
    }
};

template <typename T, typename Op> constexpr auto make_eq_mixin(Op op) {
    return EqMixin<T, Op>{op};
}

// --- Canonical instance table ---
//
// eq_instance<T> names THE equality of T. Specialise it once per type with
//   static constexpr auto mixin = make_eq_mixin<T>(...);
// A second specialisation for the same type is an ODR violation, so there is
// at most one canonical comparison per type.
template <typename T> struct eq_instance;

template <typename T>
concept EqType = requires(const T& x, const T& y) {
    { eq_instance<T>::mixin(x, y) } -> std::same_as<bool>;
};

// --- Comparison ---

template <EqType T> constexpr bool eq_op(const T& x, const T& y) {
    return eq_instance<T>::mixin(x, y);
}

template <EqType T> constexpr bool neq_op(const T& x, const T& y) {
    return !eq_op(x, y);
}

template <EqType T> constexpr bool eqxx(const T& x) { return eq_op(x, x); }

// Comparison of images: (x, y) -> f(x) == f(y)
template <typename T, typename F> constexpr auto comparing(F f) {
    return [f](const T& x, const T& y) { return eq_op(f(x), f(y)); };
}

// --- Decision views ---

// Boolean view of `x == y`. Testing it true is the evidence that the two
// compared values are the same.
struct Reflect {
    bool value{false};

    constexpr bool holds() const { return value; }
    constexpr explicit operator bool() const { return value; }
};

template <EqType T> constexpr Reflect eqP(const T& x, const T& y) {
    return Reflect{eq_op(x, y)};
}

// Case split on `x == y` that keeps the compared values. visit() calls
// on_eq(x) when they are equal and on_neq(x, y) otherwise; both branches
// must return the same type.
template <EqType T> class EqVneq {
  public:
    constexpr EqVneq(T x, T y)
        : x_(std::move(x)), y_(std::move(y)), eq_(eq_op(x_, y_)) {}

    constexpr bool is_eq() const { return eq_; }
    constexpr const T& lhs() const { return x_; }
    constexpr const T& rhs() const { return y_; }

    template <typename OnEq, typename OnNeq>
    constexpr auto visit(OnEq&& on_eq, OnNeq&& on_neq) const {
        static_assert(
            std::same_as<std::invoke_result_t<OnEq, const T&>,
                         std::invoke_result_t<OnNeq, const T&, const T&>>,
            "eqVneq: both branches must return the same type");
        if (eq_)
            return std::forward<OnEq>(on_eq)(x_);
        return std::forward<OnNeq>(on_neq)(x_, y_);
    }

  private:
    T x_;
    T y_;
    bool eq_;
};

template <EqType T> constexpr EqVneq<T> eqVneq(const T& x, const T& y) {
    return EqVneq<T>(x, y);
}

} // namespace eqtype

#endif // EQTYPE_EQ_HPP
