#pragma once

#include <listkit/fwd.hh>
#include <listkit/macros.hh>

// =========================================================================================================
// Utility functions used across listkit
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Swapping:
//   swap(a, b)                  - swap values, respects ADL swap overloads (used by the shuffles)
//


namespace lk
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

template <class T>
[[nodiscard]] LK_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LK_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LK_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Swapping
// =========================================================================================================

namespace impl
{
struct swap_fn
{
    template <class T>
    constexpr void operator()(T& a, T& b) const;
};
} // namespace impl

/// ADL-aware swap that respects custom swap overloads
/// Implemented as a function object so it cannot be found by ADL itself
/// Usage:
///   lk::swap(list[n], list[k]);  // finds custom swap via ADL if available, otherwise move-based swap
[[maybe_unused]] constexpr impl::swap_fn swap;
} // namespace lk

// =========================================================================================================
// Implementation
// =========================================================================================================

// must be done outside of the lk namespace so lk::swap cannot be found anymore
namespace _no_lk_namespace // NOLINT
{
template <class T>
constexpr void do_swap_impl(T& a, T& b)
{
    if constexpr (requires { swap(a, b); })
    {
        swap(a, b);
    }
    else
    {
        T tmp = static_cast<T&&>(a);
        a = static_cast<T&&>(b);
        b = static_cast<T&&>(tmp);
    }
}
} // namespace _no_lk_namespace

template <class T>
constexpr void lk::impl::swap_fn::operator()(T& a, T& b) const
{
    _no_lk_namespace::do_swap_impl(a, b);
}
