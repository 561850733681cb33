#pragma once

#include <duty/assert.hh>
#include <duty/fwd.hh>

#include <functional> // std::invoke, std::invoke_r
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Invocation:
//   invoke(f, args...)          - uniform call syntax (functions, lambdas, member pointers)
//   invoke_r<R>(f, args...)     - invoke and convert the result to R (R = void discards it)
//   is_invocable_r<R, F, Args>  - true if invoke_r<R>(F, Args...) is well-formed
//
// Callable utilities:
//   identity_function           - callable that returns its argument (identity function)
//
// Template metaprogramming:
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Object lifetime:
//   placement_new               - tag for constructing into raw storage without <new>
//   storage_for<T>              - uninitialized, correctly aligned storage for exactly one T
//

namespace duty
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   T b = duty::move(a);              // move construct b from a
template <class T>
[[nodiscard]] DUTY_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
/// Usage:
///   template<class T>
///   void wrapper(T&& arg) {
///       foo(duty::forward<T>(arg));  // forwards as lvalue or rvalue depending on T
///   }
template <class T>
[[nodiscard]] DUTY_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] DUTY_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Invocation
// =========================================================================================================

/// Invokes f with args, supporting pointer-to-member functions and objects
/// Usage:
///   duty::invoke(f, 1, 2);
///   duty::invoke(&S::member, s);
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args) noexcept(std::is_nothrow_invocable_v<F, Args...>)
{
    return std::invoke(duty::forward<F>(f), duty::forward<Args>(args)...);
}

/// Like invoke but converts the result to R
/// For R = void, the result is discarded (so callables with a return value fit a void signature)
template <class R, class F, class... Args>
constexpr R invoke_r(F&& f, Args&&... args) noexcept(std::is_nothrow_invocable_r_v<R, F, Args...>)
{
    return std::invoke_r<R>(duty::forward<F>(f), duty::forward<Args>(args)...);
}

/// True if F can be invoked with Args and the result is convertible to R
template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that returns its argument with perfect forwarding
/// Preserves value category (lvalue/rvalue) of the input
/// Usage:
///   auto same = m.map_values(duty::identity_function{});
struct identity_function
{
    template <class T>
    constexpr T&& operator()(T&& arg) const noexcept
    {
        return duty::forward<T>(arg);
    }
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

namespace impl
{
// only function signatures have a specialization
template <class T>
struct function_ptr_t;
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   duty::function_ptr<int(float, double)>          -> int (*)(float, double)
///   duty::function_ptr<void() noexcept>             -> void (*)() noexcept
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag selecting the non-allocating placement operator new declared below
/// Usage:
///   new (duty::placement_new, ptr) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// Uninitialized storage for exactly one T
/// The owner is responsible for constructing (via placement_new) and destroying value.
/// Trivially copyable and destructible whenever T is.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

} // namespace duty

[[nodiscard]] DUTY_FORCE_INLINE void* operator new(std::size_t, duty::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
DUTY_FORCE_INLINE void operator delete(void*, duty::placement_new_t, void*) noexcept {}
