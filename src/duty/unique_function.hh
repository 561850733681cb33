#pragma once

#include <duty/fwd.hh>
#include <duty/utility.hh>

#include <memory>
#include <type_traits>

namespace duty::impl
{
/// True for callables that carry their own "empty" state:
/// function and member pointers, and types with an explicit operator bool (std::function, function_ref)
template <class Fn>
constexpr bool is_nullable_callable = std::is_pointer_v<Fn> || std::is_member_pointer_v<Fn>
                                   || (std::is_constructible_v<bool, Fn const&> && !std::is_convertible_v<Fn const&, bool>);
} // namespace duty::impl

/// Owning, move-only callable with signature R(Args...)
///
/// duty::defaulting_map stores its default function in one of these, so default functions
/// may capture move-only state (a unique_ptr to a lookup table, a connection handle, ...).
///
/// The callable is heap-allocated once on construction; moving a unique_function only moves the pointer.
/// Constructing from a null function pointer or an empty std::function yields an invalid unique_function,
/// just like default construction. Calling an invalid one is a precondition violation.
///
/// operator() is const, but the callable itself is invoked as non-const (same as unique_ptr<T>::operator*).
template <class R, class... Args>
struct duty::unique_function<R(Args...)>
{
    // construction
public:
    unique_function() = default;

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, unique_function>)
    unique_function(F&& f) // NOLINT
    {
        using Fn = std::remove_cvref_t<F>;

        static_assert(duty::is_invocable_r<R, Fn&, Args...>, "F must be callable with Args... and return R");
        static_assert(std::is_constructible_v<Fn, F>, "F must be copyable or movable into the unique_function");

        if constexpr (duty::impl::is_nullable_callable<Fn>)
        {
            if (!static_cast<bool>(f))
                return;
        }

        auto callable = std::make_unique<Fn>(duty::forward<F>(f));
        _callable = callable_ptr(callable.release(), &destroy<Fn>);
        _call = &call<Fn>;
    }

    unique_function(unique_function&&) noexcept = default;
    unique_function& operator=(unique_function&&) noexcept = default;
    unique_function(unique_function const&) = delete;
    unique_function& operator=(unique_function const&) = delete;

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _callable != nullptr; }
    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    R operator()(Args... args) const
    {
        DUTY_ASSERT(is_valid(), "cannot call an invalid duty::unique_function");
        return _call(_callable.get(), duty::forward<Args>(args)...);
    }

private:
    template <class Fn>
    static void destroy(void* p)
    {
        std::default_delete<Fn>()(static_cast<Fn*>(p));
    }

    template <class Fn>
    static R call(void* p, Args... args)
    {
        return duty::invoke_r<R>(*static_cast<Fn*>(p), duty::forward<Args>(args)...);
    }

    using callable_ptr = std::unique_ptr<void, duty::function_ptr<void(void*)>>;

    callable_ptr _callable = callable_ptr(nullptr, nullptr);
    duty::function_ptr<R(void*, Args...)> _call = nullptr;
};
