#pragma once

#include <duty/fwd.hh>
#include <duty/utility.hh>

#include <type_traits>

/// Borrowed callable with signature R(Args...): one object pointer plus one call pointer
///
/// This is how duty::lazy refers to a deferred fallback without copying or allocating:
///   m.get_or_else(key, [&] { return expensive(key); });
/// The lambda is a temporary that lives until the end of the full expression, which covers the call.
///
/// Never owns. The referenced callable must outlive every call through the function_ref,
/// so it belongs in parameter lists, not in members or containers.
///
/// Default construction gives an invalid function_ref; calling it is a precondition violation.
/// A callable whose result converts to R fits, and R = void discards the result.
template <class R, class... Args>
struct duty::function_ref<R(Args...)>
{
    // construction
public:
    function_ref() = default;

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref>)
    function_ref(F&& f) // NOLINT
      : _object(static_cast<void const*>(&f)), _invoke(&invoke_as<std::remove_reference_t<F>>)
    {
        static_assert(duty::is_invocable_r<R, F&, Args...>, "F must be callable with Args... and return R");
    }

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _invoke != nullptr; }
    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    R operator()(Args... args) const
    {
        DUTY_ASSERT(is_valid(), "cannot call an invalid duty::function_ref");
        return _invoke(_object, duty::forward<Args>(args)...);
    }

private:
    // Fn keeps the constness of the referenced callable, so mutable lambdas stay mutable
    template <class Fn>
    static R invoke_as(void const* object, Args... args)
    {
        auto& fn = *static_cast<Fn*>(const_cast<void*>(object)); // NOLINT
        return duty::invoke_r<R>(fn, duty::forward<Args>(args)...);
    }

    void const* _object = nullptr;
    duty::function_ptr<R(void const*, Args...)> _invoke = nullptr;
};
