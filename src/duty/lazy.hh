#pragma once

#include <duty/fwd.hh>
#include <duty/function_ref.hh>
#include <duty/optional.hh>
#include <duty/utility.hh>

#include <type_traits>

/// A fallback value of type T that is either a constant or computed on demand
///
/// Explicit two-case sum:
///   - constant: holds a T, evaluate() hands out a copy (or moves it out of an rvalue lazy)
///   - deferred: references a zero-argument callable, evaluate() calls it exactly once per evaluate()
///
/// Used as the parameter type for fallbacks, e.g. map::get_or_else and optional::value_or,
/// so callers can pass either shape without overloads:
///   m.get_or_else(key, 0);
///   m.get_or_else(key, [&] { return compute(key); });
///
/// Case selection:
///   - anything convertible to T that is not a zero-argument callable is a constant
///   - a T itself is always a constant, even if T is callable
///   - a zero-argument callable whose result converts to T is deferred
///
/// IMPORTANT LIFETIME RULE:
///   the deferred case is a function_ref and never owns the callable.
///   lazy is meant as a by-value function parameter only; do not store it beyond the call.
template <class T>
struct duty::lazy
{
public:
    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, lazy> && std::is_convertible_v<U &&, T>
                 && (std::is_same_v<std::remove_cvref_t<U>, T> || !std::is_invocable_v<U&>))
    lazy(U&& value) : _constant(T(duty::forward<U>(value))) // NOLINT
    {
    }

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, lazy> && !std::is_same_v<std::remove_cvref_t<F>, T>
                 && std::is_invocable_v<F&> && duty::is_invocable_r<T, F&>)
    lazy(F&& f) : _deferred(f) // NOLINT
    {
    }

    // queries
public:
    [[nodiscard]] bool is_constant() const { return _constant.has_value(); }
    [[nodiscard]] bool is_deferred() const { return !_constant.has_value(); }

    // evaluation
public:
    /// Produces the value: copies the constant or invokes the deferred callable
    [[nodiscard]] T evaluate() const&
    {
        if (_constant.has_value())
            return _constant.value();

        return _deferred();
    }

    /// Produces the value, moving the constant out instead of copying it
    [[nodiscard]] T evaluate() &&
    {
        if (_constant.has_value())
            return duty::move(_constant).value();

        return _deferred();
    }

private:
    duty::optional<T> _constant;
    duty::function_ref<T()> _deferred;
};
