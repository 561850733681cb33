#pragma once

#include <duty/assert.hh>
#include <duty/fwd.hh>
#include <duty/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as duty::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct duty::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace duty
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
/// Usage: optional<int> opt = nullopt; or if (opt == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace duty

/// Sum type representing either a value of type T or no value (T | none), similar to std::optional.
/// This is the result type of every map lookup: absence is a value, not an error.
/// Provides a safer subset of std::optional's API: no operator* or operator-> to avoid misuse.
/// Equality comparison available; other relational operators deliberately omitted.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
template <class T>
struct duty::optional
{
    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) : _has_value(true) // NOLINT
    {
        new (duty::placement_new, &_storage.value) T(duty::forward<U>(value));
    }

    /// Constructs an empty optional from duty::nullopt; allows explicit empty initialization.
    optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy - custom implementation when T requires special handling
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    /// After this operation, rhs.has_value() == false; avoids double-destruction.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (duty::placement_new, &_storage.value) T(duty::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (duty::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move assignment for non-trivial T: moves or constructs from rhs, handling all state combinations.
    /// Leaves rhs engaged with a moved-from value (matches std::optional behavior).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = duty::move(rhs._storage.value);
            else
                new (duty::placement_new, &_storage.value) T(duty::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (duty::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns a reference to the held value, preserving the value category of the optional itself.
    /// Precondition: has_value() == true.
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        DUTY_ASSERT(self.has_value(), "attempted to access value of empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Returns the held value, or evaluates the fallback if empty.
    /// The fallback is either a constant or a callable and is only evaluated on the empty path.
    /// Usage:
    ///   auto v = m.get(key).value_or(0);
    ///   auto w = m.get(key).value_or([&] { return expensive(key); });
    template <class Self>
    [[nodiscard]] T value_or(this Self&& self, duty::lazy<T> fallback)
    {
        if (self.has_value())
            return static_cast<Self&&>(self)._storage.value;

        return duty::move(fallback).evaluate();
    }

    /// Returns *this if engaged, otherwise the optional produced by f().
    /// f is only called on the empty path.
    /// Usage:
    ///   auto v = primary.get(key).or_else([&] { return secondary.get(key); });
    template <class Self, class F>
    [[nodiscard]] optional or_else(this Self&& self, F&& f)
    {
        static_assert(std::is_same_v<std::remove_cvref_t<std::invoke_result_t<F&>>, optional>,
                      "or_else callback must return an optional of the same type");

        if (self.has_value())
            return static_cast<Self&&>(self);

        return duty::invoke(f);
    }

    // comparison
public:
    /// Equality comparison: two optionals are equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equality comparison with a value: optional is equal to the value if it holds an equal value.
    /// Returns false if the optional is empty.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    /// Equality comparison with nullopt: true iff empty.
    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Equality comparison with bool: deleted when T is not bool to prevent implicit conversions.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    /// Value is constructed in-place when the optional is engaged.
    duty::storage_for<T> _storage;

    /// True when _storage.value holds a live T object.
    bool _has_value = false;
};

namespace duty
{
/// Creates an engaged optional holding v
/// Usage:
///   CHECK(m.get("a") == duty::some(1));
template <class T>
[[nodiscard]] optional<std::remove_cvref_t<T>> some(T&& v)
{
    return optional<std::remove_cvref_t<T>>(duty::forward<T>(v));
}
} // namespace duty

// value_or needs the complete lazy type
#include <duty/lazy.hh>
