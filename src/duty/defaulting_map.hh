#pragma once

#include <duty/assert.hh>
#include <duty/fwd.hh>
#include <duty/map.hh>
#include <duty/optional.hh>
#include <duty/unique_function.hh>
#include <duty/utility.hh>

#include <string>
#include <type_traits>

/// Map decorator that synthesizes a value for missing keys
///
/// Owns exactly one inner map (by value, no sharing) and a default function K const& -> V.
/// Only lookups are intercepted:
///   - get(key) and at(key) ask the inner map first and fall back to default_fn(key)
///   - the synthesized value is NOT stored: contains_key, size and iteration only see stored entries
/// Everything else (set, put, get_or_else, get_or_else_update, map_keys, map_values, to_native, iteration)
/// is forwarded to the inner map unchanged. map_keys/map_values return plain maps without a default.
///
/// Layering: defaulting() on a defaulting_map wraps it again. A layer only consults its own default
/// function if the next inner layer reports a miss, and an inner defaulting_map never misses,
/// so the innermost default function is the one that answers.
///
/// Content comparisons (same_content, operator==) ignore default functions entirely.
///
/// Usage:
///   auto d = duty::with_default<std::string, int>([](std::string const& k) { return int(k.size()); });
///   d.get("hello");           // some(5)
///   d.contains_key("hello");  // false
///   d.set("hello", 99);
///   d.get("hello");           // some(99)
template <class K, class V, class MapT>
struct duty::defaulting_map
{
    static_assert(std::is_same_v<typename MapT::key_t, K>, "inner map must have key type K");
    static_assert(std::is_same_v<typename MapT::value_t, V>, "inner map must have value type V");

    using key_t = K;
    using value_t = V;
    using entry_t = duty::pair<K, V>;
    using native_t = std::unordered_map<K, V>;
    using inner_t = MapT;
    using default_fn_t = duty::unique_function<V(K const&)>;

    // construction
public:
    /// Wraps an empty inner map
    explicit defaulting_map(default_fn_t default_fn) : defaulting_map(MapT(), duty::move(default_fn)) {}

    /// Takes ownership of inner
    defaulting_map(MapT inner, default_fn_t default_fn) : _inner(duty::move(inner)), _default_fn(duty::move(default_fn))
    {
        DUTY_ASSERT(_default_fn.is_valid(), "defaulting_map requires a valid default function");
    }

    defaulting_map(defaulting_map&&) = default;
    defaulting_map& operator=(defaulting_map&&) = default;
    defaulting_map(defaulting_map const&) = delete;
    defaulting_map& operator=(defaulting_map const&) = delete;

    // iteration (stored entries only)
public:
    [[nodiscard]] auto begin() const { return _inner.begin(); }
    [[nodiscard]] auto end() const { return _inner.end(); }

    // queries
public:
    [[nodiscard]] isize size() const { return _inner.size(); }
    [[nodiscard]] bool is_empty() const { return _inner.is_empty(); }

    [[nodiscard]] bool contains_key(K const& key) const { return _inner.contains_key(key); }

    [[nodiscard]] MapT const& inner() const { return _inner; }

    // lookup
public:
    /// Returns the stored value, or default_fn(key) on a miss
    /// The result is never empty. The default value is recomputed on every miss and not stored.
    [[nodiscard]] duty::optional<V> get(K const& key) const
    {
        return _inner.get(key).or_else([&] { return duty::optional<V>(_default_fn(key)); });
    }

    /// Same as get(key).value()
    /// Never throws duty::key_not_found, but propagates whatever the default function throws.
    [[nodiscard]] V at(K const& key) const { return get(key).value(); }

    /// Forwarded to the inner map: the default function does not take part
    [[nodiscard]] V get_or_else(K const& key, duty::lazy<V> or_else) const
    {
        return _inner.get_or_else(key, duty::move(or_else));
    }

    /// Forwarded to the inner map: the default function does not take part
    V get_or_else_update(K const& key, duty::lazy<V> or_else)
    {
        return _inner.get_or_else_update(key, duty::move(or_else));
    }

    // mutation
public:
    void set(K const& key, V value) { _inner.set(key, duty::move(value)); }
    void put(entry_t entry) { _inner.put(duty::move(entry)); }

    // derived maps (plain, the default function is not carried over)
public:
    template <class F>
    [[nodiscard]] auto map_keys(F&& f) const
    {
        return _inner.map_keys(duty::forward<F>(f));
    }

    template <class F>
    [[nodiscard]] auto map_values(F&& f) const
    {
        return _inner.map_values(duty::forward<F>(f));
    }

    /// Wraps this decorator into another one, consuming it
    /// The new default function only answers misses of the whole inner chain (see class comment).
    template <class F>
    [[nodiscard]] duty::defaulting_map<K, V, defaulting_map> defaulting(F&& default_fn) &&
    {
        return duty::defaulting_map<K, V, defaulting_map>(duty::move(*this), duty::forward<F>(default_fn));
    }

    // conversion
public:
    [[nodiscard]] native_t to_native() const { return _inner.to_native(); }

    /// Debug rendering of the stored entries, e.g. defaulting_map{"a": 1}
    [[nodiscard]] std::string to_string() const
    {
        return duty::impl::entries_to_debug_string("defaulting_map", *this);
    }

    // comparison
public:
    /// Compares the stored entries only, on both sides
    template <duty::map_like OtherMapT>
    [[nodiscard]] bool same_content(OtherMapT const& other) const
    {
        return duty::impl::unwrap_defaults(_inner).same_content(other);
    }

    [[nodiscard]] friend bool operator==(defaulting_map const& lhs, defaulting_map const& rhs)
        requires requires(MapT const& m) { bool(m == m); }
    {
        return lhs._inner == rhs._inner;
    }

private:
    MapT _inner;
    default_fn_t _default_fn;
};

namespace duty
{
/// Creates an empty defaulting_map over a fresh duty::map<K, V>
/// Usage:
///   auto counts = duty::with_default<std::string, int>([](std::string const&) { return 0; });
template <class K, class V, class F>
[[nodiscard]] defaulting_map<K, V> with_default(F&& default_fn)
{
    return defaulting_map<K, V>(typename defaulting_map<K, V>::default_fn_t(duty::forward<F>(default_fn)));
}
} // namespace duty
