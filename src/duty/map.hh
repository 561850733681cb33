#pragma once

#include <duty/fwd.hh>
#include <duty/lazy.hh>
#include <duty/optional.hh>
#include <duty/pair.hh>
#include <duty/to_debug_string.hh>
#include <duty/utility.hh>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>

// =========================================================================================================
// Associative containers
// =========================================================================================================
//
// duty::map<K, V>                    - hash map with optional-returning lookup (this header)
// duty::defaulting_map<K, V, MapT>   - decorator synthesizing values on lookup miss (<duty/defaulting_map.hh>)
// duty::map_like<M>                  - the contract both of them implement
//
// Lookup flavors:
//   get(key)                         - optional<V>, empty on miss
//   at(key)                          - V, throws duty::key_not_found on miss (defaulting_map: computes default)
//   get_or_else(key, fallback)       - V, fallback on miss, no mutation
//   get_or_else_update(key, fallback)- V, fallback on miss is evaluated once and stored
//

/// Thrown by duty::map::at when the key has no stored entry
struct duty::key_not_found : std::out_of_range
{
    using std::out_of_range::out_of_range;
};

namespace duty
{
/// The contract shared by duty::map and duty::defaulting_map
/// Generic code that only needs "some map" should be written against this concept.
template <class M>
concept map_like = requires(M& m,
                            M const& cm,
                            typename M::key_t const& key,
                            typename M::value_t const& value,
                            typename M::entry_t const& entry) {
    { cm.get(key) } -> std::same_as<duty::optional<typename M::value_t>>;
    { cm.at(key) } -> std::convertible_to<typename M::value_t>;
    { cm.contains_key(key) } -> std::same_as<bool>;
    { cm.get_or_else(key, value) } -> std::same_as<typename M::value_t>;
    { m.get_or_else_update(key, value) } -> std::same_as<typename M::value_t>;
    { cm.to_native() } -> std::same_as<std::unordered_map<typename M::key_t, typename M::value_t>>;
    { cm.size() } -> std::same_as<isize>;
    { cm.is_empty() } -> std::same_as<bool>;
    { *cm.begin() } -> std::same_as<typename M::entry_t const&>;
    cm.end();
    m.set(key, value);
    m.put(entry);
};

namespace impl
{
/// Strips all defaulting layers and returns the innermost plain map
/// Content comparisons must never see synthesized default values.
template <class M>
[[nodiscard]] constexpr auto const& unwrap_defaults(M const& m)
{
    if constexpr (requires { m.inner(); })
        return duty::impl::unwrap_defaults(m.inner());
    else
        return m;
}

/// Renders "name{k0: v0, k1: v1, ...}"
template <class EntryRange>
[[nodiscard]] std::string entries_to_debug_string(char const* name, EntryRange const& entries)
{
    auto const cfg = debug_string_config{};

    auto s = std::string(name);
    s += '{';
    auto const prefix_size = isize(s.size());
    for (auto const& [key, value] : entries)
    {
        if (isize(s.size()) >= cfg.max_length)
        {
            s += ", ...";
            break;
        }

        if (isize(s.size()) > prefix_size)
            s += ", ";
        s += duty::to_debug_string(key, cfg);
        s += ": ";
        s += duty::to_debug_string(value, cfg);
    }
    s += '}';
    return s;
}
} // namespace impl
} // namespace duty

/// Mutable hash map from K to V with unique keys
///
/// Thin layer over std::unordered_map that
///   - reports misses as empty optionals instead of exceptions or default-inserted values
///   - offers fallback lookups (get_or_else, get_or_else_update) taking a constant or a callable
///   - derives new maps by re-mapping keys or values
///   - compares by content (same_content, operator==)
///   - can be wrapped into a duty::defaulting_map via defaulting()
///
/// Iteration yields pair<K, V> const& in the unspecified order of the underlying hash map.
/// K must be hashable via std::hash<K> and equality comparable.
///
/// Usage:
///   auto m = duty::map<std::string, int>();
///   m.set("a", 1);
///   m.get("a");                              // some(1)
///   m.get("c");                              // empty
///   m.get_or_else("c", [] { return 99; });   // 99, m unchanged
///
/// Not thread-safe: concurrent mutation requires external synchronization.
template <class K, class V>
struct duty::map
{
    using key_t = K;
    using value_t = V;
    using entry_t = duty::pair<K, V>;
    using native_t = std::unordered_map<K, V>;

private:
    // entries keep their own copy of the key so iteration can hand out pair<K, V> const&
    using storage_t = std::unordered_map<K, entry_t>;

    // iteration
public:
    struct iterator
    {
        using value_type = entry_t;
        using difference_type = std::ptrdiff_t;
        using reference = entry_t const&;
        using pointer = entry_t const*;
        using iterator_category = std::forward_iterator_tag;

        typename storage_t::const_iterator it;

        reference operator*() const { return it->second; }
        pointer operator->() const { return &it->second; }

        iterator& operator++()
        {
            ++it;
            return *this;
        }
        iterator operator++(int)
        {
            auto const prev = *this;
            ++it;
            return prev;
        }

        friend bool operator==(iterator const&, iterator const&) = default;
    };

    [[nodiscard]] iterator begin() const { return {_entries.begin()}; }
    [[nodiscard]] iterator end() const { return {_entries.end()}; }

    // construction
public:
    map() = default;

    map(std::initializer_list<entry_t> entries)
    {
        for (auto const& e : entries)
            put(e);
    }

    [[nodiscard]] static map empty() { return map(); }

    /// Copies every entry of a std::unordered_map
    [[nodiscard]] static map from_native(native_t const& native)
    {
        auto result = map();
        for (auto const& [key, value] : native)
            result.set(key, value);
        return result;
    }

    // queries
public:
    [[nodiscard]] isize size() const { return isize(_entries.size()); }
    [[nodiscard]] bool is_empty() const { return _entries.empty(); }

    [[nodiscard]] bool contains_key(K const& key) const { return _entries.contains(key); }

    // lookup
public:
    /// Returns the stored value, or an empty optional on a miss
    [[nodiscard]] duty::optional<V> get(K const& key) const
    {
        auto const it = _entries.find(key);
        if (it == _entries.end())
            return duty::nullopt;

        return it->second.second;
    }

    /// Returns the stored value
    /// Throws duty::key_not_found if there is no entry for key
    [[nodiscard]] V at(K const& key) const
    {
        auto const it = _entries.find(key);
        if (it == _entries.end())
            throw duty::key_not_found("duty::map: key not found: " + duty::to_debug_string(key));

        return it->second.second;
    }

    /// Returns the stored value, or the evaluated fallback on a miss
    /// Never modifies the map.
    [[nodiscard]] V get_or_else(K const& key, duty::lazy<V> or_else) const
    {
        return get(key).value_or(duty::move(or_else));
    }

    /// Returns the stored value
    /// On a miss, evaluates the fallback exactly once, stores it under key, and returns it.
    /// If the fallback throws, the map is unchanged.
    /// If the fallback itself writes key, its result overwrites that write: the return value is what is stored.
    V get_or_else_update(K const& key, duty::lazy<V> or_else)
    {
        auto const it = _entries.find(key);
        if (it != _entries.end())
            return it->second.second;

        auto value = duty::move(or_else).evaluate();
        _entries.insert_or_assign(key, entry_t{key, value});
        return value;
    }

    // mutation
public:
    /// Inserts or overwrites the entry for key
    void set(K const& key, V value) { _entries.insert_or_assign(key, entry_t{key, duty::move(value)}); }

    /// Same as set(entry.first, entry.second)
    void put(entry_t entry)
    {
        auto key = entry.first;
        _entries.insert_or_assign(duty::move(key), duty::move(entry));
    }

    // derived maps
public:
    /// Returns a new map with f applied to every key, values unchanged
    /// If f maps several keys to the same new key, the entry visited last wins.
    /// Visiting order is the unspecified hash map order.
    template <class F>
    [[nodiscard]] auto map_keys(F&& f) const
    {
        using new_key_t = std::remove_cvref_t<std::invoke_result_t<F&, K const&>>;

        auto result = duty::map<new_key_t, V>();
        for (auto const& [key, value] : *this)
            result.set(duty::invoke(f, key), value);
        return result;
    }

    /// Returns a new map with f applied to every value, keys unchanged
    template <class F>
    [[nodiscard]] auto map_values(F&& f) const
    {
        using new_value_t = std::remove_cvref_t<std::invoke_result_t<F&, V const&>>;

        auto result = duty::map<K, new_value_t>();
        for (auto const& [key, value] : *this)
            result.set(key, duty::invoke(f, value));
        return result;
    }

    /// Wraps this map into a defaulting_map that synthesizes default_fn(key) on lookup misses
    /// Consumes the map: the decorator is the only owner of the entries afterwards.
    /// Usage:
    ///   auto d = duty::move(m).defaulting([](std::string const& k) { return int(k.size()); });
    template <class F>
    [[nodiscard]] duty::defaulting_map<K, V> defaulting(F&& default_fn) &&
    {
        return duty::defaulting_map<K, V>(duty::move(*this), duty::forward<F>(default_fn));
    }

    // conversion
public:
    /// Copies all entries into a std::unordered_map
    [[nodiscard]] native_t to_native() const
    {
        auto result = native_t();
        result.reserve(_entries.size());
        for (auto const& [key, value] : *this)
            result.emplace(key, value);
        return result;
    }

    /// Debug rendering, e.g. map{"a": 1, "b": 2}
    [[nodiscard]] std::string to_string() const { return duty::impl::entries_to_debug_string("map", *this); }

    // comparison
public:
    /// True iff both maps hold the same key-value pairs
    /// Works against any map_like; defaulting layers of other are ignored,
    /// only stored entries take part.
    template <duty::map_like OtherMapT>
    [[nodiscard]] bool same_content(OtherMapT const& other) const
    {
        auto const& plain = duty::impl::unwrap_defaults(other);
        if (plain.size() != size())
            return false;

        for (auto const& [key, value] : *this)
            if (!(plain.get(key) == value))
                return false;

        return true;
    }

    [[nodiscard]] friend bool operator==(map const& lhs, map const& rhs)
        requires requires(V const& v) { bool(v == v); }
    {
        return lhs.same_content(rhs);
    }

private:
    storage_t _entries;
};

// defaulting_map completes the map API
#include <duty/defaulting_map.hh>
