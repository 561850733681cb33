#pragma once

#include <duty/fwd.hh>

#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace duty
{
struct debug_string_config
{
    // soft limit, sequences stop appending once they are past it
    isize max_length = 100;
};

/// Renders a map key or value for map::to_string and duty::key_not_found messages
///
/// Rules, first match wins:
///   string-like        "text"
///   char               'c', with escapes for control characters
///   member to_string() whatever it returns (nested duty::map values)
///   range              [e0, e1, ...]
///   tuple-like         (e0, e1, ...), e.g. duty::pair values
///   std::formattable   std::format("{}", v)
///   anything else      <opaque N bytes>
///
/// Diagnostics only, the output format may change at any time.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
inline void append_escaped_char(std::string& s, char c)
{
    switch (c)
    {
    case '\0': s += "\\0"; return;
    case '\a': s += "\\a"; return;
    case '\b': s += "\\b"; return;
    case '\t': s += "\\t"; return;
    case '\n': s += "\\n"; return;
    case '\v': s += "\\v"; return;
    case '\f': s += "\\f"; return;
    case '\r': s += "\\r"; return;
    case '\'': s += "\\'"; return;
    case '\\': s += "\\\\"; return;
    default: break;
    }

    auto const u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7F)
        s += std::format("\\x{:02X}", u);
    else
        s += c;
}

/// Appends ", e" or ", ..." and reports whether there is room for more
template <class T>
bool append_sequence_element(std::string& s, isize first_pos, T const& e, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (isize(s.size()) > first_pos)
        s += ", ";
    s += duty::to_debug_string(e, cfg);
    return true;
}

template <class Range>
std::string range_to_debug_string(Range const& r, debug_string_config const& cfg)
{
    auto s = std::string("[");
    for (auto const& e : r)
        if (!duty::impl::append_sequence_element(s, 1, e, cfg))
            break;
    s += ']';
    return s;
}

template <class Tuple, std::size_t... I>
std::string tuple_to_debug_string(Tuple const& t, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    auto s = std::string("(");
    (void)(duty::impl::append_sequence_element(s, 1, get<I>(t), cfg) && ...);
    s += ')';
    return s;
}

template <class T>
concept debug_string_range = requires(T const& v) {
    std::begin(v);
    std::end(v);
};

template <class T>
concept debug_string_tuple = requires { std::tuple_size<T>::value; };
} // namespace impl

template <class T>
std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (std::is_convertible_v<T const&, std::string_view>)
    {
        return std::format("\"{}\"", std::string_view(v));
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");
        duty::impl::append_escaped_char(s, v);
        s += '\'';
        return s;
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (duty::impl::debug_string_range<T>)
    {
        return duty::impl::range_to_debug_string(v, cfg);
    }
    else if constexpr (duty::impl::debug_string_tuple<T>)
    {
        return duty::impl::tuple_to_debug_string(v, cfg, std::make_index_sequence<std::tuple_size_v<T>>{});
    }
    else if constexpr (std::formattable<T, char>)
    {
        return std::format("{}", v);
    }
    else
    {
        return std::format("<opaque {} bytes>", sizeof(T));
    }
}
} // namespace duty
