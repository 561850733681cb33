#pragma once

#include <duty/fwd.hh>
#include <duty/utility.hh>

#include <cstddef>
#include <utility>

/// Entry type of duty::map: first is the key, second the value
///
/// A plain aggregate, so {key, value} braces build one and structured bindings decompose it.
/// Equality is memberwise. There is no ordering.
/// The tuple protocol below lets generic code (e.g. duty::to_debug_string) treat it like std::pair.
template <class T, class U>
struct duty::pair
{
    using first_t = T;
    using second_t = U;

    T first;
    U second;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;
};

// =========================================================================================================
// Tuple protocol
// =========================================================================================================

namespace duty
{
template <std::size_t I, class T, class U>
[[nodiscard]] constexpr auto& get(pair<T, U>& p) noexcept
{
    static_assert(I < 2, "duty::pair has two elements");
    if constexpr (I == 0)
        return p.first;
    else
        return p.second;
}

template <std::size_t I, class T, class U>
[[nodiscard]] constexpr auto const& get(pair<T, U> const& p) noexcept
{
    static_assert(I < 2, "duty::pair has two elements");
    if constexpr (I == 0)
        return p.first;
    else
        return p.second;
}

template <std::size_t I, class T, class U>
[[nodiscard]] constexpr auto&& get(pair<T, U>&& p) noexcept
{
    return duty::move(duty::get<I>(p));
}
} // namespace duty

template <class T, class U>
struct std::tuple_size<duty::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <class T, class U>
struct std::tuple_element<0, duty::pair<T, U>>
{
    using type = T;
};

template <class T, class U>
struct std::tuple_element<1, duty::pair<T, U>>
{
    using type = U;
};
