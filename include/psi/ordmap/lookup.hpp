////////////////////////////////////////////////////////////////////////////////
/// Lookup infrastructure for psi::ordmap.
///
/// Provides:
///   - LookupType concept    : constrains heterogeneous lookup key types
///   - detail::find_index    : the linear key scan every lookup reduces to
///
/// Keys are compared for equality only (no ordering is ever required), so
/// the KeyEqual predicate plays the role a comparator plays for sorted
/// containers: a transparent KeyEqual (one with an is_transparent tag, e.g.
/// std::equal_to<>) admits any key type it can compare.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <boost/config.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::ordmap
{
//------------------------------------------------------------------------------

template <typename KeyEqual>
bool constexpr is_transparent_equality{ requires{ typename KeyEqual::is_transparent; } };

/// LookupType: K is a valid lookup key if either
///   (a) the equality predicate is transparent, or
///   (b) K is implicitly convertible to key_type (the predicate then performs
///       the conversion at each comparison, e.g. char const * vs std::string).
template <typename K, bool transparent_equality, typename StoredKeyType>
concept LookupType =
    transparent_equality ||
    std::convertible_to<K const &, StoredKeyType const &>;


namespace detail
{
    inline constexpr std::size_t npos{ static_cast<std::size_t>( -1 ) };

    // Key projection for pair sequences
    inline constexpr auto key_proj{ []<typename P>( P const & pair ) noexcept -> auto const & { return std::get<0>( pair ); } };

    /// Position of the pair holding `key`, npos if there is none.
    /// The linear scan is the only lookup primitive of the library.
    template <std::ranges::forward_range Pairs, typename KeyEqual, typename K>
    [[ nodiscard ]] BOOST_FORCEINLINE
    constexpr std::size_t find_index( Pairs const & pairs, KeyEqual const & eq, K const & key )
    {
        auto const pos{ std::ranges::find_if( pairs, [&]( auto const & stored ) { return eq( stored, key ); }, key_proj ) };
        if ( pos == std::ranges::end( pairs ) )
            return npos;
        return static_cast<std::size_t>( std::ranges::distance( std::ranges::begin( pairs ), pos ) );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
