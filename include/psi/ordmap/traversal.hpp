////////////////////////////////////////////////////////////////////////////////
/// Traversal protocol for psi::ordmap::ord_map.
///
/// ord_map is itself a standard sized random access range (of const pairs)
/// so std::ranges algorithms and views apply directly. This header adds the
/// bulk consumers generic code (encoders, folds) expects:
///   - count ( map )                 : number of pairs
///   - member( map, pair )           : exact (key, value) presence
///   - reduce( map, acc, step )      : in-order fold with early termination
///   - slice ( map, start, length )  : O(1) sub-sequence for contiguous
///                                      backing containers only
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

#include <psi/ordmap/ord_map.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::ordmap
{
//------------------------------------------------------------------------------

static_assert( std::ranges::random_access_range<ord_map<int, int>> );
static_assert( std::ranges::sized_range        <ord_map<int, int>> );

//==============================================================================
// reduce step signalling
//==============================================================================

enum class reduce_signal : bool { cont, halt };

/// What a step function returns when it wants to be able to stop the
/// traversal early.
template <typename Acc>
struct reduce_step
{
    reduce_signal signal;
    Acc           acc;
};

template <typename Acc> [[nodiscard]] constexpr reduce_step<std::decay_t<Acc>> cont( Acc && acc ) { return { reduce_signal::cont, std::forward<Acc>( acc ) }; }
template <typename Acc> [[nodiscard]] constexpr reduce_step<std::decay_t<Acc>> halt( Acc && acc ) { return { reduce_signal::halt, std::forward<Acc>( acc ) }; }

template <typename Acc>
struct reduce_result
{
    Acc  acc;
    bool halted;

    friend bool operator==( reduce_result const &, reduce_result const & ) = default;
};

namespace detail
{
    template <typename T>   bool constexpr is_reduce_step                  { false };
    template <typename Acc> bool constexpr is_reduce_step<reduce_step<Acc>>{ true  };
} // namespace detail


//==============================================================================
// Traversal
//==============================================================================

template <typename K, typename T, typename E, typename C>
[[nodiscard]] constexpr auto count( ord_map<K, T, E, C> const & map ) noexcept { return map.size(); }

/// Is the exact pair (equal key and equal value) present?
template <typename K, typename T, typename E, typename C, typename Pair>
[[nodiscard]] bool member( ord_map<K, T, E, C> const & map, Pair const & pair )
{
    auto const & [ key, value ]{ pair };
    auto const pos{ map.find( key ) };
    return ( pos != map.end() ) && ( pos->second == value );
}

/// Folds the pairs in order: step( pair, acc ) returns either the next
/// accumulator or a reduce_step (cont()/halt()). The plain form returns the
/// final accumulator, the signalling form a reduce_result recording whether
/// the traversal was halted (the remaining pairs are then never visited).
// Map deduced as is (not as ord_map<...>): keeps this overload more
// specialized than an ADL found std::reduce( first, last, init ).
template <typename Map, typename Acc, typename Step>
[[nodiscard]] auto reduce( Map const & map, Acc acc, Step && step )
requires is_ord_map<Map>
{
    using pair_t    = typename Map::value_type;
    using outcome_t = std::remove_cvref_t<std::invoke_result_t<Step &, pair_t const &, Acc &&>>;

    if constexpr ( detail::is_reduce_step<outcome_t> )
    {
        static_assert( std::is_same_v<decltype( outcome_t::acc ), Acc>, "psi::ordmap::reduce: the step must preserve the accumulator type" );
        for ( auto const & pair : map )
        {
            auto step_result{ std::invoke( step, pair, std::move( acc ) ) };
            acc = std::move( step_result.acc );
            if ( step_result.signal == reduce_signal::halt )
                return reduce_result<Acc>{ std::move( acc ), true };
        }
        return reduce_result<Acc>{ std::move( acc ), false };
    }
    else
    {
        for ( auto const & pair : map )
            acc = std::invoke( step, pair, std::move( acc ) );
        return acc;
    }
}

/// Sub-sequence [start, start + length) clamped to the map, as a view into
/// its storage (valid while the map lives).
template <typename K, typename T, typename E, typename C>
[[nodiscard]] std::span<std::pair<K, T> const> slice( ord_map<K, T, E, C> const & map, std::size_t const start, std::size_t const length ) noexcept
requires std::ranges::contiguous_range<C>
{
    std::span<std::pair<K, T> const> const all{ map.tuples() };
    if ( start >= all.size() )
        return {};
    auto const clamped{ std::min( length, all.size() - start ) };
    BOOST_ASSERT( start + clamped <= all.size() );
    return all.subspan( start, clamped );
}

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
