////////////////////////////////////////////////////////////////////////////////
/// Diagnostic dump of an ord_map to stdout.
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

#include <cstdio>
#include <format>
#include <print>
//------------------------------------------------------------------------------
namespace psi::ordmap
{
//------------------------------------------------------------------------------

/// Prints the pairs in insertion order, e.g.
///   {a: 1, b: 2} [2 pairs]
template <typename K, typename T, typename E, typename C>
requires std::formattable<K, char> && std::formattable<T, char>
void print( ord_map<K, T, E, C> const & map )
{
    if ( map.empty() )
    {
        std::puts( "The map is empty." );
        return;
    }

    std::putchar( '{' );
    auto remaining{ map.size() };
    for ( auto const & [ key, value ] : map )
    {
        std::print( "{}: {}", key, value );
        if ( --remaining )
            std::print( ", " );
    }
    std::println( "}} [{} pairs]", map.size() );
}

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
