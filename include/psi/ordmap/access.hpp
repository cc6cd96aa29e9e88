////////////////////////////////////////////////////////////////////////////////
/// Nested (key path) access for psi::ordmap::ord_map.
///
///   get_in           ( map, path( k1, k2, ... ) )            -> std::optional<leaf>
///   get_and_update_in( map, path( k1, k2, ... ), updater )   -> std::pair<Get, map>
///   put_in           ( map, path( k1, k2, ... ), value )     -> map
///   update_in        ( map, path( k1, k2, ... ), fn )        -> map
///
/// Descent through a value requires a nesting<> specialization for its type:
///   - ord_map values are nestable out of the box (statically nested maps),
///   - dynamically typed values (variants, boxes, ...) provide
///       using map_type = ord_map<...>;
///       static map_type const * get ( Value const & ); // nullptr: not a map
///       static Value             wrap( map_type      );
///
/// Reads short-circuit to std::nullopt on a missing key or a value that is not
/// a map. Writes rebuild every ancestor on the path (siblings are copied
/// untouched) and throw std::out_of_range for a missing intermediate key and
/// std::invalid_argument for an intermediate value that is not a map.
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

#include <cstddef>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace psi::ordmap
{
//------------------------------------------------------------------------------

/// Customization point: how to see a value as a nested ord_map.
/// User specializations are intended.
template <typename Value>
struct nesting {};

template <typename K, typename T, typename E, typename C>
struct nesting<ord_map<K, T, E, C>>
{
    using map_type = ord_map<K, T, E, C>;

    static constexpr map_type const * get ( map_type const & value ) noexcept { return &value; }
    static constexpr map_type         wrap( map_type         map   ) noexcept { return map; }
};

template <typename Value>
concept nestable = requires { typename nesting<Value>::map_type; };


template <typename... Keys>
struct key_path
{
    static std::size_t constexpr depth{ sizeof...( Keys ) };

    std::tuple<Keys...> keys;
};

template <typename... Keys>
[[nodiscard]] constexpr key_path<std::decay_t<Keys>...> path( Keys &&... keys )
{
    static_assert( sizeof...( Keys ) > 0, "psi::ordmap::path: a key path needs at least one key" );
    return { { std::forward<Keys>( keys )... } };
}


namespace detail
{
    template <typename Map, std::size_t Depth>
    struct path_leaf
    {
        using mapped_type = typename Map::mapped_type;
        static_assert( nestable<mapped_type>, "psi::ordmap: the key path descends below a value type without a nesting<> specialization" );
        using type = typename path_leaf<typename nesting<mapped_type>::map_type, Depth - 1>::type;
    };

    template <typename Map>
    struct path_leaf<Map, 1> { using type = typename Map::mapped_type; };

    template <std::size_t Level, typename Map, typename... Keys>
    std::optional<typename path_leaf<Map, sizeof...( Keys ) - Level>::type>
    get_in( Map const & map, std::tuple<Keys...> const & keys )
    {
        auto const pos{ map.find( std::get<Level>( keys ) ) };
        if ( pos == map.end() )
            return std::nullopt;
        if constexpr ( Level + 1 == sizeof...( Keys ) )
        {
            return pos->second;
        }
        else
        {
            using value_t = typename Map::mapped_type;
            auto const * const child{ nesting<value_t>::get( pos->second ) };
            if ( !child )
                return std::nullopt;
            return detail::get_in<Level + 1>( *child, keys );
        }
    }

    template <std::size_t Level, typename Map, typename... Keys, typename Updater>
    auto get_and_update_in( Map const & map, std::tuple<Keys...> const & keys, Updater & updater )
    {
        if constexpr ( Level + 1 == sizeof...( Keys ) )
        {
            return map.get_and_update( std::get<Level>( keys ), updater );
        }
        else
        {
            using value_t = typename Map::mapped_type;
            return map.get_and_update
            (
                std::get<Level>( keys ),
                [&]( std::optional<value_t> const & current )
                {
                    if ( !current )
                        throw_out_of_range( "psi::ordmap::get_and_update_in: missing intermediate key" );
                    auto const * const child{ nesting<value_t>::get( *current ) };
                    if ( !child )
                        throw_invalid_argument( "psi::ordmap::get_and_update_in: intermediate value is not a map" );
                    auto [ retrieved, updated_child ]{ detail::get_and_update_in<Level + 1>( *child, keys, updater ) };
                    return std::pair{ std::move( retrieved ), nesting<value_t>::wrap( std::move( updated_child ) ) };
                }
            );
        }
    }
} // namespace detail

template <typename Map, std::size_t Depth>
using path_leaf_t = typename detail::path_leaf<Map, Depth>::type;


template <typename Map, typename... Keys>
[[nodiscard]] std::optional<path_leaf_t<Map, sizeof...( Keys )>> get_in( Map const & map, key_path<Keys...> const & path )
requires is_ord_map<Map>
{
    return detail::get_in<0>( map, path.keys );
}

/// get_and_update applied at the end of the path, with every ancestor map
/// rebuilt around the updated child. The updater follows the get_and_update
/// protocol (see ord_map.hpp), remove_entry included.
template <typename Map, typename... Keys, typename Updater>
[[nodiscard]] auto get_and_update_in( Map const & map, key_path<Keys...> const & path, Updater && updater )
requires is_ord_map<Map>
{
    return detail::get_and_update_in<0>( map, path.keys, updater );
}

template <typename Map, typename... Keys, typename V>
[[nodiscard]] Map put_in( Map const & map, key_path<Keys...> const & path, V && value )
requires is_ord_map<Map>
{
    using leaf_t = path_leaf_t<Map, sizeof...( Keys )>;
    return get_and_update_in( map, path, [&]( std::optional<leaf_t> const & ) {
        return std::pair{ std::monostate{}, leaf_t( std::forward<V>( value ) ) };
    } ).second;
}

/// fn( std::optional<leaf> const & ) -> leaf; receives std::nullopt when the
/// last key is missing (the result is then appended).
template <typename Map, typename... Keys, typename Fn>
[[nodiscard]] Map update_in( Map const & map, key_path<Keys...> const & path, Fn && fn )
requires is_ord_map<Map>
{
    using leaf_t = path_leaf_t<Map, sizeof...( Keys )>;
    return get_and_update_in( map, path, [&]( std::optional<leaf_t> const & current ) {
        return std::pair{ std::monostate{}, leaf_t( std::invoke( fn, current ) ) };
    } ).second;
}

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
