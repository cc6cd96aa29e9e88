////////////////////////////////////////////////////////////////////////////////
/// ord_map: insertion ordered associative container
///
/// A map that remembers the order in which its keys were first inserted.
/// Storage is a single sequence of (key, value) pairs and lookups are linear
/// scans using an equality predicate (no hashing, no ordering requirement on
/// the key type).
///
/// Value semantics / immutability:
///   ord_map only grants const access to its elements. Every 'modifier'
///   (put, replace, erase, pop, get_and_update, merge) is a const-callable
///   member returning a new ord_map and leaving the source untouched. Invoked
///   on an rvalue the operation reuses the source storage (deducing this), so
///   chained calls on temporaries do not copy.
///
/// Pair sources:
///   Every free function operation also accepts a raw ordered sequence of
///   pairs (any input range of two-element pair-like values, e.g.
///   std::vector<std::pair<K, V>> or std::map<K, V>) in place of an ord_map.
///   Such sources are normalized to the wrapped form first; the result is
///   always an ord_map.
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

#include <psi/ordmap/detail/config.hpp>
#include <psi/ordmap/lookup.hpp>

#include <boost/assert.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ordmap
{
//------------------------------------------------------------------------------

//==============================================================================
// get_and_update updater protocol
//
// The updater receives the current value (std::nullopt if the key is absent)
// and returns either
//   - std::pair<Get, T>      : store the second member under the key and
//                               report the first, or
//   - update_result<Get, T>  : the same pair, or remove_entry to delete the
//                               key (Get must then be constructible from
//                               std::optional<T>, it receives the old value).
//==============================================================================
struct remove_t { explicit remove_t() = default; };
inline constexpr remove_t remove_entry{};

template <typename Get, typename T>
using update_result = std::variant<std::pair<Get, T>, remove_t>;


namespace detail
{
    template <typename P>
    concept pair_like = requires { std::tuple_size<std::remove_cvref_t<P>>::value; } &&
                        ( std::tuple_size_v<std::remove_cvref_t<P>> == 2 );

    // Key/mapped types of a raw sequence element (std::pair<K const, V> of
    // associative containers included).
    template <typename P>
    struct pair_types
    {
        static_assert( pair_like<P>, "psi::ordmap: a raw pair sequence must hold two-element (key, value) pair-like elements" );

        using checked_type = std::conditional_t<pair_like<P>, std::remove_cvref_t<P>, std::pair<int, int>>;
        using key_type     = std::remove_cvref_t<std::tuple_element_t<0, checked_type>>;
        using mapped_type  = std::remove_cvref_t<std::tuple_element_t<1, checked_type>>;
    };

    template <typename Outcome, typename T>
    struct update_traits
    {
        static_assert( sizeof( Outcome ) == 0, "psi::ordmap::get_and_update: the updater must return std::pair<Get, T> or update_result<Get, T>" );
    };

    template <typename Get, typename U, typename T> requires std::convertible_to<U, T>
    struct update_traits<std::pair<Get, U>, T>
    {
        using get_type = Get;
        static bool constexpr can_remove{ false };
        static constexpr auto & update( std::pair<Get, U> & outcome ) noexcept { return outcome; }
    };

    template <typename Get, typename U, typename T> requires std::convertible_to<U, T>
    struct update_traits<std::variant<std::pair<Get, U>, remove_t>, T>
    {
        using get_type = Get;
        static bool constexpr can_remove{ true };
        static constexpr auto & update( std::variant<std::pair<Get, U>, remove_t> & outcome ) noexcept { return *std::get_if<0>( &outcome ); }
    };
} // namespace detail


//==============================================================================
// ord_map
//==============================================================================

template
<
    typename Key,
    typename T,
    typename KeyEqual  = std::equal_to<Key>,
    typename Container = std::vector<std::pair<Key, T>>
>
class ord_map
{
    static_assert( std::is_same_v<std::pair<Key, T>, typename Container::value_type>, "Container::value_type must be std::pair<Key, T>" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type               = Key;
    using mapped_type            = T;
    using value_type             = std::pair<key_type, mapped_type>;
    using key_equal              = KeyEqual;
    using container_type         = Container;
    using size_type              = typename Container::size_type;
    using difference_type        = typename Container::difference_type;
    using reference              = value_type const &;
    using const_reference        = value_type const &;
    using iterator               = typename Container::const_iterator;
    using const_iterator         = iterator;
    using reverse_iterator       = std::reverse_iterator<const_iterator>;
    using const_reverse_iterator = reverse_iterator;

    static auto constexpr transparent_equality{ is_transparent_equality<KeyEqual> };

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    ord_map() = default;

    explicit ord_map( KeyEqual const & eq ) noexcept( std::is_nothrow_copy_constructible_v<KeyEqual> )
        : eq_{ eq } {}

    /// Wraps an ordered sequence of unique-keyed pairs, preserving its order.
    explicit ord_map( Container tuples, KeyEqual const & eq = KeyEqual{} )
        : tuples_{ std::move( tuples ) }, eq_{ eq }
    {
        verify_unique();
    }

    /// Any range of pairs, including unordered associative containers (in
    /// which case the resulting order is their native enumeration order).
    template <std::ranges::input_range R>
    ord_map( std::from_range_t, R && rg, KeyEqual const & eq = KeyEqual{} )
        : eq_{ eq }
    {
        static_assert( detail::pair_like<std::ranges::range_reference_t<R>>, "psi::ordmap: a raw pair sequence must hold two-element (key, value) pair-like elements" );
        if constexpr ( std::ranges::sized_range<R> && requires{ tuples_.reserve( size_type{} ); } )
            tuples_.reserve( static_cast<size_type>( std::ranges::size( rg ) ) );
        for ( auto && pair : rg )
            tuples_.emplace_back( std::get<0>( std::forward<decltype( pair )>( pair ) ), std::get<1>( std::forward<decltype( pair )>( pair ) ) );
        verify_unique();
    }

    ord_map( std::initializer_list<value_type> const il, KeyEqual const & eq = KeyEqual{} )
        : tuples_( il.begin(), il.end() ), eq_{ eq }
    {
        verify_unique();
    }

    ord_map( ord_map const & ) = default;
    ord_map( ord_map && )      = default;

    ord_map & operator=( ord_map const & ) = default;
    ord_map & operator=( ord_map && )      = default;

    //--------------------------------------------------------------------------
    // Iterators (all const)
    //--------------------------------------------------------------------------
    const_iterator begin() const noexcept { return tuples_.begin(); }
    const_iterator end  () const noexcept { return tuples_.end  (); }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[nodiscard]] bool      empty   () const noexcept { return tuples_.empty(); }
    [[nodiscard]] size_type size    () const noexcept { return static_cast<size_type>( tuples_.size() ); }
    [[nodiscard]] size_type max_size() const noexcept { return tuples_.max_size(); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<transparent_equality, key_type> K = key_type>
    [[nodiscard]] const_iterator find( K const & key ) const {
        auto const pos{ find_index( key ) };
        return ( pos == detail::npos ) ? end() : nth( pos );
    }

    template <LookupType<transparent_equality, key_type> K = key_type>
    [[nodiscard]] bool contains( K const & key ) const { return find_index( key ) != detail::npos; }

    /// Position of key in insertion order.
    template <LookupType<transparent_equality, key_type> K = key_type>
    [[nodiscard]] std::optional<size_type> index_of( K const & key ) const {
        auto const pos{ find_index( key ) };
        if ( pos == detail::npos )
            return std::nullopt;
        return static_cast<size_type>( pos );
    }

    template <LookupType<transparent_equality, key_type> K = key_type>
    mapped_type const & at( K const & key ) const {
        auto const pos{ find_index( key ) };
        if ( pos == detail::npos )
            detail::throw_out_of_range( "psi::ordmap::ord_map::at" );
        return nth( pos )->second;
    }

    /// Primitive lookup: engaged iff a pair with an equal key exists.
    template <LookupType<transparent_equality, key_type> K = key_type>
    [[nodiscard]] std::optional<mapped_type> fetch( K const & key ) const {
        auto const pos{ find_index( key ) };
        if ( pos == detail::npos )
            return std::nullopt;
        return nth( pos )->second;
    }

    template <LookupType<transparent_equality, key_type> K = key_type>
    [[nodiscard]] std::optional<mapped_type> get( K const & key ) const { return fetch( key ); }

    template <LookupType<transparent_equality, key_type> K = key_type, typename D>
    [[nodiscard]] mapped_type get( K const & key, D && default_value ) const requires std::constructible_from<mapped_type, D &&> {
        if ( auto found{ fetch( key ) } )
            return *std::move( found );
        return mapped_type( std::forward<D>( default_value ) );
    }

    //--------------------------------------------------------------------------
    // Positional access
    //--------------------------------------------------------------------------
    [[nodiscard]] const_iterator nth( std::size_t const n ) const noexcept {
        BOOST_ASSERT( n <= tuples_.size() );
        return std::next( begin(), static_cast<difference_type>( n ) );
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[nodiscard]] key_equal key_eq() const noexcept { return eq_; }

    /// The wrapped pair sequence.
    [[nodiscard]] container_type const & tuples() const noexcept { return tuples_; }

    [[nodiscard]] auto keys  () const noexcept { return std::views::keys  ( tuples_ ); }
    [[nodiscard]] auto values() const noexcept { return std::views::values( tuples_ ); }

    container_type extract() && noexcept( std::is_nothrow_move_constructible_v<Container> ) { return std::move( tuples_ ); }

    //--------------------------------------------------------------------------
    // Modifiers: each returns a new ord_map
    //--------------------------------------------------------------------------

    /// Replaces the value of an existing key in place or appends a new pair.
    template <typename Self, typename K, typename M>
    [[nodiscard]] ord_map put( this Self && self, K && key, M && value ) requires std::constructible_from<value_type, K &&, M &&> {
        ord_map result( std::forward<Self>( self ) );
        result.assign_or_append( std::forward<K>( key ), std::forward<M>( value ) );
        return result;
    }

    /// Like put but never inserts: a missing key leaves the result equal to
    /// the source.
    template <typename Self, LookupType<transparent_equality, key_type> K, typename M>
    [[nodiscard]] ord_map replace( this Self && self, K const & key, M && value ) {
        ord_map result( std::forward<Self>( self ) );
        if ( auto const pos{ result.find_index( key ) }; pos != detail::npos )
            result.mutable_nth( pos )->second = std::forward<M>( value );
        return result;
    }

    template <typename Self, LookupType<transparent_equality, key_type> K>
    [[nodiscard]] ord_map erase( this Self && self, K const & key ) {
        ord_map result( std::forward<Self>( self ) );
        if ( auto const pos{ result.find_index( key ) }; pos != detail::npos )
            result.tuples_.erase( result.mutable_nth( pos ) );
        return result;
    }

    /// (value, map without key); (nullopt, unchanged map) for a missing key.
    template <typename Self, LookupType<transparent_equality, key_type> K>
    [[nodiscard]] std::pair<std::optional<mapped_type>, ord_map> pop( this Self && self, K const & key ) {
        ord_map result( std::forward<Self>( self ) );
        auto const pos{ result.find_index( key ) };
        if ( pos == detail::npos )
            return { std::nullopt, std::move( result ) };
        auto const it{ result.mutable_nth( pos ) };
        std::optional<mapped_type> value{ std::move( it->second ) };
        result.tuples_.erase( it );
        return { std::move( value ), std::move( result ) };
    }

    template <typename Self, LookupType<transparent_equality, key_type> K, typename D>
    [[nodiscard]] std::pair<mapped_type, ord_map> pop( this Self && self, K const & key, D && default_value ) requires std::constructible_from<mapped_type, D &&> {
        auto [ value, rest ]{ std::forward<Self>( self ).pop( key ) };
        if ( value )
            return { *std::move( value ), std::move( rest ) };
        return { mapped_type( std::forward<D>( default_value ) ), std::move( rest ) };
    }

    /// Reads and updates (or removes) the value under key in a single pass.
    /// See the updater protocol above.
    template <typename Self, typename K, typename Updater>
    [[nodiscard]] auto get_and_update( this Self && self, K && key, Updater && updater ) requires std::invocable<Updater &, std::optional<mapped_type> const &>
    {
        using outcome_t = std::remove_cvref_t<std::invoke_result_t<Updater &, std::optional<mapped_type> const &>>;
        using traits    = detail::update_traits<outcome_t, mapped_type>;
        using get_type  = typename traits::get_type;
        using result_t  = std::pair<get_type, ord_map>;

        ord_map result( std::forward<Self>( self ) );
        auto const pos{ result.find_index( key ) };
        std::optional<mapped_type> current;
        if ( pos != detail::npos )
            current.emplace( result.nth( pos )->second );

        auto outcome{ std::invoke( updater, std::as_const( current ) ) };

        if constexpr ( traits::can_remove )
        {
            if ( std::holds_alternative<remove_t>( outcome ) )
            {
                static_assert( std::is_constructible_v<get_type, std::optional<mapped_type> &&>, "psi::ordmap::get_and_update: removal reports the previous value, Get must be constructible from std::optional<T>" );
                if ( pos != detail::npos )
                    result.tuples_.erase( result.mutable_nth( pos ) );
                return result_t{ get_type( std::move( current ) ), std::move( result ) };
            }
        }

        auto & update{ traits::update( outcome ) };
        if ( pos != detail::npos )
            result.mutable_nth( pos )->second = std::move( update.second );
        else
            result.tuples_.emplace_back( std::forward<K>( key ), std::move( update.second ) );
        return result_t{ std::move( update.first ), std::move( result ) };
    }

    /// All pairs of this map with the pairs of other put over them: existing
    /// keys keep their position, new keys are appended in other's order.
    template <typename Self, std::ranges::input_range Other>
    [[nodiscard]] ord_map merge( this Self && self, Other && other ) {
        static_assert( detail::pair_like<std::ranges::range_reference_t<Other>>, "psi::ordmap: a raw pair sequence must hold two-element (key, value) pair-like elements" );
        ord_map result( std::forward<Self>( self ) );
        for ( auto && pair : other )
        {
            auto && [ key, value ]{ pair };
            result.assign_or_append( key, value );
        }
        return result;
    }

    //--------------------------------------------------------------------------
    // Comparison: order sensitive
    //--------------------------------------------------------------------------
    friend bool operator==( ord_map const & a, ord_map const & b ) {
        return a.tuples_ == b.tuples_;
    }

    //--------------------------------------------------------------------------
    // Private helpers
    //--------------------------------------------------------------------------
private:
    template <typename K>
    [[nodiscard]] std::size_t find_index( K const & key ) const { return detail::find_index( tuples_, eq_, key ); }

    [[nodiscard]] auto mutable_nth( std::size_t const n ) noexcept {
        BOOST_ASSERT( n < tuples_.size() );
        return std::next( tuples_.begin(), static_cast<difference_type>( n ) );
    }

    template <typename K, typename M>
    void assign_or_append( K && key, M && value ) {
        if ( auto const pos{ find_index( key ) }; pos != detail::npos )
            mutable_nth( pos )->second = std::forward<M>( value );
        else
            tuples_.emplace_back( std::forward<K>( key ), std::forward<M>( value ) );
    }

    void verify_unique() const {
        if constexpr ( verify_unique_keys )
        {
            for ( auto first{ tuples_.begin() }; first != tuples_.end(); ++first )
            {
                for ( auto second{ std::next( first ) }; second != tuples_.end(); ++second )
                {
                    if ( eq_( first->first, second->first ) )
                        detail::throw_invalid_argument( "psi::ordmap::ord_map: duplicate key in pair sequence" );
                }
            }
        }
    }

    //--------------------------------------------------------------------------
    // Data members
    //--------------------------------------------------------------------------
    container_type tuples_;
    PSI_ORDMAP_NO_UNIQUE_ADDRESS
    key_equal      eq_;
}; // class ord_map

//------------------------------------------------------------------------------
// Deduction guides
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Alloc>
ord_map( std::vector<std::pair<Key, T>, Alloc> )
    -> ord_map<Key, T, std::equal_to<Key>, std::vector<std::pair<Key, T>, Alloc>>;

template <std::ranges::input_range R>
ord_map( std::from_range_t, R && )
    -> ord_map<typename detail::pair_types<std::ranges::range_value_t<R>>::key_type,
               typename detail::pair_types<std::ranges::range_value_t<R>>::mapped_type>;


//==============================================================================
// Pair sources: ord_map or raw pair sequence
//==============================================================================

template <typename T> bool constexpr is_ord_map{ false };
template <typename K, typename T, typename E, typename C> bool constexpr is_ord_map<ord_map<K, T, E, C>>{ true };

template <typename S>
concept pair_source = is_ord_map<std::remove_cvref_t<S>> || std::ranges::input_range<S>;

namespace detail
{
    template <typename S> struct source_map;

    template <typename S> requires is_ord_map<std::remove_cvref_t<S>>
    struct source_map<S> { using type = std::remove_cvref_t<S>; };

    template <typename S> requires( !is_ord_map<std::remove_cvref_t<S>> && std::ranges::input_range<S> )
    struct source_map<S>
    {
        using pairs = pair_types<std::ranges::range_value_t<S>>;
        using type  = ord_map<typename pairs::key_type, typename pairs::mapped_type>;
    };
} // namespace detail

/// The ord_map type a pair source normalizes to.
template <pair_source S>
using source_map_t = typename detail::source_map<S>::type;

/// Identity for ord_maps (forwarded, no copy), a freshly wrapped ord_map for
/// raw pair sequences.
template <pair_source S>
[[nodiscard]] constexpr decltype( auto ) normalize( S && source )
{
    if constexpr ( is_ord_map<std::remove_cvref_t<S>> )
        return std::forward<S>( source );
    else
        return source_map_t<S>( std::from_range, std::forward<S>( source ) );
}


//==============================================================================
// Construction
//==============================================================================

/// An ord_map from another ord_map (returned as is), an associative
/// container (in its enumeration order) or an ordered pair sequence.
template <pair_source S>
[[nodiscard]] source_map_t<S> make_ord_map( S && source ) { return normalize( std::forward<S>( source ) ); }

template <std::ranges::input_range R>
[[nodiscard]] source_map_t<R> from_tuples( R && tuples ) requires( !is_ord_map<std::remove_cvref_t<R>> ) { return make_ord_map( std::forward<R>( tuples ) ); }


//==============================================================================
// Operations on pair sources
//==============================================================================

template <pair_source S, typename K>
[[nodiscard]] auto fetch( S && source, K const & key ) { return normalize( std::forward<S>( source ) ).fetch( key ); }

template <pair_source S, typename K>
[[nodiscard]] auto get( S && source, K const & key ) { return normalize( std::forward<S>( source ) ).get( key ); }

template <pair_source S, typename K, typename D>
[[nodiscard]] auto get( S && source, K const & key, D && default_value ) {
    return normalize( std::forward<S>( source ) ).get( key, std::forward<D>( default_value ) );
}

template <pair_source S>
[[nodiscard]] auto keys( S && source ) {
    decltype( auto ) map = normalize( std::forward<S>( source ) );
    auto const view{ map.keys() };
    return std::vector<typename source_map_t<S>::key_type>( view.begin(), view.end() );
}

template <pair_source S>
[[nodiscard]] auto values( S && source ) {
    decltype( auto ) map = normalize( std::forward<S>( source ) );
    auto const view{ map.values() };
    return std::vector<typename source_map_t<S>::mapped_type>( view.begin(), view.end() );
}

template <pair_source S, typename K, typename M>
[[nodiscard]] auto put( S && source, K && key, M && value ) {
    return normalize( std::forward<S>( source ) ).put( std::forward<K>( key ), std::forward<M>( value ) );
}

template <pair_source S, typename K, typename M>
[[nodiscard]] auto replace( S && source, K const & key, M && value ) {
    return normalize( std::forward<S>( source ) ).replace( key, std::forward<M>( value ) );
}

template <pair_source S, typename K>
[[nodiscard]] auto erase( S && source, K const & key ) { return normalize( std::forward<S>( source ) ).erase( key ); }

template <pair_source S, typename K>
[[nodiscard]] auto pop( S && source, K const & key ) { return normalize( std::forward<S>( source ) ).pop( key ); }

template <pair_source S, typename K, typename D>
[[nodiscard]] auto pop( S && source, K const & key, D && default_value ) {
    return normalize( std::forward<S>( source ) ).pop( key, std::forward<D>( default_value ) );
}

template <pair_source S, typename K, typename Updater>
[[nodiscard]] auto get_and_update( S && source, K && key, Updater && updater ) {
    return normalize( std::forward<S>( source ) ).get_and_update( std::forward<K>( key ), std::forward<Updater>( updater ) );
}

template <pair_source A, pair_source B>
[[nodiscard]] auto merge( A && a, B && b ) {
    return normalize( std::forward<A>( a ) ).merge( std::forward<B>( b ) );
}

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
