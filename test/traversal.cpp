////////////////////////////////////////////////////////////////////////////////
/// psi::ordmap traversal unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/ordmap/traversal.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <functional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ordmap {
//------------------------------------------------------------------------------

using str_map   = ord_map<std::string, int>;
using deque_map = ord_map<int, int, std::equal_to<int>, std::deque<std::pair<int, int>>>;

template <typename Map>
concept sliceable = requires( Map const & m ) { slice( m, 0, 1 ); };

//==============================================================================
// Range interface
//==============================================================================

TEST( traversal, range_for_visits_insertion_order )
{
    str_map const m{ { "foo", 1 }, { "bar", 2 }, { "baz", 3 } };
    std::string visited;
    for ( auto const & [ key, value ] : m )
        visited += key;
    EXPECT_EQ( visited, "foobarbaz" );
}

TEST( traversal, transform_values )
{
    str_map const m{ { "foo", 1 }, { "bar", 2 } };
    auto const incremented{ from_tuples( m | std::views::transform( []( auto const & pair ) {
        return std::pair{ pair.first, pair.second + 1 };
    } ) ) };
    EXPECT_EQ( incremented, ( str_map{ { "foo", 2 }, { "bar", 3 } } ) );
}

TEST( traversal, reverse_iteration )
{
    str_map const m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    EXPECT_EQ( m.rbegin()->first, "c" );
    EXPECT_TRUE( std::ranges::equal( m | std::views::reverse | std::views::keys, std::vector<std::string>{ "c", "b", "a" } ) );
}

//==============================================================================
// count / member
//==============================================================================

TEST( traversal, count )
{
    EXPECT_EQ( count( str_map{} ), 0 );
    EXPECT_EQ( count( str_map{ { "a", 1 }, { "b", 2 } } ), 2 );
}

TEST( traversal, member_requires_key_and_value )
{
    str_map const m{ { "a", 1 }, { "b", 2 } };
    EXPECT_TRUE ( member( m, std::pair{ "a", 1 } ) );
    EXPECT_FALSE( member( m, std::pair{ "a", 2 } ) );
    EXPECT_FALSE( member( m, std::pair{ "z", 1 } ) );
    EXPECT_FALSE( member( str_map{}, std::pair{ "a", 1 } ) );
}

//==============================================================================
// reduce
//==============================================================================

TEST( traversal, reduce_plain_fold )
{
    str_map const m{ { "foo", 1 }, { "bar", 2 } };
    auto const incremented{ reduce( m, str_map{}, []( auto const & pair, str_map acc ) {
        return std::move( acc ).put( pair.first, pair.second + 1 );
    } ) };
    EXPECT_EQ( incremented.tuples(), ( std::vector<std::pair<std::string, int>>{ { "foo", 2 }, { "bar", 3 } } ) );

    EXPECT_EQ( reduce( str_map{}, 42, []( auto const &, int acc ) { return acc + 1; } ), 42 );
}

TEST( traversal, reduce_encoder )
{
    // the kind of consumer an object encoder is: keys and values in order
    str_map const m{ { "b", 2 }, { "a", 1 } };
    auto const json{ reduce( m, std::string{}, []( auto const & pair, std::string out ) {
        if ( !out.empty() )
            out += ',';
        out += '"' + pair.first + "\":" + std::to_string( pair.second );
        return out;
    } ) };
    EXPECT_EQ( '{' + json + '}', R"({"b":2,"a":1})" );
}

TEST( traversal, reduce_halts_early )
{
    str_map const m{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } };
    int visits{ 0 };
    auto const result{ reduce( m, 0, [ &visits ]( auto const & pair, int sum ) {
        ++visits;
        sum += pair.second;
        return sum >= 3 ? halt( sum ) : cont( sum );
    } ) };
    EXPECT_EQ( result, ( reduce_result<int>{ 3, true } ) );
    EXPECT_EQ( visits, 2 ) << "pairs after the halt must not be visited";
}

TEST( traversal, reduce_signalling_without_halt )
{
    str_map const m{ { "a", 1 }, { "b", 2 } };
    auto const result{ reduce( m, 0, []( auto const & pair, int sum ) { return cont( sum + pair.second ); } ) };
    EXPECT_EQ   ( result.acc, 3 );
    EXPECT_FALSE( result.halted );
}

//==============================================================================
// slice
//==============================================================================

TEST( traversal, slice )
{
    str_map const m{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } };

    auto const middle{ slice( m, 1, 2 ) };
    ASSERT_EQ( middle.size(), 2 );
    EXPECT_EQ( middle[ 0 ].first, "b" );
    EXPECT_EQ( middle[ 1 ].first, "c" );
    EXPECT_EQ( middle.data(), &*m.nth( 1 ) ) << "slice must view, not copy";
}

TEST( traversal, slice_clamps )
{
    str_map const m{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    EXPECT_EQ  ( slice( m, 1, 100 ).size(), 2 );
    EXPECT_TRUE( slice( m, 3, 1   ).empty() );
    EXPECT_TRUE( slice( m, 9, 1   ).empty() );
    EXPECT_TRUE( slice( m, 0, 0   ).empty() );
    EXPECT_TRUE( slice( str_map{}, 0, 1 ).empty() );
}

TEST( traversal, slice_only_for_contiguous_storage )
{
    static_assert(  sliceable<str_map  > );
    static_assert( !sliceable<deque_map> );

    deque_map const m{ { 1, 10 }, { 2, 20 } };
    EXPECT_EQ( reduce( m, 0, []( auto const & pair, int sum ) { return sum + pair.second; } ), 30 );
}

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
