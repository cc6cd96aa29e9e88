////////////////////////////////////////////////////////////////////////////////
/// psi::ordmap diagnostic print unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/ordmap/print.hpp>

#include <gtest/gtest.h>

#include <string>
//------------------------------------------------------------------------------
namespace psi::ordmap {
//------------------------------------------------------------------------------

TEST( print, empty_map )
{
    testing::internal::CaptureStdout();
    print( ord_map<std::string, int>{} );
    EXPECT_EQ( testing::internal::GetCapturedStdout(), "The map is empty.\n" );
}

TEST( print, pairs_in_insertion_order )
{
    ord_map<std::string, int> const m{ { "foo", 1 }, { "bar", 2 }, { "baz", 3 } };
    testing::internal::CaptureStdout();
    print( m );
    EXPECT_EQ( testing::internal::GetCapturedStdout(), "{foo: 1, bar: 2, baz: 3} [3 pairs]\n" );
}

TEST( print, single_pair )
{
    testing::internal::CaptureStdout();
    print( ord_map<int, char>{ { 7, 'x' } } );
    EXPECT_EQ( testing::internal::GetCapturedStdout(), "{7: x} [1 pairs]\n" );
}

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
