////////////////////////////////////////////////////////////////////////////////
/// sbo::small_set unit tests
////////////////////////////////////////////////////////////////////////////////

#include <sbo/containers/small_set.hpp>

#include <gtest/gtest.h>

#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace sbo {
//------------------------------------------------------------------------------

TEST( small_set, default_construction )
{
    small_set<int, 2> s;
    EXPECT_TRUE( s.empty    () );
    EXPECT_TRUE( s.is_inline() );
    EXPECT_EQ  ( s.size(), 0 );
    EXPECT_EQ  ( s.get_index( 0 ), nullptr );
    EXPECT_FALSE( s.contains( 0 ) );
}

TEST( small_set, insert )
{
    small_set<int, 2> s;
    EXPECT_TRUE ( s.insert( 1 ) );
    EXPECT_FALSE( s.insert( 1 ) );
    EXPECT_TRUE ( s.insert( 2 ) );
    EXPECT_TRUE ( s.is_inline() );

    EXPECT_TRUE ( s.insert( 3 ) );
    EXPECT_FALSE( s.is_inline() );
    EXPECT_FALSE( s.insert( 2 ) );
    EXPECT_EQ   ( s.size(), 3 );

    EXPECT_EQ( s.get_index_of( 1 ), 0 );
    EXPECT_EQ( s.get_index_of( 3 ), 2 );
    EXPECT_EQ( *s.get_index( 1 ), 2 );
    EXPECT_EQ(  s.get_index( 3 ), nullptr );
}

TEST( small_set, literal_duplicates_are_dropped )
{
    small_set<int, 2> const s{ 0, 0 };
    EXPECT_EQ( s.size(), 1 );
    EXPECT_TRUE( s.contains( 0 ) );

    small_set<int, 2> const wide{ 3, 1, 3, 2, 1 };
    EXPECT_FALSE( wide.is_inline() );
    EXPECT_EQ( std::vector<int>( wide.begin(), wide.end() ), ( std::vector<int>{ 3, 1, 2 } ) );
}

TEST( small_set, known_unique_construction )
{
    small_set<int, 3> const s{ known_unique, { 5, 6 } };
    EXPECT_EQ( s.size(), 2 );
    EXPECT_TRUE( s.is_inline() );

    auto const literal{ make_inline_set( 7, 8, 9 ) };
    static_assert( std::remove_cvref_t<decltype( literal )>::inline_capacity() == 3 );
    EXPECT_EQ( literal.size(), 3 );
    EXPECT_TRUE( literal.contains( 9 ) );
}

TEST( small_set, from_keys )
{
    small_map<int, std::monostate, 2> keys;
    keys.insert( 4, {} );
    keys.insert( 2, {} );
    keys.insert( 9, {} );

    auto const s{ small_set<int, 2>::from_keys( std::move( keys ) ) };
    EXPECT_FALSE( s.is_inline() );
    EXPECT_EQ( std::vector<int>( s.begin(), s.end() ), ( std::vector<int>{ 4, 2, 9 } ) );
}

TEST( small_set, iteration )
{
    small_set<std::string, 2> s{ "c", "a", "b" };
    std::vector<std::string> values;
    for ( auto const & value : s )
        values.push_back( value );
    EXPECT_EQ( values, ( std::vector<std::string>{ "c", "a", "b" } ) );
    EXPECT_EQ( std::ranges::size( s.iter() ), 3 );
    EXPECT_EQ( s.begin()[ 2 ], "b" );
}

TEST( small_set, heterogeneous_lookup )
{
    small_set<std::string, 2, transparent_string_hash, transparent_equal_to> s{ "x", "y", "z" };
    EXPECT_TRUE( s.contains( std::string_view{ "z" } ) );
    EXPECT_EQ( s.get_index_of( "y" ), 1 );
    EXPECT_FALSE( s.contains( "w" ) );
}

TEST( small_set, equality )
{
    small_set<int, 2> const a{ 1, 2 };
    small_set<int, 2> const b{ 2, 1 };
    small_set<int, 2>       c{ 1 };
    EXPECT_EQ( a, b );
    EXPECT_NE( a, c );
    c.insert( 2 );
    EXPECT_EQ( a, c );

    small_set<int, 2> spilled{ 1, 2, 3 };
    small_set<int, 2> grown  { 3, 2 };
    grown.insert( 1 );
    EXPECT_EQ( spilled, grown );
    EXPECT_EQ( spilled == grown, spilled.as_map() == grown.as_map() );
}

TEST( small_set, printing )
{
    std::ostringstream os;
    os << small_set<int, 4>{ 0, 1, 2 };
    EXPECT_EQ( os.str(), "{0, 1, 2}" );
}

#ifndef NDEBUG
TEST( small_set_death, known_unique_duplicates )
{
    EXPECT_DEATH( std::ignore = make_inline_set( 0, 0 ), "Duplicate keys are not allowed" );
}
#endif

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
