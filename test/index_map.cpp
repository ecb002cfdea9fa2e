////////////////////////////////////////////////////////////////////////////////
/// sbo::index_map unit tests
////////////////////////////////////////////////////////////////////////////////

#include <sbo/containers/index_map.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace sbo {
//------------------------------------------------------------------------------

TEST( index_map, default_construction )
{
    index_map<int, std::string> m;
    EXPECT_TRUE( m.empty() );
    EXPECT_EQ  ( m.size(), 0 );
    EXPECT_EQ  ( m.begin(), m.end() );
    EXPECT_EQ  ( m.find_value( 1 ), nullptr );
    EXPECT_FALSE( m.get_index( 0 ).has_value() );
}

TEST( index_map, insertion_order )
{
    index_map<int, int> m;
    for ( int const key : { 7, 3, 9, 1 } )
        EXPECT_FALSE( m.insert( key, key * 10 ).has_value() );

    std::vector<int> keys;
    for ( auto const & [ key, value ] : m ) {
        keys.push_back( key );
        EXPECT_EQ( value, key * 10 );
    }
    EXPECT_EQ( keys, ( std::vector<int>{ 7, 3, 9, 1 } ) );
}

TEST( index_map, update_in_place )
{
    index_map<int, std::string> m{ { 1, "a" }, { 2, "b" }, { 3, "c" } };

    auto const previous{ m.insert( 2, "B" ) };
    ASSERT_TRUE( previous.has_value() );
    EXPECT_EQ( *previous, "b" );
    EXPECT_EQ( m.size(), 3 );
    EXPECT_EQ( m.get_index_of( 2 ), 1 );
    EXPECT_EQ( *m.find_value( 2 ), "B" );
}

TEST( index_map, positional_and_keyed_access_agree )
{
    index_map<std::string, int> m{ { "x", 0 }, { "y", 1 }, { "z", 2 } };
    for ( std::size_t i{ 0 }; i < m.size(); ++i ) {
        auto const element{ m.get_index( i ) };
        ASSERT_TRUE( element.has_value() );
        EXPECT_EQ( m.get_index_of( element->first ), i );
        EXPECT_EQ( element->second, static_cast<int>( i ) );
    }
    EXPECT_FALSE( m.get_index( 3 ).has_value() );
    EXPECT_FALSE( m.get_index_of( "w" ).has_value() );
}

TEST( index_map, mutable_values )
{
    index_map<int, int> m{ { 1, 10 } };
    *m.find_value( 1 ) += 1;
    m.element_at( 0 ).second += 1;
    EXPECT_EQ( *m.find_value( 1 ), 12 );
}

TEST( index_map, heterogeneous_lookup )
{
    index_map<std::string, int, transparent_string_hash, transparent_equal_to> m{ { "alpha", 1 }, { "beta", 2 } };
    EXPECT_EQ( *m.find_value( std::string_view{ "beta" } ), 2 );
    EXPECT_EQ( m.get_index_of( "alpha" ), 0 );
    EXPECT_TRUE ( m.contains( "beta"  ) );
    EXPECT_FALSE( m.contains( "gamma" ) );
}

TEST( index_map, reserve )
{
    index_map<int, int> m;
    m.reserve( 32 );
    EXPECT_GE( m.capacity(), 32 );
    EXPECT_TRUE( m.empty() );

    index_map<int, int> const literal{ { 1, 1 }, { 2, 2 } };
    EXPECT_EQ( literal.capacity(), 2 );
}

TEST( index_map, drain )
{
    index_map<int, std::string> m{ { 3, "c" }, { 1, "a" }, { 2, "b" } };
    std::vector<std::pair<int, std::string>> drained;
    m.drain( [ & ]( int && key, std::string && value ) { drained.emplace_back( key, std::move( value ) ); } );

    EXPECT_TRUE( m.empty() );
    ASSERT_EQ( drained.size(), 3 );
    EXPECT_EQ( drained[ 0 ].first, 3 );
    EXPECT_EQ( drained[ 2 ].second, "b" );
}

TEST( index_map, equality_ignores_order )
{
    index_map<int, int> const a{ { 1, 10 }, { 2, 20 } };
    index_map<int, int> const b{ { 2, 20 }, { 1, 10 } };
    index_map<int, int> const c{ { 1, 10 }, { 2, 21 } };
    EXPECT_EQ( a, b );
    EXPECT_NE( a, c );
}

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
