////////////////////////////////////////////////////////////////////////////////
/// sbo::static_vector unit tests
////////////////////////////////////////////////////////////////////////////////

#include <sbo/containers/static_vector.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace sbo {
//------------------------------------------------------------------------------

TEST( static_vector, default_construction )
{
    static_vector<int, 4> vec;
    EXPECT_TRUE ( vec.empty() );
    EXPECT_FALSE( vec.full () );
    EXPECT_EQ   ( vec.size(), 0 );
    EXPECT_EQ   ( vec.capacity(), 4 );
    EXPECT_EQ   ( vec.begin(), vec.end() );
}

TEST( static_vector, size_type_fits_capacity )
{
    static_assert( sizeof( static_vector<char, 200>::size_type ) == 1 );
    static_assert( sizeof( static_vector<char, 300>::size_type ) == 2 );
}

TEST( static_vector, emplace_and_access )
{
    static_vector<std::string, 3> vec;
    vec.emplace_back( "one" );
    vec.push_back( "two" );
    vec.emplace_back( 3, 'x' );

    EXPECT_TRUE( vec.full() );
    EXPECT_EQ( vec.size (), 3 );
    EXPECT_EQ( vec.front(), "one" );
    EXPECT_EQ( vec[ 1 ]   , "two" );
    EXPECT_EQ( vec.back (), "xxx" );
}

TEST( static_vector, throwing_overflow_policy )
{
    static_vector<int, 2, throw_on_overflow{}> vec;
    vec.push_back( 1 );
    vec.push_back( 2 );
    EXPECT_THROW( vec.push_back( 3 ), std::out_of_range );
    EXPECT_EQ( vec.size(), 2 );
}

TEST( static_vector, copy_and_move )
{
    static_vector<std::string, 4> src;
    src.push_back( "a" );
    src.push_back( "b" );

    auto copy{ src };
    EXPECT_EQ( copy, src );
    copy[ 0 ] = "z";
    EXPECT_EQ( src[ 0 ], "a" );

    auto moved{ std::move( src ) };
    EXPECT_EQ( moved.size(), 2 );
    EXPECT_EQ( moved[ 1 ], "b" );
    EXPECT_TRUE( src.empty() ); // NOLINT(bugprone-use-after-move)

    src = moved;
    EXPECT_EQ( src, moved );
}

TEST( static_vector, clear_destroys_elements )
{
    auto const tracker{ std::make_shared<int>( 0 ) };
    {
        static_vector<std::shared_ptr<int>, 3> vec;
        vec.push_back( tracker );
        vec.push_back( tracker );
        EXPECT_EQ( tracker.use_count(), 3 );
        vec.clear();
        EXPECT_EQ( tracker.use_count(), 1 );
        vec.push_back( tracker );
    }
    EXPECT_EQ( tracker.use_count(), 1 );
}

#ifndef NDEBUG
TEST( static_vector_death, asserting_overflow_policy )
{
    static_vector<int, 1> vec;
    vec.push_back( 1 );
    EXPECT_DEATH( vec.push_back( 2 ), "Static vector overflow" );
}
#endif

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
