////////////////////////////////////////////////////////////////////////////////
/// Fixed capacity, in-object contiguous storage: the inline representation of
/// small_map and small_set. Never allocates, elements are stored in a union
/// array so they are directly visible in the debugger (no type-erased byte
/// buffer) and the overflow behaviour is selectable at compile time.
////////////////////////////////////////////////////////////////////////////////
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

#include <sbo/error.hpp>

#include <boost/assert.hpp>
#include <boost/integer.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace sbo
{
//------------------------------------------------------------------------------

template <typename T, std::uint32_t size>
union [[ clang::trivial_abi ]] noninitialized_array
{
    constexpr  noninitialized_array() noexcept {}
    constexpr ~noninitialized_array() noexcept {}

    T data[ size ];
}; // noninitialized_array

struct assert_on_overflow {
    [[ noreturn ]] void operator()() const noexcept {
        BOOST_ASSERT_MSG( false, "Static vector overflow!" );
        std::unreachable();
    }
}; // assert_on_overflow
struct throw_on_overflow {
    [[ noreturn ]] void operator()() const { detail::throw_out_of_range( "sbo::static_vector overflow" ); }
}; // throw_on_overflow

template <typename T, std::uint32_t maximum_size, auto overflow_handler = assert_on_overflow{}>
class [[ clang::trivial_abi ]] static_vector
{
    static_assert( maximum_size > 0, "static_vector requires a non-zero capacity" );

public:
    using size_type       = typename boost::uint_value_t<maximum_size>::least;
    using difference_type = std::ptrdiff_t;
    using value_type      = T;
    using reference       = T       &;
    using const_reference = T const &;
    using pointer         = T       *;
    using const_pointer   = T const *;
    using iterator        = T       *;
    using const_iterator  = T const *;

    static size_type constexpr static_capacity{ maximum_size };

    constexpr static_vector() noexcept : size_{ 0 } {}

    constexpr static_vector( static_vector const & other ) noexcept( std::is_nothrow_copy_constructible_v<T> )
        : size_{ 0 }
    {
        std::uninitialized_copy_n( other.data(), other.size(), data() );
        size_ = other.size();
    }
    constexpr static_vector( static_vector && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
        : size_{ 0 }
    {
        std::uninitialized_move_n( other.data(), other.size(), data() );
        size_ = other.size();
        other.clear();
    }

    constexpr static_vector & operator=( static_vector const & other )
    {
        if ( this != &other ) {
            clear();
            std::uninitialized_copy_n( other.data(), other.size(), data() );
            size_ = other.size();
        }
        return *this;
    }
    constexpr static_vector & operator=( static_vector && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        if ( this != &other ) {
            clear();
            std::uninitialized_move_n( other.data(), other.size(), data() );
            size_ = other.size();
            other.clear();
        }
        return *this;
    }

    constexpr ~static_vector() noexcept { clear(); }

    [[ nodiscard, gnu::pure  ]]        constexpr size_type size    () const noexcept { BOOST_ASSERT( size_ <= maximum_size ); return size_; }
    [[ nodiscard, gnu::const ]] static constexpr size_type capacity()       noexcept { return maximum_size; }
    [[ nodiscard, gnu::pure  ]]        constexpr bool      empty   () const noexcept { return size_ == 0; }
    [[ nodiscard, gnu::pure  ]]        constexpr bool      full    () const noexcept { return size_ == maximum_size; }

    [[ nodiscard, gnu::const ]] constexpr value_type       * data()       noexcept { return array_.data; }
    [[ nodiscard, gnu::const ]] constexpr value_type const * data() const noexcept { return array_.data; }

    constexpr iterator       begin()       noexcept { return data(); }
    constexpr const_iterator begin() const noexcept { return data(); }
    constexpr iterator       end  ()       noexcept { return data() + size(); }
    constexpr const_iterator end  () const noexcept { return data() + size(); }

    constexpr reference operator[]( size_type const index ) noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "Index out of bounds" );
        return data()[ index ];
    }
    constexpr const_reference operator[]( size_type const index ) const noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "Index out of bounds" );
        return data()[ index ];
    }

    constexpr reference       front()       noexcept { return (*this)[ 0 ]; }
    constexpr const_reference front() const noexcept { return (*this)[ 0 ]; }
    constexpr reference       back ()       noexcept { return (*this)[ size() - 1 ]; }
    constexpr const_reference back () const noexcept { return (*this)[ size() - 1 ]; }

    template <typename ... Args>
    constexpr reference emplace_back( Args && ... args )
    {
        if ( full() ) [[ unlikely ]] {
            overflow_handler();
        }
        auto * const slot{ std::construct_at( data() + size_, std::forward<Args>( args )... ) };
        ++size_;
        return *slot;
    }

    constexpr void push_back( value_type const &  x ) { emplace_back(            x   ); }
    constexpr void push_back( value_type       && x ) { emplace_back( std::move( x ) ); }

    constexpr void clear() noexcept
    {
        std::destroy_n( data(), size_ );
        size_ = 0;
    }

    friend constexpr bool operator==( static_vector const & left, static_vector const & right )
    {
        return std::equal( left.begin(), left.end(), right.begin(), right.end() );
    }

private:
    size_type                             size_;
    noninitialized_array<T, maximum_size> array_;
}; // class static_vector

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
