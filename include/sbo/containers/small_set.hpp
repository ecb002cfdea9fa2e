////////////////////////////////////////////////////////////////////////////////
/// Small set: the key-only projection of small_map
///
/// A small_map with an empty (std::monostate) mapped type, exposing values
/// instead of key-value pairs. Inherits the inline buffer, the one-way heap
/// spill, insertion order and the lookup rules of small_map unchanged.
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

#include <sbo/containers/lookup.hpp>
#include <sbo/containers/small_map.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ostream>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace sbo
{
//------------------------------------------------------------------------------

template
<
    typename T,
    std::uint32_t C,
    typename Hash     = boost::hash<T>,
    typename KeyEqual = std::equal_to<T>
>
class small_set
{
public:
    using map_type = small_map<T, std::monostate, C, Hash, KeyEqual>;

    using key_type        = T;
    using value_type      = T;
    using reference       = T const &;
    using const_reference = T const &;
    using size_type       = typename map_type::size_type;
    using difference_type = typename map_type::difference_type;
    using hasher          = Hash;
    using key_equal       = KeyEqual;

    using iterator       = typename map_type::key_iterator;
    using const_iterator = iterator;

private:
    static bool constexpr transparent{ key_equivalence<Hash, KeyEqual>::transparent };

public:
    small_set() noexcept = default;

    /// Duplicates are silently dropped (the first occurrence keeps its
    /// position).
    small_set( std::initializer_list<value_type> const il ) : small_set( il.begin(), il.end() ) {}

    template <std::input_iterator InputIt>
    small_set( InputIt first, InputIt const last )
    {
        for ( ; first != last; ++first )
            insert( *first );
    }

    /// Fast path: no duplicate scan, uniqueness and il.size() <= C are only
    /// asserted.
    small_set( known_unique_t, std::initializer_list<value_type> const il )
    {
        BOOST_ASSERT_MSG( il.size() <= C, "Literal does not fit the inline capacity" );
        for ( auto const & value : il )
            map_.append_known_unique( value, {} );
    }

    [[ nodiscard ]] static small_set from_keys( map_type && map ) noexcept( std::is_nothrow_move_constructible_v<map_type> )
    {
        small_set set;
        set.map_ = std::move( map );
        return set;
    }

    //--------------------------------------------------------------------------
    // Iterators (values, insertion order)
    //--------------------------------------------------------------------------
    iterator begin() const noexcept { return { &map_, 0 }; }
    iterator end  () const noexcept { return { &map_, static_cast<difference_type>( size() ) }; }

    [[ nodiscard ]] auto iter() const noexcept { return std::ranges::subrange<iterator>{ begin(), end() }; }

    //--------------------------------------------------------------------------
    // Capacity & representation
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty() const noexcept { return map_.empty(); }
    [[ nodiscard ]] size_type size () const noexcept { return map_.size (); }

    [[ nodiscard ]] static constexpr size_type inline_capacity() noexcept { return C; }

    [[ nodiscard ]] bool is_inline() const noexcept { return map_.is_inline(); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & probe ) const { return map_.contains( probe ); }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K const & probe ) const { return map_.get_index_of( probe ); }

    /// Null for an out of range index.
    [[ nodiscard ]] value_type const * get_index( size_type const index ) const noexcept
    {
        if ( auto const element{ map_.get_index( index ) } )
            return &element->first;
        return nullptr;
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Returns true if value was not yet present.
    bool insert( value_type value ) { return !map_.insert( std::move( value ), {} ).has_value(); }

    [[ nodiscard ]] map_type const & as_map() const noexcept { return map_; }

    friend bool operator==( small_set const & left, small_set const & right ) { return left.map_ == right.map_; }

    friend std::ostream & operator<<( std::ostream & os, small_set const & set )
    requires requires( std::ostream & out, T const & v ) { out << v; }
    {
        os << '{';
        for ( auto it{ set.begin() }; it != set.end(); ++it ) {
            if ( it != set.begin() )
                os << ", ";
            os << *it;
        }
        return os << '}';
    }

private:
    map_type map_;
}; // class small_set


/// Creates a small_set whose inline capacity equals the number of values
/// (known_unique fast path: duplicates are a contract violation).
template <typename T, std::same_as<T> ... Ts>
[[ nodiscard ]] small_set<T, 1 + sizeof...( Ts )>
make_inline_set( T const & first, Ts const & ... rest )
{
    return { known_unique, { first, rest... } };
}

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
