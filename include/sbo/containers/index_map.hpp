////////////////////////////////////////////////////////////////////////////////
/// Heap backed, insertion ordered hash map: the spill-over representation of
/// small_map (and a usable container in its own right).
///
/// Built on a Boost.MultiIndex container with two indices over a single node
/// per element:
///   - random_access (by_position): O(1) positional access, insertion order
///   - hashed_unique (by_key)     : average O(1) key lookup
/// so positional access, key lookup and 'key to position' are all O(1) (the
/// latter via index projection).
///
/// Keys are immutable once inserted (they are the hashed index's key) while
/// mapped values are mutable through every accessor.
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
#include <sbo/containers/positional_iterator.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/random_access_index.hpp>
#include <boost/multi_index/tag.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <utility>
//------------------------------------------------------------------------------
namespace sbo
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename T,
    typename Hash     = boost::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class index_map
{
public:
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<key_type, mapped_type>;
    using reference       = std::pair<key_type const &, mapped_type       &>;
    using const_reference = std::pair<key_type const &, mapped_type const &>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using hasher          = Hash;
    using key_equal       = KeyEqual;

    using iterator       = positional_iterator<index_map, false>;
    using const_iterator = positional_iterator<index_map, true >;

private:
    using equivalence = key_equivalence<Hash, KeyEqual>;
    static bool constexpr transparent{ equivalence::transparent };

    struct slot
    {
        template <typename K, typename V>
        slot( K && k, V && v ) : key( std::forward<K>( k ) ), value( std::forward<V>( v ) ) {}

        key_type            key;
        mutable mapped_type value; // not part of any index
    }; // struct slot

    struct by_position {};
    struct by_key      {};

    using storage = boost::multi_index_container
    <
        slot,
        boost::multi_index::indexed_by
        <
            boost::multi_index::random_access<boost::multi_index::tag<by_position>>,
            boost::multi_index::hashed_unique
            <
                boost::multi_index::tag<by_key>,
                boost::multi_index::member<slot, key_type, &slot::key>,
                Hash,
                KeyEqual
            >
        >
    >;

public:
    index_map() = default;

    index_map( std::initializer_list<value_type> const il )
    {
        reserve( il.size() );
        for ( auto const & pair : il )
            insert( pair.first, pair.second );
    }

    template <std::input_iterator InputIt>
    index_map( InputIt first, InputIt const last )
    {
        for ( ; first != last; ++first ) {
            auto && pair{ *first };
            insert( pair.first, pair.second );
        }
    }

    index_map( index_map const & ) = default;
    index_map( index_map && )      = default;

    index_map & operator=( index_map const & ) = default;
    index_map & operator=( index_map && )      = default;

    //--------------------------------------------------------------------------
    // Iterators (insertion order)
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, static_cast<difference_type>( size() ) }; }
    const_iterator end  () const noexcept { return { this, static_cast<difference_type>( size() ) }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty   () const noexcept { return slots_.empty(); }
    [[ nodiscard ]] size_type size    () const noexcept { return slots_.size (); }
    /// Number of elements the positional index can hold without reallocating.
    [[ nodiscard ]] size_type capacity() const noexcept { return positions().capacity(); }

    void reserve( size_type const n )
    {
        positions().reserve( n );
        keyed    ().reserve( n );
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type       * find_value( K const & probe )       { return find_value_impl( probe ); }
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type const * find_value( K const & probe ) const { return find_value_impl( probe ); }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K const & probe ) const
    {
        auto && key{ lookup_key<key_type, transparent>( probe ) };
        auto const found{ keyed().find( key, equivalence_.hasher, equivalence_.equal ) };
        if ( found == keyed().end() )
            return std::nullopt;
        return static_cast<size_type>( slots_.template project<by_position>( found ) - positions().begin() );
    }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & probe ) const { return find_value( probe ) != nullptr; }

    [[ nodiscard ]] std::optional<reference> get_index( size_type const index ) noexcept
    {
        if ( index >= size() )
            return std::nullopt;
        return element_at( index );
    }
    [[ nodiscard ]] std::optional<const_reference> get_index( size_type const index ) const noexcept
    {
        if ( index >= size() )
            return std::nullopt;
        return element_at( index );
    }

    reference element_at( size_type const index ) noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "Index out of bounds" );
        auto const & element{ positions()[ index ] };
        return { element.key, element.value };
    }
    const_reference element_at( size_type const index ) const noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "Index out of bounds" );
        auto const & element{ positions()[ index ] };
        return { element.key, element.value };
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Add-or-update: an existing key keeps its position and receives the new
    /// value (the previous one is returned), a new key is appended.
    std::optional<mapped_type> insert( key_type key, mapped_type value )
    {
        auto const found{ keyed().find( key ) };
        if ( found != keyed().end() )
            return std::exchange( found->value, std::move( value ) );
        append( std::move( key ), std::move( value ) );
        return std::nullopt;
    }

    /// Appends a key known not to be present (no lookup beyond the one the
    /// hashed index performs on insertion).
    template <typename K, typename V>
    void append( K && key, V && value )
    {
        [[ maybe_unused ]] auto const inserted{ positions().emplace_back( std::forward<K>( key ), std::forward<V>( value ) ) };
        BOOST_ASSERT_MSG( inserted.second, "Duplicate keys are not allowed" );
    }

    /// Hands every element, in insertion order, to sink( key_type &&,
    /// mapped_type && ) and leaves the map empty (capacity is retained).
    template <typename Sink>
    void drain( Sink && sink ) noexcept( noexcept( sink( std::declval<key_type>(), std::declval<mapped_type>() ) ) )
    {
        for ( auto const & element : positions() ) {
            // the keys are moved from only immediately before their nodes are
            // destroyed (clear() does not rehash)
            sink( std::move( const_cast<key_type &>( element.key ) ), std::move( element.value ) );
        }
        slots_.clear();
    }

    void clear() noexcept { slots_.clear(); }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------

    /// Logical (map) equality: insertion order is not significant.
    friend bool operator==( index_map const & left, index_map const & right )
    {
        if ( left.size() != right.size() )
            return false;
        for ( auto const & element : left.positions() ) {
            auto const * const other{ right.find_value( element.key ) };
            if ( !other || !( *other == element.value ) )
                return false;
        }
        return true;
    }

private:
    // the mapped value is mutable even through the (always const) index nodes
    template <typename K>
    mapped_type * find_value_impl( K const & probe ) const
    {
        auto && key{ lookup_key<key_type, transparent>( probe ) };
        auto const found{ keyed().find( key, equivalence_.hasher, equivalence_.equal ) };
        return ( found != keyed().end() ) ? &found->value : nullptr;
    }

    auto       & positions()       noexcept { return slots_.template get<by_position>(); }
    auto const & positions() const noexcept { return slots_.template get<by_position>(); }
    auto       & keyed    ()       noexcept { return slots_.template get<by_key     >(); }
    auto const & keyed    () const noexcept { return slots_.template get<by_key     >(); }

private:
    storage slots_;
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    equivalence equivalence_;
}; // class index_map

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
