////////////////////////////////////////////////////////////////////////////////
/// Small map: insertion ordered hash map with an inline (in-object) buffer
/// and a one-way heap spill
///
/// Up to C entries are stored inline, in a static_vector of key-value pairs,
/// without any heap allocation. The insert that would grow the inline buffer
/// past C moves _all_ entries, in order, into a heap backed index_map, where
/// they stay for the remaining lifetime of the object (there is no shrinking
/// back to inline storage).
///
/// Both representations present the same contract: insertion order for
/// iteration and positional access (re-inserting an existing key updates the
/// value in place), global key uniqueness, optional/null based 'absent'
/// results. Only the lookup cost differs: linear scan inline, average O(1)
/// hashed on the heap.
///
/// Meant for collections that are small most of the time but must not be
/// capped. The transition is expensive (and invalidates all references and
/// iterators) so C should cover the common case.
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

#include <sbo/containers/index_map.hpp>
#include <sbo/containers/lookup.hpp>
#include <sbo/containers/positional_iterator.hpp>
#include <sbo/containers/static_vector.hpp>
#include <sbo/error.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
//------------------------------------------------------------------------------
namespace sbo
{
//------------------------------------------------------------------------------

template <typename T, std::uint32_t C, typename Hash, typename KeyEqual>
class small_set;

template
<
    typename Key,
    typename T,
    std::uint32_t C,
    typename Hash     = boost::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class small_map
{
    static_assert( C > 0, "small_map requires an inline capacity C > 0 (use index_map for heap-only storage)" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<key_type, mapped_type>;
    using reference       = std::pair<key_type const &, mapped_type       &>;
    using const_reference = std::pair<key_type const &, mapped_type const &>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using hasher          = Hash;
    using key_equal       = KeyEqual;

    using inline_storage = static_vector<value_type, C>;
    using heap_storage   = index_map<key_type, mapped_type, hasher, key_equal>;

    using iterator       = positional_iterator<small_map, false>;
    using const_iterator = positional_iterator<small_map, true >;
    using key_iterator   = positional_iterator<small_map, true, element_key>;

    class entry_handle;

private:
    using equivalence = key_equivalence<Hash, KeyEqual>;
    static bool constexpr transparent{ equivalence::transparent };

    // The heap alternative is boxed so that switching representations (and
    // moving the map) never throws once the heap storage has been built.
    using heap_box = std::unique_ptr<heap_storage>;
    using storage  = std::variant<inline_storage, heap_box>;

    // pairs can be moved into the heap storage and back again without any
    // chance of losing one midway
    static bool constexpr nothrow_transfer
    {
        std::is_nothrow_move_constructible_v<key_type   > && std::is_nothrow_move_assignable_v<key_type   > &&
        std::is_nothrow_move_constructible_v<mapped_type> && std::is_nothrow_move_assignable_v<mapped_type> &&
        std::is_nothrow_invocable_v<hasher const &, key_type const &> &&
        std::is_nothrow_invocable_v<key_equal const &, key_type const &, key_type const &>
    };

public:
    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    small_map() noexcept = default;

    /// General path: duplicate keys are ordinary updates (the first
    /// occurrence's position, the last occurrence's value).
    small_map( std::initializer_list<value_type> const il )
    {
        if ( il.size() <= C ) {
            for ( auto const & pair : il )
                insert( pair.first, pair.second );
        } else {
            heap_storage spilled;
            spilled.reserve( il.size() );
            for ( auto const & pair : il )
                spilled.insert( pair.first, pair.second );
            adopt( std::move( spilled ) );
        }
    }

    template <std::input_iterator InputIt>
    small_map( InputIt first, InputIt const last )
    {
        for ( ; first != last; ++first ) {
            auto && pair{ *first };
            insert( pair.first, pair.second );
        }
    }

    /// Fast path: the pairs are placed directly into the inline buffer. Key
    /// uniqueness and il.size() <= C are only asserted.
    small_map( known_unique_t, std::initializer_list<value_type> const il )
    {
        BOOST_ASSERT_MSG( il.size() <= C, "Literal does not fit the inline capacity" );
        for ( auto const & pair : il )
            append_known_unique( pair.first, pair.second );
    }

    /// Adopts an existing heap map: one whose allocated capacity fits into
    /// the inline buffer is moved into it, anything bigger is kept as the
    /// heap representation.
    explicit small_map( heap_storage && map ) { adopt( std::move( map ) ); }

    small_map( small_map const & other ) : storage_{ other.clone_storage() }, equivalence_{ other.equivalence_ } {}
    small_map( small_map && other ) noexcept( std::is_nothrow_move_constructible_v<inline_storage> && std::is_nothrow_copy_constructible_v<equivalence> )
        : storage_{ std::exchange( other.storage_, inline_storage{} ) }, equivalence_{ other.equivalence_ } {}

    small_map & operator=( small_map const & other )
    {
        if ( this != &other ) {
            storage_     = other.clone_storage();
            equivalence_ = other.equivalence_;
        }
        return *this;
    }
    small_map & operator=( small_map && other ) noexcept( std::is_nothrow_move_constructible_v<inline_storage> && std::is_nothrow_copy_assignable_v<equivalence> )
    {
        if ( this != &other ) {
            storage_     = std::exchange( other.storage_, inline_storage{} );
            equivalence_ = other.equivalence_;
        }
        return *this;
    }

    ~small_map() noexcept = default;

    //--------------------------------------------------------------------------
    // Iterators (insertion order, both representations)
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, static_cast<difference_type>( size() ) }; }
    const_iterator end  () const noexcept { return { this, static_cast<difference_type>( size() ) }; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    /// Restartable, sized view over the entries (size() is the exact
    /// remaining length).
    [[ nodiscard ]] auto iter() const noexcept { return std::ranges::subrange<const_iterator>{ begin(), end() }; }
    [[ nodiscard ]] auto keys() const noexcept
    {
        return std::ranges::subrange<key_iterator>
        {
            key_iterator{ this, 0 },
            key_iterator{ this, static_cast<difference_type>( size() ) }
        };
    }

    /// Consuming iteration: moves all entries out in insertion order. The map
    /// is left empty in its current representation.
    [[ nodiscard ]] std::vector<value_type> extract() &&
    {
        std::vector<value_type> pairs;
        pairs.reserve( size() );
        if ( is_inline() ) {
            auto & buffer{ inline_pairs() };
            for ( auto & pair : buffer )
                pairs.push_back( std::move( pair ) );
            buffer.clear();
        } else {
            heap().drain( [ &pairs ]( key_type && key, mapped_type && value ) {
                pairs.emplace_back( std::move( key ), std::move( value ) );
            } );
        }
        return pairs;
    }

    //--------------------------------------------------------------------------
    // Capacity & representation
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty() const noexcept { return size() == 0; }
    [[ nodiscard ]] size_type size () const noexcept { return is_inline() ? inline_pairs().size() : heap().size(); }

    [[ nodiscard ]] static constexpr size_type inline_capacity() noexcept { return C; }

    [[ nodiscard ]] bool is_inline() const noexcept { return storage_.index() == 0; }

    [[ nodiscard ]] hasher    hash_function() const { return equivalence_.hasher; }
    [[ nodiscard ]] key_equal key_eq       () const { return equivalence_.equal ; }

    //--------------------------------------------------------------------------
    // Lookup
    //  - inline: O(n) linear scan
    //  - heap  : average O(1)
    //--------------------------------------------------------------------------
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type * get( K const & probe )
    {
        return const_cast<mapped_type *>( std::as_const( *this ).get( probe ) );
    }
    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] mapped_type const * get( K const & probe ) const
    {
        auto && key{ lookup_key<key_type, transparent>( probe ) };
        if ( !is_inline() )
            return heap().find_value( key );
        auto const position{ inline_position_of( key ) };
        return position ? &inline_pairs()[ *position ].second : nullptr;
    }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> get_index_of( K const & probe ) const
    {
        auto && key{ lookup_key<key_type, transparent>( probe ) };
        if ( !is_inline() )
            return heap().get_index_of( key );
        return inline_position_of( key );
    }

    template <LookupType<transparent, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & probe ) const { return get( probe ) != nullptr; }

    template <LookupType<transparent, key_type> K = key_type>
    mapped_type & at( K const & probe )
    {
        auto * const value{ get( probe ) };
        if ( !value ) detail::throw_out_of_range( "sbo::small_map::at" );
        return *value;
    }
    template <LookupType<transparent, key_type> K = key_type>
    mapped_type const & at( K const & probe ) const
    {
        auto const * const value{ get( probe ) };
        if ( !value ) detail::throw_out_of_range( "sbo::small_map::at" );
        return *value;
    }

    //--------------------------------------------------------------------------
    // Positional access, O(1)
    //--------------------------------------------------------------------------
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

    /// Out of bounds access is a contract violation (asserted).
    mapped_type       & value_at( size_type const index )       noexcept { return element_at( index ).second; }
    mapped_type const & value_at( size_type const index ) const noexcept { return element_at( index ).second; }

    reference element_at( size_type const index ) noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "small_map: index out of bounds" );
        if ( is_inline() ) {
            auto & pair{ inline_pairs()[ static_cast<typename inline_storage::size_type>( index ) ] };
            return { pair.first, pair.second };
        }
        return heap().element_at( index );
    }
    const_reference element_at( size_type const index ) const noexcept
    {
        BOOST_ASSERT_MSG( index < size(), "small_map: index out of bounds" );
        if ( is_inline() ) {
            auto const & pair{ inline_pairs()[ static_cast<typename inline_storage::size_type>( index ) ] };
            return { pair.first, pair.second };
        }
        return heap().element_at( index );
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Add-or-update. Returns the previous value of an existing key (whose
    /// position is unchanged), nothing for a new key (appended at the end).
    /// A new key that does not fit the inline buffer moves the map to the
    /// heap.
    std::optional<mapped_type> insert( key_type key, mapped_type value )
    {
        if ( !is_inline() )
            return heap().insert( std::move( key ), std::move( value ) );

        auto & pairs{ inline_pairs() };
        if ( auto const position{ inline_position_of( key ) } )
            return std::exchange( pairs[ static_cast<typename inline_storage::size_type>( *position ) ].second, std::move( value ) );

        if ( pairs.size() < C ) {
            pairs.emplace_back( std::move( key ), std::move( value ) );
        } else {
            spill( std::move( key ), std::move( value ) );
        }
        return std::nullopt;
    }

    /// Single lookup, deferred decision: see entry_handle.
    [[ nodiscard ]] entry_handle entry( key_type key )
    {
        if ( auto const position{ get_index_of( key ) } )
            return { *this, typename entry_handle::occupied_state{ *position } };
        return { *this, typename entry_handle::vacant_state{ std::move( key ) } };
    }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------

    /// Logical equality: the same set of key-value associations, regardless of
    /// representation and insertion order.
    friend bool operator==( small_map const & left, small_map const & right )
    {
        if ( left.size() != right.size() )
            return false;
        for ( auto const & [ key, value ] : left ) {
            auto const * const other{ right.get( key ) };
            if ( !other || !( *other == value ) )
                return false;
        }
        return true;
    }

    friend std::ostream & operator<<( std::ostream & os, small_map const & map )
    requires requires( std::ostream & out, Key const & k, T const & v ) { out << k; out << v; }
    {
        os << '{';
        for ( auto it{ map.begin() }; it != map.end(); ++it ) {
            if ( it != map.begin() )
                os << ", ";
            os << it->first << ": " << it->second;
        }
        return os << '}';
    }

private:
    template <typename, std::uint32_t, typename, typename> friend class small_set;

    inline_storage       & inline_pairs()       noexcept { BOOST_ASSERT( is_inline() ); return *std::get_if<inline_storage>( &storage_ ); }
    inline_storage const & inline_pairs() const noexcept { BOOST_ASSERT( is_inline() ); return *std::get_if<inline_storage>( &storage_ ); }
    heap_storage         & heap        ()       noexcept { BOOST_ASSERT( !is_inline() ); return **std::get_if<heap_box>( &storage_ ); }
    heap_storage   const & heap        () const noexcept { BOOST_ASSERT( !is_inline() ); return **std::get_if<heap_box>( &storage_ ); }

    template <typename K>
    std::optional<size_type> inline_position_of( K const & key ) const
    {
        auto const & pairs{ inline_pairs() };
        for ( size_type position{ 0 }; position < pairs.size(); ++position ) {
            if ( equivalence_.eq( key, pairs.data()[ position ].first ) )
                return position;
        }
        return std::nullopt;
    }

    void append_known_unique( key_type key, mapped_type value )
    {
        BOOST_ASSERT_MSG( !get_index_of( key ), "Duplicate keys are not allowed" );
        inline_pairs().emplace_back( std::move( key ), std::move( value ) );
    }

    void adopt( heap_storage && map )
    {
        if ( map.capacity() <= C ) {
            auto & pairs{ inline_pairs() };
            map.drain( [ &pairs ]( key_type && key, mapped_type && value ) noexcept( std::is_nothrow_move_constructible_v<value_type> ) {
                pairs.emplace_back( std::move( key ), std::move( value ) );
            } );
        } else {
            storage_.template emplace<heap_box>( std::make_unique<heap_storage>( std::move( map ) ) );
        }
    }

    /// The inline to heap transition: the inline pairs, in order, followed by
    /// the new pair, go into a freshly built heap map which then replaces the
    /// inline buffer. Either the whole operation succeeds or the map is left
    /// as it was.
    void spill( key_type && key, mapped_type && value )
    {
        auto & pairs{ inline_pairs() };
        auto spilled{ std::make_unique<heap_storage>() };
        // no rehashing or positional reallocation after this point: the only
        // remaining failure is a node allocation, before any element is moved
        spilled->reserve( pairs.size() + 1 );
        if constexpr ( nothrow_transfer ) {
            try {
                for ( auto & pair : pairs )
                    spilled->append( std::move( pair.first ), std::move( pair.second ) );
                spilled->append( std::move( key ), std::move( value ) );
            } catch ( ... ) {
                // put the already transferred pairs back into their slots
                size_type position{ 0 };
                spilled->drain( [ &pairs, &position ]( key_type && k, mapped_type && v ) noexcept {
                    auto & pair{ pairs.data()[ position++ ] };
                    pair.first  = std::move( k );
                    pair.second = std::move( v );
                } );
                throw;
            }
        } else {
            for ( auto const & pair : pairs )
                spilled->append( pair.first, pair.second );
            spilled->append( std::move( key ), std::move( value ) );
        }
        storage_.template emplace<heap_box>( std::move( spilled ) );
    }

    storage clone_storage() const
    {
        if ( is_inline() )
            return storage{ std::in_place_type<inline_storage>, inline_pairs() };
        return storage{ std::in_place_type<heap_box>, std::make_unique<heap_storage>( heap() ) };
    }

private:
    storage storage_;
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    equivalence equivalence_;
}; // class small_map


////////////////////////////////////////////////////////////////////////////////
// entry_handle
//
// Result of a single lookup, bound to the map it came from: either Occupied
// (the position of the found key) or Vacant (the key that was not found). Meant
// to be consumed right away (all operations are rvalue qualified), e.g.
//   map.entry( key ).and_modify( []( auto & v ) { ++v; } ).or_insert( 1 );
// Any other operation on the map in between invalidates the handle.
////////////////////////////////////////////////////////////////////////////////

template <typename Key, typename T, std::uint32_t C, typename Hash, typename KeyEqual>
class small_map<Key, T, C, Hash, KeyEqual>::entry_handle
{
private:
    friend small_map;

    struct occupied_state { size_type index; };
    struct vacant_state   { key_type  key  ; };

    entry_handle( small_map & map, occupied_state const state ) noexcept : map_{ map }, state_{ state } {}
    entry_handle( small_map & map, vacant_state      && state )          : map_{ map }, state_{ std::move( state ) } {}

public:
    entry_handle( entry_handle && ) = default;
    entry_handle( entry_handle const & ) = delete;
    entry_handle & operator=( entry_handle const & ) = delete;

    [[ nodiscard ]] bool occupied() const noexcept { return state_.index() == 0; }

    [[ nodiscard ]] key_type const & key() const noexcept
    {
        if ( auto const * const found{ std::get_if<occupied_state>( &state_ ) } )
            return map_.element_at( found->index ).first;
        return std::get_if<vacant_state>( &state_ )->key;
    }

    /// Position of the existing entry (Occupied only).
    [[ nodiscard ]] size_type index() const noexcept
    {
        BOOST_ASSERT_MSG( occupied(), "Vacant entry has no index" );
        return std::get_if<occupied_state>( &state_ )->index;
    }

    /// Applies modifier to the existing value, a Vacant entry is returned as is.
    template <typename Modifier>
    entry_handle and_modify( Modifier && modifier ) &&
    {
        if ( auto const * const found{ std::get_if<occupied_state>( &state_ ) } )
            std::forward<Modifier>( modifier )( map_.value_at( found->index ) );
        return std::move( *this );
    }

    /// Inserts default_value if Vacant (which may move the map to the heap).
    /// Returns the value stored under the key in either case.
    mapped_type & or_insert( mapped_type default_value ) &&
    {
        return std::move( *this ).or_insert_with( [ & ] { return std::move( default_value ); } );
    }

    template <typename Factory>
    mapped_type & or_insert_with( Factory && make_default ) &&
    {
        if ( auto const * const found{ std::get_if<occupied_state>( &state_ ) } )
            return map_.value_at( found->index );
        map_.insert( std::move( std::get_if<vacant_state>( &state_ )->key ), std::forward<Factory>( make_default )() );
        return map_.value_at( map_.size() - 1 );
    }

private:
    small_map & map_;
    std::variant<occupied_state, vacant_state> state_;
}; // class small_map::entry_handle


/// Creates a small_map whose inline capacity equals the number of pairs
/// (known_unique fast path: duplicate keys are a contract violation).
template <typename Key, typename T, std::same_as<std::pair<Key, T>> ... Pairs>
[[ nodiscard ]] small_map<Key, T, 1 + sizeof...( Pairs )>
make_inline_map( std::pair<Key, T> const & first, Pairs const & ... rest )
{
    return { known_unique, { first, rest... } };
}

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
