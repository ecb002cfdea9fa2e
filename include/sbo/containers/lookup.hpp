////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for the sbo hashed associative containers.
///
/// Provides:
///   - key_equivalence<Hash, KeyEqual>   EBO storage for the hasher and the
///     key equality predicate + transparency detection
///   - LookupType concept                constrains heterogeneous lookup key types
///   - lookup_key()                      converts a probe to key_type once at the
///                                       public API boundary when required
///   - transparent_string_hash           ready-made heterogeneous string hasher
///
/// The inline representation of small_map compares keys linearly with
/// key_equivalence::eq(), the heap representation (index_map) hands both
/// functors to the hashed index. Both must therefore agree: a probe that
/// compares equal to a stored key has to hash equal to it as well.
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

#include <boost/container_hash/hash.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace sbo
{
//------------------------------------------------------------------------------

/// Hint tag: the supplied elements are known to have pairwise distinct keys
/// (checked only by debug assertions).
struct known_unique_t { explicit known_unique_t() = default; };
inline constexpr known_unique_t known_unique{};


template <typename Hash, typename KeyEqual>
struct key_equivalence
{
    /// True if both functors support heterogeneous lookup (have the
    /// is_transparent tag). Requiring only one of them would let a probe be
    /// compared without conversion but hashed with one (or vice versa).
    static constexpr bool transparent
    {
        requires{ typename Hash    ::is_transparent; } &&
        requires{ typename KeyEqual::is_transparent; }
    };

    [[ no_unique_address ]] Hash     hasher;
    [[ no_unique_address ]] KeyEqual equal;

    [[ gnu::pure ]] constexpr bool        eq  ( auto const & left, auto const & right ) const { return equal ( left, right ); }
    [[ gnu::pure ]] constexpr std::size_t hash( auto const & key                      ) const { return hasher( key         ); }
}; // struct key_equivalence


/// LookupType: constrains which probe types the lookup functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) the hasher and the equality predicate are both transparent, allowing
///       heterogeneous lookup with any type they accept, or
///   (b) K is implicitly convertible to key_type; the conversion happens
///       once at the public API boundary (see lookup_key()).
///       (This subsumes the K == key_type case via identity conversion.)
template <typename K, bool transparent, typename StoredKeyType>
concept LookupType =
    transparent ||
    std::convertible_to<K const &, StoredKeyType const &>;


/// Returns the probe itself when it can be used directly and a converted
/// key_type temporary otherwise (bind the result to an auto && to extend its
/// lifetime).
template <typename Key, bool transparent, typename K>
[[ nodiscard ]] constexpr decltype( auto ) lookup_key( K const & probe )
{
    if constexpr ( transparent || std::is_same_v<K, Key> )
        return ( probe );
    else
        return Key( probe );
}


/// Hashes anything convertible to std::string_view identically, so
/// std::string keys can be probed with string_views and literals without
/// constructing a temporary std::string.
struct transparent_string_hash
{
    using is_transparent = void;

    [[ gnu::pure ]] std::size_t operator()( std::string_view const str ) const noexcept
    {
        return boost::hash_range( str.begin(), str.end() );
    }
}; // struct transparent_string_hash

using transparent_equal_to = std::equal_to<>;

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
