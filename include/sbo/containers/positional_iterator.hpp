////////////////////////////////////////////////////////////////////////////////
/// Random access iterator over insertion-ordered containers that provide O(1)
/// positional element access (small_map in both of its representations,
/// index_map, small_set).
///
/// The iterator is a (container, position) pair and dereferences through
/// Container::element_at( position ), so it is oblivious of the storage in
/// use: iteration order is insertion order whatever the representation and
/// the distance between two iterators is the exact remaining length.
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

#include <compare>
#include <cstddef>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace sbo
{
//------------------------------------------------------------------------------

/// Projections applied to the element references (pairs of references) a
/// container's element_at() returns.
struct whole_element {
    template <typename Element>
    [[ gnu::const ]] constexpr Element operator()( Element element ) const noexcept { return element; }
}; // whole_element
struct element_key {
    template <typename Element>
    [[ gnu::const ]] constexpr auto const & operator()( Element const element ) const noexcept { return element.first; }
}; // element_key


template <typename Container, bool IsConst, typename Projection = whole_element>
class positional_iterator
{
    using container_ptr       = std::conditional_t<IsConst, Container const *, Container *>;
    using container_reference = std::conditional_t<IsConst, typename Container::const_reference, typename Container::reference>;

public:
    using iterator_concept  = std::random_access_iterator_tag;
    using iterator_category = std::random_access_iterator_tag;
    using difference_type   = std::ptrdiff_t;
    using reference         = std::invoke_result_t<Projection const &, container_reference>;
    using value_type        = std::conditional_t
    <
        std::is_reference_v<reference>,
        std::remove_cvref_t<reference>,
        typename Container::value_type
    >;

    struct arrow_proxy {
        reference ref;
        constexpr auto * operator->() const noexcept { return &ref; }
    };
    using pointer = std::conditional_t<std::is_reference_v<reference>, std::add_pointer_t<reference>, arrow_proxy>;

private:
    friend Container;
    friend positional_iterator<Container, !IsConst, Projection>;

    container_ptr   container_{ nullptr };
    difference_type position_ { 0 };

public:
    constexpr positional_iterator() noexcept = default;
    constexpr positional_iterator( container_ptr const container, difference_type const position ) noexcept
        : container_{ container }, position_{ position } {}

    constexpr positional_iterator( positional_iterator<Container, !IsConst, Projection> const & other ) noexcept requires IsConst
        : container_{ other.container_ }, position_{ other.position_ } {}

    constexpr reference operator*() const
    {
        return Projection{}( container_->element_at( static_cast<typename Container::size_type>( position_ ) ) );
    }

    constexpr pointer operator->() const
    {
        if constexpr ( std::is_reference_v<reference> )
            return std::addressof( **this );
        else
            return arrow_proxy{ **this };
    }

    constexpr reference operator[]( difference_type const n ) const { return *( *this + n ); }

    [[ nodiscard ]] constexpr difference_type position() const noexcept { return position_; }

    constexpr positional_iterator & operator++(     ) noexcept { ++position_; return *this; }
    constexpr positional_iterator   operator++( int ) noexcept { auto tmp{ *this }; ++position_; return tmp; }
    constexpr positional_iterator & operator--(     ) noexcept { --position_; return *this; }
    constexpr positional_iterator   operator--( int ) noexcept { auto tmp{ *this }; --position_; return tmp; }

    constexpr positional_iterator & operator+=( difference_type const n ) noexcept { position_ += n; return *this; }
    constexpr positional_iterator & operator-=( difference_type const n ) noexcept { position_ -= n; return *this; }

    friend constexpr positional_iterator operator+( positional_iterator const it, difference_type const n ) noexcept { return { it.container_, it.position_ + n }; }
    friend constexpr positional_iterator operator+( difference_type const n, positional_iterator const it ) noexcept { return { it.container_, it.position_ + n }; }
    friend constexpr positional_iterator operator-( positional_iterator const it, difference_type const n ) noexcept { return { it.container_, it.position_ - n }; }

    friend constexpr difference_type operator-( positional_iterator const & a, positional_iterator const & b ) noexcept { return a.position_ - b.position_; }

    friend constexpr bool operator== ( positional_iterator const & a, positional_iterator const & b ) noexcept { return a.position_ ==  b.position_; }
    friend constexpr auto operator<=>( positional_iterator const & a, positional_iterator const & b ) noexcept { return a.position_ <=> b.position_; }
}; // class positional_iterator

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
