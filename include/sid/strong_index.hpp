////////////////////////////////////////////////////////////////////////////////
/// Tagged handle type: an unsigned integer that only compares with (and only
/// converts explicitly from/to) handles of the same tag.
///
///   struct body_tag;
///   using body_id = sid::strong_index<body_tag, std::uint16_t>;
///   sid::tomb_vector<rigid_body, body_id> bodies;
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

#include <sid/index_traits.hpp>

#include <boost/container_hash/hash.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

template <typename Tag, std::unsigned_integral Rep = std::uint32_t>
struct [[ clang::trivial_abi ]] strong_index
{
    using rep_type = Rep;
    using tag_type = Tag;

    constexpr          strong_index(                 ) noexcept = default;
    constexpr explicit strong_index( Rep const value ) noexcept : value_{ value } {}

    [[ nodiscard ]] constexpr Rep value() const noexcept { return value_; }
    constexpr explicit operator Rep() const noexcept { return value_; }

    friend constexpr auto operator<=>( strong_index, strong_index ) noexcept = default;
    friend constexpr bool operator== ( strong_index, strong_index ) noexcept = default;

    friend std::size_t hash_value( strong_index const index ) noexcept { return boost::hash<Rep>{}( index.value_ ); }

    friend std::ostream & operator<<( std::ostream & os, strong_index const index ) { return os << +index.value_; }

    Rep value_{};
}; // struct strong_index

template <typename Tag, std::unsigned_integral Rep>
struct index_traits<strong_index<Tag, Rep>>
{
    using index    = strong_index<Tag, Rep>;
    using rep_type = Rep;
    using base     = index_traits<Rep>;

    static constexpr index sentinel() noexcept { return index{ base::sentinel() }; }
    static constexpr index zero    () noexcept { return index{ base::zero    () }; }

    static constexpr index next( index const value ) { return index{ base::next( value.value() ) }; }
    static constexpr index prev( index const value ) { return index{ base::prev( value.value() ) }; }

    static constexpr std::size_t to_position  ( index       const value    ) noexcept { return base::to_position( value.value() ); }
    static constexpr index       from_position( std::size_t const position ) noexcept { return index{ base::from_position( position ) }; }
}; // index_traits<strong_index>

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------

template <typename Tag, typename Rep>
struct std::hash<sid::strong_index<Tag, Rep>>
{
    std::size_t operator()( sid::strong_index<Tag, Rep> const index ) const noexcept { return hash_value( index ); }
};
//------------------------------------------------------------------------------
