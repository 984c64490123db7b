////////////////////////////////////////////////////////////////////////////////
/// Handle (index) capabilities consumed by the stable index containers.
///
/// A handle type has to provide (through an index_traits specialization):
///  - sentinel(): the maximum representable value - never handed out, it
///    terminates the free lists embedded in the containers
///  - zero()
///  - next()/prev(): checked successor/predecessor
///  - to_position()/from_position(): conversion to/from a raw storage
///    position (std::size_t).
/// All unsigned integral types are supported out of the box, strong_index.hpp
/// adds tagged (type-safe) handles.
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

#include <sid/error.hpp>

#include <boost/assert.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

template <std::unsigned_integral Target>
constexpr Target verified_cast( std::unsigned_integral auto const source ) noexcept
{
    auto constexpr target_max{ std::numeric_limits<Target>::max() };
    BOOST_ASSERT( source <= target_max );
    auto const result{ static_cast<Target>( source ) };
    BOOST_ASSERT( result == source );
    return result;
}

template <typename Index>
struct index_traits; // specialize for custom handle types

template <std::unsigned_integral Index>
struct index_traits<Index>
{
    using rep_type = Index;

    static constexpr Index sentinel() noexcept { return std::numeric_limits<Index>::max(); }
    static constexpr Index zero    () noexcept { return 0; }

    static constexpr Index next( Index const value )
    {
        if ( value == sentinel() ) [[ unlikely ]]
            detail::throw_capacity_overflow( "sid: index successor overflow" );
        return static_cast<Index>( value + 1 );
    }
    static constexpr Index prev( Index const value )
    {
        if ( value == zero() ) [[ unlikely ]]
            detail::throw_invalid_index( "sid: index predecessor of zero" );
        return static_cast<Index>( value - 1 );
    }

    static constexpr std::size_t to_position( Index const value ) noexcept { return value; }
    // the sentinel itself is not a valid position
    static constexpr Index from_position( std::size_t const position ) noexcept
    {
        BOOST_ASSERT_MSG( position < to_position( sentinel() ), "Storage position not representable by the index type" );
        return verified_cast<Index>( position );
    }
}; // index_traits<unsigned_integral>


template <typename Index>
concept stable_index =
    std::copyable<Index> && std::totally_ordered<Index> &&
    requires( Index const index, std::size_t const position )
    {
        { index_traits<Index>::sentinel     (          ) } -> std::same_as<Index      >;
        { index_traits<Index>::zero         (          ) } -> std::same_as<Index      >;
        { index_traits<Index>::next         ( index    ) } -> std::same_as<Index      >;
        { index_traits<Index>::prev         ( index    ) } -> std::same_as<Index      >;
        { index_traits<Index>::to_position  ( index    ) } -> std::same_as<std::size_t>;
        { index_traits<Index>::from_position( position ) } -> std::same_as<Index      >;
    };

// Number of slots addressable with the given handle type (all values except
// the sentinel).
template <stable_index Index>
constexpr std::size_t addressable_positions() noexcept { return index_traits<Index>::to_position( index_traits<Index>::sentinel() ); }

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
