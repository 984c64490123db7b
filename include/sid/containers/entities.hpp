////////////////////////////////////////////////////////////////////////////////
///
/// Hash map backed sparse collection with never recycled ids.
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
#include <sid/index_traits.hpp>
#include <sid/sequence.hpp>

#include <boost/unordered_map.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

template <typename T, stable_index Index = std::uint32_t>
class entities
{
private:
    using storage_t = boost::unordered_map<Index, T>;

public:
    using value_type     = T;
    using index_type     = Index;
    using size_type      = std::size_t;
    using iterator       = typename storage_t::iterator;
    using const_iterator = typename storage_t::const_iterator;

    entities() = default;

    [[ nodiscard ]] static entities with_capacity( size_type const capacity )
    {
        entities result;
        result.reserve( capacity );
        return result;
    }

    [[ nodiscard ]] size_type size () const noexcept { return data_.size (); }
    [[ nodiscard ]] bool      empty() const noexcept { return data_.empty(); }

    void reserve( size_type const capacity ) { data_.reserve( capacity ); }

    template <typename ... Args>
    Index allocate( Args && ... args )
    {
        auto const id{ ids_.next() };
        data_.try_emplace( id, std::forward<Args>( args )... );
        return id;
    }

    [[ nodiscard ]] T * get( Index const id ) noexcept
    {
        auto const p_element{ data_.find( id ) };
        return ( p_element != data_.end() ) ? &p_element->second : nullptr;
    }
    [[ nodiscard ]] T const * get( Index const id ) const noexcept { return const_cast<entities &>( *this ).get( id ); }

    [[ nodiscard ]] bool contains( Index const id ) const noexcept { return data_.find( id ) != data_.end(); }

    [[ nodiscard ]] T & at( Index const id )
    {
        if ( auto * const p_value{ get( id ) } ) [[ likely ]]
            return *p_value;
        detail::throw_absent_value( "sid::entities::at: no element with the given id" );
    }
    [[ nodiscard ]] T const & at( Index const id ) const { return const_cast<entities &>( *this ).at( id ); }

    T remove( Index const id )
    {
        auto const p_element{ data_.find( id ) };
        if ( p_element == data_.end() ) [[ unlikely ]]
            detail::throw_invalid_index( "sid::entities::remove: no element with the given id" );
        auto removed{ std::move( p_element->second ) };
        data_.erase( p_element );
        return removed;
    }

    // (id, value) pairs in unspecified order
    [[ nodiscard ]] iterator       begin()       noexcept { return data_.begin(); }
    [[ nodiscard ]] const_iterator begin() const noexcept { return data_.begin(); }
    [[ nodiscard ]] iterator       end  ()       noexcept { return data_.end  (); }
    [[ nodiscard ]] const_iterator end  () const noexcept { return data_.end  (); }

private:
    storage_t       data_;
    sequence<Index> ids_;
}; // class entities

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
