////////////////////////////////////////////////////////////////////////////////
/// Id generator with recoverable ids.
///
/// Released ids are kept in an ordered set and handed out again (smallest
/// first). coalesce() makes the claimed ids dense again by renaming the
/// highest claimed ids into the released holes (highest hole first).
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
#include <sid/index_traits.hpp>
#include <sid/sequence.hpp>

#include <boost/container/flat_set.hpp>

#include <concepts>
#include <cstddef>
#include <iterator>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

template <stable_index Index>
class id_pool
{
private:
    using traits = index_traits<Index>;

public:
    using index_type = Index;
    using size_type  = std::size_t;

    // Smallest released id if there is one, a fresh id otherwise.
    Index claim()
    {
        if ( !freed_.empty() )
        {
            auto const id{ *freed_.begin() };
            freed_.erase( freed_.begin() );
            return id;
        }
        return counter_.next();
    }

    void unclaim( Index const id )
    {
        if ( !( id < counter_.peek() ) ) [[ unlikely ]]
            detail::throw_invalid_index( "sid::id_pool::unclaim: id was never claimed" );
        if ( !freed_.insert( id ).second ) [[ unlikely ]]
            detail::throw_double_remove( "sid::id_pool::unclaim: id already released" );
    }

    // Renames are reported (and have to be applied) sequentially: a later
    // rename may move an id produced by an earlier one.
    template <typename OnRename>
    requires std::invocable<OnRename &, Index, Index>
    void coalesce( OnRename && on_rename )
    {
        while ( !freed_.empty() )
        {
            auto const p_freed{ std::prev( freed_.end() ) };
            auto const freed  { *p_freed };
            freed_.erase( p_freed );
            auto const last{ traits::prev( counter_.peek() ) };
            counter_ = sequence<Index>::continue_from( last );
            if ( last != freed )
                on_rename( last, freed );
        }
    }

    [[ nodiscard ]] size_type size () const noexcept { return traits::to_position( counter_.peek() ) - freed_.size(); }
    [[ nodiscard ]] bool      empty() const noexcept { return size() == 0; }

    [[ nodiscard ]] bool is_claimed( Index const id ) const noexcept { return ( id < counter_.peek() ) && !freed_.contains( id ); }

private:
    sequence<Index>                   counter_;
    boost::container::flat_set<Index> freed_;
}; // class id_pool

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
