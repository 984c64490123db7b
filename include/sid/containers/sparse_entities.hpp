////////////////////////////////////////////////////////////////////////////////
/// Sparse collection with never recycled (virtual) ids on top of densely
/// packed (physical) tomb_vector storage.
///
/// Virtual ids are translated to physical handles through a hash map, every
/// physical slot remembers its virtual id so relocations reported by
/// coalescing can be applied to the translation table. Coalescing happens
/// on demand (coalesce()) and automatically after a removal, as configured by
/// the coalesce_policy.
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

#include <sid/containers/tomb_vector.hpp>
#include <sid/detail/log.hpp>
#include <sid/error.hpp>
#include <sid/index_traits.hpp>
#include <sid/sequence.hpp>

#include <boost/assert.hpp>
#include <boost/unordered_map.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

struct coalesce_policy
{
    // coalesce once the ratio of live to all slots drops below this...
    double      min_utilization{ 0.5 };
    // ...but only for storage at least this large
    std::size_t min_capacity   { 64 };

    [[ nodiscard ]] static constexpr coalesce_policy never() noexcept { return { 0.0, std::numeric_limits<std::size_t>::max() }; }

    [[ nodiscard ]] constexpr bool should_coalesce( std::size_t const capacity, double const utilization ) const noexcept
    {
        return ( capacity >= min_capacity ) && ( utilization < min_utilization );
    }
}; // struct coalesce_policy


template <typename T, stable_index VirtualId = std::uint32_t, stable_index PhysicalIndex = std::uint32_t>
class sparse_entities
{
public:
    struct entry
    {
        template <typename ... Args>
        explicit entry( VirtualId const virtual_id, Args && ... args ) : id{ virtual_id }, value( std::forward<Args>( args )... ) {}

        VirtualId id;
        T         value;
    }; // struct entry

private:
    using storage_t = tomb_vector<entry, PhysicalIndex>;

public:
    using value_type     = T;
    using index_type     = VirtualId;
    using size_type      = std::size_t;
    using iterator       = typename storage_t::iterator;
    using const_iterator = typename storage_t::const_iterator;

    sparse_entities() = default;
    explicit sparse_entities( coalesce_policy const policy ) noexcept : policy_{ policy } {}

    [[ nodiscard ]] static sparse_entities with_capacity( size_type const capacity, coalesce_policy const policy = {} )
    {
        sparse_entities result{ policy };
        result.storage_ .reserve( capacity );
        result.physical_.reserve( capacity );
        return result;
    }

    [[ nodiscard ]] size_type size       () const noexcept { return storage_.size       (); }
    [[ nodiscard ]] bool      empty      () const noexcept { return storage_.empty      (); }
    [[ nodiscard ]] size_type capacity   () const noexcept { return storage_.capacity   (); }
    [[ nodiscard ]] double    utilization() const noexcept { return storage_.utilization(); }

    [[ nodiscard ]] coalesce_policy policy(                              ) const noexcept { return policy_; }
                    void            policy( coalesce_policy const policy )       noexcept { policy_ = policy; }

    template <typename ... Args>
    VirtualId allocate( Args && ... args )
    {
        auto const id      { ids_.next() };
        auto const physical{ storage_.allocate( id, std::forward<Args>( args )... ) };
        try
        {
            physical_.emplace( id, physical );
        }
        catch ( ... )
        {
            static_cast<void>( storage_.remove( physical ) );
            throw;
        }
        return id;
    }

    [[ nodiscard ]] T * get( VirtualId const id ) noexcept
    {
        auto const p_mapping{ physical_.find( id ) };
        if ( p_mapping == physical_.end() )
            return nullptr;
        auto & element{ storage_[ p_mapping->second ] };
        BOOST_ASSERT( element.id == id );
        return &element.value;
    }
    [[ nodiscard ]] T const * get( VirtualId const id ) const noexcept { return const_cast<sparse_entities &>( *this ).get( id ); }

    [[ nodiscard ]] bool contains( VirtualId const id ) const noexcept { return physical_.find( id ) != physical_.end(); }

    [[ nodiscard ]] T & at( VirtualId const id )
    {
        if ( auto * const p_value{ get( id ) } ) [[ likely ]]
            return *p_value;
        detail::throw_absent_value( "sid::sparse_entities::at: no element with the given id" );
    }
    [[ nodiscard ]] T const & at( VirtualId const id ) const { return const_cast<sparse_entities &>( *this ).at( id ); }

    // current physical handle of the given element (nullptr if absent)
    [[ nodiscard ]] PhysicalIndex const * physical_index( VirtualId const id ) const noexcept
    {
        auto const p_mapping{ physical_.find( id ) };
        return ( p_mapping != physical_.end() ) ? &p_mapping->second : nullptr;
    }

    T remove( VirtualId const id )
    {
        auto const p_mapping{ physical_.find( id ) };
        if ( p_mapping == physical_.end() ) [[ unlikely ]]
            detail::throw_invalid_index( "sid::sparse_entities::remove: no element with the given id" );
        auto removed{ std::move( storage_.remove( p_mapping->second ).value ) };
        physical_.erase( p_mapping );

        if ( policy_.should_coalesce( storage_.capacity(), storage_.utilization() ) )
        {
            SID_LOG_DEBUG( "auto coalescing (live: {}, slots: {})", storage_.size(), storage_.capacity() );
            coalesce();
        }
        return removed;
    }

    // Compacts the physical storage (virtual ids are unaffected).
    // Returns the number of relocated elements.
    size_type coalesce()
    {
        return storage_.coalesce
        (
            [ this ]( PhysicalIndex, PhysicalIndex const to )
            {
                auto const p_mapping{ physical_.find( storage_[ to ].id ) };
                BOOST_ASSERT( p_mapping != physical_.end() );
                p_mapping->second = to;
            }
        );
    }

    void clear() noexcept
    {
        storage_ .clear();
        physical_.clear();
    }

    // entries (id, value) in physical storage order
    [[ nodiscard ]] iterator       begin()       noexcept { return storage_.begin(); }
    [[ nodiscard ]] const_iterator begin() const noexcept { return storage_.begin(); }
    [[ nodiscard ]] iterator       end  ()       noexcept { return storage_.end  (); }
    [[ nodiscard ]] const_iterator end  () const noexcept { return storage_.end  (); }

    [[ nodiscard ]] storage_t const & storage() const noexcept { return storage_; }

private:
    storage_t                                      storage_;
    boost::unordered_map<VirtualId, PhysicalIndex> physical_;
    sequence<VirtualId>                            ids_;
    coalesce_policy                                policy_;
}; // class sparse_entities

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
