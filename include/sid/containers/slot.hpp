////////////////////////////////////////////////////////////////////////////////
/// Storage cell of the tombstone containers: either a live value or a dead
/// marker holding the (index based) link to the next free cell.
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

#include <boost/assert.hpp>

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

struct dead_t { explicit dead_t() = default; }; inline constexpr dead_t dead{};

template <typename T, typename Index>
class slot
{
    static_assert( std::is_trivially_copyable_v<Index> );

public:
    using value_type = T;
    using index_type = Index;

    slot( dead_t, Index const next_free ) noexcept : next_free_{ next_free }, alive_{ false } {}

    template <typename ... Args>
    explicit slot( std::in_place_t, Args && ... args ) noexcept( std::is_nothrow_constructible_v<T, Args...> )
        : value_( std::forward<Args>( args )... ), alive_{ true } {}

    slot( slot const & other ) noexcept( std::is_nothrow_copy_constructible_v<T> ) requires std::copy_constructible<T>
        : alive_{ other.alive_ }
    {
        if ( alive_ ) std::construct_at( &value_    , other.value_     );
        else          std::construct_at( &next_free_, other.next_free_ );
    }

    slot( slot && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
        : alive_{ other.alive_ }
    {
        if ( alive_ ) std::construct_at( &value_    , std::move( other.value_ ) );
        else          std::construct_at( &next_free_, other.next_free_          );
    }

    slot & operator=( slot const & other ) requires std::copy_constructible<T>
    {
        if ( this != &other )
        {
            slot copy{ other };
            *this = std::move( copy );
        }
        return *this;
    }

    slot & operator=( slot && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        if ( this == &other )
            return *this;
        if ( alive_ )
        {
            std::destroy_at( &value_ );
            std::construct_at( &next_free_, Index{} );
            alive_ = false;
        }
        if ( other.alive_ )
        {
            std::construct_at( &value_, std::move( other.value_ ) );
            alive_ = true;
        }
        else
        {
            std::construct_at( &next_free_, other.next_free_ );
        }
        return *this;
    }

    ~slot() noexcept { if ( alive_ ) std::destroy_at( &value_ ); }

    [[ nodiscard ]] bool alive() const noexcept { return alive_; }

    [[ nodiscard ]] T       & value()       noexcept { BOOST_ASSERT_MSG(  alive_, "Dead slot has no value" ); return value_; }
    [[ nodiscard ]] T const & value() const noexcept { BOOST_ASSERT_MSG(  alive_, "Dead slot has no value" ); return value_; }

    [[ nodiscard ]] Index next_free() const noexcept { BOOST_ASSERT_MSG( !alive_, "Live slot is not a free list node" ); return next_free_; }
    // mutable free list link (for splicing)
    [[ nodiscard ]] Index & link() noexcept { BOOST_ASSERT_MSG( !alive_, "Live slot is not a free list node" ); return next_free_; }

    // Constructs a value in a dead slot. On failure the slot is left dead
    // with its link intact.
    template <typename ... Args>
    T & revive( Args && ... args )
    {
        BOOST_ASSERT_MSG( !alive_, "Slot already holds a value" );
        auto const next_free{ next_free_ };
        try
        {
            std::construct_at( &value_, std::forward<Args>( args )... );
        }
        catch ( ... )
        {
            std::construct_at( &next_free_, next_free );
            throw;
        }
        alive_ = true;
        return value_;
    }

    // Moves the value out and turns the slot into a free list node.
    [[ nodiscard ]] T kill( Index const next_free )
    {
        BOOST_ASSERT_MSG( alive_, "Slot already dead" );
        T value( std::move( value_ ) );
        bury( next_free );
        return value;
    }

    // Destroys the value (presumably already moved from) and turns the slot
    // into a free list node.
    void bury( Index const next_free ) noexcept
    {
        BOOST_ASSERT_MSG( alive_, "Slot already dead" );
        std::destroy_at( &value_ );
        std::construct_at( &next_free_, next_free );
        alive_ = false;
    }

private:
    union
    {
        T     value_;
        Index next_free_;
    };
    bool alive_;
}; // class slot

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
