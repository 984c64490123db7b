////////////////////////////////////////////////////////////////////////////////
/// Index-stable vector with tombstones.
///
/// Elements are addressed by handles (indices into the underlying slot array)
/// which stay valid until the element itself is removed: removal leaves a dead
/// slot (tombstone) in place. Dead slots form a singly linked free list
/// threaded through the slots themselves (terminated by the handle sentinel)
/// and are reused, most recently freed first, by subsequent allocations.
/// A run of dead slots at the end of the array is reclaimed immediately (so
/// the last slot, if any, is always alive).
/// coalesce() compacts the array on demand, relocating the minimal number of
/// elements and reporting each relocation (old handle, new handle) to the
/// caller.
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

#include <sid/containers/slot.hpp>
#include <sid/detail/log.hpp>
#include <sid/error.hpp>
#include <sid/index_traits.hpp>

#include <boost/assert.hpp>
#include <boost/dynamic_bitset.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <iterator>
#include <optional>
#include <queue>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
#ifndef SID_TOMB_VECTOR_CHECK_CONSISTENCY
#   ifdef NDEBUG
#       define SID_TOMB_VECTOR_CHECK_CONSISTENCY 0
#   else
#       define SID_TOMB_VECTOR_CHECK_CONSISTENCY 1
#   endif
#endif
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

namespace detail
{
    struct trailing_dead_run
    {
        std::size_t start;
        std::size_t count;

        friend constexpr bool operator==( trailing_dead_run, trailing_dead_run ) noexcept = default;
    }; // struct trailing_dead_run

    // Locates the (maximal) run of dead slots at the end of the given slot
    // range - nullopt if the range is empty or ends with a live slot.
    template <std::ranges::random_access_range Slots>
    requires std::ranges::sized_range<Slots>
    [[ nodiscard ]] constexpr std::optional<trailing_dead_run> find_trailing_dead_run( Slots const & slots ) noexcept
    {
        auto const size { static_cast<std::size_t>( std::ranges::size( slots ) ) };
        auto const first{ std::ranges::begin( slots ) };
        auto       start{ size };
        while ( ( start != 0 ) && !first[ start - 1 ].alive() )
            --start;
        if ( start == size )
            return std::nullopt;
        return trailing_dead_run{ start, size - start };
    }
} // namespace detail


////////////////////////////////////////////////////////////////////////////////
// \class tomb_vector
////////////////////////////////////////////////////////////////////////////////

template <typename T, stable_index Index = std::size_t, auto overflow_handler = throw_on_overflow{}>
class tomb_vector
{
public:
    using value_type      = T;
    using index_type      = Index;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = T       &;
    using const_reference = T const &;
    using slot_type       = slot<T, Index>;

private:
    using traits    = index_traits<Index>;
    using storage_t = std::vector<slot_type>;

    template <typename Impl, typename Tag, typename Value, typename Reference = Value &>
    using iter_impl = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        Impl,
#   endif
        Tag,
        Value,
        Reference,
        std::conditional_t<std::is_reference_v<Reference>, std::add_pointer_t<Reference>, boost::stl_interfaces::proxy_arrow_result<Reference>>
    >;

    template <bool is_const> class basic_iterator;
    template <bool is_const> class basic_indexed_iterator;

public:
    using       iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true >;

    using       indexed_iterator = basic_indexed_iterator<false>;
    using const_indexed_iterator = basic_indexed_iterator<true >;

public:
    tomb_vector() noexcept = default;

    tomb_vector( tomb_vector const &  ) = default;
    tomb_vector( tomb_vector       && other ) noexcept
        :
        slots_    { std::move( other.slots_ ) },
        next_free_{ std::exchange( other.next_free_, traits::sentinel() ) },
        count_    { std::exchange( other.count_, 0 ) }
    {
        other.slots_.clear();
    }

    tomb_vector & operator=( tomb_vector const &  ) = default;
    tomb_vector & operator=( tomb_vector       && other ) noexcept
    {
        if ( this != &other )
        {
            slots_     = std::move( other.slots_ );
            next_free_ = std::exchange( other.next_free_, traits::sentinel() );
            count_     = std::exchange( other.count_, 0 );
            other.slots_.clear();
        }
        return *this;
    }

    ~tomb_vector() noexcept = default;

    [[ nodiscard ]] static tomb_vector with_capacity( size_type const capacity )
    {
        tomb_vector result;
        result.reserve( capacity );
        return result;
    }

    // n live copies of value (handles 0 to n - 1)
    [[ nodiscard ]] static tomb_vector populate( T const & value, size_type const n ) requires std::copy_constructible<T>
    {
        tomb_vector result;
        result.append_n( n, value );
        return result;
    }

    [[ nodiscard ]] static tomb_vector populate_defaults( size_type const n ) requires std::default_initializable<T>
    {
        tomb_vector result;
        result.append_n( n );
        return result;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------

    // number of live elements
    [[ nodiscard, gnu::pure ]] size_type size      () const noexcept { return count_; }
    [[ nodiscard, gnu::pure ]] bool      empty     () const noexcept { return count_ == 0; }
    // number of slots (live and dead)
    [[ nodiscard, gnu::pure ]] size_type capacity  () const noexcept { return slots_.size(); }
    [[ nodiscard, gnu::pure ]] size_type dead_count() const noexcept { return capacity() - size(); }

    [[ nodiscard ]] static constexpr size_type max_capacity() noexcept { return addressable_positions<Index>(); }

    [[ nodiscard ]] double utilization() const noexcept
    {
        if ( slots_.empty() )
            return 1.0;
        return static_cast<double>( count_ ) / static_cast<double>( slots_.size() );
    }

    [[ nodiscard ]] bool has_free_slots() const noexcept { return next_free_ != traits::sentinel(); }

    void reserve( size_type const new_capacity ) { slots_.reserve( new_capacity ); }

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------

    [[ nodiscard ]] T * get( Index const index ) noexcept
    {
        auto const position{ traits::to_position( index ) };
        if ( position >= slots_.size() )
            return nullptr;
        auto & slot{ slots_[ position ] };
        return slot.alive() ? &slot.value() : nullptr;
    }
    [[ nodiscard ]] T const * get( Index const index ) const noexcept { return const_cast<tomb_vector &>( *this ).get( index ); }

    [[ nodiscard ]] bool contains( Index const index ) const noexcept { return get( index ) != nullptr; }

    [[ nodiscard ]] T & at( Index const index )
    {
        if ( auto * const p_value{ get( index ) } ) [[ likely ]]
            return *p_value;
        detail::throw_absent_value( "sid::tomb_vector::at: no live element at the given index" );
    }
    [[ nodiscard ]] T const & at( Index const index ) const { return const_cast<tomb_vector &>( *this ).at( index ); }

    [[ nodiscard ]] T       & operator[]( Index const index )       noexcept { BOOST_ASSERT_MSG( contains( index ), "Dead or out of range index" ); return slots_[ traits::to_position( index ) ].value(); }
    [[ nodiscard ]] T const & operator[]( Index const index ) const noexcept { BOOST_ASSERT_MSG( contains( index ), "Dead or out of range index" ); return slots_[ traits::to_position( index ) ].value(); }

    // raw slot array (diagnostics)
    [[ nodiscard ]] std::span<slot_type const> slots() const noexcept { return slots_; }

    // free list contents, from head to tail (diagnostics)
    [[ nodiscard ]] std::vector<Index> free_list() const
    {
        std::vector<Index> result;
        result.reserve( dead_count() );
        for ( auto index{ next_free_ }; index != traits::sentinel(); index = slots_[ traits::to_position( index ) ].next_free() )
            result.push_back( index );
        return result;
    }

    //--------------------------------------------------------------------------
    // Iteration (live elements only, in storage order)
    //--------------------------------------------------------------------------

    [[ nodiscard ]]       iterator  begin()       noexcept { return {  &slots_, first_alive() }; }
    [[ nodiscard ]] const_iterator  begin() const noexcept { return {  &slots_, first_alive() }; }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]]       iterator  end  ()       noexcept { return {  &slots_, slots_.size() }; }
    [[ nodiscard ]] const_iterator  end  () const noexcept { return {  &slots_, slots_.size() }; }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end(); }

    // (index, value) pairs
    [[ nodiscard ]] auto with_index()       noexcept { return std::ranges::subrange{       indexed_iterator{ begin() },       indexed_iterator{ end() } }; }
    [[ nodiscard ]] auto with_index() const noexcept { return std::ranges::subrange{ const_indexed_iterator{ begin() }, const_indexed_iterator{ end() } }; }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Reuses the most recently freed slot if there is one, appends a new slot
    // otherwise.
    template <typename ... Args>
    Index allocate( Args && ... args )
    {
        auto const index
        {
            has_free_slots()
                ? reuse_free_slot( std::forward<Args>( args )... )
                : append_slot    ( std::forward<Args>( args )... )
        };
        ++count_;
        verify_consistency();
        return index;
    }

    Index allocate_default() requires std::default_initializable<T> { return allocate(); }

    T remove( Index const index )
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_empty_container( "sid::tomb_vector::remove: the container is empty" );
        auto const position{ traits::to_position( index ) };
        if ( position >= slots_.size() ) [[ unlikely ]]
            detail::throw_invalid_index( "sid::tomb_vector::remove: index out of range" );
        auto & slot{ slots_[ position ] };
        if ( !slot.alive() ) [[ unlikely ]]
            detail::throw_double_remove( "sid::tomb_vector::remove: the slot was already removed" );

        auto removed{ slot.kill( next_free_ ) };
        next_free_ = index;
        --count_;
        remove_trailing_dead_slots();
        verify_consistency();
        return removed;
    }

    // Compacts the storage so that the live elements occupy the handles
    // [0, size()). Each element moved in the process is reported through
    // on_relocate( old_index, new_index ) (exactly once, after the move). If
    // on_relocate throws, the relocations done so far are kept, the container
    // is brought back into a consistent (partially compacted) state and the
    // exception is propagated.
    // Returns the number of relocated elements.
    template <typename OnRelocate>
    requires std::invocable<OnRelocate &, Index, Index>
    size_type coalesce( OnRelocate && on_relocate )
    {
        if ( !has_free_slots() )
            return 0;

        std::priority_queue<Index, std::vector<Index>, std::greater<>> targets{ std::greater<>{}, free_list() };

        auto      back       { slots_.size() - 1 };
        size_type relocations{ 0 };
        try
        {
            while ( !targets.empty() )
            {
                auto const target{ traits::to_position( targets.top() ) };
                targets.pop();
                while ( ( back > target ) && !slots_[ back ].alive() )
                    --back;
                if ( back <= target ) // the rest is a dead tail
                    break;

                auto & source{ slots_[ back ] };
                slots_[ target ].revive( std::move( source.value() ) );
                source.bury( traits::sentinel() );
                ++relocations;
                on_relocate( traits::from_position( back ), traits::from_position( target ) );
                --back;
            }
        }
        catch ( ... )
        {
            SID_LOG_WARN( "coalescing aborted after {} relocation(s), rebuilding the free list", relocations );
            rebuild_free_list();
            verify_consistency();
            throw;
        }

        BOOST_ASSERT( std::ranges::all_of( slots_.begin() + static_cast<difference_type>( count_ ), slots_.end(), []( slot_type const & slot ) { return !slot.alive(); } ) );
        slots_.erase( slots_.begin() + static_cast<difference_type>( count_ ), slots_.end() );
        next_free_ = traits::sentinel();
        verify_consistency();
        return relocations;
    }

    size_type coalesce() { return coalesce( []( Index, Index ) noexcept {} ); }

    void clear() noexcept
    {
        slots_.clear();
        next_free_ = traits::sentinel();
        count_     = 0;
    }

    void swap( tomb_vector & other ) noexcept
    {
        using std::swap;
        swap( slots_    , other.slots_     );
        swap( next_free_, other.next_free_ );
        swap( count_    , other.count_     );
    }
    friend void swap( tomb_vector & left, tomb_vector & right ) noexcept { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Diagnostics
    //--------------------------------------------------------------------------

    // Full (linear) verification of the internal invariants: no trailing
    // dead slots, the free list visits exactly the dead slots (each once) and
    // the live count matches.
    [[ nodiscard ]] bool is_consistent() const
    {
        auto const slot_count{ slots_.size() };
        if ( slot_count && !slots_.back().alive() )
            return false;

        boost::dynamic_bitset<> dead_slots  ( slot_count );
        boost::dynamic_bitset<> listed_slots( slot_count );
        for ( size_type position{ 0 }; position < slot_count; ++position )
            dead_slots[ position ] = !slots_[ position ].alive();
        if ( dead_slots.count() + count_ != slot_count )
            return false;

        for ( auto index{ next_free_ }; index != traits::sentinel(); )
        {
            auto const position{ traits::to_position( index ) };
            if ( position >= slot_count || slots_[ position ].alive() || listed_slots.test( position ) )
                return false;
            listed_slots.set( position );
            index = slots_[ position ].next_free();
        }
        return listed_slots == dead_slots;
    }

private:
    template <typename ... Args>
    Index reuse_free_slot( Args && ... args )
    {
        auto const index{ next_free_ };
        auto &     slot { slots_[ traits::to_position( index ) ] };
        auto const next { slot.next_free() };
        slot.revive( std::forward<Args>( args )... );
        next_free_ = next;
        return index;
    }

    template <typename ... Args>
    Index append_slot( Args && ... args )
    {
        auto const position{ slots_.size() };
        if ( position >= max_capacity() ) [[ unlikely ]]
            overflow_handler();
        slots_.emplace_back( std::in_place, std::forward<Args>( args )... );
        return traits::from_position( position );
    }

    template <typename ... Args>
    void append_n( size_type const n, Args const & ... args )
    {
        BOOST_ASSERT( slots_.empty() );
        if ( n > max_capacity() ) [[ unlikely ]]
            overflow_handler();
        slots_.reserve( n );
        for ( size_type i{ 0 }; i < n; ++i )
            slots_.emplace_back( std::in_place, args... );
        count_ = n;
        verify_consistency();
    }

    // Pops the dead tail (if any) and splices the popped slots out of the
    // free list.
    void remove_trailing_dead_slots() noexcept
    {
        auto const dead_tail{ detail::find_trailing_dead_run( slots_ ) };
        if ( !dead_tail )
            return;
        if ( dead_tail->count == slots_.size() )
        {
            clear();
            return;
        }

        auto const new_size{ dead_tail->start };
        for ( auto * p_link{ &next_free_ }; *p_link != traits::sentinel(); )
        {
            auto & node{ slots_[ traits::to_position( *p_link ) ] };
            if ( traits::to_position( *p_link ) >= new_size )
                *p_link = node.next_free();
            else
                p_link  = &node.link();
        }
        slots_.erase( slots_.begin() + static_cast<difference_type>( new_size ), slots_.end() );
    }

    // Recreates the free list from scratch (ascending order) after popping
    // any dead tail.
    void rebuild_free_list() noexcept
    {
        while ( !slots_.empty() && !slots_.back().alive() )
            slots_.pop_back();
        next_free_ = traits::sentinel();
        for ( auto position{ slots_.size() }; position-- != 0; )
        {
            auto & slot{ slots_[ position ] };
            if ( !slot.alive() )
            {
                slot.link() = next_free_;
                next_free_  = traits::from_position( position );
            }
        }
    }

    void verify_consistency() const noexcept
    {
#   if SID_TOMB_VECTOR_CHECK_CONSISTENCY
        if ( !is_consistent() ) [[ unlikely ]]
        {
            SID_LOG_ERROR( "tomb_vector corrupted (live: {}, slots: {}, free list head: {})", count_, slots_.size(), traits::to_position( next_free_ ) );
            BOOST_ASSERT_MSG( false, "tomb_vector invariants violated" );
            std::abort();
        }
#   endif
    }

    size_type first_alive() const noexcept
    {
        size_type position{ 0 };
        while ( ( position != slots_.size() ) && !slots_[ position ].alive() )
            ++position;
        return position;
    }

private:
    storage_t slots_;
    Index     next_free_{ traits::sentinel() };
    size_type count_    { 0 };
}; // class tomb_vector


////////////////////////////////////////////////////////////////////////////////
// \class tomb_vector::basic_iterator
////////////////////////////////////////////////////////////////////////////////

template <typename T, stable_index Index, auto overflow_handler>
template <bool is_const>
class tomb_vector<T, Index, overflow_handler>::basic_iterator
    :
    public iter_impl<basic_iterator<is_const>, std::bidirectional_iterator_tag, std::conditional_t<is_const, T const, T>>
{
private:
    using impl    = iter_impl<basic_iterator<is_const>, std::bidirectional_iterator_tag, std::conditional_t<is_const, T const, T>>;
    using storage = std::conditional_t<is_const, storage_t const, storage_t>;
    using value   = std::conditional_t<is_const, T const, T>;

    friend class tomb_vector;

    constexpr basic_iterator( storage * const p_slots, size_type const position ) noexcept : p_slots_{ p_slots }, position_{ position } {}

public:
    constexpr basic_iterator() noexcept = default;
    template <bool other_const> requires( is_const && !other_const )
    constexpr basic_iterator( basic_iterator<other_const> const & other ) noexcept
        : p_slots_{ other.p_slots_ }, position_{ other.position_ } {}

    value & operator*() const noexcept
    {
        BOOST_ASSERT( position_ < p_slots_->size() );
        return (*p_slots_)[ position_ ].value();
    }

    constexpr basic_iterator & operator++() noexcept
    {
        BOOST_ASSERT( position_ < p_slots_->size() );
        do { ++position_; } while ( ( position_ != p_slots_->size() ) && !(*p_slots_)[ position_ ].alive() );
        return *this;
    }
    constexpr basic_iterator & operator--() noexcept
    {
        // the last slot is always alive so this cannot run past the beginning
        // unless decrementing begin()
        do { BOOST_ASSERT( position_ != 0 ); --position_; } while ( !(*p_slots_)[ position_ ].alive() );
        return *this;
    }
    using impl::operator++;
    using impl::operator--;

    friend constexpr bool operator==( basic_iterator const & left, basic_iterator const & right ) noexcept { return left.position_ == right.position_; }

    // handle of the pointed to element
    [[ nodiscard ]] Index index() const noexcept { return traits::from_position( position_ ); }

private:
    storage   * p_slots_ { nullptr };
    size_type   position_{ 0 };
}; // class basic_iterator


////////////////////////////////////////////////////////////////////////////////
// \class tomb_vector::basic_indexed_iterator
// Yields (index, value reference) pairs.
////////////////////////////////////////////////////////////////////////////////

template <typename T, stable_index Index, auto overflow_handler>
template <bool is_const>
class tomb_vector<T, Index, overflow_handler>::basic_indexed_iterator
    :
    public iter_impl
    <
        basic_indexed_iterator<is_const>,
        std::bidirectional_iterator_tag,
        std::pair<Index, std::conditional_t<is_const, T const, T> &>,
        std::pair<Index, std::conditional_t<is_const, T const, T> &>
    >
{
private:
    using pair = std::pair<Index, std::conditional_t<is_const, T const, T> &>;
    using impl = iter_impl<basic_indexed_iterator<is_const>, std::bidirectional_iterator_tag, pair, pair>;
    using base = basic_iterator<is_const>;

public:
    constexpr          basic_indexed_iterator(                   ) noexcept = default;
    constexpr explicit basic_indexed_iterator( base const current ) noexcept : current_{ current } {}

    pair operator*() const noexcept { return { current_.index(), *current_ }; }

    constexpr basic_indexed_iterator & operator++() noexcept { ++current_; return *this; }
    constexpr basic_indexed_iterator & operator--() noexcept { --current_; return *this; }
    using impl::operator++;
    using impl::operator--;

    friend constexpr bool operator==( basic_indexed_iterator const & left, basic_indexed_iterator const & right ) noexcept { return left.current_ == right.current_; }

    [[ nodiscard ]] Index index() const noexcept { return current_.index(); }
    [[ nodiscard ]] base  plain() const noexcept { return current_; }

private:
    base current_;
}; // class basic_indexed_iterator

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
