////////////////////////////////////////////////////////////////////////////////
/// sid::tomb_vector test suite
////////////////////////////////////////////////////////////////////////////////

#include <sid/containers/tomb_vector.hpp>
#include <sid/strong_index.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

namespace
{
    using tv8 = tomb_vector<std::uint8_t, std::uint8_t>;

    struct id8_tag;
    using id8 = strong_index<id8_tag, std::uint8_t>;

    using relocations = std::vector<std::pair<std::uint8_t, std::uint8_t>>;

    tv8 make_full_u8()
    {
        tv8 tv;
        for ( unsigned i{ 0 }; i < 255; ++i )
            EXPECT_EQ( tv.allocate( static_cast<std::uint8_t>( i ) ), i );
        return tv;
    }

    // 27 and 15 become holes, 251-254 get reclaimed as a dead tail
    tv8 create_remove_end_1()
    {
        auto tv{ make_full_u8() };
        for ( std::uint8_t const index : { 27, 254, 15, 252, 251, 253 } )
            static_cast<void>( tv.remove( index ) );
        return tv;
    }

    // holes at 15, 25, 27, 30, 34, 35 and 229, everything past 230 reclaimed
    tv8 create_remove_end_2()
    {
        auto tv{ make_full_u8() };
        for
        (
            std::uint8_t const index :
            {
                27, 15, 250, 232, 231, 254, 252, 251, 25, 253, 229, 233, 234, 235, 236, 237,
                238, 239, 240, 35, 241, 242, 243, 245, 244, 246, 247, 248, 34, 249, 30
            }
        )
            EXPECT_EQ( tv.remove( index ), index );
        return tv;
    }

    template <typename TV>
    std::multiset<typename TV::value_type> payloads( TV const & tv )
    {
        return { tv.begin(), tv.end() };
    }
} // anonymous namespace

//==============================================================================
// Construction
//==============================================================================

TEST( tomb_vector, default_construction )
{
    tv8 tv;
    EXPECT_TRUE ( tv.empty() );
    EXPECT_EQ   ( tv.size(), 0 );
    EXPECT_EQ   ( tv.capacity(), 0 );
    EXPECT_EQ   ( tv.utilization(), 1.0 );
    EXPECT_FALSE( tv.has_free_slots() );
    EXPECT_EQ   ( tv.begin(), tv.end() );
    EXPECT_TRUE ( tv.is_consistent() );
    EXPECT_EQ   ( tv8::max_capacity(), 255 );
}

TEST( tomb_vector, with_capacity )
{
    auto tv{ tomb_vector<int, std::uint16_t>::with_capacity( 2 ) };
    EXPECT_EQ( tv.size(), 0 );
    EXPECT_EQ( tv.capacity(), 0 );

    auto const i1{ tv.allocate( 1212 ) };
    EXPECT_EQ( tv.size(), 1 );
    EXPECT_EQ( tv[ i1 ], 1212 );

    auto const i2{ tv.allocate( 31232 ) };
    EXPECT_EQ( tv.size(), 2 );
    EXPECT_EQ( tv[ i2 ], 31232 );

    tv.clear();
    EXPECT_EQ( tv.size(), 0 );
    EXPECT_EQ( tv.allocate( 1212  ), 0 );
    EXPECT_EQ( tv.allocate( 31232 ), 1 );
    EXPECT_EQ( tv.size(), 2 );
}

TEST( tomb_vector, populate )
{
    auto tv{ tomb_vector<std::string, std::uint8_t>::populate( "abc", 10 ) };
    EXPECT_EQ( tv.size(), 10 );
    EXPECT_EQ( tv.capacity(), 10 );
    EXPECT_TRUE( std::ranges::all_of( tv, []( std::string const & value ) { return value == "abc"; } ) );
    EXPECT_EQ( tv.allocate( "def" ), 10 );
}

TEST( tomb_vector, populate_defaults )
{
    auto constexpr count{ 50 };
    auto tv{ tomb_vector<std::size_t, std::uint8_t>::populate_defaults( count ) };
    EXPECT_EQ( tv.size(), count );
    EXPECT_EQ( tv[ 7 ], 0 );
    EXPECT_EQ( tv.allocate( 54354534 ), count );
    EXPECT_EQ( tv.size(), count + 1 );

    EXPECT_THROW( std::ignore = ( tomb_vector<int, std::uint8_t>::populate_defaults( 256 ) ), capacity_overflow );
}

TEST( tomb_vector, move_and_copy )
{
    tomb_vector<std::string, std::uint16_t> tv;
    for ( auto const * const str : { "a", "b", "c", "d" } )
        tv.allocate( str );
    std::ignore = tv.remove( 1 );

    auto copy{ tv };
    EXPECT_EQ( copy.size(), 3 );
    EXPECT_EQ( copy.free_list(), tv.free_list() );
    EXPECT_TRUE( copy.is_consistent() );

    auto moved{ std::move( tv ) };
    EXPECT_EQ( moved.size(), 3 );
    EXPECT_EQ( moved[ 3 ], "d" );
    EXPECT_TRUE( moved.has_free_slots() );
    EXPECT_TRUE( tv.empty() ); // NOLINT(bugprone-use-after-move)
    EXPECT_TRUE( tv.is_consistent() );
    EXPECT_EQ( tv.allocate( "x" ), 0 );

    tv = std::move( copy );
    EXPECT_EQ( tv.size(), 3 );
    EXPECT_EQ( tv.allocate( "y" ), 1 );
    EXPECT_TRUE( copy.empty() ); // NOLINT(bugprone-use-after-move)

    swap( tv, moved );
    EXPECT_EQ( tv   .size(), 3 );
    EXPECT_EQ( moved.size(), 4 );
}

//==============================================================================
// Allocation and access
//==============================================================================

TEST( tomb_vector, sequential_allocation )
{
    tv8 tv;
    for ( std::uint8_t i{ 0 }; i < 5; ++i )
        EXPECT_EQ( tv.allocate( i ), i );
    EXPECT_EQ( tv.size(), 5 );
    EXPECT_EQ( tv.capacity(), 5 );
}

TEST( tomb_vector, element_access )
{
    tomb_vector<int, std::uint8_t> tv;
    auto const a{ tv.allocate( 12312  ) };
    auto const b{ tv.allocate( 654645 ) };
    auto const c{ tv.allocate( 0      ) };
    auto const d{ tv.allocate( 123    ) };

    ASSERT_NE( tv.get( a ), nullptr );
    EXPECT_EQ( *tv.get( a ), 12312  );
    EXPECT_EQ( *tv.get( b ), 654645 );
    EXPECT_EQ( tv[ c ], 0   );
    EXPECT_EQ( tv[ d ], 123 );
    EXPECT_EQ( tv.at( b ), 654645 );
    EXPECT_EQ( tv.size(), 4 );

    EXPECT_EQ( tv.allocate( 43243 ), 4 );
    EXPECT_EQ( tv.allocate( 43243 ), 5 );
    EXPECT_EQ( tv.size(), 6 );

    // absence is not an error
    EXPECT_EQ   ( tv.get( 6   ), nullptr );
    EXPECT_EQ   ( tv.get( 200 ), nullptr );
    EXPECT_FALSE( tv.contains( 200 ) );
    std::ignore = tv.remove( b );
    EXPECT_EQ   ( tv.get( b ), nullptr );
    EXPECT_FALSE( tv.contains( b ) );
    EXPECT_THROW( std::ignore = tv.at( b   ), absent_value      );
    EXPECT_THROW( std::ignore = tv.at( 100 ), std::out_of_range );

    tomb_vector<int, std::uint8_t> const & ctv{ tv };
    EXPECT_EQ( *ctv.get( a ), 12312 );
    EXPECT_EQ(  ctv.at ( d ), 123   );
    EXPECT_EQ(  ctv.get( b ), nullptr );
}

TEST( tomb_vector, capacity_overflow )
{
    tv8 tv;
    for ( unsigned i{ 0 }; i < 255; ++i )
        tv.allocate( static_cast<std::uint8_t>( i ) );
    EXPECT_EQ( tv.size(), 255 );
    EXPECT_THROW( tv.allocate( 255 ), capacity_overflow );
    EXPECT_THROW( tv.allocate( 255 ), std::length_error );
    // nothing changed
    EXPECT_EQ  ( tv.size(), 255 );
    EXPECT_TRUE( tv.is_consistent() );
}

TEST( tomb_vector, remove_then_fill )
{
    auto tv{ make_full_u8() };
    for ( unsigned i{ 50 }; i < 150; ++i )
        EXPECT_EQ( tv.remove( static_cast<std::uint8_t>( i ) ), i );
    EXPECT_EQ( tv.size(), 155 );
    EXPECT_EQ( tv.dead_count(), 100 );

    for ( unsigned i{ 0 }; i < 100; ++i )
        tv.allocate( static_cast<std::uint8_t>( i + 50 ) );
    EXPECT_EQ( tv.size(), 255 );
    EXPECT_FALSE( tv.has_free_slots() );

    EXPECT_THROW( tv.allocate( 11 ), capacity_overflow );
}

//==============================================================================
// Removal
//==============================================================================

TEST( tomb_vector, remove_from_empty )
{
    tv8 tv;
    EXPECT_THROW( std::ignore = tv.remove( 0   ), empty_container );
    EXPECT_THROW( std::ignore = tv.remove( 123 ), std::logic_error );

    tomb_vector<int> big;
    EXPECT_THROW( std::ignore = big.remove( 12321 ), empty_container );
}

TEST( tomb_vector, remove_out_of_range )
{
    tv8 tv;
    tv.allocate( 1 );
    EXPECT_THROW( std::ignore = tv.remove( 1   ), invalid_index );
    EXPECT_THROW( std::ignore = tv.remove( 255 ), std::out_of_range );
    EXPECT_EQ( tv.size(), 1 );
}

TEST( tomb_vector, double_remove )
{
    tomb_vector<int, std::uint32_t> tv;
    tv.allocate( 12 );
    auto const id{ tv.allocate( 23 ) };
    tv.allocate( 23 );

    EXPECT_EQ( tv.remove( id ), 23 );
    EXPECT_THROW( std::ignore = tv.remove( id ), double_remove );
    EXPECT_THROW( std::ignore = tv.remove( id ), error );
    EXPECT_EQ  ( tv.size(), 2 );
    EXPECT_TRUE( tv.is_consistent() );
}

TEST( tomb_vector, remove_to_empty )
{
    tv8 tv;
    EXPECT_EQ( tv.allocate( 23 ), 0 );
    EXPECT_EQ( tv.allocate( 23 ), 1 );
    EXPECT_EQ( tv.size(), 2 );

    std::ignore = tv.remove( 0 );
    std::ignore = tv.remove( 1 );
    EXPECT_TRUE( tv.empty() );
    EXPECT_EQ  ( tv.capacity(), 0 );
    EXPECT_FALSE( tv.has_free_slots() );

    EXPECT_EQ( tv.allocate( 23 ), 0 );
    EXPECT_EQ( tv.allocate( 23 ), 1 );
}

TEST( tomb_vector, free_slot_reuse_is_lifo )
{
    tv8 tv;
    for ( std::uint8_t i{ 0 }; i < 100; ++i )
        tv.allocate( i );

    EXPECT_EQ( tv.remove( 90 ), 90 );
    EXPECT_EQ( tv.size(), 99 );
    EXPECT_EQ( tv.capacity(), 100 );
    {
        std::uint8_t expected{ 0 };
        for ( auto const value : tv )
        {
            if ( expected == 90 )
                ++expected;
            EXPECT_EQ( value, expected++ );
        }
    }

    EXPECT_EQ( tv.allocate( 123 ), 90 );
    EXPECT_EQ( tv[ 90 ], 123 );
    EXPECT_EQ( tv.size(), 100 );

    std::ignore = tv.remove( 20 );
    std::ignore = tv.remove( 32 );
    EXPECT_EQ( tv.size(), 98 );
    EXPECT_EQ( tv.free_list(), ( std::vector<std::uint8_t>{ 32, 20 } ) );

    EXPECT_EQ( tv.allocate( 124 ), 32 );
    EXPECT_EQ( tv.allocate( 125 ), 20 );
    EXPECT_EQ( tv.size(), 100 );
    EXPECT_TRUE( tv.free_list().empty() );
}

TEST( tomb_vector, remove_sequences )
{
    for
    (
        std::vector<std::size_t> const & removals :
        {
            std::vector<std::size_t>{ 1, 4, 5, 3, 2, 0 },
            std::vector<std::size_t>{ 0, 3, 2, 1, 4    }, // the whole free list gets spliced away
            std::vector<std::size_t>{ 9, 8, 7, 6, 5, 4, 3, 2, 1, 0 },
        }
    )
    {
        tomb_vector<std::size_t> tv;
        auto const count{ std::ranges::max( removals ) + 1 };
        for ( std::size_t i{ 0 }; i < count; ++i )
            EXPECT_EQ( tv.allocate( i ), i );
        for ( auto const item : removals )
        {
            EXPECT_EQ( tv.remove( item ), item );
            EXPECT_TRUE( tv.is_consistent() );
        }
        EXPECT_TRUE( tv.empty() );
        EXPECT_EQ  ( tv.capacity(), 0 );
        EXPECT_FALSE( tv.has_free_slots() );
    }
}

TEST( tomb_vector, trailing_dead_slots_are_reclaimed )
{
    auto const tv{ create_remove_end_1() };
    EXPECT_EQ( tv.size(), 249 );
    EXPECT_EQ( tv.capacity(), 251 );
    EXPECT_EQ( *std::prev( tv.end() ), 250 );
    EXPECT_EQ( std::prev( tv.end() ).index(), 250 );
    EXPECT_TRUE( tv.slots().back().alive() );

    auto const free_list{ tv.free_list() };
    std::set<std::uint8_t> const free_slots( free_list.begin(), free_list.end() );
    EXPECT_EQ( free_slots, ( std::set<std::uint8_t>{ 15, 27 } ) );
}

TEST( tomb_vector, trailing_dead_slots_are_reclaimed_interleaved )
{
    auto const tv{ create_remove_end_2() };
    EXPECT_EQ( tv.size(), 224 );
    EXPECT_EQ( tv.capacity(), 231 );
    EXPECT_EQ( *std::prev( tv.end() ), 230 );
    EXPECT_EQ( tv.dead_count(), 7 );
}

TEST( tomb_vector, remove_move_only )
{
    tomb_vector<std::unique_ptr<int>, std::uint16_t> tv;
    auto const a{ tv.allocate( std::make_unique<int>( 1 ) ) };
    auto const b{ tv.allocate( std::make_unique<int>( 2 ) ) };
    auto const c{ tv.allocate( std::make_unique<int>( 3 ) ) };

    auto const removed{ tv.remove( b ) };
    ASSERT_NE( removed, nullptr );
    EXPECT_EQ( *removed, 2 );

    EXPECT_EQ( tv.coalesce(), 1 );
    EXPECT_EQ( *tv[ a ], 1 );
    EXPECT_EQ( *tv[ b ], 3 );
    EXPECT_FALSE( tv.contains( c ) );
}

//==============================================================================
// Iteration
//==============================================================================

TEST( tomb_vector, iteration_skips_dead_slots )
{
    tomb_vector<std::string, std::uint16_t> tv;
    for ( auto const * const str : { "0", "1", "2", "3", "4", "5" } )
        tv.allocate( str );

    auto const check_all{ [ & ]
    {
        for ( auto it{ tv.begin() }; it != tv.end(); ++it )
            EXPECT_EQ( tv[ it.index() ], *it );
        for ( auto const [ index, value ] : tv.with_index() )
            EXPECT_EQ( tv[ index ], value );
        EXPECT_EQ( static_cast<std::size_t>( std::distance( tv.begin(), tv.end() ) ), tv.size() );
    } };

    EXPECT_EQ( tv.remove( 1 ), "1" ); check_all();
    EXPECT_EQ( tv.remove( 4 ), "4" ); check_all();
    EXPECT_EQ( tv.remove( 5 ), "5" ); check_all();
    EXPECT_EQ( tv.remove( 2 ), "2" ); check_all();

    std::vector<std::pair<std::uint16_t, std::string>> contents;
    for ( auto const [ index, value ] : tv.with_index() )
        contents.emplace_back( index, value );
    EXPECT_EQ( contents, ( std::vector<std::pair<std::uint16_t, std::string>>{ { 0, "0" }, { 3, "3" } } ) );
}

TEST( tomb_vector, bidirectional_iteration )
{
    tomb_vector<int, std::uint8_t> tv;
    for ( int i{ 0 }; i < 8; ++i )
        tv.allocate( i );
    for ( std::uint8_t const index : { 1, 2, 5 } )
        std::ignore = tv.remove( index );

    std::vector<int> reversed;
    for ( auto it{ tv.end() }; it != tv.begin(); )
        reversed.push_back( *--it );
    EXPECT_EQ( reversed, ( std::vector<int>{ 7, 6, 4, 3, 0 } ) );

    auto it{ tv.begin() };
    EXPECT_EQ( *it++, 0 );
    EXPECT_EQ( *it  , 3 );
    EXPECT_EQ( *it--, 3 );
    EXPECT_EQ( *it  , 0 );

    // mutation through iterators
    for ( auto & value : tv )
        value *= 10;
    for ( auto [ index, value ] : tv.with_index() )
        value += index;
    EXPECT_EQ( tv[ 3 ], 33 );
    EXPECT_EQ( tv[ 7 ], 77 );

    auto const & ctv{ tv };
    tomb_vector<int, std::uint8_t>::const_iterator const cit{ tv.begin() };
    EXPECT_EQ( cit, ctv.begin() );
    EXPECT_EQ( std::ranges::distance( ctv.with_index() ), 5 );
}

//==============================================================================
// Coalescing
//==============================================================================

TEST( tomb_vector, coalesce_relocates_from_the_back )
{
    auto tv{ create_remove_end_1() };
    auto const before{ payloads( tv ) };

    relocations moves;
    auto const relocated{ tv.coalesce( [ & ]( std::uint8_t const from, std::uint8_t const to ) { moves.emplace_back( from, to ); } ) };

    EXPECT_EQ( relocated, 2 );
    // smallest hole gets the last element
    EXPECT_EQ( moves, ( relocations{ { 250, 15 }, { 249, 27 } } ) );
    EXPECT_EQ( tv.size(), 249 );
    EXPECT_EQ( tv.capacity(), 249 );
    EXPECT_EQ( tv.utilization(), 1.0 );
    EXPECT_FALSE( tv.has_free_slots() );
    EXPECT_EQ( tv[ 15 ], 250 );
    EXPECT_EQ( tv[ 27 ], 249 );
    EXPECT_EQ( payloads( tv ), before );
}

TEST( tomb_vector, coalesce_stops_at_dead_tail )
{
    auto tv{ create_remove_end_2() };

    std::set<std::uint8_t> sources;
    std::set<std::uint8_t> targets;
    tv.coalesce
    (
        [ & ]( std::uint8_t const from, std::uint8_t const to )
        {
            EXPECT_TRUE( sources.insert( from ).second );
            EXPECT_TRUE( targets.insert( to   ).second );
        }
    );

    EXPECT_EQ( targets, ( std::set<std::uint8_t>{ 15, 25, 27, 30, 34, 35 } ) );
    EXPECT_TRUE( std::ranges::all_of( sources, []( std::uint8_t const index ) { return index > 223; } ) );

    std::set<std::uint8_t> const unique_values( tv.begin(), tv.end() );
    EXPECT_EQ( unique_values.size(), 224 );
    EXPECT_EQ( tv.capacity(), 224 );
}

TEST( tomb_vector, coalesce_dense_is_noop )
{
    tomb_vector<int, std::uint8_t> tv;
    EXPECT_EQ( tv.coalesce( []( std::uint8_t, std::uint8_t ) { FAIL(); } ), 0 );
    for ( int i{ 0 }; i < 10; ++i )
        tv.allocate( i );
    std::ignore = tv.remove( 9 ); // reclaimed immediately
    EXPECT_EQ( tv.coalesce( []( std::uint8_t, std::uint8_t ) { FAIL(); } ), 0 );
    EXPECT_EQ( tv.size(), 9 );
}

TEST( tomb_vector, coalesce_strong_index )
{
    tomb_vector<std::uint8_t, id8> tv;
    for ( unsigned i{ 0 }; i < 255; ++i )
        EXPECT_EQ( tv.allocate( static_cast<std::uint8_t>( i ) ), id8{ static_cast<std::uint8_t>( i ) } );
    EXPECT_THROW( tv.allocate( 0 ), capacity_overflow );

    for ( std::uint8_t const index : { 27, 254, 15, 252, 251, 253 } )
        std::ignore = tv.remove( id8{ index } );

    std::set<id8> sources;
    std::set<id8> targets;
    tv.coalesce( [ & ]( id8 const from, id8 const to ) { sources.insert( from ); targets.insert( to ); } );
    EXPECT_EQ( sources, ( std::set<id8>{ id8{ 249 }, id8{ 250 } } ) );
    EXPECT_EQ( targets, ( std::set<id8>{ id8{ 15  }, id8{ 27  } } ) );
    EXPECT_EQ( tv[ id8{ 15 } ], 250 );
}

TEST( tomb_vector, coalesce_callback_failure_keeps_invariants )
{
    tomb_vector<std::string, std::uint16_t> tv;
    for ( int i{ 0 }; i < 20; ++i )
        tv.allocate( std::to_string( i ) );
    for ( std::uint16_t const index : { 2, 4, 6, 8 } )
        std::ignore = tv.remove( index );
    auto const before{ payloads( tv ) };

    int calls{ 0 };
    EXPECT_THROW
    (
        tv.coalesce
        (
            [ & ]( std::uint16_t, std::uint16_t )
            {
                if ( ++calls == 2 )
                    throw std::runtime_error( "remap failed" );
            }
        ),
        std::runtime_error
    );
    EXPECT_EQ( calls, 2 );

    // both reported moves stay in effect, the rest is still pending
    EXPECT_TRUE( tv.is_consistent() );
    EXPECT_EQ  ( tv.size(), 16 );
    EXPECT_EQ  ( tv.capacity(), 18 );
    EXPECT_EQ  ( tv[ 2 ], "19" );
    EXPECT_EQ  ( tv[ 4 ], "18" );
    EXPECT_EQ  ( payloads( tv ), before );

    relocations moves;
    EXPECT_EQ( tv.coalesce( [ & ]( std::uint16_t const from, std::uint16_t const to ) { moves.emplace_back( static_cast<std::uint8_t>( from ), static_cast<std::uint8_t>( to ) ); } ), 2 );
    EXPECT_EQ( moves, ( relocations{ { 17, 6 }, { 16, 8 } } ) );
    EXPECT_EQ( tv.capacity(), 16 );
    EXPECT_EQ( payloads( tv ), before );
}

//==============================================================================
// Trailing dead run helper
//==============================================================================

TEST( tomb_vector, find_trailing_dead_run )
{
    using slot8 = slot<int, std::uint8_t>;
    using detail::find_trailing_dead_run;
    using detail::trailing_dead_run;

    std::vector<slot8> slots;
    EXPECT_EQ( find_trailing_dead_run( slots ), std::nullopt );

    slots.emplace_back( dead, std::uint8_t{ 255 } );
    EXPECT_EQ( find_trailing_dead_run( slots ), ( trailing_dead_run{ 0, 1 } ) );

    slots.clear();
    slots.emplace_back( std::in_place, 1 );
    slots.emplace_back( dead, std::uint8_t{ 255 } );
    slots.emplace_back( std::in_place, 2 );
    EXPECT_EQ( find_trailing_dead_run( slots ), std::nullopt );

    slots.emplace_back( dead, std::uint8_t{ 1 } );
    slots.emplace_back( dead, std::uint8_t{ 3 } );
    EXPECT_EQ( find_trailing_dead_run( slots ), ( trailing_dead_run{ 3, 2 } ) );
}

//==============================================================================
// Randomized model check
//==============================================================================

TEST( tomb_vector, random_operations_match_model )
{
    std::mt19937 rng{ 0x5eed };
    tomb_vector<int, std::uint16_t> tv;
    std::map<std::uint16_t, int> model;

    int next_value{ 0 };
    for ( int step{ 0 }; step < 4000; ++step )
    {
        auto const op{ rng() % 16 };
        if ( op < 8 || model.empty() )
        {
            auto const value{ next_value++ };
            auto const index{ tv.allocate( value ) };
            ASSERT_FALSE( model.contains( index ) );
            model.emplace( index, value );
        }
        else
        if ( op < 15 )
        {
            auto victim{ model.begin() };
            std::advance( victim, static_cast<std::ptrdiff_t>( rng() % model.size() ) );
            EXPECT_EQ( tv.remove( victim->first ), victim->second );
            model.erase( victim );
        }
        else
        {
            std::map<std::uint16_t, int> remapped{ model };
            tv.coalesce
            (
                [ & ]( std::uint16_t const from, std::uint16_t const to )
                {
                    ASSERT_TRUE ( remapped.contains( from ) );
                    ASSERT_FALSE( remapped.contains( to   ) );
                    remapped.emplace( to, remapped.at( from ) );
                    remapped.erase( from );
                }
            );
            model = std::move( remapped );
            EXPECT_EQ( tv.capacity(), tv.size() );
        }

        ASSERT_EQ( tv.size(), model.size() );
        ASSERT_TRUE( tv.is_consistent() );
        ASSERT_TRUE( tv.empty() || tv.slots().back().alive() );
    }

    for ( auto const & [ index, value ] : model )
        EXPECT_EQ( tv.at( index ), value );
    std::map<std::uint16_t, int> iterated;
    for ( auto const [ index, value ] : std::as_const( tv ).with_index() )
        iterated.emplace( index, value );
    EXPECT_EQ( iterated, model );
}

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
