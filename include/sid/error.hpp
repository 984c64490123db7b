////////////////////////////////////////////////////////////////////////////////
/// Exception types raised by the stable index containers and generators.
///
/// All of them report contract violations (the caller used a handle it did
/// not know to be live, or ran out of representable handles) and are raised
/// before the offending operation mutated anything. They additionally derive
/// from sid::error so the whole family can be caught at once.
/// Absence (a lookup of a dead or unknown handle) is not an error: lookups
/// return nullptr - only the checked accessors (at()) throw absent_value.
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

#include <stdexcept>
#include <utility>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

struct error { virtual ~error() = default; };

struct invalid_index     : std::out_of_range, error { using std::out_of_range::out_of_range; }; // handle outside of the storage bounds
struct absent_value      : std::out_of_range, error { using std::out_of_range::out_of_range; };
struct double_remove     : std::logic_error , error { using std::logic_error ::logic_error ; };
struct empty_container   : std::logic_error , error { using std::logic_error ::logic_error ; };
struct capacity_overflow : std::length_error, error { using std::length_error::length_error; };

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_invalid_index    ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_absent_value     ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_double_remove    ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_empty_container  ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_capacity_overflow( char const * what );
} // namespace detail

// Overflow handlers for containers with a bounded number of addressable
// slots (selected through a template parameter).
struct assert_on_overflow {
    [[ noreturn ]] void operator()() const noexcept {
        BOOST_ASSERT_MSG( false, "Handle space exhausted!" );
        std::unreachable();
    }
}; // assert_on_overflow
struct throw_on_overflow {
    [[ noreturn ]] void operator()() const { detail::throw_capacity_overflow( "sid: exceeded the storage limit of the index type" ); }
}; // throw_on_overflow

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
