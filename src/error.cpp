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
#include <sid/error.hpp>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_invalid_index    ( char const * const what ) { throw invalid_index    ( what ); }
    [[ noreturn, gnu::cold ]] void throw_absent_value     ( char const * const what ) { throw absent_value     ( what ); }
    [[ noreturn, gnu::cold ]] void throw_double_remove    ( char const * const what ) { throw double_remove    ( what ); }
    [[ noreturn, gnu::cold ]] void throw_empty_container  ( char const * const what ) { throw empty_container  ( what ); }
    [[ noreturn, gnu::cold ]] void throw_capacity_overflow( char const * const what ) { throw capacity_overflow( what ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
