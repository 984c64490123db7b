////////////////////////////////////////////////////////////////////////////////
///
/// Diagnostic output macros ({fmt} based, stderr).
/// Compiled out entirely in NDEBUG builds.
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

#include <fmt/core.h>

#include <cstdio>
//------------------------------------------------------------------------------

#ifndef NDEBUG
#   define SID_LOG_IMPL( level, str, ... ) ::fmt::print( stderr, "[" level "][{} : {}]: " str "\n", __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__ )
#else
#   define SID_LOG_IMPL( level, str, ... ) ( (void)0 )
#endif

#define SID_LOG_ERROR( str, ... ) SID_LOG_IMPL( "ERROR", str __VA_OPT__(,) __VA_ARGS__ )
#define SID_LOG_WARN(  str, ... ) SID_LOG_IMPL( "WARN" , str __VA_OPT__(,) __VA_ARGS__ )
#define SID_LOG_DEBUG( str, ... ) SID_LOG_IMPL( "DEBUG", str __VA_OPT__(,) __VA_ARGS__ )

//------------------------------------------------------------------------------
