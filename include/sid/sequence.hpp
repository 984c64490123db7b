////////////////////////////////////////////////////////////////////////////////
///
/// Monotonic id generator (ids are never recycled).
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

#include <sid/index_traits.hpp>
//------------------------------------------------------------------------------
namespace sid
{
//------------------------------------------------------------------------------

template <stable_index Index>
class sequence
{
private:
    using traits = index_traits<Index>;

public:
    constexpr sequence() noexcept : counter_{ traits::zero() } {}

    [[ nodiscard ]] static constexpr sequence continue_from( Index const start ) noexcept { return sequence{ start }; }

    // Throws capacity_overflow instead of handing out the sentinel.
    constexpr Index next()
    {
        auto const current{ counter_ };
        counter_ = traits::next( current );
        return current;
    }

    [[ nodiscard ]] constexpr Index peek() const noexcept { return counter_; }

private:
    constexpr explicit sequence( Index const start ) noexcept : counter_{ start } {}

    Index counter_;
}; // class sequence

//------------------------------------------------------------------------------
} // namespace sid
//------------------------------------------------------------------------------
