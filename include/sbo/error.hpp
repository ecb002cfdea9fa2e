////////////////////////////////////////////////////////////////////////////////
/// Out-of-line (cold) throw helpers shared by the sbo containers.
///
/// Only recoverable access errors (e.g. small_map::at() on a missing key) go
/// through here. Contract violations are BOOST_ASSERTs and expected absence is
/// reported through null pointers and empty optionals.
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
//------------------------------------------------------------------------------
namespace sbo
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace sbo
//------------------------------------------------------------------------------
