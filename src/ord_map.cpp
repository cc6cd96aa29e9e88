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
#include <psi/ordmap/detail/config.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::ordmap
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range    ( char const * const msg ) { throw std::out_of_range    ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_argument( char const * const msg ) { throw std::invalid_argument( msg ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
