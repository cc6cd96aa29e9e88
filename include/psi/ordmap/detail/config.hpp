////////////////////////////////////////////////////////////////////////////////
///
/// \file config.hpp
/// ----------------
///
/// Compile-time configuration of psi::ordmap.
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
// PSI_ORDMAP_VERIFY_UNIQUE_KEYS
//   Verify (O(n^2)) that raw pair sequences handed to ord_map constructors
//   hold unique keys and throw std::invalid_argument if they do not.
//   Defaults to on for debug builds.
#if !defined( PSI_ORDMAP_VERIFY_UNIQUE_KEYS )
#   if defined( NDEBUG )
#       define PSI_ORDMAP_VERIFY_UNIQUE_KEYS 0
#   else
#       define PSI_ORDMAP_VERIFY_UNIQUE_KEYS 1
#   endif
#endif // !defined( PSI_ORDMAP_VERIFY_UNIQUE_KEYS )

#if defined( _MSC_VER )
#   define PSI_ORDMAP_NO_UNIQUE_ADDRESS [[ msvc::no_unique_address ]]
#else
#   define PSI_ORDMAP_NO_UNIQUE_ADDRESS [[ no_unique_address ]]
#endif
//------------------------------------------------------------------------------
namespace psi::ordmap
{
//------------------------------------------------------------------------------

inline constexpr bool verify_unique_keys{ PSI_ORDMAP_VERIFY_UNIQUE_KEYS != 0 };

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range    ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_invalid_argument( char const * msg );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::ordmap
//------------------------------------------------------------------------------
