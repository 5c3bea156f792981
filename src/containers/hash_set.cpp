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
#include <dual/containers/hash_set.hpp>

#include <stdexcept>
#include <string>
//------------------------------------------------------------------------------
namespace dual
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found   ( char const * const where ) { throw std::out_of_range( std::string{ where } + ": key not found" ); }
    [[ noreturn, gnu::cold ]] void throw_already_borrowed( char const * const where ) { throw borrow_error     ( std::string{ where } + ": container is already mutably borrowed" ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace dual
//------------------------------------------------------------------------------
