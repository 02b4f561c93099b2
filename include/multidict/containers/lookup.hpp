////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for the multidict containers.
///
/// Provides the key_const_arg_t alias: optimal key-passing type for lookup
/// functions.
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

#include "abi.hpp" // can_be_passed_in_reg, pass_in_reg, string_viewable

#include <type_traits>
//------------------------------------------------------------------------------
namespace multidict
{
//------------------------------------------------------------------------------

/// key_const_arg_t: optimal key-passing type for lookup functions.
///
///   - trivial/small keys → pass_in_reg<Key> holding the key by value
///   - string keys        → pass_in_reg<Key> holding a string_view, so string
///                          literals and string_views are accepted w/o
///                          constructing a temporary key_type
///   - anything else      → Key const &
template <typename Key>
using key_const_arg_t = std::conditional_t<
    can_be_passed_in_reg<Key> || string_viewable<Key>,
    pass_in_reg<Key>,
    Key const &
>;

//------------------------------------------------------------------------------
} // namespace multidict
//------------------------------------------------------------------------------
