////////////////////////////////////////////////////////////////////////////////
/// Argument passing helpers for multidict lookup functions.
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

#include <boost/config.hpp>

#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace multidict
{
//------------------------------------------------------------------------------

#if defined( __clang__ )
#   define MULTIDICT_TRIVIAL_ABI [[ clang::trivial_abi ]]
#else
#   define MULTIDICT_TRIVIAL_ABI
#endif

////////////////////////////////////////////////////////////////////////////////
// Lookup keys are taken 'by register' where that is cheaper than by reference:
// trivial small keys by value, string keys as string_views (so that literals
// and string_views can be used for lookup without materializing a key_type)
// and everything else by const reference.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivial_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
}; // can_be_passed_in_reg

/// Detects types that behave as strings (basic_string and its derived types).
/// Requires traits_type to distinguish from generic char containers (e.g. vector<char>).
template <typename T>
concept string_viewable = requires {
    typename T::value_type;
    typename T::traits_type;
} && requires( T const & t ) {
    std::basic_string_view<typename T::value_type, typename T::traits_type>{ t };
};

template <typename T>
struct optimal_const_ref { using type = T const &; };

template <string_viewable T>
struct optimal_const_ref<T> { using type = std::basic_string_view<typename T::value_type, typename T::traits_type>; };

template <typename T>
struct MULTIDICT_TRIVIAL_ABI pass_in_reg
{
    static auto constexpr pass_by_val{ can_be_passed_in_reg<T> };

    using  value_type = T;
    using stored_type = std::conditional_t<pass_by_val, T, typename optimal_const_ref<T>::type>;

    BOOST_FORCEINLINE
    constexpr pass_in_reg( auto const &... args ) noexcept requires requires { stored_type{ args... }; } : value{ args... } {}
    constexpr pass_in_reg( pass_in_reg const &  ) noexcept = default;
    constexpr pass_in_reg( pass_in_reg       && ) noexcept = default;

    stored_type value;

    [[ gnu::pure ]] BOOST_FORCEINLINE
    constexpr operator stored_type const &() const noexcept { return value; }
}; // pass_in_reg

template <typename T>
pass_in_reg( T ) -> pass_in_reg<T>;

template <typename T> [[ nodiscard ]] constexpr decltype( auto ) unwrap( pass_in_reg<T> const obj ) noexcept { return obj.value; }
template <typename T> [[ nodiscard ]] constexpr T &              unwrap( T &                  obj ) noexcept { return obj; }


namespace detail { [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg ); }

//------------------------------------------------------------------------------
} // namespace multidict
//------------------------------------------------------------------------------
