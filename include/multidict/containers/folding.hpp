////////////////////////////////////////////////////////////////////////////////
/// Key folding policies and the folder wrapper for multidict containers.
///
/// Contents:
///   - FoldingPolicy<P, Key> : concept: P can fold a Key into its comparable form
///   - exact_fold            : identity (case sensitive) policy
///   - ascii_case_fold       : ASCII case insensitive policy
///   - folder<Policy>        : EBO wrapper w/ fold/eq + the folded key type
///
/// Containers inherit from folder to get zero-overhead policy storage plus the
/// derived key equality.
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

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace multidict
{
//------------------------------------------------------------------------------

//==============================================================================
// Policy concept
//==============================================================================

/// A folding policy maps a key onto the form used for hashing and equality by
/// the key index. Two keys are the same key iff their folded forms compare
/// equal. Policies may additionally provide eq( a, b ) to compare two keys
/// w/o materializing their folded forms.
template <typename Policy, typename Key>
concept FoldingPolicy = requires( Policy const & policy, Key const & key ) {
    { policy.fold( key ) };
    requires std::equality_comparable<std::remove_cvref_t<decltype( policy.fold( key ) )>>;
};


//==============================================================================
// Policies
//==============================================================================

/// Case sensitive (identity) folding: keys are indexed as they are.
struct exact_fold
{
    static constexpr bool identity{ true };

    template <typename K>
    [[ nodiscard, gnu::pure ]] static constexpr K const & fold( K const & key ) noexcept { return key; }
}; // struct exact_fold

/// ASCII case insensitive folding (HTTP header names and similar tokens).
/// Only A-Z are folded (classic locale), all other bytes, including UTF-8
/// sequences, are compared verbatim.
struct ascii_case_fold
{
    static constexpr bool identity{ false };

    [[ nodiscard ]] std::string fold( std::string_view key ) const;
    [[ nodiscard ]] bool        eq  ( std::string_view left, std::string_view right ) const noexcept;
}; // struct ascii_case_fold


//==============================================================================
// folder: policy wrapper (EBO via public inheritance)
//==============================================================================

/// Being an aggregate with a public base and no data members, folder<P>{ p }
/// and folder<P>{} both work w/o forwarding constructors.
template <typename Policy>
struct folder : Policy
{
    /// Type under which a Key is recorded in the key index.
    template <typename Key>
    using folded_type = std::remove_cvref_t<decltype( std::declval<Policy const &>().fold( std::declval<Key const &>() ) )>;

    /// True if folding a Key yields a reference to the key itself (i.e. never
    /// allocates and cannot throw).
    template <typename Key>
    static constexpr bool folds_in_place{ std::is_reference_v<decltype( std::declval<Policy const &>().fold( std::declval<Key const &>() ) )> };

    [[ nodiscard ]] constexpr Policy const & policy() const noexcept { return *this; }
    [[ nodiscard ]] constexpr Policy       & policy()       noexcept { return *this; }

    [[ nodiscard ]] constexpr decltype( auto ) fold( auto const & key ) const { return policy().fold( key ); }

    /// Three-tier dispatch:
    ///   1. the policy's own eq() if available
    ///   2. direct == for identity policies
    ///   3. comparison of the folded forms
    [[ nodiscard ]] constexpr bool eq( auto const & left, auto const & right ) const
    {
        if constexpr ( requires{ policy().eq( left, right ); } )
            return policy().eq( left, right );
        else if constexpr ( requires{ requires( Policy::identity ); left == right; } )
            return left == right;
        else
            return policy().fold( left ) == policy().fold( right );
    }
}; // struct folder

//------------------------------------------------------------------------------
} // namespace multidict
//------------------------------------------------------------------------------
