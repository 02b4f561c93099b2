////////////////////////////////////////////////////////////////////////////////
/// multidict key folding policy unit tests
////////////////////////////////////////////////////////////////////////////////

#include <multidict/containers/folding.hpp>
#include <multidict/containers/lookup.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace multidict {
//------------------------------------------------------------------------------

using namespace std::string_view_literals;

//==============================================================================
// Compile time properties
//==============================================================================

static_assert( FoldingPolicy<exact_fold     , std::string> );
static_assert( FoldingPolicy<exact_fold     , int        > );
static_assert( FoldingPolicy<ascii_case_fold, std::string> );

static_assert(  folder<exact_fold     >::folds_in_place<std::string> );
static_assert( !folder<ascii_case_fold>::folds_in_place<std::string> );
static_assert( std::is_same_v<folder<exact_fold     >::folded_type<std::string>, std::string> );
static_assert( std::is_same_v<folder<ascii_case_fold>::folded_type<std::string>, std::string> );

static_assert( std::is_empty_v<folder<exact_fold     >> );
static_assert( std::is_empty_v<folder<ascii_case_fold>> );

// string keys are looked up through string_views
static_assert( std::is_same_v<key_const_arg_t<std::string>::stored_type, std::string_view> );
static_assert( std::is_same_v<key_const_arg_t<int        >::stored_type, int             > );
static_assert( std::is_convertible_v<std::string      const &, key_const_arg_t<std::string>> );
static_assert( std::is_convertible_v<std::string_view const &, key_const_arg_t<std::string>> );
static_assert( std::is_convertible_v<char const *     const &, key_const_arg_t<std::string>> );
static_assert( std::is_convertible_v<int              const &, key_const_arg_t<int        >> );

//==============================================================================
// exact_fold
//==============================================================================

TEST( exact_fold, is_identity )
{
    std::string const key{ "Accept" };
    EXPECT_EQ( &exact_fold::fold( key ), &key );

    folder<exact_fold> const f{};
    EXPECT_TRUE ( f.eq( "Accept"sv, "Accept"sv ) );
    EXPECT_FALSE( f.eq( "Accept"sv, "accept"sv ) );
    EXPECT_TRUE ( f.eq( 42, 42 ) );
}

//==============================================================================
// ascii_case_fold
//==============================================================================

TEST( ascii_case_fold, folds_ascii_letters )
{
    ascii_case_fold const policy{};
    EXPECT_EQ( policy.fold( "Content-Type"sv ), "content-type" );
    EXPECT_EQ( policy.fold( "X-API-KEY-2"sv  ), "x-api-key-2"  );
    EXPECT_EQ( policy.fold( ""sv             ), ""             );
}

TEST( ascii_case_fold, leaves_non_ascii_bytes_untouched )
{
    ascii_case_fold const policy{};
    // U+00C4 (LATIN CAPITAL LETTER A WITH DIAERESIS) is not folded to U+00E4
    std::string_view const upper{ "\xC3\x84-Key" };
    EXPECT_EQ   ( policy.fold( upper ), "\xC3\x84-key" );
    EXPECT_FALSE( policy.eq( upper, "\xC3\xA4-key"sv ) );
}

TEST( ascii_case_fold, eq_ignores_ascii_case )
{
    ascii_case_fold const policy{};
    EXPECT_TRUE ( policy.eq( "Content-Type"sv, "CONTENT-type"sv ) );
    EXPECT_FALSE( policy.eq( "Content-Type"sv, "Content-Typ"sv  ) );
    EXPECT_FALSE( policy.eq( "a"sv           , "b"sv            ) );
}

TEST( ascii_case_fold, folder_dispatches_to_policy_eq )
{
    folder<ascii_case_fold> const f{};
    EXPECT_TRUE ( f.eq( "Host"sv, "hOST"sv ) );
    EXPECT_FALSE( f.eq( "Host"sv, "Hosts"sv ) );
    EXPECT_EQ   ( f.fold( "HoSt"sv ), "host" );
}

//------------------------------------------------------------------------------
} // namespace multidict
//------------------------------------------------------------------------------
