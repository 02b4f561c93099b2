////////////////////////////////////////////////////////////////////////////////
/// multidict::ci_multi_map (case insensitive keys) unit tests
////////////////////////////////////////////////////////////////////////////////

#include <multidict/containers/multi_map.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace multidict {
//------------------------------------------------------------------------------

using namespace std::string_view_literals;

namespace
{
    using entries = std::vector<std::pair<std::string, std::string>>;

    entries items_of( header_map const & m ) { return entries( m.begin(), m.end() ); }
} // anonymous namespace

static_assert( std::is_same_v<header_map::folding_policy, ascii_case_fold> );
static_assert( std::is_same_v<header_map::folded_key_type, std::string> );

//==============================================================================
// Lookup
//==============================================================================

TEST( ci_multi_map, lookup_ignores_case )
{
    header_map const m{ { "Content-Type", "text/html" } };
    EXPECT_EQ  ( m.get( "content-type" ), "text/html" );
    EXPECT_EQ  ( m.get( "CONTENT-TYPE" ), "text/html" );
    EXPECT_EQ  ( m.get( "Content-Type"sv ), "text/html" );
    EXPECT_TRUE( m.contains( "cOnTeNt-TyPe" ) );
    EXPECT_EQ  ( m.count( "content-type" ), 1 );
    EXPECT_TRUE( m.key_eq( "ACCEPT", "accept" ) );
}

TEST( ci_multi_map, differently_cased_keys_are_one_key )
{
    header_map m;
    m.insert( "Set-Cookie", "a=1" );
    m.insert( "set-cookie", "b=2" );
    m.insert( "SET-COOKIE", "c=3" );

    EXPECT_EQ( m.size(), 3 );
    EXPECT_EQ( m.distinct_keys(), 1 );
    EXPECT_EQ( m.get_all( "Set-Cookie" ), ( std::vector<std::string>{ "a=1", "b=2", "c=3" } ) );
}

TEST( ci_multi_map, stored_keys_keep_their_spelling )
{
    header_map const m{ { "X-Request-ID", "1" }, { "x-request-id", "2" } };
    EXPECT_EQ( items_of( m ), ( entries{ { "X-Request-ID", "1" }, { "x-request-id", "2" } } ) );
    EXPECT_EQ( m.find( "X-REQUEST-ID" )->first, "X-Request-ID" );
}

TEST( ci_multi_map, non_ascii_keys_compare_verbatim )
{
    header_map const m{ { "\xC3\x84rger", "1" } };
    EXPECT_TRUE ( m.contains( "\xC3\x84RGER" ) );
    EXPECT_FALSE( m.contains( "\xC3\xA4rger" ) );
}

TEST( ci_multi_map, at_throws_on_missing )
{
    header_map const m{ { "Host", "example.com" } };
    EXPECT_EQ   ( m.at( "HOST" ), "example.com" );
    EXPECT_THROW( static_cast<void>( m.at( "Accept" ) ), std::out_of_range );
}

//==============================================================================
// Modifiers
//==============================================================================

TEST( ci_multi_map, set_keeps_first_stored_key )
{
    header_map m{ { "Accept", "a" }, { "Host", "h" }, { "ACCEPT", "b" } };
    m.set( "accept", "c" );
    EXPECT_EQ( items_of( m ), ( entries{ { "Accept", "c" }, { "Host", "h" } } ) );
}

TEST( ci_multi_map, remove_first_and_remove_all_ignore_case )
{
    header_map m{ { "Via", "1" }, { "VIA", "2" }, { "Host", "h" }, { "via", "3" } };

    EXPECT_EQ( m.remove_first( "vIa" ), "1" );
    EXPECT_EQ( m.get( "via" ), "2" );

    EXPECT_EQ   ( m.remove_all( "VIA" ), ( std::vector<std::string>{ "2", "3" } ) );
    EXPECT_FALSE( m.contains( "via" ) );
    EXPECT_EQ   ( items_of( m ), ( entries{ { "Host", "h" } } ) );
}

TEST( ci_multi_map, erase_by_iterator )
{
    header_map m{ { "A", "1" }, { "a", "2" } };
    m.erase( m.begin() );
    EXPECT_EQ( m.get( "A" ), "2" );
    m.erase( m.begin() );
    EXPECT_TRUE( m.empty() );
}

TEST( ci_multi_map, extend_and_select )
{
    header_map       m    { { "Accept", "a" } };
    header_map const other{ { "ACCEPT", "b" }, { "Host", "h" } };
    m.extend( other );

    EXPECT_EQ( m.get_all( "accept" ), ( std::vector<std::string>{ "a", "b" } ) );

    auto const accept{ m.select( "aCCEPT" ) };
    EXPECT_EQ( accept.size(), 2 );
    EXPECT_EQ( accept.find( "accept" )->first, "Accept" );
}

TEST( ci_multi_map, assign_all_ignores_case )
{
    header_map m{ { "Warning", "1" }, { "WARNING", "2" } };
    EXPECT_EQ( m.assign_all( "warning", "x" ), 2 );
    EXPECT_EQ( items_of( m ), ( entries{ { "Warning", "x" }, { "WARNING", "x" } } ) );
}

TEST( ci_multi_map, many_removals_keep_lookups_correct )
{
    ci_multi_map<int> m;
    for ( int i{ 0 }; i < 64; ++i )
        m.insert( ( i % 2 ) ? "Key" : "OTHER", i );
    for ( int i{ 0 }; i < 30; ++i )
        m.remove_first( "key" );
    for ( int i{ 0 }; i < 20; ++i )
        m.remove_first( "other" );

    EXPECT_EQ( m.count( "KEY" ), 2 );
    EXPECT_EQ( m.get_all( "kEy" ), ( std::vector{ 61, 63 } ) );
    EXPECT_EQ( m.get( "other" ), 40 );
    EXPECT_EQ( m.count( "Other" ), 12 );
    EXPECT_EQ( m.size(), 14 );
}

//==============================================================================
// Comparison and rendering
//==============================================================================

TEST( ci_multi_map, equality_folds_keys )
{
    header_map const a{ { "Accept", "x" }, { "Host", "h" } };
    header_map const b{ { "host", "h" }, { "ACCEPT", "x" } };
    header_map const c{ { "Accept", "X" }, { "Host", "h" } };
    EXPECT_EQ   ( a, b );
    EXPECT_NE   ( a, c ); // values are not folded
    EXPECT_FALSE( ordered_equal( a, b ) );

    header_map const d{ { "ACCEPT", "x" }, { "HOST", "h" } };
    EXPECT_TRUE( ordered_equal( a, d ) );
}

TEST( ci_multi_map, stream_rendering_uses_stored_keys )
{
    header_map const m{ { "Content-Length", "0" }, { "ETag", "\"v1\"" } };
    std::ostringstream os;
    os << m;
    EXPECT_EQ( os.str(), R"(< "Content-Length":"0", "ETag":"\"v1\"" >)" );
}

//------------------------------------------------------------------------------
} // namespace multidict
//------------------------------------------------------------------------------
