////////////////////////////////////////////////////////////////////////////////
/// detail::key_index: folded key → ascending entry positions
///
/// The auxiliary lookup structure of the multidict containers: every distinct
/// (folded) key maps onto the positions, in ascending order, of all of its
/// occurrences in the entry store. A key is present in the index iff it has at
/// least one occurrence.
///
/// String-like folded keys are hashed through their string_view so that
/// lookups can be performed w/ string_views (no temporary key strings).
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

#include "abi.hpp" // string_viewable

#include <boost/assert.hpp>
#include <boost/container/small_vector.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace multidict::detail
{
//------------------------------------------------------------------------------

template <typename FoldedKey>
struct index_hash
{
    [[ nodiscard ]] std::size_t operator()( FoldedKey const & key ) const noexcept( noexcept( boost::hash<FoldedKey>{}( key ) ) )
    {
        return boost::hash<FoldedKey>{}( key );
    }
}; // struct index_hash

template <string_viewable FoldedKey>
struct index_hash<FoldedKey>
{
    using view = std::basic_string_view<typename FoldedKey::value_type, typename FoldedKey::traits_type>;

    [[ nodiscard ]] std::size_t operator()( view const key ) const noexcept
    {
        return boost::hash_range( key.begin(), key.end() );
    }
}; // struct index_hash<string>


template <typename FoldedKey>
class key_index
{
public:
    using size_type     = std::size_t;
    using position_list = boost::container::small_vector<size_type, 1>; // most keys occur exactly once
    using hasher        = index_hash<FoldedKey>;
    using table_type    = boost::unordered_map<FoldedKey, position_list, hasher, std::equal_to<FoldedKey>>;

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] std::span<size_type const> positions_for( auto const & folded ) const noexcept
    {
        auto const node{ find_node( *this, folded ) };
        if ( node == table_.end() )
            return {};
        return { node->second.data(), node->second.size() };
    }

    [[ nodiscard ]] std::optional<size_type> first_position_for( auto const & folded ) const noexcept
    {
        auto const node{ find_node( *this, folded ) };
        if ( node == table_.end() )
            return std::nullopt;
        BOOST_ASSERT( !node->second.empty() );
        return node->second.front();
    }

    [[ nodiscard ]] bool contains( auto const & folded ) const noexcept { return find_node( *this, folded ) != table_.end(); }

    [[ nodiscard ]] size_type distinct_keys() const noexcept { return table_.size(); }
    [[ nodiscard ]] bool      empty        () const noexcept { return table_.empty(); }

    auto begin() const noexcept { return table_.begin(); }
    auto end  () const noexcept { return table_.end  (); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Adds pos to the occurrence list of the key, keeping the list ascending.
    template <typename K>
    void record( K && folded, size_type const pos )
    {
        auto & positions{ table_.try_emplace( std::forward<K>( folded ) ).first->second };
        // appends (the common case) land at the end
        positions.insert( std::upper_bound( positions.begin(), positions.end(), pos ), pos );
    }

    /// Removes exactly pos from the occurrence list of the key, dropping the
    /// key once it has no occurrences left.
    void unrecord( auto const & folded, size_type const pos ) noexcept
    {
        auto const node{ find_node( *this, folded ) };
        BOOST_ASSERT_MSG( node != table_.end(), "unrecording an unknown key" );
        auto & positions{ node->second };
        auto const it{ std::lower_bound( positions.begin(), positions.end(), pos ) };
        BOOST_ASSERT_MSG( it != positions.end() && *it == pos, "unrecording an unknown position" );
        positions.erase( it );
        if ( positions.empty() )
            table_.erase( node );
    }

    /// Drops the key together with all of its occurrences.
    void unrecord_all( auto const & folded ) noexcept
    {
        auto const node{ find_node( *this, folded ) };
        if ( node != table_.end() )
            table_.erase( node );
    }

    /// Keeps only the earliest occurrence of the key.
    void retain_first( auto const & folded ) noexcept
    {
        auto const node{ find_node( *this, folded ) };
        BOOST_ASSERT( node != table_.end() );
        auto & positions{ node->second };
        positions.erase( positions.begin() + 1, positions.end() );
    }

    /// Applies an entry store compaction remap table (old → new position).
    /// Compaction preserves relative order so the lists stay ascending.
    void renumber( std::span<size_type const> const remap ) noexcept
    {
        for ( auto & [ key, positions ] : table_ )
        {
            for ( auto & pos : positions )
            {
                BOOST_ASSERT( pos < remap.size() );
                pos = remap[ pos ];
            }
        }
    }

    void reserve( size_type const distinct_keys ) { table_.reserve( distinct_keys ); }
    void clear() noexcept { table_.clear(); }
    void swap( key_index & other ) noexcept { table_.swap( other.table_ ); }

private:
    // Same type lookups go through the table's own hasher; others (e.g.
    // string_view for string keys) through the heterogeneous find overload.
    template <typename Self, typename K>
    static auto find_node( Self & self, K const & folded ) noexcept
    {
        if constexpr ( std::same_as<K, FoldedKey> )
            return self.table_.find( folded );
        else
            return self.table_.find( folded, hasher{}, std::equal_to<>{} );
    }

private:
    table_type table_;
}; // class key_index

//------------------------------------------------------------------------------
} // namespace multidict::detail
//------------------------------------------------------------------------------
