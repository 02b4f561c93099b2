////////////////////////////////////////////////////////////////////////////////
/// detail::entry_store: insertion ordered (key, value) storage w/ tombstones
///
/// Entries live in a single vector in insertion order. Removal only clears the
/// entry's liveness bit (tombstoning) so the positions of all other entries
/// stay stable; a separate compaction step physically drops the dead slots,
/// preserving the relative order of the live ones, and reports how positions
/// moved so that an external index can be renumbered.
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

#include <boost/assert.hpp>
#include <boost/dynamic_bitset.hpp>

#include <cstddef>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace multidict::detail
{
//------------------------------------------------------------------------------

// compact() relocates entries in a noexcept step
template <typename Key, typename T>
    requires std::is_nothrow_move_assignable_v<std::pair<Key, T>>
class entry_store
{
public:
    using key_type    = Key;
    using mapped_type = T;
    using value_type  = std::pair<Key, T>;
    using size_type   = std::size_t;
    using live_flags  = boost::dynamic_bitset<>;

    static constexpr size_type npos{ live_flags::npos };

    // Dead slots are tolerated until they outnumber the live ones and there
    // are at least this many of them.
    static constexpr size_type compaction_floor{ 16 };

    entry_store() = default;
    entry_store( entry_store const & ) = default;
    entry_store( entry_store && other ) noexcept
        : entries_{ std::move( other.entries_ ) }, live_{ std::move( other.live_ ) }, live_count_{ std::exchange( other.live_count_, 0 ) } {}

    entry_store & operator=( entry_store const & ) = default;
    entry_store & operator=( entry_store && other ) noexcept
    {
        entries_    = std::move( other.entries_ );
        live_       = std::move( other.live_ );
        live_count_ = std::exchange( other.live_count_, 0 );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty() const noexcept { return live_count_ == 0; }
    [[ nodiscard ]] size_type size () const noexcept { return live_count_; }
    [[ nodiscard ]] size_type slots() const noexcept { return entries_.size(); }
    [[ nodiscard ]] size_type dead () const noexcept { return slots() - size(); }

    void reserve_additional( size_type const n )
    {
        entries_.reserve( entries_.size() + n );
        live_   .reserve( live_   .size() + n );
    }

    void shrink_to_fit() noexcept( noexcept( std::declval<std::vector<value_type> &>().shrink_to_fit() ) )
    {
        BOOST_ASSERT_MSG( dead() == 0, "shrink_to_fit() requires a compacted store" );
        entries_.shrink_to_fit();
    }

    //--------------------------------------------------------------------------
    // Access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool is_live( size_type const pos ) const noexcept { return pos < live_.size() && live_.test( pos ); }

    [[ nodiscard ]] value_type const & at( size_type const pos ) const noexcept { BOOST_ASSERT( pos < slots() ); return entries_[ pos ]; }

    [[ nodiscard ]] size_type first_live(                     ) const noexcept { return live_.find_first(); }
    [[ nodiscard ]] size_type next_live ( size_type const pos ) const noexcept { return live_.find_next( pos ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Constructs a new entry at the end, returns its position (strong
    /// guarantee).
    template <typename K, typename... Args>
    size_type append( K && key, Args &&... args )
    {
        auto const pos{ entries_.size() };
        entries_.emplace_back
        (
            std::piecewise_construct,
            std::forward_as_tuple( std::forward<K>( key ) ),
            std::forward_as_tuple( std::forward<Args>( args )... )
        );
        try {
            live_.push_back( true );
        } catch ( ... ) {
            entries_.pop_back();
            throw;
        }
        ++live_count_;
        return pos;
    }

    /// Undoes the appends past the first `mark` slots (all of which must still
    /// be live).
    void truncate( size_type const mark ) noexcept
    {
        BOOST_ASSERT( mark <= slots() );
        BOOST_ASSERT( live_count_ >= slots() - mark );
        live_count_ -= slots() - mark;
        entries_.erase( entries_.begin() + static_cast<std::ptrdiff_t>( mark ), entries_.end() );
        live_   .resize( mark );
    }

    /// Tombstones the entry at pos and hands out its value.
    [[ nodiscard ]] mapped_type remove_at( size_type const pos )
    {
        BOOST_ASSERT_MSG( is_live( pos ), "removing a dead or nonexistent entry" );
        mapped_type removed{ std::move( entries_[ pos ].second ) };
        live_.reset( pos );
        --live_count_;
        return removed;
    }

    /// Tombstones the entry at pos, destroying its value.
    void erase_at( size_type const pos ) { static_cast<void>( remove_at( pos ) ); }

    template <typename V>
    void replace_value_at( size_type const pos, V && value )
    {
        BOOST_ASSERT_MSG( is_live( pos ), "replacing the value of a dead or nonexistent entry" );
        entries_[ pos ].second = std::forward<V>( value );
    }

    void clear() noexcept
    {
        entries_.clear();
        live_   .clear();
        live_count_ = 0;
    }

    //--------------------------------------------------------------------------
    // Compaction
    //--------------------------------------------------------------------------

    /// Returns a remap table (to be passed to compact()) if, after
    /// `additional_dead` more removals, the store would be sparse enough to
    /// warrant compaction, or an empty table otherwise. This is the only
    /// allocating part of compaction so callers invoke it before mutating
    /// anything.
    [[ nodiscard ]] std::vector<size_type> prepare_compaction( size_type const additional_dead ) const
    {
        BOOST_ASSERT( additional_dead <= size() );
        auto const dead_after{ dead() + additional_dead };
        auto const live_after{ size() - additional_dead };
        if ( ( dead_after >= compaction_floor ) && ( dead_after > live_after ) )
            return std::vector<size_type>( slots(), npos );
        return {};
    }

    /// Unconditional variant of prepare_compaction() (empty if nothing is dead).
    [[ nodiscard ]] std::vector<size_type> prepare_full_compaction() const
    {
        if ( dead() == 0 )
            return {};
        return std::vector<size_type>( slots(), npos );
    }

    /// Drops the dead slots, filling remap[ old position ] with the new
    /// position of every live entry (npos for dead ones). Returns false (and
    /// does nothing) for an empty remap table.
    bool compact( std::span<size_type> const remap ) noexcept
    {
        if ( remap.empty() )
            return false;
        BOOST_ASSERT( remap.size() == slots() );

        size_type target{ 0 };
        for ( auto pos{ first_live() }; pos != npos; pos = next_live( pos ) )
        {
            if ( target != pos )
                entries_[ target ] = std::move( entries_[ pos ] );
            remap[ pos ] = target++;
        }
        BOOST_ASSERT( target == live_count_ );

        entries_.erase( entries_.begin() + static_cast<std::ptrdiff_t>( target ), entries_.end() );
        live_.resize( target );
        live_.set();
        return true;
    }

    void swap( entry_store & other ) noexcept
    {
        using std::swap;
        swap( entries_   , other.entries_    );
        swap( live_      , other.live_       );
        swap( live_count_, other.live_count_ );
    }

private:
    std::vector<value_type> entries_;
    live_flags              live_;
    size_type               live_count_{ 0 };
}; // class entry_store

//------------------------------------------------------------------------------
} // namespace multidict::detail
//------------------------------------------------------------------------------
