////////////////////////////////////////////////////////////////////////////////
/// basic_multi_map: insertion ordered multi-valued associative container
///
/// A map in which a key may be bound to any number of values and in which the
/// global insertion order of all (key, value) entries is preserved and
/// observable through iteration (HTTP header fields, URL query parameters,
/// form data...).
///
/// Architecture:
///   - detail::entry_store<Key, T>: the entries in insertion order, the single
///     source of truth for content and order. Removal tombstones (positions of
///     other entries stay stable), sparse stores get compacted.
///   - detail::key_index<folded key>: folded key → ascending positions of its
///     occurrences, for O(1) average lookup.
///   - folder<Folding>: the key folding policy (EBO base), exact_fold (case
///     sensitive) by default.
///
/// Every modifier updates the entry store first and then brings the key index
/// back in sync; if it throws (allocation failure) the container is left
/// unchanged. Entries must be nothrow move assignable (compaction relocates
/// them in a noexcept step).
///
/// Iterators are forward, read-only (entry keys are immutable, values are
/// changed through set(), assign_all() and replace_value()). Appending does
/// not invalidate iterators (references to entries are invalidated by
/// reallocation as w/ std::vector), any erasure may (due to compaction).
///
/// Not thread safe: concurrent use requires external synchronization, with
/// the usual exception of concurrent read-only access.
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

#include "abi.hpp"
#include "entry_store.hpp"
#include "folding.hpp"
#include "key_index.hpp"
#include "lookup.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <iterator>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace multidict
{
//------------------------------------------------------------------------------

struct reserve_t { explicit reserve_t() = default; };
inline constexpr reserve_t reserve_capacity{};

//==============================================================================
// basic_multi_map
//==============================================================================

template
<
    typename Key,
    typename T,
    typename Folding = exact_fold
>
class basic_multi_map
    : private folder<Folding>
{
    using folder_base = folder<Folding>;
    using store_type  = detail::entry_store<Key, T>;

    static_assert( FoldingPolicy<Folding, Key>, "Folding must be able to fold a Key" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<key_type, mapped_type>;
    using folding_policy  = Folding;
    using folded_key_type = typename folder_base::template folded_type<Key>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = value_type const &;
    using const_reference = value_type const &;
    using key_const_arg   = key_const_arg_t<Key>;

private:
    using index_type = detail::key_index<folded_key_type>;

    static constexpr size_type npos{ store_type::npos };
    static constexpr bool folds_in_place{ folder_base::template folds_in_place<Key> };

public:
    //--------------------------------------------------------------------------
    // Iterator
    //--------------------------------------------------------------------------
    class const_iterator
    {
    public:
        using iterator_concept  = std::forward_iterator_tag;
        using iterator_category = std::forward_iterator_tag;
        using value_type        = basic_multi_map::value_type;
        using difference_type   = basic_multi_map::difference_type;
        using reference         = basic_multi_map::const_reference;
        using pointer           = value_type const *;

    private:
        friend basic_multi_map;

        store_type const * store_{ nullptr };
        size_type          slot_ { npos    };

        constexpr const_iterator( store_type const * const store, size_type const slot ) noexcept : store_{ store }, slot_{ slot } {}

    public:
        constexpr const_iterator() noexcept = default;

        reference operator* () const noexcept { BOOST_ASSERT( store_ && store_->is_live( slot_ ) ); return store_->at( slot_ ); }
        pointer   operator->() const noexcept { return &**this; }

        const_iterator & operator++(     ) noexcept { slot_ = store_->next_live( slot_ ); return *this; }
        const_iterator   operator++( int ) noexcept { auto tmp{ *this }; ++*this; return tmp; }

        friend constexpr bool operator==( const_iterator const & a, const_iterator const & b ) noexcept { return a.slot_ == b.slot_; }
    }; // const_iterator

    using iterator = const_iterator;

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    basic_multi_map() = default;

    explicit basic_multi_map( Folding const & folding ) noexcept( std::is_nothrow_copy_constructible_v<Folding> )
        : folder_base{ folding } {}

    basic_multi_map( reserve_t, size_type const capacity, Folding const & folding = Folding{} )
        : folder_base{ folding }
    {
        reserve( capacity );
    }

    template <std::input_iterator InputIt, std::sentinel_for<InputIt> Sentinel>
    basic_multi_map( InputIt const first, Sentinel const last, Folding const & folding = Folding{} )
        : folder_base{ folding }
    {
        extend( first, last );
    }

    basic_multi_map( std::initializer_list<value_type> const il, Folding const & folding = Folding{} )
        : basic_multi_map( il.begin(), il.end(), folding ) {}

    basic_multi_map( basic_multi_map const & ) = default;
    basic_multi_map( basic_multi_map && )      = default;

    basic_multi_map & operator=( basic_multi_map const & ) = default;
    basic_multi_map & operator=( basic_multi_map && )      = default;

    basic_multi_map & operator=( std::initializer_list<value_type> const il )
    {
        basic_multi_map replacement{ il, key_fold() };
        swap( replacement );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators and views
    //--------------------------------------------------------------------------
    const_iterator begin () const noexcept { return { &store_, store_.first_live() }; }
    const_iterator end   () const noexcept { return { &store_, npos                }; }
    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    /// All (key, value) entries in insertion order.
    [[ nodiscard ]] auto items() const noexcept { return std::ranges::subrange<const_iterator>{ begin(), end() }; }

    /// The key of every entry in insertion order (a key occurring n times is
    /// produced n times).
    [[ nodiscard ]] auto keys() const noexcept
    {
        return items() | std::views::transform( []( value_type const & entry ) noexcept -> key_type const & { return entry.first; } );
    }

    /// The value of every entry in insertion order.
    [[ nodiscard ]] auto values() const noexcept
    {
        return items() | std::views::transform( []( value_type const & entry ) noexcept -> mapped_type const & { return entry.second; } );
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty        () const noexcept { return store_.empty(); }
    [[ nodiscard ]] size_type size         () const noexcept { return store_.size(); }
    [[ nodiscard ]] size_type distinct_keys() const noexcept { return index_.distinct_keys(); }

    void reserve( size_type const capacity )
    {
        if ( capacity > store_.size() )
            store_.reserve_additional( capacity - store_.size() );
        index_.reserve( capacity );
    }

    /// Drops all tombstones and releases spare capacity.
    void shrink_to_fit()
    {
        auto remap{ store_.prepare_full_compaction() };
        compact( remap );
        store_.shrink_to_fit();
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] Folding const & key_fold() const noexcept { return folder_base::policy(); }

    /// Are the two keys the same key under the folding policy?
    [[ nodiscard ]] bool key_eq( key_const_arg const left, key_const_arg const right ) const
    {
        return folder_base::eq( unwrap( left ), unwrap( right ) );
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      contains( key_const_arg const key ) const { return !positions_of( key ).empty(); }
    [[ nodiscard ]] size_type count   ( key_const_arg const key ) const { return  positions_of( key ).size (); }

    /// Iterator to the first occurrence of key (or end()).
    [[ nodiscard ]] const_iterator find( key_const_arg const key ) const
    {
        auto const positions{ positions_of( key ) };
        return { &store_, positions.empty() ? npos : positions.front() };
    }

    /// Value of the first occurrence of key, duplicates are not an error.
    [[ nodiscard ]] std::optional<mapped_type> get( key_const_arg const key ) const
    {
        auto const positions{ positions_of( key ) };
        if ( positions.empty() )
            return std::nullopt;
        return store_.at( positions.front() ).second;
    }

    /// Value of the first occurrence of key, throws std::out_of_range if there
    /// is none.
    [[ nodiscard ]] mapped_type const & at( key_const_arg const key ) const
    {
        auto const positions{ positions_of( key ) };
        if ( positions.empty() )
            detail::throw_out_of_range( "multidict::basic_multi_map::at" );
        return store_.at( positions.front() ).second;
    }

    /// Values of all occurrences of key in insertion order.
    [[ nodiscard ]] std::vector<mapped_type> get_all( key_const_arg const key ) const
    {
        auto const positions{ positions_of( key ) };
        std::vector<mapped_type> result;
        result.reserve( positions.size() );
        for ( auto const pos : positions )
            result.push_back( store_.at( pos ).second );
        return result;
    }

    /// A new container holding (only) the occurrences of key, in order.
    [[ nodiscard ]] basic_multi_map select( key_const_arg const key ) const
    {
        auto const positions{ positions_of( key ) };
        basic_multi_map result{ reserve_capacity, positions.size(), key_fold() };
        for ( auto const pos : positions )
        {
            auto const & entry{ store_.at( pos ) };
            result.emplace( entry.first, entry.second );
        }
        return result;
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Appends a new binding, existing bindings of the same key are kept.
    template <typename... Args>
    const_iterator emplace( key_type key, Args &&... args )
    {
        [[ maybe_unused ]] decltype( auto ) folded{ fold_for_record( key ) };
        auto const pos{ store_.append( std::move( key ), std::forward<Args>( args )... ) };
        try {
            if constexpr ( folds_in_place )
                index_.record( this->fold( store_.at( pos ).first ), pos );
            else
                index_.record( std::move( folded ), pos );
        } catch ( ... ) {
            store_.truncate( pos );
            throw;
        }
        return { &store_, pos };
    }

    const_iterator insert( key_type key, mapped_type value ) { return emplace( std::move( key ), std::move( value ) ); }
    const_iterator insert( value_type const & entry        ) { return emplace( entry.first, entry.second ); }
    const_iterator insert( value_type &&      entry        ) { return emplace( std::move( entry.first ), std::move( entry.second ) ); }

    /// Leaves key w/ a single binding to value: the first occurrence keeps its
    /// position (and stored key) and gets the new value, later occurrences
    /// are removed. Inserts if the key is absent.
    const_iterator set( key_type key, mapped_type value )
    {
        decltype( auto ) folded{ this->fold( key ) };
        auto const positions{ index_.positions_for( folded ) };
        if ( positions.empty() )
            return emplace( std::move( key ), std::move( value ) );

        auto const first{ positions.front() };
        typename index_type::position_list const doomed( positions.begin() + 1, positions.end() );
        auto remap{ store_.prepare_compaction( doomed.size() ) };

        store_.replace_value_at( first, std::move( value ) );
        index_.retain_first( folded );
        for ( auto const pos : doomed )
            store_.erase_at( pos );

        return { &store_, relocated( first, remap ) };
    }

    /// Replaces the value of every occurrence of key in place (positions and
    /// multiplicity are kept). Returns the number of replaced values.
    size_type assign_all( key_const_arg const key, mapped_type const & value )
    {
        auto const positions{ positions_of( key ) };
        std::vector<mapped_type> replacements( positions.size(), value );
        for ( size_type i{ 0 }; i != positions.size(); ++i )
            store_.replace_value_at( positions[ i ], std::move( replacements[ i ] ) );
        return positions.size();
    }

    /// Replaces the value of the entry at pos.
    void replace_value( const_iterator const pos, mapped_type value )
    {
        BOOST_ASSERT_MSG( pos.store_ == &store_, "iterator does not belong to this container" );
        store_.replace_value_at( pos.slot_, std::move( value ) );
    }

    /// Removes only the first occurrence of key and returns its value.
    std::optional<mapped_type> remove_first( key_const_arg const key )
    {
        decltype( auto ) lookup_key{ unwrap( key ) };
        decltype( auto ) folded    { this->fold( lookup_key ) };
        auto const first{ index_.first_position_for( folded ) };
        if ( !first )
            return std::nullopt;

        auto remap{ store_.prepare_compaction( 1 ) };
        std::optional<mapped_type> removed{ store_.remove_at( *first ) };
        index_.unrecord( folded, *first );
        compact( remap );
        return removed;
    }

    /// Removes every occurrence of key, returning the values in insertion
    /// order.
    std::vector<mapped_type> remove_all( key_const_arg const key )
    {
        decltype( auto ) lookup_key{ unwrap( key ) };
        decltype( auto ) folded    { this->fold( lookup_key ) };
        auto const positions{ index_.positions_for( folded ) };
        if ( positions.empty() )
            return {};

        std::vector<mapped_type> removed;
        removed.reserve( positions.size() );
        auto remap{ store_.prepare_compaction( positions.size() ) };
        for ( auto const pos : positions )
            removed.push_back( store_.remove_at( pos ) );
        index_.unrecord_all( folded );
        compact( remap );
        return removed;
    }

    /// Removes the entry at pos, returns the iterator following it.
    const_iterator erase( const_iterator const pos )
    {
        BOOST_ASSERT_MSG( pos.store_ == &store_ && store_.is_live( pos.slot_ ), "erasing an invalid iterator" );
        auto const slot{ pos.slot_ };
        decltype( auto ) folded{ this->fold( store_.at( slot ).first ) };
        auto remap{ store_.prepare_compaction( 1 ) };
        store_.erase_at( slot );
        index_.unrecord( folded, slot );
        auto const next{ store_.next_live( slot ) };
        return { &store_, relocated( next, remap ) };
    }

    /// Appends every entry of other (insert semantics, nothing is overwritten).
    /// Extending a container w/ itself duplicates its current content.
    void extend( basic_multi_map const & other )
    {
        auto const & source{ other.store_ };
        auto const   last  { source.slots() }; // self-extension appends past this point
        append_atomically( other.size(), [ & ]
        {
            for ( auto pos{ source.first_live() }; pos < last; pos = source.next_live( pos ) )
            {
                auto const & entry{ source.at( pos ) };
                store_.append( entry.first, entry.second );
            }
        } );
    }

    /// Appends the given pair-like entries in order. A range of this
    /// container's own entries is copied as it was before the call.
    template <std::input_iterator InputIt, std::sentinel_for<InputIt> Sentinel>
    void extend( InputIt first, Sentinel const last )
    {
        constexpr bool own_iterator{ std::same_as<InputIt, const_iterator> };

        size_type expected{ 0 };
        size_type bound   { npos };
        if constexpr ( own_iterator )
        {
            if ( first.store_ == &store_ )
                bound = store_.slots();
            // the reservation also keeps own source entries from being reallocated
            if constexpr ( std::same_as<Sentinel, const_iterator> )
                expected = static_cast<size_type>( std::distance( first, last ) );
        }
        else if constexpr ( std::sized_sentinel_for<Sentinel, InputIt> )
            expected = static_cast<size_type>( last - first );

        append_atomically( expected, [ & ]
        {
            for ( ; first != last; ++first )
            {
                if constexpr ( own_iterator )
                {
                    // entries appended by this call are never revisited
                    if ( first.slot_ >= bound )
                        break;
                }
                auto && [ key, value ]{ *first };
                store_.append( std::forward<decltype( key )>( key ), std::forward<decltype( value )>( value ) );
            }
        } );
    }

    void extend( std::initializer_list<value_type> const il ) { extend( il.begin(), il.end() ); }

    void clear() noexcept
    {
        store_.clear();
        index_.clear();
    }

    void swap( basic_multi_map & other ) noexcept( std::is_nothrow_swappable_v<Folding> )
    {
        using std::swap;
        swap( folder_base::policy(), other.folder_base::policy() );
        store_.swap( other.store_ );
        index_.swap( other.index_ );
    }

    friend void swap( basic_multi_map & left, basic_multi_map & right ) noexcept( noexcept( left.swap( right ) ) ) { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------

    /// Multiset equality: the same (key, value) entries, w/ keys compared
    /// under the folding policy, regardless of order.
    friend bool operator==( basic_multi_map const & left, basic_multi_map const & right )
        requires std::equality_comparable<mapped_type>
    {
        if ( ( left.size() != right.size() ) || ( left.distinct_keys() != right.distinct_keys() ) )
            return false;
        auto const left_value { [ &left  ]( size_type const pos ) noexcept -> mapped_type const & { return left .store_.at( pos ).second; } };
        auto const right_value{ [ &right ]( size_type const pos ) noexcept -> mapped_type const & { return right.store_.at( pos ).second; } };
        for ( auto const & [ folded, positions ] : left.index_ )
        {
            auto const other{ right.index_.positions_for( folded ) };
            if ( other.size() != positions.size() )
                return false;
            // values of a key compared as multisets, each side projected through its own store
            if ( !std::ranges::is_permutation( positions, other, std::equal_to<>{}, left_value, right_value ) )
                return false;
        }
        return true;
    }

private:
    [[ nodiscard ]] std::span<size_type const> positions_of( key_const_arg const key ) const
    {
        decltype( auto ) lookup_key{ unwrap( key ) };
        return index_.positions_for( this->fold( lookup_key ) );
    }

    // The folded form of a key that is about to be stored. Identity policies
    // fold the stored key itself (after the append) so nothing is needed
    // upfront.
    [[ nodiscard ]] auto fold_for_record( key_type const & key ) const
    {
        if constexpr ( folds_in_place )
            return nullptr;
        else
            return folded_key_type{ this->fold( key ) };
    }

    // The entry store is appended to by `append` (a callable that may throw
    // midway) after which the new entries get indexed. Any failure rolls both
    // back to the initial state.
    template <typename Append>
    void append_atomically( size_type const expected, Append && append )
    {
        auto const mark{ store_.slots() };
        try {
            store_.reserve_additional( expected );
            std::forward<Append>( append )();
        } catch ( ... ) {
            store_.truncate( mark );
            throw;
        }

        if constexpr ( folds_in_place )
        {
            auto pos{ mark };
            try {
                for ( ; pos != store_.slots(); ++pos )
                    index_.record( this->fold( store_.at( pos ).first ), pos );
            } catch ( ... ) {
                while ( pos-- != mark )
                    index_.unrecord( this->fold( store_.at( pos ).first ), pos );
                store_.truncate( mark );
                throw;
            }
        }
        else
        {
            std::vector<folded_key_type> folded;
            try {
                folded.reserve( store_.slots() - mark );
                for ( auto pos{ mark }; pos != store_.slots(); ++pos )
                    folded.push_back( this->fold( store_.at( pos ).first ) );
            } catch ( ... ) {
                store_.truncate( mark );
                throw;
            }

            size_type recorded{ 0 };
            try {
                for ( ; recorded != folded.size(); ++recorded )
                    index_.record( folded[ recorded ], mark + recorded );
            } catch ( ... ) {
                while ( recorded-- != 0 )
                    index_.unrecord( folded[ recorded ], mark + recorded );
                store_.truncate( mark );
                throw;
            }
        }
    }

    // Finishes a (prepared) compaction and renumbers the index. Returns
    // whether compaction took place.
    bool compact( std::vector<size_type> & remap ) noexcept
    {
        if ( !store_.compact( remap ) )
            return false;
        index_.renumber( remap );
        return true;
    }

    // Compacts (if prepared) and translates a pre-compaction position.
    [[ nodiscard ]] size_type relocated( size_type const pos, std::vector<size_type> & remap ) noexcept
    {
        if ( !compact( remap ) || ( pos == npos ) )
            return pos;
        return remap[ pos ];
    }

private:
    store_type store_;
    index_type index_;
}; // class basic_multi_map


//==============================================================================
// Non-member functions
//==============================================================================

/// Sequence equality: the same entries in the same order, keys compared under
/// the folding policy.
template <typename Key, typename T, typename Folding>
[[ nodiscard ]] bool ordered_equal( basic_multi_map<Key, T, Folding> const & left, basic_multi_map<Key, T, Folding> const & right )
    requires std::equality_comparable<T>
{
    if ( left.size() != right.size() )
        return false;
    return std::ranges::equal
    (
        left, right,
        [ &left ]( auto const & l, auto const & r ) { return ( l.second == r.second ) && left.key_eq( l.first, r.first ); }
    );
}

namespace detail
{
    template <typename E>
    void write_element( std::ostream & os, E const & element )
    {
        if constexpr ( string_viewable<E> )
            os << std::quoted( std::basic_string_view<typename E::value_type, typename E::traits_type>{ element } );
        else
            os << element;
    }
} // namespace detail

/// Renders the entries in order as < "key":"value", "key":"value" > (<> when
/// empty). String-like keys and values are quoted.
template <typename Key, typename T, typename Folding>
std::ostream & operator<<( std::ostream & os, basic_multi_map<Key, T, Folding> const & map )
{
    os << '<';
    bool first{ true };
    for ( auto const & [ key, value ] : map )
    {
        os << ( first ? " " : ", " );
        detail::write_element( os, key );
        os << ':';
        detail::write_element( os, value );
        first = false;
    }
    return os << ( first ? ">" : " >" );
}


//==============================================================================
// Aliases
//==============================================================================

template <typename Key, typename T>
using multi_map = basic_multi_map<Key, T, exact_fold>;

/// ASCII case insensitive string keyed variant: lookups ignore case, stored
/// keys keep their original spelling.
template <typename T>
using ci_multi_map = basic_multi_map<std::string, T, ascii_case_fold>;

using header_map = ci_multi_map<std::string>;
using query_map  = multi_map<std::string, std::string>;

//------------------------------------------------------------------------------
} // namespace multidict
//------------------------------------------------------------------------------
