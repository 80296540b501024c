////////////////////////////////////////////////////////////////////////////////
/// psi::oset insertion-ordered hashed set
///
/// ordered_set keeps its elements unique (like std::unordered_set) while
/// preserving insertion order and O(1) positional access (like std::vector).
///
/// Architecture:
///   ordered_impl<Key, Hash, KeyEqual, KC> — owns the sequence (KC, source of
///     truth for order/position) and the membership index (unordered_set,
///     source of truth for existence). Provides the mutation primitives
///     (append, insert-at, erase-at, erase-range, replace-at, filter) which
///     are the only code touching both structures.
///   ordered_set<Key, Hash, KeyEqual, KC> — the public container (inherits
///     ordered_impl). Sequence access, lookup, range replacement and set
///     algebra, all expressed through the ordered_impl primitives.
///   ordered_slice<Set> — positional view (see ordered_slice.hpp).
///
/// Complexity:
///   contains, count, insert, append       O(1) amortized
///   find, index_of, remove, update        O(n) (position scan)
///   replace_subrange & derived forms      O(n + m)
///   set algebra                           O(n + m)
///
/// Equality is order sensitive: { 1, 2 } != { 2, 1 } (use set_equals() for
/// plain set comparison).
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

#include "lookup.hpp"
#include "ordered_common.hpp"
#include "ordered_slice.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <concepts>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::oset
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename Hash         = std::hash<Key>,
    typename KeyEqual     = std::equal_to<Key>,
    typename KeyContainer = std::vector<Key>
>
class ordered_set
    : public ordered_impl<Key, Hash, KeyEqual, KeyContainer>
{
    using base = ordered_impl<Key, Hash, KeyEqual, KeyContainer>;

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using typename base::key_type;
    using typename base::value_type;
    using typename base::hasher;
    using typename base::key_equal;
    using typename base::key_container_type;
    using typename base::size_type;
    using typename base::difference_type;
    using typename base::reference;
    using typename base::const_reference;
    using base::transparent_lookup;

    // Element access is read-only: writing through an iterator could break
    // uniqueness behind the index's back (use replace_at()/update()).
    using iterator               = typename KeyContainer::const_iterator;
    using const_iterator         = iterator;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = reverse_iterator;
    using slice_type             = ordered_slice<ordered_set>;

    //--------------------------------------------------------------------------
    // Constructors — all deduplicate keeping the first occurrence
    //--------------------------------------------------------------------------
    ordered_set() = default;

    explicit ordered_set( Hash const & hash, KeyEqual const & equal = KeyEqual{} )
        : base{ hash, equal } {}

    template <std::input_iterator InputIt, std::sentinel_for<InputIt> Sentinel>
    ordered_set( InputIt first, Sentinel const last, Hash const & hash = Hash{}, KeyEqual const & equal = KeyEqual{} )
        : base{ hash, equal }
    {
        for ( ; first != last; ++first )
            this->append_unique( value_type( *first ) );
    }

    explicit ordered_set( KeyContainer keys, Hash const & hash = Hash{}, KeyEqual const & equal = KeyEqual{} )
        : base{ hash, equal }
    {
        this->reserve( static_cast<size_type>( keys.size() ) );
        for ( auto & key : keys )
            this->append_unique( std::move( key ) );
    }

    ordered_set( std::initializer_list<value_type> const il, Hash const & hash = Hash{}, KeyEqual const & equal = KeyEqual{} )
        : ordered_set( il.begin(), il.end(), hash, equal ) {}

    ordered_set( ordered_set const & ) = default;
    ordered_set( ordered_set && )      = default;

    ordered_set & operator=( ordered_set const & ) = default;
    ordered_set & operator=( ordered_set && )      = default;

    ordered_set & operator=( std::initializer_list<value_type> const il ) {
        clear();
        append_range( il );
        return *this;
    }

    // Additive identity
    [[nodiscard]] static ordered_set zero() { return ordered_set{}; }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator begin() const noexcept { return this->sequence_.cbegin(); }
    iterator end  () const noexcept { return this->sequence_.cend();   }

    iterator cbegin() const noexcept { return begin(); }
    iterator cend  () const noexcept { return end();   }

    reverse_iterator rbegin() const noexcept { return reverse_iterator{ end()   }; }
    reverse_iterator rend  () const noexcept { return reverse_iterator{ begin() }; }

    reverse_iterator crbegin() const noexcept { return rbegin(); }
    reverse_iterator crend  () const noexcept { return rend();   }

    // Iterator factory from index position
    iterator make_iter( size_type const pos ) const noexcept {
        BOOST_ASSERT( pos <= this->size() );
        return begin() + static_cast<difference_type>( pos );
    }

    // Iterator → index conversion
    size_type iter_index( const_iterator const it ) const noexcept {
        return static_cast<size_type>( it - begin() );
    }

    //--------------------------------------------------------------------------
    // Capacity (empty, size, max_size, reserve — inherited from ordered_impl)
    //--------------------------------------------------------------------------

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    [[nodiscard]] const_reference operator[]( size_type const pos ) const noexcept {
        BOOST_ASSERT_MSG( pos < this->size(), "ordered_set index out of bounds" );
        return this->sequence_[ pos ];
    }

    [[nodiscard]] const_reference at( size_type const pos ) const {
        detail::verify_position( pos, this->size() );
        return this->sequence_[ pos ];
    }

    [[nodiscard]] const_reference front() const noexcept { BOOST_ASSERT( !this->empty() ); return this->sequence_.front(); }
    [[nodiscard]] const_reference back () const noexcept { BOOST_ASSERT( !this->empty() ); return this->sequence_.back (); }

    // Boost compat alias (keys() inherited from ordered_impl)
    [[nodiscard]] key_container_type const & sequence() const noexcept { return this->sequence_; }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[nodiscard]] bool contains( K const & key ) const { return this->index_contains( key ); }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[nodiscard]] size_type count( K const & key ) const { return contains( key ) ? 1 : 0; }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[nodiscard]] std::optional<size_type> index_of( K const & key ) const {
        if ( !contains( key ) )
            return std::nullopt;
        return this->position_of( key );
    }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[nodiscard]] iterator find( K const & key ) const {
        if ( !contains( key ) )
            return end();
        return make_iter( this->position_of( key ) );
    }

    //--------------------------------------------------------------------------
    // Slicing — views share the base's order (and are invalidated by its
    // mutation)
    //--------------------------------------------------------------------------
    [[nodiscard]] slice_type slice( size_type const first, size_type const last ) const {
        detail::verify_range( first, last, this->size() );
        return slice_type{ *this, first, last };
    }

    [[nodiscard]] slice_type slice( const_iterator const first, const_iterator const last ) const {
        return slice( iter_index( first ), iter_index( last ) );
    }

    // Up to max_length leading/trailing elements.
    [[nodiscard]] slice_type prefix( size_type const max_length ) const {
        return slice_type{ *this, 0, std::min( max_length, this->size() ) };
    }
    [[nodiscard]] slice_type suffix( size_type const max_length ) const {
        return slice_type{ *this, this->size() - std::min( max_length, this->size() ), this->size() };
    }

    //--------------------------------------------------------------------------
    // Modifiers — membership
    //--------------------------------------------------------------------------

    // Returns the member after the call (the pre-existing one if v was
    // already present) and whether v was appended. The reference stays valid
    // until that element is removed.
    std::pair<const_reference, bool> insert( value_type const & v ) { return this->append_unique( v ); }
    std::pair<const_reference, bool> insert( value_type &&      v ) { return this->append_unique( std::move( v ) ); }

    template <typename... Args>
    std::pair<const_reference, bool> emplace( Args &&... args ) {
        return this->append_unique( value_type( std::forward<Args>( args )... ) );
    }

    bool append( value_type const & v ) { return insert( v ).second; }
    bool append( value_type &&      v ) { return insert( std::move( v ) ).second; }

    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    void append_range( R && rg ) {
        for ( auto && v : rg )
            this->append_unique( value_type( std::forward<decltype( v )>( v ) ) );
    }

    // Removes key keeping the relative order of the remaining elements.
    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[nodiscard]] std::optional<value_type> remove( K const & key ) {
        if ( !contains( key ) )
            return std::nullopt;
        return this->erase_at( this->position_of( key ) );
    }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    size_type erase( K const & key ) {
        return remove( key ).has_value() ? 1 : 0;
    }

    iterator erase( const_iterator const pos ) {
        auto const idx{ iter_index( pos ) };
        std::ignore = remove_at( idx );
        return make_iter( idx );
    }

    iterator erase( const_iterator const first, const_iterator const last ) {
        auto const idx{ iter_index( first ) };
        remove_subrange( idx, iter_index( last ) );
        return make_iter( idx );
    }

    // Upsert: overwrites an equal member in its current slot (returning the
    // previous value) or appends v.
    std::optional<value_type> update( value_type v ) {
        if ( !contains( v ) ) {
            this->append_unique( std::move( v ) );
            return std::nullopt;
        }
        auto const pos{ this->position_of( v ) };
        return this->replace_at_unchecked( pos, std::move( v ) );
    }

    // Indexed write. Overwrites the element at pos unless v equals a member
    // stored at a different position: that is a conflict, reported as
    // { iterator to the conflicting member, false } with the set unchanged.
    std::pair<iterator, bool> replace_at( size_type const pos, value_type v ) {
        detail::verify_position( pos, this->size() );
        if ( !this->key_eq()( this->sequence_[ pos ], v ) && contains( v ) )
            return { make_iter( this->position_of( v ) ), false };
        std::ignore = this->replace_at_unchecked( pos, std::move( v ) );
        return { make_iter( pos ), true };
    }

    //--------------------------------------------------------------------------
    // Modifiers — range replacement
    //
    // replace_subrange() is the backbone of every positional insertion and
    // removal: the elements in [first, last) are dropped from both structures,
    // then the candidates are inserted at first, in order, skipping any that
    // is already a member (of the remainder or of earlier candidates).
    // Malformed ranges throw std::out_of_range. The source range must not
    // alias *this.
    //--------------------------------------------------------------------------
    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    size_type replace_subrange( size_type const first, size_type const last, R && rg ) {
        detail::verify_range( first, last, this->size() );
        this->erase_range( first, last );
        return this->insert_unique_at( first, std::ranges::begin( rg ), std::ranges::end( rg ) );
    }

    size_type replace_subrange( size_type const first, size_type const last, std::initializer_list<value_type> const il ) {
        return replace_subrange<std::initializer_list<value_type> const &>( first, last, il );
    }

    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    size_type replace_subrange( const_iterator const first, const_iterator const last, R && rg ) {
        return replace_subrange( iter_index( first ), iter_index( last ), std::forward<R>( rg ) );
    }

    bool insert_at( size_type const pos, value_type const & v ) {
        detail::verify_insert_position( pos, this->size() );
        return this->insert_unique_at( pos, std::addressof( v ), std::addressof( v ) + 1 ) == 1;
    }

    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, value_type>
    size_type insert_range_at( size_type const pos, R && rg ) {
        return replace_subrange( pos, pos, std::forward<R>( rg ) );
    }

    size_type insert_range_at( size_type const pos, std::initializer_list<value_type> const il ) {
        return replace_subrange( pos, pos, il );
    }

    value_type remove_at( size_type const pos ) {
        detail::verify_position( pos, this->size() );
        return this->erase_at( pos );
    }

    void remove_subrange( size_type const first, size_type const last ) {
        detail::verify_range( first, last, this->size() );
        this->erase_range( first, last );
    }

    void remove_first( size_type const n = 1 ) { remove_subrange( 0, n ); }
    void remove_last ( size_type const n = 1 ) {
        detail::verify_range( size_type{ 0 }, n, this->size() );
        this->erase_range( this->size() - n, this->size() );
    }

    [[nodiscard]] std::optional<value_type> pop_front() {
        if ( this->empty() )
            return std::nullopt;
        return this->erase_at( 0 );
    }

    [[nodiscard]] std::optional<value_type> pop_back() {
        if ( this->empty() )
            return std::nullopt;
        return this->erase_at( this->size() - 1 );
    }

    using base::clear;

    template <typename Pred>
    friend size_type erase_if( ordered_set & c, Pred pred ) {
        return c.erase_if_impl( pred );
    }

    //--------------------------------------------------------------------------
    // Set algebra
    //
    // Result order: union — receiver order then other's new elements in
    // other's order; intersection/subtraction — receiver order;
    // symmetric difference — receiver-only elements then other-only elements.
    //--------------------------------------------------------------------------
    [[nodiscard]] ordered_set union_with( ordered_set const & other ) const {
        ordered_set result( *this );
        result.form_union( other );
        return result;
    }

    [[nodiscard]] ordered_set intersection( ordered_set const & other ) const {
        ordered_set result( *this );
        result.form_intersection( other );
        return result;
    }

    [[nodiscard]] ordered_set symmetric_difference( ordered_set const & other ) const {
        ordered_set result( this->hash_function(), this->key_eq() );
        for ( auto const & key : *this ) {
            if ( !other.contains( key ) )
                result.append_unique( key );
        }
        for ( auto const & key : other ) {
            if ( !contains( key ) )
                result.append_unique( key );
        }
        return result;
    }

    [[nodiscard]] ordered_set subtracting( ordered_set const & other ) const {
        ordered_set result( *this );
        result.subtract( other );
        return result;
    }

    void form_union( ordered_set const & other ) {
        if ( &other == this )
            return;
        for ( auto const & key : other )
            this->append_unique( key );
    }

    void form_intersection( ordered_set const & other ) {
        if ( &other == this )
            return;
        auto pred{ [&other]( key_type const & key ) { return !other.contains( key ); } };
        this->erase_if_impl( pred );
    }

    void form_symmetric_difference( ordered_set const & other ) {
        *this = symmetric_difference( other );
    }

    void subtract( ordered_set const & other ) {
        if ( &other == this ) {
            clear();
            return;
        }
        auto pred{ [&other]( key_type const & key ) { return other.contains( key ); } };
        this->erase_if_impl( pred );
    }

    friend ordered_set operator+( ordered_set lhs, ordered_set const & rhs ) { lhs.form_union( rhs ); return lhs; }
    friend ordered_set operator-( ordered_set lhs, ordered_set const & rhs ) { lhs.subtract  ( rhs ); return lhs; }

    friend ordered_set & operator+=( ordered_set & lhs, ordered_set const & rhs ) { lhs.form_union( rhs ); return lhs; }
    friend ordered_set & operator-=( ordered_set & lhs, ordered_set const & rhs ) { lhs.subtract  ( rhs ); return lhs; }

    //--------------------------------------------------------------------------
    // Set relations (order insensitive)
    //
    // Strictness is decided by size (a proper subset has fewer elements),
    // not by operator!=: equality is order sensitive, so { 1, 2, 3 } is not a
    // strict subset of { 3, 2, 1 }.
    //--------------------------------------------------------------------------
    [[nodiscard]] bool is_subset_of( ordered_set const & other ) const {
        return this->size() <= other.size() &&
               std::all_of( begin(), end(), [&other]( key_type const & key ) { return other.contains( key ); } );
    }

    [[nodiscard]] bool is_superset_of( ordered_set const & other ) const { return other.is_subset_of( *this ); }

    [[nodiscard]] bool is_strict_subset_of  ( ordered_set const & other ) const { return this->size() < other.size() && is_subset_of  ( other ); }
    [[nodiscard]] bool is_strict_superset_of( ordered_set const & other ) const { return this->size() > other.size() && is_superset_of( other ); }

    [[nodiscard]] bool is_disjoint_with( ordered_set const & other ) const {
        if ( other.size() < this->size() )
            return other.is_disjoint_with( *this );
        return std::none_of( begin(), end(), [&other]( key_type const & key ) { return other.contains( key ); } );
    }

    // Same members, regardless of order.
    [[nodiscard]] bool set_equals( ordered_set const & other ) const {
        return this->size() == other.size() && is_subset_of( other );
    }

    //--------------------------------------------------------------------------
    // Swap & extraction
    //--------------------------------------------------------------------------
    void swap( ordered_set & other ) noexcept { this->swap_impl( other ); }
    friend void swap( ordered_set & a, ordered_set & b ) noexcept { a.swap( b ); }

    key_container_type extract_sequence() noexcept( std::is_nothrow_move_constructible_v<KeyContainer> ) {
        return this->extract_sequence_impl();
    }
}; // class ordered_set


//------------------------------------------------------------------------------
// Deduction guides
//------------------------------------------------------------------------------

template <std::input_iterator InputIt, typename Hash = std::hash<std::iter_value_t<InputIt>>, typename KeyEqual = std::equal_to<std::iter_value_t<InputIt>>>
ordered_set( InputIt, InputIt, Hash = Hash{}, KeyEqual = KeyEqual{} )
    -> ordered_set<std::iter_value_t<InputIt>, Hash, KeyEqual>;

template <typename Key, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
ordered_set( std::initializer_list<Key>, Hash = Hash{}, KeyEqual = KeyEqual{} )
    -> ordered_set<Key, Hash, KeyEqual>;

//------------------------------------------------------------------------------
} // namespace psi::oset
//------------------------------------------------------------------------------
