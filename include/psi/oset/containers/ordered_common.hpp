////////////////////////////////////////////////////////////////////////////////
/// Shared foundations for psi::oset insertion-ordered hashed containers.
///
/// Contents:
///   - PSI_OSET_CHECK_INVARIANTS               (debug consistency switch)
///   - detail position/range validation        (verify_position, verify_range)
///   - detail storage abstraction helpers      (storage_erase_at, ...)
///   - ordered_impl<Key, Hash, KeyEqual, KC>   (dual-structure base of ordered_set)
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

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <iterator>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
// Re-verify the sequence/index agreement (O(n)) after every mutating primitive.
#ifndef PSI_OSET_CHECK_INVARIANTS
#   define PSI_OSET_CHECK_INVARIANTS 0
#endif
//------------------------------------------------------------------------------
namespace psi::oset
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg );

    //==============================================================================
    // Position/range validation — positional mutations never clamp.
    //==============================================================================
    template <std::unsigned_integral Size>
    constexpr void verify_position( Size const pos, Size const size ) {
        if ( pos >= size ) [[ unlikely ]]
            throw_out_of_range( "psi::oset: position out of range" );
    }

    template <std::unsigned_integral Size>
    constexpr void verify_insert_position( Size const pos, Size const size ) {
        if ( pos > size ) [[ unlikely ]]
            throw_out_of_range( "psi::oset: insertion position out of range" );
    }

    template <std::unsigned_integral Size>
    constexpr void verify_range( Size const first, Size const last, Size const size ) {
        if ( first > last ) [[ unlikely ]]
            throw_out_of_range( "psi::oset: range lower bound exceeds upper bound" );
        if ( last > size ) [[ unlikely ]]
            throw_out_of_range( "psi::oset: range out of bounds" );
    }

    //==============================================================================
    // Storage abstraction helpers (any random-access sequence container)
    //==============================================================================
    template <typename KC>
    constexpr auto nth_of( KC & c, typename KC::size_type const pos ) noexcept {
        return c.begin() + static_cast<typename KC::difference_type>( pos );
    }

    // storage_erase_at — erase single element at position
    template <typename KC>
    constexpr void storage_erase_at( KC & c, typename KC::size_type const pos ) {
        c.erase( nth_of( c, pos ) );
    }

    // storage_erase_range — erase [first, last) positions
    template <typename KC>
    constexpr void storage_erase_range( KC & c, typename KC::size_type const first, typename KC::size_type const last ) {
        c.erase( nth_of( c, first ), nth_of( c, last ) );
    }

    // storage_move_insert — move a staging buffer into c at pos
    template <typename KC, typename Buffer>
    constexpr void storage_move_insert( KC & c, typename KC::size_type const pos, Buffer & staged ) {
        c.insert( nth_of( c, pos ), std::make_move_iterator( staged.begin() ), std::make_move_iterator( staged.end() ) );
    }


    //==============================================================================
    // ordered_impl — owns the (sequence, membership index) pair
    //
    // The sequence (KeyContainer) is authoritative for order and position, the
    // index (std::unordered_set) for membership. The protected primitives below
    // are the only code that mutates either structure: every public operation
    // of ordered_set is expressed through them.
    //==============================================================================
    template <typename Key, typename Hash, typename KeyEqual, typename KeyContainer>
    class ordered_impl
    {
        static_assert( std::is_same_v<Key, typename KeyContainer::value_type>, "KeyContainer::value_type must be Key" );
        static_assert( std::is_base_of_v<std::random_access_iterator_tag, typename std::iterator_traits<typename KeyContainer::const_iterator>::iterator_category>, "KeyContainer must be a random access sequence" );
        static_assert( std::copy_constructible<Key>, "Key is stored in both the sequence and the index" );

    public:
        using key_type           = Key;
        using value_type         = Key;
        using hasher             = Hash;
        using key_equal          = KeyEqual;
        using key_container_type = KeyContainer;
        using index_type         = std::unordered_set<Key, Hash, KeyEqual>;
        using size_type          = typename KeyContainer::size_type;
        using difference_type    = typename KeyContainer::difference_type;
        using reference          = Key const &;
        using const_reference    = Key const &;

        static constexpr bool transparent_lookup{ transparent_hash<Hash, KeyEqual> };

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------
        [[nodiscard]] bool      empty   () const noexcept { return sequence_.empty(); }
        [[nodiscard]] size_type size    () const noexcept { return static_cast<size_type>( sequence_.size() ); }
        [[nodiscard]] size_type max_size() const noexcept { return static_cast<size_type>( std::min<std::size_t>( sequence_.max_size(), index_.max_size() ) ); }

        void reserve( size_type const n ) {
            if constexpr ( requires( KeyContainer & kc ) { kc.reserve( size_type{} ); } )
                sequence_.reserve( n );
            index_.reserve( n );
        }

        //--------------------------------------------------------------------------
        // Observers
        //--------------------------------------------------------------------------
        [[nodiscard]] key_container_type const & keys() const noexcept { return sequence_; }

        [[nodiscard]] hasher    hash_function() const { return index_.hash_function(); }
        [[nodiscard]] key_equal key_eq       () const { return index_.key_eq();        }

        /// Verifies that the sequence holds no duplicates and that the index
        /// holds exactly the sequence's elements. O(n).
        [[nodiscard]] bool check_invariants() const {
            if ( sequence_.size() != index_.size() )
                return false;
            index_type seen( index_.bucket_count(), index_.hash_function(), index_.key_eq() );
            for ( auto const & key : sequence_ ) {
                if ( !seen.insert( key ).second || !index_.contains( key ) )
                    return false;
            }
            return true;
        }

        //--------------------------------------------------------------------------
        // Comparison — order sensitive (sequence based)
        //--------------------------------------------------------------------------
        // Element-wise with the set's own KeyEqual.
        friend bool operator==( ordered_impl const & a, ordered_impl const & b ) {
            return std::equal( a.sequence_.begin(), a.sequence_.end(), b.sequence_.begin(), b.sequence_.end(), a.key_eq() );
        }

        friend auto operator<=>( ordered_impl const & a, ordered_impl const & b )
        requires std::three_way_comparable<Key>
        {
            return std::lexicographical_compare_three_way( a.sequence_.begin(), a.sequence_.end(), b.sequence_.begin(), b.sequence_.end() );
        }

    protected:
        ordered_impl() = default;

        explicit ordered_impl( Hash const & hash, KeyEqual const & equal = KeyEqual{} )
            : index_( 0, hash, equal ) {}

        ordered_impl( ordered_impl const & ) = default;
        ordered_impl( ordered_impl && other ) noexcept( std::is_nothrow_move_constructible_v<KeyContainer> && std::is_nothrow_move_constructible_v<index_type> )
            : sequence_{ std::move( other.sequence_ ) }, index_{ std::move( other.index_ ) }
        {
            other.clear();
        }

        // Copy-and-swap: a throwing element copy leaves *this untouched.
        ordered_impl & operator=( ordered_impl const & other )
        {
            if ( this != &other ) {
                ordered_impl tmp( other );
                swap_impl( tmp );
            }
            return *this;
        }
        ordered_impl & operator=( ordered_impl && other ) noexcept( std::is_nothrow_move_assignable_v<KeyContainer> && std::is_nothrow_move_assignable_v<index_type> )
        {
            if ( this != &other ) {
                sequence_ = std::move( other.sequence_ );
                index_    = std::move( other.index_    );
                other.clear();
            }
            return *this;
        }

        ~ordered_impl() = default;

        //--------------------------------------------------------------------------
        // Lookup helpers
        //--------------------------------------------------------------------------
        template <typename K>
        [[nodiscard]] bool index_contains( K const & key ) const {
            return index_.find( key ) != index_.end();
        }

        // Linear scan: the index knows membership, not position.
        template <typename K>
        [[nodiscard]] size_type position_of( K const & key ) const {
            auto const & eq{ index_.key_eq() };
            auto const   it{ std::find_if( sequence_.begin(), sequence_.end(), [&]( Key const & stored ) { return eq( stored, key ); } ) };
            return static_cast<size_type>( it - sequence_.begin() );
        }

        //--------------------------------------------------------------------------
        // Mutation primitives
        //--------------------------------------------------------------------------

        // Insert-at-end. Strong exception guarantee.
        template <typename V>
        std::pair<const_reference, bool> append_unique( V && value ) {
            auto const [it, inserted]{ index_.insert( std::forward<V>( value ) ) };
            if ( inserted ) {
                try {
                    sequence_.push_back( *it );
                } catch ( ... ) {
                    index_.erase( it );
                    throw;
                }
                verify();
            }
            return { *it, inserted };
        }

        // Insert the non-member elements of [first, last) at pos, in order.
        // Returns the number of elements inserted. Clears on failure.
        template <std::input_iterator InputIt, std::sentinel_for<InputIt> Sentinel>
        size_type insert_unique_at( size_type const pos, InputIt first, Sentinel const last ) {
            BOOST_ASSERT( pos <= size() );
            std::vector<Key> staged;
            try {
                for ( ; first != last; ++first ) {
                    auto const [it, inserted]{ index_.insert( *first ) };
                    if ( inserted )
                        staged.push_back( *it );
                }
                storage_move_insert( sequence_, pos, staged );
            } catch ( ... ) {
                clear();
                throw;
            }
            verify();
            return static_cast<size_type>( staged.size() );
        }

        // Remove-at-position, handing the removed element to the caller.
        Key erase_at( size_type const pos ) {
            BOOST_ASSERT( pos < size() );
            auto node{ index_.extract( sequence_[ pos ] ) };
            BOOST_ASSERT_MSG( !node.empty(), "Sequence element missing from the index" );
            storage_erase_at( sequence_, pos );
            verify();
            return std::move( node.value() );
        }

        void erase_range( size_type const first, size_type const last ) {
            BOOST_ASSERT( first <= last && last <= size() );
            for ( auto pos{ first }; pos != last; ++pos )
                BOOST_VERIFY( index_.erase( sequence_[ pos ] ) == 1 );
            storage_erase_range( sequence_, first, last );
            verify();
        }

        // Replace-at-position. The caller guarantees that value is not a member
        // at any other position. Returns the previous value. Clears on failure.
        template <typename V>
        Key replace_at_unchecked( size_type const pos, V && value ) {
            BOOST_ASSERT( pos < size() );
            auto node{ index_.extract( sequence_[ pos ] ) };
            BOOST_ASSERT_MSG( !node.empty(), "Sequence element missing from the index" );
            try {
                node.value() = value;
                BOOST_VERIFY( index_.insert( std::move( node ) ).inserted );
                Key previous{ std::exchange( sequence_[ pos ], std::forward<V>( value ) ) };
                verify();
                return previous;
            } catch ( ... ) {
                clear();
                throw;
            }
        }

        // Stable in-place filter: drops every element satisfying pred from both
        // structures, survivors keep their relative order. Clears on failure.
        template <typename Pred>
        size_type erase_if_impl( Pred & pred ) {
            auto const oldSize{ size() };
            try {
                auto const newEnd
                {
                    std::remove_if( sequence_.begin(), sequence_.end(), [&]( Key const & key ) {
                        if ( !pred( key ) )
                            return false;
                        BOOST_VERIFY( index_.erase( key ) == 1 );
                        return true;
                    } )
                };
                sequence_.erase( newEnd, sequence_.end() );
            } catch ( ... ) {
                clear();
                throw;
            }
            verify();
            return static_cast<size_type>( oldSize - size() );
        }

        void clear() noexcept {
            sequence_.clear();
            index_   .clear();
        }

        void swap_impl( ordered_impl & other ) noexcept {
            using std::swap;
            swap( sequence_, other.sequence_ );
            swap( index_   , other.index_    );
        }

        key_container_type extract_sequence_impl() noexcept( std::is_nothrow_move_constructible_v<KeyContainer> ) {
            KeyContainer result( std::move( sequence_ ) );
            clear();
            return result;
        }

        void verify() const {
            if constexpr ( PSI_OSET_CHECK_INVARIANTS )
                BOOST_ASSERT_MSG( check_invariants(), "ordered_set: sequence and index disagree" );
        }

        KeyContainer sequence_;
        index_type   index_;
    }; // class ordered_impl

} // namespace detail

using detail::ordered_impl;

//------------------------------------------------------------------------------
} // namespace psi::oset
//------------------------------------------------------------------------------
