////////////////////////////////////////////////////////////////////////////////
/// psi::oset ordered_slice — read-only positional view over a contiguous
/// [first, last) run of an insertion-ordered container.
///
/// The slice borrows its base (like std::span): any mutation of the base
/// invalidates it. Element order is the base's order.
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
#include <boost/stl_interfaces/view_interface.hpp>

#include <algorithm>
#include <optional>
//------------------------------------------------------------------------------
namespace psi::oset
{
//------------------------------------------------------------------------------

template <typename Set>
class ordered_slice
    : public boost::stl_interfaces::view_interface<ordered_slice<Set>>
{
public:
    using set_type        = Set;
    using key_type        = typename Set::key_type;
    using value_type      = typename Set::value_type;
    using size_type       = typename Set::size_type;
    using difference_type = typename Set::difference_type;
    using const_reference = typename Set::const_reference;
    using reference       = const_reference;
    using iterator        = typename Set::const_iterator;
    using const_iterator  = iterator;

    ordered_slice( Set const & base, size_type const first, size_type const last ) noexcept
        : p_base_{ &base }, first_{ first }, last_{ last }
    {
        BOOST_ASSERT_MSG( first <= last && last <= base.size(), "Malformed slice bounds" );
    }

    ordered_slice( ordered_slice const & ) noexcept = default;
    ordered_slice & operator=( ordered_slice const & ) noexcept = default;

    [[nodiscard]] iterator begin() const noexcept { return p_base_->make_iter( first_ ); }
    [[nodiscard]] iterator end  () const noexcept { return p_base_->make_iter( last_  ); }

    // Bounds within the base container.
    [[nodiscard]] size_type start_index() const noexcept { return first_; }
    [[nodiscard]] size_type end_index  () const noexcept { return last_;  }

    [[nodiscard]] Set const & base() const noexcept { return *p_base_; }

    template <LookupType<Set::transparent_lookup, key_type> K = key_type>
    [[nodiscard]] std::optional<size_type> index_of( K const & key ) const {
        auto const pos{ p_base_->index_of( key ) };
        if ( pos && *pos >= first_ && *pos < last_ )
            return *pos - first_;
        return std::nullopt;
    }

    template <LookupType<Set::transparent_lookup, key_type> K = key_type>
    [[nodiscard]] bool contains( K const & key ) const { return index_of( key ).has_value(); }

    // Materialize into an independent container (same hash/equality policies).
    [[nodiscard]] Set to_set() const {
        return Set( begin(), end(), p_base_->hash_function(), p_base_->key_eq() );
    }

    friend bool operator==( ordered_slice const & a, ordered_slice const & b ) {
        return std::equal( a.begin(), a.end(), b.begin(), b.end(), a.base().key_eq() );
    }

private:
    Set const * p_base_;
    size_type   first_;
    size_type   last_;
}; // class ordered_slice

//------------------------------------------------------------------------------
} // namespace psi::oset
//------------------------------------------------------------------------------
