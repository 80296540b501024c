////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for psi::oset hashed containers.
///
/// Provides:
///   - transparent_hash concept — detects is_transparent Hash/KeyEqual pairs
///   - LookupType concept       — constrains heterogeneous lookup key types
///
/// Merges the traditional two-overload lookup pattern (non-template +
/// constrained template) into a single constrained template per function.
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
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::oset
{
//------------------------------------------------------------------------------

/// transparent_hash — both the hasher and the equality predicate opt into
/// heterogeneous lookup (the unordered containers' C++20 requirement).
template <typename Hash, typename KeyEqual>
concept transparent_hash =
    requires { typename Hash    ::is_transparent; } &&
    requires { typename KeyEqual::is_transparent; };


/// LookupType — constrains which key types a hashed container's lookup
/// functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) Hash and KeyEqual are both transparent, allowing heterogeneous
///       lookup with any hashable/comparable type, or
///   (b) K is implicitly convertible to key_type (this subsumes the
///       K == key_type case via identity conversion).
///
/// Usable in both explicit and abbreviated form:
///   template <LookupType<transparent, key_type> K = key_type>
///   iterator find( K const & );
template <typename K, bool transparent_lookup, typename StoredKeyType>
concept LookupType =
    transparent_lookup ||
    std::convertible_to<K const &, StoredKeyType const &>;

//------------------------------------------------------------------------------
} // namespace psi::oset
//------------------------------------------------------------------------------
