////////////////////////////////////////////////////////////////////////////////
/// Rendering of psi::oset ordered containers as bracketed, comma separated
/// lists in sequence order: "[1, 2, 3]" ("[]" when empty). Strings and
/// characters are quoted and escaped: ["b", "a"], ['x'].
///
/// Both ordered_set and ordered_slice are formatted as {fmt} sequence ranges
/// (fmt would otherwise pick its "{...}" set style because of key_type), so
/// the range format specs apply: "{:n}" drops the brackets and "{::spec}"
/// formats every element with spec. to_string() and std::ostream insertion
/// are built on top.
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

#include "ordered_set.hpp"
#include "ordered_slice.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ostream>
#include <string>
#include <type_traits>
//------------------------------------------------------------------------------

template <typename Key, typename Hash, typename KeyEqual, typename KC, typename Char>
struct fmt::range_format_kind<psi::oset::ordered_set<Key, Hash, KeyEqual, KC>, Char>
    : std::integral_constant<fmt::range_format, fmt::range_format::sequence> {};

template <typename Set, typename Char>
struct fmt::range_format_kind<psi::oset::ordered_slice<Set>, Char>
    : std::integral_constant<fmt::range_format, fmt::range_format::sequence> {};

//------------------------------------------------------------------------------
namespace psi::oset
{
//------------------------------------------------------------------------------

template <typename Key, typename Hash, typename KeyEqual, typename KC>
[[nodiscard]] std::string to_string( ordered_set<Key, Hash, KeyEqual, KC> const & s ) {
    return fmt::format( "{}", s );
}

template <typename Set>
[[nodiscard]] std::string to_string( ordered_slice<Set> const & s ) {
    return fmt::format( "{}", s );
}

template <typename Key, typename Hash, typename KeyEqual, typename KC>
std::ostream & operator<<( std::ostream & os, ordered_set<Key, Hash, KeyEqual, KC> const & s ) {
    return os << to_string( s );
}

template <typename Set>
std::ostream & operator<<( std::ostream & os, ordered_slice<Set> const & s ) {
    return os << to_string( s );
}

//------------------------------------------------------------------------------
} // namespace psi::oset
//------------------------------------------------------------------------------
