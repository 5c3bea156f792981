////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for dual hashed containers.
///
/// Provides:
///   - LookupType concept      — constrains heterogeneous lookup key types
///   - string_viewable concept — detects basic_string-like keys
///   - hash<Key>               — default hasher, transparent for string keys
///   - transparent_lookup<H,E> — both hasher and key_equal are transparent
///
/// Unordered containers only perform heterogeneous lookup when *both* the
/// hasher and the equality predicate carry the is_transparent tag. With that
/// in place any type they accept (string_view, char const *...) is hashed and
/// compared directly, otherwise the lookup key is converted to key_type once,
/// at the public API boundary.
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
#include <cstddef>
#include <functional>
#include <string_view>
#include <type_traits>
//------------------------------------------------------------------------------
namespace dual
{
//------------------------------------------------------------------------------

/// LookupType — a type K is a valid lookup key if either
///   (a) the hasher and key_equal are transparent, allowing heterogeneous
///       lookup with any type they accept, or
///   (b) K is implicitly convertible to key_type (this subsumes K == key_type).
/// Usable in explicit and abbreviated form:
///   template <LookupType<transparent, key_type> K = key_type>
///   iterator find( K const & );
template <typename K, bool transparent_hashing, typename StoredKeyType>
concept LookupType =
    transparent_hashing ||
    std::convertible_to<K const &, StoredKeyType const &>;


/// Detects types that behave as strings (basic_string and its derived types).
/// Requires traits_type to distinguish from generic char containers (e.g. vector<char>).
template <typename T>
concept string_viewable = requires {
    typename T::value_type;
    typename T::traits_type;
} && requires( T const & t ) {
    std::basic_string_view<typename T::value_type, typename T::traits_type>{ t };
};


/// Default hasher: std::hash, except for string-like keys which are hashed
/// through their basic_string_view so that views and literals can be looked up
/// without materializing a key (std::hash guarantees equal results for a
/// string and a view of it).
template <typename Key>
struct hash : std::hash<Key> {};

template <string_viewable Key>
struct hash<Key>
{
    using is_transparent = void;
    using view_type      = std::basic_string_view<typename Key::value_type, typename Key::traits_type>;

    [[ gnu::pure ]] std::size_t operator()( view_type const key ) const noexcept { return std::hash<view_type>{}( key ); }
}; // struct hash<string_viewable>


template <typename Hash, typename KeyEqual>
bool constexpr transparent_lookup
{
    requires{ typename Hash    ::is_transparent; } &&
    requires{ typename KeyEqual::is_transparent; }
};

//------------------------------------------------------------------------------
} // namespace dual
//------------------------------------------------------------------------------
