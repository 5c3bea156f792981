////////////////////////////////////////////////////////////////////////////////
/// The keyed element contract for dual containers.
///
/// A keyed type carries its own index key: the container never stores an
/// externally supplied key, it asks the element. The answer may change after
/// the element is mutated, which is what hash_set's mutation protocols exist
/// to handle.
///
/// Provides:
///   - key_traits<T> — customization point (nested key_type + key() member by
///                     default, specialize for types that cannot be changed)
///   - keyed<T>      — concept checked by the containers
///   - key_of(v)     — the single accessor the containers call
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
namespace dual
{
//------------------------------------------------------------------------------

template <typename T>
struct key_traits {}; // T is not keyed

template <typename T>
requires requires( T const & value ) { typename T::key_type; value.key(); }
struct key_traits<T>
{
    using key_type = typename T::key_type;

    [[ gnu::pure ]] static constexpr decltype( auto ) key( T const & value ) noexcept( noexcept( value.key() ) ) { return value.key(); }
}; // struct key_traits


/// keyed — T reports a copyable, equality comparable key through key_traits.
/// The accessor must be free of side effects (it is called on every
/// relocation check).
template <typename T>
concept keyed =
    std::is_object_v<T> &&
    requires( T const & value )
    {
        typename key_traits<T>::key_type;
        { key_traits<T>::key( value ) } -> std::convertible_to<typename key_traits<T>::key_type const &>;
    } &&
    std::copyable            <typename key_traits<T>::key_type> &&
    std::equality_comparable <typename key_traits<T>::key_type>;

template <keyed T>
using key_type_t = typename key_traits<T>::key_type;

template <keyed T>
[[ gnu::pure ]] constexpr decltype( auto ) key_of( T const & value ) noexcept( noexcept( key_traits<T>::key( value ) ) )
{
    return key_traits<T>::key( value );
}

//------------------------------------------------------------------------------
} // namespace dual
//------------------------------------------------------------------------------
