////////////////////////////////////////////////////////////////////////////////
/// relocating_ref — scoped mutable access to one element of a dual container.
///
/// A plain T & gives the container no chance to notice that the element's key
/// changed, so mutable access is handed out through this guard instead. It
/// remembers the slot (the key the element was filed under when the guard was
/// created) and, when it goes out of scope on any path (end of scope, early
/// return, exception unwind), re-reads the element's key and asks the
/// container to move the element if it no longer matches.
///
/// The owning container is marked as borrowed for the guard's entire lifetime
/// so at most one guard per container can exist at a time.
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

#include <memory>
#include <utility>
//------------------------------------------------------------------------------
namespace dual
{
//------------------------------------------------------------------------------

template <typename Set>
class [[ nodiscard ]] relocating_ref
{
public:
    using value_type = typename Set::value_type;
    using key_type   = typename Set::key_type;

    relocating_ref( relocating_ref && other ) noexcept
        : p_set_{ std::exchange( other.p_set_, nullptr ) }, pos_{ other.pos_ } {}

    relocating_ref( relocating_ref const &  ) = delete;
    relocating_ref & operator=( relocating_ref const &  ) = delete;
    relocating_ref & operator=( relocating_ref       && ) = delete;

    ~relocating_ref() noexcept
    {
        if ( p_set_ )
            p_set_->release( pos_ );
    }

    [[ nodiscard ]] value_type & get       () const noexcept { BOOST_ASSERT( p_set_ ); return pos_->second; }
    [[ nodiscard ]] value_type & operator* () const noexcept { return get(); }
    [[ nodiscard ]] value_type * operator->() const noexcept { return std::addressof( get() ); }

    /// The slot the element is filed under until this guard is released (the
    /// element's own key may already differ).
    [[ nodiscard ]] key_type const & key() const noexcept { BOOST_ASSERT( p_set_ ); return pos_->first; }

private: friend Set;
    using storage_iterator = typename Set::storage_iterator;

    relocating_ref( Set & set, storage_iterator const pos ) noexcept : p_set_{ &set }, pos_{ pos } {}

private:
    Set *            p_set_;
    storage_iterator pos_;
}; // class relocating_ref

//------------------------------------------------------------------------------
} // namespace dual
//------------------------------------------------------------------------------
