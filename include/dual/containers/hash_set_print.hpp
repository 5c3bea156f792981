#pragma once

#include "hash_set.hpp"

#include <ostream>
//------------------------------------------------------------------------------
namespace dual
{
//------------------------------------------------------------------------------

// One line per slot: '<slot> -> <element key>', stale entries (element key no
// longer matching the slot, only possible after a mismatching
// get_or_insert_with factory) are marked.
template <keyed T, typename Hash, typename KeyEqual, typename Allocator>
void hash_set<T, Hash, KeyEqual, Allocator>::print( std::ostream & os ) const
{
    if ( empty() )
    {
        os << "The set is empty.\n";
        return;
    }

    size_type stale_count{ 0 };
    for ( auto const & [ slot, value ] : storage_ )
    {
        os << slot << " -> " << key_of( value );
        if ( !storage_.key_eq()( slot, key_of( value ) ) )
        {
            os << " [stale]";
            ++stale_count;
        }
        os << '\n';
    }
    os << '[' << size() << " elements, " << stale_count << " stale, " << storage_.bucket_count() << " buckets]\n";
}

//------------------------------------------------------------------------------
} // namespace dual
//------------------------------------------------------------------------------
