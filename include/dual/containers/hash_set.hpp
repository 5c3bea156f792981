////////////////////////////////////////////////////////////////////////////////
/// dual::hash_set — hashed set of self-keyed values
///
/// Elements carry their own key (see keyed.hpp). Unlike std::unordered_set (or
/// an unordered_map with a duplicated key), modifying an element in a way that
/// changes its key is *not* a logic error: every path that hands out mutable
/// access re-reads the key afterwards and moves the element to its new slot.
///
/// Architecture:
///   storage_  — node based std::unordered_map<key_type, T>; the map key is the
///               'slot' the element is filed under. Relocation extracts the
///               node, rewrites its key and reinserts it so the element itself
///               is never moved or copied (and its address stays stable).
///   mutation  — closure form: modify, modify_all, retain, erase_if;
///               guard form:   get_mut, get_or_insert_with (relocating_ref).
///   borrowed_ — set while a guard is alive or a mutation closure runs; every
///               mutating member rejects re-entry with borrow_error.
///
/// Index coherence: outside of a mutation in progress, for every slot k the
/// stored element reports key_of( element ) == k. The one tolerated exception
/// is a get_or_insert_with factory that produces an element with a different
/// key: it is filed under the requested key and moved by the next relocation
/// check (guard release, modify, retain).
///
/// Relocation never grows the index (a node is extracted before it is
/// reinserted, retain reinserts only after erasing/extracting) so it never
/// rehashes, but it copies the element's key into the slot. Deferred
/// relocations run from destructors: a key type whose copy throws terminates
/// the program if that copy fails there.
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

#include "keyed.hpp"
#include "lookup.hpp"
#include "relocating_ref.hpp"

#include <boost/assert.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <algorithm>
#include <concepts>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace dual
{
//------------------------------------------------------------------------------

/// Thrown when a container that is already mutably borrowed (a live
/// relocating_ref or a running mutation closure) is asked for another mutable
/// access.
class borrow_error : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found   ( char const * where );
    [[ noreturn, gnu::cold ]] void throw_already_borrowed( char const * where );
} // namespace detail


template
<
    keyed    T,
    typename Hash      = hash<key_type_t<T>>,
    typename KeyEqual  = std::equal_to<>,
    typename Allocator = std::allocator<std::pair<key_type_t<T> const, T>>
>
class hash_set
{
private:
    using storage_type           = std::unordered_map<key_type_t<T>, T, Hash, KeyEqual, Allocator>;
    using storage_iterator       = typename storage_type::iterator;
    using storage_const_iterator = typename storage_type::const_iterator;
    using node_type              = typename storage_type::node_type;

    friend class relocating_ref<hash_set>;

public:
    using key_type        = key_type_t<T>;
    using value_type      = T;
    using size_type       = typename storage_type::size_type;
    using difference_type = std::ptrdiff_t;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using allocator_type  = Allocator;
    using reference       = value_type const &; // mutable access only through the mutation protocols
    using const_reference = value_type const &;

    /// True if lookups accept any type the hasher and key_equal accept
    /// (otherwise the lookup key is converted to key_type once).
    static bool constexpr transparent_hashing{ transparent_lookup<Hash, KeyEqual> };

    using mut_ref = relocating_ref<hash_set>;

    class const_iterator;
    using iterator = const_iterator; // elements are never exposed through a mutable iterator

    class drain;

private:
    using const_iterator_base = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        const_iterator,
#   endif
        std::forward_iterator_tag,
        value_type const
    >;

public:
    class const_iterator : public const_iterator_base
    {
    public:
        constexpr const_iterator() noexcept = default;

        value_type const & operator*() const noexcept { return pos_->second; }

        const_iterator & operator++() noexcept { ++pos_; return *this; }
        using const_iterator_base::operator++;

        friend bool operator==( const_iterator const & left, const_iterator const & right ) noexcept { return left.pos_ == right.pos_; }

    private: friend class hash_set;
        explicit const_iterator( storage_const_iterator const pos ) noexcept : pos_{ pos } {}

        storage_const_iterator pos_{};
    }; // class const_iterator

public:
    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------
    hash_set() = default;

    explicit hash_set( size_type const bucket_count, Hash const & hash_fn = Hash{}, KeyEqual const & equal = KeyEqual{}, Allocator const & alloc = Allocator{} )
        : storage_( bucket_count, hash_fn, equal, alloc ) {}

    template <std::input_iterator InputIt>
    hash_set( InputIt first, InputIt const last ) { insert( first, last ); }

    hash_set( std::initializer_list<value_type> const il ) : hash_set( il.begin(), il.end() ) {}

    hash_set( hash_set const & other ) : storage_{ other.storage_ } {}
    hash_set( hash_set && other ) : storage_{ take( other ) } {}

    hash_set & operator=( hash_set const & other )
    {
        ensure_unborrowed( "dual::hash_set::operator=" );
        if ( this != &other )
            storage_ = other.storage_;
        return *this;
    }
    hash_set & operator=( hash_set && other )
    {
        ensure_unborrowed( "dual::hash_set::operator=" );
        if ( this != &other )
            storage_ = take( other );
        return *this;
    }

    ~hash_set() noexcept { BOOST_ASSERT_MSG( !borrowed_, "hash_set destroyed while a relocating_ref is alive" ); }

    //--------------------------------------------------------------------------
    // Iterators (cheap, restartable; invalidated by any mutation)
    //--------------------------------------------------------------------------
    const_iterator begin () const noexcept { return const_iterator{ storage_.begin() }; }
    const_iterator end   () const noexcept { return const_iterator{ storage_.end  () }; }
    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    /// Lazy view of every element's current key.
    [[ nodiscard ]] auto keys() const
    {
        return std::views::transform( *this, []( value_type const & value ) -> decltype( auto ) { return key_of( value ); } );
    }

    /// Consumes the container: a single pass input range yielding the
    /// elements by value (rvalue reference).
    [[ nodiscard ]] drain into_values() &&
    {
        drain values{ take( *this ) };
        storage_.clear();
        return values;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty   () const noexcept { return storage_.empty(); }
    [[ nodiscard ]] size_type size    () const noexcept { return storage_.size (); }
    [[ nodiscard ]] size_type max_size() const noexcept { return storage_.max_size(); }

    [[ nodiscard ]] size_type bucket_count() const noexcept { return storage_.bucket_count(); }

    void reserve( size_type const n )
    {
        ensure_unborrowed( "dual::hash_set::reserve" );
        storage_.reserve( n );
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<transparent_hashing, key_type> K = key_type>
    [[ nodiscard ]] const_iterator find( K const & key ) const { return const_iterator{ slot( key ) }; }

    template <LookupType<transparent_hashing, key_type> K = key_type>
    [[ nodiscard ]] value_type const * get( K const & key ) const
    {
        auto const pos{ slot( key ) };
        return ( pos != storage_.end() ) ? std::addressof( pos->second ) : nullptr;
    }

    template <LookupType<transparent_hashing, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & key ) const { return slot( key ) != storage_.end(); }

    /// Checked access, for callers that have already established presence.
    template <LookupType<transparent_hashing, key_type> K = key_type>
    [[ nodiscard ]] value_type const & at( K const & key ) const
    {
        auto const pos{ slot( key ) };
        if ( pos == storage_.end() ) [[ unlikely ]]
            detail::throw_key_not_found( "dual::hash_set::at" );
        return pos->second;
    }

    template <LookupType<transparent_hashing, key_type> K = key_type>
    [[ nodiscard ]] value_type const & operator[]( K const & key ) const { return at( key ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Files value under its own key, returning the element it displaced (if
    /// that slot was occupied). An occupied slot keeps its node and has its
    /// element move assigned so a failing allocation cannot lose the occupant.
    std::optional<value_type> insert( value_type value )
    {
        ensure_unborrowed( "dual::hash_set::insert" );
        if ( auto const pos{ storage_.find( key_of( value ) ) }; pos != storage_.end() )
        {
            std::optional<value_type> displaced{ std::move( pos->second ) };
            pos->second = std::move( value );
            return displaced;
        }
        storage_.emplace( key_type( key_of( value ) ), std::move( value ) );
        return std::nullopt;
    }

    template <std::input_iterator InputIt>
    void insert( InputIt first, InputIt const last )
    {
        for ( ; first != last; ++first )
            insert( value_type( *first ) );
    }

    void insert( std::initializer_list<value_type> const il ) { insert( il.begin(), il.end() ); }

    template <typename... Args>
    std::optional<value_type> emplace( Args &&... args )
    {
        return insert( value_type( std::forward<Args>( args )... ) );
    }

    template <LookupType<transparent_hashing, key_type> K = key_type>
    std::optional<value_type> remove( K const & key )
    {
        ensure_unborrowed( "dual::hash_set::remove" );
        auto const pos{ slot( key ) };
        if ( pos == storage_.end() )
            return std::nullopt;
        return std::optional<value_type>{ std::move( storage_.extract( pos ).mapped() ) };
    }

    void clear()
    {
        ensure_unborrowed( "dual::hash_set::clear" );
        storage_.clear();
    }

    void swap( hash_set & other )
    {
        ensure_unborrowed      ( "dual::hash_set::swap" );
        other.ensure_unborrowed( "dual::hash_set::swap" );
        storage_.swap( other.storage_ );
    }
    friend void swap( hash_set & left, hash_set & right ) { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Mutation — closure form
    //--------------------------------------------------------------------------

    /// Invokes f( T & ) on the element filed under key and moves the element
    /// if f changed its key. Returns f's result (std::nullopt if key is absent)
    /// or, for void f, whether the element was found.
    template <LookupType<transparent_hashing, key_type> K = key_type, typename F>
    requires std::invocable<F, value_type &>
    auto modify( K const & key, F && f )
    {
        using result_t = std::invoke_result_t<F, value_type &>;
        static_assert( !std::is_reference_v<result_t>, "modify would return a reference into a relocatable element" );

        auto ref{ get_mut( key ) };
        if constexpr ( std::is_void_v<result_t> )
        {
            if ( !ref )
                return false;
            std::invoke( std::forward<F>( f ), **ref );
            return true;
        }
        else
        {
            if ( !ref )
                return std::optional<result_t>{};
            return std::optional<result_t>{ std::invoke( std::forward<F>( f ), **ref ) };
        }
    } // relocation happens in ~relocating_ref, also when f throws

    /// Applies f( T & ) to every element, relocating the ones whose key changed.
    template <typename F>
    requires std::invocable<F &, value_type &>
    void modify_all( F && f )
    {
        retain( [&f]( value_type & value ) { std::invoke( f, value ); return true; } );
    }

    /// Invokes predicate( T & ) exactly once for every element. Elements for
    /// which it returns false are destroyed, the rest end up filed under their
    /// (possibly changed) key.
    /// The index is never grown while it is being traversed: elements whose
    /// key changed are extracted and only reinserted after the traversal, so
    /// no element can be visited twice or displace a not yet visited one.
    template <typename Predicate>
    requires std::predicate<Predicate &, value_type &>
    void retain( Predicate && predicate )
    {
        borrow_scope        const scope{ *this, "dual::hash_set::retain" };
        pending_relocations       pending{ *this };
        for ( auto pos{ storage_.begin() }; pos != storage_.end(); )
        {
            auto const current{ pos++ };
            bool keep;
            try
            {
                keep = static_cast<bool>( std::invoke( predicate, current->second ) );
            }
            catch ( ... )
            {
                relocate( current ); // traversal is abandoned, inserting is safe
                throw;
            }

            if ( !keep )
                storage_.erase( current );
            else
            if ( is_stale( current ) )
                pending.nodes.push_back( storage_.extract( current ) );
        }
        pending.flush();
    }

    /// std::erase_if counterpart: the predicate only gets const access.
    template <typename Predicate>
    requires std::predicate<Predicate &, value_type const &>
    friend size_type erase_if( hash_set & set, Predicate predicate )
    {
        borrow_scope const scope{ set, "dual::erase_if" };
        return static_cast<size_type>( std::erase_if( set.storage_, [&predicate]( auto const & slot ) {
            return static_cast<bool>( std::invoke( predicate, slot.second ) );
        } ) );
    }

    //--------------------------------------------------------------------------
    // Mutation — guard form
    //--------------------------------------------------------------------------
    template <LookupType<transparent_hashing, key_type> K = key_type>
    [[ nodiscard ]] std::optional<mut_ref> get_mut( K const & key )
    {
        ensure_unborrowed( "dual::hash_set::get_mut" );
        auto const pos{ slot( key ) };
        if ( pos == storage_.end() )
            return std::nullopt;
        return borrow( pos );
    }

    /// Returns a guard for the element filed under key, first inserting
    /// factory( key ) if there is none. factory is not invoked for a present
    /// key. An element reporting a key other than the requested one is still
    /// filed under the requested key and relocated by the next relocation
    /// check (at the latest when the returned guard is released).
    template <LookupType<transparent_hashing, key_type> K = key_type, typename Factory>
    requires std::constructible_from<value_type, std::invoke_result_t<Factory, key_type const &>>
    [[ nodiscard ]] mut_ref get_or_insert_with( K const & key, Factory && factory )
    {
        ensure_unborrowed( "dual::hash_set::get_or_insert_with" );
        auto pos{ slot( key ) };
        if ( pos == storage_.end() )
        {
            key_type slot_key( key );
            std::optional<value_type> value;
            {
                // the factory must not reach back into the set
                borrow_scope const scope{ *this, "dual::hash_set::get_or_insert_with" };
                value.emplace( std::invoke( std::forward<Factory>( factory ), std::as_const( slot_key ) ) );
            }
            pos = storage_.emplace( std::move( slot_key ), std::move( *value ) ).first;
        }
        return borrow( pos );
    }

    //--------------------------------------------------------------------------
    // Observers & diagnostics
    //--------------------------------------------------------------------------
    [[ nodiscard ]] hasher         hash_function() const { return storage_.hash_function(); }
    [[ nodiscard ]] key_equal      key_eq       () const { return storage_.key_eq(); }
    [[ nodiscard ]] allocator_type get_allocator() const { return storage_.get_allocator(); }

    /// Is a relocating_ref or a mutation closure currently active?
    [[ nodiscard ]] bool borrowed() const noexcept { return borrowed_; }

    /// Every element is filed under its own current key.
    [[ nodiscard ]] bool is_coherent() const
    {
        return std::ranges::all_of( storage_, [ this ]( auto const & slot ) {
            return storage_.key_eq()( slot.first, key_of( slot.second ) );
        } );
    }

    // solely a debugging helper (include hash_set_print.hpp)
    void print( std::ostream & ) const;

    friend bool operator==( hash_set const & left, hash_set const & right )
    requires std::equality_comparable<value_type>
    {
        return left.storage_ == right.storage_;
    }

private:
    class [[ nodiscard ]] borrow_scope
    {
    public:
        borrow_scope( hash_set & set, char const * const operation ) : set_{ set }
        {
            set.ensure_unborrowed( operation );
            set.borrowed_ = true;
        }
        borrow_scope( borrow_scope const & ) = delete;
        ~borrow_scope() noexcept { set_.borrowed_ = false; }

    private:
        hash_set & set_;
    }; // class borrow_scope

    // nodes extracted during a traversal, put back once it is over (or aborted)
    struct pending_relocations
    {
        hash_set &             set;
        std::vector<node_type> nodes{};

        void flush()
        {
            for ( auto & node : nodes )
            {
                if ( node )
                    set.place( std::move( node ) );
            }
            nodes.clear();
        }

        ~pending_relocations() noexcept { flush(); }
    }; // struct pending_relocations

    template <typename K>
    [[ nodiscard ]] storage_const_iterator slot( K const & key ) const
    {
        if constexpr ( transparent_hashing || std::same_as<K, key_type> )
            return storage_.find( key );
        else
            return storage_.find( key_type( key ) );
    }
    template <typename K>
    [[ nodiscard ]] storage_iterator slot( K const & key )
    {
        if constexpr ( transparent_hashing || std::same_as<K, key_type> )
            return storage_.find( key );
        else
            return storage_.find( key_type( key ) );
    }

    void ensure_unborrowed( char const * const operation ) const
    {
        if ( borrowed_ ) [[ unlikely ]]
            detail::throw_already_borrowed( operation );
    }

    static storage_type && take( hash_set & other )
    {
        other.ensure_unborrowed( "dual::hash_set move" );
        return std::move( other.storage_ );
    }

    [[ nodiscard ]] bool is_stale( storage_const_iterator const pos ) const
    {
        return !storage_.key_eq()( pos->first, key_of( pos->second ) );
    }

    mut_ref borrow( storage_iterator const pos ) noexcept
    {
        BOOST_ASSERT( !borrowed_ );
        borrowed_ = true;
        return mut_ref{ *this, pos };
    }

    // called exactly once by every live relocating_ref on destruction
    void release( storage_iterator const pos )
    {
        BOOST_ASSERT( borrowed_ );
        borrowed_ = false;
        relocate( pos );
    }

    void relocate( storage_iterator const pos )
    {
        if ( !is_stale( pos ) ) [[ likely ]]
            return;
        auto node{ storage_.extract( pos ) };
        node.key() = key_of( node.mapped() );
        place( std::move( node ) );
    }

    // inserts a detached node, displacing (destroying) the current occupant of
    // its slot
    void place( node_type && node )
    {
        BOOST_ASSERT( !node.empty() );
        auto result{ storage_.insert( std::move( node ) ) };
        if ( result.inserted ) [[ likely ]]
            return;
        storage_.erase( result.position );
        [[ maybe_unused ]] auto const reinserted{ storage_.insert( std::move( result.node ) ) };
        BOOST_ASSERT( reinserted.inserted );
    }

private:
    storage_type storage_;
    bool         borrowed_{ false };
}; // class hash_set


//==============================================================================
// drain — the consuming range returned by hash_set::into_values()
//==============================================================================

template <keyed T, typename Hash, typename KeyEqual, typename Allocator>
class hash_set<T, Hash, KeyEqual, Allocator>::drain
{
private:
    class iterator_impl;
    using iterator_base = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        iterator_impl,
#   endif
        std::input_iterator_tag,
        value_type,
        value_type &&,
        value_type *
    >;

    class iterator_impl : public iterator_base
    {
    public:
        constexpr iterator_impl() noexcept = default;

        value_type && operator*() const noexcept { return std::move( pos_->second ); }

        iterator_impl & operator++() noexcept { ++pos_; return *this; }
        using iterator_base::operator++;

        friend bool operator==( iterator_impl const & left, iterator_impl const & right ) noexcept { return left.pos_ == right.pos_; }

    private: friend class drain;
        explicit iterator_impl( storage_iterator const pos ) noexcept : pos_{ pos } {}

        storage_iterator pos_{};
    }; // class iterator_impl

public:
    using iterator = iterator_impl;

    explicit drain( storage_type && storage ) noexcept : storage_{ std::move( storage ) } {}

    iterator begin() noexcept { return iterator{ storage_.begin() }; }
    iterator end  () noexcept { return iterator{ storage_.end  () }; }

    [[ nodiscard ]] size_type size () const noexcept { return storage_.size (); }
    [[ nodiscard ]] bool      empty() const noexcept { return storage_.empty(); }

private:
    storage_type storage_;
}; // class drain

//------------------------------------------------------------------------------
} // namespace dual
//------------------------------------------------------------------------------
