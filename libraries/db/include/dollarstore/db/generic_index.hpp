/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once
#include <dollarstore/db/index.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/mem_fun.hpp>

namespace dollarstore { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id{};

   /**
    *  Stores ObjectType in a Boost.MultiIndex container whose first index is ordered_unique on
    *  object::id, and reports every change to the undo journal.
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         using index_type  = MultiIndexType;
         using object_type = ObjectType;

         explicit generic_index( undo_database& undo )
         :_undo(undo),_next_id( ObjectType::type_id, 0 ) {}

         virtual uint8_t        object_type_id()const override { return ObjectType::type_id; }
         virtual object_id_type get_next_id()const override    { return _next_id; }

         virtual const object& create( const std::function<void(object&)>& constructor ) override
         {
            ObjectType item;
            item.id = _next_id;
            constructor( item );
            auto inserted = _indices.insert( std::move( item ) );
            FC_ASSERT( inserted.second, "Could not create object, a uniqueness constraint was violated" );
            _next_id = _next_id.successor();
            _undo.on_create( *inserted.first );
            return *inserted.first;
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            _undo.on_modify( obj );
            const bool ok = _indices.modify( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ),
                                             [&m]( ObjectType& o ){ m( o ); } );
            FC_ASSERT( ok, "Could not modify object, an index constraint was violated" );
         }

         virtual void remove( const object& obj ) override
         {
            _undo.on_remove( obj );
            _indices.erase( _indices.iterator_to( static_cast<const ObjectType&>( obj ) ) );
         }

         virtual const object* find( object_id_type id )const override
         {
            auto itr = _indices.find( id );
            return itr == _indices.end() ? nullptr : &*itr;
         }

         virtual void revert( undo_entry& entry ) override
         {
            switch( entry.action )
            {
               case undo_entry::created:
               {
                  auto itr = _indices.find( entry.id );
                  if( itr != _indices.end() )
                     _indices.erase( itr );
                  _next_id = entry.id;
                  break;
               }
               case undo_entry::modified:
               {
                  auto itr = _indices.find( entry.id );
                  FC_ASSERT( itr != _indices.end(), "Object ${id} vanished before its change was undone",
                             ("id",entry.id) );
                  ObjectType& prior = static_cast<ObjectType&>( *entry.prior );
                  FC_ASSERT( _indices.modify( itr, [&prior]( ObjectType& o ){ o = std::move( prior ); } ) );
                  break;
               }
               case undo_entry::removed:
               {
                  auto inserted = _indices.insert( std::move( static_cast<ObjectType&>( *entry.prior ) ) );
                  FC_ASSERT( inserted.second, "Could not restore removed object ${id}", ("id",entry.id) );
                  break;
               }
            }
         }

         const index_type& indices()const { return _indices; }

      private:
         undo_database&  _undo;
         index_type      _indices;
         object_id_type  _next_id;
   };

} } // dollarstore::db
