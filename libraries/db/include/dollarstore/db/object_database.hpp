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
#include <dollarstore/db/object.hpp>
#include <dollarstore/db/index.hpp>
#include <dollarstore/db/undo_database.hpp>

#include <memory>
#include <vector>

namespace dollarstore { namespace db {

   /**
    *   @class object_database
    *   @brief owns one index per object type; every change goes through it so that sessions can undo it
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         template<typename IndexType>
         IndexType* add_index()
         {
            const uint8_t type = IndexType::object_type::type_id;
            if( _index.size() <= type )
               _index.resize( type + 1 );
            FC_ASSERT( !_index[type], "Index for object type ${t} already exists", ("t",uint64_t(type)) );
            _index[type] = std::make_unique<IndexType>( _undo_db );
            return static_cast<IndexType*>( _index[type].get() );
         }

         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            return static_cast<const IndexType&>( get_index( IndexType::object_type::type_id ) );
         }
         template<typename T>
         const index& get_index()const { return get_index( T::type_id ); }
         const index& get_index( uint8_t type )const;

         const object* find_object( object_id_type id )const { return get_index( id.type() ).find( id ); }
         const object& get_object( object_id_type id )const  { return get_index( id.type() ).get( id ); }

         template<typename T>
         const T* find( object_id_type id )const { return static_cast<const T*>( find_object( id ) ); }
         template<typename T>
         const T& get( object_id_type id )const  { return static_cast<const T&>( get_object( id ) ); }

         template<uint8_t TypeID>
         const typename object_of_id< object_id<TypeID> >::type* find( object_id<TypeID> id )const
         { return find< typename object_of_id< object_id<TypeID> >::type >( object_id_type( id ) ); }
         template<uint8_t TypeID>
         const typename object_of_id< object_id<TypeID> >::type& get( object_id<TypeID> id )const
         { return get< typename object_of_id< object_id<TypeID> >::type >( object_id_type( id ) ); }

         /// @{ The only ways to change stored objects
         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            return static_cast<const T&>( get_mutable_index( T::type_id ).create(
                  [&constructor]( object& o ){ constructor( static_cast<T&>( o ) ); } ) );
         }
         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            get_mutable_index( obj.id.type() ).modify( obj, [&m]( object& o ){ m( static_cast<T&>( o ) ); } );
         }
         void remove( const object& obj ) { get_mutable_index( obj.id.type() ).remove( obj ); }
         /// @}

         /** public for testing purposes only... should be private in practice. */
         undo_database _undo_db;

      private:
         friend class undo_database;
         index& get_mutable_index( uint8_t type );

         std::vector< std::unique_ptr<index> > _index;
   };

} } // dollarstore::db
