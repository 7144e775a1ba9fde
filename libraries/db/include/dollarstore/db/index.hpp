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
#include <dollarstore/db/undo_database.hpp>

#include <fc/exception/exception.hpp>

#include <functional>

namespace dollarstore { namespace db {

   /**
    *  @class index
    *  @brief type-erased access to the objects of one type
    *
    *  Ids are handed out sequentially. Objects can only be changed through modify(), everything
    *  outside the callback sees const references.
    */
   class index
   {
      public:
         virtual ~index(){}

         virtual uint8_t        object_type_id()const = 0;
         virtual object_id_type get_next_id()const = 0;

         /// Assigns the next id, lets @p constructor fill the object in and inserts it
         virtual const object&  create( const std::function<void(object&)>& constructor ) = 0;
         /// Secondary keys are re-checked once @p m returns
         virtual void           modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void           remove( const object& obj ) = 0;

         virtual const object*  find( object_id_type id )const = 0;
         const object&          get( object_id_type id )const
         {
            const object* found = find( id );
            FC_ASSERT( found != nullptr, "Unable to find object ${id}", ("id",id) );
            return *found;
         }

         /// Reverses one journaled change without journaling it again
         virtual void           revert( undo_entry& entry ) = 0;
   };

} } // dollarstore::db
