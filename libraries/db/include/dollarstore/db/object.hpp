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
#include <dollarstore/db/object_id.hpp>
#include <fc/reflect/variant.hpp>

#include <memory>

namespace dollarstore { namespace db {

   /**
    *  @brief base of everything stored in the object_database
    *
    *  Objects are plain reflected structs that refer to each other by id. They must be cheap to
    *  copy, because the undo journal keeps a copy of an object before its first change in a session.
    */
   class object
   {
      public:
         virtual ~object(){}

         object_id_type id;

         virtual std::unique_ptr<object> clone()const = 0;
   };

   /// Implements clone() for DerivedClass
   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         virtual std::unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( static_cast<const DerivedClass&>( *this ) );
         }
   };

} } // dollarstore::db

FC_REFLECT( dollarstore::db::object, (id) )
