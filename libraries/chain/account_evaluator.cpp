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
#include <dollarstore/chain/account_evaluator.hpp>
#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/exceptions.hpp>

namespace dollarstore { namespace chain {

void_result account_create_evaluator::do_evaluate( const account_create_operation& op )
{ try {
   const database& d = db();
   FC_ASSERT( d.find_account_by_name( op.name ) == nullptr, "Account '${a}' already exists.", ("a",op.name) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type account_create_evaluator::do_apply( const account_create_operation& o )
{ try {
   database& d = db();
   const auto& new_acnt_object = d.create<account_object>( [&o]( account_object& obj ){
      obj.name = o.name;
   });
   d.create<account_statistics_object>( [&new_acnt_object]( account_statistics_object& s ){
      s.owner = new_acnt_object.get_id();
   });
   return new_acnt_object.id;
} FC_CAPTURE_AND_RETHROW((o)) }

} } // dollarstore::chain
