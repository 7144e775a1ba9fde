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
#include <dollarstore/chain/token_evaluator.hpp>
#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/exceptions.hpp>

namespace dollarstore { namespace chain {

void_result transfer_evaluator::do_evaluate( const transfer_operation& op )
{ try {
   const database& d = db();

   const account_object& from_account = op.from(d);
   op.to(d);
   op.amount.asset_id(d);

   const asset balance = d.get_balance( op.from, op.amount.asset_id );
   DOLLARSTORE_ASSERT( balance >= op.amount, insufficient_balance,
                       "Insufficient Balance: ${balance}, unable to transfer '${total_transfer}' from account '${a}' to '${t}'",
                       ("a",from_account.name)("t",op.to)("total_transfer",op.amount)("balance",balance) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_evaluator::do_apply( const transfer_operation& o )
{ try {
   db().adjust_balance( o.from, -o.amount );
   db().adjust_balance( o.to, o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result approve_evaluator::do_evaluate( const approve_operation& op )
{ try {
   const database& d = db();
   op.owner(d);
   op.amount.asset_id(d);
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result approve_evaluator::do_apply( const approve_operation& o )
{ try {
   db().set_allowance( o.owner, o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // dollarstore::chain
