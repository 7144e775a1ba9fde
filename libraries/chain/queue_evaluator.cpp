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
#include <dollarstore/chain/queue_evaluator.hpp>
#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/exceptions.hpp>
#include <dollarstore/chain/queue_position_object.hpp>

namespace dollarstore { namespace chain {

void_result queue_join_evaluator::do_evaluate( const queue_join_operation& op )
{ try {
   const database& d = db();
   op.account(d);
   // only deposits drain a queue, so the asset must still accept them
   d.get_depositable_asset( op.asset_type ).validate_canonical( op.amount );

   const asset held = d.get_balance( op.account, d.get_synthetic_asset().get_id() );
   DOLLARSTORE_ASSERT( held.amount >= op.amount, insufficient_balance,
                       "Insufficient Balance: ${b}, unable to queue ${r}", ("b",held)("r",op.amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type queue_join_evaluator::do_apply( const queue_join_operation& op )
{ try {
   return db().enqueue( op.asset_type, op.amount, op.account ).id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result queue_cancel_evaluator::do_evaluate( const queue_cancel_operation& op )
{ try {
   const database& d = db();
   op.account(d);

   const queue_position_object& position = d.get_open_queue_position( op.position );
   DOLLARSTORE_ASSERT( position.owner == op.account, not_owner,
                       "Position ${p} is not owned by ${a}", ("p",op.position)("a",op.account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

asset queue_cancel_evaluator::do_apply( const queue_cancel_operation& op )
{ try {
   database& d = db();
   const share_type refund = d.cancel_queue_position( op.position, op.account );
   return d.get_synthetic_asset().amount( refund );
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // dollarstore::chain
