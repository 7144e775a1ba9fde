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
#include <dollarstore/chain/swap_evaluator.hpp>
#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/exceptions.hpp>
#include <dollarstore/chain/reserve_object.hpp>

namespace dollarstore { namespace chain {

void_result swap_evaluator::do_evaluate( const swap_operation& op )
{ try {
   const database& d = db();
   op.account(d);

   _canonical = d.check_deposit( op.account, op.amount );

   // a swap that may queue needs a target that deposits can still drain into
   const asset_object& target = op.queue_if_unavailable ? d.get_depositable_asset( op.to_asset )
                                                        : d.get_reserve_asset( op.to_asset );
   target.validate_canonical( _canonical );
   if( !op.queue_if_unavailable )
   {
      const reserve_object& reserve = d.get_reserve( op.to_asset );
      DOLLARSTORE_ASSERT( reserve.balance >= _canonical, insufficient_reserves,
                          "Reserve of ${s} holds ${b}, ${r} requested",
                          ("s",target.symbol)("b",reserve.balance)("r",_canonical) );
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

swap_result swap_evaluator::do_apply( const swap_operation& op )
{ try {
   database& d = db();
   const share_type minted = d.apply_deposit( op.account, op.amount );
   FC_ASSERT( minted == _canonical );
   return d.apply_redemption( op.account, op.to_asset, minted, op.queue_if_unavailable );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result swap_from_synthetic_evaluator::do_evaluate( const swap_from_synthetic_operation& op )
{ try {
   const database& d = db();
   op.account(d);

   const asset_object& target = op.queue_if_unavailable ? d.get_depositable_asset( op.to_asset )
                                                        : d.get_reserve_asset( op.to_asset );
   target.validate_canonical( op.amount );

   const asset held = d.get_balance( op.account, d.get_synthetic_asset().get_id() );
   DOLLARSTORE_ASSERT( held.amount >= op.amount, insufficient_balance,
                       "Insufficient Balance: ${b}, unable to swap ${r}", ("b",held)("r",op.amount) );

   if( !op.queue_if_unavailable )
   {
      const reserve_object& reserve = d.get_reserve( op.to_asset );
      DOLLARSTORE_ASSERT( reserve.balance >= op.amount, insufficient_reserves,
                          "Reserve of ${s} holds ${b}, ${r} requested",
                          ("s",target.symbol)("b",reserve.balance)("r",op.amount) );
   }
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

swap_result swap_from_synthetic_evaluator::do_apply( const swap_from_synthetic_operation& op )
{ try {
   return db().apply_redemption( op.account, op.to_asset, op.amount, op.queue_if_unavailable );
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // dollarstore::chain
