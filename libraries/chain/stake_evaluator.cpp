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
#include <dollarstore/chain/stake_evaluator.hpp>
#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/exceptions.hpp>
#include <dollarstore/chain/stake_object.hpp>

namespace dollarstore { namespace chain {

void_result stake_evaluator::do_evaluate( const stake_operation& op )
{ try {
   const database& d = db();
   op.account(d);

   _stake = d.find_stake( op.account );
   DOLLARSTORE_ASSERT( _stake == nullptr || !_stake->is_unstaking(), already_unstaking,
                       "Account ${a} has an unstake pending", ("a",op.account) );

   const asset amount = d.get_reward_asset().amount( op.amount );
   const share_type allowed = d.get_allowance( op.account, amount.asset_id );
   DOLLARSTORE_ASSERT( allowed >= op.amount, insufficient_allowance,
                       "Allowance of ${a} is less than the stake of ${s}", ("a",allowed)("s",amount) );
   const asset balance = d.get_balance( op.account, amount.asset_id );
   DOLLARSTORE_ASSERT( balance >= amount, insufficient_balance,
                       "Balance of ${b} is less than the stake of ${s}", ("b",balance)("s",amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result stake_evaluator::do_apply( const stake_operation& op )
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();

   d.pull_with_allowance( op.account, d.get_reward_asset().amount( op.amount ) );

   if( _stake == nullptr )
   {
      d.create<stake_object>( [&op,now]( stake_object& s ) {
         s.owner = op.account;
         s.staked = op.amount;
         s.stake_start = now;
         s.status = stake_status::staked;
      });
   }
   else
   {
      // topping up an active stake keeps its start time
      d.modify( *_stake, [&op,now]( stake_object& s ) {
         if( s.status == stake_status::none )
            s.stake_start = now;
         s.staked += op.amount;
         s.status = stake_status::staked;
      });
   }

   d.push_applied_operation( staked_operation( op.account, op.amount, d.get_stake_power( op.account ) ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result unstake_evaluator::do_evaluate( const unstake_operation& op )
{ try {
   const database& d = db();
   op.account(d);

   _stake = d.find_stake( op.account );
   DOLLARSTORE_ASSERT( _stake == nullptr || !_stake->is_unstaking(), already_unstaking,
                       "Account ${a} has an unstake pending", ("a",op.account) );
   DOLLARSTORE_ASSERT( _stake != nullptr && _stake->staked > 0, not_staked,
                       "Account ${a} has nothing staked", ("a",op.account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result unstake_evaluator::do_apply( const unstake_operation& op )
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();

   d.modify( *_stake, [now]( stake_object& s ) {
      s.status = stake_status::unstaking;
      s.unstake_time = now;
   });

   const time_point_sec completion = now + d.get_chain_parameters().unstake_cooldown;
   d.push_applied_operation( unstake_initiated_operation( op.account, _stake->staked, completion ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result unstake_complete_evaluator::do_evaluate( const unstake_complete_operation& op )
{ try {
   const database& d = db();
   op.account(d);

   _stake = d.find_stake( op.account );
   DOLLARSTORE_ASSERT( _stake != nullptr && _stake->is_unstaking(), not_unstaking,
                       "Account ${a} has no unstake pending", ("a",op.account) );
   FC_ASSERT( _stake->unstake_time.valid() );

   const time_point_sec ready = *_stake->unstake_time + d.get_chain_parameters().unstake_cooldown;
   DOLLARSTORE_ASSERT( d.head_time() >= ready, cooldown_not_complete,
                       "Unstake of ${a} completes at ${t}", ("a",op.account)("t",ready) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result unstake_complete_evaluator::do_apply( const unstake_complete_operation& op )
{ try {
   database& d = db();
   const share_type amount = _stake->staked;

   d.modify( *_stake, []( stake_object& s ) {
      s.staked = 0;
      s.status = stake_status::none;
      s.unstake_time.reset();
   });
   d.adjust_balance( op.account, d.get_reward_asset().amount( amount ) );

   d.push_applied_operation( unstake_completed_operation( op.account, amount ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result unstake_cancel_evaluator::do_evaluate( const unstake_cancel_operation& op )
{ try {
   const database& d = db();
   op.account(d);

   _stake = d.find_stake( op.account );
   DOLLARSTORE_ASSERT( _stake != nullptr && _stake->is_unstaking(), not_unstaking,
                       "Account ${a} has no unstake pending", ("a",op.account) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result unstake_cancel_evaluator::do_apply( const unstake_cancel_operation& op )
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();

   // power ramps up again from zero
   d.modify( *_stake, [now]( stake_object& s ) {
      s.status = stake_status::staked;
      s.stake_start = now;
      s.unstake_time.reset();
   });

   d.push_applied_operation( unstake_cancelled_operation( op.account, _stake->staked ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // dollarstore::chain
