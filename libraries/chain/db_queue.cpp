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
#include <dollarstore/chain/database.hpp>

#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/queue_position_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>

#include <cmath>

namespace dollarstore { namespace chain {

const queue_position_object& database::enqueue( asset_id_type asset_id, share_type amount, account_id_type owner )
{ try {
   DOLLARSTORE_ASSERT( amount > 0, zero_amount, "Queued amount must be positive", ("amount",amount) );
   get_depositable_asset( asset_id ).validate_canonical( amount );

   // the escrow leaves the wallet but stays in the synthetic supply until it is filled or refunded
   adjust_balance( owner, -get_synthetic_asset().amount( amount ) );

   const time_point_sec now = head_time();
   const queue_position_object& position = create<queue_position_object>(
         [asset_id,amount,owner,now]( queue_position_object& p ) {
      p.owner = owner;
      p.asset_type = asset_id;
      p.original_amount = amount;
      p.remaining = amount;
      p.created = now;
      p.status = queue_position_status::active;
   });
   push_applied_operation( queue_joined_operation( owner, position.get_id(), asset_id, amount ) );
   return position;
} FC_CAPTURE_AND_RETHROW( (asset_id)(amount)(owner) ) }

vector<std::pair<queue_position_id_type, share_type>> database::drain_queue( asset_id_type asset_id,
                                                                            share_type available,
                                                                            account_id_type taker )
{ try {
   vector<std::pair<queue_position_id_type, share_type>> fills;
   const reserve_object& reserve = get_reserve( asset_id );
   const auto& idx = get_index_type<queue_position_index>().indices().get<by_asset_open>();
   const time_point_sec now = head_time();

   share_type cleared;
   while( available > 0 )
   {
      // filling a position moves it within the index, so look the head up again every time
      auto itr = idx.lower_bound( boost::make_tuple( asset_id, true ) );
      if( itr == idx.end() || itr->asset_type != asset_id || !itr->is_open() )
         break;

      const queue_position_object& position = *itr;
      const share_type fill = std::min( available, position.remaining );
      const asset paid = _settle_from_reserve( reserve, fill, position.owner );
      modify( position, [fill]( queue_position_object& p ) {
         p.remaining -= fill;
         p.status = ( p.remaining == 0 ) ? queue_position_status::filled
                                         : queue_position_status::partially_filled;
      });
      push_applied_operation( queue_filled_operation( position.get_id(), position.owner, paid, position.remaining ) );

      mint_maker_reward( position.owner, fill, now.sec_since_epoch() - position.created.sec_since_epoch() );

      fills.emplace_back( position.get_id(), fill );
      available -= fill;
      cleared += fill;
   }

   if( cleared > 0 )
      mint_taker_reward( taker, cleared );
   return fills;
} FC_CAPTURE_AND_RETHROW( (asset_id)(available)(taker) ) }

share_type database::cancel_queue_position( queue_position_id_type id, account_id_type caller )
{ try {
   const queue_position_object& position = get_open_queue_position( id );
   DOLLARSTORE_ASSERT( position.owner == caller, not_owner,
                       "Position ${p} belongs to ${o}", ("p",id)("o",position.owner) );

   const share_type refund = position.remaining;
   modify( position, []( queue_position_object& p ) {
      p.remaining = 0;
      p.status = queue_position_status::cancelled;
   });
   adjust_balance( caller, get_synthetic_asset().amount( refund ) );
   push_applied_operation( queue_cancelled_operation( id, caller, refund ) );
   return refund;
} FC_CAPTURE_AND_RETHROW( (id)(caller) ) }

const queue_position_object& database::get_open_queue_position( queue_position_id_type id )const
{
   const queue_position_object* position = find( id );
   DOLLARSTORE_ASSERT( position != nullptr && position->is_open(), position_not_found,
                       "No open queue position ${p}", ("p",id) );
   return *position;
}

share_type database::get_queue_depth( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<queue_position_index>().indices().get<by_asset_open>();
   share_type depth;
   auto range = idx.equal_range( boost::make_tuple( asset_id, true ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      depth += itr->remaining;
   return depth;
}

queue_position_info database::get_queue_position_info( queue_position_id_type id )const
{
   const queue_position_object& position = get_open_queue_position( id );
   const auto& idx = get_index_type<queue_position_index>().indices().get<by_asset_open>();

   queue_position_info info;
   auto itr = idx.lower_bound( boost::make_tuple( position.asset_type, true ) );
   for( ; itr != idx.end() && itr->id < position.id; ++itr )
   {
      info.amount_ahead += itr->remaining;
      ++info.position_number;
   }
   ++info.position_number;
   return info;
}

vector<queue_position_id_type> database::get_user_queue_positions( account_id_type owner )const
{
   const auto& idx = get_index_type<queue_position_index>().indices().get<by_owner>();
   vector<queue_position_id_type> result;
   auto range = idx.equal_range( boost::make_tuple( owner ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      if( itr->is_open() )
         result.push_back( itr->get_id() );
   return result;
}

double database::get_fill_score( queue_position_id_type id )const
{
   const queue_position_object& position = get_open_queue_position( id );
   const double seconds = head_time().sec_since_epoch() - position.created.sec_since_epoch();
   const double power = double( get_stake_power( position.owner ).value ) / DOLLARSTORE_REWARD_PRECISION;
   const double remaining_dollars = double( position.remaining.value ) / DOLLARSTORE_SYNTHETIC_PRECISION;
   return ( 1.0 + power / std::sqrt( remaining_dollars ) ) * seconds;
}

} }
