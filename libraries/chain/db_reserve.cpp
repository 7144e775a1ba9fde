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

#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/queue_position_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>

namespace dollarstore { namespace chain {

const reserve_object& database::get_reserve( asset_id_type asset_id )const
{
   const auto& idx = get_index_type<reserve_index>().indices().get<by_asset>();
   auto itr = idx.find( asset_id );
   DOLLARSTORE_ASSERT( itr != idx.end(), unsupported_asset,
                       "Asset ${a} is not a reserve asset", ("a",asset_id) );
   return *itr;
}

share_type database::get_total_reserves()const
{
   share_type total;
   for( const reserve_object& r : get_index_type<reserve_index>().indices() )
      total += r.balance;
   return total;
}

share_type database::credit_reserve( const asset& amount, account_id_type depositor )
{ try {
   const asset_object& reserve_asset = get_depositable_asset( amount.asset_id );
   const share_type canonical = reserve_asset.to_canonical( amount );
   DOLLARSTORE_ASSERT( canonical > 0, zero_amount, "Nothing to credit", ("amount",amount) );

   modify( get_reserve( amount.asset_id ), [canonical]( reserve_object& r ) {
      r.balance += canonical;
   });
   const asset minted = get_synthetic_asset().amount( canonical );
   adjust_balance( depositor, minted );
   adjust_supply( minted );
   return canonical;
} FC_CAPTURE_AND_RETHROW( (amount)(depositor) ) }

asset database::debit_reserve( asset_id_type asset_id, share_type amount, account_id_type holder )
{ try {
   const reserve_object& reserve = get_reserve( asset_id );
   DOLLARSTORE_ASSERT( reserve.balance >= amount, insufficient_reserves,
                       "Reserve of ${a} holds ${b}, ${r} requested",
                       ("a",asset_id)("b",reserve.balance)("r",amount) );
   adjust_balance( holder, -get_synthetic_asset().amount( amount ) );
   return _settle_from_reserve( reserve, amount, holder );
} FC_CAPTURE_AND_RETHROW( (asset_id)(amount)(holder) ) }

asset database::_settle_from_reserve( const reserve_object& reserve, share_type amount, account_id_type recipient )
{
   FC_ASSERT( amount > 0 && reserve.balance >= amount );
   adjust_supply( -get_synthetic_asset().amount( amount ) );
   modify( reserve, [amount]( reserve_object& r ) {
      r.balance -= amount;
   });
   const asset paid = reserve.asset_type(*this).from_canonical( amount );
   adjust_balance( recipient, paid );
   return paid;
}

share_type database::check_deposit( account_id_type depositor, const asset& amount )const
{
   const asset_object& reserve_asset = get_depositable_asset( amount.asset_id );
   const share_type canonical = reserve_asset.to_canonical( amount );

   const share_type allowed = get_allowance( depositor, amount.asset_id );
   DOLLARSTORE_ASSERT( allowed >= amount.amount, insufficient_allowance,
                       "Allowance of ${a} is less than the deposit of ${d}", ("a",allowed)("d",amount) );
   const asset balance = get_balance( depositor, amount.asset_id );
   DOLLARSTORE_ASSERT( balance >= amount, insufficient_balance,
                       "Balance of ${b} is less than the deposit of ${d}", ("b",balance)("d",amount) );
   return canonical;
}

share_type database::apply_deposit( account_id_type depositor, const asset& amount )
{
   pull_with_allowance( depositor, amount );
   const share_type minted = credit_reserve( amount, depositor );
   push_applied_operation( deposited_operation( depositor, amount, minted ) );

   const auto fills = drain_queue( amount.asset_id, minted, depositor );
   if( !fills.empty() )
      dlog( "Deposit of ${a} filled ${n} queue positions", ("a",amount)("n",fills.size()) );
   return minted;
}

swap_result database::apply_redemption( account_id_type holder, asset_id_type asset_id, share_type amount,
                                        bool queue_if_unavailable )
{ try {
   const reserve_object& reserve = get_reserve( asset_id );
   share_type now = amount;
   if( queue_if_unavailable )
      now = std::min( reserve.balance, amount );
   else
      DOLLARSTORE_ASSERT( reserve.balance >= amount, insufficient_reserves,
                          "Reserve of ${a} holds ${b}, ${r} requested",
                          ("a",asset_id)("b",reserve.balance)("r",amount) );

   swap_result result;
   result.received = asset( 0, asset_id );
   if( now > 0 )
   {
      result.received = debit_reserve( asset_id, now, holder );
      push_applied_operation( withdrawn_operation( holder, result.received, now ) );
      _record_redemption( holder, now );
   }

   const share_type shortfall = amount - now;
   if( shortfall > 0 )
   {
      result.position = enqueue( asset_id, shortfall, holder ).get_id();
      result.queued = shortfall;
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (holder)(asset_id)(amount)(queue_if_unavailable) ) }

void database::_record_redemption( account_id_type account, share_type amount )
{
   const auto& idx = get_index_type<account_stats_index>().indices().get<by_owner>();
   auto itr = idx.find( account );
   FC_ASSERT( itr != idx.end(), "Account ${a} has no statistics", ("a",account) );

   const uint32_t today = head_time().sec_since_epoch() / DOLLARSTORE_SECONDS_PER_DAY;
   modify( *itr, [today,amount]( account_statistics_object& s ) {
      if( s.redemption_day != today )
      {
         s.redemption_day = today;
         s.redeemed_today = 0;
      }
      s.redeemed_today += amount;
   });
}

share_type database::get_daily_redemption_used( account_id_type account )const
{
   const auto& idx = get_index_type<account_stats_index>().indices().get<by_owner>();
   auto itr = idx.find( account );
   if( itr == idx.end() )
      return 0;
   return itr->redeemed_on( head_time() );
}

} }
