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

namespace dollarstore { namespace chain {

asset database::get_balance(account_id_type owner, asset_id_type asset_id)const
{
   auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find(boost::make_tuple(owner, asset_id));
   if( itr == index.end() )
      return asset(0, asset_id);
   return itr->get_balance();
}

asset database::get_balance(const account_object& owner, const asset_object& asset_obj)const
{
   return get_balance(owner.get_id(), asset_obj.get_id());
}

void database::adjust_balance(account_id_type account, asset delta)
{ try {
   if( delta.amount == 0 )
      return;

   auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find(boost::make_tuple(account, delta.asset_id));
   if( itr == index.end() )
   {
      DOLLARSTORE_ASSERT( delta.amount > 0, insufficient_balance,
                          "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                          ("a",account(*this).name)("b",asset(0,delta.asset_id))("r",-delta) );
      create<account_balance_object>([account,&delta](account_balance_object& b) {
         b.owner = account;
         b.asset_type = delta.asset_id;
         b.balance = delta.amount;
      });
   } else {
      if( delta.amount < 0 )
         DOLLARSTORE_ASSERT( itr->get_balance() >= -delta, insufficient_balance,
                             "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                             ("a",account(*this).name)("b",itr->get_balance())("r",-delta) );
      modify(*itr, [delta](account_balance_object& b) {
         b.adjust_balance(delta);
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::adjust_supply( const asset& delta )
{ try {
   if( delta.amount == 0 )
      return;
   const asset_dynamic_data_object& dyn = delta.asset_id(*this).dynamic_data(*this);
   FC_ASSERT( dyn.current_supply + delta.amount >= 0, "Supply of ${a} cannot go negative",
              ("a",delta.asset_id)("supply",dyn.current_supply) );
   FC_ASSERT( dyn.current_supply + delta.amount <= DOLLARSTORE_MAX_SHARE_SUPPLY );
   modify( dyn, [&delta]( asset_dynamic_data_object& d ) {
      d.current_supply += delta.amount;
   });
} FC_CAPTURE_AND_RETHROW( (delta) ) }

share_type database::get_allowance( account_id_type owner, asset_id_type asset_id )const
{
   auto& index = get_index_type<token_allowance_index>().indices().get<by_account_asset>();
   auto itr = index.find(boost::make_tuple(owner, asset_id));
   return itr == index.end() ? share_type(0) : itr->amount;
}

void database::set_allowance( account_id_type owner, const asset& amount )
{
   FC_ASSERT( amount.amount >= 0 );
   auto& index = get_index_type<token_allowance_index>().indices().get<by_account_asset>();
   auto itr = index.find(boost::make_tuple(owner, amount.asset_id));
   if( itr == index.end() )
   {
      create<token_allowance_object>([owner,&amount](token_allowance_object& a) {
         a.owner = owner;
         a.asset_type = amount.asset_id;
         a.amount = amount.amount;
      });
   }
   else
   {
      modify(*itr, [&amount](token_allowance_object& a) {
         a.amount = amount.amount;
      });
   }
}

void database::pull_with_allowance( account_id_type owner, const asset& amount )
{ try {
   const share_type allowed = get_allowance( owner, amount.asset_id );
   DOLLARSTORE_ASSERT( allowed >= amount.amount, insufficient_allowance,
                       "Allowance of ${a} is less than required ${r}", ("a",allowed)("r",amount) );
   set_allowance( owner, asset( allowed - amount.amount, amount.asset_id ) );
   adjust_balance( owner, -amount );
} FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }

} }
