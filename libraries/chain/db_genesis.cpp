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
#include <dollarstore/chain/emission_object.hpp>
#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>

namespace dollarstore { namespace chain {

void database::init_genesis(const genesis_state_type& genesis_state)
{ try {
   FC_ASSERT( genesis_state.initial_timestamp != time_point_sec(), "Must initialize genesis timestamp." );
   FC_ASSERT( get_index<asset_object>().get_next_id().instance() == 0, "Genesis already applied" );
   genesis_state.validate();

   transaction_evaluation_state genesis_eval_state(this);

   _p_dyn_global_prop_obj = & create<dynamic_global_property_object>(
                                 [&genesis_state](dynamic_global_property_object& p) {
      p.time = genesis_state.initial_timestamp;
   });

   // Create initial assets
   std::map<string, asset_id_type> assets_by_symbol;
   for( const auto& asset : genesis_state.initial_assets )
   {
      const asset_dynamic_data_object& dyn_asset =
         create<asset_dynamic_data_object>([](asset_dynamic_data_object& a) {
            a.current_supply = 0;
         });
      const asset_object& asset_obj = create<asset_object>( [&asset,&dyn_asset]( asset_object& a ) {
         a.symbol = asset.symbol;
         a.precision = asset.precision;
         a.kind = asset.kind;
         a.supported = asset.supported;
         a.dynamic_asset_data_id = dyn_asset.id;
      });
      asset_obj.validate();
      assets_by_symbol[asset.symbol] = asset_obj.get_id();

      if( asset_obj.is_reserve() )
         create<reserve_object>( [&asset_obj]( reserve_object& r ) {
            r.asset_type = asset_obj.get_id();
            r.balance = 0;
         });
      else if( asset_obj.is_synthetic() )
         _p_synthetic_asset_obj = &asset_obj;
      else
         _p_reward_asset_obj = &asset_obj;
   }

   // Create initial accounts
   for( const auto& account : genesis_state.initial_accounts )
   {
      account_create_operation cop;
      cop.name = account.name;
      apply_operation(genesis_eval_state, cop);
   }
   const account_object* founder = find_account_by_name( genesis_state.founder_account );
   if( founder == nullptr )
   {
      account_create_operation cop;
      cop.name = genesis_state.founder_account;
      apply_operation(genesis_eval_state, cop);
      founder = find_account_by_name( genesis_state.founder_account );
   }
   FC_ASSERT( founder != nullptr );

   // Create global properties
   _p_global_prop_obj = & create<global_property_object>([&](global_property_object& p) {
       p.parameters = genesis_state.initial_parameters;
       p.synthetic_asset = _p_synthetic_asset_obj->get_id();
       p.reward_asset = _p_reward_asset_obj->get_id();
       p.founder_account = founder->get_id();
   });

   _p_emission_state_obj = & create<emission_state_object>([&genesis_state](emission_state_object& e) {
      e.maker_cap = genesis_state.initial_parameters.maker_cap;
      e.taker_cap = genesis_state.initial_parameters.taker_cap;
      e.founder_cap = genesis_state.initial_parameters.founder_cap;
   });

   // Allocate initial balances
   for( const auto& handout : genesis_state.initial_balances )
   {
      const account_object* owner = find_account_by_name( handout.owner );
      FC_ASSERT( owner != nullptr, "Unknown balance owner", ("owner",handout.owner) );
      const asset amount( handout.amount, assets_by_symbol[handout.asset_symbol] );
      adjust_balance( owner->get_id(), amount );
      adjust_supply( amount );
   }

   _applied_ops.clear();

   ilog( "Ledger initialized at ${t} with ${a} assets and ${n} accounts",
         ("t",head_time())("a",genesis_state.initial_assets.size())
         ("n",get_index<account_object>().get_next_id().instance()) );
} FC_CAPTURE_AND_RETHROW() }

} }
