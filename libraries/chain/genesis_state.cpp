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
#include <dollarstore/chain/genesis_state.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/protocol/account.hpp>

#include <set>

namespace dollarstore { namespace chain {

void genesis_state_type::validate()const
{ try {
   initial_parameters.validate();

   std::set<string> account_names;
   for( const auto& a : initial_accounts )
   {
      FC_ASSERT( is_valid_name( a.name ), "Invalid account name", ("name",a.name) );
      FC_ASSERT( account_names.insert( a.name ).second, "Duplicate account name", ("name",a.name) );
   }
   FC_ASSERT( is_valid_name( founder_account ), "Invalid founder account name", ("name",founder_account) );
   account_names.insert( founder_account );

   std::map<string, asset_kind> kinds;
   uint32_t synthetic_count = 0;
   uint32_t reward_count = 0;
   for( const auto& a : initial_assets )
   {
      FC_ASSERT( asset_object::is_valid_symbol( a.symbol ), "Invalid asset symbol", ("symbol",a.symbol) );
      FC_ASSERT( kinds.emplace( a.symbol, a.kind ).second, "Duplicate asset symbol", ("symbol",a.symbol) );
      FC_ASSERT( a.precision <= DOLLARSTORE_MAX_ASSET_PRECISION );
      if( a.kind == asset_kind::synthetic )
      {
         ++synthetic_count;
         FC_ASSERT( a.precision == DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS,
                    "The synthetic asset defines the canonical precision", ("precision",a.precision) );
      }
      else if( a.kind == asset_kind::reward )
      {
         ++reward_count;
         FC_ASSERT( a.precision == DOLLARSTORE_REWARD_PRECISION_DIGITS,
                    "The reward token must carry the precision emission rates are expressed in",
                    ("precision",a.precision) );
      }
   }
   FC_ASSERT( synthetic_count == 1, "Exactly one synthetic asset is required" );
   FC_ASSERT( reward_count == 1, "Exactly one reward asset is required" );

   for( const auto& b : initial_balances )
   {
      FC_ASSERT( account_names.count( b.owner ), "Balance owner is not an initial account", ("owner",b.owner) );
      auto itr = kinds.find( b.asset_symbol );
      FC_ASSERT( itr != kinds.end(), "Unknown asset in initial balance", ("symbol",b.asset_symbol) );
      FC_ASSERT( itr->second != asset_kind::synthetic, "The synthetic asset is only minted against reserves" );
      FC_ASSERT( b.amount > 0, "Initial balances must be positive", ("balance",b) );
   }
} FC_CAPTURE_AND_RETHROW() }

genesis_state_type create_default_genesis()
{
   genesis_state_type genesis;
   genesis.initial_timestamp = fc::time_point_sec( fc::time_point::now().sec_since_epoch() );

   auto add_asset = [&genesis]( const string& symbol, asset_kind kind ) {
      genesis_state_type::initial_asset_type a;
      a.symbol = symbol;
      a.precision = DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS;
      a.kind = kind;
      genesis.initial_assets.push_back( a );
   };
   add_asset( "USDC", asset_kind::reserve );
   add_asset( "USDT", asset_kind::reserve );
   add_asset( DOLLARSTORE_SYMBOL, asset_kind::synthetic );
   add_asset( DOLLARSTORE_REWARD_SYMBOL, asset_kind::reward );

   genesis.initial_accounts.emplace_back( genesis.founder_account );
   return genesis;
}

} } // dollarstore::chain
