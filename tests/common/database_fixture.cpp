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
#include <boost/test/unit_test.hpp>

#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/emission_object.hpp>
#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>

#include <fc/io/json.hpp>

#include <map>

#include "database_fixture.hpp"

uint32_t DOLLARSTORE_TESTING_GENESIS_TIMESTAMP = 1431700000;

namespace dollarstore { namespace chain {

namespace {
   const int64_t faucet_whole_units = 1000000000;
}

genesis_state_type database_fixture::make_genesis()
{
   genesis_state_type genesis;
   genesis.initial_timestamp = time_point_sec( DOLLARSTORE_TESTING_GENESIS_TIMESTAMP );

   auto add_asset = [&genesis]( const string& symbol, uint8_t precision, asset_kind kind, bool supported ) {
      genesis_state_type::initial_asset_type a;
      a.symbol = symbol;
      a.precision = precision;
      a.kind = kind;
      a.supported = supported;
      genesis.initial_assets.push_back( a );
   };
   add_asset( "USDC", 6, asset_kind::reserve, true );
   add_asset( "USDT", 6, asset_kind::reserve, true );
   add_asset( "TUSD", 8, asset_kind::reserve, true );
   add_asset( "BUSD", 6, asset_kind::reserve, false );
   add_asset( DOLLARSTORE_SYMBOL, DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS, asset_kind::synthetic, true );
   add_asset( DOLLARSTORE_REWARD_SYMBOL, DOLLARSTORE_REWARD_PRECISION_DIGITS, asset_kind::reward, true );

   genesis.initial_accounts.emplace_back( DOLLARSTORE_TESTING_FAUCET_ACCOUNT );

   auto add_balance = [&genesis]( const string& symbol, uint8_t precision ) {
      genesis_state_type::initial_balance_type b;
      b.owner = DOLLARSTORE_TESTING_FAUCET_ACCOUNT;
      b.asset_symbol = symbol;
      b.amount = faucet_whole_units * asset::scaled_precision( precision ).value;
      genesis.initial_balances.push_back( b );
   };
   add_balance( "USDC", 6 );
   add_balance( "USDT", 6 );
   add_balance( "TUSD", 8 );
   add_balance( "BUSD", 6 );
   add_balance( DOLLARSTORE_REWARD_SYMBOL, DOLLARSTORE_REWARD_PRECISION_DIGITS );

   return genesis;
}

database_fixture::database_fixture()
   : database_fixture( make_genesis() )
{
}

database_fixture::database_fixture( const genesis_state_type& genesis )
   : genesis_state( genesis ), db(), api( db )
{ try {
   db.init_genesis( genesis_state );

   usdc_id  = get_asset( "USDC" ).get_id();
   usdt_id  = get_asset( "USDT" ).get_id();
   tusd_id  = get_asset( "TUSD" ).get_id();
   busd_id  = get_asset( "BUSD" ).get_id();
   dlrs_id  = get_asset( DOLLARSTORE_SYMBOL ).get_id();
   cents_id = get_asset( DOLLARSTORE_REWARD_SYMBOL ).get_id();
   faucet_id  = get_account( DOLLARSTORE_TESTING_FAUCET_ACCOUNT ).get_id();
   founder_id = get_account( genesis_state.founder_account ).get_id();

   for( const auto& b : genesis_state.initial_balances )
      if( b.asset_symbol == DOLLARSTORE_REWARD_SYMBOL )
         initial_reward_supply += b.amount;
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   try {
      // If we're unwinding due to an exception, don't do any more checks.
      // This way, boost test's last checkpoint tells us approximately where the error was.
      if( !std::uncaught_exception() )
      {
         verify_ledger_invariants(db);
         const emission_state_object& emission = db.get_emission_state();
         BOOST_CHECK_EQUAL( db.get_reward_asset().dynamic_data(db).current_supply.value,
                            ( initial_reward_supply + emission.total_minted() ).value );
      }
      return;
   } catch (fc::exception& ex) {
      BOOST_FAIL( std::string("fc::exception in ~database_fixture: ") + ex.to_detail_string() );
   } catch (std::exception& e) {
      BOOST_FAIL( std::string("std::exception in ~database_fixture:") + e.what() );
   } catch (...) {
      BOOST_FAIL( "Uncaught exception in ~database_fixture" );
   }
}

void database_fixture::verify_ledger_invariants( const database& db )
{
   const asset_id_type synthetic = db.get_synthetic_asset().get_id();
   const asset_id_type reward = db.get_reward_asset().get_id();

   std::map<asset_id_type,share_type> total_balances;
   for( const account_balance_object& b : db.get_index_type<account_balance_index>().indices() )
   {
      BOOST_CHECK( b.balance >= 0 );
      total_balances[b.asset_type] += b.balance;
   }
   for( const token_allowance_object& a : db.get_index_type<token_allowance_index>().indices() )
      BOOST_CHECK( a.amount >= 0 );

   // open positions hold their remaining synthetic in escrow
   std::map<asset_id_type,share_type> depth;
   for( const queue_position_object& p : db.get_index_type<queue_position_index>().indices() )
   {
      BOOST_CHECK( p.remaining >= 0 );
      BOOST_CHECK( p.remaining <= p.original_amount );
      if( p.is_open() )
      {
         BOOST_CHECK( p.remaining > 0 );
         total_balances[synthetic] += p.remaining;
         depth[p.asset_type] += p.remaining;
      }
      else
         BOOST_CHECK_EQUAL( p.remaining.value, 0 );
   }

   for( const stake_object& s : db.get_index_type<stake_index>().indices() )
   {
      BOOST_CHECK( s.staked >= 0 );
      total_balances[reward] += s.staked;
   }

   for( const reserve_object& r : db.get_index_type<reserve_index>().indices() )
   {
      BOOST_CHECK( r.balance >= 0 );
      const asset_object& reserve_asset = r.asset_type(db);
      total_balances[r.asset_type] += reserve_asset.from_canonical( r.balance ).amount;
      BOOST_CHECK_EQUAL( db.get_queue_depth( r.asset_type ).value, depth[r.asset_type].value );
   }

   for( const asset_object& a : db.get_index_type<asset_index>().indices() )
      BOOST_CHECK_EQUAL( a.dynamic_data(db).current_supply.value, total_balances[a.get_id()].value );

   // every synthetic unit outstanding is backed by one unit in the basket
   BOOST_CHECK_EQUAL( db.get_total_reserves().value,
                      db.get_synthetic_asset().dynamic_data(db).current_supply.value );

   const emission_state_object& emission = db.get_emission_state();
   BOOST_CHECK( emission.maker_minted >= 0 && emission.maker_minted <= emission.maker_cap );
   BOOST_CHECK( emission.taker_minted >= 0 && emission.taker_minted <= emission.taker_cap );
   BOOST_CHECK( emission.founder_vested >= 0 && emission.founder_vested <= emission.founder_cap );
   const share_type founder_target = std::min( emission.founder_cap,
         ( emission.maker_minted + emission.taker_minted )
            / share_type( db.get_chain_parameters().founder_vesting_ratio ) );
   BOOST_CHECK_EQUAL( emission.founder_vested.value, founder_target.value );
}

asset database_fixture::units( asset_id_type asset_id, int64_t whole )const
{
   return asset( whole * asset::scaled_precision( asset_id(db).precision ).value, asset_id );
}

processed_transaction database_fixture::push_op( const operation& op )
{
   trx.operations.clear();
   trx.operations.push_back( op );
   trx.validate();
   processed_transaction ptx = db.push_transaction( trx );
   trx.operations.clear();
   return ptx;
}

processed_transaction database_fixture::push_ops( const vector<operation>& ops )
{
   trx.operations = ops;
   trx.validate();
   processed_transaction ptx = db.push_transaction( trx );
   trx.operations.clear();
   return ptx;
}

const account_object& database_fixture::create_account( const string& name )
{ try {
   account_create_operation op;
   op.name = name;
   processed_transaction ptx = push_op( op );
   return db.get<account_object>( ptx.operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (name) ) }

const account_object& database_fixture::get_account( const string& name )const
{
   const account_object* account = db.find_account_by_name( name );
   FC_ASSERT( account != nullptr, "Unknown account", ("name",name) );
   return *account;
}

const asset_object& database_fixture::get_asset( const string& symbol )const
{
   const asset_object* a = db.find_asset_by_symbol( symbol );
   FC_ASSERT( a != nullptr, "Unknown asset", ("symbol",symbol) );
   return *a;
}

void database_fixture::fund( const account_object& to, const asset& amount )
{ try {
   transfer( faucet_id, to.get_id(), amount );
} FC_CAPTURE_AND_RETHROW( (to.name)(amount) ) }

void database_fixture::transfer( account_id_type from, account_id_type to, const asset& amount )
{
   transfer_operation op;
   op.from = from;
   op.to = to;
   op.amount = amount;
   push_op( op );
}

void database_fixture::approve( account_id_type owner, const asset& amount )
{
   approve_operation op;
   op.owner = owner;
   op.amount = amount;
   push_op( op );
}

share_type database_fixture::deposit( account_id_type who, const asset& amount )
{ try {
   approve_operation aop;
   aop.owner = who;
   aop.amount = amount;
   deposit_operation dop;
   dop.account = who;
   dop.amount = amount;
   processed_transaction ptx = push_ops( { aop, dop } );
   return ptx.operation_results[1].get<asset>().amount;
} FC_CAPTURE_AND_RETHROW( (who)(amount) ) }

asset database_fixture::withdraw( account_id_type who, const asset& amount )
{ try {
   withdraw_operation op;
   op.account = who;
   op.amount = amount;
   return push_op( op ).operation_results[0].get<asset>();
} FC_CAPTURE_AND_RETHROW( (who)(amount) ) }

swap_result database_fixture::swap( account_id_type who, const asset& amount, asset_id_type to,
                                    bool queue_if_unavailable )
{ try {
   approve_operation aop;
   aop.owner = who;
   aop.amount = amount;
   swap_operation sop;
   sop.account = who;
   sop.amount = amount;
   sop.to_asset = to;
   sop.queue_if_unavailable = queue_if_unavailable;
   processed_transaction ptx = push_ops( { aop, sop } );
   return ptx.operation_results[1].get<swap_result>();
} FC_CAPTURE_AND_RETHROW( (who)(amount)(to)(queue_if_unavailable) ) }

swap_result database_fixture::swap_from_synthetic( account_id_type who, share_type amount, asset_id_type to,
                                                   bool queue_if_unavailable )
{ try {
   swap_from_synthetic_operation op;
   op.account = who;
   op.amount = amount;
   op.to_asset = to;
   op.queue_if_unavailable = queue_if_unavailable;
   return push_op( op ).operation_results[0].get<swap_result>();
} FC_CAPTURE_AND_RETHROW( (who)(amount)(to)(queue_if_unavailable) ) }

queue_position_id_type database_fixture::join_queue( account_id_type who, asset_id_type asset_id, share_type amount )
{ try {
   queue_join_operation op;
   op.account = who;
   op.asset_type = asset_id;
   op.amount = amount;
   return queue_position_id_type( push_op( op ).operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (who)(asset_id)(amount) ) }

share_type database_fixture::cancel_queue( account_id_type who, queue_position_id_type id )
{ try {
   queue_cancel_operation op;
   op.account = who;
   op.position = id;
   return push_op( op ).operation_results[0].get<asset>().amount;
} FC_CAPTURE_AND_RETHROW( (who)(id) ) }

void database_fixture::stake( account_id_type who, share_type amount )
{ try {
   approve_operation aop;
   aop.owner = who;
   aop.amount = asset( amount, cents_id );
   stake_operation sop;
   sop.account = who;
   sop.amount = amount;
   push_ops( { aop, sop } );
} FC_CAPTURE_AND_RETHROW( (who)(amount) ) }

void database_fixture::unstake( account_id_type who )
{
   unstake_operation op;
   op.account = who;
   push_op( op );
}

void database_fixture::complete_unstake( account_id_type who )
{
   unstake_complete_operation op;
   op.account = who;
   push_op( op );
}

void database_fixture::cancel_unstake( account_id_type who )
{
   unstake_cancel_operation op;
   op.account = who;
   push_op( op );
}

void database_fixture::advance_time( uint32_t seconds )
{
   db.advance_time( db.head_time() + seconds );
}

int64_t database_fixture::get_balance( account_id_type account, asset_id_type asset_id )const
{
   return db.get_balance( account, asset_id ).amount.value;
}

int64_t database_fixture::get_reserve( asset_id_type asset_id )const
{
   return db.get_reserve( asset_id ).balance.value;
}

int64_t database_fixture::get_supply( asset_id_type asset_id )const
{
   return asset_id(db).dynamic_data(db).current_supply.value;
}

const queue_position_object& database_fixture::get_position( queue_position_id_type id )const
{
   return db.get( id );
}

vector<operation> database_fixture::applied_events()const
{
   vector<operation> result;
   for( const auto& oh : db.get_applied_operations() )
      if( oh.valid() && is_virtual_operation( oh->op ) )
         result.push_back( oh->op );
   return result;
}

genesis_state_type small_cap_fixture::make_small_cap_genesis()
{
   genesis_state_type genesis = database_fixture::make_genesis();
   genesis.initial_parameters.maker_cap = 100 * DOLLARSTORE_REWARD_PRECISION;
   genesis.initial_parameters.taker_cap = 50 * DOLLARSTORE_REWARD_PRECISION;
   genesis.initial_parameters.founder_cap = 30 * DOLLARSTORE_REWARD_PRECISION;
   return genesis;
}

small_cap_fixture::small_cap_fixture()
   : database_fixture( make_small_cap_genesis() )
{
}

genesis_state_type coarse_reserve_fixture::make_coarse_reserve_genesis()
{
   genesis_state_type genesis = database_fixture::make_genesis();

   genesis_state_type::initial_asset_type a;
   a.symbol = "GUSD";
   a.precision = 2;
   a.kind = asset_kind::reserve;
   a.supported = true;
   genesis.initial_assets.push_back( a );

   genesis_state_type::initial_balance_type b;
   b.owner = DOLLARSTORE_TESTING_FAUCET_ACCOUNT;
   b.asset_symbol = a.symbol;
   b.amount = faucet_whole_units * asset::scaled_precision( a.precision ).value;
   genesis.initial_balances.push_back( b );
   return genesis;
}

coarse_reserve_fixture::coarse_reserve_fixture()
   : database_fixture( make_coarse_reserve_genesis() ), gusd_id( get_asset( "GUSD" ).get_id() )
{
}

} } // dollarstore::chain
