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

#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/exceptions.hpp>
#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/operation_history_object.hpp>

#include "../common/database_fixture.hpp"

using namespace dollarstore::chain;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_test )
{
   try {
      const auto& idx = db.get_index_type<account_balance_index>();
      const object_id_type next = idx.get_next_id();

      auto ses = db._undo_db.start_undo_session();
      const auto& bal_obj1 = db.create<account_balance_object>( [&]( account_balance_object& obj ){
         obj.owner = account_id_type(1000);
         obj.asset_type = usdc_id;
      });
      auto id1 = bal_obj1.id;
      BOOST_CHECK( id1 == next );
      // abandon changes
      ses.undo();
      BOOST_CHECK( db.find_object( id1 ) == nullptr );

      // start a new session
      ses = db._undo_db.start_undo_session();
      const auto& bal_obj2 = db.create<account_balance_object>( [&]( account_balance_object& obj ){
         obj.owner = account_id_type(1000);
         obj.asset_type = usdc_id;
      });
      auto id2 = bal_obj2.id;
      BOOST_CHECK( id1 == id2 );
   } catch ( const fc::exception& e )
   {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( undo_modify_and_remove )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );
   const account_balance_object* bal = nullptr;
   for( const account_balance_object& b : db.get_index_type<account_balance_index>().indices() )
      if( b.owner == alice_id && b.asset_type == usdc_id )
         bal = &b;
   BOOST_REQUIRE( bal != nullptr );
   const object_id_type bal_id = bal->id;

   {
      auto ses = db._undo_db.start_undo_session();
      db.modify( *bal, []( account_balance_object& b ) {
         b.balance = 1;
      });
      BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), 1 );
      // the session is undone when it goes out of scope
   }
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(100).amount.value );

   {
      auto ses = db._undo_db.start_undo_session();
      db.remove( db.get<account_balance_object>( bal_id ) );
      BOOST_CHECK( db.find_object( bal_id ) == nullptr );
      BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), 0 );
   }
   BOOST_CHECK( db.find_object( bal_id ) != nullptr );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(100).amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( merge_test )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );

   auto outer = db._undo_db.start_undo_session();
   {
      auto inner = db._undo_db.start_undo_session();
      db.adjust_balance( alice_id, -usdc(40) );
      inner.merge();
   }
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(60).amount.value );

   // the merged changes belong to the outer session now
   outer.undo();
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(100).amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( nested_commit_folds_into_outer )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );
   BOOST_CHECK_EQUAL( db._undo_db.active_sessions(), 0u );

   auto outer = db._undo_db.start_undo_session();
   db.adjust_balance( alice_id, -usdc(10) );
   {
      auto inner = db._undo_db.start_undo_session();
      BOOST_CHECK_EQUAL( db._undo_db.active_sessions(), 2u );
      db.adjust_balance( alice_id, -usdc(20) );
      db.adjust_balance( alice_id, -usdc(30) );
      inner.commit();
   }
   BOOST_CHECK_EQUAL( db._undo_db.active_sessions(), 1u );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(40).amount.value );

   // a nested commit only lasts as long as the session around it
   outer.undo();
   BOOST_CHECK_EQUAL( db._undo_db.active_sessions(), 0u );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(100).amount.value );

   // the outermost commit is final
   auto last = db._undo_db.start_undo_session();
   db.adjust_balance( alice_id, -usdc(5) );
   db.adjust_balance( faucet_id, usdc(5) );
   last.commit();
   last.undo();
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(95).amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_created_modified_then_removed )
{ try {
   const auto& idx = db.get_index_type<account_balance_index>();
   const object_id_type next = idx.get_next_id();
   BOOST_CHECK( next.type() == account_balance_object::type_id );

   {
      auto ses = db._undo_db.start_undo_session();
      const auto& created = db.create<account_balance_object>( [&]( account_balance_object& obj ){
         obj.owner = account_id_type(1000);
         obj.asset_type = usdc_id;
      });
      BOOST_CHECK( created.id == next );
      db.modify( created, []( account_balance_object& obj ){ obj.balance = 7; } );
      db.modify( created, []( account_balance_object& obj ){ obj.balance = 9; } );
      db.remove( created );
      BOOST_CHECK( db.find_object( next ) == nullptr );
      BOOST_CHECK( idx.get_next_id() == next.successor() );
   }
   BOOST_CHECK( db.find_object( next ) == nullptr );
   BOOST_CHECK( idx.get_next_id() == next );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_transaction_is_atomic )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );
   const uint64_t trx_count = db.get_dynamic_global_properties().transaction_count;

   approve_operation aop;
   aop.owner = alice_id;
   aop.amount = usdc(100);
   deposit_operation dop;
   dop.account = alice_id;
   dop.amount = usdc(100);
   withdraw_operation wop;
   wop.account = alice_id;
   wop.amount = usdc(101);

   // the first two operations succeed on their own
   DOLLARSTORE_REQUIRE_THROW( push_ops( { aop, dop, wop } ), insufficient_reserves );

   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(100).amount.value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), 0 );
   BOOST_CHECK_EQUAL( db.get_allowance( alice_id, usdc_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), 0 );
   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), 0 );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().transaction_count, trx_count );
   BOOST_CHECK( db.get_applied_operations().empty() );

   wop.amount = usdc(60);
   processed_transaction ptx = push_ops( { aop, dop, wop } );
   BOOST_REQUIRE_EQUAL( ptx.operation_results.size(), 3u );
   BOOST_CHECK( ptx.operation_results[2].get<asset>() == usdc(60) );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(40).value );
   BOOST_CHECK_EQUAL( db.get_dynamic_global_properties().transaction_count, trx_count + 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( validate_transaction_leaves_no_trace )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );

   approve_operation aop;
   aop.owner = alice_id;
   aop.amount = usdc(100);
   deposit_operation dop;
   dop.account = alice_id;
   dop.amount = usdc(100);
   trx.operations = { aop, dop };

   processed_transaction ptx = db.validate_transaction( trx );
   BOOST_REQUIRE_EQUAL( ptx.operation_results.size(), 2u );
   BOOST_CHECK_EQUAL( ptx.operation_results[1].get<asset>().amount.value, dollars(100).value );

   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(100).amount.value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), 0 );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), 0 );

   dop.amount = usdc(101);
   trx.operations = { aop, dop };
   DOLLARSTORE_REQUIRE_THROW( db.validate_transaction( trx ), insufficient_allowance );
   trx.operations.clear();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transaction_validation )
{ try {
   ACTOR(alice);

   // empty transactions are refused
   trx.operations.clear();
   DOLLARSTORE_REQUIRE_THROW( db.push_transaction( trx ), fc::exception );

   // events are recorded by the ledger, never pushed
   trx.operations.push_back( deposited_operation( alice_id, usdc(1), dollars(1) ) );
   DOLLARSTORE_REQUIRE_THROW( db.push_transaction( trx ), fc::exception );
   trx.operations.clear();

   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), 0 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( applied_operations_record_order )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );
   deposit( alice_id, usdc(100) );

   const auto& applied = db.get_applied_operations();
   BOOST_REQUIRE_EQUAL( applied.size(), 3u );
   BOOST_REQUIRE( applied[0].valid() && applied[1].valid() && applied[2].valid() );
   BOOST_CHECK( applied[0]->op.is_type<approve_operation>() );
   BOOST_CHECK( applied[1]->op.is_type<deposit_operation>() );
   BOOST_CHECK( applied[2]->op.is_type<deposited_operation>() );

   BOOST_CHECK_EQUAL( applied[0]->op_in_trx, 0 );
   BOOST_CHECK_EQUAL( applied[1]->op_in_trx, 1 );
   BOOST_CHECK_EQUAL( applied[2]->op_in_trx, 1 );
   BOOST_CHECK_EQUAL( applied[1]->virtual_op, 0 );
   BOOST_CHECK_EQUAL( applied[2]->virtual_op, 1 );
   BOOST_CHECK_EQUAL( applied[2]->trx_num, db.get_dynamic_global_properties().transaction_count );
   BOOST_CHECK( applied[2]->time == db.head_time() );
   BOOST_CHECK( applied[1]->result.get<asset>() == asset( dollars(100), dlrs_id ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( applied_transaction_signal )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );

   uint32_t calls = 0;
   vector<operation> seen;
   int64_t supply_seen = -1;
   auto conn = db.applied_transaction.connect(
         [&]( const processed_transaction& ptx, const vector<operation_history_object>& ops ) {
      ++calls;
      for( const auto& oh : ops )
         seen.push_back( oh.op );
      // observers run after the writer lock is released and may read the ledger
      supply_seen = api.get_synthetic_supply().value;
   });

   deposit( alice_id, usdc(100) );
   BOOST_CHECK_EQUAL( calls, 1u );
   BOOST_REQUIRE_EQUAL( seen.size(), 3u );
   BOOST_CHECK( seen[2].is_type<deposited_operation>() );
   BOOST_CHECK_EQUAL( supply_seen, dollars(100).value );

   // rejected transactions publish nothing
   DOLLARSTORE_REQUIRE_THROW( withdraw( alice_id, usdc(200) ), insufficient_reserves );
   BOOST_CHECK_EQUAL( calls, 1u );

   withdraw( alice_id, usdc(10) );
   BOOST_CHECK_EQUAL( calls, 2u );
   BOOST_CHECK_EQUAL( supply_seen, dollars(90).value );

   conn.disconnect();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( time_only_moves_forward )
{ try {
   const time_point_sec start = db.head_time();
   BOOST_CHECK( start == time_point_sec( DOLLARSTORE_TESTING_GENESIS_TIMESTAMP ) );

   advance_time( 60 );
   BOOST_CHECK( db.head_time() == start + 60 );
   DOLLARSTORE_REQUIRE_THROW( db.advance_time( start ), fc::exception );

   // a rejected transaction does not move time back
   ACTOR(alice);
   DOLLARSTORE_REQUIRE_THROW( withdraw( alice_id, usdc(1) ), insufficient_reserves );
   BOOST_CHECK( db.head_time() == start + 60 );

   db.advance_time( db.head_time() );
   BOOST_CHECK( db.head_time() == start + 60 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_state_test )
{ try {
   BOOST_CHECK( db.get_global_properties().synthetic_asset == dlrs_id );
   BOOST_CHECK( db.get_global_properties().reward_asset == cents_id );
   BOOST_CHECK( db.get_global_properties().founder_account == founder_id );
   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), 0 );
   BOOST_CHECK_EQUAL( get_supply( cents_id ), initial_reward_supply.value );
   BOOST_CHECK_EQUAL( db.get_total_reserves().value, 0 );

   const emission_state_object& e = db.get_emission_state();
   BOOST_CHECK_EQUAL( e.maker_cap.value, DOLLARSTORE_DEFAULT_MAKER_CAP );
   BOOST_CHECK_EQUAL( e.taker_cap.value, DOLLARSTORE_DEFAULT_TAKER_CAP );
   BOOST_CHECK_EQUAL( e.founder_cap.value, DOLLARSTORE_DEFAULT_FOUNDER_CAP );
   BOOST_CHECK_EQUAL( e.total_minted().value, 0 );

   // genesis can only be applied once
   DOLLARSTORE_REQUIRE_THROW( db.init_genesis( genesis_state ), fc::exception );

   genesis_state_type bad = make_genesis();
   bad.initial_assets.pop_back();
   chain::database other;
   DOLLARSTORE_REQUIRE_THROW( other.init_genesis( bad ), fc::exception );

   // the default basket comes up with USDC and USDT
   chain::database fresh;
   fresh.init_genesis( create_default_genesis() );
   BOOST_CHECK( fresh.find_asset_by_symbol( "USDC" ) != nullptr );
   BOOST_CHECK( fresh.find_asset_by_symbol( "USDT" ) != nullptr );
   BOOST_CHECK( fresh.get_synthetic_asset().symbol == DOLLARSTORE_SYMBOL );
   BOOST_CHECK( fresh.get_reward_asset().symbol == DOLLARSTORE_REWARD_SYMBOL );
   BOOST_CHECK( fresh.find_account_by_name( DOLLARSTORE_DEFAULT_FOUNDER_ACCOUNT_NAME ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( account_names )
{ try {
   ACTOR(alice);
   DOLLARSTORE_REQUIRE_THROW( create_account( "alice" ), fc::exception );
   DOLLARSTORE_REQUIRE_THROW( create_account( "Alice" ), fc::exception );
   DOLLARSTORE_REQUIRE_THROW( create_account( "ab" ), fc::exception );
   DOLLARSTORE_REQUIRE_THROW( create_account( "bob-" ), fc::exception );
   create_account( "bob-2" );
   BOOST_CHECK( db.find_account_by_name( "bob-2" ) != nullptr );
   BOOST_CHECK( db.find_account_by_name( "carol" ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
