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
#include <dollarstore/chain/queue_position_object.hpp>

#include "../common/database_fixture.hpp"

using namespace dollarstore::chain;

namespace {

/// Gives accounts synthetic by depositing USDT, leaving the USDC reserve empty for the queue
struct queue_fixture : database_fixture
{
   void mint_synthetic( const account_object& account, int64_t amount )
   {
      fund( account, usdt(amount) );
      deposit( account.get_id(), usdt(amount) );
   }
};

}

BOOST_FIXTURE_TEST_SUITE( queue_tests, queue_fixture )

BOOST_AUTO_TEST_CASE( join_escrows_synthetic )
{ try {
   ACTOR(alice);
   mint_synthetic( alice, 500 );

   const queue_position_id_type pos = join_queue( alice_id, usdc_id, dollars(200) );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(300).value );
   // escrowed synthetic is still outstanding
   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), dollars(500).value );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, dollars(200).value );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdt_id ).value, 0 );

   const queue_position_object& p = get_position( pos );
   BOOST_CHECK( p.owner == alice_id );
   BOOST_CHECK( p.asset_type == usdc_id );
   BOOST_CHECK_EQUAL( p.original_amount.value, dollars(200).value );
   BOOST_CHECK_EQUAL( p.remaining.value, dollars(200).value );
   BOOST_CHECK( p.created == db.head_time() );
   BOOST_CHECK( p.status == queue_position_status::active );

   auto joined = applied_events_of_type<queue_joined_operation>();
   BOOST_REQUIRE_EQUAL( joined.size(), 1u );
   BOOST_CHECK( joined[0].account == alice_id );
   BOOST_CHECK( joined[0].position == pos );
   BOOST_CHECK( joined[0].asset_type == usdc_id );
   BOOST_CHECK_EQUAL( joined[0].amount.value, dollars(200).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( join_rejections )
{ try {
   ACTORS( (alice)(bob) );
   mint_synthetic( alice, 100 );

   DOLLARSTORE_REQUIRE_THROW( join_queue( alice_id, usdc_id, 0 ), zero_amount );
   DOLLARSTORE_REQUIRE_THROW( join_queue( alice_id, usdc_id, dollars(101) ), insufficient_balance );
   DOLLARSTORE_REQUIRE_THROW( join_queue( bob_id, usdc_id, dollars(1) ), insufficient_balance );
   DOLLARSTORE_REQUIRE_THROW( join_queue( alice_id, dlrs_id, dollars(1) ), unsupported_asset );
   DOLLARSTORE_REQUIRE_THROW( join_queue( alice_id, cents_id, dollars(1) ), unsupported_asset );

   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(100).value );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( delisted_asset_cannot_be_queued )
{ try {
   ACTOR(alice);
   mint_synthetic( alice, 100 );
   fund( alice, usdc(10) );

   // BUSD takes no deposits, so nothing could ever fill a BUSD position
   DOLLARSTORE_REQUIRE_THROW( join_queue( alice_id, busd_id, dollars(1) ), unsupported_asset );
   DOLLARSTORE_REQUIRE_THROW( swap_from_synthetic( alice_id, dollars(1), busd_id, true ), unsupported_asset );
   DOLLARSTORE_REQUIRE_THROW( swap( alice_id, usdc(1), busd_id, true ), unsupported_asset );

   // without queueing it is only a matter of an empty reserve
   DOLLARSTORE_REQUIRE_THROW( swap_from_synthetic( alice_id, dollars(1), busd_id, false ), insufficient_reserves );

   BOOST_CHECK_EQUAL( db.get_queue_depth( busd_id ).value, 0 );
   BOOST_CHECK( db.get_user_queue_positions( alice_id ).empty() );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(100).value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(10).amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( deposit_fills_oldest_first )
{ try {
   ACTORS( (alice)(bob)(carol) );
   mint_synthetic( alice, 200 );
   mint_synthetic( bob, 300 );
   fund( carol, usdc(250) );

   const queue_position_id_type first = join_queue( alice_id, usdc_id, dollars(200) );
   const queue_position_id_type second = join_queue( bob_id, usdc_id, dollars(300) );

   deposit( carol_id, usdc(250) );

   const queue_position_object& p1 = get_position( first );
   const queue_position_object& p2 = get_position( second );
   BOOST_CHECK( p1.status == queue_position_status::filled );
   BOOST_CHECK_EQUAL( p1.remaining.value, 0 );
   BOOST_CHECK( p2.status == queue_position_status::partially_filled );
   BOOST_CHECK_EQUAL( p2.remaining.value, dollars(250).value );

   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(200).amount.value );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usdc_id ), usdc(50).amount.value );
   BOOST_CHECK_EQUAL( get_balance( carol_id, dlrs_id ), dollars(250).value );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), 0 );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, dollars(250).value );
   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), dollars(500).value );

   // the partially filled position keeps its place at the head of the line
   queue_position_info info = db.get_queue_position_info( second );
   BOOST_CHECK_EQUAL( info.position_number, 1u );
   BOOST_CHECK_EQUAL( info.amount_ahead.value, 0 );

   vector<operation> events = applied_events();
   BOOST_REQUIRE_EQUAL( events.size(), 5u );
   BOOST_REQUIRE( events[0].is_type<deposited_operation>() );
   BOOST_REQUIRE( events[1].is_type<queue_filled_operation>() );
   BOOST_REQUIRE( events[2].is_type<queue_filled_operation>() );
   BOOST_REQUIRE( events[3].is_type<reward_minted_operation>() );
   BOOST_REQUIRE( events[4].is_type<reward_minted_operation>() );

   const auto& fill1 = events[1].get<queue_filled_operation>();
   BOOST_CHECK( fill1.position == first );
   BOOST_CHECK( fill1.owner == alice_id );
   BOOST_CHECK( fill1.amount == usdc(200) );
   BOOST_CHECK_EQUAL( fill1.remaining.value, 0 );
   const auto& fill2 = events[2].get<queue_filled_operation>();
   BOOST_CHECK( fill2.position == second );
   BOOST_CHECK( fill2.amount == usdc(50) );
   BOOST_CHECK_EQUAL( fill2.remaining.value, dollars(250).value );

   // nothing waited, so only the depositor is rewarded for clearing the queue
   const auto& taker = events[3].get<reward_minted_operation>();
   BOOST_CHECK( taker.category == reward_category::taker );
   BOOST_CHECK( taker.account == carol_id );
   const auto& founder = events[4].get<reward_minted_operation>();
   BOOST_CHECK( founder.category == reward_category::founder );
   BOOST_CHECK( founder.account == founder_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( deposit_of_other_asset_leaves_queue )
{ try {
   ACTORS( (alice)(bob) );
   mint_synthetic( alice, 100 );
   const queue_position_id_type pos = join_queue( alice_id, usdc_id, dollars(100) );

   fund( bob, usdt(500) );
   deposit( bob_id, usdt(500) );
   BOOST_CHECK( get_position( pos ).status == queue_position_status::active );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, dollars(100).value );
   BOOST_CHECK( applied_events_of_type<queue_filled_operation>().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( large_deposit_drains_many )
{ try {
   ACTORS( (alice)(whale) );
   mint_synthetic( alice, 200 );

   vector<queue_position_id_type> positions;
   for( int i = 0; i < 20; ++i )
      positions.push_back( join_queue( alice_id, usdc_id, dollars(10) ) );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, dollars(200).value );

   fund( whale, usdc(155) );
   deposit( whale_id, usdc(155) );

   for( int i = 0; i < 15; ++i )
      BOOST_CHECK( get_position( positions[i] ).status == queue_position_status::filled );
   BOOST_CHECK( get_position( positions[15] ).status == queue_position_status::partially_filled );
   BOOST_CHECK_EQUAL( get_position( positions[15] ).remaining.value, dollars(5).value );
   for( int i = 16; i < 20; ++i )
      BOOST_CHECK( get_position( positions[i] ).status == queue_position_status::active );

   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, dollars(45).value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(155).amount.value );
   BOOST_CHECK_EQUAL( applied_events_of_type<queue_filled_operation>().size(), 16u );
   BOOST_CHECK_EQUAL( db.get_user_queue_positions( alice_id ).size(), 5u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_refunds_remaining )
{ try {
   ACTORS( (alice)(bob)(carol)(dave) );
   mint_synthetic( alice, 100 );
   mint_synthetic( bob, 200 );
   mint_synthetic( carol, 300 );

   const queue_position_id_type a = join_queue( alice_id, usdc_id, dollars(100) );
   fund( dave, usdc(50) );
   deposit( dave_id, usdc(50) );
   BOOST_CHECK_EQUAL( get_position( a ).remaining.value, dollars(50).value );

   const queue_position_id_type b = join_queue( bob_id, usdc_id, dollars(200) );
   const queue_position_id_type c = join_queue( carol_id, usdc_id, dollars(300) );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, dollars(550).value );
   BOOST_CHECK_EQUAL( db.get_queue_position_info( c ).position_number, 3u );

   const share_type refund = cancel_queue( alice_id, a );
   BOOST_CHECK_EQUAL( refund.value, dollars(50).value );
   BOOST_CHECK( get_position( a ).status == queue_position_status::cancelled );
   BOOST_CHECK_EQUAL( get_position( a ).remaining.value, 0 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(50).value );
   BOOST_CHECK_EQUAL( db.get_queue_depth( usdc_id ).value, dollars(500).value );

   auto cancelled = applied_events_of_type<queue_cancelled_operation>();
   BOOST_REQUIRE_EQUAL( cancelled.size(), 1u );
   BOOST_CHECK( cancelled[0].position == a );
   BOOST_CHECK( cancelled[0].owner == alice_id );
   BOOST_CHECK_EQUAL( cancelled[0].refund.value, dollars(50).value );

   // the others move up without changing order
   queue_position_info bi = db.get_queue_position_info( b );
   BOOST_CHECK_EQUAL( bi.position_number, 1u );
   BOOST_CHECK_EQUAL( bi.amount_ahead.value, 0 );
   queue_position_info ci = db.get_queue_position_info( c );
   BOOST_CHECK_EQUAL( ci.position_number, 2u );
   BOOST_CHECK_EQUAL( ci.amount_ahead.value, dollars(200).value );

   fund( dave, usdc(250) );
   deposit( dave_id, usdc(250) );
   BOOST_CHECK( get_position( b ).status == queue_position_status::filled );
   BOOST_CHECK_EQUAL( get_position( c ).remaining.value, dollars(250).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_rejections )
{ try {
   ACTORS( (alice)(bob)(carol) );
   mint_synthetic( alice, 100 );
   mint_synthetic( bob, 100 );

   const queue_position_id_type a = join_queue( alice_id, usdc_id, dollars(60) );
   const queue_position_id_type b = join_queue( bob_id, usdc_id, dollars(40) );

   DOLLARSTORE_REQUIRE_THROW( cancel_queue( bob_id, a ), not_owner );
   DOLLARSTORE_REQUIRE_THROW( cancel_queue( alice_id, queue_position_id_type(999) ), position_not_found );

   cancel_queue( alice_id, a );
   DOLLARSTORE_REQUIRE_THROW( cancel_queue( alice_id, a ), position_not_found );

   fund( carol, usdc(40) );
   deposit( carol_id, usdc(40) );
   BOOST_CHECK( get_position( b ).status == queue_position_status::filled );
   DOLLARSTORE_REQUIRE_THROW( cancel_queue( bob_id, b ), position_not_found );

   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(100).value );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usdc_id ), usdc(40).amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( position_info_and_terminal_positions )
{ try {
   ACTORS( (alice)(bob)(carol) );
   mint_synthetic( alice, 100 );
   mint_synthetic( bob, 100 );

   const queue_position_id_type a1 = join_queue( alice_id, usdc_id, dollars(30) );
   const queue_position_id_type b1 = join_queue( bob_id, usdc_id, dollars(20) );
   const queue_position_id_type a2 = join_queue( alice_id, usdc_id, dollars(10) );
   const queue_position_id_type t1 = join_queue( bob_id, usdt_id, dollars(5) );

   queue_position_info info = db.get_queue_position_info( a2 );
   BOOST_CHECK_EQUAL( info.position_number, 3u );
   BOOST_CHECK_EQUAL( info.amount_ahead.value, dollars(50).value );
   // lines are kept per asset
   info = db.get_queue_position_info( t1 );
   BOOST_CHECK_EQUAL( info.position_number, 1u );
   BOOST_CHECK_EQUAL( info.amount_ahead.value, 0 );

   vector<queue_position_id_type> mine = db.get_user_queue_positions( alice_id );
   BOOST_REQUIRE_EQUAL( mine.size(), 2u );
   BOOST_CHECK( mine[0] == a1 );
   BOOST_CHECK( mine[1] == a2 );

   fund( carol, usdc(30) );
   deposit( carol_id, usdc(30) );

   // filled positions stay readable but have no place in line
   DOLLARSTORE_REQUIRE_THROW( db.get_queue_position_info( a1 ), position_not_found );
   optional<queue_position_object> filled = api.get_queue_position( a1 );
   BOOST_REQUIRE( filled.valid() );
   BOOST_CHECK( filled->status == queue_position_status::filled );
   BOOST_CHECK_EQUAL( filled->original_amount.value, dollars(30).value );
   BOOST_CHECK( !api.get_queue_position( queue_position_id_type(12345) ).valid() );

   mine = db.get_user_queue_positions( alice_id );
   BOOST_REQUIRE_EQUAL( mine.size(), 1u );
   BOOST_CHECK( mine[0] == a2 );

   info = api.get_queue_position_info( b1 );
   BOOST_CHECK_EQUAL( info.position_number, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fill_score_does_not_reorder )
{ try {
   ACTORS( (alice)(bob)(carol) );
   mint_synthetic( alice, 100 );
   mint_synthetic( bob, 100 );
   fund( bob, asset( cents(1000), cents_id ) );

   stake( bob_id, cents(1000) );
   const queue_position_id_type a = join_queue( alice_id, usdc_id, dollars(100) );
   advance_time( DOLLARSTORE_DEFAULT_FULL_POWER_DURATION );

   const queue_position_id_type b = join_queue( bob_id, usdc_id, dollars(100) );
   advance_time( 10 );

   // (1 + 1000 power / sqrt(100 dollars)) * 10 seconds
   BOOST_CHECK_CLOSE( db.get_fill_score( b ), 1010.0, 0.0001 );
   BOOST_CHECK_CLOSE( api.get_fill_score( a ), double( DOLLARSTORE_DEFAULT_FULL_POWER_DURATION + 10 ), 0.0001 );
   BOOST_CHECK( db.get_fill_score( b ) > 0 );

   // bob's stake does not let him jump the line
   fund( carol, usdc(100) );
   deposit( carol_id, usdc(100) );
   BOOST_CHECK( get_position( a ).status == queue_position_status::filled );
   BOOST_CHECK( get_position( b ).status == queue_position_status::active );
   DOLLARSTORE_REQUIRE_THROW( db.get_fill_score( a ), position_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
