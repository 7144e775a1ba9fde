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
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>
#include <dollarstore/chain/queue_position_object.hpp>

#include "../common/database_fixture.hpp"

using namespace dollarstore::chain;

BOOST_FIXTURE_TEST_SUITE( reserve_tests, database_fixture )

BOOST_AUTO_TEST_CASE( deposit_mints_one_to_one )
{ try {
   ACTOR(alice);
   fund( alice, usdc(1000) );

   const share_type minted = deposit( alice_id, usdc(1000) );
   BOOST_CHECK_EQUAL( minted.value, dollars(1000).value );

   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), 0 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(1000).value );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), dollars(1000).value );
   BOOST_CHECK_EQUAL( get_reserve( usdt_id ), 0 );
   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), dollars(1000).value );
   BOOST_CHECK_EQUAL( db.get_total_reserves().value, dollars(1000).value );

   auto deposited = applied_events_of_type<deposited_operation>();
   BOOST_REQUIRE_EQUAL( deposited.size(), 1u );
   BOOST_CHECK( deposited[0].account == alice_id );
   BOOST_CHECK( deposited[0].amount == usdc(1000) );
   BOOST_CHECK_EQUAL( deposited[0].minted.value, dollars(1000).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( deposit_consumes_allowance )
{ try {
   ACTOR(alice);
   fund( alice, usdc(500) );

   approve( alice_id, usdc(300) );
   BOOST_CHECK_EQUAL( db.get_allowance( alice_id, usdc_id ).value, usdc(300).amount.value );

   deposit_operation op;
   op.account = alice_id;
   op.amount = usdc(100);
   push_op( op );
   BOOST_CHECK_EQUAL( db.get_allowance( alice_id, usdc_id ).value, usdc(200).amount.value );

   // a new approval replaces the remaining one
   approve( alice_id, usdc(50) );
   BOOST_CHECK_EQUAL( db.get_allowance( alice_id, usdc_id ).value, usdc(50).amount.value );

   op.amount = usdc(60);
   DOLLARSTORE_REQUIRE_THROW( push_op( op ), insufficient_allowance );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(400).amount.value );
   BOOST_CHECK_EQUAL( db.get_allowance( alice_id, usdc_id ).value, usdc(50).amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( deposit_rejections )
{ try {
   ACTOR(alice);
   fund( alice, usdc(100) );
   fund( alice, units( busd_id, 100 ) );

   // more than the wallet holds, with enough allowance
   DOLLARSTORE_REQUIRE_THROW( deposit( alice_id, usdc(101) ), insufficient_balance );

   // delisted reserve assets and non-reserve assets are refused
   DOLLARSTORE_REQUIRE_THROW( deposit( alice_id, units( busd_id, 10 ) ), unsupported_asset );
   fund( alice, asset( cents(10), cents_id ) );
   DOLLARSTORE_REQUIRE_THROW( deposit( alice_id, asset( cents(10), cents_id ) ), unsupported_asset );

   DOLLARSTORE_REQUIRE_THROW( deposit( alice_id, usdc(0) ), zero_amount );

   // nothing was applied by the failed transactions
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(100).amount.value );
   BOOST_CHECK_EQUAL( db.get_allowance( alice_id, usdc_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( withdraw_burns_and_pays )
{ try {
   ACTOR(alice);
   fund( alice, usdc(1000) );
   deposit( alice_id, usdc(1000) );

   const asset received = withdraw( alice_id, usdc(400) );
   BOOST_CHECK( received == usdc(400) );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(400).amount.value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(600).value );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), dollars(600).value );
   BOOST_CHECK_EQUAL( get_supply( dlrs_id ), dollars(600).value );

   auto withdrawn = applied_events_of_type<withdrawn_operation>();
   BOOST_REQUIRE_EQUAL( withdrawn.size(), 1u );
   BOOST_CHECK( withdrawn[0].account == alice_id );
   BOOST_CHECK( withdrawn[0].amount == usdc(400) );
   BOOST_CHECK_EQUAL( withdrawn[0].burned.value, dollars(400).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( withdraw_any_reserve_asset )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, usdc(1000) );
   fund( bob, usdt(500) );
   deposit( alice_id, usdc(1000) );
   deposit( bob_id, usdt(500) );

   // synthetic is fungible across the basket
   withdraw( alice_id, usdt(300) );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdt_id ), usdt(300).amount.value );
   BOOST_CHECK_EQUAL( get_reserve( usdt_id ), dollars(200).value );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), dollars(1000).value );

   auto summary = api.get_reserves();
   BOOST_CHECK_EQUAL( summary.total.value, dollars(1200).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( withdraw_rejections )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, usdc(100) );
   deposit( alice_id, usdc(100) );

   // never queued: the reserve must cover the whole amount
   DOLLARSTORE_REQUIRE_THROW( withdraw( alice_id, usdt(50) ), insufficient_reserves );
   DOLLARSTORE_REQUIRE_THROW( withdraw( alice_id, usdc(101) ), insufficient_reserves );

   // bob holds no synthetic
   DOLLARSTORE_REQUIRE_THROW( withdraw( bob_id, usdc(10) ), insufficient_balance );

   DOLLARSTORE_REQUIRE_THROW( withdraw( alice_id, asset( dollars(10), dlrs_id ) ), unsupported_asset );
   DOLLARSTORE_REQUIRE_THROW( withdraw( alice_id, usdc(0) ), zero_amount );

   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(100).value );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), dollars(100).value );
   BOOST_CHECK( db.get_user_queue_positions( alice_id ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( precision_normalization )
{ try {
   ACTOR(alice);
   fund( alice, tusd(100) );

   // 8 decimal places in, 6 decimal places of synthetic out
   const share_type minted = deposit( alice_id, tusd(100) );
   BOOST_CHECK_EQUAL( minted.value, dollars(100).value );
   BOOST_CHECK_EQUAL( get_reserve( tusd_id ), dollars(100).value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, tusd_id ), 0 );

   const asset received = withdraw( alice_id, tusd(40) );
   BOOST_CHECK_EQUAL( received.amount.value, int64_t(40) * 100000000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(60).value );

   // amounts finer than one synthetic unit cannot be represented in the basket
   fund( alice, asset( 150, tusd_id ) );
   DOLLARSTORE_REQUIRE_THROW( deposit( alice_id, asset( 150, tusd_id ) ), amount_not_representable );
   DOLLARSTORE_REQUIRE_THROW( withdraw( alice_id, asset( 101, tusd_id ) ), amount_not_representable );

   // a whole synthetic unit's worth is fine
   deposit( alice_id, asset( 100, tusd_id ) );
   BOOST_CHECK_EQUAL( get_reserve( tusd_id ), dollars(60).value + 1 );

   const asset_object& tusd_obj = tusd_id(db);
   BOOST_CHECK_EQUAL( tusd_obj.to_canonical( tusd(3) ).value, dollars(3).value );
   BOOST_CHECK( tusd_obj.from_canonical( dollars(3) ) == tusd(3) );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( coarse_precision_normalization, coarse_reserve_fixture )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, gusd(100) );

   // 2 decimal places in, 6 decimal places of synthetic out
   BOOST_CHECK_EQUAL( deposit( alice_id, gusd(100) ).value, dollars(100).value );
   BOOST_CHECK_EQUAL( get_reserve( gusd_id ), dollars(100).value );
   BOOST_CHECK_EQUAL( get_balance( alice_id, gusd_id ), 0 );

   const asset_object& gusd_obj = gusd_id(db);
   BOOST_CHECK_EQUAL( gusd_obj.to_canonical( asset( 1, gusd_id ) ).value, 10000 );
   BOOST_CHECK( gusd_obj.from_canonical( 30000 ) == asset( 3, gusd_id ) );
   DOLLARSTORE_REQUIRE_THROW( gusd_obj.from_canonical( 30001 ), amount_not_representable );

   // one cent out burns one cent of synthetic
   BOOST_CHECK( withdraw( alice_id, asset( 1, gusd_id ) ) == asset( 1, gusd_id ) );
   BOOST_CHECK_EQUAL( get_balance( alice_id, dlrs_id ), dollars(100).value - 10000 );
   BOOST_CHECK_EQUAL( get_reserve( gusd_id ), dollars(100).value - 10000 );

   // fractions of a cent cannot be paid out in GUSD, queued or not
   DOLLARSTORE_REQUIRE_THROW( swap_from_synthetic( alice_id, 15000, gusd_id, false ), amount_not_representable );
   DOLLARSTORE_REQUIRE_THROW( swap_from_synthetic( alice_id, 15000, gusd_id, true ), amount_not_representable );
   DOLLARSTORE_REQUIRE_THROW( join_queue( alice_id, gusd_id, 15000 ), amount_not_representable );

   fund( bob, usdc(10) );
   DOLLARSTORE_REQUIRE_THROW( swap( bob_id, asset( 15000, usdc_id ), gusd_id, false ), amount_not_representable );
   BOOST_CHECK( swap( bob_id, usdc(1), gusd_id, false ).received == gusd(1) );

   BOOST_CHECK( swap_from_synthetic( alice_id, 20000, gusd_id, false ).received == asset( 2, gusd_id ) );
   BOOST_CHECK_EQUAL( get_balance( alice_id, gusd_id ), 3 );

   // a whole-cent queue position is paid in whole cents
   const queue_position_id_type pos = join_queue( alice_id, gusd_id, dollars(1) );
   fund( bob, gusd(5) );
   deposit( bob_id, gusd(5) );
   BOOST_CHECK( get_position( pos ).status == queue_position_status::filled );
   BOOST_CHECK_EQUAL( get_balance( alice_id, gusd_id ), 103 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( daily_redemption_tracking )
{ try {
   ACTOR(alice);
   fund( alice, usdc(1000) );
   deposit( alice_id, usdc(1000) );
   BOOST_CHECK_EQUAL( db.get_daily_redemption_used( alice_id ).value, 0 );

   withdraw( alice_id, usdc(30) );
   withdraw( alice_id, usdc(20) );
   BOOST_CHECK_EQUAL( db.get_daily_redemption_used( alice_id ).value, dollars(50).value );
   BOOST_CHECK_EQUAL( api.get_daily_redemption_used( alice_id ).value, dollars(50).value );

   // deposits do not count
   fund( alice, usdc(10) );
   deposit( alice_id, usdc(10) );
   BOOST_CHECK_EQUAL( db.get_daily_redemption_used( alice_id ).value, dollars(50).value );

   advance_time( DOLLARSTORE_SECONDS_PER_DAY );
   BOOST_CHECK_EQUAL( db.get_daily_redemption_used( alice_id ).value, 0 );

   withdraw( alice_id, usdc(5) );
   BOOST_CHECK_EQUAL( db.get_daily_redemption_used( alice_id ).value, dollars(5).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfer_test )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, usdc(100) );

   transfer( alice_id, bob_id, usdc(40) );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usdc_id ), usdc(60).amount.value );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usdc_id ), usdc(40).amount.value );

   DOLLARSTORE_REQUIRE_THROW( transfer( bob_id, alice_id, usdc(41) ), insufficient_balance );
   DOLLARSTORE_REQUIRE_THROW( transfer( bob_id, bob_id, usdc(1) ), fc::exception );
   DOLLARSTORE_REQUIRE_THROW( transfer( bob_id, account_id_type(9999), usdc(1) ), fc::exception );

   // synthetic moves like any other asset
   deposit( alice_id, usdc(60) );
   transfer( alice_id, bob_id, asset( dollars(25), dlrs_id ) );
   BOOST_CHECK_EQUAL( get_balance( bob_id, dlrs_id ), dollars(25).value );
   withdraw( bob_id, usdc(25) );
   BOOST_CHECK_EQUAL( get_balance( bob_id, usdc_id ), usdc(65).amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
