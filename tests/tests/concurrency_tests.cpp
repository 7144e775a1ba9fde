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
#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/operation_history_object.hpp>

#include <atomic>
#include <mutex>
#include <thread>

#include "../common/database_fixture.hpp"

using namespace dollarstore::chain;

namespace {

/// Pushes one transaction without touching the fixture's shared trx
processed_transaction push_from_thread( database& db, const vector<operation>& ops )
{
   transaction tx;
   tx.operations = ops;
   return db.push_transaction( tx );
}

}

BOOST_FIXTURE_TEST_SUITE( concurrency_tests, database_fixture )

BOOST_AUTO_TEST_CASE( concurrent_deposits_and_withdrawals )
{ try {
   const int num_threads = 4;
   const int iterations = 50;

   vector<account_id_type> accounts;
   for( int i = 0; i < num_threads; ++i )
   {
      const account_object& a = create_account( "trader" + fc::to_string( i ) );
      fund( a, usdc(1000) );
      accounts.push_back( a.get_id() );
   }

   const asset ten = usdc(10);
   const asset five = usdc(5);
   std::atomic<int> failures( 0 );
   std::atomic<bool> done( false );

   vector<std::thread> workers;
   for( int i = 0; i < num_threads; ++i )
   {
      workers.emplace_back( [this,&accounts,&failures,&ten,&five,i,iterations]() {
         const account_id_type who = accounts[i];
         for( int n = 0; n < iterations; ++n )
         {
            try {
               approve_operation aop;
               aop.owner = who;
               aop.amount = ten;
               deposit_operation dop;
               dop.account = who;
               dop.amount = ten;
               push_from_thread( db, { aop, dop } );

               withdraw_operation wop;
               wop.account = who;
               wop.amount = five;
               push_from_thread( db, { wop } );
            } catch( const fc::exception& e ) {
               elog( "${e}", ("e",e.to_detail_string()) );
               ++failures;
            }
         }
      });
   }

   // a reader holding the writer lock never sees a half-applied transaction
   std::atomic<int> inconsistent( 0 );
   std::thread reader( [this,&done,&inconsistent]() {
      while( !done )
      {
         {
            std::lock_guard<std::mutex> guard( db.write_mutex() );
            if( db.get_total_reserves() != db.get_synthetic_asset().dynamic_data(db).current_supply )
               ++inconsistent;
         }
         const dollarstore::app::reserve_summary summary = api.get_reserves();
         share_type sum;
         for( const auto& r : summary.reserves )
            sum += r.balance;
         if( sum != summary.total )
            ++inconsistent;
         std::this_thread::yield();
      }
   });

   for( auto& t : workers )
      t.join();
   done = true;
   reader.join();

   BOOST_CHECK_EQUAL( failures.load(), 0 );
   BOOST_CHECK_EQUAL( inconsistent.load(), 0 );
   for( const account_id_type& who : accounts )
   {
      BOOST_CHECK_EQUAL( get_balance( who, dlrs_id ), dollars( 5 * iterations ).value );
      BOOST_CHECK_EQUAL( get_balance( who, usdc_id ), usdc( 1000 - 5 * iterations ).amount.value );
   }
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), dollars( 5 * iterations * num_threads ).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( concurrent_queue_traffic )
{ try {
   ACTORS( (maker)(taker) );
   fund( maker, usdt(2000) );
   deposit( maker_id, usdt(2000) );
   fund( taker, usdc(2000) );

   const asset ten = usdc(10);
   std::atomic<int> failures( 0 );
   std::thread joiner( [this,&failures,maker_id]() {
      for( int n = 0; n < 100; ++n )
      {
         try {
            queue_join_operation op;
            op.account = maker_id;
            op.asset_type = usdc_id;
            op.amount = dollars(10);
            push_from_thread( db, { op } );
         } catch( const fc::exception& e ) {
            elog( "${e}", ("e",e.to_detail_string()) );
            ++failures;
         }
      }
   });
   std::thread depositor( [this,&failures,&ten,taker_id]() {
      for( int n = 0; n < 100; ++n )
      {
         try {
            approve_operation aop;
            aop.owner = taker_id;
            aop.amount = ten;
            deposit_operation dop;
            dop.account = taker_id;
            dop.amount = ten;
            push_from_thread( db, { aop, dop } );
         } catch( const fc::exception& e ) {
            elog( "${e}", ("e",e.to_detail_string()) );
            ++failures;
         }
      }
   });
   joiner.join();
   depositor.join();

   BOOST_CHECK_EQUAL( failures.load(), 0 );
   // every deposited dollar either paid the maker or stayed in the basket
   const int64_t depth = db.get_queue_depth( usdc_id ).value;
   BOOST_CHECK_EQUAL( get_balance( maker_id, usdc_id ), usdc(1000).amount.value - depth );
   BOOST_CHECK_EQUAL( get_reserve( usdc_id ), depth );
   BOOST_CHECK_EQUAL( get_balance( taker_id, dlrs_id ), dollars(1000).value );
   BOOST_CHECK_EQUAL( get_balance( maker_id, dlrs_id ), dollars(1000).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( commits_are_published_in_order )
{ try {
   const int num_threads = 4;
   const int iterations = 25;

   vector<account_id_type> accounts;
   for( int i = 0; i < num_threads; ++i )
   {
      const account_object& a = create_account( "sender" + fc::to_string( i ) );
      fund( a, usdc(100) );
      accounts.push_back( a.get_id() );
   }

   std::mutex seen_mutex;
   vector<uint64_t> seen;
   auto conn = db.applied_transaction.connect(
         [&]( const processed_transaction&, const vector<operation_history_object>& ops ) {
      std::lock_guard<std::mutex> guard( seen_mutex );
      seen.push_back( ops.front().trx_num );
      std::this_thread::yield();
   });
   const uint64_t first = db.get_dynamic_global_properties().transaction_count + 1;

   const asset one = usdc(1);
   std::atomic<int> failures( 0 );
   vector<std::thread> workers;
   for( int i = 0; i < num_threads; ++i )
   {
      workers.emplace_back( [this,&accounts,&failures,&one,i,iterations,num_threads]() {
         for( int n = 0; n < iterations; ++n )
         {
            try {
               transfer_operation op;
               op.from = accounts[i];
               op.to = accounts[ (i + 1) % num_threads ];
               op.amount = one;
               push_from_thread( db, { op } );
            } catch( const fc::exception& e ) {
               elog( "${e}", ("e",e.to_detail_string()) );
               ++failures;
            }
         }
      });
   }
   for( auto& t : workers )
      t.join();
   conn.disconnect();

   BOOST_CHECK_EQUAL( failures.load(), 0 );
   BOOST_REQUIRE_EQUAL( seen.size(), size_t( num_threads * iterations ) );
   for( size_t n = 0; n < seen.size(); ++n )
      BOOST_CHECK_EQUAL( seen[n], first + n );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
