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
#pragma once
#include <dollarstore/chain/types.hpp>
#include <dollarstore/db/generic_index.hpp>
#include <dollarstore/protocol/asset.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace dollarstore { namespace chain {

   /**
    * @brief This class represents an account on the object graph
    * @ingroup object
    * @ingroup protocol
    *
    * Accounts are the users of the ledger. They hold wallet balances of every asset, grant the
    * ledger allowances, own queue positions and stakes.
    */
   class account_object : public dollarstore::db::abstract_object<account_object>
   {
      public:
         static constexpr uint8_t type_id  = account_object_type;

         /// The account's name. This name must be unique among all account names on the graph. May not be empty.
         string name;

         account_id_type get_id()const { return account_id_type( id ); }
   };

   /**
    * @brief Tracks the balance of a single account/asset pair
    * @ingroup object
    *
    * Indexed on (owner, asset_type) for wallet lookups.
    */
   class account_balance_object : public abstract_object<account_balance_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_account_balance_object_type;

         account_id_type   owner;
         asset_id_type     asset_type;
         share_type        balance;

         asset get_balance()const { return asset(balance, asset_type); }
         void  adjust_balance(const asset& delta);
   };

   /**
    * @brief How much of one asset the ledger may pull from an owner's wallet
    * @ingroup object
    */
   class token_allowance_object : public abstract_object<token_allowance_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_token_allowance_object_type;

         account_id_type   owner;
         asset_id_type     asset_type;
         share_type        amount;
   };

   /**
    * @class account_statistics_object
    * @ingroup object
    * @ingroup implementation
    *
    * Usage counters kept apart from the account so that the account object stays small.
    */
   class account_statistics_object : public abstract_object<account_statistics_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_account_statistics_object_type;

         account_id_type   owner;

         /// days since the epoch of the last redemption
         uint32_t          redemption_day = 0;
         /// synthetic redeemed for reserve assets during @ref redemption_day
         share_type        redeemed_today;

         /// usage on the day containing @p now
         share_type redeemed_on( time_point_sec now )const
         {
            return redemption_day == now.sec_since_epoch() / DOLLARSTORE_SECONDS_PER_DAY ? redeemed_today : 0;
         }
   };

   struct by_name;
   struct by_account_asset;
   struct by_owner;

   using account_multi_index_type = multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member<account_object, string, &account_object::name> >
      >
   >;

   /**
    * @ingroup object_index
    */
   using account_index = generic_index<account_object, account_multi_index_type>;

   using account_balance_object_multi_index_type = multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_asset>,
            composite_key<
               account_balance_object,
               member<account_balance_object, account_id_type, &account_balance_object::owner>,
               member<account_balance_object, asset_id_type, &account_balance_object::asset_type>
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using account_balance_index = generic_index<account_balance_object, account_balance_object_multi_index_type>;

   using token_allowance_multi_index_type = multi_index_container<
      token_allowance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_asset>,
            composite_key<
               token_allowance_object,
               member<token_allowance_object, account_id_type, &token_allowance_object::owner>,
               member<token_allowance_object, asset_id_type, &token_allowance_object::asset_type>
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using token_allowance_index = generic_index<token_allowance_object, token_allowance_multi_index_type>;

   using account_stats_multi_index_type = multi_index_container<
      account_statistics_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>,
                         member< account_statistics_object, account_id_type, &account_statistics_object::owner > >
      >
   >;

   /**
    * @ingroup object_index
    */
   using account_stats_index = generic_index<account_statistics_object, account_stats_multi_index_type>;

} } // dollarstore::chain

DOLLARSTORE_BIND_OBJECT_ID( dollarstore::chain::account_object )

FC_REFLECT_DERIVED( dollarstore::chain::account_object, (dollarstore::db::object), (name) )
FC_REFLECT_DERIVED( dollarstore::chain::account_balance_object, (dollarstore::db::object),
                    (owner)(asset_type)(balance) )
FC_REFLECT_DERIVED( dollarstore::chain::token_allowance_object, (dollarstore::db::object),
                    (owner)(asset_type)(amount) )
FC_REFLECT_DERIVED( dollarstore::chain::account_statistics_object, (dollarstore::db::object),
                    (owner)(redemption_day)(redeemed_today) )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::account_object )
DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::account_balance_object )
DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::token_allowance_object )
DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::account_statistics_object )
