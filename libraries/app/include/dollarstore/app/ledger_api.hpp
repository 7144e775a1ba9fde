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

#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/emission_object.hpp>
#include <dollarstore/chain/queue_position_object.hpp>
#include <dollarstore/chain/stake_object.hpp>

#include <fc/optional.hpp>

#include <memory>
#include <string>
#include <vector>

namespace dollarstore { namespace chain { class database; } }

namespace dollarstore { namespace app {

using namespace dollarstore::chain;

using std::string;
using std::vector;

class ledger_api_impl;

/// One reserve asset and what the basket holds of it
struct reserve_entry
{
   asset_id_type  asset_type;
   string         symbol;
   /// in synthetic units
   share_type     balance;
   bool           supported = false;
};

struct reserve_summary
{
   vector<reserve_entry>  reserves;
   /// sum of all reserve balances; always equals the synthetic supply
   share_type             total;
};

/**
 * @brief Consistent reads of the ledger
 *
 * Every call takes the database's writer lock, so a read never observes a transaction halfway
 * through. Objects are returned by value.
 */
class ledger_api
{
   public:
      ledger_api( dollarstore::chain::database& db );
      ~ledger_api();

      //////////////
      // Reserves //
      //////////////

      /// Every reserve asset with its balance, plus the aggregate
      reserve_summary get_reserves()const;

      /**
       * @brief Get the reserve balance of one asset
       * @param asset_id ID of a reserve asset
       * @return the balance in synthetic units
       * @throws unsupported_asset if @p asset_id is not a reserve asset
       */
      share_type get_reserve( asset_id_type asset_id )const;

      /// Reserve assets currently accepting deposits
      vector<asset_object> supported_stablecoins()const;

      bool is_supported( asset_id_type asset_id )const;

      share_type get_synthetic_supply()const;

      ///////////
      // Queue //
      ///////////

      /// Synthetic waiting in open positions for @p asset_id
      share_type get_queue_depth( asset_id_type asset_id )const;

      /// @return the position in any status, or null if the id was never issued
      optional<queue_position_object> get_queue_position( queue_position_id_type id )const;

      /**
       * @brief Get where an open position stands in its line
       * @throws position_not_found if the position is unknown, filled or cancelled
       */
      queue_position_info get_queue_position_info( queue_position_id_type id )const;

      /// Open positions of @p owner, oldest first
      vector<queue_position_id_type> get_user_queue_positions( account_id_type owner )const;

      double get_fill_score( queue_position_id_type id )const;

      /////////////
      // Staking //
      /////////////

      staking_info get_staking_info( account_id_type owner )const;
      share_type   get_stake_power( account_id_type owner )const;
      share_type   get_daily_fee_free_cap( account_id_type owner )const;
      share_type   get_daily_redemption_used( account_id_type owner )const;

      //////////////
      // Emission //
      //////////////

      emission_stats         get_emission_stats()const;
      emission_state_object  get_emission_state()const;

      //////////////
      // Accounts //
      //////////////

      asset      get_balance( account_id_type owner, asset_id_type asset_id )const;
      share_type get_allowance( account_id_type owner, asset_id_type asset_id )const;
      optional<account_object> get_account_by_name( string name )const;

      ////////////
      // Assets //
      ////////////

      optional<asset_object> lookup_asset_symbol( string symbol )const;

   private:
      std::shared_ptr< ledger_api_impl > my;
};

} } // dollarstore::app

FC_REFLECT( dollarstore::app::reserve_entry, (asset_type)(symbol)(balance)(supported) )
FC_REFLECT( dollarstore::app::reserve_summary, (reserves)(total) )
