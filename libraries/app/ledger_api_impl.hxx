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

#include <dollarstore/app/ledger_api.hpp>

#include <dollarstore/chain/database.hpp>

#include <mutex>

namespace dollarstore { namespace app {

class ledger_api_impl : public std::enable_shared_from_this<ledger_api_impl>
{
   public:
      explicit ledger_api_impl( dollarstore::chain::database& db );
      virtual ~ledger_api_impl();

      // Reserves
      reserve_summary get_reserves()const;
      share_type get_reserve( asset_id_type asset_id )const;
      vector<asset_object> supported_stablecoins()const;
      bool is_supported( asset_id_type asset_id )const;
      share_type get_synthetic_supply()const;

      // Queue
      share_type get_queue_depth( asset_id_type asset_id )const;
      optional<queue_position_object> get_queue_position( queue_position_id_type id )const;
      queue_position_info get_queue_position_info( queue_position_id_type id )const;
      vector<queue_position_id_type> get_user_queue_positions( account_id_type owner )const;
      double get_fill_score( queue_position_id_type id )const;

      // Staking
      staking_info get_staking_info( account_id_type owner )const;
      share_type get_stake_power( account_id_type owner )const;
      share_type get_daily_fee_free_cap( account_id_type owner )const;
      share_type get_daily_redemption_used( account_id_type owner )const;

      // Emission
      emission_stats get_emission_stats()const;
      emission_state_object get_emission_state()const;

      // Accounts
      asset get_balance( account_id_type owner, asset_id_type asset_id )const;
      share_type get_allowance( account_id_type owner, asset_id_type asset_id )const;
      optional<account_object> get_account_by_name( const string& name )const;

      // Assets
      optional<asset_object> lookup_asset_symbol( const string& symbol )const;

   private:
      using read_guard = std::lock_guard<std::mutex>;

      dollarstore::chain::database& _db;
};

} } // dollarstore::app
