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

#include <dollarstore/protocol/chain_parameters.hpp>
#include <dollarstore/protocol/types.hpp>

#include <string>
#include <vector>

namespace dollarstore { namespace chain {
using std::string;
using std::vector;
using namespace dollarstore::protocol;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string())
         : name(name)
      {}
      string name;
   };
   struct initial_asset_type {
      string     symbol;
      uint8_t    precision = DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS;
      asset_kind kind = asset_kind::reserve;
      bool       supported = true;
   };
   struct initial_balance_type {
      /// Must correspond to one of the initial accounts
      string     owner;
      string     asset_symbol;
      share_type amount;
   };

   time_point_sec                           initial_timestamp;
   chain_parameters                         initial_parameters;
   vector<initial_account_type>             initial_accounts;
   vector<initial_asset_type>               initial_assets;
   /// wallet balances of reserve assets and the reward token; the synthetic asset starts unissued
   vector<initial_balance_type>             initial_balances;
   /// Receives founder vesting; created if it is not among the initial accounts
   string                                   founder_account = DOLLARSTORE_DEFAULT_FOUNDER_ACCOUNT_NAME;

   /// Checks the genesis is self-consistent before any object is created from it
   void validate()const;
};

/**
 * The basket the ledger launches with: USDC and USDT reserves, the DLRS synthetic dollar and the CENTS
 * reward token, all with six decimals, and the founder account.
 */
genesis_state_type create_default_genesis();

} } // namespace dollarstore::chain

FC_REFLECT(dollarstore::chain::genesis_state_type::initial_account_type, (name))

FC_REFLECT(dollarstore::chain::genesis_state_type::initial_asset_type,
           (symbol)(precision)(kind)(supported))

FC_REFLECT(dollarstore::chain::genesis_state_type::initial_balance_type,
           (owner)(asset_symbol)(amount))

FC_REFLECT(dollarstore::chain::genesis_state_type,
           (initial_timestamp)(initial_parameters)(initial_accounts)(initial_assets)(initial_balances)
           (founder_account))
