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
#include <dollarstore/protocol/base.hpp>

namespace dollarstore { namespace protocol {

   /**
    *  Tunable constants of the stake ledger and the emission allocator. Set at genesis;
    *  defaults come from config.hpp.
    */
   struct chain_parameters
   {
      uint32_t    full_power_duration         = DOLLARSTORE_DEFAULT_FULL_POWER_DURATION; ///< seconds for stake power to ramp to the staked amount
      uint32_t    unstake_cooldown            = DOLLARSTORE_DEFAULT_UNSTAKE_COOLDOWN; ///< seconds between unstake and its completion
      uint16_t    maker_reward_rate_bps       = DOLLARSTORE_DEFAULT_MAKER_REWARD_RATE_BPS; ///< annualized reward on queued synthetic
      uint16_t    taker_fee_bps               = DOLLARSTORE_DEFAULT_TAKER_FEE_BPS; ///< fee rate a queue-clearing deposit is rewarded with
      uint32_t    reward_units_per_dollar     = DOLLARSTORE_DEFAULT_REWARD_UNITS_PER_DOLLAR; ///< reward tokens paid per dollar of reward value
      share_type  maker_cap                   = DOLLARSTORE_DEFAULT_MAKER_CAP;
      share_type  taker_cap                   = DOLLARSTORE_DEFAULT_TAKER_CAP;
      share_type  founder_cap                 = DOLLARSTORE_DEFAULT_FOUNDER_CAP;
      uint16_t    founder_vesting_ratio       = DOLLARSTORE_DEFAULT_FOUNDER_VESTING_RATIO; ///< user reward units per founder unit
      uint32_t    fee_free_cap_multiplier     = DOLLARSTORE_DEFAULT_FEE_FREE_CAP_MULTIPLIER; ///< synthetic per unit of stake power per day
      extensions_type extensions;

      void validate()const;
   };

} }  // dollarstore::protocol

FC_REFLECT( dollarstore::protocol::chain_parameters,
            (full_power_duration)
            (unstake_cooldown)
            (maker_reward_rate_bps)
            (taker_fee_bps)
            (reward_units_per_dollar)
            (maker_cap)
            (taker_cap)
            (founder_cap)
            (founder_vesting_ratio)
            (fee_free_cap_multiplier)
            (extensions)
          )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::protocol::chain_parameters )
