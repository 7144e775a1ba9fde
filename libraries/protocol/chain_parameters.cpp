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
#include <dollarstore/protocol/chain_parameters.hpp>

#include <fc/io/raw.hpp>

namespace dollarstore { namespace protocol {

   void chain_parameters::validate()const
   {
      FC_ASSERT( full_power_duration > 0, "Power ramp duration must be positive" );
      FC_ASSERT( maker_reward_rate_bps <= DOLLARSTORE_BASIS_POINTS_DENOM );
      FC_ASSERT( taker_fee_bps <= DOLLARSTORE_BASIS_POINTS_DENOM );
      FC_ASSERT( reward_units_per_dollar > 0 );
      FC_ASSERT( maker_cap >= 0 && taker_cap >= 0 && founder_cap >= 0, "Emission caps cannot be negative" );
      FC_ASSERT( maker_cap + taker_cap + founder_cap <= DOLLARSTORE_MAX_SHARE_SUPPLY,
                 "Emission caps exceed the maximum supply" );
      FC_ASSERT( founder_vesting_ratio > 0, "Founder vesting ratio must be positive" );
   }

} } // dollarstore::protocol

DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::protocol::chain_parameters )
