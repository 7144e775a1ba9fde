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
#include <dollarstore/chain/database.hpp>

#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/stake_object.hpp>

namespace dollarstore { namespace chain {

const stake_object* database::find_stake( account_id_type owner )const
{
   const auto& idx = get_index_type<stake_index>().indices().get<by_owner>();
   auto itr = idx.find( owner );
   return itr == idx.end() ? nullptr : &*itr;
}

share_type database::get_stake_power( account_id_type owner )const
{
   const stake_object* stake = find_stake( owner );
   if( stake == nullptr )
      return 0;
   return stake->power_at( head_time(), get_chain_parameters().full_power_duration );
}

share_type database::get_daily_fee_free_cap( account_id_type owner )const
{
   return get_stake_power( owner ) * share_type( get_chain_parameters().fee_free_cap_multiplier );
}

staking_info database::get_staking_info( account_id_type owner )const
{
   staking_info info;
   const stake_object* stake = find_stake( owner );
   if( stake == nullptr )
      return info;
   info.staked       = stake->staked;
   info.stake_power  = stake->power_at( head_time(), get_chain_parameters().full_power_duration );
   info.staked_since = stake->stake_start;
   info.unstake_time = stake->unstake_time;
   info.is_unstaking = stake->is_unstaking();
   return info;
}

} }
