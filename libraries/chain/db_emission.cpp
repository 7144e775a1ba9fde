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

#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/emission_object.hpp>
#include <dollarstore/chain/global_property_object.hpp>

#include <fc/uint128.hpp>

namespace dollarstore { namespace chain {

share_type database::mint_maker_reward( account_id_type owner, share_type filled, uint32_t seconds_queued )
{ try {
   const chain_parameters& params = get_chain_parameters();
   const emission_state_object& emission = get_emission_state();

   fc::uint128_t reward128( filled.value );
   reward128 *= params.maker_reward_rate_bps;
   reward128 *= seconds_queued;
   reward128 *= params.reward_units_per_dollar;
   reward128 /= uint64_t( DOLLARSTORE_BASIS_POINTS_DENOM ) * DOLLARSTORE_SECONDS_PER_YEAR;

   share_type reward = emission.maker_remaining();
   if( reward128 < static_cast<uint64_t>( reward.value ) )
      reward = static_cast<int64_t>( reward128 );
   if( reward <= 0 )
      return 0;

   modify( emission, [reward]( emission_state_object& e ) {
      e.maker_minted += reward;
   });
   _mint_reward( owner, reward_category::maker, reward );
   _vest_founder();
   return reward;
} FC_CAPTURE_AND_RETHROW( (owner)(filled)(seconds_queued) ) }

share_type database::mint_taker_reward( account_id_type taker, share_type cleared )
{ try {
   const chain_parameters& params = get_chain_parameters();
   const emission_state_object& emission = get_emission_state();

   fc::uint128_t reward128( cleared.value );
   reward128 *= params.taker_fee_bps;
   reward128 *= params.reward_units_per_dollar;
   reward128 /= DOLLARSTORE_BASIS_POINTS_DENOM;

   share_type reward = emission.taker_remaining();
   if( reward128 < static_cast<uint64_t>( reward.value ) )
      reward = static_cast<int64_t>( reward128 );
   if( reward <= 0 )
      return 0;

   modify( emission, [reward]( emission_state_object& e ) {
      e.taker_minted += reward;
   });
   _mint_reward( taker, reward_category::taker, reward );
   _vest_founder();
   return reward;
} FC_CAPTURE_AND_RETHROW( (taker)(cleared) ) }

/// Founder allocation tracks user emission at a fixed ratio up to its cap
void database::_vest_founder()
{
   const emission_state_object& emission = get_emission_state();
   const chain_parameters& params = get_chain_parameters();

   share_type target = ( emission.maker_minted + emission.taker_minted ) / share_type( params.founder_vesting_ratio );
   target = std::min( target, emission.founder_cap );
   if( target <= emission.founder_vested )
      return;

   const share_type delta = target - emission.founder_vested;
   modify( emission, [delta]( emission_state_object& e ) {
      e.founder_vested += delta;
   });
   _mint_reward( get_global_properties().founder_account, reward_category::founder, delta );
}

void database::_mint_reward( account_id_type account, reward_category category, share_type amount )
{
   if( amount <= 0 )
      return;
   const asset minted = get_reward_asset().amount( amount );
   adjust_balance( account, minted );
   adjust_supply( minted );
   push_applied_operation( reward_minted_operation( account, category, amount ) );
}

emission_stats database::get_emission_stats()const
{
   const emission_state_object& emission = get_emission_state();
   emission_stats stats;
   stats.maker_remaining = emission.maker_remaining();
   stats.taker_remaining = emission.taker_remaining();
   stats.founder_vested  = emission.founder_vested;
   stats.total_minted    = emission.total_minted();
   return stats;
}

} }
