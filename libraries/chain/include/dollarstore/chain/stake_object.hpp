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

namespace dollarstore { namespace chain {

   enum class stake_status : uint8_t
   {
      none      = 0,
      staked    = 1,
      unstaking = 2
   };

   /**
    *  @brief an account's stake of the reward token
    *  @ingroup object
    *  @ingroup protocol
    *
    *  Created by the first stake and kept afterwards, with a zero amount once an unstake completes.
    *
    *  Power ramps linearly from zero at @ref stake_start to the staked amount after the full power
    *  duration, and is zero while an unstake is pending.
    */
   class stake_object : public abstract_object<stake_object>
   {
      public:
         static constexpr uint8_t type_id  = stake_object_type;

         account_id_type           owner;
         share_type                staked;
         time_point_sec            stake_start;
         optional<time_point_sec>  unstake_time;
         stake_status              status = stake_status::none;

         bool is_unstaking()const { return status == stake_status::unstaking; }

         share_type power_at( time_point_sec now, uint32_t full_power_duration )const;
   };

   struct staking_info
   {
      share_type                staked;
      share_type                stake_power;
      time_point_sec            staked_since;
      optional<time_point_sec>  unstake_time;
      bool                      is_unstaking = false;
   };

   struct by_owner;

   using stake_multi_index_type = multi_index_container<
      stake_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< stake_object, account_id_type, &stake_object::owner > >
      >
   >;

   using stake_index = generic_index<stake_object, stake_multi_index_type>;

} } // dollarstore::chain

DOLLARSTORE_BIND_OBJECT_ID( dollarstore::chain::stake_object )

FC_REFLECT_ENUM( dollarstore::chain::stake_status, (none)(staked)(unstaking) )

FC_REFLECT( dollarstore::chain::staking_info, (staked)(stake_power)(staked_since)(unstake_time)(is_unstaking) )

FC_REFLECT_DERIVED( dollarstore::chain::stake_object, (dollarstore::db::object),
                    (owner)(staked)(stake_start)(unstake_time)(status) )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::stake_object )
