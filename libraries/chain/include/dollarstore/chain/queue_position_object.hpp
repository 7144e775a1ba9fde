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

   enum class queue_position_status : uint8_t
   {
      active           = 0,
      partially_filled = 1,
      filled           = 2,
      cancelled        = 3
   };

   /**
    *  @brief a pending redemption waiting for a reserve asset to be deposited
    *  @ingroup object
    *  @ingroup protocol
    *
    *  The position escrows synthetic: its remaining amount is still part of the synthetic supply and
    *  is burned as the position is filled. Positions of one asset are served strictly in id order.
    *  Filled and cancelled positions are kept with their final status.
    */
   class queue_position_object : public abstract_object<queue_position_object>
   {
      public:
         static constexpr uint8_t type_id  = queue_position_object_type;

         account_id_type        owner;
         asset_id_type          asset_type;
         /// synthetic escrowed when the position was created
         share_type             original_amount;
         /// synthetic still waiting to be filled
         share_type             remaining;
         time_point_sec         created;
         queue_position_status  status = queue_position_status::active;

         bool is_open()const
         {
            return status == queue_position_status::active || status == queue_position_status::partially_filled;
         }

         queue_position_id_type get_id()const { return queue_position_id_type( id ); }
   };

   /// Where an open position stands in its asset's line
   struct queue_position_info
   {
      /// synthetic waiting in front of the position
      share_type amount_ahead;
      /// 1 for the head of the line
      uint32_t   position_number = 0;
   };

   struct by_asset_open;
   struct by_owner;

   using queue_position_multi_index_type = multi_index_container<
      queue_position_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset_open>,
            composite_key< queue_position_object,
               member< queue_position_object, asset_id_type, &queue_position_object::asset_type >,
               const_mem_fun< queue_position_object, bool, &queue_position_object::is_open >,
               member< object, object_id_type, &object::id >
            >,
            composite_key_compare<
               std::less< asset_id_type >,
               std::greater< bool >,
               std::less< object_id_type >
            >
         >,
         ordered_unique< tag<by_owner>,
            composite_key< queue_position_object,
               member< queue_position_object, account_id_type, &queue_position_object::owner >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using queue_position_index = generic_index<queue_position_object, queue_position_multi_index_type>;

} } // dollarstore::chain

DOLLARSTORE_BIND_OBJECT_ID( dollarstore::chain::queue_position_object )

FC_REFLECT_ENUM( dollarstore::chain::queue_position_status, (active)(partially_filled)(filled)(cancelled) )

FC_REFLECT( dollarstore::chain::queue_position_info, (amount_ahead)(position_number) )

FC_REFLECT_DERIVED( dollarstore::chain::queue_position_object, (dollarstore::db::object),
                    (owner)(asset_type)(original_amount)(remaining)(created)(status) )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::queue_position_object )
