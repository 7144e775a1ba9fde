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
#include <dollarstore/protocol/chain_parameters.hpp>

namespace dollarstore { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains global state information set at genesis
    * @ingroup object
    * @ingroup implementation
    */
   class global_property_object : public dollarstore::db::abstract_object<global_property_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_global_property_object_type;

         chain_parameters   parameters;
         asset_id_type      synthetic_asset;
         asset_id_type      reward_asset;
         /// receives founder vesting
         account_id_type    founder_account;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state information that changes as transactions are applied
    * @ingroup object
    * @ingroup implementation
    */
   class dynamic_global_property_object : public abstract_object<dynamic_global_property_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_dynamic_global_property_object_type;

         /// ledger time; only moves forward
         time_point_sec    time;
         uint64_t          transaction_count = 0;
   };

   using global_property_index = generic_index<global_property_object,
         multi_index_container< global_property_object,
            indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
         >
      >;
   using dynamic_global_property_index = generic_index<dynamic_global_property_object,
         multi_index_container< dynamic_global_property_object,
            indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
         >
      >;

}}


FC_REFLECT_DERIVED( dollarstore::chain::dynamic_global_property_object, (dollarstore::db::object),
                    (time)
                    (transaction_count)
                  )

FC_REFLECT_DERIVED( dollarstore::chain::global_property_object, (dollarstore::db::object),
                    (parameters)
                    (synthetic_asset)
                    (reward_asset)
                    (founder_account)
                  )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::dynamic_global_property_object )
DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::global_property_object )
