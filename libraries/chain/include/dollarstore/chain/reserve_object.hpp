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

   /**
    * @brief The basket's holding of one reserve asset
    * @ingroup object
    * @ingroup implementation
    *
    * The balance is kept in synthetic units. Across all reserve objects the balances sum to the
    * current supply of the synthetic asset whenever no transaction is being applied.
    */
   class reserve_object : public abstract_object<reserve_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_reserve_object_type;

         asset_id_type  asset_type;
         share_type     balance;
   };

   struct by_asset;

   using reserve_multi_index_type = multi_index_container<
      reserve_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset>, member< reserve_object, asset_id_type, &reserve_object::asset_type > >
      >
   >;

   using reserve_index = generic_index<reserve_object, reserve_multi_index_type>;

} } // dollarstore::chain


FC_REFLECT_DERIVED( dollarstore::chain::reserve_object, (dollarstore::db::object), (asset_type)(balance) )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::reserve_object )
