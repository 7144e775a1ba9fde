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

#include <dollarstore/protocol/types.hpp>

namespace dollarstore { namespace chain {

   using namespace protocol;

   /// Ledger bookkeeping objects; operations never name these by id
   enum impl_object_type : uint8_t
   {
      impl_global_property_object_type = OBJECT_TYPE_COUNT,
      impl_dynamic_global_property_object_type,
      impl_asset_dynamic_data_object_type,
      impl_account_balance_object_type,
      impl_token_allowance_object_type,
      impl_reserve_object_type,
      impl_emission_state_object_type,
      impl_account_statistics_object_type,
      impl_operation_history_object_type
   };

   using asset_dynamic_data_id_type = object_id<impl_asset_dynamic_data_object_type>;

} }
