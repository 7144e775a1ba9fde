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
#include <dollarstore/protocol/asset.hpp>
#include <dollarstore/protocol/exceptions.hpp>

namespace dollarstore { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @ingroup transactions Transactions
    *  @brief A set of valid commands for mutating the ledger state.
    *
    *  An operation can be thought of like a function that will modify the shared ledger
    *  state. The members of each struct are like function arguments and each operation
    *  can generate a return value.
    *
    *  Operations are grouped into transactions (@ref transaction) to ensure that they occur
    *  in a particular order and that all operations apply successfully or no operations apply.
    *
    *  Operations marked virtual are never pushed by a caller. The ledger records them as
    *  events describing the effects of the operations it applied.
    *
    *  @{
    */

   struct void_result{};

   /// Outcome of a swap leg: what was delivered immediately and, if the rest was deferred, where it waits
   struct swap_result
   {
      asset                                  received;
      optional<queue_position_id_type>       position;
      share_type                             queued;
   };

   using operation_result = fc::static_variant< void_result, object_id_type, asset, swap_result >;

   struct base_operation
   {
      void validate()const{}
   };

   /**
    *  For future expansion many structs include a single member of type
    *  extensions_type that can be changed when updating a protocol.  You can
    *  always add new types to a static_variant without breaking backward
    *  compatibility.
    */
   using future_extensions = static_variant<void_t>;

   /**
    *  A flat_set is used to make sure that only one extension of
    *  each type is added and that they are added in order.
    *
    *  @note static_variant compares only the type tag and not the
    *  content.
    */
   using extensions_type = flat_set<future_extensions>;

   /// Rejects non-positive amounts with zero_amount
   inline void validate_positive( share_type amount, const char* field )
   {
      DOLLARSTORE_ASSERT( amount > 0, zero_amount, "${f} must be positive", ("f",field)("amount",amount) );
   }

   ///@}

} } // dollarstore::protocol

FC_REFLECT_TYPENAME( dollarstore::protocol::operation_result )
FC_REFLECT_TYPENAME( dollarstore::protocol::future_extensions )
FC_REFLECT( dollarstore::protocol::void_result, )
FC_REFLECT( dollarstore::protocol::swap_result, (received)(position)(queued) )
