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
    *  @ingroup operations
    *  @brief Escrows synthetic at the tail of an asset's redemption queue
    *
    *  @return the id of the new queue position
    */
   struct queue_join_operation : public base_operation
   {
      account_id_type  account;
      /// reserve asset the position waits for
      asset_id_type    asset_type;
      /// synthetic amount to escrow
      share_type       amount;

      extensions_type  extensions;

      account_id_type actor()const { return account; }
      void            validate()const;
   };

   /**
    *  @ingroup operations
    *  @brief Cancels an open queue position and refunds its remaining synthetic escrow
    *
    *  @return the synthetic refund
    */
   struct queue_cancel_operation : public base_operation
   {
      account_id_type         account;
      queue_position_id_type  position;

      extensions_type         extensions;

      account_id_type actor()const { return account; }
      void            validate()const {}
   };

} } // dollarstore::protocol

FC_REFLECT( dollarstore::protocol::queue_join_operation, (account)(asset_type)(amount)(extensions) )
FC_REFLECT( dollarstore::protocol::queue_cancel_operation, (account)(position)(extensions) )
