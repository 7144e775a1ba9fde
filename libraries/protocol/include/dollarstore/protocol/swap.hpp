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
    *  @brief Exchanges one reserve asset for another through the synthetic dollar
    *
    *  Performs a deposit of @ref amount followed by a withdrawal of the same value in
    *  @ref to_asset. When the target reserve cannot cover it and @ref queue_if_unavailable
    *  is set, whatever is available is delivered now and the shortfall is queued.
    *
    *  @return swap_result
    */
   struct swap_operation : public base_operation
   {
      account_id_type  account;
      asset            amount;
      asset_id_type    to_asset;
      bool             queue_if_unavailable = false;

      extensions_type  extensions;

      account_id_type actor()const { return account; }
      void            validate()const;
   };

   /**
    *  @ingroup operations
    *  @brief Redeems synthetic for a reserve asset, optionally queueing the shortfall
    *
    *  @return swap_result
    */
   struct swap_from_synthetic_operation : public base_operation
   {
      account_id_type  account;
      /// synthetic amount to redeem
      share_type       amount;
      asset_id_type    to_asset;
      bool             queue_if_unavailable = false;

      extensions_type  extensions;

      account_id_type actor()const { return account; }
      void            validate()const;
   };

} } // dollarstore::protocol

FC_REFLECT( dollarstore::protocol::swap_operation,
            (account)(amount)(to_asset)(queue_if_unavailable)(extensions) )
FC_REFLECT( dollarstore::protocol::swap_from_synthetic_operation,
            (account)(amount)(to_asset)(queue_if_unavailable)(extensions) )
