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
    *  @brief Deposits a supported stablecoin into the reserve and mints synthetic 1:1
    *
    *  The amount is pulled from the depositor's wallet against a prior allowance. Any queue
    *  positions waiting for this asset are filled from the deposit, oldest first.
    *
    *  @return the synthetic amount minted
    */
   struct deposit_operation : public base_operation
   {
      account_id_type  account;
      /// amount in units of the deposited reserve asset
      asset            amount;

      extensions_type  extensions;

      account_id_type actor()const { return account; }
      void            validate()const;
   };

   /**
    *  @ingroup operations
    *  @brief Burns synthetic to take a reserve asset out of the basket
    *
    *  Fails when the reserve cannot cover the full amount; a withdrawal is never queued.
    *
    *  @return the reserve asset delivered
    */
   struct withdraw_operation : public base_operation
   {
      account_id_type  account;
      /// amount in units of the reserve asset to receive
      asset            amount;

      extensions_type  extensions;

      account_id_type actor()const { return account; }
      void            validate()const;
   };

} } // dollarstore::protocol

FC_REFLECT( dollarstore::protocol::deposit_operation, (account)(amount)(extensions) )
FC_REFLECT( dollarstore::protocol::withdraw_operation, (account)(amount)(extensions) )
