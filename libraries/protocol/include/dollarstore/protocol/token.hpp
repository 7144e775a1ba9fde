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
    * @ingroup operations
    *
    *  @brief Transfers an amount of one asset from one account to another
    *
    *  @pre amount.amount > 0
    *  @pre from != to
    *  @post from account's balance will be reduced by amount
    *  @post to account's balance will be increased by amount
    */
   struct transfer_operation : public base_operation
   {
      /// Account to transfer asset from
      account_id_type  from;
      /// Account to transfer asset to
      account_id_type  to;
      /// The amount of asset to transfer from @ref from to @ref to
      asset            amount;

      extensions_type  extensions;

      account_id_type actor()const { return from; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    *  @brief Sets how much of an asset the ledger may pull from the owner's wallet
    *
    *  The allowance is replaced, not increased. Deposits and stakes consume it.
    *  An amount of zero revokes the allowance.
    */
   struct approve_operation : public base_operation
   {
      account_id_type  owner;
      asset            amount;

      extensions_type  extensions;

      account_id_type actor()const { return owner; }
      void            validate()const;
   };

} } // dollarstore::protocol

FC_REFLECT( dollarstore::protocol::transfer_operation, (from)(to)(amount)(extensions) )
FC_REFLECT( dollarstore::protocol::approve_operation, (owner)(amount)(extensions) )
