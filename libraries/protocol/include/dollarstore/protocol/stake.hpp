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
    *  @brief Moves reward tokens from the wallet into the account's stake
    *
    *  The first stake starts the power ramp; later stakes add to the amount without
    *  restarting it. Rejected while an unstake is pending.
    */
   struct stake_operation : public base_operation
   {
      account_id_type  account;
      /// amount of the reward token
      share_type       amount;

      extensions_type  extensions;

      account_id_type actor()const { return account; }
      void            validate()const;
   };

   /**
    *  @ingroup operations
    *  @brief Starts the unstake cooldown; power drops to zero immediately
    */
   struct unstake_operation : public base_operation
   {
      account_id_type  account;
      extensions_type  extensions;

      account_id_type actor()const { return account; }
   };

   /**
    *  @ingroup operations
    *  @brief Returns the staked amount to the wallet once the cooldown has elapsed
    */
   struct unstake_complete_operation : public base_operation
   {
      account_id_type  account;
      extensions_type  extensions;

      account_id_type actor()const { return account; }
   };

   /**
    *  @ingroup operations
    *  @brief Abandons a pending unstake and restarts the power ramp
    */
   struct unstake_cancel_operation : public base_operation
   {
      account_id_type  account;
      extensions_type  extensions;

      account_id_type actor()const { return account; }
   };

} } // dollarstore::protocol

FC_REFLECT( dollarstore::protocol::stake_operation, (account)(amount)(extensions) )
FC_REFLECT( dollarstore::protocol::unstake_operation, (account)(extensions) )
FC_REFLECT( dollarstore::protocol::unstake_complete_operation, (account)(extensions) )
FC_REFLECT( dollarstore::protocol::unstake_cancel_operation, (account)(extensions) )
