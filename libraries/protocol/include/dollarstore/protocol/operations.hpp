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
#include <dollarstore/protocol/account.hpp>
#include <dollarstore/protocol/token.hpp>
#include <dollarstore/protocol/reserve.hpp>
#include <dollarstore/protocol/swap.hpp>
#include <dollarstore/protocol/queue.hpp>
#include <dollarstore/protocol/stake.hpp>
#include <dollarstore/protocol/virtual_operations.hpp>

namespace dollarstore { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   using operation = fc::static_variant<
            /*  0 */ account_create_operation,
            /*  1 */ transfer_operation,
            /*  2 */ approve_operation,
            /*  3 */ deposit_operation,
            /*  4 */ withdraw_operation,
            /*  5 */ swap_operation,
            /*  6 */ swap_from_synthetic_operation,
            /*  7 */ queue_join_operation,
            /*  8 */ queue_cancel_operation,
            /*  9 */ stake_operation,
            /* 10 */ unstake_operation,
            /* 11 */ unstake_complete_operation,
            /* 12 */ unstake_cancel_operation,
            /* 13 */ deposited_operation,          // VIRTUAL
            /* 14 */ withdrawn_operation,          // VIRTUAL
            /* 15 */ queue_joined_operation,       // VIRTUAL
            /* 16 */ queue_filled_operation,       // VIRTUAL
            /* 17 */ queue_cancelled_operation,    // VIRTUAL
            /* 18 */ staked_operation,             // VIRTUAL
            /* 19 */ unstake_initiated_operation,  // VIRTUAL
            /* 20 */ unstake_completed_operation,  // VIRTUAL
            /* 21 */ unstake_cancelled_operation,  // VIRTUAL
            /* 22 */ reward_minted_operation       // VIRTUAL
         >;

   /// @} // operations group

   /// Collects every account an operation (user or virtual) concerns
   void operation_get_impacted_accounts( const operation& op, flat_set<account_id_type>& result );

   bool is_virtual_operation( const operation& op );

   void operation_validate( const operation& op );

} } // dollarstore::protocol

FC_REFLECT_TYPENAME( dollarstore::protocol::operation )
