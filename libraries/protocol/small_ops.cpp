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
#include <dollarstore/protocol/token.hpp>
#include <dollarstore/protocol/reserve.hpp>
#include <dollarstore/protocol/swap.hpp>
#include <dollarstore/protocol/queue.hpp>
#include <dollarstore/protocol/stake.hpp>

namespace dollarstore { namespace protocol {

void transfer_operation::validate()const
{
   FC_ASSERT( from != to, "Cannot transfer to self" );
   validate_positive( amount.amount, "transfer amount" );
}

void approve_operation::validate()const
{
   FC_ASSERT( amount.amount >= 0, "Allowance cannot be negative" );
}

void deposit_operation::validate()const
{
   validate_positive( amount.amount, "deposit amount" );
}

void withdraw_operation::validate()const
{
   validate_positive( amount.amount, "withdraw amount" );
}

void swap_operation::validate()const
{
   validate_positive( amount.amount, "swap amount" );
   DOLLARSTORE_ASSERT( amount.asset_id != to_asset, same_asset_swap,
                       "Cannot swap ${a} for itself", ("a",to_asset) );
}

void swap_from_synthetic_operation::validate()const
{
   validate_positive( amount, "swap amount" );
}

void queue_join_operation::validate()const
{
   validate_positive( amount, "queue amount" );
}

void stake_operation::validate()const
{
   validate_positive( amount, "stake amount" );
}

} } // dollarstore::protocol
