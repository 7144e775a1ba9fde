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
#include <dollarstore/chain/account_object.hpp>

#include <fc/io/raw.hpp>

namespace dollarstore { namespace chain {

void account_balance_object::adjust_balance(const asset& delta)
{
   FC_ASSERT( delta.asset_id == asset_type );
   balance += delta.amount;
}

} } // dollarstore::chain

DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::account_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::account_balance_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::token_allowance_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::account_statistics_object )
