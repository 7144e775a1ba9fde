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
#include <dollarstore/protocol/transaction.hpp>

#include <fc/io/raw.hpp>

namespace dollarstore { namespace protocol {

fc::sha256 transaction::digest()const
{
   fc::sha256::encoder enc;
   fc::raw::pack( enc, *this );
   return enc.result();
}

void transaction::validate() const
{
   FC_ASSERT( operations.size() > 0, "A transaction must have at least one operation", ("trx",*this) );
   for( const auto& op : operations )
   {
      FC_ASSERT( !is_virtual_operation( op ), "Virtual operations cannot be pushed", ("op",op) );
      operation_validate( op );
   }
}

void transaction::get_impacted_accounts( flat_set<account_id_type>& impacted )const
{
   for( const auto& op : operations )
      operation_get_impacted_accounts( op, impacted );
}

} } // dollarstore::protocol

DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::protocol::transaction )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::protocol::processed_transaction )
