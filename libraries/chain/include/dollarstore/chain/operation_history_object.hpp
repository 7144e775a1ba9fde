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
#include <dollarstore/protocol/operations.hpp>
#include <dollarstore/chain/types.hpp>
#include <dollarstore/db/object.hpp>

namespace dollarstore { namespace chain {

   /**
    * @brief tracks the history of all logical operations on ledger state
    * @ingroup object
    * @ingroup implementation
    *
    *  Every operation and every virtual operation applied within a transaction is recorded as an
    *  operation_history_object. The records of the last pushed transaction are available from
    *  database::get_applied_operations() and are published by database::applied_transaction.
    *
    *  @note  this object is READ ONLY it can never be modified
    */
   class operation_history_object : public abstract_object<operation_history_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_operation_history_object_type;

         operation_history_object( const operation& o ):op(o){}
         operation_history_object(){}

         operation         op;
         operation_result  result;
         /** sequence number of the transaction that caused this operation */
         uint64_t          trx_num = 0;
         /** the operation within the transaction */
         uint16_t          op_in_trx = 0;
         /** any virtual operations implied by operation in transaction */
         uint16_t          virtual_op = 0;
         /** ledger time at which the transaction was applied */
         time_point_sec    time;
   };

} } // dollarstore::chain

FC_REFLECT_DERIVED( dollarstore::chain::operation_history_object, (dollarstore::db::object),
                    (op)(result)(trx_num)(op_in_trx)(virtual_op)(time) )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::operation_history_object )
