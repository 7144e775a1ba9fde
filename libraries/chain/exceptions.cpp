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
#include <dollarstore/chain/exceptions.hpp>

namespace dollarstore { namespace chain {

   // Internal exceptions

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "ledger exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,      chain_exception, 3010000,
                                   "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_process_exception, chain_exception, 3030000,
                                   "transaction processing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception,  chain_exception, 3050000,
                                   "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,       chain_exception, 3070000,
                                   "undo database exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( pop_empty_chain, undo_database_exception, 3070001,
                                   "there are no undo states to pop" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unsupported_asset,        operation_evaluate_exception, 3050001,
                                   "asset is not a supported reserve asset" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_reserves,    operation_evaluate_exception, 3050002,
                                   "insufficient reserves" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_allowance,   operation_evaluate_exception, 3050003,
                                   "insufficient allowance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,     operation_evaluate_exception, 3050004,
                                   "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( position_not_found,       operation_evaluate_exception, 3050005,
                                   "queue position not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_owner,                operation_evaluate_exception, 3050006,
                                   "caller does not own the queue position" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_unstaking,        operation_evaluate_exception, 3050007,
                                   "an unstake is already pending" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( cooldown_not_complete,    operation_evaluate_exception, 3050008,
                                   "unstake cooldown has not elapsed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_unstaking,            operation_evaluate_exception, 3050009,
                                   "no unstake is pending" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_staked,               operation_evaluate_exception, 3050010,
                                   "nothing is staked" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( amount_not_representable, operation_evaluate_exception, 3050011,
                                   "amount is not representable in synthetic units" )

} } // dollarstore::chain
