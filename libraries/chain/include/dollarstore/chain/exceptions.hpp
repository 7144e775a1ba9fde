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

#include <fc/exception/exception.hpp>
#include <dollarstore/protocol/exceptions.hpp>
#include <dollarstore/protocol/operations.hpp>
#include <dollarstore/chain/types.hpp>

#define DOLLARSTORE_TRY_NOTIFY( signal, ... )                                 \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in event observer: ${e}",                       \
            ("e", e.to_detail_string() ) );                                   \
   }

namespace dollarstore { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     dollarstore::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_process_exception,dollarstore::chain::chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, dollarstore::chain::chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,      dollarstore::chain::chain_exception, 3070000 )

   FC_DECLARE_DERIVED_EXCEPTION( pop_empty_chain,              dollarstore::chain::undo_database_exception, 3070001 )

   FC_DECLARE_DERIVED_EXCEPTION( unsupported_asset,        dollarstore::chain::operation_evaluate_exception, 3050001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_reserves,    dollarstore::chain::operation_evaluate_exception, 3050002 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_allowance,   dollarstore::chain::operation_evaluate_exception, 3050003 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,     dollarstore::chain::operation_evaluate_exception, 3050004 )
   FC_DECLARE_DERIVED_EXCEPTION( position_not_found,       dollarstore::chain::operation_evaluate_exception, 3050005 )
   FC_DECLARE_DERIVED_EXCEPTION( not_owner,                dollarstore::chain::operation_evaluate_exception, 3050006 )
   FC_DECLARE_DERIVED_EXCEPTION( already_unstaking,        dollarstore::chain::operation_evaluate_exception, 3050007 )
   FC_DECLARE_DERIVED_EXCEPTION( cooldown_not_complete,    dollarstore::chain::operation_evaluate_exception, 3050008 )
   FC_DECLARE_DERIVED_EXCEPTION( not_unstaking,            dollarstore::chain::operation_evaluate_exception, 3050009 )
   FC_DECLARE_DERIVED_EXCEPTION( not_staked,               dollarstore::chain::operation_evaluate_exception, 3050010 )
   FC_DECLARE_DERIVED_EXCEPTION( amount_not_representable, dollarstore::chain::operation_evaluate_exception, 3050011 )

} } // dollarstore::chain
