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
#include <dollarstore/chain/database.hpp>
#include <dollarstore/chain/evaluator.hpp>
#include <dollarstore/chain/exceptions.hpp>
#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/operation_history_object.hpp>
#include <dollarstore/chain/transaction_evaluation_state.hpp>

namespace dollarstore { namespace chain {

/**
 * Attempts to push the transaction onto the ledger state. Listeners of applied_transaction are
 * notified once the writer lock has been released, so they may read through ledger_api. A commit
 * waits for the one before it to be published, so listeners see transactions in commit order.
 */
processed_transaction database::push_transaction( const transaction& trx )
{ try {
   processed_transaction result;
   vector<operation_history_object> applied;
   uint64_t trx_num = 0;
   {
      std::lock_guard<std::mutex> guard( _write_mutex );
      result = _push_transaction( trx );
      trx_num = get_dynamic_global_properties().transaction_count;
      applied.reserve( _applied_ops.size() );
      for( const auto& oh : _applied_ops )
         if( oh.valid() )
            applied.push_back( *oh );
   }

   std::unique_lock<std::mutex> turn( _publish_mutex );
   _publish_turn.wait( turn, [this,trx_num]() { return _published_trx_num + 1 == trx_num; } );
   auto pass_turn = [this,trx_num,&turn]() {
      _published_trx_num = trx_num;
      turn.unlock();
      _publish_turn.notify_all();
   };
   try
   {
      DOLLARSTORE_TRY_NOTIFY( applied_transaction, result, applied )
   }
   catch( ... )
   {
      pass_turn();
      throw;
   }
   pass_turn();
   return result;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::_push_transaction( const transaction& trx )
{
   _applied_ops.clear();

   // The session is discarded by its destructor if _apply_transaction fails, which rolls back
   // every object created, modified or removed by the transaction.
   auto session = _undo_db.start_undo_session();
   processed_transaction processed_trx;
   try
   {
      processed_trx = _apply_transaction( trx );
   }
   catch( const fc::exception& e )
   {
      wlog( "Rolling back transaction: ${e}", ("e", e.to_string()) );
      _applied_ops.clear();
      throw;
   }
   session.commit();

   dlog( "Applied transaction ${n} with ${o} operations and ${a} records",
         ("n", get_dynamic_global_properties().transaction_count)
         ("o", trx.operations.size())("a", _applied_ops.size()) );
   return processed_trx;
}

processed_transaction database::validate_transaction( const transaction& trx )
{
   std::lock_guard<std::mutex> guard( _write_mutex );
   _applied_ops.clear();
   auto session = _undo_db.start_undo_session();
   processed_transaction result;
   try
   {
      result = _apply_transaction( trx );
   }
   catch( const fc::exception& )
   {
      _applied_ops.clear();
      throw;
   }
   _applied_ops.clear();
   return result;
}

processed_transaction database::_apply_transaction( const transaction& trx )
{ try {
   trx.validate();

   transaction_evaluation_state eval_state(this);

   modify( get_dynamic_global_properties(), []( dynamic_global_property_object& dgp ) {
      ++dgp.transaction_count;
   });

   processed_transaction ptrx(trx);
   _current_op_in_trx = 0;
   for( const auto& op : ptrx.operations )
   {
      _current_virtual_op = 0;
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );
      ++_current_op_in_trx;
   }
   ptrx.operation_results = std::move( eval_state.operation_results );

   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   const auto which = static_cast<size_t>( op.which() );
   FC_ASSERT( which < _operation_evaluators.size() && _operation_evaluators[which],
              "No registered evaluator for this operation" );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[which];
   auto op_id = push_applied_operation( op );
   auto result = eval->evaluate( eval_state, op, true );
   set_applied_operation_result( op_id, result );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back( operation_history_object(op) );
   operation_history_object& oh = *(_applied_ops.back());
   oh.trx_num    = get_dynamic_global_properties().transaction_count;
   oh.op_in_trx  = _current_op_in_trx;
   oh.virtual_op = _current_virtual_op++;
   oh.time       = head_time();
   return _applied_ops.size() - 1;
}

void database::set_applied_operation_result( uint32_t op_id, const operation_result& result )
{
   FC_ASSERT( op_id < _applied_ops.size() );
   if( _applied_ops[op_id] )
      _applied_ops[op_id]->result = result;
   else
   {
      elog( "Could not set operation result (trx_num=${n})",
            ("n", get_dynamic_global_properties().transaction_count) );
   }
}

const vector<optional< operation_history_object > >& database::get_applied_operations()const
{
   return _applied_ops;
}

} }
