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

#include <fc/crypto/sha256.hpp>

namespace dollarstore { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * All transactions are sets of operations that must be applied atomically. Transactions must
    * be pushed to the ledger one at a time; the ledger applies them in arrival order.
    *
    * Signing and account authentication happen outside the ledger: the account named by an
    * operation is taken to be its authorized caller.
    */

   /**
    *  @brief groups operations that should be applied atomically
    */
   class transaction
   {
   public:
      /**
       * A list of operations to be applied in this transaction, in order. Virtual operations
       * are rejected by validate().
       */
      vector<operation>  operations;
      extensions_type    extensions;

      /// Calculate the digest for a transaction
      fc::sha256         digest()const;

      void validate() const;

      template<typename Visitor>
      vector<typename Visitor::result_type> visit( Visitor&& visitor )
      {
         vector<typename Visitor::result_type> results;
         for( auto& op : operations )
            results.push_back(op.visit( std::forward<Visitor>( visitor ) ));
         return results;
      }
      template<typename Visitor>
      vector<typename Visitor::result_type> visit( Visitor&& visitor )const
      {
         vector<typename Visitor::result_type> results;
         for( auto& op : operations )
            results.push_back(op.visit( std::forward<Visitor>( visitor ) ));
         return results;
      }

      void get_impacted_accounts( flat_set<account_id_type>& impacted )const;
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    *
    *  When processing a transaction some operations generate new object IDs and these IDs
    *  cannot be known until the transaction is actually included in the ledger. A processed
    *  transaction carries the results of each operation in the order they were applied.
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // dollarstore::protocol

FC_REFLECT( dollarstore::protocol::transaction, (operations)(extensions) )
FC_REFLECT_DERIVED( dollarstore::protocol::processed_transaction, (dollarstore::protocol::transaction),
                    (operation_results) )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::protocol::transaction )
DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::protocol::processed_transaction )
