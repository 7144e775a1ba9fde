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
#include <dollarstore/chain/evaluator.hpp>

#include <dollarstore/protocol/stake.hpp>

namespace dollarstore { namespace chain {

   class stake_object;

   class stake_evaluator : public evaluator<stake_evaluator>
   {
      public:
         using operation_type = stake_operation;

         void_result do_evaluate( const stake_operation& o );
         void_result do_apply( const stake_operation& o );

         const stake_object* _stake = nullptr;
   };

   class unstake_evaluator : public evaluator<unstake_evaluator>
   {
      public:
         using operation_type = unstake_operation;

         void_result do_evaluate( const unstake_operation& o );
         void_result do_apply( const unstake_operation& o );

         const stake_object* _stake = nullptr;
   };

   class unstake_complete_evaluator : public evaluator<unstake_complete_evaluator>
   {
      public:
         using operation_type = unstake_complete_operation;

         void_result do_evaluate( const unstake_complete_operation& o );
         void_result do_apply( const unstake_complete_operation& o );

         const stake_object* _stake = nullptr;
   };

   class unstake_cancel_evaluator : public evaluator<unstake_cancel_evaluator>
   {
      public:
         using operation_type = unstake_cancel_operation;

         void_result do_evaluate( const unstake_cancel_operation& o );
         void_result do_apply( const unstake_cancel_operation& o );

         const stake_object* _stake = nullptr;
   };

} } // dollarstore::chain
