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

#include <dollarstore/protocol/reserve.hpp>

namespace dollarstore { namespace chain {

   class deposit_evaluator : public evaluator<deposit_evaluator>
   {
      public:
         using operation_type = deposit_operation;

         void_result do_evaluate( const deposit_operation& o );
         /// @return the synthetic minted
         asset do_apply( const deposit_operation& o );
   };

   class withdraw_evaluator : public evaluator<withdraw_evaluator>
   {
      public:
         using operation_type = withdraw_operation;

         void_result do_evaluate( const withdraw_operation& o );
         /// @return the reserve asset paid out
         asset do_apply( const withdraw_operation& o );

         share_type _canonical;
   };

} } // dollarstore::chain
