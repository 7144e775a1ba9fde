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

#include <dollarstore/protocol/swap.hpp>

namespace dollarstore { namespace chain {

   /**
    * Deposits the source asset and redeems the synthetic it mints for the target asset. What the
    * target reserve cannot cover is either queued or fails the whole swap.
    */
   class swap_evaluator : public evaluator<swap_evaluator>
   {
      public:
         using operation_type = swap_operation;

         void_result do_evaluate( const swap_operation& o );
         swap_result do_apply( const swap_operation& o );

         share_type _canonical;
   };

   class swap_from_synthetic_evaluator : public evaluator<swap_from_synthetic_evaluator>
   {
      public:
         using operation_type = swap_from_synthetic_operation;

         void_result do_evaluate( const swap_from_synthetic_operation& o );
         swap_result do_apply( const swap_from_synthetic_operation& o );
   };

} } // dollarstore::chain
