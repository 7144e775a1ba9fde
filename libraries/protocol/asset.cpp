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
#include <dollarstore/protocol/asset.hpp>

#include <fc/io/raw.hpp>

namespace dollarstore { namespace protocol {

   const int64_t scaled_precision_lut[19] =
   {
      int64_t(1ll), int64_t(10ll), int64_t(100ll), int64_t(1000ll),
      int64_t(10000ll), int64_t(100000ll), int64_t(1000000ll), int64_t(10000000ll),
      int64_t(100000000ll), int64_t(1000000000ll), int64_t(10000000000ll), int64_t(100000000000ll),
      int64_t(1000000000000ll), int64_t(10000000000000ll), int64_t(100000000000000ll), int64_t(1000000000000000ll),
      int64_t(10000000000000000ll), int64_t(100000000000000000ll), int64_t(1000000000000000000ll)
   };

} } // dollarstore::protocol

DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::protocol::asset )
