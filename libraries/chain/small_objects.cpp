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
#include <dollarstore/chain/emission_object.hpp>
#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/operation_history_object.hpp>
#include <dollarstore/chain/queue_position_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>

#include <fc/io/raw.hpp>

DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::dynamic_global_property_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::global_property_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::emission_state_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::operation_history_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::queue_position_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::reserve_object )
