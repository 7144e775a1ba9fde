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
#include <dollarstore/chain/global_property_object.hpp>

namespace dollarstore { namespace chain {

void database::advance_time( time_point_sec new_time )
{ try {
   std::lock_guard<std::mutex> guard( _write_mutex );
   const dynamic_global_property_object& dgp = get_dynamic_global_properties();
   FC_ASSERT( new_time >= dgp.time, "Ledger time cannot move backwards",
              ("head_time",dgp.time)("new_time",new_time) );

   // no session is open under the writer lock, so the new time is permanent
   modify( dgp, [new_time]( dynamic_global_property_object& p ) {
      p.time = new_time;
   });
} FC_CAPTURE_AND_RETHROW( (new_time) ) }

} }
