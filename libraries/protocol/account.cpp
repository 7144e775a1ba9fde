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
#include <dollarstore/protocol/account.hpp>

namespace dollarstore { namespace protocol {

/**
 * Names must satisfy the following rules:
 *
 * - Length is between (inclusive) DOLLARSTORE_MIN_ACCOUNT_NAME_LENGTH and DOLLARSTORE_MAX_ACCOUNT_NAME_LENGTH
 * - The name begins with a lowercase letter
 * - The name ends with a lowercase letter or digit
 * - The name contains only lowercase letters, digits or hyphens
 */
bool is_valid_name( const string& name )
{
   const size_t len = name.size();
   if( len < DOLLARSTORE_MIN_ACCOUNT_NAME_LENGTH )
      return false;

   if( len > DOLLARSTORE_MAX_ACCOUNT_NAME_LENGTH )
      return false;

   auto is_lower = []( char c ) { return c >= 'a' && c <= 'z'; };
   auto is_digit = []( char c ) { return c >= '0' && c <= '9'; };

   if( !is_lower( name.front() ) )
      return false;
   if( !is_lower( name.back() ) && !is_digit( name.back() ) )
      return false;
   for( size_t i = 1; i + 1 < len; ++i )
   {
      const char c = name[i];
      if( !is_lower(c) && !is_digit(c) && c != '-' )
         return false;
   }
   return true;
}

void account_create_operation::validate()const
{
   FC_ASSERT( is_valid_name( name ), "Invalid account name", ("name",name) );
}

} } // dollarstore::protocol
