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
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/exceptions.hpp>

#include <fc/io/raw.hpp>

#include <locale>

namespace dollarstore { namespace chain {

/**
 *  Valid symbols can contain [A-Z0-9], and '.'
 *  They must start with [A, Z]
 *  They must end with [A-Z0-9]
 *  They can contain a maximum of one '.'
 */
bool asset_object::is_valid_symbol( const string& symbol )
{
   static const std::locale& loc = std::locale::classic();
   if( symbol.size() < DOLLARSTORE_MIN_ASSET_SYMBOL_LENGTH )
      return false;

   if( symbol.size() > DOLLARSTORE_MAX_ASSET_SYMBOL_LENGTH )
      return false;

   if( !isalpha( symbol.front(), loc ) )
      return false;

   if( !isalnum( symbol.back(), loc ) )
      return false;

   bool dot_already_present = false;
   for( const auto c : symbol )
   {
      if( (isalpha( c, loc ) && isupper( c, loc )) || isdigit( c, loc ) )
         continue;

      if( c == '.' )
      {
         if( dot_already_present )
            return false;

         dot_already_present = true;
         continue;
      }

      return false;
   }

   return true;
}

share_type asset_object::to_canonical( const asset& a )const
{
   FC_ASSERT( a.asset_id == get_id() );
   const share_type per_canonical = units_per_canonical();
   DOLLARSTORE_ASSERT( a.amount.value % per_canonical.value == 0, amount_not_representable,
                       "${a} ${s} has precision beyond ${d} decimals",
                       ("a",a.amount)("s",symbol)("d",DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS) );
   return a.amount / per_canonical * canonical_per_unit();
}

void asset_object::validate_canonical( share_type canonical )const
{
   DOLLARSTORE_ASSERT( canonical.value % canonical_per_unit().value == 0, amount_not_representable,
                       "${c} synthetic units are not a whole amount of ${s}, which has ${p} decimals",
                       ("c",canonical)("s",symbol)("p",precision) );
}

asset asset_object::from_canonical( share_type canonical )const
{
   validate_canonical( canonical );
   return amount( canonical / canonical_per_unit() * units_per_canonical() );
}

} } // dollarstore::chain

DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::asset_object )
DOLLARSTORE_IMPLEMENT_EXTERNAL_SERIALIZATION( dollarstore::chain::asset_dynamic_data_object )
