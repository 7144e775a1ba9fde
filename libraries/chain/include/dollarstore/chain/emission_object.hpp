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
#include <dollarstore/chain/types.hpp>
#include <dollarstore/db/generic_index.hpp>

namespace dollarstore { namespace chain {

   /**
    * @class emission_state_object
    * @brief Minting counters of the three capped reward pools
    * @ingroup object
    * @ingroup implementation
    *
    * Singleton. Each counter only grows and never passes its cap.
    */
   class emission_state_object : public abstract_object<emission_state_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_emission_state_object_type;

         share_type maker_cap;
         share_type maker_minted;
         share_type taker_cap;
         share_type taker_minted;
         share_type founder_cap;
         share_type founder_vested;

         share_type maker_remaining()const { return maker_cap - maker_minted; }
         share_type taker_remaining()const { return taker_cap - taker_minted; }
         share_type founder_remaining()const { return founder_cap - founder_vested; }
         share_type total_minted()const { return maker_minted + taker_minted + founder_vested; }
         share_type total_cap()const { return maker_cap + taker_cap + founder_cap; }
   };

   struct emission_stats
   {
      share_type maker_remaining;
      share_type taker_remaining;
      share_type founder_vested;
      share_type total_minted;
   };

   using emission_state_index = generic_index<emission_state_object,
         multi_index_container< emission_state_object,
            indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
         >
      >;

} } // dollarstore::chain


FC_REFLECT( dollarstore::chain::emission_stats, (maker_remaining)(taker_remaining)(founder_vested)(total_minted) )

FC_REFLECT_DERIVED( dollarstore::chain::emission_state_object, (dollarstore::db::object),
                    (maker_cap)(maker_minted)(taker_cap)(taker_minted)(founder_cap)(founder_vested) )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::emission_state_object )
