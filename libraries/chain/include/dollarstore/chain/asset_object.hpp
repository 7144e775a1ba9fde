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
#include <dollarstore/protocol/asset.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace dollarstore { namespace chain {
   class database;

   /**
    *  @brief tracks the asset information that changes frequently
    *  @ingroup object
    *  @ingroup implementation
    *
    *  Because the asset_object is very large it doesn't make sense to save an undo state
    *  for all of the parameters that never change.   This object factors out the parameters
    *  of an asset that change in almost every transaction that involves the asset.
    *
    *  This object exists as an implementation detail and its ID should never be referenced by
    *  an operation.
    */
   class asset_dynamic_data_object : public abstract_object<asset_dynamic_data_object>
   {
      public:
         static constexpr uint8_t type_id  = impl_asset_dynamic_data_object_type;

         /// The number of shares currently in existence
         share_type current_supply;
   };

   /**
    *  @brief tracks the parameters of an asset
    *  @ingroup object
    *
    *  All assets have a globally unique symbol. Assets are registered at genesis and never removed;
    *  @ref kind tells reserve stablecoins apart from the synthetic dollar and the reward token.
    */
   class asset_object : public dollarstore::db::abstract_object<asset_object>
   {
      public:
         static constexpr uint8_t type_id  = asset_object_type;

         /// This function does not check if any registered asset has this symbol or not; it simply checks whether the
         /// symbol would be valid.
         /// @return true if symbol is a valid ticker symbol; false otherwise.
         static bool is_valid_symbol( const string& symbol );

         bool is_reserve()const   { return kind == asset_kind::reserve; }
         bool is_synthetic()const { return kind == asset_kind::synthetic; }
         bool is_reward()const    { return kind == asset_kind::reward; }

         /// @return true if deposits of this asset are accepted into the reserve basket
         bool accepts_deposits()const { return is_reserve() && supported; }

         /// Helper function to get an asset object with the given amount in this asset's type
         asset amount(share_type a)const { return asset(a, asset_id_type(id)); }
         /// Asset units making up one synthetic unit; 1 for assets coarser than the synthetic
         share_type units_per_canonical()const
         {
            return precision > DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS
                   ? asset::scaled_precision( precision - DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS ) : 1;
         }
         /// Synthetic units making up one asset unit; 1 for assets at least as fine as the synthetic
         share_type canonical_per_unit()const
         {
            return precision < DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS
                   ? asset::scaled_precision( DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS - precision ) : 1;
         }

         /**
          * Normalizes an amount of this asset to synthetic units.
          * @throws amount_not_representable if @p a carries dust below synthetic precision
          */
         share_type to_canonical( const asset& a )const;
         /**
          * Expresses a synthetic amount in units of this asset.
          * @throws amount_not_representable if @p canonical is finer than one unit of this asset
          */
         asset from_canonical( share_type canonical )const;
         /// @throws amount_not_representable unless @p canonical is a whole number of units of this asset
         void validate_canonical( share_type canonical )const;

         /// Ticker symbol for this asset, i.e. "USDC"
         string symbol;
         /// Maximum number of digits after the decimal point (must be <= 18)
         uint8_t precision = 0;
         asset_kind kind = asset_kind::reserve;
         /// Whether deposits are accepted; only meaningful for reserve assets
         bool supported = true;

         /// Current supply is stored in this object
         asset_dynamic_data_id_type  dynamic_asset_data_id;

         asset_id_type get_id()const { return asset_id_type( id ); }

         void validate()const
         {
            FC_ASSERT( is_valid_symbol( symbol ), "Invalid asset symbol", ("symbol",symbol) );
            FC_ASSERT( precision <= DOLLARSTORE_MAX_ASSET_PRECISION );
         }

         template<class DB>
         const asset_dynamic_data_object& dynamic_data(const DB& db)const
         { return db.get(dynamic_asset_data_id); }
   };

   struct by_symbol;
   struct by_kind;

   using asset_object_multi_index_type = multi_index_container<
      asset_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_symbol>, member<asset_object, string, &asset_object::symbol> >,
         ordered_unique< tag<by_kind>,
            composite_key< asset_object,
               member< asset_object, asset_kind, &asset_object::kind >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;
   using asset_index = generic_index<asset_object, asset_object_multi_index_type>;

   using asset_dynamic_data_index = generic_index<asset_dynamic_data_object,
         multi_index_container< asset_dynamic_data_object,
            indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
         >
      >;

} } // dollarstore::chain

DOLLARSTORE_BIND_OBJECT_ID( dollarstore::chain::asset_object )
DOLLARSTORE_BIND_OBJECT_ID( dollarstore::chain::asset_dynamic_data_object )

FC_REFLECT_DERIVED( dollarstore::chain::asset_dynamic_data_object, (dollarstore::db::object), (current_supply) )
FC_REFLECT_DERIVED( dollarstore::chain::asset_object, (dollarstore::db::object),
                    (symbol)
                    (precision)
                    (kind)
                    (supported)
                    (dynamic_asset_data_id)
                  )

DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::asset_object )
DOLLARSTORE_DECLARE_EXTERNAL_SERIALIZATION( dollarstore::chain::asset_dynamic_data_object )
