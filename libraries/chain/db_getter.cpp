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

#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/emission_object.hpp>
#include <dollarstore/chain/global_property_object.hpp>

namespace dollarstore { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return *_p_global_prop_obj;
}

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return *_p_dyn_global_prop_obj;
}

const chain_parameters& database::get_chain_parameters()const
{
   return get_global_properties().parameters;
}

const emission_state_object& database::get_emission_state()const
{
   return *_p_emission_state_obj;
}

const asset_object& database::get_synthetic_asset()const
{
   return *_p_synthetic_asset_obj;
}

const asset_object& database::get_reward_asset()const
{
   return *_p_reward_asset_obj;
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

const account_object* database::find_account_by_name( const string& name )const
{
   const auto& idx = get_index_type<account_index>().indices().get<by_name>();
   auto itr = idx.find( name );
   return itr == idx.end() ? nullptr : &*itr;
}

const asset_object* database::find_asset_by_symbol( const string& symbol )const
{
   const auto& idx = get_index_type<asset_index>().indices().get<by_symbol>();
   auto itr = idx.find( symbol );
   return itr == idx.end() ? nullptr : &*itr;
}

const asset_object& database::get_depositable_asset( asset_id_type id )const
{
   const asset_object* a = find( id );
   DOLLARSTORE_ASSERT( a != nullptr && a->accepts_deposits(), unsupported_asset,
                       "Asset ${a} is not accepted into the reserve", ("a",id) );
   return *a;
}

const asset_object& database::get_reserve_asset( asset_id_type id )const
{
   const asset_object* a = find( id );
   DOLLARSTORE_ASSERT( a != nullptr && a->is_reserve(), unsupported_asset,
                       "Asset ${a} is not a reserve asset", ("a",id) );
   return *a;
}

} }
