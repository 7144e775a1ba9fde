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
#include "ledger_api_impl.hxx"

#include <dollarstore/chain/reserve_object.hpp>

namespace dollarstore { namespace app {

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

ledger_api::ledger_api( dollarstore::chain::database& db )
   : my( new ledger_api_impl( db ) ) {}

ledger_api::~ledger_api() {}

ledger_api_impl::ledger_api_impl( dollarstore::chain::database& db )
:_db(db)
{
   dlog( "creating ledger api ${x}", ("x",int64_t(this)) );
}

ledger_api_impl::~ledger_api_impl()
{
   dlog( "freeing ledger api ${x}", ("x",int64_t(this)) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Reserves                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

reserve_summary ledger_api::get_reserves()const
{
   return my->get_reserves();
}

reserve_summary ledger_api_impl::get_reserves()const
{
   read_guard guard( _db.write_mutex() );
   reserve_summary summary;
   for( const reserve_object& r : _db.get_index_type<reserve_index>().indices() )
   {
      const asset_object& a = r.asset_type(_db);
      reserve_entry entry;
      entry.asset_type = r.asset_type;
      entry.symbol = a.symbol;
      entry.balance = r.balance;
      entry.supported = a.supported;
      summary.reserves.push_back( entry );
      summary.total += r.balance;
   }
   return summary;
}

share_type ledger_api::get_reserve( asset_id_type asset_id )const
{
   return my->get_reserve( asset_id );
}

share_type ledger_api_impl::get_reserve( asset_id_type asset_id )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_reserve( asset_id ).balance;
}

vector<asset_object> ledger_api::supported_stablecoins()const
{
   return my->supported_stablecoins();
}

vector<asset_object> ledger_api_impl::supported_stablecoins()const
{
   read_guard guard( _db.write_mutex() );
   vector<asset_object> result;
   const auto& idx = _db.get_index_type<asset_index>().indices().get<by_kind>();
   auto range = idx.equal_range( boost::make_tuple( asset_kind::reserve ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      if( itr->accepts_deposits() )
         result.push_back( *itr );
   return result;
}

bool ledger_api::is_supported( asset_id_type asset_id )const
{
   return my->is_supported( asset_id );
}

bool ledger_api_impl::is_supported( asset_id_type asset_id )const
{
   read_guard guard( _db.write_mutex() );
   const asset_object* a = _db.find( asset_id );
   return a != nullptr && a->accepts_deposits();
}

share_type ledger_api::get_synthetic_supply()const
{
   return my->get_synthetic_supply();
}

share_type ledger_api_impl::get_synthetic_supply()const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_synthetic_asset().dynamic_data(_db).current_supply;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Queue                                                            //
//                                                                  //
//////////////////////////////////////////////////////////////////////

share_type ledger_api::get_queue_depth( asset_id_type asset_id )const
{
   return my->get_queue_depth( asset_id );
}

share_type ledger_api_impl::get_queue_depth( asset_id_type asset_id )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_queue_depth( asset_id );
}

optional<queue_position_object> ledger_api::get_queue_position( queue_position_id_type id )const
{
   return my->get_queue_position( id );
}

optional<queue_position_object> ledger_api_impl::get_queue_position( queue_position_id_type id )const
{
   read_guard guard( _db.write_mutex() );
   const queue_position_object* position = _db.find( id );
   if( position == nullptr )
      return optional<queue_position_object>();
   return *position;
}

queue_position_info ledger_api::get_queue_position_info( queue_position_id_type id )const
{
   return my->get_queue_position_info( id );
}

queue_position_info ledger_api_impl::get_queue_position_info( queue_position_id_type id )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_queue_position_info( id );
}

vector<queue_position_id_type> ledger_api::get_user_queue_positions( account_id_type owner )const
{
   return my->get_user_queue_positions( owner );
}

vector<queue_position_id_type> ledger_api_impl::get_user_queue_positions( account_id_type owner )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_user_queue_positions( owner );
}

double ledger_api::get_fill_score( queue_position_id_type id )const
{
   return my->get_fill_score( id );
}

double ledger_api_impl::get_fill_score( queue_position_id_type id )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_fill_score( id );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Staking                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

staking_info ledger_api::get_staking_info( account_id_type owner )const
{
   return my->get_staking_info( owner );
}

staking_info ledger_api_impl::get_staking_info( account_id_type owner )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_staking_info( owner );
}

share_type ledger_api::get_stake_power( account_id_type owner )const
{
   return my->get_stake_power( owner );
}

share_type ledger_api_impl::get_stake_power( account_id_type owner )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_stake_power( owner );
}

share_type ledger_api::get_daily_fee_free_cap( account_id_type owner )const
{
   return my->get_daily_fee_free_cap( owner );
}

share_type ledger_api_impl::get_daily_fee_free_cap( account_id_type owner )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_daily_fee_free_cap( owner );
}

share_type ledger_api::get_daily_redemption_used( account_id_type owner )const
{
   return my->get_daily_redemption_used( owner );
}

share_type ledger_api_impl::get_daily_redemption_used( account_id_type owner )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_daily_redemption_used( owner );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Emission                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

emission_stats ledger_api::get_emission_stats()const
{
   return my->get_emission_stats();
}

emission_stats ledger_api_impl::get_emission_stats()const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_emission_stats();
}

emission_state_object ledger_api::get_emission_state()const
{
   return my->get_emission_state();
}

emission_state_object ledger_api_impl::get_emission_state()const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_emission_state();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Accounts                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

asset ledger_api::get_balance( account_id_type owner, asset_id_type asset_id )const
{
   return my->get_balance( owner, asset_id );
}

asset ledger_api_impl::get_balance( account_id_type owner, asset_id_type asset_id )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_balance( owner, asset_id );
}

share_type ledger_api::get_allowance( account_id_type owner, asset_id_type asset_id )const
{
   return my->get_allowance( owner, asset_id );
}

share_type ledger_api_impl::get_allowance( account_id_type owner, asset_id_type asset_id )const
{
   read_guard guard( _db.write_mutex() );
   return _db.get_allowance( owner, asset_id );
}

optional<account_object> ledger_api::get_account_by_name( string name )const
{
   return my->get_account_by_name( name );
}

optional<account_object> ledger_api_impl::get_account_by_name( const string& name )const
{
   read_guard guard( _db.write_mutex() );
   const account_object* account = _db.find_account_by_name( name );
   if( account != nullptr )
      return *account;
   return optional<account_object>();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Assets                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

optional<asset_object> ledger_api::lookup_asset_symbol( string symbol )const
{
   return my->lookup_asset_symbol( symbol );
}

optional<asset_object> ledger_api_impl::lookup_asset_symbol( const string& symbol )const
{
   read_guard guard( _db.write_mutex() );
   const asset_object* a = _db.find_asset_by_symbol( symbol );
   if( a != nullptr )
      return *a;
   return optional<asset_object>();
}

} } // dollarstore::app
