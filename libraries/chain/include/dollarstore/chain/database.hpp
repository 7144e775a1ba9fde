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
#include <dollarstore/chain/global_property_object.hpp>
#include <dollarstore/chain/account_object.hpp>
#include <dollarstore/chain/asset_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>
#include <dollarstore/chain/queue_position_object.hpp>
#include <dollarstore/chain/stake_object.hpp>
#include <dollarstore/chain/emission_object.hpp>
#include <dollarstore/chain/operation_history_object.hpp>
#include <dollarstore/chain/genesis_state.hpp>
#include <dollarstore/chain/evaluator.hpp>

#include <dollarstore/db/object_database.hpp>
#include <dollarstore/db/object.hpp>
#include <dollarstore/db/generic_index.hpp>
#include <dollarstore/protocol/transaction.hpp>

#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

#include <map>
#include <condition_variable>
#include <mutex>

namespace dollarstore { namespace chain {
   using dollarstore::db::abstract_object;
   using dollarstore::db::object;
   class op_evaluator;
   class transaction_evaluation_state;

   /**
    *   @class database
    *   @brief tracks the ledger state in an extensible manner
    *
    *   Holds the reserve ledger, the queue store, the stake ledger and the emission counters as indexed
    *   objects. Every change goes through push_transaction(), which applies a transaction atomically
    *   under a single writer lock.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Create the initial objects of the ledger
          *
          * Must be called once, before any transaction is pushed.
          */
         void init_genesis(const genesis_state_type& genesis_state = create_default_genesis());

         //////////////////// db_block.cpp ////////////////////

         /**
          * Applies @p trx atomically: either every operation in it takes effect or the ledger is left
          * untouched and the exception is rethrown. Concurrent callers are serialized.
          */
         processed_transaction push_transaction( const transaction& trx );

         /**
          * This method is used to track applied operations during the evaluation of a transaction.
          */
         uint32_t  push_applied_operation( const operation& op );
         void      set_applied_operation_result( uint32_t op_id, const operation_result& r );
         /// operations and events of the last transaction pushed; cleared by the next push
         const vector<optional< operation_history_object > >& get_applied_operations()const;

         /**
          *  This signal is emitted after a transaction has been committed, with the operations and
          *  events it applied, in order. Transactions are published in commit order. The signal is
          *  emitted outside the writer lock, so observers may read the ledger, but they must not push
          *  transactions themselves.
          */
         fc::signal<void(const processed_transaction&, const vector<operation_history_object>&)> applied_transaction;

         /**
          * Evaluates @p trx against the current state and discards its effects.
          */
         processed_transaction validate_transaction( const transaction& trx );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         /// The lock every write and every consistent read must hold
         std::mutex& write_mutex()const { return _write_mutex; }

         //////////////////// db_update.cpp ////////////////////

         /// Moves ledger time forward; time never goes backwards
         void advance_time( time_point_sec new_time );

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const chain_parameters&                get_chain_parameters()const;
         const emission_state_object&           get_emission_state()const;
         const asset_object&                    get_synthetic_asset()const;
         const asset_object&                    get_reward_asset()const;

         time_point_sec   head_time()const;

         const account_object* find_account_by_name( const string& name )const;
         const asset_object*   find_asset_by_symbol( const string& symbol )const;

         /// @throws unsupported_asset unless @p id is a reserve asset accepting deposits
         const asset_object& get_depositable_asset( asset_id_type id )const;
         /// @throws unsupported_asset unless @p id is a reserve asset
         const asset_object& get_reserve_asset( asset_id_type id )const;

         //////////////////// db_balance.cpp ////////////////////
         /**
          * @brief Retrieve a particular account's balance in a given asset
          * @param owner Account whose balance should be retrieved
          * @param asset_id ID of the asset to get balance in
          * @return owner's balance in asset
          */
         asset get_balance(account_id_type owner, asset_id_type asset_id)const;
         /// This is an overloaded method.
         asset get_balance(const account_object& owner, const asset_object& asset_obj)const;

         /**
          * @brief Adjust a particular account's balance in a given asset by a delta
          * @param account ID of account whose balance should be adjusted
          * @param delta Asset ID and amount to adjust balance by
          */
         void adjust_balance(account_id_type account, asset delta);

         /// Changes the recorded supply of an asset; used when the ledger mints or burns
         void adjust_supply( const asset& delta );

         share_type get_allowance( account_id_type owner, asset_id_type asset_id )const;
         void       set_allowance( account_id_type owner, const asset& amount );

         /**
          * Moves @p amount out of the owner's wallet into ledger custody, consuming allowance.
          * Callers check allowance and balance during evaluation.
          */
         void pull_with_allowance( account_id_type owner, const asset& amount );

         //////////////////// db_reserve.cpp ////////////////////

         const reserve_object& get_reserve( asset_id_type asset_id )const;
         /// Sum of all reserve balances, in synthetic units
         share_type            get_total_reserves()const;

         /**
          * Adds a deposit already taken into custody to the reserve and mints the same value of
          * synthetic to @p depositor.
          * @return the synthetic amount minted
          */
         share_type credit_reserve( const asset& amount, account_id_type depositor );

         /**
          * Burns @p amount synthetic from @p holder's wallet and pays the same value of the reserve
          * asset out of the basket to it.
          * @return the reserve asset paid
          */
         asset      debit_reserve( asset_id_type asset_id, share_type amount, account_id_type holder );

         /**
          * Checks a deposit of @p amount by @p depositor against ledger state.
          * @return the deposit in synthetic units
          */
         share_type check_deposit( account_id_type depositor, const asset& amount )const;

         /// Takes the deposit into custody, credits the reserve and fills waiting queue positions
         share_type apply_deposit( account_id_type depositor, const asset& amount );

         /**
          * Redeems @p amount synthetic from @p holder's wallet for @p asset_id. What the reserve cannot
          * cover is queued when @p queue_if_unavailable is set.
          */
         swap_result apply_redemption( account_id_type holder, asset_id_type asset_id, share_type amount,
                                       bool queue_if_unavailable );

         /// Synthetic redeemed by @p account for reserve assets today
         share_type get_daily_redemption_used( account_id_type account )const;

         //////////////////// db_queue.cpp ////////////////////

         /**
          * Escrows @p amount synthetic from @p owner's wallet in a new position at the tail of
          * @p asset_id's line.
          */
         const queue_position_object& enqueue( asset_id_type asset_id, share_type amount, account_id_type owner );

         /**
          * Fills open positions of @p asset_id oldest first from @p available synthetic worth of
          * newly deposited reserve, then rewards @p taker for what was cleared.
          * @return the filled positions with the amount each received
          */
         vector<std::pair<queue_position_id_type, share_type>> drain_queue( asset_id_type asset_id,
                                                                           share_type available,
                                                                           account_id_type taker );

         /// @return the synthetic refunded to @p caller
         share_type cancel_queue_position( queue_position_id_type id, account_id_type caller );

         /// @throws position_not_found if the position does not exist or is no longer open
         const queue_position_object& get_open_queue_position( queue_position_id_type id )const;

         share_type                      get_queue_depth( asset_id_type asset_id )const;
         queue_position_info             get_queue_position_info( queue_position_id_type id )const;
         vector<queue_position_id_type>  get_user_queue_positions( account_id_type owner )const;

         /**
          * Display score of an open position: (1 + power / sqrt(remaining dollars)) * seconds queued.
          * It has no influence on fill order.
          */
         double                          get_fill_score( queue_position_id_type id )const;

         //////////////////// db_stake.cpp ////////////////////

         const stake_object* find_stake( account_id_type owner )const;
         share_type          get_stake_power( account_id_type owner )const;
         share_type          get_daily_fee_free_cap( account_id_type owner )const;
         staking_info        get_staking_info( account_id_type owner )const;

         //////////////////// db_emission.cpp ////////////////////

         /**
          * Mints the maker reward for @p filled synthetic that waited @p seconds_queued, clipped to
          * what is left under the maker cap.
          * @return the amount minted
          */
         share_type mint_maker_reward( account_id_type owner, share_type filled, uint32_t seconds_queued );
         /// Mints the taker reward for @p cleared synthetic, clipped to what is left under the taker cap
         share_type mint_taker_reward( account_id_type taker, share_type cleared );

         emission_stats get_emission_stats()const;

         //////////////////// db_init.cpp ////////////////////

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

      protected:
         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();

      private:
         processed_transaction _push_transaction( const transaction& trx );
         processed_transaction _apply_transaction( const transaction& trx );

         /// Settles @p amount of a position's escrow against the basket and pays its owner
         asset _settle_from_reserve( const reserve_object& reserve, share_type amount, account_id_type recipient );
         void  _record_redemption( account_id_type account, share_type amount );

         void  _mint_reward( account_id_type account, reward_category category, share_type amount );
         void  _vest_founder();

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;

         /**
          * Contains the set of ops that are in the process of being applied from
          * the current transaction.
          */
         vector<optional<operation_history_object> >  _applied_ops;

         uint16_t                          _current_op_in_trx    = 0;
         uint16_t                          _current_virtual_op   = 0;

         mutable std::mutex                _write_mutex;

         /// number of the last committed transaction handed to applied_transaction
         uint64_t                          _published_trx_num = 0;
         std::mutex                        _publish_mutex;
         std::condition_variable           _publish_turn;

         const global_property_object*          _p_global_prop_obj          = nullptr;
         const dynamic_global_property_object*  _p_dyn_global_prop_obj      = nullptr;
         const emission_state_object*           _p_emission_state_obj       = nullptr;
         const asset_object*                    _p_synthetic_asset_obj      = nullptr;
         const asset_object*                    _p_reward_asset_obj         = nullptr;
   };

} }
