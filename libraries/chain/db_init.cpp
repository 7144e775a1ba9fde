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
#include <dollarstore/chain/queue_position_object.hpp>
#include <dollarstore/chain/reserve_object.hpp>
#include <dollarstore/chain/stake_object.hpp>

#include <dollarstore/chain/account_evaluator.hpp>
#include <dollarstore/chain/token_evaluator.hpp>
#include <dollarstore/chain/reserve_evaluator.hpp>
#include <dollarstore/chain/swap_evaluator.hpp>
#include <dollarstore/chain/queue_evaluator.hpp>
#include <dollarstore/chain/stake_evaluator.hpp>

namespace dollarstore { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<account_create_evaluator>();
   register_evaluator<transfer_evaluator>();
   register_evaluator<approve_evaluator>();
   register_evaluator<deposit_evaluator>();
   register_evaluator<withdraw_evaluator>();
   register_evaluator<swap_evaluator>();
   register_evaluator<swap_from_synthetic_evaluator>();
   register_evaluator<queue_join_evaluator>();
   register_evaluator<queue_cancel_evaluator>();
   register_evaluator<stake_evaluator>();
   register_evaluator<unstake_evaluator>();
   register_evaluator<unstake_complete_evaluator>();
   register_evaluator<unstake_cancel_evaluator>();
}

void database::initialize_indexes()
{
   //Protocol object indexes
   add_index< account_index >();
   add_index< asset_index >();
   add_index< queue_position_index >();
   add_index< stake_index >();

   //Implementation object indexes
   add_index< global_property_index >();
   add_index< dynamic_global_property_index >();
   add_index< asset_dynamic_data_index >();
   add_index< account_balance_index >();
   add_index< token_allowance_index >();
   add_index< reserve_index >();
   add_index< emission_state_index >();
   add_index< account_stats_index >();
}

} }
