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
#include <dollarstore/protocol/base.hpp>

namespace dollarstore { namespace protocol {

   /**
    *  @defgroup virtual_operations Virtual Operations
    *  @ingroup operations
    *
    *  Events recorded by the ledger while applying user operations. They are appended to the
    *  applied operation list of the transaction and published once it commits. None of them
    *  can be pushed by a caller.
    *
    *  @{
    */

   /// Reserve asset accepted into the basket and synthetic minted
   struct deposited_operation : public base_operation
   {
      deposited_operation(){}
      deposited_operation( account_id_type u, asset a, share_type m )
         :account(u),amount(a),minted(m){}

      account_id_type  account;
      asset            amount;
      share_type       minted;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   /// Synthetic burned and reserve asset delivered
   struct withdrawn_operation : public base_operation
   {
      withdrawn_operation(){}
      withdrawn_operation( account_id_type u, asset a, share_type b )
         :account(u),amount(a),burned(b){}

      account_id_type  account;
      asset            amount;
      share_type       burned;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   struct queue_joined_operation : public base_operation
   {
      queue_joined_operation(){}
      queue_joined_operation( account_id_type u, queue_position_id_type p, asset_id_type a, share_type amt )
         :account(u),position(p),asset_type(a),amount(amt){}

      account_id_type         account;
      queue_position_id_type  position;
      asset_id_type           asset_type;
      /// synthetic escrowed
      share_type              amount;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   /// A queue position was paid out, fully or in part
   struct queue_filled_operation : public base_operation
   {
      queue_filled_operation(){}
      queue_filled_operation( queue_position_id_type p, account_id_type o, asset a, share_type r )
         :position(p),owner(o),amount(a),remaining(r){}

      queue_position_id_type  position;
      account_id_type         owner;
      /// reserve asset delivered to the owner
      asset                   amount;
      /// synthetic still waiting after this fill
      share_type              remaining;

      account_id_type actor()const { return owner; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   struct queue_cancelled_operation : public base_operation
   {
      queue_cancelled_operation(){}
      queue_cancelled_operation( queue_position_id_type p, account_id_type o, share_type r )
         :position(p),owner(o),refund(r){}

      queue_position_id_type  position;
      account_id_type         owner;
      share_type              refund;

      account_id_type actor()const { return owner; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   struct staked_operation : public base_operation
   {
      staked_operation(){}
      staked_operation( account_id_type u, share_type a, share_type p )
         :account(u),amount(a),new_power(p){}

      account_id_type  account;
      share_type       amount;
      share_type       new_power;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   struct unstake_initiated_operation : public base_operation
   {
      unstake_initiated_operation(){}
      unstake_initiated_operation( account_id_type u, share_type a, time_point_sec c )
         :account(u),amount(a),completion_time(c){}

      account_id_type  account;
      share_type       amount;
      time_point_sec   completion_time;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   struct unstake_completed_operation : public base_operation
   {
      unstake_completed_operation(){}
      unstake_completed_operation( account_id_type u, share_type a ):account(u),amount(a){}

      account_id_type  account;
      share_type       amount;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   struct unstake_cancelled_operation : public base_operation
   {
      unstake_cancelled_operation(){}
      unstake_cancelled_operation( account_id_type u, share_type a ):account(u),amount(a){}

      account_id_type  account;
      share_type       amount;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   enum class reward_category : uint8_t
   {
      maker   = 0,
      taker   = 1,
      founder = 2
   };

   struct reward_minted_operation : public base_operation
   {
      reward_minted_operation(){}
      reward_minted_operation( account_id_type a, reward_category c, share_type m )
         :account(a),category(c),amount(m){}

      account_id_type  account;
      reward_category  category = reward_category::maker;
      share_type       amount;

      account_id_type actor()const { return account; }
      void            validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   ///@}

} } // dollarstore::protocol

FC_REFLECT_ENUM( dollarstore::protocol::reward_category, (maker)(taker)(founder) )

FC_REFLECT( dollarstore::protocol::deposited_operation, (account)(amount)(minted) )
FC_REFLECT( dollarstore::protocol::withdrawn_operation, (account)(amount)(burned) )
FC_REFLECT( dollarstore::protocol::queue_joined_operation, (account)(position)(asset_type)(amount) )
FC_REFLECT( dollarstore::protocol::queue_filled_operation, (position)(owner)(amount)(remaining) )
FC_REFLECT( dollarstore::protocol::queue_cancelled_operation, (position)(owner)(refund) )
FC_REFLECT( dollarstore::protocol::staked_operation, (account)(amount)(new_power) )
FC_REFLECT( dollarstore::protocol::unstake_initiated_operation, (account)(amount)(completion_time) )
FC_REFLECT( dollarstore::protocol::unstake_completed_operation, (account)(amount) )
FC_REFLECT( dollarstore::protocol::unstake_cancelled_operation, (account)(amount) )
FC_REFLECT( dollarstore::protocol::reward_minted_operation, (account)(category)(amount) )
