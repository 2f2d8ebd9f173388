/*
 * Copyright (c) 2024 RedBank Developers, and contributors.
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
#include <redbank/chain/token_evaluator.hpp>
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

namespace redbank { namespace chain {

namespace {

   struct payload_decoder
   {
      using result_type = operation;

      const token_receive_operation& msg;

      operation operator()( const deposit_token_payload& p )const
      {
         deposit_operation op;
         op.depositor = msg.sender_account;
         op.asset = msg.token_asset_info();
         op.amount = msg.amount;
         op.on_behalf_of = p.on_behalf_of;
         return op;
      }

      operation operator()( const repay_token_payload& p )const
      {
         repay_operation op;
         op.account = msg.sender_account;
         op.asset = msg.token_asset_info();
         op.amount = msg.amount;
         op.on_behalf_of = p.on_behalf_of;
         return op;
      }

      operation operator()( const liquidate_token_payload& p )const
      {
         liquidate_operation op;
         op.liquidator = msg.sender_account;
         op.collateral_asset = p.collateral_asset;
         op.debt_asset = msg.token_asset_info();
         op.user = p.user;
         op.amount = msg.amount;
         op.receive_ma_token = p.receive_ma_token;
         return op;
      }
   };

}

operation token_receive_evaluator::decode_payload( const token_receive_operation& op )
{
   return op.payload.visit( payload_decoder{ op } );
}

void_result token_receive_evaluator::do_evaluate( const token_receive_operation& op )
{ try {
   verify_account_exists( op.sender_account );
   const share_type balance = db().get_balance( op.sender_account, op.token_asset_info() );
   REDBANK_ASSERT( balance >= op.amount, insufficient_balance,
                   "${u} holds ${b} of token ${t}, cannot send ${a}",
                   ("u", op.sender_account)("b", balance)("t", op.contract_addr)("a", op.amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result token_receive_evaluator::do_apply( const token_receive_operation& op )const
{ try {
   database& d = db();

   d.adjust_balance( op.sender_account, op.token_asset_info(), -op.amount );

   const operation nested = decode_payload( op );
   dlog( "Token ${t} received from ${u}, dispatching ${o}",
         ("t", op.contract_addr)("u", op.sender_account)("o", nested.which()) );
   return d.apply_nested_operation( *trx_state, nested, op.amount );
} FC_CAPTURE_AND_RETHROW( (op) ) }

} }
