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
#include <boost/test/unit_test.hpp>

#include <redbank/chain/market_object.hpp>
#include <redbank/chain/position_object.hpp>
#include <redbank/chain/token_evaluator.hpp>

#include "../common/database_fixture.hpp"

using namespace redbank::chain;

namespace {
   const string      luna_token_addr = "terra1lunatoken";
   const string      usd_token_addr  = "terra1usdtoken";
   const asset_info  luna_token = token( luna_token_addr );
   const asset_info  usd_token  = token( usd_token_addr );
   const asset_info  uluna = native( "uluna" );
   const asset_info  uusd  = native( "uusd" );
}

BOOST_FIXTURE_TEST_SUITE( token_tests, database_fixture )

BOOST_AUTO_TEST_CASE( deposit_tokens_through_contract )
{ try {
   ACTORS( (alice)(bob) );
   init_market( luna_token );
   BOOST_CHECK_EQUAL( db.get_market( luna_token ).ma_token_symbol, "materra1lunatoken" );
   fund( alice_id, luna_token, 5000 );

   // tokens can not be pulled by the bank
   REQUIRE_EXCEPTION_WITH_TEXT( deposit( alice_id, luna_token, 5000 ), "must be sent through its token contract" );

   const operation_result result = send_token( alice_id, luna_token_addr, 3000, deposit_token_payload() );
   BOOST_CHECK( result.is_type<void_result>() );
   BOOST_CHECK_EQUAL( get_balance( alice_id, luna_token ).value, 2000 );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, luna_token ).value, 3000 );

   deposit_token_payload for_bob;
   for_bob.on_behalf_of = bob_id;
   send_token( alice_id, luna_token_addr, 2000, for_bob );
   BOOST_CHECK_EQUAL( collateral_of( bob_id, luna_token ).value, 2000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, luna_token ).value, 0 );

   // withdrawals are paid back in tokens
   set_price( luna_token, "25" );
   BOOST_CHECK_EQUAL( withdraw( bob_id, luna_token ).value, 2000 );
   BOOST_CHECK_EQUAL( get_balance( bob_id, luna_token ).value, 2000 );

   REDBANK_REQUIRE_THROW( send_token( alice_id, luna_token_addr, 1, deposit_token_payload() ), insufficient_balance );
   REDBANK_REQUIRE_THROW( send_token( bob_id, usd_token_addr, 0, deposit_token_payload() ), invalid_parameter );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_nested_operation_reverts_transfer )
{ try {
   ACTORS( (alice) );
   fund( alice_id, usd_token, 1000 );

   // no market for the token
   REDBANK_REQUIRE_THROW( send_token( alice_id, usd_token_addr, 1000, deposit_token_payload() ), asset_not_initialized );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_token ).value, 1000 );

   init_market( usd_token );
   REDBANK_REQUIRE_THROW( send_token( alice_id, usd_token_addr, 1000, repay_token_payload() ), fc::exception );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_token ).value, 1000 );
   BOOST_CHECK_EQUAL( db.get_market( usd_token ).available_liquidity.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( nested_operations_do_not_nest_further )
{ try {
   ACTORS( (alice) );
   init_market( uusd );
   fund( alice_id, uusd, 1000 );

   evaluation_state nested_state( &db, REDBANK_MAX_NESTED_OPERATION_DEPTH );
   deposit_operation op;
   op.depositor = alice_id;
   op.asset = uusd;
   op.amount = 1000;
   REDBANK_REQUIRE_THROW( db.apply_nested_operation( nested_state, op, share_type( 1000 ) ),
                          nested_operation_depth_exceeded );
   BOOST_CHECK_EQUAL( get_balance( alice_id, uusd ).value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( decode_token_payloads )
{ try {
   token_receive_operation msg;
   msg.contract_addr = usd_token_addr;
   msg.sender_account = account_id_type( 7 );
   msg.amount = 500;

   liquidate_token_payload payload;
   payload.collateral_asset = uluna;
   payload.user = account_id_type( 8 );
   payload.receive_ma_token = true;
   msg.payload = payload;

   const operation decoded = token_receive_evaluator::decode_payload( msg );
   BOOST_REQUIRE( decoded.is_type<liquidate_operation>() );
   const liquidate_operation& op = decoded.get<liquidate_operation>();
   BOOST_CHECK( op.liquidator == account_id_type( 7 ) );
   BOOST_CHECK( op.user == account_id_type( 8 ) );
   BOOST_CHECK( op.debt_asset == usd_token );
   BOOST_CHECK( op.collateral_asset == uluna );
   BOOST_CHECK_EQUAL( op.amount.value, 500 );
   BOOST_CHECK( op.receive_ma_token );

   repay_token_payload repay_payload;
   repay_payload.on_behalf_of = account_id_type( 9 );
   msg.payload = repay_payload;
   const operation repay = token_receive_evaluator::decode_payload( msg );
   BOOST_REQUIRE( repay.is_type<repay_operation>() );
   BOOST_CHECK( repay.get<repay_operation>().beneficiary() == account_id_type( 9 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( borrow_and_repay_tokens )
{ try {
   ACTORS( (alice)(bob) );
   init_market( uluna );
   init_market( usd_token );
   set_price( uluna, "25" );
   set_price( usd_token, "1" );

   fund( bob_id, usd_token, 1000000 );
   send_token( bob_id, usd_token_addr, 1000000, deposit_token_payload() );
   fund( alice_id, uluna, 10000 );
   deposit( alice_id, uluna, 10000 );

   borrow( alice_id, usd_token, 100000 );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_token ).value, 100000 );

   fund( alice_id, usd_token, 5000 );
   const operation_result result = send_token( alice_id, usd_token_addr, 105000, repay_token_payload() );
   BOOST_CHECK_EQUAL( result.get<share_type>().value, 5000 );
   BOOST_CHECK( db.find_debt( alice_id, db.get_market( usd_token ).get_id() ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( alice_id, usd_token ).value, 5000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( liquidate_token_debt )
{ try {
   ACTORS( (alice)(bob)(liquidator) );
   init_market( uluna );
   init_market( usd_token );
   set_price( uluna, "25" );
   set_price( usd_token, "1" );

   fund( bob_id, usd_token, 20000000 );
   send_token( bob_id, usd_token_addr, 20000000, deposit_token_payload() );
   fund( alice_id, uluna, 1000000 );
   deposit( alice_id, uluna, 1000000 );
   borrow( alice_id, usd_token, 13475000 );
   set_price( uluna, "20" );

   fund( liquidator_id, usd_token, 10000000 );
   // direct liquidation can not pull tokens
   REDBANK_REQUIRE_THROW( liquidate( liquidator_id, uluna, usd_token, alice_id, 5390000 ), invalid_parameter );

   liquidate_token_payload payload;
   payload.collateral_asset = uluna;
   payload.user = alice_id;
   const liquidation_result result = send_token( liquidator_id, usd_token_addr, 8085000, payload )
                                        .get<liquidation_result>();

   BOOST_CHECK_EQUAL( result.debt_amount_repaid.value, 6737500 );
   BOOST_CHECK_EQUAL( result.refund_amount.value, 8085000 - 6737500 );
   BOOST_CHECK_EQUAL( result.collateral_amount_liquidated.value, 370562 );
   BOOST_CHECK_EQUAL( get_balance( liquidator_id, usd_token ).value, 10000000 - 6737500 );
   BOOST_CHECK_EQUAL( get_balance( liquidator_id, uluna ).value, 370562 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( liquidate_token_collateral )
{ try {
   ACTORS( (alice)(bob)(liquidator) );
   init_market( luna_token );
   init_market( uusd );
   set_price( luna_token, "25" );
   set_price( uusd, "1" );

   fund( bob_id, uusd, 20000000 );
   deposit( bob_id, uusd, 20000000 );
   fund( alice_id, luna_token, 1000000 );
   send_token( alice_id, luna_token_addr, 1000000, deposit_token_payload() );
   borrow( alice_id, uusd, 13475000 );
   set_price( luna_token, "20" );

   fund( liquidator_id, uusd, 10000000 );
   const liquidation_result result = liquidate( liquidator_id, luna_token, uusd, alice_id, 5390000 );

   BOOST_CHECK_EQUAL( result.debt_amount_repaid.value, 5390000 );
   BOOST_CHECK_EQUAL( result.collateral_amount_liquidated.value, 296450 );
   BOOST_CHECK_EQUAL( get_balance( liquidator_id, luna_token ).value, 296450 );
   BOOST_CHECK_EQUAL( collateral_of( alice_id, luna_token ).value, 703550 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
