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

#include <redbank/protocol/decimal.hpp>
#include <redbank/protocol/exceptions.hpp>
#include <redbank/protocol/interest_rate_model.hpp>
#include <redbank/chain/market_object.hpp>

#include <fc/io/json.hpp>
#include <fc/variant.hpp>

using namespace redbank::protocol;
using namespace redbank::chain;

BOOST_AUTO_TEST_SUITE( decimal_tests )

BOOST_AUTO_TEST_CASE( decimal_string_conversion )
{ try {
   BOOST_CHECK_EQUAL( decimal::from_string( "25" ).to_string(), "25" );
   BOOST_CHECK_EQUAL( decimal::from_string( "0.5" ).to_string(), "0.5" );
   BOOST_CHECK_EQUAL( decimal::from_string( "1.000000000000000001" ).to_string(), "1.000000000000000001" );
   BOOST_CHECK_EQUAL( decimal::from_string( ".25" ).to_string(), "0.25" );
   BOOST_CHECK_EQUAL( decimal::zero().to_string(), "0" );
   BOOST_CHECK( decimal::from_string( "0.55" ) == decimal::percent( 55 ) );
   BOOST_CHECK( decimal::from_string( "0.004" ) == decimal::permille( 4 ) );

   BOOST_CHECK_THROW( decimal::from_string( "" ), invalid_decimal );
   BOOST_CHECK_THROW( decimal::from_string( "1.2.3" ), invalid_decimal );
   BOOST_CHECK_THROW( decimal::from_string( "-1" ), invalid_decimal );
   BOOST_CHECK_THROW( decimal::from_string( "0.0000000000000000001" ), invalid_decimal );

   const decimal d = fc::variant( "1.25" ).as<decimal>( 1 );
   BOOST_CHECK( d == decimal::from_ratio( 5, 4 ) );
   BOOST_CHECK_EQUAL( fc::variant( d, 1 ).as_string(), "1.25" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( decimal_from_json_numbers )
{ try {
   BOOST_CHECK( fc::variant( uint64_t( 3 ) ).as<decimal>( 1 ) == decimal::from_string( "3" ) );
   BOOST_CHECK( fc::variant( int64_t( 2 ) ).as<decimal>( 1 ) == decimal::from_string( "2" ) );

   // a fraction must not be truncated to zero
   BOOST_CHECK_THROW( fc::variant( 0.5 ).as<decimal>( 1 ), invalid_decimal );
   BOOST_CHECK_THROW( fc::variant( 0.55 ).as<decimal>( 1 ), invalid_decimal );
   BOOST_CHECK_THROW( fc::variant( int64_t( -1 ) ).as<decimal>( 1 ), invalid_decimal );
   BOOST_CHECK_THROW( fc::variant( true ).as<decimal>( 1 ), invalid_decimal );
   BOOST_CHECK_THROW( fc::json::from_string( "{\"x\":0.5}" )["x"].as<decimal>( 1 ), invalid_decimal );
   BOOST_CHECK( fc::json::from_string( "{\"x\":\"0.5\"}" )["x"].as<decimal>( 1 ) == decimal::percent( 50 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( decimal_arithmetic_rounding )
{ try {
   const decimal third = decimal::from_ratio( 1, 3 );
   BOOST_CHECK( third.atomics() == fc::uint128_t( 333333333333333333ULL ) );

   BOOST_CHECK( third.mul_floor( 3 ) == 0 );
   BOOST_CHECK( third.mul_ceil( 3 ) == 1 );
   BOOST_CHECK( decimal::percent( 55 ).mul_floor( 25000000 ) == 13750000 );
   BOOST_CHECK( decimal::from_ratio( 3, 2 ).div_floor( 10 ) == 6 );
   BOOST_CHECK( decimal::from_ratio( 3, 2 ).div_ceil( 10 ) == 7 );

   BOOST_CHECK( decimal::percent( 50 ) * decimal::percent( 50 ) == decimal::percent( 25 ) );
   BOOST_CHECK( decimal::one() / decimal::from_string( "4" ) == decimal::percent( 25 ) );
   BOOST_CHECK( decimal::percent( 30 ).saturating_sub( decimal::percent( 40 ) ) == decimal::zero() );

   BOOST_CHECK_THROW( decimal::percent( 30 ) - decimal::percent( 40 ), invalid_decimal );
   BOOST_CHECK_THROW( decimal::one() / decimal::zero(), invalid_decimal );
   BOOST_CHECK_THROW( decimal::zero().div_floor( 1 ), invalid_decimal );
   BOOST_CHECK_THROW( decimal::from_ratio( 1, 0 ), invalid_decimal );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( linear_interest_rate_model_test )
{ try {
   linear_interest_rate_model model;
   model.optimal_utilization_rate = decimal::percent( 80 );
   model.base = decimal::zero();
   model.slope_1 = decimal::percent( 7 );
   model.slope_2 = decimal::percent( 45 );
   model.validate();

   const interest_rate_strategy strategy = model;
   BOOST_CHECK( get_updated_borrow_rate( strategy, decimal::zero(), decimal::zero() ) == decimal::zero() );
   BOOST_CHECK( get_updated_borrow_rate( strategy, decimal::zero(), decimal::percent( 40 ) )
                == decimal::permille( 35 ) );
   BOOST_CHECK( get_updated_borrow_rate( strategy, decimal::zero(), decimal::percent( 80 ) ) == decimal::percent( 7 ) );
   // 0.07 + 0.45 * ( 0.9 - 0.8 ) / ( 1 - 0.8 )
   BOOST_CHECK( get_updated_borrow_rate( strategy, decimal::zero(), decimal::percent( 90 ) )
                == decimal::permille( 295 ) );

   // 0.2 * 0.5 * ( 1 - 0.1 )
   BOOST_CHECK( get_liquidity_rate( decimal::percent( 20 ), decimal::percent( 50 ), decimal::percent( 10 ) )
                == decimal::permille( 90 ) );

   // every utilization above zero is past the kink
   model.optimal_utilization_rate = decimal::zero();
   model.validate();
   const interest_rate_strategy no_kink = model;
   BOOST_CHECK( get_updated_borrow_rate( no_kink, decimal::zero(), decimal::zero() ) == decimal::zero() );
   // 0.07 + 0.45 * 0.5
   BOOST_CHECK( get_updated_borrow_rate( no_kink, decimal::zero(), decimal::percent( 50 ) )
                == decimal::permille( 295 ) );
   BOOST_CHECK( get_updated_borrow_rate( no_kink, decimal::zero(), decimal::one() ) == decimal::permille( 520 ) );

   model.optimal_utilization_rate = decimal::from_ratio( 11, 10 );
   BOOST_CHECK_THROW( model.validate(), invalid_rate_model );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dynamic_interest_rate_model_test )
{ try {
   dynamic_interest_rate_model model;
   model.min_borrow_rate = decimal::percent( 1 );
   model.max_borrow_rate = decimal::percent( 90 );
   model.kp_1 = decimal::percent( 40 );
   model.optimal_utilization_rate = decimal::percent( 60 );
   model.kp_augmentation_threshold = decimal::percent( 15 );
   model.kp_2 = decimal::one();
   model.validate();

   // under-utilized by 0.1: rate drops by 0.4 * 0.1
   BOOST_CHECK( model.get_borrow_rate( decimal::percent( 10 ), decimal::percent( 50 ) ) == decimal::percent( 6 ) );
   // over-utilized by 0.2, above the threshold so kp_2 applies
   BOOST_CHECK( model.get_borrow_rate( decimal::percent( 10 ), decimal::percent( 80 ) ) == decimal::percent( 30 ) );
   // clamped to the bounds
   BOOST_CHECK( model.get_borrow_rate( decimal::percent( 2 ), decimal::zero() ) == decimal::percent( 1 ) );
   BOOST_CHECK( model.get_borrow_rate( decimal::percent( 85 ), decimal::one() ) == decimal::percent( 90 ) );

   model.min_borrow_rate = decimal::one();
   BOOST_CHECK_THROW( model.validate(), invalid_rate_model );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( linear_index_accrual )
{ try {
   const decimal rate = decimal::percent( 10 );
   BOOST_CHECK( calculate_applied_linear_interest_rate( decimal::one(), rate, 0 ) == decimal::one() );
   BOOST_CHECK( calculate_applied_linear_interest_rate( decimal::one(), decimal::zero(), 1000 ) == decimal::one() );
   BOOST_CHECK( calculate_applied_linear_interest_rate( decimal::one(), rate, REDBANK_SECONDS_PER_YEAR )
                == decimal::from_ratio( 11, 10 ) );
   BOOST_CHECK( calculate_applied_linear_interest_rate( decimal::from_string( "2" ), rate, REDBANK_SECONDS_PER_YEAR / 2 )
                == decimal::from_ratio( 21, 10 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( scaled_amount_rounding )
{ try {
   const decimal index = decimal::from_ratio( 3, 2 );

   // deposits round the shares down, partial withdrawals burn rounded up shares
   BOOST_CHECK( get_scaled_liquidity_amount( 1, index ) == 666666 );
   BOOST_CHECK( get_scaled_liquidity_amount_ceil( 1, index ) == 666667 );
   BOOST_CHECK_EQUAL( get_underlying_liquidity_amount( 666666, index ).value, 0 );
   BOOST_CHECK_EQUAL( get_underlying_liquidity_amount( 666667, index ).value, 1 );

   // debt rounds against the borrower
   BOOST_CHECK( get_scaled_debt_amount( 1, index ) == 666667 );
   BOOST_CHECK( get_scaled_debt_amount_floor( 1, index ) == 666666 );
   BOOST_CHECK_EQUAL( get_underlying_debt_amount( 666666, index ).value, 1 );
   BOOST_CHECK_EQUAL( get_underlying_debt_amount( 2000000, index ).value, 3 );

   BOOST_CHECK( get_scaled_liquidity_amount( 1000000, decimal::one() ) == fc::uint128_t( 1000000000000ULL ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
