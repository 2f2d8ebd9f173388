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

#include <fc/io/json.hpp>

#include <boost/test/unit_test.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <redbank/protocol/types.hpp>
#include <redbank/chain/database.hpp>
#include <redbank/chain/exceptions.hpp>

#include <iostream>

using namespace redbank::db;

extern uint32_t REDBANK_TESTING_GENESIS_TIMESTAMP;

#define REDBANK_REQUIRE_THROW( expr, exc_type )           \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "REDBANK_REQUIRE_THROW begin "         \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "REDBANK_REQUIRE_THROW end "           \
         << req_throw_info << std::endl;                  \
}

#define REDBANK_CHECK_THROW( expr, exc_type )             \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "REDBANK_CHECK_THROW begin "           \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "REDBANK_CHECK_THROW end "             \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   REDBANK_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}
#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value ) \
   REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, fc::exception )

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                 \
{                                                                 \
   try                                                            \
   {                                                              \
      op;                                                         \
      BOOST_FAIL(std::string("Expected an exception with \"") +   \
         std::string(exc_text) +                                  \
         std::string("\" but none thrown"));                      \
   }                                                              \
   catch (fc::exception& ex)                                      \
   {                                                              \
      std::string what = ex.to_string(                            \
            fc::log_level(fc::log_level::all));                   \
      if (what.find(exc_text) == std::string::npos)               \
      {                                                           \
         BOOST_FAIL( std::string("Expected \"") +                 \
            std::string(exc_text) +                               \
            std::string("\" but got \"") +                        \
            std::string(what) );                                  \
      }                                                           \
   }                                                              \
}                                                                 \

#define ACTOR(name) \
   const account_object& name = create_account(BOOST_PP_STRINGIZE(name)); \
   redbank::chain::account_id_type name ## _id = name.get_id(); (void)name ## _id;

#define GET_ACTOR(name) \
   const account_object& name = get_account(BOOST_PP_STRINGIZE(name)); \
   redbank::chain::account_id_type name ## _id = name.get_id(); \
   (void)name ##_id

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

namespace redbank { namespace chain {

/**
 *  Fresh ledger with the owner and fee collector accounts, no markets and no prices.
 *  The helpers push one operation each and rethrow whatever the ledger rejects.
 */
struct database_fixture {
   genesis_state_type genesis_state;
   chain::database db;

   account_id_type owner_id;
   account_id_type insurance_fund_id;
   account_id_type treasury_id;
   account_id_type staking_id;

   const std::string current_test_name;
   const std::string current_suite_name;

   database_fixture();
   ~database_fixture();

   static genesis_state_type make_genesis();
   static linear_interest_rate_model default_rate_model();
   /// LTV 0.55, maintenance margin 0.65, bonus 0.1, reserve 0.1, 5% initial rate, linear model
   static asset_params default_asset_params();

   const account_object& create_account( const string& name );
   const account_object& get_account( const string& name )const;
   /// Credits @p who with tokens or coins from outside of the bank
   void fund( account_id_type who, const asset_info& asset, share_type amount );
   share_type get_balance( account_id_type who, const asset_info& asset )const;

   const market_object& init_market( const asset_info& asset,
                                     const asset_params& params = default_asset_params(),
                                     const optional<string>& symbol = optional<string>() );
   void update_market( const asset_info& asset, const asset_params& params );
   void update_config( const config_params& config );
   void set_price( const asset_info& asset, const decimal& price );
   void set_price( const asset_info& asset, const string& price ) { set_price( asset, decimal::from_string( price ) ); }

   void deposit( account_id_type who, const asset_info& asset, share_type amount,
                 const optional<account_id_type>& on_behalf_of = optional<account_id_type>() );
   share_type withdraw( account_id_type who, const asset_info& asset,
                        const optional<share_type>& amount = optional<share_type>(),
                        const optional<account_id_type>& recipient = optional<account_id_type>() );
   share_type borrow( account_id_type who, const asset_info& asset, share_type amount,
                      const optional<account_id_type>& recipient = optional<account_id_type>() );
   share_type repay( account_id_type who, const asset_info& asset, share_type amount,
                     const optional<account_id_type>& on_behalf_of = optional<account_id_type>() );
   liquidation_result liquidate( account_id_type liquidator, const asset_info& collateral_asset,
                                 const asset_info& debt_asset, account_id_type user, share_type amount,
                                 bool receive_ma_token = false );
   void set_uncollateralized_limit( account_id_type user, const asset_info& asset, share_type limit );
   void set_collateral_status( account_id_type who, const asset_info& asset, bool enable );
   void transfer_ma_token( account_id_type from, account_id_type to, const asset_info& asset, share_type amount );
   share_type distribute_income( account_id_type sender, const asset_info& asset,
                                 const optional<share_type>& amount = optional<share_type>() );
   /// Sends tokens of @p contract to the bank with an attached message
   operation_result send_token( account_id_type who, const string& contract, share_type amount,
                                const token_receive_payload& payload );

   /// Underlying collateral of @p who in @p asset, zero without a position
   share_type collateral_of( account_id_type who, const asset_info& asset )const;
   /// Underlying debt of @p who in @p asset, zero without a position
   share_type debt_of( account_id_type who, const asset_info& asset )const;

   /// Checks the per market totals against the positions
   void verify_market_totals()const;
};

} }
