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

#include <redbank/chain/global_property_object.hpp>
#include <redbank/chain/account_object.hpp>
#include <redbank/chain/market_object.hpp>
#include <redbank/chain/position_object.hpp>
#include <redbank/chain/price_feed_object.hpp>
#include <redbank/chain/price_oracle.hpp>
#include <redbank/chain/user_position.hpp>
#include <redbank/chain/genesis_state.hpp>
#include <redbank/chain/evaluator.hpp>

#include <redbank/db/object_database.hpp>
#include <redbank/db/object.hpp>

#include <fc/log/logger.hpp>

namespace redbank { namespace chain {
   using redbank::db::abstract_object;
   using redbank::db::object;

   /**
    *   @class database
    *   @brief tracks the red bank ledger state
    *
    *   Every change goes through push_operation(), which evaluates one operation inside its own
    *   undo session: the operation either applies completely or leaves no trace.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Initialize an empty ledger from a genesis state
          *
          * Creates the global properties, the initial accounts, balances, prices and markets.
          * May only be called once.
          */
         void init_genesis( const genesis_state_type& genesis_state );

         /// Replace the price source; the default serves set_asset_price_operation prices
         void set_price_oracle( std::unique_ptr<price_oracle> oracle );

         //////////////////// db_ledger.cpp ////////////////////
      public:
         /**
          * Validate and apply one operation atomically.  On failure the exception is rethrown
          * after every change made by the operation has been undone.
          */
         operation_result push_operation( const operation& op );

         /**
          * Evaluate an operation carried inside the operation being evaluated.  The nested
          * operation runs in its own undo session which is merged into the enclosing one.
          */
         operation_result apply_nested_operation( const evaluation_state& parent, const operation& op,
                                                  const optional<share_type>& prepaid_amount );

         /// Move the ledger clock forward; going backwards is rejected
         void set_time( time_point_sec t );
         void advance_time( uint32_t seconds );

      protected:
         operation_result apply_operation( evaluation_state& eval_state, const operation& op );

         //////////////////// db_getter.cpp ////////////////////
      public:
         const global_property_object&         get_global_properties()const;
         const dynamic_global_property_object& get_dynamic_global_properties()const;
         const redbank_config&                 get_config()const;
         time_point_sec                        head_time()const;

         const account_object*  find_account_by_name( const string& name )const;
         const account_object&  get_account_by_name( const string& name )const;

         const market_object*   find_market( const asset_info& asset )const;
         /// Throws asset_not_initialized when the asset has no market
         const market_object&   get_market( const asset_info& asset )const;
         const market_object*   find_market_by_ma_token( const string& symbol )const;

         const collateral_object* find_collateral( account_id_type owner, market_id_type market )const;
         const debt_object*       find_debt( account_id_type borrower, market_id_type market )const;
         share_type               get_uncollateralized_limit( account_id_type user, market_id_type market )const;
         bool                     has_positive_uncollateralized_limit( account_id_type user )const;

         decimal get_price( const asset_info& asset )const;

         //////////////////// db_balance.cpp ////////////////////
      public:
         /// Balance held by an account outside of the red bank
         share_type get_balance( account_id_type owner, const asset_info& asset )const;
         void       adjust_balance( account_id_type owner, const asset_info& asset, share_type delta );

         /// Transfer tax on a native payout: min( amount - amount / ( 1 + tax_rate ), cap )
         share_type compute_tax( const asset_info& asset, const share_type& amount )const;

         /**
          * Send @p amount out of the bank to @p recipient.  Native payouts are delivered net of
          * transfer tax.
          * @return the amount delivered
          */
         share_type pay_out( account_id_type recipient, const asset_info& asset, const share_type& amount );

         //////////////////// db_interest.cpp ////////////////////
      public:
         /// Bring the indices of @p market up to head_time() and book the protocol share of interest
         void accrue_interests( const market_object& market );
         /// Recompute the borrow and liquidity rates from the current utilization
         void update_interest_rates( const market_object& market );
         /// Accrue every market the user holds collateral or debt in
         void accrue_user_markets( account_id_type user );

         //////////////////// db_position.cpp ////////////////////
      public:
         /// Valuation of a user across all markets at head_time()
         user_position get_user_position( account_id_type user )const;

         const collateral_object& increase_collateral( account_id_type owner, const market_object& market,
                                                       const scaled_amount_type& amount_scaled );
         /// Removes the position once it is empty
         void decrease_collateral( const collateral_object& collateral, const scaled_amount_type& amount_scaled );

         const debt_object& increase_debt( account_id_type borrower, const market_object& market,
                                           const scaled_amount_type& amount_scaled, bool uncollateralized );
         /// Removes the position once it is empty
         void decrease_debt( const debt_object& debt, const scaled_amount_type& amount_scaled );

         /// Throws health_check_failed if the user is borrowing with a health factor below one
         void assert_healthy( account_id_type user, const char* action )const;

         //////////////////// db_init.cpp ////////////////////
      private:
         void initialize_evaluators();
         void initialize_indexes();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < static_cast<int64_t>( _operation_evaluators.size() ),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

         vector< std::unique_ptr<op_evaluator> > _operation_evaluators;
         std::unique_ptr<price_oracle>            _price_oracle;
   };

} }
