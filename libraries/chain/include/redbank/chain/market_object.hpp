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
#pragma once
#include <redbank/protocol/asset_info.hpp>
#include <redbank/protocol/parameters.hpp>
#include <redbank/chain/types.hpp>
#include <redbank/db/generic_index.hpp>

namespace redbank { namespace chain {
   using redbank::db::abstract_object;
   using redbank::db::generic_index;
   using redbank::db::object;
   using redbank::db::by_id;

   /**
    * @brief The pool of one asset: its parameters, interest indices and totals
    * @ingroup object
    * @ingroup protocol
    *
    * Collateral and debt positions store scaled amounts.  The underlying value of a position is
    * its scaled amount times the matching index divided by REDBANK_MA_TOKEN_SCALING_FACTOR.
    * Both indices start at one and never decrease.
    */
   class market_object : public abstract_object<market_object, market_id_type>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = market_object_type;

         asset_info         asset;
         string             asset_ref;        ///< asset_reference( asset )
         uint32_t           index = 0;        ///< Sequential market number
         string             ma_token_symbol;

         decimal            borrow_index = decimal::one();
         decimal            liquidity_index = decimal::one();
         decimal            borrow_rate;
         decimal            liquidity_rate;

         decimal                          max_loan_to_value;
         decimal                          reserve_factor;
         decimal                          maintenance_margin;
         decimal                          liquidation_bonus;
         protocol::interest_rate_strategy interest_rate_strategy;

         time_point_sec     interests_last_updated;

         scaled_amount_type debt_total_scaled = 0;
         scaled_amount_type collateral_total_scaled = 0;   ///< Total supply of the ma-token
         share_type         available_liquidity;           ///< Underlying held by the bank for this market
         share_type         protocol_income_to_distribute;
         share_type         bad_debt;                      ///< Debt written off so far

         market_parameters get_parameters()const;
         void              set_parameters( const market_parameters& params );

         /// Borrow index as it would be after accruing interest up to @p now
         decimal get_updated_borrow_index( time_point_sec now )const;
         /// Liquidity index as it would be after accruing interest up to @p now
         decimal get_updated_liquidity_index( time_point_sec now )const;
   };

   /// index * ( 1 + rate * elapsed / seconds_per_year )
   decimal calculate_applied_linear_interest_rate( const decimal& index, const decimal& rate, uint32_t time_elapsed );

   /// Deposit shares: floor( amount * scaling / liquidity_index )
   scaled_amount_type get_scaled_liquidity_amount( const share_type& amount, const decimal& liquidity_index );
   /// Shares burnt on a partial withdrawal: ceil( amount * scaling / liquidity_index )
   scaled_amount_type get_scaled_liquidity_amount_ceil( const share_type& amount, const decimal& liquidity_index );
   /// floor( scaled * liquidity_index / scaling )
   share_type get_underlying_liquidity_amount( const scaled_amount_type& amount_scaled, const decimal& liquidity_index );
   /// Debt shares minted on borrow: ceil( amount * scaling / borrow_index )
   scaled_amount_type get_scaled_debt_amount( const share_type& amount, const decimal& borrow_index );
   /// Debt shares burnt on repay: floor( amount * scaling / borrow_index )
   scaled_amount_type get_scaled_debt_amount_floor( const share_type& amount, const decimal& borrow_index );
   /// ceil( scaled * borrow_index / scaling )
   share_type get_underlying_debt_amount( const scaled_amount_type& amount_scaled, const decimal& borrow_index );

   struct by_asset;
   struct by_ma_token;
   struct by_market_index;
   using market_multi_index_type = multi_index_container<
      market_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset>, member< market_object, string, &market_object::asset_ref > >,
         ordered_unique< tag<by_ma_token>, member< market_object, string, &market_object::ma_token_symbol > >,
         ordered_unique< tag<by_market_index>, member< market_object, uint32_t, &market_object::index > >
      >
   >;
   using market_index = generic_index<market_object, market_multi_index_type>;

} } // redbank::chain

MAP_OBJECT_ID_TO_TYPE(redbank::chain::market_object)

FC_REFLECT_DERIVED( redbank::chain::market_object, (redbank::db::object),
                    (asset)(asset_ref)(index)(ma_token_symbol)
                    (borrow_index)(liquidity_index)(borrow_rate)(liquidity_rate)
                    (max_loan_to_value)(reserve_factor)(maintenance_margin)(liquidation_bonus)(interest_rate_strategy)
                    (interests_last_updated)
                    (debt_total_scaled)(collateral_total_scaled)(available_liquidity)
                    (protocol_income_to_distribute)(bad_debt) )
