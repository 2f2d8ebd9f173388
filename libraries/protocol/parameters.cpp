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
#include <redbank/protocol/parameters.hpp>
#include <redbank/protocol/exceptions.hpp>

namespace redbank { namespace protocol {

static void validate_less_or_equal_one( const decimal& value, const char* name )
{
   REDBANK_ASSERT( value <= decimal::one(), invalid_parameter,
                   "${name} should be less or equal than one, got ${value}", ("name", name)("value", value) );
}

void market_parameters::validate()const
{
   validate_interest_rate_strategy( interest_rate_strategy );

   validate_less_or_equal_one( max_loan_to_value,  "max_loan_to_value" );
   validate_less_or_equal_one( reserve_factor,     "reserve_factor" );
   validate_less_or_equal_one( maintenance_margin, "maintenance_margin" );
   validate_less_or_equal_one( liquidation_bonus,  "liquidation_bonus" );

   REDBANK_ASSERT( maintenance_margin > max_loan_to_value, invalid_parameter,
                   "maintenance_margin should be greater than max_loan_to_value. "
                   "maintenance_margin: ${mm}, max_loan_to_value: ${ltv}",
                   ("mm", maintenance_margin)("ltv", max_loan_to_value) );
}

bool asset_params::is_complete()const
{
   return initial_borrow_rate.valid() && max_loan_to_value.valid() && reserve_factor.valid()
       && maintenance_margin.valid() && liquidation_bonus.valid() && interest_rate_strategy.valid();
}

market_parameters asset_params::to_market_parameters()const
{
   REDBANK_ASSERT( is_complete(), invalid_parameter,
                   "All params should be available during initialization", ("params", *this) );
   market_parameters result;
   apply_to( result );
   return result;
}

void asset_params::apply_to( market_parameters& params )const
{
   if( max_loan_to_value.valid() )
      params.max_loan_to_value = *max_loan_to_value;
   if( reserve_factor.valid() )
      params.reserve_factor = *reserve_factor;
   if( maintenance_margin.valid() )
      params.maintenance_margin = *maintenance_margin;
   if( liquidation_bonus.valid() )
      params.liquidation_bonus = *liquidation_bonus;
   if( interest_rate_strategy.valid() )
      params.interest_rate_strategy = *interest_rate_strategy;
}

void asset_params::validate()const
{
   if( max_loan_to_value.valid() )
      validate_less_or_equal_one( *max_loan_to_value, "max_loan_to_value" );
   if( reserve_factor.valid() )
      validate_less_or_equal_one( *reserve_factor, "reserve_factor" );
   if( maintenance_margin.valid() )
      validate_less_or_equal_one( *maintenance_margin, "maintenance_margin" );
   if( liquidation_bonus.valid() )
      validate_less_or_equal_one( *liquidation_bonus, "liquidation_bonus" );
   if( interest_rate_strategy.valid() )
      validate_interest_rate_strategy( *interest_rate_strategy );
}

void redbank_config::validate()const
{
   validate_less_or_equal_one( close_factor,             "close_factor" );
   validate_less_or_equal_one( insurance_fund_fee_share, "insurance_fund_fee_share" );
   validate_less_or_equal_one( treasury_fee_share,       "treasury_fee_share" );

   REDBANK_ASSERT( insurance_fund_fee_share + treasury_fee_share <= decimal::one(), invalid_parameter,
                   "Invalid fee share amounts. Sum of insurance and treasury fee shares exceed one",
                   ("insurance", insurance_fund_fee_share)("treasury", treasury_fee_share) );

   for( const auto& cap : tax_caps )
   {
      REDBANK_ASSERT( !cap.first.empty(), invalid_parameter, "Tax cap denom must not be empty", ("caps", tax_caps) );
      REDBANK_ASSERT( cap.second >= 0, invalid_parameter, "Tax cap must not be negative",
                      ("denom", cap.first)("cap", cap.second) );
   }
}

void config_params::apply_to( redbank_config& config )const
{
   if( owner.valid() )                    config.owner = *owner;
   if( close_factor.valid() )             config.close_factor = *close_factor;
   if( insurance_fund_fee_share.valid() ) config.insurance_fund_fee_share = *insurance_fund_fee_share;
   if( treasury_fee_share.valid() )       config.treasury_fee_share = *treasury_fee_share;
   if( insurance_fund.valid() )           config.insurance_fund = *insurance_fund;
   if( treasury.valid() )                 config.treasury = *treasury;
   if( staking.valid() )                  config.staking = *staking;
   if( tax_rate.valid() )                 config.tax_rate = *tax_rate;
   if( tax_caps.valid() )                 config.tax_caps = *tax_caps;
}

void config_params::validate()const
{
   if( close_factor.valid() )
      validate_less_or_equal_one( *close_factor, "close_factor" );
   if( insurance_fund_fee_share.valid() )
      validate_less_or_equal_one( *insurance_fund_fee_share, "insurance_fund_fee_share" );
   if( treasury_fee_share.valid() )
      validate_less_or_equal_one( *treasury_fee_share, "treasury_fee_share" );
}

} } // redbank::protocol
