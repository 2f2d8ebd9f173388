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
#include <redbank/protocol/interest_rate_model.hpp>
#include <redbank/protocol/exceptions.hpp>

namespace redbank { namespace protocol {

void dynamic_interest_rate_model::validate()const
{
   REDBANK_ASSERT( min_borrow_rate <= max_borrow_rate, invalid_rate_model,
                   "max_borrow_rate should be greater than or equal to min_borrow_rate. "
                   "max_borrow_rate: ${max}, min_borrow_rate: ${min}",
                   ("max", max_borrow_rate)("min", min_borrow_rate) );
   REDBANK_ASSERT( optimal_utilization_rate <= decimal::one(), invalid_rate_model,
                   "Optimal utilization rate can't be greater than one", ("optimal", optimal_utilization_rate) );
}

decimal dynamic_interest_rate_model::get_borrow_rate( const decimal& current_borrow_rate,
                                                      const decimal& current_utilization_rate )const
{
   const bool under_utilized = optimal_utilization_rate > current_utilization_rate;
   const decimal error = under_utilized ? optimal_utilization_rate - current_utilization_rate
                                        : current_utilization_rate - optimal_utilization_rate;

   const decimal& kp = ( error >= kp_augmentation_threshold ) ? kp_2 : kp_1;
   const decimal p = kp * error;

   decimal new_borrow_rate = under_utilized ? current_borrow_rate.saturating_sub( p )
                                            : current_borrow_rate + p;

   if( new_borrow_rate < min_borrow_rate )
      new_borrow_rate = min_borrow_rate;
   else if( new_borrow_rate > max_borrow_rate )
      new_borrow_rate = max_borrow_rate;

   return new_borrow_rate;
}

void linear_interest_rate_model::validate()const
{
   // decimals are unsigned, so slopes and base are never negative
   REDBANK_ASSERT( optimal_utilization_rate <= decimal::one(), invalid_rate_model,
                   "Optimal utilization rate can't be greater than one", ("optimal", optimal_utilization_rate) );
}

decimal linear_interest_rate_model::get_borrow_rate( const decimal& current_borrow_rate,
                                                     const decimal& current_utilization_rate )const
{
   if( current_utilization_rate <= optimal_utilization_rate )
   {
      if( current_utilization_rate.is_zero() )
         return base;
      return base + slope_1 * ( current_utilization_rate / optimal_utilization_rate );
   }

   // optimal < u <= 1 here, so 1 - optimal is positive even when optimal is zero
   const decimal excess = current_utilization_rate - optimal_utilization_rate;
   return base + slope_1 + slope_2 * ( excess / ( decimal::one() - optimal_utilization_rate ) );
}

namespace {

   struct strategy_validator
   {
      using result_type = void;
      template<typename Model>
      void operator()( const Model& m )const { m.validate(); }
   };

   struct borrow_rate_getter
   {
      using result_type = decimal;

      const decimal& current_borrow_rate;
      const decimal& current_utilization_rate;

      template<typename Model>
      decimal operator()( const Model& m )const
      {
         return m.get_borrow_rate( current_borrow_rate, current_utilization_rate );
      }
   };

}

void validate_interest_rate_strategy( const interest_rate_strategy& strategy )
{
   strategy.visit( strategy_validator() );
}

decimal get_updated_borrow_rate( const interest_rate_strategy& strategy,
                                 const decimal& current_borrow_rate,
                                 const decimal& current_utilization_rate )
{
   return strategy.visit( borrow_rate_getter{ current_borrow_rate, current_utilization_rate } );
}

decimal get_liquidity_rate( const decimal& borrow_rate,
                            const decimal& current_utilization_rate,
                            const decimal& reserve_factor )
{
   return borrow_rate * current_utilization_rate * ( decimal::one() - reserve_factor );
}

} } // redbank::protocol
