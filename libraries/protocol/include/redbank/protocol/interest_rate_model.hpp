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
#include <redbank/protocol/decimal.hpp>

namespace redbank { namespace protocol {

   /**
    *  @brief Proportional controller that moves the borrow rate toward the optimal utilization.
    *
    *  On every update the utilization error e = |optimal - u| is multiplied by kp_1, or by
    *  kp_2 once e reaches kp_augmentation_threshold.  The rate goes down by kp * e while the
    *  market is under-utilized and up by kp * e otherwise, clamped to [min, max].
    */
   struct dynamic_interest_rate_model
   {
      decimal min_borrow_rate;
      decimal max_borrow_rate;
      decimal kp_1;
      decimal optimal_utilization_rate;
      decimal kp_augmentation_threshold;
      decimal kp_2;

      void    validate()const;
      decimal get_borrow_rate( const decimal& current_borrow_rate, const decimal& current_utilization_rate )const;
   };

   /**
    *  @brief Piecewise linear borrow rate curve with a kink at the optimal utilization.
    *
    *  Below the kink: base + slope_1 * u / optimal.
    *  Above it:       base + slope_1 + slope_2 * (u - optimal) / (1 - optimal).
    */
   struct linear_interest_rate_model
   {
      decimal optimal_utilization_rate;
      decimal base;
      decimal slope_1;
      decimal slope_2;

      void    validate()const;
      decimal get_borrow_rate( const decimal& current_borrow_rate, const decimal& current_utilization_rate )const;
   };

   using interest_rate_strategy = static_variant< dynamic_interest_rate_model, linear_interest_rate_model >;

   void validate_interest_rate_strategy( const interest_rate_strategy& strategy );

   /// Borrow rate for the given utilization; the current rate only matters to the dynamic model
   decimal get_updated_borrow_rate( const interest_rate_strategy& strategy,
                                    const decimal& current_borrow_rate,
                                    const decimal& current_utilization_rate );

   /// borrow_rate * utilization * (1 - reserve_factor)
   decimal get_liquidity_rate( const decimal& borrow_rate,
                               const decimal& current_utilization_rate,
                               const decimal& reserve_factor );

} } // redbank::protocol

FC_REFLECT( redbank::protocol::dynamic_interest_rate_model,
            (min_borrow_rate)(max_borrow_rate)(kp_1)(optimal_utilization_rate)(kp_augmentation_threshold)(kp_2) )
FC_REFLECT( redbank::protocol::linear_interest_rate_model,
            (optimal_utilization_rate)(base)(slope_1)(slope_2) )
