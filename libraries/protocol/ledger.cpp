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
#include <redbank/protocol/ledger.hpp>
#include <redbank/protocol/exceptions.hpp>

namespace redbank { namespace protocol {

static void validate_positive_amount( const share_type& amount )
{
   REDBANK_ASSERT( amount > 0, invalid_parameter, "Amount must be greater than 0", ("amount", amount) );
}

void deposit_operation::validate()const
{
   validate_asset_info( asset );
   validate_positive_amount( amount );
}

void withdraw_operation::validate()const
{
   validate_asset_info( asset );
   if( amount.valid() )
      validate_positive_amount( *amount );
}

void borrow_operation::validate()const
{
   validate_asset_info( asset );
   validate_positive_amount( amount );
}

void repay_operation::validate()const
{
   validate_asset_info( asset );
   validate_positive_amount( amount );
}

void update_uncollateralized_loan_limit_operation::validate()const
{
   validate_asset_info( asset );
   REDBANK_ASSERT( new_limit >= 0, invalid_parameter, "Limit must not be negative", ("limit", new_limit) );
}

void update_user_collateral_asset_status_operation::validate()const
{
   validate_asset_info( asset );
}

void ma_token_transfer_operation::validate()const
{
   validate_asset_info( asset );
   validate_positive_amount( amount );
   REDBANK_ASSERT( from != to, invalid_parameter, "Cannot transfer to self", ("from", from) );
}

void distribute_protocol_income_operation::validate()const
{
   validate_asset_info( asset );
   if( amount.valid() )
      validate_positive_amount( *amount );
}

} } // redbank::protocol
