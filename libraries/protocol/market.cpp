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
#include <redbank/protocol/market.hpp>
#include <redbank/protocol/exceptions.hpp>

namespace redbank { namespace protocol {

void init_asset_operation::validate()const
{
   validate_asset_info( asset );
   REDBANK_ASSERT( params.is_complete(), invalid_parameter,
                   "All params should be available during initialization", ("params", params) );
   params.to_market_parameters().validate();
   if( symbol.valid() )
   {
      REDBANK_ASSERT( !symbol->empty() && symbol->size() <= REDBANK_MAX_SYMBOL_LENGTH, invalid_parameter,
                      "Invalid ma-token symbol ${s}", ("s", *symbol) );
   }
}

void update_asset_operation::validate()const
{
   validate_asset_info( asset );
   params.validate();
}

void update_config_operation::validate()const
{
   config.validate();
}

void set_asset_price_operation::validate()const
{
   validate_asset_info( asset );
   REDBANK_ASSERT( !price.is_zero(), invalid_parameter, "Price must be positive", ("asset", asset) );
}

} } // redbank::protocol
