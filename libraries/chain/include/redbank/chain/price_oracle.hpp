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

namespace redbank { namespace chain {

   class database;

   /**
    * @brief Source of asset prices in the common reference currency
    *
    * Position evaluation and liquidation read every price through this interface.
    */
   class price_oracle
   {
      public:
         virtual ~price_oracle() = default;

         /// Throws price_not_available when the asset has no price
         virtual decimal get_price( const asset_info& asset )const = 0;
   };

   /// Serves the fixed prices stored by set_asset_price_operation
   class database_price_oracle : public price_oracle
   {
      public:
         explicit database_price_oracle( const database& db ):_db(db){}

         decimal get_price( const asset_info& asset )const override;

      private:
         const database& _db;
   };

} } // redbank::chain
