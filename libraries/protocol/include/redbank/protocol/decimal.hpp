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
#include <redbank/protocol/types.hpp>

namespace redbank { namespace protocol {

   /**
    *  @brief Unsigned fixed point number with 18 fractional digits.
    *
    *  Rates, indices, prices and protocol factors are all decimals.  Every arithmetic
    *  operation rounds toward zero; the intermediate products are computed in 256 bits
    *  so that no precision is lost before the final division.
    */
   class decimal
   {
      public:
         decimal() = default;

         static decimal zero() { return decimal(); }
         static decimal one();
         static decimal raw( const fc::uint128_t& atomics );
         static decimal from_ratio( const fc::uint128_t& numerator, const fc::uint128_t& denominator );
         static decimal percent( uint64_t x ) { return from_ratio( x, 100 ); }
         static decimal permille( uint64_t x ) { return from_ratio( x, 1000 ); }
         static decimal from_string( const string& s );

         const fc::uint128_t& atomics()const { return _atomics; }
         bool                 is_zero()const { return _atomics == 0; }

         string to_string()const;

         /// floor( amount * this )
         fc::uint128_t mul_floor( const fc::uint128_t& amount )const;
         /// ceil( amount * this )
         fc::uint128_t mul_ceil( const fc::uint128_t& amount )const;
         /// floor( amount / this )
         fc::uint128_t div_floor( const fc::uint128_t& amount )const;
         /// ceil( amount / this )
         fc::uint128_t div_ceil( const fc::uint128_t& amount )const;

         /// subtraction saturating at zero
         decimal saturating_sub( const decimal& o )const { return _atomics > o._atomics ? raw( _atomics - o._atomics ) : zero(); }

         decimal& operator += ( const decimal& o );
         decimal& operator -= ( const decimal& o );

         friend decimal operator + ( const decimal& a, const decimal& b );
         friend decimal operator - ( const decimal& a, const decimal& b );
         friend decimal operator * ( const decimal& a, const decimal& b );
         friend decimal operator / ( const decimal& a, const decimal& b );

         friend bool operator == ( const decimal& a, const decimal& b ) { return a._atomics == b._atomics; }
         friend bool operator != ( const decimal& a, const decimal& b ) { return a._atomics != b._atomics; }
         friend bool operator <  ( const decimal& a, const decimal& b ) { return a._atomics <  b._atomics; }
         friend bool operator <= ( const decimal& a, const decimal& b ) { return a._atomics <= b._atomics; }
         friend bool operator >  ( const decimal& a, const decimal& b ) { return a._atomics >  b._atomics; }
         friend bool operator >= ( const decimal& a, const decimal& b ) { return a._atomics >= b._atomics; }

      private:
         fc::uint128_t _atomics = 0;
   };

} } // redbank::protocol

namespace fc {
   void to_variant( const redbank::protocol::decimal& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, redbank::protocol::decimal& vo, uint32_t max_depth = 1 );

   template<>
   struct get_typename<redbank::protocol::decimal> { static const char* name() { return "decimal"; } };
}
