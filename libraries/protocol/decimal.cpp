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
#include <redbank/protocol/decimal.hpp>
#include <redbank/protocol/exceptions.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <sstream>

namespace redbank { namespace protocol {

using boost::multiprecision::uint256_t;

static const uint256_t fractional256( REDBANK_DECIMAL_FRACTIONAL );

static fc::uint128_t to_checked_128( const uint256_t& t )
{
   REDBANK_ASSERT( t <= uint256_t( std::numeric_limits<fc::uint128_t>::max() ), invalid_decimal,
                   "Decimal overflow", ("value", t.str()) );
   return static_cast<fc::uint128_t>(t);
}

decimal decimal::one()
{
   return raw( REDBANK_DECIMAL_FRACTIONAL );
}

decimal decimal::raw( const fc::uint128_t& atomics )
{
   decimal result;
   result._atomics = atomics;
   return result;
}

decimal decimal::from_ratio( const fc::uint128_t& numerator, const fc::uint128_t& denominator )
{
   REDBANK_ASSERT( denominator != 0, invalid_decimal, "Denominator must not be zero", ("n", fc::variant(numerator, 2)) );
   return raw( to_checked_128( uint256_t( numerator ) * fractional256 / uint256_t( denominator ) ) );
}

decimal decimal::from_string( const string& s )
{ try {
   REDBANK_ASSERT( !s.empty(), invalid_decimal, "Empty decimal string", ("s", s) );
   auto dot = s.find( '.' );
   string whole = s.substr( 0, dot );
   string frac = ( dot == string::npos ) ? string() : s.substr( dot + 1 );
   REDBANK_ASSERT( !whole.empty() || !frac.empty(), invalid_decimal, "Invalid decimal ${s}", ("s", s) );
   REDBANK_ASSERT( frac.size() <= REDBANK_DECIMAL_PLACES, invalid_decimal,
                   "Cannot parse more than ${n} fractional digits", ("n", REDBANK_DECIMAL_PLACES)("s", s) );

   uint256_t value = 0;
   for( char c : whole + frac )
   {
      REDBANK_ASSERT( c >= '0' && c <= '9', invalid_decimal, "Invalid character in decimal ${s}", ("s", s) );
      value = value * 10 + uint256_t( c - '0' );
   }
   for( size_t i = frac.size(); i < REDBANK_DECIMAL_PLACES; ++i )
      value *= 10;
   return raw( to_checked_128( value ) );
} FC_CAPTURE_AND_RETHROW( (s) ) }

string decimal::to_string()const
{
   std::string s = fc::variant( _atomics, 2 ).as_string();
   if( _atomics == 0 )
      return s;

   std::stringstream ss;
   const size_t precision = REDBANK_DECIMAL_PLACES;
   size_t pos = s.find_last_not_of( '0' );
   size_t len = s.size();
   if( len > precision )
   {
      size_t left_len = len - precision;
      ss << s.substr( 0, left_len );
      if( pos >= left_len )
         ss << '.' << s.substr( left_len, pos - left_len + 1 );
   }
   else
   {
      ss << "0.";
      for( size_t i = precision - len; i > 0; --i )
         ss << '0';
      ss << s.substr( 0, pos + 1 );
   }
   return ss.str();
}

fc::uint128_t decimal::mul_floor( const fc::uint128_t& amount )const
{
   return to_checked_128( uint256_t( amount ) * uint256_t( _atomics ) / fractional256 );
}

fc::uint128_t decimal::mul_ceil( const fc::uint128_t& amount )const
{
   uint256_t product = uint256_t( amount ) * uint256_t( _atomics );
   return to_checked_128( ( product + fractional256 - 1 ) / fractional256 );
}

fc::uint128_t decimal::div_floor( const fc::uint128_t& amount )const
{
   REDBANK_ASSERT( _atomics != 0, invalid_decimal, "Division by zero", ("amount", fc::variant(amount, 2)) );
   return to_checked_128( uint256_t( amount ) * fractional256 / uint256_t( _atomics ) );
}

fc::uint128_t decimal::div_ceil( const fc::uint128_t& amount )const
{
   REDBANK_ASSERT( _atomics != 0, invalid_decimal, "Division by zero", ("amount", fc::variant(amount, 2)) );
   uint256_t divisor( _atomics );
   return to_checked_128( ( uint256_t( amount ) * fractional256 + divisor - 1 ) / divisor );
}

decimal& decimal::operator += ( const decimal& o )
{
   *this = *this + o;
   return *this;
}

decimal& decimal::operator -= ( const decimal& o )
{
   *this = *this - o;
   return *this;
}

decimal operator + ( const decimal& a, const decimal& b )
{
   return decimal::raw( to_checked_128( uint256_t( a._atomics ) + uint256_t( b._atomics ) ) );
}

decimal operator - ( const decimal& a, const decimal& b )
{
   REDBANK_ASSERT( a._atomics >= b._atomics, invalid_decimal, "Decimal underflow: ${a} - ${b}",
                   ("a", a.to_string())("b", b.to_string()) );
   return decimal::raw( a._atomics - b._atomics );
}

decimal operator * ( const decimal& a, const decimal& b )
{
   return decimal::raw( to_checked_128( uint256_t( a._atomics ) * uint256_t( b._atomics ) / fractional256 ) );
}

decimal operator / ( const decimal& a, const decimal& b )
{
   REDBANK_ASSERT( b._atomics != 0, invalid_decimal, "Division by zero: ${a} / 0", ("a", a.to_string()) );
   return decimal::raw( to_checked_128( uint256_t( a._atomics ) * fractional256 / uint256_t( b._atomics ) ) );
}

} } // redbank::protocol

namespace fc {

void to_variant( const redbank::protocol::decimal& var, fc::variant& vo, uint32_t max_depth )
{
   vo = var.to_string();
}

void from_variant( const fc::variant& var, redbank::protocol::decimal& vo, uint32_t max_depth )
{
   if( var.is_string() )
      vo = redbank::protocol::decimal::from_string( var.get_string() );
   else if( var.is_uint64() )
      vo = redbank::protocol::decimal::from_string( fc::to_string( var.as_uint64() ) );
   else if( var.is_int64() )
   {
      REDBANK_ASSERT( var.as_int64() >= 0, redbank::protocol::invalid_decimal,
                      "Decimal can't be negative: ${v}", ("v", var.as_int64()) );
      vo = redbank::protocol::decimal::from_string( fc::to_string( var.as_int64() ) );
   }
   else
      FC_THROW_EXCEPTION( redbank::protocol::invalid_decimal,
                          "Decimal must be a string or a whole number, fractions are written as strings: ${v}",
                          ("v", var) );
}

} // fc
