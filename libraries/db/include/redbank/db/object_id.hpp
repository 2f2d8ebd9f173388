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
#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>
#include <fc/string.hpp>

#include <functional>

namespace redbank { namespace db {

   /**
    *  Untyped object id.  The space takes the top byte, the type the next byte and the instance
    *  the remaining 48 bits, so ids sort by space, then type, then creation order.
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits = 48;
      static constexpr uint64_t instance_mask = ( uint64_t(1) << instance_bits ) - 1;
      static constexpr uint64_t max_space_or_type = 0xff;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i ){ reset( s, t, i ); }

      void reset( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( ( i & ~instance_mask ) == 0, "instance overflow", ("instance",i) );
         number = ( uint64_t(s) << ( instance_bits + 8 ) ) | ( uint64_t(t) << instance_bits ) | i;
      }

      uint8_t  space()const    { return uint8_t( number >> ( instance_bits + 8 ) ); }
      uint8_t  type()const     { return uint8_t( number >> instance_bits ); }
      uint64_t instance()const { return number & instance_mask; }

      /// Next id in the same index
      void advance() { reset( space(), type(), instance() + 1 ); }

      template<typename IdType>
      bool is()const { return space() == IdType::space_id && type() == IdType::type_id; }

      explicit operator std::string()const
      {
         return fc::to_string( space() ) + "." + fc::to_string( type() ) + "." + fc::to_string( instance() );
      }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number <  b.number; }

      uint64_t number = 0;
   };

   class object;

   /// Maps an object_id<S,T> to the object class stored under it, see MAP_OBJECT_ID_TO_TYPE
   template<typename ObjectID>
   struct object_downcast { using type = object; };
   template<typename ObjectID>
   using object_downcast_t = typename object_downcast<ObjectID>::type;

#define MAP_OBJECT_ID_TO_TYPE(OBJECT) \
   namespace redbank { namespace db { \
   template<> \
   struct object_downcast<const redbank::db::object_id<OBJECT::space_id, \
                                                      OBJECT::type_id>&> { using type = OBJECT; }; \
   } }

   /// Id of an object of a known space and type
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id  = TypeID;

      object_id() = default;
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( ( i & ~object_id_type::instance_mask ) == 0, "instance overflow", ("instance",i) );
      }
      explicit object_id( const object_id_type& id ):instance(id.instance())
      {
         FC_ASSERT( id.is<object_id>(), "Expected an id of ${s}.${t}, got ${id}",
                    ("s",SpaceID)("t",TypeID)("id",std::string(id)) );
      }

      object_id& operator=( const object_id_type& o ) { return *this = object_id( o ); }

      operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }

      explicit operator std::string()const { return std::string( object_id_type( *this ) ); }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator <  ( const object_id& a, const object_id& b ) { return a.instance <  b.instance; }

      uint64_t instance = 0;
   };

} } // redbank::db

namespace std {
   template<> struct hash<redbank::db::object_id_type>
   {
      size_t operator()( const redbank::db::object_id_type& x )const { return std::hash<uint64_t>()( x.number ); }
   };
}

namespace fc {

template<uint8_t SpaceID, uint8_t TypeID>
struct get_typename<redbank::db::object_id<SpaceID,TypeID>>
{
   static const char* name()
   {
      static const std::string n = "redbank::db::object_id<" + fc::to_string(SpaceID) + ":" + fc::to_string(TypeID) + ">";
      return n.c_str();
   }
};

template<>
struct get_typename<redbank::db::object_id_type>
{
   static const char* name() { return "redbank::db::object_id_type"; }
};

void to_variant( const redbank::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 );
void from_variant( const fc::variant& var, redbank::db::object_id_type& vo, uint32_t max_depth = 1 );

template<uint8_t SpaceID, uint8_t TypeID>
void to_variant( const redbank::db::object_id<SpaceID,TypeID>& var, fc::variant& vo, uint32_t max_depth = 1 )
{
   vo = std::string( var );
}

template<uint8_t SpaceID, uint8_t TypeID>
void from_variant( const fc::variant& var, redbank::db::object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
{ try {
   redbank::db::object_id_type id;
   from_variant( var, id, max_depth );
   vo = redbank::db::object_id<SpaceID,TypeID>( id );
} FC_CAPTURE_AND_RETHROW( (var) ) }

} // fc
