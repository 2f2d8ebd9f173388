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
#include <redbank/db/object_database.hpp>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace redbank { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   _undo_db.enable();
}

const object* object_database::find_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).find( id );
}

const object& object_database::get_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).get( id );
}

const index& object_database::get_index( uint8_t space_id, uint8_t type_id )const
{
   auto itr = _indexes.find( index_key( space_id, type_id ) );
   FC_ASSERT( itr != _indexes.end(), "Database index ${s}.${t} does not exist", ("s",space_id)("t",type_id) );
   return *itr->second;
}

index& object_database::get_mutable_index( uint8_t space_id, uint8_t type_id )
{
   auto itr = _indexes.find( index_key( space_id, type_id ) );
   FC_ASSERT( itr != _indexes.end(), "Database index ${s}.${t} does not exist", ("s",space_id)("t",type_id) );
   return *itr->second;
}

void base_primary_index::save_undo( const object& obj )
{
   _db._undo_db.on_modify( obj );
}

void base_primary_index::on_add( const object& obj )
{
   _db._undo_db.on_create( obj );
}

void base_primary_index::on_remove( const object& obj )
{
   _db._undo_db.on_remove( obj );
}

} } // namespace redbank::db

namespace fc {

void to_variant( const redbank::db::object_id_type& var, fc::variant& vo, uint32_t max_depth )
{
   vo = std::string( var );
}

void from_variant( const fc::variant& var, redbank::db::object_id_type& vo, uint32_t max_depth )
{ try {
   std::vector<std::string> parts;
   const std::string& s = var.get_string();
   boost::split( parts, s, boost::is_any_of( "." ) );
   FC_ASSERT( parts.size() == 3, "Object ids are written as space.type.instance" );
   for( const auto& part : parts )
      FC_ASSERT( !part.empty(), "Empty component in object id" );

   const uint64_t space_id = fc::to_uint64( parts[0] );
   const uint64_t type_id  = fc::to_uint64( parts[1] );
   FC_ASSERT( space_id <= redbank::db::object_id_type::max_space_or_type, "space overflow" );
   FC_ASSERT( type_id <= redbank::db::object_id_type::max_space_or_type, "type overflow" );
   vo.reset( static_cast<uint8_t>(space_id), static_cast<uint8_t>(type_id), fc::to_uint64( parts[2] ) );
} FC_CAPTURE_AND_RETHROW( (var) ) }

} // fc
