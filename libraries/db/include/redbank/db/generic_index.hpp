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
#include <redbank/db/index.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace redbank { namespace db {

   using boost::multi_index_container;
   using namespace boost::multi_index;

   struct by_id;

   /**
    *  Stores objects of one type in a boost::multi_index_container.  The container must have an
    *  ordered_unique index on the object id as its first index; any further indexes are used by
    *  the ledger for its lookups through indices().
    */
   template<typename ObjectType, typename MultiIndexType>
   class generic_index : public index
   {
      public:
         using index_type  = MultiIndexType;
         using object_type = ObjectType;

         const object& create( const std::function<void(object&)>& constructor )override
         {
            ObjectType item;
            item.id = get_next_id();
            constructor( item );
            const ObjectType& result = store( std::move( item ) );
            use_next_id();
            return result;
         }

         const object& insert( object&& obj )override
         {
            return store( std::move( static_cast<ObjectType&>(obj) ) );
         }

         void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            const bool ok = _indices.modify( locate( obj ), [&m]( ObjectType& o ){ m(o); } );
            FC_ASSERT( ok, "Could not modify ${id}, an index constraint was violated", ("id",obj.id) );
         }

         void remove( const object& obj )override
         {
            _indices.erase( locate( obj ) );
         }

         const object* find( object_id_type id )const override
         {
            auto itr = _indices.find( id );
            return itr == _indices.end() ? nullptr : &*itr;
         }

         size_t size()const override { return _indices.size(); }

         const index_type& indices()const { return _indices; }

      private:
         const ObjectType& store( ObjectType&& item )
         {
            const object_id_type id = item.id;
            auto inserted = _indices.insert( std::move( item ) );
            FC_ASSERT( inserted.second, "Could not store ${id}, a uniqueness constraint was violated", ("id",id) );
            return *inserted.first;
         }

         typename index_type::iterator locate( const object& obj )
         {
            return _indices.iterator_to( static_cast<const ObjectType&>(obj) );
         }

         index_type _indices;
   };

   /// Index of objects looked up by id only
   template<typename T>
   struct sparse_index : public generic_index<T, multi_index_container<
      T,
      indexed_by<
         ordered_unique< tag<by_id>, member<object, object_id_type, &object::id> >
      >
   >>{};

} } // redbank::db
