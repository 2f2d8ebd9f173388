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
#include <redbank/chain/types.hpp>
#include <redbank/db/generic_index.hpp>

namespace redbank { namespace chain {
   using redbank::db::abstract_object;
   using redbank::db::generic_index;
   using redbank::db::object;
   using redbank::db::by_id;

   /**
    * @brief Fixed price of an asset in the reference currency
    * @ingroup object
    * @ingroup protocol
    */
   class price_feed_object : public abstract_object<price_feed_object, price_feed_id_type>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = price_feed_object_type;

         asset_info     asset;
         string         asset_ref;
         decimal        price;
         time_point_sec last_update;
   };

   struct by_asset_ref;
   using price_feed_multi_index_type = multi_index_container<
      price_feed_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset_ref>, member< price_feed_object, string, &price_feed_object::asset_ref > >
      >
   >;
   using price_feed_index = generic_index<price_feed_object, price_feed_multi_index_type>;

} } // redbank::chain

MAP_OBJECT_ID_TO_TYPE(redbank::chain::price_feed_object)

FC_REFLECT_DERIVED( redbank::chain::price_feed_object, (redbank::db::object),
                    (asset)(asset_ref)(price)(last_update) )
