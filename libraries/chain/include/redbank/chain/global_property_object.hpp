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
#include <redbank/protocol/parameters.hpp>
#include <redbank/chain/types.hpp>
#include <redbank/db/generic_index.hpp>

namespace redbank { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains the global configuration of the red bank
    * @ingroup object
    * @ingroup implementation
    *
    * The values here are set at genesis and changed by the owner through update_config_operation.
    */
   class global_property_object : public redbank::db::abstract_object<global_property_object,
                                                                      global_property_id_type>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_global_property_object_type;

         redbank_config config;
         uint32_t       market_count = 0;
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains the ledger clock
    * @ingroup object
    * @ingroup implementation
    */
   class dynamic_global_property_object : public redbank::db::abstract_object<dynamic_global_property_object,
                                                                              dynamic_global_property_id_type>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_dynamic_global_property_object_type;

         time_point_sec time;
         uint64_t       operation_count = 0;   ///< Top level operations applied so far
   };

   using global_property_index = redbank::db::sparse_index<global_property_object>;
   using dynamic_global_property_index = redbank::db::sparse_index<dynamic_global_property_object>;

} } // redbank::chain

MAP_OBJECT_ID_TO_TYPE(redbank::chain::global_property_object)
MAP_OBJECT_ID_TO_TYPE(redbank::chain::dynamic_global_property_object)

FC_REFLECT_DERIVED( redbank::chain::global_property_object, (redbank::db::object), (config)(market_count) )
FC_REFLECT_DERIVED( redbank::chain::dynamic_global_property_object, (redbank::db::object),
                    (time)(operation_count) )
