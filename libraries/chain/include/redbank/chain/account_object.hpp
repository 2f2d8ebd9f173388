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
#include <redbank/protocol/asset_info.hpp>
#include <redbank/chain/types.hpp>
#include <redbank/db/generic_index.hpp>

namespace redbank { namespace chain {
   using redbank::db::abstract_object;
   using redbank::db::generic_index;
   using redbank::db::object;
   using redbank::db::by_id;

   /**
    * @brief A named participant of the ledger
    * @ingroup object
    * @ingroup protocol
    *
    * Users, liquidators, the owner and the fee collectors are all plain accounts.
    */
   class account_object : public abstract_object<account_object, account_id_type>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = account_object_type;

         string name;
   };

   /**
    * @brief Tracks the bank or token balance of an account in a single asset
    * @ingroup object
    * @ingroup protocol
    *
    * This is the external transfer subsystem as seen by the red bank: native coins and token
    * contract balances held outside of the markets.
    */
   class account_balance_object : public abstract_object<account_balance_object, account_balance_id_type>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = account_balance_object_type;

         account_id_type owner;
         asset_info      asset;
         string          asset_ref;   ///< asset_reference( asset ), the lookup key
         share_type      balance;

         void adjust_balance( const share_type& delta )
         {
            balance += delta;
         }
   };

   struct by_name;
   using account_multi_index_type = multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member< account_object, string, &account_object::name > >
      >
   >;
   using account_index = generic_index<account_object, account_multi_index_type>;

   struct by_account_asset;
   using account_balance_multi_index_type = multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_asset>,
            composite_key<
               account_balance_object,
               member< account_balance_object, account_id_type, &account_balance_object::owner >,
               member< account_balance_object, string, &account_balance_object::asset_ref >
            >
         >
      >
   >;
   using account_balance_index = generic_index<account_balance_object, account_balance_multi_index_type>;

} } // redbank::chain

MAP_OBJECT_ID_TO_TYPE(redbank::chain::account_object)
MAP_OBJECT_ID_TO_TYPE(redbank::chain::account_balance_object)

FC_REFLECT_DERIVED( redbank::chain::account_object, (redbank::db::object), (name) )
FC_REFLECT_DERIVED( redbank::chain::account_balance_object, (redbank::db::object),
                    (owner)(asset)(asset_ref)(balance) )
