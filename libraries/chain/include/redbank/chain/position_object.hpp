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
#include <redbank/chain/types.hpp>
#include <redbank/db/generic_index.hpp>

namespace redbank { namespace chain {
   using redbank::db::abstract_object;
   using redbank::db::generic_index;
   using redbank::db::object;
   using redbank::db::by_id;

   /**
    * @brief Ma-token shares held by an account in one market
    * @ingroup object
    * @ingroup protocol
    *
    * Only enabled positions count toward borrowing power and can be seized by liquidators.
    */
   class collateral_object : public abstract_object<collateral_object, collateral_id_type>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = collateral_object_type;

         account_id_type    owner;
         market_id_type     market;
         scaled_amount_type amount_scaled = 0;
         bool               enabled = true;
   };

   /**
    * @brief Scaled debt of a borrower in one market
    * @ingroup object
    * @ingroup protocol
    *
    * Debt taken against an uncollateralized loan limit is flagged and left out of the
    * health computation.
    */
   class debt_object : public abstract_object<debt_object, debt_id_type>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = debt_object_type;

         account_id_type    borrower;
         market_id_type     market;
         scaled_amount_type amount_scaled = 0;
         bool               uncollateralized = false;
   };

   class uncollateralized_limit_object : public abstract_object<uncollateralized_limit_object,
                                                                uncollateralized_limit_id_type>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = uncollateralized_limit_object_type;

         account_id_type user;
         market_id_type  market;
         share_type      limit;
   };

   struct by_account_market;
   struct by_market;

   using collateral_multi_index_type = multi_index_container<
      collateral_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_market>,
            composite_key<
               collateral_object,
               member< collateral_object, account_id_type, &collateral_object::owner >,
               member< collateral_object, market_id_type, &collateral_object::market >
            >
         >,
         ordered_unique< tag<by_market>,
            composite_key<
               collateral_object,
               member< collateral_object, market_id_type, &collateral_object::market >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using debt_multi_index_type = multi_index_container<
      debt_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_market>,
            composite_key<
               debt_object,
               member< debt_object, account_id_type, &debt_object::borrower >,
               member< debt_object, market_id_type, &debt_object::market >
            >
         >,
         ordered_unique< tag<by_market>,
            composite_key<
               debt_object,
               member< debt_object, market_id_type, &debt_object::market >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using uncollateralized_limit_multi_index_type = multi_index_container<
      uncollateralized_limit_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_market>,
            composite_key<
               uncollateralized_limit_object,
               member< uncollateralized_limit_object, account_id_type, &uncollateralized_limit_object::user >,
               member< uncollateralized_limit_object, market_id_type, &uncollateralized_limit_object::market >
            >
         >,
         ordered_unique< tag<by_market>,
            composite_key<
               uncollateralized_limit_object,
               member< uncollateralized_limit_object, market_id_type, &uncollateralized_limit_object::market >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using collateral_index = generic_index<collateral_object, collateral_multi_index_type>;
   using debt_index = generic_index<debt_object, debt_multi_index_type>;
   using uncollateralized_limit_index = generic_index<uncollateralized_limit_object,
                                                      uncollateralized_limit_multi_index_type>;

} } // redbank::chain

MAP_OBJECT_ID_TO_TYPE(redbank::chain::collateral_object)
MAP_OBJECT_ID_TO_TYPE(redbank::chain::debt_object)
MAP_OBJECT_ID_TO_TYPE(redbank::chain::uncollateralized_limit_object)

FC_REFLECT_DERIVED( redbank::chain::collateral_object, (redbank::db::object),
                    (owner)(market)(amount_scaled)(enabled) )
FC_REFLECT_DERIVED( redbank::chain::debt_object, (redbank::db::object),
                    (borrower)(market)(amount_scaled)(uncollateralized) )
FC_REFLECT_DERIVED( redbank::chain::uncollateralized_limit_object, (redbank::db::object),
                    (user)(market)(limit) )
