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
#include <redbank/chain/exceptions.hpp>
#include <redbank/protocol/operations.hpp>

namespace redbank { namespace chain {

   class database;

   /**
    *  State tracked while one operation is being processed.  A nested operation, such as the
    *  message carried by a token_receive_operation, is evaluated with its own state.
    */
   class evaluation_state
   {
      public:
         explicit evaluation_state( database* db = nullptr, uint32_t depth = 0 )
         :_db(db), nesting_depth(depth){}

         database& db()const { FC_ASSERT( _db != nullptr, "Evaluation state is not bound to a database" ); return *_db; }

         database* _db = nullptr;
         uint32_t  nesting_depth = 0;
         /**
          *  Amount of the operation's asset already transferred to the bank before evaluation.
          *  Set for messages delivered by the token contract, in which case the sender's balance
          *  is not charged again.
          */
         optional<share_type> prepaid_amount;
   };

   class generic_evaluator
   {
   public:
      virtual ~generic_evaluator(){}

      virtual int get_type()const = 0;
      virtual operation_result start_evaluate( evaluation_state& eval_state, const operation& op, bool apply );

      /**
       * @note derived classes should ASSUME that the default validation that is
       * indepenent of ledger state should be performed by op.validate() and should
       * not perform these extra checks.
       */
      virtual operation_result evaluate( const operation& op ) = 0;
      virtual operation_result apply( const operation& op ) = 0;

      database& db()const;

   protected:
      /// Throws unauthorized_exception unless @p account is the configured owner
      void verify_owner( account_id_type account )const;

      void verify_account_exists( account_id_type account )const;

      /// Moves @p amount of @p asset from @p from to the bank, unless it was prepaid
      void collect_funds( account_id_type from, const asset_info& asset, const share_type& amount )const;

      evaluation_state* trx_state = nullptr;
   };

   class op_evaluator
   {
   public:
      virtual ~op_evaluator(){}
      virtual operation_result evaluate( evaluation_state& eval_state, const operation& op, bool apply ) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
   public:
      operation_result evaluate( evaluation_state& eval_state, const operation& op, bool apply = true ) override
      {
         T eval;
         return eval.start_evaluate( eval_state, op, apply );
      }
   };

   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
   public:
      int get_type()const override { return operation::tag<typename DerivedEvaluator::operation_type>::value; }

      operation_result evaluate( const operation& o ) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();

         return eval->do_evaluate(op);
      }

      operation_result apply( const operation& o ) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();

         return eval->do_apply(op);
      }
   };
} }
