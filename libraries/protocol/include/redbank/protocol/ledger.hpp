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
#include <redbank/protocol/base.hpp>

namespace redbank { namespace protocol {

   /**
    * @brief Deposit a native asset into its market
    * @ingroup operations
    *
    * The depositor receives ma-token shares, or the beneficiary does when on_behalf_of is set.
    * A new collateral position is enabled as collateral.
    */
   struct deposit_operation : public base_operation
   {
      account_id_type           depositor;
      asset_info                asset;
      share_type                amount;
      optional<account_id_type> on_behalf_of;

      account_id_type sender()const { return depositor; }
      account_id_type beneficiary()const { return on_behalf_of.valid() ? *on_behalf_of : depositor; }
      void            validate()const override;
   };

   /**
    * @brief Burn ma-token shares and receive the underlying asset
    * @ingroup operations
    */
   struct withdraw_operation : public base_operation
   {
      account_id_type           account;
      asset_info                asset;
      optional<share_type>      amount;      ///< Underlying amount; the whole balance when absent
      optional<account_id_type> recipient;   ///< Receiver of the underlying asset, the account by default

      account_id_type sender()const { return account; }
      void            validate()const override;
   };

   struct borrow_operation : public base_operation
   {
      account_id_type           borrower;
      asset_info                asset;
      share_type                amount;
      optional<account_id_type> recipient;

      account_id_type sender()const { return borrower; }
      void            validate()const override;
   };

   /**
    * @brief Repay debt of a native asset
    * @ingroup operations
    *
    * Whatever exceeds the outstanding debt is sent back to the payer.
    */
   struct repay_operation : public base_operation
   {
      account_id_type           account;
      asset_info                asset;
      share_type                amount;
      optional<account_id_type> on_behalf_of;

      account_id_type sender()const { return account; }
      account_id_type beneficiary()const { return on_behalf_of.valid() ? *on_behalf_of : account; }
      void            validate()const override;
   };

   /**
    * @brief Grant or revoke a borrowing allowance that needs no collateral
    * @ingroup operations
    *
    * A zero limit removes the allowance.  Users with a positive allowance cannot be liquidated.
    */
   struct update_uncollateralized_loan_limit_operation : public base_operation
   {
      account_id_type owner;
      account_id_type user;
      asset_info      asset;
      share_type      new_limit;

      account_id_type sender()const { return owner; }
      void            validate()const override;
   };

   struct update_user_collateral_asset_status_operation : public base_operation
   {
      account_id_type account;
      asset_info      asset;
      bool            enable = false;

      account_id_type sender()const { return account; }
      void            validate()const override;
   };

   /**
    * @brief Transfer ma-token shares between accounts
    * @ingroup operations
    *
    * The amount is given in the underlying asset and converted with the current liquidity index.
    */
   struct ma_token_transfer_operation : public base_operation
   {
      account_id_type from;
      account_id_type to;
      asset_info      asset;
      share_type      amount;

      account_id_type sender()const { return from; }
      void            validate()const override;
   };

   /**
    * @brief Turn the accrued protocol income of a market into ma-token shares
    * @ingroup operations
    *
    * Anyone may trigger the distribution.  The income is split between the insurance fund,
    * the treasury and the staking account according to the configured fee shares.
    */
   struct distribute_protocol_income_operation : public base_operation
   {
      account_id_type      sender_account;
      asset_info           asset;
      optional<share_type> amount;   ///< Part of the income to distribute, all of it when absent

      account_id_type sender()const { return sender_account; }
      void            validate()const override;
   };

} } // redbank::protocol

FC_REFLECT( redbank::protocol::deposit_operation, (depositor)(asset)(amount)(on_behalf_of) )
FC_REFLECT( redbank::protocol::withdraw_operation, (account)(asset)(amount)(recipient) )
FC_REFLECT( redbank::protocol::borrow_operation, (borrower)(asset)(amount)(recipient) )
FC_REFLECT( redbank::protocol::repay_operation, (account)(asset)(amount)(on_behalf_of) )
FC_REFLECT( redbank::protocol::update_uncollateralized_loan_limit_operation, (owner)(user)(asset)(new_limit) )
FC_REFLECT( redbank::protocol::update_user_collateral_asset_status_operation, (account)(asset)(enable) )
FC_REFLECT( redbank::protocol::ma_token_transfer_operation, (from)(to)(asset)(amount) )
FC_REFLECT( redbank::protocol::distribute_protocol_income_operation, (sender_account)(asset)(amount) )
