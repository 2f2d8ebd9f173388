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

   struct deposit_token_payload
   {
      optional<account_id_type> on_behalf_of;
   };

   struct repay_token_payload
   {
      optional<account_id_type> on_behalf_of;
   };

   struct liquidate_token_payload
   {
      asset_info      collateral_asset;
      account_id_type user;
      bool            receive_ma_token = false;
   };

   using token_receive_payload = static_variant< deposit_token_payload, repay_token_payload, liquidate_token_payload >;

   /**
    * @brief Notification that tokens were sent to the red bank with an attached message
    * @ingroup operations
    *
    * The tokens move from the sender's balance to the bank, then the message is decoded into
    * a deposit, repay or liquidate operation on the token asset and evaluated as a nested
    * operation.  If the nested operation fails the whole notification fails.
    */
   struct token_receive_operation : public base_operation
   {
      string                contract_addr;   ///< The token contract sending the notification
      account_id_type       sender_account;  ///< Who sent the tokens
      share_type            amount;
      token_receive_payload payload;

      account_id_type sender()const { return sender_account; }
      asset_info      token_asset_info()const { return token( contract_addr ); }
      void            validate()const override;
   };

} } // redbank::protocol

FC_REFLECT( redbank::protocol::deposit_token_payload, (on_behalf_of) )
FC_REFLECT( redbank::protocol::repay_token_payload, (on_behalf_of) )
FC_REFLECT( redbank::protocol::liquidate_token_payload, (collateral_asset)(user)(receive_ma_token) )
FC_REFLECT( redbank::protocol::token_receive_operation, (contract_addr)(sender_account)(amount)(payload) )
