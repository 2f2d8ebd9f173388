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

#define REDBANK_MIN_ACCOUNT_NAME_LENGTH 1
#define REDBANK_MAX_ACCOUNT_NAME_LENGTH 63

#define REDBANK_MAX_DENOM_LENGTH 128
#define REDBANK_MAX_SYMBOL_LENGTH 32

#define REDBANK_MAX_SHARE_SUPPLY int64_t(1000000000000000000ll)

/// ma-token shares minted per unit of underlying at a liquidity index of 1
#define REDBANK_MA_TOKEN_SCALING_FACTOR uint64_t( 1000000 )

/// fixed point denominator of redbank::protocol::decimal
#define REDBANK_DECIMAL_FRACTIONAL uint64_t( 1000000000000000000ULL )
#define REDBANK_DECIMAL_PLACES 18

#define REDBANK_SECONDS_PER_YEAR uint64_t( 31536000 )

#define REDBANK_MA_TOKEN_SYMBOL_PREFIX "ma"

/// a token receive may carry exactly one nested operation
#define REDBANK_MAX_NESTED_OPERATION_DEPTH 1

#define REDBANK_MAX_NESTED_OBJECTS (200)

/// initial timestamp used when a genesis state does not provide one
#define REDBANK_DEFAULT_GENESIS_TIMESTAMP 1609459200
