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

#define DOLLARSTORE_SYMBOL        "DLRS"
#define DOLLARSTORE_REWARD_SYMBOL "CENTS"

/// All reserve accounting happens in units of the synthetic token
#define DOLLARSTORE_SYNTHETIC_PRECISION_DIGITS 6
#define DOLLARSTORE_SYNTHETIC_PRECISION        int64_t( 1000000 )
#define DOLLARSTORE_REWARD_PRECISION_DIGITS    6
#define DOLLARSTORE_REWARD_PRECISION           int64_t( 1000000 )

#define DOLLARSTORE_MIN_ACCOUNT_NAME_LENGTH 3
#define DOLLARSTORE_MAX_ACCOUNT_NAME_LENGTH 63

#define DOLLARSTORE_MIN_ASSET_SYMBOL_LENGTH 3
#define DOLLARSTORE_MAX_ASSET_SYMBOL_LENGTH 16
#define DOLLARSTORE_MAX_ASSET_PRECISION     18

#define DOLLARSTORE_MAX_SHARE_SUPPLY int64_t(1000000000000000000ll)

#define DOLLARSTORE_BASIS_POINTS_DENOM  10000
#define DOLLARSTORE_SECONDS_PER_DAY     (86400)
#define DOLLARSTORE_SECONDS_PER_YEAR    (365 * DOLLARSTORE_SECONDS_PER_DAY)

/**
 * Stake ledger timing. Power ramps linearly to the staked amount over the full power
 * duration and is suspended for the cooldown after an unstake.
 */
#define DOLLARSTORE_DEFAULT_FULL_POWER_DURATION   (30 * DOLLARSTORE_SECONDS_PER_DAY)
#define DOLLARSTORE_DEFAULT_UNSTAKE_COOLDOWN      (7 * DOLLARSTORE_SECONDS_PER_DAY)

/// 8% APY on queued synthetic, paid at fill
#define DOLLARSTORE_DEFAULT_MAKER_REWARD_RATE_BPS  800
/// the 1bp redemption fee a taker would otherwise have paid
#define DOLLARSTORE_DEFAULT_TAKER_FEE_BPS          1
/// one reward token is priced at $0.01
#define DOLLARSTORE_DEFAULT_REWARD_UNITS_PER_DOLLAR 100

#define DOLLARSTORE_DEFAULT_MAKER_CAP    (int64_t(600000000) * DOLLARSTORE_REWARD_PRECISION)
#define DOLLARSTORE_DEFAULT_TAKER_CAP    (int64_t(200000000) * DOLLARSTORE_REWARD_PRECISION)
#define DOLLARSTORE_DEFAULT_FOUNDER_CAP  (int64_t(200000000) * DOLLARSTORE_REWARD_PRECISION)
/// founder vests one unit for every this many user reward units
#define DOLLARSTORE_DEFAULT_FOUNDER_VESTING_RATIO  4

/// synthetic units of daily fee-free redemption per unit of stake power
#define DOLLARSTORE_DEFAULT_FEE_FREE_CAP_MULTIPLIER 1

#define DOLLARSTORE_DEFAULT_FOUNDER_ACCOUNT_NAME "founder"

#define DOLLARSTORE_MAX_NESTED_OBJECTS (200)
