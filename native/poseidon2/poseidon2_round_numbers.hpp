// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_POSEIDON2_ROUND_NUMBERS_HPP__
#define __ZKPERM_POSEIDON2_ROUND_NUMBERS_HPP__

#include "types/int_types.h"
#include "ff/field_utils.hpp"
#include "utils/exception.hpp"

struct Poseidon2RoundNumbers
{
    u64 rounds_f;
    u64 rounds_p;
};

constexpr u64 gcd_u64(u64 a, u64 b)
{
    while (b != 0)
    {
        u64 t = b;
        b = a % b;
        a = t;
    }
    return a;
}

// (p - 1) mod d, for a small d
template <typename F>
constexpr u64 order_minus_one_mod(u64 d)
{
    return (limbs_mod_small(F::ORDER_LIMBS, d) + d - 1) % d;
}

/*
 * The S-box degree of F: the smallest D >= 3 with gcd(p - 1, D) = 1, so that
 * x -> x^D is a permutation of F.
 */
template <typename F>
constexpr u64 poseidon2_sbox_degree()
{
    u64 d = 3;
    while (gcd_u64(d, order_minus_one_mod<F>(d)) != 1)
    {
        d++;
    }
    return d;
}

/*
 * Round numbers (R_F, R_P) giving 128 bits of security, from the tables of
 * the Poseidon2 paper for 31-bit and 64-bit fields and the HorizenLabs
 * parameters for BN254. Throws for unsupported combinations.
 */
template <typename F>
constexpr Poseidon2RoundNumbers poseidon2_round_numbers_128(u64 width, u64 d)
{
    // x^d has to be a permutation
    if (gcd_u64(d, order_minus_one_mod<F>(d)) != 1)
    {
        throw zkperm_error(ZKPERM_ERR_PARAMETERS, "x^%lu is not a permutation of the field", d);
    }

    const u32 prime_bit_number = limbs_bit_length(F::ORDER_LIMBS);

    if (prime_bit_number == 31)
    {
        if (width == 16)
        {
            switch (d)
            {
            case 3:
                return {8, 20};
            case 5:
                return {8, 14};
            case 7:
            case 9:
            case 11:
                return {8, 13};
            }
        }
        else if (width == 24)
        {
            switch (d)
            {
            case 3:
                return {8, 23};
            case 5:
                return {8, 22};
            case 7:
            case 9:
            case 11:
                return {8, 21};
            }
        }
    }
    else if (prime_bit_number == 64)
    {
        if (width == 8)
        {
            switch (d)
            {
            case 3:
                return {8, 41};
            case 5:
                return {8, 27};
            case 7:
                return {8, 22};
            case 9:
                return {8, 19};
            case 11:
                return {8, 17};
            }
        }
        else if (width == 12 || width == 16)
        {
            switch (d)
            {
            case 3:
                return {8, 42};
            case 5:
                return {8, 27};
            case 7:
                return {8, 22};
            case 9:
                return {8, 20};
            case 11:
                return {8, 18};
            }
        }
    }
    else if (prime_bit_number == 254)
    {
        if (width == 3 && d == 5)
        {
            return {8, 56};
        }
    }

    throw zkperm_error(ZKPERM_ERR_PARAMETERS, "no 128-bit round numbers for a %u-bit field, width %lu, degree %lu",
                       prime_bit_number, width, d);
}

#endif // __ZKPERM_POSEIDON2_ROUND_NUMBERS_HPP__
