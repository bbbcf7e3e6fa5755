// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_FF_FIELD_UTILS_HPP__
#define __ZKPERM_FF_FIELD_UTILS_HPP__

#include <random>

#include "types/int_types.h"

// Canonical field elements cross the library boundary as little-endian 64-bit
// limbs. The widest supported field (BN254) needs four of them.
#define ZKPERM_MAX_LIMBS 4

constexpr u32 limbs_bit_length(const u64 (&limbs)[ZKPERM_MAX_LIMBS])
{
    for (int i = ZKPERM_MAX_LIMBS - 1; i >= 0; i--)
    {
        if (limbs[i] != 0)
        {
            u32 bits = 0;
            u64 top = limbs[i];
            while (top)
            {
                top >>= 1;
                bits++;
            }
            return 64 * i + bits;
        }
    }
    return 0;
}

// limbs mod d, for a small d
constexpr u64 limbs_mod_small(const u64 (&limbs)[ZKPERM_MAX_LIMBS], u64 d)
{
    u128 r = 0;
    for (int i = ZKPERM_MAX_LIMBS - 1; i >= 0; i--)
    {
        r = ((r << 64) | limbs[i]) % d;
    }
    return (u64)r;
}

// a < b, both num_limbs long
inline bool limbs_less_than(const u64 *a, const u64 *b, u32 num_limbs)
{
    for (int i = num_limbs - 1; i >= 0; i--)
    {
        if (a[i] != b[i])
        {
            return a[i] < b[i];
        }
    }
    return false;
}

/*
 * Uniformly random element of F, drawn by rejection sampling over the bit
 * length of the modulus.
 */
template <typename F, typename Rng>
F random_field_element(Rng &rng)
{
    const u32 bits = limbs_bit_length(F::ORDER_LIMBS);
    const u32 top = (bits - 1) / 64;
    const u32 top_bits = bits - 64 * top;
    const u64 top_mask = top_bits == 64 ? ~(u64)0 : (((u64)1 << top_bits) - 1);

    std::uniform_int_distribution<u64> dist;
    u64 limbs[ZKPERM_MAX_LIMBS] = {0};
    do
    {
        for (u32 i = 0; i <= top; i++)
        {
            limbs[i] = dist(rng);
        }
        limbs[top] &= top_mask;
    } while (!F::is_canonical_limbs(limbs));

    return F::from_canonical_limbs(limbs);
}

#endif // __ZKPERM_FF_FIELD_UTILS_HPP__
