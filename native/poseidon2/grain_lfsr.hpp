// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_POSEIDON2_GRAIN_LFSR_HPP__
#define __ZKPERM_POSEIDON2_GRAIN_LFSR_HPP__

#include "types/int_types.h"
#include "ff/field_utils.hpp"

/*
 * The Grain LFSR of the Poseidon reference scripts, used to derive round
 * constants. The 80-bit state is seeded with the field type (prime field),
 * the S-box type (x^D), the field size in bits, the width, R_F, R_P and
 * thirty ones, then clocked 160 times. Output bits are self-shrinking:
 * bits are read in pairs and the second is kept only when the first is 1.
 */
class GrainLfsr
{
private:
    static const u32 STATE_BITS = 80;

    u8 state[STATE_BITS];
    u32 head;

    u8 clock();
    void push_bits(u32 *pos, u64 value, u32 nbits);

public:
    GrainLfsr(u32 field_bits, u32 width, u32 rounds_f, u32 rounds_p);

    u8 next_bit();

    // nbits (<= 64 * ZKPERM_MAX_LIMBS) read MSB first into little-endian limbs
    void next_bits(u32 nbits, u64 *limbs);

    /*
     * Next element of F: field-size-many bits read MSB first, rejected and
     * redrawn while the value is not below the modulus.
     */
    template <typename F>
    F next_field_element()
    {
        u64 limbs[ZKPERM_MAX_LIMBS];
        do
        {
            next_bits(F::BITS, limbs);
        } while (!F::is_canonical_limbs(limbs));
        return F::from_canonical_limbs(limbs);
    }
};

#endif // __ZKPERM_POSEIDON2_GRAIN_LFSR_HPP__
