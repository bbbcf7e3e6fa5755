// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include "poseidon2/grain_lfsr.hpp"

#include <cstring>

void GrainLfsr::push_bits(u32 *pos, u64 value, u32 nbits)
{
    for (int i = nbits - 1; i >= 0; i--)
    {
        this->state[(*pos)++] = (value >> i) & 1;
    }
}

GrainLfsr::GrainLfsr(u32 field_bits, u32 width, u32 rounds_f, u32 rounds_p)
{
    u32 pos = 0;
    push_bits(&pos, 1, 2); // prime field
    push_bits(&pos, 0, 4); // x^D S-box
    push_bits(&pos, field_bits, 12);
    push_bits(&pos, width, 12);
    push_bits(&pos, rounds_f, 10);
    push_bits(&pos, rounds_p, 10);
    push_bits(&pos, 0x3FFFFFFF, 30);
    this->head = 0;

    for (u32 i = 0; i < 160; i++)
    {
        clock();
    }
}

/*
 * b[i + 80] = b[i + 62] ^ b[i + 51] ^ b[i + 38] ^ b[i + 23] ^ b[i + 13] ^ b[i],
 * kept in a ring buffer whose oldest bit sits at head.
 */
u8 GrainLfsr::clock()
{
    u8 bit = this->state[(this->head + 62) % STATE_BITS] ^
             this->state[(this->head + 51) % STATE_BITS] ^
             this->state[(this->head + 38) % STATE_BITS] ^
             this->state[(this->head + 23) % STATE_BITS] ^
             this->state[(this->head + 13) % STATE_BITS] ^
             this->state[this->head];
    this->state[this->head] = bit;
    this->head = (this->head + 1) % STATE_BITS;
    return bit;
}

u8 GrainLfsr::next_bit()
{
    u8 select = clock();
    while (select == 0)
    {
        clock();
        select = clock();
    }
    return clock();
}

void GrainLfsr::next_bits(u32 nbits, u64 *limbs)
{
    std::memset(limbs, 0, ZKPERM_MAX_LIMBS * sizeof(u64));
    for (int i = nbits - 1; i >= 0; i--)
    {
        if (next_bit())
        {
            limbs[i / 64] |= (u64)1 << (i % 64);
        }
    }
}
