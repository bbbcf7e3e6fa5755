// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include "ff/bn254.hpp"

#include <cstdio>

static int hex_digit_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool Bn254Field::is_canonical_limbs(const u64 *limbs)
{
    return limbs_less_than(limbs, ORDER_LIMBS, NUM_LIMBS);
}

Bn254Field Bn254Field::from_canonical_limbs(const u64 *limbs)
{
    if (!is_canonical_limbs(limbs))
    {
        throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "0x%016lx%016lx%016lx%016lx is not a canonical BN254 scalar",
                           limbs[3], limbs[2], limbs[1], limbs[0]);
    }

    u8 bytes[8 * NUM_LIMBS];
    for (u32 i = 0; i < NUM_LIMBS; i++)
    {
        for (u32 j = 0; j < 8; j++)
        {
            bytes[8 * i + j] = (u8)(limbs[i] >> (8 * j));
        }
    }
    Bn254Field r;
    r.to(bytes, sizeof(bytes), true);
    return r;
}

void Bn254Field::to_canonical_limbs(u64 *out) const
{
    pow_t scalar;
    this->to_scalar(scalar);
    for (u32 i = 0; i < NUM_LIMBS; i++)
    {
        u64 limb = 0;
        for (u32 j = 0; j < 8; j++)
        {
            limb |= (u64)scalar[8 * i + j] << (8 * j);
        }
        out[i] = limb;
    }
}

Bn254Field Bn254Field::from_hex(const std::string &hex)
{
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    {
        start = 2;
    }
    const size_t num_digits = hex.size() - start;
    if (num_digits == 0)
    {
        throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "invalid hex string '%s'", hex.c_str());
    }
    if (num_digits > 16 * NUM_LIMBS)
    {
        throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "%s does not fit in %u limbs", hex.c_str(), NUM_LIMBS);
    }

    // digit k from the right lands in limb k / 16
    u64 limbs[NUM_LIMBS] = {0};
    for (size_t k = 0; k < num_digits; k++)
    {
        int v = hex_digit_value(hex[hex.size() - 1 - k]);
        if (v < 0)
        {
            throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "invalid hex string '%s'", hex.c_str());
        }
        limbs[k / 16] |= (u64)v << (4 * (k % 16));
    }

    return from_canonical_limbs(limbs);
}

std::string Bn254Field::to_hex() const
{
    u64 limbs[NUM_LIMBS];
    to_canonical_limbs(limbs);

    char buf[2 + 16 * NUM_LIMBS + 1];
    snprintf(buf, sizeof(buf), "0x%016lx%016lx%016lx%016lx", limbs[3], limbs[2], limbs[1], limbs[0]);
    return std::string(buf);
}

Bn254Field Bn254Field::exp_u64(u64 power) const
{
    Bn254Field result = One();
    Bn254Field base = *this;
    while (power)
    {
        if (power & 1)
            result *= base;
        base = base.square();
        power >>= 1;
    }
    return result;
}
