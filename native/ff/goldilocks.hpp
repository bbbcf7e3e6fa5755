// Copyright Supranational LLC
// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_FF_GOLDILOCKS_HPP__
#define __ZKPERM_FF_GOLDILOCKS_HPP__

#include "types/int_types.h"
#include "ff/field_utils.hpp"
#include "utils/exception.hpp"

/*
 * Element of the Goldilocks field, kept in canonical form.
 */
class GoldilocksField
{
private:
    u64 val;

public:
    static constexpr u64 ORDER = 0xffffffff00000001ULL; // Goldilocks prime
    static constexpr u64 ORDER_U64 = ORDER;
    static constexpr u64 EPSILON = 4294967295;          // ((u64)1 << 32) - 1 = 2^64 % ORDER
    static constexpr u64 ORDER_LIMBS[ZKPERM_MAX_LIMBS] = {ORDER, 0, 0, 0};
    static constexpr u32 NUM_LIMBS = 1;
    static constexpr u32 BITS = 64;

    inline GoldilocksField() : val(0) {}
    // any u64 is accepted and reduced once
    inline GoldilocksField(u64 a) : val(a >= ORDER ? a - ORDER : a) {}

    static inline GoldilocksField Zero() { return GoldilocksField((u64)0); }
    static inline GoldilocksField One() { return GoldilocksField((u64)1); }

    static GoldilocksField from_canonical_u64(u64 x)
    {
        if (x >= ORDER)
        {
            throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "0x%lx is not a canonical Goldilocks element", x);
        }
        return GoldilocksField(x);
    }

    static inline bool is_canonical_limbs(const u64 *limbs)
    {
        return limbs[0] < ORDER;
    }

    static GoldilocksField from_canonical_limbs(const u64 *limbs)
    {
        return from_canonical_u64(limbs[0]);
    }

    inline u64 as_canonical_u64() const { return this->val; }

    inline void to_canonical_limbs(u64 *out) const
    {
        out[0] = this->val;
    }

    inline GoldilocksField operator+(const GoldilocksField &rhs) const
    {
        GoldilocksField r;
        r.val = modulo_add(this->val, rhs.val);
        return r;
    }

    inline GoldilocksField &operator+=(const GoldilocksField &rhs)
    {
        this->val = modulo_add(this->val, rhs.val);
        return *this;
    }

    inline GoldilocksField operator-(const GoldilocksField &rhs) const
    {
        GoldilocksField r;
        r.val = modulo_sub(this->val, rhs.val);
        return r;
    }

    inline GoldilocksField &operator-=(const GoldilocksField &rhs)
    {
        this->val = modulo_sub(this->val, rhs.val);
        return *this;
    }

    inline GoldilocksField operator-() const
    {
        GoldilocksField r;
        r.val = this->val == 0 ? 0 : ORDER - this->val;
        return r;
    }

    inline GoldilocksField operator*(const GoldilocksField &rhs) const
    {
        GoldilocksField r;
        r.val = reduce128((u128)this->val * (u128)rhs.val);
        return r;
    }

    inline GoldilocksField &operator*=(const GoldilocksField &rhs)
    {
        this->val = reduce128((u128)this->val * (u128)rhs.val);
        return *this;
    }

    inline bool operator==(const GoldilocksField &rhs) const { return this->val == rhs.val; }
    inline bool operator!=(const GoldilocksField &rhs) const { return this->val != rhs.val; }

    inline GoldilocksField dbl() const { return *this + *this; }
    inline GoldilocksField square() const { return *this * *this; }

    GoldilocksField exp_u64(u64 power) const
    {
        GoldilocksField result = One();
        GoldilocksField base = *this;
        while (power)
        {
            if (power & 1)
                result *= base;
            base = base.square();
            power >>= 1;
        }
        return result;
    }

    static inline GoldilocksField from_noncanonical_u128(u128 n)
    {
        GoldilocksField r;
        r.val = reduce128(n);
        return r;
    }

private:
    /*
     * if x + y >= ORDER => x + y - ORDER
     * we avoid doing x + y because it may overflow 64 bits!
     * - the condition x + y < ORDER <=> x < ORDER - y
     * - x + y - ORDER <=> y - (ORDER - x)
     */
    static inline u64 modulo_add(u64 x, u64 y)
    {
        return (x < ORDER - y) ? x + y : y - (ORDER - x);
    }

    /*
     * we assume x, y < ORDER
     * if x < y, we need ORDER - y + x
     */
    static inline u64 modulo_sub(u64 x, u64 y)
    {
        return (x >= y) ? x - y : x + (ORDER - y);
    }

    /*
     * x = x_lo + 2^64 x_hi_lo + 2^96 x_hi_hi with 2^64 = EPSILON and 2^96 = -1 (mod ORDER).
     * Returns the canonical residue.
     */
    static inline u64 reduce128(u128 x)
    {
        u64 x_lo = (u64)x;
        u64 x_hi = (u64)(x >> 64);

        u64 x_hi_hi = x_hi >> 32;
        u64 x_hi_lo = x_hi & EPSILON;

        u64 t0 = x_lo - x_hi_hi;
        if (x_lo < x_hi_hi)
        {
            // borrowed 2^64, give back EPSILON; t0 > EPSILON here
            t0 -= EPSILON;
        }
        u64 t1 = x_hi_lo * EPSILON;
        u64 t2 = t0 + t1;
        if (t2 < t1)
        {
            t2 += EPSILON;
        }
        return t2 >= ORDER ? t2 - ORDER : t2;
    }
};

#endif // __ZKPERM_FF_GOLDILOCKS_HPP__
