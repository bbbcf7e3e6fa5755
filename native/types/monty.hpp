// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_MONTY_HPP__
#define __ZKPERM_MONTY_HPP__

#include "types/int_types.h"
#include "ff/field_utils.hpp"
#include "utils/exception.hpp"

/*
 * Montgomery reduction: x * 2^-32 mod PRIME, for x < PRIME * 2^32.
 * MONTY_MU is PRIME^-1 mod 2^32.
 */
template <typename MP>
static inline u32 monty_reduce(u64 x)
{
    u64 t = (x * (u64)MP::MONTY_MU) & (u64)MP::MONTY_MASK;
    u64 u = t * (u64)MP::PRIME;

    u64 over = (u > x);
    u64 x_sub_u = x - u;
    u32 x_sub_u_hi = (u32)(x_sub_u >> MP::MONTY_BITS);
    u32 corr = over ? MP::PRIME : 0;
    return x_sub_u_hi + corr;
}

/*
 * A 31-bit prime field element kept in Montgomery form (R = 2^32).
 */
template <typename MP>
class MontyField31
{
private:
    u32 val;

public:
    typedef MP Parameters;

    static constexpr u32 ORDER_U32 = MP::PRIME;
    static constexpr u64 ORDER_U64 = (u64)MP::PRIME;
    static constexpr u64 ORDER_LIMBS[ZKPERM_MAX_LIMBS] = {MP::PRIME, 0, 0, 0};
    static constexpr u32 NUM_LIMBS = 1;
    static constexpr u32 BITS = 31;

    MontyField31() { this->val = 0; };

    MontyField31(u32 x, bool is_monty = false)
    {
        if (is_monty)
            this->val = x;
        else
            this->val = to_monty(x);
    };

    static inline u32 to_monty(u32 x)
    {
        return (u32)(((u64)x << MP::MONTY_BITS) % (u64)MP::PRIME);
    }

    static inline u32 from_monty(u32 x)
    {
        return monty_reduce<MP>((u64)x);
    }

    static inline MontyField31 Zero()
    {
        return MontyField31(0);
    }

    static inline MontyField31 One()
    {
        return MontyField31(1);
    }

    static inline MontyField31 Two()
    {
        return MontyField31(2);
    }

    static inline MontyField31 NegOne()
    {
        return MontyField31(MP::PRIME - 1);
    }

    static MontyField31 from_canonical_u32(u32 x)
    {
        if (x >= MP::PRIME)
        {
            throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "%u is not a canonical element of F_%u", x, MP::PRIME);
        }
        return MontyField31(x);
    }

    static inline bool is_canonical_limbs(const u64 *limbs)
    {
        return limbs[0] < (u64)MP::PRIME;
    }

    static MontyField31 from_canonical_limbs(const u64 *limbs)
    {
        if (!is_canonical_limbs(limbs))
        {
            throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "%lu is not a canonical element of F_%u", limbs[0], MP::PRIME);
        }
        return MontyField31((u32)limbs[0]);
    }

    // raw Montgomery representation
    inline u32 value() const
    {
        return this->val;
    }

    inline u32 as_canonical_u32() const
    {
        return from_monty(this->val);
    }

    inline u64 to_u64() const
    {
        return (u64)from_monty(this->val);
    }

    inline void to_canonical_limbs(u64 *out) const
    {
        out[0] = to_u64();
    }

    inline MontyField31 operator+(const MontyField31 &rhs) const
    {
        u64 sum = (u64)val + (u64)rhs.value();
        u32 v = sum < (u64)MP::PRIME ? (u32)sum : (u32)(sum - MP::PRIME);
        return MontyField31(v, true);
    }

    inline MontyField31 &operator+=(const MontyField31 &rhs)
    {
        u64 sum = (u64)val + (u64)rhs.value();
        this->val = sum < (u64)MP::PRIME ? (u32)sum : (u32)(sum - MP::PRIME);
        return *this;
    }

    inline MontyField31 operator-(const MontyField31 &rhs) const
    {
        u32 over = val < rhs.value();
        u32 diff = over ? (u32)((u64)val + (u64)MP::PRIME - rhs.value()) : val - rhs.value();
        return MontyField31(diff, true);
    }

    inline MontyField31 &operator-=(const MontyField31 &rhs)
    {
        u32 over = val < rhs.value();
        this->val = over ? (u32)((u64)val + (u64)MP::PRIME - rhs.value()) : val - rhs.value();
        return *this;
    }

    inline MontyField31 operator-() const
    {
        return MontyField31(val == 0 ? 0 : MP::PRIME - val, true);
    }

    inline MontyField31 operator*(const MontyField31 &rhs) const
    {
        u64 prod = (u64)val * (u64)rhs.value();
        return MontyField31(monty_reduce<MP>(prod), true);
    }

    inline MontyField31 &operator*=(const MontyField31 &rhs)
    {
        u64 prod = (u64)val * (u64)rhs.value();
        this->val = monty_reduce<MP>(prod);
        return *this;
    }

    inline bool operator==(const MontyField31 &rhs) const
    {
        return val == rhs.value();
    }

    inline bool operator!=(const MontyField31 &rhs) const
    {
        return val != rhs.value();
    }

    inline MontyField31 dbl() const
    {
        return *this + *this;
    }

    inline MontyField31 square() const
    {
        return *this * *this;
    }

    // x / 2; the Montgomery factor is linear so the raw value is halved directly
    inline MontyField31 halve() const
    {
        u32 half = (val & 1) ? (val >> 1) + ((MP::PRIME + 1) >> 1) : (val >> 1);
        return MontyField31(half, true);
    }

    // x * 2^-n for 0 <= n <= 32: one reduction of x * 2^(32 - n)
    inline MontyField31 mul_2exp_neg_n(u32 n) const
    {
        return MontyField31(monty_reduce<MP>((u64)val << (MP::MONTY_BITS - n)), true);
    }

    MontyField31 exp_u64(u64 power) const
    {
        MontyField31 result = One();
        MontyField31 base = *this;
        while (power)
        {
            if (power & 1)
                result *= base;
            base = base.square();
            power >>= 1;
        }
        return result;
    }
};

#endif // __ZKPERM_MONTY_HPP__
