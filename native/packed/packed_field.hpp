// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_PACKED_PACKED_FIELD_HPP__
#define __ZKPERM_PACKED_PACKED_FIELD_HPP__

#include "types/int_types.h"

/*
 * N independent elements of F processed together. Every operation is applied
 * lane by lane, so any field works and the result of lane i only depends on
 * lane i of the operands. Architecture specific packings offer the same
 * interface.
 */
template <typename F, const u32 N>
class PackedField
{
private:
    F vals[N];

public:
    typedef F Scalar;
    static constexpr u32 WIDTH = N;

    PackedField()
    {
        for (u32 i = 0; i < N; i++)
        {
            this->vals[i] = F::Zero();
        }
    }

    static inline PackedField from_scalar(const F &x)
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
        {
            r.vals[i] = x;
        }
        return r;
    }

    static inline PackedField from_lanes(const F *lanes)
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
        {
            r.vals[i] = lanes[i];
        }
        return r;
    }

    static inline PackedField Zero() { return from_scalar(F::Zero()); }
    static inline PackedField One() { return from_scalar(F::One()); }

    inline F lane(u32 i) const { return this->vals[i]; }
    inline void set_lane(u32 i, const F &x) { this->vals[i] = x; }

    inline void to_lanes(F *out) const
    {
        for (u32 i = 0; i < N; i++)
        {
            out[i] = this->vals[i];
        }
    }

    inline PackedField operator+(const PackedField &rhs) const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i] + rhs.vals[i];
        return r;
    }

    inline PackedField operator-(const PackedField &rhs) const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i] - rhs.vals[i];
        return r;
    }

    inline PackedField operator*(const PackedField &rhs) const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i] * rhs.vals[i];
        return r;
    }

    inline PackedField operator-() const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = -this->vals[i];
        return r;
    }

    inline PackedField &operator+=(const PackedField &rhs)
    {
        for (u32 i = 0; i < N; i++)
            this->vals[i] += rhs.vals[i];
        return *this;
    }

    inline PackedField &operator-=(const PackedField &rhs)
    {
        for (u32 i = 0; i < N; i++)
            this->vals[i] -= rhs.vals[i];
        return *this;
    }

    inline PackedField &operator*=(const PackedField &rhs)
    {
        for (u32 i = 0; i < N; i++)
            this->vals[i] *= rhs.vals[i];
        return *this;
    }

    // mixed operations with a scalar, applied to every lane

    inline PackedField operator+(const F &rhs) const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i] + rhs;
        return r;
    }

    inline PackedField operator-(const F &rhs) const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i] - rhs;
        return r;
    }

    inline PackedField operator*(const F &rhs) const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i] * rhs;
        return r;
    }

    inline PackedField &operator+=(const F &rhs)
    {
        for (u32 i = 0; i < N; i++)
            this->vals[i] += rhs;
        return *this;
    }

    inline PackedField &operator-=(const F &rhs)
    {
        for (u32 i = 0; i < N; i++)
            this->vals[i] -= rhs;
        return *this;
    }

    inline PackedField &operator*=(const F &rhs)
    {
        for (u32 i = 0; i < N; i++)
            this->vals[i] *= rhs;
        return *this;
    }

    inline bool operator==(const PackedField &rhs) const
    {
        for (u32 i = 0; i < N; i++)
        {
            if (this->vals[i] != rhs.vals[i])
                return false;
        }
        return true;
    }

    inline bool operator!=(const PackedField &rhs) const
    {
        return !(*this == rhs);
    }

    inline PackedField dbl() const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i].dbl();
        return r;
    }

    inline PackedField square() const
    {
        return *this * *this;
    }

    // only available when F provides halve()
    inline PackedField halve() const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i].halve();
        return r;
    }

    // only available when F provides mul_2exp_neg_n()
    inline PackedField mul_2exp_neg_n(u32 n) const
    {
        PackedField r;
        for (u32 i = 0; i < N; i++)
            r.vals[i] = this->vals[i].mul_2exp_neg_n(n);
        return r;
    }
};

template <typename F, const u32 N>
inline PackedField<F, N> operator+(const F &lhs, const PackedField<F, N> &rhs)
{
    return rhs + lhs;
}

template <typename F, const u32 N>
inline PackedField<F, N> operator*(const F &lhs, const PackedField<F, N> &rhs)
{
    return rhs * lhs;
}

template <typename F, const u32 N>
inline PackedField<F, N> operator-(const F &lhs, const PackedField<F, N> &rhs)
{
    return PackedField<F, N>::from_scalar(lhs) - rhs;
}

#endif // __ZKPERM_PACKED_PACKED_FIELD_HPP__
