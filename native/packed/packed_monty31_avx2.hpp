// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_PACKED_PACKED_MONTY31_AVX2_HPP__
#define __ZKPERM_PACKED_PACKED_MONTY31_AVX2_HPP__

#ifdef __USE_AVX__

#include <immintrin.h>

#include "types/int_types.h"
#include "types/monty.hpp"

/*
 * Eight MontyField31<MP> elements in one 256-bit register, raw Montgomery
 * values in each 32-bit lane. Every lane stays in [0, PRIME).
 */
template <typename MP>
class PackedMonty31AVX2
{
private:
    __m256i val;

    static inline __m256i prime() { return _mm256_set1_epi32((int)MP::PRIME); }

    static inline __m256i movehdup(__m256i x)
    {
        return _mm256_castps_si256(_mm256_movehdup_ps(_mm256_castsi256_ps(x)));
    }

    /*
     * Montgomery product of the raw lanes of x and y. The 64-bit products of
     * the even and odd lanes are reduced separately:
     * q = prod * MU mod 2^32, d = (prod - q * PRIME) / 2^32 lies in (-PRIME, PRIME).
     */
    static inline __m256i monty_mul(__m256i x, __m256i y)
    {
        const __m256i P = prime();
        const __m256i MU = _mm256_set1_epi32((int)MP::MONTY_MU);

        __m256i prod_evn = _mm256_mul_epu32(x, y);
        __m256i prod_odd = _mm256_mul_epu32(movehdup(x), movehdup(y));

        __m256i q_evn = _mm256_mul_epu32(prod_evn, MU);
        __m256i q_odd = _mm256_mul_epu32(prod_odd, MU);

        __m256i q_p_evn = _mm256_mul_epu32(q_evn, P);
        __m256i q_p_odd = _mm256_mul_epu32(q_odd, P);

        // the low halves cancel, the high halves hold d
        __m256i d_evn = _mm256_sub_epi64(prod_evn, q_p_evn);
        __m256i d_odd = _mm256_sub_epi64(prod_odd, q_p_odd);

        __m256i d = _mm256_blend_epi32(movehdup(d_evn), d_odd, 0b10101010);
        __m256i corr = _mm256_add_epi32(d, P);
        return _mm256_min_epu32(d, corr);
    }

public:
    typedef MontyField31<MP> Scalar;
    static constexpr u32 WIDTH = 8;

    PackedMonty31AVX2() : val(_mm256_setzero_si256()) {}
    explicit PackedMonty31AVX2(__m256i v) : val(v) {}

    static inline PackedMonty31AVX2 from_scalar(const Scalar &x)
    {
        return PackedMonty31AVX2(_mm256_set1_epi32((int)x.value()));
    }

    static inline PackedMonty31AVX2 from_lanes(const Scalar *lanes)
    {
        u32 raw[WIDTH];
        for (u32 i = 0; i < WIDTH; i++)
        {
            raw[i] = lanes[i].value();
        }
        return PackedMonty31AVX2(_mm256_loadu_si256((const __m256i *)raw));
    }

    static inline PackedMonty31AVX2 Zero() { return PackedMonty31AVX2(); }
    static inline PackedMonty31AVX2 One() { return from_scalar(Scalar::One()); }

    inline void to_lanes(Scalar *out) const
    {
        u32 raw[WIDTH];
        _mm256_storeu_si256((__m256i *)raw, this->val);
        for (u32 i = 0; i < WIDTH; i++)
        {
            out[i] = Scalar(raw[i], true);
        }
    }

    inline Scalar lane(u32 i) const
    {
        u32 raw[WIDTH];
        _mm256_storeu_si256((__m256i *)raw, this->val);
        return Scalar(raw[i], true);
    }

    inline PackedMonty31AVX2 operator+(const PackedMonty31AVX2 &rhs) const
    {
        // x + y < 2^32; if it is >= PRIME the subtraction gives the smaller value
        __m256i t = _mm256_add_epi32(this->val, rhs.val);
        __m256i u = _mm256_sub_epi32(t, prime());
        return PackedMonty31AVX2(_mm256_min_epu32(t, u));
    }

    inline PackedMonty31AVX2 operator-(const PackedMonty31AVX2 &rhs) const
    {
        // on underflow t wraps above 2^31 and t + PRIME is the smaller value
        __m256i t = _mm256_sub_epi32(this->val, rhs.val);
        __m256i u = _mm256_add_epi32(t, prime());
        return PackedMonty31AVX2(_mm256_min_epu32(t, u));
    }

    inline PackedMonty31AVX2 operator-() const
    {
        return PackedMonty31AVX2() - *this;
    }

    inline PackedMonty31AVX2 operator*(const PackedMonty31AVX2 &rhs) const
    {
        return PackedMonty31AVX2(monty_mul(this->val, rhs.val));
    }

    inline PackedMonty31AVX2 &operator+=(const PackedMonty31AVX2 &rhs)
    {
        *this = *this + rhs;
        return *this;
    }

    inline PackedMonty31AVX2 &operator-=(const PackedMonty31AVX2 &rhs)
    {
        *this = *this - rhs;
        return *this;
    }

    inline PackedMonty31AVX2 &operator*=(const PackedMonty31AVX2 &rhs)
    {
        *this = *this * rhs;
        return *this;
    }

    inline PackedMonty31AVX2 operator+(const Scalar &rhs) const { return *this + from_scalar(rhs); }
    inline PackedMonty31AVX2 operator-(const Scalar &rhs) const { return *this - from_scalar(rhs); }
    inline PackedMonty31AVX2 operator*(const Scalar &rhs) const { return *this * from_scalar(rhs); }

    inline PackedMonty31AVX2 &operator+=(const Scalar &rhs) { return *this += from_scalar(rhs); }
    inline PackedMonty31AVX2 &operator-=(const Scalar &rhs) { return *this -= from_scalar(rhs); }
    inline PackedMonty31AVX2 &operator*=(const Scalar &rhs) { return *this *= from_scalar(rhs); }

    inline bool operator==(const PackedMonty31AVX2 &rhs) const
    {
        __m256i eq = _mm256_cmpeq_epi32(this->val, rhs.val);
        return _mm256_movemask_epi8(eq) == -1;
    }

    inline bool operator!=(const PackedMonty31AVX2 &rhs) const
    {
        return !(*this == rhs);
    }

    inline PackedMonty31AVX2 dbl() const { return *this + *this; }
    inline PackedMonty31AVX2 square() const { return *this * *this; }

    // lane-wise MontyField31::halve
    inline PackedMonty31AVX2 halve() const
    {
        const __m256i one = _mm256_set1_epi32(1);
        const __m256i half_p_plus_1 = _mm256_set1_epi32((int)((MP::PRIME + 1) >> 1));

        __m256i odd_mask = _mm256_sub_epi32(_mm256_setzero_si256(), _mm256_and_si256(this->val, one));
        __m256i shifted = _mm256_srli_epi32(this->val, 1);
        return PackedMonty31AVX2(_mm256_add_epi32(shifted, _mm256_and_si256(odd_mask, half_p_plus_1)));
    }

    // x * 2^-n for 1 <= n <= 32, a Montgomery product with the raw value 2^(32 - n)
    inline PackedMonty31AVX2 mul_2exp_neg_n(u32 n) const
    {
        const __m256i factor = _mm256_set1_epi32((int)(u32)((u64)1 << (MP::MONTY_BITS - n)));
        return PackedMonty31AVX2(monty_mul(this->val, factor));
    }
};

template <typename MP>
inline PackedMonty31AVX2<MP> operator+(const MontyField31<MP> &lhs, const PackedMonty31AVX2<MP> &rhs)
{
    return rhs + lhs;
}

template <typename MP>
inline PackedMonty31AVX2<MP> operator*(const MontyField31<MP> &lhs, const PackedMonty31AVX2<MP> &rhs)
{
    return rhs * lhs;
}

template <typename MP>
inline PackedMonty31AVX2<MP> operator-(const MontyField31<MP> &lhs, const PackedMonty31AVX2<MP> &rhs)
{
    return PackedMonty31AVX2<MP>::from_scalar(lhs) - rhs;
}

#endif // __USE_AVX__

#endif // __ZKPERM_PACKED_PACKED_MONTY31_AVX2_HPP__
