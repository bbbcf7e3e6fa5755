// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_FF_BN254_HPP__
#define __ZKPERM_FF_BN254_HPP__

#include <blst_t.hpp>
#include <string>

#include "types/int_types.h"
#include "ff/field_utils.hpp"
#include "utils/exception.hpp"

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsubobject-linkage"
#endif

// TO_LIMB_T and vec256 come from blst
// the int value of r is 21888242871839275222246405745257275088548364400416034343698204186575808495617
static const vec256 ALT_BN128_r = {
    TO_LIMB_T(0x43e1f593f0000001), TO_LIMB_T(0x2833e84879b97091),
    TO_LIMB_T(0xb85045b68181585d), TO_LIMB_T(0x30644e72e131a029)};
static const vec256 ALT_BN128_rRR = {/* (1<<512)%r */
                                     TO_LIMB_T(0x1bb8e645ae216da7), TO_LIMB_T(0x53fe3ab1e35c59e3),
                                     TO_LIMB_T(0x8c49833d53bb8085), TO_LIMB_T(0x0216d0b17f4e44a5)};
static const vec256 ALT_BN128_rONE = {/* (1<<256)%r */
                                      TO_LIMB_T(0xac96341c4ffffffb), TO_LIMB_T(0x36fc76959f60cd29),
                                      TO_LIMB_T(0x666ea36f7879462e), TO_LIMB_T(0x0e0a77c19a07df2f)};

typedef blst_256_t<254, ALT_BN128_r, 0xc2e1f593efffffffu,
                   ALT_BN128_rRR, ALT_BN128_rONE>
    bn254_fr_mont;

/*
 * Element of the BN254 scalar field (the group order r of alt_bn128). The
 * Montgomery arithmetic is blst's; this class adds the canonical limb and hex
 * I/O the permutation needs.
 */
class Bn254Field : public bn254_fr_mont
{
public:
    static constexpr u32 NUM_LIMBS = 4;
    static constexpr u32 BITS = 254;

    // r again, as plain limbs for the constexpr round number tables
    static constexpr u64 ORDER_LIMBS[ZKPERM_MAX_LIMBS] = {
        0x43e1f593f0000001, 0x2833e84879b97091,
        0xb85045b68181585d, 0x30644e72e131a029};

    inline Bn254Field() : bn254_fr_mont((uint64_t)0) {}
    inline Bn254Field(const bn254_fr_mont &a) : bn254_fr_mont(a) {}

    // small canonical value
    inline explicit Bn254Field(u64 x) : bn254_fr_mont((uint64_t)x) {}

    static inline Bn254Field Zero() { return Bn254Field(); }
    static inline Bn254Field One() { return Bn254Field((u64)1); }

    static bool is_canonical_limbs(const u64 *limbs);
    static Bn254Field from_canonical_limbs(const u64 *limbs);
    void to_canonical_limbs(u64 *out) const;

    // "0x"-prefixed or bare hexadecimal, at most 64 digits, canonical
    static Bn254Field from_hex(const std::string &hex);
    // "0x" followed by 64 hex digits
    std::string to_hex() const;

    inline Bn254Field dbl() const { return *this + *this; }
    inline Bn254Field square() const { return *this * *this; }

    Bn254Field exp_u64(u64 power) const;
};

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif // __ZKPERM_FF_BN254_HPP__
