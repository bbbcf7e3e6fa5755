// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_POSEIDON2_GOLDILOCKS_HPP__
#define __ZKPERM_POSEIDON2_GOLDILOCKS_HPP__

#include <array>

#include "types/int_types.h"
#include "ff/goldilocks.hpp"
#include "poseidon2/poseidon2.hpp"

const u64 GOLDILOCKS_S_BOX_DEGREE = 7;

static_assert(poseidon2_sbox_degree<GoldilocksField>() == GOLDILOCKS_S_BOX_DEGREE, "Goldilocks S-box degree");

/*
 * Internal diagonals V for Goldilocks. Random entries, chosen so that
 * 1 + diag(V) has an irreducible characteristic polynomial. No shift based
 * fast path exists for this field, the generic multiply is used.
 */
template <const u64 WIDTH>
struct GoldilocksInternalDiagonal;

template <>
struct GoldilocksInternalDiagonal<8>
{
    static constexpr u64 DIAG[8] = {
        0x3672ae18c765bfad, 0xf1f93f798afd13ae, 0x929c5806056cc332, 0xa32809296ce16120,
        0x67e8cdcd97d37ff6, 0x01a733af8bcb5cae, 0xfb83cf2ff6115545, 0x842d449cd00495ba};

    static std::array<GoldilocksField, 8> values()
    {
        std::array<GoldilocksField, 8> v;
        for (u64 i = 0; i < 8; i++)
            v[i] = GoldilocksField::from_canonical_u64(DIAG[i]);
        return v;
    }
};

template <>
struct GoldilocksInternalDiagonal<12>
{
    static constexpr u64 DIAG[12] = {
        0xc3fc7465b642c1ba, 0x0e4b6b0faccf738d, 0x7a929fa235187f44, 0x2a2d723361fac043,
        0x6b9a962fae4177e6, 0xf7c84866444e070e, 0xc83dee51e14e2c7e, 0xc5805c10b1770249,
        0x828797d2b7599678, 0x287ff1f4940b18ca, 0x6c7876c44a238d32, 0xe8827473c69df416};

    static std::array<GoldilocksField, 12> values()
    {
        std::array<GoldilocksField, 12> v;
        for (u64 i = 0; i < 12; i++)
            v[i] = GoldilocksField::from_canonical_u64(DIAG[i]);
        return v;
    }
};

template <const u64 WIDTH>
using Poseidon2Goldilocks = Poseidon2<GoldilocksField,
                                      Poseidon2ExternalLayer<GoldilocksField, WIDTH, GOLDILOCKS_S_BOX_DEGREE, HLMDSMat4>,
                                      Poseidon2InternalLayer<GoldilocksField, WIDTH, GOLDILOCKS_S_BOX_DEGREE,
                                                             Poseidon2InternalMatrixGeneric<GoldilocksField, WIDTH, GoldilocksInternalDiagonal<WIDTH>>>,
                                      WIDTH, GOLDILOCKS_S_BOX_DEGREE>;

#endif // __ZKPERM_POSEIDON2_GOLDILOCKS_HPP__
