// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_POSEIDON2_BN254_HPP__
#define __ZKPERM_POSEIDON2_BN254_HPP__

#include <array>

#include "types/int_types.h"
#include "ff/bn254.hpp"
#include "poseidon2/poseidon2.hpp"

const u64 BN254_WIDTH = 3;
const u64 BN254_S_BOX_DEGREE = 5;

static_assert(poseidon2_sbox_degree<Bn254Field>() == BN254_S_BOX_DEGREE, "BN254 S-box degree");

// HorizenLabs round constants, canonical little-endian limbs
const u32 BN254_ROUNDS_F = 8;
const u32 BN254_ROUNDS_P = 56;
extern const u64 BN254_WIDTH_3_EXT_CONST_HL[BN254_ROUNDS_F][BN254_WIDTH][ZKPERM_MAX_LIMBS];
extern const u64 BN254_WIDTH_3_INT_CONST_HL[BN254_ROUNDS_P][ZKPERM_MAX_LIMBS];

// V = [1, 1, 2]
struct Bn254InternalDiagonal
{
    static std::array<Bn254Field, BN254_WIDTH> values()
    {
        return {Bn254Field::One(), Bn254Field::One(), Bn254Field((u64)2)};
    }
};

/*
 * 1 + diag(1, 1, 2) = [[2, 1, 1], [1, 2, 1], [1, 1, 3]] with three additions
 * and one doubling.
 */
class Bn254InternalMatrix
{
public:
    template <typename A>
    inline void permute_mut(std::array<A, BN254_WIDTH> &state) const
    {
        // x1 + x2 does not wait for the S-box on x0
        A sum = state[0] + (state[1] + state[2]);
        state[0] += sum;
        state[1] += sum;
        state[2] = state[2].dbl() + sum;
    }
};

typedef Poseidon2ExternalLayer<Bn254Field, BN254_WIDTH, BN254_S_BOX_DEGREE, HLMDSMat4> Poseidon2ExternalLayerBn254;

typedef Poseidon2<Bn254Field,
                  Poseidon2ExternalLayerBn254,
                  Poseidon2InternalLayer<Bn254Field, BN254_WIDTH, BN254_S_BOX_DEGREE, Bn254InternalMatrix>,
                  BN254_WIDTH, BN254_S_BOX_DEGREE>
    Poseidon2Bn254;

typedef Poseidon2<Bn254Field,
                  Poseidon2ExternalLayerBn254,
                  Poseidon2InternalLayer<Bn254Field, BN254_WIDTH, BN254_S_BOX_DEGREE,
                                         Poseidon2InternalMatrixGeneric<Bn254Field, BN254_WIDTH, Bn254InternalDiagonal>>,
                  BN254_WIDTH, BN254_S_BOX_DEGREE>
    Poseidon2Bn254Generic;

static_assert(Poseidon2Bn254::STATE_WIDTH == 3, "Poseidon2 over BN254 is only defined for width 3");

// the HorizenLabs constants as external and internal round constants
ExternalLayerConstants<Bn254Field, BN254_WIDTH> bn254_horizen_labs_external_constants();
std::vector<Bn254Field> bn254_horizen_labs_internal_constants();

// a new instance over the HorizenLabs constants
Poseidon2Bn254 poseidon2_bn254_horizen_labs();

// shared instance over the HorizenLabs constants, built on first use
const Poseidon2Bn254 &poseidon2_bn254_default();

#endif // __ZKPERM_POSEIDON2_BN254_HPP__
