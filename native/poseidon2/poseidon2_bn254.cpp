// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include "poseidon2/poseidon2_bn254.hpp"

ExternalLayerConstants<Bn254Field, BN254_WIDTH> bn254_horizen_labs_external_constants()
{
    const u32 half_f = BN254_ROUNDS_F / 2;
    std::vector<std::array<Bn254Field, BN254_WIDTH>> initial(half_f);
    std::vector<std::array<Bn254Field, BN254_WIDTH>> terminal(half_f);
    for (u32 r = 0; r < half_f; r++)
    {
        for (u32 i = 0; i < BN254_WIDTH; i++)
        {
            initial[r][i] = Bn254Field::from_canonical_limbs(BN254_WIDTH_3_EXT_CONST_HL[r][i]);
            terminal[r][i] = Bn254Field::from_canonical_limbs(BN254_WIDTH_3_EXT_CONST_HL[half_f + r][i]);
        }
    }
    return ExternalLayerConstants<Bn254Field, BN254_WIDTH>(initial, terminal);
}

std::vector<Bn254Field> bn254_horizen_labs_internal_constants()
{
    std::vector<Bn254Field> internal(BN254_ROUNDS_P);
    for (u32 r = 0; r < BN254_ROUNDS_P; r++)
    {
        internal[r] = Bn254Field::from_canonical_limbs(BN254_WIDTH_3_INT_CONST_HL[r]);
    }
    return internal;
}

Poseidon2Bn254 poseidon2_bn254_horizen_labs()
{
    return Poseidon2Bn254(bn254_horizen_labs_external_constants(), bn254_horizen_labs_internal_constants());
}

const Poseidon2Bn254 &poseidon2_bn254_default()
{
    static const Poseidon2Bn254 instance = poseidon2_bn254_horizen_labs();
    return instance;
}
