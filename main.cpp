// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include <stdio.h>
#include <array>
#include <exception>

#include "poseidon2/poseidon2_bn254.hpp"

int main()
{
    try
    {
        std::array<Bn254Field, BN254_WIDTH> state = {Bn254Field((u64)0), Bn254Field((u64)1), Bn254Field((u64)2)};
        poseidon2_bn254_default().permute_mut(state);

        printf("poseidon2 bn254 [0, 1, 2] ->\n");
        for (u64 i = 0; i < BN254_WIDTH; i++)
        {
            printf("  %s\n", state[i].to_hex().c_str());
        }
    }
    catch (const zkperm_error &e)
    {
        fprintf(stderr, "error %d: %s\n", e.code(), e.what());
        return 1;
    }
    return 0;
}
