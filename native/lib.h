// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_LIB_H__
#define __ZKPERM_LIB_H__

#ifdef __cplusplus
#define EXTERN extern "C"
#else
#define EXTERN
#endif

#include <stdint.h>
#include "utils/error_codes.h"

/*
 * C entry points. States are in canonical form and are permuted in place;
 * on any error the state is left untouched and a ZKPERM_ERR_* code is
 * returned. Round constants are the HorizenLabs ones for BN254 and Grain
 * LFSR generated ones for the other fields.
 */

// state: 3 elements of 4 little-endian 64-bit limbs each
EXTERN int zkperm_poseidon2_bn254_permute(uint64_t *state);

// width 16 or 24
EXTERN int zkperm_poseidon2_koalabear_permute(uint32_t *state, uint32_t width);

// width 16 or 24
EXTERN int zkperm_poseidon2_babybear_permute(uint32_t *state, uint32_t width);

// width 8 or 12
EXTERN int zkperm_poseidon2_goldilocks_permute(uint64_t *state, uint32_t width);

// count consecutive states of the given width, in parallel
EXTERN int zkperm_poseidon2_koalabear_permute_batch(uint32_t *states, uint64_t count, uint32_t width);

EXTERN int zkperm_poseidon2_babybear_permute_batch(uint32_t *states, uint64_t count, uint32_t width);

#endif // __ZKPERM_LIB_H__
