// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_BABYBEAR_HPP__
#define __ZKPERM_BABYBEAR_HPP__

#include "types/int_types.h"
#include "types/monty.hpp"

class BabyBearParameters
{
public:
    // The Baby Bear prime: 2^31 - 2^27 + 1.
    // This is the unique 31-bit prime with the highest possible 2 adicity (27).
    static constexpr u32 PRIME = 0x78000001; // 2013265921
    static constexpr u32 MONTY_BITS = 32;
    static constexpr u32 MONTY_MU = 0x88000001;
    static constexpr u32 MONTY_MASK = 0xFFFFFFFF;
};

typedef MontyField31<BabyBearParameters> BabyBearField;

#endif // __ZKPERM_BABYBEAR_HPP__
