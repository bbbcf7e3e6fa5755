// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_KOALABEAR_HPP__
#define __ZKPERM_KOALABEAR_HPP__

#include "types/int_types.h"
#include "types/monty.hpp"

class KoalaBearParameters
{
public:
    // The Koala Bear prime: 2^31 - 2^24 + 1.
    // p - 1 = 127 * 2^24, so x^3 is a permutation of the field.
    static constexpr u32 PRIME = 0x7f000001; // 2130706433
    static constexpr u32 MONTY_BITS = 32;
    static constexpr u32 MONTY_MU = 0x81000001;
    static constexpr u32 MONTY_MASK = 0xFFFFFFFF;
};

typedef MontyField31<KoalaBearParameters> KoalaBearField;

#endif // __ZKPERM_KOALABEAR_HPP__
