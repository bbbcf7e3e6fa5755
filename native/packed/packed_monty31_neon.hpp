// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_PACKED_PACKED_MONTY31_NEON_HPP__
#define __ZKPERM_PACKED_PACKED_MONTY31_NEON_HPP__

#include "types/int_types.h"
#include "types/monty.hpp"
#include "packed/packed_field.hpp"

/*
 * AArch64 packing for MontyField31. There are no NEON kernels yet, so it is a
 * single lane and every operation is the scalar one.
 */
template <typename MP>
using PackedMonty31Neon = PackedField<MontyField31<MP>, 1>;

#endif // __ZKPERM_PACKED_PACKED_MONTY31_NEON_HPP__
