// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_PACKED_PACKING_HPP__
#define __ZKPERM_PACKED_PACKING_HPP__

#include <array>

#include "types/int_types.h"
#include "types/monty.hpp"
#include "packed/packed_field.hpp"
#include "packed/packed_monty31_avx2.hpp"
#include "packed/packed_monty31_neon.hpp"

/*
 * The packing used for batch work on F, chosen at compile time. Fields
 * without vector kernels get a single scalar lane.
 */
template <typename F>
struct FieldPacking
{
    typedef PackedField<F, 1> Packing;
};

template <typename MP>
struct FieldPacking<MontyField31<MP>>
{
#if defined(__USE_AVX__)
    typedef PackedMonty31AVX2<MP> Packing;
#elif defined(__aarch64__)
    typedef PackedMonty31Neon<MP> Packing;
#else
    typedef PackedField<MontyField31<MP>, 1> Packing;
#endif
};

/*
 * Transpose P::WIDTH scalar states into one packed state: lane j of
 * packed[i] is states[j][i].
 */
template <typename P, const u64 WIDTH>
inline void pack_states(const std::array<typename P::Scalar, WIDTH> *states, std::array<P, WIDTH> &packed)
{
    typename P::Scalar lanes[P::WIDTH];
    for (u64 i = 0; i < WIDTH; i++)
    {
        for (u32 j = 0; j < P::WIDTH; j++)
        {
            lanes[j] = states[j][i];
        }
        packed[i] = P::from_lanes(lanes);
    }
}

template <typename P, const u64 WIDTH>
inline void unpack_states(const std::array<P, WIDTH> &packed, std::array<typename P::Scalar, WIDTH> *states)
{
    typename P::Scalar lanes[P::WIDTH];
    for (u64 i = 0; i < WIDTH; i++)
    {
        packed[i].to_lanes(lanes);
        for (u32 j = 0; j < P::WIDTH; j++)
        {
            states[j][i] = lanes[j];
        }
    }
}

#endif // __ZKPERM_PACKED_PACKING_HPP__
