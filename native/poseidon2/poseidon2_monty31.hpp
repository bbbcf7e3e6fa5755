// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_POSEIDON2_MONTY31_HPP__
#define __ZKPERM_POSEIDON2_MONTY31_HPP__

#include <array>

#include "types/int_types.h"
#include "types/monty.hpp"
#include "types/babybear.hpp"
#include "types/koalabear.hpp"
#include "poseidon2/poseidon2.hpp"

/*
 * Internal diagonals for 31-bit Monty fields. All of them start with
 * V = [-2, 1, 2, 1/2, 3, 4, -1/2, -3, -4, ...]; the remaining entries are
 * +-2^-k, given here as signed shifts (k > 0 means 2^-k, k < 0 means -2^-|k|).
 * The resulting 1 + diag(V) matrices have irreducible characteristic
 * polynomials.
 */
template <typename MP, const u64 WIDTH>
struct Monty31InternalShifts;

template <>
struct Monty31InternalShifts<KoalaBearParameters, 16>
{
    static constexpr i32 SHIFTS[7] = {8, 3, 24, -8, -3, -4, -24};
};

template <>
struct Monty31InternalShifts<KoalaBearParameters, 24>
{
    static constexpr i32 SHIFTS[15] = {8, 2, 3, 4, 7, 9, 24, -8, -2, -3, -4, -7, -9, -11, -24};
};

template <>
struct Monty31InternalShifts<BabyBearParameters, 16>
{
    static constexpr i32 SHIFTS[7] = {8, 2, 3, 27, -8, -4, -27};
};

template <>
struct Monty31InternalShifts<BabyBearParameters, 24>
{
    static constexpr i32 SHIFTS[15] = {8, 2, 3, 4, 7, 9, 27, -8, -2, -3, -4, -7, -9, -26, -27};
};

/*
 * V as field elements, for the generic 1 + diag(V) multiply.
 */
template <typename MP, const u64 WIDTH>
struct Monty31InternalDiagonal
{
    static std::array<MontyField31<MP>, WIDTH> values()
    {
        typedef MontyField31<MP> F;
        const F two = F::Two();
        const F inv_two = F((MP::PRIME + 1) >> 1);
        const F three = F(3);
        const F four = F(4);

        std::array<F, WIDTH> v;
        v[0] = -two;
        v[1] = F::One();
        v[2] = two;
        v[3] = inv_two;
        v[4] = three;
        v[5] = four;
        v[6] = -inv_two;
        v[7] = -three;
        v[8] = -four;
        for (u64 i = 9; i < WIDTH; i++)
        {
            i32 shift = Monty31InternalShifts<MP, WIDTH>::SHIFTS[i - 9];
            if (shift > 0)
                v[i] = inv_two.exp_u64((u64)shift);
            else
                v[i] = -inv_two.exp_u64((u64)(-shift));
        }
        return v;
    }
};

/*
 * Fast 1 + diag(V) for 31-bit Monty fields: every diagonal entry is applied
 * with additions, doublings, halvings or a single reduction by 2^-k instead
 * of a full multiplication.
 */
template <typename MP, const u64 WIDTH>
class Monty31InternalMatrix
{
public:
    template <typename A>
    inline void permute_mut(std::array<A, WIDTH> &state) const
    {
        // lanes 1.. do not depend on the S-box of lane 0
        A part_sum = state[1];
        for (u64 i = 2; i < WIDTH; i++)
        {
            part_sum += state[i];
        }
        A full_sum = part_sum + state[0];

        // -2 * x0 + sum = part_sum - x0
        state[0] = part_sum - state[0];
        state[1] = state[1] + full_sum;
        state[2] = state[2].dbl() + full_sum;
        state[3] = state[3].halve() + full_sum;
        state[4] = state[4].dbl() + state[4] + full_sum;
        state[5] = state[5].dbl().dbl() + full_sum;
        state[6] = full_sum - state[6].halve();
        state[7] = full_sum - (state[7].dbl() + state[7]);
        state[8] = full_sum - state[8].dbl().dbl();

        for (u64 i = 9; i < WIDTH; i++)
        {
            i32 shift = Monty31InternalShifts<MP, WIDTH>::SHIFTS[i - 9];
            if (shift > 0)
                state[i] = full_sum + state[i].mul_2exp_neg_n((u32)shift);
            else
                state[i] = full_sum - state[i].mul_2exp_neg_n((u32)(-shift));
        }
    }
};

template <typename MP, const u64 WIDTH, const u64 D>
using Poseidon2Monty31 = Poseidon2<MontyField31<MP>,
                                   Poseidon2ExternalLayer<MontyField31<MP>, WIDTH, D, MDSMat4>,
                                   Poseidon2InternalLayer<MontyField31<MP>, WIDTH, D, Monty31InternalMatrix<MP, WIDTH>>,
                                   WIDTH, D>;

template <typename MP, const u64 WIDTH, const u64 D>
using Poseidon2Monty31Generic = Poseidon2<MontyField31<MP>,
                                          Poseidon2ExternalLayer<MontyField31<MP>, WIDTH, D, MDSMat4>,
                                          Poseidon2InternalLayer<MontyField31<MP>, WIDTH, D,
                                                                 Poseidon2InternalMatrixGeneric<MontyField31<MP>, WIDTH, Monty31InternalDiagonal<MP, WIDTH>>>,
                                          WIDTH, D>;

const u64 KOALABEAR_S_BOX_DEGREE = 3;
const u64 BABYBEAR_S_BOX_DEGREE = 7;

static_assert(poseidon2_sbox_degree<KoalaBearField>() == KOALABEAR_S_BOX_DEGREE, "KoalaBear S-box degree");
static_assert(poseidon2_sbox_degree<BabyBearField>() == BABYBEAR_S_BOX_DEGREE, "BabyBear S-box degree");

template <const u64 WIDTH>
using Poseidon2KoalaBear = Poseidon2Monty31<KoalaBearParameters, WIDTH, KOALABEAR_S_BOX_DEGREE>;
template <const u64 WIDTH>
using Poseidon2KoalaBearGeneric = Poseidon2Monty31Generic<KoalaBearParameters, WIDTH, KOALABEAR_S_BOX_DEGREE>;

template <const u64 WIDTH>
using Poseidon2BabyBear = Poseidon2Monty31<BabyBearParameters, WIDTH, BABYBEAR_S_BOX_DEGREE>;
template <const u64 WIDTH>
using Poseidon2BabyBearGeneric = Poseidon2Monty31Generic<BabyBearParameters, WIDTH, BABYBEAR_S_BOX_DEGREE>;

#endif // __ZKPERM_POSEIDON2_MONTY31_HPP__
