// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include "lib.h"

#include <omp.h>
#include <array>
#include <exception>

#include "types/int_types.h"
#include "utils/exception.hpp"
#include "packed/packing.hpp"
#include "poseidon2/poseidon2_bn254.hpp"
#include "poseidon2/poseidon2_monty31.hpp"
#include "poseidon2/poseidon2_goldilocks.hpp"

template <typename Perm>
static const Perm &grain_instance()
{
    static const Perm instance = Perm::new_from_grain_128();
    return instance;
}

template <typename Perm>
static void permute_u32(const Perm &perm, u32 *state)
{
    typedef typename Perm::Field F;
    std::array<F, Perm::STATE_WIDTH> s;
    for (u64 i = 0; i < Perm::STATE_WIDTH; i++)
    {
        s[i] = F::from_canonical_u32(state[i]);
    }
    perm.permute_mut(s);
    for (u64 i = 0; i < Perm::STATE_WIDTH; i++)
    {
        state[i] = s[i].as_canonical_u32();
    }
}

template <typename Perm>
static void permute_u64(const Perm &perm, u64 *state)
{
    typedef typename Perm::Field F;
    std::array<F, Perm::STATE_WIDTH> s;
    for (u64 i = 0; i < Perm::STATE_WIDTH; i++)
    {
        s[i] = F::from_canonical_u64(state[i]);
    }
    perm.permute_mut(s);
    for (u64 i = 0; i < Perm::STATE_WIDTH; i++)
    {
        state[i] = s[i].as_canonical_u64();
    }
}

/*
 * Groups of Packing::WIDTH states go through the packed backend, the
 * remainder through the scalar one. Input is checked up front since nothing
 * may throw inside the parallel region.
 */
template <typename Perm>
static void permute_batch_u32(const Perm &perm, u32 *states, u64 count)
{
    typedef typename Perm::Field F;
    typedef typename FieldPacking<F>::Packing P;
    const u64 W = Perm::STATE_WIDTH;

    for (u64 k = 0; k < count * W; k++)
    {
        if (states[k] >= F::ORDER_U32)
        {
            throw zkperm_error(ZKPERM_ERR_NONCANONICAL, "state %lu, lane %lu: %u is not canonical", k / W, k % W, states[k]);
        }
    }

    const u64 chunks = count / P::WIDTH;
#pragma omp parallel for
    for (u64 c = 0; c < chunks; c++)
    {
        u32 *base = states + c * P::WIDTH * W;
        std::array<F, W> lanes[P::WIDTH];
        for (u32 j = 0; j < P::WIDTH; j++)
        {
            for (u64 i = 0; i < W; i++)
            {
                lanes[j][i] = F(base[j * W + i]);
            }
        }

        std::array<P, W> packed;
        pack_states<P, W>(lanes, packed);
        perm.permute_mut(packed);
        unpack_states<P, W>(packed, lanes);

        for (u32 j = 0; j < P::WIDTH; j++)
        {
            for (u64 i = 0; i < W; i++)
            {
                base[j * W + i] = lanes[j][i].as_canonical_u32();
            }
        }
    }

    for (u64 k = chunks * P::WIDTH; k < count; k++)
    {
        permute_u32(perm, states + k * W);
    }
}

EXTERN int zkperm_poseidon2_bn254_permute(uint64_t *state)
{
    if (state == nullptr)
    {
        return ZKPERM_ERR_PARAMETERS;
    }
    try
    {
        std::array<Bn254Field, BN254_WIDTH> s;
        for (u64 i = 0; i < BN254_WIDTH; i++)
        {
            s[i] = Bn254Field::from_canonical_limbs(state + i * ZKPERM_MAX_LIMBS);
        }
        poseidon2_bn254_default().permute_mut(s);
        for (u64 i = 0; i < BN254_WIDTH; i++)
        {
            s[i].to_canonical_limbs(state + i * ZKPERM_MAX_LIMBS);
        }
    }
    catch (const zkperm_error &e)
    {
        return e.code();
    }
    catch (const std::exception &)
    {
        return ZKPERM_ERR_INTERNAL;
    }
    return ZKPERM_OK;
}

EXTERN int zkperm_poseidon2_koalabear_permute(uint32_t *state, uint32_t width)
{
    if (state == nullptr)
    {
        return ZKPERM_ERR_PARAMETERS;
    }
    try
    {
        switch (width)
        {
        case 16:
            permute_u32(grain_instance<Poseidon2KoalaBear<16>>(), state);
            break;
        case 24:
            permute_u32(grain_instance<Poseidon2KoalaBear<24>>(), state);
            break;
        default:
            return ZKPERM_ERR_WIDTH;
        }
    }
    catch (const zkperm_error &e)
    {
        return e.code();
    }
    catch (const std::exception &)
    {
        return ZKPERM_ERR_INTERNAL;
    }
    return ZKPERM_OK;
}

EXTERN int zkperm_poseidon2_babybear_permute(uint32_t *state, uint32_t width)
{
    if (state == nullptr)
    {
        return ZKPERM_ERR_PARAMETERS;
    }
    try
    {
        switch (width)
        {
        case 16:
            permute_u32(grain_instance<Poseidon2BabyBear<16>>(), state);
            break;
        case 24:
            permute_u32(grain_instance<Poseidon2BabyBear<24>>(), state);
            break;
        default:
            return ZKPERM_ERR_WIDTH;
        }
    }
    catch (const zkperm_error &e)
    {
        return e.code();
    }
    catch (const std::exception &)
    {
        return ZKPERM_ERR_INTERNAL;
    }
    return ZKPERM_OK;
}

EXTERN int zkperm_poseidon2_goldilocks_permute(uint64_t *state, uint32_t width)
{
    if (state == nullptr)
    {
        return ZKPERM_ERR_PARAMETERS;
    }
    try
    {
        switch (width)
        {
        case 8:
            permute_u64(grain_instance<Poseidon2Goldilocks<8>>(), state);
            break;
        case 12:
            permute_u64(grain_instance<Poseidon2Goldilocks<12>>(), state);
            break;
        default:
            return ZKPERM_ERR_WIDTH;
        }
    }
    catch (const zkperm_error &e)
    {
        return e.code();
    }
    catch (const std::exception &)
    {
        return ZKPERM_ERR_INTERNAL;
    }
    return ZKPERM_OK;
}

EXTERN int zkperm_poseidon2_koalabear_permute_batch(uint32_t *states, uint64_t count, uint32_t width)
{
    if (states == nullptr && count > 0)
    {
        return ZKPERM_ERR_PARAMETERS;
    }
    try
    {
        switch (width)
        {
        case 16:
            permute_batch_u32(grain_instance<Poseidon2KoalaBear<16>>(), states, count);
            break;
        case 24:
            permute_batch_u32(grain_instance<Poseidon2KoalaBear<24>>(), states, count);
            break;
        default:
            return ZKPERM_ERR_WIDTH;
        }
    }
    catch (const zkperm_error &e)
    {
        return e.code();
    }
    catch (const std::exception &)
    {
        return ZKPERM_ERR_INTERNAL;
    }
    return ZKPERM_OK;
}

EXTERN int zkperm_poseidon2_babybear_permute_batch(uint32_t *states, uint64_t count, uint32_t width)
{
    if (states == nullptr && count > 0)
    {
        return ZKPERM_ERR_PARAMETERS;
    }
    try
    {
        switch (width)
        {
        case 16:
            permute_batch_u32(grain_instance<Poseidon2BabyBear<16>>(), states, count);
            break;
        case 24:
            permute_batch_u32(grain_instance<Poseidon2BabyBear<24>>(), states, count);
            break;
        default:
            return ZKPERM_ERR_WIDTH;
        }
    }
    catch (const zkperm_error &e)
    {
        return e.code();
    }
    catch (const std::exception &)
    {
        return ZKPERM_ERR_INTERNAL;
    }
    return ZKPERM_OK;
}
