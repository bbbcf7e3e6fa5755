// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include <stdio.h>
#include <omp.h>
#include <cstdint>
#include <array>
#include <vector>

#include "lib.h"
#include "packed/packing.hpp"
#include "poseidon2/poseidon2_bn254.hpp"
#include "poseidon2/poseidon2_monty31.hpp"
#include "poseidon2/poseidon2_goldilocks.hpp"

__uint128_t g_lehmer64_state = 0xAAAAAAAAAAAAAAAALL;

// Fast random generator
// https://lemire.me/blog/2019/03/19/the-fastest-conventional-random-number-generator-that-can-pass-big-crush/
uint64_t lehmer64()
{
    g_lehmer64_state *= 0xda942042e4dd58b5LL;
    return g_lehmer64_state >> 64;
}

template <typename Perm>
void bench_scalar(const char *name, const Perm &perm, u64 iterations)
{
    typedef typename Perm::Field F;
    std::array<F, Perm::STATE_WIDTH> state;
    for (u64 i = 0; i < Perm::STATE_WIDTH; i++)
    {
        state[i] = F(lehmer64() % 1000);
    }

    double start = omp_get_wtime();
    for (u64 i = 0; i < iterations; i++)
    {
        perm.permute_mut(state);
    }
    double end = omp_get_wtime();
    printf("%-24s scalar: %8.3lf us/permutation\n", name, (end - start) * 1e6 / iterations);
}

template <typename Perm>
void bench_packed(const char *name, const Perm &perm, u64 iterations)
{
    typedef typename Perm::Field F;
    typedef typename FieldPacking<F>::Packing P;
    std::array<P, Perm::STATE_WIDTH> state;
    for (u64 i = 0; i < Perm::STATE_WIDTH; i++)
    {
        state[i] = P::from_scalar(F(lehmer64() % 1000));
    }

    double start = omp_get_wtime();
    for (u64 i = 0; i < iterations; i++)
    {
        perm.permute_mut(state);
    }
    double end = omp_get_wtime();
    printf("%-24s packed: %8.3lf us/permutation (%u lanes)\n", name, (end - start) * 1e6 / (iterations * P::WIDTH), P::WIDTH);
}

void bench_batch(const char *name, u32 width, u64 count, bool koalabear)
{
    u32 prime = koalabear ? KoalaBearParameters::PRIME : BabyBearParameters::PRIME;
    std::vector<u32> states(count * width);
    for (u64 k = 0; k < states.size(); k++)
    {
        states[k] = lehmer64() % prime;
    }

    double start = omp_get_wtime();
    int rc = koalabear ? zkperm_poseidon2_koalabear_permute_batch(states.data(), count, width)
                       : zkperm_poseidon2_babybear_permute_batch(states.data(), count, width);
    double end = omp_get_wtime();
    if (rc != ZKPERM_OK)
    {
        printf("%s batch failed with code %d\n", name, rc);
        return;
    }
    printf("%-24s batch:  %8.3lf ms for %lu states (%d threads)\n", name, (end - start) * 1000, count, omp_get_max_threads());
}

int main()
{
    const u64 iterations = 1 << 14;

    bench_scalar("bn254/3", poseidon2_bn254_default(), iterations / 16);

    Poseidon2KoalaBear<16> kb16 = Poseidon2KoalaBear<16>::new_from_grain_128();
    Poseidon2KoalaBear<24> kb24 = Poseidon2KoalaBear<24>::new_from_grain_128();
    Poseidon2BabyBear<16> bb16 = Poseidon2BabyBear<16>::new_from_grain_128();
    Poseidon2BabyBear<24> bb24 = Poseidon2BabyBear<24>::new_from_grain_128();
    Poseidon2Goldilocks<8> gl8 = Poseidon2Goldilocks<8>::new_from_grain_128();
    Poseidon2Goldilocks<12> gl12 = Poseidon2Goldilocks<12>::new_from_grain_128();

    bench_scalar("koalabear/16", kb16, iterations);
    bench_packed("koalabear/16", kb16, iterations);
    bench_scalar("koalabear/24", kb24, iterations);
    bench_packed("koalabear/24", kb24, iterations);
    bench_scalar("babybear/16", bb16, iterations);
    bench_packed("babybear/16", bb16, iterations);
    bench_scalar("babybear/24", bb24, iterations);
    bench_packed("babybear/24", bb24, iterations);
    bench_scalar("goldilocks/8", gl8, iterations);
    bench_scalar("goldilocks/12", gl12, iterations);

    bench_batch("koalabear/16", 16, 1 << 18, true);
    bench_batch("babybear/16", 16, 1 << 18, false);
    bench_batch("babybear/24", 24, 1 << 18, false);

    return 0;
}
