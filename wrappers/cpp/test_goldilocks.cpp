// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <cstdint>

#include "ff/goldilocks.hpp"
#include "test_util.hpp"

const int NUM_SAMPLES = 10000;
const uint64_t P = GoldilocksField::ORDER;

static uint64_t mul_ref(uint64_t a, uint64_t b)
{
    return (uint64_t)(((__uint128_t)a * b) % P);
}

TEST(goldilocks, ring_ops_match_u128)
{
    for (int i = 0; i < NUM_SAMPLES; i++)
    {
        uint64_t a = lehmer64() % P;
        uint64_t b = lehmer64() % P;
        GoldilocksField fa(a);
        GoldilocksField fb(b);

        EXPECT_EQ((fa + fb).as_canonical_u64(), (uint64_t)(((__uint128_t)a + b) % P));
        EXPECT_EQ((fa - fb).as_canonical_u64(), (uint64_t)(((__uint128_t)a + P - b) % P));
        EXPECT_EQ((fa * fb).as_canonical_u64(), mul_ref(a, b));
        EXPECT_EQ((-fa).as_canonical_u64(), (P - a) % P);
        EXPECT_EQ(fa.square().as_canonical_u64(), mul_ref(a, a));
    }
}

TEST(goldilocks, edge_values_stay_canonical)
{
    const uint64_t edges[] = {0, 1, 2, GoldilocksField::EPSILON, (uint64_t)1 << 32, P - 2, P - 1};
    for (uint64_t a : edges)
    {
        for (uint64_t b : edges)
        {
            GoldilocksField fa(a);
            GoldilocksField fb(b);
            EXPECT_LT((fa * fb).as_canonical_u64(), P);
            EXPECT_EQ((fa * fb).as_canonical_u64(), mul_ref(a, b));
            EXPECT_EQ((fa + fb).as_canonical_u64(), (uint64_t)(((__uint128_t)a + b) % P));
            EXPECT_EQ((fa - fb).as_canonical_u64(), (uint64_t)(((__uint128_t)a + P - b) % P));
        }
    }
    // x - x is canonical zero
    EXPECT_EQ((GoldilocksField(P - 1) - GoldilocksField(P - 1)).as_canonical_u64(), 0);
}

TEST(goldilocks, from_noncanonical_u128)
{
    for (int i = 0; i < NUM_SAMPLES; i++)
    {
        __uint128_t n = ((__uint128_t)lehmer64() << 64) | lehmer64();
        EXPECT_EQ(GoldilocksField::from_noncanonical_u128(n).as_canonical_u64(), (uint64_t)(n % P));
    }
    __uint128_t max = ~(__uint128_t)0;
    EXPECT_EQ(GoldilocksField::from_noncanonical_u128(max).as_canonical_u64(), (uint64_t)(max % P));
}

TEST(goldilocks, exp_u64)
{
    GoldilocksField g(7);
    EXPECT_EQ(g.exp_u64(P - 1), GoldilocksField::One());
    EXPECT_EQ(g.exp_u64(3).as_canonical_u64(), 343);
    EXPECT_EQ(g.exp_u64(0), GoldilocksField::One());
}

TEST(goldilocks, canonical_boundary)
{
    EXPECT_EQ(GoldilocksField::from_canonical_u64(P - 1).as_canonical_u64(), P - 1);
    EXPECT_THROW(GoldilocksField::from_canonical_u64(P), zkperm_error);
    EXPECT_THROW(GoldilocksField::from_canonical_u64(UINT64_MAX), zkperm_error);

    uint64_t limbs[ZKPERM_MAX_LIMBS] = {P, 0, 0, 0};
    EXPECT_FALSE(GoldilocksField::is_canonical_limbs(limbs));
    limbs[0] = P - 1;
    EXPECT_TRUE(GoldilocksField::is_canonical_limbs(limbs));

    // the u64 constructor reduces
    EXPECT_EQ(GoldilocksField(UINT64_MAX).as_canonical_u64(), UINT64_MAX - P);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
