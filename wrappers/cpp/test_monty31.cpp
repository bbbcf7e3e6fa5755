// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <cstdint>

#include "types/babybear.hpp"
#include "types/koalabear.hpp"
#include "test_util.hpp"

const int NUM_SAMPLES = 10000;

template <typename F>
class Monty31Test : public ::testing::Test
{
};

typedef ::testing::Types<BabyBearField, KoalaBearField> Monty31Fields;
TYPED_TEST_SUITE(Monty31Test, Monty31Fields);

static uint64_t pow_mod(uint64_t base, uint64_t e, uint64_t p)
{
    uint64_t r = 1;
    base %= p;
    while (e)
    {
        if (e & 1)
            r = r * base % p;
        base = base * base % p;
        e >>= 1;
    }
    return r;
}

TYPED_TEST(Monty31Test, ring_ops_match_u64)
{
    typedef TypeParam F;
    const uint64_t p = F::ORDER_U64;

    for (int i = 0; i < NUM_SAMPLES; i++)
    {
        uint64_t a = lehmer64() % p;
        uint64_t b = lehmer64() % p;
        F fa = F::from_canonical_u32((uint32_t)a);
        F fb = F::from_canonical_u32((uint32_t)b);

        EXPECT_EQ((fa + fb).as_canonical_u32(), (a + b) % p);
        EXPECT_EQ((fa - fb).as_canonical_u32(), (a + p - b) % p);
        EXPECT_EQ((fa * fb).as_canonical_u32(), a * b % p);
        EXPECT_EQ((-fa).as_canonical_u32(), (p - a) % p);
        EXPECT_EQ(fa.dbl().as_canonical_u32(), 2 * a % p);
        EXPECT_EQ(fa.square().as_canonical_u32(), a * a % p);

        F acc = fa;
        acc += fb;
        acc *= fb;
        acc -= fa;
        EXPECT_EQ(acc.as_canonical_u32(), (((a + b) % p) * b % p + p - a) % p);
    }
}

TYPED_TEST(Monty31Test, halve_and_negative_powers_of_two)
{
    typedef TypeParam F;
    const uint64_t p = F::ORDER_U64;
    const uint64_t inv_two = (p + 1) / 2;

    for (int i = 0; i < NUM_SAMPLES; i++)
    {
        uint64_t a = lehmer64() % p;
        F fa = F::from_canonical_u32((uint32_t)a);

        EXPECT_EQ(fa.halve().as_canonical_u32(), a * inv_two % p);
        EXPECT_EQ(fa.halve().dbl(), fa);

        uint32_t n = 1 + (uint32_t)(lehmer64() % 31);
        EXPECT_EQ(fa.mul_2exp_neg_n(n).as_canonical_u32(), a * pow_mod(inv_two, n, p) % p);
    }
}

TYPED_TEST(Monty31Test, exp_u64)
{
    typedef TypeParam F;
    const uint64_t p = F::ORDER_U64;

    for (int i = 0; i < 1000; i++)
    {
        uint64_t a = lehmer64() % p;
        uint64_t e = lehmer64();
        EXPECT_EQ(F(a).exp_u64(e).as_canonical_u32(), pow_mod(a, e, p));
    }
    // Fermat
    EXPECT_EQ(F(12345).exp_u64(p - 1), F::One());
    EXPECT_EQ(F::Zero().exp_u64(0), F::One());
}

TYPED_TEST(Monty31Test, canonical_boundary)
{
    typedef TypeParam F;
    const uint32_t p = F::ORDER_U32;

    EXPECT_EQ(F::from_canonical_u32(p - 1), F::NegOne());
    EXPECT_EQ(F::from_canonical_u32(p - 1).as_canonical_u32(), p - 1);
    EXPECT_EQ(F::from_canonical_u32(0), F::Zero());

    try
    {
        F::from_canonical_u32(p);
        FAIL() << "p accepted as canonical";
    }
    catch (const zkperm_error &e)
    {
        EXPECT_EQ(e.code(), ZKPERM_ERR_NONCANONICAL);
    }

    uint64_t limbs[ZKPERM_MAX_LIMBS] = {(uint64_t)p + 5, 0, 0, 0};
    EXPECT_FALSE(F::is_canonical_limbs(limbs));
    EXPECT_THROW(F::from_canonical_limbs(limbs), zkperm_error);

    limbs[0] = p - 2;
    uint64_t out[ZKPERM_MAX_LIMBS] = {0};
    F::from_canonical_limbs(limbs).to_canonical_limbs(out);
    EXPECT_EQ(out[0], p - 2);
}

TYPED_TEST(Monty31Test, random_field_element_is_canonical)
{
    typedef TypeParam F;
    Lehmer64 rng(7);
    for (int i = 0; i < 1000; i++)
    {
        F x = random_field_element<F>(rng);
        EXPECT_LT(x.as_canonical_u32(), F::ORDER_U32);
    }
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
