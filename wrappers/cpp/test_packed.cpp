// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <type_traits>

#include "types/babybear.hpp"
#include "types/koalabear.hpp"
#include "ff/goldilocks.hpp"
#include "packed/packing.hpp"
#include "test_util.hpp"

const int NUM_SAMPLES = 2000;

/*
 * Every packed operation must equal the scalar operation applied lane by lane.
 */
template <typename P>
void check_lane_wise_ops()
{
    typedef typename P::Scalar F;
    const u32 N = P::WIDTH;
    Lehmer64 rng(42);

    for (int s = 0; s < NUM_SAMPLES; s++)
    {
        F xs[N], ys[N];
        for (u32 i = 0; i < N; i++)
        {
            xs[i] = random_field_element<F>(rng);
            ys[i] = random_field_element<F>(rng);
        }
        F c = random_field_element<F>(rng);
        P x = P::from_lanes(xs);
        P y = P::from_lanes(ys);

        P sum = x + y;
        P diff = x - y;
        P prod = x * y;
        P neg = -x;
        P dbl = x.dbl();
        P sq = x.square();
        P mixed_add = x + c;
        P mixed_mul = x * c;
        P mixed_sub = x - c;
        P acc = x;
        acc += y;
        acc *= c;
        acc -= y;

        for (u32 i = 0; i < N; i++)
        {
            EXPECT_EQ(sum.lane(i), xs[i] + ys[i]);
            EXPECT_EQ(diff.lane(i), xs[i] - ys[i]);
            EXPECT_EQ(prod.lane(i), xs[i] * ys[i]);
            EXPECT_EQ(neg.lane(i), -xs[i]);
            EXPECT_EQ(dbl.lane(i), xs[i].dbl());
            EXPECT_EQ(sq.lane(i), xs[i].square());
            EXPECT_EQ(mixed_add.lane(i), xs[i] + c);
            EXPECT_EQ(mixed_mul.lane(i), xs[i] * c);
            EXPECT_EQ(mixed_sub.lane(i), xs[i] - c);
            EXPECT_EQ(acc.lane(i), (xs[i] + ys[i]) * c - ys[i]);
        }
    }
}

template <typename P>
void check_monty_ops()
{
    typedef typename P::Scalar F;
    const u32 N = P::WIDTH;
    Lehmer64 rng(43);

    for (int s = 0; s < NUM_SAMPLES; s++)
    {
        F xs[N];
        for (u32 i = 0; i < N; i++)
        {
            xs[i] = random_field_element<F>(rng);
        }
        // include the extremes
        xs[0] = F::NegOne();
        P x = P::from_lanes(xs);
        u32 n = 1 + (u32)(rng() % 32);

        P half = x.halve();
        P shifted = x.mul_2exp_neg_n(n);
        for (u32 i = 0; i < N; i++)
        {
            EXPECT_EQ(half.lane(i), xs[i].halve());
            EXPECT_EQ(shifted.lane(i), xs[i].mul_2exp_neg_n(n));
        }
    }
}

TEST(packed_field, lane_wise_babybear_4)
{
    check_lane_wise_ops<PackedField<BabyBearField, 4>>();
    check_monty_ops<PackedField<BabyBearField, 4>>();
}

TEST(packed_field, lane_wise_koalabear_4)
{
    check_lane_wise_ops<PackedField<KoalaBearField, 4>>();
    check_monty_ops<PackedField<KoalaBearField, 4>>();
}

TEST(packed_field, lane_wise_goldilocks_2)
{
    check_lane_wise_ops<PackedField<GoldilocksField, 2>>();
}

TEST(packed_field, broadcast_and_lanes)
{
    typedef PackedField<KoalaBearField, 4> P;
    KoalaBearField x(123456);
    P b = P::from_scalar(x);
    for (u32 i = 0; i < P::WIDTH; i++)
    {
        EXPECT_EQ(b.lane(i), x);
    }
    EXPECT_EQ(P::Zero(), P());
    EXPECT_EQ(P::One() * b, b);

    P c = b;
    c.set_lane(2, KoalaBearField(7));
    EXPECT_NE(c, b);
    EXPECT_EQ(c.lane(2), KoalaBearField(7));
    EXPECT_EQ(c.lane(3), x);
}

TEST(packed_field, pack_unpack_states)
{
    typedef PackedField<BabyBearField, 4> P;
    std::array<BabyBearField, 16> states[4];
    for (u32 j = 0; j < 4; j++)
        for (u32 i = 0; i < 16; i++)
            states[j][i] = BabyBearField(100 * j + i);

    std::array<P, 16> packed;
    pack_states<P, 16>(states, packed);
    EXPECT_EQ(packed[5].lane(3), BabyBearField(305));

    std::array<BabyBearField, 16> out[4];
    unpack_states<P, 16>(packed, out);
    for (u32 j = 0; j < 4; j++)
        EXPECT_EQ(out[j], states[j]);
}

TEST(packed_field, default_packing_selection)
{
    EXPECT_TRUE((std::is_same<FieldPacking<GoldilocksField>::Packing, PackedField<GoldilocksField, 1>>::value));
#if defined(__USE_AVX__)
    EXPECT_TRUE((std::is_same<FieldPacking<BabyBearField>::Packing, PackedMonty31AVX2<BabyBearParameters>>::value));
    EXPECT_EQ(FieldPacking<KoalaBearField>::Packing::WIDTH, 8u);
#else
    EXPECT_EQ(FieldPacking<KoalaBearField>::Packing::WIDTH, 1u);
#endif
}

#ifdef __USE_AVX__
TEST(packed_monty31_avx2, lane_wise_babybear)
{
    check_lane_wise_ops<PackedMonty31AVX2<BabyBearParameters>>();
    check_monty_ops<PackedMonty31AVX2<BabyBearParameters>>();
}

TEST(packed_monty31_avx2, lane_wise_koalabear)
{
    check_lane_wise_ops<PackedMonty31AVX2<KoalaBearParameters>>();
    check_monty_ops<PackedMonty31AVX2<KoalaBearParameters>>();
}

TEST(packed_monty31_avx2, extremes)
{
    typedef PackedMonty31AVX2<KoalaBearParameters> P;
    typedef KoalaBearField F;
    F xs[8] = {F::Zero(), F::One(), F::NegOne(), F::Two(), F::NegOne(), F::Zero(), F(1 << 30), F(0x7effffff)};
    F ys[8] = {F::NegOne(), F::NegOne(), F::NegOne(), F::Zero(), F::One(), F::Zero(), F(1 << 30), F(0x7effffff)};
    P x = P::from_lanes(xs);
    P y = P::from_lanes(ys);
    P sum = x + y, diff = x - y, prod = x * y;
    for (u32 i = 0; i < 8; i++)
    {
        EXPECT_EQ(sum.lane(i), xs[i] + ys[i]);
        EXPECT_EQ(diff.lane(i), xs[i] - ys[i]);
        EXPECT_EQ(prod.lane(i), xs[i] * ys[i]);
    }
}
#endif

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
