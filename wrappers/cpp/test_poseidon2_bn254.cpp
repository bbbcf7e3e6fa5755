// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <vector>

#include "poseidon2/poseidon2_bn254.hpp"
#include "packed/packed_field.hpp"
#include "test_util.hpp"

typedef std::array<Bn254Field, 3> State;

static State random_state(Lehmer64 &rng)
{
    State s;
    for (u32 i = 0; i < 3; i++)
    {
        s[i] = random_field_element<Bn254Field>(rng);
    }
    return s;
}

TEST(poseidon2_bn254, horizen_labs_test_vector)
{
    State input = {Bn254Field((u64)0), Bn254Field((u64)1), Bn254Field((u64)2)};
    State expected = {
        Bn254Field::from_hex("0x0bb61d24daca55eebcb1929a82650f328134334da98ea4f847f760054f4a3033"),
        Bn254Field::from_hex("0x303b6f7c86d043bfcbcc80214f26a30277a15d3f74ca654992defe7ff8d03570"),
        Bn254Field::from_hex("0x1ed25194542b12eef8617361c3ba7c52e660b145994427cc86296242cf766ec8"),
    };

    State output = input;
    poseidon2_bn254_default().permute_mut(output);
    for (u32 i = 0; i < 3; i++)
    {
        EXPECT_EQ(output[i].to_hex(), expected[i].to_hex()) << "lane " << i;
    }
}

TEST(poseidon2_bn254, grain_lfsr_regenerates_horizen_labs_table)
{
    Poseidon2Bn254 grain = Poseidon2Bn254::new_from_grain_128();
    Poseidon2Bn254 table = poseidon2_bn254_horizen_labs();

    const ExternalLayerConstants<Bn254Field, 3> &g = grain.get_external_layer().get_constants();
    const ExternalLayerConstants<Bn254Field, 3> &t = table.get_external_layer().get_constants();
    EXPECT_EQ(g.get_initial_constants(), t.get_initial_constants());
    EXPECT_EQ(g.get_terminal_constants(), t.get_terminal_constants());
    EXPECT_EQ(grain.get_internal_layer().get_constants(), table.get_internal_layer().get_constants());

    EXPECT_EQ(t.get_initial_constants()[0][0].to_hex(),
              "0x1d066a255517b7fd8bddd3a93f7804ef7f8fcde48bb4c37a59a09a1a97052816");
    EXPECT_EQ(table.get_internal_layer().get_constants()[0].to_hex(),
              "0x1a1d063e54b1e764b63e1855bff015b8cedd192f47308731499573f23597d4b5");
}

TEST(poseidon2_bn254, fast_internal_matrix_matches_generic)
{
    Bn254InternalMatrix fast;
    Poseidon2InternalMatrixGeneric<Bn254Field, 3, Bn254InternalDiagonal> generic;
    Lehmer64 rng(1);

    for (int i = 0; i < 200; i++)
    {
        State a = random_state(rng);
        State b = a;
        fast.permute_mut(a);
        generic.permute_mut(b);
        EXPECT_EQ(a, b);
    }

    Poseidon2Bn254 fast_perm = poseidon2_bn254_horizen_labs();
    Poseidon2Bn254Generic generic_perm(bn254_horizen_labs_external_constants(), bn254_horizen_labs_internal_constants());
    for (int i = 0; i < 20; i++)
    {
        State s = random_state(rng);
        EXPECT_EQ(fast_perm.permute(s), generic_perm.permute(s));
    }
}

TEST(poseidon2_bn254, rng_construction_is_deterministic)
{
    Lehmer64 rng_a(2024), rng_b(2024), rng_c(2025);
    Poseidon2Bn254 a = Poseidon2Bn254::new_from_rng_128(rng_a);
    Poseidon2Bn254 b = Poseidon2Bn254::new_from_rng_128(rng_b);
    Poseidon2Bn254 c = Poseidon2Bn254::new_from_rng_128(rng_c);

    Lehmer64 rng(3);
    State s = random_state(rng);
    EXPECT_EQ(a.permute(s), b.permute(s));
    EXPECT_NE(a.permute(s), c.permute(s));
}

TEST(poseidon2_bn254, permutation_is_not_identity)
{
    Lehmer64 rng(4);
    const Poseidon2Bn254 &perm = poseidon2_bn254_default();
    for (int i = 0; i < 10; i++)
    {
        State s = random_state(rng);
        EXPECT_NE(perm.permute(s), s);
    }
    State zero;
    EXPECT_NE(perm.permute(zero), zero);
}

TEST(poseidon2_bn254, permute_leaves_input_untouched)
{
    Lehmer64 rng(5);
    State s = random_state(rng);
    State copy = s;
    State out = poseidon2_bn254_default().permute(s);
    EXPECT_EQ(s, copy);

    poseidon2_bn254_default().permute_mut(copy);
    EXPECT_EQ(copy, out);
}

TEST(poseidon2_bn254, packed_state_matches_scalar_states)
{
    typedef PackedField<Bn254Field, 4> P;
    const Poseidon2Bn254 &perm = poseidon2_bn254_default();
    Lehmer64 rng(6);

    State states[4];
    std::array<P, 3> packed;
    for (u32 j = 0; j < 4; j++)
    {
        states[j] = random_state(rng);
    }
    for (u32 i = 0; i < 3; i++)
    {
        Bn254Field lanes[4] = {states[0][i], states[1][i], states[2][i], states[3][i]};
        packed[i] = P::from_lanes(lanes);
    }

    perm.permute_mut(packed);
    for (u32 j = 0; j < 4; j++)
    {
        State expected = perm.permute(states[j]);
        for (u32 i = 0; i < 3; i++)
        {
            EXPECT_EQ(packed[i].lane(j), expected[i]);
        }
    }
}

TEST(poseidon2_bn254, rejects_wrong_round_constant_counts)
{
    ExternalLayerConstants<Bn254Field, 3> external = bn254_horizen_labs_external_constants();
    std::vector<Bn254Field> internal = bn254_horizen_labs_internal_constants();

    std::vector<Bn254Field> short_internal(internal.begin(), internal.end() - 1);
    try
    {
        Poseidon2Bn254 perm(external, short_internal);
        FAIL() << "55 internal constants accepted";
    }
    catch (const zkperm_error &e)
    {
        EXPECT_EQ(e.code(), ZKPERM_ERR_ROUND_CONSTANTS);
    }

    std::vector<std::array<Bn254Field, 3>> initial = external.get_initial_constants();
    std::vector<std::array<Bn254Field, 3>> terminal = external.get_terminal_constants();
    initial.pop_back();
    terminal.pop_back();
    ExternalLayerConstants<Bn254Field, 3> short_external(initial, terminal);
    EXPECT_THROW(Poseidon2Bn254(short_external, internal), zkperm_error);

    // halves of different length
    terminal.push_back(terminal.back());
    EXPECT_THROW((ExternalLayerConstants<Bn254Field, 3>(initial, terminal)), zkperm_error);
}

TEST(poseidon2_bn254, round_numbers)
{
    static_assert(poseidon2_sbox_degree<Bn254Field>() == 5, "x^5 on BN254");
    constexpr Poseidon2RoundNumbers rounds = poseidon2_round_numbers_128<Bn254Field>(3, 5);
    EXPECT_EQ(rounds.rounds_f, 8u);
    EXPECT_EQ(rounds.rounds_p, 56u);

    try
    {
        poseidon2_round_numbers_128<Bn254Field>(4, 5);
        FAIL() << "width 4 accepted";
    }
    catch (const zkperm_error &e)
    {
        EXPECT_EQ(e.code(), ZKPERM_ERR_PARAMETERS);
    }
    // x^3 is not a permutation of BN254 Fr
    EXPECT_THROW(poseidon2_round_numbers_128<Bn254Field>(3, 3), zkperm_error);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
