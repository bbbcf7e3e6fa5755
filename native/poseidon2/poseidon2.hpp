// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_POSEIDON2_HPP__
#define __ZKPERM_POSEIDON2_HPP__

#include <array>
#include <vector>

#include "types/int_types.h"
#include "ff/field_utils.hpp"
#include "utils/exception.hpp"
#include "poseidon2/poseidon2_round_numbers.hpp"
#include "poseidon2/grain_lfsr.hpp"

/*
 * Everything below is templated on the element type A of the state, which is
 * either the field F itself or a packing of F. The round logic never looks at
 * which one it is.
 */

template <const u64 D, typename A>
inline A exp_const(const A &x)
{
    switch (D)
    {
    case 1:
        return x;
    case 2:
        return x * x;
    case 3:
        return x * x * x;
    case 4:
    {
        A x2 = x * x;
        return x2 * x2;
    }
    case 5:
    {
        A x2 = x * x;
        A x4 = x2 * x2;
        return x * x4;
    }
    case 6:
    {
        A x2 = x * x;
        A x4 = x2 * x2;
        return x2 * x4;
    }
    case 7:
    {
        A x2 = x * x;
        A x4 = x2 * x2;
        A x3 = x * x2;
        return x3 * x4;
    }
    default:
    {
        A result = x;
        A base = x;
        u64 power = D - 1;
        while (power)
        {
            if (power & 1)
                result = result * base;
            base = base * base;
            power >>= 1;
        }
        return result;
    }
    }
}

template <typename A>
inline void apply_mat4(A *x)
{
    A t01 = x[0] + x[1];
    A t23 = x[2] + x[3];
    A t0123 = t01 + t23;
    A t01123 = t0123 + x[1];
    A t01233 = t0123 + x[3];
    // The order here is important. Need to overwrite x[0] and x[2] after x[1] and x[3].
    x[3] = t01233 + x[0] + x[0]; // 3*x[0] + x[1] + x[2] + 2*x[3]
    x[1] = t01123 + x[2] + x[2]; // x[0] + 2*x[1] + 3*x[2] + x[3]
    x[0] = t01123 + t01;         // 2*x[0] + 3*x[1] + x[2] + x[3]
    x[2] = t01233 + t23;         // x[0] + x[1] + 2*x[2] + 3*x[3]
}

template <typename A>
inline void apply_hl_mat4(A *x)
{
    A t0 = x[0] + x[1];
    A t1 = x[2] + x[3];
    A t2 = x[1] + x[1] + t1;
    A t3 = x[3] + x[3] + t0;
    A t4 = t1 + t1 + t1 + t1 + t3;
    A t5 = t0 + t0 + t0 + t0 + t2;
    A t6 = t3 + t5;
    A t7 = t2 + t4;
    x[0] = t6;
    x[1] = t5;
    x[2] = t7;
    x[3] = t4;
}

// [[2, 3, 1, 1], [1, 2, 3, 1], [1, 1, 2, 3], [3, 1, 1, 2]]
class MDSMat4
{
public:
    template <typename A>
    static inline void permute_mut(A *state)
    {
        apply_mat4<A>(state);
    }
};

// [[5, 7, 1, 3], [4, 6, 1, 1], [1, 3, 5, 7], [1, 1, 4, 6]]
class HLMDSMat4
{
public:
    template <typename A>
    static inline void permute_mut(A *state)
    {
        apply_hl_mat4<A>(state);
    }
};

/*
 * The external linear layer. Widths 2 and 3 use circ(2, 1, ..., 1), multiples
 * of 4 use the block circulant circ(2 M4, M4, ..., M4).
 */
template <typename A, typename Mat4, const u64 WIDTH>
inline void mds_light_permutation(std::array<A, WIDTH> &state)
{
    static_assert(WIDTH == 2 || WIDTH == 3 || (WIDTH % 4 == 0 && WIDTH >= 4 && WIDTH <= 24),
                  "unsupported width for the external linear layer");

    switch (WIDTH)
    {
    case 2:
    case 3:
    {
        A sum = state[0];
        for (u64 i = 1; i < WIDTH; i++)
        {
            sum += state[i];
        }
        for (u64 i = 0; i < WIDTH; i++)
        {
            state[i] += sum;
        }
    }
    break;

    default:
    {
        // First, we apply M_4 to each consecutive four elements of the state.
        // In Appendix B's terminology, this replaces each x_i with x_i'.
        for (u64 i = 0; i + 4 <= WIDTH; i += 4)
        {
            Mat4::permute_mut(&state[i]);
        }
        // Now, we apply the outer circulant matrix (to compute the y_i values).

        // We first precompute the four sums of every four elements.
        A sums[4] = {A::Zero(), A::Zero(), A::Zero(), A::Zero()};
        for (u64 k = 0; k < 4; k++)
        {
            for (u64 i = 0; i + k < WIDTH; i += 4)
            {
                sums[k] += state[i + k];
            }
        }

        // The formula for each y_i involves 2x_i' term and x_j' terms for each j that equals i mod 4.
        // In other words, we can add a single copy of x_i' to the appropriate one of our precomputed sums
        for (u64 i = 0; i < WIDTH; i++)
        {
            state[i] += sums[i % 4];
        }
    }
    break;
    }
}

/*
 * Round constants of the external rounds, split into the rounds before the
 * internal rounds (initial) and after them (terminal).
 */
template <typename F, const u64 WIDTH>
class ExternalLayerConstants
{
private:
    std::vector<std::array<F, WIDTH>> initial;
    std::vector<std::array<F, WIDTH>> terminal;

public:
    ExternalLayerConstants(const std::vector<std::array<F, WIDTH>> &initial,
                           const std::vector<std::array<F, WIDTH>> &terminal)
        : initial(initial), terminal(terminal)
    {
        if (initial.size() != terminal.size())
        {
            throw zkperm_error(ZKPERM_ERR_ROUND_CONSTANTS, "%lu initial and %lu terminal external rounds",
                               initial.size(), terminal.size());
        }
    }

    template <typename Rng>
    static ExternalLayerConstants new_from_rng(u64 rounds_f, Rng &rng)
    {
        u64 half_f = rounds_f / 2;
        std::vector<std::array<F, WIDTH>> initial(half_f);
        std::vector<std::array<F, WIDTH>> terminal(half_f);
        for (u64 r = 0; r < half_f; r++)
        {
            for (u64 i = 0; i < WIDTH; i++)
            {
                initial[r][i] = random_field_element<F>(rng);
            }
        }
        for (u64 r = 0; r < half_f; r++)
        {
            for (u64 i = 0; i < WIDTH; i++)
            {
                terminal[r][i] = random_field_element<F>(rng);
            }
        }
        return ExternalLayerConstants(initial, terminal);
    }

    inline const std::vector<std::array<F, WIDTH>> &get_initial_constants() const { return this->initial; }
    inline const std::vector<std::array<F, WIDTH>> &get_terminal_constants() const { return this->terminal; }
};

template <typename F, const u64 WIDTH, const u64 D, typename Mat4>
class Poseidon2ExternalLayer
{
private:
    ExternalLayerConstants<F, WIDTH> constants;

    template <typename A>
    inline void external_rounds(std::array<A, WIDTH> &state, const std::vector<std::array<F, WIDTH>> &rcs) const
    {
        for (const std::array<F, WIDTH> &rc : rcs)
        {
            for (u64 i = 0; i < WIDTH; i++)
            {
                state[i] += rc[i];
                state[i] = exp_const<D>(state[i]);
            }
            mds_light_permutation<A, Mat4, WIDTH>(state);
        }
    }

public:
    explicit Poseidon2ExternalLayer(const ExternalLayerConstants<F, WIDTH> &constants) : constants(constants) {}

    inline const ExternalLayerConstants<F, WIDTH> &get_constants() const { return this->constants; }

    // the initial linear layer followed by the initial external rounds
    template <typename A>
    inline void permute_state_initial(std::array<A, WIDTH> &state) const
    {
        mds_light_permutation<A, Mat4, WIDTH>(state);
        external_rounds(state, this->constants.get_initial_constants());
    }

    template <typename A>
    inline void permute_state_terminal(std::array<A, WIDTH> &state) const
    {
        external_rounds(state, this->constants.get_terminal_constants());
    }
};

/*
 * 1 + diag(V) for any field: x_i <- V_i * x_i + sum(x). Diag supplies V
 * through a static values() returning std::array<F, WIDTH>.
 */
template <typename F, const u64 WIDTH, typename Diag>
class Poseidon2InternalMatrixGeneric
{
private:
    std::array<F, WIDTH> diag;

public:
    Poseidon2InternalMatrixGeneric() : diag(Diag::values()) {}

    inline const std::array<F, WIDTH> &diagonal() const { return this->diag; }

    template <typename A>
    inline void permute_mut(std::array<A, WIDTH> &state) const
    {
        A sum = state[0];
        for (u64 i = 1; i < WIDTH; i++)
        {
            sum += state[i];
        }

        for (u64 i = 0; i < WIDTH; i++)
        {
            state[i] *= this->diag[i];
            state[i] += sum;
        }
    }
};

template <typename F, const u64 WIDTH, const u64 D, typename Matrix>
class Poseidon2InternalLayer
{
private:
    std::vector<F> constants;
    Matrix matrix;

public:
    explicit Poseidon2InternalLayer(const std::vector<F> &constants) : constants(constants) {}

    inline const std::vector<F> &get_constants() const { return this->constants; }

    template <typename A>
    inline void permute_state(std::array<A, WIDTH> &state) const
    {
        for (const F &rc : this->constants)
        {
            state[0] += rc;
            state[0] = exp_const<D>(state[0]);
            this->matrix.permute_mut(state);
        }
    }
};

/*
 * Poseidon2 permutation: the initial linear layer and R_F / 2 external
 * rounds, R_P internal rounds, then R_F / 2 external rounds. An instance only
 * holds its round constants and can be shared between threads.
 */
template <typename F, typename ExternalLayer, typename InternalLayer, const u64 WIDTH, const u64 D>
class Poseidon2
{
private:
    ExternalLayer external_layer;
    InternalLayer internal_layer;

    static const ExternalLayerConstants<F, WIDTH> &check_external(const ExternalLayerConstants<F, WIDTH> &external_constants)
    {
        Poseidon2RoundNumbers rounds = poseidon2_round_numbers_128<F>(WIDTH, D);
        if (external_constants.get_initial_constants().size() != rounds.rounds_f / 2)
        {
            throw zkperm_error(ZKPERM_ERR_ROUND_CONSTANTS, "expected %lu external rounds per half, got %lu",
                               rounds.rounds_f / 2, external_constants.get_initial_constants().size());
        }
        return external_constants;
    }

    static const std::vector<F> &check_internal(const std::vector<F> &internal_constants)
    {
        Poseidon2RoundNumbers rounds = poseidon2_round_numbers_128<F>(WIDTH, D);
        if (internal_constants.size() != rounds.rounds_p)
        {
            throw zkperm_error(ZKPERM_ERR_ROUND_CONSTANTS, "expected %lu internal rounds, got %lu",
                               rounds.rounds_p, internal_constants.size());
        }
        return internal_constants;
    }

public:
    static constexpr u64 STATE_WIDTH = WIDTH;
    static constexpr u64 SBOX_DEGREE = D;
    typedef F Field;
    typedef std::array<F, WIDTH> State;

    Poseidon2(const ExternalLayerConstants<F, WIDTH> &external_constants, const std::vector<F> &internal_constants)
        : external_layer(check_external(external_constants)), internal_layer(check_internal(internal_constants))
    {
    }

    template <typename Rng>
    static Poseidon2 new_from_rng_128(Rng &rng)
    {
        Poseidon2RoundNumbers rounds = poseidon2_round_numbers_128<F>(WIDTH, D);
        ExternalLayerConstants<F, WIDTH> external_constants =
            ExternalLayerConstants<F, WIDTH>::new_from_rng(rounds.rounds_f, rng);
        std::vector<F> internal_constants(rounds.rounds_p);
        for (u64 r = 0; r < rounds.rounds_p; r++)
        {
            internal_constants[r] = random_field_element<F>(rng);
        }
        return Poseidon2(external_constants, internal_constants);
    }

    // constants from the Grain LFSR, in the order the reference scripts draw them
    static Poseidon2 new_from_grain_128()
    {
        Poseidon2RoundNumbers rounds = poseidon2_round_numbers_128<F>(WIDTH, D);
        GrainLfsr grain(F::BITS, WIDTH, rounds.rounds_f, rounds.rounds_p);
        u64 half_f = rounds.rounds_f / 2;

        std::vector<std::array<F, WIDTH>> initial(half_f);
        std::vector<std::array<F, WIDTH>> terminal(half_f);
        std::vector<F> internal_constants(rounds.rounds_p);

        for (u64 r = 0; r < half_f; r++)
            for (u64 i = 0; i < WIDTH; i++)
                initial[r][i] = grain.next_field_element<F>();
        for (u64 r = 0; r < rounds.rounds_p; r++)
            internal_constants[r] = grain.next_field_element<F>();
        for (u64 r = 0; r < half_f; r++)
            for (u64 i = 0; i < WIDTH; i++)
                terminal[r][i] = grain.next_field_element<F>();

        return Poseidon2(ExternalLayerConstants<F, WIDTH>(initial, terminal), internal_constants);
    }

    inline const ExternalLayer &get_external_layer() const { return this->external_layer; }
    inline const InternalLayer &get_internal_layer() const { return this->internal_layer; }

    template <typename A>
    void permute_mut(std::array<A, WIDTH> &state) const
    {
        this->external_layer.permute_state_initial(state);
        this->internal_layer.permute_state(state);
        this->external_layer.permute_state_terminal(state);
    }

    template <typename A>
    std::array<A, WIDTH> permute(std::array<A, WIDTH> state) const
    {
        permute_mut(state);
        return state;
    }
};

#endif // __ZKPERM_POSEIDON2_HPP__
