// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_TEST_UTIL_HPP__
#define __ZKPERM_TEST_UTIL_HPP__

#include <cstdint>

static __uint128_t g_lehmer64_state = 0xAAAAAAAAAAAAAAAALL;

// Fast random generator
// https://lemire.me/blog/2019/03/19/the-fastest-conventional-random-number-generator-that-can-pass-big-crush/
static inline uint64_t lehmer64()
{
    g_lehmer64_state *= 0xda942042e4dd58b5LL;
    return g_lehmer64_state >> 64;
}

// minimal UniformRandomBitGenerator over a private lehmer64 state
class Lehmer64
{
    __uint128_t state;

public:
    typedef uint64_t result_type;

    explicit Lehmer64(uint64_t seed) : state(((__uint128_t)seed << 64) | 0xAAAAAAAAAAAAAAABULL) {}

    static constexpr uint64_t min() { return 0; }
    static constexpr uint64_t max() { return UINT64_MAX; }

    uint64_t operator()()
    {
        this->state *= 0xda942042e4dd58b5LL;
        return this->state >> 64;
    }
};

#endif // __ZKPERM_TEST_UTIL_HPP__
