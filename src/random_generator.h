// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_RANDOM_GENERATOR_H_INCLUDED
#define HEADER_MODERN_ULID_RANDOM_GENERATOR_H_INCLUDED

#include <modern-ulid/common.h>

#include <random>
#include <chacha20.hpp>


namespace mulid::impl {

    using prng = chacha20_12;

    /// Per-thread generator, re-seeded after fork()
    prng & get_random_generator();

    /// Fills dest with uniformly distributed bytes drawn from gen
    template<class Gen>
    void fill_random(Gen & gen, std::span<uint8_t> dest) {
        std::uniform_int_distribution<uint64_t> distrib;
        auto it = dest.begin();
        while (it != dest.end()) {
            uint64_t val = distrib(gen);
            for (size_t i = 0; i < sizeof(val) && it != dest.end(); ++i, ++it) {
                *it = uint8_t(val);
                val >>= 8;
            }
        }
    }
}

#endif
