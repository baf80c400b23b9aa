// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "random_generator.h"
#include "fork_handler.h"

#include <modern-ulid/generator.h>

#include <randutils.hpp>

namespace mulid::impl {

    prng & get_random_generator() {

        struct generator : prng {
            generator():
                prng(randutils::auto_seed_128{}.base())
            {}
        };

        return reset_on_fork_thread_local<generator>::instance();
    }

}

using namespace mulid;

void default_random_source::fill(std::span<uint8_t> dest) {
    impl::fill_random(impl::get_random_generator(), dest);
}

void system_random_source::fill(std::span<uint8_t> dest) {
    //std::random_device reports failures via std::exception derived exceptions
    std::random_device device;
    impl::fill_random(device, dest);
}
