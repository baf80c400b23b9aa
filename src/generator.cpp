// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/generator.h>

#include "fork_handler.h"

using namespace mulid;

namespace {

    struct thread_stream {
        generator gen;
        ulid last;
    };
}

auto ulid::generate() -> ulid {
    auto & stream = impl::reset_on_fork_thread_local<thread_stream>::instance();
    stream.last = stream.gen.generate_monotonic(stream.last);
    return stream.last;
}
