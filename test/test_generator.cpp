// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <modern-ulid/generator.h>

#include <stdexcept>
#include <vector>
#include <set>
#include <thread>

using namespace mulid;
using namespace std::literals;

namespace {

    using millis_time_point = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    struct fake_clock {
        int64_t * millis;

        auto now() const -> millis_time_point
            { return millis_time_point(std::chrono::milliseconds(*millis)); }
    };

    struct fixed_random {
        std::array<uint8_t, ulid::random_length> value{};
        int calls = 0;

        void fill(std::span<uint8_t> dest) {
            ++calls;
            std::copy(value.begin(), value.begin() + std::min(dest.size(), value.size()), dest.begin());
        }
    };

    struct failing_random {
        void fill(std::span<uint8_t>) {
            throw std::runtime_error("entropy exhausted");
        }
    };

    using fake_generator = basic_generator<fixed_random, fake_clock>;

    constexpr std::array<uint8_t, ulid::random_length> some_random = {0x53,0x34,0xad,0xa7,0x8e,0xdc,0x1d,0x4a,0x6f,0x1e};
    constexpr std::array<uint8_t, ulid::random_length> all_ones = {0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF};
}

TEST_SUITE("generator") {

static_assert(random_source<fixed_random>);
static_assert(random_source<failing_random>);
static_assert(ulid_clock<fake_clock>);
static_assert(!random_source<int>);
static_assert(!ulid_clock<std::chrono::steady_clock>);

TEST_CASE("generate") {
    int64_t now = 1508808576371;
    fake_generator gen(fixed_random{some_random}, fake_clock{&now});

    std::error_code ec;
    auto val = gen.generate(ec);
    CHECK(!ec);
    CHECK(val == ulid("01BX5ZZKBKACTAV9WEVGEMMVRY"));
    CHECK(val.timestamp_millis() == 1508808576371);

    now += 1;
    CHECK(gen.generate().timestamp_millis() == 1508808576372);
    CHECK(gen.random().calls == 2);
}

TEST_CASE("timestamp limits") {
    int64_t now = int64_t(ulid::max_timestamp);
    fake_generator gen(fixed_random{some_random}, fake_clock{&now});

    std::error_code ec;
    auto val = gen.generate(ec);
    CHECK(!ec);
    CHECK(val.timestamp_millis() == 0xFFFFFFFFFFFF);

    now += 1;
    CHECK(gen.generate(ec) == ulid());
    CHECK(ec == ulid_errc::timestamp_overflow);
    CHECK_THROWS_AS(gen.generate(), ulid_error);
    CHECK(gen.random().calls == 1);

    now = -1;
    CHECK(gen.generate(ec) == ulid());
    CHECK(ec == ulid_errc::timestamp_overflow);

    now = 0;
    CHECK(gen.generate(ec).timestamp_millis() == 0);
    CHECK(!ec);
}

TEST_CASE("random failure") {
    int64_t now = 1000;
    basic_generator<failing_random, fake_clock> gen(failing_random{}, fake_clock{&now});

    std::error_code ec;
    CHECK(gen.generate(ec) == ulid());
    CHECK(ec == ulid_errc::generate_random);

    try {
        (void)gen.generate();
        FAIL("no exception");
    } catch(ulid_error & ex) {
        CHECK(ex.code() == ulid_errc::generate_random);
        CHECK(std::string(ex.what()).find("generate random error: msg = entropy exhausted") != std::string::npos);
    }

    //a different millisecond requires fresh randomness
    ulid prev = ulid::make(999, some_random);
    CHECK(gen.generate_monotonic(prev, ec) == ulid());
    CHECK(ec == ulid_errc::generate_random);

    //same millisecond does not touch the random source
    prev = ulid::make(1000, some_random);
    CHECK(gen.generate_monotonic(prev, ec) == *prev.increment());
    CHECK(!ec);
}

TEST_CASE("monotonic") {
    int64_t now = 1000;
    fake_generator gen(fixed_random{some_random}, fake_clock{&now});

    auto first = gen.generate();
    auto second = gen.generate_monotonic(first);
    auto third = gen.generate_monotonic(second);
    CHECK(first < second);
    CHECK(second < third);
    CHECK(second == *first.increment());
    CHECK(third == *second.increment());
    CHECK(third.timestamp_millis() == 1000);
    CHECK(gen.random().calls == 1);

    now = 1001;
    auto fourth = gen.generate_monotonic(third);
    CHECK(third < fourth);
    CHECK(fourth == ulid::make(1001, some_random));
    CHECK(gen.random().calls == 2);
}

TEST_CASE("monotonic sequence") {
    int64_t now = 1508808576371;
    fake_generator gen(fixed_random{some_random}, fake_clock{&now});

    ulid prev;
    for (int i = 0; i < 1000; ++i) {
        if (i % 100 == 0)
            ++now;
        auto next = gen.generate_monotonic(prev);
        CHECK(prev < next);
        prev = next;
    }
}

TEST_CASE("monotonic overflow") {
    int64_t now = 1000;
    fake_generator gen(fixed_random{all_ones}, fake_clock{&now});

    auto first = gen.generate();
    CHECK(first == ulid("00000000Z8ZZZZZZZZZZZZZZZZ"));

    std::error_code ec;
    CHECK(gen.generate_monotonic(first, ec) == ulid());
    CHECK(ec == ulid_errc::random_overflow);
    CHECK_THROWS_AS(gen.generate_monotonic(first), ulid_error);

    //no value instead of an error for the strict variant
    CHECK(!gen.generate_strictly_monotonic(first, ec));
    CHECK(ec == ulid_errc::random_overflow);

    now = 1001;
    auto next = gen.generate_monotonic(first, ec);
    CHECK(!ec);
    CHECK(next.timestamp_millis() == 1001);
    CHECK(first < next);
}

TEST_CASE("clock regression") {
    int64_t now = 2000;
    fake_generator gen(fixed_random{some_random}, fake_clock{&now});

    auto first = gen.generate();

    now = 1999;
    std::error_code ec;
    auto regressed = gen.generate_monotonic(first, ec);
    CHECK(!ec);
    CHECK(regressed == ulid::make(1999, some_random));
    CHECK(regressed < first);

    CHECK(!gen.generate_strictly_monotonic(first, ec));
    CHECK(!ec);
    CHECK(!gen.generate_strictly_monotonic(first));

    now = 2000;
    auto strict = gen.generate_strictly_monotonic(first, ec);
    REQUIRE(strict);
    CHECK(!ec);
    CHECK(first < *strict);

    now = 2001;
    strict = gen.generate_strictly_monotonic(first);
    REQUIRE(strict);
    CHECK(strict->timestamp_millis() == 2001);
}

TEST_CASE("default generator") {
    generator gen;
    std::error_code ec;

    std::set<ulid> seen;
    ulid prev;
    for (int i = 0; i < 100; ++i) {
        auto val = gen.generate_monotonic(prev, ec);
        REQUIRE(!ec);
        CHECK(seen.insert(val).second);
        prev = val;
    }

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
    auto fresh = gen.generate();
    CHECK(int64_t(fresh.timestamp_millis()) >= now);
    CHECK(int64_t(fresh.timestamp_millis()) - now < 60'000);
}

TEST_CASE("system random source") {
    basic_generator<system_random_source> gen;
    auto u1 = gen.generate();
    auto u2 = gen.generate();
    CHECK(u1 != u2);
    CHECK(u1 != ulid());
}

TEST_CASE("threads") {
    std::vector<ulid> results(4 * 100);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < 4; ++t) {
        threads.emplace_back([&results, t]() {
            for (size_t i = 0; i < 100; ++i)
                results[t * 100 + i] = ulid::generate();
        });
    }
    for (auto & thread: threads)
        thread.join();

    std::set<ulid> unique(results.begin(), results.end());
    CHECK(unique.size() == results.size());
    for (size_t t = 0; t < 4; ++t) {
        for (size_t i = 1; i < 100; ++i)
            CHECK(results[t * 100 + i - 1] < results[t * 100 + i]);
    }
}

}
