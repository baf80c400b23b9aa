// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_GENERATOR_H_INCLUDED
#define HEADER_MODERN_ULID_GENERATOR_H_INCLUDED

#include <modern-ulid/ulid.h>

#include <exception>

namespace mulid {

    namespace impl {
        template<class T>
        concept system_time_point = std::same_as<typename T::clock, std::chrono::system_clock>;
    }

    /**
     * Source of random bytes for ULID generation
     *
     * fill() must populate the whole span. It may throw an exception derived
     * from std::exception to report failure.
     */
    template<class T>
    concept random_source = requires(T & r, std::span<uint8_t> dest) {
        r.fill(dest);
    };

    /// Clock producing std::chrono::system_clock time points
    template<class T>
    concept ulid_clock = requires(T & c) {
        { c.now() } -> impl::system_time_point;
    };

    /**
     * Default random source
     *
     * Draws from a per-thread ChaCha20 generator seeded from system entropy.
     * The generator is re-seeded in a child process after fork().
     */
    class default_random_source {
    public:
        MULID_EXPORTED void fill(std::span<uint8_t> dest);
    };

    /// Random source that reads std::random_device on every call
    class system_random_source {
    public:
        MULID_EXPORTED void fill(std::span<uint8_t> dest);
    };

    static_assert(random_source<default_random_source>);
    static_assert(random_source<system_random_source>);
    static_assert(ulid_clock<std::chrono::system_clock>);

    /**
     * ULID generator
     *
     * Combines the current clock reading with random bytes. Monotonic modes take
     * the previously generated ULID explicitly. A generator is not safe for
     * concurrent use from multiple threads.
     *
     * Every operation comes in two flavors: one reporting failures via
     * std::error_code and one throwing ulid_error.
     */
    template<random_source Random = default_random_source, ulid_clock Clock = std::chrono::system_clock>
    class basic_generator {
    public:
        basic_generator() = default;

        explicit basic_generator(Random random, Clock clock = Clock{}):
            m_random(std::move(random)),
            m_clock(std::move(clock))
        {}

        /**
         * Generates a new ULID from the current time and fresh randomness
         *
         * Reports ulid_errc::timestamp_overflow if the clock is before the epoch
         * or beyond 48 bits of milliseconds and ulid_errc::generate_random
         * if the random source fails.
         */
        auto generate(std::error_code & ec) noexcept -> ulid {
            uint64_t timestamp;
            if (!this->read_clock(timestamp, ec))
                return {};
            return this->generate_at(timestamp, ec);
        }

        auto generate() -> ulid {
            uint64_t timestamp;
            std::error_code ec;
            if (!this->read_clock(timestamp, ec))
                impl::raise_error(ec);
            return this->generate_at(timestamp);
        }

        /**
         * Generates a ULID that sorts after prev when created in the same millisecond
         *
         * If the clock reads the same millisecond as prev the result is prev
         * with its random part incremented. ulid_errc::random_overflow is
         * reported if the random part is exhausted. Otherwise a fresh ULID is
         * generated, even if the clock moved backwards.
         */
        auto generate_monotonic(const ulid & prev, std::error_code & ec) noexcept -> ulid {
            uint64_t timestamp;
            if (!this->read_clock(timestamp, ec))
                return {};
            if (timestamp == prev.timestamp_millis())
                return increment(prev, ec);
            return this->generate_at(timestamp, ec);
        }

        auto generate_monotonic(const ulid & prev) -> ulid {
            uint64_t timestamp;
            std::error_code ec;
            if (!this->read_clock(timestamp, ec))
                impl::raise_error(ec);
            if (timestamp == prev.timestamp_millis()) {
                auto ret = increment(prev, ec);
                if (ec)
                    impl::raise_error(ec);
                return ret;
            }
            return this->generate_at(timestamp);
        }

        /**
         * Like generate_monotonic but never returns a ULID that is not greater than prev
         *
         * Returns std::nullopt on error (with ec set) or when the clock
         * moved backwards (with ec clear).
         */
        auto generate_strictly_monotonic(const ulid & prev, std::error_code & ec) noexcept -> std::optional<ulid> {
            auto ret = this->generate_monotonic(prev, ec);
            if (ec || ret <= prev)
                return std::nullopt;
            return ret;
        }

        auto generate_strictly_monotonic(const ulid & prev) -> std::optional<ulid> {
            auto ret = this->generate_monotonic(prev);
            if (ret <= prev)
                return std::nullopt;
            return ret;
        }

        auto random() noexcept -> Random &
            { return m_random; }
        auto clock() noexcept -> Clock &
            { return m_clock; }

    private:
        auto read_clock(uint64_t & timestamp, std::error_code & ec) noexcept -> bool {
            using namespace std::chrono;

            auto millis = floor<milliseconds>(m_clock.now()).time_since_epoch().count();
            if (millis < 0 || uint64_t(millis) > ulid::max_timestamp) {
                ec = ulid_errc::timestamp_overflow;
                return false;
            }
            timestamp = uint64_t(millis);
            return true;
        }

        static auto increment(const ulid & prev, std::error_code & ec) noexcept -> ulid {
            if (auto ret = prev.increment()) {
                ec.clear();
                return *ret;
            }
            ec = ulid_errc::random_overflow;
            return {};
        }

        auto generate_at(uint64_t timestamp, std::error_code & ec) noexcept -> ulid {
            std::array<uint8_t, ulid::random_length> random;
        #if MULID_USE_EXCEPTIONS
            try {
                m_random.fill(random);
            } catch (const std::exception &) {
                ec = ulid_errc::generate_random;
                return {};
            }
        #else
            m_random.fill(random);
        #endif
            return ulid::make(timestamp, random, ec);
        }

        auto generate_at(uint64_t timestamp) -> ulid {
            std::array<uint8_t, ulid::random_length> random;
        #if MULID_USE_EXCEPTIONS
            try {
                m_random.fill(random);
            } catch (const std::exception & ex) {
                throw ulid_error(ulid_errc::generate_random, std::string("generate random error: msg = ") + ex.what());
            }
        #else
            m_random.fill(random);
        #endif
            return ulid::make(timestamp, random);
        }

    private:
        Random m_random;
        Clock m_clock;
    };

    /// Generator using the default random source and the system clock
    using generator = basic_generator<>;
}

#endif
