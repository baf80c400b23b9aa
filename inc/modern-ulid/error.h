// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_ERROR_H_INCLUDED
#define HEADER_MODERN_ULID_ERROR_H_INCLUDED

#include <modern-ulid/common.h>

#include <system_error>
#include <stdexcept>

namespace mulid {

    /// Error codes reported by ULID parsing, conversion and generation
    enum class ulid_errc {
        /// Text is not exactly 26 characters long
        invalid_length = 1,
        /// Text contains a character outside of the Crockford alphabet
        invalid_char,
        /// Leading character encodes a value greater than 7
        data_type_overflow,
        /// Byte input is not exactly 16 bytes long
        invalid_byte_array,
        /// Timestamp does not fit into 48 bits
        timestamp_overflow,
        /// Randomness source failed. Retrying may succeed.
        generate_random,
        /// Monotonic increment would overflow the 80 random bits
        random_overflow
    };
}

template<>
struct std::is_error_code_enum<mulid::ulid_errc> : std::true_type {};

namespace mulid {

    /// Error category for ulid_errc
    MULID_EXPORTED auto ulid_category() noexcept -> const std::error_category &;

    inline auto make_error_code(ulid_errc e) noexcept -> std::error_code {
        return {int(e), ulid_category()};
    }

    /// Exception thrown by the throwing overloads of this library
    class ulid_error : public std::system_error {
    public:
        ulid_error(ulid_errc e):
            std::system_error(make_error_code(e))
        {}
        ulid_error(ulid_errc e, const std::string & what):
            std::system_error(make_error_code(e), what)
        {}
        ulid_error(std::error_code ec):
            std::system_error(ec)
        {}
    };

    /**
     * Result of decoding ULID text
     *
     * A default constructed ec means success. For ulid_errc::invalid_char
     * position is the index of the offending character.
     */
    struct decode_result {
        ulid_errc ec{};
        size_t position = 0;

        constexpr explicit operator bool() const noexcept
            { return this->ec == ulid_errc{}; }

        friend constexpr bool operator==(const decode_result & lhs, const decode_result & rhs) noexcept = default;
    };

    namespace impl {
        [[noreturn]] MULID_EXPORTED void raise_decode_error(decode_result res, char32_t offending);
        [[noreturn]] MULID_EXPORTED void raise_error(std::error_code ec);
    }
}

#endif
