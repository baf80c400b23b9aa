// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/error.h>

using namespace mulid;

namespace {

    class ulid_error_category : public std::error_category {
    public:
        auto name() const noexcept -> const char * override {
            return "ulid";
        }

        auto message(int code) const -> std::string override {
            switch (ulid_errc(code)) {
            case ulid_errc::invalid_length:
                return "invalid length";
            case ulid_errc::invalid_char:
                return "invalid character";
            case ulid_errc::data_type_overflow:
                return "data type overflow";
            case ulid_errc::invalid_byte_array:
                return "data must be 16 bytes in length";
            case ulid_errc::timestamp_overflow:
                return "timestamp does not fit into 48 bits";
            case ulid_errc::generate_random:
                return "generate random error";
            case ulid_errc::random_overflow:
                return "random part overflow";
            }
            return "unknown ulid error";
        }
    };

    auto describe_char(char32_t c) -> std::string {
        char buf[32];
        if (c >= 0x20 && c < 0x7F)
            snprintf(buf, sizeof(buf), "'%c'", char(c));
        else
            snprintf(buf, sizeof(buf), "U+%04X", unsigned(c));
        return buf;
    }
}

auto mulid::ulid_category() noexcept -> const std::error_category & {
    static const ulid_error_category category;
    return category;
}

void mulid::impl::raise_decode_error(decode_result res, char32_t offending) {
    switch (res.ec) {
    case ulid_errc::invalid_char:
        MULID_THROW(ulid_error(res.ec, "invalid the char: " + describe_char(offending) +
                                       " at position " + std::to_string(res.position)));
    case ulid_errc::data_type_overflow:
        MULID_THROW(ulid_error(res.ec, "ulid string must not exceed '7ZZZZZZZZZZZZZZZZZZZZZZZZZ'"));
    default:
        MULID_THROW(ulid_error(res.ec));
    }
}

void mulid::impl::raise_error(std::error_code ec) {
    MULID_THROW(ulid_error(ec));
}
