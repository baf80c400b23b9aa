// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_JSON_H_INCLUDED
#define HEADER_MODERN_ULID_JSON_H_INCLUDED

#include <modern-ulid/ulid.h>

#include <nlohmann/json.hpp>

/*
 nlohmann::json serialization.

 By default a ulid is stored as its canonical 26 character string. Wrap it in
 ulid_as_words to store it as a [high, low] pair of 64-bit integers or in
 ulid_as_uuid to store it as a UUID string.

 Deserialization failures throw nlohmann::json exceptions for wrong JSON
 types, ulid_error for malformed ULID strings and std::invalid_argument for
 malformed UUID strings.
*/

namespace mulid {

    /// Stores a ulid as a [high, low] array of unsigned 64-bit integers
    struct ulid_as_words {
        ulid value;

        friend constexpr auto operator==(const ulid_as_words & lhs, const ulid_as_words & rhs) noexcept -> bool = default;
    };

    /// Stores a ulid as an 8-4-4-4-12 UUID string
    struct ulid_as_uuid {
        ulid value;

        friend constexpr auto operator==(const ulid_as_uuid & lhs, const ulid_as_uuid & rhs) noexcept -> bool = default;
    };

    inline void to_json(nlohmann::json & j, const ulid & val) {
        j = val.to_string();
    }

    inline void from_json(const nlohmann::json & j, ulid & val) {
        val = ulid::from_string(j.get_ref<const std::string &>());
    }

    inline void to_json(nlohmann::json & j, const uuid & val) {
        j = val.to_string();
    }

    inline void from_json(const nlohmann::json & j, uuid & val) {
        auto maybe_val = uuid::from_chars(j.get_ref<const std::string &>());
        if (!maybe_val)
            MULID_THROW(std::invalid_argument("invalid uuid string"));
        val = *maybe_val;
    }

    inline void to_json(nlohmann::json & j, const ulid_as_words & val) {
        j = nlohmann::json::array({val.value.most_significant_bits(), val.value.least_significant_bits()});
    }

    inline void from_json(const nlohmann::json & j, ulid_as_words & val) {
        auto words = j.get<std::array<uint64_t, 2>>();
        val.value = ulid(words[0], words[1]);
    }

    inline void to_json(nlohmann::json & j, const ulid_as_uuid & val) {
        to_json(j, val.value.to_uuid());
    }

    inline void from_json(const nlohmann::json & j, ulid_as_uuid & val) {
        uuid tmp;
        from_json(j, tmp);
        val.value = ulid(tmp);
    }
}

#endif
