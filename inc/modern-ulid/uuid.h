// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_UUID_H_INCLUDED
#define HEADER_MODERN_ULID_UUID_H_INCLUDED

#include <modern-ulid/common.h>

namespace mulid {
    namespace impl {

        template<char_like C> struct uuid_char_traits {
            static constexpr unsigned max = 128;
            static constexpr C dash = C(u8'-');
        };

        template<> struct uuid_char_traits<char> {
            static constexpr unsigned max = ('a' == u8'a' ? 128 : 256);
            static constexpr char dash = '-';
        };

        template<> struct uuid_char_traits<wchar_t> {
            static constexpr unsigned max = (L'a' == u8'a' ? 128 : 256);
            static constexpr wchar_t dash = L'-';
        };

        struct hex_digits {
            static constexpr uint8_t invalid = 16;

            template<impl::char_like C>
            static constexpr C encode(uint8_t nibble) noexcept {
                return C(nibble < 10 ? u8'0' + nibble : u8'a' + (nibble - 10));
            }

            template<impl::char_like C>
            static constexpr uint8_t decode(C c) noexcept {
                const auto val = uint32_t(std::make_unsigned_t<C>(c));
                if (val >= u8'0' && val <= u8'9')
                    return uint8_t(val - u8'0');
                if (val >= u8'a' && val <= u8'f')
                    return uint8_t(val - u8'a' + 10);
                if (val >= u8'A' && val <= u8'F')
                    return uint8_t(val - u8'A' + 10);
                return invalid;
            }
        };
    }

    /**
     * A 128-bit universally unique identifier
     *
     * Only the value semantics needed for interoperability are provided: the
     * bytes, ordering, and the 8-4-4-4-12 text form. A ulid converts to and
     * from this type without any transformation of its bits.
     */
    class uuid {
    public:
        /// Number of characters in string representation of UUID
        static constexpr size_t char_length = 36;

    private:
        static constexpr bool is_dash_position(size_t idx) noexcept
            { return idx == 8 || idx == 13 || idx == 18 || idx == 23; }

        template<impl::char_like T>
        static constexpr bool read(const T * str, std::span<uint8_t, 16> dest) noexcept {
            using tr = impl::uuid_char_traits<T>;

            size_t byte_idx = 0;
            for (size_t i = 0; i < uuid::char_length; ) {
                if (is_dash_position(i)) {
                    if (str[i] != tr::dash)
                        return false;
                    ++i;
                    continue;
                }
                uint8_t high = impl::hex_digits::decode(str[i]);
                uint8_t low = impl::hex_digits::decode(str[i + 1]);
                if (high == impl::hex_digits::invalid || low == impl::hex_digits::invalid)
                    return false;
                dest[byte_idx++] = uint8_t((high << 4) | low);
                i += 2;
            }
            return true;
        }

        template<impl::char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str) noexcept {
            using tr = impl::uuid_char_traits<T>;

            size_t byte_idx = 0;
            for (size_t i = 0; i < uuid::char_length; ) {
                if (is_dash_position(i)) {
                    str[i++] = tr::dash;
                    continue;
                }
                str[i++] = impl::hex_digits::encode<T>(uint8_t(src[byte_idx] >> 4));
                str[i++] = impl::hex_digits::encode<T>(uint8_t(src[byte_idx] & 0x0F));
                ++byte_idx;
            }
        }

    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a Nil UUID
        constexpr uuid() noexcept = default;

        ///Constructs uuid from a string literal
        template<impl::char_like T>
        consteval uuid(const T (&src)[uuid::char_length + 1]) noexcept {
            if (!uuid::read(src, this->bytes) || src[uuid::char_length] != 0)
                impl::invalid_constexpr_call("invalid uuid string");
        }

        /// Constructs uuid from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr uuid(std::span<Byte, 16> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.begin(), [](Byte b) { return uint8_t(b); });
        }

        /// Constructs uuid from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr uuid(const T & src) noexcept:
            uuid{std::span{src}}
        {}

        constexpr friend auto operator==(const uuid & lhs, const uuid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const uuid & lhs, const uuid & rhs) noexcept -> std::strong_ordering = default;

        /// Parses uuid from a span of characters
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<uuid> from_chars(std::span<const T, Extent> src) noexcept {
            if (src.size() != uuid::char_length)
                return std::nullopt;
            uuid ret;
            if (!uuid::read(src.data(), ret.bytes))
                return std::nullopt;
            return ret;
        }

        /// Parses uuid from anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_chars(const T & src) noexcept
            { return uuid::from_chars(std::span{src}); }

        /// Returns a character array with formatted uuid
        template<impl::char_like T = char>
        constexpr auto to_chars() const noexcept -> std::array<T, uuid::char_length> {
            std::array<T, uuid::char_length> ret;
            uuid::write(this->bytes, ret.data());
            return ret;
        }

        /// Returns a string with formatted uuid
        template<impl::char_like T = char>
        auto to_string() const -> std::basic_string<T> {
            auto buf = this->to_chars<T>();
            return std::basic_string<T>(buf.begin(), buf.end());
        }

        /// Prints uuid into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const uuid val) {
            auto buf = val.to_chars<T>();
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Returns hash code for the uuid
        friend constexpr size_t hash_value(const uuid & val) noexcept {
            static_assert(sizeof(uuid) > sizeof(size_t) && sizeof(uuid) % sizeof(size_t) == 0);
            size_t temp;
            const uint8_t * data = val.bytes.data();
            size_t ret = 0;
            for(unsigned i = 0; i < sizeof(uuid) / sizeof(size_t); ++i) {
                memcpy(&temp, data, sizeof(size_t));
                ret = impl::hash_combine(ret, temp);
                data += sizeof(size_t);
            }
            return ret;
        }
    };

    static_assert(sizeof(uuid) == 16);
}

/// std::hash specialization for uuid
template<>
struct std::hash<mulid::uuid> {

    size_t operator()(const mulid::uuid & val) const noexcept {
        return hash_value(val);
    }
};

#endif
