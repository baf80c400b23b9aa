// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_ULID_H_INCLUDED
#define HEADER_MODERN_ULID_ULID_H_INCLUDED

#include <modern-ulid/common.h>
#include <modern-ulid/error.h>
#include <modern-ulid/crockford.h>
#include <modern-ulid/uuid.h>

namespace mulid {

    namespace impl {
        template<class T>
        concept char_range = !is_span<T> && requires(const T & x) {
            std::span{x};
            requires char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        };

        template<class T>
        concept byte_range = !is_span<T> && requires(const T & x) {
            std::span{x};
            requires byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        };

        //String literals carry a terminating NUL which is not part of the text
        template<char_range T>
        constexpr auto text_span(const T & src) noexcept {
            using C = std::remove_cvref_t<decltype(*std::span{src}.begin())>;
            std::span<const C> ret = std::span{src};
            if constexpr (std::is_array_v<T>) {
                if (!ret.empty() && ret.back() == C(0))
                    ret = ret.first(ret.size() - 1);
            }
            return ret;
        }

        /// Maximum number of decimal digits in a 128-bit unsigned value
        constexpr size_t max_decimal_length = 39;

        /// Writes the decimal form of high:low to str and returns the number of characters written
        template<char_like C>
        constexpr size_t write_decimal(uint64_t high, uint64_t low, C * str) noexcept {
            uint32_t limbs[4] = {uint32_t(high >> 32), uint32_t(high), uint32_t(low >> 32), uint32_t(low)};
            C buf[max_decimal_length] = {};
            size_t count = 0;
            do {
                uint64_t rem = 0;
                for (auto & limb: limbs) {
                    uint64_t cur = (rem << 32) | limb;
                    limb = uint32_t(cur / 10);
                    rem = cur % 10;
                }
                buf[count++] = C(u8'0' + rem);
            } while ((limbs[0] | limbs[1] | limbs[2] | limbs[3]) != 0);

            for (size_t i = 0; i < count; ++i)
                str[i] = buf[count - 1 - i];
            return count;
        }
    }

    /**
     * Universally Unique Lexicographically Sortable Identifier
     *
     * Stored as 16 big-endian bytes: a 48-bit millisecond Unix timestamp
     * followed by 80 bits of randomness. Comparison is by raw 128-bit magnitude
     * so the timestamp dominates.
     */
    class ulid {
    public:
        /// Formatting case
        enum format {
            lowercase,
            uppercase
        };

        /// Number of characters in string representation of ULID
        static constexpr size_t char_length = crockford::encoded_length;
        /// Number of bytes in binary representation of ULID
        static constexpr size_t byte_length = 16;
        /// Number of random bytes
        static constexpr size_t random_length = 10;
        /// Largest timestamp a ULID can carry
        static constexpr uint64_t max_timestamp = 0xFFFF'FFFF'FFFF;

        /// Timestamp as a time point
        using time_point = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    private:
        constexpr void assign(uint64_t msb, uint64_t lsb) noexcept {
            impl::write_bytes(msb, this->bytes.data());
            impl::write_bytes(lsb, this->bytes.data() + 8);
        }

        static auto make_unchecked(uint64_t timestamp, std::span<const uint8_t, random_length> random) noexcept -> ulid {
            ulid ret;
            impl::write_bytes<6>(timestamp, ret.bytes.data());
            std::copy(random.begin(), random.end(), ret.bytes.begin() + 6);
            return ret;
        }

    public:
        std::array<uint8_t, byte_length> bytes{};

    public:
        ///Constructs a Nil ULID
        constexpr ulid() noexcept = default;

        ///Constructs ulid from a string literal
        template<impl::char_like T>
        consteval ulid(const T (&src)[ulid::char_length + 1]) noexcept {
            uint64_t high = 0, low = 0;
            if (!crockford::decode(src, ulid::char_length, high, low) || src[ulid::char_length] != 0)
                impl::invalid_constexpr_call("invalid ulid string");
            this->assign(high, low);
        }

        /// Constructs ulid from a span of 16 byte-like objects in big-endian order
        template<impl::byte_like Byte>
        constexpr ulid(std::span<Byte, byte_length> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.begin(), [](Byte b) { return uint8_t(b); });
        }

        /// Constructs ulid from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr ulid(const T & src) noexcept:
            ulid{std::span{src}}
        {}

        /// Constructs ulid from the most and least significant 64-bit words
        constexpr ulid(uint64_t msb, uint64_t lsb) noexcept {
            this->assign(msb, lsb);
        }

        /// Reinterprets the bytes of a UUID as a ulid
        constexpr explicit ulid(const uuid & src) noexcept:
            bytes(src.bytes)
        {}

        /**
         * Creates ulid from a timestamp and 10 random bytes
         *
         * Reports ulid_errc::timestamp_overflow if timestamp exceeds max_timestamp
         */
        static auto make(uint64_t timestamp, std::span<const uint8_t, random_length> random,
                         std::error_code & ec) noexcept -> ulid {
            if (timestamp > ulid::max_timestamp) {
                ec = ulid_errc::timestamp_overflow;
                return {};
            }
            ec.clear();
            return ulid::make_unchecked(timestamp, random);
        }

        /// Creates ulid from a timestamp and 10 random bytes, throwing ulid_error on failure
        static auto make(uint64_t timestamp, std::span<const uint8_t, random_length> random) -> ulid {
            std::error_code ec;
            auto ret = ulid::make(timestamp, random, ec);
            if (ec)
                impl::raise_error(ec);
            return ret;
        }

        /**
         * Generates a ULID
         *
         * Uses a per-thread generator. ULIDs generated by the same thread within
         * the same millisecond are monotonically increasing.
         */
        MULID_EXPORTED static auto generate() -> ulid;

        /// Returns a Max ULID
        static constexpr ulid max() noexcept
            { return ulid("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"); }

        /// Resets the object to a Nil ULID
        constexpr void clear() noexcept {
            *this = ulid();
        }

        constexpr friend auto operator==(const ulid & lhs, const ulid & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const ulid & lhs, const ulid & rhs) noexcept -> std::strong_ordering = default;

        constexpr auto most_significant_bits() const noexcept -> uint64_t {
            uint64_t ret;
            impl::read_bytes(this->bytes.data(), ret);
            return ret;
        }

        constexpr auto least_significant_bits() const noexcept -> uint64_t {
            uint64_t ret;
            impl::read_bytes(this->bytes.data() + 8, ret);
            return ret;
        }

        /// Milliseconds since Unix epoch
        constexpr auto timestamp_millis() const noexcept -> uint64_t
            { return this->most_significant_bits() >> 16; }

        constexpr auto timestamp() const noexcept -> time_point
            { return time_point(std::chrono::milliseconds(int64_t(this->timestamp_millis()))); }

        constexpr auto random_bytes() const noexcept -> std::span<const uint8_t, random_length>
            { return std::span<const uint8_t, byte_length>(this->bytes).subspan<6>(); }

        /**
         * Returns ulid with the random part incremented by one
         *
         * The carry propagates from the low word into the random bits of the
         * high word. Returns std::nullopt if all 80 random bits are set.
         * The timestamp is never modified.
         */
        constexpr auto increment() const noexcept -> std::optional<ulid> {
            uint64_t msb = this->most_significant_bits();
            uint64_t lsb = this->least_significant_bits();
            if (lsb != std::numeric_limits<uint64_t>::max())
                return ulid(msb, lsb + 1);
            if ((msb & 0xFFFF) == 0xFFFF)
                return std::nullopt;
            return ulid(msb + 1, 0);
        }

        /// Reinterprets the bytes as a UUID
        constexpr auto to_uuid() const noexcept -> uuid {
            uuid ret;
            ret.bytes = this->bytes;
            return ret;
        }

        /// Returns the 16 bytes in the requested order
        constexpr auto to_bytes(byte_order order = byte_order::big) const noexcept -> std::array<uint8_t, byte_length> {
            auto ret = this->bytes;
            if (order == byte_order::little)
                std::reverse(ret.begin(), ret.end());
            return ret;
        }

        /// Constructs ulid from exactly 16 bytes in the given order
        template<impl::byte_like Byte>
        static constexpr auto from_bytes(std::span<Byte, byte_length> src, byte_order order = byte_order::big) noexcept -> ulid {
            ulid ret(src);
            if (order == byte_order::little)
                std::reverse(ret.bytes.begin(), ret.bytes.end());
            return ret;
        }

        /**
         * Constructs ulid from a span of bytes in the given order
         *
         * Reports ulid_errc::invalid_byte_array unless the span is exactly 16 bytes long
         */
        template<impl::byte_like Byte>
        static auto from_bytes(std::span<Byte> src, byte_order order, std::error_code & ec) noexcept -> ulid {
            if (src.size() != byte_length) {
                ec = ulid_errc::invalid_byte_array;
                return {};
            }
            ec.clear();
            return ulid::from_bytes(src.template first<byte_length>(), order);
        }

        template<impl::byte_like Byte>
        static auto from_bytes(std::span<Byte> src, byte_order order = byte_order::big) -> ulid {
            std::error_code ec;
            auto ret = ulid::from_bytes(src, order, ec);
            if (ec)
                impl::raise_error(ec);
            return ret;
        }

        /// Constructs ulid from anything convertible to a span of bytes
        template<impl::byte_range T>
        static auto from_bytes(const T & src, byte_order order, std::error_code & ec) noexcept -> ulid {
            using Byte = std::remove_reference_t<decltype(*std::span{src}.begin())>;
            return ulid::from_bytes(std::span<Byte>(std::span{src}), order, ec);
        }

        template<impl::byte_range T>
        static auto from_bytes(const T & src, byte_order order = byte_order::big) -> ulid {
            using Byte = std::remove_reference_t<decltype(*std::span{src}.begin())>;
            return ulid::from_bytes(std::span<Byte>(std::span{src}), order);
        }

        /**
         * Parses ulid from a span of characters
         *
         * The span must be exactly 26 characters long. On failure dest is
         * unchanged and the result describes the error.
         */
        template<impl::char_like T, size_t Extent>
        static constexpr auto parse(std::span<const T, Extent> src, ulid & dest,
                                    decode_mode mode = decode_mode::lenient) noexcept -> decode_result {
            uint64_t high = 0, low = 0;
            auto res = crockford::decode(src.data(), src.size(), high, low, mode);
            if (res)
                dest.assign(high, low);
            return res;
        }

        /// Parses ulid from anything convertible to a span of characters
        template<impl::char_range T>
        static constexpr auto parse(const T & src, ulid & dest,
                                    decode_mode mode = decode_mode::lenient) noexcept -> decode_result
            { return ulid::parse(impl::text_span(src), dest, mode); }

        /// Parses ulid from a span of characters
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<ulid> from_chars(std::span<const T, Extent> src,
                                                        decode_mode mode = decode_mode::lenient) noexcept {
            ulid ret;
            if (!ulid::parse(src, ret, mode))
                return std::nullopt;
            return ret;
        }

        /// Parses ulid from anything convertible to a span of characters
        template<impl::char_range T>
        static constexpr auto from_chars(const T & src, decode_mode mode = decode_mode::lenient) noexcept
            { return ulid::from_chars(impl::text_span(src), mode); }

        /// Parses ulid from a span of characters, throwing ulid_error on failure
        template<impl::char_like T, size_t Extent>
        static auto from_string(std::span<const T, Extent> src, decode_mode mode = decode_mode::lenient) -> ulid {
            ulid ret;
            if (auto res = ulid::parse(src, ret, mode); !res) {
                char32_t offending = (res.ec == ulid_errc::invalid_char ? char32_t(std::make_unsigned_t<T>(src[res.position])) : 0);
                impl::raise_decode_error(res, offending);
            }
            return ret;
        }

        template<impl::char_range T>
        static auto from_string(const T & src, decode_mode mode = decode_mode::lenient) -> ulid
            { return ulid::from_string(impl::text_span(src), mode); }

        /// Formats ulid into a span of characters
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<T, Extent> dest, format fmt = ulid::uppercase) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < ulid::char_length)
                    return false;
            } else {
                static_assert(Extent >= ulid::char_length, "destination is too small");
            }

            crockford::encode(this->most_significant_bits(), this->least_significant_bits(),
                              dest.data(), fmt == ulid::uppercase);

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats ulid into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto to_chars(T & dest, format fmt = ulid::uppercase) const noexcept {
            return this->to_chars(std::span{dest}, fmt);
        }

        /// Returns a character array with formatted ulid
        template<impl::char_like T = char>
        constexpr auto to_chars(format fmt = ulid::uppercase) const noexcept -> std::array<T, ulid::char_length> {
            std::array<T, ulid::char_length> ret;
            this->to_chars(ret, fmt);
            return ret;
        }


        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted ulid
        auto to_string(format fmt = ulid::uppercase) const -> std::basic_string<T>
        {
            std::basic_string<T> ret(ulid::char_length, T(0));
            (void)to_chars(ret, fmt);
            return ret;
        }

        /// Prints canonical (uppercase) ulid into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const ulid val) {
            std::array<T, ulid::char_length> buf;
            val.to_chars(buf);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Reads ulid from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, ulid & val) {
            std::array<T, ulid::char_length> buf;
            auto * strbuf = str.rdbuf();
            for(T & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<T>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = T(res);
            }
            if (auto maybe_val = ulid::from_chars(buf))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the ulid
        friend constexpr size_t hash_value(const ulid & val) noexcept {
            static_assert(sizeof(ulid) > sizeof(size_t) && sizeof(ulid) % sizeof(size_t) == 0);
            size_t temp;
            const uint8_t * data = val.bytes.data();
            size_t ret = 0;
            for(unsigned i = 0; i < sizeof(ulid) / sizeof(size_t); ++i) {
                memcpy(&temp, data, sizeof(size_t));
                ret = impl::hash_combine(ret, temp);
                data += sizeof(size_t);
            }
            return ret;
        }
    };

    static_assert(sizeof(ulid) == 16);
    static_assert(std::is_trivially_copyable_v<ulid>);

    namespace impl {
        template<class Derived, class CharT>
        struct ulid_formatter_base {
            ulid::format fmt = ulid::uppercase;
            bool decimal = false;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                using tr = crockford_char_traits<CharT>;

                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == tr::l) {
                        this->fmt = ulid::lowercase; ++it;
                    } else if (*it == tr::u) {
                        this->fmt = ulid::uppercase; ++it;
                    } else if (*it == tr::d) {
                        this->decimal = true; ++it;
                    } else if (*it == tr::cl_br) {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(ulid val, FormatContext & ctx) const -> decltype(ctx.out())  {
                if (this->decimal) {
                    std::array<CharT, max_decimal_length> buf;
                    size_t len = write_decimal(val.most_significant_bits(), val.least_significant_bits(), buf.data());
                    return std::copy(buf.begin(), buf.begin() + len, ctx.out());
                }
                std::array<CharT, ulid::char_length> buf;
                val.to_chars(buf, this->fmt);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for ulid
template<>
struct std::hash<mulid::ulid> {

    size_t operator()(const mulid::ulid & val) const noexcept {
        return hash_value(val);
    }
};


#if MULID_SUPPORTS_STD_FORMAT

/// ulid formatter for std::format
template<class CharT>
struct std::formatter<::mulid::ulid, CharT> :
    public ::mulid::impl::ulid_formatter_base<std::formatter<::mulid::ulid, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MULID_THROW(std::format_error(message));
    }
};

#endif

#if MULID_SUPPORTS_FMT_FORMAT

/// ulid formatter for fmt::format
template<class CharT>
struct fmt::formatter<::mulid::ulid, CharT> :
    public ::mulid::impl::ulid_formatter_base<fmt::formatter<::mulid::ulid, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
