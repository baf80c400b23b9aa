// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_CROCKFORD_H_INCLUDED
#define HEADER_MODERN_ULID_CROCKFORD_H_INCLUDED

#include <modern-ulid/common.h>
#include <modern-ulid/error.h>

namespace mulid {

    /// How to treat visually ambiguous letters when decoding
    enum class decode_mode {
        /// I, i, L, l decode as 1 and O, o decode as 0
        lenient,
        /// I, i, L, l, O, o are invalid characters
        strict
    };

    namespace impl {
        template<char_like C> struct crockford_char_traits {
            static constexpr unsigned max = 128;

            static constexpr C i = C(u8'i');
            static constexpr C I = C(u8'I');
            static constexpr C o = C(u8'o');
            static constexpr C O = C(u8'O');
            static constexpr C l = C(u8'l');
            static constexpr C L = C(u8'L');
            static constexpr C u = C(u8'u');
            static constexpr C d = C(u8'd');
            static constexpr C cl_br = C(u8'}');
        };

        template<> struct crockford_char_traits<char> {
            static constexpr unsigned max = ('a' == u8'a' ? 128 : 256);

            static constexpr char i = 'i';
            static constexpr char I = 'I';
            static constexpr char o = 'o';
            static constexpr char O = 'O';
            static constexpr char l = 'l';
            static constexpr char L = 'L';
            static constexpr char u = 'u';
            static constexpr char d = 'd';
            static constexpr char cl_br = '}';
        };

        template<> struct crockford_char_traits<wchar_t> {
            static constexpr unsigned max = (L'a' == u8'a' ? 128 : 256);

            static constexpr wchar_t i = L'i';
            static constexpr wchar_t I = L'I';
            static constexpr wchar_t o = L'o';
            static constexpr wchar_t O = L'O';
            static constexpr wchar_t l = L'l';
            static constexpr wchar_t L = L'L';
            static constexpr wchar_t u = L'u';
            static constexpr wchar_t d = L'd';
            static constexpr wchar_t cl_br = L'}';
        };

        //lowercase half followed by uppercase half
        #define MULID_CROCKFORD_ALPHABET(...) \
                __VA_ARGS__##"0123456789abcdefghjkmnpqrstvwxyz" \
                __VA_ARGS__##"0123456789ABCDEFGHJKMNPQRSTVWXYZ"

        template<class C, size_t N>
        consteval auto make_crockford_decode_table(const C (&chars)[N], decode_mode mode) {
            using tr = crockford_char_traits<C>;
            constexpr uint8_t half = uint8_t((N - 1) / 2);

            std::array<uint8_t, tr::max> ret;
            ret.fill(half);
            for (size_t idx = 0; idx < N - 1; ++idx)
                ret[unsigned(chars[idx])] = uint8_t(idx % half);
            if (mode == decode_mode::lenient) {
                ret[unsigned(tr::i)] = 1;
                ret[unsigned(tr::I)] = 1;
                ret[unsigned(tr::l)] = 1;
                ret[unsigned(tr::L)] = 1;
                ret[unsigned(tr::o)] = 0;
                ret[unsigned(tr::O)] = 0;
            }
            return ret;
        }

        class crockford_alphabet {
        private:
            static constexpr const char narrow[] = MULID_CROCKFORD_ALPHABET();
            static constexpr const wchar_t wide[] = MULID_CROCKFORD_ALPHABET(L);
            static constexpr const char8_t utf[] = MULID_CROCKFORD_ALPHABET(u8);

            static constexpr auto lenient_narrow = make_crockford_decode_table(narrow, decode_mode::lenient);
            static constexpr auto lenient_wide = make_crockford_decode_table(wide, decode_mode::lenient);
            static constexpr auto lenient_utf = make_crockford_decode_table(utf, decode_mode::lenient);

            static constexpr auto strict_narrow = make_crockford_decode_table(narrow, decode_mode::strict);
            static constexpr auto strict_wide = make_crockford_decode_table(wide, decode_mode::strict);
            static constexpr auto strict_utf = make_crockford_decode_table(utf, decode_mode::strict);

            template<class C>
            static constexpr bool is_utf = std::is_same_v<C, char32_t> ||
                                           std::is_same_v<C, char16_t> ||
                                           std::is_same_v<C, char8_t> ||
                                           (std::is_same_v<C, wchar_t> && L'a' == u8'a') ||
                                           (std::is_same_v<C, char> && 'a' == u8'a');

            template<size_t M>
            static constexpr uint8_t lookup(const std::array<uint8_t, M> & table, unsigned c) noexcept {
                if (c >= M)
                    return size;
                return table[c];
            }

        public:
            /// Number of symbols
            static constexpr uint8_t size = uint8_t((std::size(utf) - 1) / 2);
            /// Number of bits encoded by one symbol
            static constexpr size_t bits_per_char = ct_log2<size>::value;

        public:
            template<impl::char_like C>
            static constexpr C encode(bool uppercase, uint8_t idx) noexcept {
                auto real_idx = idx + (size_t(uppercase) << bits_per_char);

                if constexpr (is_utf<C>) {
                    return C(utf[real_idx]);
                } else if constexpr (std::is_same_v<C, wchar_t>) {
                    return wide[real_idx];
                } else {
                    return narrow[real_idx];
                }
            }

            /// Returns symbol value or size if c is not a valid symbol
            template<impl::char_like C>
            static constexpr uint8_t decode(C c, decode_mode mode) noexcept {
                using unsigned_c = std::make_unsigned_t<C>;
                const unsigned val = unsigned(unsigned_c(c));

                if constexpr (is_utf<C>) {
                    return lookup(mode == decode_mode::strict ? strict_utf : lenient_utf, val);
                } else if constexpr (std::is_same_v<C, wchar_t>) {
                    return lookup(mode == decode_mode::strict ? strict_wide : lenient_wide, val);
                } else {
                    return lookup(mode == decode_mode::strict ? strict_narrow : lenient_narrow, val);
                }
            }
        };

        constexpr unsigned crockford_shift(size_t char_idx) noexcept {
            return unsigned(5 * (25 - char_idx));
        }

        constexpr uint8_t crockford_extract(uint64_t high, uint64_t low, unsigned shift) noexcept {
            if (shift >= 64)
                return uint8_t((high >> (shift - 64)) & 0x1F);
            if (shift == 0)
                return uint8_t(low & 0x1F);
            return uint8_t(((high << (64 - shift)) | (low >> shift)) & 0x1F);
        }

        #undef MULID_CROCKFORD_ALPHABET
    }

    /**
     * Crockford base32 codec for 128-bit values held as two 64-bit words
     *
     * The value is split into 26 groups of 5 bits, most significant first.
     * The first group only carries the top 3 bits.
     */
    namespace crockford {

        /// Number of characters in an encoded 128-bit value
        constexpr size_t encoded_length = 26;

        /// Largest value the leading character may encode
        constexpr uint8_t max_leading_value = 7;

        /// Writes exactly encoded_length characters to str
        template<impl::char_like T>
        constexpr void encode(uint64_t high, uint64_t low, T * str, bool uppercase = true) noexcept {
            using alphabet = impl::crockford_alphabet;

            for (size_t i = 0; i < encoded_length; ++i)
                str[i] = alphabet::encode<T>(uppercase, impl::crockford_extract(high, low, impl::crockford_shift(i)));
        }

        /**
         * Decodes size characters at str into high and low
         *
         * high and low are only modified on success
         */
        template<impl::char_like T>
        constexpr auto decode(const T * str, size_t size, uint64_t & high, uint64_t & low,
                              decode_mode mode = decode_mode::lenient) noexcept -> decode_result {
            using alphabet = impl::crockford_alphabet;

            if (size != encoded_length)
                return {ulid_errc::invalid_length, 0};

            uint8_t val = alphabet::decode(str[0], mode);
            if (val >= alphabet::size)
                return {ulid_errc::invalid_char, 0};
            if (val > max_leading_value)
                return {ulid_errc::data_type_overflow, 0};

            uint64_t hi = 0;
            uint64_t lo = val;
            for (size_t i = 1; i < encoded_length; ++i) {
                val = alphabet::decode(str[i], mode);
                if (val >= alphabet::size)
                    return {ulid_errc::invalid_char, i};
                hi = (hi << alphabet::bits_per_char) | (lo >> (64 - alphabet::bits_per_char));
                lo = (lo << alphabet::bits_per_char) | val;
            }
            high = hi;
            low = lo;
            return {};
        }
    }
}

#endif
