/**
 * @file chunk_type.hh
 * @brief Four-letter chunk type code with case-encoded property flags
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <ostream>

#include <pngme/export_pngme.h>
#include <pngme/exceptions.hh>

namespace pngme {

    /**
     * @brief Test whether a byte is an ASCII letter (A-Z or a-z)
     */
    constexpr bool is_ascii_alpha(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    constexpr bool is_ascii_upper(char c) {
        return c >= 'A' && c <= 'Z';
    }

    constexpr bool is_ascii_lower(char c) {
        return c >= 'a' && c <= 'z';
    }

    class chunk_type;
    constexpr chunk_type operator""_type(const char* str, std::size_t len);

    /**
     * @class chunk_type
     * @brief Immutable 4-byte chunk identifier
     *
     * Every byte is an ASCII letter. Bit 5 of each byte (the letter case)
     * encodes one property flag:
     *   - byte 0 uppercase: critical (decoders must understand the chunk)
     *   - byte 1 uppercase: public (registered type)
     *   - byte 2 uppercase: reserved bit valid
     *   - byte 3 lowercase: safe to copy when the file is edited
     *
     * Values can only be obtained through the validating factories, so a
     * chunk_type object always holds four letters.
     */
    class PNGME_EXPORT chunk_type {
    public:
        /**
         * @brief Construct from 4 raw bytes
         * @param bytes Type code bytes
         * @throws invalid_type_code if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes);

        /**
         * @brief Construct from 4 raw bytes at the given address
         * @param data Pointer to at least 4 readable bytes
         * @throws invalid_type_code if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Construct from text
         * @param text Exactly 4 bytes of ASCII letters
         * @throws invalid_type_code on wrong byte length or non-letter bytes
         */
        static chunk_type from_string(std::string_view text);

        // Raw code
        [[nodiscard]] std::array<std::uint8_t, 4> bytes() const {
            std::array<std::uint8_t, 4> out{};
            std::memcpy(out.data(), m_code.data(), 4);
            return out;
        }

        [[nodiscard]] constexpr bool is_critical() const { return is_ascii_upper(m_code[0]); }
        [[nodiscard]] constexpr bool is_public() const { return is_ascii_upper(m_code[1]); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_ascii_upper(m_code[2]); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return is_ascii_lower(m_code[3]); }

        // Letters are guaranteed by construction, only the reserved bit can fail
        [[nodiscard]] constexpr bool is_valid() const { return is_reserved_bit_valid(); }

        [[nodiscard]] std::string to_string() const {
            return {m_code.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {m_code.data(), 4};
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_code.data(), 4);
        }

        [[nodiscard]] std::uint32_t to_uint32() const {
            std::uint32_t result;
            std::memcpy(&result, m_code.data(), 4);
            return result;
        }

        constexpr char operator[](std::size_t i) const { return m_code[i]; }

        [[nodiscard]] constexpr auto begin() const { return m_code.begin(); }
        [[nodiscard]] constexpr auto end() const { return m_code.end(); }

        // Comparison is byte-for-byte, case included
        bool operator==(const chunk_type& o) const { return m_code == o.m_code; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_code < o.m_code; }

        bool operator==(std::string_view text) const { return to_string_view() == text; }
        bool operator!=(std::string_view text) const { return !(*this == text); }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os.write(t.m_code.data(), 4);
        }

    private:
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_code{c0, c1, c2, c3} {}

        friend constexpr chunk_type operator""_type(const char* str, std::size_t len);

        std::array<char, 4> m_code;
    };

    /**
     * @brief User-defined literal for well-known chunk types
     *
     * "IEND"_type is validated like from_string(); an invalid literal used
     * in a constant expression fails to compile.
     */
    constexpr chunk_type operator""_type(const char* str, std::size_t len) {
        if (len != 4) {
            throw invalid_type_code("Chunk type literal must be exactly 4 characters");
        }
        for (std::size_t i = 0; i < 4; i++) {
            if (!is_ascii_alpha(str[i])) {
                throw invalid_type_code("Chunk type literal must contain only ASCII letters");
            }
        }
        return {str[0], str[1], str[2], str[3]};
    }

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngme

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
