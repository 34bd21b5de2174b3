/**
 * @file chunk_type.hh
 * @brief Four-byte PNG chunk type code
 *
 * The case of each letter carries one property bit (bit 5 of the byte):
 *
 *     bLOb  <-- 32 bit chunk type code represented in text form
 *     ||||
 *     |||+- Safe-to-copy bit is 1 (lowercase letter; bit 5 is 1)
 *     ||+-- Reserved bit is 0     (uppercase letter; bit 5 is 0)
 *     |+--- Private bit is 0      (uppercase letter; bit 5 is 0)
 *     +---- Ancillary bit is 1    (lowercase letter; bit 5 is 1)
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        static constexpr std::size_t size = 4;

        // Constructor from 4 individual bytes, always succeeds
        constexpr chunk_type(std::uint8_t b0, std::uint8_t b1, std::uint8_t b2, std::uint8_t b3)
            : m_bytes{ b0, b1, b2, b3 } {}

        constexpr explicit chunk_type(const bytes_type& bytes)
            : m_bytes(bytes) {}

        // Constructor from raw memory (exactly 4 bytes are read)
        static chunk_type from_bytes(const void* data) {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, size);
            return chunk_type(bytes);
        }

        /**
         * @brief Parse a chunk type from its text form
         * @param text Exactly 4 ASCII letters
         * @throws invalid_format_error if the length is not 4 or a character is not a letter
         *
         * Only the character set is checked: "Rust" parses although its
         * reserved bit is set, so is_valid() is false for it.
         */
        static chunk_type parse(std::string_view text);

        [[nodiscard]] constexpr const bytes_type& bytes() const noexcept { return m_bytes; }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), size);
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
        [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

        /// All bytes are ASCII letters and the reserved bit is clear
        [[nodiscard]] bool is_valid() const noexcept;

        // Ancillary bit clear
        [[nodiscard]] constexpr bool is_critical() const noexcept { return is_upper(m_bytes[0]); }

        // Private bit clear
        [[nodiscard]] constexpr bool is_public() const noexcept { return is_upper(m_bytes[1]); }

        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept { return is_upper(m_bytes[2]); }

        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept { return is_lower(m_bytes[3]); }

        // Check if contains only printable ASCII
        [[nodiscard]] bool is_printable() const noexcept;

        /**
         * @brief Render the type as text
         *
         * Printable ASCII bytes are emitted as-is. Any other byte is emitted
         * as the escape "\xNN" with two lowercase hex digits, so the result
         * is exact whenever is_printable() is true.
         */
        [[nodiscard]] std::string to_string() const;

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        static constexpr bool is_upper(std::uint8_t c) noexcept { return c >= 'A' && c <= 'Z'; }
        static constexpr bool is_lower(std::uint8_t c) noexcept { return c >= 'a' && c <= 'z'; }
        static constexpr bool is_letter(std::uint8_t c) noexcept { return is_upper(c) || is_lower(c); }

    private:
        bytes_type m_bytes;
    };

    // Stream output, same rendering as to_string()
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk types
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw invalid_format_error("Chunk type literal must be exactly 4 characters");
        }
        for (std::size_t i = 0; i < len; ++i) {
            if (!chunk_type::is_letter(static_cast<std::uint8_t>(str[i]))) {
                throw invalid_format_error("Chunk type literal must consist of ASCII letters");
            }
        }
        return {
            static_cast<std::uint8_t>(str[0]),
            static_cast<std::uint8_t>(str[1]),
            static_cast<std::uint8_t>(str[2]),
            static_cast<std::uint8_t>(str[3])
        };
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
