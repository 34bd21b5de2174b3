//
// Chunk type parsing and rendering
//

#include <pngchunk/chunk_type.hh>

#include <algorithm>
#include <ostream>

namespace pngchunk {

    chunk_type chunk_type::parse(std::string_view text) {
        if (text.size() != size) {
            throw invalid_format_error(build_error_msg(
                "Invalid chunk type length: expected 4 characters, got ", text.size()));
        }

        bytes_type bytes;
        for (std::size_t i = 0; i < size; ++i) {
            const auto c = static_cast<std::uint8_t>(text[i]);
            if (!is_letter(c)) {
                throw invalid_format_error(build_error_msg(
                    "Invalid chunk type character at position ", i,
                    ": chunk types consist of ASCII letters only"));
            }
            bytes[i] = c;
        }
        return chunk_type(bytes);
    }

    bool chunk_type::is_valid() const noexcept {
        return std::all_of(m_bytes.begin(), m_bytes.end(), is_letter) && is_reserved_bit_valid();
    }

    bool chunk_type::is_printable() const noexcept {
        return std::all_of(m_bytes.begin(), m_bytes.end(), [](std::uint8_t c) {
            return c >= 32 && c <= 126;
        });
    }

    std::string chunk_type::to_string() const {
        static constexpr char hex_digits[] = "0123456789abcdef";

        std::string result;
        result.reserve(size);
        for (std::uint8_t c : m_bytes) {
            if (c >= 32 && c <= 126) {
                result += static_cast<char>(c);
            } else {
                // Escape non-printable bytes
                result += "\\x";
                result += hex_digits[c >> 4];
                result += hex_digits[c & 0x0F];
            }
        }
        return result;
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os << t.to_string();
    }

} // namespace pngchunk
