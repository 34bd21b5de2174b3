//
// Chunk record encoding and decoding
//

#include <pngchunk/chunk.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <optional>
#include <ostream>
#include <utility>

#include "record_checks.hh"

namespace pngchunk {

    namespace {
        // Offset of the first byte that does not start a well-formed UTF-8
        // sequence (RFC 3629: no overlong forms, no surrogates, max U+10FFFF)
        std::optional<std::size_t> find_invalid_utf8(const std::uint8_t* p, std::size_t n) {
            std::size_t i = 0;
            while (i < n) {
                const std::uint8_t c = p[i];
                if (c < 0x80) {
                    ++i;
                    continue;
                }

                std::size_t extra;
                std::uint8_t lo = 0x80;
                std::uint8_t hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) {
                    extra = 1;
                } else if (c == 0xE0) {
                    extra = 2;
                    lo = 0xA0;
                } else if (c == 0xED) {
                    extra = 2;
                    hi = 0x9F;
                } else if (c >= 0xE1 && c <= 0xEF) {
                    extra = 2;
                } else if (c == 0xF0) {
                    extra = 3;
                    lo = 0x90;
                } else if (c >= 0xF1 && c <= 0xF3) {
                    extra = 3;
                } else if (c == 0xF4) {
                    extra = 3;
                    hi = 0x8F;
                } else {
                    return i;
                }

                if (n - i <= extra) {
                    return i;
                }
                if (p[i + 1] < lo || p[i + 1] > hi) {
                    return i;
                }
                for (std::size_t k = 2; k <= extra; ++k) {
                    if (p[i + k] < 0x80 || p[i + k] > 0xBF) {
                        return i;
                    }
                }
                i += extra + 1;
            }
            return std::nullopt;
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
        : m_type(type), m_data(std::move(data)) {}

    chunk::chunk(chunk_type type, std::string_view text)
        : m_type(type), m_data(text.begin(), text.end()) {}

    chunk chunk::decode(const void* data, std::size_t size, const decode_options& options) {
        if (size < header_size) {
            throw truncated_input_error(header_size, size, build_error_msg(
                "Truncated chunk header: need ", header_size, " bytes, got ", size));
        }

        const auto* bytes = static_cast<const std::uint8_t*>(data);
        const std::uint32_t length = load_be32(bytes);
        const chunk_type type = chunk_type::from_bytes(bytes + length_field_size);

        detail::check_length(0, type, length, options);
        detail::check_type(0, type, options);

        // Compare without forming header_size + length + crc_field_size, which may not fit
        if (size - header_size < length || size - header_size - length < crc_field_size) {
            const std::uint64_t needed = std::uint64_t(metadata_size) + length;
            throw truncated_input_error(static_cast<std::size_t>(needed), size, build_error_msg(
                "Truncated chunk '", type, "': declares ", length, " payload bytes, need ",
                needed, " bytes, got ", size));
        }

        const std::uint8_t* payload = bytes + header_size;
        chunk result(type, std::vector<std::uint8_t>(payload, payload + length));

        detail::check_crc(0, result, load_be32(payload + length), options);

        if (size > result.record_size()) {
            detail::warn(options, 0, "trailing_data", build_error_msg(
                "Ignoring ", size - result.record_size(), " bytes after chunk '", type, "'"));
        }
        return result;
    }

    chunk chunk::decode(const std::vector<std::uint8_t>& buffer, const decode_options& options) {
        return decode(buffer.data(), buffer.size(), options);
    }

    std::string chunk::data_as_string() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            throw encoding_error(*bad, build_error_msg(
                "Chunk '", m_type, "' payload is not valid UTF-8: invalid sequence at offset ", *bad));
        }
        return std::string(m_data.begin(), m_data.end());
    }

    std::uint32_t chunk::crc() const {
        crc_engine engine;
        engine.update(m_type.bytes().data(), type_field_size);
        engine.update(m_data.data(), m_data.size());
        return engine.value();
    }

    std::vector<std::uint8_t> chunk::as_bytes() const {
        THROW_PARSE_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(),
                       error_kind::invalid_length,
                       "Chunk '", m_type, "' payload of ", m_data.size(),
                       " bytes does not fit the 32-bit length field");

        std::vector<std::uint8_t> out(record_size());
        store_be32(static_cast<std::uint32_t>(m_data.size()), out.data());
        m_type.to_bytes(out.data() + length_field_size);
        std::copy(m_data.begin(), m_data.end(), out.begin() + header_size);
        store_be32(crc(), out.data() + header_size + m_data.size());
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        const auto flags = os.flags();
        const auto fill = os.fill();
        os << c.type() << " (" << c.length() << " bytes, crc 0x"
           << std::hex << std::setfill('0') << std::setw(8) << c.crc() << ")";
        os.flags(flags);
        os.fill(fill);
        return os;
    }

} // namespace pngchunk
