/**
 * @file chunk.hh
 * @brief A single PNG chunk record
 *
 * On-wire layout, all integers big-endian:
 *
 *     offset 0      4 bytes   payload length L
 *     offset 4      4 bytes   chunk type
 *     offset 8      L bytes   payload
 *     offset 8+L    4 bytes   CRC-32 over bytes [4, 8+L)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable chunk type plus payload
     *
     * Length and CRC are derived from the type and payload on every call.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_field_size = 4;
        static constexpr std::size_t type_field_size = 4;
        static constexpr std::size_t crc_field_size = 4;
        static constexpr std::size_t header_size = length_field_size + type_field_size;
        static constexpr std::size_t metadata_size = header_size + crc_field_size;

        /**
         * @brief Create a chunk, taking ownership of the payload
         *
         * The type is not validated; decode() is where invalid types are rejected.
         */
        chunk(chunk_type type, std::vector<std::uint8_t> data);

        // Payload copied from text bytes
        chunk(chunk_type type, std::string_view text);

        /**
         * @brief Decode one record from the front of a buffer
         * @param data Start of the record
         * @param size Bytes available at data
         * @param options Decoding options
         * @return The decoded chunk; record_size() tells how many bytes it used
         * @throws truncated_input_error if size is smaller than the declared record
         * @throws invalid_chunk_type_error if the type fails chunk_type::is_valid()
         * @throws checksum_mismatch_error if the embedded CRC is wrong
         * @throws parse_error (invalid_length) if the length exceeds options.max_chunk_size
         *
         * Bytes past the end of the record are ignored.
         */
        static chunk decode(const void* data, std::size_t size, const decode_options& options = {});

        static chunk decode(const std::vector<std::uint8_t>& buffer, const decode_options& options = {});

        /// Payload byte count
        [[nodiscard]] std::size_t length() const noexcept { return m_data.size(); }

        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }

        [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return m_data; }

        /**
         * @brief Payload as UTF-8 text
         * @throws encoding_error if the payload is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// CRC-32 over the type bytes followed by the payload
        [[nodiscard]] std::uint32_t crc() const;

        /**
         * @brief Serialize to the on-wire layout
         * @throws parse_error (invalid_length) if the payload does not fit the 32-bit length field
         */
        [[nodiscard]] std::vector<std::uint8_t> as_bytes() const;

        /// Size of the serialized record, metadata_size + length()
        [[nodiscard]] std::size_t record_size() const noexcept { return metadata_size + m_data.size(); }

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::uint8_t> m_data;
    };

    // Writes "<type> (<length> bytes, crc 0x<crc>)"
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
