//
// Byte reader over a std::istream
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <array>
#include <optional>
#include <vector>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    // Reads from the stream's current position and tracks how much was consumed.
    // Short reads at end of stream are reported through return values; stream
    // failures throw io_error.
    class reader {
        public:
            explicit reader(std::istream& is);

            std::size_t read(void* dst, std::size_t size);

            // Reads up to size bytes in bounded steps, stops early at end of stream
            std::vector<std::uint8_t> read_up_to(std::size_t size);

            // Big-endian 32-bit field, nullopt at end of stream
            std::optional<std::uint32_t> read_be32();

            std::optional<chunk_type> read_chunk_type();

            // Absolute stream offset of the next byte (0-based from where reading began
            // when the stream cannot report positions)
            [[nodiscard]] std::uint64_t offset() const { return m_start + m_consumed; }

            [[nodiscard]] std::uint64_t consumed() const { return m_consumed; }

        private:
            static constexpr std::size_t block_size = 64 * 1024;

            std::istream& m_stream;
            std::uint64_t m_start;
            std::uint64_t m_consumed;
    };
}
