//
// Byte reader over a std::istream
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace pngchunk {

    reader::reader(std::istream& is)
        : m_stream(is), m_start(0), m_consumed(0) {
        THROW_IO_IF(m_stream.bad(), "Stream in bad state");
        THROW_IO_IF(m_stream.fail() && !m_stream.eof(), "Stream in failed state");

        // tellg() fails on a stream at end of file, so query it with the state cleared
        const std::ios::iostate state = m_stream.rdstate();
        m_stream.clear();
        std::streampos pos = m_stream.tellg();
        if (pos != std::streampos(-1)) {
            m_start = static_cast<std::uint64_t>(pos);
        }
        // Non-seekable streams report offsets relative to the first read
        m_stream.clear(state);
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst || size == 0, "Null buffer in read");

        if (size == 0 || m_stream.eof()) {
            return 0;
        }

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed after ", bytes_read, " of ", size, " bytes");
        m_consumed += bytes_read;
        return bytes_read;
    }

    std::vector<std::uint8_t> reader::read_up_to(std::size_t size) {
        std::vector<std::uint8_t> result;
        result.reserve(std::min(size, block_size));

        while (result.size() < size) {
            const std::size_t step = std::min(size - result.size(), block_size);
            const std::size_t old_size = result.size();
            result.resize(old_size + step);

            const std::size_t actual = read(result.data() + old_size, step);
            if (actual != step) {
                result.resize(old_size + actual);
                break;
            }
        }
        return result;
    }

    std::optional<std::uint32_t> reader::read_be32() {
        std::array<std::uint8_t, 4> data;
        if (read(data.data(), data.size()) != data.size()) {
            return std::nullopt;
        }
        return load_be32(data.data());
    }

    std::optional<chunk_type> reader::read_chunk_type() {
        std::array<std::uint8_t, chunk_type::size> data;
        if (read(data.data(), data.size()) != data.size()) {
            return std::nullopt;
        }
        return chunk_type(data);
    }
}
