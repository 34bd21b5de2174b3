//
// CRC-32 backed by zlib
//

#include <pngchunk/crc.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngchunk {

    crc_engine::crc_engine()
        : m_crc(::crc32(0L, Z_NULL, 0)) {}

    void crc_engine::update(const void* data, std::size_t size) {
        const auto* p = static_cast<const Bytef*>(data);
        // zlib takes a uInt length, feed larger buffers in pieces
        while (size > 0) {
            const std::size_t step = std::min<std::size_t>(size, std::numeric_limits<uInt>::max());
            m_crc = ::crc32(m_crc, p, static_cast<uInt>(step));
            p += step;
            size -= step;
        }
    }

    std::uint32_t crc_engine::value() const noexcept {
        return static_cast<std::uint32_t>(m_crc);
    }

    void crc_engine::reset() {
        m_crc = ::crc32(0L, Z_NULL, 0);
    }

    std::uint32_t crc_engine::compute(const void* data, std::size_t size) {
        crc_engine engine;
        engine.update(data, size);
        return engine.value();
    }

} // namespace pngchunk
