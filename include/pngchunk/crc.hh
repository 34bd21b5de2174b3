/**
 * @file crc.hh
 * @brief CRC-32 (ISO-HDLC) as used by PNG chunks
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class crc_engine
     * @brief Incremental CRC-32/ISO-HDLC computation
     *
     * Reflected polynomial 0x04C11DB7, initial value 0xFFFFFFFF and final
     * XOR 0xFFFFFFFF. Feeding the same bytes in one or several update()
     * calls yields the same value.
     */
    class PNGCHUNK_EXPORT crc_engine {
    public:
        crc_engine();

        /**
         * @brief Add bytes to the running checksum
         * @param data Bytes to add (may be null when size is 0)
         * @param size Number of bytes
         */
        void update(const void* data, std::size_t size);

        /// Checksum of everything added so far
        [[nodiscard]] std::uint32_t value() const noexcept;

        void reset();

        /// One-shot checksum of a single buffer
        static std::uint32_t compute(const void* data, std::size_t size);

    private:
        unsigned long m_crc;
    };

} // namespace pngchunk
