/**
 * @file byte_order.hh
 * @brief Big-endian loads and stores for chunk fields
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <pngchunk/endian.hh>

namespace pngchunk {
    /**
     * @brief Load an unsigned 32-bit big-endian value from memory
     * @param src At least 4 readable bytes
     */
    inline std::uint32_t load_be32(const void* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    /**
     * @brief Store an unsigned 32-bit value to memory in big-endian order
     * @param value Value to store
     * @param dest At least 4 writable bytes
     */
    inline void store_be32(std::uint32_t value, void* dest) {
        value = swap32be(value);
        std::memcpy(dest, &value, sizeof(value));
    }
}
