/**
 * @file decode_options.hh
 * @brief Options controlling how chunk records are decoded
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct decode_options
     * @brief Configuration options for decoding chunk records
     *
     * The defaults reject everything the PNG 1.2 chunk layout does not
     * allow. Relaxed settings turn some failures into warnings.
     */
    struct decode_options {
        /**
         * @brief Strict decoding mode
         *
         * When true, a declared length above max_chunk_size fails the decode.
         * When false, it is reported as a "size_limit" warning.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed payload length in bytes
         *
         * The default admits every 32-bit length field. Set 0x7FFFFFFF to
         * enforce the PNG 1.2 limit of 2^31-1.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @brief Reject chunk types that fail chunk_type::is_valid()
         *
         * When false, an invalid type is reported as an "invalid_type" warning.
         */
        bool validate_type = true;

        /**
         * @brief Compare the embedded CRC with the recomputed one
         *
         * When false, a mismatch is reported as a "crc_mismatch" warning.
         */
        bool verify_crc = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Input offset of the record the warning is about
         * @param category Warning category ("size_limit", "invalid_type",
         *                 "crc_mismatch", "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
