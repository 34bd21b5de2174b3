//
// Validation steps shared by the buffer and stream decoders
//

#include "record_checks.hh"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <pngchunk/exceptions.hh>

namespace pngchunk::detail {

    namespace {
        std::string hex32(std::uint32_t v) {
            std::ostringstream oss;
            oss << "0x" << std::hex << std::setfill('0') << std::setw(8) << v;
            return oss.str();
        }
    }

    void warn(const decode_options& options, std::uint64_t offset,
              std::string_view category, const std::string& message) {
        if (options.on_warning) {
            options.on_warning(offset, category, message);
        }
    }

    void check_length(std::uint64_t offset, const chunk_type& type, std::uint32_t length,
                      const decode_options& options) {
        if (length <= options.max_chunk_size) {
            return;
        }

        std::string msg = build_error_msg(
            "Chunk '", type, "' at offset ", offset, " declares ", length,
            " payload bytes, exceeding maximum allowed size of ", options.max_chunk_size);
        if (options.strict) {
            THROW_PARSE(error_kind::invalid_length, msg);
        }
        warn(options, offset, "size_limit", msg);
    }

    void check_type(std::uint64_t offset, const chunk_type& type, const decode_options& options) {
        if (type.is_valid()) {
            return;
        }

        const bool letters_only = std::all_of(type.begin(), type.end(), chunk_type::is_letter);
        std::string msg = build_error_msg(
            "Invalid chunk type '", type, "' at offset ", offset,
            letters_only ? ": reserved bit is set" : ": chunk types consist of ASCII letters only");
        if (options.validate_type) {
            throw invalid_chunk_type_error(type.bytes(), msg);
        }
        warn(options, offset, "invalid_type", msg);
    }

    void check_crc(std::uint64_t offset, const chunk& c, std::uint32_t expected,
                   const decode_options& options) {
        const std::uint32_t actual = c.crc();
        if (actual == expected) {
            return;
        }

        std::string msg = build_error_msg(
            "Invalid checksum for chunk '", c.type(), "' at offset ", offset,
            ": expected ", expected, " (", hex32(expected), ")",
            " actual ", actual, " (", hex32(actual), ")");
        if (options.verify_crc) {
            throw checksum_mismatch_error(expected, actual, msg);
        }
        warn(options, offset, "crc_mismatch", msg);
    }

} // namespace pngchunk::detail
