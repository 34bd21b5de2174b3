//
// Validation steps shared by the buffer and stream decoders
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk::detail {

    // offset is the input position of the record's length field
    void check_length(std::uint64_t offset, const chunk_type& type, std::uint32_t length,
                      const decode_options& options);

    void check_type(std::uint64_t offset, const chunk_type& type, const decode_options& options);

    void check_crc(std::uint64_t offset, const chunk& c, std::uint32_t expected,
                   const decode_options& options);

    void warn(const decode_options& options, std::uint64_t offset,
              std::string_view category, const std::string& message);

} // namespace pngchunk::detail
