//
// Chunk records on standard streams
//

#include <pngchunk/chunk_io.hh>
#include <pngchunk/exceptions.hh>

#include <istream>
#include <ostream>

#include "input.hh"
#include "record_checks.hh"

namespace pngchunk {

    chunk read_chunk(std::istream& stream, const decode_options& options) {
        reader in(stream);
        const std::uint64_t offset = in.offset();

        auto length = in.read_be32();
        auto type = length ? in.read_chunk_type() : std::nullopt;
        if (!length || !type) {
            const auto got = static_cast<std::size_t>(in.consumed());
            throw truncated_input_error(chunk::header_size, got, build_error_msg(
                "Truncated chunk header at offset ", offset, ": need ",
                chunk::header_size, " bytes, got ", got));
        }

        detail::check_length(offset, *type, *length, options);
        detail::check_type(offset, *type, options);

        std::vector<std::uint8_t> payload = in.read_up_to(*length);
        auto expected = payload.size() == *length ? in.read_be32()
                                                  : std::nullopt;
        if (!expected) {
            const std::uint64_t needed = std::uint64_t(chunk::metadata_size) + *length;
            const auto got = static_cast<std::size_t>(in.consumed());
            throw truncated_input_error(static_cast<std::size_t>(needed), got, build_error_msg(
                "Truncated chunk '", *type, "' at offset ", offset, ": declares ", *length,
                " payload bytes, need ", needed, " bytes, got ", got));
        }

        chunk result(*type, std::move(payload));
        detail::check_crc(offset, result, *expected, options);
        return result;
    }

    void write_chunk(std::ostream& stream, const chunk& c) {
        THROW_IO_UNLESS(stream.good(), "Output stream in bad state");

        const std::vector<std::uint8_t> bytes = c.as_bytes();
        stream.write(reinterpret_cast<const char*>(bytes.data()),
                     static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(stream.good(), "Failed to write chunk '", c.type(), "' (",
                        bytes.size(), " bytes)");
    }

} // namespace pngchunk
