/**
 * @file chunk_io.hh
 * @brief Reading and writing chunk records on standard streams
 */

#pragma once

#include <iosfwd>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    /**
     * @brief Read one chunk record from the current stream position
     * @param stream Input stream, left positioned right after the record
     * @param options Decoding options, same checks as chunk::decode()
     * @return The decoded chunk
     * @throws truncated_input_error if the stream ends inside the record
     * @throws io_error if the stream fails
     *
     * The payload is read incrementally, so a corrupt length field does not
     * allocate more memory than the stream actually provides.
     */
    PNGCHUNK_EXPORT chunk read_chunk(std::istream& stream, const decode_options& options = {});

    /**
     * @brief Write the on-wire form of a chunk
     * @param stream Output stream
     * @param c Chunk to write
     * @throws io_error if the stream fails
     */
    PNGCHUNK_EXPORT void write_chunk(std::ostream& stream, const chunk& c);

} // namespace pngchunk
