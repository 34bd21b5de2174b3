//
// Chunk types defined by the PNG 1.2 specification
//

#pragma once

#include <pngchunk/chunk_type.hh>

namespace pngchunk {
    namespace chunk_types {
        // Critical chunks
        inline constexpr chunk_type IHDR = "IHDR"_ct;
        inline constexpr chunk_type PLTE = "PLTE"_ct;
        inline constexpr chunk_type IDAT = "IDAT"_ct;
        inline constexpr chunk_type IEND = "IEND"_ct;

        // Ancillary chunks
        inline constexpr chunk_type bKGD = "bKGD"_ct;
        inline constexpr chunk_type cHRM = "cHRM"_ct;
        inline constexpr chunk_type gAMA = "gAMA"_ct;
        inline constexpr chunk_type hIST = "hIST"_ct;
        inline constexpr chunk_type iCCP = "iCCP"_ct;
        inline constexpr chunk_type iTXt = "iTXt"_ct;
        inline constexpr chunk_type pHYs = "pHYs"_ct;
        inline constexpr chunk_type sBIT = "sBIT"_ct;
        inline constexpr chunk_type sPLT = "sPLT"_ct;
        inline constexpr chunk_type sRGB = "sRGB"_ct;
        inline constexpr chunk_type tEXt = "tEXt"_ct;
        inline constexpr chunk_type tIME = "tIME"_ct;
        inline constexpr chunk_type tRNS = "tRNS"_ct;
        inline constexpr chunk_type zTXt = "zTXt"_ct;
    }
}
