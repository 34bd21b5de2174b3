/**
 * @file chunk_dump.cpp
 * @brief List the chunk records of a file
 *
 * Reads consecutive chunk records and prints their type, property bits,
 * length and checksum. A leading PNG signature is skipped when present.
 * Text payloads of tEXt chunks are shown.
 */

#include <pngchunk/chunk_io.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/exceptions.hh>
#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
    constexpr std::array<char, 8> png_signature = {'\x89', 'P', 'N', 'G', '\r', '\n', '\x1a', '\n'};

    void skip_signature(std::istream& is) {
        std::array<char, 8> head{};
        is.read(head.data(), head.size());
        if (is.gcount() != static_cast<std::streamsize>(head.size()) || head != png_signature) {
            is.clear();
            is.seekg(0);
        }
    }

    std::string flags_of(const pngchunk::chunk_type& t) {
        std::string flags;
        flags += t.is_critical() ? "critical" : "ancillary";
        flags += t.is_public() ? ", public" : ", private";
        flags += t.is_safe_to_copy() ? ", safe-to-copy" : ", unsafe-to-copy";
        return flags;
    }

    void display_chunk(const pngchunk::chunk& c, std::uint64_t offset) {
        std::cout << c.type() << "\n";
        std::cout << "  Offset: 0x" << std::hex << offset << std::dec << "\n";
        std::cout << "  Length: " << c.length() << " bytes\n";
        std::cout << "  CRC: 0x" << std::hex << std::setw(8) << std::setfill('0') << c.crc()
                  << std::dec << std::setfill(' ') << "\n";
        std::cout << "  Flags: " << flags_of(c.type()) << "\n";

        if (c.type() == pngchunk::chunk_types::tEXt) {
            try {
                std::cout << "  Text: \"" << c.data_as_string() << "\"\n";
            } catch (const pngchunk::encoding_error& e) {
                std::cout << "  Text: <" << e.what() << ">\n";
            }
        }
        std::cout << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file> [--lenient]\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open file: " << argv[1] << "\n";
        return 1;
    }

    pngchunk::decode_options options;
    if (argc > 2 && std::string(argv[2]) == "--lenient") {
        options.strict = false;
        options.verify_crc = false;
        options.validate_type = false;
    }
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    skip_signature(file);

    std::size_t count = 0;
    try {
        while (file.peek() != std::char_traits<char>::eof()) {
            const auto offset = static_cast<std::uint64_t>(file.tellg());
            pngchunk::chunk c = pngchunk::read_chunk(file, options);
            display_chunk(c, offset);
            ++count;
        }
    } catch (const pngchunk::chunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << count << " chunk(s)\n";
    return 0;
}
