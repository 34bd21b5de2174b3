//
// Relaxed decoding and warning callbacks
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/decode_options.hh>
#include <pngchunk/exceptions.hh>

#include <string>
#include <vector>
#include "test_utils.hh"

using namespace pngchunk;
using namespace test_data;

namespace {
    struct captured_warning {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    decode_options collecting(std::vector<captured_warning>& out) {
        decode_options opts;
        opts.on_warning = [&out](std::uint64_t offset, std::string_view category, std::string_view message) {
            out.push_back({offset, std::string(category), std::string(message)});
        };
        return opts;
    }
}

TEST_CASE("decode options") {
    std::vector<captured_warning> warnings;

    SUBCASE("default options produce no warnings for a clean record") {
        auto opts = collecting(warnings);
        (void)chunk::decode(secret_record(), opts);
        CHECK(warnings.empty());
    }

    SUBCASE("trailing data is reported") {
        auto record = secret_record();
        record.push_back(0x00);
        record.push_back(0x01);

        auto opts = collecting(warnings);
        chunk c = chunk::decode(record, opts);
        CHECK(c.length() == 42);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "trailing_data");
        CHECK(warnings[0].offset == 0);
        CHECK(warnings[0].message.find("2 bytes") != std::string::npos);
    }

    SUBCASE("configured size limit") {
        auto opts = collecting(warnings);
        opts.max_chunk_size = 16;

        try {
            (void)chunk::decode(secret_record(), opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::invalid_length);
        }
        CHECK(warnings.empty());
    }

    SUBCASE("size limit in non-strict mode") {
        auto opts = collecting(warnings);
        opts.max_chunk_size = 16;
        opts.strict = false;

        chunk c = chunk::decode(secret_record(), opts);
        CHECK(c.data_as_string() == secret_message);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "size_limit");
        CHECK(warnings[0].message.find("RuSt") != std::string::npos);
    }

    SUBCASE("checksum verification disabled") {
        auto opts = collecting(warnings);
        opts.verify_crc = false;

        chunk c = chunk::decode(secret_record(12345), opts);
        CHECK(c.crc() == secret_crc);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "crc_mismatch");
        CHECK(warnings[0].message.find("12345") != std::string::npos);
    }

    SUBCASE("type validation disabled") {
        auto opts = collecting(warnings);
        opts.validate_type = false;

        chunk c = chunk::decode(make_record("Rust", bytes_of(secret_message)), opts);
        CHECK(c.type().to_string() == "Rust");
        CHECK_FALSE(c.type().is_valid());
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "invalid_type");
        CHECK(warnings[0].message.find("reserved bit") != std::string::npos);
    }

    SUBCASE("relaxed checks without a handler") {
        decode_options opts;
        opts.verify_crc = false;
        opts.validate_type = false;

        chunk c = chunk::decode(make_record(3, "Ru1t", bytes_of("abc"), 0), opts);
        CHECK(c.length() == 3);
    }

    SUBCASE("truncation is never relaxed") {
        decode_options opts;
        opts.strict = false;
        opts.verify_crc = false;
        opts.validate_type = false;

        auto record = secret_record();
        record.pop_back();
        CHECK_THROWS_AS(chunk::decode(record, opts), truncated_input_error);
    }
}
