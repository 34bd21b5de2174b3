#include <doctest/doctest.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/chunk_types.hh>

#include <sstream>
#include <unordered_set>
#include <set>

using namespace pngchunk;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from individual bytes") {
            chunk_type t(82, 117, 83, 116);
            chunk_type::bytes_type expected{82, 117, 83, 116};
            CHECK(t.bytes() == expected);
        }

        SUBCASE("from raw memory") {
            const char raw[] = "RuSt";
            chunk_type t = chunk_type::from_bytes(raw);
            CHECK(t == chunk_type(82, 117, 83, 116));
        }

        SUBCASE("any four bytes are accepted") {
            chunk_type t(0x00, 0xFF, '1', ' ');
            CHECK(t[0] == 0x00);
            CHECK(t[1] == 0xFF);
            CHECK(t[2] == '1');
            CHECK(t[3] == ' ');
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("from string") {
            chunk_type t = chunk_type::parse("RuSt");
            CHECK(t == chunk_type(82, 117, 83, 116));
        }

        SUBCASE("literal") {
            constexpr chunk_type t = "RuSt"_ct;
            CHECK(t == chunk_type::parse("RuSt"));
        }
    }

    TEST_CASE("chunk_type parse failures") {
        SUBCASE("non-letter character") {
            CHECK_THROWS_AS(chunk_type::parse("Ru1t"), invalid_format_error);
            CHECK_THROWS_AS(chunk_type::parse("Ru t"), invalid_format_error);
            CHECK_THROWS_AS(chunk_type::parse("Ru_t"), invalid_format_error);
        }

        SUBCASE("wrong length") {
            CHECK_THROWS_AS(chunk_type::parse(""), invalid_format_error);
            CHECK_THROWS_AS(chunk_type::parse("RuS"), invalid_format_error);
            CHECK_THROWS_AS(chunk_type::parse("RuStt"), invalid_format_error);
        }

        SUBCASE("non-ASCII bytes") {
            // 4 bytes: "Ru" plus a 2-byte UTF-8 sequence
            CHECK_THROWS_AS(chunk_type::parse("Ru\xC3\x9F"), invalid_format_error);
        }

        SUBCASE("error kind") {
            try {
                (void)chunk_type::parse("Ru1t");
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::invalid_format);
            }
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("critical") {
            CHECK(chunk_type::parse("RuSt").is_critical());
            CHECK_FALSE(chunk_type::parse("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::parse("RUSt").is_public());
            CHECK_FALSE(chunk_type::parse("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::parse("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::parse("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::parse("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::parse("RuST").is_safe_to_copy());
        }

        SUBCASE("RuSt vector") {
            chunk_type t = chunk_type::parse("RuSt");
            CHECK(t.is_valid());
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
        }

        SUBCASE("non-letters never count as uppercase or lowercase") {
            chunk_type t(0xC1, 0xC2, 0xC3, 0xE1);
            CHECK_FALSE(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK_FALSE(t.is_reserved_bit_valid());
            CHECK_FALSE(t.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type validity") {
        CHECK(chunk_type::parse("RuSt").is_valid());
        CHECK_FALSE(chunk_type::parse("Rust").is_valid());
        CHECK_FALSE(chunk_type('R', 'u', '1', 't').is_valid());
        CHECK_FALSE(chunk_type('R', 'u', 'S', '1').is_valid());
        CHECK_FALSE(chunk_type('@', 'u', 'S', 't').is_valid());
        CHECK_FALSE(chunk_type('R', 'u', 'S', '[').is_valid());
        CHECK(chunk_type('a', 'z', 'A', 'Z').is_valid());
    }

    TEST_CASE("standard PNG chunk types") {
        using namespace chunk_types;

        for (const auto& t : {IHDR, PLTE, IDAT, IEND}) {
            CHECK(t.is_valid());
            CHECK(t.is_critical());
            CHECK(t.is_public());
        }

        CHECK(tEXt.is_valid());
        CHECK_FALSE(tEXt.is_critical());
        CHECK(tEXt.is_public());
        CHECK(tEXt.is_safe_to_copy());

        CHECK_FALSE(IDAT.is_safe_to_copy());
        CHECK_FALSE(gAMA.is_safe_to_copy());
        CHECK(pHYs.is_safe_to_copy());
        CHECK(IHDR.to_string() == "IHDR");
    }

    TEST_CASE("chunk_type rendering") {
        SUBCASE("letters render as-is") {
            chunk_type t = chunk_type::parse("RuSt");
            CHECK(t.to_string() == "RuSt");
            CHECK(t.is_printable());

            std::ostringstream oss;
            oss << t;
            CHECK(oss.str() == "RuSt");
        }

        SUBCASE("non-printable bytes are escaped") {
            chunk_type t(0xFF, 'A', 0x00, 'c');
            CHECK_FALSE(t.is_printable());
            CHECK(t.to_string() == "\\xffA\\x00c");
        }

        SUBCASE("printable non-letters render as-is") {
            chunk_type t('R', 'u', '1', 't');
            CHECK(t.is_printable());
            CHECK(t.to_string() == "Ru1t");
        }
    }

    TEST_CASE("chunk_type comparison and hashing") {
        chunk_type a = chunk_type::parse("IDAT");
        chunk_type b = chunk_type::parse("IDAT");
        chunk_type c = chunk_type::parse("IEND");

        CHECK(a == b);
        CHECK(a != c);
        CHECK(a < c);
        CHECK_FALSE(c < a);

        std::unordered_set<chunk_type> seen{a, b, c};
        CHECK(seen.size() == 2);

        std::set<chunk_type> ordered{c, a};
        CHECK(*ordered.begin() == a);
    }
}
