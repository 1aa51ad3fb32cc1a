#include <doctest/doctest.h>
#include <pngstash/chunk_type.hh>
#include <pngstash/exceptions.hh>

#include <sstream>
#include <unordered_map>
#include <set>

using namespace pngstash;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from individual bytes") {
            chunk_type t(82, 117, 83, 116);
            CHECK(t.bytes() == std::array<std::uint8_t, 4>{82, 117, 83, 116});
            CHECK(t.to_string() == "RuSt");
        }

        SUBCASE("from raw bytes") {
            unsigned char raw[4] = {'R', 'u', 'S', 't'};
            auto t = chunk_type::from_bytes(raw);
            CHECK(t == chunk_type(82, 117, 83, 116));
        }

        SUBCASE("from raw bytes accepts non-letters") {
            unsigned char raw[4] = {'R', 'u', '1', 't'};
            auto t = chunk_type::from_bytes(raw);
            CHECK(t[2] == '1');
            CHECK_FALSE(t.are_bytes_letters());
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("from std::byte") {
            chunk_type t(std::byte('I'), std::byte('D'), std::byte('A'), std::byte('T'));
            CHECK(t == chunk_types::IDAT);
        }

        SUBCASE("from text") {
            auto t = chunk_type::from_text("RuSt");
            CHECK(t == chunk_type(82, 117, 83, 116));
        }

        SUBCASE("literal") {
            constexpr auto iend = "IEND"_ct;
            CHECK(iend == chunk_types::IEND);
            CHECK(iend.to_string() == "IEND");
        }
    }

    TEST_CASE("chunk_type text errors") {
        CHECK_THROWS_AS(chunk_type::from_text("Ru1t"), format_error);
        CHECK_THROWS_AS(chunk_type::from_text("RuS"), format_error);
        CHECK_THROWS_AS(chunk_type::from_text("RuStX"), format_error);
        CHECK_THROWS_AS(chunk_type::from_text(""), format_error);
        CHECK_THROWS_AS(chunk_type::from_text("Ru t"), format_error);

        unsigned char raw[4] = {'R', 0x00, 'S', 't'};
        CHECK_THROWS_AS(chunk_type::from_bytes(raw).to_string(), format_error);
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_text("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_text("ruSt").is_critical());
            CHECK(chunk_type::from_text("ruSt").is_ancillary());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_text("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_text("RuSt").is_public());
            CHECK(chunk_type::from_text("RuSt").is_private());
            CHECK_FALSE(chunk_type::from_text("RUSt").is_private());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_text("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_text("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_text("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_text("RuST").is_safe_to_copy());
        }

        SUBCASE("standard types") {
            CHECK(chunk_types::IHDR.is_critical());
            CHECK(chunk_types::IHDR.is_public());
            CHECK_FALSE(chunk_types::IHDR.is_safe_to_copy());
            CHECK(chunk_type::from_text("tEXt").is_ancillary());
            CHECK(chunk_type::from_text("tEXt").is_safe_to_copy());
        }

        SUBCASE("each property reads exactly one byte") {
            // flipping the case of byte i only changes property i
            chunk_type base = chunk_type::from_text("RUST");
            chunk_type b0 = chunk_type::from_text("rUST");
            chunk_type b1 = chunk_type::from_text("RuST");
            chunk_type b2 = chunk_type::from_text("RUsT");
            chunk_type b3 = chunk_type::from_text("RUSt");

            CHECK(base.is_critical());
            CHECK(base.is_public());
            CHECK(base.is_reserved_bit_valid());
            CHECK_FALSE(base.is_safe_to_copy());

            CHECK_FALSE(b0.is_critical());
            CHECK(b0.is_public());
            CHECK(b0.is_reserved_bit_valid());

            CHECK(b1.is_critical());
            CHECK_FALSE(b1.is_public());
            CHECK(b1.is_reserved_bit_valid());

            CHECK(b2.is_critical());
            CHECK(b2.is_public());
            CHECK_FALSE(b2.is_reserved_bit_valid());
            CHECK_FALSE(b2.is_safe_to_copy());

            CHECK(b3.is_reserved_bit_valid());
            CHECK(b3.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type validity") {
        CHECK(chunk_type::from_text("RuSt").is_valid());
        CHECK(chunk_type::from_text("ruSt").is_valid());
        // letters, but lowercase third byte
        CHECK_FALSE(chunk_type::from_text("Rust").is_valid());
        CHECK_FALSE(chunk_type(82, 117, 115, 116).is_valid());
        // reserved bit clear, but not a letter
        CHECK_FALSE(chunk_type(82, 117, '@', 116).is_valid());
        CHECK_FALSE(chunk_type(82, 117, '[', 116).is_valid());
    }

    TEST_CASE("chunk_type comparison") {
        auto a = chunk_type::from_text("RuSt");
        auto b = chunk_type(82, 117, 83, 116);
        auto c = chunk_type::from_text("ruSt");

        CHECK(a == b);
        CHECK(a != c);
        CHECK(a < c);
        CHECK(c > a);
        CHECK(a <= b);
        CHECK(a >= b);

        std::set<chunk_type> ordered{c, a, chunk_types::IEND};
        CHECK(*ordered.begin() == chunk_types::IEND);
    }

    TEST_CASE("chunk_type hashing") {
        std::unordered_map<chunk_type, int> counts;
        counts["IDAT"_ct] += 2;
        counts[chunk_types::IDAT] += 1;
        counts["tEXt"_ct] += 1;

        CHECK(counts.size() == 2);
        CHECK(counts[chunk_types::IDAT] == 3);
    }

    TEST_CASE("chunk_type stream output") {
        std::ostringstream ss;
        ss << chunk_type::from_text("RuSt");
        CHECK(ss.str() == "RuSt");

        std::ostringstream escaped;
        escaped << chunk_type('R', 0x01, 'S', 't') << " " << 10;
        CHECK(escaped.str() == "R\\x01St 10");
    }

    TEST_CASE("chunk_type numeric value") {
        CHECK(chunk_types::IEND.to_uint32() == 0x49454E44u);
    }
}
