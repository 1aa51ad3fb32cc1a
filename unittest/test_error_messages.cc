//
// Test that error messages identify the failing stage and chunk
//

#include <doctest/doctest.h>
#include <string>
#include <vector>

#include <pngstash/png.hh>
#include <pngstash/exceptions.hh>

#include "test_utils.hh"

using namespace pngstash;

TEST_CASE("Error messages") {
    SUBCASE("signature") {
        auto file = bytes_of("not a png file");
        try {
            png::decode(file);
            FAIL("Should have thrown exception");
        } catch (const invalid_signature_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("signature") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("checksum - shows chunk type, offset and both values") {
        auto file = png_signature_bytes();
        append_raw_chunk(file, "IHDR", ihdr_data(1, 1));
        append_raw_chunk(file, "ruSt", bytes_of("hidden"));
        file.back() ^= std::byte(0x01);

        try {
            png::decode(file);
            FAIL("Should have thrown exception");
        } catch (const checksum_mismatch_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("Checksum") != std::string::npos);
            CHECK(msg.find("ruSt") != std::string::npos);
            CHECK(msg.find("offset 33") != std::string::npos);
            CHECK(e.stored() != e.computed());
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("truncated chunk - shows chunk type and sizes") {
        auto file = png_signature_bytes();
        append_raw_chunk(file, "IDAT", std::vector<std::byte>(64, std::byte(7)));
        file.resize(file.size() - 10);

        try {
            png::decode(file);
            FAIL("Should have thrown exception");
        } catch (const truncated_input_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("IDAT") != std::string::npos);
            CHECK(msg.find("offset 8") != std::string::npos);
            CHECK(msg.find("64") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("length mismatch - shows declared and actual size") {
        auto bytes = raw_chunk("tEXt", bytes_of("abc"));
        bytes.push_back(std::byte(0));

        try {
            chunk::decode(bytes);
            FAIL("Should have thrown exception");
        } catch (const length_mismatch_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("tEXt") != std::string::npos);
            CHECK(msg.find("length 3") != std::string::npos);
            CHECK(msg.find("16 bytes") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("missing chunk - shows requested type") {
        auto p = png::decode(minimal_png());
        try {
            p.remove_chunk("ruSt"_ct);
            FAIL("Should have thrown exception");
        } catch (const not_found_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("ruSt") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("bad chunk type text") {
        try {
            chunk_type::from_text("ab1d");
            FAIL("Should have thrown exception");
        } catch (const format_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("ab1d") != std::string::npos);
            CHECK(msg.find("position 2") != std::string::npos);
            INFO("Error message: " << msg);
        }
    }

    SUBCASE("all library errors share a base class") {
        CHECK_THROWS_AS(png::decode(bytes_of("xx")), pngstash_error);
        CHECK_THROWS_AS(chunk_type::from_text("x"), pngstash_error);
        CHECK_THROWS_AS(png().remove_chunk("IEND"_ct), pngstash_error);
    }
}
