//
// Robustness tests: corrupted input must be rejected, never accepted with wrong data
//

#include <doctest/doctest.h>
#include <pngme/chunk.hh>
#include <pngme/container.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>

#include <vector>

#include "test_utils.hh"

using namespace pngme;

TEST_CASE("Security - single bit flips are detected") {
    const chunk original(chunk_type::from_string("RuSt"), secret_message);
    const auto encoded = original.serialize();

    // Length, type and data regions; the CRC field itself is covered below
    const std::size_t crc_offset = encoded.size() - 4;

    for (std::size_t byte = 0; byte < crc_offset; byte++) {
        for (int bit = 0; bit < 8; bit++) {
            auto corrupted = encoded;
            corrupted[byte] ^= std::byte(1u << bit);

            CAPTURE(byte);
            CAPTURE(bit);
            bool rejected = false;
            try {
                (void)chunk::parse(corrupted);
            } catch (const parse_error& e) {
                rejected = e.kind() == parse_error::kind_t::crc_mismatch ||
                           e.kind() == parse_error::kind_t::truncated;
            } catch (const invalid_type_code&) {
                // Flipping bit 6 or 7 of a type byte leaves the letter range
                rejected = byte >= 4 && byte < 8;
            }
            CHECK(rejected);
        }
    }

    SUBCASE("crc field") {
        for (std::size_t byte = crc_offset; byte < encoded.size(); byte++) {
            for (int bit = 0; bit < 8; bit++) {
                auto corrupted = encoded;
                corrupted[byte] ^= std::byte(1u << bit);
                try {
                    (void)chunk::parse(corrupted);
                    FAIL("Corrupted CRC was accepted");
                } catch (const parse_error& e) {
                    CHECK(e.kind() == parse_error::kind_t::crc_mismatch);
                }
            }
        }
    }
}

TEST_CASE("Security - length field shrink is detected") {
    // A smaller declared length moves the CRC window into the payload
    chunk original(chunk_type::from_string("RuSt"), secret_message);
    auto encoded = original.serialize();
    encoded[3] = std::byte(41);

    try {
        (void)chunk::parse(encoded);
        FAIL("Should have thrown exception");
    } catch (const parse_error& e) {
        CHECK(e.kind() == parse_error::kind_t::crc_mismatch);
    }
}

TEST_CASE("Security - max chunk size enforcement") {
    SUBCASE("declared size above the limit") {
        auto bytes = make_container({
            chunk(chunk_type::from_string("IDAT"), std::string(2048, 'x')).serialize()
        });

        parse_options opts;
        opts.max_chunk_size = 1024;

        try {
            (void)container::parse(bytes, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == parse_error::kind_t::size_limit);
        }
    }

    SUBCASE("limit applies before data is read") {
        // Claims 2GB but carries 4 bytes
        auto bytes = make_container({raw_chunk(0x7FFFFFFFu, "IDAT", "abcd", 0)});

        parse_options opts;
        opts.max_chunk_size = 1024 * 1024;

        try {
            (void)container::parse(bytes, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == parse_error::kind_t::size_limit);
        }
    }

    SUBCASE("size at the limit is accepted") {
        auto bytes = make_container({
            chunk(chunk_type::from_string("IDAT"), std::string(1024, 'x')).serialize()
        });

        parse_options opts;
        opts.max_chunk_size = 1024;
        CHECK(container::parse(bytes, opts).size() == 1);
    }

    SUBCASE("lying length without a limit is truncation") {
        auto bytes = make_container({raw_chunk(0xFFFFFFF0u, "IDAT", "abcd", 0)});
        try {
            (void)container::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == parse_error::kind_t::truncated);
        }
    }
}

TEST_CASE("Security - random garbage after signature") {
    auto bytes = signature_bytes();
    for (int i = 0; i < 64; i++) {
        bytes.push_back(std::byte(static_cast<unsigned char>(i * 37 + 11)));
    }
    CHECK_THROWS_AS((void)container::parse(bytes), error);
}
