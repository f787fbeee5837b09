#include <doctest/doctest.h>
#include <pngme/container.hh>
#include <pngme/exceptions.hh>

#include <sstream>
#include <string>

#include "test_utils.hh"

using namespace pngme;

namespace {
    chunk text_chunk(std::string_view type, std::string_view text) {
        return chunk(chunk_type::from_string(type), text);
    }

    std::vector<std::string> types_of(const container& c) {
        std::vector<std::string> out;
        for (const auto& ch : c) {
            out.push_back(ch.type().to_string());
        }
        return out;
    }

    container testing_container() {
        container c;
        c.append(text_chunk("FrSt", "I am the first chunk"));
        c.append(text_chunk("miDl", "I am another chunk"));
        c.append(text_chunk("LASt", "I am the last chunk"));
        return c;
    }
}

TEST_SUITE("CONTAINER") {
    TEST_CASE("container construction") {
        SUBCASE("default container is empty") {
            container c;
            CHECK(c.empty());
            CHECK(c.size() == 0);
            CHECK(c.serialize() == signature_bytes());
        }

        SUBCASE("from chunk list") {
            std::vector<chunk> chunks = {
                text_chunk("FrSt", "one"),
                text_chunk("LASt", "two")
            };
            container c(chunks);
            CHECK(c.size() == 2);
            CHECK(c.chunks() == chunks);
        }

        SUBCASE("signature constant") {
            const auto& sig = container::signature;
            CHECK(sig.size() == 8);
            CHECK(sig[0] == 0x89);
            CHECK(sig[1] == 'P');
            CHECK(sig[2] == 'N');
            CHECK(sig[3] == 'G');
        }
    }

    TEST_CASE("container parsing") {
        SUBCASE("signature only") {
            auto c = container::parse(signature_bytes());
            CHECK(c.empty());
        }

        SUBCASE("chunks in order") {
            auto bytes = testing_container().serialize();
            auto c = container::parse(bytes);
            CHECK(types_of(c) == std::vector<std::string>{"FrSt", "miDl", "LASt"});
            CHECK(c.chunks()[1].data_as_string() == "I am another chunk");
        }

        SUBCASE("bad signature") {
            auto bytes = testing_container().serialize();
            bytes[0] = std::byte(0x88);
            try {
                (void)container::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == parse_error::kind_t::bad_signature);
            }
        }

        SUBCASE("input shorter than the signature") {
            auto sig = signature_bytes();
            for (std::size_t n = 0; n < sig.size(); n++) {
                try {
                    (void)container::parse(sig.data(), n);
                    FAIL("Should have thrown exception");
                } catch (const parse_error& e) {
                    CHECK(e.kind() == parse_error::kind_t::bad_signature);
                }
            }
        }

        SUBCASE("corrupted chunk aborts the whole parse") {
            auto bytes = make_container({
                text_chunk("FrSt", "fine").serialize(),
                raw_chunk(42, "RuSt", secret_message, secret_message_crc ^ 1),
                text_chunk("LASt", "never reached").serialize()
            });
            try {
                (void)container::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == parse_error::kind_t::crc_mismatch);
            }
        }

        SUBCASE("truncated last chunk") {
            auto bytes = testing_container().serialize();
            bytes.pop_back();
            try {
                (void)container::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == parse_error::kind_t::truncated);
            }
        }

        SUBCASE("trailing garbage shorter than a header") {
            auto bytes = testing_container().serialize();
            bytes.push_back(std::byte(0));
            bytes.push_back(std::byte(0));
            try {
                (void)container::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == parse_error::kind_t::truncated);
            }
        }

        SUBCASE("invalid type code inside the stream") {
            auto bytes = make_container({
                text_chunk("FrSt", "fine").serialize(),
                raw_chunk(0, "AB1D", "", 0)
            });
            CHECK_THROWS_AS((void)container::parse(bytes), invalid_type_code);
        }
    }

    TEST_CASE("container round trip") {
        SUBCASE("append-built container") {
            auto original = testing_container();
            auto decoded = container::parse(original.serialize());
            CHECK(decoded == original);
            CHECK(decoded.serialize() == original.serialize());
        }

        SUBCASE("repeated types and binary payloads") {
            container original;
            original.append(text_chunk("AAAA", "1"));
            original.append(chunk(chunk_type::from_string("bINa"),
                                  std::vector<std::byte>{std::byte(0), std::byte(0xFF), std::byte(0x80)}));
            original.append(text_chunk("AAAA", "2"));
            original.append(chunk("IEND"_type, std::vector<std::byte>{}));

            auto decoded = container::parse(original.serialize());
            CHECK(decoded == original);
        }

        SUBCASE("serialize layout") {
            auto c = testing_container();
            auto expected = signature_bytes();
            for (const auto& ch : c) {
                auto b = ch.serialize();
                expected.insert(expected.end(), b.begin(), b.end());
            }
            CHECK(c.serialize() == expected);
        }
    }

    TEST_CASE("container editing") {
        SUBCASE("append goes to the end") {
            auto c = testing_container();
            c.append(text_chunk("TeSt", "Message"));
            CHECK(c.size() == 4);
            CHECK(c.chunks().back().type() == "TeSt");
            CHECK(c.chunks().back().data_as_string() == "Message");
        }

        SUBCASE("chunk_by_type finds the first match") {
            auto c = testing_container();
            c.append(text_chunk("FrSt", "second FrSt"));

            const chunk* found = c.chunk_by_type("FrSt");
            REQUIRE(found != nullptr);
            CHECK(found->data_as_string() == "I am the first chunk");
        }

        SUBCASE("chunk_by_type is case sensitive") {
            auto c = testing_container();
            CHECK(c.chunk_by_type("frst") == nullptr);
            CHECK(c.chunk_by_type("FRST") == nullptr);
        }

        SUBCASE("chunk_by_type not found") {
            auto c = testing_container();
            CHECK(c.chunk_by_type("NoPe") == nullptr);
            CHECK(c.chunk_by_type("") == nullptr);
            CHECK(c.chunk_by_type("toolong") == nullptr);
        }

        SUBCASE("remove first of repeated type") {
            container c;
            c.append(text_chunk("AAAA", "first"));
            c.append(text_chunk("BBBB", "middle"));
            c.append(text_chunk("AAAA", "last"));

            auto removed = c.remove_first_by_type("AAAA");
            CHECK(removed.data_as_string() == "first");
            CHECK(types_of(c) == std::vector<std::string>{"BBBB", "AAAA"});
            CHECK(c.chunks()[1].data_as_string() == "last");
        }

        SUBCASE("remove shifts later chunks down") {
            auto c = testing_container();
            auto removed = c.remove_first_by_type("miDl");
            CHECK(removed.type() == "miDl");
            CHECK(types_of(c) == std::vector<std::string>{"FrSt", "LASt"});
        }

        SUBCASE("remove not found leaves container unchanged") {
            auto c = testing_container();
            auto before = c.serialize();
            CHECK_THROWS_AS(c.remove_first_by_type("NoPe"), not_found_error);
            CHECK(c.size() == 3);
            CHECK(c.serialize() == before);
        }

        SUBCASE("remove until empty") {
            container c;
            c.append(text_chunk("AAAA", "x"));
            c.append(text_chunk("AAAA", "y"));
            (void)c.remove_first_by_type("AAAA");
            (void)c.remove_first_by_type("AAAA");
            CHECK(c.empty());
            CHECK_THROWS_AS(c.remove_first_by_type("AAAA"), not_found_error);
        }
    }

    TEST_CASE("container rendering") {
        SUBCASE("one line per chunk") {
            auto c = testing_container();
            CHECK(c.to_string() == "I am the first chunk\nI am another chunk\nI am the last chunk");

            std::ostringstream oss;
            oss << c;
            CHECK(oss.str() == c.to_string());
        }

        SUBCASE("empty container renders nothing") {
            container c;
            CHECK(c.to_string().empty());
        }

        SUBCASE("binary chunk fails the whole rendering") {
            auto c = testing_container();
            c.append(chunk(chunk_type::from_string("bINa"), std::vector<std::byte>{std::byte(0xFF)}));
            CHECK_THROWS_AS((void)c.to_string(), encoding_error);
        }
    }
}
