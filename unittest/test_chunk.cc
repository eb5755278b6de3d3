#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("CHUNK") {
    TEST_CASE("reference chunk") {
        auto c = chunk::parse(secret_message_chunk());

        SUBCASE("length") {
            CHECK(c.length() == 42);
        }

        SUBCASE("type") {
            CHECK(c.type().to_string() == "RuSt");
        }

        SUBCASE("data as string") {
            CHECK(c.data_as_string() == secret_message);
        }

        SUBCASE("crc") {
            CHECK(c.crc() == 2882656334u);
        }

        SUBCASE("debug rendering") {
            CHECK(c.to_string() == "[82, 117, 83, 116]");

            std::ostringstream ss;
            ss << c;
            CHECK(ss.str() == c.to_string());
        }
    }

    TEST_CASE("chunk construction") {
        SUBCASE("derives length and crc") {
            chunk c(chunk_type("RuSt"), secret_message);
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_message_crc);
            CHECK(c.data() == to_bytes(secret_message));
        }

        SUBCASE("empty payload") {
            chunk c(chunk_types::IEND, std::vector<std::byte>{});
            CHECK(c.length() == 0);
            CHECK(c.data().empty());
            // CRC of "IEND" found at the end of every PNG file
            CHECK(c.crc() == 0xAE426082u);
        }

        SUBCASE("binary payload") {
            std::vector<std::byte> payload = {std::byte(0x00), std::byte(0xFF), std::byte(0x80), std::byte(0x7F)};
            chunk c(chunk_type("ruSt"), payload);
            CHECK(c.length() == 4);
            CHECK(c.data() == payload);
        }
    }

    TEST_CASE("chunk serialization") {
        SUBCASE("matches the wire layout") {
            chunk c(chunk_type("RuSt"), secret_message);
            CHECK(c.as_bytes() == secret_message_chunk());
        }

        SUBCASE("IEND encoding") {
            chunk c(chunk_types::IEND, std::vector<std::byte>{});
            std::vector<std::byte> expected = {
                std::byte(0x00), std::byte(0x00), std::byte(0x00), std::byte(0x00),
                std::byte('I'), std::byte('E'), std::byte('N'), std::byte('D'),
                std::byte(0xAE), std::byte(0x42), std::byte(0x60), std::byte(0x82)
            };
            CHECK(c.as_bytes() == expected);
        }

        SUBCASE("serialization leaves the chunk unchanged") {
            chunk c(chunk_type("RuSt"), "abc");
            auto first = c.as_bytes();
            auto second = c.as_bytes();
            CHECK(first == second);
            CHECK(c.length() == 3);
        }
    }

    TEST_CASE("chunk round trip") {
        const std::vector<std::pair<std::string, std::string>> samples = {
            {"RuSt", "This is where your secret message will be!"},
            {"IEND", ""},
            {"tEXt", std::string("Comment\0Hidden", 14)},
            {"prIv", std::string(1000, 'x')},
        };

        for (const auto& sample : samples) {
            const std::string& name = sample.first;
            CAPTURE(name);
            chunk original{chunk_type(name), std::string_view(sample.second)};
            auto decoded = chunk::parse(original.as_bytes());

            CHECK(decoded == original);
            CHECK(decoded.length() == original.length());
            CHECK(decoded.type() == original.type());
            CHECK(decoded.data() == original.data());
            CHECK(decoded.crc() == original.crc());
        }

        SUBCASE("non-alphabetic type survives") {
            chunk_type::bytes_type bytes = {std::byte('R'), std::byte('u'), std::byte('1'), std::byte('t')};
            chunk original(chunk_type(bytes), "payload");
            auto decoded = chunk::parse(original.as_bytes());
            CHECK(decoded == original);
        }
    }

    TEST_CASE("chunk parse failures") {
        SUBCASE("every buffer below 12 bytes is malformed") {
            auto full = secret_message_chunk();
            for (std::size_t n = 0; n < chunk::overhead; n++) {
                CAPTURE(n);
                std::vector<std::byte> shorter(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(n));
                CHECK_THROWS_AS(chunk::parse(shorter), malformed_input_error);
            }
        }

        SUBCASE("twelve bytes is enough") {
            auto c = chunk::parse(chunk(chunk_types::IEND, std::vector<std::byte>{}).as_bytes());
            CHECK(c.type() == chunk_types::IEND);
        }

        SUBCASE("wrong crc") {
            auto bytes = raw_chunk(42, "RuSt", secret_message, 2882656333u);
            CHECK_THROWS_AS(chunk::parse(bytes), checksum_mismatch_error);
        }

        SUBCASE("declared length larger than payload") {
            auto bytes = raw_chunk(43, "RuSt", secret_message, secret_message_crc);
            CHECK_THROWS_AS(chunk::parse(bytes), length_mismatch_error);
        }

        SUBCASE("declared length smaller than payload") {
            auto bytes = raw_chunk(41, "RuSt", secret_message, secret_message_crc);
            CHECK_THROWS_AS(chunk::parse(bytes), length_mismatch_error);
        }

        SUBCASE("every corrupted length field is rejected") {
            auto good = secret_message_chunk();
            for (std::size_t i = 0; i < 4; i++) {
                CAPTURE(i);
                auto bytes = good;
                bytes[i] ^= std::byte(0x01);
                CHECK_THROWS_AS(chunk::parse(bytes), length_mismatch_error);
            }
        }

        SUBCASE("every corrupted type or data byte is rejected") {
            auto good = secret_message_chunk();
            for (std::size_t i = 4; i < good.size() - 4; i++) {
                CAPTURE(i);
                auto bytes = good;
                // Flipping bit 0 keeps the byte ASCII, so only the CRC can catch it
                bytes[i] ^= std::byte(0x01);
                CHECK_THROWS_AS(chunk::parse(bytes), checksum_mismatch_error);
            }
        }

        SUBCASE("corrupted crc field") {
            auto bytes = secret_message_chunk();
            bytes.back() ^= std::byte(0x80);
            CHECK_THROWS_AS(chunk::parse(bytes), checksum_mismatch_error);
        }

        SUBCASE("non-ASCII type byte") {
            auto bytes = secret_message_chunk();
            bytes[5] = std::byte(0xF5);
            CHECK_THROWS_AS(chunk::parse(bytes), invalid_byte_error);
        }

        SUBCASE("all failures are parse errors") {
            CHECK_THROWS_AS(chunk::parse(std::vector<std::byte>{}), parse_error);
            CHECK_THROWS_AS(chunk::parse(raw_chunk(42, "RuSt", secret_message, 0)), parse_error);
        }
    }

    TEST_CASE("chunk parse from raw memory") {
        auto bytes = secret_message_chunk();
        auto c = chunk::parse(bytes.data(), bytes.size());
        CHECK(c.crc() == secret_message_crc);
    }

    TEST_CASE("parsed chunk owns its data") {
        auto bytes = secret_message_chunk();
        auto c = chunk::parse(bytes);
        bytes[8] = std::byte('X');
        CHECK(c.data_as_string() == secret_message);
    }

    TEST_CASE("chunk equality") {
        chunk a(chunk_type("RuSt"), "one");
        chunk b(chunk_type("RuSt"), "one");
        chunk c(chunk_type("RuSt"), "two");
        chunk d(chunk_type("RuST"), "one");

        CHECK(a == b);
        CHECK(a != c);
        CHECK(a != d);
    }
}
