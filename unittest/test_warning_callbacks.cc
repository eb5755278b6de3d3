//
// Test warning callback functionality across different scenarios
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_io.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <algorithm>
#include <functional>
#include <sstream>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    const warning_info* find(std::string_view category) const {
        auto it = std::find_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
        return it == warnings.end() ? nullptr : &*it;
    }
};

namespace {
    std::vector<std::byte> encode(const chunk_type::bytes_type& type, std::string_view payload) {
        return chunk(chunk_type(type), payload).as_bytes();
    }

    chunk_type::bytes_type bytes_of(std::string_view name) {
        return {std::byte(name[0]), std::byte(name[1]), std::byte(name[2]), std::byte(name[3])};
    }
}

TEST_CASE("Warning callbacks - clean chunk") {
    warning_tracker tracker;
    parse_options opts;
    opts.on_warning = std::ref(tracker);

    auto c = chunk::parse(secret_message_chunk(), opts);
    CHECK(c.length() == 42);
    CHECK(tracker.warnings.empty());
}

TEST_CASE("Warning callbacks - chunk_name") {
    auto bytes = encode(bytes_of("Ru1t"), "payload");

    SUBCASE("lenient mode reports and accepts") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        auto c = chunk::parse(bytes, opts);
        CHECK(c.type().to_string() == "Ru1t");

        const auto* w = tracker.find("chunk_name");
        REQUIRE(w != nullptr);
        CHECK(w->offset == 4);
        CHECK(w->message.find("Ru1t") != std::string::npos);
    }

    SUBCASE("no handler installed") {
        CHECK_NOTHROW(chunk::parse(bytes));
    }

    SUBCASE("strict mode rejects") {
        parse_options opts;
        opts.strict = true;
        CHECK_THROWS_AS(chunk::parse(bytes, opts), invalid_byte_error);
    }
}

TEST_CASE("Warning callbacks - reserved_bit") {
    auto bytes = chunk(chunk_type("Rust"), "payload").as_bytes();

    SUBCASE("lenient mode reports and accepts") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        auto c = chunk::parse(bytes, opts);
        CHECK_FALSE(c.type().is_valid());

        const auto* w = tracker.find("reserved_bit");
        REQUIRE(w != nullptr);
        CHECK(w->offset == 6);
        CHECK_FALSE(tracker.has_warning("chunk_name"));
    }

    SUBCASE("strict mode rejects") {
        parse_options opts;
        opts.strict = true;
        CHECK_THROWS_AS(chunk::parse(bytes, opts), invalid_byte_error);
    }

    SUBCASE("strict mode accepts valid names") {
        parse_options opts;
        opts.strict = true;
        CHECK_NOTHROW(chunk::parse(secret_message_chunk(), opts));
    }
}

TEST_CASE("Warning callbacks - stream offsets") {
    std::vector<std::byte> bytes = chunk(chunk_types::tEXt, "first").as_bytes();
    auto odd = encode(bytes_of("ab c"), "second");
    bytes.insert(bytes.end(), odd.begin(), odd.end());

    std::istringstream stream(as_string(bytes), std::ios::binary);

    warning_tracker tracker;
    parse_options opts;
    opts.on_warning = std::ref(tracker);

    (void)read_chunk(stream, opts);
    CHECK(tracker.warnings.empty());

    (void)read_chunk(stream, opts);
    const auto* w = tracker.find("chunk_name");
    REQUIRE(w != nullptr);
    // Second chunk starts after 12 + 5 bytes, type field 4 bytes later
    CHECK(w->offset == 21);
}

TEST_CASE("Size limit") {
    parse_options opts;
    opts.max_chunk_size = 16;

    CHECK_NOTHROW(chunk::parse(chunk(chunk_type("RuSt"), "short").as_bytes(), opts));
    CHECK_THROWS_AS(chunk::parse(secret_message_chunk(), opts), size_limit_error);
}
