// test_binary_format.cpp - Tests for the tagged binary Serializer/Deserializer

#include <catch2/catch_all.hpp>
#include <dltypes/binary_format.h>
#include <dltypes/codec.h>

#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

using namespace dltypes;

// ============================================================
// Layout
// ============================================================

TEST_CASE("BinarySerializer layout", "[binary][layout]") {
    SECTION("bool") {
        BinarySerializer s;
        s.write_bool(true);
        REQUIRE(s.buffer() == ByteBuffer{binary_tag::boolean, 0x01});
    }

    SECTION("signed integer is tag + 8 bytes") {
        BinarySerializer s;
        s.write_i64(-2);
        const auto& buf = s.buffer();
        REQUIRE(buf.size() == 9);
        REQUIRE(buf[0] == binary_tag::int64);
        int64_t v;
        std::memcpy(&v, buf.data() + 1, sizeof(v));
        REQUIRE(v == -2);
    }

    SECTION("string is tag + length + bytes") {
        BinarySerializer s;
        s.write_string("hey");
        REQUIRE(s.buffer() == ByteBuffer{binary_tag::string, 3, 0, 0, 0, 'h', 'e', 'y'});
    }

    SECTION("optional none and some") {
        BinarySerializer s;
        s.begin_option(false);
        s.begin_option(true);
        s.write_bool(false);
        REQUIRE(s.buffer() == ByteBuffer{binary_tag::none, binary_tag::some, binary_tag::boolean, 0x00});
    }

    SECTION("sequence records its element count") {
        BinarySerializer s;
        s.begin_seq(2);
        s.write_bool(true);
        s.write_bool(false);
        s.end_seq();
        REQUIRE(s.buffer() == ByteBuffer{binary_tag::sequence, 2, 0, 0, 0,
                                         binary_tag::boolean, 0x01,
                                         binary_tag::boolean, 0x00});
    }

    SECTION("struct records its field count, not its field names") {
        BinarySerializer s;
        s.begin_struct("Flag", 1);
        s.field("on");
        s.write_bool(true);
        s.end_struct();
        REQUIRE(s.buffer() == ByteBuffer{binary_tag::record, 1, 0, 0, 0, binary_tag::boolean, 0x01});
    }

    SECTION("counts beyond the u32 length field are rejected before writing") {
        BinarySerializer s;
        s.write_bool(true);
        REQUIRE_THROWS_AS(s.begin_seq(std::size_t{1} << 32), std::length_error);
        REQUIRE_THROWS_AS(s.begin_struct("Wide", std::size_t{1} << 32), std::length_error);
        REQUIRE(s.buffer() == ByteBuffer{binary_tag::boolean, 0x01});
    }

    SECTION("largest u32 count is accepted") {
        BinarySerializer s;
        s.begin_seq(0xFFFFFFFFu);
        REQUIRE(s.buffer() == ByteBuffer{binary_tag::sequence, 0xFF, 0xFF, 0xFF, 0xFF});
    }

    SECTION("take empties the serializer") {
        BinarySerializer s;
        s.write_bool(true);
        auto bytes = s.take();
        REQUIRE(bytes.size() == 2);
        REQUIRE(s.buffer().empty());
    }
}

// ============================================================
// Reading
// ============================================================

TEST_CASE("BinaryDeserializer reads what BinarySerializer writes", "[binary][read]") {
    BinarySerializer s;
    s.write_i64(std::numeric_limits<int64_t>::min());
    s.write_u64(std::numeric_limits<uint64_t>::max());
    s.write_f64(0.1);
    s.write_string("");
    s.begin_seq(1);
    s.write_bool(true);
    s.end_seq();
    auto bytes = s.take();

    BinaryDeserializer d(bytes);
    REQUIRE(d.read_i64() == std::numeric_limits<int64_t>::min());
    REQUIRE(d.read_u64() == std::numeric_limits<uint64_t>::max());
    REQUIRE(d.read_f64() == 0.1);
    REQUIRE(d.read_string().empty());
    REQUIRE(d.begin_seq() == 1);
    REQUIRE(d.has_next());
    REQUIRE(d.read_bool());
    REQUIRE_FALSE(d.has_next());
    d.end_seq();
    REQUIRE_NOTHROW(d.finish());
    REQUIRE(d.position() == bytes.size());
}

// ============================================================
// Errors
// ============================================================

TEST_CASE("BinaryDeserializer rejects malformed input", "[binary][error]") {
    SECTION("empty buffer") {
        ByteBuffer empty;
        BinaryDeserializer d(empty);
        REQUIRE_THROWS_AS(d.read_bool(), MalformedValue);
    }

    SECTION("tag mismatch") {
        ByteBuffer buf{binary_tag::boolean, 0x01};
        BinaryDeserializer d(buf);
        REQUIRE_THROWS_WITH(d.read_string(), Catch::Matchers::ContainsSubstring("Expected string"));
    }

    SECTION("invalid bool byte") {
        ByteBuffer buf{binary_tag::boolean, 0x02};
        BinaryDeserializer d(buf);
        REQUIRE_THROWS_AS(d.read_bool(), MalformedValue);
    }

    SECTION("truncated integer") {
        ByteBuffer buf{binary_tag::int64, 1, 2, 3};
        BinaryDeserializer d(buf);
        REQUIRE_THROWS_WITH(d.read_i64(), Catch::Matchers::ContainsSubstring("Unexpected end of buffer"));
    }

    SECTION("string length past the end") {
        ByteBuffer buf{binary_tag::string, 10, 0, 0, 0, 'a'};
        BinaryDeserializer d(buf);
        REQUIRE_THROWS_AS(d.read_string(), MalformedValue);
    }

    SECTION("invalid option tag") {
        ByteBuffer buf{binary_tag::string};
        BinaryDeserializer d(buf);
        REQUIRE_THROWS_AS(d.read_option(), MalformedValue);
    }

    SECTION("struct field count mismatch") {
        ByteBuffer buf{binary_tag::record, 3, 0, 0, 0};
        BinaryDeserializer d(buf);
        REQUIRE_THROWS_AS(d.begin_struct("Pair", 2), MalformedValue);
    }

    SECTION("sequence closed with unread elements") {
        ByteBuffer buf{binary_tag::sequence, 2, 0, 0, 0, binary_tag::boolean, 0x01, binary_tag::boolean, 0x00};
        BinaryDeserializer d(buf);
        d.begin_seq();
        d.expect_element();
        (void)d.read_bool();
        REQUIRE_THROWS_AS(d.end_seq(), MalformedValue);
    }

    SECTION("trailing bytes") {
        ByteBuffer buf{binary_tag::boolean, 0x01, 0xFF};
        BinaryDeserializer d(buf);
        REQUIRE(d.read_bool());
        REQUIRE_THROWS_WITH(d.finish(), Catch::Matchers::ContainsSubstring("trailing"));
    }

    SECTION("trailing bytes through from_bytes") {
        ByteBuffer buf{binary_tag::boolean, 0x01, 0xFF};
        REQUIRE_THROWS_AS(from_bytes<bool>(buf), MalformedValue);
    }
}
