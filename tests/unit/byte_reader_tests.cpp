#include <doctest/doctest.h>
#include <gbl/byte_reader.hpp>

#include <cstdint>
#include <limits>
#include <vector>

using gbl::read_be32;
using gbl::read_le32;

TEST_CASE("read_le32 and read_be32 interpret the same bytes in opposite order") {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};

    REQUIRE(read_le32(data, 0).has_value());
    CHECK(*read_le32(data, 0) == 0x04030201u);
    CHECK(*read_be32(data, 0) == 0x01020304u);

    CHECK(*read_le32(data, 1) == 0x05040302u);
    CHECK(*read_be32(data, 1) == 0x02030405u);
}

TEST_CASE("field readers reject reads past the end of the buffer") {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};

    CHECK_FALSE(read_le32(data, 2).has_value());
    CHECK_FALSE(read_be32(data, 2).has_value());
    CHECK_FALSE(read_le32(data, 5).has_value());
    CHECK_FALSE(read_be32(data, 100).has_value());
    CHECK_FALSE(read_le32(data, std::numeric_limits<size_t>::max()).has_value());

    std::vector<uint8_t> empty;
    CHECK_FALSE(read_le32(empty, 0).has_value());
}

TEST_CASE("field readers handle the full unsigned range") {
    std::vector<uint8_t> data = {0xFF, 0xFF, 0xFF, 0xFE};
    CHECK(*read_le32(data, 0) == 0xFEFFFFFFu);
    CHECK(*read_be32(data, 0) == 0xFFFFFFFEu);
}
