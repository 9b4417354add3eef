#include <catch2/catch_test_macros.hpp>
#include <quiver/storage/codec.hpp>

#include <string_view>
#include <vector>

using namespace quiver;
using namespace quiver::storage;

namespace {

auto bytes_of(std::string_view s) -> std::vector<std::uint8_t> {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("crc32c matches the Castagnoli check value", "[codec][crc]") {
    REQUIRE(crc32c(bytes_of("123456789")) == 0xE3069283u);
    REQUIRE(crc32c({}) == 0u);
}

TEST_CASE("sealed blobs unseal to their payload", "[codec]") {
    const auto payload = bytes_of("the quick brown fox jumps over the lazy dog");
    for (bool compress : {false, true}) {
        auto sealed = seal(payload, compress);
        REQUIRE(sealed.has_value());
        auto back = unseal(*sealed);
        REQUIRE(back.has_value());
        REQUIRE(*back == payload);
    }

    auto empty = seal({}, true);
    REQUIRE(empty.has_value());
    REQUIRE(unseal(*empty).value().empty());
}

TEST_CASE("compressible payloads shrink when zstd is built in", "[codec][zstd]") {
    const std::vector<std::uint8_t> payload(64 * 1024, 0x42);
    auto sealed = seal(payload, true);
    REQUIRE(sealed.has_value());
    if (compression_available()) {
        REQUIRE(sealed->size() < payload.size() / 4);
    } else {
        REQUIRE(sealed->size() > payload.size());
    }
    REQUIRE(unseal(*sealed).value() == payload);
}

TEST_CASE("unseal detects corruption", "[codec]") {
    auto sealed = seal(bytes_of("payload bytes"), false).value();

    auto flipped = sealed;
    flipped[12] ^= 0x10;
    REQUIRE(unseal(flipped).error().code == core::error_code::data_integrity);

    auto truncated = sealed;
    truncated.resize(truncated.size() - 3);
    REQUIRE(unseal(truncated).error().code == core::error_code::data_integrity);

    REQUIRE(unseal(bytes_of("abc")).error().code == core::error_code::data_integrity);
}

TEST_CASE("byte reader failure is sticky", "[codec]") {
    ByteWriter out;
    out.put_u32(7);
    out.put_string("abc");
    out.put_f64(2.5);
    const auto buf = std::move(out).take();

    ByteReader in(buf);
    REQUIRE(in.u32() == 7u);
    REQUIRE(in.string() == "abc");
    REQUIRE(in.f64() == 2.5);
    REQUIRE(in.exhausted());

    REQUIRE(in.u64() == 0u);
    REQUIRE_FALSE(in.ok());
    REQUIRE(in.u8() == 0u);
    REQUIRE_FALSE(in.exhausted());

    // A length prefix pointing past the end fails rather than over-reading.
    ByteWriter lying;
    lying.put_u32(1000);
    lying.put_u8(1);
    const auto lbuf = std::move(lying).take();
    ByteReader lin(lbuf);
    REQUIRE(lin.bytes().empty());
    REQUIRE_FALSE(lin.ok());
}
