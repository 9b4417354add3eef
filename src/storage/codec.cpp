#include "quiver/storage/codec.hpp"
#include "quiver/core/platform_utils.hpp"

#include <array>
#include <limits>

#ifdef QUIVER_HAS_ZSTD
#include <zstd.h>
#endif

namespace quiver::storage {

namespace {

constexpr std::uint8_t kFlagZstd = 0x1;
constexpr std::size_t kHeaderSize = 1 + 8;
constexpr std::size_t kTrailerSize = 4;

constexpr std::array<std::uint32_t, 256> kCrc32cTable = [] {
    std::array<std::uint32_t, 256> t{};
    constexpr std::uint32_t poly = 0x82F63B78u;
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
        t[i] = c;
    }
    return t;
}();

#ifdef QUIVER_HAS_ZSTD
auto zstd_level() -> int {
    // QUIVER_ZSTD_LEVEL in [1, 19]; default 3.
    if (auto v = core::env_unsigned("QUIVER_ZSTD_LEVEL"); v && *v >= 1 && *v <= 19) {
        return static_cast<int>(*v);
    }
    return 3;
}
#endif

} // namespace

auto ByteReader::bytes() -> std::vector<std::uint8_t> {
    const std::uint32_t n = u32();
    if (!ok_ || n > remaining()) {
        ok_ = false;
        return {};
    }
    std::vector<std::uint8_t> out(bytes_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                  bytes_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return out;
}

auto ByteReader::string() -> std::string {
    const std::uint32_t n = u32();
    if (!ok_ || n > remaining()) {
        ok_ = false;
        return {};
    }
    std::string out(reinterpret_cast<const char*>(bytes_.data() + pos_), n);
    pos_ += n;
    return out;
}

auto ByteReader::floats(std::size_t count) -> std::vector<float> {
    if (!ok_ || count > remaining() / sizeof(float)) {
        ok_ = false;
        return {};
    }
    std::vector<float> out(count);
    get_raw(out.data(), count * sizeof(float));
    return out;
}

auto crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t {
    std::uint32_t c = ~0u;
    for (auto b : bytes) c = kCrc32cTable[(c ^ b) & 0xFFu] ^ (c >> 8);
    return ~c;
}

auto compression_available() noexcept -> bool {
#ifdef QUIVER_HAS_ZSTD
    return true;
#else
    return false;
#endif
}

auto seal(std::span<const std::uint8_t> payload, bool compress)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    std::vector<std::uint8_t> out;
    std::uint8_t flags = 0;
    const std::uint64_t raw_size = payload.size();

    out.resize(kHeaderSize);
#ifdef QUIVER_HAS_ZSTD
    if (compress && !payload.empty()) {
        const std::size_t bound = ZSTD_compressBound(payload.size());
        std::vector<std::uint8_t> packed(bound);
        const std::size_t got = ZSTD_compress(packed.data(), bound, payload.data(), payload.size(),
                                              zstd_level());
        if (ZSTD_isError(got)) {
            return core::make_error(core::error_code::internal,
                                    std::string("zstd compress failed: ") + ZSTD_getErrorName(got),
                                    "storage.codec");
        }
        if (got < payload.size()) {
            flags |= kFlagZstd;
            out.insert(out.end(), packed.begin(), packed.begin() + static_cast<std::ptrdiff_t>(got));
        }
    }
#else
    (void)compress;
#endif
    if ((flags & kFlagZstd) == 0) {
        out.insert(out.end(), payload.begin(), payload.end());
    }

    out[0] = flags;
    std::memcpy(out.data() + 1, &raw_size, sizeof(raw_size));
    const std::uint32_t crc = crc32c(out);
    const auto* c = reinterpret_cast<const std::uint8_t*>(&crc);
    out.insert(out.end(), c, c + sizeof(crc));
    return out;
}

auto unseal(std::span<const std::uint8_t> blob)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    using core::error_code;
    if (blob.size() < kHeaderSize + kTrailerSize) {
        return core::make_error(error_code::data_integrity, "blob truncated", "storage.codec");
    }
    const std::size_t body = blob.size() - kTrailerSize;
    std::uint32_t expect = 0;
    std::memcpy(&expect, blob.data() + body, sizeof(expect));
    if (crc32c(blob.first(body)) != expect) {
        return core::make_error(error_code::data_integrity, "blob checksum mismatch", "storage.codec");
    }

    const std::uint8_t flags = blob[0];
    std::uint64_t raw_size = 0;
    std::memcpy(&raw_size, blob.data() + 1, sizeof(raw_size));
    const auto payload = blob.subspan(kHeaderSize, body - kHeaderSize);

    if ((flags & kFlagZstd) == 0) {
        if (payload.size() != raw_size) {
            return core::make_error(error_code::data_integrity, "blob size mismatch", "storage.codec");
        }
        return std::vector<std::uint8_t>(payload.begin(), payload.end());
    }

#ifdef QUIVER_HAS_ZSTD
    if (raw_size > std::numeric_limits<std::uint32_t>::max()) {
        return core::make_error(error_code::data_integrity, "implausible blob size", "storage.codec");
    }
    std::vector<std::uint8_t> out(static_cast<std::size_t>(raw_size));
    const std::size_t got = ZSTD_decompress(out.data(), out.size(), payload.data(), payload.size());
    if (ZSTD_isError(got) || got != out.size()) {
        return core::make_error(error_code::data_integrity, "zstd decompress failed", "storage.codec");
    }
    return out;
#else
    return core::make_error(error_code::unsupported,
                            "blob is zstd-compressed but zstd support is not built in",
                            "storage.codec");
#endif
}

} // namespace quiver::storage
