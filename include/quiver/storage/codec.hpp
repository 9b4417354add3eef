#pragma once

/** \file codec.hpp
 *  \brief Binary encoding helpers for persisted blobs.
 *
 * Layout of a sealed blob:
 *   [u8 flags][u64 raw_size][payload][u32 crc32c]
 * flags bit0 = payload is zstd-compressed. The CRC covers every byte before it.
 * Integers are stored little-endian (host order on supported targets).
 */

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "quiver/error.hpp"

namespace quiver::storage {

/** \brief Append-only little-endian writer. */
class ByteWriter {
public:
    void put_u8(std::uint8_t v) { buf_.push_back(v); }
    void put_u32(std::uint32_t v) { put_raw(&v, sizeof(v)); }
    void put_u64(std::uint64_t v) { put_raw(&v, sizeof(v)); }
    void put_i64(std::int64_t v) { put_raw(&v, sizeof(v)); }
    void put_f32(float v) { put_raw(&v, sizeof(v)); }
    void put_f64(double v) { put_raw(&v, sizeof(v)); }

    void put_bytes(std::span<const std::uint8_t> bytes) {
        put_u32(static_cast<std::uint32_t>(bytes.size()));
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }
    void put_string(std::string_view s) {
        put_u32(static_cast<std::uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }
    /** \brief Raw floats without a length prefix (the reader knows the count). */
    void put_floats(std::span<const float> v) { put_raw(v.data(), v.size_bytes()); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return buf_.size(); }
    [[nodiscard]] auto view() const noexcept -> std::span<const std::uint8_t> { return buf_; }
    auto take() && -> std::vector<std::uint8_t> { return std::move(buf_); }

private:
    void put_raw(const void* p, std::size_t n) {
        const auto* b = static_cast<const std::uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }

    std::vector<std::uint8_t> buf_;
};

/** \brief Bounds-checked reader. Failure is sticky: once a read underruns,
 *  every later read yields zero values and ok() stays false.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> bytes) noexcept : bytes_(bytes) {}

    auto u8() noexcept -> std::uint8_t { std::uint8_t v{}; get_raw(&v, sizeof(v)); return v; }
    auto u32() noexcept -> std::uint32_t { std::uint32_t v{}; get_raw(&v, sizeof(v)); return v; }
    auto u64() noexcept -> std::uint64_t { std::uint64_t v{}; get_raw(&v, sizeof(v)); return v; }
    auto i64() noexcept -> std::int64_t { std::int64_t v{}; get_raw(&v, sizeof(v)); return v; }
    auto f32() noexcept -> float { float v{}; get_raw(&v, sizeof(v)); return v; }
    auto f64() noexcept -> double { double v{}; get_raw(&v, sizeof(v)); return v; }

    auto bytes() -> std::vector<std::uint8_t>;
    auto string() -> std::string;
    auto floats(std::size_t count) -> std::vector<float>;

    [[nodiscard]] auto ok() const noexcept -> bool { return ok_; }
    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return bytes_.size() - pos_; }
    [[nodiscard]] auto exhausted() const noexcept -> bool { return ok_ && pos_ == bytes_.size(); }

private:
    auto get_raw(void* out, std::size_t n) noexcept -> bool {
        if (!ok_ || n > bytes_.size() - pos_) {
            ok_ = false;
            return false;
        }
        std::memcpy(out, bytes_.data() + pos_, n);
        pos_ += n;
        return true;
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t pos_{0};
    bool ok_{true};
};

/** \brief CRC-32C (Castagnoli, reflected polynomial 0x82F63B78). */
auto crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t;

/** \brief Whether zstd support was compiled in (QUIVER_HAS_ZSTD). */
auto compression_available() noexcept -> bool;

/** \brief Wrap a payload into a sealed blob, zstd-compressing it when asked and worthwhile.
 *
 * Compression is skipped (stored raw) when zstd is unavailable or does not shrink the payload.
 */
auto seal(std::span<const std::uint8_t> payload, bool compress)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Verify and unwrap a sealed blob.
 *
 * \return The raw payload; data_integrity on CRC/size mismatch, unsupported when the
 *         blob is compressed and zstd is not compiled in.
 */
auto unseal(std::span<const std::uint8_t> blob)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace quiver::storage
