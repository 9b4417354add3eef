#include "quiver/storage/vector_store.hpp"
#include "quiver/core/platform_utils.hpp"
#include "quiver/storage/codec.hpp"

#include <charconv>
#include <cstdio>
#include <iostream>
#include <shared_mutex>
#include <thread>

#include "roaring64map.hh"

namespace quiver::storage {

namespace {

constexpr std::uint8_t kRecordVersion = 1;
constexpr std::string_view kVecPrefix = "vec/";

enum class AttrTag : std::uint8_t { string = 0, real = 1, integer = 2, boolean = 3 };

auto parse_key(std::string_view key) -> std::optional<VectorId> {
    if (!key.starts_with(kVecPrefix)) return std::nullopt;
    const auto hex = key.substr(kVecPrefix.size());
    if (hex.size() != 16) return std::nullopt;
    VectorId id = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), id, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size()) return std::nullopt;
    return id;
}

auto record_bytes(const VectorRecord& r) -> std::size_t {
    std::size_t n = sizeof(VectorRecord) + r.values.size() * sizeof(float) + r.code.size();
    for (const auto& [name, value] : r.attributes) {
        n += name.size() + sizeof(AttributeValue);
        if (const auto* s = std::get_if<std::string>(&value)) n += s->size();
    }
    return n;
}

} // namespace

auto encode_record(const VectorRecord& record) -> std::vector<std::uint8_t> {
    ByteWriter out;
    out.put_u8(kRecordVersion);
    out.put_u32(static_cast<std::uint32_t>(record.values.size()));
    out.put_floats(record.values);
    out.put_bytes(record.code);
    out.put_u64(record.code_generation);
    out.put_u32(static_cast<std::uint32_t>(record.attributes.size()));
    for (const auto& [name, value] : record.attributes) {
        out.put_string(name);
        if (const auto* s = std::get_if<std::string>(&value)) {
            out.put_u8(static_cast<std::uint8_t>(AttrTag::string));
            out.put_string(*s);
        } else if (const auto* d = std::get_if<double>(&value)) {
            out.put_u8(static_cast<std::uint8_t>(AttrTag::real));
            out.put_f64(*d);
        } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
            out.put_u8(static_cast<std::uint8_t>(AttrTag::integer));
            out.put_i64(*i);
        } else {
            out.put_u8(static_cast<std::uint8_t>(AttrTag::boolean));
            out.put_u8(std::get<bool>(value) ? 1 : 0);
        }
    }
    return std::move(out).take();
}

auto decode_record(std::span<const std::uint8_t> bytes) -> std::expected<VectorRecord, core::error> {
    auto corrupt = [](const char* what) {
        return core::make_error(core::error_code::data_integrity, what, "storage.vector_store");
    };
    ByteReader in(bytes);
    if (in.u8() != kRecordVersion) return corrupt("unknown record version");
    VectorRecord r;
    const std::uint32_t dim = in.u32();
    if (!in.ok() || dim > in.remaining() / sizeof(float)) return corrupt("bad vector length");
    r.values = in.floats(dim);
    r.code = in.bytes();
    r.code_generation = in.u64();
    const std::uint32_t nattrs = in.u32();
    for (std::uint32_t i = 0; i < nattrs && in.ok(); ++i) {
        auto name = in.string();
        switch (static_cast<AttrTag>(in.u8())) {
            case AttrTag::string: r.attributes.emplace(std::move(name), in.string()); break;
            case AttrTag::real: r.attributes.emplace(std::move(name), in.f64()); break;
            case AttrTag::integer: r.attributes.emplace(std::move(name), in.i64()); break;
            case AttrTag::boolean: r.attributes.emplace(std::move(name), in.u8() != 0); break;
            default: return corrupt("unknown attribute tag");
        }
    }
    if (!in.exhausted()) return corrupt("truncated or oversized record");
    return r;
}

class VectorStore::Impl {
public:
    Impl(std::shared_ptr<BlobStore> blobs, const VectorStoreConfig& config)
        : blobs_(std::move(blobs)), config_(config),
          cache_(config.cache_bytes, config.cache_shards),
          debug_(core::debug_enabled("QUIVER_STORE_DEBUG")) {}

    /** \brief Run op, retrying transient failures with exponential backoff. */
    template <typename Op>
    auto with_retry(const char* what, std::string_view key, Op&& op) const -> decltype(op()) {
        auto delay = config_.initial_backoff;
        for (std::uint32_t attempt = 0;; ++attempt) {
            auto r = op();
            if (r || !core::is_transient(r.error().code) || attempt >= config_.max_retries) {
                if (!r && debug_ && core::is_transient(r.error().code)) {
                    std::cerr << "[quiver][store][retry] " << what << " " << key << " giving up after "
                              << attempt + 1 << " attempts: " << r.error().message << std::endl;
                }
                return r;
            }
            if (debug_) {
                std::cerr << "[quiver][store][retry] " << what << " " << key << " attempt="
                          << attempt + 1 << " backoff_ms=" << delay.count() << std::endl;
            }
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

    auto load(VectorId id) const -> std::expected<RecordPtr, core::error> {
        if (!contains(id)) {
            return core::make_error(core::error_code::not_found,
                                    "vector " + std::to_string(id) + " not found", "storage.vector_store");
        }
        if (auto hit = cache_.get(id)) return *hit;

        // Held across the read and the cache fill so a concurrent put cannot be
        // shadowed by the record it replaced.
        std::shared_lock io(io_mutex_);
        if (auto hit = cache_.get(id)) return *hit;
        const auto key = key_for(id);
        auto blob = with_retry("read", key, [&] { return blobs_->read(key); });
        if (!blob) return std::unexpected(blob.error());
        auto payload = unseal(*blob);
        if (!payload) return std::unexpected(payload.error());
        auto record = decode_record(*payload);
        if (!record) return std::unexpected(record.error());

        auto ptr = std::make_shared<const VectorRecord>(std::move(*record));
        cache_.put(id, ptr, record_bytes(*ptr));
        return ptr;
    }

    auto contains(VectorId id) const -> bool {
        std::shared_lock lock(ids_mutex_);
        return ids_.contains(id);
    }

    auto snapshot_ids() const -> std::vector<VectorId> {
        std::shared_lock lock(ids_mutex_);
        std::vector<VectorId> out;
        out.reserve(ids_.cardinality());
        for (auto it = ids_.begin(); it != ids_.end(); ++it) out.push_back(*it);
        return out;
    }

    std::shared_ptr<BlobStore> blobs_;
    VectorStoreConfig config_;
    mutable cache::ShardedLruCache<VectorId, RecordPtr> cache_;
    mutable std::shared_mutex ids_mutex_;
    mutable std::shared_mutex io_mutex_;
    roaring::Roaring64Map ids_;
    bool debug_;
};

VectorStore::VectorStore() = default;
VectorStore::~VectorStore() = default;
VectorStore::VectorStore(VectorStore&&) noexcept = default;
VectorStore& VectorStore::operator=(VectorStore&&) noexcept = default;

auto VectorStore::key_for(VectorId id) -> std::string {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(id));
    return std::string(kVecPrefix) + buf;
}

auto VectorStore::open(std::shared_ptr<BlobStore> blobs, const VectorStoreConfig& config)
    -> std::expected<VectorStore, core::error> {
    if (!blobs) {
        return core::make_error(core::error_code::precondition_failed, "blob store is null",
                                "storage.vector_store");
    }
    VectorStore store;
    store.impl_ = std::make_unique<Impl>(std::move(blobs), config);
    auto& impl = *store.impl_;

    auto keys = impl.with_retry("list", kVecPrefix, [&] { return impl.blobs_->list(kVecPrefix); });
    if (!keys) return std::unexpected(keys.error());
    std::size_t skipped = 0;
    for (const auto& key : *keys) {
        if (auto id = parse_key(key)) {
            impl.ids_.add(*id);
        } else {
            ++skipped;
        }
    }
    if (impl.debug_) {
        std::cerr << "[quiver][store][open] records=" << impl.ids_.cardinality()
                  << " skipped_keys=" << skipped << std::endl;
    }
    return store;
}

auto VectorStore::put(VectorId id, VectorRecord record) -> std::expected<void, core::error> {
    auto sealed = seal(encode_record(record), impl_->config_.compress);
    if (!sealed) return std::unexpected(sealed.error());

    const auto key = key_for(id);
    std::unique_lock io(impl_->io_mutex_);
    auto w = impl_->with_retry("write", key, [&] { return impl_->blobs_->write(key, *sealed); });
    if (!w) return std::unexpected(w.error());

    {
        std::unique_lock lock(impl_->ids_mutex_);
        impl_->ids_.add(id);
    }
    auto ptr = std::make_shared<const VectorRecord>(std::move(record));
    impl_->cache_.put(id, ptr, record_bytes(*ptr));
    return {};
}

auto VectorStore::get(VectorId id) const -> std::expected<RecordPtr, core::error> {
    return impl_->load(id);
}

auto VectorStore::remove(VectorId id) -> std::expected<void, core::error> {
    if (!impl_->contains(id)) {
        return core::make_error(core::error_code::not_found,
                                "vector " + std::to_string(id) + " not found", "storage.vector_store");
    }
    const auto key = key_for(id);
    std::unique_lock io(impl_->io_mutex_);
    auto r = impl_->with_retry("remove", key, [&] { return impl_->blobs_->remove(key); });
    if (!r) return std::unexpected(r.error());
    {
        std::unique_lock lock(impl_->ids_mutex_);
        impl_->ids_.remove(id);
    }
    impl_->cache_.remove(id);
    return {};
}

auto VectorStore::contains(VectorId id) const -> bool { return impl_->contains(id); }

auto VectorStore::size() const -> std::uint64_t {
    std::shared_lock lock(impl_->ids_mutex_);
    return impl_->ids_.cardinality();
}

auto VectorStore::ids() const -> std::vector<VectorId> { return impl_->snapshot_ids(); }

auto VectorStore::cursor() const -> Cursor { return Cursor(impl_.get()); }

auto VectorStore::cache_stats() const -> cache::CacheStats { return impl_->cache_.stats(); }

void VectorStore::Cursor::rewind() {
    ids_ = store_->snapshot_ids();
    pos_ = 0;
}

auto VectorStore::Cursor::next()
    -> std::expected<std::optional<std::pair<VectorId, RecordPtr>>, core::error> {
    while (pos_ < ids_.size()) {
        const VectorId id = ids_[pos_++];
        auto record = store_->load(id);
        if (record) return std::make_pair(id, std::move(*record));
        if (record.error().code != core::error_code::not_found) return std::unexpected(record.error());
        // Removed since the snapshot.
    }
    return std::nullopt;
}

} // namespace quiver::storage
