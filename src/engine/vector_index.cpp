#include "quiver/engine/vector_index.hpp"
#include "quiver/core/platform_utils.hpp"
#include "quiver/kernels/distance.hpp"
#include "quiver/storage/codec.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace quiver::engine {

namespace {

constexpr std::uint32_t kHeaderMagic = 0x58495651u;  // "QVIX"
constexpr std::uint32_t kHeaderVersion = 1;
constexpr std::string_view kHeaderKey = "header";
constexpr std::string_view kGraphKey = "graph";
constexpr std::string_view kCodebookKey = "codebook";

struct Header {
    IndexConfig config;
    std::uint64_t generation{0};
    std::uint64_t next_auto_id{0};
};

auto encode_header(const Header& h) -> std::vector<std::uint8_t> {
    const auto& c = h.config;
    storage::ByteWriter out;
    out.put_u32(kHeaderMagic);
    out.put_u32(kHeaderVersion);
    out.put_u32(c.dimension);
    out.put_u8(static_cast<std::uint8_t>(c.metric));
    out.put_u32(c.hnsw.M);
    out.put_u32(c.hnsw.ef_construction);
    out.put_u32(c.hnsw.seed);
    out.put_u8(c.hnsw.keep_pruned_connections ? 1 : 0);
    out.put_u8(static_cast<std::uint8_t>(c.quantizer.kind));
    out.put_u32(c.quantizer.m);
    out.put_u32(c.quantizer.nbits);
    out.put_u32(c.quantizer.max_iter);
    out.put_f32(c.quantizer.epsilon);
    out.put_u32(c.quantizer.seed);
    out.put_u8(c.quantizer.use_rotation ? 1 : 0);
    out.put_u32(c.quantizer.rotation_iters);
    out.put_u32(c.quantizer.min_samples_per_centroid);
    out.put_u64(c.store.cache_bytes);
    out.put_u64(c.store.cache_shards);
    out.put_u32(c.store.max_retries);
    out.put_u64(static_cast<std::uint64_t>(c.store.initial_backoff.count()));
    out.put_u8(c.store.compress ? 1 : 0);
    out.put_u8(c.compress_graph ? 1 : 0);
    out.put_f64(c.auto_compact_ratio);
    out.put_u64(h.generation);
    out.put_u64(h.next_auto_id);
    return std::move(out).take();
}

auto decode_header(std::span<const std::uint8_t> bytes) -> std::expected<Header, core::error> {
    using core::error_code;
    storage::ByteReader in(bytes);
    if (in.u32() != kHeaderMagic || !in.ok()) {
        return core::make_error(error_code::data_integrity, "bad index header", "engine.index");
    }
    if (const auto v = in.u32(); v != kHeaderVersion) {
        return core::make_error(error_code::unsupported,
                                "index format version " + std::to_string(v) + " not supported",
                                "engine.index");
    }
    Header h;
    auto& c = h.config;
    c.dimension = in.u32();
    auto metric = index::metric_from_tag(in.u8());
    if (!metric) return std::unexpected(metric.error());
    c.metric = *metric;
    c.hnsw.M = in.u32();
    c.hnsw.ef_construction = in.u32();
    c.hnsw.seed = in.u32();
    c.hnsw.keep_pruned_connections = in.u8() != 0;
    const auto kind = in.u8();
    if (kind > static_cast<std::uint8_t>(index::QuantizerKind::product)) {
        return core::make_error(error_code::data_integrity, "unknown quantizer kind", "engine.index");
    }
    c.quantizer.kind = static_cast<index::QuantizerKind>(kind);
    c.quantizer.m = in.u32();
    c.quantizer.nbits = in.u32();
    c.quantizer.max_iter = in.u32();
    c.quantizer.epsilon = in.f32();
    c.quantizer.seed = in.u32();
    c.quantizer.use_rotation = in.u8() != 0;
    c.quantizer.rotation_iters = in.u32();
    c.quantizer.min_samples_per_centroid = in.u32();
    c.store.cache_bytes = static_cast<std::size_t>(in.u64());
    c.store.cache_shards = static_cast<std::size_t>(in.u64());
    c.store.max_retries = in.u32();
    c.store.initial_backoff = std::chrono::milliseconds(static_cast<std::int64_t>(in.u64()));
    c.store.compress = in.u8() != 0;
    c.compress_graph = in.u8() != 0;
    c.auto_compact_ratio = in.f64();
    h.generation = in.u64();
    h.next_auto_id = in.u64();
    if (!in.exhausted()) {
        return core::make_error(error_code::data_integrity, "truncated index header", "engine.index");
    }
    if (auto ok = validate(c); !ok) {
        return core::make_error(error_code::data_integrity,
                                "persisted configuration invalid: " + ok.error().message, "engine.index");
    }
    return h;
}

auto read_sealed(const storage::BlobStore& blobs, std::string_view key)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    auto blob = blobs.read(key);
    if (!blob) return std::unexpected(blob.error());
    return storage::unseal(*blob);
}

auto write_sealed(storage::BlobStore& blobs, std::string_view key,
                  std::span<const std::uint8_t> payload, bool compress)
    -> std::expected<void, core::error> {
    auto sealed = storage::seal(payload, compress);
    if (!sealed) return std::unexpected(sealed.error());
    return blobs.write(key, *sealed);
}

} // namespace

class VectorIndex::Impl {
public:
    Impl(IndexConfig config, std::shared_ptr<storage::BlobStore> blobs, storage::VectorStore store,
         index::HnswGraph graph, index::LevelGenerator levels)
        : config_(std::move(config)), blobs_(std::move(blobs)), store_(std::move(store)),
          graph_(std::move(graph)), levels_(std::move(levels)),
          debug_(core::debug_enabled("QUIVER_DEBUG")) {}

    auto header() const -> Header {
        return Header{config_, generation_.load(), next_auto_id_};
    }

    auto write_header() -> std::expected<void, core::error> {
        return write_sealed(*blobs_, kHeaderKey, encode_header(header()), false);
    }

    auto insert_locked(index::VectorId id, std::span<const float> vec, Attributes attributes,
                       bool overwrite) -> std::expected<void, core::error>;

    auto check_writable() const -> std::expected<void, core::error> {
        if (graph_.needs_rebuild()) {
            return core::make_error(core::error_code::internal_inconsistency,
                                    "index is read-only until compact()", "engine.index");
        }
        return {};
    }

    IndexConfig config_;
    std::shared_ptr<storage::BlobStore> blobs_;
    storage::VectorStore store_;
    index::HnswGraph graph_;
    index::LevelGenerator levels_;
    std::atomic<std::shared_ptr<const index::Codebook>> codebook_;
    std::atomic<std::uint64_t> generation_{0};
    std::uint64_t next_auto_id_{0};
    std::mutex writer_mutex_;
    bool debug_;
};

auto VectorIndex::Impl::insert_locked(index::VectorId id, std::span<const float> vec,
                                      Attributes attributes, bool overwrite)
    -> std::expected<void, core::error> {
    using core::error_code;
    if (auto ok = check_writable(); !ok) return ok;
    if (vec.size() != config_.dimension) {
        return core::make_error(error_code::dimension_mismatch,
                                "expected dimension " + std::to_string(config_.dimension) + ", got " +
                                    std::to_string(vec.size()),
                                "engine.index");
    }
    if (!overwrite && graph_.contains(id)) {
        return core::make_error(error_code::duplicate_id, "id " + std::to_string(id) + " already present",
                                "engine.index");
    }

    storage::VectorRecord record;
    record.values.assign(vec.begin(), vec.end());
    if (index::needs_normalization(config_.metric)) kernels::normalize(record.values);
    record.attributes = std::move(attributes);

    if (auto cb = codebook_.load()) {
        record.code.resize(cb->code_size());
        if (auto r = cb->encode(record.values, record.code); !r) return std::unexpected(r.error());
        record.code_generation = generation_.load();
    }

    std::shared_ptr<const storage::VectorRecord> previous;
    if (store_.contains(id)) {
        auto old = store_.get(id);
        if (!old) return std::unexpected(old.error());
        previous = std::move(*old);
    }
    auto values = record.values;
    auto code = record.code;
    const auto gen = record.code_generation;
    if (auto r = store_.put(id, std::move(record)); !r) return std::unexpected(r.error());

    if (auto r = graph_.insert(id, values, std::move(code), gen, levels_, overwrite); !r) {
        auto undo = previous ? store_.put(id, *previous) : store_.remove(id);
        if (!undo && debug_) {
            std::cerr << "[quiver][index][insert] rollback of id " << id
                      << " failed: " << undo.error().message << std::endl;
        }
        return std::unexpected(r.error());
    }
    next_auto_id_ = std::max(next_auto_id_, id + 1);
    return {};
}

VectorIndex::VectorIndex() = default;
VectorIndex::~VectorIndex() = default;
VectorIndex::VectorIndex(VectorIndex&&) noexcept = default;
VectorIndex& VectorIndex::operator=(VectorIndex&&) noexcept = default;

auto VectorIndex::create(IndexConfig config, std::shared_ptr<storage::BlobStore> blobs)
    -> std::expected<VectorIndex, core::error> {
    using core::error_code;
    if (!blobs) {
        return core::make_error(error_code::precondition_failed, "blob store is null", "engine.index");
    }
    apply_env_overrides(config);
    if (auto ok = validate(config); !ok) return std::unexpected(ok.error());

    if (auto existing = blobs->read(kHeaderKey); existing) {
        return core::make_error(error_code::precondition_failed, "blob store already holds an index",
                                "engine.index");
    } else if (existing.error().code != error_code::not_found) {
        return std::unexpected(existing.error());
    }

    auto store = storage::VectorStore::open(blobs, config.store);
    if (!store) return std::unexpected(store.error());
    if (store->size() != 0) {
        return core::make_error(error_code::precondition_failed,
                                "blob store holds vector records but no index header", "engine.index");
    }
    auto graph = index::HnswGraph::create(config.dimension, config.metric, config.hnsw);
    if (!graph) return std::unexpected(graph.error());

    index::LevelGenerator levels(config.hnsw.seed, config.hnsw.M);
    VectorIndex out;
    out.impl_ = std::make_unique<Impl>(std::move(config), std::move(blobs), std::move(*store),
                                       std::move(*graph), std::move(levels));
    if (auto w = out.impl_->write_header(); !w) return std::unexpected(w.error());
    return out;
}

auto VectorIndex::open(std::shared_ptr<storage::BlobStore> blobs)
    -> std::expected<VectorIndex, core::error> {
    using core::error_code;
    if (!blobs) {
        return core::make_error(error_code::precondition_failed, "blob store is null", "engine.index");
    }
    const bool dbg = core::debug_enabled("QUIVER_DEBUG");

    auto raw_header = read_sealed(*blobs, kHeaderKey);
    if (!raw_header) return std::unexpected(raw_header.error());
    auto header = decode_header(*raw_header);
    if (!header) return std::unexpected(header.error());
    const auto& config = header->config;

    auto store = storage::VectorStore::open(blobs, config.store);
    if (!store) return std::unexpected(store.error());

    std::shared_ptr<const index::Codebook> codebook;
    if (header->generation > 0) {
        auto raw = read_sealed(*blobs, kCodebookKey);
        if (!raw) return std::unexpected(raw.error());
        auto cb = index::deserialize_codebook(*raw);
        if (!cb) return std::unexpected(cb.error());
        if ((*cb)->dimension() != config.dimension) {
            return core::make_error(error_code::data_integrity, "codebook dimension differs from index",
                                    "engine.index");
        }
        codebook = std::move(*cb);
    }

    const index::NodeLoader loader = [&store](index::VectorId id)
        -> std::expected<std::optional<index::NodePayload>, core::error> {
        auto rec = store->get(id);
        if (!rec) {
            if (rec.error().code == core::error_code::not_found) return std::nullopt;
            return std::unexpected(rec.error());
        }
        return index::NodePayload{(*rec)->values, (*rec)->code, (*rec)->code_generation};
    };

    std::optional<index::HnswGraph> graph;
    if (auto raw = read_sealed(*blobs, kGraphKey); raw) {
        auto g = index::HnswGraph::deserialize(*raw, loader);
        if (g) {
            graph.emplace(std::move(*g));
        } else if (g.error().code != error_code::data_integrity) {
            return std::unexpected(g.error());
        } else if (dbg) {
            std::cerr << "[quiver][index][open] graph blob unusable, rebuilding: " << g.error().message
                      << std::endl;
        }
    } else if (raw.error().code != error_code::not_found && raw.error().code != error_code::data_integrity) {
        return std::unexpected(raw.error());
    }
    if (!graph) {
        auto g = index::HnswGraph::create(config.dimension, config.metric, config.hnsw);
        if (!g) return std::unexpected(g.error());
        graph.emplace(std::move(*g));
    }
    if (graph->dimension() != config.dimension || graph->metric() != config.metric) {
        return core::make_error(error_code::data_integrity, "graph does not match index header",
                                "engine.index");
    }

    // Vectors persisted after the last save() are linked in now.
    const auto stored = store->size();
    index::LevelGenerator levels(config.hnsw.seed + static_cast<std::uint32_t>(stored), config.hnsw.M);
    std::uint64_t next_id = header->next_auto_id;
    std::size_t linked = 0;
    for (index::VectorId id : store->ids()) {
        next_id = std::max(next_id, id + 1);
        if (graph->contains(id)) continue;
        auto rec = store->get(id);
        if (!rec) return std::unexpected(rec.error());
        if ((*rec)->values.size() != config.dimension) {
            return core::make_error(error_code::data_integrity,
                                    "stored vector " + std::to_string(id) + " has wrong dimension",
                                    "engine.index");
        }
        auto r = graph->insert(id, (*rec)->values, (*rec)->code, (*rec)->code_generation, levels, false);
        if (!r) return std::unexpected(r.error());
        ++linked;
    }
    if (auto r = graph->set_codes(codebook, header->generation, {}); !r) return std::unexpected(r.error());

    if (dbg) {
        std::cerr << "[quiver][index][open] dim=" << config.dimension
                  << " metric=" << index::to_string(config.metric) << " records=" << stored
                  << " graph_nodes=" << graph->size() << " relinked=" << linked
                  << " generation=" << header->generation << std::endl;
    }

    VectorIndex out;
    out.impl_ = std::make_unique<Impl>(config, std::move(blobs), std::move(*store), std::move(*graph),
                                       std::move(levels));
    out.impl_->codebook_.store(std::move(codebook));
    out.impl_->generation_.store(header->generation);
    out.impl_->next_auto_id_ = next_id;
    return out;
}

auto VectorIndex::insert(index::VectorId id, std::span<const float> vec, Attributes attributes,
                         bool overwrite) -> std::expected<void, core::error> {
    std::lock_guard lock(impl_->writer_mutex_);
    return impl_->insert_locked(id, vec, std::move(attributes), overwrite);
}

auto VectorIndex::insert_auto(std::span<const float> vec, Attributes attributes)
    -> std::expected<index::VectorId, core::error> {
    std::lock_guard lock(impl_->writer_mutex_);
    auto id = impl_->next_auto_id_;
    while (impl_->store_.contains(id) || impl_->graph_.contains(id)) ++id;
    if (auto r = impl_->insert_locked(id, vec, std::move(attributes), false); !r) {
        return std::unexpected(r.error());
    }
    return id;
}

auto VectorIndex::remove(index::VectorId id) -> std::expected<void, core::error> {
    std::lock_guard lock(impl_->writer_mutex_);
    if (auto ok = impl_->check_writable(); !ok) return ok;
    if (auto r = impl_->graph_.remove(id); !r) return std::unexpected(r.error());
    if (auto r = impl_->store_.remove(id); !r && r.error().code != core::error_code::not_found) {
        return std::unexpected(r.error());
    }

    // A graph flagged by a concurrent reader is left for an explicit compact().
    const auto& graph = impl_->graph_;
    if (!graph.needs_rebuild() && graph.needs_compaction(impl_->config_.auto_compact_ratio)) {
        if (impl_->debug_) {
            std::cerr << "[quiver][index][compact] auto compaction tombstones="
                      << impl_->graph_.tombstone_count() << " live=" << impl_->graph_.size() << std::endl;
        }
        return impl_->graph_.compact();
    }
    return {};
}

auto VectorIndex::get(index::VectorId id) const
    -> std::expected<std::shared_ptr<const storage::VectorRecord>, core::error> {
    return impl_->store_.get(id);
}

auto VectorIndex::search(std::span<const float> query, std::size_t k, const SearchParams& params) const
    -> std::expected<SearchResult, core::error> {
    return QueryEngine(impl_->graph_, impl_->store_).search(query, k, params);
}

auto VectorIndex::train_quantizer(const float* sample, std::size_t n) -> std::expected<void, core::error> {
    using core::error_code;
    const auto& cfg = impl_->config_;
    const std::size_t dim = cfg.dimension;
    if (auto ok = impl_->check_writable(); !ok) return ok;
    if (cfg.quantizer.kind == index::QuantizerKind::none) {
        return core::make_error(error_code::config_invalid, "index has no quantizer kind configured",
                                "engine.index");
    }
    if (sample == nullptr && n > 0) {
        return core::make_error(error_code::precondition_failed, "sample is null", "engine.index");
    }

    // Training sees vectors the way the index stores them.
    std::vector<float> normalized;
    const float* data = sample;
    if (index::needs_normalization(cfg.metric)) {
        normalized.assign(sample, sample + n * dim);
        for (std::size_t i = 0; i < n; ++i) kernels::normalize(std::span(normalized.data() + i * dim, dim));
        data = normalized.data();
    }

    auto trained = index::train_codebook(data, n, dim, cfg.quantizer);
    if (!trained) return std::unexpected(trained.error());
    std::shared_ptr<const index::Codebook> cb = std::move(*trained);

    std::lock_guard lock(impl_->writer_mutex_);
    if (auto ok = impl_->check_writable(); !ok) return ok;
    const std::uint64_t generation = impl_->generation_.load() + 1;
    std::unordered_map<index::VectorId, std::vector<std::uint8_t>> codes;
    codes.reserve(impl_->store_.size());

    auto cursor = impl_->store_.cursor();
    for (;;) {
        auto next = cursor.next();
        if (!next) return std::unexpected(next.error());
        if (!next->has_value()) break;
        const auto& [id, record] = **next;

        storage::VectorRecord updated = *record;
        updated.code.assign(cb->code_size(), 0);
        if (auto r = cb->encode(updated.values, updated.code); !r) return std::unexpected(r.error());
        updated.code_generation = generation;
        codes.emplace(id, updated.code);
        if (auto r = impl_->store_.put(id, std::move(updated)); !r) return std::unexpected(r.error());
    }

    if (auto r = write_sealed(*impl_->blobs_, kCodebookKey, cb->serialize(), false); !r) {
        return std::unexpected(r.error());
    }
    const auto encoded = codes.size();
    if (auto r = impl_->graph_.set_codes(cb, generation, std::move(codes)); !r) {
        return std::unexpected(r.error());
    }
    impl_->codebook_.store(cb);
    impl_->generation_.store(generation);

    if (impl_->debug_) {
        std::cerr << "[quiver][index][train] generation=" << generation
                  << " kind=" << index::to_string(cb->kind()) << " encoded=" << encoded << std::endl;
    }
    return impl_->write_header();
}

auto VectorIndex::train_quantizer_from_store(std::size_t max_samples) -> std::expected<void, core::error> {
    if (max_samples == 0) {
        return core::make_error(core::error_code::precondition_failed, "max_samples must be > 0",
                                "engine.index");
    }
    const std::size_t dim = impl_->config_.dimension;
    const auto ids = impl_->store_.ids();
    const std::size_t stride = std::max<std::size_t>(1, (ids.size() + max_samples - 1) / max_samples);

    std::vector<float> sample;
    std::size_t n = 0;
    for (std::size_t i = 0; i < ids.size() && n < max_samples; i += stride) {
        auto rec = impl_->store_.get(ids[i]);
        if (!rec) {
            if (rec.error().code == core::error_code::not_found) continue;
            return std::unexpected(rec.error());
        }
        sample.insert(sample.end(), (*rec)->values.begin(), (*rec)->values.end());
        ++n;
    }
    return train_quantizer(sample.data(), n);
}

auto VectorIndex::stats() const -> IndexStats {
    IndexStats s;
    s.vector_count = impl_->store_.size();
    s.graph = impl_->graph_.stats();
    if (auto cb = impl_->codebook_.load()) {
        s.quantizer = cb->kind();
        s.code_size = cb->code_size();
    }
    s.codebook_generation = impl_->generation_.load();
    s.cache = impl_->store_.cache_stats();
    s.needs_rebuild = impl_->graph_.needs_rebuild();
    return s;
}

auto VectorIndex::compact() -> std::expected<void, core::error> {
    std::lock_guard lock(impl_->writer_mutex_);
    return impl_->graph_.compact();
}

auto VectorIndex::save() -> std::expected<void, core::error> {
    std::lock_guard lock(impl_->writer_mutex_);
    if (auto ok = impl_->check_writable(); !ok) return ok;
    const auto t0 = std::chrono::steady_clock::now();
    const auto graph = impl_->graph_.serialize();
    if (auto r = write_sealed(*impl_->blobs_, kGraphKey, graph, impl_->config_.compress_graph); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = impl_->write_header(); !r) return std::unexpected(r.error());
    if (impl_->debug_) {
        const auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[quiver][index][save] graph_bytes=" << graph.size() << " ms=" << ms << std::endl;
    }
    return {};
}

auto VectorIndex::config() const noexcept -> const IndexConfig& { return impl_->config_; }
auto VectorIndex::size() const noexcept -> std::size_t { return impl_->graph_.size(); }

auto VectorIndex::codebook() const -> std::shared_ptr<const index::Codebook> {
    return impl_->codebook_.load();
}

auto VectorIndex::graph() const noexcept -> const index::HnswGraph& { return impl_->graph_; }

auto VectorIndex::debug_mark_inconsistent(const char* what) -> void {
    impl_->graph_.debug_mark_inconsistent(what);
}

} // namespace quiver::engine
