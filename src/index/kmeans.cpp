#include "quiver/index/kmeans.hpp"
#include "quiver/kernels/dispatch.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <string>

namespace quiver::index {

namespace {

[[gnu::hot]] inline auto sq_dist(const float* a, const float* b, std::size_t dim) -> float {
    return kernels::select_backend_auto().l2_sq(std::span(a, dim), std::span(b, dim));
}

auto nearest_centroid(const float* point, const std::vector<std::vector<float>>& centroids,
                      std::size_t dim) -> std::pair<std::uint32_t, float> {
    std::uint32_t best = 0;
    float best_dist = std::numeric_limits<float>::max();
    for (std::uint32_t c = 0; c < centroids.size(); ++c) {
        const float d = sq_dist(point, centroids[c].data(), dim);
        if (d < best_dist) {
            best_dist = d;
            best = c;
        }
    }
    return {best, best_dist};
}

/** \brief Recompute centroids as member means; returns the ids of clusters left empty. */
auto update_centroids(const float* data, std::size_t n, std::size_t dim,
                      std::span<const std::uint32_t> assignments,
                      std::vector<std::vector<float>>& centroids) -> std::vector<std::uint32_t> {
    const std::size_t k = centroids.size();
    std::vector<double> sums(k * dim, 0.0);
    std::vector<std::uint32_t> counts(k, 0);

    for (std::size_t i = 0; i < n; ++i) {
        const std::uint32_t c = assignments[i];
        ++counts[c];
        const float* p = data + i * dim;
        double* s = sums.data() + static_cast<std::size_t>(c) * dim;
        for (std::size_t d = 0; d < dim; ++d) s[d] += p[d];
    }

    std::vector<std::uint32_t> empty;
    for (std::uint32_t c = 0; c < k; ++c) {
        if (counts[c] == 0) {
            empty.push_back(c);
            continue;
        }
        const double inv = 1.0 / counts[c];
        for (std::size_t d = 0; d < dim; ++d) {
            centroids[c][d] = static_cast<float>(sums[static_cast<std::size_t>(c) * dim + d] * inv);
        }
    }
    return empty;
}

/** \brief Move each empty centroid onto the worst-served point (largest residual). */
auto reseed_empty(const float* data, std::size_t n, std::size_t dim,
                  const std::vector<std::uint32_t>& empty,
                  std::span<std::uint32_t> assignments,
                  std::vector<std::vector<float>>& centroids) -> void {
    if (empty.empty()) return;
    std::vector<std::pair<float, std::size_t>> residuals(n);
    for (std::size_t i = 0; i < n; ++i) {
        residuals[i] = {sq_dist(data + i * dim, centroids[assignments[i]].data(), dim), i};
    }
    std::sort(residuals.begin(), residuals.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    for (std::size_t e = 0; e < empty.size() && e < n; ++e) {
        const std::size_t idx = residuals[e].second;
        centroids[empty[e]].assign(data + idx * dim, data + (idx + 1) * dim);
        assignments[idx] = empty[e];
    }
}

} // namespace

auto kmeans_plusplus_init(const float* data, std::size_t n, std::size_t dim,
                          std::uint32_t k, std::uint32_t seed)
    -> std::vector<std::vector<float>> {
    std::vector<std::vector<float>> centroids;
    centroids.reserve(k);
    if (n == 0 || k == 0) return centroids;

    std::mt19937 gen(seed);
    std::uniform_int_distribution<std::size_t> pick(0, n - 1);
    std::size_t first = pick(gen);
    centroids.emplace_back(data + first * dim, data + (first + 1) * dim);

    std::vector<float> min_dist(n, std::numeric_limits<float>::max());
    std::vector<double> cumsum(n);

    for (std::uint32_t c = 1; c < k; ++c) {
        const auto& last = centroids.back();

        #pragma omp parallel for
        for (long long i = 0; i < static_cast<long long>(n); ++i) {
            const float d = sq_dist(data + static_cast<std::size_t>(i) * dim, last.data(), dim);
            min_dist[i] = std::min(min_dist[i], d);
        }

        double running = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            running += min_dist[i];
            cumsum[i] = running;
        }

        std::size_t idx = 0;
        if (running > 0.0) {
            std::uniform_real_distribution<double> sample(0.0, running);
            const double target = sample(gen);
            idx = static_cast<std::size_t>(
                std::lower_bound(cumsum.begin(), cumsum.end(), target) - cumsum.begin());
            idx = std::min(idx, n - 1);
        } else {
            // Every point already coincides with a centroid: duplicates are all that is left.
            idx = pick(gen);
        }
        centroids.emplace_back(data + idx * dim, data + (idx + 1) * dim);
    }
    return centroids;
}

auto kmeans_assign(const float* data, std::size_t n, std::size_t dim,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> float {
    double total = 0.0;

    #pragma omp parallel for reduction(+:total)
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const auto [c, d] = nearest_centroid(data + static_cast<std::size_t>(i) * dim, centroids, dim);
        assignments[static_cast<std::size_t>(i)] = c;
        total += d;
    }
    return static_cast<float>(total);
}

auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error> {
    using core::error_code;

    if (params.k == 0 || dim == 0) {
        return core::make_error(error_code::precondition_failed, "k and dim must be > 0", "index.kmeans");
    }
    if (n < params.k) {
        return core::make_error(error_code::insufficient_samples,
                                "need at least " + std::to_string(params.k) + " points, got " +
                                    std::to_string(n),
                                "index.kmeans");
    }

    KmeansResult result;
    result.centroids = kmeans_plusplus_init(data, n, dim, params.k, params.seed);
    result.assignments.assign(n, 0);

    float prev = std::numeric_limits<float>::max();
    std::uint32_t iter = 0;
    for (; iter < params.max_iter; ++iter) {
        const float inertia = kmeans_assign(data, n, dim, result.centroids, result.assignments);
        const float change = std::abs(prev - inertia) / (prev + 1e-10f);
        prev = inertia;
        if (change < params.epsilon) break;

        auto empty = update_centroids(data, n, dim, result.assignments, result.centroids);
        reseed_empty(data, n, dim, empty, result.assignments, result.centroids);
    }

    // Returned centroids and assignments must agree.
    result.inertia = kmeans_assign(data, n, dim, result.centroids, result.assignments);
    result.iterations = iter;
    return result;
}

} // namespace quiver::index
