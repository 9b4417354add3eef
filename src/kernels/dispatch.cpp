#include "quiver/kernels/dispatch.hpp"
#include "quiver/kernels/backends/scalar.hpp"
#include "quiver/kernels/backends/avx2.hpp"
#include "quiver/core/platform_utils.hpp"

#if defined(__x86_64__) || defined(_M_X64)
#include <cpuid.h>
#endif

#include <string>

namespace quiver::kernels {

namespace detail {

struct CpuFeatures {
    bool has_avx2{false};
    bool has_fma{false};
};

[[gnu::cold]] auto detect_cpu_features() noexcept -> CpuFeatures {
    CpuFeatures features{};
#if defined(__x86_64__) || defined(_M_X64)
    unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
    if (__get_cpuid(0, &eax, &ebx, &ecx, &edx)) {
        const unsigned int max_level = eax;
        if (max_level >= 7) {
            __cpuid_count(7, 0, eax, ebx, ecx, edx);
            features.has_avx2 = (ebx & (1u << 5)) != 0;   // CPUID.07H:EBX.AVX2
        }
        if (__get_cpuid(1, &eax, &ebx, &ecx, &edx)) {
            features.has_fma = (ecx & (1u << 12)) != 0;   // CPUID.01H:ECX.FMA
        }
    }
#endif
    return features;
}

auto cpu_features() noexcept -> const CpuFeatures& {
    static const CpuFeatures features = detect_cpu_features();
    return features;
}

/** \brief QUIVER_KERNEL_BACKEND override; empty when unset or "auto". */
auto backend_override() noexcept -> std::string {
    auto v = core::safe_getenv("QUIVER_KERNEL_BACKEND");
    if (!v) return {};
    std::string s = *v;
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    if (s == "auto") return {};
    return s;
}

} // namespace detail

const KernelOps& select_backend(std::string_view name) noexcept {
#if defined(__AVX2__) && defined(__FMA__)
    if (name == "avx2") {
        const auto& f = detail::cpu_features();
        if (f.has_avx2 && f.has_fma) return get_avx2_ops();
    }
#endif
    (void)name;
    return get_scalar_ops();
}

const KernelOps& select_backend_auto() noexcept {
    static const KernelOps& chosen = []() -> const KernelOps& {
        const std::string forced = detail::backend_override();
        if (!forced.empty()) return select_backend(forced);
        return select_backend("avx2");
    }();
    return chosen;
}

} // namespace quiver::kernels
