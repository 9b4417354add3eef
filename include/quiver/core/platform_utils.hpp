#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace quiver::core {

// Cross-platform getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// A flag counts as on when set, non-empty and not starting with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] != '0';
}

// Diagnostic logging gate: QUIVER_DEBUG turns every component on, otherwise the
// component flag (e.g. QUIVER_GRAPH_DEBUG) decides.
inline bool debug_enabled(const char* component_flag) noexcept {
    return env_flag("QUIVER_DEBUG") || env_flag(component_flag);
}

// Parses an unsigned integer knob; unset or malformed values yield nullopt.
inline std::optional<unsigned long long> env_unsigned(const char* name) noexcept {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') return std::nullopt;
    return parsed;
}

} // namespace quiver::core
