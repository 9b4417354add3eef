#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable numeric codes, grouped by thousands per category, for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace quiver::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  internal_inconsistency = 3002,
  precondition_failed = 4001,
  dimension_mismatch = 4002,
  insufficient_samples = 4003,
  resource_exhausted = 5001,
  not_found = 6001,
  duplicate_id = 6002,
  unavailable = 7001,
  cancelled = 8001,
  internal = 9001,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "storage.vector_store" */
};

/** \brief Diagnostic name of a code ("dimension_mismatch", ...). */
constexpr auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::internal_inconsistency: return "internal_inconsistency";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::insufficient_samples: return "insufficient_samples";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::duplicate_id: return "duplicate_id";
    case error_code::unavailable: return "unavailable";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

/** \brief Transient failures are safe to retry (blob store hiccups). */
constexpr auto is_transient(error_code ec) noexcept -> bool {
  return ec == error_code::unavailable;
}

/** \brief Shorthand for returning a failed expected. */
inline auto make_error(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace quiver::core
