#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Domain codes (validation_failed .. index_unavailable) map one-to-one onto
 *   the failures callers of the engine must be able to distinguish.
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
  precondition_failed = 4001,
  resource_exhausted = 5001,
  not_found = 6001,
  unavailable = 7001,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
  unsupported = 9005,
  validation_failed = 10001,    /**< rejected before any mutation */
  missing_vector = 10002,       /**< upsert carried no vector */
  index_inconsistency = 10003,  /**< store and index reachability diverged */
  timeout = 10004,              /**< query deadline exceeded */
  index_unavailable = 10005,    /**< index not (re)built yet */
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.hnsw" */
};

/** \brief Stable lowercase name for an error code. */
constexpr auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
    case error_code::unsupported: return "unsupported";
    case error_code::validation_failed: return "validation_failed";
    case error_code::missing_vector: return "missing_vector";
    case error_code::index_inconsistency: return "index_inconsistency";
    case error_code::timeout: return "timeout";
    case error_code::index_unavailable: return "index_unavailable";
  }
  return "unknown";
}

} // namespace quiver::core
