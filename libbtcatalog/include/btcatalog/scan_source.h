/**
 * @file scan_source.h
 * @brief Scan source interface, cancellation and source registry
 *
 * A scan source is a black box that observes nearby devices for a bounded
 * time and returns raw observations, or fails. Sources are stateless per
 * call and may be invoked from any thread.
 */

#ifndef BTCATALOG_SCAN_SOURCE_H
#define BTCATALOG_SCAN_SOURCE_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace btcatalog {

// ============================================================================
// Well-known Source Identifiers
// ============================================================================

constexpr const char *SOURCE_BLE = "ble";
constexpr const char *SOURCE_CLASSIC = "classic";
constexpr const char *SOURCE_PLATFORM_REGISTRY = "platform-registry";

// ============================================================================
// Cancellation
// ============================================================================

/**
 * @brief Cooperative cancellation flag shared between a task and its owner
 *
 * Copies share the same state. Sources wait on the token in place of a
 * plain sleep so a cancelled scan returns promptly.
 */
class BTCATALOG_API CancellationToken {
public:
  CancellationToken();

  /// Request cancellation and wake every waiter
  void cancel();

  bool is_cancelled() const;

  /**
   * @brief Block until cancelled or the timeout elapses
   * @return true if cancelled
   */
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  struct State;
  std::shared_ptr<State> state_;
};

// ============================================================================
// Scan Source
// ============================================================================

/**
 * @brief Interface implemented by every discovery backend
 */
class BTCATALOG_API ScanSource {
public:
  virtual ~ScanSource() = default;

  /// Stable identifier ("ble", "classic", ...)
  virtual std::string id() const = 0;

  /**
   * @brief Observe devices for the given duration
   * @param duration How long to listen
   * @param filter_name Optional case-insensitive name filter (a hint only)
   * @param cancel Cancelled when the caller gives up on this source
   * @return Observations in arrival order, or the source's failure
   */
  virtual Result<std::vector<RawObservation>>
  observe(std::chrono::milliseconds duration,
          const std::optional<std::string> &filter_name,
          const CancellationToken &cancel) = 0;
};

using ScanSourcePtr = std::shared_ptr<ScanSource>;

// ============================================================================
// Source Registry
// ============================================================================

/**
 * @brief Set of available sources, in registration order
 */
class BTCATALOG_API SourceRegistry {
public:
  /// Register a source; DuplicateSource if its id is already taken
  Result<void> add(ScanSourcePtr source);

  /// Source by id, nullptr if unknown
  ScanSourcePtr find(const std::string &id) const;

  bool contains(const std::string &id) const;

  /// Ids in registration order
  std::vector<std::string> ids() const;

  size_t size() const { return sources_.size(); }
  bool empty() const { return sources_.empty(); }

private:
  std::vector<ScanSourcePtr> sources_;
};

} // namespace btcatalog

#endif // BTCATALOG_SCAN_SOURCE_H
