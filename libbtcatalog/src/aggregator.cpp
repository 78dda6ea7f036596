/**
 * @file aggregator.cpp
 * @brief Aggregation orchestrator implementation
 */

#include "btcatalog/aggregator.h"
#include "btcatalog/address.h"
#include "btcatalog/log.h"
#include "btcatalog/merger.h"
#include "btcatalog/naming.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

namespace btcatalog {

using Clock = std::chrono::steady_clock;
using ObservationList = std::vector<RawObservation>;

namespace {

/**
 * @brief Result slot shared between one scan thread and the aggregator
 *
 * The thread owns a shared_ptr copy, so a timed-out thread that finishes
 * late writes into a slot nobody reads any more.
 */
struct SourceSlot {
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  std::optional<Result<ObservationList>> result;
};

/**
 * @brief One source scheduled in this aggregation call
 */
struct SourceTask {
  ScanSourcePtr source;
  std::string id;
  int rank = 0;
  std::shared_ptr<SourceSlot> slot;
  CancellationToken cancel;
  std::thread thread;
  bool started = false;
  std::optional<Error> launch_error;
};

void run_source(ScanSourcePtr source, std::shared_ptr<SourceSlot> slot,
                std::chrono::milliseconds duration,
                std::optional<std::string> filter, CancellationToken cancel) {
  std::optional<Result<ObservationList>> outcome;
  try {
    outcome.emplace(source->observe(duration, filter, cancel));
  } catch (const std::exception &e) {
    outcome.emplace(
        Error(ErrorCode::SourceFailed, "Scan source threw an exception",
              e.what()));
  }

  {
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->result = std::move(outcome);
    slot->done = true;
  }
  slot->cv.notify_all();
}

void launch(SourceTask &task, std::chrono::milliseconds duration,
            const std::optional<std::string> &filter) {
  try {
    task.thread = std::thread(run_source, task.source, task.slot, duration,
                              filter, task.cancel);
    task.started = true;
  } catch (const std::system_error &e) {
    task.launch_error =
        Error(ErrorCode::SourceFailed, "Cannot start scan thread", e.what());
  }
}

/**
 * @brief Wait for a task until its budget runs out
 * @return The source's result, or SourceTimeout
 */
Result<ObservationList> settle(SourceTask &task, Clock::time_point budget) {
  if (task.launch_error) {
    return *task.launch_error;
  }

  bool done = false;
  {
    std::unique_lock<std::mutex> lock(task.slot->mutex);
    done = task.slot->cv.wait_until(lock, budget,
                                    [&task] { return task.slot->done; });
  }

  if (!done) {
    task.cancel.cancel();
    if (task.thread.joinable()) {
      task.thread.detach();
    }
    return Error(ErrorCode::SourceTimeout,
                 "Scan source did not finish within its time budget",
                 task.id);
  }

  if (task.thread.joinable()) {
    task.thread.join();
  }

  std::lock_guard<std::mutex> lock(task.slot->mutex);
  return std::move(*task.slot->result);
}

std::string describe_failures(const std::map<std::string, Error> &errors) {
  std::string details;
  for (const auto &[id, error] : errors) {
    if (!details.empty()) {
      details += "; ";
    }
    details += id + ": " + error.to_string();
  }
  return details;
}

} // namespace

// ============================================================================
// AggregatorOptions
// ============================================================================

AggregatorOptions AggregatorOptions::from_config(const CatalogConfig &config) {
  AggregatorOptions options;
  options.grace_period = std::chrono::milliseconds(config.grace_period_ms);
  options.source_priority = config.source_priority;
  options.enrich = config.enrich;
  return options;
}

// ============================================================================
// Aggregator Implementation
// ============================================================================

class Aggregator::Impl {
public:
  Impl(const SourceRegistry &reg, const EnrichmentPipeline &enr,
       AggregatorOptions opts)
      : registry(reg), enrichment(enr), options(std::move(opts)) {}

  const SourceRegistry &registry;
  const EnrichmentPipeline &enrichment;
  AggregatorOptions options;
  RecordMerger merger;

  std::vector<std::string> fold_order(const std::vector<std::string> &sources) const;

  std::map<std::string, Result<ObservationList>>
  run_concurrent(std::vector<SourceTask> &tasks,
                 std::chrono::milliseconds duration,
                 const std::optional<std::string> &filter,
                 std::optional<Clock::time_point> deadline) const;

  std::map<std::string, Result<ObservationList>>
  run_sequential(std::vector<SourceTask> &tasks,
                 std::chrono::milliseconds duration,
                 const std::optional<std::string> &filter,
                 std::optional<Clock::time_point> deadline) const;

  std::vector<CanonicalDevice>
  fold(const std::vector<SourceTask> &tasks,
       std::map<std::string, Result<ObservationList>> &outcomes) const;
};

std::vector<std::string>
Aggregator::Impl::fold_order(const std::vector<std::string> &sources) const {
  std::vector<std::string> requested;
  for (const auto &id : sources) {
    if (std::find(requested.begin(), requested.end(), id) == requested.end()) {
      requested.push_back(id);
    }
  }

  std::vector<std::string> order;
  for (const auto &id : options.source_priority) {
    if (std::find(requested.begin(), requested.end(), id) != requested.end()) {
      order.push_back(id);
    }
  }
  for (const auto &id : requested) {
    if (std::find(order.begin(), order.end(), id) == order.end()) {
      order.push_back(id);
    }
  }
  return order;
}

std::map<std::string, Result<ObservationList>> Aggregator::Impl::run_concurrent(
    std::vector<SourceTask> &tasks, std::chrono::milliseconds duration,
    const std::optional<std::string> &filter,
    std::optional<Clock::time_point> deadline) const {
  auto start = Clock::now();
  for (auto &task : tasks) {
    launch(task, duration, filter);
  }

  Clock::time_point budget = start + duration + options.grace_period;
  if (deadline && *deadline < budget) {
    budget = *deadline;
  }

  std::map<std::string, Result<ObservationList>> outcomes;
  for (auto &task : tasks) {
    outcomes.emplace(task.id, settle(task, budget));
  }
  return outcomes;
}

std::map<std::string, Result<ObservationList>> Aggregator::Impl::run_sequential(
    std::vector<SourceTask> &tasks, std::chrono::milliseconds duration,
    const std::optional<std::string> &filter,
    std::optional<Clock::time_point> deadline) const {
  std::map<std::string, Result<ObservationList>> outcomes;

  for (auto &task : tasks) {
    auto start = Clock::now();
    if (deadline && start >= *deadline) {
      outcomes.emplace(task.id,
                       Error(ErrorCode::SourceTimeout,
                             "Request deadline passed before the source ran",
                             task.id));
      continue;
    }

    launch(task, duration, filter);

    Clock::time_point budget = start + duration + options.grace_period;
    if (deadline && *deadline < budget) {
      budget = *deadline;
    }
    outcomes.emplace(task.id, settle(task, budget));
  }
  return outcomes;
}

std::vector<CanonicalDevice> Aggregator::Impl::fold(
    const std::vector<SourceTask> &tasks,
    std::map<std::string, Result<ObservationList>> &outcomes) const {
  std::vector<CanonicalDevice> devices;
  std::map<std::string, size_t> index_by_key;
  std::set<std::string> used_ids;

  for (const auto &task : tasks) {
    auto it = outcomes.find(task.id);
    if (it == outcomes.end() || it->second.is_error()) {
      continue;
    }

    for (auto &observation : it->second.value()) {
      observation.source_id = task.id;

      if (observation.raw_address.empty()) {
        log::get()->warn("Dropping observation without identifier from '{}'",
                         task.id);
        continue;
      }

      auto normalized = normalize_address(observation.raw_address);

      // Opaque identifiers never merge across sources
      std::string key = normalized.normalizable
                            ? normalized.value
                            : task.id + '\x1f' + observation.raw_address;

      auto existing = index_by_key.find(key);
      if (existing != index_by_key.end()) {
        merger.merge_into(devices[existing->second], observation, task.rank);
        log::get()->debug("Merged {} from '{}' into {}",
                          observation.raw_address, task.id,
                          devices[existing->second].canonical_id);
        continue;
      }

      CanonicalDevice device = merger.create(observation, task.rank);
      if (!normalized.normalizable && used_ids.count(device.canonical_id)) {
        device.canonical_id += "@" + task.id;
      }
      used_ids.insert(device.canonical_id);

      log::get()->debug("New device {} from '{}'", device.canonical_id,
                        task.id);
      index_by_key.emplace(std::move(key), devices.size());
      devices.push_back(std::move(device));
    }
  }

  return devices;
}

// ============================================================================
// Aggregator
// ============================================================================

Aggregator::Aggregator(const SourceRegistry &registry,
                       const EnrichmentPipeline &enrichment,
                       AggregatorOptions options)
    : impl_(std::make_unique<Impl>(registry, enrichment, std::move(options))) {}

Aggregator::~Aggregator() = default;

const AggregatorOptions &Aggregator::options() const { return impl_->options; }

std::vector<std::string>
Aggregator::fold_order(const std::vector<std::string> &sources) const {
  return impl_->fold_order(sources);
}

Result<AggregationResult> Aggregator::aggregate(const ScanRequest &request) const {
  BTCATALOG_TRY(validate_request(request, impl_->registry));
  BTCATALOG_REQUIRE(impl_->options.grace_period.count() >= 0 &&
                        impl_->options.grace_period.count() <=
                            MAX_GRACE_PERIOD_MS,
                    ErrorCode::InvalidArgument,
                    "Grace period must be between 0 and 60000 ms");

  auto started = Clock::now();
  auto filter = normalize_filter_name(request.filter_name);
  auto duration = request.duration();

  std::vector<std::string> requested =
      request.sources.empty() ? impl_->registry.ids() : request.sources;
  std::vector<std::string> order = impl_->fold_order(requested);

  std::vector<SourceTask> tasks;
  tasks.reserve(order.size());
  for (size_t i = 0; i < order.size(); ++i) {
    SourceTask task;
    task.id = order[i];
    task.source = impl_->registry.find(order[i]);
    task.rank = static_cast<int>(i);
    task.slot = std::make_shared<SourceSlot>();
    tasks.push_back(std::move(task));
  }

  log::get()->info("Scanning {} source(s) for {} ms ({})", tasks.size(),
                   duration.count(),
                   request.concurrent ? "concurrent" : "sequential");

  auto outcomes =
      request.concurrent
          ? impl_->run_concurrent(tasks, duration, filter, request.deadline)
          : impl_->run_sequential(tasks, duration, filter, request.deadline);

  AggregationResult result;
  for (const auto &[id, outcome] : outcomes) {
    if (outcome.is_error()) {
      log::get()->warn("Source '{}' failed: {}", id,
                       outcome.error().to_string());
      result.source_errors.emplace(id, outcome.error());
    }
  }

  std::vector<CanonicalDevice> devices = impl_->fold(tasks, outcomes);

  if (devices.empty() && result.source_errors.size() == tasks.size()) {
    Error error(ErrorCode::TotalFailure, "All scan sources failed",
                describe_failures(result.source_errors));
    log::get()->error("{}", error.to_string());
    return error;
  }

  result.total = devices.size();
  for (auto &device : devices) {
    if (impl_->options.enrich) {
      device = impl_->enrichment.enrich(std::move(device));
    }
    if (!filter || name_matches(device.name, *filter)) {
      result.devices.push_back(std::move(device));
    }
  }

  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - started);

  log::get()->info("Aggregated {} device(s), {} after filter, {} failed "
                   "source(s) in {} ms",
                   result.total, result.devices.size(),
                   result.source_errors.size(), result.elapsed.count());
  return result;
}

} // namespace btcatalog
