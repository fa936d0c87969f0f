#pragma once

#include "core/job.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ngl::core {

class JobStream;

/// Caller-side record of every job, keyed by JobKey.
///
/// Each job's state changes only through apply() with that job's ticket,
/// fed from its own event stream in arrival order. Different keys are
/// independent. The map lock is never held across a stream read.
class JobRegistry {
public:
  static constexpr std::size_t kDefaultLogRetention = 10000;

  /// `log_retention` caps the lines kept per job (oldest dropped first);
  /// 0 keeps everything.
  explicit JobRegistry(std::size_t log_retention = kDefaultLogRetention);

  /// Create or replace the state for `key` and return the ticket for the new
  /// generation. Earlier tickets for the key become stale.
  JobTicket begin(const JobKey &key);

  /// Apply one event. Returns false (and changes nothing) for a stale or
  /// unknown ticket, or for events arriving after Completed.
  bool apply(const JobTicket &ticket, const JobEvent &event);

  /// Drain `stream` into the registry until it ends. Blocks the calling
  /// thread; returns the number of events applied.
  std::size_t consume(const JobTicket &ticket, JobStream &stream);

  [[nodiscard]] std::optional<JobState> snapshot(const JobKey &key) const;
  [[nodiscard]] bool contains(const JobKey &key) const;
  [[nodiscard]] std::vector<JobKey> keys() const;
  [[nodiscard]] std::size_t active_count() const;
  [[nodiscard]] std::size_t log_retention() const { return log_retention_; }

  /// Forget a job's state. Returns false if the key was unknown.
  bool discard(const JobKey &key);

private:
  struct Entry {
    std::uint64_t generation = 0;
    bool completed = false;
    JobState state;
  };

  void append_log_locked(Entry &entry, std::string line);

  const std::size_t log_retention_;
  mutable std::mutex mutex_;
  std::unordered_map<JobKey, Entry> jobs_;
  std::uint64_t next_generation_ = 1;
};

} // namespace ngl::core
