#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ms {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct StatsView {
  std::uint64_t processed = 0;
  std::uint64_t valid = 0;
  std::uint64_t blank = 0;
  std::uint64_t line_errors = 0;
  double elapsed_s = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

// Counters for one run. Counter updates are safe from any worker; the
// stage timers are driven by the coordinating thread only.
class ProcessingStats {
public:
  using clock = std::chrono::steady_clock;

  ProcessingStats() : start_(clock::now()) {}

  void restart_clock() { start_ = clock::now(); }

  void add_processed() noexcept { processed_.fetch_add(1, std::memory_order_relaxed); }
  void add_valid() noexcept     { valid_.fetch_add(1, std::memory_order_relaxed); }
  void add_blank() noexcept     { blank_.fetch_add(1, std::memory_order_relaxed); }
  void add_line_error(std::string_view kind);

  std::uint64_t processed() const noexcept { return processed_.load(std::memory_order_relaxed); }
  std::uint64_t valid() const noexcept     { return valid_.load(std::memory_order_relaxed); }
  std::uint64_t blank() const noexcept     { return blank_.load(std::memory_order_relaxed); }
  std::uint64_t line_errors() const noexcept { return errors_.load(std::memory_order_relaxed); }

  double elapsed_seconds() const;
  clock::time_point started() const noexcept { return start_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  StatsView snapshot() const;

private:
  clock::time_point start_;
  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> valid_{0};
  std::atomic<std::uint64_t> blank_{0};
  std::atomic<std::uint64_t> errors_{0};

  mutable std::mutex err_mu_;
  std::unordered_map<std::string, std::uint64_t> errs_by_kind_;

  std::vector<StageTiming> stage_order_;
  std::unordered_map<std::string, clock::time_point> stage_starts_;
};

}
