#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace ms {

struct ProgressSnapshot {
  std::uint64_t processed = 0;
  std::uint64_t valid = 0;
  std::uint64_t total = 0;
  std::uint64_t current_index = 0;
  double percent = 0.0;
  double lines_per_sec = 0.0;
  double eta_seconds = 0.0;
  double elapsed_seconds = 0.0;
  std::string eta = "-";
  std::string status;
};

inline constexpr const char* kEtaPlaceholder = "Calculating...";

// MM:SS, or HH:MM:SS when the hour component is non-zero.
std::string format_duration(double seconds);

// Linear extrapolation; placeholder text and *eta_s = 0 while no usable
// throughput exists.
std::string estimate_remaining(std::uint64_t processed, std::uint64_t remaining,
                               double elapsed_s, double* eta_s = nullptr);

// Pure computation; every numeric field comes back finite and >= 0.
ProgressSnapshot compute_progress(std::uint64_t current_index, std::uint64_t processed,
                                  std::uint64_t valid, std::uint64_t total,
                                  double elapsed_s);

std::string to_json(const ProgressSnapshot& s);

// "[ 42%] 4200/10000 lines, 17 valid, 5300 lines/s, ETA: 00:01"
std::string format_progress_line(const ProgressSnapshot& s);

// Throttled publisher. The latest snapshot is always readable from other
// threads (control server).
class ProgressReporter {
public:
  using Callback = std::function<void(const ProgressSnapshot&)>;

  ProgressReporter(std::uint64_t total, std::chrono::milliseconds interval,
                   Callback cb = nullptr);

  // Publishes only when `interval` has passed since the last publication.
  bool maybe_emit(std::uint64_t current_index, std::uint64_t processed,
                  std::uint64_t valid, double elapsed_s);

  // Unthrottled publication with an explicit status text.
  void emit(std::uint64_t current_index, std::uint64_t processed,
            std::uint64_t valid, double elapsed_s, std::string status);

  void set_status(std::string status);
  void set_total(std::uint64_t total);
  ProgressSnapshot latest() const;

private:
  void publish_locked(ProgressSnapshot s, std::unique_lock<std::mutex>& lk);

  mutable std::mutex mu_;
  std::uint64_t total_;
  std::chrono::milliseconds interval_;
  std::chrono::steady_clock::time_point last_;
  std::string status_;
  ProgressSnapshot latest_;
  Callback cb_;
};

}
