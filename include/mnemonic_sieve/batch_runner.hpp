#pragma once
#include "mnemonic_sieve/cancellation.hpp"
#include "mnemonic_sieve/config.hpp"
#include "mnemonic_sieve/predicate.hpp"
#include "mnemonic_sieve/progress.hpp"
#include "mnemonic_sieve/run_outcome.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace ms {

// Owns one run: Idle -> Running -> {Completed, Cancelled, Failed}.
//
// Checkpoint flow: the resume value is written at start, raised on every
// multiple of checkpoint_interval as lines commit in order (after flushing
// the output), written right away on cancel(), written once more after the
// drain, and removed when the run completes. If the output fails, the
// checkpoint drops back to the last value saved after a successful flush.
class BatchRunner {
public:
  struct Options {
    std::string input_path;
    std::string output_path;
    std::string checkpoint_path;
    std::size_t workers = 0;
    std::uint64_t checkpoint_interval = 10000;
    std::chrono::milliseconds progress_interval{3000};
    std::chrono::milliseconds grace_period{5000};
    std::size_t max_line_bytes = 1024 * 1024;
    bool preserve_order = false;
    bool dedup_output = false;
    bool log_to_console = true;
  };

  static Options options_from(const RunConfig& cfg);

  BatchRunner(Options opt, LinePredicate pred,
              ProgressReporter::Callback on_progress = nullptr);
  ~BatchRunner();

  BatchRunner(const BatchRunner&) = delete;
  BatchRunner& operator=(const BatchRunner&) = delete;

  // Blocking; a BatchRunner runs once.
  RunOutcome run();

  // Any thread, including the signal listener. Persists the current
  // high-water mark immediately. False if already cancelled.
  bool cancel(CancelReason why = CancelReason::Request);

  RunState state() const;
  ProgressSnapshot progress() const;
  std::uint64_t high_water_mark() const;

  // True while the pipeline thread is alive. After a grace period expiry
  // run() returns while this is still true; the detached pipeline no
  // longer writes the checkpoint.
  bool pipeline_active() const;

private:
  struct Shared;
  // shared with the pipeline thread, which may outlive run() when the
  // grace period expires
  std::shared_ptr<Shared> s_;
};

}
