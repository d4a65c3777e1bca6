#pragma once
#include "mnemonic_sieve/cancellation.hpp"
#include "mnemonic_sieve/line_source.hpp"
#include "mnemonic_sieve/output_sink.hpp"
#include "mnemonic_sieve/predicate.hpp"
#include "mnemonic_sieve/stats.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace ms {

// Fans the remaining lines of a LineSource out over a oneTBB pipeline:
//   read (serial) -> evaluate (parallel) -> write (serial) -> commit (serial, in order)
// The commit hook sees every consumed line exactly once, in index order,
// after its output (if any) reached the sink.
class WorkerPool {
public:
  static constexpr std::size_t kMaxWorkers = 1024;
  static constexpr std::size_t kMaxTokensPerWorker = 64;

  struct Config {
    std::size_t   workers           = 0;  // 0 = hardware concurrency, capped at kMaxWorkers
    std::size_t   tokens_per_worker = 4;  // lines in flight per worker
    bool          preserve_order    = false;
    std::uint64_t resume_from       = 0;  // indices below are skipped
  };

  using CommitHook = std::function<void(std::uint64_t next_index)>;

  WorkerPool(Config cfg, LinePredicate pred);

  // Blocks until the input is exhausted, a cancellation has drained, or a
  // fatal error stopped the pipeline. False on fatal error (see error()).
  bool run(LineSource& src, OutputSink& sink, ProcessingStats& stats,
           CancellationToken& token, const CommitHook& on_commit);

  std::size_t concurrency() const noexcept;
  std::string error() const;

private:
  void fail(const std::string& why, CancellationToken& token);

  Config cfg_;
  LinePredicate pred_;
  std::atomic<bool> failed_{false};
  mutable std::mutex err_mu_;
  std::string err_;
};

}
