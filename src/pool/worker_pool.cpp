#include "mnemonic_sieve/worker_pool.hpp"

#include <tbb/parallel_pipeline.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

namespace ms {

namespace {

enum class Verdict { Pending, Blank, Rejected, Accepted, LineError };

struct WorkItem {
  std::uint64_t index = 0;
  std::string   text;
  LineStatus    status = LineStatus::Ok;
  Verdict       verdict = Verdict::Pending;
};

}

WorkerPool::WorkerPool(Config cfg, LinePredicate pred)
  : cfg_(cfg), pred_(std::move(pred)) {}

std::size_t WorkerPool::concurrency() const noexcept {
  if (cfg_.workers > 0) return std::min(cfg_.workers, kMaxWorkers);
  const int n = tbb::this_task_arena::max_concurrency();
  return n > 0 ? std::min(static_cast<std::size_t>(n), kMaxWorkers) : 1;
}

std::string WorkerPool::error() const {
  std::lock_guard<std::mutex> lk(err_mu_);
  return err_;
}

void WorkerPool::fail(const std::string& why, CancellationToken& token) {
  {
    std::lock_guard<std::mutex> lk(err_mu_);
    if (err_.empty()) err_ = why;
  }
  failed_.store(true, std::memory_order_release);
  token.request(CancelReason::Failure);
}

bool WorkerPool::run(LineSource& src, OutputSink& sink, ProcessingStats& stats,
                     CancellationToken& token, const CommitHook& on_commit) {
  failed_.store(false);
  {
    std::lock_guard<std::mutex> lk(err_mu_);
    err_.clear();
  }
  if (!pred_) {
    fail("no predicate configured", token);
    return false;
  }

  const std::size_t workers = concurrency();
  const std::size_t per = std::clamp<std::size_t>(cfg_.tokens_per_worker, 1, kMaxTokensPerWorker);
  const std::size_t tokens = workers * per;
  LineRecord rec;

  auto read = [&](tbb::flow_control& fc) -> WorkItem {
    WorkItem w;
    while (true) {
      // cancellation is honoured between lines, never inside one
      if (token.cancelled()) { fc.stop(); return w; }
      if (!src.read_next(rec)) {
        if (src.last_error() != 0) fail(src.error(), token);
        fc.stop();
        return w;
      }
      if (rec.index < cfg_.resume_from) continue;
      w.index = rec.index;
      w.status = rec.status;
      w.text.swap(rec.text);
      return w;
    }
  };

  auto evaluate = [&](WorkItem w) -> WorkItem {
    if (w.status != LineStatus::Ok) {
      stats.add_processed();
      stats.add_line_error(to_string(w.status));
      std::cerr << ("[source] line " + std::to_string(w.index) + " skipped: " +
                    to_string(w.status) + "\n");
      w.verdict = Verdict::LineError;
      return w;
    }
    const std::string_view t = trim(w.text);
    if (t.empty()) {
      stats.add_blank();
      w.verdict = Verdict::Blank;
      return w;
    }
    stats.add_processed();
    w.verdict = pred_(t) ? Verdict::Accepted : Verdict::Rejected;
    return w;
  };

  auto write = [&](WorkItem w) -> std::uint64_t {
    if (w.verdict == Verdict::Accepted && !failed_.load(std::memory_order_acquire)) {
      switch (sink.append(w.text)) {
        case OutputSink::Append::Written:
        case OutputSink::Append::Duplicate:
          stats.add_valid();
          break;
        case OutputSink::Append::Failed:
          fail(sink.error(), token);
          break;
      }
    }
    return w.index;
  };

  auto commit = [&](std::uint64_t index) {
    // nothing past a failed write may become part of the resume boundary
    if (failed_.load(std::memory_order_acquire)) return;
    if (on_commit) on_commit(index + 1);
  };

  const auto write_mode = cfg_.preserve_order ? tbb::filter_mode::serial_in_order
                                              : tbb::filter_mode::serial_out_of_order;
  try {
    tbb::task_arena arena(static_cast<int>(workers));
    arena.execute([&] {
      tbb::parallel_pipeline(
          tokens,
          tbb::make_filter<void, WorkItem>(tbb::filter_mode::serial_in_order, read) &
          tbb::make_filter<WorkItem, WorkItem>(tbb::filter_mode::parallel, evaluate) &
          tbb::make_filter<WorkItem, std::uint64_t>(write_mode, write) &
          tbb::make_filter<std::uint64_t, void>(tbb::filter_mode::serial_in_order, commit));
    });
  } catch (const std::exception& e) {
    fail(std::string("worker failed: ") + e.what(), token);
  }
  return !failed_.load(std::memory_order_acquire);
}

}
