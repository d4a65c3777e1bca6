#include "mnemonic_sieve/batch_runner.hpp"
#include "mnemonic_sieve/checkpoint_store.hpp"
#include "mnemonic_sieve/line_source.hpp"
#include "mnemonic_sieve/output_sink.hpp"
#include "mnemonic_sieve/path_utils.hpp"
#include "mnemonic_sieve/stats.hpp"
#include "mnemonic_sieve/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace ms {

const char* to_string(RunState s) noexcept {
  switch (s) {
    case RunState::Idle:      return "idle";
    case RunState::Running:   return "running";
    case RunState::Completed: return "completed";
    case RunState::Cancelled: return "cancelled";
    case RunState::Failed:    return "failed";
  }
  return "unknown";
}

int exit_code(const RunOutcome& o) noexcept {
  return (o.state == RunState::Completed || o.state == RunState::Cancelled) ? 0 : 1;
}

struct BatchRunner::Shared {
  Options opt;
  LinePredicate pred;

  CancellationToken token;
  CheckpointStore store;
  HighWaterMark mark;
  ProcessingStats stats;
  ProgressReporter reporter;
  std::atomic<int> state{static_cast<int>(RunState::Idle)};

  std::unique_ptr<LineSource> source;
  std::unique_ptr<OutputSink> sink;
  std::unique_ptr<WorkerPool> pool;

  std::atomic<bool> loaded{false};         // resume point read from the store
  std::atomic<bool> pipeline_live{false};
  std::atomic<bool> abandoned{false};      // set under commit_mu
  std::atomic<std::uint64_t> durable{0};   // last checkpoint saved after a sink flush

  std::mutex commit_mu;
  std::string commit_error;   // first failed periodic flush or save

  Shared(Options o, LinePredicate p, ProgressReporter::Callback cb)
    : opt(std::move(o)), pred(std::move(p)), store(opt.checkpoint_path),
      reporter(0, opt.progress_interval, std::move(cb)) {}

  RunState current() const { return static_cast<RunState>(state.load()); }
  void set(RunState s) { state.store(static_cast<int>(s)); }

  bool persist(std::uint64_t index, std::string* err) {
    return store.save(index, err);
  }

  // Commits arriving after abandon() come from a detached pipeline whose
  // run has already reported; they must not touch the checkpoint file.
  // A periodic checkpoint is only saved once the output below it is flushed.
  void on_commit(std::uint64_t next) {
    if (abandoned.load(std::memory_order_acquire)) return;
    if (!mark.raise(next)) return;
    if (next % opt.checkpoint_interval == 0) {
      std::string err;
      bool ok = true;
      {
        std::lock_guard<std::mutex> lk(commit_mu);
        if (abandoned.load(std::memory_order_relaxed)) return;
        if (!sink->flush(&err)) {
          ok = false;
          if (commit_error.empty()) commit_error = err;
        } else if (!persist(next, &err)) {
          ok = false;
          if (commit_error.empty()) commit_error = "checkpoint update failed: " + err;
        } else {
          durable.store(next);
        }
      }
      if (!ok) token.request(CancelReason::Failure);
    }
    reporter.maybe_emit(next, stats.processed(), stats.valid(), stats.elapsed_seconds());
  }

  void abandon() {
    std::lock_guard<std::mutex> lk(commit_mu);
    abandoned.store(true, std::memory_order_release);
  }

  std::string first_commit_error() {
    std::lock_guard<std::mutex> lk(commit_mu);
    return commit_error;
  }
};

// Clamped to [0, kMaxIntervalSeconds]; NaN maps to 0.
static std::chrono::milliseconds to_millis(double seconds) {
  const double s = std::isfinite(seconds) ? std::clamp(seconds, 0.0, kMaxIntervalSeconds) : 0.0;
  return std::chrono::milliseconds(static_cast<std::int64_t>(s * 1000.0));
}

BatchRunner::Options BatchRunner::options_from(const RunConfig& cfg) {
  Options o;
  o.input_path = cfg.input_path;
  o.output_path = cfg.output_path;
  o.checkpoint_path = resolved_checkpoint_path(cfg);
  o.workers = cfg.workers;
  o.checkpoint_interval = cfg.checkpoint_interval;
  o.progress_interval = to_millis(cfg.progress_interval_s);
  o.grace_period = to_millis(cfg.grace_period_s);
  o.max_line_bytes = cfg.max_line_bytes;
  o.preserve_order = cfg.preserve_order;
  o.dedup_output = cfg.dedup_output;
  return o;
}

BatchRunner::BatchRunner(Options opt, LinePredicate pred, ProgressReporter::Callback on_progress) {
  if (opt.checkpoint_interval == 0) opt.checkpoint_interval = 1;
  s_ = std::make_shared<Shared>(std::move(opt), std::move(pred), std::move(on_progress));
}

BatchRunner::~BatchRunner() = default;

RunState BatchRunner::state() const { return s_->current(); }
ProgressSnapshot BatchRunner::progress() const { return s_->reporter.latest(); }
std::uint64_t BatchRunner::high_water_mark() const { return s_->mark.value(); }
bool BatchRunner::pipeline_active() const { return s_->pipeline_live.load(); }

bool BatchRunner::cancel(CancelReason why) {
  if (!s_->token.request(why)) return false;
  s_->reporter.set_status("Cancelling...");
  // before the resume point is loaded the mark is still 0
  if (s_->current() == RunState::Running && s_->loaded.load()) {
    const std::uint64_t at = s_->mark.value();
    std::string err;
    if (s_->persist(at, &err)) {
      std::cerr << "[signal] cancel requested (" << to_string(why)
                << "), checkpoint saved at " << at << "\n";
    } else {
      std::cerr << "[signal] cancel requested, checkpoint save failed: " << err << "\n";
    }
  }
  return true;
}

RunOutcome BatchRunner::run() {
  auto s = s_;
  RunOutcome out;
  out.input_path = s->opt.input_path;
  out.output_path = s->opt.output_path;
  out.checkpoint_path = s->opt.checkpoint_path;

  int idle = static_cast<int>(RunState::Idle);
  if (!s->state.compare_exchange_strong(idle, static_cast<int>(RunState::Running))) {
    out.state = RunState::Failed;
    out.error = "run already started";
    return out;
  }
  s->stats.restart_clock();
  s->reporter.set_status("Starting...");

  auto fail = [&](std::string why) {
    out.state = RunState::Failed;
    out.error = std::move(why);
    out.stats = s->stats.snapshot();
    out.wall_seconds = out.stats.elapsed_s;
    std::cerr << "[run] error: " << out.error << "\n";
    s->reporter.emit(s->mark.value(), s->stats.processed(), s->stats.valid(),
                     s->stats.elapsed_seconds(), "Error: " + out.error);
    s->set(RunState::Failed);
    return out;
  };

  if (!ensure_parent_dirs(s->opt.checkpoint_path))
    return fail("cannot create checkpoint directory for '" + s->opt.checkpoint_path + "'");
  const std::uint64_t resume = s->store.load();
  s->mark.raise(resume);
  s->durable.store(resume);
  s->loaded.store(true);
  out.resumed_from = resume;

  LineSource::Config scfg;
  scfg.max_line_bytes = s->opt.max_line_bytes;
  s->source = std::make_unique<LineSource>(s->opt.input_path, scfg);
  s->stats.start_stage("count_lines");
  if (!s->source->open()) return fail(s->source->error());
  s->stats.end_stage("count_lines");
  out.total_lines = s->source->total_lines();
  s->reporter.set_total(out.total_lines);

  if (s->opt.log_to_console)
    std::cout << "Total lines: " << out.total_lines
              << ", Starting from checkpoint: " << resume << std::endl;
  if (resume > out.total_lines)
    std::cerr << "[checkpoint] resume point " << resume << " is past the end of the input ("
              << out.total_lines << " lines)\n";

  std::string err;
  if (!s->persist(resume, &err)) return fail(err);

  OutputSink::Config kcfg;
  kcfg.dedup = s->opt.dedup_output;
  s->sink = std::make_unique<OutputSink>(s->opt.output_path, kcfg);
  if (!s->sink->open(&err)) return fail(err);

  WorkerPool::Config pcfg;
  pcfg.workers = s->opt.workers;
  pcfg.preserve_order = s->opt.preserve_order;
  pcfg.resume_from = resume;
  s->pool = std::make_unique<WorkerPool>(pcfg, s->pred);

  if (s->opt.log_to_console)
    std::cout << "Starting validation process (" << s->pool->concurrency() << " workers)..."
              << std::endl;
  s->reporter.emit(resume, 0, 0, 0.0, "Processing...");
  s->stats.start_stage("validate");

  auto done = std::make_shared<std::promise<bool>>();
  std::future<bool> fut = done->get_future();
  s->pipeline_live.store(true);
  std::thread worker([s, done] {
    const bool ok = s->pool->run(*s->source, *s->sink, s->stats, s->token,
                                 [s](std::uint64_t next) { s->on_commit(next); });
    done->set_value(ok);
    s->pipeline_live.store(false);
  });

  bool drained = true;
  bool have_deadline = false;
  std::chrono::steady_clock::time_point deadline{};
  while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
    if (!s->token.cancelled()) continue;
    const auto now = std::chrono::steady_clock::now();
    if (!have_deadline) {
      have_deadline = true;
      deadline = now + s->opt.grace_period;
    } else if (now >= deadline) {
      drained = false;
      break;
    }
  }

  bool pool_ok = false;
  if (drained) {
    worker.join();
    pool_ok = fut.get();
  } else {
    s->abandon();
    worker.detach();
    std::cerr << "[run] pipeline still busy after the grace period, detached\n";
  }
  s->stats.end_stage("validate");

  out.drained = drained;
  out.cancel_reason = s->token.reason();
  out.checkpoint = s->mark.value();

  // also after a detach: the pipeline keeps appending under the sink lock
  std::string flush_err;
  const bool flushed = s->sink->flush(&flush_err);
  const std::string commit_err = s->first_commit_error();

  if (!flushed) {
    out.state = RunState::Failed;
    out.error = flush_err;
  } else if (!drained) {
    out.state = RunState::Cancelled;
    out.error = "in-flight lines did not finish within the grace period";
  } else if (!pool_ok || !commit_err.empty()) {
    out.state = RunState::Failed;
    out.error = !pool_ok ? s->pool->error() : commit_err;
  } else if (s->token.cancelled()) {
    out.state = RunState::Cancelled;
  } else {
    out.state = RunState::Completed;
  }

  if (out.state == RunState::Completed) {
    if (!s->store.remove(&err)) std::cerr << "[checkpoint] " << err << "\n";
  } else if (!flushed) {
    // lines committed since the last flushed checkpoint never reached the output
    out.checkpoint = s->durable.load();
    if (!s->store.rewind(out.checkpoint, &err)) {
      std::cerr << "[checkpoint] final save failed: " << err << "\n";
    } else {
      std::cerr << "[checkpoint] output failed, resume point reset to " << out.checkpoint << "\n";
    }
  } else if (!s->persist(out.checkpoint, &err)) {
    std::cerr << "[checkpoint] final save failed: " << err << "\n";
    if (out.error.empty()) out.error = err;
  }
  if (drained) s->sink->close();

  out.stats = s->stats.snapshot();
  out.processed = out.stats.processed;
  out.valid = out.stats.valid;
  out.blank = out.stats.blank;
  out.line_errors = out.stats.line_errors;
  out.duplicates = s->sink->duplicates();
  out.wall_seconds = out.stats.elapsed_s;
  out.lines_per_sec = out.wall_seconds > 0.0 ? out.processed / out.wall_seconds : 0.0;

  std::string status = "Done.";
  if (out.state == RunState::Cancelled) status = "Cancelled.";
  if (out.state == RunState::Failed) {
    status = "Error: " + out.error;
    std::cerr << "[run] error: " << out.error << "\n";
  }
  s->reporter.emit(out.checkpoint, out.processed, out.valid, out.wall_seconds, status);
  s->set(out.state);
  return out;
}

}
