#include "mnemonic_sieve/batch_runner.hpp"
#include "mnemonic_sieve/checkpoint_store.hpp"
#include "../test_support.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static int fails = 0;
static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static ms::BatchRunner::Options options(const mst::ScopedDir& dir, bool ordered) {
  ms::BatchRunner::Options o;
  o.input_path = (dir / "in.txt").string();
  o.output_path = (dir / "out.txt").string();
  o.checkpoint_path = (dir / "ckpt").string();
  o.workers = 3;
  o.checkpoint_interval = 20;
  o.progress_interval = 0ms;
  o.grace_period = 5000ms;
  o.preserve_order = ordered;
  o.log_to_console = false;
  return o;
}

// Lines are "v<i>" (valid) or "x<i>"; the predicate is slow enough to cancel mid-run.
static std::vector<std::string> make_lines(std::size_t n) {
  std::vector<std::string> lines;
  for (std::size_t i = 0; i < n; ++i)
    lines.push_back((i % 4 == 0 ? "v" : "x") + std::to_string(i));
  return lines;
}

static bool slow_pred(std::string_view s) {
  std::this_thread::sleep_for(200us);
  return !s.empty() && s[0] == 'v';
}

static void cancel_then_resume(bool ordered) {
  const std::string tag = ordered ? "ordered" : "unordered";
  mst::ScopedDir dir("batch-cancel-" + tag);
  const auto lines = make_lines(4000);
  mst::write_lines(dir / "in.txt", lines);

  ms::RunOutcome first;
  {
    ms::BatchRunner r(options(dir, ordered), slow_pred);
    auto fut = std::async(std::launch::async, [&r]{ return r.run(); });
    for (int i = 0; i < 500 && r.high_water_mark() < 200; ++i) std::this_thread::sleep_for(5ms);
    expect(r.cancel(ms::CancelReason::Request), tag + ": first cancel accepted");
    expect(!r.cancel(ms::CancelReason::Interrupt), tag + ": second cancel is a no-op");
    first = fut.get();
  }
  expect(first.state == ms::RunState::Cancelled && first.drained, tag + ": cancelled and drained");
  expect(first.cancel_reason == ms::CancelReason::Request, tag + ": cancel reason kept");
  expect(ms::exit_code(first) == 0, tag + ": cancellation exits 0");
  expect(first.checkpoint >= 200 && first.checkpoint < lines.size(), tag + ": stopped mid-run");

  ms::CheckpointStore st((dir / "ckpt").string());
  const std::uint64_t k = st.load();
  expect(k == first.checkpoint, tag + ": persisted checkpoint equals the high-water mark");
  expect(first.processed == k, tag + ": every line below the mark was processed");

  // nothing at or past the mark reached the output
  std::set<std::string> partial;
  for (const auto& l : mst::read_lines(dir / "out.txt")) partial.insert(l);
  bool bounded = true;
  for (const auto& l : partial) bounded = bounded && std::stoull(l.substr(1)) < k;
  expect(bounded && partial.size() == (k + 3) / 4, tag + ": output holds exactly the valid lines below the mark");

  ms::BatchRunner again(options(dir, ordered), slow_pred);
  const auto second = again.run();
  expect(second.state == ms::RunState::Completed && second.resumed_from == k, tag + ": resume completes");
  expect(first.processed + second.processed == lines.size(), tag + ": no line skipped or repeated");

  const auto all = mst::read_lines(dir / "out.txt");
  std::set<std::string> uniq(all.begin(), all.end());
  expect(all.size() == lines.size() / 4 && uniq.size() == all.size(), tag + ": final output has every valid line once");
  if (ordered) {
    bool sorted = true;
    for (std::size_t i = 1; i < all.size(); ++i)
      sorted = sorted && std::stoull(all[i - 1].substr(1)) < std::stoull(all[i].substr(1));
    expect(sorted, tag + ": order preserved across the resume");
  }
  expect(!fs::exists(dir / "ckpt"), tag + ": checkpoint gone after completion");
}

// A stuck predicate: the grace period expires and the run reports undrained.
static void grace_period_expiry() {
  mst::ScopedDir dir("batch-grace");
  mst::write_lines(dir / "in.txt", make_lines(50));

  auto release = std::make_shared<std::atomic<bool>>(false);
  auto entered = std::make_shared<std::atomic<int>>(0);
  auto pred = [release, entered](std::string_view) {
    ++*entered;
    for (int i = 0; i < 400 && !release->load(); ++i) std::this_thread::sleep_for(5ms);
    return false;
  };

  auto opt = options(dir, false);
  opt.grace_period = 100ms;
  opt.checkpoint_interval = 1;
  ms::BatchRunner r(opt, pred);
  auto fut = std::async(std::launch::async, [&r]{ return r.run(); });
  for (int i = 0; i < 400 && entered->load() == 0; ++i) std::this_thread::sleep_for(5ms);

  const auto t0 = std::chrono::steady_clock::now();
  r.cancel(ms::CancelReason::Interrupt);
  const auto o = fut.get();
  const auto waited = std::chrono::steady_clock::now() - t0;

  expect(o.state == ms::RunState::Cancelled && !o.drained, "grace: reported undrained");
  expect(o.cancel_reason == ms::CancelReason::Interrupt, "grace: interrupt reason");
  expect(waited < 1500ms, "grace: run returned shortly after the grace period");

  ms::CheckpointStore st((dir / "ckpt").string());
  expect(fs::exists(dir / "ckpt") && st.load() == 0, "grace: checkpoint written with no committed lines");
  expect(r.pipeline_active(), "grace: pipeline still alive after run() returned");

  // the abandoned pipeline commits its lines but leaves the checkpoint alone
  release->store(true);
  for (int i = 0; i < 400 && r.pipeline_active(); ++i) std::this_thread::sleep_for(5ms);
  expect(!r.pipeline_active(), "grace: pipeline finished once released");
  expect(st.load() == 0, "grace: late commits did not move the checkpoint");
}

// cancel() before the resume point is loaded must not clobber the stored checkpoint
static void cancel_before_load() {
  mst::ScopedDir dir("batch-early-cancel");
  mst::write_lines(dir / "in.txt", make_lines(2000));
  const auto ckpt = (dir / "ckpt").string();
  ms::CheckpointStore seed(ckpt);
  seed.save(40);

  {
    ms::BatchRunner r(options(dir, false), slow_pred);
    expect(r.cancel(ms::CancelReason::Interrupt), "early: cancel accepted while idle");
    const auto o = r.run();
    expect(o.state == ms::RunState::Cancelled && o.drained, "early: run ends cancelled");
    expect(o.resumed_from == 40 && o.checkpoint == 40 && o.processed == 0, "early: nothing processed");
    expect(ms::CheckpointStore(ckpt).load() == 40, "early: checkpoint kept");
  }

  // cancel racing the start of run()
  int kept = 0, runs = 0;
  for (int i = 0; i < 50; ++i) {
    ms::BatchRunner r(options(dir, false), slow_pred);
    auto fut = std::async(std::launch::async, [&r]{ return r.run(); });
    r.cancel(ms::CancelReason::Interrupt);
    const auto o = fut.get();
    if (o.state == ms::RunState::Completed) {
      seed.rewind(40);
      continue;
    }
    ++runs;
    if (o.state == ms::RunState::Cancelled && ms::CheckpointStore(ckpt).load() >= 40) ++kept;
  }
  expect(kept == runs, "early: racing cancel never lowers the checkpoint (" +
                       std::to_string(kept) + "/" + std::to_string(runs) + ")");
}

int main(){
  cancel_then_resume(false);
  cancel_then_resume(true);
  grace_period_expiry();
  cancel_before_load();

  if (fails) return 1;
  std::cout << "[PASS] batch cancel\n";
  return 0;
}
