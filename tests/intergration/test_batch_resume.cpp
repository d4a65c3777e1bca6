#include "mnemonic_sieve/batch_runner.hpp"
#include "mnemonic_sieve/checkpoint_store.hpp"
#include "mnemonic_sieve/report_writer.hpp"
#include "../test_support.hpp"

#include <simdjson.h>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int fails = 0;
static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

struct Fixture {
  std::vector<std::string> lines;
  std::vector<std::string> valid;     // valid lines in input order
  std::vector<std::size_t> valid_at;  // their indices
};

// Every 5th line blank, every 3rd a valid phrase, the rest junk or bad checksums.
static Fixture make_fixture(const std::vector<std::string>& words, std::size_t n) {
  Fixture f;
  const std::size_t sizes[] = {12, 15, 18, 21, 24};
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t wc = sizes[i % 5];
    const auto seed = static_cast<std::uint32_t>(i + 1);
    std::string line;
    if (i % 5 == 4)      line = "   ";
    else if (i % 3 == 0) line = mst::valid_phrase(words, wc, seed);
    else if (i % 3 == 1) line = mst::bad_checksum_phrase(words, wc, seed);
    else                 line = "junk line " + std::to_string(i);
    if (i % 5 != 4 && i % 3 == 0) { f.valid.push_back(line); f.valid_at.push_back(i); }
    f.lines.push_back(line);
  }
  return f;
}

static ms::BatchRunner::Options options(const mst::ScopedDir& dir, const std::string& out) {
  ms::BatchRunner::Options o;
  o.input_path = (dir / "in.txt").string();
  o.output_path = (dir / out).string();
  o.checkpoint_path = (dir / "state" / "ckpt").string();
  o.workers = 4;
  o.checkpoint_interval = 25;
  o.progress_interval = std::chrono::milliseconds(0);
  o.log_to_console = false;
  return o;
}

static std::uint64_t non_blank_from(const Fixture& f, std::size_t k) {
  std::uint64_t n = 0;
  for (std::size_t i = k; i < f.lines.size(); ++i) n += (i % 5 != 4);
  return n;
}

int main(){
  mst::ScopedDir dir("batch-resume");
  const auto words = mst::synthetic_wordlist();
  ms::MnemonicValidator v;
  if (!v.set_wordlist(words)) { std::cerr << "[ERR] wordlist\n"; return 2; }
  const auto pred = v.as_predicate();

  // small worked example
  {
    mst::write_lines(dir / "in.txt", {mst::valid_phrase(words, 24, 9), "not a phrase",
                                      mst::valid_phrase(words, 12, 4)});
    ms::BatchRunner r(options(dir, "example.txt"), pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Completed && ms::exit_code(o) == 0, "example completes");
    expect(o.processed == 3 && o.valid == 2 && o.total_lines == 3, "example counters");
    expect(mst::read_lines(dir / "example.txt").size() == 2, "example writes the two valid phrases");
    expect(!fs::exists(dir / "state" / "ckpt"), "checkpoint removed on completion");
  }

  // empty input
  {
    mst::write_text(dir / "in.txt", "");
    ms::BatchRunner r(options(dir, "empty.txt"), pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Completed && o.processed == 0 && o.valid == 0, "empty input completes");
    expect(fs::exists(dir / "empty.txt") && fs::file_size(dir / "empty.txt") == 0, "empty output created");
  }

  const Fixture fx = make_fixture(words, 400);
  mst::write_lines(dir / "in.txt", fx.lines);

  // full run, twice: same output set
  std::set<std::string> first_set;
  for (int pass = 0; pass < 2; ++pass) {
    const std::string out = "full" + std::to_string(pass) + ".txt";
    ms::BatchRunner r(options(dir, out), pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Completed, "full run completes");
    expect(o.processed == non_blank_from(fx, 0) && o.blank == 80, "blank lines not processed");
    expect(o.valid == fx.valid.size(), "valid count");
    expect(o.checkpoint == 400, "high-water mark reaches the end");
    const auto got = mst::read_lines(dir / out);
    std::set<std::string> s(got.begin(), got.end());
    expect(s == std::set<std::string>(fx.valid.begin(), fx.valid.end()), "output is the valid set");
    if (pass == 0) first_set = s;
    else expect(s == first_set, "two runs agree");
  }

  // resuming from K processes exactly the lines with index >= K
  for (std::size_t k : {0u, 1u, 24u, 25u, 199u, 399u, 400u}) {
    ms::CheckpointStore st((dir / "state" / "ckpt").string());
    expect(st.save(k), "seed checkpoint");
    const std::string out = "resume" + std::to_string(k) + ".txt";
    ms::BatchRunner r(options(dir, out), pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Completed && o.resumed_from == k, "resume completes from " + std::to_string(k));
    expect(o.processed == non_blank_from(fx, k), "processed count after resume from " + std::to_string(k));

    std::set<std::string> want;
    for (std::size_t j = 0; j < fx.valid.size(); ++j)
      if (fx.valid_at[j] >= k) want.insert(fx.valid[j]);
    const auto got = mst::read_lines(dir / out);
    expect(std::set<std::string>(got.begin(), got.end()) == want && got.size() == want.size(),
           "resumed output from " + std::to_string(k));
  }

  // checkpoint past the end finishes without work
  {
    ms::CheckpointStore st((dir / "state" / "ckpt").string());
    st.save(10000);
    ms::BatchRunner r(options(dir, "past_end.txt"), pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Completed && o.processed == 0, "checkpoint past end completes");
    expect(!fs::exists(dir / "state" / "ckpt"), "and clears the checkpoint");
  }

  // corrupt checkpoint restarts from 0
  {
    mst::write_text(dir / "state" / "ckpt", "garbage");
    ms::BatchRunner r(options(dir, "corrupt.txt"), pred);
    const auto o = r.run();
    expect(o.resumed_from == 0 && o.valid == fx.valid.size(), "corrupt checkpoint treated as 0");
  }

  // preserve_order keeps input order in the output
  {
    auto opt = options(dir, "ordered.txt");
    opt.preserve_order = true;
    ms::BatchRunner r(opt, pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Completed, "ordered run completes");
    expect(mst::read_lines(dir / "ordered.txt") == fx.valid, "output in input order");
  }

  // dedup against an existing output
  {
    auto opt = options(dir, "ordered.txt");
    opt.dedup_output = true;
    ms::BatchRunner r(opt, pred);
    const auto o = r.run();
    expect(o.duplicates == fx.valid.size() && mst::read_lines(dir / "ordered.txt").size() == fx.valid.size(),
           "dedup leaves the file unchanged on a rerun");
  }

  // fatal: input missing, output is a directory
  {
    auto opt = options(dir, "unused.txt");
    opt.input_path = (dir / "absent.txt").string();
    ms::BatchRunner r(opt, pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Failed && ms::exit_code(o) == 1 && !o.error.empty(), "missing input fails");
  }
  {
    fs::create_directories(dir / "a_directory");
    auto opt = options(dir, "a_directory");
    ms::BatchRunner r(opt, pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Failed && ms::exit_code(o) == 1, "unwritable output fails");
  }

  // the output device fills up: the run fails and the checkpoint never
  // covers lines that did not reach the file
  if (fs::exists("/dev/full")) {
    std::vector<std::string> phrases;
    for (std::uint32_t i = 0; i < 200; ++i) phrases.push_back(mst::valid_phrase(words, 24, i + 1));
    mst::write_lines(dir / "phrases.txt", phrases);
    auto opt = options(dir, "unused.txt");
    opt.input_path = (dir / "phrases.txt").string();
    opt.output_path = "/dev/full";
    opt.checkpoint_path = (dir / "full_ckpt").string();
    ms::BatchRunner r(opt, pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Failed && ms::exit_code(o) == 1, "full output device fails the run");
    expect(o.error.find("/dev/full") != std::string::npos, "error names the output: " + o.error);
    ms::CheckpointStore st(opt.checkpoint_path);
    expect(o.checkpoint == 0 && st.load() == 0, "checkpoint stays at the last flushed boundary");
  }

  // the checkpoint directory turns into a regular file after the run starts
  {
    const auto ck = dir / "ck";
    auto opt = options(dir, "ckfail.txt");
    opt.checkpoint_path = (ck / "ckpt").string();
    std::once_flag once;
    auto sabotage = [&](std::string_view line) {
      std::call_once(once, [&] {
        fs::remove_all(ck);
        mst::write_text(ck, "not a directory");
      });
      return pred(line);
    };
    ms::BatchRunner r(opt, sabotage);
    const auto o = r.run();
    expect(o.state == ms::RunState::Failed && ms::exit_code(o) == 1, "periodic checkpoint failure fails the run");
    expect(o.cancel_reason == ms::CancelReason::Failure, "cancelled with reason failure");
    expect(o.error.find("checkpoint") != std::string::npos, "error mentions the checkpoint: " + o.error);
    expect(o.processed < non_blank_from(fx, 0), "run stopped early");
    fs::remove(ck);
  }

  // undecodable and oversize lines go through the whole run as line errors
  {
    const std::string a = mst::valid_phrase(words, 24, 71);
    const std::string b = mst::valid_phrase(words, 12, 72);
    mst::write_text(dir / "mixed.txt", a + "\n\xff\xfe\n" + std::string(300, 'a') + "\n" + b + "\n\n");
    auto opt = options(dir, "mixed_out.txt");
    opt.input_path = (dir / "mixed.txt").string();
    opt.max_line_bytes = 150;
    ms::BatchRunner r(opt, pred);
    const auto o = r.run();
    expect(o.state == ms::RunState::Completed && o.total_lines == 5, "mixed input completes");
    expect(o.processed == 4 && o.valid == 2 && o.blank == 1 && o.line_errors == 2, "mixed input counters");
    const auto& kinds = o.stats.errors_by_kind;
    expect(kinds.count("invalid_encoding") && kinds.at("invalid_encoding") == 1, "one invalid_encoding line");
    expect(kinds.count("oversize") && kinds.at("oversize") == 1, "one oversize line");
    const auto got = mst::read_lines(dir / "mixed_out.txt");
    expect(std::set<std::string>(got.begin(), got.end()) == std::set<std::string>{a, b}, "only the valid phrases written");
  }

  // run report
  {
    ms::BatchRunner r(options(dir, "reported.txt"), pred);
    const auto o = r.run();
    std::string err;
    const auto rep = dir / "report";
    expect(ms::write_run_report(rep.string(), o, &err), "report written: " + err);
    expect(fs::exists(rep / "report.html") && fs::file_size(rep / "report.html") > 0, "report.html");

    simdjson::dom::parser p;
    simdjson::dom::element doc;
    const std::string text = mst::read_text(rep / "run.json");
    if (p.parse(text).get(doc) != simdjson::SUCCESS) {
      expect(false, "run.json parses");
    } else {
      std::uint64_t valid = 0;
      std::string_view state;
      simdjson::dom::array stages;
      expect(doc["valid"].get(valid) == simdjson::SUCCESS && valid == fx.valid.size(), "run.json valid");
      expect(doc["state"].get(state) == simdjson::SUCCESS && state == "completed", "run.json state");
      expect(doc["stage_times"].get(stages) == simdjson::SUCCESS && stages.size() == 2, "run.json stages");
    }
    const std::string html = mst::read_text(rep / "report.html");
    expect(html.find("completed") != std::string::npos && html.find("{{") == std::string::npos,
           "html rendered");
  }

  if (fails) return 1;
  std::cout << "[PASS] batch resume\n";
  return 0;
}
