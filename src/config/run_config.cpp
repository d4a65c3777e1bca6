#include "mnemonic_sieve/config.hpp"
#include "mnemonic_sieve/path_utils.hpp"
#include "mnemonic_sieve/worker_pool.hpp"

#include <fast_float/fast_float.h>
#include <simdjson.h>

#include <charconv>
#include <cmath>
#include <string_view>

namespace ms {

static bool parse_double(std::string_view s, double& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

template <typename T>
static bool parse_uint(std::string_view s, T& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

std::string usage() {
  return
    "Usage: mnemonic-sieve [-i FILE|--input=FILE] [-o FILE|--output=FILE] [--auto-output]\n"
    "                      [--config=FILE] [--checkpoint=FILE] [--wordlist=FILE]\n"
    "                      [--workers=N] [--checkpoint-interval=N] [--progress-interval=SEC]\n"
    "                      [--grace-period=SEC] [--max-line-bytes=N]\n"
    "                      [--preserve-order] [--dedup] [--report-dir=DIR]\n"
    "                      [--serve] [--port=N] [--quiet]\n"
    "\n"
    "Reads one candidate mnemonic per line, writes the valid ones to the output\n"
    "file and resumes from a checkpoint after Ctrl+C.\n";
}

std::string resolved_checkpoint_path(const RunConfig& cfg) {
  return cfg.checkpoint_path.empty() ? default_checkpoint_path().string()
                                     : cfg.checkpoint_path;
}

bool load_config_file(const std::string& path, RunConfig& cfg, std::string* err) {
  auto loaded = simdjson::padded_string::load(path);
  if (loaded.error()) {
    if (err) *err = "cannot read config '" + path + "': " + simdjson::error_message(loaded.error());
    return false;
  }
  simdjson::padded_string json = std::move(loaded).value();

  simdjson::ondemand::parser parser;
  std::string bad_key;
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      auto str = [&](std::string& out) { out = std::string(std::string_view(v.get_string())); };

      if      (key == "input_path")          str(cfg.input_path);
      else if (key == "output_path")         str(cfg.output_path);
      else if (key == "auto_output")         cfg.auto_output = v.get_bool();
      else if (key == "checkpoint_path")     str(cfg.checkpoint_path);
      else if (key == "wordlist_path")       str(cfg.wordlist_path);
      else if (key == "workers")             cfg.workers = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
      else if (key == "checkpoint_interval") cfg.checkpoint_interval = v.get_uint64();
      else if (key == "progress_interval_s") cfg.progress_interval_s = v.get_double();
      else if (key == "grace_period_s")      cfg.grace_period_s = v.get_double();
      else if (key == "max_line_bytes")      cfg.max_line_bytes = static_cast<std::size_t>(std::uint64_t(v.get_uint64()));
      else if (key == "preserve_order")      cfg.preserve_order = v.get_bool();
      else if (key == "dedup_output")        cfg.dedup_output = v.get_bool();
      else if (key == "report_dir")          str(cfg.report_dir);
      else if (key == "serve")               cfg.serve = v.get_bool();
      else if (key == "port") {
        const std::int64_t port = v.get_int64();
        cfg.port = (port < 0 || port > 65535) ? -1 : static_cast<int>(port);  // -1 fails validate()
      }
      else if (key == "quiet")               cfg.quiet = v.get_bool();
      else { bad_key = std::string(key); break; }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err) *err = "config '" + path + "': " + e.what();
    return false;
  }
  if (!bad_key.empty()) {
    if (err) *err = "config '" + path + "': unknown key '" + bad_key + "'";
    return false;
  }
  return true;
}

bool validate(const RunConfig& c, std::string* err) {
  auto bad = [&](const std::string& why) { if (err) *err = why; return false; };
  if (c.input_path.empty())  return bad("input path is empty");
  if (c.output_path.empty()) return bad("output path is empty");
  if (c.input_path == c.output_path) return bad("input and output are the same file");
  if (c.checkpoint_interval == 0) return bad("checkpoint interval must be > 0");
  if (!std::isfinite(c.progress_interval_s) || c.progress_interval_s < 0.0 ||
      c.progress_interval_s > kMaxIntervalSeconds)
    return bad("progress interval must be between 0 and 86400 seconds");
  if (!std::isfinite(c.grace_period_s) || c.grace_period_s < 0.0 ||
      c.grace_period_s > kMaxIntervalSeconds)
    return bad("grace period must be between 0 and 86400 seconds");
  if (c.workers > WorkerPool::kMaxWorkers)
    return bad("workers must be at most " + std::to_string(WorkerPool::kMaxWorkers));
  if (c.max_line_bytes == 0) return bad("max line bytes must be > 0");
  if (c.port <= 0 || c.port > 65535) return bad("port out of range");
  return true;
}

CliResult parse_cli(int argc, char** argv, RunConfig& c) {
  CliResult r;
  auto error = [&](std::string why) { r.action = CliAction::Error; r.error = std::move(why); return r; };

  // config file first so that flags override it
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) r.config_file = a.substr(9);
    else if (a == "--config" && i + 1 < argc) r.config_file = argv[++i];
  }
  if (!r.config_file.empty()) {
    std::string err;
    if (!load_config_file(r.config_file, c, &err)) return error(err);
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    std::string bad;
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_num = [&](const char* pfx, auto* out){
      if (a.rfind(pfx, 0) != 0) return false;
      if (!parse_uint(std::string_view(a).substr(std::string(pfx).size()), *out)) bad = a;
      return true;
    };
    auto eat_sec = [&](const char* pfx, double* out){
      if (a.rfind(pfx, 0) != 0) return false;
      if (!parse_double(std::string_view(a).substr(std::string(pfx).size()), *out)) bad = a;
      return true;
    };
    auto next_value = [&](std::string* out){
      if (i + 1 >= argc) { bad = a + " needs a value"; return; }
      *out = argv[++i];
    };

    if (a == "-h" || a == "--help") { r.action = CliAction::Help; return r; }
    if (a == "--config") { ++i; continue; }
    if (a.rfind("--config=", 0) == 0) continue;
    if (a == "-i" || a == "--input")  { next_value(&c.input_path);  }
    else if (a == "-o" || a == "--output") { next_value(&c.output_path); }
    else if (eat("--input=", &c.input_path)) {}
    else if (eat("--output=", &c.output_path)) {}
    else if (eat("--checkpoint=", &c.checkpoint_path)) {}
    else if (eat("--wordlist=", &c.wordlist_path)) {}
    else if (eat("--report-dir=", &c.report_dir)) {}
    else if (eat_num("--workers=", &c.workers)) {}
    else if (eat_num("--checkpoint-interval=", &c.checkpoint_interval)) {}
    else if (eat_num("--max-line-bytes=", &c.max_line_bytes)) {}
    else if (eat_num("--port=", &c.port)) {}
    else if (eat_sec("--progress-interval=", &c.progress_interval_s)) {}
    else if (eat_sec("--grace-period=", &c.grace_period_s)) {}
    else if (a == "--auto-output")    c.auto_output = true;
    else if (a == "--preserve-order") c.preserve_order = true;
    else if (a == "--dedup")          c.dedup_output = true;
    else if (a == "--serve")          c.serve = true;
    else if (a == "--quiet")          c.quiet = true;
    else return error("unknown argument: " + a);

    if (!bad.empty()) return error("invalid value: " + bad);
  }

  if (c.auto_output) c.output_path = auto_output_path(c.input_path).string();

  std::string err;
  if (!validate(c, &err)) return error(err);
  return r;
}

}
