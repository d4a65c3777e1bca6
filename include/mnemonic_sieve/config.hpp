#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace ms {

struct RunConfig {
  std::string input_path  = "input/mnemonics.txt";
  std::string output_path = "output/valid_mnemonics.txt";
  bool        auto_output = false;            // output/<input stem>_valid.txt
  std::string checkpoint_path;                // empty -> $HOME/.mnemonic_sieve_checkpoint
  std::string wordlist_path = "wordlists/english.txt";

  std::size_t   workers             = 0;      // 0 = hardware concurrency
  std::uint64_t checkpoint_interval = 10000;
  double        progress_interval_s = 3.0;
  double        grace_period_s      = 5.0;
  std::size_t   max_line_bytes      = 1024 * 1024;
  bool          preserve_order      = false;
  bool          dedup_output        = false;

  std::string report_dir;                     // empty -> no run report
  bool        serve = false;
  int         port  = 8080;
  bool        quiet = false;
};

// Upper bound for every duration option, in seconds.
inline constexpr double kMaxIntervalSeconds = 86400.0;

enum class CliAction { Run, Help, Error };

struct CliResult {
  CliAction   action = CliAction::Run;
  std::string error;
  std::string config_file;
};

// Layering: defaults <- JSON config file (--config=FILE) <- flags.
CliResult parse_cli(int argc, char** argv, RunConfig& cfg);

// Keys are the RunConfig field names. Unknown keys and wrong types fail.
bool load_config_file(const std::string& path, RunConfig& cfg, std::string* err = nullptr);

bool validate(const RunConfig& cfg, std::string* err = nullptr);

std::string resolved_checkpoint_path(const RunConfig& cfg);

std::string usage();

}
