#pragma once
#include "mnemonic_sieve/cancellation.hpp"
#include "mnemonic_sieve/stats.hpp"

#include <cstdint>
#include <string>

namespace ms {

enum class RunState { Idle, Running, Completed, Cancelled, Failed };

const char* to_string(RunState s) noexcept;

struct RunOutcome {
  RunState state = RunState::Idle;

  std::string input_path;
  std::string output_path;
  std::string checkpoint_path;

  std::uint64_t total_lines  = 0;
  std::uint64_t resumed_from = 0;
  std::uint64_t checkpoint   = 0;   // high-water mark when the run ended

  std::uint64_t processed   = 0;
  std::uint64_t valid       = 0;
  std::uint64_t blank       = 0;
  std::uint64_t line_errors = 0;
  std::uint64_t duplicates  = 0;

  double wall_seconds  = 0.0;
  double lines_per_sec = 0.0;

  bool         drained = true;      // false: grace period expired with lines in flight
  CancelReason cancel_reason = CancelReason::None;
  std::string  error;

  StatsView stats;
};

// 0 for Completed and Cancelled, 1 otherwise.
int exit_code(const RunOutcome& o) noexcept;

}
