#pragma once
#include "mnemonic_sieve/run_outcome.hpp"
#include <string>

namespace ms {

class RunJsonWriter {
public:
  // Compact JSON: counters, rates, stage_times, errors_by_kind, state, paths.
  static std::string to_json(const RunOutcome& o);
};

// JSON string literal with the usual escapes (quotes included).
std::string json_quote(const std::string& s);

}
