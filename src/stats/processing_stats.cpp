#include "mnemonic_sieve/stats.hpp"
#include <algorithm>

namespace ms {

void ProcessingStats::add_line_error(std::string_view kind) {
  errors_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(err_mu_);
  ++errs_by_kind_[std::string(kind)];
}

double ProcessingStats::elapsed_seconds() const {
  return std::chrono::duration<double>(clock::now() - start_).count();
}

void ProcessingStats::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = clock::now();
}

void ProcessingStats::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(
              clock::now() - it->second).count();
  stage_starts_.erase(it);

  auto acc = std::find_if(stage_order_.begin(), stage_order_.end(),
                          [&](const StageTiming& s){ return s.name == key; });
  if (acc == stage_order_.end()) stage_order_.push_back(StageTiming{key, static_cast<std::uint64_t>(dur)});
  else acc->duration_ms += static_cast<std::uint64_t>(dur);
}

StatsView ProcessingStats::snapshot() const {
  StatsView v;
  v.processed = processed();
  v.valid = valid();
  v.blank = blank();
  v.line_errors = line_errors();
  v.elapsed_s = elapsed_seconds();
  v.stages = stage_order_;
  std::lock_guard<std::mutex> lk(err_mu_);
  v.errors_by_kind = errs_by_kind_;
  return v;
}

}
