#include "mnemonic_sieve/progress.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <utility>

namespace ms {

static inline double safe_num(double v){ return std::isfinite(v) && v > 0.0 ? v : 0.0; }

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:   o << c;      break;
    }
  }
  o << '"';
}

std::string format_duration(double seconds) {
  const auto total = static_cast<std::uint64_t>(std::floor(safe_num(seconds)));
  const std::uint64_t h = total / 3600, m = (total % 3600) / 60, s = total % 60;
  char buf[48];
  if (h > 0) std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu",
                           (unsigned long long)h, (unsigned long long)m, (unsigned long long)s);
  else       std::snprintf(buf, sizeof(buf), "%02llu:%02llu",
                           (unsigned long long)m, (unsigned long long)s);
  return buf;
}

std::string estimate_remaining(std::uint64_t processed, std::uint64_t remaining,
                               double elapsed_s, double* eta_s) {
  if (eta_s) *eta_s = 0.0;
  if (processed == 0 || safe_num(elapsed_s) == 0.0) return kEtaPlaceholder;

  const double lps = static_cast<double>(processed) / elapsed_s;
  if (!std::isfinite(lps) || lps < 0.01) return kEtaPlaceholder;

  const double secs = safe_num(static_cast<double>(remaining) / lps);
  if (eta_s) *eta_s = secs;
  return format_duration(secs);
}

ProgressSnapshot compute_progress(std::uint64_t current_index, std::uint64_t processed,
                                  std::uint64_t valid, std::uint64_t total,
                                  double elapsed_s) {
  ProgressSnapshot s;
  s.processed = processed;
  s.valid = valid;
  s.total = total;
  s.current_index = current_index;
  s.elapsed_seconds = safe_num(elapsed_s);

  if (total > 0)
    s.percent = std::min(100.0, 100.0 * static_cast<double>(current_index) / static_cast<double>(total));
  if (s.elapsed_seconds > 0.0)
    s.lines_per_sec = safe_num(static_cast<double>(processed) / s.elapsed_seconds);

  const std::uint64_t remaining = total > current_index ? total - current_index : 0;
  s.eta = estimate_remaining(processed, remaining, s.elapsed_seconds, &s.eta_seconds);
  return s;
}

std::string to_json(const ProgressSnapshot& s) {
  std::ostringstream o;
  o << "{";
  o << "\"processed\":" << s.processed << ",";
  o << "\"valid\":" << s.valid << ",";
  o << "\"total\":" << s.total << ",";
  o << "\"current_index\":" << s.current_index << ",";
  o << "\"percent\":" << safe_num(s.percent) << ",";
  o << "\"lines_per_sec\":" << safe_num(s.lines_per_sec) << ",";
  o << "\"eta_seconds\":" << safe_num(s.eta_seconds) << ",";
  o << "\"elapsed_seconds\":" << safe_num(s.elapsed_seconds) << ",";
  o << "\"eta\":"; esc(o, s.eta); o << ",";
  o << "\"status\":"; esc(o, s.status);
  o << "}";
  return o.str();
}

std::string format_progress_line(const ProgressSnapshot& s) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "[%3d%%] %llu/%llu lines, %llu valid, %llu lines/s, ETA: ",
                static_cast<int>(s.percent),
                (unsigned long long)s.current_index, (unsigned long long)s.total,
                (unsigned long long)s.valid,
                (unsigned long long)s.lines_per_sec);
  return std::string(buf) + s.eta;
}

ProgressReporter::ProgressReporter(std::uint64_t total, std::chrono::milliseconds interval,
                                   Callback cb)
  : total_(total), interval_(interval), last_(std::chrono::steady_clock::now()),
    cb_(std::move(cb)) {
  latest_.total = total;
}

bool ProgressReporter::maybe_emit(std::uint64_t current_index, std::uint64_t processed,
                                  std::uint64_t valid, double elapsed_s) {
  std::unique_lock<std::mutex> lk(mu_);
  const auto now = std::chrono::steady_clock::now();
  if (now - last_ < interval_) return false;
  last_ = now;
  auto s = compute_progress(current_index, processed, valid, total_, elapsed_s);
  s.status = status_;
  publish_locked(std::move(s), lk);
  return true;
}

void ProgressReporter::emit(std::uint64_t current_index, std::uint64_t processed,
                            std::uint64_t valid, double elapsed_s, std::string status) {
  std::unique_lock<std::mutex> lk(mu_);
  last_ = std::chrono::steady_clock::now();
  status_ = std::move(status);
  auto s = compute_progress(current_index, processed, valid, total_, elapsed_s);
  s.status = status_;
  publish_locked(std::move(s), lk);
}

void ProgressReporter::set_status(std::string status) {
  std::lock_guard<std::mutex> lk(mu_);
  status_ = std::move(status);
  latest_.status = status_;
}

void ProgressReporter::set_total(std::uint64_t total) {
  std::lock_guard<std::mutex> lk(mu_);
  total_ = total;
  latest_.total = total;
}

ProgressSnapshot ProgressReporter::latest() const {
  std::lock_guard<std::mutex> lk(mu_);
  return latest_;
}

void ProgressReporter::publish_locked(ProgressSnapshot s, std::unique_lock<std::mutex>& lk) {
  latest_ = s;
  lk.unlock();
  if (cb_) cb_(s);
}

}
