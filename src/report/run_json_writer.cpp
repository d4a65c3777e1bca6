#include "mnemonic_sieve/run_json.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <utility>
#include <vector>

namespace ms {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof buf, "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) && v >= 0.0 ? v : 0.0; }

std::string json_quote(const std::string& s) {
  std::ostringstream o;
  esc(o, s);
  return o.str();
}

std::string RunJsonWriter::to_json(const RunOutcome& r) {
  std::ostringstream o;
  o << "{";
  o << "\"state\":"; esc(o, to_string(r.state)); o << ",";
  o << "\"cancel_reason\":"; esc(o, to_string(r.cancel_reason)); o << ",";
  o << "\"drained\":" << (r.drained ? "true" : "false") << ",";
  o << "\"error\":"; esc(o, r.error); o << ",";

  o << "\"input_path\":";      esc(o, r.input_path);      o << ",";
  o << "\"output_path\":";     esc(o, r.output_path);     o << ",";
  o << "\"checkpoint_path\":"; esc(o, r.checkpoint_path); o << ",";

  o << "\"total_lines\":"  << r.total_lines  << ",";
  o << "\"resumed_from\":" << r.resumed_from << ",";
  o << "\"checkpoint\":"   << r.checkpoint   << ",";
  o << "\"processed\":"    << r.processed    << ",";
  o << "\"valid\":"        << r.valid        << ",";
  o << "\"blank\":"        << r.blank        << ",";
  o << "\"line_errors\":"  << r.line_errors  << ",";
  o << "\"duplicates\":"   << r.duplicates   << ",";
  o << "\"wall_time_ms\":"  << safe_num(r.wall_seconds * 1000.0) << ",";
  o << "\"lines_per_sec\":" << safe_num(r.lines_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<r.stats.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, r.stats.stages[i].name);
    o << ",\"duration_ms\":" << r.stats.stages[i].duration_ms << "}";
  }
  o << "],";

  // sorted so the file diffs cleanly between runs
  std::vector<std::pair<std::string, std::uint64_t>> errs(r.stats.errors_by_kind.begin(),
                                                          r.stats.errors_by_kind.end());
  std::sort(errs.begin(), errs.end());
  o << "\"errors_by_kind\":{";
  for (size_t i=0;i<errs.size();++i){
    if (i) o << ",";
    esc(o, errs[i].first); o << ":" << errs[i].second;
  }
  o << "}";

  o << "}";
  return o.str();
}

}
