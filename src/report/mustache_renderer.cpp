#include "mnemonic_sieve/mustache_renderer.hpp"
#include "mnemonic_sieve/path_utils.hpp"
#include "mnemonic_sieve/progress.hpp"

#include <kainjow/mustache.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace ms {

namespace mstch = kainjow::mustache;

MustacheRenderer::MustacheRenderer() : cfg_{} {}
MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static bool read_file(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss; ss << in.rdbuf();
  out = ss.str();
  return true;
}

static std::string inline_partials(std::string tpl,
                                   const std::filesystem::path& partials_dir,
                                   std::string& err) {
  size_t pos = 0;
  while ((pos = tpl.find("{{>", pos)) != std::string::npos) {
    size_t name_start = pos + 3;
    while (name_start < tpl.size() && std::isspace(static_cast<unsigned char>(tpl[name_start])))
      ++name_start;
    size_t close = tpl.find("}}", name_start);
    if (close == std::string::npos) break;

    size_t name_end = close;
    while (name_end > name_start &&
           std::isspace(static_cast<unsigned char>(tpl[name_end - 1])))
      --name_end;

    const std::string name = tpl.substr(name_start, name_end - name_start);
    std::string content;
    if (name.empty() ||
        (!read_file((partials_dir / name).string(), content) &&
         !read_file((partials_dir / (name + ".mustache")).string(), content))) {
      err += "partial not found: " + (partials_dir / name).string() + "\n";
      tpl.erase(pos, (close + 2) - pos);
      continue;
    }
    tpl.replace(pos, (close + 2) - pos, content);
    pos += content.size();
  }
  return tpl;
}

static std::string fixed1(double v) {
  char buf[64];
  std::snprintf(buf, sizeof buf, "%.1f", std::isfinite(v) ? v : 0.0);
  return buf;
}

static mstch::data build_context(const RunOutcome& r, std::string_view run_json) {
  mstch::data ctx;
  ctx.set("state", to_string(r.state));
  ctx.set("cancel_reason", to_string(r.cancel_reason));
  ctx.set("input_path", r.input_path);
  ctx.set("output_path", r.output_path);
  ctx.set("checkpoint_path", r.checkpoint_path);
  ctx.set("total_lines", std::to_string(r.total_lines));
  ctx.set("resumed_from", std::to_string(r.resumed_from));
  ctx.set("checkpoint", std::to_string(r.checkpoint));
  ctx.set("processed", std::to_string(r.processed));
  ctx.set("valid", std::to_string(r.valid));
  ctx.set("blank", std::to_string(r.blank));
  ctx.set("line_errors", std::to_string(r.line_errors));
  ctx.set("duplicates", std::to_string(r.duplicates));
  ctx.set("wall_time", format_duration(r.wall_seconds));
  ctx.set("lines_per_sec", fixed1(r.lines_per_sec));
  ctx.set("has_error", mstch::data(!r.error.empty()));
  ctx.set("error", r.error);
  ctx.set("run_json", std::string(run_json));

  mstch::data stages{mstch::data::type::list};
  for (const auto& st : r.stats.stages) {
    mstch::data row;
    row.set("stage", st.name);
    row.set("duration_ms", std::to_string(st.duration_ms));
    stages.push_back(row);
  }
  ctx.set("stages", stages);

  std::vector<std::pair<std::string, std::uint64_t>> errs(r.stats.errors_by_kind.begin(),
                                                          r.stats.errors_by_kind.end());
  std::sort(errs.begin(), errs.end());
  mstch::data kinds{mstch::data::type::list};
  for (const auto& kv : errs) {
    mstch::data row;
    row.set("kind", kv.first);
    row.set("count", std::to_string(kv.second));
    kinds.push_back(row);
  }
  ctx.set("line_errors_by_kind", kinds);
  ctx.set("has_line_errors", mstch::data(!errs.empty()));
  return ctx;
}

bool MustacheRenderer::render(std::string_view template_name, const RunOutcome& outcome,
                              std::string_view run_json, std::string& out) {
  err_.clear();
  const auto tpl_path =
      (std::filesystem::path(cfg_.template_dir) / std::string(template_name)).string();

  std::string tpl;
  if (!read_file(tpl_path, tpl)) {
    err_ = "cannot read template " + tpl_path;
    return false;
  }
  std::string partial_err;
  tpl = inline_partials(std::move(tpl), std::filesystem::path(cfg_.partials_dir), partial_err);
  if (!partial_err.empty()) {
    err_ = partial_err;
    return false;
  }

  mstch::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  out = view.render(build_context(outcome, run_json));
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  return true;
}

bool MustacheRenderer::render_to_file(std::string_view template_name, const RunOutcome& outcome,
                                      std::string_view run_json, std::string_view out_path) {
  std::string rendered;
  if (!render(template_name, outcome, run_json, rendered)) return false;

  const std::filesystem::path target{std::string(out_path)};
  if (!ensure_parent_dirs(target)) { err_ = "cannot create directory for " + target.string(); return false; }

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) { err_ = "cannot write " + target.string(); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  if (!out) { err_ = "short write on " + target.string(); return false; }
  return true;
}

}
