#include "mnemonic_sieve/report_writer.hpp"
#include "mnemonic_sieve/mustache_renderer.hpp"
#include "mnemonic_sieve/run_json.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace ms {

std::string default_template_dir() {
#ifdef MS_DEFAULT_TEMPLATE_DIR
  return MS_DEFAULT_TEMPLATE_DIR;
#else
  return "templates";
#endif
}

bool write_run_report(const std::string& report_dir, const RunOutcome& outcome,
                      std::string* err_out, const std::string& template_dir) {
  const std::filesystem::path out_dir(report_dir);
  const std::string run_json = RunJsonWriter::to_json(outcome);

  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    if (err_out) *err_out = "cannot create " + out_dir.string() + ": " + ec.message();
    return false;
  }
  {
    std::ofstream rj(out_dir / "run.json", std::ios::binary | std::ios::trunc);
    rj.write(run_json.data(), static_cast<std::streamsize>(run_json.size()));
    if (!rj) {
      if (err_out) *err_out = "failed to write run.json";
      return false;
    }
  }

  MustacheRenderer::Config rcfg;
  rcfg.template_dir = template_dir.empty() ? default_template_dir() : template_dir;
  rcfg.partials_dir = rcfg.template_dir + "/partials";

  MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_file("report.mustache", outcome, run_json,
                                          (out_dir / "report.html").string());
  if (!ok && err_out) *err_out = renderer.error();
  return ok;
}

}
