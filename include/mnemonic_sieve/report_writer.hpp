#pragma once
#include "mnemonic_sieve/run_outcome.hpp"
#include <string>

namespace ms {

// Writes <report_dir>/run.json and <report_dir>/report.html.
// template_dir defaults to MS_DEFAULT_TEMPLATE_DIR when built with it.
bool write_run_report(const std::string& report_dir, const RunOutcome& outcome,
                      std::string* err_out = nullptr,
                      const std::string& template_dir = {});

std::string default_template_dir();

}
