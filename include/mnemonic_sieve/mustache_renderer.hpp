#pragma once
#include "mnemonic_sieve/run_outcome.hpp"
#include <string>
#include <string_view>

namespace ms {

// Renders the run report page. Partials ("{{> name}}") are inlined from
// partials_dir before the template reaches the engine.
class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  // Context: every RunOutcome counter by name, `stages` and `line_errors_by_kind`
  // lists, `has_error`, and the raw document as `run_json` (use {{{run_json}}}).
  bool render(std::string_view template_name, const RunOutcome& outcome,
              std::string_view run_json, std::string& out);

  bool render_to_file(std::string_view template_name, const RunOutcome& outcome,
                      std::string_view run_json, std::string_view out_path);

  const std::string& error() const { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
