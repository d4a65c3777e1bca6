#include "mnemonic_sieve/path_utils.hpp"
#include <cstdlib>
#include <system_error>

namespace ms {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return std::filesystem::is_directory(parent, ec);
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::filesystem::path home_dir() {
  const char* h = std::getenv("HOME");
  if (h && *h) return std::filesystem::path(h);
  return std::filesystem::path(".");
}

std::filesystem::path default_checkpoint_path() {
  return home_dir() / ".mnemonic_sieve_checkpoint";
}

std::filesystem::path auto_output_path(const std::filesystem::path& input,
                                       const std::filesystem::path& out_dir) {
  std::string stem = input.stem().string();
  if (stem.empty()) stem = "output";
  return out_dir / (stem + "_valid.txt");
}

}
