#pragma once
#include <filesystem>
#include <string>

namespace ms {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// $HOME, or the current directory when HOME is unset/empty.
std::filesystem::path home_dir();

// Hidden per-user resume marker.
std::filesystem::path default_checkpoint_path();

// output/<input stem>_valid.txt
std::filesystem::path auto_output_path(const std::filesystem::path& input,
                                       const std::filesystem::path& out_dir = "output");

}
