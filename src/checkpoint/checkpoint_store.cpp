#include "mnemonic_sieve/checkpoint_store.hpp"
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace ms {

std::optional<std::uint64_t> parse_checkpoint(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  std::uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

CheckpointStore::CheckpointStore(std::string path) : path_(std::move(path)) {}

std::uint64_t CheckpointStore::load() {
  std::lock_guard<std::mutex> lk(mu_);
  std::ifstream in(path_, std::ios::binary);
  if (!in) return floor_ = 0;

  std::ostringstream ss; ss << in.rdbuf();
  auto v = parse_checkpoint(ss.str());
  if (!v) {
    std::cerr << "[checkpoint] ignoring unreadable checkpoint at " << path_
              << ", starting from 0\n";
    return floor_ = 0;
  }
  floor_ = *v;
  return *v;
}

bool CheckpointStore::save(std::uint64_t index, std::string* err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (index < floor_) return true;
  return write_locked(index, err);
}

bool CheckpointStore::rewind(std::uint64_t index, std::string* err) {
  std::lock_guard<std::mutex> lk(mu_);
  return write_locked(index, err);
}

// caller holds mu_
bool CheckpointStore::write_locked(std::uint64_t index, std::string* err) {
  const std::filesystem::path target(path_);
  const std::filesystem::path tmp(path_ + ".tmp");
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      if (err) *err = "cannot create checkpoint directory: " + ec.message();
      return false;
    }
  }

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      if (err) *err = "cannot write " + tmp.string();
      return false;
    }
    out << index << '\n';
    out.flush();
    if (!out) {
      if (err) *err = "short write on " + tmp.string();
      return false;
    }
  }

  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    const std::string why = ec.message();
    std::filesystem::remove(tmp, ec);
    if (err) *err = "cannot replace " + path_ + ": " + why;
    return false;
  }
  floor_ = index;
  return true;
}

bool CheckpointStore::remove(std::string* err) {
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    if (err) *err = "cannot remove " + path_ + ": " + ec.message();
    return false;
  }
  std::filesystem::remove(path_ + ".tmp", ec);
  return true;
}

bool CheckpointStore::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

std::uint64_t CheckpointStore::floor() const {
  std::lock_guard<std::mutex> lk(mu_);
  return floor_;
}

}
