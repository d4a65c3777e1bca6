#include "mnemonic_sieve/output_sink.hpp"
#include "mnemonic_sieve/path_utils.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace ms {

struct OutputSink::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  std::vector<char> iobuf;

  mutable std::mutex mu;
  std::unordered_set<std::string> seen;
  std::string err;
  std::atomic<bool> broken{false};
  std::atomic<std::uint64_t> written{0};
  std::atomic<std::uint64_t> dups{0};

  ~Impl() { close(); }

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }

  // caller holds mu
  void mark_failed(const std::string& what, int e) {
    err = what + " '" + path + "': " + std::strerror(e ? e : EIO);
    broken.store(true, std::memory_order_release);
  }

  bool preload_existing(std::string* err_out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return true;  // nothing written yet
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!line.empty()) seen.insert(line);
    }
    if (in.bad()) {
      if (err_out) *err_out = "cannot read existing output '" + path + "' for de-duplication";
      return false;
    }
    return true;
  }
};

OutputSink::OutputSink(std::string path) : OutputSink(std::move(path), Config{}) {}

OutputSink::OutputSink(std::string path, Config cfg) : p_(new Impl()) {
  p_->path = std::move(path);
  p_->cfg = cfg;
}

OutputSink::~OutputSink() { delete p_; }

bool OutputSink::open(std::string* err) {
  std::lock_guard<std::mutex> lk(p_->mu);
  p_->close();
  if (!ensure_parent_dirs(p_->path)) {
    if (err) *err = "cannot create output directory for '" + p_->path + "'";
    return false;
  }
  if (p_->cfg.dedup && !p_->preload_existing(err)) return false;

  p_->f = std::fopen(p_->path.c_str(), "ab");
  if (!p_->f) {
    if (err) *err = "cannot open output '" + p_->path + "': " + std::strerror(errno);
    return false;
  }
  if (p_->cfg.buffer_bytes > 0) {
    p_->iobuf.assign(p_->cfg.buffer_bytes, 0);
    std::setvbuf(p_->f, p_->iobuf.data(), _IOFBF, p_->iobuf.size());
  }
  return true;
}

OutputSink::Append OutputSink::append(std::string_view line) {
  std::lock_guard<std::mutex> lk(p_->mu);
  if (p_->broken.load(std::memory_order_acquire)) return Append::Failed;
  if (!p_->f) {
    p_->mark_failed("output not open", EBADF);
    return Append::Failed;
  }
  if (p_->cfg.dedup) {
    auto ins = p_->seen.emplace(line);
    if (!ins.second) {
      p_->dups.fetch_add(1, std::memory_order_relaxed);
      return Append::Duplicate;
    }
  }
  if (std::fwrite(line.data(), 1, line.size(), p_->f) != line.size() ||
      std::fputc('\n', p_->f) == EOF) {
    p_->mark_failed("write failed on", errno);
    return Append::Failed;
  }
  p_->written.fetch_add(1, std::memory_order_relaxed);
  return Append::Written;
}

bool OutputSink::flush(std::string* err) {
  std::lock_guard<std::mutex> lk(p_->mu);
  if (!p_->broken.load(std::memory_order_acquire) && p_->f && std::fflush(p_->f) != 0)
    p_->mark_failed("flush failed on", errno);
  if (p_->broken.load(std::memory_order_acquire)) {
    if (err) *err = p_->err;
    return false;
  }
  return true;
}

void OutputSink::close() {
  std::lock_guard<std::mutex> lk(p_->mu);
  p_->close();
}

std::uint64_t OutputSink::lines_written() const noexcept { return p_->written.load(); }
std::uint64_t OutputSink::duplicates() const noexcept { return p_->dups.load(); }
bool OutputSink::failed() const noexcept { return p_->broken.load(); }
const std::string& OutputSink::path() const noexcept { return p_->path; }

std::string OutputSink::error() const {
  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->err;
}

}
