#include "mnemonic_sieve/line_source.hpp"
#include <simdjson.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <vector>

namespace ms {

const char* to_string(LineStatus s) noexcept {
  switch (s) {
    case LineStatus::Ok:              return "ok";
    case LineStatus::InvalidEncoding: return "invalid_encoding";
    case LineStatus::Oversize:        return "oversize";
  }
  return "unknown";
}

static std::string describe(const std::string& what, const std::string& path, int e) {
  return what + " '" + path + "': " + std::strerror(e);
}

static bool count_pass(std::FILE* f, std::size_t chunk, std::uint64_t& lines,
                       std::uint64_t& bytes, int& err) {
  std::vector<char> buf(chunk, 0);
  char last = '\n';
  lines = 0;
  bytes = 0;
  while (true) {
    std::size_t n = std::fread(buf.data(), 1, chunk, f);
    if (n == 0) break;
    bytes += n;
    lines += static_cast<std::uint64_t>(std::count(buf.data(), buf.data() + n, '\n'));
    last = buf[n - 1];
  }
  if (std::ferror(f)) { err = errno ? errno : EIO; return false; }
  // unterminated final line
  if (bytes > 0 && last != '\n') ++lines;
  return true;
}

bool count_lines(const std::string& path, std::uint64_t& out, std::string* err) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    if (err) *err = describe("cannot open input", path, errno);
    return false;
  }
  std::uint64_t bytes = 0;
  int e = 0;
  const bool ok = count_pass(f, LineSource::Config{}.chunk_bytes, out, bytes, e);
  std::fclose(f);
  if (!ok && err) *err = describe("read failed on", path, e);
  return ok;
}

struct LineSource::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  std::vector<char> buf;
  std::size_t pos{0}, len{0};
  bool eof{false};

  std::string carry;
  bool partial{false};   // bytes seen since the last newline
  bool oversize{false};  // current line exceeded the guard; drop until newline

  std::uint64_t next_index{0};
  std::uint64_t total{0};
  std::uint64_t bytes{0};
  int last_errno{0};
  std::string err;

  ~Impl() { close(); }

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }

  bool fail(const std::string& what, int e) {
    last_errno = e ? e : EIO;
    err = describe(what, path, last_errno);
    close();
    return false;
  }

  bool open() {
    close();
    last_errno = 0;
    err.clear();

    std::FILE* cf = std::fopen(path.c_str(), "rb");
    if (!cf) return fail("cannot open input", errno);
    std::uint64_t counted_bytes = 0;
    int e = 0;
    const bool ok = count_pass(cf, cfg.chunk_bytes, total, counted_bytes, e);
    std::fclose(cf);
    if (!ok) return fail("read failed on", e);

    f = std::fopen(path.c_str(), "rb");
    if (!f) return fail("cannot reopen input", errno);
    buf.assign(cfg.chunk_bytes, 0);
    pos = len = 0;
    eof = false;
    carry.clear();
    partial = oversize = false;
    next_index = 0;
    bytes = 0;
    return true;
  }

  void append(const char* b, std::size_t n) {
    if (oversize) return;
    if (carry.size() + n > cfg.max_line_bytes) {
      oversize = true;
      carry.clear();
      return;
    }
    carry.append(b, n);
  }

  void emit(LineRecord& out) {
    out.index = next_index++;
    out.text.clear();
    if (oversize) {
      out.status = LineStatus::Oversize;
    } else {
      if (cfg.strip_cr && !carry.empty() && carry.back() == '\r') carry.pop_back();
      if (cfg.check_utf8 && !simdjson::validate_utf8(carry.data(), carry.size())) {
        out.status = LineStatus::InvalidEncoding;
      } else {
        out.status = LineStatus::Ok;
        std::swap(out.text, carry);
      }
    }
    carry.clear();
    partial = oversize = false;
  }

  bool read_next(LineRecord& out) {
    if (!f) return false;
    while (true) {
      if (pos == len) {
        if (eof) break;
        std::size_t n = std::fread(buf.data(), 1, cfg.chunk_bytes, f);
        if (n == 0) {
          if (std::ferror(f)) return fail("read failed on", errno);
          eof = true;
          break;
        }
        bytes += n;
        pos = 0;
        len = n;
      }
      const char* b = buf.data() + pos;
      const void* nl = std::memchr(b, '\n', len - pos);
      const std::size_t take = nl ? static_cast<std::size_t>(static_cast<const char*>(nl) - b)
                                  : len - pos;
      append(b, take);
      partial = true;
      if (nl) {
        pos += take + 1;
        emit(out);
        return true;
      }
      pos = len;
    }
    if (partial) {
      emit(out);
      return true;
    }
    return false;
  }
};

LineSource::LineSource(std::string path)
  : LineSource(std::move(path), Config{}) {}

LineSource::LineSource(std::string path, Config cfg)
  : p_(new Impl()) {
  p_->path = std::move(path);
  p_->cfg = cfg;
  if (p_->cfg.chunk_bytes == 0) p_->cfg.chunk_bytes = Config{}.chunk_bytes;
}

LineSource::~LineSource() { delete p_; }

bool LineSource::open() { return p_->open(); }
bool LineSource::read_next(LineRecord& out) { return p_->read_next(out); }
std::uint64_t LineSource::total_lines() const noexcept { return p_->total; }
std::uint64_t LineSource::bytes_read() const noexcept { return p_->bytes; }
int LineSource::last_error() const noexcept { return p_->last_errno; }
const std::string& LineSource::error() const noexcept { return p_->err; }
const std::string& LineSource::path() const noexcept { return p_->path; }

}
