#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace ms {

enum class LineStatus { Ok, InvalidEncoding, Oversize };

struct LineRecord {
  std::uint64_t index = 0;
  std::string   text;
  LineStatus    status = LineStatus::Ok;
};

const char* to_string(LineStatus s) noexcept;

// Two-pass reader: open() counts lines, then rewinds so read_next() yields
// (index, text) from index 0. Memory stays bounded by chunk + line guard.
class LineSource {
public:
  struct Config {
    std::size_t chunk_bytes    = 512 * 1024;   // 512 KiB
    std::size_t max_line_bytes = 1024 * 1024;  // longer lines come back as Oversize
    bool        strip_cr       = true;         // trim trailing '\r' (CRLF)
    bool        check_utf8     = true;
  };

  explicit LineSource(std::string path);
  LineSource(std::string path, Config cfg);
  ~LineSource();

  LineSource(const LineSource&) = delete;
  LineSource& operator=(const LineSource&) = delete;

  // Counting pass + reopen. False if the file cannot be opened or read.
  bool open();

  // False at end of input or on a stream error (last_error() != 0).
  bool read_next(LineRecord& out);

  std::uint64_t total_lines() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  int  last_error() const noexcept;
  const std::string& error() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Standalone counting pass; same line boundaries as LineSource.
bool count_lines(const std::string& path, std::uint64_t& out, std::string* err = nullptr);

}
